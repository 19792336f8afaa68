#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace minnow {

enum class ErrorKind {
    MalformedBody,
    MissingParameter,
    RouteNotFound,
    InvalidResponseShape,
    HandlerFailure,
    ForbiddenPath,
    NotFound,
    TemplateUnavailable,
};

std::string_view to_string(ErrorKind kind) noexcept;

/**
 * @brief Base of every request-terminating failure.
 * @details
 *  what() carries the server-side detail (logged). client_message() is the
 *  body sent to the peer and never contains internals.
 */
class HttpError : public std::runtime_error {
   public:
    HttpError(ErrorKind kind, int status, const std::string& detail, std::string client_message);

    ErrorKind kind() const noexcept { return kind_; }
    int status() const noexcept { return status_; }
    const std::string& client_message() const noexcept { return client_message_; }

   private:
    ErrorKind kind_;
    int status_;
    std::string client_message_;
};

class MalformedBody : public HttpError {
   public:
    explicit MalformedBody(const std::string& detail);
};

class MissingParameter : public HttpError {
   public:
    explicit MissingParameter(std::string name);
    const std::string& name() const noexcept { return name_; }

   private:
    std::string name_;
};

class RouteNotFound : public HttpError {
   public:
    explicit RouteNotFound(const std::string& path);
};

class InvalidResponseShape : public HttpError {
   public:
    explicit InvalidResponseShape(const std::string& detail);
};

class HandlerFailure : public HttpError {
   public:
    HandlerFailure(const std::string& handler, const std::string& detail);
};

class ForbiddenPath : public HttpError {
   public:
    explicit ForbiddenPath(const std::string& path);
};

class NotFound : public HttpError {
   public:
    explicit NotFound(const std::string& what);
};

class TemplateUnavailable : public HttpError {
   public:
    explicit TemplateUnavailable(const std::string& name);
};

}  // namespace minnow
