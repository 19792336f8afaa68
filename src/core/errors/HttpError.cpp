#include "HttpError.hpp"

#include <utility>

namespace minnow {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MalformedBody:
            return "MalformedBody";
        case ErrorKind::MissingParameter:
            return "MissingParameter";
        case ErrorKind::RouteNotFound:
            return "RouteNotFound";
        case ErrorKind::InvalidResponseShape:
            return "InvalidResponseShape";
        case ErrorKind::HandlerFailure:
            return "HandlerFailure";
        case ErrorKind::ForbiddenPath:
            return "ForbiddenPath";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::TemplateUnavailable:
            return "TemplateUnavailable";
    }
    return "Unknown";
}

HttpError::HttpError(ErrorKind kind, int status, const std::string& detail,
                     std::string client_message)
    : std::runtime_error(detail),
      kind_(kind),
      status_(status),
      client_message_(std::move(client_message)) {}

MalformedBody::MalformedBody(const std::string& detail)
    : HttpError(ErrorKind::MalformedBody, 400, detail, "400 Bad Request: Malformed request body") {}

MissingParameter::MissingParameter(std::string name)
    : HttpError(ErrorKind::MissingParameter, 400, "Missing required parameter: " + name,
                "400 Bad Request: Missing required parameter '" + name + "'"),
      name_(std::move(name)) {}

RouteNotFound::RouteNotFound(const std::string& path)
    : HttpError(ErrorKind::RouteNotFound, 404, "No handler for path: /" + path, "404 Not Found") {}

InvalidResponseShape::InvalidResponseShape(const std::string& detail)
    : HttpError(ErrorKind::InvalidResponseShape, 500, detail,
                "500 Internal Server Error: Invalid response tuple") {}

HandlerFailure::HandlerFailure(const std::string& handler, const std::string& detail)
    : HttpError(ErrorKind::HandlerFailure, 500, "Handler '" + handler + "' failed: " + detail,
                "500 Internal Server Error") {}

ForbiddenPath::ForbiddenPath(const std::string& path)
    : HttpError(ErrorKind::ForbiddenPath, 403, "Path escapes root: " + path, "403 Forbidden") {}

NotFound::NotFound(const std::string& what)
    : HttpError(ErrorKind::NotFound, 404, "Not found: " + what, "404 Not Found") {}

TemplateUnavailable::TemplateUnavailable(const std::string& name)
    : HttpError(ErrorKind::TemplateUnavailable, 500,
                "No template engine configured (template '" + name + "')",
                "500 Internal Server Error") {}

}  // namespace minnow
