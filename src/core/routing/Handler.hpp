#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Fields.hpp"
#include "ResponseTypes.hpp"
#include "Session.hpp"

namespace minnow {

struct Parameter {
    std::string name;
    std::optional<boost::json::value> default_value;

    Parameter(const char* n) : name(n) {}              // NOLINT(google-explicit-constructor)
    Parameter(std::string n) : name(std::move(n)) {}  // NOLINT(google-explicit-constructor)
    Parameter(std::string n, boost::json::value def)
        : name(std::move(n)), default_value(std::move(def)) {}

    bool has_default() const noexcept { return default_value.has_value(); }
};

struct HandlerDescriptor {
    std::string name;
    std::vector<Parameter> params;
};

// Path, query and body values bind as strings, uploads as FileRecords,
// session attributes and declared defaults as JSON values.
using Argument = std::variant<std::string, FileRecord, boost::json::value>;
using Arguments = std::vector<Argument>;

/**
 * @brief Everything decoded from one request.
 * Owned by the dispatcher for the request's lifetime; handlers get a reference.
 */
struct RequestContext {
    std::string method;
    std::string path;
    std::string query_string;
    HeaderList headers;

    std::vector<std::string> path_params;
    FieldMap query;
    FieldMap body;
    FileMap files;

    std::shared_ptr<Session> session;
};

using HandlerFn =
    std::function<boost::asio::awaitable<HandlerResult>(RequestContext&, Arguments)>;

struct Route {
    HandlerDescriptor descriptor;
    HandlerFn fn;
};

/**
 * @brief Reads an argument as text.
 * JSON strings are unwrapped, other JSON values serialized.
 * @throws std::invalid_argument for file uploads.
 */
std::string as_string(const Argument& arg);

// nullptr unless the argument is an uploaded file.
const FileRecord* as_file(const Argument& arg);

bool is_null(const Argument& arg);

}  // namespace minnow
