#include "Handler.hpp"

#include <stdexcept>

namespace minnow {

std::string as_string(const Argument& arg) {
    if (const auto* s = std::get_if<std::string>(&arg)) {
        return *s;
    }
    if (const auto* v = std::get_if<boost::json::value>(&arg)) {
        if (v->is_string()) {
            return std::string{v->get_string()};
        }
        return boost::json::serialize(*v);
    }
    throw std::invalid_argument("Argument is a file upload, not text");
}

const FileRecord* as_file(const Argument& arg) { return std::get_if<FileRecord>(&arg); }

bool is_null(const Argument& arg) {
    const auto* v = std::get_if<boost::json::value>(&arg);
    return v != nullptr && v->is_null();
}

}  // namespace minnow
