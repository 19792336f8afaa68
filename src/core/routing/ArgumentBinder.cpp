#include "ArgumentBinder.hpp"

#include <spdlog/spdlog.h>

#include "HttpError.hpp"

namespace minnow {

namespace {

const std::string* first_value(const FieldMap& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it == fields.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second.front();
}

}  // namespace

Arguments bind_arguments(const HandlerDescriptor& handler, const BindingSources& sources) {
    Arguments args;
    args.reserve(handler.params.size());

    std::size_t next_positional = 0;
    for (const auto& param : handler.params) {
        if (next_positional < sources.positional.size()) {
            args.emplace_back(sources.positional[next_positional++]);
        } else if (const auto* value = first_value(sources.query, param.name)) {
            args.emplace_back(*value);
        } else if (const auto* value = first_value(sources.body, param.name)) {
            args.emplace_back(*value);
        } else if (auto file = sources.files.find(param.name); file != sources.files.end()) {
            args.emplace_back(file->second);
        } else if (const auto* attr = sources.session.if_contains(param.name)) {
            args.emplace_back(*attr);
        } else if (param.has_default()) {
            args.emplace_back(*param.default_value);
        } else {
            spdlog::debug("[ArgumentBinder] '{}' is missing required parameter '{}'", handler.name,
                          param.name);
            throw MissingParameter(param.name);
        }
    }
    return args;
}

}  // namespace minnow
