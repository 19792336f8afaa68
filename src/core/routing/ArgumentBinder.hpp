#pragma once

#include <boost/json/object.hpp>
#include <span>
#include <string>

#include "Handler.hpp"

namespace minnow {

struct BindingSources {
    std::span<const std::string> positional;
    const FieldMap& query;
    const FieldMap& body;
    const FileMap& files;
    const boost::json::object& session;
};

/**
 * @brief Builds a handler's argument list.
 * @details
 *  For each declared parameter, in order, the first source that supplies it wins:
 *    1. the next unclaimed positional path segment (consumed left to right)
 *    2. first query value for the name
 *    3. first body value for the name
 *    4. uploaded file under the name
 *    5. session attribute under the name
 *    6. declared default
 *  Pure function of its inputs.
 * @throws MissingParameter naming the first parameter no source supplies.
 */
Arguments bind_arguments(const HandlerDescriptor& handler, const BindingSources& sources);

}  // namespace minnow
