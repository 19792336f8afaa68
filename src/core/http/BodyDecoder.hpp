#pragma once

#include <string>
#include <string_view>

#include "Fields.hpp"

namespace minnow {

struct DecodedBody {
    FieldMap fields;
    FileMap files;
};

/**
 * @brief Decodes a buffered request body according to its Content-Type.
 * @details
 *  - application/x-www-form-urlencoded (or no content type): query-string rules.
 *  - multipart/form-data: boundary-delimited parts; parts carrying a filename
 *    become FileRecords, the rest are appended to `fields`.
 *  - anything else: empty result.
 * @throws MalformedBody if a multipart content type carries no boundary.
 */
DecodedBody decode_body(std::string_view raw, std::string_view content_type);

DecodedBody decode_multipart(std::string_view raw, std::string_view content_type);

/**
 * @brief Parses `a=1&b=2&a=3` into {a:[1,3], b:[2]}.
 * '+' decodes to a space. Keys without '=' map to an empty value, empty keys
 * are dropped. An invalid percent-encoding yields an empty map.
 */
FieldMap parse_query(std::string_view query);

// Inverse of parse_query.
std::string encode_query(const FieldMap& fields);

}  // namespace minnow
