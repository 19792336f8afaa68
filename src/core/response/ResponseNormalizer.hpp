#pragma once

#include <string>
#include <string_view>

#include "ResponseTypes.hpp"

namespace minnow {

inline constexpr std::string_view DEFAULT_CONTENT_TYPE = "text/html; charset=utf-8";

/**
 * @brief Converts a handler result into status, headers and body.
 * @details
 *  Headers are `prepopulated`, then the handler's, then (only if missing) a
 *  session Set-Cookie and a Content-Type. A bare Body gets status 200.
 *  Statuses that forbid a body (1xx, 204, 304) get an empty one.
 * @throws InvalidResponseShape for a status outside 100..999 or a chunk
 *  stream without a producer.
 */
NormalizedResponse normalize_response(HandlerResult result, std::string_view session_id,
                                      HeaderList prepopulated = {});

// Appends the session cookie unless a Set-Cookie already carries session_id=.
void ensure_session_cookie(HeaderList& headers, std::string_view session_id);

// Appends `Content-Type: text/html; charset=utf-8` unless any Content-Type exists.
void ensure_content_type(HeaderList& headers);

// False for 1xx, 204 and 304, which never carry a message body.
bool status_allows_body(int status) noexcept;

// Canonical phrase for common codes, "OK" for everything else.
std::string_view reason_phrase(int status) noexcept;

// 302 with a Location header and a meta-refresh page pointing at `location`.
StatusBodyHeaders redirect(std::string_view location);

}  // namespace minnow
