#pragma once

#include <map>
#include <string>
#include <string_view>

namespace minnow {

inline constexpr std::string_view SESSION_COOKIE_NAME = "session_id";

using CookieMap = std::map<std::string, std::string>;

/**
 * @brief Parses a raw `Cookie` request header.
 * Entries without '=' are dropped; the last duplicate wins. Never throws on
 * malformed input.
 */
CookieMap parse_cookies(std::string_view header);

// session_id=<id>; Path=/; HttpOnly; SameSite=Strict
std::string build_session_cookie(std::string_view session_id);

}  // namespace minnow
