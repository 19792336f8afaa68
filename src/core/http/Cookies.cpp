#include "Cookies.hpp"

#include "Fields.hpp"

namespace minnow {

CookieMap parse_cookies(std::string_view header) {
    CookieMap cookies;

    while (!header.empty()) {
        auto semi = header.find(';');
        std::string_view entry = header.substr(0, semi);
        header = (semi == std::string_view::npos) ? std::string_view{} : header.substr(semi + 1);

        auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        auto name = trim(entry.substr(0, eq));
        auto value = trim(entry.substr(eq + 1));
        cookies[std::string{name}] = std::string{value};
    }
    return cookies;
}

std::string build_session_cookie(std::string_view session_id) {
    std::string cookie{SESSION_COOKIE_NAME};
    cookie += '=';
    cookie += session_id;
    cookie += "; Path=/; HttpOnly; SameSite=Strict";
    return cookie;
}

}  // namespace minnow
