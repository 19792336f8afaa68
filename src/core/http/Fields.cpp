#include "Fields.hpp"

#include <boost/beast/core/string.hpp>

namespace minnow {

std::optional<std::string_view> find_header(const HeaderList& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (boost::beast::iequals(key, name)) {
            return std::string_view{value};
        }
    }
    return std::nullopt;
}

bool has_header(const HeaderList& headers, std::string_view name) {
    return find_header(headers, name).has_value();
}

std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

}  // namespace minnow
