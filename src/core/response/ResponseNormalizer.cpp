#include "ResponseNormalizer.hpp"

#include <spdlog/spdlog.h>

#include <boost/beast/core/string.hpp>
#include <iterator>

#include "Cookies.hpp"
#include "HttpError.hpp"

namespace minnow {

namespace {

constexpr int MIN_STATUS = 100;
constexpr int MAX_STATUS = 999;

std::variant<std::string, ChunkStream> to_wire_body(ResponseBody&& content) {
    if (auto* text = std::get_if<std::string>(&content)) {
        return std::move(*text);
    }
    if (auto* bytes = std::get_if<Bytes>(&content)) {
        return std::string(bytes->begin(), bytes->end());
    }
    auto& stream = std::get<ChunkStream>(content);
    if (!stream.valid()) {
        throw InvalidResponseShape("Streaming body has no chunk producer");
    }
    return std::move(stream);
}

}  // namespace

bool status_allows_body(int status) noexcept {
    return !(status < 200 || status == 204 || status == 304);
}

std::string_view reason_phrase(int status) noexcept {
    switch (status) {
        case 200:
            return "OK";
        case 206:
            return "Partial Content";
        case 302:
            return "Found";
        case 400:
            return "Bad Request";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 500:
            return "Internal Server Error";
        default:
            return "OK";
    }
}

void ensure_session_cookie(HeaderList& headers, std::string_view session_id) {
    const std::string marker = std::string{SESSION_COOKIE_NAME} + "=";
    for (const auto& [name, value] : headers) {
        if (boost::beast::iequals(name, "Set-Cookie") && value.find(marker) != std::string::npos) {
            return;
        }
    }
    headers.emplace_back("Set-Cookie", build_session_cookie(session_id));
}

void ensure_content_type(HeaderList& headers) {
    if (!has_header(headers, "Content-Type")) {
        headers.emplace_back("Content-Type", DEFAULT_CONTENT_TYPE);
    }
}

NormalizedResponse normalize_response(HandlerResult result, std::string_view session_id,
                                      HeaderList prepopulated) {
    if (result.valueless_by_exception()) {
        throw InvalidResponseShape("Handler result holds no value");
    }

    NormalizedResponse out;
    out.headers = std::move(prepopulated);

    std::visit(
        [&](auto&& shape) {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, Body>) {
                out.status = 200;
            } else {
                out.status = shape.status;
            }
            if constexpr (std::is_same_v<T, StatusBodyHeaders>) {
                out.headers.insert(out.headers.end(),
                                   std::make_move_iterator(shape.headers.begin()),
                                   std::make_move_iterator(shape.headers.end()));
            }
            if (shape.content.valueless_by_exception()) {
                throw InvalidResponseShape("Response body holds no value");
            }
            out.body = to_wire_body(std::move(shape.content));
        },
        std::move(result));

    if (out.status < MIN_STATUS || out.status > MAX_STATUS) {
        throw InvalidResponseShape("Status code out of range: " + std::to_string(out.status));
    }

    if (!status_allows_body(out.status)) {
        bool had_body = out.streaming() || !std::get<std::string>(out.body).empty();
        if (had_body) {
            spdlog::debug("[ResponseNormalizer] Dropping body of {} response", out.status);
        }
        out.body = std::string{};
    }

    out.reason = reason_phrase(out.status);
    ensure_session_cookie(out.headers, session_id);
    ensure_content_type(out.headers);
    return out;
}

StatusBodyHeaders redirect(std::string_view location) {
    std::string page = "<html><head><meta http-equiv='refresh' content='0;url=";
    page += location;
    page += "'></head></html>";
    return StatusBodyHeaders{302, std::move(page), {{"Location", std::string{location}}}};
}

}  // namespace minnow
