#include "BodyDecoder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/beast/core/string.hpp>
#include <boost/url/encode.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/params_encoded_view.hpp>
#include <boost/url/parse_query.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>
#include <cctype>
#include <map>

#include "HttpError.hpp"

namespace urls = boost::urls;

namespace {

constexpr std::string_view CRLF = "\r\n";
constexpr std::string_view HEADER_END = "\r\n\r\n";
constexpr std::string_view DEFAULT_FILE_TYPE = "application/octet-stream";

std::string to_lower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view strip_quotes(std::string_view s) {
    while (!s.empty() && s.front() == '"') s.remove_prefix(1);
    while (!s.empty() && s.back() == '"') s.remove_suffix(1);
    return s;
}

// Splits "a; b=c; d" on ';' and returns the key=value entries, keys lower-cased.
std::map<std::string, std::string> header_params(std::string_view value) {
    std::map<std::string, std::string> params;
    while (!value.empty()) {
        auto semi = value.find(';');
        auto entry = minnow::trim(value.substr(0, semi));
        value = (semi == std::string_view::npos) ? std::string_view{} : value.substr(semi + 1);

        auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        params[to_lower(minnow::trim(entry.substr(0, eq)))] =
            std::string{strip_quotes(minnow::trim(entry.substr(eq + 1)))};
    }
    return params;
}

std::string_view mime_type(std::string_view content_type) {
    return minnow::trim(content_type.substr(0, content_type.find(';')));
}

void decode_part(std::string_view section, minnow::DecodedBody& out) {
    if (section.starts_with(CRLF)) section.remove_prefix(CRLF.size());
    if (section.ends_with(CRLF)) section.remove_suffix(CRLF.size());
    if (section.empty() || section == "--") {
        return;
    }

    auto split = section.find(HEADER_END);
    if (split == std::string_view::npos) {
        spdlog::debug("[BodyDecoder] Skipping multipart section without header separator");
        return;
    }
    std::string_view header_block = section.substr(0, split);
    std::string_view content = section.substr(split + HEADER_END.size());

    std::map<std::string, std::string> headers;
    while (!header_block.empty()) {
        auto eol = header_block.find(CRLF);
        auto line = header_block.substr(0, eol);
        header_block = (eol == std::string_view::npos) ? std::string_view{}
                                                        : header_block.substr(eol + CRLF.size());
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        headers[to_lower(minnow::trim(line.substr(0, colon)))] =
            std::string{minnow::trim(line.substr(colon + 1))};
    }

    auto disposition = header_params(headers["content-disposition"]);
    auto name_it = disposition.find("name");
    if (name_it == disposition.end()) {
        spdlog::debug("[BodyDecoder] Skipping multipart section without a name");
        return;
    }
    const std::string& name = name_it->second;

    auto filename_it = disposition.find("filename");
    if (filename_it != disposition.end() && !filename_it->second.empty()) {
        auto type_it = headers.find("content-type");
        minnow::FileRecord record{
            filename_it->second,
            type_it != headers.end() ? type_it->second : std::string{DEFAULT_FILE_TYPE},
            std::string{content},
        };
        out.files[name] = std::move(record);
        return;
    }
    out.fields[name].emplace_back(content);
}

}  // namespace

namespace minnow {

FieldMap parse_query(std::string_view query) {
    FieldMap fields;
    if (query.empty()) {
        return fields;
    }

    auto parsed = urls::parse_query(query);
    if (!parsed) {
        spdlog::debug("[BodyDecoder] Unparseable query string: {}", parsed.error().message());
        return fields;
    }

    urls::encoding_opts opts;
    opts.space_as_plus = true;
    for (auto param : *parsed) {
        std::string key = param.key.decode(opts);
        if (key.empty()) {
            continue;
        }
        fields[key].push_back(param.has_value ? param.value.decode(opts) : std::string{});
    }
    return fields;
}

std::string encode_query(const FieldMap& fields) {
    urls::encoding_opts opts;
    opts.space_as_plus = true;

    std::string out;
    for (const auto& [key, values] : fields) {
        for (const auto& value : values) {
            if (!out.empty()) out += '&';
            out += urls::encode(key, urls::unreserved_chars, opts);
            out += '=';
            out += urls::encode(value, urls::unreserved_chars, opts);
        }
    }
    return out;
}

DecodedBody decode_multipart(std::string_view raw, std::string_view content_type) {
    auto params = header_params(content_type);
    auto boundary_it = params.find("boundary");
    if (boundary_it == params.end() || boundary_it->second.empty()) {
        throw MalformedBody("Boundary not found in Content-Type header");
    }

    const std::string delimiter = "--" + boundary_it->second;
    DecodedBody out;

    std::size_t pos = 0;
    for (;;) {
        auto next = raw.find(delimiter, pos);
        decode_part(raw.substr(pos, next == std::string_view::npos ? next : next - pos), out);
        if (next == std::string_view::npos) {
            break;
        }
        pos = next + delimiter.size();
    }

    spdlog::trace("[BodyDecoder] Multipart decoded: {} fields, {} files", out.fields.size(),
                  out.files.size());
    return out;
}

DecodedBody decode_body(std::string_view raw, std::string_view content_type) {
    auto mime = to_lower(mime_type(content_type));

    if (mime == "multipart/form-data") {
        return decode_multipart(raw, content_type);
    }
    if (mime.empty() || mime == "application/x-www-form-urlencoded") {
        return DecodedBody{parse_query(raw), {}};
    }

    spdlog::debug("[BodyDecoder] Not decoding body of type '{}'", mime);
    return {};
}

}  // namespace minnow
