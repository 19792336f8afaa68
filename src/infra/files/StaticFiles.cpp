#include "StaticFiles.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/beast/core/string.hpp>
#include <fstream>
#include <iterator>
#include <system_error>

namespace minnow {

namespace {

bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    auto rel = candidate.lexically_relative(root);
    return !rel.empty() && *rel.begin() != "..";
}

}  // namespace

StaticFiles::StaticFiles(std::filesystem::path root) {
    std::error_code ec;
    root_ = std::filesystem::weakly_canonical(std::filesystem::absolute(root), ec);
    if (ec) {
        spdlog::warn("[StaticFiles] Cannot resolve root '{}': {}", root.string(), ec.message());
        root_ = std::filesystem::absolute(root).lexically_normal();
    }
}

std::string StaticFiles::guess_mime(const std::filesystem::path& file) {
    auto ext = file.extension().string();
    using boost::beast::iequals;

    if (iequals(ext, ".html") || iequals(ext, ".htm")) return "text/html";
    if (iequals(ext, ".css")) return "text/css";
    if (iequals(ext, ".js")) return "application/javascript";
    if (iequals(ext, ".json")) return "application/json";
    if (iequals(ext, ".txt")) return "text/plain";
    if (iequals(ext, ".xml")) return "application/xml";
    if (iequals(ext, ".png")) return "image/png";
    if (iequals(ext, ".jpg") || iequals(ext, ".jpeg")) return "image/jpeg";
    if (iequals(ext, ".gif")) return "image/gif";
    if (iequals(ext, ".svg")) return "image/svg+xml";
    if (iequals(ext, ".ico")) return "image/vnd.microsoft.icon";
    if (iequals(ext, ".pdf")) return "application/pdf";
    if (iequals(ext, ".wasm")) return "application/wasm";
    return "application/octet-stream";
}

HandlerResult StaticFiles::serve(std::string_view relative) const {
    std::error_code ec;
    auto requested = std::filesystem::weakly_canonical(root_ / std::filesystem::path(relative), ec);
    if (ec || !is_within(root_, requested)) {
        spdlog::warn("[StaticFiles] Refusing path outside root: {}", relative);
        return StatusBody{403, std::string{"403 Forbidden"}};
    }

    if (!std::filesystem::is_regular_file(requested, ec)) {
        spdlog::debug("[StaticFiles] Not found: {}", requested.string());
        return StatusBody{404, std::string{"404 Not Found"}};
    }

    std::ifstream in(requested, std::ios::binary);
    if (!in) {
        spdlog::error("[StaticFiles] Cannot open {}", requested.string());
        return StatusBody{404, std::string{"404 Not Found"}};
    }
    Bytes content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    spdlog::trace("[StaticFiles] Serving {} ({} bytes)", requested.string(), content.size());
    return StatusBodyHeaders{200, std::move(content), {{"Content-Type", guess_mime(requested)}}};
}

}  // namespace minnow
