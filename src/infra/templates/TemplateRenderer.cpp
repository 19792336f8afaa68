#include "TemplateRenderer.hpp"

#include <spdlog/spdlog.h>

#include <boost/json/serialize.hpp>
#include <fstream>
#include <iterator>
#include <system_error>

#include "Fields.hpp"
#include "HttpError.hpp"

namespace minnow {

namespace {

constexpr std::string_view OPEN_TAG = "{{";
constexpr std::string_view CLOSE_TAG = "}}";

}  // namespace

FileTemplateRenderer::FileTemplateRenderer(std::filesystem::path dir)
    : dir_(std::filesystem::absolute(std::move(dir)).lexically_normal()) {}

std::string FileTemplateRenderer::substitute(std::string_view tpl,
                                             const boost::json::object& vars) {
    std::string out;
    out.reserve(tpl.size());

    for (;;) {
        auto open = tpl.find(OPEN_TAG);
        if (open == std::string_view::npos) {
            out += tpl;
            break;
        }
        auto close = tpl.find(CLOSE_TAG, open + OPEN_TAG.size());
        if (close == std::string_view::npos) {
            out += tpl;
            break;
        }

        out += tpl.substr(0, open);
        auto key = trim(tpl.substr(open + OPEN_TAG.size(), close - open - OPEN_TAG.size()));
        if (const auto* value = vars.if_contains(key)) {
            if (value->is_string()) {
                out += value->get_string();
            } else if (!value->is_null()) {
                out += boost::json::serialize(*value);
            }
        }
        tpl.remove_prefix(close + CLOSE_TAG.size());
    }
    return out;
}

std::string FileTemplateRenderer::render(std::string_view name,
                                         const boost::json::object& vars) const {
    auto file = (dir_ / std::filesystem::path(name)).lexically_normal();
    auto rel = file.lexically_relative(dir_);
    if (rel.empty() || *rel.begin() == "..") {
        throw ForbiddenPath(std::string{name});
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw NotFound("template " + std::string{name});
    }
    std::string tpl{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    spdlog::trace("[Templates] Rendering {} with {} variables", name, vars.size());
    return substitute(tpl, vars);
}

Templates::Templates(std::shared_ptr<const TemplateRenderer> renderer)
    : renderer_(std::move(renderer)) {}

void Templates::configure(std::shared_ptr<const TemplateRenderer> renderer) {
    renderer_ = std::move(renderer);
}

std::string Templates::render(std::string_view name, const boost::json::object& vars) const {
    if (!renderer_) {
        throw TemplateUnavailable(std::string{name});
    }
    return renderer_->render(name, vars);
}

}  // namespace minnow
