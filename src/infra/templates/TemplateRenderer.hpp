#pragma once

#include <boost/json/object.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace minnow {

class TemplateRenderer {
   public:
    virtual ~TemplateRenderer() = default;
    virtual std::string render(std::string_view name, const boost::json::object& vars) const = 0;
};

/**
 * @brief Loads `<dir>/<name>` and replaces `{{ key }}` placeholders.
 * String values are inserted as-is, other JSON values serialized, unknown
 * keys render empty.
 * @throws ForbiddenPath if the name escapes the directory, NotFound if the
 *  file does not exist.
 */
class FileTemplateRenderer : public TemplateRenderer {
   public:
    explicit FileTemplateRenderer(std::filesystem::path dir);

    std::string render(std::string_view name, const boost::json::object& vars) const override;

    static std::string substitute(std::string_view tpl, const boost::json::object& vars);

   private:
    std::filesystem::path dir_;
};

/**
 * @brief Optional template engine handed to handlers.
 * render() throws TemplateUnavailable until a renderer is configured.
 */
class Templates {
   public:
    Templates() = default;
    explicit Templates(std::shared_ptr<const TemplateRenderer> renderer);

    void configure(std::shared_ptr<const TemplateRenderer> renderer);
    bool available() const noexcept { return static_cast<bool>(renderer_); }

    std::string render(std::string_view name, const boost::json::object& vars = {}) const;

   private:
    std::shared_ptr<const TemplateRenderer> renderer_;
};

}  // namespace minnow
