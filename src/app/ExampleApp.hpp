#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "Router.hpp"
#include "StaticFiles.hpp"
#include "TemplateRenderer.hpp"

namespace minnow::app {

// In-memory paste storage for the pastebin handlers. Lost on restart.
class PasteBoard {
   public:
    std::string add(std::string content);
    std::optional<std::string> get(const std::string& id) const;
    bool remove(const std::string& id);

   private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> pastes_;
};

struct ExampleDeps {
    std::shared_ptr<const StaticFiles> static_files;
    std::shared_ptr<const Templates> templates;
    std::shared_ptr<PasteBoard> pastes;
};

/**
 * @brief Registers the demo handlers:
 *  index, upload_form, greet, upload, headers, static, visits, paste, stream
 *  and the "echo" websocket handler.
 */
void RegisterExampleRoutes(Router& router, const ExampleDeps& deps);

std::string html_escape(std::string_view text);

}  // namespace minnow::app
