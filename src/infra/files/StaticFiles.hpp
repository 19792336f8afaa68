#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "ResponseTypes.hpp"

namespace minnow {

/**
 * @brief Serves files below a fixed root directory.
 * @details
 *  serve() returns a handler-shaped result:
 *  - 403 "403 Forbidden" when the path resolves outside the root
 *  - 404 "404 Not Found" when it is not a regular file
 *  - 200 with the bytes and a guessed Content-Type otherwise
 */
class StaticFiles {
   public:
    explicit StaticFiles(std::filesystem::path root);

    HandlerResult serve(std::string_view relative) const;

    const std::filesystem::path& root() const noexcept { return root_; }

    static std::string guess_mime(const std::filesystem::path& file);

   private:
    std::filesystem::path root_;
};

}  // namespace minnow
