#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Fields.hpp"

namespace minnow {

/**
 * @brief Lazy, finite, forward-only sequence of body chunks.
 * @details
 *  Pulled one chunk at a time by the dispatcher; not restartable and consumed
 *  exactly once. The producer returns std::nullopt when the sequence ends and
 *  may throw, which the dispatcher treats as a late failure.
 */
class ChunkStream {
   public:
    using producer = std::function<std::optional<std::string>()>;

    ChunkStream() = default;
    explicit ChunkStream(producer next) : next_(std::move(next)) {}

    ChunkStream(ChunkStream&&) noexcept = default;
    ChunkStream& operator=(ChunkStream&&) noexcept = default;
    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    std::optional<std::string> next() {
        if (done_ || !next_) {
            return std::nullopt;
        }
        auto chunk = next_();
        if (!chunk) {
            done_ = true;
            next_ = nullptr;
        }
        return chunk;
    }

    bool valid() const noexcept { return static_cast<bool>(next_) || done_; }
    bool exhausted() const noexcept { return done_; }

    static ChunkStream from_chunks(std::vector<std::string> chunks) {
        return ChunkStream([chunks = std::move(chunks), i = std::size_t{0}]() mutable
                           -> std::optional<std::string> {
            if (i == chunks.size()) {
                return std::nullopt;
            }
            return std::move(chunks[i++]);
        });
    }

   private:
    producer next_;
    bool done_ = false;
};

// What a handler may hand back as a body.
using ResponseBody = std::variant<std::string, Bytes, ChunkStream>;

// The three accepted handler return shapes.
struct Body {
    ResponseBody content;
};

struct StatusBody {
    int status;
    ResponseBody content;
};

struct StatusBodyHeaders {
    int status;
    ResponseBody content;
    HeaderList headers;
};

using HandlerResult = std::variant<Body, StatusBody, StatusBodyHeaders>;

struct NormalizedResponse {
    int status = 200;
    std::string reason;
    HeaderList headers;
    std::variant<std::string, ChunkStream> body;

    bool streaming() const noexcept { return std::holds_alternative<ChunkStream>(body); }
};

}  // namespace minnow
