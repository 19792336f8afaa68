#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace minnow {

/**
 * @brief Server-side per-client state keyed by the `session_id` cookie.
 * @details
 *  Every attribute operation is individually serialized, nothing more:
 *  two requests sharing a session may interleave freely and concurrent
 *  writers to the same key observe last-write-wins.
 *  The last-access timestamp is owned by SessionStore and only touched under
 *  the store's lock.
 */
class Session {
   public:
    using clock = std::chrono::steady_clock;

    Session(std::string id, clock::time_point created);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const noexcept { return id_; }

    std::optional<boost::json::value> get(std::string_view key) const;
    void set(std::string_view key, boost::json::value value);
    bool erase(std::string_view key);
    bool contains(std::string_view key) const;

    // Copy of the whole bag, for binding and rendering.
    boost::json::object snapshot() const;

   private:
    friend class SessionStore;

    std::string id_;
    clock::time_point last_access_;

    mutable std::mutex attributes_mutex_;
    boost::json::object attributes_;
};

}  // namespace minnow
