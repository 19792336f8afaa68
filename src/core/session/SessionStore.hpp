#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "Session.hpp"

namespace minnow {

struct SessionHandle {
    std::shared_ptr<Session> session;
    bool created = false;
};

/**
 * @brief Process-wide registry of live sessions.
 * @details
 *  A single mutex guards the id -> session map and the last-access
 *  timestamps, so resolve() and sweep() may run concurrently from any thread.
 *  Created at startup, cleared at shutdown; nothing is persisted.
 */
class SessionStore {
   public:
    using clock = Session::clock;
    using time_source = std::function<clock::time_point()>;

    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{8 * 3600};

    explicit SessionStore(std::chrono::seconds timeout = DEFAULT_TIMEOUT,
                          time_source now = &clock::now);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * @brief Returns the session named by the cookie, refreshing its timestamp,
     * or a freshly created one when the id is empty or unknown.
     */
    SessionHandle resolve(std::string_view cookie_session_id);

    // Removes every session with last_access + timeout <= now.
    std::size_t sweep(clock::time_point now);
    std::size_t sweep();

    std::shared_ptr<Session> get(const std::string& id) const;
    std::size_t size() const;
    void clear();

    std::chrono::seconds timeout() const noexcept { return timeout_; }

   private:
    std::string next_id_locked();

    mutable std::mutex mutex_;
    std::chrono::seconds timeout_;
    time_source now_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

}  // namespace minnow
