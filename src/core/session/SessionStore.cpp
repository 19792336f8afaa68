#include "SessionStore.hpp"

#include <spdlog/spdlog.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <utility>

namespace minnow {

SessionStore::SessionStore(std::chrono::seconds timeout, time_source now)
    : timeout_(timeout), now_(std::move(now)) {}

std::string SessionStore::next_id_locked() {
    boost::uuids::random_generator generator;
    for (;;) {
        std::string id = boost::uuids::to_string(generator());
        if (!sessions_.contains(id)) {
            return id;
        }
        spdlog::warn("[SessionStore] Session id collision, drawing again");
    }
}

SessionHandle SessionStore::resolve(std::string_view cookie_session_id) {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);

    if (!cookie_session_id.empty()) {
        auto it = sessions_.find(std::string{cookie_session_id});
        if (it != sessions_.end()) {
            it->second->last_access_ = now;
            return {it->second, false};
        }
        spdlog::debug("[SessionStore] Unknown session id presented, issuing a new one");
    }

    auto session = std::make_shared<Session>(next_id_locked(), now);
    sessions_.emplace(session->id(), session);
    spdlog::debug("[SessionStore] Session {} created ({} live)", session->id(), sessions_.size());
    return {std::move(session), true};
}

std::size_t SessionStore::sweep(clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t removed = std::erase_if(sessions_, [&](const auto& entry) {
        return entry.second->last_access_ + timeout_ <= now;
    });

    if (removed > 0) {
        spdlog::debug("[SessionStore] Swept {} expired sessions ({} live)", removed,
                      sessions_.size());
    }
    return removed;
}

std::size_t SessionStore::sweep() { return sweep(now_()); }

std::shared_ptr<Session> SessionStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return (it != sessions_.end()) ? it->second : nullptr;
}

std::size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("[SessionStore] Clearing {} sessions", sessions_.size());
    sessions_.clear();
}

}  // namespace minnow
