#include "Session.hpp"

#include <utility>

namespace minnow {

Session::Session(std::string id, clock::time_point created)
    : id_(std::move(id)), last_access_(created) {}

std::optional<boost::json::value> Session::get(std::string_view key) const {
    std::lock_guard<std::mutex> lock(attributes_mutex_);
    auto it = attributes_.find(key);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    return it->value();
}

void Session::set(std::string_view key, boost::json::value value) {
    std::lock_guard<std::mutex> lock(attributes_mutex_);
    attributes_[key] = std::move(value);
}

bool Session::erase(std::string_view key) {
    std::lock_guard<std::mutex> lock(attributes_mutex_);
    return attributes_.erase(key) > 0;
}

bool Session::contains(std::string_view key) const {
    std::lock_guard<std::mutex> lock(attributes_mutex_);
    return attributes_.contains(key);
}

boost::json::object Session::snapshot() const {
    std::lock_guard<std::mutex> lock(attributes_mutex_);
    return attributes_;
}

}  // namespace minnow
