#include "Router.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace minnow {

Router& Router::add(std::string name, std::vector<Parameter> params, HandlerFn fn) {
    if (!fn) {
        throw std::invalid_argument("Handler '" + name + "' has no callable");
    }
    spdlog::debug("[Router] Registered handler '{}' ({} params)", name, params.size());

    Route route{HandlerDescriptor{name, std::move(params)}, std::move(fn)};
    routes_.insert_or_assign(std::move(name), std::move(route));
    return *this;
}

Router& Router::add_websocket(std::string name, WebSocketHandlerFn fn) {
    if (!fn) {
        throw std::invalid_argument("WebSocket handler '" + name + "' has no callable");
    }
    spdlog::debug("[Router] Registered websocket handler '{}'", name);
    websocket_routes_.insert_or_assign(std::move(name), std::move(fn));
    return *this;
}

const Route* Router::find(std::string_view name) const {
    auto it = routes_.find(std::string{name});
    return it != routes_.end() ? &it->second : nullptr;
}

const WebSocketHandlerFn* Router::find_websocket(std::string_view name) const {
    auto it = websocket_routes_.find(std::string{name});
    return it != websocket_routes_.end() ? &it->second : nullptr;
}

std::vector<std::string> Router::split_path(std::string_view path) {
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }

    std::vector<std::string> segments;
    if (path.empty()) {
        return segments;
    }
    for (;;) {
        auto slash = path.find('/');
        segments.emplace_back(path.substr(0, slash));
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return segments;
}

RouteMatch Router::resolve(std::string_view path) const {
    auto segments = split_path(path);
    RouteMatch match;

    if (segments.empty()) {
        match.name = FALLBACK_HANDLER;
        match.route = find(FALLBACK_HANDLER);
        return match;
    }

    if (const Route* route = find(segments.front())) {
        match.name = segments.front();
        match.route = route;
        match.positional.assign(std::make_move_iterator(segments.begin() + 1),
                                std::make_move_iterator(segments.end()));
        return match;
    }

    spdlog::trace("[Router] No handler '{}', falling back to '{}'", segments.front(),
                  FALLBACK_HANDLER);
    match.name = FALLBACK_HANDLER;
    match.route = find(FALLBACK_HANDLER);
    match.positional = std::move(segments);
    match.fallback = true;
    return match;
}

}  // namespace minnow
