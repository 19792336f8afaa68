#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "Handler.hpp"

namespace minnow {

inline constexpr std::string_view FALLBACK_HANDLER = "index";

using WebSocketStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

// Receives an accepted websocket and the path segments after its name.
using WebSocketHandlerFn =
    std::function<boost::asio::awaitable<void>(WebSocketStream&, std::vector<std::string>)>;

struct RouteMatch {
    const Route* route = nullptr;  // nullptr when even the fallback is missing
    std::string name;
    std::vector<std::string> positional;
    bool fallback = false;
};

/**
 * @brief Maps the first path segment to a registered handler.
 * @details
 *  Registration happens at startup; afterwards the router is read-only and
 *  shared between all connections without locking.
 *
 *  - ""            -> index, no positional params
 *  - "greet/42"    -> greet, ["42"]
 *  - "nope/a" (no handler "nope") -> index, ["nope", "a"], fallback = true
 */
class Router {
   public:
    Router& add(std::string name, std::vector<Parameter> params, HandlerFn fn);
    Router& add_websocket(std::string name, WebSocketHandlerFn fn);

    const Route* find(std::string_view name) const;
    const WebSocketHandlerFn* find_websocket(std::string_view name) const;

    RouteMatch resolve(std::string_view path) const;

    static std::vector<std::string> split_path(std::string_view path);

   private:
    std::unordered_map<std::string, Route> routes_;
    std::unordered_map<std::string, WebSocketHandlerFn> websocket_routes_;
};

}  // namespace minnow
