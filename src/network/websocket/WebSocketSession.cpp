#include "WebSocketSession.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>

namespace minnow::network {

WebSocketSession::WebSocketSession(tcp::socket&& socket, std::shared_ptr<const Router> router)
    : ws_(std::move(socket)), router_(std::move(router)) {}

void WebSocketSession::run(http::request<http::empty_body> req) {
    asio::co_spawn(
        ws_.get_executor(),
        [self = shared_from_this(), req = std::move(req)]() mutable {
            return self->do_session(std::move(req));
        },
        asio::detached);
}

asio::awaitable<void> WebSocketSession::do_session(http::request<http::empty_body> req) {
    std::vector<std::string> segments;
    if (auto target = boost::urls::parse_origin_form(req.target())) {
        segments = Router::split_path(target->path());
    }
    std::string name = segments.empty() ? std::string{"default"} : segments.front();
    std::vector<std::string> params;
    if (!segments.empty()) {
        params.assign(segments.begin() + 1, segments.end());
    }

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    auto [ec_accept] = co_await ws_.async_accept(req, asio::as_tuple(asio::use_awaitable));
    if (ec_accept) {
        spdlog::error("WS Accept failed: {}", ec_accept.message());
        co_return;
    }

    const WebSocketHandlerFn* handler = router_->find_websocket(name);
    if (handler == nullptr) {
        spdlog::debug("[WebSocket] No handler '{}', closing", name);
        co_await do_close(websocket::close_code::normal);
        co_return;
    }

    spdlog::info("WS Connected: {}", name);
    bool failed = false;
    try {
        co_await (*handler)(ws_, std::move(params));
    } catch (const std::exception& e) {
        spdlog::error("[WebSocket] Handler '{}' failed: {}", name, e.what());
        failed = true;
    }

    if (failed && ws_.is_open()) {
        co_await do_close(websocket::close_code::internal_error);
    }
}

asio::awaitable<void> WebSocketSession::do_close(websocket::close_code code) {
    auto [ec] = co_await ws_.async_close(code, asio::as_tuple(asio::use_awaitable));
    if (ec && ec != websocket::error::closed) {
        spdlog::debug("[WebSocket] Close failed: {}", ec.message());
    }
}

}  // namespace minnow::network
