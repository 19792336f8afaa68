#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <memory>

#include "Router.hpp"
#include "Types.hpp"

namespace minnow::network {

/**
 * @brief Runs the websocket handler selected by the upgrade request's path.
 * @details
 *  The first path segment names the handler ("default" for an empty path),
 *  the rest are passed as positional params. Without a matching handler the
 *  socket is accepted and closed normally (1000); a handler that throws gets
 *  the connection closed with 1011.
 */
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
   public:
    WebSocketSession(tcp::socket&& socket, std::shared_ptr<const Router> router);

    void run(http::request<http::empty_body> req);

   private:
    asio::awaitable<void> do_session(http::request<http::empty_body> req);
    asio::awaitable<void> do_close(websocket::close_code code);

    WebSocketStream ws_;
    std::shared_ptr<const Router> router_;
};

}  // namespace minnow::network
