#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>
#include <optional>

#include "Dispatcher.hpp"
#include "Router.hpp"
#include "Types.hpp"

namespace minnow::network {

/**
 * @brief Handles a single HTTP connection.
 * @details
 *  Reads one request at a time with a buffer_body parser so the body reaches
 *  the dispatcher chunk by chunk, and writes the response either in one piece
 *  (Content-Length) or with chunked transfer encoding for streamed bodies.
 *  WebSocket upgrades are handed to a WebSocketSession.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
   public:
    HttpSession(tcp::socket&& socket, std::shared_ptr<Dispatcher> dispatcher,
                std::shared_ptr<const Router> router, std::chrono::seconds idle_timeout);

    // Entry point: launches the session coroutine
    void run();

   private:
    class Exchange;

    asio::awaitable<void> do_session();
    asio::awaitable<void> do_graceful_close();
    asio::awaitable<void> do_bad_request(unsigned version);
    void do_close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::shared_ptr<const Router> router_;
    std::chrono::seconds idle_timeout_;

    // Reset per request (required for HTTP keep-alive)
    std::optional<http::request_parser<http::buffer_body>> parser_;
};

}  // namespace minnow::network
