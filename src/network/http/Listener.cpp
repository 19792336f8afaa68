#include "Listener.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include "HttpSession.hpp"

namespace minnow::network {

namespace {

void fail(beast::error_code ec, const char* what) {
    if (ec != beast::errc::not_connected && ec != asio::error::eof &&
        ec != asio::error::connection_reset) {
        spdlog::error("{} : {}", what, ec.message());
    }
}

}  // namespace

Listener::Listener(asio::io_context& ioc, IoContextPool& pool, const tcp::endpoint& endpoint,
                   std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<const Router> router,
                   std::chrono::seconds idle_timeout)
    : acceptor_(ioc),
      pool_(pool),
      dispatcher_(std::move(dispatcher)),
      router_(std::move(router)),
      idle_timeout_(idle_timeout) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        fail(ec, "open");
        throw boost::system::system_error(ec, "open");
    }

    // Allow immediate reuse of the port after a restart (TIME_WAIT).
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        fail(ec, "set_option(reuse_address)");
        throw boost::system::system_error(ec, "set_option");
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        fail(ec, "bind");
        throw boost::system::system_error(ec, "bind");
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        fail(ec, "listen");
        throw boost::system::system_error(ec, "listen");
    }
    spdlog::debug("Listener successfully bound to {} {}", endpoint.address().to_string(),
                  endpoint.port());
}

void Listener::run() {
    spdlog::debug("Starting to accept connections..");

    // fire and forget coroutine, keeps listening until the acceptor closes
    asio::co_spawn(
        acceptor_.get_executor(), [self = shared_from_this()]() { return self->do_accept(); },
        asio::detached);
}

void Listener::stop() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

tcp::endpoint Listener::local_endpoint() const {
    beast::error_code ec;
    return acceptor_.local_endpoint(ec);
}

asio::awaitable<void> Listener::do_accept() {
    try {
        for (;;) {
            // the socket is created on a pool io_context
            auto& pool_ioc = pool_.get_io_context();

            auto [ec, socket] =
                co_await acceptor_.async_accept(pool_ioc, asio::as_tuple(asio::use_awaitable));

            if (ec) {
                if (ec == asio::error::operation_aborted) {
                    break;
                }
                fail(ec, "accept");
                continue;
            }

            spdlog::debug("New connection accepted");
            std::make_shared<HttpSession>(std::move(socket), dispatcher_, router_, idle_timeout_)
                ->run();
        }
    } catch (const std::exception& e) {
        spdlog::error("[Listener] Uncaught exception: {}", e.what());
    }
}

}  // namespace minnow::network
