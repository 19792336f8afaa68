#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <memory>

#include "Dispatcher.hpp"
#include "IoContextPool.hpp"
#include "Router.hpp"
#include "Types.hpp"

namespace minnow::network {

/**
 * @brief The TCP Connection Acceptor.
 * @details
 *  Runs on the main io_context and hands every accepted socket to an
 *  io_context taken from the pool, where its HttpSession runs. Parsing,
 *  dispatch and handler work therefore never block the acceptor.
 */
class Listener : public std::enable_shared_from_this<Listener> {
   public:
    Listener(asio::io_context& ioc, IoContextPool& pool, const tcp::endpoint& endpoint,
             std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<const Router> router,
             std::chrono::seconds idle_timeout);

    // Start accepting incoming connections
    void run();
    void stop();

    tcp::endpoint local_endpoint() const;

   private:
    asio::awaitable<void> do_accept();

    tcp::acceptor acceptor_;
    IoContextPool& pool_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::shared_ptr<const Router> router_;
    std::chrono::seconds idle_timeout_;
};

}  // namespace minnow::network
