#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>

#include "Router.hpp"
#include "config.hpp"

namespace minnow::network {

/**
 * @brief High-level Server Facade.
 * Orchestrates the thread pool, session store, sweeper, dispatcher and listener.
 */
class Server {
   public:
    Server(boost::asio::io_context& io, const AppConfig& config, std::shared_ptr<const Router> router);
    ~Server();

    // Starts the workers and the acceptor, then runs the main loop until Stop().
    void Start();
    void Stop();

    // Bound address, useful when the configured port is 0.
    boost::asio::ip::tcp::endpoint local_endpoint() const;

   private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace minnow::network
