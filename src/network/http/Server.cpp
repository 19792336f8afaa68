#include "Server.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio.hpp>

#include "Dispatcher.hpp"
#include "IoContextPool.hpp"
#include "Listener.hpp"
#include "SessionSweeper.hpp"
#include "Types.hpp"

namespace minnow::network {

struct Server::Impl {
    asio::io_context& main_io_;

    // Components
    std::shared_ptr<IoContextPool> pool_;
    std::shared_ptr<SessionStore> sessions_;
    std::shared_ptr<SessionSweeper> sweeper_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::shared_ptr<Listener> listener_;

    Impl(asio::io_context& io, const AppConfig& config, std::shared_ptr<const Router> router)
        : main_io_(io) {
        // 1. Thread Pool
        pool_ = std::make_shared<IoContextPool>(config.server.threads);

        // 2. Session Management
        sessions_ =
            std::make_shared<SessionStore>(std::chrono::seconds(config.session.timeout_seconds));
        sweeper_ = std::make_shared<SessionSweeper>(
            main_io_, sessions_, std::chrono::seconds(config.session.sweep_interval_seconds));

        // 3. Request Dispatch
        dispatcher_ = std::make_shared<Dispatcher>(router, sessions_);

        // 4. HTTP Listener
        tcp::endpoint endpoint{asio::ip::make_address(config.server.address), config.server.port};
        listener_ = std::make_shared<Listener>(
            main_io_, *pool_, endpoint, dispatcher_, std::move(router),
            std::chrono::seconds(config.server.idle_timeout_seconds));

        spdlog::info("Server initialized on {}:{} (Threads: {})", config.server.address,
                     config.server.port, pool_->size());
    }

    void Start() {
        pool_->run();      // Start worker threads
        sweeper_->run();   // Periodic session eviction
        listener_->run();  // Start accepting connections
        main_io_.run();    // Start main thread loop
    }

    void Stop() {
        spdlog::info("Stopping server components...");
        listener_->stop();
        sweeper_->stop();
        pool_->stop();
        main_io_.stop();
        sessions_->clear();
        if (auto late = dispatcher_->late_failures(); late > 0) {
            spdlog::warn("{} responses failed after their status line was sent", late);
        }
    }
};

Server::Server(asio::io_context& io, const AppConfig& config, std::shared_ptr<const Router> router)
    : pImpl_(std::make_unique<Impl>(io, config, std::move(router))) {}

Server::~Server() = default;

void Server::Start() { pImpl_->Start(); }
void Server::Stop() { pImpl_->Stop(); }

boost::asio::ip::tcp::endpoint Server::local_endpoint() const {
    return pImpl_->listener_->local_endpoint();
}

}  // namespace minnow::network
