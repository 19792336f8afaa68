#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <memory>

#include "SessionStore.hpp"

namespace minnow {

/**
 * @brief Evicts expired sessions on a fixed interval.
 * Runs as a detached coroutine on the given io_context until stop().
 */
class SessionSweeper : public std::enable_shared_from_this<SessionSweeper> {
   public:
    SessionSweeper(boost::asio::io_context& io, std::shared_ptr<SessionStore> store,
                   boost::asio::steady_timer::duration interval);

    void run();
    void stop();

    // Completed sweep passes.
    std::size_t sweeps() const noexcept { return sweeps_.load(); }

   private:
    boost::asio::awaitable<void> do_sweep_loop();

    boost::asio::steady_timer timer_;
    std::shared_ptr<SessionStore> store_;
    boost::asio::steady_timer::duration interval_;
    bool stopped_ = false;
    std::atomic<std::size_t> sweeps_{0};
};

}  // namespace minnow
