#include "SessionSweeper.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace minnow {

SessionSweeper::SessionSweeper(boost::asio::io_context& io, std::shared_ptr<SessionStore> store,
                               boost::asio::steady_timer::duration interval)
    : timer_(io), store_(std::move(store)), interval_(interval) {}

void SessionSweeper::run() {
    spdlog::debug("[SessionSweeper] Sweeping every {}ms (timeout {}s)",
                  std::chrono::duration_cast<std::chrono::milliseconds>(interval_).count(),
                  store_->timeout().count());
    boost::asio::co_spawn(
        timer_.get_executor(), [self = shared_from_this()]() { return self->do_sweep_loop(); },
        boost::asio::detached);
}

void SessionSweeper::stop() {
    boost::asio::post(timer_.get_executor(), [self = shared_from_this()]() {
        self->stopped_ = true;
        self->timer_.cancel();
    });
}

boost::asio::awaitable<void> SessionSweeper::do_sweep_loop() {
    while (!stopped_) {
        timer_.expires_after(interval_);
        auto [ec] = co_await timer_.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec == boost::asio::error::operation_aborted || stopped_) {
            break;
        }
        store_->sweep();
        ++sweeps_;
    }
    spdlog::debug("[SessionSweeper] Stopped");
}

}  // namespace minnow
