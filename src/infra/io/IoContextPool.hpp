#pragma once

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace minnow {

/**
 * @brief Pool of `io_context` instances, each pinned to one thread.
 * Connections are spread over the contexts round-robin, so a request runs on
 * exactly one thread for its whole life.
 */
class IoContextPool {
   public:
    explicit IoContextPool(std::size_t pool_size);

    // Stops the contexts; the jthreads join on destruction.
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void run();
    void stop();

    boost::asio::io_context& get_io_context();

    std::size_t size() const noexcept { return io_contexts_.size(); }

   private:
    std::vector<std::shared_ptr<boost::asio::io_context>> io_contexts_;

    using work_guard_type =
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::vector<work_guard_type> work_guards_;

    std::vector<std::jthread> threads_;

    std::atomic<std::size_t> next_io_context_{0};
};

}  // namespace minnow
