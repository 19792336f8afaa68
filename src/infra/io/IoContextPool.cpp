#include "IoContextPool.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace minnow {

namespace {

// Runs one worker's context. An exception escaping a handler must not take
// every connection on this context down with it, so the loop is resumed.
void run_worker(std::size_t index, boost::asio::io_context& ioc) {
    spdlog::debug("[IoContextPool] Worker {} started", index);
    for (;;) {
        try {
            ioc.run();
            break;
        } catch (const std::exception& e) {
            spdlog::critical("[IoContextPool] Worker {} caught escaped exception: {}", index,
                             e.what());
        }
    }
    spdlog::debug("[IoContextPool] Worker {} finished", index);
}

}  // namespace

IoContextPool::IoContextPool(std::size_t pool_size) {
    if (pool_size == 0) {
        throw std::invalid_argument("IoContextPool needs at least one thread");
    }

    io_contexts_.reserve(pool_size);
    work_guards_.reserve(pool_size);
    for (std::size_t i = 0; i < pool_size; ++i) {
        // concurrency hint 1: each context is only ever run by its own thread
        auto& ioc = io_contexts_.emplace_back(std::make_shared<boost::asio::io_context>(1));
        work_guards_.emplace_back(boost::asio::make_work_guard(*ioc));
    }
}

IoContextPool::~IoContextPool() { stop(); }

void IoContextPool::run() {
    if (!threads_.empty()) {
        spdlog::warn("[IoContextPool] run() called twice, ignoring");
        return;
    }

    spdlog::info("[IoContextPool] Serving connections on {} worker threads", io_contexts_.size());
    threads_.reserve(io_contexts_.size());
    for (std::size_t i = 0; i < io_contexts_.size(); ++i) {
        threads_.emplace_back([i, ioc = io_contexts_[i]]() { run_worker(i, *ioc); });
    }
}

void IoContextPool::stop() {
    // Dropping the guards lets idle contexts return; stop() interrupts busy ones.
    work_guards_.clear();
    for (const auto& ioc : io_contexts_) {
        if (!ioc->stopped()) {
            ioc->stop();
        }
    }
}

boost::asio::io_context& IoContextPool::get_io_context() {
    std::size_t idx =
        next_io_context_.fetch_add(1, std::memory_order_relaxed) % io_contexts_.size();
    return *io_contexts_[idx];
}

}  // namespace minnow
