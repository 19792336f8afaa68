#pragma once

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core/string.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "Transport.hpp"

namespace minnow::test {

// Runs a coroutine to completion on a private io_context.
template <class T>
T run(boost::asio::awaitable<T> task) {
    boost::asio::io_context io;
    auto result = boost::asio::co_spawn(io, std::move(task), boost::asio::use_future);
    io.run();
    return result.get();
}

class FakeRequest : public RequestSource {
   public:
    FakeRequest(std::string method, std::string path, std::string query = {},
                HeaderList headers = {}, std::vector<std::string> body_chunks = {})
        : head_{std::move(method), std::move(path), std::move(query), std::move(headers)},
          chunks_(std::move(body_chunks)) {}

    const RequestHead& head() const override { return head_; }

    boost::asio::awaitable<BodyChunk> read_body_chunk() override {
        ++reads;
        if (next_ >= chunks_.size()) {
            co_return BodyChunk{};
        }
        std::string data = chunks_[next_++];
        co_return BodyChunk{std::move(data), next_ < chunks_.size()};
    }

    int reads = 0;

   private:
    RequestHead head_;
    std::vector<std::string> chunks_;
    std::size_t next_ = 0;
};

class RecordingSink : public ResponseSink {
   public:
    boost::asio::awaitable<void> start(int s, std::string_view r, const HeaderList& h,
                                       bool is_streaming) override {
        ++starts;
        status = s;
        reason = r;
        headers = h;
        streaming = is_streaming;
        co_return;
    }

    boost::asio::awaitable<void> write(std::string_view data, bool final) override {
        chunks.emplace_back(data);
        if (final) ++finals;
        co_return;
    }

    std::string body() const {
        std::string out;
        for (const auto& c : chunks) out += c;
        return out;
    }

    int count_header(std::string_view name) const {
        int n = 0;
        for (const auto& [key, value] : headers) {
            if (boost::beast::iequals(key, name)) ++n;
        }
        return n;
    }

    std::string header(std::string_view name) const {
        for (const auto& [key, value] : headers) {
            if (boost::beast::iequals(key, name)) return value;
        }
        return {};
    }

    int starts = 0;
    int finals = 0;
    int status = 0;
    std::string reason;
    HeaderList headers;
    bool streaming = false;
    std::vector<std::string> chunks;
};

}  // namespace minnow::test
