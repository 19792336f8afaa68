#pragma once

#include <boost/asio/awaitable.hpp>
#include <string>
#include <string_view>

#include "Fields.hpp"

namespace minnow {

struct RequestHead {
    std::string method;
    std::string path;          // decoded, leading '/' kept
    std::string query_string;  // still percent-encoded
    HeaderList headers;
};

struct BodyChunk {
    std::string data;
    bool more = false;
};

/**
 * @brief Inbound half of the transport boundary.
 * head() is available up front; body chunks are pulled until one arrives
 * with more == false.
 */
class RequestSource {
   public:
    virtual ~RequestSource() = default;

    virtual const RequestHead& head() const = 0;
    virtual boost::asio::awaitable<BodyChunk> read_body_chunk() = 0;
};

/**
 * @brief Outbound half of the transport boundary.
 * Exactly one start(), then write() until a call with final == true.
 * `streaming` tells the transport the body length is unknown.
 */
class ResponseSink {
   public:
    virtual ~ResponseSink() = default;

    virtual boost::asio::awaitable<void> start(int status, std::string_view reason,
                                               const HeaderList& headers, bool streaming) = 0;
    virtual boost::asio::awaitable<void> write(std::string_view data, bool final) = 0;
};

}  // namespace minnow
