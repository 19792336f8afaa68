#include "HttpSession.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>

#include "ResponseNormalizer.hpp"
#include "WebSocketSession.hpp"

namespace {

constexpr std::size_t BODY_CHUNK_SIZE = 16 * 1024;
constexpr int DRAIN_BUFFER_SIZE = 1024;  // Drain unread TCP data during shutdown
constexpr int DRAIN_TIMEOUT_SECONDS = 1;

void fail(beast::error_code ec, const char* what) {
    if (ec == beast::error::timeout) {
        spdlog::debug("[HttpSession] Stream timeout: {}", what);
        return;
    }
    if (ec != beast::errc::not_connected && ec != asio::error::eof &&
        ec != asio::error::connection_reset) {
        spdlog::error("[HttpSession] {} error: {}", what, ec.message());
    }
}

}  // namespace

namespace minnow::network {

/**
 * @brief One request/response exchange on the connection.
 * Adapts the Beast parser and stream to the dispatcher's transport boundary.
 */
class HttpSession::Exchange final : public RequestSource, public ResponseSink {
   public:
    Exchange(beast::tcp_stream& stream, beast::flat_buffer& buffer,
             http::request_parser<http::buffer_body>& parser, RequestHead head,
             std::chrono::seconds timeout)
        : stream_(stream),
          buffer_(buffer),
          parser_(parser),
          head_(std::move(head)),
          timeout_(timeout),
          version_(parser.get().version()),
          keep_alive_(parser.get().keep_alive()) {}

    const RequestHead& head() const override { return head_; }

    asio::awaitable<BodyChunk> read_body_chunk() override {
        if (parser_.is_done()) {
            co_return BodyChunk{};
        }

        auto& body = parser_.get().body();
        body.data = chunk_buf_.data();
        body.size = chunk_buf_.size();

        stream_.expires_after(timeout_);
        auto [ec, _] =
            co_await http::async_read(stream_, buffer_, parser_, asio::as_tuple(asio::use_awaitable));
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            throw boost::system::system_error(ec, "read body");
        }

        std::size_t got = chunk_buf_.size() - body.size;
        co_return BodyChunk{std::string(chunk_buf_.data(), got), !parser_.is_done()};
    }

    asio::awaitable<void> start(int status, std::string_view reason, const HeaderList& headers,
                                bool streaming) override {
        status_ = status;
        reason_ = reason;
        headers_ = headers;
        // HTTP/1.0 peers cannot read chunked encoding; their stream is buffered
        // and sent with a Content-Length instead.
        streaming_ = streaming && version_ >= 11;
        // An unread request body leaves the connection unusable.
        keep_alive_ = keep_alive_ && parser_.is_done();

        if (!streaming_) {
            co_return;
        }

        chunked_res_.emplace();
        fill_header(*chunked_res_);
        chunked_res_->chunked(true);
        serializer_.emplace(*chunked_res_);

        stream_.expires_after(timeout_);
        auto [ec, _] = co_await http::async_write_header(stream_, *serializer_,
                                                         asio::as_tuple(asio::use_awaitable));
        if (ec) {
            throw boost::system::system_error(ec, "write header");
        }
    }

    asio::awaitable<void> write(std::string_view data, bool final) override {
        if (!streaming_) {
            pending_ += data;
            if (final) {
                co_await write_buffered();
            }
            co_return;
        }

        if (!data.empty()) {
            stream_.expires_after(timeout_);
            auto [ec, _] = co_await asio::async_write(
                stream_, http::make_chunk(asio::buffer(data.data(), data.size())),
                asio::as_tuple(asio::use_awaitable));
            if (ec) {
                throw boost::system::system_error(ec, "write chunk");
            }
        }
        if (final) {
            stream_.expires_after(timeout_);
            auto [ec, _] = co_await asio::async_write(stream_, http::make_chunk_last(),
                                                      asio::as_tuple(asio::use_awaitable));
            if (ec) {
                throw boost::system::system_error(ec, "write last chunk");
            }
        }
    }

    bool keep_alive() const noexcept { return keep_alive_; }

   private:
    template <class Body>
    void fill_header(http::response<Body>& res) const {
        res.version(version_);
        res.result(static_cast<unsigned>(status_));
        res.reason(reason_);
        res.keep_alive(keep_alive_);
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        for (const auto& [name, value] : headers_) {
            res.insert(name, value);
        }
    }

    asio::awaitable<void> write_buffered() {
        http::response<http::string_body> res;
        fill_header(res);
        if (status_allows_body(status_)) {
            res.body() = std::move(pending_);
        }
        res.prepare_payload();

        // Disable Nagle (TCP_NODELAY) for lower latency
        beast::error_code ec;
        stream_.socket().set_option(tcp::no_delay(true), ec);

        stream_.expires_after(timeout_);
        auto [ec_write, bytes] =
            co_await http::async_write(stream_, res, asio::as_tuple(asio::use_awaitable));
        if (ec_write) {
            throw boost::system::system_error(ec_write, "write");
        }
        spdlog::debug("[HttpSession] Sent response: {} bytes", bytes);
    }

    beast::tcp_stream& stream_;
    beast::flat_buffer& buffer_;
    http::request_parser<http::buffer_body>& parser_;
    RequestHead head_;
    std::chrono::seconds timeout_;
    unsigned version_;
    bool keep_alive_;

    std::array<char, BODY_CHUNK_SIZE> chunk_buf_{};

    int status_ = 0;
    std::string reason_;
    HeaderList headers_;
    bool streaming_ = false;
    std::string pending_;

    std::optional<http::response<http::empty_body>> chunked_res_;
    std::optional<http::response_serializer<http::empty_body>> serializer_;
};

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<Dispatcher> dispatcher,
                         std::shared_ptr<const Router> router, std::chrono::seconds idle_timeout)
    : stream_(std::move(socket)),
      dispatcher_(std::move(dispatcher)),
      router_(std::move(router)),
      idle_timeout_(idle_timeout) {
    beast::error_code ec;
    auto remote = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        spdlog::debug("New HTTP connection: {}", remote.address().to_string());
    }
}

void HttpSession::run() {
    asio::co_spawn(
        stream_.get_executor(), [self = shared_from_this()]() { return self->do_session(); },
        asio::detached);
}

asio::awaitable<void> HttpSession::do_session() {
    try {
        for (;;) {
            parser_.emplace();
            parser_->body_limit(boost::none);
            stream_.expires_after(idle_timeout_);

            auto [ec_head, _] = co_await http::async_read_header(
                stream_, buffer_, *parser_, asio::as_tuple(asio::use_awaitable));
            if (ec_head) {
                if (ec_head == http::error::end_of_stream) {
                    co_await do_graceful_close();
                } else {
                    fail(ec_head, "read");
                }
                co_return;
            }

            auto& req = parser_->get();

            if (websocket::is_upgrade(req)) {
                spdlog::info("Upgrading to WebSocket...");
                stream_.expires_never();
                std::make_shared<WebSocketSession>(stream_.release_socket(), router_)
                    ->run(http::request<http::empty_body>(req.base()));
                co_return;
            }

            auto target = boost::urls::parse_origin_form(req.target());
            if (!target) {
                spdlog::info("[HttpSession] Rejecting malformed target: {}",
                             std::string_view(req.target().data(), req.target().size()));
                co_await do_bad_request(req.version());
                co_return;
            }

            RequestHead head;
            head.method = std::string(req.method_string());
            head.path = target->path();
            head.query_string = std::string(target->encoded_query());
            for (const auto& field : req) {
                head.headers.emplace_back(std::string(field.name_string()),
                                          std::string(field.value()));
            }

            Exchange exchange(stream_, buffer_, *parser_, std::move(head), idle_timeout_);
            try {
                co_await dispatcher_->dispatch(exchange, exchange);
            } catch (const boost::system::system_error& e) {
                fail(e.code(), "dispatch");
                co_return;
            }

            if (!exchange.keep_alive()) {
                co_await do_graceful_close();
                co_return;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Session died: {}", e.what());
    }
}

asio::awaitable<void> HttpSession::do_bad_request(unsigned version) {
    http::response<http::string_body> res{http::status::bad_request, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "text/html; charset=utf-8");
    res.keep_alive(false);
    res.body() = "400 Bad Request";
    res.prepare_payload();

    stream_.expires_after(idle_timeout_);
    auto [ec, _] = co_await http::async_write(stream_, res, asio::as_tuple(asio::use_awaitable));
    if (ec) {
        fail(ec, "write");
    }
    co_await do_graceful_close();
}

asio::awaitable<void> HttpSession::do_graceful_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);

    if (ec && ec != beast::errc::not_connected) {
        fail(ec, "shutdown");
    }

    // Drain remaining data until the peer closes or the timer fires
    beast::flat_buffer drain;
    stream_.expires_after(std::chrono::seconds(DRAIN_TIMEOUT_SECONDS));
    auto [ec_drain, _] = co_await stream_.async_read_some(drain.prepare(DRAIN_BUFFER_SIZE),
                                                          asio::as_tuple(asio::use_awaitable));
    if (ec_drain) {
        spdlog::trace("[HttpSession] Drain finished: {}", ec_drain.message());
    }
    do_close();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().close(ec);
}

}  // namespace minnow::network
