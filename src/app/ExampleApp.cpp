#include "ExampleApp.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <charconv>

#include "HttpError.hpp"
#include "ResponseNormalizer.hpp"
#include "Types.hpp"

namespace minnow::app {

namespace {

constexpr std::string_view UPLOAD_FORM = R"(<html>
    <head><title>File Upload</title></head>
    <body>
        <h2>Upload a File</h2>
        <form action="/upload" method="post" enctype="multipart/form-data">
            <input type="file" name="file"><br><br>
            <input type="submit" value="Upload">
        </form>
    </body>
</html>)";

constexpr int MAX_STREAM_LINES = 1000;

}  // namespace

std::string PasteBoard::add(std::string content) {
    boost::uuids::random_generator generator;
    std::string id = boost::uuids::to_string(generator());

    std::lock_guard<std::mutex> lock(mutex_);
    pastes_.emplace(id, std::move(content));
    return id;
}

std::optional<std::string> PasteBoard::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pastes_.find(id);
    if (it == pastes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PasteBoard::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pastes_.erase(id) > 0;
}

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&#34;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

void RegisterExampleRoutes(Router& router, const ExampleDeps& deps) {
    // GET / shows the pastebin (or the upload form without templates),
    // POST / stores a paste and redirects to it.
    router.add("index", {}, [deps](RequestContext& ctx, Arguments) -> asio::awaitable<HandlerResult> {
        if (ctx.method == "POST") {
            auto it = ctx.body.find("paste_content");
            std::string content = (it != ctx.body.end() && !it->second.empty()) ? it->second.front() : "";
            std::string id = deps.pastes->add(html_escape(content));
            spdlog::info("[ExampleApp] Stored paste {}", id);
            co_return redirect("/paste/" + id);
        }
        if (!deps.templates->available()) {
            co_return Body{std::string{UPLOAD_FORM}};
        }
        co_return Body{deps.templates->render("index.html")};
    });

    router.add("upload_form", {}, [](RequestContext&, Arguments) -> asio::awaitable<HandlerResult> {
        co_return Body{std::string{UPLOAD_FORM}};
    });

    router.add("greet", {"id", {"name", "anon"}},
               [](RequestContext&, Arguments args) -> asio::awaitable<HandlerResult> {
                   co_return Body{"Hello " + html_escape(as_string(args[1])) + ", you are #" +
                                  html_escape(as_string(args[0]))};
               });

    router.add("upload", {"file"}, [](RequestContext&, Arguments args) -> asio::awaitable<HandlerResult> {
        const FileRecord* file = as_file(args[0]);
        if (file == nullptr) {
            co_return StatusBody{400, std::string{"No file uploaded."}};
        }
        spdlog::info("[ExampleApp] Received upload {} ({} bytes, {})", file->filename,
                     file->data.size(), file->content_type);
        co_return Body{"File '" + html_escape(file->filename) + "' uploaded successfully (" +
                       std::to_string(file->data.size()) + " bytes)!"};
    });

    router.add("headers", {}, [](RequestContext&, Arguments) -> asio::awaitable<HandlerResult> {
        co_return StatusBodyHeaders{
            200,
            std::string{"hello world"},
            {
                {"Content-Type", "text/html"},
                {"X-Content-Type-Options", "nosniff"},
                {"X-Frame-Options", "DENY"},
                {"X-XSS-Protection", "1; mode=block"},
                {"Strict-Transport-Security", "max-age=31536000; includeSubDomains"},
                {"Content-Security-Policy", "default-src 'self'"},
            }};
    });

    router.add("static", {"filename"},
               [deps](RequestContext&, Arguments args) -> asio::awaitable<HandlerResult> {
                   co_return deps.static_files->serve(as_string(args[0]));
               });

    // Per-session counter; `visits` is also bound from the session when present.
    router.add("visits", {{"visits", 0}},
               [](RequestContext& ctx, Arguments args) -> asio::awaitable<HandlerResult> {
                   std::int64_t visits = 0;
                   if (const auto* v = std::get_if<boost::json::value>(&args[0]); v && v->is_int64()) {
                       visits = v->as_int64();
                   }
                   ++visits;
                   ctx.session->set("visits", visits);
                   co_return Body{"You have visited this page " + std::to_string(visits) + " times."};
               });

    router.add("paste", {"paste_id", {"delete", nullptr}},
               [deps](RequestContext&, Arguments args) -> asio::awaitable<HandlerResult> {
                   std::string id = as_string(args[0]);
                   if (!is_null(args[1]) && as_string(args[1]) == "delete") {
                       deps.pastes->remove(id);
                       co_return redirect("/");
                   }
                   auto content = deps.pastes->get(id);
                   if (!content) {
                       throw NotFound("paste " + id);
                   }
                   co_return Body{deps.templates->render(
                       "paste.html", {{"paste_id", html_escape(id)}, {"paste_content", *content}})};
               });

    // Streams `count` numbered lines as separate chunks.
    router.add("stream", {{"count", "5"}},
               [](RequestContext&, Arguments args) -> asio::awaitable<HandlerResult> {
                   std::string text = as_string(args[0]);
                   int count = 0;
                   auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), count);
                   if (ec != std::errc{} || count < 0 || count > MAX_STREAM_LINES) {
                       co_return StatusBody{400, std::string{"400 Bad Request: invalid count"}};
                   }
                   co_return StatusBodyHeaders{
                       200,
                       ChunkStream([i = 0, count]() mutable -> std::optional<std::string> {
                           if (i == count) {
                               return std::nullopt;
                           }
                           return "line " + std::to_string(++i) + "\n";
                       }),
                       {{"Content-Type", "text/plain; charset=utf-8"}}};
               });

    router.add_websocket("echo", [](WebSocketStream& ws, std::vector<std::string>) -> asio::awaitable<void> {
        beast::flat_buffer buffer;
        for (;;) {
            auto [ec, n] = co_await ws.async_read(buffer, asio::as_tuple(asio::use_awaitable));
            if (ec == websocket::error::closed) {
                co_return;
            }
            if (ec) {
                throw boost::system::system_error(ec, "ws read");
            }
            ws.text(ws.got_text());
            co_await ws.async_write(buffer.data(), asio::use_awaitable);
            buffer.consume(buffer.size());
        }
    });
}

}  // namespace minnow::app
