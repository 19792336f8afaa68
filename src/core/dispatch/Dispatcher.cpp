#include "Dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <boost/system/system_error.hpp>
#include <utility>

#include "ArgumentBinder.hpp"
#include "BodyDecoder.hpp"
#include "Cookies.hpp"
#include "ResponseNormalizer.hpp"

namespace minnow {

namespace {

constexpr std::string_view LATE_FAILURE_BODY = "500 Internal Server Error";
constexpr std::string_view UNEXPECTED_FAILURE_BODY = "500 Internal Server Error";

void transition(DispatchOutcome& outcome, DispatchState next, std::string_view path) {
    spdlog::trace("[Dispatcher] /{} {} -> {}", path, to_string(outcome.state), to_string(next));
    outcome.state = next;
}

NormalizedResponse error_response(int status, std::string body, std::string_view session_id) {
    return normalize_response(StatusBody{status, std::move(body)}, session_id);
}

}  // namespace

std::string_view to_string(DispatchState state) noexcept {
    switch (state) {
        case DispatchState::ReceivingHeaders:
            return "ReceivingHeaders";
        case DispatchState::ResolvingSession:
            return "ResolvingSession";
        case DispatchState::BufferingBody:
            return "BufferingBody";
        case DispatchState::DecodingBody:
            return "DecodingBody";
        case DispatchState::ResolvingRoute:
            return "ResolvingRoute";
        case DispatchState::BindingArguments:
            return "BindingArguments";
        case DispatchState::Invoking:
            return "Invoking";
        case DispatchState::NormalizingResponse:
            return "NormalizingResponse";
        case DispatchState::Emitting:
            return "Emitting";
        case DispatchState::Done:
            return "Done";
        case DispatchState::Error:
            return "Error";
    }
    return "Unknown";
}

Dispatcher::Dispatcher(std::shared_ptr<const Router> router, std::shared_ptr<SessionStore> sessions)
    : router_(std::move(router)), sessions_(std::move(sessions)) {}

bool Dispatcher::method_has_body(std::string_view method) noexcept {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

boost::asio::awaitable<DispatchOutcome> Dispatcher::dispatch(RequestSource& source,
                                                             ResponseSink& sink) {
    const RequestHead& head = source.head();
    DispatchOutcome outcome;

    RequestContext ctx;
    ctx.method = head.method;
    ctx.path = head.path;
    ctx.query_string = head.query_string;
    ctx.headers = head.headers;

    std::string_view path = ctx.path;
    while (!path.empty() && path.front() == '/') path.remove_prefix(1);

    NormalizedResponse response;
    std::optional<std::string> first_chunk;
    bool failed = false;

    try {
        // 1. Session
        transition(outcome, DispatchState::ResolvingSession, path);
        auto cookies = parse_cookies(find_header(ctx.headers, "Cookie").value_or(""));
        auto cookie_it = cookies.find(std::string{SESSION_COOKIE_NAME});
        auto handle =
            sessions_->resolve(cookie_it != cookies.end() ? cookie_it->second : std::string{});
        ctx.session = handle.session;
        outcome.session_id = handle.session->id();
        outcome.session_created = handle.created;

        ctx.query = parse_query(ctx.query_string);

        // 2. Body
        if (method_has_body(ctx.method)) {
            transition(outcome, DispatchState::BufferingBody, path);
            std::string raw;
            for (;;) {
                BodyChunk chunk = co_await source.read_body_chunk();
                raw += chunk.data;
                if (!chunk.more) {
                    break;
                }
            }

            transition(outcome, DispatchState::DecodingBody, path);
            auto decoded = decode_body(raw, find_header(ctx.headers, "Content-Type").value_or(""));
            ctx.body = std::move(decoded.fields);
            ctx.files = std::move(decoded.files);
        }

        // 3. Route
        transition(outcome, DispatchState::ResolvingRoute, path);
        RouteMatch match = router_->resolve(path);
        if (match.route == nullptr) {
            throw RouteNotFound(std::string{path});
        }
        ctx.path_params = match.positional;

        // 4. Arguments
        transition(outcome, DispatchState::BindingArguments, path);
        const boost::json::object session_attrs = ctx.session->snapshot();
        Arguments args = bind_arguments(
            match.route->descriptor,
            BindingSources{match.positional, ctx.query, ctx.body, ctx.files, session_attrs});
        if (match.fallback && args.empty()) {
            throw RouteNotFound(std::string{path});
        }

        // 5. Handler
        transition(outcome, DispatchState::Invoking, path);
        HandlerResult result = co_await invoke(*match.route, ctx, std::move(args));

        // 6. Normalize
        transition(outcome, DispatchState::NormalizingResponse, path);
        response = normalize_response(std::move(result), outcome.session_id);
        if (auto* stream = std::get_if<ChunkStream>(&response.body)) {
            // Pulled before start() so a producer that fails straight away still
            // gets a proper error status.
            try {
                first_chunk = stream->next();
            } catch (const HttpError&) {
                throw;
            } catch (const std::exception& e) {
                spdlog::error("[Dispatcher] Streamed body of '{}' failed before start: {}",
                              match.name, e.what());
                throw HandlerFailure(match.name, e.what());
            }
        }
    } catch (const HttpError& e) {
        failed = true;
        outcome.error = e.kind();
        if (e.kind() == ErrorKind::HandlerFailure || e.status() >= 500) {
            spdlog::error("[Dispatcher] {} /{} failed ({}): {}", ctx.method, path,
                          to_string(e.kind()), e.what());
        } else {
            spdlog::info("[Dispatcher] {} /{} rejected ({}): {}", ctx.method, path,
                         to_string(e.kind()), e.what());
        }
        response = error_response(e.status(), e.client_message(), outcome.session_id);
    } catch (const boost::system::system_error&) {
        throw;
    } catch (const std::exception& e) {
        failed = true;
        outcome.error = ErrorKind::HandlerFailure;
        spdlog::error("[Dispatcher] {} /{} unexpected failure: {}", ctx.method, path, e.what());
        response = error_response(500, std::string{UNEXPECTED_FAILURE_BODY}, outcome.session_id);
    }

    if (failed) {
        transition(outcome, DispatchState::Error, path);
        first_chunk.reset();
    }

    // 7. Emit
    outcome.status = response.status;
    transition(outcome, DispatchState::Emitting, path);
    co_await emit(response, std::move(first_chunk), sink, outcome);
    transition(outcome, (failed || outcome.late_failure) ? DispatchState::Error : DispatchState::Done,
               path);

    spdlog::debug("[Dispatcher] {} /{} -> {}", ctx.method, path, outcome.status);
    co_return outcome;
}

boost::asio::awaitable<HandlerResult> Dispatcher::invoke(const Route& route, RequestContext& ctx,
                                                         Arguments args) {
    try {
        co_return co_await route.fn(ctx, std::move(args));
    } catch (const HttpError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("[Dispatcher] Handler '{}' raised: {}", route.descriptor.name, e.what());
        throw HandlerFailure(route.descriptor.name, e.what());
    }
}

boost::asio::awaitable<void> Dispatcher::emit(NormalizedResponse& response,
                                              std::optional<std::string> first_chunk,
                                              ResponseSink& sink, DispatchOutcome& outcome) {
    if (auto* buffered = std::get_if<std::string>(&response.body)) {
        co_await sink.start(response.status, response.reason, response.headers, false);
        co_await sink.write(*buffered, true);
        co_return;
    }

    auto& stream = std::get<ChunkStream>(response.body);
    co_await sink.start(response.status, response.reason, response.headers, true);

    std::optional<std::string> chunk = std::move(first_chunk);
    while (chunk) {
        co_await sink.write(*chunk, false);

        bool broken = false;
        std::string failure;
        try {
            chunk = stream.next();
        } catch (const std::exception& e) {
            broken = true;
            failure = e.what();
        }

        if (broken) {
            late_failures_.fetch_add(1);
            outcome.late_failure = true;
            outcome.error = ErrorKind::HandlerFailure;
            spdlog::critical("[Dispatcher] Late failure after response start (status {} already sent): {}",
                             response.status, failure);
            co_await sink.write(LATE_FAILURE_BODY, true);
            co_return;
        }
    }
    co_await sink.write({}, true);
}

}  // namespace minnow
