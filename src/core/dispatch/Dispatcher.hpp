#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "HttpError.hpp"
#include "ResponseTypes.hpp"
#include "Router.hpp"
#include "SessionStore.hpp"
#include "Transport.hpp"

namespace minnow {

enum class DispatchState {
    ReceivingHeaders,
    ResolvingSession,
    BufferingBody,
    DecodingBody,
    ResolvingRoute,
    BindingArguments,
    Invoking,
    NormalizingResponse,
    Emitting,
    Done,
    Error,
};

std::string_view to_string(DispatchState state) noexcept;

struct DispatchOutcome {
    DispatchState state = DispatchState::ReceivingHeaders;
    std::optional<ErrorKind> error;
    int status = 0;
    bool late_failure = false;
    std::string session_id;
    bool session_created = false;
};

/**
 * @brief Runs one request from headers to the last body chunk.
 * @details
 *  ReceivingHeaders -> ResolvingSession -> [BufferingBody -> DecodingBody]
 *  -> ResolvingRoute -> BindingArguments -> Invoking -> NormalizingResponse
 *  -> Emitting -> Done.
 *  Any HttpError moves the request to Error and an error response is emitted
 *  through the same normalization, so it still carries the session cookie and
 *  a Content-Type. Body states only run for POST, PUT and PATCH.
 *
 *  Failures of a streamed body after start() has been emitted cannot change
 *  the status line any more: they are logged as late failures, counted, and
 *  answered with a best-effort final error chunk.
 *
 *  Transport errors (boost::system::system_error) propagate to the caller.
 */
class Dispatcher {
   public:
    Dispatcher(std::shared_ptr<const Router> router, std::shared_ptr<SessionStore> sessions);

    boost::asio::awaitable<DispatchOutcome> dispatch(RequestSource& source, ResponseSink& sink);

    std::uint64_t late_failures() const noexcept { return late_failures_.load(); }

    static bool method_has_body(std::string_view method) noexcept;

   private:
    boost::asio::awaitable<HandlerResult> invoke(const Route& route, RequestContext& ctx,
                                                 Arguments args);
    boost::asio::awaitable<void> emit(NormalizedResponse& response,
                                      std::optional<std::string> first_chunk, ResponseSink& sink,
                                      DispatchOutcome& outcome);

    std::shared_ptr<const Router> router_;
    std::shared_ptr<SessionStore> sessions_;
    std::atomic<std::uint64_t> late_failures_{0};
};

}  // namespace minnow
