#pragma once

/// Eventline - Server-Sent Events client library
///
/// Version: 1.0.0
///
/// Include this file for the whole library: the event loop, TCP/TLS
/// streams, the HTTP response parser and the SSE client.

#define EVENTLINE_VERSION_MAJOR 1
#define EVENTLINE_VERSION_MINOR 0
#define EVENTLINE_VERSION_PATCH 0

#include <tuple>

// Coroutines
#include "coro/promise_base.hpp"
#include "coro/task.hpp"
#include "coro/cancel_token.hpp"

// Event loop and timers
#include "runtime/event_loop.hpp"
#include "time/timer_service.hpp"
#include "time/timer.hpp"

// I/O and networking
#include "io/io_awaitables.hpp"
#include "net/tcp.hpp"
#include "net/stream.hpp"
#include "tls/tls_context.hpp"
#include "tls/tls_stream.hpp"

// HTTP
#include "http/http_common.hpp"
#include "http/response_parser.hpp"
#include "http/utf8.hpp"

// Server-Sent Events
#include "sse/event.hpp"
#include "sse/config.hpp"
#include "sse/frame_parser.hpp"
#include "sse/transport.hpp"
#include "sse/unhandled_error.hpp"
#include "sse/connection.hpp"
#include "sse/http_transport.hpp"
#include "sse/event_source.hpp"

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

/// Root namespace for the Eventline library
namespace eventline {

/// Get library version string
inline const char* version() noexcept {
    return "1.0.0";
}

/// Get library version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(EVENTLINE_VERSION_MAJOR, EVENTLINE_VERSION_MINOR, EVENTLINE_VERSION_PATCH);
}

} // namespace eventline

/// Quick Start Example:
///
/// ```cpp
/// #include <eventline/eventline.hpp>
///
/// using namespace eventline;
///
/// int main() {
///     runtime::event_loop loop;
///     sse::event_source source(loop, "http://localhost:8080/events");
///     source.on_message([](const sse::event& ev) {
///         fmt::print("{}\n", std::get<sse::message_event>(ev).data);
///     });
///     loop.run();
/// }
/// ```
