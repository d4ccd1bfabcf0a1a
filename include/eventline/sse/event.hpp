#pragma once

/// @file event.hpp
/// @brief Records and notifications produced by an SSE connection

#include <eventline/http/http_common.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace eventline::sse {

/// MIME type of an event stream
inline constexpr std::string_view content_type = "text/event-stream";

/// Decoded event record
struct message_event {
    std::string type = "message";   ///< Event type (default "message")
    std::string data;               ///< Data lines joined with '\n'
    std::string last_event_id;      ///< Id in effect when the record was dispatched
};

/// Response metadata of one connection attempt
struct connection_status {
    int status = 0;
    std::string status_text;
    http::header_list headers;
};

/// Failure reported by a transport (or synthesised for a stalled stream)
struct transport_error {
    int code = 0;           ///< errno-style code, 0 if not applicable
    std::string message;
};

/// The stream was accepted
struct open_event {
    connection_status response;
};

/// Error notification
///
/// Carries the response for a non-conforming reply, the transport error for
/// a failed or stalled attempt, or neither when the stream simply ended.
struct error_event {
    std::optional<connection_status> response;
    std::optional<transport_error> error;
};

/// Anything delivered to listeners
using event = std::variant<open_event, message_event, error_event>;

/// Listener-facing type name: "open", "error" or the record's own type
inline std::string_view event_type(const event& ev) noexcept {
    if (auto* msg = std::get_if<message_event>(&ev)) {
        return msg->type;
    }
    return std::holds_alternative<open_event>(ev) ? "open" : "error";
}

/// Public connection state
enum class ready_state : int {
    connecting = 0,
    open = 1,
    closed = 2
};

inline constexpr const char* ready_state_to_string(ready_state s) noexcept {
    switch (s) {
        case ready_state::connecting: return "connecting";
        case ready_state::open: return "open";
        case ready_state::closed: return "closed";
        default: return "unknown";
    }
}

} // namespace eventline::sse
