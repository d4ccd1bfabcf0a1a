#pragma once

/// @file transport.hpp
/// @brief Streaming request interface consumed by sse::connection

#include <eventline/sse/event.hpp>
#include <eventline/http/http_common.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace eventline::sse {

/// Whether credentials accompany the request
enum class credentials_mode {
    same_origin,    ///< No credentials
    include         ///< URL userinfo as Basic auth plus the configured cookie
};

/// A streaming GET request
struct request {
    std::string url;
    credentials_mode credentials = credentials_mode::same_origin;
    http::header_list headers;
};

/// Signals of one streaming request
///
/// on_start fires at most once and before any chunk. on_chunk delivers text
/// that never ends inside a UTF-8 sequence. on_finish fires exactly once;
/// cancellation finishes without an error. None of them fires from inside
/// transport::open().
struct transport_callbacks {
    std::function<void(int status, std::string status_text,
                       std::optional<std::string> content_type,
                       http::header_list headers)> on_start;
    std::function<void(std::string_view text)> on_chunk;
    std::function<void(std::optional<transport_error> error)> on_finish;
};

/// Handle to an open request
///
/// Destroying the handle cancels the request and suppresses every callback
/// that has not run yet.
class transport_handle {
public:
    virtual ~transport_handle() = default;

    /// Stop the request; on_finish follows without an error. Safe after finish.
    virtual void cancel() = 0;
};

/// Opens streaming requests
class transport {
public:
    virtual ~transport() = default;

    /// Start a request
    /// @throws std::invalid_argument if the request cannot be issued at all
    virtual std::unique_ptr<transport_handle> open(request req, transport_callbacks callbacks) = 0;
};

} // namespace eventline::sse
