#pragma once

#include <eventline/http/http_common.hpp>

#include <algorithm>
#include <chrono>
#include <string>

namespace eventline::sse {

/// Lower bound for retry and heartbeat intervals
inline constexpr std::chrono::milliseconds min_duration{1000};

/// Upper bound for retry and heartbeat intervals (5 hours)
inline constexpr std::chrono::milliseconds max_duration{18000000};

/// Clamp an interval to [min_duration, max_duration]
inline constexpr std::chrono::milliseconds clamp_duration(std::chrono::milliseconds d) noexcept {
    return std::clamp(d, min_duration, max_duration);
}

/// Client configuration
struct client_config {
    std::chrono::milliseconds initial_retry{1000};        ///< First reconnect delay
    std::chrono::milliseconds heartbeat_timeout{45000};   ///< Inactivity limit before reconnecting
    bool with_credentials = false;                        ///< Send credentials (URL userinfo, cookie)
    http::header_list headers;                            ///< Extra request headers
    std::string last_event_id;                            ///< Resume token for the first attempt
};

/// HTTP transport configuration
struct http_transport_config {
    size_t read_buffer_size = 4096;                       ///< Socket read size
    std::string user_agent = "eventline/1.0";             ///< User-Agent header (empty = none)
    bool verify_certificate = true;                       ///< Verify TLS certificates
    std::string cookie;                                   ///< Cookie header sent with credentials
    size_t max_header_bytes = 64 * 1024;                  ///< Response head size limit
};

} // namespace eventline::sse
