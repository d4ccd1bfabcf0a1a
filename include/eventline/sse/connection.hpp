#pragma once

/// @file connection.hpp
/// @brief Reconnecting SSE connection state machine

#include <eventline/sse/config.hpp>
#include <eventline/sse/event.hpp>
#include <eventline/sse/frame_parser.hpp>
#include <eventline/sse/transport.hpp>
#include <eventline/sse/unhandled_error.hpp>
#include <eventline/http/http_common.hpp>
#include <eventline/time/timer.hpp>
#include <eventline/time/timer_service.hpp>
#include <eventline/log/macros.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace eventline::sse {

/// Internal lifecycle state
enum class connection_state {
    waiting,      ///< Retry timer pending
    connecting,   ///< Request sent, no accepted response yet
    open,         ///< Streaming
    closed        ///< Terminal
};

inline constexpr const char* connection_state_to_string(connection_state s) noexcept {
    switch (s) {
        case connection_state::waiting: return "waiting";
        case connection_state::connecting: return "connecting";
        case connection_state::open: return "open";
        case connection_state::closed: return "closed";
        default: return "unknown";
    }
}

/// Receives what a connection produces
class connection_observer {
public:
    virtual ~connection_observer() = default;

    virtual void on_open(const connection_status& status) = 0;
    virtual void on_message(const message_event& ev) = 0;
    virtual void on_error(const error_event& ev) = 0;
};

/// Log line for a response that cannot carry an event stream
inline std::string describe_rejected_response(int status, std::string_view status_text,
                                              const std::optional<std::string>& type) {
    if (status != 200) {
        return fmt::format("EventSource's response has a status {} {} that is not 200. Aborting the connection.",
                           status, http::collapse_whitespace(status_text));
    }
    return fmt::format("EventSource's response has a Content-Type specifying an unsupported type: {}. "
                       "Aborting the connection.",
                       type ? http::collapse_whitespace(*type) : std::string("-"));
}

/// Check a Content-Type against `text/event-stream` (parameters allowed)
inline bool is_event_stream(std::string_view value) noexcept {
    if (value.size() < content_type.size() ||
        !http::iequals(value.substr(0, content_type.size()), content_type)) {
        return false;
    }
    auto rest = value.substr(content_type.size());
    return rest.empty() || rest.front() == ';';
}

/// Request URL for an attempt
///
/// The fragment is dropped. Unless the URL is a `data:` or `blob:` URL and
/// when last_event_id is non-empty, existing `lastEventId` query parameters
/// are removed and `lastEventId=<encoded id>` is appended; the other
/// parameters keep their order.
inline std::string build_request_url(std::string_view base, std::string_view last_event_id) {
    auto hash = base.find('#');
    if (hash != std::string_view::npos) {
        base = base.substr(0, hash);
    }

    if (base.starts_with("data:") || base.starts_with("blob:") || last_event_id.empty()) {
        return std::string(base);
    }

    std::string result;
    auto question = base.find('?');
    std::string_view query;
    if (question == std::string_view::npos) {
        result.assign(base);
    } else {
        result.assign(base.substr(0, question));
        query = base.substr(question + 1);
    }

    std::string kept;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto param = query.substr(0, amp);
        auto name = param.substr(0, param.find('='));
        if (name != "lastEventId" && !param.empty()) {
            if (!kept.empty()) kept += '&';
            kept.append(param);
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }

    result += '?';
    if (!kept.empty()) {
        result += kept;
        result += '&';
    }
    result += "lastEventId=";
    result += http::encode_uri_component(last_event_id);
    return result;
}

/// Reconnecting event stream connection
///
/// Drives one transport request at a time through waiting, connecting and
/// open, feeding chunks into a frame_parser and reporting records to the
/// observer. Failed or finished attempts are retried with exponential
/// backoff; a heartbeat watchdog forces a reconnect when nothing arrives
/// within the heartbeat timeout. Everything runs on the thread that drives
/// the timer service.
///
/// The observer may call close() from any notification. It must not destroy
/// the connection from inside one.
class connection {
public:
    /// @throws std::invalid_argument if url is empty
    connection(std::string url, client_config config, transport& transport,
               time::timer_service& timers, connection_observer& observer)
        : url_(std::move(url))
        , with_credentials_(config.with_credentials)
        , headers_(std::move(config.headers))
        , last_event_id_(std::move(config.last_event_id))
        , initial_retry_(clamp_duration(config.initial_retry))
        , retry_(initial_retry_)
        , heartbeat_timeout_(clamp_duration(config.heartbeat_timeout))
        , transport_(transport)
        , timers_(timers)
        , observer_(observer)
        , retry_timer_(timers)
        , watchdog_(timers) {
        if (url_.empty()) {
            throw std::invalid_argument("Event source URL is empty");
        }
    }

    ~connection() {
        close();
    }

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    /// Start the first attempt
    /// @throws Whatever transport::open throws; the connection is closed then
    void start() {
        if (state_ != connection_state::waiting || started_) {
            return;
        }
        started_ = true;
        connect();
    }

    /// Stop for good; idempotent, callable from observer notifications
    void close() noexcept {
        if (state_ == connection_state::closed) {
            return;
        }
        EVENTLINE_LOG_DEBUG("SSE connection to {} closed", url_);
        state_ = connection_state::closed;
        ++generation_;
        auto handle = std::move(handle_);
        watchdog_.cancel();
        retry_timer_.cancel();
        handle.reset();
    }

    connection_state state() const noexcept { return state_; }

    /// Waiting is reported as connecting
    ready_state public_state() const noexcept {
        switch (state_) {
            case connection_state::open: return ready_state::open;
            case connection_state::closed: return ready_state::closed;
            default: return ready_state::connecting;
        }
    }

    const std::string& url() const noexcept { return url_; }
    bool with_credentials() const noexcept { return with_credentials_; }
    const std::string& last_event_id() const noexcept { return last_event_id_; }
    std::chrono::milliseconds retry_interval() const noexcept { return retry_; }
    std::chrono::milliseconds initial_retry() const noexcept { return initial_retry_; }
    std::chrono::milliseconds heartbeat_timeout() const noexcept { return heartbeat_timeout_; }
    /// Characters (code points) of stream text seen on the current attempt
    uint64_t chars_received() const noexcept { return chars_received_; }

private:
    /// Waiting -> connecting
    void connect() {
        state_ = connection_state::connecting;
        last_activity_.reset();
        chars_received_ = 0;
        parser_.reset(last_event_id_);
        auto generation = ++generation_;

        request req;
        req.url = build_request_url(url_, last_event_id_);
        req.credentials = with_credentials_ ? credentials_mode::include : credentials_mode::same_origin;
        req.headers.add("Accept", content_type);
        for (const auto& [name, value] : headers_) {
            req.headers.set(name, value);
        }

        arm_watchdog(heartbeat_timeout_);
        EVENTLINE_LOG_DEBUG("SSE connecting to {}", req.url);

        try {
            handle_ = transport_.open(std::move(req), make_callbacks(generation));
        } catch (...) {
            close();
            throw;
        }
    }

    /// Retry timer fired
    void reconnect() {
        try {
            connect();
        } catch (...) {
            // connect() has closed the connection already
            EVENTLINE_LOG_ERROR("SSE reconnect to {} failed, connection closed", url_);
            timers_.post([ex = std::current_exception()]() { report_unhandled_error(ex); });
        }
    }

    transport_callbacks make_callbacks(uint64_t generation) {
        transport_callbacks callbacks;
        callbacks.on_start = [this, generation](int status, std::string status_text,
                                                std::optional<std::string> type,
                                                http::header_list headers) {
            if (generation == generation_) {
                on_start(status, std::move(status_text), std::move(type), std::move(headers));
            }
        };
        callbacks.on_chunk = [this, generation](std::string_view text) {
            if (generation == generation_) {
                on_chunk(text);
            }
        };
        callbacks.on_finish = [this, generation](std::optional<transport_error> error) {
            if (generation == generation_) {
                on_finish(std::move(error));
            }
        };
        return callbacks;
    }

    void on_start(int status, std::string status_text, std::optional<std::string> type,
                  http::header_list headers) {
        if (state_ != connection_state::connecting) {
            return;
        }

        connection_status response{status, std::move(status_text), std::move(headers)};
        if (status == 200 && type && is_event_stream(*type)) {
            state_ = connection_state::open;
            last_activity_ = timers_.now();
            retry_ = initial_retry_;
            EVENTLINE_LOG_DEBUG("SSE connection to {} open", url_);
            observer_.on_open(response);
            return;
        }

        auto message = describe_rejected_response(status, response.status_text, type);

        // The aborted request's own finish is ignored from here on
        ++generation_;
        auto handle = std::move(handle_);
        handle.reset();

        error_event ev;
        ev.response = std::move(response);
        observer_.on_error(ev);
        if (state_ == connection_state::closed) {
            return;
        }
        EVENTLINE_LOG_ERROR("{}", message);
        retry_after_failure(std::nullopt);
    }

    void on_chunk(std::string_view text) {
        if (state_ != connection_state::open) {
            return;
        }
        if (!text.empty()) {
            last_activity_ = timers_.now();
            // Continuation bytes do not start a character
            chars_received_ += static_cast<uint64_t>(std::ranges::count_if(
                text, [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
        }
        parser_.feed(text, [this](frame& f) { return on_frame(f); });
    }

    bool on_frame(frame& f) {
        if (auto* ev = std::get_if<message_event>(&f)) {
            last_event_id_ = ev->last_event_id;
            observer_.on_message(*ev);
            // A listener may have closed the connection
            return state_ == connection_state::open;
        }
        if (auto* retry = std::get_if<retry_frame>(&f)) {
            initial_retry_ = retry->interval;
            retry_ = retry->interval;
            EVENTLINE_LOG_DEBUG("SSE retry interval set to {} ms", retry_.count());
        } else if (auto* heartbeat = std::get_if<heartbeat_frame>(&f)) {
            heartbeat_timeout_ = heartbeat->timeout;
            if (watchdog_.armed()) {
                arm_watchdog(heartbeat_timeout_);
            }
            EVENTLINE_LOG_DEBUG("SSE heartbeat timeout set to {} ms", heartbeat_timeout_.count());
        }
        return true;
    }

    void on_finish(std::optional<transport_error> error) {
        if (state_ != connection_state::open && state_ != connection_state::connecting) {
            return;
        }
        ++generation_;
        auto handle = std::move(handle_);
        handle.reset();
        retry_after_failure(std::move(error));
    }

    /// Open/connecting -> waiting
    void retry_after_failure(std::optional<transport_error> error) {
        state_ = connection_state::waiting;
        watchdog_.cancel();
        auto delay = retry_;
        retry_timer_.arm(delay, [this]() { reconnect(); });
        retry_ = clamp_duration(std::min(initial_retry_ * 16, retry_ * 2));

        if (error) {
            EVENTLINE_LOG_ERROR("SSE connection to {} failed: {}", url_, error->message);
        }
        EVENTLINE_LOG_DEBUG("SSE reconnecting to {} in {} ms", url_, delay.count());

        error_event ev;
        ev.error = std::move(error);
        observer_.on_error(ev);
    }

    void arm_watchdog(std::chrono::milliseconds delay) {
        watchdog_.arm(delay, [this]() { on_watchdog(); });
    }

    void on_watchdog() {
        if (state_ != connection_state::connecting && state_ != connection_state::open) {
            return;
        }

        if (!last_activity_ && handle_) {
            auto message = fmt::format("No activity within {} milliseconds. {} Reconnecting.",
                heartbeat_timeout_.count(),
                state_ == connection_state::connecting
                    ? std::string("No response received.")
                    : fmt::format("{} chars received.", chars_received_));
            ++generation_;
            auto handle = std::move(handle_);
            retry_after_failure(transport_error{ETIMEDOUT, std::move(message)});
            handle.reset();
            return;
        }

        auto now = timers_.now();
        auto since = last_activity_.value_or(now);
        auto next = std::chrono::duration_cast<std::chrono::milliseconds>(since + heartbeat_timeout_ - now);
        last_activity_.reset();
        arm_watchdog(std::max(next, std::chrono::milliseconds(1)));
    }

    std::string url_;
    bool with_credentials_;
    http::header_list headers_;
    std::string last_event_id_;
    std::chrono::milliseconds initial_retry_;
    std::chrono::milliseconds retry_;
    std::chrono::milliseconds heartbeat_timeout_;

    transport& transport_;
    time::timer_service& timers_;
    connection_observer& observer_;

    connection_state state_ = connection_state::waiting;
    bool started_ = false;
    uint64_t generation_ = 0;
    std::unique_ptr<transport_handle> handle_;
    frame_parser parser_;
    std::optional<time::clock::time_point> last_activity_;
    uint64_t chars_received_ = 0;

    time::timer retry_timer_;
    time::timer watchdog_;
};

} // namespace eventline::sse
