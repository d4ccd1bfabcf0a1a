#pragma once

/// @file event_source.hpp
/// @brief Listener-facing SSE client

#include <eventline/sse/connection.hpp>
#include <eventline/sse/http_transport.hpp>
#include <eventline/sse/unhandled_error.hpp>
#include <eventline/runtime/event_loop.hpp>
#include <eventline/time/timer_service.hpp>
#include <eventline/log/macros.hpp>

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace eventline::sse {

/// Callback for delivered events
using listener = std::function<void(const event&)>;

/// Identifies a registered listener
using listener_id = uint64_t;

/// Always-reconnecting event source
///
/// Connects on construction and keeps reconnecting until close() or
/// destruction. Events go to the listeners registered for their type, in
/// registration order, and then to the matching primary handler.
///
/// @code
/// runtime::event_loop loop;
/// sse::event_source source(loop, "https://example.com/stream");
/// source.on_message([](const sse::event& ev) {
///     auto& msg = std::get<sse::message_event>(ev);
///     EVENTLINE_LOG_INFO("{}: {}", msg.type, msg.data);
/// });
/// source.add_event_listener("update", handle_update);
/// loop.run();
/// @endcode
///
/// Listeners run on the loop thread. A listener may call close() or change
/// listeners; it must not destroy the event source. An exception thrown by a
/// listener is passed to the unhandled-error handler on a later loop turn.
class event_source final : private connection_observer {
public:
    /// Connect over HTTP(S) on the given loop
    /// @throws std::invalid_argument for empty, malformed or non-http(s) URLs
    event_source(runtime::event_loop& loop, std::string url,
                 client_config config = {}, http_transport_config transport_config = {})
        : timers_(loop)
        , owned_transport_(std::make_unique<http_transport>(loop, std::move(transport_config)))
        , connection_(std::move(url), std::move(config), *owned_transport_, loop, *this) {
        connection_.start();
    }

    /// Connect through a caller-provided transport, which must outlive this object
    event_source(time::timer_service& timers, transport& transport, std::string url,
                 client_config config = {})
        : timers_(timers)
        , connection_(std::move(url), std::move(config), transport, timers, *this) {
        connection_.start();
    }

    ~event_source() override {
        connection_.close();
    }

    event_source(const event_source&) = delete;
    event_source& operator=(const event_source&) = delete;

    const std::string& url() const noexcept { return connection_.url(); }
    bool with_credentials() const noexcept { return connection_.with_credentials(); }
    ready_state state() const noexcept { return connection_.public_state(); }
    const std::string& last_event_id() const noexcept { return connection_.last_event_id(); }

    /// Stop reconnecting and deliver nothing more; idempotent
    void close() noexcept { connection_.close(); }

    /// Register a listener for an event type ("open", "error", "message" or a
    /// server-defined type)
    listener_id add_event_listener(std::string_view type, listener fn) {
        auto id = next_listener_id_++;
        auto entry = std::make_shared<listener_entry>(listener_entry{id, std::move(fn), false});
        auto it = listeners_.find(type);
        if (it == listeners_.end()) {
            it = listeners_.emplace(std::string(type), std::vector<std::shared_ptr<listener_entry>>{}).first;
        }
        it->second.push_back(std::move(entry));
        return id;
    }

    /// @return false if no such listener was registered for type
    bool remove_event_listener(std::string_view type, listener_id id) {
        auto it = listeners_.find(type);
        if (it == listeners_.end()) {
            return false;
        }
        auto& entries = it->second;
        for (auto e = entries.begin(); e != entries.end(); ++e) {
            if ((*e)->id == id) {
                (*e)->removed = true;
                entries.erase(e);
                if (entries.empty()) {
                    listeners_.erase(it);
                }
                return true;
            }
        }
        return false;
    }

    /// Primary handlers; setting one replaces the previous, empty clears it
    void on_open(listener fn) { on_open_ = std::move(fn); }
    void on_message(listener fn) { on_message_ = std::move(fn); }
    void on_error(listener fn) { on_error_ = std::move(fn); }

    /// Underlying state machine (for diagnostics)
    const connection& get_connection() const noexcept { return connection_; }

private:
    struct listener_entry {
        listener_id id;
        listener fn;
        bool removed;
    };

    void on_open(const connection_status& status) override {
        dispatch(event{open_event{status}});
    }

    void on_message(const message_event& ev) override {
        dispatch(event{ev});
    }

    void on_error(const error_event& ev) override {
        dispatch(event{ev});
    }

    void dispatch(const event& ev) {
        auto type = event_type(ev);

        std::vector<std::shared_ptr<listener_entry>> snapshot;
        if (auto it = listeners_.find(type); it != listeners_.end()) {
            snapshot = it->second;
        }
        for (auto& entry : snapshot) {
            if (!entry->removed) {
                invoke(entry->fn, ev);
            }
        }

        if (type == "open") {
            invoke(on_open_, ev);
        } else if (type == "message") {
            invoke(on_message_, ev);
        } else if (type == "error") {
            invoke(on_error_, ev);
        }
    }

    void invoke(const listener& fn, const event& ev) {
        if (!fn) {
            return;
        }
        // Copy: the listener may replace itself
        auto callback = fn;
        try {
            callback(ev);
        } catch (...) {
            timers_.post([ex = std::current_exception()]() { report_unhandled_error(ex); });
        }
    }

    time::timer_service& timers_;
    std::map<std::string, std::vector<std::shared_ptr<listener_entry>>, std::less<>> listeners_;
    listener_id next_listener_id_ = 1;
    listener on_open_;
    listener on_message_;
    listener on_error_;
    std::unique_ptr<transport> owned_transport_;
    connection connection_;
};

} // namespace eventline::sse
