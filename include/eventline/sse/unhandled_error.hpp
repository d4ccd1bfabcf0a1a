#pragma once

#include <eventline/log/macros.hpp>

#include <exception>
#include <functional>
#include <utility>

namespace eventline::sse {

/// Receives exceptions thrown by listeners (and by reconnect attempts
/// started from a timer), outside the call stack that raised them
using unhandled_error_handler = std::function<void(std::exception_ptr)>;

namespace detail {

inline unhandled_error_handler& unhandled_handler_slot() {
    static unhandled_error_handler handler;
    return handler;
}

inline void log_unhandled(std::exception_ptr ex) noexcept {
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        EVENTLINE_LOG_ERROR("Unhandled error in event listener: {}", e.what());
    } catch (...) {
        EVENTLINE_LOG_ERROR("Unhandled non-standard exception in event listener");
    }
}

} // namespace detail

/// Install the process-wide handler; an empty handler restores the default
/// (log at error level)
/// @return The previous handler
inline unhandled_error_handler set_unhandled_error_handler(unhandled_error_handler handler) {
    return std::exchange(detail::unhandled_handler_slot(), std::move(handler));
}

/// Hand an exception to the installed handler
inline void report_unhandled_error(std::exception_ptr ex) noexcept {
    if (!ex) {
        return;
    }
    auto& handler = detail::unhandled_handler_slot();
    if (!handler) {
        detail::log_unhandled(ex);
        return;
    }
    try {
        handler(ex);
    } catch (const std::exception& e) {
        EVENTLINE_LOG_ERROR("Unhandled error handler threw: {}", e.what());
        detail::log_unhandled(ex);
    } catch (...) {
        EVENTLINE_LOG_ERROR("Unhandled error handler threw a non-standard exception");
        detail::log_unhandled(ex);
    }
}

} // namespace eventline::sse
