#pragma once

#include <eventline/time/timer_service.hpp>
#include <eventline/coro/cancel_token.hpp>

#include <chrono>
#include <coroutine>
#include <functional>
#include <utility>

namespace eventline::time {

/// A single cancellable timer slot
///
/// At most one callback is pending per slot: arm() cancels whatever was
/// scheduled before. The slot must outlive any callback it armed, which the
/// destructor guarantees by cancelling.
class timer {
public:
    explicit timer(timer_service& service) noexcept
        : service_(&service) {}

    ~timer() { cancel(); }

    timer(const timer&) = delete;
    timer& operator=(const timer&) = delete;
    timer(timer&&) = delete;
    timer& operator=(timer&&) = delete;

    /// Schedule callback after delay, replacing any pending one
    void arm(std::chrono::milliseconds delay, std::function<void()> callback) {
        cancel();
        id_ = service_->schedule_after(delay,
            [this, cb = std::move(callback)]() {
                id_ = invalid_timer;
                cb();
            });
    }

    /// Cancel the pending callback, if any
    void cancel() noexcept {
        if (id_ != invalid_timer) {
            service_->cancel(id_);
            id_ = invalid_timer;
        }
    }

    /// Check if a callback is pending
    bool armed() const noexcept { return id_ != invalid_timer; }

    timer_service& service() const noexcept { return *service_; }

private:
    timer_service* service_;
    timer_id id_ = invalid_timer;
};

/// Awaitable for cancellable sleep operations
/// Returns cancel_result indicating if sleep completed or was cancelled
class sleep_awaitable {
public:
    using cancel_result = coro::cancel_result;

    template<typename Rep, typename Period>
    sleep_awaitable(timer_service& service,
                    std::chrono::duration<Rep, Period> duration,
                    coro::cancel_token token)
        : service_(service)
        , duration_(std::chrono::duration_cast<std::chrono::milliseconds>(duration))
        , token_(std::move(token)) {}

    bool await_ready() const noexcept {
        return token_.is_cancelled() || duration_.count() <= 0;
    }

    void await_suspend(std::coroutine_handle<> awaiter) {
        awaiter_ = awaiter;
        id_ = service_.schedule_after(duration_, [this]() {
            id_ = invalid_timer;
            cancel_registration_.unregister();
            awaiter_.resume();
        });

        // Resume through post() so a cancel() issued deep inside another
        // coroutine does not run this one on top of it
        cancel_registration_ = token_.on_cancel([this]() {
            if (id_ != invalid_timer && service_.cancel(id_)) {
                id_ = invalid_timer;
                cancelled_ = true;
                service_.post([h = awaiter_]() { h.resume(); });
            }
        });
    }

    cancel_result await_resume() noexcept {
        cancel_registration_.unregister();
        return (cancelled_ || token_.is_cancelled()) ? cancel_result::cancelled
                                                     : cancel_result::completed;
    }

private:
    timer_service& service_;
    std::chrono::milliseconds duration_;
    coro::cancel_token token_;
    coro::cancel_registration cancel_registration_;
    std::coroutine_handle<> awaiter_;
    timer_id id_ = invalid_timer;
    bool cancelled_ = false;
};

/// Sleep for a duration
/// @param service Timer service (usually the event loop)
/// @param duration Duration to sleep
/// @param token Cancellation token - sleep returns early if cancelled
/// @return Awaitable that returns cancel_result::completed or cancel_result::cancelled
template<typename Rep, typename Period>
inline auto sleep_for(timer_service& service, std::chrono::duration<Rep, Period> duration,
                      coro::cancel_token token = {}) {
    return sleep_awaitable(service, duration, std::move(token));
}

} // namespace eventline::time
