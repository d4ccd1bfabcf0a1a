#pragma once

#include <coroutine>
#include <cstdint>
#include <exception>

namespace eventline::coro {

/// Lifecycle of a task body, kept for assertions in tests and logs
enum class coroutine_state : uint8_t {
    created,
    running,
    completed,
    failed
};

/// Bookkeeping shared by every task promise
///
/// Holds the exception that escaped the body, the coroutine to resume on
/// completion, and whether the owning task handle was released.
class promise_base {
public:
    promise_base() noexcept = default;
    promise_base(const promise_base&) = delete;
    promise_base& operator=(const promise_base&) = delete;

    void unhandled_exception() noexcept {
        failure_ = std::current_exception();
        state_ = coroutine_state::failed;
    }

    [[nodiscard]] std::exception_ptr exception() const noexcept { return failure_; }
    [[nodiscard]] coroutine_state state() const noexcept { return state_; }
    void set_state(coroutine_state s) noexcept { state_ = s; }

    /// Marks the body finished unless it already failed
    void mark_finished() noexcept {
        if (state_ != coroutine_state::failed) {
            state_ = coroutine_state::completed;
        }
    }

    void set_continuation(std::coroutine_handle<> h) noexcept {
        continuation_ = h;
        state_ = coroutine_state::running;
    }
    [[nodiscard]] std::coroutine_handle<> continuation() const noexcept { return continuation_; }

    void detach() noexcept { detached_ = true; }
    [[nodiscard]] bool detached() const noexcept { return detached_; }

    /// Rethrows the body's exception in the awaiting coroutine
    void rethrow_if_failed() const {
        if (failure_) {
            std::rethrow_exception(failure_);
        }
    }

private:
    std::exception_ptr failure_;
    std::coroutine_handle<> continuation_;
    coroutine_state state_ = coroutine_state::created;
    bool detached_ = false;
};

} // namespace eventline::coro
