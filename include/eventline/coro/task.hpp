#pragma once

#include "promise_base.hpp"
#include <eventline/log/macros.hpp>
#include <coroutine>
#include <optional>
#include <exception>
#include <stdexcept>
#include <utility>

namespace eventline::coro {

template<typename T = void>
class task;
template<>
class task<void>;

namespace detail {

/// A released task has no owner left to observe its failure, so it is logged
inline void report_detached_failure(std::exception_ptr ex) noexcept {
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        EVENTLINE_LOG_ERROR("Detached task failed: {}", e.what());
    } catch (...) {
        EVENTLINE_LOG_ERROR("Detached task failed with a non-standard exception");
    }
}

/// Hands control back to the awaiter, or frees a released task
struct final_awaiter {
    bool await_ready() const noexcept { return false; }

    template<typename Promise>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> self) noexcept {
        promise_base& p = self.promise();
        p.mark_finished();
        if (auto next = p.continuation()) {
            return next;
        }
        if (p.detached()) {
            if (auto failure = p.exception()) {
                report_detached_failure(failure);
            }
            self.destroy();
        }
        return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
};

/// Promise pieces that do not depend on the result type
template<typename Task>
struct promise_common : promise_base {
    Task get_return_object() noexcept {
        using promise = typename Task::promise_type;
        return Task{std::coroutine_handle<promise>::from_promise(static_cast<promise&>(*this))};
    }
    std::suspend_always initial_suspend() noexcept { return {}; }
    final_awaiter final_suspend() noexcept { return {}; }
};

/// Owning handle and awaiter interface shared by task<T> and task<void>
template<typename Promise>
class task_handle {
public:
    using handle_type = std::coroutine_handle<Promise>;

    explicit task_handle(handle_type h) noexcept : coro_(h) {}
    task_handle(task_handle&& other) noexcept : coro_(std::exchange(other.coro_, {})) {}
    task_handle& operator=(task_handle&& other) noexcept {
        if (this != &other) {
            reset();
            coro_ = std::exchange(other.coro_, {});
        }
        return *this;
    }
    task_handle(const task_handle&) = delete;
    task_handle& operator=(const task_handle&) = delete;
    ~task_handle() { reset(); }

    handle_type handle() const noexcept { return coro_; }

    /// Gives up ownership; the frame frees itself when the body returns
    [[nodiscard]] handle_type release() noexcept {
        if (coro_) {
            coro_.promise().detach();
        }
        return std::exchange(coro_, {});
    }

    [[nodiscard]] bool done() const noexcept { return !coro_ || coro_.done(); }

    bool await_ready() const noexcept { return false; }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        coro_.promise().set_continuation(awaiter);
        return coro_;
    }

protected:
    Promise& promise() const noexcept { return coro_.promise(); }

private:
    void reset() noexcept {
        if (coro_) {
            coro_.destroy();
            coro_ = {};
        }
    }

    handle_type coro_;
};

template<typename T>
struct value_promise : promise_common<task<T>> {
    std::optional<T> value_;

    template<typename U>
    void return_value(U&& v) {
        value_.emplace(std::forward<U>(v));
    }
};

struct void_promise : promise_common<task<void>> {
    void return_void() noexcept {}
};

} // namespace detail

/// Lazily started coroutine producing a T
///
/// Nothing runs until the task is awaited or released to an event loop:
/// @code
/// coro::task<int> answer() { co_return 42; }
///
/// coro::task<> caller() {
///     int v = co_await answer();
/// }
///
/// loop.spawn(caller().release());
/// @endcode
template<typename T>
class task : public detail::task_handle<detail::value_promise<T>> {
    using base = detail::task_handle<detail::value_promise<T>>;

public:
    using promise_type = detail::value_promise<T>;
    using base::base;

    T await_resume() {
        auto& p = this->promise();
        p.rethrow_if_failed();
        if (!p.value_) {
            throw std::logic_error("task finished without a value");
        }
        return std::move(*p.value_);
    }
};

template<>
class task<void> : public detail::task_handle<detail::void_promise> {
    using base = detail::task_handle<detail::void_promise>;

public:
    using promise_type = detail::void_promise;
    using base::base;

    void await_resume() { promise().rethrow_if_failed(); }
};

} // namespace eventline::coro
