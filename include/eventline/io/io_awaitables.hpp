#pragma once

#include <eventline/runtime/event_loop.hpp>
#include <eventline/coro/cancel_token.hpp>
#include <eventline/coro/task.hpp>
#include <sys/socket.h>
#include <cerrno>
#include <coroutine>
#include <cstdint>

namespace eventline::io {

/// Outcome of a single read or write: a byte count, or -errno
struct io_result {
    int32_t result = 0;

    bool success() const noexcept { return result >= 0; }
    int bytes_transferred() const noexcept { return success() ? result : 0; }
    int error_code() const noexcept { return success() ? 0 : -result; }
};

/// Awaitable for fd readiness
///
/// Resumes with 0 once the fd is ready (or has failed; the next syscall
/// reports the error), -ECANCELED if the token fires first, or a negative
/// errno if the wait could not be registered.
class wait_ready_awaitable {
public:
    wait_ready_awaitable(runtime::event_loop& loop, int fd, runtime::io_event ev,
                         coro::cancel_token token) noexcept
        : loop_(loop), fd_(fd), ev_(ev), token_(std::move(token)) {}

    bool await_ready() const noexcept {
        return token_.is_cancelled();
    }

    bool await_suspend(std::coroutine_handle<> awaiter) {
        if (!loop_.add_waiter(fd_, ev_, awaiter, &result_)) {
            result_ = -EBUSY;
            return false;
        }
        cancel_registration_ = token_.on_cancel([this]() {
            loop_.cancel_waiter(fd_, ev_);
        });
        return true;
    }

    int await_resume() noexcept {
        cancel_registration_.unregister();
        if (token_.is_cancelled()) {
            return -ECANCELED;
        }
        return result_;
    }

private:
    runtime::event_loop& loop_;
    int fd_;
    runtime::io_event ev_;
    coro::cancel_token token_;
    coro::cancel_registration cancel_registration_;
    int result_ = 0;
};

/// Wait until fd is readable
inline auto wait_readable(runtime::event_loop& loop, int fd, coro::cancel_token token = {}) {
    return wait_ready_awaitable(loop, fd, runtime::io_event::readable, std::move(token));
}

/// Wait until fd is writable
inline auto wait_writable(runtime::event_loop& loop, int fd, coro::cancel_token token = {}) {
    return wait_ready_awaitable(loop, fd, runtime::io_event::writable, std::move(token));
}

/// Receive from a non-blocking socket, waiting for readiness as needed
/// @return Bytes received (0 = peer closed) or -errno
inline coro::task<io_result> async_recv(runtime::event_loop& loop, int fd,
                                        void* buffer, size_t length,
                                        coro::cancel_token token = {}) {
    while (true) {
        if (token.is_cancelled()) {
            co_return io_result{-ECANCELED};
        }
        ssize_t n = ::recv(fd, buffer, length, 0);
        if (n >= 0) {
            co_return io_result{static_cast<int32_t>(n)};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            co_return io_result{-errno};
        }
        int ready = co_await wait_readable(loop, fd, token);
        if (ready < 0) {
            co_return io_result{ready};
        }
    }
}

/// Send on a non-blocking socket, waiting for readiness as needed
/// @return Bytes sent or -errno
inline coro::task<io_result> async_send(runtime::event_loop& loop, int fd,
                                        const void* buffer, size_t length,
                                        coro::cancel_token token = {}) {
    while (true) {
        if (token.is_cancelled()) {
            co_return io_result{-ECANCELED};
        }
        ssize_t n = ::send(fd, buffer, length, MSG_NOSIGNAL);
        if (n >= 0) {
            co_return io_result{static_cast<int32_t>(n)};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            co_return io_result{-errno};
        }
        int ready = co_await wait_writable(loop, fd, token);
        if (ready < 0) {
            co_return io_result{ready};
        }
    }
}

} // namespace eventline::io
