#pragma once

#include <eventline/io/io_awaitables.hpp>
#include <eventline/runtime/event_loop.hpp>
#include <eventline/coro/task.hpp>
#include <eventline/coro/cancel_token.hpp>
#include <eventline/log/macros.hpp>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace eventline::net {

struct tcp_options {
    bool reuse_addr = true;
    bool no_delay = true;
    bool keep_alive = true;
    int backlog = 128;
};

/// Numeric IPv4 endpoint; addr is kept in network byte order
struct ipv4_address {
    uint32_t addr = INADDR_ANY;
    uint16_t port = 0;

    ipv4_address() = default;

    /// An unparsable ip leaves the wildcard address
    ipv4_address(std::string_view ip, uint16_t p) : port(p) {
        std::string text(ip);
        if (!text.empty() && inet_pton(AF_INET, text.c_str(), &addr) != 1) {
            EVENTLINE_LOG_ERROR("Invalid IPv4 address: {}", ip);
            addr = INADDR_ANY;
        }
    }

    explicit ipv4_address(const sockaddr_in& sa) : addr(sa.sin_addr.s_addr), port(ntohs(sa.sin_port)) {}

    sockaddr_in to_sockaddr() const {
        sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_port = htons(port);
        sa.sin_addr.s_addr = addr;
        return sa;
    }

    std::string to_string() const {
        in_addr in{addr};
        char text[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &in, text, sizeof(text));
        return fmt::format("{}:{}", text, port);
    }
};

namespace detail {

inline void set_flag(int fd, int level, int name, bool on) noexcept {
    int value = on ? 1 : 0;
    if (::setsockopt(fd, level, name, &value, sizeof(value)) < 0) {
        EVENTLINE_LOG_DEBUG("setsockopt({}, {}) failed: {}", level, name, std::strerror(errno));
    }
}

/// Owns a socket registered with a loop; closing it cancels pending waits
class socket_handle {
public:
    socket_handle() = default;
    socket_handle(int fd, runtime::event_loop& loop) noexcept : fd_(fd), loop_(&loop) {}
    socket_handle(socket_handle&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)), loop_(other.loop_) {}
    socket_handle& operator=(socket_handle&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
            loop_ = other.loop_;
        }
        return *this;
    }
    socket_handle(const socket_handle&) = delete;
    socket_handle& operator=(const socket_handle&) = delete;
    ~socket_handle() { reset(); }

    int get() const noexcept { return fd_; }
    runtime::event_loop& loop() const noexcept { return *loop_; }

    /// Hands the descriptor to the caller without closing it
    int release() noexcept { return std::exchange(fd_, -1); }

    void reset() noexcept {
        if (fd_ < 0) {
            return;
        }
        loop_->forget_fd(fd_);
        ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
    runtime::event_loop* loop_ = nullptr;
};

struct addrinfo_deleter {
    void operator()(addrinfo* ai) const noexcept { ::freeaddrinfo(ai); }
};
using addrinfo_ptr = std::unique_ptr<addrinfo, addrinfo_deleter>;

} // namespace detail

/// Connected, non-blocking TCP socket
class tcp_stream {
public:
    /// Adopts fd and switches it to non-blocking mode
    tcp_stream(int fd, runtime::event_loop& loop) : sock_(fd, loop) {
        int fl = ::fcntl(fd, F_GETFL, 0);
        if (fl >= 0 && !(fl & O_NONBLOCK)) {
            ::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
        }
    }

    int fd() const noexcept { return sock_.get(); }
    runtime::event_loop& loop() noexcept { return sock_.loop(); }

    /// @return Bytes read, 0 at end of stream, or -errno
    coro::task<io::io_result> read(void* buffer, size_t length, coro::cancel_token token = {}) {
        return io::async_recv(sock_.loop(), fd(), buffer, length, std::move(token));
    }

    coro::task<io::io_result> write(const void* buffer, size_t length, coro::cancel_token token = {}) {
        return io::async_send(sock_.loop(), fd(), buffer, length, std::move(token));
    }

    /// @return false if the peer went away or the token fired part way
    coro::task<bool> write_all(std::string_view data, coro::cancel_token token = {}) {
        while (!data.empty()) {
            auto sent = co_await write(data.data(), data.size(), token);
            if (sent.result <= 0) {
                co_return false;
            }
            data.remove_prefix(static_cast<size_t>(sent.result));
        }
        co_return true;
    }

    /// Readiness waits for protocols layered on top (TLS)
    auto poll_read(coro::cancel_token token = {}) {
        return io::wait_readable(sock_.loop(), fd(), std::move(token));
    }
    auto poll_write(coro::cancel_token token = {}) {
        return io::wait_writable(sock_.loop(), fd(), std::move(token));
    }

    /// Pending waits resume with -ECANCELED
    void close() noexcept { sock_.reset(); }

    void set_no_delay(bool on) noexcept { detail::set_flag(fd(), IPPROTO_TCP, TCP_NODELAY, on); }

private:
    detail::socket_handle sock_;
};

/// Listening socket; used by the tests to stand up local event streams
class tcp_listener {
public:
    /// Port 0 picks an ephemeral port, reported by local_address()
    static std::expected<tcp_listener, int> bind(const ipv4_address& where, runtime::event_loop& loop,
                                                 const tcp_options& opts = {}) {
        int raw = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (raw < 0) {
            return std::unexpected(errno);
        }
        detail::socket_handle sock(raw, loop);
        if (opts.reuse_addr) {
            detail::set_flag(raw, SOL_SOCKET, SO_REUSEADDR, true);
        }

        auto sa = where.to_sockaddr();
        if (::bind(raw, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) < 0 || ::listen(raw, opts.backlog) < 0) {
            return std::unexpected(errno);
        }

        ipv4_address local = where;
        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (::getsockname(raw, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            local = ipv4_address(bound);
        }
        EVENTLINE_LOG_DEBUG("Listening on {}", local.to_string());
        return tcp_listener(std::move(sock), local, opts.no_delay);
    }

    const ipv4_address& local_address() const noexcept { return local_; }

    coro::task<std::expected<tcp_stream, int>> accept(coro::cancel_token token = {}) {
        for (;;) {
            sockaddr_in peer{};
            socklen_t peer_len = sizeof(peer);
            int fd = ::accept4(sock_.get(), reinterpret_cast<sockaddr*>(&peer), &peer_len,
                               SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (fd >= 0) {
                tcp_stream conn(fd, sock_.loop());
                if (no_delay_) {
                    conn.set_no_delay(true);
                }
                EVENTLINE_LOG_DEBUG("Accepted {}", ipv4_address(peer).to_string());
                co_return conn;
            }
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            if (err != EAGAIN && err != EWOULDBLOCK) {
                co_return std::unexpected(err);
            }
            if (int waited = co_await io::wait_readable(sock_.loop(), sock_.get(), token); waited < 0) {
                co_return std::unexpected(-waited);
            }
        }
    }

    void close() noexcept { sock_.reset(); }

private:
    tcp_listener(detail::socket_handle sock, const ipv4_address& local, bool no_delay) noexcept
        : sock_(std::move(sock)), local_(local), no_delay_(no_delay) {}

    detail::socket_handle sock_;
    ipv4_address local_;
    bool no_delay_;
};

namespace detail {

/// One non-blocking connect attempt
/// @return Connected socket, or errno
inline coro::task<std::expected<int, int>> connect_one(runtime::event_loop& loop, const addrinfo& ai,
                                                       const tcp_options& opts, coro::cancel_token token) {
    int raw = ::socket(ai.ai_family, ai.ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai.ai_protocol);
    if (raw < 0) {
        co_return std::unexpected(errno);
    }
    socket_handle sock(raw, loop);
    if (opts.no_delay) {
        set_flag(raw, IPPROTO_TCP, TCP_NODELAY, true);
    }
    if (opts.keep_alive) {
        set_flag(raw, SOL_SOCKET, SO_KEEPALIVE, true);
    }

    if (::connect(raw, ai.ai_addr, ai.ai_addrlen) < 0 && errno != EINPROGRESS) {
        co_return std::unexpected(errno);
    }
    if (int waited = co_await io::wait_writable(loop, raw, token); waited < 0) {
        co_return std::unexpected(-waited);
    }

    int pending = 0;
    socklen_t len = sizeof(pending);
    if (::getsockopt(raw, SOL_SOCKET, SO_ERROR, &pending, &len) < 0) {
        pending = errno;
    }
    if (pending != 0) {
        co_return std::unexpected(pending);
    }
    co_return sock.release();
}

} // namespace detail

/// Resolves host and connects to the first address that accepts
///
/// Bracketed IPv6 literals, as they appear in URLs, are accepted.
/// @return Connected stream, or the errno of the last attempt: ECANCELED
///         once the token fires, EHOSTUNREACH when resolution fails
inline coro::task<std::expected<tcp_stream, int>>
tcp_connect(runtime::event_loop& loop, std::string_view host, uint16_t port,
            coro::cancel_token token = {}, tcp_options opts = {}) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    std::string name(host);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    int rc = ::getaddrinfo(name.c_str(), std::to_string(port).c_str(), &hints, &found);
    detail::addrinfo_ptr candidates(found);
    if (rc != 0 || !candidates) {
        EVENTLINE_LOG_ERROR("Failed to resolve hostname {}: {}", name, ::gai_strerror(rc));
        co_return std::unexpected(EHOSTUNREACH);
    }

    int last_error = ECONNREFUSED;
    for (const addrinfo* ai = candidates.get(); ai && !token.is_cancelled(); ai = ai->ai_next) {
        auto fd = co_await detail::connect_one(loop, *ai, opts, token);
        if (fd) {
            EVENTLINE_LOG_DEBUG("Connected to {}:{}", name, port);
            co_return tcp_stream(*fd, loop);
        }
        last_error = fd.error();
        if (last_error == ECANCELED) {
            break;
        }
        EVENTLINE_LOG_DEBUG("Connect to {}:{} failed: {}", name, port, std::strerror(last_error));
    }
    if (token.is_cancelled()) {
        last_error = ECANCELED;
    }
    co_return std::unexpected(last_error);
}

} // namespace eventline::net
