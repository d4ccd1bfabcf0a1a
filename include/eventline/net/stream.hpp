#pragma once

/// @file stream.hpp
/// @brief Client connection that may or may not be encrypted

#include <eventline/net/tcp.hpp>
#include <eventline/tls/tls_context.hpp>
#include <eventline/tls/tls_stream.hpp>
#include <eventline/coro/task.hpp>
#include <eventline/coro/cancel_token.hpp>

#include <expected>
#include <string_view>
#include <type_traits>
#include <variant>

namespace eventline::net {

/// A plain tcp_stream or a tls_stream, chosen by the URL scheme
class stream {
public:
    stream() = default;
    explicit stream(tcp_stream plain) : conn_(std::move(plain)) {}
    explicit stream(tls::tls_stream secure) : conn_(std::move(secure)) {}

    bool is_connected() const noexcept { return !std::holds_alternative<std::monostate>(conn_); }
    bool is_secure() const noexcept { return std::holds_alternative<tls::tls_stream>(conn_); }

    /// @return Bytes read, 0 at end of stream, or -errno
    coro::task<io::io_result> read(void* buffer, size_t length, coro::cancel_token token = {}) {
        return std::visit([&](auto& c) -> coro::task<io::io_result> {
            if constexpr (std::is_same_v<std::decay_t<decltype(c)>, std::monostate>) {
                return not_connected();
            } else {
                return c.read(buffer, length, std::move(token));
            }
        }, conn_);
    }

    coro::task<io::io_result> write(const void* buffer, size_t length, coro::cancel_token token = {}) {
        return std::visit([&](auto& c) -> coro::task<io::io_result> {
            if constexpr (std::is_same_v<std::decay_t<decltype(c)>, std::monostate>) {
                return not_connected();
            } else {
                return c.write(buffer, length, std::move(token));
            }
        }, conn_);
    }

    /// @return 0 once everything is written, else a positive errno
    coro::task<int> write_all(std::string_view data, coro::cancel_token token = {}) {
        while (!data.empty()) {
            auto sent = co_await write(data.data(), data.size(), token);
            if (!sent.success()) {
                co_return sent.error_code();
            }
            if (sent.result == 0) {
                co_return EPIPE;
            }
            data.remove_prefix(static_cast<size_t>(sent.result));
        }
        co_return 0;
    }

    /// Closes the socket without a TLS close_notify
    void disconnect() noexcept { conn_.emplace<std::monostate>(); }

    int fd() const noexcept {
        return std::visit([](const auto& c) -> int {
            if constexpr (std::is_same_v<std::decay_t<decltype(c)>, std::monostate>) {
                return -1;
            } else {
                return c.fd();
            }
        }, conn_);
    }

private:
    static coro::task<io::io_result> not_connected() { co_return io::io_result{-ENOTCONN}; }

    std::variant<std::monostate, tcp_stream, tls::tls_stream> conn_;
};

/// Opens a connection, encrypted when tls_ctx is given
/// @return Connected stream, or the errno of the step that failed
inline coro::task<std::expected<stream, int>>
connect(runtime::event_loop& loop, std::string_view host, uint16_t port,
        tls::tls_context* tls_ctx, coro::cancel_token token = {}) {
    if (!tls_ctx) {
        auto plain = co_await tcp_connect(loop, host, port, token);
        if (!plain) {
            co_return std::unexpected(plain.error());
        }
        co_return stream(std::move(*plain));
    }
    auto secure = co_await tls::tls_connect(loop, *tls_ctx, host, port, token);
    if (!secure) {
        co_return std::unexpected(secure.error());
    }
    co_return stream(std::move(*secure));
}

} // namespace eventline::net
