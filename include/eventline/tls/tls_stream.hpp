#pragma once

#include <eventline/tls/tls_context.hpp>
#include <eventline/net/tcp.hpp>
#include <eventline/coro/task.hpp>
#include <eventline/coro/cancel_token.hpp>
#include <eventline/log/macros.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <cerrno>
#include <cstring>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace eventline::tls {

/// Client side of a TLS session over an owned tcp_stream
class tls_stream {
public:
    tls_stream(net::tcp_stream tcp, tls_context& ctx)
        : tcp_(std::move(tcp)), ssl_(SSL_new(ctx.native_handle())) {
        if (!ssl_) {
            throw std::runtime_error("Failed to create SSL object: " + tls_context::last_error());
        }
        SSL_set_fd(ssl_.get(), tcp_.fd());
        SSL_set_connect_state(ssl_.get());
    }

    /// SNI plus the name the certificate must carry
    void set_hostname(std::string_view host) {
        std::string name(host);
        SSL_set_tlsext_host_name(ssl_.get(), name.c_str());
        X509_VERIFY_PARAM_set1_host(SSL_get0_param(ssl_.get()), name.c_str(), name.size());
        peer_ = std::move(name);
    }

    /// @return 0, or a positive errno (EPROTO for TLS-level failures)
    coro::task<int> handshake(coro::cancel_token token = {}) {
        auto r = co_await drive([this] { return SSL_connect(ssl_.get()); }, token);
        if (r.result < 0) {
            co_return r.error_code();
        }
        if (r.result == 0) {
            co_return ECONNRESET;
        }
        EVENTLINE_LOG_DEBUG("TLS with {} established: {} {}", peer_, SSL_get_version(ssl_.get()),
                            SSL_get_cipher_name(ssl_.get()));
        co_return 0;
    }

    /// @return Bytes read, 0 once the peer is done, or -errno
    coro::task<io::io_result> read(void* buffer, size_t length, coro::cancel_token token = {}) {
        int n = static_cast<int>(length);
        return drive([this, buffer, n] { return SSL_read(ssl_.get(), buffer, n); }, std::move(token));
    }

    coro::task<io::io_result> write(const void* buffer, size_t length, coro::cancel_token token = {}) {
        int n = static_cast<int>(length);
        return drive([this, buffer, n] { return SSL_write(ssl_.get(), buffer, n); }, std::move(token));
    }

    int fd() const noexcept { return tcp_.fd(); }

private:
    struct ssl_deleter {
        void operator()(SSL* s) const noexcept { SSL_free(s); }
    };

    /// Repeats op until OpenSSL stops asking for socket readiness
    template<typename Op>
    coro::task<io::io_result> drive(Op op, coro::cancel_token token) {
        for (;;) {
            if (token.is_cancelled()) {
                co_return io::io_result{-ECANCELED};
            }
            ERR_clear_error();
            errno = 0;
            int ret = op();
            if (ret > 0) {
                co_return io::io_result{ret};
            }

            int wait = 0;
            switch (int err = SSL_get_error(ssl_.get(), ret)) {
            case SSL_ERROR_WANT_READ:
                wait = co_await tcp_.poll_read(token);
                break;
            case SSL_ERROR_WANT_WRITE:
                wait = co_await tcp_.poll_write(token);
                break;
            case SSL_ERROR_ZERO_RETURN:
                co_return io::io_result{0};
            case SSL_ERROR_SYSCALL: {
                int sys = errno;
                // Servers often drop the socket without close_notify
                if (ERR_peek_error() == 0 && sys == 0) {
                    co_return io::io_result{0};
                }
                EVENTLINE_LOG_WARNING("TLS I/O with {} failed: {}", peer_,
                                      sys ? std::strerror(sys) : tls_context::last_error());
                co_return io::io_result{sys ? -sys : -EIO};
            }
            default:
                report_failure(err);
                co_return io::io_result{-EPROTO};
            }
            if (wait < 0) {
                co_return io::io_result{wait};
            }
        }
    }

    void report_failure(int err) const {
        long verify = SSL_get_verify_result(ssl_.get());
        if (verify != X509_V_OK) {
            EVENTLINE_LOG_ERROR("Certificate of {} rejected: {}", peer_, X509_verify_cert_error_string(verify));
        } else {
            EVENTLINE_LOG_ERROR("TLS error {} with {}: {}", err, peer_, tls_context::last_error());
        }
    }

    net::tcp_stream tcp_;
    std::unique_ptr<SSL, ssl_deleter> ssl_;
    std::string peer_;
};

/// TCP connect, then handshake with SNI set to host
/// @return Stream, or the errno of the step that failed
inline coro::task<std::expected<tls_stream, int>>
tls_connect(runtime::event_loop& loop, tls_context& ctx, std::string_view host, uint16_t port,
            coro::cancel_token token = {}) {
    auto tcp = co_await net::tcp_connect(loop, host, port, token);
    if (!tcp) {
        co_return std::unexpected(tcp.error());
    }
    tls_stream session(std::move(*tcp), ctx);
    if (host.size() >= 2 && host.front() == '[') {
        host = host.substr(1, host.size() - 2);
    }
    session.set_hostname(host);
    if (int err = co_await session.handshake(token); err != 0) {
        co_return std::unexpected(err);
    }
    co_return std::move(session);
}

} // namespace eventline::tls
