#pragma once

#include <eventline/log/macros.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace eventline::tls {

/// Client SSL_CTX shared by every connection attempt of one transport
class tls_context {
public:
    /// @param verify_peer Check the certificate chain and host name
    explicit tls_context(bool verify_peer = true)
        : ctx_(SSL_CTX_new(TLS_client_method())), verify_peer_(verify_peer) {
        if (!ctx_) {
            throw std::runtime_error("Failed to create SSL context: " + last_error());
        }
        auto* ctx = ctx_.get();
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
        SSL_CTX_set_options(ctx, SSL_OP_NO_COMPRESSION);
        SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

        // Event streams are HTTP/1.1
        static constexpr unsigned char http11[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};
        SSL_CTX_set_alpn_protos(ctx, http11, sizeof(http11));

        if (verify_peer_) {
            load_system_roots();
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        } else {
            SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
            EVENTLINE_LOG_WARNING("TLS certificate verification is disabled");
        }
    }

    SSL_CTX* native_handle() noexcept { return ctx_.get(); }
    bool verify_peer() const noexcept { return verify_peer_; }

    /// Pops the oldest queued OpenSSL error as text
    static std::string last_error() {
        unsigned long code = ERR_get_error();
        if (code == 0) {
            return "no OpenSSL error queued";
        }
        char text[256];
        ERR_error_string_n(code, text, sizeof(text));
        return text;
    }

private:
    struct ctx_deleter {
        void operator()(SSL_CTX* c) const noexcept { SSL_CTX_free(c); }
    };

    /// Distribution bundles are tried before OpenSSL's compiled-in paths,
    /// which do not match every system
    void load_system_roots() {
        static constexpr const char* bundles[] = {
            "/etc/ssl/certs/ca-certificates.crt",
            "/etc/pki/tls/certs/ca-bundle.crt",
            "/etc/ssl/ca-bundle.pem",
            "/etc/ssl/cert.pem",
        };
        for (const char* bundle : bundles) {
            if (SSL_CTX_load_verify_locations(ctx_.get(), bundle, nullptr) == 1) {
                EVENTLINE_LOG_DEBUG("Trust anchors from {}", bundle);
                return;
            }
        }
        ERR_clear_error();
        if (SSL_CTX_set_default_verify_paths(ctx_.get()) != 1) {
            EVENTLINE_LOG_WARNING("No system CA certificates found: {}", last_error());
        }
    }

    std::unique_ptr<SSL_CTX, ctx_deleter> ctx_;
    bool verify_peer_;
};

} // namespace eventline::tls
