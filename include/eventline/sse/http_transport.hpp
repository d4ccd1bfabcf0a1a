#pragma once

/// @file http_transport.hpp
/// @brief HTTP/1.1 streaming transport over TCP or TLS

#include <eventline/sse/transport.hpp>
#include <eventline/sse/config.hpp>
#include <eventline/http/http_common.hpp>
#include <eventline/http/response_parser.hpp>
#include <eventline/http/utf8.hpp>
#include <eventline/net/stream.hpp>
#include <eventline/tls/tls_context.hpp>
#include <eventline/runtime/event_loop.hpp>
#include <eventline/coro/task.hpp>
#include <eventline/coro/cancel_token.hpp>
#include <eventline/log/macros.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace eventline::sse {

namespace detail {

/// State shared by a running request and its handle
struct http_stream_state {
    transport_callbacks callbacks;
    coro::cancel_source cancel;
    bool detached = false;   ///< Handle destroyed: no more callbacks
    bool finished = false;

    bool live() const noexcept {
        return !detached && !cancel.is_cancelled();
    }

    void finish(std::optional<transport_error> error) {
        if (finished) {
            return;
        }
        finished = true;
        if (!detached && callbacks.on_finish) {
            // A cancelled request always ends without an error
            if (cancel.is_cancelled()) {
                error.reset();
            }
            callbacks.on_finish(std::move(error));
        }
    }
};

class http_transport_handle final : public transport_handle {
public:
    explicit http_transport_handle(std::shared_ptr<http_stream_state> state)
        : state_(std::move(state)) {}

    ~http_transport_handle() override {
        state_->detached = true;
        state_->cancel.cancel();
    }

    void cancel() override {
        if (!state_->finished) {
            state_->cancel.cancel();
        }
    }

private:
    std::shared_ptr<http_stream_state> state_;
};

inline transport_error io_error(std::string_view what, int code) {
    return transport_error{code, fmt::format("{}: {}", what, std::strerror(code))};
}

} // namespace detail

/// Streaming GET over HTTP/1.1
///
/// Each open() spawns a coroutine on the event loop that connects, sends the
/// request, parses the response head, decodes the body framing and UTF-8,
/// and reports through the callbacks. The server closing the connection at
/// the end of the body finishes without an error.
class http_transport final : public transport {
public:
    explicit http_transport(runtime::event_loop& loop, http_transport_config config = {})
        : loop_(loop)
        , config_(std::move(config)) {
        if (config_.read_buffer_size == 0) {
            config_.read_buffer_size = 4096;
        }
    }

    /// @throws std::invalid_argument for malformed or non-http(s) URLs
    std::unique_ptr<transport_handle> open(request req, transport_callbacks callbacks) override {
        auto parsed = http::url::parse(req.url);
        if (!parsed) {
            throw std::invalid_argument("Invalid event source URL: " + req.url);
        }
        if (parsed->scheme != "http" && parsed->scheme != "https") {
            throw std::invalid_argument("Unsupported URL scheme: " + parsed->scheme);
        }

        std::shared_ptr<tls::tls_context> tls_ctx;
        if (parsed->is_secure()) {
            if (!tls_ctx_) {
                tls_ctx_ = std::make_shared<tls::tls_context>(config_.verify_certificate);
            }
            tls_ctx = tls_ctx_;
        }

        auto request_text = build_request(*parsed, req);
        auto state = std::make_shared<detail::http_stream_state>();
        state->callbacks = std::move(callbacks);

        auto task = run(loop_, std::move(tls_ctx), std::move(*parsed), std::move(request_text), config_, state);
        loop_.spawn(task.release());
        return std::make_unique<detail::http_transport_handle>(std::move(state));
    }

    const http_transport_config& config() const noexcept { return config_; }

    /// Request head for a parsed URL (exposed for tests)
    std::string build_request(const http::url& target, const request& req) const {
        http::header_list headers;
        headers.add("Host", target.host_header());
        headers.add("Accept", content_type);
        headers.add("Cache-Control", "no-cache");
        if (!config_.user_agent.empty()) {
            headers.add("User-Agent", config_.user_agent);
        }
        if (req.credentials == credentials_mode::include) {
            if (!target.userinfo.empty()) {
                headers.add("Authorization", "Basic " + http::base64_encode(http::percent_decode(target.userinfo)));
            }
            if (!config_.cookie.empty()) {
                headers.add("Cookie", config_.cookie);
            }
        }
        for (const auto& [name, value] : req.headers) {
            headers.set(name, value);
        }

        std::string text = "GET " + target.path_with_query() + " HTTP/1.1\r\n";
        text += headers.serialize();
        text += "\r\n";
        return text;
    }

private:
    static coro::task<void> run(runtime::event_loop& loop, std::shared_ptr<tls::tls_context> tls_ctx,
                                http::url target,
                                std::string request_text, http_transport_config config,
                                std::shared_ptr<detail::http_stream_state> state) {
        auto token = state->cancel.get_token();

        EVENTLINE_LOG_DEBUG("Connecting to {}:{}", target.host, target.effective_port());
        auto connected = co_await net::connect(loop, target.host, target.effective_port(),
                                              tls_ctx.get(), token);
        if (!connected) {
            state->finish(detail::io_error(
                fmt::format("Failed to connect to {}:{}", target.host, target.effective_port()),
                connected.error()));
            co_return;
        }
        auto& conn = *connected;

        int sent = co_await conn.write_all(request_text, token);
        if (sent != 0) {
            state->finish(detail::io_error("Failed to send request", sent));
            co_return;
        }

        http::response_head_parser head(config.max_header_bytes);
        http::body_decoder body;
        http::utf8_decoder utf8;
        std::vector<char> buffer(config.read_buffer_size);
        bool started = false;
        std::string payload;

        while (state->live()) {
            auto result = co_await conn.read(buffer.data(), buffer.size(), token);
            if (!state->live()) {
                break;
            }
            if (result.result < 0) {
                state->finish(detail::io_error("Read failed", result.error_code()));
                co_return;
            }
            if (result.result == 0) {
                if (!started) {
                    state->finish(transport_error{ECONNRESET, "Connection closed before the response head"});
                } else if (!body.finish_on_close()) {
                    state->finish(transport_error{EPIPE, "Connection closed before the end of the body"});
                } else {
                    EVENTLINE_LOG_DEBUG("Event stream from {} ended", target.host);
                    state->finish(std::nullopt);
                }
                co_return;
            }

            std::string_view data(buffer.data(), static_cast<size_t>(result.result));

            if (!started) {
                auto [status, consumed] = head.parse(data);
                if (status == http::parse_result::error) {
                    state->finish(transport_error{EPROTO, std::string(head.error_message())});
                    co_return;
                }
                if (status == http::parse_result::need_more) {
                    continue;
                }
                started = true;
                data.remove_prefix(consumed);

                auto headers = head.take_headers();
                body = http::body_decoder::for_response(head.status_code(), headers);
                std::optional<std::string> type;
                if (auto ct = headers.get("Content-Type")) {
                    type = std::string(*ct);
                }
                EVENTLINE_LOG_DEBUG("Response {} {} from {}", head.status_code(), head.status_text(), target.host);
                if (state->callbacks.on_start) {
                    state->callbacks.on_start(head.status_code(), std::string(head.status_text()),
                                              std::move(type), std::move(headers));
                }
                if (!state->live()) {
                    break;
                }
            }

            payload.clear();
            auto decoded = body.decode(data, payload);
            if (decoded == http::parse_result::error) {
                state->finish(transport_error{EPROTO, std::string(body.error_message())});
                co_return;
            }
            if (!payload.empty()) {
                auto text = utf8.decode(payload);
                if (!text.empty() && state->callbacks.on_chunk) {
                    state->callbacks.on_chunk(text);
                    if (!state->live()) {
                        break;
                    }
                }
            }
            if (decoded == http::parse_result::complete) {
                state->finish(std::nullopt);
                co_return;
            }
        }

        state->finish(std::nullopt);
    }

    runtime::event_loop& loop_;
    http_transport_config config_;
    std::shared_ptr<tls::tls_context> tls_ctx_;
};

} // namespace eventline::sse
