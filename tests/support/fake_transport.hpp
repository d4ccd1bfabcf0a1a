#pragma once

#include <eventline/sse/transport.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace eventline::test {

/// One request opened through fake_transport, driven by the test
///
/// Signals are dropped once the handle is gone, the way a real transport
/// stops reporting after its handle is destroyed.
struct fake_request {
    sse::request req;
    sse::transport_callbacks callbacks;
    bool cancelled = false;
    bool handle_alive = true;

    bool live() const noexcept { return handle_alive && !cancelled; }

    void start(int status = 200, std::optional<std::string> type = std::string("text/event-stream"),
               http::header_list headers = {}, std::string status_text = "OK") {
        if (live() && callbacks.on_start) {
            callbacks.on_start(status, std::move(status_text), std::move(type), std::move(headers));
        }
    }

    void chunk(std::string_view text) {
        if (live() && callbacks.on_chunk) {
            callbacks.on_chunk(text);
        }
    }

    void finish(std::optional<sse::transport_error> error = std::nullopt) {
        if (handle_alive && callbacks.on_finish) {
            callbacks.on_finish(std::move(error));
        }
    }
};

class fake_transport final : public sse::transport {
public:
    class handle final : public sse::transport_handle {
    public:
        explicit handle(std::shared_ptr<fake_request> request)
            : request_(std::move(request)) {}

        ~handle() override { request_->handle_alive = false; }

        void cancel() override { request_->cancelled = true; }

    private:
        std::shared_ptr<fake_request> request_;
    };

    std::unique_ptr<sse::transport_handle> open(sse::request req,
                                                sse::transport_callbacks callbacks) override {
        if (fail_next_open_ > 0) {
            --fail_next_open_;
            throw std::invalid_argument("fake transport refused " + req.url);
        }
        auto request = std::make_shared<fake_request>();
        request->req = std::move(req);
        request->callbacks = std::move(callbacks);
        requests_.push_back(request);
        return std::make_unique<handle>(std::move(request));
    }

    /// Make the next n open() calls throw
    void fail_next_open(int n = 1) { fail_next_open_ = n; }

    size_t open_count() const noexcept { return requests_.size(); }

    fake_request& last() { return *requests_.back(); }
    fake_request& at(size_t i) { return *requests_.at(i); }

private:
    std::vector<std::shared_ptr<fake_request>> requests_;
    int fail_next_open_ = 0;
};

} // namespace eventline::test
