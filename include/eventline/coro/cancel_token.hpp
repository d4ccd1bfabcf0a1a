#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <utility>

namespace eventline::coro {

/// How a cancellable wait ended
enum class cancel_result {
    completed,
    cancelled
};

namespace detail {

/// Flag and callback table shared by a source and its tokens
///
/// Lives on one event loop thread; nothing here is synchronized.
class cancel_state {
public:
    bool requested() const noexcept { return requested_; }

    /// @return Slot id, or 0 when the callback already ran
    uint64_t attach(std::function<void()> fn) {
        if (requested_) {
            fn();
            return 0;
        }
        auto slot = ++last_slot_;
        pending_.emplace(slot, std::move(fn));
        return slot;
    }

    void detach(uint64_t slot) noexcept { pending_.erase(slot); }

    /// Runs callbacks in registration order; each may detach later ones
    void request() {
        if (requested_) {
            return;
        }
        requested_ = true;
        while (!pending_.empty()) {
            auto first = pending_.begin();
            auto fn = std::move(first->second);
            pending_.erase(first);
            fn();
        }
    }

private:
    std::map<uint64_t, std::function<void()>> pending_;
    uint64_t last_slot_ = 0;
    bool requested_ = false;
};

} // namespace detail

/// Keeps a cancellation callback registered for as long as it lives
class cancel_registration {
public:
    cancel_registration() = default;
    cancel_registration(cancel_registration&& other) noexcept
        : state_(std::move(other.state_)), slot_(std::exchange(other.slot_, 0)) {}
    cancel_registration& operator=(cancel_registration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            slot_ = std::exchange(other.slot_, 0);
        }
        return *this;
    }
    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;
    ~cancel_registration() { unregister(); }

    void unregister() noexcept {
        if (slot_ == 0) {
            return;
        }
        if (auto state = state_.lock()) {
            state->detach(slot_);
        }
        slot_ = 0;
        state_.reset();
    }

private:
    friend class cancel_token;

    cancel_registration(std::weak_ptr<detail::cancel_state> state, uint64_t slot) noexcept
        : state_(std::move(state)), slot_(slot) {}

    std::weak_ptr<detail::cancel_state> state_;
    uint64_t slot_ = 0;
};

/// Observer side of a cancel_source
///
/// A default-constructed token is never cancelled. Awaitables that take a
/// token register a callback that completes the wait early:
/// @code
/// while (!token.is_cancelled()) {
///     if (co_await time::sleep_for(loop, 100ms, token) == cancel_result::cancelled) break;
/// }
/// @endcode
class cancel_token {
public:
    cancel_token() = default;

    bool is_cancelled() const noexcept { return state_ && state_->requested(); }

    /// True while work may continue
    explicit operator bool() const noexcept { return !is_cancelled(); }

    /// Runs callback on cancellation, or right away if that already happened
    template<typename F>
    [[nodiscard]] cancel_registration on_cancel(F&& callback) const {
        if (!state_) {
            return {};
        }
        auto slot = state_->attach(std::function<void()>(std::forward<F>(callback)));
        return cancel_registration{state_, slot};
    }

private:
    friend class cancel_source;

    explicit cancel_token(std::shared_ptr<detail::cancel_state> state) noexcept
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_;
};

/// Owner side: hands out tokens and requests cancellation once
class cancel_source {
public:
    cancel_source() : state_(std::make_shared<detail::cancel_state>()) {}

    cancel_token get_token() const noexcept { return cancel_token{state_}; }

    /// Idempotent
    void cancel() {
        if (state_) {
            state_->request();
        }
    }

    bool is_cancelled() const noexcept { return state_ && state_->requested(); }

private:
    std::shared_ptr<detail::cancel_state> state_;
};

} // namespace eventline::coro
