#pragma once

#include <eventline/time/timer_service.hpp>

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace eventline::test {

/// Timer service driven by the test instead of the wall clock
///
/// Nothing runs until advance() or run_posted() is called. Callbacks due at
/// the same instant run in scheduling order.
class manual_timer_service final : public time::timer_service {
public:
    time::clock::time_point now() const noexcept override { return now_; }

    time::timer_id schedule_after(std::chrono::milliseconds delay,
                                  std::function<void()> callback) override {
        auto id = next_id_++;
        auto when = now_ + std::max(delay, std::chrono::milliseconds(0));
        timers_.emplace(std::make_pair(when, id), std::move(callback));
        index_.emplace(id, when);
        return id;
    }

    bool cancel(time::timer_id id) noexcept override {
        auto it = index_.find(id);
        if (it == index_.end()) {
            return false;
        }
        timers_.erase(std::make_pair(it->second, id));
        index_.erase(it);
        return true;
    }

    void post(std::function<void()> callback) override {
        posted_.push_back(std::move(callback));
    }

    /// Run posted callbacks (including ones they post)
    size_t run_posted() {
        size_t count = 0;
        while (!posted_.empty()) {
            auto fn = std::move(posted_.front());
            posted_.pop_front();
            fn();
            ++count;
        }
        return count;
    }

    /// Move the clock forward, running every timer that falls due on the way
    size_t advance(std::chrono::milliseconds delta) {
        auto target = now_ + delta;
        size_t count = run_posted();
        while (!timers_.empty() && timers_.begin()->first.first <= target) {
            auto node = timers_.extract(timers_.begin());
            index_.erase(node.key().second);
            now_ = node.key().first;
            node.mapped()();
            ++count;
            count += run_posted();
        }
        now_ = target;
        return count + run_posted();
    }

    size_t pending_timers() const noexcept { return timers_.size(); }
    size_t pending_posts() const noexcept { return posted_.size(); }

    /// Delay until the earliest timer, if any
    std::optional<std::chrono::milliseconds> next_delay() const {
        if (timers_.empty()) {
            return std::nullopt;
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(timers_.begin()->first.first - now_);
    }

private:
    time::clock::time_point now_{};
    time::timer_id next_id_ = 1;
    std::map<std::pair<time::clock::time_point, time::timer_id>, std::function<void()>> timers_;
    std::unordered_map<time::timer_id, time::clock::time_point> index_;
    std::deque<std::function<void()>> posted_;
};

} // namespace eventline::test
