#pragma once

#include <eventline/time/timer_service.hpp>
#include <eventline/log/macros.hpp>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <coroutine>
#include <cstring>
#include <deque>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace eventline::runtime {

/// Readiness direction for fd waits
enum class io_event : uint8_t {
    readable,
    writable
};

/// Single-threaded event loop
///
/// Drives everything in one thread: posted callbacks, coroutine resumptions,
/// timers and socket readiness (level-triggered epoll). The only member that
/// may be called from another thread is stop().
///
/// @code
/// runtime::event_loop loop;
/// loop.spawn(main_task(loop).release());
/// loop.run();
/// @endcode
class event_loop final : public time::timer_service {
public:
    /// Configuration options
    struct config {
        size_t max_events = 64;  ///< Max epoll events per turn
    };

    event_loop() : event_loop(config{}) {}

    explicit event_loop(const config& cfg)
        : events_(cfg.max_events) {
        epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            throw std::runtime_error(
                std::string("epoll_create1 failed: ") + std::strerror(errno));
        }

        wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd_ < 0) {
            ::close(epoll_fd_);
            throw std::runtime_error(
                std::string("eventfd creation failed: ") + std::strerror(errno));
        }

        struct epoll_event wake_ev{};
        wake_ev.events = EPOLLIN;
        wake_ev.data.fd = wake_fd_;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &wake_ev) < 0) {
            ::close(wake_fd_);
            ::close(epoll_fd_);
            throw std::runtime_error(
                std::string("epoll_ctl for wake_fd failed: ") + std::strerror(errno));
        }

        EVENTLINE_LOG_DEBUG("event_loop initialized (max_events={})", cfg.max_events);
    }

    ~event_loop() override {
        // Waiting coroutines get -ECANCELED so they can unwind and free
        // their sockets before the loop disappears
        std::vector<int> fds;
        fds.reserve(fd_states_.size());
        for (auto& [fd, state] : fd_states_) {
            fds.push_back(fd);
        }
        for (int fd : fds) {
            forget_fd(fd);
        }
        for (int i = 0; i < 1024 && !tasks_.empty(); ++i) {
            run_tasks();
        }
        timers_.clear();
        timer_index_.clear();

        ::close(wake_fd_);
        ::close(epoll_fd_);
        EVENTLINE_LOG_DEBUG("event_loop destroyed");
    }

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;
    event_loop(event_loop&&) = delete;
    event_loop& operator=(event_loop&&) = delete;

    /// Loop currently running on this thread, if any
    static event_loop* current() noexcept { return current_; }

    // timer_service

    time::clock::time_point now() const noexcept override {
        return time::clock::now();
    }

    time::timer_id schedule_after(std::chrono::milliseconds delay,
                                  std::function<void()> callback) override {
        auto deadline = now() + std::max(delay, std::chrono::milliseconds(0));
        auto id = next_timer_id_++;
        timers_.emplace(std::make_pair(deadline, id), std::move(callback));
        timer_index_.emplace(id, deadline);
        return id;
    }

    bool cancel(time::timer_id id) noexcept override {
        auto it = timer_index_.find(id);
        if (it == timer_index_.end()) {
            return false;
        }
        timers_.erase(std::make_pair(it->second, id));
        timer_index_.erase(it);
        return true;
    }

    void post(std::function<void()> callback) override {
        tasks_.push_back(std::move(callback));
    }

    /// Resume a coroutine on the next turn
    void spawn(std::coroutine_handle<> handle) {
        if (handle) {
            tasks_.push_back([handle]() { handle.resume(); });
        }
    }

    /// Register a one-shot readiness wait
    ///
    /// When the fd becomes ready (or fails) *result is set to 0 and awaiter is
    /// resumed on the loop. Only one waiter per fd and direction.
    /// @return false if a waiter is already registered or epoll refused the fd
    bool add_waiter(int fd, io_event ev, std::coroutine_handle<> awaiter, int* result) {
        auto& state = fd_states_[fd];
        auto& slot = (ev == io_event::readable) ? state.reader : state.writer;
        if (slot.handle) {
            return false;
        }
        slot.handle = awaiter;
        slot.result = result;
        if (!update_interest(fd, state)) {
            slot = waiter{};
            if (!state.reader.handle && !state.writer.handle) {
                fd_states_.erase(fd);
            }
            return false;
        }
        return true;
    }

    /// Remove a pending wait; the awaiter is resumed with -ECANCELED
    /// @return true if a waiter was pending
    bool cancel_waiter(int fd, io_event ev) {
        auto it = fd_states_.find(fd);
        if (it == fd_states_.end()) {
            return false;
        }
        auto& slot = (ev == io_event::readable) ? it->second.reader : it->second.writer;
        if (!slot.handle) {
            return false;
        }
        complete(slot, -ECANCELED);
        update_interest(fd, it->second);
        if (!it->second.reader.handle && !it->second.writer.handle) {
            fd_states_.erase(it);
        }
        return true;
    }

    /// Drop all waits on an fd that is about to be closed
    void forget_fd(int fd) {
        auto it = fd_states_.find(fd);
        if (it == fd_states_.end()) {
            return;
        }
        if (it->second.reader.handle) complete(it->second.reader, -ECANCELED);
        if (it->second.writer.handle) complete(it->second.writer, -ECANCELED);
        if (it->second.registered) {
            ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        }
        fd_states_.erase(it);
    }

    /// Run one turn: wait up to max_wait for work, then process it
    /// @return Number of callbacks, timers and resumptions executed
    size_t run_once(std::chrono::milliseconds max_wait) {
        auto* previous = current_;
        current_ = this;

        int timeout_ms = 0;
        if (tasks_.empty()) {
            auto wait = max_wait;
            if (!timers_.empty()) {
                auto until_next = std::chrono::ceil<std::chrono::milliseconds>(
                    timers_.begin()->first.first - now());
                wait = std::min(wait, std::max(until_next, std::chrono::milliseconds(0)));
            }
            timeout_ms = static_cast<int>(wait.count());
        }

        size_t executed = poll_fds(timeout_ms);
        executed += run_timers();
        executed += run_tasks();

        current_ = previous;
        return executed;
    }

    /// Run until stop() is called
    void run() {
        stop_requested_.store(false, std::memory_order_relaxed);
        while (!stop_requested_.load(std::memory_order_acquire)) {
            run_once(std::chrono::milliseconds(1000));
        }
    }

    /// Run for a wall-clock duration
    void run_for(std::chrono::milliseconds duration) {
        auto deadline = now() + duration;
        stop_requested_.store(false, std::memory_order_relaxed);
        while (!stop_requested_.load(std::memory_order_acquire)) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now());
            if (remaining.count() <= 0) break;
            run_once(remaining);
        }
    }

    /// Run until pred() holds or limit elapses
    /// @return Final value of pred()
    template<typename Pred>
    bool run_until(Pred&& pred, std::chrono::milliseconds limit) {
        auto deadline = now() + limit;
        while (!pred()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now());
            if (remaining.count() <= 0) {
                return pred();
            }
            run_once(std::min(remaining, std::chrono::milliseconds(10)));
        }
        return true;
    }

    /// Ask run() to return; safe from any thread
    void stop() noexcept {
        stop_requested_.store(true, std::memory_order_release);
        uint64_t one = 1;
        ssize_t ret = ::write(wake_fd_, &one, sizeof(one));
        (void)ret;  // EAGAIN means a wake-up is already pending
    }

    /// Check if any callback, timer or fd wait is outstanding
    bool has_pending() const noexcept {
        return !tasks_.empty() || !timers_.empty() || !fd_states_.empty();
    }

    size_t timer_count() const noexcept { return timers_.size(); }

private:
    struct waiter {
        std::coroutine_handle<> handle;
        int* result = nullptr;
    };

    struct fd_state {
        waiter reader;
        waiter writer;
        uint32_t events = 0;
        bool registered = false;
    };

    void complete(waiter& w, int result) {
        if (w.result) {
            *w.result = result;
        }
        spawn(w.handle);
        w = waiter{};
    }

    bool update_interest(int fd, fd_state& state) {
        uint32_t events = 0;
        if (state.reader.handle) events |= EPOLLIN | EPOLLRDHUP;
        if (state.writer.handle) events |= EPOLLOUT;

        if (events == 0) {
            if (state.registered) {
                ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                state.registered = false;
                state.events = 0;
            }
            return true;
        }
        if (state.registered && events == state.events) {
            return true;
        }

        struct epoll_event ev{};
        ev.events = events;
        ev.data.fd = fd;
        int ret = ::epoll_ctl(epoll_fd_, state.registered ? EPOLL_CTL_MOD : EPOLL_CTL_ADD, fd, &ev);
        if (ret < 0) {
            EVENTLINE_LOG_WARNING("epoll_ctl failed for fd {}: {}", fd, std::strerror(errno));
            return false;
        }
        state.registered = true;
        state.events = events;
        return true;
    }

    size_t poll_fds(int timeout_ms) {
        int n = ::epoll_wait(epoll_fd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
        if (n < 0) {
            if (errno != EINTR) {
                EVENTLINE_LOG_ERROR("epoll_wait failed: {}", std::strerror(errno));
            }
            return 0;
        }

        size_t completed = 0;
        for (int i = 0; i < n; ++i) {
            int fd = events_[i].data.fd;
            uint32_t ev = events_[i].events;

            if (fd == wake_fd_) {
                uint64_t value = 0;
                ssize_t ret = ::read(wake_fd_, &value, sizeof(value));
                (void)ret;
                continue;
            }

            auto it = fd_states_.find(fd);
            if (it == fd_states_.end()) {
                continue;
            }
            auto& state = it->second;
            bool failed = (ev & (EPOLLERR | EPOLLHUP)) != 0;
            if (state.reader.handle && (failed || (ev & (EPOLLIN | EPOLLRDHUP)))) {
                complete(state.reader, 0);
                ++completed;
            }
            if (state.writer.handle && (failed || (ev & EPOLLOUT))) {
                complete(state.writer, 0);
                ++completed;
            }
            update_interest(fd, state);
            if (!state.reader.handle && !state.writer.handle) {
                fd_states_.erase(it);
            }
        }
        return completed;
    }

    size_t run_timers() {
        if (timers_.empty()) {
            return 0;
        }
        // Collect first: a callback may cancel another expired timer, and
        // timers armed by callbacks wait for the next turn
        auto current_time = now();
        std::vector<time::timer_id> expired;
        for (auto it = timers_.begin(); it != timers_.end() && it->first.first <= current_time; ++it) {
            expired.push_back(it->first.second);
        }

        size_t executed = 0;
        for (auto id : expired) {
            auto idx = timer_index_.find(id);
            if (idx == timer_index_.end()) {
                continue;
            }
            auto node = timers_.extract(std::make_pair(idx->second, id));
            timer_index_.erase(idx);
            node.mapped()();
            ++executed;
        }
        return executed;
    }

    size_t run_tasks() {
        // Work posted while running waits for the next turn
        std::deque<std::function<void()>> batch;
        batch.swap(tasks_);
        size_t executed = 0;
        while (!batch.empty()) {
            auto fn = std::move(batch.front());
            batch.pop_front();
            fn();
            ++executed;
        }
        return executed;
    }

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::vector<struct epoll_event> events_;
    std::unordered_map<int, fd_state> fd_states_;
    std::map<std::pair<time::clock::time_point, time::timer_id>, std::function<void()>> timers_;
    std::unordered_map<time::timer_id, time::clock::time_point> timer_index_;
    time::timer_id next_timer_id_ = 1;
    std::deque<std::function<void()>> tasks_;
    std::atomic<bool> stop_requested_{false};

    static inline thread_local event_loop* current_ = nullptr;
};

} // namespace eventline::runtime
