#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace eventline::time {

using clock = std::chrono::steady_clock;

/// Identifier of a scheduled callback
using timer_id = uint64_t;

/// Never returned by schedule_after()
inline constexpr timer_id invalid_timer = 0;

/// Abstract clock and callback scheduler
///
/// Implementations: runtime::event_loop (wall clock, epoll driven) and the
/// manual service used by the tests. All calls happen on the thread that
/// drives the service. A callback that is running has already been removed
/// from the service, so it may schedule or cancel freely.
class timer_service {
public:
    virtual ~timer_service() = default;

    /// Current time of this service
    virtual clock::time_point now() const noexcept = 0;

    /// Run callback once after delay (a zero or negative delay runs it on
    /// the next turn, never synchronously)
    virtual timer_id schedule_after(std::chrono::milliseconds delay,
                                    std::function<void()> callback) = 0;

    /// Cancel a scheduled callback
    /// @return true if the callback was pending and will not run
    virtual bool cancel(timer_id id) noexcept = 0;

    /// Run callback on the next turn, outside the current call stack
    virtual void post(std::function<void()> callback) = 0;
};

} // namespace eventline::time
