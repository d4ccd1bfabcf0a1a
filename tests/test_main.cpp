// Timeout helpers shared by the test suites; main comes from Catch2WithMain

#ifndef EVENTLINE_TEST_HELPERS_HPP
#define EVENTLINE_TEST_HELPERS_HPP

#include <chrono>

namespace eventline::test {

constexpr bool is_tsan_enabled() {
#if defined(__SANITIZE_THREAD__)
    return true;
#elif defined(__has_feature)
    #if __has_feature(thread_sanitizer)
        return true;
    #else
        return false;
    #endif
#else
    return false;
#endif
}

constexpr bool is_asan_enabled() {
#if defined(__SANITIZE_ADDRESS__)
    return true;
#elif defined(__has_feature)
    #if __has_feature(address_sanitizer)
        return true;
    #else
        return false;
    #endif
#else
    return false;
#endif
}

/// How much slower the instrumented build runs
constexpr int timeout_scale_factor() {
    if (is_tsan_enabled()) return 10;
    if (is_asan_enabled()) return 3;
    return 1;
}

/// Deadline for loop.run_until, stretched under sanitizers
inline std::chrono::milliseconds scaled_ms(int base_ms) {
    return std::chrono::milliseconds(base_ms * timeout_scale_factor());
}

} // namespace eventline::test

#endif // EVENTLINE_TEST_HELPERS_HPP
