#pragma once

#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <mutex>
#include <optional>
#include <string_view>
#include <unistd.h>

namespace eventline::log {

enum class level {
    debug,
    info,
    warning,
    error
};

constexpr const char* level_to_string(level lvl) noexcept {
    constexpr const char* names[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    auto i = static_cast<unsigned>(lvl);
    return i < std::size(names) ? names[i] : "UNKNOWN";
}

/// Accepts the lower-case names, plus "warn"
inline std::optional<level> level_from_string(std::string_view name) noexcept {
    if (name == "debug") return level::debug;
    if (name == "info") return level::info;
    if (name == "warn" || name == "warning") return level::warning;
    if (name == "error") return level::error;
    return std::nullopt;
}

/// Process-wide line logger writing to stderr
///
/// Starts at info unless EVENTLINE_LOG_LEVEL names another level. Lines are
/// colored only when stderr is a terminal.
class logger {
public:
    static logger& instance() noexcept {
        static logger the_logger;
        return the_logger;
    }

    void set_level(level min_level) noexcept { threshold_.store(min_level, std::memory_order_relaxed); }
    level get_level() const noexcept { return threshold_.load(std::memory_order_relaxed); }
    bool enabled(level lvl) const noexcept { return lvl >= get_level(); }

    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (enabled(lvl)) {
            write(lvl, file, line, fmt::format(fmt_str, std::forward<Args>(args)...));
        }
    }

    /// Emits one preformatted line: time, level, source location, text
    void write(level lvl, std::string_view file, int line, std::string_view text) {
        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        auto stamp = fmt::localtime(std::chrono::system_clock::to_time_t(now));

        fmt::memory_buffer out;
        auto it = std::back_inserter(out);
        if (colored_) {
            fmt::format_to(it, "{}", color_of(lvl));
        }
        fmt::format_to(it, "{:%H:%M:%S}.{:03} {:<5} {}:{} {}", stamp, millis, level_to_string(lvl),
                       base_name(file), line, text);
        if (colored_) {
            fmt::format_to(it, "\033[0m");
        }
        out.push_back('\n');

        std::lock_guard lock(write_mutex_);
        std::fwrite(out.data(), 1, out.size(), stderr);
    }

private:
    logger() noexcept : threshold_(level_from_env()), colored_(::isatty(STDERR_FILENO) == 1) {}
    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    static level level_from_env() noexcept {
        if (const char* env = std::getenv("EVENTLINE_LOG_LEVEL")) {
            return level_from_string(env).value_or(level::info);
        }
        return level::info;
    }

    static std::string_view base_name(std::string_view path) noexcept {
        auto slash = path.rfind('/');
        return slash == std::string_view::npos ? path : path.substr(slash + 1);
    }

    static constexpr std::string_view color_of(level lvl) noexcept {
        switch (lvl) {
            case level::debug:   return "\033[36m";
            case level::info:    return "\033[32m";
            case level::warning: return "\033[33m";
            case level::error:   return "\033[31m";
        }
        return "";
    }

    std::atomic<level> threshold_;
    bool colored_;
    std::mutex write_mutex_;
};

} // namespace eventline::log
