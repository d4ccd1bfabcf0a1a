#pragma once

/// @file frame_parser.hpp
/// @brief Incremental parser for the text/event-stream format

#include <eventline/sse/event.hpp>
#include <eventline/sse/config.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace eventline::sse {

/// `retry:` field with a usable value
struct retry_frame {
    std::chrono::milliseconds interval;
};

/// `heartbeatTimeout:` field with a usable value
struct heartbeat_frame {
    std::chrono::milliseconds timeout;
};

/// Parser output, in stream order
using frame = std::variant<message_event, retry_frame, heartbeat_frame>;

/// Parse a `retry` value
///
/// ASCII digits only. Empty, non-numeric and zero values are rejected;
/// others are clamped to [min_duration, max_duration], saturating on
/// overflow.
inline std::optional<std::chrono::milliseconds> parse_duration(std::string_view value) noexcept {
    if (value.empty()) {
        return std::nullopt;
    }
    constexpr uint64_t limit = static_cast<uint64_t>(max_duration.count());
    uint64_t n = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        if (n <= limit) {
            n = n * 10 + static_cast<uint64_t>(c - '0');
        }
    }
    if (n == 0) {
        return std::nullopt;
    }
    return clamp_duration(std::chrono::milliseconds(static_cast<int64_t>(std::min(n, limit))));
}

/// Parse a `heartbeatTimeout` value
///
/// Leading whitespace and one sign are skipped, then the leading run of
/// digits is read and anything after it ignored. Any integer found, zero
/// and negatives included, is clamped to [min_duration, max_duration];
/// nullopt only when there is no digit at all.
inline std::optional<std::chrono::milliseconds> parse_heartbeat_timeout(std::string_view value) noexcept {
    size_t pos = 0;
    while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t' || value[pos] == '\n' ||
                                  value[pos] == '\r' || value[pos] == '\f' || value[pos] == '\v')) {
        ++pos;
    }
    bool negative = false;
    if (pos < value.size() && (value[pos] == '-' || value[pos] == '+')) {
        negative = value[pos] == '-';
        ++pos;
    }
    constexpr uint64_t limit = static_cast<uint64_t>(max_duration.count());
    uint64_t n = 0;
    size_t digits = 0;
    for (; pos < value.size() && value[pos] >= '0' && value[pos] <= '9'; ++pos, ++digits) {
        if (n <= limit) {
            n = n * 10 + static_cast<uint64_t>(value[pos] - '0');
        }
    }
    if (digits == 0) {
        return std::nullopt;
    }
    if (negative) {
        return min_duration;
    }
    return clamp_duration(std::chrono::milliseconds(static_cast<int64_t>(std::min(n, limit))));
}

/// Incremental event stream parser
///
/// Accepts chunks split anywhere (including between the CR and LF of a
/// line break) and yields exactly what the concatenated input would. Each
/// chunk is cut at its last line terminator; the unterminated remainder is
/// held until a later chunk completes it.
///
/// @code
/// sse::frame_parser parser;
/// parser.feed("data: hel", handler);
/// parser.feed("lo\n\n", handler);   // handler sees message_event{"message", "hello", ""}
/// @endcode
class frame_parser {
public:
    frame_parser() = default;

    explicit frame_parser(std::string last_event_id)
        : pending_id_(std::move(last_event_id)) {}

    /// Discard all state; the id of the next record defaults to last_event_id
    void reset(std::string last_event_id = {}) {
        state_ = line_state::field_start;
        tail_.clear();
        data_.clear();
        type_.clear();
        pending_id_ = std::move(last_event_id);
        field_start_ = 0;
        value_start_ = 0;
    }

    /// Feed a chunk, calling handler(frame&) for every frame in order
    ///
    /// The handler returns false to stop; the rest of the scanned text is
    /// then dropped, and a later feed() starts at the next line.
    /// @return false if the handler stopped the scan
    template<typename Handler>
    bool feed(std::string_view chunk, Handler&& handler) {
        auto last = chunk.find_last_of("\r\n");
        if (last == std::string_view::npos) {
            tail_.append(chunk);
            return true;
        }
        std::string text = std::move(tail_);
        text.append(chunk.substr(0, last + 1));
        tail_.assign(chunk.substr(last + 1));
        return scan(text, handler);
    }

    /// Feed a chunk and collect its frames
    std::vector<frame> feed(std::string_view chunk) {
        std::vector<frame> frames;
        feed(chunk, [&frames](frame& f) {
            frames.push_back(std::move(f));
            return true;
        });
        return frames;
    }

    /// Id the next record will carry
    std::string_view pending_event_id() const noexcept { return pending_id_; }

    /// Unterminated text held from previous chunks
    std::string_view buffered() const noexcept { return tail_; }

private:
    enum class line_state {
        after_cr,       ///< Saw CR; a following LF belongs to the same break
        field_start,    ///< At the start of a line
        field,          ///< Inside the field name
        value_start,    ///< Just after the colon
        value           ///< Inside the value
    };

    template<typename Handler>
    bool scan(std::string_view text, Handler& handler) {
        for (size_t pos = 0; pos < text.size(); ++pos) {
            char c = text[pos];
            if (state_ == line_state::after_cr && c == '\n') {
                state_ = line_state::field_start;
                continue;
            }
            if (state_ == line_state::after_cr) {
                state_ = line_state::field_start;
            }

            if (c == '\r' || c == '\n') {
                // The line is consumed before the handler runs, so a stop
                // leaves the parser ready for the next line
                auto ended = state_;
                state_ = (c == '\r') ? line_state::after_cr : line_state::field_start;
                bool go_on = true;
                if (ended != line_state::field_start) {
                    if (ended == line_state::field) {
                        value_start_ = pos + 1;
                    }
                    auto name = text.substr(field_start_, value_start_ - 1 - field_start_);
                    size_t from = value_start_;
                    if (from < pos && text[from] == ' ') {
                        ++from;
                    }
                    auto value = from < pos ? text.substr(from, pos - from) : std::string_view{};
                    go_on = on_field(name, value, handler);
                } else {
                    go_on = dispatch(handler);
                }
                if (!go_on) {
                    return false;
                }
                continue;
            }

            if (state_ == line_state::field_start) {
                field_start_ = pos;
                state_ = line_state::field;
            }
            if (state_ == line_state::field) {
                if (c == ':') {
                    value_start_ = pos + 1;
                    state_ = line_state::value_start;
                }
            } else if (state_ == line_state::value_start) {
                state_ = line_state::value;
            }
        }
        return true;
    }

    template<typename Handler>
    bool on_field(std::string_view name, std::string_view value, Handler& handler) {
        if (name == "data") {
            data_ += '\n';
            data_.append(value);
        } else if (name == "id") {
            pending_id_.assign(value);
        } else if (name == "event") {
            type_.assign(value);
        } else if (name == "retry") {
            if (auto d = parse_duration(value)) {
                frame f{retry_frame{*d}};
                return handler(f);
            }
        } else if (name == "heartbeatTimeout") {
            if (auto d = parse_heartbeat_timeout(value)) {
                frame f{heartbeat_frame{*d}};
                return handler(f);
            }
        }
        return true;
    }

    /// Blank line: flush the pending record, if it has data
    template<typename Handler>
    bool dispatch(Handler& handler) {
        if (data_.empty()) {
            type_.clear();
            return true;
        }
        message_event ev;
        if (!type_.empty()) {
            ev.type = std::move(type_);
        }
        ev.data = data_.substr(1);
        ev.last_event_id = pending_id_;
        data_.clear();
        type_.clear();

        frame f{std::move(ev)};
        return handler(f);
    }

    line_state state_ = line_state::field_start;
    std::string tail_;
    std::string data_;
    std::string type_;
    std::string pending_id_;
    size_t field_start_ = 0;
    size_t value_start_ = 0;
};

} // namespace eventline::sse
