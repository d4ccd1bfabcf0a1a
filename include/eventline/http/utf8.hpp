#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace eventline::http {

/// Streaming UTF-8 decoder
///
/// Turns arbitrary byte chunks into well-formed UTF-8 text. A sequence split
/// across chunks is held until its last byte arrives, so decode() never
/// returns text that ends inside a character. Ill-formed input becomes
/// U+FFFD (one per maximal invalid subpart) and a leading byte order mark is
/// removed.
class utf8_decoder {
public:
    /// Decode the next chunk of bytes
    std::string decode(std::string_view bytes) {
        std::string out;
        out.reserve(bytes.size());
        for (size_t i = 0; i < bytes.size();) {
            auto b = static_cast<uint8_t>(bytes[i]);
            if (needed_ == 0) {
                ++i;
                if (b <= 0x7F) {
                    emit(out, b);
                } else if (b >= 0xC2 && b <= 0xDF) {
                    needed_ = 1;
                    code_point_ = b & 0x1F;
                } else if (b >= 0xE0 && b <= 0xEF) {
                    if (b == 0xE0) lower_ = 0xA0;
                    if (b == 0xED) upper_ = 0x9F;
                    needed_ = 2;
                    code_point_ = b & 0x0F;
                } else if (b >= 0xF0 && b <= 0xF4) {
                    if (b == 0xF0) lower_ = 0x90;
                    if (b == 0xF4) upper_ = 0x8F;
                    needed_ = 3;
                    code_point_ = b & 0x07;
                } else {
                    emit(out, replacement);
                }
                continue;
            }

            if (b < lower_ || b > upper_) {
                // Truncated sequence; the byte is examined again as a lead byte
                clear_sequence();
                emit(out, replacement);
                continue;
            }

            ++i;
            lower_ = 0x80;
            upper_ = 0xBF;
            code_point_ = (code_point_ << 6) | (b & 0x3F);
            if (++seen_ == needed_) {
                auto cp = code_point_;
                clear_sequence();
                emit(out, cp);
            }
        }
        return out;
    }

    /// Check if a multi-byte sequence is waiting for more bytes
    bool has_pending() const noexcept { return needed_ != 0; }

    /// Forget any held partial sequence and the BOM state
    void reset() noexcept {
        clear_sequence();
        bom_checked_ = false;
    }

    static constexpr char32_t replacement = 0xFFFD;

private:
    void clear_sequence() noexcept {
        code_point_ = 0;
        needed_ = 0;
        seen_ = 0;
        lower_ = 0x80;
        upper_ = 0xBF;
    }

    void emit(std::string& out, char32_t cp) {
        if (!bom_checked_) {
            bom_checked_ = true;
            if (cp == 0xFEFF) return;
        }
        append_utf8(out, cp);
    }

    static void append_utf8(std::string& out, char32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    char32_t code_point_ = 0;
    int needed_ = 0;
    int seen_ = 0;
    uint8_t lower_ = 0x80;
    uint8_t upper_ = 0xBF;
    bool bom_checked_ = false;
};

} // namespace eventline::http
