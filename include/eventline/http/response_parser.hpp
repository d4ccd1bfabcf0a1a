#pragma once

#include <eventline/http/http_common.hpp>

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace eventline::http {

/// Parser result
enum class parse_result {
    need_more,      ///< Need more data
    complete,       ///< Parsing complete
    error           ///< Parse error
};

/// Incremental parser for an HTTP/1.x response head
///
/// Feed bytes until complete(); the bytes after the blank line are body and
/// are not consumed. Interim 1xx responses are skipped.
class response_head_parser {
public:
    explicit response_head_parser(size_t max_bytes = 64 * 1024)
        : max_bytes_(max_bytes) {}

    void reset() {
        state_ = state::status_line;
        line_.clear();
        head_bytes_ = 0;
        version_.clear();
        status_code_ = 0;
        status_text_.clear();
        headers_.clear();
        error_message_.clear();
    }

    /// Parse incoming data
    /// @return Parse result and number of bytes consumed
    std::pair<parse_result, size_t> parse(std::string_view data) {
        if (state_ == state::complete) return {parse_result::complete, 0};
        if (state_ == state::error) return {parse_result::error, 0};

        size_t pos = 0;
        while (pos < data.size()) {
            auto nl = data.find('\n', pos);
            size_t end = (nl == std::string_view::npos) ? data.size() : nl;
            head_bytes_ += end - pos + (nl == std::string_view::npos ? 0 : 1);
            if (head_bytes_ > max_bytes_) {
                set_error("Response head exceeds " + std::to_string(max_bytes_) + " bytes");
                return {parse_result::error, pos};
            }
            line_.append(data.substr(pos, end - pos));
            if (nl == std::string_view::npos) {
                return {parse_result::need_more, data.size()};
            }
            pos = nl + 1;

            if (!line_.empty() && line_.back() == '\r') {
                line_.pop_back();
            }
            bool ok = (state_ == state::status_line) ? parse_status_line(line_) : parse_header_line(line_);
            line_.clear();
            if (!ok) {
                return {parse_result::error, pos};
            }
            if (state_ == state::complete) {
                return {parse_result::complete, pos};
            }
        }
        return {parse_result::need_more, pos};
    }

    bool is_complete() const noexcept { return state_ == state::complete; }
    bool has_error() const noexcept { return state_ == state::error; }

    int status_code() const noexcept { return status_code_; }
    std::string_view status_text() const noexcept { return status_text_; }
    std::string_view version() const noexcept { return version_; }
    const header_list& headers() const noexcept { return headers_; }
    header_list take_headers() { return std::move(headers_); }
    std::string_view error_message() const noexcept { return error_message_; }

private:
    enum class state { status_line, headers, complete, error };

    bool parse_status_line(std::string_view line) {
        // HTTP/1.1 200 OK
        auto space1 = line.find(' ');
        if (space1 == std::string_view::npos || !line.starts_with("HTTP/")) {
            set_error("Invalid status line");
            return false;
        }
        version_ = line.substr(0, space1);

        auto rest = line.substr(space1 + 1);
        auto space2 = rest.find(' ');
        auto code = rest.substr(0, space2);
        int value = 0;
        auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), value);
        if (code.size() != 3 || ec != std::errc{} || ptr != code.data() + code.size()) {
            set_error("Invalid status code");
            return false;
        }
        status_code_ = value;
        status_text_ = (space2 == std::string_view::npos) ? std::string() : std::string(rest.substr(space2 + 1));
        state_ = state::headers;
        return true;
    }

    bool parse_header_line(std::string_view line) {
        if (line.empty()) {
            if (status_code_ >= 100 && status_code_ < 200 && status_code_ != 101) {
                // Interim response, the real one follows
                version_.clear();
                status_text_.clear();
                status_code_ = 0;
                headers_.clear();
                state_ = state::status_line;
                return true;
            }
            state_ = state::complete;
            return true;
        }

        if (line.front() == ' ' || line.front() == '\t') {
            // obs-fold continuation
            if (headers_.empty()) {
                set_error("Continuation line without header");
                return false;
            }
            headers_.append_to_last(trim(line));
            return true;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            set_error("Invalid header line");
            return false;
        }
        headers_.add(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        return true;
    }

    void set_error(std::string msg) {
        state_ = state::error;
        error_message_ = std::move(msg);
    }

    size_t max_bytes_;
    state state_ = state::status_line;
    std::string line_;
    size_t head_bytes_ = 0;
    std::string version_;
    int status_code_ = 0;
    std::string status_text_;
    header_list headers_;
    std::string error_message_;
};

/// How the response body is delimited
enum class body_framing {
    none,              ///< No body (204, 304)
    content_length,    ///< Exactly N bytes
    chunked,           ///< Transfer-Encoding: chunked
    until_close        ///< Everything until the server closes
};

/// Incremental response body decoder
class body_decoder {
public:
    body_decoder() = default;

    body_decoder(body_framing framing, uint64_t content_length = 0)
        : framing_(framing), remaining_(content_length) {
        if (framing_ == body_framing::none ||
            (framing_ == body_framing::content_length && remaining_ == 0)) {
            done_ = true;
        }
    }

    /// Pick the framing from status and headers (RFC 9112 section 6.3)
    static body_decoder for_response(int status, const header_list& headers) {
        if (status == 204 || status == 304 || (status >= 100 && status < 200)) {
            return body_decoder(body_framing::none);
        }
        if (auto te = headers.get("Transfer-Encoding")) {
            auto last = *te;
            auto comma = last.rfind(',');
            if (comma != std::string_view::npos) last = last.substr(comma + 1);
            if (iequals(trim(last), "chunked")) {
                return body_decoder(body_framing::chunked);
            }
            return body_decoder(body_framing::until_close);
        }
        if (auto cl = headers.get("Content-Length")) {
            auto v = trim(*cl);
            uint64_t length = 0;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), length);
            if (ec == std::errc{} && ptr == v.data() + v.size()) {
                return body_decoder(body_framing::content_length, length);
            }
            body_decoder bad(body_framing::content_length);
            bad.set_error("Invalid Content-Length");
            return bad;
        }
        return body_decoder(body_framing::until_close);
    }

    /// Decode wire bytes, appending payload to out
    /// @return complete once the body has ended, error on framing errors
    parse_result decode(std::string_view in, std::string& out) {
        if (!error_message_.empty()) return parse_result::error;

        switch (framing_) {
            case body_framing::none:
                return parse_result::complete;

            case body_framing::until_close:
                out.append(in);
                return parse_result::need_more;

            case body_framing::content_length: {
                auto take = static_cast<size_t>(std::min<uint64_t>(remaining_, in.size()));
                out.append(in.substr(0, take));
                remaining_ -= take;
                if (remaining_ == 0) done_ = true;
                return done_ ? parse_result::complete : parse_result::need_more;
            }

            case body_framing::chunked:
                return decode_chunked(in, out);
        }
        return parse_result::error;
    }

    /// The server closed the connection: is that a valid end of body?
    bool finish_on_close() const noexcept {
        return done_ || framing_ == body_framing::until_close;
    }

    bool done() const noexcept { return done_; }
    body_framing framing() const noexcept { return framing_; }
    std::string_view error_message() const noexcept { return error_message_; }

private:
    enum class chunk_state { size_line, data, data_end, trailer };

    parse_result decode_chunked(std::string_view in, std::string& out) {
        size_t pos = 0;
        while (pos < in.size() && !done_) {
            switch (chunk_state_) {
                case chunk_state::size_line:
                case chunk_state::data_end:
                case chunk_state::trailer: {
                    auto nl = in.find('\n', pos);
                    size_t end = (nl == std::string_view::npos) ? in.size() : nl;
                    line_.append(in.substr(pos, end - pos));
                    if (line_.size() > max_line_) {
                        set_error("Chunk line too long");
                        return parse_result::error;
                    }
                    if (nl == std::string_view::npos) {
                        return parse_result::need_more;
                    }
                    pos = nl + 1;
                    if (!line_.empty() && line_.back() == '\r') line_.pop_back();
                    if (!on_line()) {
                        return parse_result::error;
                    }
                    line_.clear();
                    break;
                }
                case chunk_state::data: {
                    auto take = static_cast<size_t>(std::min<uint64_t>(remaining_, in.size() - pos));
                    out.append(in.substr(pos, take));
                    pos += take;
                    remaining_ -= take;
                    if (remaining_ == 0) chunk_state_ = chunk_state::data_end;
                    break;
                }
            }
        }
        return done_ ? parse_result::complete : parse_result::need_more;
    }

    bool on_line() {
        switch (chunk_state_) {
            case chunk_state::size_line: {
                std::string_view size_str = line_;
                auto semi = size_str.find(';');
                if (semi != std::string_view::npos) size_str = size_str.substr(0, semi);
                size_str = trim(size_str);
                uint64_t size = 0;
                auto [ptr, ec] = std::from_chars(size_str.data(), size_str.data() + size_str.size(), size, 16);
                if (size_str.empty() || ec != std::errc{} || ptr != size_str.data() + size_str.size()) {
                    set_error("Invalid chunk size");
                    return false;
                }
                remaining_ = size;
                chunk_state_ = (size == 0) ? chunk_state::trailer : chunk_state::data;
                return true;
            }
            case chunk_state::data_end:
                if (!line_.empty()) {
                    set_error("Missing CRLF after chunk data");
                    return false;
                }
                chunk_state_ = chunk_state::size_line;
                return true;
            case chunk_state::trailer:
                if (line_.empty()) {
                    done_ = true;
                }
                return true;
            case chunk_state::data:
                break;
        }
        return true;
    }

    void set_error(std::string msg) {
        error_message_ = std::move(msg);
        done_ = false;
    }

    static constexpr size_t max_line_ = 8192;

    body_framing framing_ = body_framing::until_close;
    uint64_t remaining_ = 0;
    bool done_ = false;
    chunk_state chunk_state_ = chunk_state::size_line;
    std::string line_;
    std::string error_message_;
};

} // namespace eventline::http
