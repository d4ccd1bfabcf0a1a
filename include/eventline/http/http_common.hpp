#pragma once

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace eventline::http {

/// ASCII case-insensitive equality
inline bool iequals(std::string_view a, std::string_view b) noexcept {
    auto lower = [](char c) { return std::tolower(static_cast<unsigned char>(c)); };
    return std::ranges::equal(a, b, {}, lower, lower);
}

/// Strip leading and trailing spaces and tabs
inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

/// Replace every run of whitespace with a single space
inline std::string collapse_whitespace(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    bool in_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) result += ' ';
            in_space = true;
        } else {
            result += c;
            in_space = false;
        }
    }
    return result;
}

/// Ordered header list
///
/// Keeps the order and duplicates the server sent; lookups are
/// case-insensitive and return the first match.
class header_list {
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    header_list() = default;

    header_list(std::initializer_list<value_type> init) : entries_(init) {}

    /// Append a header, keeping any existing one with the same name
    void add(std::string_view name, std::string_view value) {
        entries_.emplace_back(std::string(name), std::string(value));
    }

    /// Replace all headers with this name by one entry (appended if absent)
    void set(std::string_view name, std::string_view value) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
            [name](const value_type& e) { return iequals(e.first, name); });
        if (it == entries_.end()) {
            add(name, value);
            return;
        }
        it->second = std::string(value);
        entries_.erase(std::remove_if(std::next(it), entries_.end(),
            [name](const value_type& e) { return iequals(e.first, name); }),
            entries_.end());
    }

    /// Extend the value of the last header (obs-fold continuation)
    void append_to_last(std::string_view more) {
        if (entries_.empty()) return;
        entries_.back().second += ' ';
        entries_.back().second += more;
    }

    /// First value for name
    std::optional<std::string_view> get(std::string_view name) const {
        for (const auto& [n, v] : entries_) {
            if (iequals(n, name)) return std::string_view(v);
        }
        return std::nullopt;
    }

    bool contains(std::string_view name) const {
        return get(name).has_value();
    }

    void remove(std::string_view name) {
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
            [name](const value_type& e) { return iequals(e.first, name); }),
            entries_.end());
    }

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    void clear() noexcept { entries_.clear(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    /// Serialize as request header lines
    std::string serialize() const {
        std::string result;
        for (const auto& [name, value] : entries_) {
            result += name;
            result += ": ";
            result += value;
            result += "\r\n";
        }
        return result;
    }

private:
    std::vector<value_type> entries_;
};

/// Absolute http(s) URL split into the pieces a request needs
struct url {
    std::string scheme;     ///< lower case
    std::string userinfo;   ///< still percent-encoded
    std::string host;       ///< IPv6 literals keep their brackets
    uint16_t port = 0;      ///< 0 when the URL names none
    std::string path = "/";
    std::string query;
    std::string fragment;

    bool is_secure() const { return scheme == "https"; }
    uint16_t default_port() const { return is_secure() ? 443 : 80; }
    uint16_t effective_port() const { return port ? port : default_port(); }

    /// Origin-form request target
    std::string path_with_query() const {
        return query.empty() ? path : path + '?' + query;
    }

    /// Host header value; the port is omitted when it is the default
    std::string host_header() const {
        if (effective_port() == default_port()) {
            return host;
        }
        return host + ':' + std::to_string(port);
    }

    /// @return nullopt without a scheme or host, or with a bad port
    static std::optional<url> parse(std::string_view text) {
        auto sep = text.find("://");
        if (sep == std::string_view::npos || sep == 0) {
            return std::nullopt;
        }
        url u;
        u.scheme.resize(sep);
        std::ranges::transform(text.substr(0, sep), u.scheme.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        text.remove_prefix(sep + 3);

        // Peel from the right: fragment, query, then path off the authority
        if (auto hash = text.find('#'); hash != std::string_view::npos) {
            u.fragment = text.substr(hash + 1);
            text = text.substr(0, hash);
        }
        if (auto q = text.find('?'); q != std::string_view::npos) {
            u.query = text.substr(q + 1);
            text = text.substr(0, q);
        }
        std::string_view authority = text.substr(0, text.find('/'));
        if (authority.size() < text.size()) {
            u.path = text.substr(authority.size());
        }
        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            u.userinfo = authority.substr(0, at);
            authority.remove_prefix(at + 1);
        }

        // The last colon outside an IPv6 literal starts the port
        size_t host_end = authority.size();
        if (authority.starts_with('[')) {
            host_end = authority.find(']');
            if (host_end == std::string_view::npos) {
                return std::nullopt;
            }
            ++host_end;
            if (host_end < authority.size() && authority[host_end] != ':') {
                return std::nullopt;
            }
        } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
            host_end = colon;
        }
        u.host = authority.substr(0, host_end);
        if (u.host.empty()) {
            return std::nullopt;
        }
        if (host_end < authority.size()) {
            auto digits = authority.substr(host_end + 1);
            auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), u.port);
            if (ec != std::errc{} || end != digits.data() + digits.size() || u.port == 0) {
                return std::nullopt;
            }
        }
        return u;
    }
};

/// Percent-encode everything except A-Z a-z 0-9 and - _ . ! ~ * ' ( )
inline std::string encode_uri_component(std::string_view str) {
    static const char hex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' ||
            c == '~' || c == '*' || c == '\'' || c == '(' || c == ')') {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex[c >> 4];
            result += hex[c & 0x0F];
        }
    }
    return result;
}

/// Decode %XX escapes; malformed escapes are kept as is
inline std::string percent_decode(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int value = 0;
            auto [ptr, ec] = std::from_chars(str.data() + i + 1, str.data() + i + 3, value, 16);
            if (ec == std::errc{} && ptr == str.data() + i + 3) {
                result += static_cast<char>(value);
                i += 2;
                continue;
            }
        }
        result += str[i];
    }
    return result;
}

/// Standard base64 (with padding)
inline std::string base64_encode(std::string_view data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

} // namespace eventline::http
