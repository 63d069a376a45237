/**
 * @file beacon_string_utils.hpp
 * @brief String helpers for query strings, headers and config values
 * @author Bennie Shearer
 * @version 1.0.0
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#ifndef MAILBEACON_STRING_UTILS_HPP
#define MAILBEACON_STRING_UTILS_HPP

#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mailbeacon {
namespace string_utils {

namespace detail {

inline constexpr std::string_view kSpace = " \t\r\n\f\v";

template<typename Fn>
std::string mapChars(std::string_view s, Fn fn) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out += static_cast<char>(fn(c));
    return out;
}

inline int hexDigit(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(c | 0x20);
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace detail

/// Copy without leading and trailing whitespace
[[nodiscard]] inline std::string trim(std::string_view s) {
    auto first = s.find_first_not_of(detail::kSpace);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(detail::kSpace);
    return std::string(s.substr(first, last - first + 1));
}

[[nodiscard]] inline std::string toLower(std::string_view s) {
    return detail::mapChars(s, [](unsigned char c) { return std::tolower(c); });
}

[[nodiscard]] inline std::string toUpper(std::string_view s) {
    return detail::mapChars(s, [](unsigned char c) { return std::toupper(c); });
}

/// Split on every delimiter; empty fields are kept
[[nodiscard]] inline std::vector<std::string> split(std::string_view s, char delimiter) {
    std::vector<std::string> parts;
    for (;;) {
        auto pos = s.find(delimiter);
        parts.emplace_back(s.substr(0, pos));
        if (pos == std::string_view::npos) return parts;
        s.remove_prefix(pos + 1);
    }
}

[[nodiscard]] inline bool startsWith(std::string_view s, std::string_view prefix) noexcept {
    return s.substr(0, prefix.size()) == prefix;
}

/// ASCII case-insensitive prefix test, used for URL schemes
[[nodiscard]] inline bool startsWithIgnoreCase(std::string_view s, std::string_view prefix) noexcept {
    if (s.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Last path segment of a caller-supplied reference
 *
 * Both '/' and '\\' count as separators, so "../../etc/passwd" and
 * "..\\..\\boot.ini" reduce to "passwd" and "boot.ini".
 */
[[nodiscard]] inline std::string lastPathSegment(std::string_view s) {
    auto pos = s.find_last_of("/\\");
    return std::string(pos == std::string_view::npos ? s : s.substr(pos + 1));
}

/**
 * @brief Percent-decode a URL component
 * @param plusAsSpace Decode '+' as a space (form encoding)
 *
 * A '%' not followed by two hex digits is kept as is.
 */
[[nodiscard]] inline std::string urlDecode(std::string_view s, bool plusAsSpace = true) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+' && plusAsSpace) {
            out += ' ';
            continue;
        }
        if (c == '%' && i + 2 < s.size()) {
            int hi = detail::hexDigit(s[i + 1]);
            int lo = detail::hexDigit(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += c;
    }
    return out;
}

/**
 * @brief Percent-encode everything outside the RFC 3986 unreserved set
 * @param keep Extra ASCII characters passed through unchanged
 */
[[nodiscard]] inline std::string urlEncode(std::string_view s, std::string_view keep = {}) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        bool plain = c < 0x80 && (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
                                  keep.find(static_cast<char>(c)) != std::string_view::npos);
        if (plain) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

/// Whole-string integer parse; nullopt on any trailing text or overflow
template<typename T = int>
[[nodiscard]] std::optional<T> toInt(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    T value{};
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || end != s.data() + s.size()) return std::nullopt;
    return value;
}

} // namespace string_utils
} // namespace mailbeacon

#endif // MAILBEACON_STRING_UTILS_HPP
