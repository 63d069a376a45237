/**
 * @file beacon_time_utils.hpp
 * @brief Time and date utilities for MailBeacon
 * @author Bennie Shearer
 * @version 1.0.0
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * This header provides:
 * - Injectable clock type
 * - UTC ISO 8601 formatting with microsecond precision
 * - ISO 8601 parsing for stored event timestamps
 */

#ifndef MAILBEACON_TIME_UTILS_HPP
#define MAILBEACON_TIME_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace mailbeacon {
namespace time_utils {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;
using Microseconds = std::chrono::microseconds;
using Minutes = std::chrono::minutes;

/// Source of "now" for components that stamp or compare event times
using ClockFn = std::function<TimePoint()>;

[[nodiscard]] inline TimePoint now() noexcept {
    return Clock::now();
}

[[nodiscard]] inline ClockFn systemClock() {
    return [] { return Clock::now(); };
}

namespace detail {

// Days since 1970-01-01 for a proleptic Gregorian date
[[nodiscard]] constexpr int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

[[nodiscard]] constexpr bool isLeap(int64_t y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

[[nodiscard]] constexpr unsigned daysInMonth(int64_t y, unsigned m) noexcept {
    constexpr unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeap(y)) ? 29 : table[m - 1];
}

[[nodiscard]] inline bool readDigits(std::string_view s, std::size_t& pos, std::size_t count,
                                     int64_t& out) noexcept {
    if (pos + count > s.size()) return false;
    int64_t value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

} // namespace detail

/**
 * @brief Format a time point as UTC ISO 8601 with microseconds and a Z suffix
 * @return e.g. 2025-01-06T12:00:00.123456Z
 */
[[nodiscard]] inline std::string toISO8601Micros(TimePoint tp) {
    auto us = std::chrono::duration_cast<Microseconds>(tp.time_since_epoch()).count();
    int64_t secs = us / 1000000;
    int64_t frac = us % 1000000;
    if (frac < 0) {
        frac += 1000000;
        --secs;
    }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(6) << frac << 'Z';
    return oss.str();
}

/**
 * @brief Parse an ISO 8601 timestamp
 *
 * Accepts YYYY-MM-DD[T| ]HH:MM[:SS[.fraction]] followed by an optional
 * Z or +HH:MM / -HH:MM offset. A missing offset is read as UTC.
 * @return Time point, or nullopt when the text is not a valid timestamp
 */
[[nodiscard]] inline std::optional<TimePoint> parseISO8601(std::string_view s) noexcept {
    std::size_t pos = 0;
    int64_t year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!detail::readDigits(s, pos, 4, year)) return std::nullopt;
    if (pos >= s.size() || s[pos++] != '-') return std::nullopt;
    if (!detail::readDigits(s, pos, 2, month)) return std::nullopt;
    if (pos >= s.size() || s[pos++] != '-') return std::nullopt;
    if (!detail::readDigits(s, pos, 2, day)) return std::nullopt;
    if (pos >= s.size() || (s[pos] != 'T' && s[pos] != ' ')) return std::nullopt;
    ++pos;
    if (!detail::readDigits(s, pos, 2, hour)) return std::nullopt;
    if (pos >= s.size() || s[pos++] != ':') return std::nullopt;
    if (!detail::readDigits(s, pos, 2, minute)) return std::nullopt;

    int64_t micros = 0;
    if (pos < s.size() && s[pos] == ':') {
        ++pos;
        if (!detail::readDigits(s, pos, 2, second)) return std::nullopt;
        if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
            ++pos;
            std::size_t digits = 0;
            int64_t scale = 100000;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                if (digits < 6) {
                    micros += (s[pos] - '0') * scale;
                    scale /= 10;
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) return std::nullopt;
        }
    }

    int64_t offsetMinutes = 0;
    if (pos < s.size()) {
        char c = s[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            ++pos;
            int64_t oh = 0, om = 0;
            if (!detail::readDigits(s, pos, 2, oh)) return std::nullopt;
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (!detail::readDigits(s, pos, 2, om)) return std::nullopt;
            if (oh > 23 || om > 59) return std::nullopt;
            offsetMinutes = (oh * 60 + om) * (c == '-' ? -1 : 1);
        }
    }
    if (pos != s.size()) return std::nullopt;

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > detail::daysInMonth(year, static_cast<unsigned>(month))) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    int64_t days = detail::daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offsetMinutes * 60;
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        Seconds(secs) + Microseconds(micros)));
}

} // namespace time_utils
} // namespace mailbeacon

#endif // MAILBEACON_TIME_UTILS_HPP
