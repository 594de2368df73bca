#pragma once

/**
 * Time utilities
 *
 * All persisted timestamps are milliseconds since Unix epoch (UTC).
 * Text form is ISO-8601 with an explicit +00:00 offset; the fractional
 * part is omitted when the timestamp falls on a whole second.
 */

#include "../types.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>

namespace tradegate {
namespace util {

constexpr int64_t MS_PER_SECOND = 1000;
constexpr int64_t MS_PER_MINUTE = 60 * MS_PER_SECOND;
constexpr int64_t MS_PER_HOUR = 60 * MS_PER_MINUTE;
constexpr int64_t MS_PER_DAY = 24 * MS_PER_HOUR;

/**
 * Returns current time in nanoseconds since steady_clock epoch.
 * Monotonic; use for durations only.
 */
inline uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

/**
 * Returns current wall-clock time in milliseconds since Unix epoch.
 */
inline Timestamp wall_clock_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

inline Timestamp seconds_to_ms(double seconds) {
    return static_cast<Timestamp>(seconds * 1000.0);
}

// Floor division so pre-1970 timestamps land on the right second
inline int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
        --q;
    return q;
}

/**
 * Format as "YYYY-MM-DDTHH:MM:SS[.ffffff]+00:00"
 */
inline std::string format_iso8601(Timestamp ts_ms) {
    int64_t secs = floor_div(ts_ms, MS_PER_SECOND);
    int64_t frac_ms = ts_ms - secs * MS_PER_SECOND;
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[48];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buf);
    if (frac_ms != 0) {
        char frac[16];
        std::snprintf(frac, sizeof(frac), ".%03lld000", static_cast<long long>(frac_ms));
        out += frac;
    }
    out += "+00:00";
    return out;
}

/**
 * UTC calendar day "YYYY-MM-DD"
 */
inline std::string utc_day(Timestamp ts_ms) {
    std::time_t t = static_cast<std::time_t>(floor_div(ts_ms, MS_PER_SECOND));
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

/**
 * Start of the UTC day containing ts_ms
 */
inline Timestamp utc_day_start(Timestamp ts_ms) {
    return floor_div(ts_ms, MS_PER_DAY) * MS_PER_DAY;
}

/**
 * Parse ISO-8601 text.
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.fff...]]" with 'T' or ' ' separator,
 * and an optional "Z" or "+HH:MM"/"-HH:MM" offset. No offset means UTC.
 */
inline std::optional<Timestamp> parse_iso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;

    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3)
        return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > 31)
        return std::nullopt;

    size_t pos = static_cast<size_t>(consumed);
    int64_t frac_ms = 0;
    int offset_minutes = 0;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        int n = 0;
        if (std::sscanf(text.c_str() + pos, "%2d:%2d%n", &hour, &minute, &n) != 2)
            return std::nullopt;
        pos += static_cast<size_t>(n);
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (std::sscanf(text.c_str() + pos, "%2d%n", &second, &n) != 1)
                return std::nullopt;
            pos += static_cast<size_t>(n);
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int digits = 0;
            int64_t scale = 100;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (digits < 3) {
                    frac_ms += (text[pos] - '0') * scale;
                    scale /= 10;
                }
                ++digits;
                ++pos;
            }
            if (digits == 0)
                return std::nullopt;
        }
        if (pos < text.size()) {
            char c = text[pos];
            if (c == 'Z' || c == 'z') {
                ++pos;
            } else if (c == '+' || c == '-') {
                int oh = 0, om = 0;
                if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d%n", &oh, &om, &n) != 2)
                    return std::nullopt;
                offset_minutes = (oh * 60 + om) * (c == '+' ? 1 : -1);
                pos += 1 + static_cast<size_t>(n);
            }
        }
    }
    if (pos != text.size())
        return std::nullopt;
    if (hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    int64_t secs = static_cast<int64_t>(timegm(&tm));
    return secs * MS_PER_SECOND + frac_ms - static_cast<int64_t>(offset_minutes) * MS_PER_MINUTE;
}

}  // namespace util
}  // namespace tradegate
