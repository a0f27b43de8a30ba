#pragma once
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/format.h>

#include "types/cell.hpp"
#include "util/text.hpp"

namespace tabprof {

// Canonical instant: microseconds since 1970-01-01 00:00:00 UTC (no zone conversion).
using instant_us = std::int64_t;

constexpr std::int64_t us_per_second = 1000000;
constexpr std::int64_t us_per_day    = 86400 * us_per_second;

// ---------- civil calendar helpers ----------
inline std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct civil_date { std::int64_t year; unsigned month; unsigned day; };

inline civil_date civil_from_days(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return civil_date{ y + (m <= 2), m, d };
}

inline bool is_leap(std::int64_t y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

inline unsigned days_in_month(std::int64_t y, unsigned m) {
    static const unsigned k[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29u : k[m - 1];
}

inline std::optional<instant_us> to_instant(const std::tm& tm, std::int64_t micros) {
    const std::int64_t y = static_cast<std::int64_t>(tm.tm_year) + 1900;
    const int m = tm.tm_mon + 1;
    if (m < 1 || m > 12) return std::nullopt;
    if (tm.tm_mday < 1 || static_cast<unsigned>(tm.tm_mday) > days_in_month(y, static_cast<unsigned>(m)))
        return std::nullopt;
    if (tm.tm_hour < 0 || tm.tm_hour > 23 || tm.tm_min < 0 || tm.tm_min > 59 ||
        tm.tm_sec < 0 || tm.tm_sec > 59)
        return std::nullopt;
    const std::int64_t days = days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(tm.tm_mday));
    const std::int64_t secs = tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec;
    return days * us_per_day + secs * us_per_second + micros;
}

// ---------- parsing ----------
// Tries each strftime-style format in order; the whole (trimmed) text must be consumed.
// Accepts an optional ".ffffff" fraction and a trailing 'Z' after the formatted part.
inline std::optional<instant_us> parse_datetime(std::string_view s,
                                                const std::vector<std::string>& fmts) {
    const std::string text = trim(s);
    if (text.empty()) return std::nullopt;
    for (const auto& fmt : fmts) {
        std::tm tm{};
        std::istringstream iss(text);
        iss >> std::get_time(&tm, fmt.c_str());
        if (iss.fail()) continue;

        std::int64_t micros = 0;
        if (iss.peek() == '.') {
            iss.get();
            std::int64_t scale = 100000;
            int digits = 0;
            while (std::isdigit(iss.peek())) {
                const int d = iss.get() - '0';
                if (digits < 6) micros += d * scale;
                scale /= 10;
                ++digits;
            }
            if (digits == 0) continue;
        }
        if (iss.peek() == 'Z') iss.get();
        if (iss.peek() != std::char_traits<char>::eof()) continue;

        if (auto v = to_instant(tm, micros)) return v;
    }
    return std::nullopt;
}

// Only textual cells carry dates; numbers and booleans never parse as datetimes.
inline std::optional<instant_us> parse_datetime(const cell& c, const std::vector<std::string>& fmts) {
    if (const auto* s = std::get_if<std::string>(&c)) return parse_datetime(std::string_view(*s), fmts);
    return std::nullopt;
}

// ---------- formatting ----------
// "YYYY-MM-DD HH:MM:SS", with ".ffffff" appended when the fraction is non-zero
// or when always_fraction is set.
inline std::string format_instant(instant_us t, bool always_fraction = false) {
    std::int64_t days = t / us_per_day;
    std::int64_t rem  = t % us_per_day;
    if (rem < 0) { rem += us_per_day; --days; }
    const civil_date cd = civil_from_days(days);
    const std::int64_t secs   = rem / us_per_second;
    const std::int64_t micros = rem % us_per_second;
    std::string out = fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                                  cd.year, cd.month, cd.day,
                                  secs / 3600, (secs / 60) % 60, secs % 60);
    if (micros != 0 || always_fraction) out += fmt::format(".{:06}", micros);
    return out;
}

inline const std::vector<std::string>& canonical_datetime_formats() {
    static const std::vector<std::string> k{"%Y-%m-%d %H:%M:%S"};
    return k;
}

inline std::optional<instant_us> parse_instant(std::string_view s) {
    return parse_datetime(s, canonical_datetime_formats());
}

}
