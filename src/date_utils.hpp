#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// Calendar utilities for integer YYYYMMDD trading dates
// ---------------------------------------------------------------------------
namespace date_utils {

constexpr int DAYS_PER_WEEK = 7;
// 1970-01-01 was a Thursday; weekday() counts Monday as 0.
constexpr int EPOCH_WEEKDAY = 3;

inline int year_of(int date) { return date / 10000; }
inline int month_of(int date) { return (date / 100) % 100; }
inline int day_of(int date) { return date % 100; }
inline int quarter_of(int date) { return (month_of(date) - 1) / 3 + 1; }

inline bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline int days_in_month(int y, int m) {
    static constexpr int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return DAYS[m - 1];
}

inline bool is_valid_date(int date) {
    int y = year_of(date), m = month_of(date), d = day_of(date);
    if (y < 1 || y > 9999) return false;
    if (m < 1 || m > 12) return false;
    return d >= 1 && d <= days_in_month(y, m);
}

// Days since 1970-01-01 (proleptic Gregorian). Howard Hinnant's algorithm.
inline int64_t days_from_civil(int date) {
    int64_t y = year_of(date);
    int64_t m = month_of(date);
    int64_t d = day_of(date);
    y -= (m <= 2) ? 1 : 0;
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

inline int civil_from_days(int64_t z) {
    z += 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp + (mp < 10 ? 3 : -9);
    y += (m <= 2) ? 1 : 0;
    return static_cast<int>(y * 10000 + m * 100 + d);
}

inline int add_days(int date, int days) {
    return civil_from_days(days_from_civil(date) + days);
}

// 0 = Monday ... 6 = Sunday
inline int weekday(int date) {
    int64_t days = days_from_civil(date);
    int64_t wd = (days + EPOCH_WEEKDAY) % DAYS_PER_WEEK;
    if (wd < 0) wd += DAYS_PER_WEEK;
    return static_cast<int>(wd);
}

// Monotonic index of the Monday-start week containing `date`.
inline int64_t iso_week_index(int date) {
    int64_t monday = days_from_civil(date) - weekday(date);
    int64_t idx = monday / DAYS_PER_WEEK;
    if (monday < 0 && monday % DAYS_PER_WEEK != 0) idx -= 1;
    return idx;
}

// Accepts "YYYY-MM-DD" or "YYYYMMDD". Returns 0 when the text is not a date.
inline int parse_date(const std::string& text) {
    int y = 0, m = 0, d = 0;
    if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
        for (size_t i = 0; i < text.size(); ++i) {
            if (i == 4 || i == 7) continue;
            if (text[i] < '0' || text[i] > '9') return 0;
        }
        y = std::stoi(text.substr(0, 4));
        m = std::stoi(text.substr(5, 2));
        d = std::stoi(text.substr(8, 2));
    } else if (text.size() == 8) {
        for (char c : text) {
            if (c < '0' || c > '9') return 0;
        }
        int v = std::stoi(text);
        y = v / 10000;
        m = (v / 100) % 100;
        d = v % 100;
    } else {
        return 0;
    }
    int date = y * 10000 + m * 100 + d;
    return is_valid_date(date) ? date : 0;
}

inline std::string format_date(int date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  year_of(date), month_of(date), day_of(date));
    return buf;
}

}  // namespace date_utils
