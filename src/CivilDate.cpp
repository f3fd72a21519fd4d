/**
 * CivilDate.cpp - Implementation
 */

#include "tmdbsync/CivilDate.h"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace {
    bool is_leap(int y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    int days_in_month(int y, int m) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && is_leap(y)) return 29;
        return days[m - 1];
    }
}

std::optional<CivilDate> CivilDate::parse(const std::string& iso) {
    // Strict YYYY-MM-DD
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
        return std::nullopt;
    }
    for (size_t i = 0; i < iso.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (iso[i] < '0' || iso[i] > '9') return std::nullopt;
    }

    CivilDate date;
    date.year = std::stoi(iso.substr(0, 4));
    date.month = std::stoi(iso.substr(5, 2));
    date.day = std::stoi(iso.substr(8, 2));

    if (date.month < 1 || date.month > 12) return std::nullopt;
    if (date.day < 1 || date.day > days_in_month(date.year, date.month)) return std::nullopt;
    return date;
}

CivilDate CivilDate::today_utc() {
    auto now = std::chrono::system_clock::now();
    std::time_t t_now = std::chrono::system_clock::to_time_t(now);
    std::tm utc_tm;
    gmtime_r(&t_now, &utc_tm);

    CivilDate date;
    date.year = utc_tm.tm_year + 1900;
    date.month = utc_tm.tm_mon + 1;
    date.day = utc_tm.tm_mday;
    return date;
}

int64_t CivilDate::to_days() const {
    // Howard Hinnant's days_from_civil
    int64_t y = year;
    const unsigned m = static_cast<unsigned>(month);
    const unsigned d = static_cast<unsigned>(day);
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate CivilDate::from_days(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;

    CivilDate date;
    date.year = static_cast<int>(y + (m <= 2));
    date.month = static_cast<int>(m);
    date.day = static_cast<int>(d);
    return date;
}

std::string CivilDate::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::string CivilDate::to_log_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d", day, month, year);
    return buf;
}
