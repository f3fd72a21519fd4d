/**
 * CivilDate.h - Calendar dates for refresh-window arithmetic
 *
 * Records carry dates as "YYYY-MM-DD" strings. Refresh windows are
 * measured in whole days against the current UTC calendar date.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    static std::optional<CivilDate> parse(const std::string& iso);
    static CivilDate today_utc();
    static CivilDate from_days(int64_t days);

    // Days since 1970-01-01
    int64_t to_days() const;

    CivilDate minus_days(int days) const { return from_days(to_days() - days); }

    std::string to_string() const;
    // DD/MM/YYYY, as written into run logs
    std::string to_log_string() const;

    bool operator==(const CivilDate& other) const { return to_days() == other.to_days(); }
    bool operator!=(const CivilDate& other) const { return !(*this == other); }
    bool operator<(const CivilDate& other) const { return to_days() < other.to_days(); }
    bool operator<=(const CivilDate& other) const { return to_days() <= other.to_days(); }
};
