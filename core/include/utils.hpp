#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Local wall-clock "YYYY-MM-DD HH:MM:SS"
    std::string timestampToString(const Timestamp& ts);

    // ISO 8601 with mandatory offset or 'Z', e.g. 2026-01-08T15:55:00-05:00
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Backend bar dates: "2026-01-08", "2026-01-08 15:55:00", "2026-01-08T15:55".
    // No offset means local wall-clock time; an offset or 'Z' is honoured.
    // Throws core::ParseException.
    Timestamp parseBarDate(const std::string& date_str);

    // --- Local calendar arithmetic (normalised like mktime, so Mar 31 - 1 month = Mar 3) ---
    Timestamp makeLocalTime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
    Timestamp startOfDay(const Timestamp& ts);
    Timestamp startOfYear(const Timestamp& ts);
    Timestamp addCalendarDays(const Timestamp& ts, int days);
    Timestamp addCalendarMonths(const Timestamp& ts, int months);
    Timestamp addCalendarYears(const Timestamp& ts, int years);

} // namespace utils
} // namespace core
