#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <cmath>      // For std::pow
#include <cctype>     // For std::isdigit
#include <ctime>      // For mktime, localtime_r, timegm

namespace core {
namespace utils {

    namespace {

        std::tm toLocalTm(const Timestamp& ts) {
            std::time_t tt = std::chrono::system_clock::to_time_t(ts);
            std::tm local_tm = {};
            #ifdef _WIN32
                localtime_s(&local_tm, &tt);
            #else
                localtime_r(&tt, &local_tm);
            #endif
            return local_tm;
        }

        // mktime normalises out-of-range fields (month 13, day 0...) which is what
        // the calendar arithmetic below relies on.
        Timestamp fromLocalTm(std::tm local_tm) {
            local_tm.tm_isdst = -1; // Let the C library work out DST
            std::time_t tt = std::mktime(&local_tm);
            if (tt == static_cast<std::time_t>(-1)) {
                throw ParseException("Failed to convert local calendar time to epoch seconds");
            }
            return std::chrono::system_clock::from_time_t(tt);
        }

    } // namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw ParseException("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                    throw ParseException("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw ParseException("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        } else {
            throw ParseException("Timestamp missing timezone offset/indicator: " + iso_string);
        }

        // 4. tm is UTC figures here; the offset is applied afterwards
        #ifdef _WIN32
            std::time_t tt = _mkgmtime(&tm);
        #else
            std::time_t tt = timegm(&tm);
        #endif
        if (tt == static_cast<std::time_t>(-1)) {
            throw ParseException("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2026-01-08T10:00:00-05:00 is 15:00Z, so subtract the offset
        return base_tp_utc - offset_duration;
    }

    Timestamp parseBarDate(const std::string& date_str) {
        if (date_str.size() < 10) {
            throw ParseException("Bar date too short: '" + date_str + "'");
        }

        std::string normalized = date_str;
        if (normalized.size() > 10 && normalized[10] == ' ') {
            normalized[10] = 'T';
        }

        // Anything carrying an explicit offset goes through the ISO parser
        if (normalized.size() > 11 && normalized.find_first_of("Z+-", 11) != std::string::npos) {
            return stringToTimestamp(normalized);
        }

        std::tm tm = {};
        std::istringstream ss(normalized);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw ParseException("Failed to parse bar date: '" + date_str + "'");
        }

        if (ss.peek() == 'T') {
            ss.ignore();
            ss >> std::get_time(&tm, "%H:%M");
            if (ss.fail()) {
                throw ParseException("Failed to parse bar time of day: '" + date_str + "'");
            }
            if (ss.peek() == ':') {
                ss.ignore();
                int seconds = 0;
                if (!(ss >> seconds) || seconds < 0 || seconds > 60) {
                    throw ParseException("Failed to parse bar seconds: '" + date_str + "'");
                }
                tm.tm_sec = seconds;
            }
            // Sub-second precision is irrelevant for 5-minute bars
        }

        return fromLocalTm(tm);
    }

    std::string timestampToString(const Timestamp& ts) {
        std::tm local_tm = toLocalTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    Timestamp makeLocalTime(int year, int month, int day, int hour, int minute, int second) {
        std::tm tm = {};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        return fromLocalTm(tm);
    }

    Timestamp startOfDay(const Timestamp& ts) {
        std::tm tm = toLocalTm(ts);
        tm.tm_hour = 0;
        tm.tm_min = 0;
        tm.tm_sec = 0;
        return fromLocalTm(tm);
    }

    Timestamp startOfYear(const Timestamp& ts) {
        std::tm tm = toLocalTm(ts);
        tm.tm_mon = 0;
        tm.tm_mday = 1;
        tm.tm_hour = 0;
        tm.tm_min = 0;
        tm.tm_sec = 0;
        return fromLocalTm(tm);
    }

    Timestamp addCalendarDays(const Timestamp& ts, int days) {
        std::tm tm = toLocalTm(ts);
        tm.tm_mday += days;
        return fromLocalTm(tm);
    }

    Timestamp addCalendarMonths(const Timestamp& ts, int months) {
        std::tm tm = toLocalTm(ts);
        tm.tm_mon += months;
        return fromLocalTm(tm);
    }

    Timestamp addCalendarYears(const Timestamp& ts, int years) {
        std::tm tm = toLocalTm(ts);
        tm.tm_year += years;
        return fromLocalTm(tm);
    }

} // namespace utils
} // namespace core
