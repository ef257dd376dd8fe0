#pragma once

#include <chrono>
#include <cmath>
#include <ctime>
#include <format>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace itinera::helpers {

// Calendar date and wall-clock timestamp in the destination's local time.
// No time zone is attached; the whole itinerary lives in one local frame.
using date = std::chrono::sys_days;
using timestamp = std::chrono::sys_seconds;

namespace time_helper {

    inline date today() {
        return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    }

    inline std::optional<std::tm> parse_tm(std::string_view text, const char* format) {
        std::tm tm = {};
        std::istringstream ss{std::string(text)};
        ss >> std::get_time(&tm, format);
        if (ss.fail()) {
            return std::nullopt;
        }
        return tm;
    }

    inline std::optional<date> date_from_tm(const std::tm& tm) {
        std::chrono::year_month_day ymd{
            std::chrono::year{tm.tm_year + 1900},
            std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
            std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
        if (!ymd.ok()) {
            return std::nullopt;
        }
        return date{ymd};
    }

    // Parse "YYYY-MM-DD"
    inline date parse_date(std::string_view text) {
        auto tm = parse_tm(text, "%Y-%m-%d");
        auto d = tm ? date_from_tm(*tm) : std::nullopt;
        if (!d) {
            throw std::invalid_argument(std::format("Invalid date '{}', expected YYYY-MM-DD", text));
        }
        return *d;
    }

    // Parse "HH:MM" or "HH:MM:SS" into an offset from midnight
    inline std::optional<std::chrono::minutes> parse_clock_time(std::string_view text) {
        auto tm = parse_tm(text, "%H:%M");
        if (!tm || tm->tm_hour < 0 || tm->tm_hour > 23 || tm->tm_min < 0 || tm->tm_min > 59) {
            return std::nullopt;
        }
        return std::chrono::hours{tm->tm_hour} + std::chrono::minutes{tm->tm_min};
    }

    // Parse "YYYY-MM-DDTHH:MM" (a space instead of 'T' is accepted too)
    inline timestamp parse_timestamp(std::string_view text) {
        auto tm = parse_tm(text, "%Y-%m-%dT%H:%M");
        if (!tm) {
            tm = parse_tm(text, "%Y-%m-%d %H:%M");
        }
        auto d = tm ? date_from_tm(*tm) : std::nullopt;
        if (!d) {
            throw std::invalid_argument(std::format("Invalid timestamp '{}', expected YYYY-MM-DDTHH:MM", text));
        }
        return timestamp{*d} + std::chrono::hours{tm->tm_hour} + std::chrono::minutes{tm->tm_min};
    }

    inline timestamp at(date d, std::chrono::minutes time_of_day) {
        return timestamp{d} + time_of_day;
    }

    inline date date_of(timestamp t) {
        return std::chrono::floor<std::chrono::days>(t);
    }

    inline std::chrono::seconds hours(double h) {
        return std::chrono::seconds{std::llround(h * 3600.0)};
    }

    inline std::string format_date(date d) {
        return std::format("{:%Y-%m-%d}", d);
    }

    inline std::string format_timestamp(timestamp t) {
        return std::format("{:%Y-%m-%dT%H:%M}", std::chrono::floor<std::chrono::minutes>(t));
    }
}

} // namespace itinera::helpers
