#include "esflow/core/clock.hpp"

#include <cstdio>
#include <ctime>

namespace esflow {

Timestamp now_utc() noexcept {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

std::string format_timestamp(Timestamp ts) {
    auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()
    ).count();
    auto seconds = static_cast<std::time_t>(ms_total / 1000);
    auto millis = static_cast<int>(ms_total % 1000);
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buffer;
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    std::string input(text);
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
    int consumed = 0;

    int fields = std::sscanf(input.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ%n",
                             &year, &month, &day, &hour, &minute, &second, &millis, &consumed);
    if (fields != 7) {
        // Accept second precision as well
        consumed = 0;
        millis = 0;
        fields = std::sscanf(input.c_str(), "%4d-%2d-%2dT%2d:%2d:%2dZ%n",
                             &year, &month, &day, &hour, &minute, &second, &consumed);
        if (fields != 6) {
            return std::nullopt;
        }
    }
    if (consumed != static_cast<int>(input.size())) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60 || millis < 0 || millis > 999) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    std::time_t seconds = timegm(&tm);
    return Timestamp(std::chrono::seconds(seconds)) + std::chrono::milliseconds(millis);
}

} // namespace esflow
