#pragma once

#include <chrono>
#include <string>

namespace time_utils
{
    using TimePoint = std::chrono::system_clock::time_point;

    // hour:minute:00 local time on the calendar day of `day`, offset by day_offset days
    TimePoint atLocalTime(TimePoint day, int hour, int minute, int day_offset = 0);

    // strftime() of the local time
    std::string formatLocalTime(TimePoint when, const char *format = "%Y-%m-%d %H:%M:%S");

    // Whole seconds, rounded towards zero
    long long secondsBetween(TimePoint from, TimePoint to);
}
