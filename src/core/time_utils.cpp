#include "core/time_utils.hpp"
#include <ctime>

namespace time_utils
{
    TimePoint atLocalTime(TimePoint day, int hour, int minute, int day_offset)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(day);
        std::tm local{};
        localtime_r(&t, &local);

        local.tm_mday += day_offset;
        local.tm_hour = hour;
        local.tm_min = minute;
        local.tm_sec = 0;
        local.tm_isdst = -1; // let mktime work out DST for the target day

        return std::chrono::system_clock::from_time_t(std::mktime(&local));
    }

    std::string formatLocalTime(TimePoint when, const char *format)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(when);
        std::tm local{};
        localtime_r(&t, &local);

        char buffer[64];
        size_t n = std::strftime(buffer, sizeof(buffer), format, &local);
        return std::string(buffer, n);
    }

    long long secondsBetween(TimePoint from, TimePoint to)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
    }
}
