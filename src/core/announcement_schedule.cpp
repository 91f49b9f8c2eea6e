#include "core/announcement_schedule.hpp"
#include "core/time_utils.hpp"
#include "logging/logger.hpp"
#include <Poco/NumberParser.h>
#include <Poco/String.h>
#include <cstdio>

namespace
{
    const std::string kCustomPrefix = "custom:";

    bool parseBoundedInt(const std::string &text, int low, int high, int &value)
    {
        if (text.empty() || text.size() > 2)
            return false;
        for (char c : text)
        {
            if (c < '0' || c > '9')
                return false;
        }
        return Poco::NumberParser::tryParse(text, value) && value >= low && value <= high;
    }
}

std::optional<TimeOfDay> parseTimeOfDay(const std::string &text)
{
    const std::string trimmed = Poco::trim(text);
    const auto colon = trimmed.find(':');
    if (colon == std::string::npos)
    {
        return std::nullopt;
    }

    TimeOfDay time;
    if (!parseBoundedInt(trimmed.substr(0, colon), 0, 23, time.hour) ||
        !parseBoundedInt(trimmed.substr(colon + 1), 0, 59, time.minute))
    {
        return std::nullopt;
    }
    return time;
}

std::optional<AnnouncementEvent> nextAnnouncement(const std::map<std::string, std::string> &schedule,
                                                  std::chrono::system_clock::time_point now)
{
    std::optional<AnnouncementEvent> next;

    for (const auto &[time_key, type] : schedule)
    {
        auto time = parseTimeOfDay(time_key);
        if (!time)
        {
            Logger::warn("Invalid time format in configuration: " + time_key);
            continue;
        }

        auto when = time_utils::atLocalTime(now, time->hour, time->minute);
        if (when <= now)
        {
            // Already passed today
            when = time_utils::atLocalTime(now, time->hour, time->minute, 1);
        }

        if (!next || when < next->time)
        {
            char buffer[8];
            std::snprintf(buffer, sizeof(buffer), "%02d:%02d", time->hour, time->minute);
            next = AnnouncementEvent{when, type, buffer};
        }
    }

    return next;
}

std::string convertTo12Hour(const std::string &time_24h)
{
    auto time = parseTimeOfDay(time_24h);
    if (!time)
    {
        Logger::error("Error converting time format: " + time_24h);
        return time_24h;
    }

    const char *period = time->hour >= 12 ? "PM" : "AM";
    int hour = time->hour;
    if (hour > 12)
        hour -= 12;
    else if (hour == 0)
        hour = 12;

    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%d:%02d %s", hour, time->minute, period);
    return buffer;
}

std::string templateKeyForType(const std::string &type)
{
    if (type.compare(0, kCustomPrefix.size(), kCustomPrefix) == 0)
    {
        return "custom_" + Poco::toLower(type.substr(kCustomPrefix.size()));
    }
    if (type == ":55" || type == "fiftyfive")
        return "fiftyfive";
    if (type == "hour" || type == "rules" || type == "ad")
        return type;
    return "hour";
}
