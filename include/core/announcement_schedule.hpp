#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

struct TimeOfDay
{
    int hour = 0;
    int minute = 0;
};

/**
 * @brief The next (time, type) pair due to fire.
 */
struct AnnouncementEvent
{
    std::chrono::system_clock::time_point time;
    std::string type;
    std::string time_of_day; // "HH:MM", 24-hour
};

// "H:MM" or "HH:MM" with hour 0-23 and minute 0-59
std::optional<TimeOfDay> parseTimeOfDay(const std::string &text);

/**
 * @brief Earliest upcoming event of a schedule.
 *
 * Every entry is projected onto today at its time of day, or onto tomorrow when
 * today's projection is not strictly after now. Malformed times are skipped
 * with a warning. Equal timestamps keep the first entry in key order.
 * Returns std::nullopt when no entry is valid.
 */
std::optional<AnnouncementEvent> nextAnnouncement(const std::map<std::string, std::string> &schedule,
                                                  std::chrono::system_clock::time_point now);

// "13:05" -> "1:05 PM"; malformed input is returned unchanged
std::string convertTo12Hour(const std::string &time_24h);

// Announcement type tag -> template key ("custom:Foo" -> "custom_foo", unknown -> "hour")
std::string templateKeyForType(const std::string &type);
