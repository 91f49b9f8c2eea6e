#include "test_base.hpp"
#include "core/announcement_schedule.hpp"
#include "core/time_utils.hpp"

namespace
{
    std::chrono::system_clock::time_point today(int hour, int minute, int second = 0)
    {
        return time_utils::atLocalTime(std::chrono::system_clock::now(), hour, minute) + std::chrono::seconds(second);
    }
}

class AnnouncementScheduleTest : public TempDirTest
{
};

TEST_F(AnnouncementScheduleTest, ParsesValidTimes)
{
    auto t = parseTimeOfDay("07:05");
    ASSERT_TRUE(t);
    EXPECT_EQ(t->hour, 7);
    EXPECT_EQ(t->minute, 5);

    auto short_hour = parseTimeOfDay("7:05");
    ASSERT_TRUE(short_hour);
    EXPECT_EQ(short_hour->hour, 7);

    EXPECT_TRUE(parseTimeOfDay("00:00"));
    EXPECT_TRUE(parseTimeOfDay("23:59"));
}

TEST_F(AnnouncementScheduleTest, RejectsMalformedTimes)
{
    EXPECT_FALSE(parseTimeOfDay("24:00"));
    EXPECT_FALSE(parseTimeOfDay("12:60"));
    EXPECT_FALSE(parseTimeOfDay("noon"));
    EXPECT_FALSE(parseTimeOfDay("1200"));
    EXPECT_FALSE(parseTimeOfDay("12:5x"));
    EXPECT_FALSE(parseTimeOfDay("-1:30"));
    EXPECT_FALSE(parseTimeOfDay(""));
}

TEST_F(AnnouncementScheduleTest, PicksNextEntryLaterToday)
{
    std::map<std::string, std::string> schedule = {{"13:00", "hour"}, {"15:00", "rules"}};
    auto next = nextAnnouncement(schedule, today(14, 0));
    ASSERT_TRUE(next);
    EXPECT_EQ(next->type, "rules");
    EXPECT_EQ(next->time, today(15, 0));
    EXPECT_EQ(next->time_of_day, "15:00");
}

TEST_F(AnnouncementScheduleTest, PassedEntryMovesToTomorrow)
{
    std::map<std::string, std::string> schedule = {{"14:00", "hour"}};

    auto at_13 = nextAnnouncement(schedule, today(13, 0));
    ASSERT_TRUE(at_13);
    EXPECT_EQ(at_13->time, today(14, 0));

    auto at_15 = nextAnnouncement(schedule, today(15, 0));
    ASSERT_TRUE(at_15);
    EXPECT_EQ(at_15->time, time_utils::atLocalTime(today(15, 0), 14, 0, 1));
}

TEST_F(AnnouncementScheduleTest, EntryAtExactlyNowIsNotNext)
{
    std::map<std::string, std::string> schedule = {{"14:00", "hour"}, {"14:30", "ad"}};
    auto next = nextAnnouncement(schedule, today(14, 0));
    ASSERT_TRUE(next);
    EXPECT_EQ(next->type, "ad");
}

TEST_F(AnnouncementScheduleTest, NextIsMinimumAndStrictlyInFuture)
{
    std::map<std::string, std::string> schedule = {
        {"06:00", "hour"}, {"09:15", "rules"}, {"12:55", ":55"}, {"18:40", "ad"}, {"23:59", "hour"}};

    for (int hour = 0; hour < 24; ++hour)
    {
        const auto now = today(hour, 20, 30);
        auto next = nextAnnouncement(schedule, now);
        ASSERT_TRUE(next);
        EXPECT_GT(next->time, now);
        for (const auto &[key, type] : schedule)
        {
            auto t = parseTimeOfDay(key);
            auto candidate = time_utils::atLocalTime(now, t->hour, t->minute);
            if (candidate <= now)
                candidate = time_utils::atLocalTime(now, t->hour, t->minute, 1);
            EXPECT_LE(next->time, candidate);
        }
    }
}

TEST_F(AnnouncementScheduleTest, MalformedEntriesAreSkipped)
{
    std::map<std::string, std::string> schedule = {{"25:00", "hour"}, {"lunch", "ad"}, {"16:00", "rules"}};
    auto next = nextAnnouncement(schedule, today(10, 0));
    ASSERT_TRUE(next);
    EXPECT_EQ(next->type, "rules");
}

TEST_F(AnnouncementScheduleTest, NoValidEntriesMeansNoEvent)
{
    EXPECT_FALSE(nextAnnouncement({}, today(10, 0)));
    EXPECT_FALSE(nextAnnouncement({{"99:99", "hour"}}, today(10, 0)));
}

TEST_F(AnnouncementScheduleTest, EqualTimesKeepFirstKey)
{
    std::map<std::string, std::string> schedule = {{"08:00", "hour"}, {"8:00", "ad"}};
    auto next = nextAnnouncement(schedule, today(7, 0));
    ASSERT_TRUE(next);
    EXPECT_EQ(next->type, "hour");
}

TEST_F(AnnouncementScheduleTest, ConvertsTo12HourClock)
{
    EXPECT_EQ(convertTo12Hour("00:00"), "12:00 AM");
    EXPECT_EQ(convertTo12Hour("09:30"), "9:30 AM");
    EXPECT_EQ(convertTo12Hour("12:00"), "12:00 PM");
    EXPECT_EQ(convertTo12Hour("13:05"), "1:05 PM");
    EXPECT_EQ(convertTo12Hour("23:59"), "11:59 PM");
}

TEST_F(AnnouncementScheduleTest, MalformedTimeIsReturnedUnchanged)
{
    EXPECT_EQ(convertTo12Hour("late"), "late");
    EXPECT_EQ(convertTo12Hour("25:00"), "25:00");
}

TEST_F(AnnouncementScheduleTest, MapsTypesToTemplateKeys)
{
    EXPECT_EQ(templateKeyForType(":55"), "fiftyfive");
    EXPECT_EQ(templateKeyForType("fiftyfive"), "fiftyfive");
    EXPECT_EQ(templateKeyForType("hour"), "hour");
    EXPECT_EQ(templateKeyForType("rules"), "rules");
    EXPECT_EQ(templateKeyForType("ad"), "ad");
    EXPECT_EQ(templateKeyForType("custom:Lunch"), "custom_lunch");
    EXPECT_EQ(templateKeyForType("surprise"), "hour");
}
