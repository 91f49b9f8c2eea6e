#include "test_base.hpp"
#include "core/daily_rollover_timer.hpp"
#include "core/time_utils.hpp"
#include <atomic>
#include <mutex>
#include <thread>

namespace
{
    std::chrono::system_clock::time_point localTime(int hour, int minute, int second = 0)
    {
        return time_utils::atLocalTime(std::chrono::system_clock::now(), hour, minute) + std::chrono::seconds(second);
    }

    // Clock that moves forward a fixed step every time it is read
    class SteppingClock
    {
    public:
        SteppingClock(std::chrono::system_clock::time_point start, std::chrono::milliseconds step)
            : now_(start), step_(step) {}

        std::chrono::system_clock::time_point operator()()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto current = now_;
            now_ += step_;
            return current;
        }

    private:
        std::mutex mutex_;
        std::chrono::system_clock::time_point now_;
        std::chrono::milliseconds step_;
    };
}

class DailyRolloverTimerTest : public TempDirTest
{
};

TEST_F(DailyRolloverTimerTest, NextOccurrenceIsLaterToday)
{
    auto now = localTime(0, 30);
    EXPECT_EQ(DailyRolloverTimer::nextOccurrence(now, 1, 0), localTime(1, 0));
}

TEST_F(DailyRolloverTimerTest, NextOccurrenceMovesToTomorrowWhenPassed)
{
    auto now = localTime(1, 0);
    auto next = DailyRolloverTimer::nextOccurrence(now, 1, 0);
    EXPECT_GT(next, now);
    EXPECT_EQ(next, time_utils::atLocalTime(now, 1, 0, 1));

    auto later = localTime(15, 45);
    EXPECT_EQ(DailyRolloverTimer::nextOccurrence(later, 1, 0), time_utils::atLocalTime(later, 1, 0, 1));
}

TEST_F(DailyRolloverTimerTest, RaisesFlagWhenRolloverTimeIsReached)
{
    ReloadCoordinator coordinator(path("reload_config"));
    DailyRolloverTimer timer(coordinator, 1, 0);

    // Two minutes before the rollover; every clock read advances 30 seconds
    auto clock = std::make_shared<SteppingClock>(localTime(0, 58), std::chrono::seconds(30));
    timer.setClock([clock]()
                   { return (*clock)(); });
    timer.setMaxIncrement(std::chrono::milliseconds(1));
    timer.start();

    for (int i = 0; i < 500 && timer.getRolloverCount() == 0; ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    timer.stop();

    EXPECT_GE(timer.getRolloverCount(), 1);
    EXPECT_TRUE(coordinator.checkForReloadRequest());
}

TEST_F(DailyRolloverTimerTest, RearmsForTheFollowingDay)
{
    ReloadCoordinator coordinator(path("reload_config"));
    DailyRolloverTimer timer(coordinator, 1, 0);

    // Six hours per clock read: 01:00 is crossed today and again tomorrow
    auto clock = std::make_shared<SteppingClock>(localTime(0, 30), std::chrono::hours(6));
    timer.setClock([clock]()
                   { return (*clock)(); });
    timer.setMaxIncrement(std::chrono::milliseconds(1));
    timer.start();

    for (int i = 0; i < 1000 && timer.getRolloverCount() < 2; ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    timer.stop();

    EXPECT_GE(timer.getRolloverCount(), 2);
    // Raises collapse into a single pending reload
    EXPECT_TRUE(coordinator.checkForReloadRequest());
    EXPECT_FALSE(coordinator.checkForReloadRequest());
}

TEST_F(DailyRolloverTimerTest, StopEndsWaitWithoutRaising)
{
    ReloadCoordinator coordinator(path("reload_config"));
    DailyRolloverTimer timer(coordinator, 1, 0);
    timer.setClock([]()
                   { return localTime(12, 0); });
    timer.start();
    EXPECT_TRUE(timer.isRunning());

    auto started = std::chrono::steady_clock::now();
    timer.stop();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(timer.isRunning());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(timer.getRolloverCount(), 0);
    EXPECT_FALSE(coordinator.checkForReloadRequest());
}
