#include "core/daily_rollover_timer.hpp"
#include "core/time_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>

DailyRolloverTimer::DailyRolloverTimer(ReloadCoordinator &coordinator, int hour, int minute)
    : coordinator_(coordinator), hour_(hour), minute_(minute),
      clock_([]
             { return std::chrono::system_clock::now(); })
{
}

DailyRolloverTimer::~DailyRolloverTimer()
{
    stop();
}

void DailyRolloverTimer::start()
{
    if (running_.load())
    {
        Logger::warn("DailyRolloverTimer is already running");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    timer_thread_ = std::thread(&DailyRolloverTimer::timerLoop, this);
    Logger::info("DailyRolloverTimer started");
}

void DailyRolloverTimer::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (timer_thread_.joinable())
    {
        timer_thread_.join();
        Logger::info("DailyRolloverTimer stopped");
    }
    running_.store(false);
}

std::chrono::system_clock::time_point DailyRolloverTimer::nextOccurrence(std::chrono::system_clock::time_point now,
                                                                         int hour, int minute)
{
    auto candidate = time_utils::atLocalTime(now, hour, minute);
    if (candidate <= now)
    {
        candidate = time_utils::atLocalTime(now, hour, minute, 1);
    }
    return candidate;
}

bool DailyRolloverTimer::waitIncrement(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this]
                        { return stop_requested_; });
}

void DailyRolloverTimer::timerLoop()
{
    for (;;)
    {
        const auto target = nextOccurrence(clock_(), hour_, minute_);
        Logger::info("DailyRolloverTimer: next configuration reload scheduled at " +
                     time_utils::formatLocalTime(target) + " (in " +
                     std::to_string(time_utils::secondsBetween(clock_(), target)) + " seconds)");

        for (;;)
        {
            const auto now = clock_();
            if (now >= target)
            {
                break;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(target - now);
            if (remaining.count() <= 0)
            {
                remaining = std::chrono::milliseconds(1);
            }
            if (waitIncrement(std::min(remaining, max_increment_)))
            {
                return;
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_)
            {
                return;
            }
        }

        Logger::info("DailyRolloverTimer: rollover time reached - signaling day-specific configuration reload");
        coordinator_.raise();
        rollover_count_.fetch_add(1);
    }
}
