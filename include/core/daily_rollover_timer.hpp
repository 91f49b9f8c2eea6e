#pragma once

#include "core/reload_coordinator.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

/**
 * @brief Background task that raises the reload flag once a day.
 *
 * The day files are keyed by weekday, so shortly after midnight (01:00 by
 * default) the active file has to be re-derived from the new date. The task
 * sleeps in bounded increments so stop() is observed within one increment.
 */
class DailyRolloverTimer
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    DailyRolloverTimer(ReloadCoordinator &coordinator, int hour = 1, int minute = 0);
    ~DailyRolloverTimer();

    DailyRolloverTimer(const DailyRolloverTimer &) = delete;
    DailyRolloverTimer &operator=(const DailyRolloverTimer &) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // Next local hour:minute strictly after now
    static std::chrono::system_clock::time_point nextOccurrence(std::chrono::system_clock::time_point now,
                                                                int hour, int minute);

    void setClock(Clock clock) { clock_ = std::move(clock); }
    void setMaxIncrement(std::chrono::milliseconds increment) { max_increment_ = increment; }

    int getRolloverCount() const { return rollover_count_.load(); }

private:
    void timerLoop();

    // Returns true when stop() was requested during the wait
    bool waitIncrement(std::chrono::milliseconds duration);

    ReloadCoordinator &coordinator_;
    int hour_;
    int minute_;
    Clock clock_;
    std::chrono::milliseconds max_increment_{std::chrono::seconds(60)};

    std::atomic<bool> running_{false};
    std::atomic<int> rollover_count_{0};
    bool stop_requested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread timer_thread_;
};
