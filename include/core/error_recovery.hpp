#pragma once
#include <chrono>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include "logging/logger.hpp"

/**
 * @brief How often and how patiently a failing call is retried.
 *
 * Attempt n (0-based) that fails waits base_delay * multiplier^n plus a
 * uniform jitter in [0, max_jitter] before the next attempt. The delay part
 * never exceeds MAX_DELAY.
 */
struct RetryPolicy
{
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{2000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_jitter{100};

    static constexpr std::chrono::milliseconds MAX_DELAY = std::chrono::hours(1);

    std::chrono::milliseconds delayForAttempt(int attempt) const
    {
        const double limit = static_cast<double>(MAX_DELAY.count());
        double delay = static_cast<double>(base_delay.count());
        for (int i = 0; i < attempt && delay < limit; ++i)
        {
            delay *= multiplier;
        }
        if (!(delay < limit))
        {
            return MAX_DELAY;
        }
        return std::chrono::milliseconds(static_cast<long long>(delay));
    }
};

class ErrorRecovery
{
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    static void defaultSleep(std::chrono::milliseconds duration)
    {
        std::this_thread::sleep_for(duration);
    }

    static std::chrono::milliseconds randomJitter(std::chrono::milliseconds max_jitter)
    {
        if (max_jitter.count() <= 0)
        {
            return std::chrono::milliseconds(0);
        }
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<long long> dis(0, max_jitter.count());
        return std::chrono::milliseconds(dis(gen));
    }

    // Retry mechanism with exponential backoff. Any std::exception counts as
    // transient; the exception of the final attempt propagates to the caller.
    template <typename Func>
    static auto retryWithBackoff(const RetryPolicy &policy, const std::string &operation_name, Func func,
                                 const SleepFunction &sleep = defaultSleep)
        -> decltype(func())
    {
        const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;

        for (int attempt = 0; attempt < attempts - 1; ++attempt)
        {
            try
            {
                return func();
            }
            catch (const std::exception &e)
            {
                auto delay = policy.delayForAttempt(attempt);
                Logger::warn(operation_name + " error: " + e.what() + ", retrying in " +
                             std::to_string(delay.count()) + "ms (attempt " + std::to_string(attempt + 1) +
                             "/" + std::to_string(attempts) + ")");
                sleep(delay + randomJitter(policy.max_jitter));
            }
        }

        try
        {
            return func();
        }
        catch (const std::exception &e)
        {
            Logger::error(operation_name + " failed after " + std::to_string(attempts) + " attempts: " + e.what());
            throw;
        }
    }

    // Graceful degradation for non-critical operations
    template <typename Func, typename FallbackFunc>
    static auto callWithFallback(Func primary_func, FallbackFunc fallback_func, const std::string &operation_name)
        -> decltype(primary_func())
    {
        try
        {
            return primary_func();
        }
        catch (const std::exception &e)
        {
            Logger::warn("Primary operation '" + operation_name + "' failed, using fallback: " + e.what());
            return fallback_func();
        }
    }
};
