#pragma once

#include "core/color_source.hpp"
#include "core/config_snapshot.hpp"
#include "core/error_recovery.hpp"
#include <atomic>
#include <optional>

/**
 * @brief Fetches the current color rotation shortly before an announcement.
 *
 * The source is retried according to the policy. std::nullopt means the source
 * answered but had no colors; AuxiliaryFetchError means every attempt failed.
 */
class ColorFetcher
{
public:
    explicit ColorFetcher(ColorSource &source, RetryPolicy policy = RetryPolicy{},
                          ErrorRecovery::SleepFunction sleep = ErrorRecovery::defaultSleep);

    std::optional<ColorData> fetch(const ConfigSnapshot &snapshot);

    const RetryPolicy &getPolicy() const { return policy_; }
    int getLastAttemptCount() const { return last_attempts_.load(); }

private:
    ColorSource &source_;
    RetryPolicy policy_;
    ErrorRecovery::SleepFunction sleep_;
    std::atomic<int> last_attempts_{0};
};
