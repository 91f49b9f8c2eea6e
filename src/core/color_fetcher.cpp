#include "core/color_fetcher.hpp"
#include "core/announcer_errors.hpp"
#include "logging/logger.hpp"

ColorFetcher::ColorFetcher(ColorSource &source, RetryPolicy policy, ErrorRecovery::SleepFunction sleep)
    : source_(source), policy_(policy), sleep_(std::move(sleep))
{
}

std::optional<ColorData> ColorFetcher::fetch(const ConfigSnapshot &snapshot)
{
    last_attempts_.store(0);

    ColorData colors;
    try
    {
        colors = ErrorRecovery::retryWithBackoff(
            policy_, "Color fetch",
            [&]()
            {
                last_attempts_.fetch_add(1);
                return source_.fetchColors(snapshot.credentials);
            },
            sleep_);
    }
    catch (const std::exception &e)
    {
        throw AuxiliaryFetchError("Color data unavailable after " + std::to_string(last_attempts_.load()) +
                                  " attempts: " + e.what());
    }

    if (colors.empty())
    {
        Logger::error("ColorFetcher: no colors found in database");
        return std::nullopt;
    }

    std::string sequence;
    for (const auto &[position, color] : colors)
    {
        Logger::debug("ColorFetcher: " + position + " -> " + color);
        sequence += (sequence.empty() ? "" : ", ") + position + "=" + color;
    }
    Logger::info("ColorFetcher: current color sequence: " + sequence);
    return colors;
}
