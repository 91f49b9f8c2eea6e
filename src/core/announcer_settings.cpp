#include "core/announcer_settings.hpp"
#include "core/announcer_errors.hpp"
#include "logging/logger.hpp"
#include <Poco/AutoPtr.h>
#include <Poco/Exception.h>
#include <Poco/Util/JSONConfiguration.h>
#include <fstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    void requireRange(const std::string &key, long long value, long long low, long long high)
    {
        if (value < low || value > high)
        {
            throw ConfigInvalidError("Setting " + key + " out of range: " + std::to_string(value));
        }
    }
}

AnnouncerSettings AnnouncerSettings::load(const std::string &path)
{
    AnnouncerSettings settings;

    std::ifstream in(path);
    if (!in.good())
    {
        Logger::debug("AnnouncerSettings: " + path + " not found, using defaults");
        return settings;
    }

    try
    {
        AutoPtr<JSONConfiguration> cfg = new JSONConfiguration();
        cfg->load(in);

        settings.log_level = cfg->getString("log_level", settings.log_level);
        settings.log_file = cfg->getString("log_file", settings.log_file);
        settings.working_directory = cfg->getString("working_directory", settings.working_directory);
        settings.marker_file = cfg->getString("marker_file", settings.marker_file);
        settings.fallback_config = cfg->getString("fallback_config", settings.fallback_config);
        settings.pid_file = cfg->getString("pid_file", settings.pid_file);

        settings.rollover_hour = cfg->getInt("rollover.hour", settings.rollover_hour);
        settings.rollover_minute = cfg->getInt("rollover.minute", settings.rollover_minute);

        settings.retry.max_attempts = cfg->getInt("retry.max_attempts", settings.retry.max_attempts);
        settings.retry.base_delay = std::chrono::milliseconds(
            cfg->getInt64("retry.base_delay_ms", settings.retry.base_delay.count()));
        settings.retry.multiplier = cfg->getDouble("retry.multiplier", settings.retry.multiplier);
        settings.retry.max_jitter = std::chrono::milliseconds(
            cfg->getInt64("retry.max_jitter_ms", settings.retry.max_jitter.count()));

        settings.connect_timeout_seconds =
            cfg->getInt("database.connect_timeout_seconds", settings.connect_timeout_seconds);
        settings.rotation_minutes = cfg->getInt("database.rotation_minutes", settings.rotation_minutes);

        settings.tts_command = cfg->getString("tts.command", settings.tts_command);
        settings.player_command = cfg->getString("player.command", settings.player_command);
        settings.player_args = cfg->getString("player.args", settings.player_args);
    }
    catch (const Poco::Exception &e)
    {
        throw ConfigInvalidError("Could not read settings " + path + ": " + e.displayText());
    }

    requireRange("rollover.hour", settings.rollover_hour, 0, 23);
    requireRange("rollover.minute", settings.rollover_minute, 0, 59);
    requireRange("retry.max_attempts", settings.retry.max_attempts, 1, 100);
    requireRange("retry.base_delay_ms", settings.retry.base_delay.count(), 0, 3600000);
    requireRange("retry.max_jitter_ms", settings.retry.max_jitter.count(), 0, 60000);
    requireRange("database.connect_timeout_seconds", settings.connect_timeout_seconds, 1, 3600);
    requireRange("database.rotation_minutes", settings.rotation_minutes, 1, 1440);
    if (settings.retry.multiplier < 1.0)
    {
        throw ConfigInvalidError("Setting retry.multiplier must be at least 1");
    }

    Logger::info("AnnouncerSettings: loaded " + path);
    return settings;
}
