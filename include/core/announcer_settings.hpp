#pragma once

#include "core/error_recovery.hpp"
#include <string>

/**
 * @brief Process settings read from announcer.json.
 *
 * Every key is optional. A missing file yields the defaults; a malformed file
 * or an out-of-range value throws ConfigInvalidError.
 */
struct AnnouncerSettings
{
    std::string log_level = "INFO";
    std::string log_file = "announcement_script.log";
    std::string working_directory = ".";
    std::string marker_file = "reload_config";
    std::string fallback_config = "config.ini";
    std::string pid_file = "announcer.pid";

    int rollover_hour = 1;
    int rollover_minute = 0;

    RetryPolicy retry;

    int connect_timeout_seconds = 30;
    int rotation_minutes = 30;

    std::string tts_command = "edge-tts";
    std::string player_command = "mpg123";
    std::string player_args = "-q";

    static AnnouncerSettings load(const std::string &path);
};
