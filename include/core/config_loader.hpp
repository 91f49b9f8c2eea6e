#pragma once

#include "core/config_snapshot.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

// Day-of-week file names, 0 = Monday. Any other value maps to the fallback.
std::string selectConfigFile(int weekday);

// Monday-based weekday (0..6) of a point in local time
int mondayBasedWeekday(std::chrono::system_clock::time_point when);

std::string configFileForDate(std::chrono::system_clock::time_point when);

/**
 * @brief Loads configuration snapshots from the day files.
 *
 * Relative file names (day files, the fallback, the reload marker and paths
 * named inside the marker) are resolved against config_dir.
 *
 * load() consumes a pending reload marker, resolves the file to use, reads it
 * under a shared lock and validates the result. Throws ConfigNotFoundError or
 * ConfigInvalidError.
 */
class ConfigLoader
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit ConfigLoader(std::string config_dir = ".",
                          std::string marker_file = "reload_config",
                          std::string fallback_file = "config.ini");

    ConfigSnapshotPtr load(const std::optional<std::string> &explicit_path = std::nullopt);

    // Parse a document without touching the filesystem. Throws ConfigInvalidError.
    static ConfigSnapshot parse(const std::string &content, const std::string &source_path = "");

    void setClock(Clock clock) { clock_ = std::move(clock); }

    std::string resolve(const std::string &file_name) const;
    std::string getMarkerPath() const { return resolve(marker_file_); }
    std::string getFallbackPath() const { return resolve(fallback_file_); }

    // Today's day file, resolved against config_dir
    std::string currentDayConfigPath() const;

private:
    std::optional<std::string> consumeReloadMarker();
    std::string resolveExistingPath(const std::string &path) const;

    std::string config_dir_;
    std::string marker_file_;
    std::string fallback_file_;
    Clock clock_;
};

// Write a snapshot in the INI layout under an exclusive lock
void saveConfig(const ConfigSnapshot &snapshot, const std::string &path);

// Copy one configuration file to another, shared lock on the source and
// exclusive lock on the target. Throws ConfigNotFoundError if source is missing.
void copyConfig(const std::string &source_path, const std::string &target_path);
