#pragma once

#include <map>
#include <memory>
#include <string>

/**
 * @brief Connection parameters for the color database.
 */
struct DatabaseCredentials
{
    std::string server;
    std::string database;
    std::string username;
    std::string password;
    std::string port;      // empty: libpq default
    int printer_group = 1; // ticket printer group whose colors rotate

    bool isComplete() const
    {
        return !server.empty() && !database.empty() && !username.empty() && !password.empty();
    }
};

struct VoiceSettings
{
    std::string voice_id;
    std::string output_format = "mp3";
};

/**
 * @brief One fully loaded configuration file.
 *
 * Snapshots are never modified after loading. A reload builds a new snapshot
 * and the scheduler swaps its pointer.
 */
struct ConfigSnapshot
{
    DatabaseCredentials credentials;
    std::map<std::string, std::string> schedule;  // "HH:MM" -> announcement type tag
    std::map<std::string, std::string> templates; // template key -> format string
    VoiceSettings voice;
    std::string source_path;
};

using ConfigSnapshotPtr = std::shared_ptr<const ConfigSnapshot>;
