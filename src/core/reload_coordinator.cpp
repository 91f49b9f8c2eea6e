#include "core/reload_coordinator.hpp"
#include "core/locked_file.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <filesystem>
#include <system_error>
#include <unistd.h>

ReloadCoordinator::ReloadCoordinator(std::string marker_path)
    : marker_path_(std::move(marker_path))
{
}

bool ReloadCoordinator::markerExists() const
{
    std::error_code ec;
    return std::filesystem::exists(marker_path_, ec);
}

bool ReloadCoordinator::checkForReloadRequest()
{
    if (markerExists())
    {
        Logger::info("ReloadCoordinator: found reload marker " + marker_path_ + " - signaling configuration reload");
        return true;
    }

    bool pending = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reload_pending_)
        {
            reload_pending_ = false;
            pending = true;
        }
    }

    if (pending)
    {
        Logger::info("ReloadCoordinator: detected daily rollover signal");
    }
    return pending;
}

void ReloadCoordinator::raise()
{
    std::lock_guard<std::mutex> lock(mutex_);
    reload_pending_ = true;
}

void ReloadCoordinator::clearPending()
{
    std::lock_guard<std::mutex> lock(mutex_);
    reload_pending_ = false;
}

bool ReloadCoordinator::isPending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return reload_pending_;
}

void ReloadCoordinator::requestReload(const std::string &config_path)
{
    // The marker only ever appears with its full content: write a private
    // file, then rename it into place.
    static std::atomic<unsigned> sequence{0};
    const std::string staging = marker_path_ + "." + std::to_string(::getpid()) + "." +
                                std::to_string(sequence.fetch_add(1)) + ".tmp";
    try
    {
        writeLockedFile(staging, config_path);
        std::filesystem::rename(staging, marker_path_);
    }
    catch (const std::exception &)
    {
        std::error_code ec;
        std::filesystem::remove(staging, ec);
        throw;
    }
    Logger::info("ReloadCoordinator: reload requested for " +
                 (config_path.empty() ? std::string("today's configuration") : config_path));
}
