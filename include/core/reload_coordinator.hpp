#pragma once

#include <mutex>
#include <string>

/**
 * @brief Decides whether the active configuration must be reloaded.
 *
 * Two sources can ask for a reload:
 * - the reload marker file, deposited by an editor process (names a file)
 * - the in-process flag, raised by the daily rollover timer (no file; the
 *   loader re-derives today's file from the date)
 *
 * The flag is a single slot: raise() sets it, checkForReloadRequest() reads and
 * clears it in one critical section, so each raise is consumed exactly once.
 * The mutex is never held across I/O.
 */
class ReloadCoordinator
{
public:
    explicit ReloadCoordinator(std::string marker_path = "reload_config");

    // True when the marker exists or a pending flag was consumed
    bool checkForReloadRequest();

    // Set the flag (rollover timer side)
    void raise();

    // Drop a pending flag; called when a load is about to happen anyway
    void clearPending();

    bool isPending() const;

    // Editor side: name the file to activate and deposit the marker
    void requestReload(const std::string &config_path);

    const std::string &getMarkerPath() const { return marker_path_; }

private:
    bool markerExists() const;

    std::string marker_path_;
    mutable std::mutex mutex_;
    bool reload_pending_{false};
};
