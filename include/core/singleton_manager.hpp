#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>

/**
 * @brief Keeps a single scheduler process per working directory.
 *
 * The PID file names the running instance. Only that instance consumes the
 * reload marker. Stale files (unreadable PID, or a process that no longer
 * exists) are removed when detected.
 */
class SingletonManager
{
public:
    explicit SingletonManager(std::string pid_file_path = "announcer.pid");
    ~SingletonManager();

    SingletonManager(const SingletonManager &) = delete;
    SingletonManager &operator=(const SingletonManager &) = delete;

    // Create the PID file, first terminating a running instance when replace is set
    bool acquire(bool replace);

    // Check if another instance is running
    bool isAnotherInstanceRunning();

    // Create PID file exclusively and write our PID into it
    bool createPidFile();

    // Remove PID file if this process created it
    void removePidFile();

    // SIGTERM the existing instance, SIGKILL after the grace period
    bool shutdownExistingInstance(std::chrono::milliseconds grace = std::chrono::seconds(2));

    // -1 when missing or unreadable
    pid_t getPidFromFile() const;

    bool ownsPidFile() const { return owns_pid_file_; }
    const std::string &getPidFilePath() const { return pid_file_path_; }

private:
    static bool processAlive(pid_t pid);

    std::string pid_file_path_;
    bool owns_pid_file_{false};
};
