#include "core/singleton_manager.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <signal.h>
#include <thread>
#include <unistd.h>

SingletonManager::SingletonManager(std::string pid_file_path) : pid_file_path_(std::move(pid_file_path))
{
}

SingletonManager::~SingletonManager()
{
    removePidFile();
}

bool SingletonManager::processAlive(pid_t pid)
{
    // EPERM means the process exists but belongs to someone else
    return pid > 0 && (kill(pid, 0) == 0 || errno == EPERM);
}

pid_t SingletonManager::getPidFromFile() const
{
    std::ifstream file(pid_file_path_);
    if (!file.is_open())
    {
        return -1;
    }

    pid_t pid = -1;
    if (!(file >> pid))
    {
        return -1;
    }
    return pid;
}

bool SingletonManager::isAnotherInstanceRunning()
{
    if (pid_file_path_.empty() || access(pid_file_path_.c_str(), F_OK) != 0)
    {
        return false;
    }

    const pid_t pid = getPidFromFile();
    if (pid == getpid())
    {
        return false;
    }

    if (!processAlive(pid))
    {
        Logger::info("SingletonManager: removing stale PID file " + pid_file_path_);
        unlink(pid_file_path_.c_str());
        return false;
    }
    return true;
}

bool SingletonManager::createPidFile()
{
    if (pid_file_path_.empty())
    {
        return false;
    }

    int fd = open(pid_file_path_.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd == -1)
    {
        Logger::error("SingletonManager: cannot create PID file " + pid_file_path_ + ": " + std::strerror(errno));
        return false;
    }

    const std::string pid_str = std::to_string(getpid()) + "\n";
    const ssize_t written = write(fd, pid_str.c_str(), pid_str.length());
    close(fd);
    if (written != static_cast<ssize_t>(pid_str.length()))
    {
        unlink(pid_file_path_.c_str());
        Logger::error("SingletonManager: short write to PID file " + pid_file_path_);
        return false;
    }

    owns_pid_file_ = true;
    return true;
}

void SingletonManager::removePidFile()
{
    if (owns_pid_file_)
    {
        unlink(pid_file_path_.c_str());
        owns_pid_file_ = false;
    }
}

bool SingletonManager::shutdownExistingInstance(std::chrono::milliseconds grace)
{
    if (!isAnotherInstanceRunning())
    {
        return true;
    }

    const pid_t existing_pid = getPidFromFile();
    if (kill(existing_pid, SIGTERM) != 0)
    {
        Logger::error("SingletonManager: could not signal PID " + std::to_string(existing_pid) + ": " +
                      std::strerror(errno));
        return false;
    }
    Logger::info("SingletonManager: sent shutdown signal to existing instance (PID: " +
                 std::to_string(existing_pid) + ")");

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (processAlive(existing_pid) && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (processAlive(existing_pid))
    {
        Logger::warn("SingletonManager: existing instance still running, sending SIGKILL...");
        kill(existing_pid, SIGKILL);
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    // The killed instance may not have cleaned up after itself
    if (!processAlive(existing_pid))
    {
        unlink(pid_file_path_.c_str());
    }
    return !processAlive(existing_pid);
}

bool SingletonManager::acquire(bool replace)
{
    if (isAnotherInstanceRunning())
    {
        if (!replace)
        {
            Logger::error("SingletonManager: another instance is already running (PID: " +
                          std::to_string(getPidFromFile()) + ")");
            return false;
        }
        if (!shutdownExistingInstance())
        {
            return false;
        }
    }
    else if (getPidFromFile() == getpid())
    {
        // Left over from an earlier acquire in this process
        unlink(pid_file_path_.c_str());
    }
    return createPidFile();
}
