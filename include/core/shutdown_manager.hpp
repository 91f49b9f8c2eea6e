#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Process-wide stop and reload signals for the announcer.
 * - SIGINT/SIGTERM/SIGQUIT request shutdown, SIGHUP requests a configuration reload
 * - The handlers only set sig_atomic_t flags; a watcher thread turns them into
 *   calls on ordinary threads
 * - Every wait in the scheduler goes through waitFor(), so a shutdown request
 *   interrupts it immediately
 */
class ShutdownManager
{
public:
    using Hook = std::function<void()>;

    static ShutdownManager &getInstance();

    // Install signal handlers and start internal watcher thread
    void installSignalHandlers();

    // Programmatically request shutdown (safe to call from any thread, not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Called once, on the requesting thread, after waiters have been woken
    void addShutdownHook(Hook hook);

    // Called on the watcher thread for every SIGHUP
    void setReloadHandler(Hook handler);

    // Drop hooks that reference objects about to go away
    void clearHooks();

    // Block until shutdown has been requested
    void waitForShutdown();

    // Sleep up to timeout; returns true if shutdown was requested meanwhile
    bool waitFor(std::chrono::milliseconds timeout);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    static std::string signalName(int sig);

    // Async-signal-safe entry point used by the installed handlers
    static void handleSignal(int sig) noexcept;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Background watcher to translate signal flags into proper requests
    void startWatcher();
    void stopWatcher();
    void dispatchReload() noexcept;
    void runShutdownHooks() noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::mutex hooks_mutex_;
    std::vector<Hook> shutdown_hooks_;
    Hook reload_handler_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};
    bool handlers_installed_ = false;

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
    static volatile sig_atomic_t reload_flag_;
};
