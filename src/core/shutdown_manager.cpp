#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <csignal>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;
volatile sig_atomic_t ShutdownManager::reload_flag_ = 0;

namespace
{
    const int kStopSignals[] = {SIGINT, SIGTERM, SIGQUIT};
}

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    for (int sig : kStopSignals)
    {
        std::signal(sig, &ShutdownManager::handleSignal);
    }
    std::signal(SIGHUP, &ShutdownManager::handleSignal);
    handlers_installed_ = true;

    startWatcher();
    Logger::info("ShutdownManager: signal handlers installed (SIGHUP reloads the configuration)");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    if (sig == SIGHUP)
    {
        reload_flag_ = 1;
        return;
    }
    signal_num_ = sig;
    signal_flag_ = 1;
}

std::string ShutdownManager::signalName(int sig)
{
    switch (sig)
    {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    case SIGQUIT:
        return "SIGQUIT";
    case SIGHUP:
        return "SIGHUP";
    default:
        return "signal " + std::to_string(sig);
    }
}

void ShutdownManager::addShutdownHook(Hook hook)
{
    std::lock_guard<std::mutex> lk(hooks_mutex_);
    shutdown_hooks_.push_back(std::move(hook));
}

void ShutdownManager::setReloadHandler(Hook handler)
{
    std::lock_guard<std::mutex> lk(hooks_mutex_);
    reload_handler_ = std::move(handler);
}

void ShutdownManager::clearHooks()
{
    // Waits for hooks that are running on another thread
    std::lock_guard<std::mutex> lk(hooks_mutex_);
    shutdown_hooks_.clear();
    reload_handler_ = nullptr;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load())
        {
            if (reload_flag_)
            {
                reload_flag_ = 0;
                dispatchReload();
            }

            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("Received " + signalName(sig), sig);
            }

            if (shutdown_requested_.load())
            {
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
    {
        watcher_.join();
    }
}

void ShutdownManager::dispatchReload() noexcept
{
    std::lock_guard<std::mutex> lk(hooks_mutex_);
    if (!reload_handler_)
    {
        Logger::warn("ShutdownManager: SIGHUP received but no reload handler is set");
        return;
    }
    Logger::info("ShutdownManager: SIGHUP received, requesting configuration reload");
    try
    {
        reload_handler_();
    }
    catch (const std::exception &e)
    {
        Logger::error("ShutdownManager: reload request failed: " + std::string(e.what()));
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received " + signalName(signal_number) + ", stopping announcer");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested - " + reason);
    }

    runShutdownHooks();
}

void ShutdownManager::runShutdownHooks() noexcept
{
    std::lock_guard<std::mutex> lk(hooks_mutex_);
    for (auto &hook : shutdown_hooks_)
    {
        try
        {
            hook();
        }
        catch (const std::exception &e)
        {
            Logger::error("ShutdownManager: shutdown hook failed: " + std::string(e.what()));
        }
    }
    shutdown_hooks_.clear();
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    if (handlers_installed_)
    {
        for (int sig : kStopSignals)
        {
            std::signal(sig, SIG_DFL);
        }
        std::signal(SIGHUP, SIG_DFL);
        handlers_installed_ = false;
    }

    shutdown_requested_.store(false);
    shutdown_in_progress_.store(false);
    last_signal_.store(0);

    signal_flag_ = 0;
    signal_num_ = 0;
    reload_flag_ = 0;

    {
        std::lock_guard<std::mutex> lk(hooks_mutex_);
        shutdown_hooks_.clear();
        reload_handler_ = nullptr;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    reason_.clear();
}
