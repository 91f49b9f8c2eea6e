#pragma once

#include "core/announcement_schedule.hpp"
#include "core/audio_player.hpp"
#include "core/color_fetcher.hpp"
#include "core/config_loader.hpp"
#include "core/reload_coordinator.hpp"
#include "core/speech_synthesizer.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief Main loop: keeps the active configuration current and plays each
 * scheduled announcement at its time.
 *
 * State cycle:
 *   LOADING -> WAITING_FOR_SCHEDULE -> ARMED -> FETCHING -> RENDERING -> PLAYING
 *   -> WAITING_FOR_SCHEDULE (or LOADING when a reload was requested)
 *
 * Every pause goes through the wait function, which returns true when the
 * process is shutting down; run() then returns. Configuration errors are
 * retried every minute, per-event errors only abort that event.
 */
class AnnouncementScheduler
{
public:
    enum class State
    {
        LOADING,
        WAITING_FOR_SCHEDULE,
        ARMED,
        FETCHING,
        RENDERING,
        PLAYING,
        STOPPED
    };

    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using WaitFunction = std::function<bool(std::chrono::milliseconds)>;

    static constexpr std::chrono::seconds POLL_INTERVAL{60};
    static constexpr std::chrono::seconds LOAD_RETRY_DELAY{60};
    static constexpr std::chrono::seconds POST_ANNOUNCEMENT_PAUSE{1};

    AnnouncementScheduler(ConfigLoader &loader, ReloadCoordinator &coordinator, ColorFetcher &fetcher,
                          SpeechSynthesizer &synthesizer, AudioPlayer &player);

    // Blocks until shutdown
    void run();

    // Leave run() at the next state transition
    void stop() { stop_requested_.store(true); }

    // Synthesize and play one text; errors are logged. Returns true when played.
    bool speak(const std::string &text, const VoiceSettings &voice);

    // Used for the first load only
    void setExplicitConfigPath(const std::string &path) { explicit_path_ = path; }

    void setClock(Clock clock) { clock_ = std::move(clock); }
    void setWaitFunction(WaitFunction wait) { wait_ = std::move(wait); }

    State getState() const { return state_.load(); }
    ConfigSnapshotPtr getSnapshot() const;
    int getAnnouncementCount() const { return announcement_count_.load(); }
    int getEventCount() const { return event_count_.load(); }
    int getLoadCount() const { return load_count_.load(); }

    static std::string stateName(State state);

private:
    bool loadConfig();
    void waitForSchedule();
    bool armed();
    std::optional<ColorData> fetchColors(const ConfigSnapshot &snapshot);
    void finishEvent();
    bool wait(std::chrono::milliseconds duration);
    void transition(State next);

    std::chrono::milliseconds untilEvent() const;

    ConfigLoader &loader_;
    ReloadCoordinator &coordinator_;
    ColorFetcher &fetcher_;
    SpeechSynthesizer &synthesizer_;
    AudioPlayer &player_;

    Clock clock_;
    WaitFunction wait_;
    std::optional<std::string> explicit_path_;

    mutable std::mutex snapshot_mutex_;
    ConfigSnapshotPtr snapshot_;

    AnnouncementEvent event_;
    std::optional<ColorData> colors_;
    std::string text_;

    std::atomic<State> state_{State::LOADING};
    std::atomic<bool> stop_requested_{false};
    std::atomic<int> announcement_count_{0};
    std::atomic<int> event_count_{0};
    std::atomic<int> load_count_{0};
};
