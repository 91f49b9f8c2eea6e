#include "core/announcement_scheduler.hpp"
#include "core/announcement_renderer.hpp"
#include "core/announcer_errors.hpp"
#include "core/error_recovery.hpp"
#include "core/scoped_artifact.hpp"
#include "core/shutdown_manager.hpp"
#include "core/time_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>

using namespace std::chrono;

AnnouncementScheduler::AnnouncementScheduler(ConfigLoader &loader, ReloadCoordinator &coordinator,
                                             ColorFetcher &fetcher, SpeechSynthesizer &synthesizer,
                                             AudioPlayer &player)
    : loader_(loader), coordinator_(coordinator), fetcher_(fetcher), synthesizer_(synthesizer), player_(player),
      clock_([]()
             { return system_clock::now(); }),
      wait_([](milliseconds duration)
            { return ShutdownManager::getInstance().waitFor(duration); })
{
}

std::string AnnouncementScheduler::stateName(State state)
{
    switch (state)
    {
    case State::LOADING:
        return "LOADING";
    case State::WAITING_FOR_SCHEDULE:
        return "WAITING_FOR_SCHEDULE";
    case State::ARMED:
        return "ARMED";
    case State::FETCHING:
        return "FETCHING";
    case State::RENDERING:
        return "RENDERING";
    case State::PLAYING:
        return "PLAYING";
    case State::STOPPED:
        return "STOPPED";
    }
    return "UNKNOWN";
}

ConfigSnapshotPtr AnnouncementScheduler::getSnapshot() const
{
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

void AnnouncementScheduler::transition(State next)
{
    Logger::trace("AnnouncementScheduler: " + stateName(state_.load()) + " -> " + stateName(next));
    state_.store(next);
}

bool AnnouncementScheduler::wait(milliseconds duration)
{
    if (duration.count() < 0)
    {
        duration = milliseconds(0);
    }
    if (wait_(duration) || stop_requested_.load())
    {
        transition(State::STOPPED);
        return true;
    }
    return false;
}

milliseconds AnnouncementScheduler::untilEvent() const
{
    return duration_cast<milliseconds>(event_.time - clock_());
}

void AnnouncementScheduler::run()
{
    Logger::info("AnnouncementScheduler: starting");
    transition(State::LOADING);

    while (!stop_requested_.load() && state_.load() != State::STOPPED)
    {
        switch (state_.load())
        {
        case State::LOADING:
            if (loadConfig())
            {
                transition(State::WAITING_FOR_SCHEDULE);
            }
            else
            {
                Logger::info("AnnouncementScheduler: retrying configuration load in " +
                             std::to_string(LOAD_RETRY_DELAY.count()) + " seconds");
                wait(LOAD_RETRY_DELAY);
            }
            break;

        case State::WAITING_FOR_SCHEDULE:
            waitForSchedule();
            break;

        case State::ARMED:
            if (armed())
            {
                transition(State::FETCHING);
            }
            break;

        case State::FETCHING:
        {
            auto snapshot = getSnapshot();
            colors_ = fetchColors(*snapshot);
            const auto remaining = untilEvent();
            Logger::debug("AnnouncementScheduler: waiting " + std::to_string(remaining.count()) +
                          " ms until announcement");
            if (!wait(remaining))
            {
                transition(State::RENDERING);
            }
            break;
        }

        case State::RENDERING:
            try
            {
                text_ = AnnouncementRenderer::render(*getSnapshot(), event_, colors_);
                transition(State::PLAYING);
            }
            catch (const RenderError &e)
            {
                Logger::error("AnnouncementScheduler: could not render announcement: " + std::string(e.what()));
                finishEvent();
            }
            break;

        case State::PLAYING:
            if (speak(text_, getSnapshot()->voice))
            {
                announcement_count_.fetch_add(1);
            }
            finishEvent();
            break;

        case State::STOPPED:
            break;
        }
    }

    transition(State::STOPPED);
    Logger::info("AnnouncementScheduler: stopped");
}

bool AnnouncementScheduler::loadConfig()
{
    // A load re-derives today's file anyway, so a pending rollover is satisfied
    coordinator_.clearPending();

    try
    {
        auto snapshot = loader_.load(explicit_path_);
        explicit_path_.reset();
        {
            std::lock_guard<std::mutex> lock(snapshot_mutex_);
            snapshot_ = std::move(snapshot);
        }
        load_count_.fetch_add(1);
        Logger::info("AnnouncementScheduler: configuration active from " + getSnapshot()->source_path);
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("AnnouncementScheduler: error loading configuration: " + std::string(e.what()));
        return false;
    }
}

void AnnouncementScheduler::waitForSchedule()
{
    if (coordinator_.checkForReloadRequest())
    {
        Logger::info("AnnouncementScheduler: configuration reload requested");
        transition(State::LOADING);
        return;
    }

    auto snapshot = getSnapshot();
    auto next = nextAnnouncement(snapshot->schedule, clock_());
    if (!next)
    {
        Logger::info("AnnouncementScheduler: no announcements scheduled, checking again in " +
                     std::to_string(POLL_INTERVAL.count()) + " seconds");
        wait(POLL_INTERVAL);
        return;
    }

    event_ = *next;
    colors_.reset();
    text_.clear();
    Logger::info("AnnouncementScheduler: next announcement '" + event_.type + "' at " +
                 time_utils::formatLocalTime(event_.time));
    transition(State::ARMED);
}

// Returns true once the event is within one poll interval
bool AnnouncementScheduler::armed()
{
    const auto remaining = untilEvent();
    if (remaining.count() <= 0)
    {
        transition(State::WAITING_FOR_SCHEDULE);
        return false;
    }
    if (remaining <= POLL_INTERVAL)
    {
        return true;
    }

    const milliseconds step = std::min<milliseconds>(remaining - POLL_INTERVAL, POLL_INTERVAL);
    Logger::debug("AnnouncementScheduler: sleeping " + std::to_string(step.count()) + " ms, " +
                  std::to_string(duration_cast<seconds>(remaining).count()) + " s until announcement");
    if (wait(step))
    {
        return false;
    }

    if (coordinator_.checkForReloadRequest())
    {
        Logger::info("AnnouncementScheduler: configuration reload requested while waiting");
        transition(State::LOADING);
    }
    return false;
}

std::optional<ColorData> AnnouncementScheduler::fetchColors(const ConfigSnapshot &snapshot)
{
    Logger::info("AnnouncementScheduler: fetching color data for upcoming announcement");
    return ErrorRecovery::callWithFallback(
        [&]()
        { return fetcher_.fetch(snapshot); },
        []()
        { return std::optional<ColorData>(); },
        "Color fetch");
}

bool AnnouncementScheduler::speak(const std::string &text, const VoiceSettings &voice)
{
    try
    {
        Logger::info("AnnouncementScheduler: speaking: " + text);
        ScopedArtifact artifact(synthesizer_.synthesize(text, voice));
        player_.play(artifact.path());
        Logger::info("AnnouncementScheduler: announcement played successfully");
        return true;
    }
    catch (const SynthesisError &e)
    {
        Logger::error("AnnouncementScheduler: speech synthesis failed: " + std::string(e.what()));
    }
    catch (const PlaybackError &e)
    {
        Logger::error("AnnouncementScheduler: playback failed: " + std::string(e.what()));
    }
    return false;
}

void AnnouncementScheduler::finishEvent()
{
    event_count_.fetch_add(1);
    if (!wait(POST_ANNOUNCEMENT_PAUSE))
    {
        transition(State::WAITING_FOR_SCHEDULE);
    }
}
