#include "core/announcement_scheduler.hpp"
#include "core/announcer_errors.hpp"
#include "core/announcer_settings.hpp"
#include "core/audio_player.hpp"
#include "core/color_fetcher.hpp"
#include "core/config_loader.hpp"
#include "core/daily_rollover_timer.hpp"
#include "core/locked_file.hpp"
#include "core/postgres_color_source.hpp"
#include "core/reload_coordinator.hpp"
#include "core/shutdown_manager.hpp"
#include "core/singleton_manager.hpp"
#include "core/speech_synthesizer.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    enum class Command
    {
        RUN,
        REQUEST_RELOAD,
        COPY_CONFIG,
        LIST_CONFIGS,
        SAY
    };

    void printUsage(const char *program)
    {
        std::cout << "Announcer - scheduled voice announcements" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --settings <file>            Process settings (default: announcer.json)" << std::endl;
        std::cout << "  --config <file>              Configuration for the first load instead of today's file" << std::endl;
        std::cout << "  --replace                    Shutdown an existing instance and start a new one" << std::endl;
        std::cout << "  --request-reload [<file>]    Ask the running instance to activate a configuration" << std::endl;
        std::cout << "                               (default: today's file)" << std::endl;
        std::cout << "  --copy-config <src> <dst>    Copy one configuration file to another" << std::endl;
        std::cout << "  --list-configs               Show the day files and which one is active today" << std::endl;
        std::cout << "  --say <text>                 Speak a text once with today's voice" << std::endl;
        std::cout << "  --help, -h                   Show this help message" << std::endl;
    }

    bool hasValue(int i, int argc, char *argv[])
    {
        return i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
    }

    int listConfigs(const ConfigLoader &loader)
    {
        const std::string today = loader.currentDayConfigPath();
        for (int weekday = 0; weekday < 7; ++weekday)
        {
            const std::string path = loader.resolve(selectConfigFile(weekday));
            std::error_code ec;
            const bool exists = fs::exists(path, ec);
            std::cout << (path == today ? "* " : "  ") << selectConfigFile(weekday);
            if (exists)
                std::cout << "  " << fs::file_size(path, ec) << " bytes";
            else
                std::cout << "  (missing)";
            std::cout << std::endl;
        }
        std::error_code ec;
        std::cout << "  " << fs::path(loader.getFallbackPath()).filename().string()
                  << (fs::exists(loader.getFallbackPath(), ec) ? "  (fallback)" : "  (fallback, missing)")
                  << std::endl;
        return 0;
    }

    // Today's voice without consuming the reload marker
    VoiceSettings voiceForToday(const ConfigLoader &loader)
    {
        std::string path = loader.currentDayConfigPath();
        if (!fs::exists(path))
        {
            path = loader.getFallbackPath();
        }
        if (!fs::exists(path))
        {
            throw ConfigNotFoundError("Config file not found: " + path);
        }
        return ConfigLoader::parse(readLockedFile(path), path).voice;
    }
}

int main(int argc, char *argv[])
{
    std::string settings_path = "announcer.json";
    std::optional<std::string> explicit_config;
    std::optional<std::string> reload_target;
    std::string copy_source;
    std::string copy_target;
    std::string say_text;
    bool replace = false;
    Command command = Command::RUN;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--settings" && i + 1 < argc)
        {
            settings_path = argv[++i];
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            explicit_config = argv[++i];
        }
        else if (arg == "--replace")
        {
            replace = true;
        }
        else if (arg == "--request-reload")
        {
            command = Command::REQUEST_RELOAD;
            if (hasValue(i, argc, argv))
                reload_target = argv[++i];
        }
        else if (arg == "--copy-config" && i + 2 < argc)
        {
            command = Command::COPY_CONFIG;
            copy_source = argv[++i];
            copy_target = argv[++i];
        }
        else if (arg == "--list-configs")
        {
            command = Command::LIST_CONFIGS;
        }
        else if (arg == "--say" && i + 1 < argc)
        {
            command = Command::SAY;
            say_text = argv[++i];
        }
        else
        {
            std::cerr << "Error: unknown or incomplete option " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    AnnouncerSettings settings;
    try
    {
        settings = AnnouncerSettings::load(settings_path);
    }
    catch (const ConfigInvalidError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::error_code ec;
    fs::current_path(settings.working_directory, ec);
    if (ec)
    {
        std::cerr << "Error: cannot change to working directory " << settings.working_directory << ": "
                  << ec.message() << std::endl;
        return 1;
    }

    // The one-shot commands log to the console only
    Logger::init(settings.log_level, command == Command::RUN ? settings.log_file : "");
    if (!Logger::isValidLevel(settings.log_level))
    {
        Logger::warn("Invalid log level: " + settings.log_level + ", defaulting to INFO");
    }

    ConfigLoader loader(".", settings.marker_file, settings.fallback_config);
    ReloadCoordinator coordinator(loader.getMarkerPath());

    PostgresColorSource color_source(settings.connect_timeout_seconds, settings.rotation_minutes);
    ColorFetcher fetcher(color_source, settings.retry);
    EdgeTtsSynthesizer synthesizer(settings.tts_command);
    ProcessAudioPlayer player(settings.player_command, settings.player_args);
    AnnouncementScheduler scheduler(loader, coordinator, fetcher, synthesizer, player);

    try
    {
        switch (command)
        {
        case Command::REQUEST_RELOAD:
        {
            const std::string target = reload_target ? *reload_target : loader.currentDayConfigPath();
            coordinator.requestReload(target);
            Logger::info("Reload of " + target + " requested");
            return 0;
        }
        case Command::COPY_CONFIG:
            copyConfig(loader.resolve(copy_source), loader.resolve(copy_target));
            Logger::info("Copied " + copy_source + " to " + copy_target);
            return 0;
        case Command::LIST_CONFIGS:
            return listConfigs(loader);
        case Command::SAY:
            return scheduler.speak(say_text, voiceForToday(loader)) ? 0 : 1;
        case Command::RUN:
            break;
        }
    }
    catch (const std::exception &e)
    {
        Logger::error(e.what());
        return 1;
    }

    ShutdownManager::getInstance().installSignalHandlers();

    SingletonManager singleton(settings.pid_file);
    if (!singleton.acquire(replace))
    {
        std::cerr << "Error: Another instance is already running!" << std::endl;
        std::cerr << "Use --replace to shutdown the existing instance." << std::endl;
        return 1;
    }

    Logger::info("Starting announcer (PID: " + std::to_string(getpid()) + ")...");

    if (explicit_config)
    {
        scheduler.setExplicitConfigPath(*explicit_config);
    }

    DailyRolloverTimer rollover_timer(coordinator, settings.rollover_hour, settings.rollover_minute);
    auto &shutdown_manager = ShutdownManager::getInstance();
    shutdown_manager.setReloadHandler([&coordinator]()
                                      { coordinator.raise(); });
    shutdown_manager.addShutdownHook([&rollover_timer]()
                                     { rollover_timer.stop(); });

    int exit_code = 0;
    try
    {
        rollover_timer.start();
        scheduler.run();
    }
    catch (const std::exception &e)
    {
        Logger::critical("Fatal error in main loop: " + std::string(e.what()));
        shutdown_manager.requestShutdown("Fatal error");
        exit_code = 1;
    }

    shutdown_manager.clearHooks();
    rollover_timer.stop();
    Logger::info("Announcer stopped (" + shutdown_manager.getReason() + ")");
    Logger::flush();
    return exit_code;
}
