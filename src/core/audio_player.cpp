#include "core/audio_player.hpp"
#include "core/announcer_errors.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <Poco/Process.h>
#include <Poco/StringTokenizer.h>
#include <filesystem>
#include <system_error>

ProcessAudioPlayer::ProcessAudioPlayer(std::string command, const std::string &args)
    : command_(std::move(command))
{
    Poco::StringTokenizer tokens(args, " \t",
                                 Poco::StringTokenizer::TOK_IGNORE_EMPTY | Poco::StringTokenizer::TOK_TRIM);
    args_.assign(tokens.begin(), tokens.end());
}

void ProcessAudioPlayer::play(const std::string &path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        throw PlaybackError(ec ? "Cannot access audio file " + path + ": " + ec.message()
                               : "Audio file not found: " + path);
    }

    Poco::Process::Args args = args_;
    args.push_back(path);

    int exit_code = -1;
    try
    {
        Poco::ProcessHandle handle = Poco::Process::launch(command_, args);
        exit_code = handle.wait();
    }
    catch (const Poco::Exception &e)
    {
        throw PlaybackError("Could not run " + command_ + ": " + e.displayText());
    }

    if (exit_code != 0)
    {
        throw PlaybackError(command_ + " exited with code " + std::to_string(exit_code));
    }
    Logger::debug("ProcessAudioPlayer: finished playing " + path);
}
