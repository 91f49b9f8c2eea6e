#include "core/speech_synthesizer.hpp"
#include "core/announcer_errors.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <Poco/Process.h>
#include <Poco/TemporaryFile.h>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

EdgeTtsSynthesizer::EdgeTtsSynthesizer(std::string command) : command_(std::move(command))
{
}

std::string EdgeTtsSynthesizer::synthesize(const std::string &text, const VoiceSettings &voice)
{
    const std::string output = Poco::TemporaryFile::tempName() + "." + voice.output_format;

    Poco::Process::Args args;
    args.push_back("--voice");
    args.push_back(voice.voice_id);
    args.push_back("--text");
    args.push_back(text);
    args.push_back("--write-media");
    args.push_back(output);

    int exit_code = -1;
    try
    {
        Poco::ProcessHandle handle = Poco::Process::launch(command_, args);
        exit_code = handle.wait();
    }
    catch (const Poco::Exception &e)
    {
        throw SynthesisError("Could not run " + command_ + ": " + e.displayText());
    }

    std::error_code ec;
    const bool produced = fs::exists(output, ec) && fs::file_size(output, ec) > 0 && !ec;
    if (exit_code != 0 || !produced)
    {
        fs::remove(output, ec);
        throw SynthesisError(command_ + " failed (exit code " + std::to_string(exit_code) +
                             (produced ? ")" : ", no audio written)"));
    }

    Logger::info("EdgeTtsSynthesizer: audio file saved: " + output);
    return output;
}
