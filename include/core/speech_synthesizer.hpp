#pragma once

#include "core/config_snapshot.hpp"
#include <string>

/**
 * @brief Turns announcement text into an audio file.
 *
 * The caller owns the returned file and deletes it after playback.
 * Failures throw SynthesisError.
 */
class SpeechSynthesizer
{
public:
    virtual ~SpeechSynthesizer() = default;
    virtual std::string synthesize(const std::string &text, const VoiceSettings &voice) = 0;
};

// Runs the edge-tts command line tool into a unique temporary file
class EdgeTtsSynthesizer : public SpeechSynthesizer
{
public:
    explicit EdgeTtsSynthesizer(std::string command = "edge-tts");

    std::string synthesize(const std::string &text, const VoiceSettings &voice) override;

private:
    std::string command_;
};
