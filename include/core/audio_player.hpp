#pragma once

#include <string>
#include <vector>

/**
 * @brief Plays an audio file to completion. Failures throw PlaybackError.
 */
class AudioPlayer
{
public:
    virtual ~AudioPlayer() = default;
    virtual void play(const std::string &path) = 0;
};

// Launches an external player ("mpg123 -q <file>" by default) and waits for it
class ProcessAudioPlayer : public AudioPlayer
{
public:
    explicit ProcessAudioPlayer(std::string command = "mpg123", const std::string &args = "-q");

    void play(const std::string &path) override;

    const std::vector<std::string> &getArgs() const { return args_; }

private:
    std::string command_;
    std::vector<std::string> args_;
};
