#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every error the announcer reports on purpose.
 *
 * Configuration errors pause the scheduler and are retried; the per-announcement
 * errors (fetch, render, synthesis, playback) only abort the current event.
 */
class AnnouncerError : public std::runtime_error
{
public:
    explicit AnnouncerError(const std::string &message) : std::runtime_error(message) {}
};

// Neither the resolved configuration file nor the fallback exists
class ConfigNotFoundError : public AnnouncerError
{
public:
    explicit ConfigNotFoundError(const std::string &message) : AnnouncerError(message) {}
};

// Required fields missing or the document could not be read
class ConfigInvalidError : public AnnouncerError
{
public:
    explicit ConfigInvalidError(const std::string &message) : AnnouncerError(message) {}
};

// Color lookup failed on every retry attempt
class AuxiliaryFetchError : public AnnouncerError
{
public:
    explicit AuxiliaryFetchError(const std::string &message) : AnnouncerError(message) {}
};

// Template references an unknown placeholder or has unbalanced braces
class RenderError : public AnnouncerError
{
public:
    explicit RenderError(const std::string &message) : AnnouncerError(message) {}
};

class SynthesisError : public AnnouncerError
{
public:
    explicit SynthesisError(const std::string &message) : AnnouncerError(message) {}
};

class PlaybackError : public AnnouncerError
{
public:
    explicit PlaybackError(const std::string &message) : AnnouncerError(message) {}
};
