#pragma once

#include "logging/logger.hpp"
#include <filesystem>
#include <string>
#include <system_error>

/**
 * @brief Deletes a synthesized audio file when the owning scope ends.
 */
class ScopedArtifact
{
public:
    explicit ScopedArtifact(std::string path) : path_(std::move(path)) {}

    ~ScopedArtifact()
    {
        if (path_.empty())
            return;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec)
        {
            Logger::warn("ScopedArtifact: could not delete " + path_ + ": " + ec.message());
        }
    }

    ScopedArtifact(const ScopedArtifact &) = delete;
    ScopedArtifact &operator=(const ScopedArtifact &) = delete;

    const std::string &path() const { return path_; }

private:
    std::string path_;
};
