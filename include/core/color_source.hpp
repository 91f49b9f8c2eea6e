#pragma once

#include "core/config_snapshot.hpp"
#include <map>
#include <string>

// "color1" -> "Red", keyed by rotated position
using ColorData = std::map<std::string, std::string>;

/**
 * @brief Source of the rotating color sequence.
 *
 * Implementations throw on any connection or query failure; an empty map
 * means the source has no colors configured.
 */
class ColorSource
{
public:
    virtual ~ColorSource() = default;
    virtual ColorData fetchColors(const DatabaseCredentials &credentials) = 0;
};
