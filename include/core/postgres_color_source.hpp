#pragma once

#include "core/color_source.hpp"
#include <string>
#include <vector>

// Windows ARGB color codes stored by the ticket printer software
std::string colorNameFromCode(long long code);

/**
 * @brief Rotate colors so the current interval's color takes position 1.
 *
 * codes are in display order (corder). The interval advances every
 * rotation_minutes since the shift start; the color at 0-based index i lands
 * on position ((i - interval + n) % n) + 1.
 */
ColorData rotateColors(const std::vector<long long> &codes, int minutes_since_start, int rotation_minutes = 30);

/**
 * @brief ColorSource backed by the ticketing PostgreSQL database (libpq).
 */
class PostgresColorSource : public ColorSource
{
public:
    explicit PostgresColorSource(int connect_timeout_seconds = 30, int rotation_minutes = 30);

    ColorData fetchColors(const DatabaseCredentials &credentials) override;

private:
    int connect_timeout_seconds_;
    int rotation_minutes_;
};
