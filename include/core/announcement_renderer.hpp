#pragma once

#include "core/announcement_schedule.hpp"
#include "core/color_source.hpp"
#include "core/config_snapshot.hpp"
#include <map>
#include <optional>
#include <string>

/**
 * @brief Turns an announcement event into the text handed to synthesis.
 */
class AnnouncementRenderer
{
public:
    using PlaceholderValues = std::map<std::string, std::string>;

    static constexpr const char *DEFAULT_TEMPLATE = "Attention! It's {time}.";
    static constexpr const char *UNKNOWN_COLOR = "unknown";

    // Template text for an event type; falls back to DEFAULT_TEMPLATE
    static std::string selectTemplate(const ConfigSnapshot &snapshot, const std::string &type);

    // {time} plus {color1}..{color4}, missing colors become "unknown"
    static PlaceholderValues buildValues(const std::string &time_12h, const std::optional<ColorData> &colors);

    /**
     * @brief Substitute {name} placeholders.
     *
     * "{{" and "}}" produce literal braces. An unknown name or an unbalanced
     * brace throws RenderError.
     */
    static std::string substitute(const std::string &text, const PlaceholderValues &values);

    static std::string render(const ConfigSnapshot &snapshot, const AnnouncementEvent &event,
                              const std::optional<ColorData> &colors);
};
