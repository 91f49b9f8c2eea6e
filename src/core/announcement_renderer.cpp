#include "core/announcement_renderer.hpp"
#include "core/announcer_errors.hpp"
#include "logging/logger.hpp"

std::string AnnouncementRenderer::selectTemplate(const ConfigSnapshot &snapshot, const std::string &type)
{
    auto it = snapshot.templates.find(templateKeyForType(type));
    if (it == snapshot.templates.end())
    {
        return DEFAULT_TEMPLATE;
    }
    return it->second;
}

AnnouncementRenderer::PlaceholderValues AnnouncementRenderer::buildValues(const std::string &time_12h,
                                                                          const std::optional<ColorData> &colors)
{
    if (!colors)
    {
        Logger::warn("AnnouncementRenderer: no color data available; using default placeholders");
    }

    PlaceholderValues values;
    values["time"] = time_12h;
    for (int i = 1; i <= 4; ++i)
    {
        const std::string key = "color" + std::to_string(i);
        std::string value = UNKNOWN_COLOR;
        if (colors)
        {
            auto it = colors->find(key);
            if (it != colors->end())
                value = it->second;
        }
        values[key] = value;
    }
    return values;
}

std::string AnnouncementRenderer::substitute(const std::string &text, const PlaceholderValues &values)
{
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (c == '{')
        {
            if (i + 1 < text.size() && text[i + 1] == '{')
            {
                result += '{';
                ++i;
                continue;
            }
            const auto close = text.find('}', i + 1);
            if (close == std::string::npos)
            {
                throw RenderError("Single '{' encountered in template");
            }
            const std::string name = text.substr(i + 1, close - i - 1);
            auto it = values.find(name);
            if (it == values.end())
            {
                throw RenderError("Template formatting error - missing key: " + name);
            }
            result += it->second;
            i = close;
        }
        else if (c == '}')
        {
            if (i + 1 < text.size() && text[i + 1] == '}')
            {
                result += '}';
                ++i;
                continue;
            }
            throw RenderError("Single '}' encountered in template");
        }
        else
        {
            result += c;
        }
    }
    return result;
}

std::string AnnouncementRenderer::render(const ConfigSnapshot &snapshot, const AnnouncementEvent &event,
                                         const std::optional<ColorData> &colors)
{
    Logger::info("AnnouncementRenderer: generating announcement for type: " + event.type);

    const std::string text = selectTemplate(snapshot, event.type);
    const auto values = buildValues(convertTo12Hour(event.time_of_day), colors);
    Logger::debug("AnnouncementRenderer: template before formatting: " + text);

    std::string rendered = substitute(text, values);
    Logger::info("AnnouncementRenderer: announcement text generated: " + rendered);
    return rendered;
}
