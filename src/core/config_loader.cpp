#include "core/config_loader.hpp"
#include "core/announcer_errors.hpp"
#include "core/locked_file.hpp"
#include "logging/logger.hpp"
#include <Poco/AutoPtr.h>
#include <Poco/Exception.h>
#include <Poco/NumberParser.h>
#include <Poco/String.h>
#include <Poco/Util/IniFileConfiguration.h>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

using Poco::AutoPtr;
using Poco::Util::AbstractConfiguration;
using Poco::Util::IniFileConfiguration;

namespace
{
    const char *const kDayConfigFiles[] = {
        "mon.ini",   // Monday
        "tue.ini",   // Tuesday
        "wed.ini",   // Wednesday
        "thurs.ini", // Thursday
        "fri.ini",   // Friday
        "sat.ini",   // Saturday
        "sun.ini"    // Sunday
    };

    const char *const kFixedTemplateKeys[] = {"fiftyfive", "hour", "rules", "ad"};

    // Map current and legacy section names onto the four sections we read
    std::string canonicalSection(const std::string &lowered)
    {
        if (lowered == "credentials" || lowered == "database")
            return "credentials";
        if (lowered == "schedule" || lowered == "times")
            return "schedule";
        if (lowered == "templates" || lowered == "announcements")
            return "templates";
        if (lowered == "voice" || lowered == "tts")
            return "voice";
        return "";
    }

    std::string stripQuotes(const std::string &value)
    {
        const auto first = value.find_first_not_of("\"'");
        if (first == std::string::npos)
            return "";
        const auto last = value.find_last_not_of("\"'");
        return value.substr(first, last - first + 1);
    }

    void assignCredential(DatabaseCredentials &credentials, const std::string &key, const std::string &value)
    {
        if (key == "server")
            credentials.server = value;
        else if (key == "database")
            credentials.database = value;
        else if (key == "username")
            credentials.username = value;
        else if (key == "password")
            credentials.password = value;
        else if (key == "port")
            credentials.port = value;
        else if (key == "printer_group")
        {
            int group = 0;
            if (!Poco::NumberParser::tryParse(value, group))
            {
                throw ConfigInvalidError("Invalid printer_group value: " + value);
            }
            credentials.printer_group = group;
        }
    }

    void assignVoice(VoiceSettings &voice, const std::string &key, const std::string &value)
    {
        if (key == "voice_id" || key == "id")
            voice.voice_id = value;
        else if (key == "output_format")
            voice.output_format = Poco::toLower(value);
    }

    // Drop comments and lines that are neither a section header nor an assignment,
    // so the INI parser only sees what the schedule format allows.
    std::string filterDocument(const std::string &content, const std::string &source_path)
    {
        std::istringstream raw(content);
        std::ostringstream filtered;
        std::string line;
        int line_number = 0;

        while (std::getline(raw, line))
        {
            ++line_number;
            std::string trimmed = Poco::trim(line);
            if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
                continue;

            if (trimmed.front() == '[' && trimmed.back() == ']')
            {
                filtered << trimmed << '\n';
                continue;
            }

            if (trimmed.find('=') == std::string::npos)
            {
                Logger::warn("ConfigLoader: skipping line " + std::to_string(line_number) + " of " +
                             (source_path.empty() ? std::string("<memory>") : source_path) + ": no '=' found");
                continue;
            }
            filtered << trimmed << '\n';
        }
        return filtered.str();
    }

    std::string formatValue(const std::string &value)
    {
        std::string flat = value;
        for (auto &c : flat)
        {
            if (c == '\n' || c == '\r')
                c = ' ';
        }
        if (!flat.empty() && (std::isspace(static_cast<unsigned char>(flat.front())) ||
                              std::isspace(static_cast<unsigned char>(flat.back()))))
        {
            return "\"" + flat + "\"";
        }
        return flat;
    }

    bool samePath(const std::string &a, const std::string &b)
    {
        return fs::path(a).lexically_normal() == fs::path(b).lexically_normal();
    }
}

std::string selectConfigFile(int weekday)
{
    if (weekday < 0 || weekday > 6)
    {
        return "config.ini";
    }
    return kDayConfigFiles[weekday];
}

int mondayBasedWeekday(std::chrono::system_clock::time_point when)
{
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);
    return (local.tm_wday + 6) % 7;
}

std::string configFileForDate(std::chrono::system_clock::time_point when)
{
    return selectConfigFile(mondayBasedWeekday(when));
}

ConfigLoader::ConfigLoader(std::string config_dir, std::string marker_file, std::string fallback_file)
    : config_dir_(std::move(config_dir)),
      marker_file_(std::move(marker_file)),
      fallback_file_(std::move(fallback_file)),
      clock_([]
             { return std::chrono::system_clock::now(); })
{
}

std::string ConfigLoader::resolve(const std::string &file_name) const
{
    fs::path path(file_name);
    if (path.is_absolute())
        return path.lexically_normal().string();
    return (fs::path(config_dir_) / path).lexically_normal().string();
}

std::string ConfigLoader::currentDayConfigPath() const
{
    return resolve(configFileForDate(clock_()));
}

ConfigSnapshotPtr ConfigLoader::load(const std::optional<std::string> &explicit_path)
{
    std::optional<std::string> path;
    if (explicit_path)
    {
        path = resolve(*explicit_path);
    }

    if (auto requested = consumeReloadMarker())
    {
        path = requested;
    }

    if (!path)
    {
        path = currentDayConfigPath();
    }

    const std::string resolved = resolveExistingPath(*path);
    Logger::info("ConfigLoader: loading configuration from " + resolved);

    std::string content;
    try
    {
        content = readLockedFile(resolved);
    }
    catch (const std::system_error &e)
    {
        if (e.code() == std::errc::no_such_file_or_directory)
        {
            throw ConfigNotFoundError("Config file disappeared before it could be read: " + resolved);
        }
        throw ConfigInvalidError("Cannot read " + resolved + ": " + e.what());
    }

    auto snapshot = std::make_shared<const ConfigSnapshot>(parse(content, resolved));
    Logger::info("ConfigLoader: configuration loaded successfully (" +
                 std::to_string(snapshot->schedule.size()) + " scheduled announcements)");
    return snapshot;
}

std::optional<std::string> ConfigLoader::consumeReloadMarker()
{
    const std::string marker = getMarkerPath();
    std::error_code ec;
    if (!fs::exists(marker, ec))
    {
        return std::nullopt;
    }

    // Claim the marker first. A request that lands after the rename creates a
    // fresh marker and is picked up on the next poll instead of being deleted here.
    std::string claimed = marker + ".consumed";
    fs::rename(marker, claimed, ec);
    if (ec)
    {
        const std::string reason = ec.message();
        if (!fs::exists(marker, ec))
        {
            return std::nullopt;
        }
        Logger::warn("ConfigLoader: could not claim reload marker, consuming it in place: " + reason);
        claimed = marker;
    }

    std::string content;
    try
    {
        content = readLockedFile(claimed);
    }
    catch (const std::system_error &e)
    {
        Logger::warn("ConfigLoader: could not read reload marker: " + std::string(e.what()));
    }

    // The marker goes away whatever it contained, otherwise a stale marker
    // would trigger a reload on every poll.
    try
    {
        LockedFile acknowledge(claimed, FileMode::ReadWrite, LockKind::Exclusive);
        // A writer that created the file but had not locked it yet is done by now
        const std::string settled = acknowledge.readAll();
        if (!Poco::trim(settled).empty())
        {
            content = settled;
        }
        acknowledge.truncate();
        fs::remove(claimed);
    }
    catch (const std::exception &e)
    {
        Logger::warn("ConfigLoader: could not clear reload marker: " + std::string(e.what()));
        fs::remove(claimed, ec);
        if (ec)
        {
            Logger::error("ConfigLoader: reload marker could not be removed: " + ec.message());
        }
    }

    std::optional<std::string> requested;
    const std::string candidate = Poco::trim(content);
    if (!candidate.empty())
    {
        const std::string candidate_path = resolve(candidate);
        if (fs::exists(candidate_path, ec))
        {
            requested = candidate_path;
            Logger::info("ConfigLoader: loading requested configuration from reload marker: " + candidate_path);
        }
        else
        {
            Logger::warn("ConfigLoader: reload marker names a missing file, ignoring it: " + candidate);
        }
    }

    return requested;
}

std::string ConfigLoader::resolveExistingPath(const std::string &path) const
{
    std::error_code ec;
    if (fs::exists(path, ec))
    {
        return path;
    }

    Logger::error("ConfigLoader: config file not found: " + path);
    const std::string fallback = getFallbackPath();
    if (samePath(path, fallback))
    {
        throw ConfigNotFoundError("Config file not found: " + path);
    }

    Logger::warn("ConfigLoader: falling back to default " + fallback);
    if (!fs::exists(fallback, ec))
    {
        throw ConfigNotFoundError("Default config file not found: " + fallback);
    }
    return fallback;
}

ConfigSnapshot ConfigLoader::parse(const std::string &content, const std::string &source_path)
{
    std::istringstream document(filterDocument(content, source_path));

    AutoPtr<IniFileConfiguration> ini;
    try
    {
        ini = new IniFileConfiguration(document);
    }
    catch (const Poco::Exception &e)
    {
        throw ConfigInvalidError("Cannot parse " + source_path + ": " + e.displayText());
    }

    ConfigSnapshot snapshot;
    snapshot.source_path = source_path;

    AbstractConfiguration::Keys sections;
    ini->keys(sections);
    for (const auto &section : sections)
    {
        const std::string name = canonicalSection(Poco::toLower(section));
        if (name.empty())
        {
            Logger::debug("ConfigLoader: ignoring section [" + section + "]");
            continue;
        }

        AbstractConfiguration::Keys keys;
        ini->keys(section, keys);
        for (const auto &key : keys)
        {
            const std::string full_key = section + "." + key;
            if (!ini->has(full_key))
            {
                Logger::warn("ConfigLoader: skipping unsupported key '" + full_key + "'");
                continue;
            }

            const std::string value = stripQuotes(ini->getRawString(full_key));
            if (name == "credentials")
                assignCredential(snapshot.credentials, Poco::toLower(key), value);
            else if (name == "schedule")
                snapshot.schedule[key] = value;
            else if (name == "templates")
                snapshot.templates[Poco::toLower(key)] = value;
            else
                assignVoice(snapshot.voice, Poco::toLower(key), value);
        }
    }

    if (!snapshot.credentials.isComplete())
    {
        throw ConfigInvalidError("Missing required database configuration in " + source_path);
    }
    if (snapshot.voice.voice_id.empty())
    {
        throw ConfigInvalidError("Missing required TTS voice_id configuration in " + source_path);
    }

    return snapshot;
}

void saveConfig(const ConfigSnapshot &snapshot, const std::string &path)
{
    std::ostringstream out;
    const auto &credentials = snapshot.credentials;

    out << "[credentials]\n";
    out << "server = " << formatValue(credentials.server) << "\n";
    out << "database = " << formatValue(credentials.database) << "\n";
    out << "username = " << formatValue(credentials.username) << "\n";
    out << "password = " << formatValue(credentials.password) << "\n";
    if (!credentials.port.empty())
        out << "port = " << formatValue(credentials.port) << "\n";
    if (credentials.printer_group != 1)
        out << "printer_group = " << credentials.printer_group << "\n";
    out << "\n";

    out << "[schedule]\n";
    for (const auto &[time_key, type] : snapshot.schedule)
    {
        out << time_key << " = " << formatValue(type) << "\n";
    }
    out << "\n";

    out << "[templates]\n";
    for (const char *key : kFixedTemplateKeys)
    {
        auto it = snapshot.templates.find(key);
        if (it != snapshot.templates.end())
            out << key << " = " << formatValue(it->second) << "\n";
    }
    for (const auto &[key, text] : snapshot.templates)
    {
        bool fixed = false;
        for (const char *fixed_key : kFixedTemplateKeys)
            fixed = fixed || key == fixed_key;
        if (!fixed)
            out << key << " = " << formatValue(text) << "\n";
    }
    out << "\n";

    out << "[voice]\n";
    out << "voice_id = " << formatValue(snapshot.voice.voice_id) << "\n";
    out << "output_format = " << formatValue(snapshot.voice.output_format) << "\n";

    writeLockedFile(path, out.str());
    Logger::info("ConfigLoader: configuration written to " + path);
}

void copyConfig(const std::string &source_path, const std::string &target_path)
{
    std::error_code ec;
    if (!fs::exists(source_path, ec))
    {
        throw ConfigNotFoundError("Source config does not exist: " + source_path);
    }

    const std::string content = readLockedFile(source_path);
    writeLockedFile(target_path, content);
    Logger::info("ConfigLoader: copied " + source_path + " to " + target_path);
}
