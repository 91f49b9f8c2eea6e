#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Configure level and, when log_file is non-empty, add a file sink
     * next to the console sink. Call once before any worker thread starts.
     */
    static void init(const std::string &log_level = "INFO", const std::string &log_file = "")
    {
        auto logger = getLogger();

        if (!log_file.empty())
        {
            try
            {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
                logger->sinks().push_back(file_sink);
            }
            catch (const spdlog::spdlog_ex &e)
            {
                warn("Could not open log file " + log_file + ": " + e.what());
            }
        }

        logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger->set_level(toSpdlogLevel(log_level));
        logger->flush_on(spdlog::level::warn);
    }

    static bool isValidLevel(const std::string &log_level)
    {
        return log_level == "TRACE" || log_level == "DEBUG" || log_level == "INFO" ||
               log_level == "WARN" || log_level == "ERROR";
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

    static void critical(const std::string &message)
    {
        log(Level::CRITICAL, message);
    }

    static void flush()
    {
        getLogger()->flush();
    }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stdout_color_mt("announcer");
        return logger;
    }

    static spdlog::level::level_enum toSpdlogLevel(const std::string &log_level)
    {
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "WARN")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;
        return spdlog::level::info;
    }

    static void log(Level level, const std::string &message)
    {
        auto logger = getLogger();
        switch (level)
        {
        case Level::TRACE:
            logger->trace(message);
            break;
        case Level::DEBUG:
            logger->debug(message);
            break;
        case Level::INFO:
            logger->info(message);
            break;
        case Level::WARN:
            logger->warn(message);
            break;
        case Level::ERROR:
            logger->error(message);
            break;
        case Level::CRITICAL:
            logger->critical(message);
            break;
        }
    }
};
