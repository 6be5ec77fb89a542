#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
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
        ERROR
    };

    static void init(const std::string &log_level = "INFO")
    {
        bool known = true;
        getLogger()->set_level(toSpdlogLevel(log_level, known));
    }

    static void setLevel(const std::string &log_level)
    {
        bool known = true;
        auto level = toSpdlogLevel(log_level, known);
        if (!known)
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }

        getLogger()->set_level(level);
        info("Log level changed to: " + log_level);
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

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stdout_color_mt("media_dedup");
        return logger;
    }

    // Accepts the plugin-era spelling "WARNING" as well as "WARN"
    static spdlog::level::level_enum toSpdlogLevel(std::string log_level, bool &known)
    {
        std::transform(log_level.begin(), log_level.end(), log_level.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });

        known = true;
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "INFO")
            return spdlog::level::info;
        if (log_level == "WARN" || log_level == "WARNING")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;

        known = false;
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
        }
    }
};
