#pragma once
#include <string>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>

enum class LogLevel
{
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

NLOHMANN_JSON_SERIALIZE_ENUM(LogLevel, {
                                           {LogLevel::TRACE, "TRACE"},
                                           {LogLevel::DEBUG, "DEBUG"},
                                           {LogLevel::INFO, "INFO"},
                                           {LogLevel::WARN, "WARN"},
                                           {LogLevel::ERROR, "ERROR"},
                                           {LogLevel::FATAL, "FATAL"},
                                       })

class Logger
{
public:
    static void InitLogFile(const std::string &filePath);
    static void Log(LogLevel level, const std::string &msg);

    // Throws std::invalid_argument on an unknown name
    static LogLevel ParseLogLevel(const std::string &name);
    static std::string ToString(LogLevel level);

    static void SetLogLevel(LogLevel level)
    {
        currentLogLevel = level;
    }

    static LogLevel GetLogLevel()
    {
        return currentLogLevel;
    }

    static void SetDebug(bool debug)
    {
        setDebug = debug;
    }

private:
    static std::ofstream g_logFile;
    static std::mutex g_logMutex;
    static LogLevel currentLogLevel;
    static bool setDebug;
};
