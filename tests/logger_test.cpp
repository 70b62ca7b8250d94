// File: logger_test.cpp
#include "logger.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

TEST(LoggerTest, ParsesLevelNames)
{
    EXPECT_EQ(LogLevel::TRACE, Logger::ParseLogLevel("TRACE"));
    EXPECT_EQ(LogLevel::DEBUG, Logger::ParseLogLevel("debug"));
    EXPECT_EQ(LogLevel::WARN, Logger::ParseLogLevel("Warn"));
    EXPECT_EQ(LogLevel::FATAL, Logger::ParseLogLevel("fatal"));
    EXPECT_THROW(Logger::ParseLogLevel("verbose"), std::invalid_argument);
}

TEST(LoggerTest, WritesJsonLinesAtOrAboveLevel)
{
    auto path = std::filesystem::temp_directory_path() / ("netstream-log-" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);

    LogLevel previous = Logger::GetLogLevel();
    Logger::InitLogFile(path.string());
    Logger::SetLogLevel(LogLevel::WARN);
    Logger::Log(LogLevel::INFO, "hidden");
    Logger::Log(LogLevel::ERROR, "stream failed");
    Logger::SetLogLevel(previous);
    Logger::InitLogFile("/dev/null");

    std::ifstream file(path);
    std::vector<nlohmann::json> lines;
    std::string line;
    while (std::getline(file, line))
    {
        lines.push_back(nlohmann::json::parse(line));
    }
    std::filesystem::remove(path);

    ASSERT_EQ(1u, lines.size());
    EXPECT_EQ("ERROR", lines[0]["level"]);
    EXPECT_EQ("stream failed", lines[0]["message"]);
    EXPECT_TRUE(lines[0].contains("timestamp"));
}

TEST(LoggerTest, LevelIsReadableFromConfigJson)
{
    nlohmann::json config = {{"logLevel", "DEBUG"}};
    EXPECT_EQ(LogLevel::DEBUG, config.value("logLevel", LogLevel::INFO));
}
