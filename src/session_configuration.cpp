// File: session_configuration.cpp
#include "session_configuration.hpp"
#include "logger.hpp"
#include <fstream>
#include <stdexcept>

SessionConfiguration SessionConfiguration::networkingConfiguration()
{
    SessionConfiguration configuration;
    configuration.serviceType = NetworkServiceType::AvStreaming;
    configuration.cacheDisabled = true;
    return configuration;
}

SessionConfiguration SessionConfiguration::fromFile(const std::string &path)
{
    std::ifstream configFile(path);
    if (!configFile.is_open())
    {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json config;
    try
    {
        configFile >> config;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    Logger::Log(LogLevel::DEBUG, "SessionConfiguration::fromFile: Loaded " + path);
    return fromJson(config);
}

SessionConfiguration SessionConfiguration::fromJson(const nlohmann::json &config)
{
    if (!config.is_object())
    {
        throw std::runtime_error("Session configuration must be a JSON object");
    }

    SessionConfiguration configuration = networkingConfiguration();
    try
    {
        configuration.cacheDisabled = config.value("cacheDisabled", configuration.cacheDisabled);
        configuration.serviceType = config.value("serviceType", configuration.serviceType);
        configuration.userAgent = config.value("userAgent", configuration.userAgent);
        configuration.connectTimeoutSeconds = config.value("connectTimeoutSeconds", configuration.connectTimeoutSeconds);
        configuration.bufferSize = config.value("bufferSize", configuration.bufferSize);
        configuration.followRedirects = config.value("followRedirects", configuration.followRedirects);
        configuration.maxConcurrentTransfers = config.value("maxConcurrentTransfers", configuration.maxConcurrentTransfers);
        configuration.httpVersion = config.value("httpVersion", configuration.httpVersion);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error("Invalid session configuration: " + std::string(e.what()));
    }

    if (configuration.httpVersion != "1.1" && configuration.httpVersion != "2")
    {
        throw std::runtime_error("Invalid session configuration: httpVersion must be \"1.1\" or \"2\"");
    }
    if (configuration.bufferSize <= 0 || configuration.connectTimeoutSeconds < 0 || configuration.maxConcurrentTransfers < 0)
    {
        throw std::runtime_error("Invalid session configuration: negative or zero size");
    }
    return configuration;
}
