// File: session_configuration.hpp
#pragma once
#include <string>
#include <nlohmann/json.hpp>

enum class NetworkServiceType
{
    Default,
    AvStreaming
};

NLOHMANN_JSON_SERIALIZE_ENUM(NetworkServiceType, {
                                                     {NetworkServiceType::Default, "default"},
                                                     {NetworkServiceType::AvStreaming, "avStreaming"},
                                                 })

struct SessionConfiguration
{
    bool cacheDisabled = true;
    NetworkServiceType serviceType = NetworkServiceType::Default;
    std::string userAgent = "netstream/1.0";
    long connectTimeoutSeconds = 30; // 0 keeps curl's default
    long bufferSize = 100000;
    bool followRedirects = true;
    long maxConcurrentTransfers = 0; // 0 = unlimited
    std::string httpVersion = "2";   // "1.1" or "2"

    /// Defaults for audio streaming: no cache, AV service type.
    static SessionConfiguration networkingConfiguration();

    /// Reads a JSON object on top of networkingConfiguration(). Throws std::runtime_error.
    static SessionConfiguration fromFile(const std::string &path);
    static SessionConfiguration fromJson(const nlohmann::json &config);
};
