// File: stream_types.cpp
#include "stream_types.hpp"
#include <algorithm>
#include <cctype>

std::string ToString(DataStreamError error)
{
    switch (error)
    {
    case DataStreamError::Unknown:
        return "unknown";
    case DataStreamError::SessionDeinit:
        return "session deinitialized";
    case DataStreamError::TransportFailure:
        return "transport failure";
    case DataStreamError::HttpStatus:
        return "http status";
    case DataStreamError::Cancelled:
        return "cancelled";
    default:
        return "unknown";
    }
}

std::optional<std::string> StreamResponse::header(const std::string &name) const
{
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    auto it = headers.find(key);
    if (it == headers.end())
    {
        return std::nullopt;
    }
    return it->second;
}
