// File: network_request.hpp
#pragma once
#include <string>
#include <map>

struct NetworkRequest
{
    std::string url;
    std::string method = "GET";
    std::map<std::string, std::string> headers;

    NetworkRequest() = default;
    explicit NetworkRequest(const std::string &u)
        : url(u) {}

    NetworkRequest &setHeader(const std::string &name, const std::string &value)
    {
        headers[name] = value;
        return *this;
    }
};
