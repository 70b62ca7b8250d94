// File: stream_types.hpp
#pragma once
#include <string>
#include <map>
#include <optional>

enum class DataStreamError
{
    Unknown,
    SessionDeinit,
    TransportFailure,
    HttpStatus,
    Cancelled
};

std::string ToString(DataStreamError error);

struct StreamResponse
{
    long statusCode = 0;
    std::map<std::string, std::string> headers; // lower-cased names
    long long expectedContentLength = -1;        // -1 when unknown

    std::optional<std::string> header(const std::string &name) const;
};

struct StreamCompletion
{
    std::optional<DataStreamError> error; // empty on success
    std::string message;
    long statusCode = 0;

    bool succeeded() const
    {
        return !error.has_value();
    }

    static StreamCompletion success(long status = 0)
    {
        StreamCompletion completion;
        completion.statusCode = status;
        return completion;
    }

    static StreamCompletion failure(DataStreamError err, std::string msg, long status = 0)
    {
        StreamCompletion completion;
        completion.error = err;
        completion.message = std::move(msg);
        completion.statusCode = status;
        return completion;
    }
};
