// File: main.cpp
#include "networking_client.hpp"
#include "session_configuration.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

std::atomic<bool> exitRequested{false};

// Signal handler to gracefully exit
void handleSignal(int signal)
{
    if (signal == SIGINT || signal == SIGTERM)
    {
        exitRequested = true;
    }
}

struct StreamSink
{
    std::string url;
    std::unique_ptr<std::ofstream> file;
    std::atomic<uint64_t> bytes{0};
};

void printUsage()
{
    std::cout << "Usage: ./netstream [options] <url>...\n"
              << "--config <path>                 Path to the session configuration file\n"
              << "--debug                         Enable debug mode (equivalent to --log-level DEBUG)\n"
              << "--log-level <level>             Set log level (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)\n"
              << "--log-file <path>               Write JSON log lines to this file\n"
              << "--output <dir>                  Write each stream to <dir>/stream-<n>.bin\n"
              << "--header \"Name: value\"         Add a request header (repeatable)\n";
}

int main(int argc, char *argv[])
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    LogLevel logLevel = LogLevel::INFO;
    bool debugMode = false;
    std::string configFilePath;
    std::string logFilePath;
    std::string outputDir;
    std::vector<std::string> urls;
    std::vector<std::pair<std::string, std::string>> extraHeaders;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help")
        {
            printUsage();
            return 0;
        }
        else if (arg == "--debug")
        {
            debugMode = true;
            logLevel = LogLevel::DEBUG;
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            try
            {
                logLevel = Logger::ParseLogLevel(argv[++i]);
            }
            catch (const std::invalid_argument &e)
            {
                std::cerr << e.what() << std::endl;
                return 1;
            }
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            configFilePath = argv[++i];
        }
        else if (arg == "--log-file" && i + 1 < argc)
        {
            logFilePath = argv[++i];
        }
        else if (arg == "--output" && i + 1 < argc)
        {
            outputDir = argv[++i];
        }
        else if (arg == "--header" && i + 1 < argc)
        {
            std::string header = argv[++i];
            auto colon = header.find(':');
            if (colon == std::string::npos || colon == 0)
            {
                std::cerr << "Invalid header, expected \"Name: value\": " << header << std::endl;
                return 1;
            }
            std::string value = header.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));
            extraHeaders.emplace_back(header.substr(0, colon), value);
        }
        else if (arg.rfind("--", 0) == 0)
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage();
            return 1;
        }
        else
        {
            urls.push_back(arg);
        }
    }

    if (urls.empty())
    {
        std::cerr << "Error: at least one URL is required." << std::endl;
        printUsage();
        return 1;
    }

    if (!logFilePath.empty())
    {
        Logger::InitLogFile(logFilePath);
    }
    Logger::SetLogLevel(logLevel);
    Logger::SetDebug(debugMode || logFilePath.empty());
    Logger::Log(LogLevel::INFO, "netstream starting...");

    SessionConfiguration configuration = SessionConfiguration::networkingConfiguration();
    if (!configFilePath.empty())
    {
        try
        {
            configuration = SessionConfiguration::fromFile(configFilePath);
            Logger::Log(LogLevel::INFO, "Configuration loaded from: " + configFilePath);
        }
        catch (const std::exception &e)
        {
            Logger::Log(LogLevel::ERROR, "Failed to load config file: " + std::string(e.what()));
            return 1;
        }
    }

    // Completion handlers reference these; they must outlive the client.
    std::mutex doneMutex;
    std::condition_variable doneCondition;
    size_t remaining = urls.size();
    std::atomic<int> failures{0};

    std::shared_ptr<NetworkingClient> client;
    try
    {
        client = NetworkingClient::create(configuration);
    }
    catch (const std::exception &e)
    {
        Logger::Log(LogLevel::FATAL, "Failed to create networking client: " + std::string(e.what()));
        return 1;
    }

    std::vector<std::shared_ptr<StreamSink>> sinks;
    for (size_t index = 0; index < urls.size(); ++index)
    {
        auto sink = std::make_shared<StreamSink>();
        sink->url = urls[index];
        if (!outputDir.empty())
        {
            std::string path = outputDir + "/stream-" + std::to_string(index) + ".bin";
            sink->file = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
            if (!sink->file->good())
            {
                Logger::Log(LogLevel::ERROR, "Could not open output file: " + path);
                return 1;
            }
        }
        sinks.push_back(sink);

        StreamHandlers handlers;
        handlers.onResponse = [sink](const StreamResponse &response)
        {
            auto contentType = response.header("Content-Type");
            Logger::Log(LogLevel::INFO, "Response " + std::to_string(response.statusCode) + " for " + sink->url +
                                            (contentType ? " (" + *contentType + ")" : "") +
                                            (response.expectedContentLength >= 0 ? ", " + std::to_string(response.expectedContentLength) + " bytes expected" : ""));
        };
        handlers.onData = [sink](const std::string &data)
        {
            sink->bytes += data.size();
            if (sink->file)
            {
                sink->file->write(data.data(), static_cast<std::streamsize>(data.size()));
            }
        };
        handlers.onComplete = [sink, &doneMutex, &doneCondition, &remaining, &failures](const StreamCompletion &completion)
        {
            if (completion.succeeded())
            {
                Logger::Log(LogLevel::INFO, "Finished " + sink->url + " after " + std::to_string(sink->bytes.load()) + " bytes.");
            }
            else
            {
                ++failures;
                Logger::Log(LogLevel::ERROR, "Stream " + sink->url + " ended: " + ToString(*completion.error) + " " + completion.message);
            }
            if (sink->file)
            {
                sink->file->flush();
            }

            std::lock_guard<std::mutex> lock(doneMutex);
            --remaining;
            doneCondition.notify_all();
        };

        NetworkRequest request(sink->url);
        for (const auto &header : extraHeaders)
        {
            request.setHeader(header.first, header.second);
        }
        client->stream(request, std::move(handlers));
    }

    bool cancelled = false;
    std::unique_lock<std::mutex> lock(doneMutex);
    while (remaining > 0)
    {
        doneCondition.wait_for(lock, std::chrono::milliseconds(200));
        if (exitRequested && !cancelled)
        {
            Logger::Log(LogLevel::INFO, "Interrupted, cancelling all streams...");
            cancelled = true;
            lock.unlock();
            client->cancelAllRequest();
            lock.lock();
        }
    }
    lock.unlock();

    client.reset();
    Logger::Log(LogLevel::INFO, "netstream exited cleanly.");
    return failures > 0 && !cancelled ? 2 : 0;
}
