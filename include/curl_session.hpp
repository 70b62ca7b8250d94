// File: curl_session.hpp
#pragma once

#include "dispatch_queue.hpp"
#include "session_configuration.hpp"
#include "transport.hpp"
#include <curl/curl.h>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class CurlSession;

class CurlTransportTask : public ITransportTask, public std::enable_shared_from_this<CurlTransportTask>
{
public:
    CurlTransportTask(uint64_t identifier, CURL *easyHandle, curl_slist *headers, std::weak_ptr<CurlSession> session);
    ~CurlTransportTask() override;

    CurlTransportTask(const CurlTransportTask &) = delete;
    CurlTransportTask &operator=(const CurlTransportTask &) = delete;

    uint64_t taskIdentifier() const override;
    void resume() override;
    void cancel() override;
    bool isCancelled() const override;

private:
    friend class CurlSession;

    const uint64_t identifier_;
    CURL *easyHandle_;
    curl_slist *headers_;
    std::weak_ptr<CurlSession> session_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> resumed_{false};

    // Event loop thread only.
    CurlSession *owner_ = nullptr;
    StreamResponse response_;
    bool responseDelivered_ = false;
    char errorBuffer_[CURL_ERROR_SIZE] = {};
};

/// Transport engine on top of the libcurl multi interface. One event loop thread
/// drives every transfer; callbacks are posted in order to the delegate queue.
class CurlSession : public ITransportSession, public std::enable_shared_from_this<CurlSession>
{
public:
    CurlSession(SessionConfiguration configuration,
                std::weak_ptr<ITransportSessionDelegate> delegate,
                std::shared_ptr<DispatchQueue> delegateQueue);
    ~CurlSession() override;

    CurlSession(const CurlSession &) = delete;
    CurlSession &operator=(const CurlSession &) = delete;

    std::shared_ptr<ITransportTask> dataTask(const NetworkRequest &request) override;
    void finishTasksAndInvalidate() override;
    void invalidateAndCancel() override;
    bool isInvalidated() const override;

private:
    friend class CurlTransportTask;

    enum class Command
    {
        Add,
        Remove
    };

    void schedule(Command command, std::shared_ptr<CurlTransportTask> task);
    void eventLoop();
    void processCommands();
    void processMessages();
    void teardown();
    void finishTask(const std::shared_ptr<CurlTransportTask> &task, const StreamCompletion &completion);
    void deliverResponse(CurlTransportTask &task);
    void post(std::function<void(ITransportSessionDelegate &)> event);
    curl_slist *configure(CURL *easyHandle, const NetworkRequest &request) const;

    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);
    static int sockoptCallback(void *clientp, curl_socket_t curlfd, curlsocktype purpose);

    SessionConfiguration configuration_;
    std::weak_ptr<ITransportSessionDelegate> delegate_;
    std::shared_ptr<DispatchQueue> delegateQueue_;

    CURLM *multiHandle_;
    std::thread workerThread_;
    std::atomic<bool> isRunning_{true};
    std::atomic<bool> invalidated_{false};
    std::atomic<bool> finishing_{false};
    std::atomic<uint64_t> nextTaskIdentifier_{1};

    std::mutex mutex_;
    std::vector<std::pair<Command, std::shared_ptr<CurlTransportTask>>> commands_;
    bool loopExited_ = false;
    std::mutex lifecycleMutex_;

    // Event loop thread only.
    std::map<CURL *, std::shared_ptr<CurlTransportTask>> running_;
};
