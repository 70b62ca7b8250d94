// File: curl_session.cpp
#include "curl_session.hpp"
#include "logger.hpp"
#include <netinet/in.h>
#include <netinet/ip.h>
#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace
{
    // AF41, the DSCP class for interactive audio/video.
    constexpr int kAvStreamingTos = 0x88;

    void ensureCurlGlobalInit()
    {
        static std::once_flag flag;
        static CURLcode result = CURLE_OK;
        std::call_once(flag, []
                       { result = curl_global_init(CURL_GLOBAL_ALL); });
        if (result != CURLE_OK)
        {
            throw std::runtime_error("curl_global_init failed: " + std::string(curl_easy_strerror(result)));
        }
    }

    std::string trim(const std::string &value)
    {
        auto begin = value.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
        {
            return "";
        }
        auto end = value.find_last_not_of(" \t\r\n");
        return value.substr(begin, end - begin + 1);
    }
}

CurlTransportTask::CurlTransportTask(uint64_t identifier, CURL *easyHandle, curl_slist *headers, std::weak_ptr<CurlSession> session)
    : identifier_(identifier), easyHandle_(easyHandle), headers_(headers), session_(std::move(session))
{
}

CurlTransportTask::~CurlTransportTask()
{
    curl_easy_cleanup(easyHandle_);
    curl_slist_free_all(headers_);
}

uint64_t CurlTransportTask::taskIdentifier() const
{
    return identifier_;
}

void CurlTransportTask::resume()
{
    if (resumed_.exchange(true))
    {
        return;
    }

    auto session = session_.lock();
    if (!session)
    {
        Logger::Log(LogLevel::WARN, "CurlTransportTask::resume: Session is gone, task " + std::to_string(identifier_) + " will not run.");
        return;
    }
    session->schedule(CurlSession::Command::Add, shared_from_this());
}

void CurlTransportTask::cancel()
{
    if (cancelled_.exchange(true))
    {
        return;
    }

    Logger::Log(LogLevel::DEBUG, "CurlTransportTask::cancel: Cancelling task " + std::to_string(identifier_));
    if (auto session = session_.lock())
    {
        session->schedule(CurlSession::Command::Remove, shared_from_this());
    }
}

bool CurlTransportTask::isCancelled() const
{
    return cancelled_;
}

CurlSession::CurlSession(SessionConfiguration configuration,
                         std::weak_ptr<ITransportSessionDelegate> delegate,
                         std::shared_ptr<DispatchQueue> delegateQueue)
    : configuration_(std::move(configuration)),
      delegate_(std::move(delegate)),
      delegateQueue_(std::move(delegateQueue))
{
    if (!delegateQueue_)
    {
        throw std::invalid_argument("CurlSession requires a delegate queue");
    }

    ensureCurlGlobalInit();
    multiHandle_ = curl_multi_init();
    if (!multiHandle_)
    {
        throw std::runtime_error("Failed to initialize CURL multi handle");
    }

    if (configuration_.maxConcurrentTransfers > 0)
    {
        curl_multi_setopt(multiHandle_, CURLMOPT_MAX_TOTAL_CONNECTIONS, configuration_.maxConcurrentTransfers);
    }

    workerThread_ = std::thread(&CurlSession::eventLoop, this);
}

CurlSession::~CurlSession()
{
    invalidateAndCancel();
    curl_multi_cleanup(multiHandle_);
}

std::shared_ptr<ITransportTask> CurlSession::dataTask(const NetworkRequest &request)
{
    if (invalidated_)
    {
        return nullptr;
    }

    CURL *easyHandle = curl_easy_init();
    if (!easyHandle)
    {
        throw std::runtime_error("Failed to initialize CURL easy handle");
    }

    curl_slist *headers = nullptr;
    try
    {
        headers = configure(easyHandle, request);
    }
    catch (...)
    {
        curl_easy_cleanup(easyHandle);
        throw;
    }

    auto task = std::make_shared<CurlTransportTask>(nextTaskIdentifier_++, easyHandle, headers, weak_from_this());
    curl_easy_setopt(easyHandle, CURLOPT_WRITEDATA, task.get());
    curl_easy_setopt(easyHandle, CURLOPT_HEADERDATA, task.get());
    curl_easy_setopt(easyHandle, CURLOPT_ERRORBUFFER, task->errorBuffer_);

    Logger::Log(LogLevel::DEBUG, "CurlSession::dataTask: Created task " + std::to_string(task->taskIdentifier()) + " for " + request.url);
    return task;
}

void CurlSession::finishTasksAndInvalidate()
{
    Logger::Log(LogLevel::INFO, "CurlSession::finishTasksAndInvalidate: No new tasks accepted.");
    invalidated_ = true;
    finishing_ = true;
    curl_multi_wakeup(multiHandle_);
}

void CurlSession::invalidateAndCancel()
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    invalidated_ = true;
    isRunning_ = false;
    curl_multi_wakeup(multiHandle_);

    if (workerThread_.joinable() && workerThread_.get_id() != std::this_thread::get_id())
    {
        workerThread_.join();
        Logger::Log(LogLevel::DEBUG, "CurlSession::invalidateAndCancel: Event loop stopped.");
    }
}

bool CurlSession::isInvalidated() const
{
    return invalidated_;
}

curl_slist *CurlSession::configure(CURL *easyHandle, const NetworkRequest &request) const
{
    curl_easy_setopt(easyHandle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(easyHandle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(easyHandle, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(easyHandle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easyHandle, CURLOPT_TIMEOUT, 0L);
    curl_easy_setopt(easyHandle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(easyHandle, CURLOPT_BUFFERSIZE, configuration_.bufferSize);
    curl_easy_setopt(easyHandle, CURLOPT_FOLLOWLOCATION, configuration_.followRedirects ? 1L : 0L);
    curl_easy_setopt(easyHandle, CURLOPT_USERAGENT, configuration_.userAgent.c_str());
    curl_easy_setopt(easyHandle, CURLOPT_HTTP_VERSION,
                     static_cast<long>(configuration_.httpVersion == "2" ? CURL_HTTP_VERSION_2TLS : CURL_HTTP_VERSION_1_1));

    if (configuration_.connectTimeoutSeconds > 0)
    {
        curl_easy_setopt(easyHandle, CURLOPT_CONNECTTIMEOUT, configuration_.connectTimeoutSeconds);
    }

    if (request.method == "HEAD")
    {
        curl_easy_setopt(easyHandle, CURLOPT_NOBODY, 1L);
    }
    else if (request.method != "GET")
    {
        curl_easy_setopt(easyHandle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (configuration_.serviceType == NetworkServiceType::AvStreaming)
    {
        curl_easy_setopt(easyHandle, CURLOPT_SOCKOPTFUNCTION, sockoptCallback);
    }

    std::vector<std::string> lines;
    if (configuration_.cacheDisabled)
    {
        lines.push_back("Cache-Control: no-cache");
        lines.push_back("Pragma: no-cache");
    }
    for (const auto &header : request.headers)
    {
        lines.push_back(header.first + ": " + header.second);
    }

    curl_slist *headers = nullptr;
    for (const auto &line : lines)
    {
        curl_slist *appended = curl_slist_append(headers, line.c_str());
        if (!appended)
        {
            curl_slist_free_all(headers);
            throw std::runtime_error("Failed to build request headers for " + request.url);
        }
        headers = appended;
    }

    if (headers)
    {
        curl_easy_setopt(easyHandle, CURLOPT_HTTPHEADER, headers);
    }
    return headers;
}

void CurlSession::schedule(Command command, std::shared_ptr<CurlTransportTask> task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!loopExited_)
        {
            commands_.emplace_back(command, std::move(task));
            curl_multi_wakeup(multiHandle_);
            return;
        }
    }

    if (command == Command::Add)
    {
        finishTask(task, StreamCompletion::failure(DataStreamError::SessionDeinit, "Session is invalidated"));
    }
}

void CurlSession::eventLoop()
{
    Logger::Log(LogLevel::INFO, "CurlSession::eventLoop: Started.");

    while (isRunning_)
    {
        processCommands();

        int runningHandles = 0;
        CURLMcode code = curl_multi_perform(multiHandle_, &runningHandles);
        if (code != CURLM_OK)
        {
            Logger::Log(LogLevel::ERROR, "CurlSession::eventLoop: curl_multi_perform failed: " + std::string(curl_multi_strerror(code)));
        }

        processMessages();

        if (finishing_ && running_.empty())
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (commands_.empty())
            {
                break;
            }
        }

        code = curl_multi_poll(multiHandle_, nullptr, 0, 1000, nullptr);
        if (code != CURLM_OK)
        {
            Logger::Log(LogLevel::ERROR, "CurlSession::eventLoop: curl_multi_poll failed: " + std::string(curl_multi_strerror(code)));
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    teardown();
    Logger::Log(LogLevel::INFO, "CurlSession::eventLoop: Exiting.");
}

void CurlSession::processCommands()
{
    std::vector<std::pair<Command, std::shared_ptr<CurlTransportTask>>> commands;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        commands.swap(commands_);
    }

    for (auto &entry : commands)
    {
        auto &task = entry.second;
        if (entry.first == Command::Add)
        {
            if (task->cancelled_)
            {
                finishTask(task, StreamCompletion::failure(DataStreamError::Cancelled, "Task cancelled"));
                continue;
            }
            if (running_.count(task->easyHandle_) > 0)
            {
                continue;
            }

            task->owner_ = this;
            CURLMcode code = curl_multi_add_handle(multiHandle_, task->easyHandle_);
            if (code != CURLM_OK)
            {
                finishTask(task, StreamCompletion::failure(DataStreamError::TransportFailure, curl_multi_strerror(code)));
                continue;
            }
            running_[task->easyHandle_] = task;
            Logger::Log(LogLevel::DEBUG, "CurlSession::processCommands: Task " + std::to_string(task->identifier_) + " started.");
        }
        else
        {
            auto it = running_.find(task->easyHandle_);
            if (it == running_.end())
            {
                continue;
            }
            curl_multi_remove_handle(multiHandle_, task->easyHandle_);
            running_.erase(it);
            finishTask(task, StreamCompletion::failure(DataStreamError::Cancelled, "Task cancelled"));
        }
    }
}

void CurlSession::processMessages()
{
    int numMessages = 0;
    CURLMsg *msg = nullptr;
    while ((msg = curl_multi_info_read(multiHandle_, &numMessages)))
    {
        if (msg->msg != CURLMSG_DONE)
        {
            continue;
        }

        CURL *easyHandle = msg->easy_handle;
        CURLcode result = msg->data.result;
        curl_multi_remove_handle(multiHandle_, easyHandle);

        auto it = running_.find(easyHandle);
        if (it == running_.end())
        {
            continue;
        }
        auto task = it->second;
        running_.erase(it);

        if (task->cancelled_)
        {
            finishTask(task, StreamCompletion::failure(DataStreamError::Cancelled, "Task cancelled"));
            continue;
        }

        if (result != CURLE_OK)
        {
            std::string message = task->errorBuffer_[0] != '\0' ? std::string(task->errorBuffer_) : std::string(curl_easy_strerror(result));
            finishTask(task, StreamCompletion::failure(DataStreamError::TransportFailure, message, task->response_.statusCode));
            continue;
        }

        if (!task->responseDelivered_)
        {
            deliverResponse(*task);
        }

        long status = task->response_.statusCode;
        if (status >= 400)
        {
            finishTask(task, StreamCompletion::failure(DataStreamError::HttpStatus, "HTTP status " + std::to_string(status), status));
        }
        else
        {
            finishTask(task, StreamCompletion::success(status));
        }
    }
}

void CurlSession::teardown()
{
    std::vector<std::pair<Command, std::shared_ptr<CurlTransportTask>>> commands;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loopExited_ = true;
        commands.swap(commands_);
    }

    for (auto &entry : running_)
    {
        curl_multi_remove_handle(multiHandle_, entry.first);
        finishTask(entry.second, entry.second->cancelled_
                                     ? StreamCompletion::failure(DataStreamError::Cancelled, "Task cancelled")
                                     : StreamCompletion::failure(DataStreamError::SessionDeinit, "Session is invalidated"));
    }
    running_.clear();

    for (auto &entry : commands)
    {
        if (entry.first == Command::Add)
        {
            finishTask(entry.second, StreamCompletion::failure(DataStreamError::SessionDeinit, "Session is invalidated"));
        }
    }
}

void CurlSession::finishTask(const std::shared_ptr<CurlTransportTask> &task, const StreamCompletion &completion)
{
    Logger::Log(LogLevel::DEBUG, "CurlSession::finishTask: Task " + std::to_string(task->identifier_) + " completed" +
                                     (completion.succeeded() ? "." : ": " + completion.message));
    post([task, completion](ITransportSessionDelegate &delegate)
         { delegate.didComplete(task, completion); });
}

void CurlSession::deliverResponse(CurlTransportTask &task)
{
    long status = 0;
    curl_easy_getinfo(task.easyHandle_, CURLINFO_RESPONSE_CODE, &status);
    curl_off_t length = -1;
    curl_easy_getinfo(task.easyHandle_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

    task.response_.statusCode = status;
    task.response_.expectedContentLength = static_cast<long long>(length);
    task.responseDelivered_ = true;

    auto self = task.shared_from_this();
    StreamResponse response = task.response_;
    post([self, response](ITransportSessionDelegate &delegate)
         { delegate.didReceiveResponse(self, response); });
}

void CurlSession::post(std::function<void(ITransportSessionDelegate &)> event)
{
    std::weak_ptr<ITransportSessionDelegate> delegate = delegate_;
    delegateQueue_->async([delegate, event = std::move(event)]()
                          {
        if (auto target = delegate.lock())
        {
            event(*target);
        } });
}

size_t CurlSession::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *task = static_cast<CurlTransportTask *>(userdata);
    size_t total = size * nmemb;

    if (task->cancelled_)
    {
        return 0; // Abort the transfer
    }

    if (!task->responseDelivered_)
    {
        task->owner_->deliverResponse(*task);
    }

    // Error bodies are not stream data.
    if (task->response_.statusCode >= 400)
    {
        return total;
    }

    auto self = task->shared_from_this();
    std::string chunk(ptr, total);
    task->owner_->post([self, chunk = std::move(chunk)](ITransportSessionDelegate &delegate)
                       { delegate.didReceiveData(self, chunk); });
    return total;
}

size_t CurlSession::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    auto *task = static_cast<CurlTransportTask *>(userdata);
    size_t total = size * nitems;
    std::string line = trim(std::string(buffer, total));

    if (line.rfind("HTTP/", 0) == 0)
    {
        // A new response begins, e.g. after a redirect.
        task->response_.headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos)
    {
        std::string name = trim(line.substr(0, colon));
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        task->response_.headers[name] = trim(line.substr(colon + 1));
    }
    return total;
}

int CurlSession::sockoptCallback(void *clientp, curl_socket_t curlfd, curlsocktype purpose)
{
    (void)clientp;
    if (purpose != CURLSOCKTYPE_IPCXN)
    {
        return CURL_SOCKOPT_OK;
    }

    int tos = kAvStreamingTos;
    if (setsockopt(curlfd, IPPROTO_IP, IP_TOS, &tos, sizeof(tos)) != 0 &&
        setsockopt(curlfd, IPPROTO_IPV6, IPV6_TCLASS, &tos, sizeof(tos)) != 0)
    {
        Logger::Log(LogLevel::DEBUG, "CurlSession::sockoptCallback: Could not set traffic class on socket.");
    }
    return CURL_SOCKOPT_OK;
}
