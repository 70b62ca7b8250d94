// File: networking_client.cpp
#include "networking_client.hpp"
#include "curl_session.hpp"
#include "logger.hpp"
#include <stdexcept>

std::shared_ptr<NetworkingClient> NetworkingClient::create(const SessionConfiguration &configuration)
{
    auto networkQueue = std::make_shared<DispatchQueue>("netstream.session.network.queue");
    auto delegate = std::make_shared<NetworkSessionDelegate>();
    auto session = std::make_shared<CurlSession>(configuration, delegate, networkQueue);
    return create(std::move(networkQueue), std::move(delegate), std::move(session));
}

std::shared_ptr<NetworkingClient> NetworkingClient::create(std::shared_ptr<DispatchQueue> networkQueue,
                                                           std::shared_ptr<NetworkSessionDelegate> delegate,
                                                           std::shared_ptr<ITransportSession> session)
{
    if (!networkQueue || !delegate || !session)
    {
        throw std::invalid_argument("NetworkingClient requires a queue, a delegate and a session");
    }

    auto client = std::make_shared<NetworkingClient>(PrivateTag{}, std::move(networkQueue), std::move(delegate), std::move(session));
    client->delegate_->setTaskProvider(client);
    return client;
}

NetworkingClient::NetworkingClient(PrivateTag,
                                   std::shared_ptr<DispatchQueue> networkQueue,
                                   std::shared_ptr<NetworkSessionDelegate> delegate,
                                   std::shared_ptr<ITransportSession> session)
    : networkQueue_(std::move(networkQueue)),
      delegate_(std::move(delegate)),
      session_(std::move(session))
{
    Logger::Log(LogLevel::DEBUG, "NetworkingClient::NetworkingClient: Created on queue " + networkQueue_->label());
}

NetworkingClient::~NetworkingClient()
{
    Logger::Log(LogLevel::INFO, "NetworkingClient::~NetworkingClient: Invalidating session.");

    std::vector<NetworkDataStreamPtr> outstanding;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &entry : activeTasks_)
        {
            outstanding.push_back(entry.second);
        }
        for (auto &entry : pendingTasks_)
        {
            outstanding.push_back(entry.second);
        }
        activeTasks_.clear();
        pendingTasks_.clear();
        tasks_ = NetworkTasksMap();
    }

    session_->invalidateAndCancel();
    for (auto &stream : outstanding)
    {
        stream->invalidate();
    }

    // Completion handlers posted by invalidate() must run before the queue goes away.
    if (!networkQueue_->isCurrent())
    {
        networkQueue_->drain();
    }
}

NetworkDataStreamPtr NetworkingClient::stream(const NetworkRequest &request, StreamHandlers handlers)
{
    auto stream = std::make_shared<NetworkDataStream>(NetworkDataStream::makeId(), networkQueue_);
    stream->setHandlers(std::move(handlers));

    std::weak_ptr<NetworkingClient> weakSelf = weak_from_this();
    stream->setFinishHook([weakSelf](const NetworkDataStreamPtr &finished)
                          {
        if (auto self = weakSelf.lock())
        {
            self->remove(*finished);
        } });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingTasks_[stream->id()] = stream;
    }

    Logger::Log(LogLevel::INFO, "NetworkingClient::stream: Stream " + stream->description() + " scheduled for " + request.url);
    setupRequest(stream, request);
    return stream;
}

void NetworkingClient::cancelAllRequest()
{
    std::vector<NetworkDataStreamPtr> streams;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        streams.reserve(activeTasks_.size() + pendingTasks_.size());
        for (auto &entry : activeTasks_)
        {
            streams.push_back(entry.second);
        }
        for (auto &entry : pendingTasks_)
        {
            streams.push_back(entry.second);
        }
        activeTasks_.clear();
        pendingTasks_.clear();
        tasks_ = NetworkTasksMap();
    }

    Logger::Log(LogLevel::INFO, "NetworkingClient::cancelAllRequest: Cancelling " + std::to_string(streams.size()) + " streams.");
    networkQueue_->async([streams = std::move(streams)]()
                         {
        for (auto &stream : streams)
        {
            stream->cancel();
        } });
}

void NetworkingClient::remove(const NetworkDataStream &stream)
{
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = activeTasks_.erase(stream.id()) > 0;
        removed = pendingTasks_.erase(stream.id()) > 0 || removed;
        removed = tasks_.remove(stream) || removed;
    }

    if (removed)
    {
        Logger::Log(LogLevel::DEBUG, "NetworkingClient::remove: Removed stream " + stream.description());
    }
}

NetworkDataStreamPtr NetworkingClient::dataStream(const ITransportTask &task) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.stream(task);
}

std::shared_ptr<ITransportTask> NetworkingClient::sessionTask(const NetworkDataStream &stream) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.task(stream);
}

bool NetworkingClient::isActive(const NetworkDataStream &stream) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return activeTasks_.count(stream.id()) > 0;
}

size_t NetworkingClient::activeStreamCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return activeTasks_.size();
}

std::vector<NetworkDataStreamPtr> NetworkingClient::activeStreams() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NetworkDataStreamPtr> streams;
    streams.reserve(activeTasks_.size());
    for (auto &entry : activeTasks_)
    {
        streams.push_back(entry.second);
    }
    return streams;
}

void NetworkingClient::setupRequest(const NetworkDataStreamPtr &stream, const NetworkRequest &request)
{
    std::weak_ptr<NetworkingClient> weakSelf = weak_from_this();
    networkQueue_->async([weakSelf, stream, request]()
                         {
        auto self = weakSelf.lock();
        if (!self)
        {
            return;
        }
        self->bind(stream, request); });
}

void NetworkingClient::bind(const NetworkDataStreamPtr &stream, const NetworkRequest &request)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pendingTasks_.find(stream->id());
        if (it == pendingTasks_.end())
        {
            // Removed or cancelled before it reached the queue.
            Logger::Log(LogLevel::DEBUG, "NetworkingClient::bind: Stream " + stream->description() + " no longer pending, skipping.");
            return;
        }
        pendingTasks_.erase(it);
        activeTasks_[stream->id()] = stream;
    }

    auto task = stream->task(request, *session_);
    if (!task)
    {
        remove(*stream);
        return;
    }

    bool landed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (activeTasks_.count(stream->id()) > 0)
        {
            tasks_.set(stream, task);
            landed = true;
        }
    }

    if (!landed)
    {
        Logger::Log(LogLevel::DEBUG, "NetworkingClient::bind: Stream " + stream->description() + " was dropped while its task was created, cancelling.");
        stream->cancel();
    }
}
