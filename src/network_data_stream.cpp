// File: network_data_stream.cpp
#include "network_data_stream.hpp"
#include "logger.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <exception>

NetworkDataStream::NetworkDataStream(StreamId id, std::weak_ptr<DispatchQueue> underlyingQueue)
    : id_(id), underlyingQueue_(std::move(underlyingQueue))
{
}

StreamId NetworkDataStream::makeId()
{
    // random_generator is not thread safe
    thread_local boost::uuids::random_generator generator;
    return generator();
}

const StreamId &NetworkDataStream::id() const
{
    return id_;
}

std::string NetworkDataStream::description() const
{
    return boost::uuids::to_string(id_);
}

NetworkDataStream::State NetworkDataStream::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool NetworkDataStream::isCancelled() const
{
    return state() == State::Cancelled;
}

bool NetworkDataStream::isFinished() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

void NetworkDataStream::setHandlers(StreamHandlers handlers)
{
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_ = std::move(handlers);
}

void NetworkDataStream::setFinishHook(FinishHook hook)
{
    std::lock_guard<std::mutex> lock(mutex_);
    finishHook_ = std::move(hook);
}

std::shared_ptr<ITransportTask> NetworkDataStream::task(const NetworkRequest &request, ITransportSession &session)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (task_)
        {
            return task_;
        }
        if (state_ != State::Initialized)
        {
            Logger::Log(LogLevel::DEBUG, "NetworkDataStream::task: Stream " + description() + " is " + ToString(state_) + ", not creating a task.");
            return nullptr;
        }
    }

    std::shared_ptr<ITransportTask> created;
    try
    {
        created = session.dataTask(request);
    }
    catch (const std::exception &e)
    {
        Logger::Log(LogLevel::ERROR, "NetworkDataStream::task: Failed to create task for " + request.url + ": " + e.what());
        complete(StreamCompletion::failure(DataStreamError::Unknown, e.what()));
        return nullptr;
    }

    if (!created)
    {
        Logger::Log(LogLevel::WARN, "NetworkDataStream::task: Session invalidated, cannot stream " + request.url);
        complete(StreamCompletion::failure(DataStreamError::SessionDeinit, "Session is invalidated"));
        return nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Initialized)
        {
            // Cancelled while the task was being built.
            created->cancel();
            return nullptr;
        }
        task_ = created;
        state_ = State::Resumed;
    }

    Logger::Log(LogLevel::DEBUG, "NetworkDataStream::task: Stream " + description() + " bound to task " + std::to_string(created->taskIdentifier()) + " for " + request.url);
    created->resume();
    return created;
}

std::shared_ptr<ITransportTask> NetworkDataStream::currentTask() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return task_;
}

void NetworkDataStream::cancel()
{
    abort(DataStreamError::Cancelled, "Stream cancelled");
}

void NetworkDataStream::invalidate()
{
    abort(DataStreamError::SessionDeinit, "Session invalidated");
}

void NetworkDataStream::abort(DataStreamError reason, const std::string &message)
{
    std::shared_ptr<ITransportTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Cancelled || completed_)
        {
            return;
        }
        state_ = State::Cancelled;
        task = task_;
    }

    Logger::Log(LogLevel::INFO, "NetworkDataStream::abort: Stopping stream " + description() + ": " + message);
    if (task)
    {
        task->cancel();
    }
    complete(StreamCompletion::failure(reason, message));
}

void NetworkDataStream::didReceiveResponse(const StreamResponse &response)
{
    std::function<void(const StreamResponse &)> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Resumed)
        {
            return;
        }
        handler = handlers_.onResponse;
    }

    Logger::Log(LogLevel::DEBUG, "NetworkDataStream::didReceiveResponse: Stream " + description() + " status " + std::to_string(response.statusCode));
    if (handler)
    {
        handler(response);
    }
}

void NetworkDataStream::didReceiveData(const std::string &data)
{
    std::function<void(const std::string &)> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Resumed)
        {
            return;
        }
        handler = handlers_.onData;
    }

    Logger::Log(LogLevel::TRACE, "NetworkDataStream::didReceiveData: Stream " + description() + " received " + std::to_string(data.size()) + " bytes.");
    if (handler)
    {
        handler(data);
    }
}

void NetworkDataStream::didComplete(const StreamCompletion &completion)
{
    complete(completion);
}

void NetworkDataStream::complete(const StreamCompletion &completion)
{
    std::function<void(const StreamCompletion &)> handler;
    FinishHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_)
        {
            return;
        }
        completed_ = true;
        if (state_ != State::Cancelled)
        {
            state_ = State::Finished;
        }
        handler = std::move(handlers_.onComplete);
        hook = std::move(finishHook_);
        // Handlers often capture the stream itself.
        handlers_ = StreamHandlers{};
        finishHook_ = nullptr;
    }

    if (completion.succeeded())
    {
        Logger::Log(LogLevel::INFO, "NetworkDataStream::complete: Stream " + description() + " finished.");
    }
    else
    {
        Logger::Log(completion.error == DataStreamError::Cancelled ? LogLevel::DEBUG : LogLevel::WARN,
                    "NetworkDataStream::complete: Stream " + description() + " failed: " + ToString(*completion.error) + " " + completion.message);
    }

    auto self = shared_from_this();
    auto deliver = [self, handler = std::move(handler), hook = std::move(hook), completion]()
    {
        if (hook)
        {
            hook(self);
        }
        if (handler)
        {
            handler(completion);
        }
    };

    auto queue = underlyingQueue_.lock();
    if (!queue || queue->isCurrent())
    {
        deliver();
    }
    else
    {
        queue->async(std::move(deliver));
    }
}

std::string ToString(NetworkDataStream::State state)
{
    switch (state)
    {
    case NetworkDataStream::State::Initialized:
        return "initialized";
    case NetworkDataStream::State::Resumed:
        return "resumed";
    case NetworkDataStream::State::Cancelled:
        return "cancelled";
    case NetworkDataStream::State::Finished:
        return "finished";
    default:
        return "unknown";
    }
}
