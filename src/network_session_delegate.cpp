// File: network_session_delegate.cpp
#include "network_session_delegate.hpp"
#include "logger.hpp"

void NetworkSessionDelegate::setTaskProvider(std::weak_ptr<IStreamTaskProvider> provider)
{
    std::lock_guard<std::mutex> lock(mutex_);
    taskProvider_ = std::move(provider);
}

void NetworkSessionDelegate::didReceiveResponse(const std::shared_ptr<ITransportTask> &task, const StreamResponse &response)
{
    if (auto stream = resolve(task, "response"))
    {
        stream->didReceiveResponse(response);
    }
}

void NetworkSessionDelegate::didReceiveData(const std::shared_ptr<ITransportTask> &task, const std::string &data)
{
    if (auto stream = resolve(task, "data"))
    {
        stream->didReceiveData(data);
    }
}

void NetworkSessionDelegate::didComplete(const std::shared_ptr<ITransportTask> &task, const StreamCompletion &completion)
{
    if (auto stream = resolve(task, "completion"))
    {
        stream->didComplete(completion);
    }
}

NetworkDataStreamPtr NetworkSessionDelegate::resolve(const std::shared_ptr<ITransportTask> &task, const char *event) const
{
    if (!task)
    {
        return nullptr;
    }

    std::shared_ptr<IStreamTaskProvider> provider;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        provider = taskProvider_.lock();
    }

    if (!provider)
    {
        Logger::Log(LogLevel::TRACE, "NetworkSessionDelegate::resolve: No task provider, dropping " + std::string(event) + " for task " + std::to_string(task->taskIdentifier()));
        return nullptr;
    }

    auto stream = provider->dataStream(*task);
    if (!stream)
    {
        Logger::Log(LogLevel::TRACE, "NetworkSessionDelegate::resolve: Unknown task " + std::to_string(task->taskIdentifier()) + ", dropping " + event);
    }
    return stream;
}
