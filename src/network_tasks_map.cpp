// File: network_tasks_map.cpp
#include "network_tasks_map.hpp"

void NetworkTasksMap::set(const NetworkDataStreamPtr &stream, const std::shared_ptr<ITransportTask> &task)
{
    if (!stream)
    {
        return;
    }
    if (!task)
    {
        remove(*stream);
        return;
    }

    remove(*stream);
    remove(*task);

    tasksByStream_[stream->id()] = Binding{stream, task};
    streamsByTask_[task->taskIdentifier()] = stream;
}

std::shared_ptr<ITransportTask> NetworkTasksMap::task(const NetworkDataStream &stream) const
{
    auto it = tasksByStream_.find(stream.id());
    if (it == tasksByStream_.end())
    {
        return nullptr;
    }
    return it->second.task;
}

NetworkDataStreamPtr NetworkTasksMap::stream(const ITransportTask &task) const
{
    return stream(task.taskIdentifier());
}

NetworkDataStreamPtr NetworkTasksMap::stream(uint64_t taskIdentifier) const
{
    auto it = streamsByTask_.find(taskIdentifier);
    if (it == streamsByTask_.end())
    {
        return nullptr;
    }
    return it->second;
}

bool NetworkTasksMap::remove(const NetworkDataStream &stream)
{
    auto it = tasksByStream_.find(stream.id());
    if (it == tasksByStream_.end())
    {
        return false;
    }
    streamsByTask_.erase(it->second.task->taskIdentifier());
    tasksByStream_.erase(it);
    return true;
}

bool NetworkTasksMap::remove(const ITransportTask &task)
{
    auto it = streamsByTask_.find(task.taskIdentifier());
    if (it == streamsByTask_.end())
    {
        return false;
    }
    tasksByStream_.erase(it->second->id());
    streamsByTask_.erase(it);
    return true;
}

size_t NetworkTasksMap::size() const
{
    return tasksByStream_.size();
}

bool NetworkTasksMap::empty() const
{
    return tasksByStream_.empty();
}
