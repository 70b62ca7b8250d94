// File: network_tasks_map.hpp
#pragma once

#include "network_data_stream.hpp"
#include "transport.hpp"
#include <cstdint>
#include <memory>
#include <unordered_map>

/// Bidirectional stream <-> task binding. Each stream maps to at most one task and
/// each task to at most one stream. Not synchronized; the owner serializes access.
class NetworkTasksMap
{
public:
    /// Binds stream to task. Any previous binding of either side is dropped.
    void set(const NetworkDataStreamPtr &stream, const std::shared_ptr<ITransportTask> &task);

    std::shared_ptr<ITransportTask> task(const NetworkDataStream &stream) const;
    NetworkDataStreamPtr stream(const ITransportTask &task) const;
    NetworkDataStreamPtr stream(uint64_t taskIdentifier) const;

    /// Both return false when nothing was bound.
    bool remove(const NetworkDataStream &stream);
    bool remove(const ITransportTask &task);

    size_t size() const;
    bool empty() const;

private:
    struct Binding
    {
        NetworkDataStreamPtr stream;
        std::shared_ptr<ITransportTask> task;
    };

    std::unordered_map<StreamId, Binding, StreamIdHash> tasksByStream_;
    std::unordered_map<uint64_t, NetworkDataStreamPtr> streamsByTask_;
};
