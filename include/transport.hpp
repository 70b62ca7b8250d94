// File: transport.hpp
// Boundary between the stream coordinator and the transport engine.
#pragma once
#include "network_request.hpp"
#include "stream_types.hpp"
#include <cstdint>
#include <memory>
#include <string>

class ITransportTask
{
public:
    virtual ~ITransportTask() = default;

    /// Unique within the session that created the task.
    virtual uint64_t taskIdentifier() const = 0;

    /// Starts (or re-queues) the transfer.
    virtual void resume() = 0;

    /// Safe from any thread; a cancelled task delivers no more data.
    virtual void cancel() = 0;

    virtual bool isCancelled() const = 0;
};

/// Raw transport callbacks. Delivered one at a time, in order, on the session's delegate queue.
class ITransportSessionDelegate
{
public:
    virtual ~ITransportSessionDelegate() = default;

    virtual void didReceiveResponse(const std::shared_ptr<ITransportTask> &task, const StreamResponse &response) = 0;
    virtual void didReceiveData(const std::shared_ptr<ITransportTask> &task, const std::string &data) = 0;
    virtual void didComplete(const std::shared_ptr<ITransportTask> &task, const StreamCompletion &completion) = 0;
};

class ITransportSession
{
public:
    virtual ~ITransportSession() = default;

    /// Creates a suspended task for the request. Returns nullptr once the session is invalidated.
    /// Throws std::runtime_error when the engine cannot allocate a transfer.
    virtual std::shared_ptr<ITransportTask> dataTask(const NetworkRequest &request) = 0;

    /// Refuses new tasks and lets running ones complete.
    virtual void finishTasksAndInvalidate() = 0;

    /// Refuses new tasks and cancels every running one. Blocks until the engine stopped.
    virtual void invalidateAndCancel() = 0;

    virtual bool isInvalidated() const = 0;
};
