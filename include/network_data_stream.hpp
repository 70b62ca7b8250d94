// File: network_data_stream.hpp
#pragma once

#include "dispatch_queue.hpp"
#include "stream_types.hpp"
#include "transport.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/functional/hash.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

using StreamId = boost::uuids::uuid;

struct StreamHandlers
{
    std::function<void(const StreamResponse &)> onResponse;
    std::function<void(const std::string &)> onData;
    std::function<void(const StreamCompletion &)> onComplete;
};

/// One logical streaming download. Shared between the caller and NetworkingClient.
class NetworkDataStream : public std::enable_shared_from_this<NetworkDataStream>
{
public:
    enum class State
    {
        Initialized,
        Resumed,
        Cancelled,
        Finished
    };

    using FinishHook = std::function<void(const std::shared_ptr<NetworkDataStream> &)>;

    NetworkDataStream(StreamId id, std::weak_ptr<DispatchQueue> underlyingQueue);

    NetworkDataStream(const NetworkDataStream &) = delete;
    NetworkDataStream &operator=(const NetworkDataStream &) = delete;

    static StreamId makeId();

    const StreamId &id() const;
    std::string description() const;
    State state() const;
    bool isCancelled() const;
    bool isFinished() const;

    void setHandlers(StreamHandlers handlers);
    void setFinishHook(FinishHook hook);

    /// Builds and resumes the transport task for this stream. Returns nullptr when the
    /// stream was cancelled or the task could not be built; the latter completes the stream.
    std::shared_ptr<ITransportTask> task(const NetworkRequest &request, ITransportSession &session);
    std::shared_ptr<ITransportTask> currentTask() const;

    /// Cancels the transport task and completes with DataStreamError::Cancelled. Idempotent.
    void cancel();

    /// Same as cancel() but completes with DataStreamError::SessionDeinit.
    void invalidate();

    // Transport events, resolved by NetworkSessionDelegate.
    void didReceiveResponse(const StreamResponse &response);
    void didReceiveData(const std::string &data);
    void didComplete(const StreamCompletion &completion);

    bool operator==(const NetworkDataStream &other) const
    {
        return id_ == other.id_;
    }

    bool operator!=(const NetworkDataStream &other) const
    {
        return !(*this == other);
    }

private:
    void abort(DataStreamError reason, const std::string &message);
    void complete(const StreamCompletion &completion);

    const StreamId id_;
    std::weak_ptr<DispatchQueue> underlyingQueue_;

    mutable std::mutex mutex_;
    State state_ = State::Initialized;
    bool completed_ = false;
    std::shared_ptr<ITransportTask> task_;
    StreamHandlers handlers_;
    FinishHook finishHook_;
};

using NetworkDataStreamPtr = std::shared_ptr<NetworkDataStream>;

struct StreamIdHash
{
    size_t operator()(const StreamId &id) const
    {
        return boost::hash<StreamId>()(id);
    }
};

std::string ToString(NetworkDataStream::State state);
