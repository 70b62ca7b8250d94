// File: networking_client.hpp
#pragma once

#include "dispatch_queue.hpp"
#include "network_data_stream.hpp"
#include "network_request.hpp"
#include "network_session_delegate.hpp"
#include "network_tasks_map.hpp"
#include "session_configuration.hpp"
#include "transport.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

/// Creates streams, binds each to a transport task and tears them down.
///
/// Registry and active-set mutations are serialized by one mutex; the binding
/// step of stream() and all transport events run on the network queue.
class NetworkingClient : public IStreamTaskProvider, public std::enable_shared_from_this<NetworkingClient>
{
    struct PrivateTag
    {
    };

public:
    /// Builds a libcurl backed session with its own network queue.
    static std::shared_ptr<NetworkingClient> create(const SessionConfiguration &configuration = SessionConfiguration::networkingConfiguration());

    /// The delegate must be the one the session reports to.
    static std::shared_ptr<NetworkingClient> create(std::shared_ptr<DispatchQueue> networkQueue,
                                                    std::shared_ptr<NetworkSessionDelegate> delegate,
                                                    std::shared_ptr<ITransportSession> session);

    NetworkingClient(PrivateTag,
                     std::shared_ptr<DispatchQueue> networkQueue,
                     std::shared_ptr<NetworkSessionDelegate> delegate,
                     std::shared_ptr<ITransportSession> session);
    ~NetworkingClient() override;

    NetworkingClient(const NetworkingClient &) = delete;
    NetworkingClient &operator=(const NetworkingClient &) = delete;

    /// Returns at once. The task is created later on the network queue; failures
    /// are reported through the stream's completion handler.
    NetworkDataStreamPtr stream(const NetworkRequest &request, StreamHandlers handlers = {});

    /// Forgets every stream now and cancels them on the network queue.
    void cancelAllRequest();

    /// Drops the stream from the active set and the task map. No-op for unknown streams.
    void remove(const NetworkDataStream &stream);

    NetworkDataStreamPtr dataStream(const ITransportTask &task) const override;
    std::shared_ptr<ITransportTask> sessionTask(const NetworkDataStream &stream) const;

    bool isActive(const NetworkDataStream &stream) const;
    size_t activeStreamCount() const;
    std::vector<NetworkDataStreamPtr> activeStreams() const;

private:
    void setupRequest(const NetworkDataStreamPtr &stream, const NetworkRequest &request);
    void bind(const NetworkDataStreamPtr &stream, const NetworkRequest &request);

    std::shared_ptr<DispatchQueue> networkQueue_;
    std::shared_ptr<NetworkSessionDelegate> delegate_;
    std::shared_ptr<ITransportSession> session_;

    mutable std::mutex mutex_;
    NetworkTasksMap tasks_;
    std::unordered_map<StreamId, NetworkDataStreamPtr, StreamIdHash> activeTasks_;
    // Created by stream() but not yet bound by the network queue.
    std::unordered_map<StreamId, NetworkDataStreamPtr, StreamIdHash> pendingTasks_;
};
