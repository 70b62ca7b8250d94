// File: network_session_delegate.hpp
#pragma once

#include "network_data_stream.hpp"
#include "transport.hpp"
#include <memory>
#include <mutex>

class IStreamTaskProvider
{
public:
    virtual ~IStreamTaskProvider() = default;

    /// Stream bound to the task, or nullptr. Callable from any thread.
    virtual NetworkDataStreamPtr dataStream(const ITransportTask &task) const = 0;
};

/// Routes raw transport callbacks to the owning NetworkDataStream.
class NetworkSessionDelegate : public ITransportSessionDelegate
{
public:
    NetworkSessionDelegate() = default;

    /// Non-owning; an expired provider turns every callback into a no-op.
    void setTaskProvider(std::weak_ptr<IStreamTaskProvider> provider);

    void didReceiveResponse(const std::shared_ptr<ITransportTask> &task, const StreamResponse &response) override;
    void didReceiveData(const std::shared_ptr<ITransportTask> &task, const std::string &data) override;
    void didComplete(const std::shared_ptr<ITransportTask> &task, const StreamCompletion &completion) override;

private:
    NetworkDataStreamPtr resolve(const std::shared_ptr<ITransportTask> &task, const char *event) const;

    mutable std::mutex mutex_;
    std::weak_ptr<IStreamTaskProvider> taskProvider_;
};
