// File: network_session_delegate_test.cpp
#include "network_session_delegate.hpp"
#include "network_tasks_map.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>
#include <string>

namespace
{
    class MapTaskProvider : public IStreamTaskProvider
    {
    public:
        NetworkDataStreamPtr dataStream(const ITransportTask &task) const override
        {
            ++lookups;
            return tasks.stream(task);
        }

        NetworkTasksMap tasks;
        mutable int lookups = 0;
    };

    class NetworkSessionDelegateTest : public testing::Test
    {
    protected:
        void SetUp() override
        {
            provider_ = std::make_shared<MapTaskProvider>();
            delegate_.setTaskProvider(provider_);

            stream_ = std::make_shared<NetworkDataStream>(NetworkDataStream::makeId(), std::weak_ptr<DispatchQueue>());
            StreamHandlers handlers;
            handlers.onResponse = [this](const StreamResponse &response)
            { status_ = response.statusCode; };
            handlers.onData = [this](const std::string &data)
            { data_ += data; };
            handlers.onComplete = [this](const StreamCompletion &)
            { ++completions_; };
            stream_->setHandlers(std::move(handlers));

            task_ = stream_->task(NetworkRequest("http://example.com/live"), session_);
            ASSERT_NE(nullptr, task_);
        }

        FakeTransportSession session_;
        NetworkSessionDelegate delegate_;
        std::shared_ptr<MapTaskProvider> provider_;
        NetworkDataStreamPtr stream_;
        std::shared_ptr<ITransportTask> task_;

        long status_ = 0;
        std::string data_;
        int completions_ = 0;
    };
}

TEST_F(NetworkSessionDelegateTest, RoutesEventsToBoundStream)
{
    provider_->tasks.set(stream_, task_);

    StreamResponse response;
    response.statusCode = 206;
    delegate_.didReceiveResponse(task_, response);
    delegate_.didReceiveData(task_, "abc");
    delegate_.didComplete(task_, StreamCompletion::success(206));

    EXPECT_EQ(206, status_);
    EXPECT_EQ("abc", data_);
    EXPECT_EQ(1, completions_);
    EXPECT_EQ(3, provider_->lookups);
}

TEST_F(NetworkSessionDelegateTest, IgnoresUnknownTask)
{
    delegate_.didReceiveData(task_, "abc");
    delegate_.didComplete(task_, StreamCompletion::success());

    EXPECT_TRUE(data_.empty());
    EXPECT_EQ(0, completions_);
    EXPECT_EQ(2, provider_->lookups);
}

TEST_F(NetworkSessionDelegateTest, IgnoresCallbacksOnceProviderIsGone)
{
    provider_->tasks.set(stream_, task_);
    provider_.reset();

    delegate_.didReceiveData(task_, "abc");
    delegate_.didComplete(task_, StreamCompletion::success());

    EXPECT_TRUE(data_.empty());
    EXPECT_EQ(0, completions_);
}

TEST_F(NetworkSessionDelegateTest, IgnoresNullTask)
{
    provider_->tasks.set(stream_, task_);
    delegate_.didReceiveData(nullptr, "abc");

    EXPECT_TRUE(data_.empty());
    EXPECT_EQ(0, provider_->lookups);
}
