// File: network_data_stream_test.cpp
#include "network_data_stream.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>
#include <boost/uuid/uuid_io.hpp>
#include <atomic>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace
{
    struct Recorder
    {
        std::vector<long> statuses;
        std::string data;
        std::vector<StreamCompletion> completions;

        StreamHandlers handlers()
        {
            StreamHandlers result;
            result.onResponse = [this](const StreamResponse &response)
            { statuses.push_back(response.statusCode); };
            result.onData = [this](const std::string &chunk)
            { data += chunk; };
            result.onComplete = [this](const StreamCompletion &completion)
            { completions.push_back(completion); };
            return result;
        }
    };

    NetworkDataStreamPtr makeStream(std::weak_ptr<DispatchQueue> queue = {})
    {
        return std::make_shared<NetworkDataStream>(NetworkDataStream::makeId(), std::move(queue));
    }
}

TEST(NetworkDataStreamTest, IdentityFollowsId)
{
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i)
    {
        EXPECT_TRUE(seen.insert(boost::uuids::to_string(NetworkDataStream::makeId())).second);
    }

    auto id = NetworkDataStream::makeId();
    NetworkDataStream first(id, {});
    NetworkDataStream same(id, {});
    NetworkDataStream other(NetworkDataStream::makeId(), {});

    EXPECT_TRUE(first == same);
    EXPECT_TRUE(first != other);
    EXPECT_EQ(StreamIdHash()(first.id()), StreamIdHash()(same.id()));
    EXPECT_EQ(boost::uuids::to_string(id), first.description());
}

TEST(NetworkDataStreamTest, TaskIsCreatedOnceAndResumed)
{
    FakeTransportSession session;
    auto stream = makeStream();

    auto task = stream->task(NetworkRequest("http://example.com/a.mp3"), session);
    ASSERT_NE(nullptr, task);
    EXPECT_EQ(task, stream->task(NetworkRequest("http://example.com/a.mp3"), session));
    EXPECT_EQ(task, stream->currentTask());
    EXPECT_EQ(1u, session.tasks().size());
    EXPECT_EQ(1, session.tasks()[0]->resumeCount.load());
    EXPECT_EQ(NetworkDataStream::State::Resumed, stream->state());
}

TEST(NetworkDataStreamTest, DeliversEventsWhileResumed)
{
    FakeTransportSession session;
    Recorder recorder;
    auto stream = makeStream();
    stream->setHandlers(recorder.handlers());
    stream->task(NetworkRequest("http://example.com/a.mp3"), session);

    StreamResponse response;
    response.statusCode = 200;
    stream->didReceiveResponse(response);
    stream->didReceiveData("ID3");
    stream->didReceiveData("...");
    stream->didComplete(StreamCompletion::success(200));

    EXPECT_EQ(std::vector<long>{200}, recorder.statuses);
    EXPECT_EQ("ID3...", recorder.data);
    ASSERT_EQ(1u, recorder.completions.size());
    EXPECT_TRUE(recorder.completions[0].succeeded());
    EXPECT_EQ(NetworkDataStream::State::Finished, stream->state());
    EXPECT_TRUE(stream->isFinished());
}

TEST(NetworkDataStreamTest, ResponseHeadersIgnoreNameCase)
{
    FakeTransportSession session;
    std::optional<std::string> contentType;
    std::optional<std::string> missing;
    auto stream = makeStream();

    StreamHandlers handlers;
    handlers.onResponse = [&](const StreamResponse &response)
    {
        contentType = response.header("Content-Type");
        missing = response.header("icy-metaint");
    };
    stream->setHandlers(std::move(handlers));
    stream->task(NetworkRequest("http://example.com/a.mp3"), session);

    StreamResponse response;
    response.statusCode = 200;
    response.headers["content-type"] = "audio/mpeg";
    stream->didReceiveResponse(response);

    ASSERT_TRUE(contentType.has_value());
    EXPECT_EQ("audio/mpeg", *contentType);
    EXPECT_FALSE(missing.has_value());
}

TEST(NetworkDataStreamTest, CompletesOnlyOnce)
{
    FakeTransportSession session;
    Recorder recorder;
    auto stream = makeStream();
    stream->setHandlers(recorder.handlers());
    stream->task(NetworkRequest("http://example.com/a.mp3"), session);

    stream->didComplete(StreamCompletion::success());
    stream->didComplete(StreamCompletion::failure(DataStreamError::TransportFailure, "late"));
    stream->cancel();

    ASSERT_EQ(1u, recorder.completions.size());
    EXPECT_TRUE(recorder.completions[0].succeeded());
}

TEST(NetworkDataStreamTest, CancelCancelsTaskAndDropsLaterData)
{
    FakeTransportSession session;
    Recorder recorder;
    auto stream = makeStream();
    stream->setHandlers(recorder.handlers());
    stream->task(NetworkRequest("http://example.com/a.mp3"), session);

    stream->cancel();
    stream->cancel();
    stream->didReceiveData("late bytes");

    auto task = session.tasks()[0];
    EXPECT_EQ(1, task->cancelCount.load());
    EXPECT_TRUE(recorder.data.empty());
    ASSERT_EQ(1u, recorder.completions.size());
    EXPECT_EQ(DataStreamError::Cancelled, recorder.completions[0].error);
    EXPECT_TRUE(stream->isCancelled());
}

TEST(NetworkDataStreamTest, CancelBeforeTaskPreventsMaterialization)
{
    FakeTransportSession session;
    auto stream = makeStream();

    stream->cancel();

    EXPECT_EQ(nullptr, stream->task(NetworkRequest("http://example.com/a.mp3"), session));
    EXPECT_TRUE(session.tasks().empty());
}

TEST(NetworkDataStreamTest, CancelDuringMaterializationCancelsNewTask)
{
    FakeTransportSession session;
    auto stream = makeStream();
    session.setOnDataTask([stream](const NetworkRequest &)
                          { stream->cancel(); });

    EXPECT_EQ(nullptr, stream->task(NetworkRequest("http://example.com/a.mp3"), session));
    ASSERT_EQ(1u, session.tasks().size());
    EXPECT_EQ(1, session.tasks()[0]->cancelCount.load());
    EXPECT_EQ(0, session.tasks()[0]->resumeCount.load());
    EXPECT_EQ(nullptr, stream->currentTask());
}

TEST(NetworkDataStreamTest, MaterializationFailureCompletesWithUnknown)
{
    FakeTransportSession session;
    session.failWith = "no handles left";
    Recorder recorder;
    auto stream = makeStream();
    stream->setHandlers(recorder.handlers());

    EXPECT_EQ(nullptr, stream->task(NetworkRequest("http://example.com/a.mp3"), session));
    ASSERT_EQ(1u, recorder.completions.size());
    EXPECT_EQ(DataStreamError::Unknown, recorder.completions[0].error);
    EXPECT_EQ("no handles left", recorder.completions[0].message);
}

TEST(NetworkDataStreamTest, InvalidatedSessionCompletesWithSessionDeinit)
{
    FakeTransportSession session;
    session.finishTasksAndInvalidate();
    Recorder recorder;
    auto stream = makeStream();
    stream->setHandlers(recorder.handlers());

    EXPECT_EQ(nullptr, stream->task(NetworkRequest("http://example.com/a.mp3"), session));
    ASSERT_EQ(1u, recorder.completions.size());
    EXPECT_EQ(DataStreamError::SessionDeinit, recorder.completions[0].error);
}

TEST(NetworkDataStreamTest, InvalidateCompletesWithSessionDeinit)
{
    FakeTransportSession session;
    Recorder recorder;
    auto stream = makeStream();
    stream->setHandlers(recorder.handlers());
    stream->task(NetworkRequest("http://example.com/a.mp3"), session);

    stream->invalidate();

    EXPECT_EQ(1, session.tasks()[0]->cancelCount.load());
    ASSERT_EQ(1u, recorder.completions.size());
    EXPECT_EQ(DataStreamError::SessionDeinit, recorder.completions[0].error);
}

TEST(NetworkDataStreamTest, FinishHookRunsBeforeCompletionHandler)
{
    FakeTransportSession session;
    auto stream = makeStream();
    std::vector<std::string> calls;
    StreamHandlers handlers;
    handlers.onComplete = [&calls](const StreamCompletion &)
    { calls.push_back("handler"); };
    stream->setHandlers(std::move(handlers));
    stream->setFinishHook([&calls, stream](const NetworkDataStreamPtr &finished)
                          {
        EXPECT_EQ(stream, finished);
        calls.push_back("hook"); });

    stream->cancel();

    EXPECT_EQ((std::vector<std::string>{"hook", "handler"}), calls);
}

TEST(NetworkDataStreamTest, CompletionIsDeliveredOnItsQueue)
{
    auto queue = std::make_shared<DispatchQueue>("test.stream.queue");
    FakeTransportSession session;
    auto stream = makeStream(queue);
    std::atomic<bool> onQueue{false};
    std::atomic<int> completions{0};
    StreamHandlers handlers;
    handlers.onComplete = [&](const StreamCompletion &)
    {
        onQueue = queue->isCurrent();
        ++completions;
    };
    stream->setHandlers(std::move(handlers));

    stream->cancel();
    queue->drain();

    EXPECT_EQ(1, completions.load());
    EXPECT_TRUE(onQueue.load());
}
