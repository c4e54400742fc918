#include <gtest/gtest.h>
#include "fake_upstream.hpp"
#include "stream/chunk_source.hpp"
#include "upstream/upstream_stream.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <thread>

using namespace gateway;
using gateway_test::FakeTransport;

namespace {

UpstreamRequest StreamRequest() {
    UpstreamRequest req;
    req.method = "POST";
    req.endpoint = ParseHttpEndpoint("https://upstream.test/api/chat/completions");
    req.body = R"({"model":"m","stream":true})";
    req.content_type = "application/json";
    return req;
}

std::vector<std::string> Drain(IChunkSource* source, std::string* err) {
    std::vector<std::string> out;
    while (auto chunk = source->Next(err)) out.push_back(*chunk);
    return out;
}

bool WaitUntil(const std::function<bool()>& done) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

}  // namespace

TEST(ChunkChannelTest, DeliversChunksInOrderThenEnds) {
    ChunkChannel channel;
    ASSERT_TRUE(channel.Push("a"));
    ASSERT_TRUE(channel.Push("b"));
    channel.Close();

    std::string err;
    EXPECT_EQ(Drain(&channel, &err), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(err.empty());
}

TEST(ChunkChannelTest, CloseWithErrorIsReportedAfterBufferedChunks) {
    ChunkChannel channel;
    ASSERT_TRUE(channel.Push("a"));
    channel.Close("reset by peer");

    std::string err;
    EXPECT_EQ(Drain(&channel, &err), (std::vector<std::string>{"a"}));
    EXPECT_EQ(err, "reset by peer");
}

TEST(ChunkChannelTest, CancelUnblocksFullProducer) {
    ChunkChannel channel(1);
    ASSERT_TRUE(channel.Push("first"));

    std::atomic<bool> pushed{true};
    std::thread producer([&] { pushed = channel.Push("second"); });
    channel.Cancel();
    producer.join();

    EXPECT_FALSE(pushed.load());
    EXPECT_TRUE(channel.Cancelled());
    std::string err;
    EXPECT_FALSE(channel.Next(&err).has_value());
    EXPECT_TRUE(err.empty());
}

TEST(ChunkChannelTest, CancelRunsHookOnce) {
    int calls = 0;
    ChunkChannel channel(4, [&] { calls++; });
    channel.Cancel();
    channel.Cancel();
    EXPECT_EQ(calls, 1);
}

TEST(UpstreamStreamTest, OpenReturnsHeadAndBodyStreamsChunks) {
    FakeTransport transport;
    FakeTransport::StreamScript script;
    script.head.status = 200;
    script.chunks = {"data: 1\n", "\n", "data: 2\n\n"};
    transport.SetStream(script);

    UpstreamStream stream(&transport, StreamRequest());
    std::string err;
    auto head = stream.Open(&err);

    ASSERT_TRUE(head.has_value()) << err;
    EXPECT_EQ(head->status, 200);
    EXPECT_EQ(Drain(stream.Body(), &err), script.chunks);
    EXPECT_TRUE(err.empty());
    EXPECT_EQ(transport.CallCount(), 1u);
}

TEST(UpstreamStreamTest, ErrorStatusSkipsBody) {
    FakeTransport transport;
    FakeTransport::StreamScript script;
    script.head.status = 401;
    script.chunks = {"{\"detail\":\"unauthorized\"}"};
    transport.SetStream(script);

    UpstreamStream stream(&transport, StreamRequest());
    std::string err;
    auto head = stream.Open(&err);

    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head->status, 401);
    EXPECT_TRUE(Drain(stream.Body(), &err).empty());
    EXPECT_EQ(transport.ChunksDelivered(), 0u);
}

TEST(UpstreamStreamTest, FailureBeforeHeadIsReportedByOpen) {
    FakeTransport transport;
    FakeTransport::StreamScript script;
    script.fail_before_head = true;
    script.error_after_chunks = "Connection";
    transport.SetStream(script);

    UpstreamStream stream(&transport, StreamRequest());
    std::string err;
    auto head = stream.Open(&err);

    EXPECT_FALSE(head.has_value());
    EXPECT_EQ(err, "Connection");
}

TEST(UpstreamStreamTest, MidStreamFailureSurfacesThroughBody) {
    FakeTransport transport;
    FakeTransport::StreamScript script;
    script.head.status = 200;
    script.chunks = {"data: 1\n\n"};
    script.error_after_chunks = "Read";
    transport.SetStream(script);

    UpstreamStream stream(&transport, StreamRequest());
    std::string err;
    ASSERT_TRUE(stream.Open(&err).has_value());

    auto chunks = Drain(stream.Body(), &err);
    EXPECT_EQ(chunks.size(), 1u);
    EXPECT_EQ(err, "Read");
}

TEST(UpstreamStreamTest, DestroyingUnreadStreamCancelsUpstream) {
    FakeTransport transport;
    FakeTransport::StreamScript script;
    script.head.status = 200;
    for (int i = 0; i < 16; i++) script.chunks.push_back("data: x\n\n");
    transport.SetStream(script);

    {
        UpstreamStream stream(&transport, StreamRequest(), 2);
        std::string err;
        ASSERT_TRUE(stream.Open(&err).has_value());
    }

    EXPECT_TRUE(transport.StreamCancelled());
    EXPECT_LT(transport.ChunksDelivered(), 16u);
}

TEST(UpstreamStreamTest, DestroyingStreamAbortsSilentUpstream) {
    FakeTransport transport;
    FakeTransport::StreamScript script;
    script.head.status = 200;
    script.block_after_chunks = true;
    transport.SetStream(script);

    auto done = std::async(std::launch::async, [&] {
        UpstreamStream stream(&transport, StreamRequest());
        std::string err;
        return stream.Open(&err).has_value();
    });

    ASSERT_EQ(done.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(done.get());
    EXPECT_TRUE(transport.CancelHookFired());
}

TEST(UpstreamStreamTest, CancellingBodyUnblocksReaderWaitingOnUpstream) {
    FakeTransport transport;
    FakeTransport::StreamScript script;
    script.head.status = 200;
    script.chunks = {"data: 1\n\n"};
    script.block_after_chunks = true;
    transport.SetStream(script);

    UpstreamStream stream(&transport, StreamRequest());
    std::string err;
    ASSERT_TRUE(stream.Open(&err).has_value());
    ASSERT_TRUE(stream.Body()->Next(&err).has_value());

    stream.Body()->Cancel();
    EXPECT_TRUE(WaitUntil([&] { return transport.CancelHookFired(); }));
    EXPECT_FALSE(stream.Body()->Next(&err).has_value());
    EXPECT_TRUE(err.empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
