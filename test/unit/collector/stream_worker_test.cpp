#include <gtest/gtest.h>
#include "streamstats/collector/stream_worker.h"
#include "test_util/scripted_stream.h"

#include <chrono>

namespace streamstats {
namespace collector {
namespace {

using stream::ReceiveResult;
using testutil::WaitForCondition;

class StreamWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        context_.registry = &registry_;
        context_.factory = &factory_;
        context_.restart_delay = &sampler_;
        context_.statistics = &stats_;
        context_.no_endpoints_backoff = std::chrono::milliseconds(20);
    }

    void AddEndpoint(const std::string& url) {
        auto parsed = endpoints::ParseEndpoint(url);
        ASSERT_TRUE(parsed.ok()) << parsed.error();
        registry_.AddEndpoints(parsed.value().url.Authority(), {parsed.value()});
    }

    std::unique_ptr<StreamWorker> StartWorker() {
        auto worker = std::make_unique<StreamWorker>(1, context_);
        worker->Start();
        return worker;
    }

    endpoints::EndpointRegistry registry_{99};
    testutil::ScriptedStreamFactory factory_;
    distribution::DistributionSampler sampler_;
    CollectorStatistics stats_;
    WorkerContext context_;
};

TEST_F(StreamWorkerTest, RequiresCompleteContext) {
    WorkerContext empty;
    EXPECT_THROW(StreamWorker(1, empty), std::invalid_argument);
}

TEST_F(StreamWorkerTest, NoEndpointsIsNotAnError) {
    context_.no_endpoints_backoff = std::chrono::hours(1);
    auto worker = StartWorker();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto start = std::chrono::steady_clock::now();
    worker->Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));

    EXPECT_EQ(factory_.OpenCalls(), 0);
    EXPECT_EQ(stats_.errors.Get(), 0u);
    EXPECT_EQ(stats_.opened.Get(), 0u);
    EXPECT_EQ(worker->state(), WorkerState::STOPPED);
}

TEST_F(StreamWorkerTest, PicksUpEndpointsAddedLater) {
    auto worker = StartWorker();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    AddEndpoint("rtmp://late/live/cam");
    EXPECT_TRUE(WaitForCondition([this] { return factory_.OpenCalls() >= 1; }));
    worker->Stop();
}

TEST_F(StreamWorkerTest, CountsReceivedDataAndReleasesGaugesOnStop) {
    AddEndpoint("rtmp://media/live/cam?pixels=1000");
    factory_.SetScript({ReceiveResult::Data(100), ReceiveResult::Data(50)}, true);

    auto worker = StartWorker();
    ASSERT_TRUE(WaitForCondition([this] { return stats_.packets.Get() == 2; }));
    EXPECT_TRUE(WaitForCondition([&worker] { return worker->state() == WorkerState::STREAMING; }));

    EXPECT_EQ(stats_.bytes.Get(), 150u);
    EXPECT_EQ(stats_.opened.Get(), 1u);
    EXPECT_EQ(stats_.open_connections.Get(), 1);
    EXPECT_EQ(stats_.receiving_connections.Get(), 1);
    EXPECT_EQ(stats_.pixels.Get(), 1000);
    EXPECT_EQ(factory_.LiveStreams(), 1);

    worker->Stop();

    // Stop takes priority: the interrupted stream is neither closed nor an error
    EXPECT_EQ(stats_.closed.Get(), 0u);
    EXPECT_EQ(stats_.errors.Get(), 0u);
    EXPECT_EQ(stats_.open_connections.Get(), 0);
    EXPECT_EQ(stats_.receiving_connections.Get(), 0);
    EXPECT_EQ(stats_.pixels.Get(), 0);
    EXPECT_EQ(factory_.LiveStreams(), 0);
}

TEST_F(StreamWorkerTest, FirstPacketFeedsNoDelay) {
    AddEndpoint("rtmp://media/live/cam");
    factory_.SetScript({ReceiveResult::Data(100)}, true);

    auto worker = StartWorker();
    ASSERT_TRUE(WaitForCondition([this] { return stats_.packets.Get() == 1; }));
    ASSERT_TRUE(WaitForCondition([this] { return stats_.receiving_connections.Get() == 1; }));
    EXPECT_EQ(stats_.packet_delay.ComputeAverage(), 0.0);
    worker->Stop();
}

TEST_F(StreamWorkerTest, PacketDelayAveragesInterArrivalTimes) {
    AddEndpoint("rtmp://media/live/cam");
    factory_.SetReceiveDelay(std::chrono::milliseconds(20));
    factory_.SetScript({ReceiveResult::Data(1), ReceiveResult::Data(1), ReceiveResult::Data(1)}, true);

    auto worker = StartWorker();
    ASSERT_TRUE(WaitForCondition([this] { return stats_.packets.Get() == 3; }));
    worker->Stop();

    // Two gaps of at least 20ms; a first packet measured from nowhere would dwarf them
    double average = stats_.packet_delay.ComputeAverage();
    EXPECT_GE(average, 0.015);
    EXPECT_LT(average, 1.0);
}

TEST_F(StreamWorkerTest, EndOfStreamReleasesGaugesBetweenCycles) {
    AddEndpoint("rtmp://media/live/cam?pixels=640");
    ASSERT_TRUE(sampler_.Set("const:300ms").ok());
    factory_.SetScript({ReceiveResult::Data(10), ReceiveResult::EndOfStream()}, false);

    auto worker = StartWorker();
    ASSERT_TRUE(WaitForCondition([this, &worker] {
        return stats_.closed.Get() == 1 && worker->state() == WorkerState::DELAYING;
    }));
    EXPECT_EQ(stats_.opened.Get(), 1u);
    EXPECT_EQ(stats_.open_connections.Get(), 0);
    EXPECT_EQ(stats_.receiving_connections.Get(), 0);
    EXPECT_EQ(stats_.pixels.Get(), 0);

    EXPECT_TRUE(WaitForCondition([this] { return stats_.opened.Get() >= 2; }));
    worker->Stop();
}

TEST_F(StreamWorkerTest, ReceiveErrorReleasesGaugesBetweenCycles) {
    AddEndpoint("rtmp://media/live/cam?pixels=640");
    ASSERT_TRUE(sampler_.Set("const:300ms").ok());
    factory_.SetScript({ReceiveResult::Data(10), ReceiveResult::Error("connection reset")}, false);

    auto worker = StartWorker();
    ASSERT_TRUE(WaitForCondition([this, &worker] {
        return stats_.errors.Get() == 1 && worker->state() == WorkerState::DELAYING;
    }));
    EXPECT_EQ(stats_.closed.Get(), 1u);
    EXPECT_EQ(stats_.open_connections.Get(), 0);
    EXPECT_EQ(stats_.receiving_connections.Get(), 0);
    EXPECT_EQ(stats_.pixels.Get(), 0);
    worker->Stop();
}

TEST_F(StreamWorkerTest, EndOfStreamCountsClosedAndReopens) {
    AddEndpoint("rtmp://media/live/cam");
    ASSERT_TRUE(sampler_.Set("const:5ms").ok());
    factory_.SetScript({ReceiveResult::Data(10), ReceiveResult::EndOfStream()}, false);

    auto worker = StartWorker();
    ASSERT_TRUE(WaitForCondition([this] { return stats_.closed.Get() >= 3; }));
    worker->Stop();

    const uint64_t opened = stats_.opened.Get();
    const uint64_t closed = stats_.closed.Get();
    EXPECT_GE(opened, closed);
    EXPECT_LE(opened - closed, 1u);
    EXPECT_GE(stats_.bytes.Get(), 10 * closed);
    EXPECT_LE(stats_.bytes.Get(), 10 * opened);
    EXPECT_EQ(stats_.errors.Get(), 0u);
    EXPECT_EQ(stats_.open_connections.Get(), 0);
    EXPECT_EQ(stats_.receiving_connections.Get(), 0);
}

TEST_F(StreamWorkerTest, ReceiveErrorCountsErrorAndClosed) {
    AddEndpoint("rtmp://media/live/cam");
    ASSERT_TRUE(sampler_.Set("const:5ms").ok());
    factory_.SetScript({ReceiveResult::Data(5), ReceiveResult::Error("connection reset")}, false);

    auto worker = StartWorker();
    ASSERT_TRUE(WaitForCondition([this] { return stats_.errors.Get() >= 2; }));
    worker->Stop();

    EXPECT_EQ(stats_.errors.Get(), stats_.closed.Get());
    EXPECT_EQ(stats_.open_connections.Get(), 0);
}

TEST_F(StreamWorkerTest, OpenFailureCountsErrorOnly) {
    AddEndpoint("rtmp://media/live/cam");
    ASSERT_TRUE(sampler_.Set("const:5ms").ok());
    factory_.SetOpenError("connection refused");

    auto worker = StartWorker();
    ASSERT_TRUE(WaitForCondition([this] { return stats_.errors.Get() >= 2; }));
    worker->Stop();

    EXPECT_EQ(stats_.opened.Get(), 0u);
    EXPECT_EQ(stats_.closed.Get(), 0u);
    EXPECT_EQ(stats_.open_connections.Get(), 0);
}

TEST_F(StreamWorkerTest, StopInterruptsRestartDelay) {
    AddEndpoint("rtmp://media/live/cam");
    ASSERT_TRUE(sampler_.Set("const:1h").ok());

    auto worker = StartWorker();
    ASSERT_TRUE(WaitForCondition([&worker] { return worker->state() == WorkerState::DELAYING; }));

    auto start = std::chrono::steady_clock::now();
    worker->Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_EQ(factory_.OpenCalls(), 0);
}

TEST_F(StreamWorkerTest, StopIsIdempotent) {
    auto worker = StartWorker();
    worker->RequestStop();
    worker->RequestStop();
    worker->Join();
    worker->Stop();
    EXPECT_TRUE(worker->stopping());
    EXPECT_EQ(worker->state(), WorkerState::STOPPED);
}

TEST(WorkerStateTest, Names) {
    EXPECT_STREQ(WorkerStateName(WorkerState::STREAMING), "streaming");
    EXPECT_STREQ(WorkerStateName(WorkerState::STOPPED), "stopped");
}

} // namespace
} // namespace collector
} // namespace streamstats
