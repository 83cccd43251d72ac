#include <gtest/gtest.h>
#include "peerlink/engine/event_channel.hpp"
#include "support/test_support.hpp"
#include <atomic>
#include <stdexcept>

using namespace peerlink::engine;
using peerlink::network::ConnectionState;
using peerlink::network::DisconnectReason;

namespace {

TransferProgress progress_event(std::uint64_t bytes) {
    TransferProgress event{};
    event.job_id = "00";
    event.peer = "bob";
    event.direction = peerlink::transfer::Direction::OUTGOING;
    event.filename = "a.bin";
    event.bytes_done = bytes;
    event.total_bytes = 1000;
    return event;
}

}

class EventChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel.start();
    }

    void TearDown() override {
        channel.stop();
    }

    EventChannel channel;
};

TEST_F(EventChannelTest, DeliversInPublicationOrder) {
    std::mutex mutex;
    std::vector<std::uint64_t> seen;
    channel.subscribe([&](const Event& event) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(std::get<TransferProgress>(event).bytes_done);
    });

    for (std::uint64_t i = 0; i < 200; ++i) {
        channel.publish(progress_event(i));
    }
    ASSERT_TRUE(channel.flush());

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(seen.size(), 200u);
    for (std::uint64_t i = 0; i < 200; ++i) {
        EXPECT_EQ(seen[i], i);
    }
}

TEST_F(EventChannelTest, EverySubscriberSeesEveryEvent) {
    std::atomic<int> first{0};
    std::atomic<int> second{0};
    channel.subscribe([&](const Event&) { ++first; });
    channel.subscribe([&](const Event&) { ++second; });

    channel.publish(ConnectionStateChanged{"bob", ConnectionState::CONNECTED, DisconnectReason::NONE});
    channel.publish(progress_event(10));
    ASSERT_TRUE(channel.flush());

    EXPECT_EQ(first.load(), 2);
    EXPECT_EQ(second.load(), 2);
}

TEST_F(EventChannelTest, FailingHandlerDoesNotStopDelivery) {
    std::atomic<int> delivered{0};
    channel.subscribe([](const Event&) { throw std::runtime_error("handler failure"); });
    channel.subscribe([&](const Event&) { ++delivered; });

    channel.publish(progress_event(1));
    channel.publish(progress_event(2));
    ASSERT_TRUE(channel.flush());

    EXPECT_EQ(delivered.load(), 2);
}

TEST_F(EventChannelTest, StopDeliversQueuedEvents) {
    std::atomic<int> delivered{0};
    channel.subscribe([&](const Event&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        ++delivered;
    });

    for (int i = 0; i < 20; ++i) {
        channel.publish(progress_event(static_cast<std::uint64_t>(i)));
    }
    channel.stop();

    EXPECT_FALSE(channel.is_running());
    EXPECT_EQ(delivered.load(), 20);
}

TEST_F(EventChannelTest, FlushWithNothingQueued) {
    EXPECT_TRUE(channel.flush(std::chrono::milliseconds(100)));
}

TEST(EventDescribeTest, NamesTheEvent) {
    auto line = describe(Event{ConnectionStateChanged{"bob", ConnectionState::CONNECTED, DisconnectReason::NONE}});
    EXPECT_NE(line.find("bob"), std::string::npos);

    auto progress = progress_event(250);
    EXPECT_DOUBLE_EQ(progress.percent(), 25.0);
    EXPECT_NE(describe(Event{progress}).find("a.bin"), std::string::npos);
}
