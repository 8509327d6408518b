#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "sendspin_types.h"
#include "utils/thread_safe_queue.h"

using sendspin::audio::utils::ThreadSafeQueue;

class ThreadSafeQueueTest : public ::testing::Test {
protected:
    ThreadSafeQueue<int> queue;
};

TEST_F(ThreadSafeQueueTest, InitiallyEmpty) {
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_FALSE(queue.is_stopped());
}

TEST_F(ThreadSafeQueueTest, FIFOOrder) {
    queue.push(1);
    queue.push(2);
    queue.push(3);

    int value = 0;
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 1);
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 2);
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 3);
    EXPECT_TRUE(queue.empty());
}

TEST_F(ThreadSafeQueueTest, StopUnblocksBlockingPop) {
    std::atomic<bool> popped{false};
    std::atomic<bool> returned{false};

    std::thread consumer([this, &popped, &returned]() {
        int value;
        popped = queue.pop(value);
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(returned);

    queue.stop();
    consumer.join();

    EXPECT_TRUE(returned);
    EXPECT_FALSE(popped);
    EXPECT_TRUE(queue.is_stopped());
}

TEST_F(ThreadSafeQueueTest, QueuedItemsDrainAfterStop) {
    queue.push(7);
    queue.push(8);
    queue.stop();

    EXPECT_FALSE(queue.push(9));
    int value = 0;
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 7);
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 8);
    EXPECT_FALSE(queue.pop(value));
}

TEST_F(ThreadSafeQueueTest, ResetReopensQueue) {
    queue.push(1);
    queue.stop();
    queue.reset();

    EXPECT_FALSE(queue.is_stopped());
    EXPECT_TRUE(queue.empty());
    EXPECT_TRUE(queue.push(2));
    EXPECT_EQ(queue.size(), 1u);
}

TEST(SessionEventQueueTest, CarriesEventVariantsAcrossThreads) {
    using namespace sendspin::audio;
    ThreadSafeQueue<SessionEvent> events;
    std::vector<SessionEvent> received;

    std::thread consumer([&]() {
        SessionEvent event;
        while (events.pop(event)) {
            received.push_back(event);
        }
    });

    events.push(StateChangedEvent{ConnectionState::CONNECTED});
    events.push(VolumeChangedEvent{40});
    events.push(StreamEndEvent{});
    events.stop();
    consumer.join();

    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(std::get<StateChangedEvent>(received[0]).state, ConnectionState::CONNECTED);
    EXPECT_EQ(std::get<VolumeChangedEvent>(received[1]).volume, 40);
    EXPECT_TRUE(std::holds_alternative<StreamEndEvent>(received[2]));
}
