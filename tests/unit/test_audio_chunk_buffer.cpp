#include <gtest/gtest.h>
#include "buffering/audio_chunk_buffer.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace sendspin::audio;

namespace {

AudioChunk make_chunk(int64_t timestamp_us, size_t bytes, uint8_t fill = 0) {
    AudioChunk chunk;
    chunk.timestamp_us = timestamp_us;
    chunk.payload.assign(bytes, fill);
    return chunk;
}

} // namespace

class AudioChunkBufferTest : public ::testing::Test {
protected:
    AudioChunkBuffer buffer{1024};
};

TEST_F(AudioChunkBufferTest, InitiallyEmpty) {
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.size_bytes(), 0u);
    EXPECT_EQ(buffer.capacity(), 1024u);
    EXPECT_EQ(buffer.available_bytes(), 1024u);
    EXPECT_FALSE(buffer.read().has_value());
    EXPECT_FALSE(buffer.peek().has_value());
    EXPECT_FALSE(buffer.peek_timestamp().has_value());
}

TEST_F(AudioChunkBufferTest, OverflowingWriteIsRejectedWithoutSideEffects) {
    EXPECT_TRUE(buffer.write(make_chunk(1, 600)));
    EXPECT_EQ(buffer.size_bytes(), 600u);

    EXPECT_FALSE(buffer.write(make_chunk(2, 500)));
    EXPECT_EQ(buffer.size_bytes(), 600u);
    EXPECT_EQ(buffer.chunk_count(), 1u);
    EXPECT_EQ(buffer.chunks_rejected(), 1u);

    auto chunk = buffer.read();
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->payload.size(), 600u);
    EXPECT_EQ(chunk->timestamp_us, 1);
    EXPECT_EQ(buffer.size_bytes(), 0u);
}

TEST_F(AudioChunkBufferTest, ChunkFillingExactCapacityIsAccepted) {
    EXPECT_TRUE(buffer.write(make_chunk(1, 1024)));
    EXPECT_EQ(buffer.size_bytes(), 1024u);
    EXPECT_EQ(buffer.usage_percent(), 100);
    EXPECT_FALSE(buffer.write(make_chunk(2, 1)));
}

TEST_F(AudioChunkBufferTest, ChunkLargerThanCapacityIsRejected) {
    EXPECT_FALSE(buffer.write(make_chunk(1, 1025)));
    EXPECT_TRUE(buffer.empty());
}

TEST_F(AudioChunkBufferTest, ReadsInWriteOrderNotTimestampOrder) {
    buffer.write(make_chunk(300, 10, 3));
    buffer.write(make_chunk(100, 10, 1));
    buffer.write(make_chunk(200, 10, 2));

    EXPECT_EQ(buffer.peek_timestamp().value(), 300);
    EXPECT_EQ(buffer.read()->timestamp_us, 300);
    EXPECT_EQ(buffer.read()->timestamp_us, 100);
    EXPECT_EQ(buffer.read()->timestamp_us, 200);
    EXPECT_TRUE(buffer.empty());
}

TEST_F(AudioChunkBufferTest, PeekDoesNotConsume) {
    buffer.write(make_chunk(7, 32, 0x5A));
    auto peeked = buffer.peek();
    ASSERT_TRUE(peeked.has_value());
    EXPECT_EQ(peeked->payload[0], 0x5A);
    EXPECT_EQ(buffer.chunk_count(), 1u);
    EXPECT_EQ(buffer.size_bytes(), 32u);
}

TEST_F(AudioChunkBufferTest, ClearDropsEverything) {
    buffer.write(make_chunk(1, 100));
    buffer.write(make_chunk(2, 200));
    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.size_bytes(), 0u);
    EXPECT_EQ(buffer.chunks_written(), 2u);
    EXPECT_TRUE(buffer.write(make_chunk(3, 1024)));
}

TEST_F(AudioChunkBufferTest, UsagePercentTracksFill) {
    buffer.write(make_chunk(1, 256));
    EXPECT_EQ(buffer.usage_percent(), 25);
    EXPECT_EQ(buffer.health_percent(), 25);
    buffer.write(make_chunk(2, 256));
    EXPECT_EQ(buffer.usage_percent(), 50);
}

TEST_F(AudioChunkBufferTest, WaitForBytesReturnsWhenThresholdReached) {
    std::atomic<bool> stop{false};
    std::thread producer([this]() {
        for (int i = 0; i < 4; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            buffer.write(make_chunk(i, 100));
        }
    });
    EXPECT_TRUE(buffer.wait_for_bytes(400, std::chrono::milliseconds(2000), stop));
    producer.join();
    EXPECT_EQ(buffer.size_bytes(), 400u);
}

TEST_F(AudioChunkBufferTest, WaitForBytesTimesOut) {
    std::atomic<bool> stop{false};
    buffer.write(make_chunk(1, 100));
    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(buffer.wait_for_bytes(500, std::chrono::milliseconds(30), stop));
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(25));
}

TEST_F(AudioChunkBufferTest, WaitForBytesWakesOnStop) {
    std::atomic<bool> stop{false};
    std::atomic<bool> returned{false};
    std::thread waiter([&]() {
        buffer.wait_for_bytes(1000, std::chrono::seconds(10), stop);
        returned = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(returned);
    stop = true;
    buffer.notify_waiters();
    waiter.join();
    EXPECT_TRUE(returned);
}

TEST(AudioChunkBufferConcurrencyTest, SingleProducerSingleConsumerKeepsOrder) {
    AudioChunkBuffer buffer(64 * 1024);
    constexpr int kChunks = 2000;
    std::atomic<bool> done{false};

    std::thread producer([&]() {
        for (int i = 0; i < kChunks; ++i) {
            AudioChunk chunk{i, std::vector<uint8_t>(64, static_cast<uint8_t>(i))};
            while (!buffer.write(chunk)) {
                std::this_thread::yield();
            }
        }
        done = true;
    });

    std::vector<int64_t> received;
    received.reserve(kChunks);
    while (static_cast<int>(received.size()) < kChunks) {
        if (auto chunk = buffer.read()) {
            EXPECT_LE(buffer.size_bytes(), buffer.capacity());
            received.push_back(chunk->timestamp_us);
        } else if (done && buffer.empty()) {
            break;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(kChunks));
    for (int i = 0; i < kChunks; ++i) {
        EXPECT_EQ(received[i], i);
    }
    EXPECT_EQ(buffer.chunks_read(), static_cast<uint64_t>(kChunks));
}
