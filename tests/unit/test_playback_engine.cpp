#include <gtest/gtest.h>
#include "playback/playback_engine.h"
#include "../mocks/mock_audio_output.h"

#include <chrono>
#include <thread>

using namespace sendspin::audio;
using sendspin::audio::testing::FakeClock;
using sendspin::audio::testing::MockAudioOutput;

class PlaybackEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings = std::make_shared<SendspinSettings>();
        settings->playback.device_buffer_factor = 1;
        settings->playback.prebuffer_timeout_ms = 200;
        settings->playback.empty_poll_ms = 1;
        settings->telemetry.enabled = false;

        buffer = std::make_shared<AudioChunkBuffer>(64 * 1024);
        clock = std::make_shared<ClockSynchronizer>(settings->clock_sync, fake_clock.source(), nullptr);
        store = std::make_shared<PlayerStateStore>();
        output = std::make_shared<MockAudioOutput>(fake_clock.source());
        output->set_min_buffer_bytes(64);
        engine = std::make_unique<PlaybackEngine>(buffer, clock, store, output, settings, nullptr);
    }

    void TearDown() override {
        engine.reset();
    }

    void sync_clock(int64_t offset_us) {
        for (size_t i = 0; i < settings->clock_sync.min_samples_for_sync; ++i) {
            clock->add_offset_sample(offset_us);
        }
        ASSERT_TRUE(clock->is_synced());
    }

    static StreamConfig pcm_config() {
        StreamConfig config;
        config.codec = "pcm";
        config.sample_rate = 48000;
        config.channels = 2;
        config.bit_depth = 16;
        return config;
    }

    void push_chunk(int64_t server_timestamp_us, size_t bytes, uint8_t fill) {
        ASSERT_TRUE(buffer->write(AudioChunk{server_timestamp_us, std::vector<uint8_t>(bytes, fill)}));
    }

    int64_t server_now() const { return clock->local_to_server(fake_clock.now()); }

    FakeClock fake_clock;
    SendspinSettingsPtr settings;
    std::shared_ptr<AudioChunkBuffer> buffer;
    std::shared_ptr<ClockSynchronizer> clock;
    std::shared_ptr<PlayerStateStore> store;
    std::shared_ptr<MockAudioOutput> output;
    std::unique_ptr<PlaybackEngine> engine;
};

TEST_F(PlaybackEngineTest, ConfigureOpensDeviceWithScaledBuffer) {
    settings->playback.device_buffer_factor = 6;
    ASSERT_TRUE(engine->configure(pcm_config()));

    EXPECT_TRUE(output->is_open());
    ASSERT_TRUE(output->format().has_value());
    EXPECT_EQ(output->format()->sample_rate, 48000);
    EXPECT_EQ(output->buffer_bytes(), 64u * 6u);
    EXPECT_EQ(engine->device_buffer_bytes(), 64u * 6u);
    ASSERT_TRUE(engine->active_config().has_value());
    EXPECT_EQ(*engine->active_config(), pcm_config());
}

TEST_F(PlaybackEngineTest, NonPcmStreamIsRejected) {
    StreamConfig config = pcm_config();
    config.codec = "flac";
    EXPECT_FALSE(engine->configure(config));
    EXPECT_EQ(output->open_calls(), 0);
    EXPECT_FALSE(engine->active_config().has_value());
}

TEST_F(PlaybackEngineTest, InvalidPcmFormatIsRejected) {
    StreamConfig config = pcm_config();
    config.channels = 0;
    EXPECT_FALSE(engine->configure(config));
    EXPECT_EQ(output->open_calls(), 0);
}

TEST_F(PlaybackEngineTest, DeviceOpenFailureLeavesEngineIdle) {
    output->set_fail_open(true);
    push_chunk(0, 64, 1);
    EXPECT_FALSE(engine->configure(pcm_config()));
    EXPECT_FALSE(engine->active_config().has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_TRUE(output->writes().empty());
    EXPECT_EQ(buffer->chunk_count(), 1u);

    output->set_fail_open(false);
    EXPECT_TRUE(engine->configure(pcm_config()));
    EXPECT_TRUE(output->wait_for_writes(1, std::chrono::milliseconds(1000)));
}

TEST_F(PlaybackEngineTest, UnsyncedClockPlaysInArrivalOrder) {
    push_chunk(5000000, 64, 1);
    push_chunk(1, 64, 2);
    ASSERT_TRUE(engine->configure(pcm_config()));

    ASSERT_TRUE(output->wait_for_writes(2, std::chrono::milliseconds(1000)));
    auto writes = output->writes();
    EXPECT_EQ(writes[0].data[0], 1);
    EXPECT_EQ(writes[1].data[0], 2);
    EXPECT_EQ(engine->stats().chunks_played, 2u);
}

TEST_F(PlaybackEngineTest, StaleChunksAreSkippedAtStreamStart) {
    sync_clock(3000000);
    push_chunk(server_now() - 2000000, 64, 0xAA);
    push_chunk(server_now(), 64, 0xBB);
    ASSERT_TRUE(engine->configure(pcm_config()));

    ASSERT_TRUE(output->wait_for_writes(1, std::chrono::milliseconds(1000)));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto writes = output->writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].data[0], 0xBB);

    auto stats = engine->stats();
    EXPECT_EQ(stats.chunks_skipped_fast_forward, 1u);
    EXPECT_EQ(stats.chunks_played, 1u);
}

TEST_F(PlaybackEngineTest, VeryLateChunkIsDroppedWithoutWrite) {
    settings->playback.fast_forward_threshold_us = 60000000;
    sync_clock(0);
    push_chunk(server_now() - 2000000, 64, 0xAA);
    push_chunk(server_now() - 200000, 64, 0xBB);
    ASSERT_TRUE(engine->configure(pcm_config()));

    ASSERT_TRUE(output->wait_for_writes(1, std::chrono::milliseconds(1000)));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto writes = output->writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].data[0], 0xBB);
    EXPECT_EQ(engine->stats().chunks_dropped_late, 1u);
    EXPECT_EQ(engine->stats().chunks_skipped_fast_forward, 0u);
}

TEST_F(PlaybackEngineTest, EarlyChunkIsHeldBack) {
    settings->playback.max_ahead_sleep_us = 150000;
    sync_clock(0);
    push_chunk(server_now() + 400000, 64, 0x01);

    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(engine->configure(pcm_config()));
    ASSERT_TRUE(output->wait_for_writes(1, std::chrono::milliseconds(2000)));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
    EXPECT_EQ(engine->stats().chunks_played, 1u);
}

TEST_F(PlaybackEngineTest, PartialFrameIsTrimmed) {
    push_chunk(0, 66, 3);
    ASSERT_TRUE(engine->configure(pcm_config()));
    ASSERT_TRUE(output->wait_for_writes(1, std::chrono::milliseconds(1000)));
    EXPECT_EQ(output->writes()[0].data.size(), 64u);
}

TEST_F(PlaybackEngineTest, PrebufferTimeoutStillStartsPlayback) {
    settings->playback.device_buffer_factor = 100;
    push_chunk(0, 64, 7);
    ASSERT_TRUE(engine->configure(pcm_config()));
    ASSERT_TRUE(output->wait_for_writes(1, std::chrono::milliseconds(2000)));
    EXPECT_EQ(output->writes()[0].data[0], 7);
}

TEST_F(PlaybackEngineTest, WriteErrorsAreCounted) {
    output->set_write_error(-32);
    push_chunk(0, 64, 1);
    ASSERT_TRUE(engine->configure(pcm_config()));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (engine->stats().write_errors == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    EXPECT_EQ(engine->stats().write_errors, 1u);
    EXPECT_EQ(engine->stats().chunks_played, 0u);
}

TEST_F(PlaybackEngineTest, StopReleasesDevice) {
    ASSERT_TRUE(engine->configure(pcm_config()));
    engine->stop();

    EXPECT_FALSE(output->is_open());
    EXPECT_EQ(output->release_calls(), 1);
    EXPECT_FALSE(engine->active_config().has_value());

    engine->stop();
    EXPECT_EQ(output->release_calls(), 1);
}

TEST_F(PlaybackEngineTest, StopInterruptsStalledWrite) {
    output->set_stall_writes(true);
    push_chunk(0, 64, 1);
    ASSERT_TRUE(engine->configure(pcm_config()));
    ASSERT_TRUE(output->wait_for_stalled_write(std::chrono::seconds(1)));

    engine->stop();

    EXPECT_GE(output->interrupt_calls(), 1);
    EXPECT_EQ(output->release_calls(), 1);
    EXPECT_EQ(engine->stats().chunks_played, 0u);
    EXPECT_EQ(engine->stats().write_errors, 0u);
}

TEST_F(PlaybackEngineTest, ReconfigureReleasesPreviousDevice) {
    ASSERT_TRUE(engine->configure(pcm_config()));
    StreamConfig next = pcm_config();
    next.sample_rate = 44100;
    ASSERT_TRUE(engine->configure(next));

    EXPECT_EQ(output->release_calls(), 1);
    EXPECT_EQ(output->open_calls(), 2);
    EXPECT_EQ(output->format()->sample_rate, 44100);
}

TEST_F(PlaybackEngineTest, VolumeIsClampedAndForwarded) {
    engine->set_volume(1.7f);
    EXPECT_FLOAT_EQ(engine->volume(), 1.0f);
    EXPECT_FLOAT_EQ(output->volume(), 1.0f);

    engine->set_volume(-0.5f);
    EXPECT_FLOAT_EQ(output->volume(), 0.0f);

    engine->set_volume(0.4f);
    ASSERT_TRUE(engine->configure(pcm_config()));
    EXPECT_FLOAT_EQ(output->volume(), 0.4f);
}
