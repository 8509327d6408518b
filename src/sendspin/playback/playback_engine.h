/**
 * @file playback_engine.h
 * @brief Drains the chunk buffer into the output device, paced by the
 *        synchronized clock.
 */
#ifndef SENDSPIN_PLAYBACK_ENGINE_H
#define SENDSPIN_PLAYBACK_ENGINE_H

#include "audio_output.h"
#include "../buffering/audio_chunk_buffer.h"
#include "../configuration/sendspin_settings.h"
#include "../session/player_state_store.h"
#include "../timing/clock_synchronizer.h"
#include "../utils/audio_component.h"
#include "../utils/cpp_logger.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace sendspin {
namespace audio {

/**
 * @class PlaybackEngine
 * @brief Playback thread for one stream at a time.
 * @details `configure()` opens the device for the stream format with a buffer
 *          of `device_buffer_factor` times the device minimum and starts the
 *          thread. The thread pre-buffers, skips chunks that are already too
 *          late once the clock is synced, then plays chunks in buffer order:
 *          early chunks are held back, very late chunks are dropped, the rest
 *          is written immediately.
 */
class PlaybackEngine : public AudioComponent {
public:
    struct Stats {
        uint64_t chunks_played = 0;
        uint64_t chunks_dropped_late = 0;
        uint64_t chunks_skipped_fast_forward = 0;
        uint64_t write_errors = 0;
    };

    PlaybackEngine(std::shared_ptr<AudioChunkBuffer> buffer,
                   std::shared_ptr<ClockSynchronizer> clock,
                   std::shared_ptr<PlayerStateStore> state_store,
                   std::shared_ptr<IAudioOutput> output,
                   SendspinSettingsPtr settings,
                   logging::LoggerPtr logger);
    ~PlaybackEngine() override;

    /**
     * @brief Stops any running stream and starts playing `config`.
     * @return false if the format is unsupported or the device failed to
     *         open; the engine then stays idle until the next call.
     */
    bool configure(const StreamConfig& config);

    void start() override;

    /** @brief Cancels the loop, stops and releases the device. */
    void stop() override;

    /** @brief Linear gain, clamped to [0, 1]. */
    void set_volume(float volume);
    float volume() const { return volume_.load(); }

    std::optional<StreamConfig> active_config() const;
    size_t device_buffer_bytes() const { return device_buffer_bytes_.load(); }
    Stats stats() const;

protected:
    void run() override;

private:
    bool prebuffer();
    void fast_forward();
    void play_chunk(const AudioChunk& chunk);
    void maybe_report_health(std::chrono::steady_clock::time_point now);
    void maybe_log_telemetry(std::chrono::steady_clock::time_point now);

    /// Sleeps up to `duration`; returns false if stop was requested.
    bool sleep_interruptible(std::chrono::microseconds duration);

    std::shared_ptr<AudioChunkBuffer> buffer_;
    std::shared_ptr<ClockSynchronizer> clock_;
    std::shared_ptr<PlayerStateStore> state_store_;
    std::shared_ptr<IAudioOutput> output_;
    SendspinSettingsPtr settings_;
    logging::LoggerPtr logger_;

    mutable std::mutex control_mutex_;
    std::optional<StreamConfig> config_;
    bool device_open_ = false;
    std::atomic<size_t> device_buffer_bytes_{0};
    std::atomic<float> volume_{1.0f};

    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;

    std::atomic<uint64_t> chunks_played_{0};
    std::atomic<uint64_t> chunks_dropped_late_{0};
    std::atomic<uint64_t> chunks_skipped_{0};
    std::atomic<uint64_t> write_errors_{0};

    std::chrono::steady_clock::time_point last_health_report_{};
    std::chrono::steady_clock::time_point last_telemetry_log_{};
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_PLAYBACK_ENGINE_H
