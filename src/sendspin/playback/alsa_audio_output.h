#pragma once

#include "audio_output.h"
#include "../configuration/sendspin_settings.h"
#include "../utils/cpp_logger.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <alsa/asoundlib.h>

namespace sendspin {
namespace audio {

/**
 * @class AlsaAudioOutput
 * @brief Writes interleaved little-endian PCM to an ALSA playback device.
 * @details The PCM is opened non-blocking; writes wait on `snd_pcm_wait` in
 *          short slices and recover from x-runs with `snd_pcm_recover`.
 *          Volume is applied as software gain before each write.
 */
class AlsaAudioOutput : public IAudioOutput {
public:
    AlsaAudioOutput(SendspinSettingsPtr settings, logging::LoggerPtr logger);
    ~AlsaAudioOutput() override;

    size_t min_buffer_size_bytes(const StreamConfig& format) override;
    bool open(const StreamConfig& format, size_t buffer_bytes) override;
    bool start() override;
    long write(const uint8_t* data, size_t size) override;
    void stop() override;
    void release() override;
    void interrupt() override;
    void set_volume(float volume) override;
    int64_t latency_us() const override;

private:
    static snd_pcm_format_t format_for_bit_depth(int bit_depth);

    bool configure_device_locked(size_t buffer_bytes);
    bool handle_write_error_locked(int err);
    bool write_frames_locked(const uint8_t* data, size_t frame_count);
    const uint8_t* apply_gain_locked(const uint8_t* data, size_t size);
    void close_locked();
    void maybe_log_telemetry_locked();

    SendspinSettingsPtr settings_;
    logging::LoggerPtr logger_;
    std::string device_name_;

    mutable std::mutex state_mutex_;
    snd_pcm_t* pcm_handle_ = nullptr;
    StreamConfig format_;
    snd_pcm_format_t sample_format_ = SND_PCM_FORMAT_UNKNOWN;
    size_t bytes_per_frame_ = 0;
    snd_pcm_uframes_t period_frames_ = 0;
    snd_pcm_uframes_t buffer_frames_ = 0;

    std::atomic<float> volume_{1.0f};
    std::atomic<bool> interrupted_{false};
    std::vector<uint8_t> gain_scratch_;

    std::chrono::steady_clock::time_point telemetry_last_log_time_{};
    uint64_t frames_written_ = 0;
    uint64_t xrun_count_ = 0;
};

} // namespace audio
} // namespace sendspin
