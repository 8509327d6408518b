#include "alsa_audio_output.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>

namespace sendspin {
namespace audio {

namespace {

int32_t read_s24_3le(const uint8_t* p) {
    int32_t value = static_cast<int32_t>(p[0]) | (static_cast<int32_t>(p[1]) << 8) |
                    (static_cast<int32_t>(p[2]) << 16);
    if (value & 0x800000) {
        value |= ~0xFFFFFF;
    }
    return value;
}

void write_s24_3le(uint8_t* p, int32_t value) {
    p[0] = static_cast<uint8_t>(value & 0xFF);
    p[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    p[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
}

} // namespace

AlsaAudioOutput::AlsaAudioOutput(SendspinSettingsPtr settings, logging::LoggerPtr logger)
    : settings_(resolve_settings(settings)),
      logger_(std::move(logger)),
      device_name_(settings_->system_audio.alsa_device.empty() ? "default"
                                                               : settings_->system_audio.alsa_device) {}

AlsaAudioOutput::~AlsaAudioOutput() {
    release();
}

snd_pcm_format_t AlsaAudioOutput::format_for_bit_depth(int bit_depth) {
    switch (bit_depth) {
        case 16: return SND_PCM_FORMAT_S16_LE;
        case 24: return SND_PCM_FORMAT_S24_3LE;
        case 32: return SND_PCM_FORMAT_S32_LE;
        default: return SND_PCM_FORMAT_UNKNOWN;
    }
}

size_t AlsaAudioOutput::min_buffer_size_bytes(const StreamConfig& format) {
    if (format_for_bit_depth(format.bit_depth) == SND_PCM_FORMAT_UNKNOWN ||
        format.channels <= 0 || format.sample_rate <= 0) {
        return 0;
    }
    const double latency_ms = std::max(1.0, settings_->system_audio.alsa_target_latency_ms);
    const auto frames = static_cast<size_t>(std::ceil(format.sample_rate * latency_ms / 1000.0));
    return frames * static_cast<size_t>(format.bytes_per_frame());
}

bool AlsaAudioOutput::open(const StreamConfig& format, size_t buffer_bytes) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    close_locked();
    interrupted_ = false;

    format_ = format;
    sample_format_ = format_for_bit_depth(format.bit_depth);
    bytes_per_frame_ = static_cast<size_t>(format.bytes_per_frame());
    if (sample_format_ == SND_PCM_FORMAT_UNKNOWN || bytes_per_frame_ == 0) {
        LOG_CPP_ERROR(logger_, "[AlsaOutput:%s] Unsupported format: %d ch %d bit.",
                      device_name_.c_str(), format.channels, format.bit_depth);
        return false;
    }
    return configure_device_locked(buffer_bytes);
}

bool AlsaAudioOutput::configure_device_locked(size_t buffer_bytes) {
    int err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, SND_PCM_NONBLOCK);
    if (err < 0) {
        LOG_CPP_ERROR(logger_, "[AlsaOutput:%s] snd_pcm_open failed: %s", device_name_.c_str(), snd_strerror(err));
        pcm_handle_ = nullptr;
        return false;
    }

    const auto sample_rate = static_cast<unsigned int>(format_.sample_rate);
    const auto channels = static_cast<unsigned int>(format_.channels);

    snd_pcm_hw_params_t* hw_params = nullptr;
    snd_pcm_hw_params_malloc(&hw_params);
    snd_pcm_hw_params_any(pcm_handle_, hw_params);
    snd_pcm_hw_params_set_rate_resample(pcm_handle_, hw_params, 1);
    snd_pcm_hw_params_set_access(pcm_handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);

    err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, sample_format_);
    if (err < 0) {
        LOG_CPP_ERROR(logger_, "[AlsaOutput:%s] Failed to set %d-bit format: %s",
                      device_name_.c_str(), format_.bit_depth, snd_strerror(err));
        snd_pcm_hw_params_free(hw_params);
        close_locked();
        return false;
    }
    err = snd_pcm_hw_params_set_channels(pcm_handle_, hw_params, channels);
    if (err < 0) {
        LOG_CPP_ERROR(logger_, "[AlsaOutput:%s] Failed to set %u channels: %s",
                      device_name_.c_str(), channels, snd_strerror(err));
        snd_pcm_hw_params_free(hw_params);
        close_locked();
        return false;
    }
    err = snd_pcm_hw_params_set_rate(pcm_handle_, hw_params, sample_rate, 0);
    if (err < 0) {
        LOG_CPP_ERROR(logger_, "[AlsaOutput:%s] Failed to set exact sample rate %u Hz: %s",
                      device_name_.c_str(), sample_rate, snd_strerror(err));
        snd_pcm_hw_params_free(hw_params);
        close_locked();
        return false;
    }

    const size_t buffer_frames_requested = std::max<size_t>(1, buffer_bytes / bytes_per_frame_);
    unsigned int buffer_time = static_cast<unsigned int>(
        (static_cast<uint64_t>(buffer_frames_requested) * 1000000ULL) / sample_rate);
    const unsigned int periods = std::max(1u, settings_->system_audio.alsa_periods_per_buffer);
    unsigned int period_time = std::max(1000u, buffer_time / periods);
    snd_pcm_hw_params_set_buffer_time_near(pcm_handle_, hw_params, &buffer_time, nullptr);
    snd_pcm_hw_params_set_period_time_near(pcm_handle_, hw_params, &period_time, nullptr);

    err = snd_pcm_hw_params(pcm_handle_, hw_params);
    if (err < 0) {
        LOG_CPP_ERROR(logger_, "[AlsaOutput:%s] Failed to apply hw params: %s", device_name_.c_str(), snd_strerror(err));
        snd_pcm_hw_params_free(hw_params);
        close_locked();
        return false;
    }

    snd_pcm_hw_params_get_period_size(hw_params, &period_frames_, nullptr);
    snd_pcm_hw_params_get_buffer_size(hw_params, &buffer_frames_);
    snd_pcm_hw_params_free(hw_params);

    snd_pcm_sw_params_t* sw_params = nullptr;
    snd_pcm_sw_params_malloc(&sw_params);
    snd_pcm_sw_params_current(pcm_handle_, sw_params);
    snd_pcm_uframes_t start_threshold = period_frames_ > 0 && buffer_frames_ > period_frames_
                                            ? buffer_frames_ - period_frames_
                                            : std::max<snd_pcm_uframes_t>(1, period_frames_);
    snd_pcm_sw_params_set_start_threshold(pcm_handle_, sw_params, start_threshold);
    snd_pcm_sw_params_set_avail_min(pcm_handle_, sw_params, std::max<snd_pcm_uframes_t>(1, period_frames_));
    snd_pcm_sw_params(pcm_handle_, sw_params);
    snd_pcm_sw_params_free(sw_params);

    err = snd_pcm_prepare(pcm_handle_);
    if (err < 0) {
        LOG_CPP_ERROR(logger_, "[AlsaOutput:%s] Failed to prepare PCM device: %s", device_name_.c_str(), snd_strerror(err));
        close_locked();
        return false;
    }

    LOG_CPP_INFO(logger_, "[AlsaOutput:%s] Opened rate=%u Hz channels=%u bit_depth=%d period=%lu frames buffer=%lu frames.",
                 device_name_.c_str(), sample_rate, channels, format_.bit_depth,
                 static_cast<unsigned long>(period_frames_), static_cast<unsigned long>(buffer_frames_));
    frames_written_ = 0;
    xrun_count_ = 0;
    return true;
}

bool AlsaAudioOutput::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!pcm_handle_) {
        return false;
    }
    interrupted_ = false;
    // Playback starts on its own once start_threshold frames are queued.
    const snd_pcm_state_t state = snd_pcm_state(pcm_handle_);
    if (state == SND_PCM_STATE_SETUP || state == SND_PCM_STATE_XRUN) {
        const int err = snd_pcm_prepare(pcm_handle_);
        if (err < 0) {
            LOG_CPP_ERROR(logger_, "[AlsaOutput:%s] Failed to prepare PCM device: %s", device_name_.c_str(), snd_strerror(err));
            return false;
        }
    }
    return true;
}

long AlsaAudioOutput::write(const uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!pcm_handle_) {
        return -ENODEV;
    }
    if (!data || size == 0 || bytes_per_frame_ == 0) {
        return 0;
    }

    const size_t frame_count = size / bytes_per_frame_;
    if (frame_count == 0) {
        return 0;
    }
    const size_t byte_count = frame_count * bytes_per_frame_;
    const uint8_t* samples = apply_gain_locked(data, byte_count);
    if (!write_frames_locked(samples, frame_count)) {
        return interrupted_ ? -EINTR : -EIO;
    }
    maybe_log_telemetry_locked();
    return static_cast<long>(byte_count);
}

const uint8_t* AlsaAudioOutput::apply_gain_locked(const uint8_t* data, size_t size) {
    const float gain = volume_.load();
    if (gain >= 0.9999f) {
        return data;
    }

    gain_scratch_.resize(size);
    if (gain <= 0.0f) {
        std::fill(gain_scratch_.begin(), gain_scratch_.end(), 0);
        return gain_scratch_.data();
    }

    switch (sample_format_) {
        case SND_PCM_FORMAT_S16_LE:
            for (size_t i = 0; i + 1 < size; i += 2) {
                int16_t sample;
                std::memcpy(&sample, data + i, sizeof(sample));
                sample = static_cast<int16_t>(std::lround(sample * gain));
                std::memcpy(gain_scratch_.data() + i, &sample, sizeof(sample));
            }
            break;
        case SND_PCM_FORMAT_S24_3LE:
            for (size_t i = 0; i + 2 < size; i += 3) {
                write_s24_3le(gain_scratch_.data() + i,
                              static_cast<int32_t>(std::lround(read_s24_3le(data + i) * gain)));
            }
            break;
        case SND_PCM_FORMAT_S32_LE:
            for (size_t i = 0; i + 3 < size; i += 4) {
                int32_t sample;
                std::memcpy(&sample, data + i, sizeof(sample));
                sample = static_cast<int32_t>(std::llround(static_cast<double>(sample) * gain));
                std::memcpy(gain_scratch_.data() + i, &sample, sizeof(sample));
            }
            break;
        default:
            return data;
    }
    return gain_scratch_.data();
}

bool AlsaAudioOutput::write_frames_locked(const uint8_t* data, size_t frame_count) {
    const uint8_t* byte_ptr = data;
    size_t frames_remaining = frame_count;

    while (frames_remaining > 0) {
        if (interrupted_) {
            LOG_CPP_DEBUG(logger_, "[AlsaOutput:%s] Write interrupted with %zu frames pending.",
                          device_name_.c_str(), frames_remaining);
            return false;
        }
        int wait_rc = snd_pcm_wait(pcm_handle_, 10);
        if (wait_rc == 0) {
            continue;
        }
        if (wait_rc < 0) {
            if (!handle_write_error_locked(wait_rc)) {
                return false;
            }
            continue;
        }

        snd_pcm_sframes_t avail = snd_pcm_avail_update(pcm_handle_);
        if (avail < 0) {
            if (!handle_write_error_locked(static_cast<int>(avail))) {
                return false;
            }
            continue;
        }
        if (avail == 0) {
            continue;
        }

        const auto frames_desired = static_cast<snd_pcm_uframes_t>(
            std::min<size_t>(frames_remaining, static_cast<size_t>(avail)));
        snd_pcm_sframes_t written = snd_pcm_writei(pcm_handle_, byte_ptr, frames_desired);
        if (written == -EAGAIN) {
            continue;
        }
        if (written < 0) {
            if (!handle_write_error_locked(static_cast<int>(written))) {
                return false;
            }
            continue;
        }

        frames_written_ += static_cast<uint64_t>(written);
        byte_ptr += static_cast<size_t>(written) * bytes_per_frame_;
        frames_remaining -= static_cast<size_t>(written);
    }
    return true;
}

bool AlsaAudioOutput::handle_write_error_locked(int err) {
    if (!pcm_handle_) {
        return false;
    }

    if (err == -EPIPE || snd_pcm_state(pcm_handle_) == SND_PCM_STATE_XRUN) {
        ++xrun_count_;
        LOG_CPP_WARNING(logger_, "[AlsaOutput:%s] x-run detected (err=%s). Attempting recovery.",
                        device_name_.c_str(), snd_strerror(err));
    } else {
        LOG_CPP_WARNING(logger_, "[AlsaOutput:%s] Write error (err=%s). Attempting recovery.",
                        device_name_.c_str(), snd_strerror(err));
    }

    err = snd_pcm_recover(pcm_handle_, err, 1);
    if (err < 0) {
        LOG_CPP_ERROR(logger_, "[AlsaOutput:%s] Failed to recover from write error: %s",
                      device_name_.c_str(), snd_strerror(err));
        return false;
    }
    return true;
}

void AlsaAudioOutput::stop() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pcm_handle_) {
        snd_pcm_drop(pcm_handle_);
    }
}

void AlsaAudioOutput::interrupt() {
    interrupted_ = true;
}

void AlsaAudioOutput::release() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    close_locked();
}

void AlsaAudioOutput::close_locked() {
    if (pcm_handle_) {
        snd_pcm_drop(pcm_handle_);
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
        LOG_CPP_INFO(logger_, "[AlsaOutput:%s] Closed after %llu frames (%llu x-runs).",
                     device_name_.c_str(), static_cast<unsigned long long>(frames_written_),
                     static_cast<unsigned long long>(xrun_count_));
    }
    period_frames_ = 0;
    buffer_frames_ = 0;
}

void AlsaAudioOutput::set_volume(float volume) {
    volume_.store(std::clamp(volume, 0.0f, 1.0f));
}

int64_t AlsaAudioOutput::latency_us() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!pcm_handle_ || format_.sample_rate <= 0) {
        return 0;
    }
    return static_cast<int64_t>(buffer_frames_) * 1000000LL / format_.sample_rate;
}

void AlsaAudioOutput::maybe_log_telemetry_locked() {
    if (!settings_->telemetry.enabled || !pcm_handle_ || format_.sample_rate <= 0) {
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    const auto interval = std::chrono::milliseconds(settings_->telemetry.log_interval_ms);
    if (telemetry_last_log_time_.time_since_epoch().count() != 0 &&
        now - telemetry_last_log_time_ < interval) {
        return;
    }
    telemetry_last_log_time_ = now;

    snd_pcm_sframes_t delay_frames = 0;
    double delay_ms = 0.0;
    if (snd_pcm_delay(pcm_handle_, &delay_frames) == 0 && delay_frames >= 0) {
        delay_ms = 1000.0 * static_cast<double>(delay_frames) / static_cast<double>(format_.sample_rate);
    }

    LOG_CPP_INFO(logger_,
                 "[Telemetry][AlsaOutput:%s] delay_frames=%ld delay_ms=%.3f buffer_frames=%lu period_frames=%lu frames_written=%llu xruns=%llu",
                 device_name_.c_str(),
                 static_cast<long>(delay_frames),
                 delay_ms,
                 static_cast<unsigned long>(buffer_frames_),
                 static_cast<unsigned long>(period_frames_),
                 static_cast<unsigned long long>(frames_written_),
                 static_cast<unsigned long long>(xrun_count_));
}

} // namespace audio
} // namespace sendspin
