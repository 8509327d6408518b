#include "playback_engine.h"

#include <algorithm>
#include <cerrno>

namespace sendspin {
namespace audio {

PlaybackEngine::PlaybackEngine(std::shared_ptr<AudioChunkBuffer> buffer,
                               std::shared_ptr<ClockSynchronizer> clock,
                               std::shared_ptr<PlayerStateStore> state_store,
                               std::shared_ptr<IAudioOutput> output,
                               SendspinSettingsPtr settings,
                               logging::LoggerPtr logger)
    : buffer_(std::move(buffer)),
      clock_(std::move(clock)),
      state_store_(std::move(state_store)),
      output_(std::move(output)),
      settings_(resolve_settings(settings)),
      logger_(std::move(logger)) {}

PlaybackEngine::~PlaybackEngine() {
    stop();
}

bool PlaybackEngine::configure(const StreamConfig& config) {
    stop();

    std::lock_guard<std::mutex> lock(control_mutex_);
    if (config.codec != "pcm") {
        LOG_CPP_ERROR(logger_, "[Playback] Unsupported codec '%s'; only raw PCM is played.", config.codec.c_str());
        return false;
    }
    if (config.bytes_per_frame() == 0 || config.sample_rate <= 0) {
        LOG_CPP_ERROR(logger_, "[Playback] Invalid PCM format: %d Hz %d ch %d bit.",
                      config.sample_rate, config.channels, config.bit_depth);
        return false;
    }

    const size_t min_buffer = output_->min_buffer_size_bytes(config);
    if (min_buffer == 0) {
        LOG_CPP_ERROR(logger_, "[Playback] Output device does not support %d Hz %d ch %d bit.",
                      config.sample_rate, config.channels, config.bit_depth);
        return false;
    }
    const size_t buffer_bytes = min_buffer * static_cast<size_t>(std::max(1, settings_->playback.device_buffer_factor));

    if (!output_->open(config, buffer_bytes)) {
        LOG_CPP_ERROR(logger_, "[Playback] Failed to open output device; staying idle until the next stream.");
        return false;
    }
    output_->set_volume(volume_.load());

    config_ = config;
    device_open_ = true;
    device_buffer_bytes_ = buffer_bytes;
    chunks_played_ = 0;
    chunks_dropped_late_ = 0;
    chunks_skipped_ = 0;
    write_errors_ = 0;

    LOG_CPP_INFO(logger_, "[Playback] Configured %d Hz %d ch %d bit, device buffer %zu bytes (min %zu).",
                 config.sample_rate, config.channels, config.bit_depth, buffer_bytes, min_buffer);

    stop_flag_ = false;
    component_thread_ = std::thread(&PlaybackEngine::run, this);
    return true;
}

void PlaybackEngine::start() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (component_thread_.joinable() || !device_open_) {
        return;
    }
    stop_flag_ = false;
    component_thread_ = std::thread(&PlaybackEngine::run, this);
}

void PlaybackEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        stop_flag_ = true;
    }
    sleep_cv_.notify_all();
    buffer_->notify_waiters();
    output_->interrupt();

    if (component_thread_.joinable()) {
        component_thread_.join();
    }

    std::lock_guard<std::mutex> lock(control_mutex_);
    if (device_open_) {
        output_->stop();
        output_->release();
        device_open_ = false;
        LOG_CPP_INFO(logger_, "[Playback] Stopped: played=%llu dropped_late=%llu skipped=%llu write_errors=%llu",
                     static_cast<unsigned long long>(chunks_played_.load()),
                     static_cast<unsigned long long>(chunks_dropped_late_.load()),
                     static_cast<unsigned long long>(chunks_skipped_.load()),
                     static_cast<unsigned long long>(write_errors_.load()));
    }
    config_.reset();
    device_buffer_bytes_ = 0;
}

void PlaybackEngine::set_volume(float volume) {
    const float clamped = std::clamp(volume, 0.0f, 1.0f);
    volume_.store(clamped);
    output_->set_volume(clamped);
}

std::optional<StreamConfig> PlaybackEngine::active_config() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return config_;
}

PlaybackEngine::Stats PlaybackEngine::stats() const {
    Stats stats;
    stats.chunks_played = chunks_played_.load();
    stats.chunks_dropped_late = chunks_dropped_late_.load();
    stats.chunks_skipped_fast_forward = chunks_skipped_.load();
    stats.write_errors = write_errors_.load();
    return stats;
}

bool PlaybackEngine::sleep_interruptible(std::chrono::microseconds duration) {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, duration, [this] { return stop_flag_.load(); });
    return !stop_flag_;
}

bool PlaybackEngine::prebuffer() {
    const size_t target = device_buffer_bytes_.load();
    const auto timeout = std::chrono::milliseconds(settings_->playback.prebuffer_timeout_ms);
    const bool reached = buffer_->wait_for_bytes(target, timeout, stop_flag_);
    if (stop_flag_) {
        return false;
    }
    if (reached) {
        LOG_CPP_INFO(logger_, "[Playback] Pre-buffered %zu bytes (target %zu).", buffer_->size_bytes(), target);
    } else {
        LOG_CPP_WARNING(logger_, "[Playback] Pre-buffer timeout, starting with %zu of %zu bytes.",
                        buffer_->size_bytes(), target);
    }
    return true;
}

void PlaybackEngine::fast_forward() {
    if (!clock_->is_synced()) {
        return;
    }
    const int64_t threshold = settings_->playback.fast_forward_threshold_us;
    uint64_t skipped = 0;
    while (!stop_flag_) {
        auto timestamp = buffer_->peek_timestamp();
        if (!timestamp || clock_->delay_until(*timestamp) >= -threshold) {
            break;
        }
        buffer_->read();
        ++skipped;
    }
    if (skipped > 0) {
        chunks_skipped_ += skipped;
        LOG_CPP_INFO(logger_, "[Playback] Fast-forwarded past %llu stale chunks.",
                     static_cast<unsigned long long>(skipped));
    }
}

void PlaybackEngine::run() {
    LOG_CPP_DEBUG(logger_, "[Playback] Thread started.");
    if (!prebuffer()) {
        return;
    }
    if (!output_->start()) {
        LOG_CPP_ERROR(logger_, "[Playback] Failed to start output device; playback idle.");
        return;
    }
    fast_forward();

    const int64_t device_latency_us = output_->latency_us();
    LOG_CPP_INFO(logger_, "[Playback] Output latency estimate %lld us.", static_cast<long long>(device_latency_us));

    const auto& tuning = settings_->playback;
    const auto empty_poll = std::chrono::milliseconds(std::max(1L, tuning.empty_poll_ms));
    const int late_log_interval = std::max(1, tuning.late_drop_log_interval);

    while (!stop_flag_) {
        auto chunk = buffer_->read();
        if (!chunk) {
            if (!sleep_interruptible(empty_poll)) {
                break;
            }
            continue;
        }

        if (clock_->is_synced()) {
            const int64_t delay_us = clock_->delay_until(chunk->timestamp_us - device_latency_us);
            if (delay_us > tuning.ahead_threshold_us) {
                const int64_t sleep_us = std::min(delay_us, tuning.max_ahead_sleep_us);
                if (sleep_us > tuning.sleep_margin_us &&
                    !sleep_interruptible(std::chrono::microseconds(sleep_us - tuning.sleep_margin_us))) {
                    break;
                }
            } else if (delay_us < -tuning.late_drop_threshold_us) {
                const uint64_t dropped = ++chunks_dropped_late_;
                if (dropped == 1 || dropped % static_cast<uint64_t>(late_log_interval) == 0) {
                    LOG_CPP_WARNING(logger_, "[Playback] Skipping late chunk: %lld ms behind (%llu dropped).",
                                    static_cast<long long>(-delay_us / 1000),
                                    static_cast<unsigned long long>(dropped));
                }
                continue;
            }
        }

        play_chunk(*chunk);

        const auto now = std::chrono::steady_clock::now();
        maybe_report_health(now);
        maybe_log_telemetry(now);
    }
    LOG_CPP_DEBUG(logger_, "[Playback] Thread finished.");
}

void PlaybackEngine::play_chunk(const AudioChunk& chunk) {
    const size_t frame_bytes = config_ ? static_cast<size_t>(config_->bytes_per_frame()) : 0;
    size_t size = chunk.payload.size();
    if (frame_bytes > 0 && size % frame_bytes != 0) {
        LOG_CPP_WARNING(logger_, "[Playback] Chunk of %zu bytes not aligned to %zu-byte frames; trimming.",
                        size, frame_bytes);
        size -= size % frame_bytes;
    }
    if (size == 0) {
        return;
    }

    const long written = output_->write(chunk.payload.data(), size);
    if (written == -EINTR && stop_flag_) {
        return;
    }
    if (written < 0) {
        ++write_errors_;
        LOG_CPP_ERROR(logger_, "[Playback] Output write error: %ld", written);
        return;
    }
    ++chunks_played_;
}

void PlaybackEngine::maybe_report_health(std::chrono::steady_clock::time_point now) {
    if (!state_store_) {
        return;
    }
    const auto interval = std::chrono::milliseconds(settings_->playback.health_update_interval_ms);
    if (now - last_health_report_ < interval) {
        return;
    }
    last_health_report_ = now;
    const int health = buffer_->health_percent();
    state_store_->update([health](PlayerState& state) { state.buffer_health_percent = health; });
}

void PlaybackEngine::maybe_log_telemetry(std::chrono::steady_clock::time_point now) {
    if (!settings_->telemetry.enabled) {
        return;
    }
    const auto interval = std::chrono::milliseconds(settings_->telemetry.log_interval_ms);
    if (last_telemetry_log_.time_since_epoch().count() != 0 && now - last_telemetry_log_ < interval) {
        return;
    }
    last_telemetry_log_ = now;
    LOG_CPP_INFO(logger_, "[Telemetry][Playback] buffered=%zu bytes (%d%%) offset=%lld us played=%llu dropped_late=%llu skipped=%llu",
                 buffer_->size_bytes(), buffer_->usage_percent(),
                 static_cast<long long>(clock_->offset_us()),
                 static_cast<unsigned long long>(chunks_played_.load()),
                 static_cast<unsigned long long>(chunks_dropped_late_.load()),
                 static_cast<unsigned long long>(chunks_skipped_.load()));
}

} // namespace audio
} // namespace sendspin
