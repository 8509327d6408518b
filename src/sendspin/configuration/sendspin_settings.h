#ifndef SENDSPIN_SETTINGS_H
#define SENDSPIN_SETTINGS_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace sendspin {
namespace audio {

inline constexpr uint16_t kDefaultServicePort = 8927;
inline constexpr const char* kDefaultServicePath = "/sendspin";
inline constexpr std::size_t kDefaultBufferCapacityBytes = 4 * 1024 * 1024;

struct ServiceSettings {
    std::string device_name = "Sendspin Player";
    uint16_t port = kDefaultServicePort;
    std::string path = kDefaultServicePath;
    std::string state_dir;          // empty: $XDG_STATE_HOME/sendspin-player
    std::string hostname;           // empty: gethostname()
    bool advertise_mdns = true;
    long connection_timeout_ms = 30000;    // WebSocket handshake timeout, 0 disables
};

struct ClockSyncTuning {
    std::size_t max_samples = 10;
    std::size_t min_samples_for_sync = 3;
    int burst_count = 5;
    long burst_interval_ms = 50;
    long resync_interval_ms = 30000;
};

struct BufferTuning {
    std::size_t capacity_bytes = kDefaultBufferCapacityBytes;
};

struct PlaybackTuning {
    int device_buffer_factor = 6;
    long prebuffer_timeout_ms = 5000;
    int64_t fast_forward_threshold_us = 500000;     // skip chunks later than this at stream start
    int64_t ahead_threshold_us = 100000;            // sleep before writing when this early
    int64_t max_ahead_sleep_us = 500000;
    int64_t sleep_margin_us = 10000;
    int64_t late_drop_threshold_us = 1000000;       // never write chunks later than this
    long empty_poll_ms = 5;
    long health_update_interval_ms = 250;
    int late_drop_log_interval = 50;
};

struct SystemAudioTuning {
    std::string alsa_device = "default";
    double alsa_target_latency_ms = 24.0;
    unsigned int alsa_periods_per_buffer = 3;
};

struct SessionTuning {
    int buffer_full_log_interval = 100;
    long health_refresh_interval_ms = 250;
};

struct TelemetrySettings {
    bool enabled = true;
    long log_interval_ms = 30000;
};

struct LoggingSettings {
    std::string level = "info";
    bool mirror_to_stderr = false;
};

class SendspinSettings {
public:
    ServiceSettings service;
    ClockSyncTuning clock_sync;
    BufferTuning buffer;
    PlaybackTuning playback;
    SystemAudioTuning system_audio;
    SessionTuning session;
    TelemetrySettings telemetry;
    LoggingSettings logging;
};

using SendspinSettingsPtr = std::shared_ptr<SendspinSettings>;

inline SendspinSettingsPtr resolve_settings(const SendspinSettingsPtr& settings) {
    return settings ? settings : std::make_shared<SendspinSettings>();
}

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_SETTINGS_H
