#include "settings_loader.h"

#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sendspin {
namespace audio {
namespace config {

namespace {

class SectionReader {
public:
    SectionReader(const Json::Value& section, std::string name, const logging::LoggerPtr& logger)
        : section_(section), name_(std::move(name)), logger_(logger) {}

    void read(const char* key, std::string& out) const {
        const Json::Value* value = find(key);
        if (!value) {
            return;
        }
        if (!value->isString()) {
            report_type_error(key, "string");
            return;
        }
        out = value->asString();
    }

    void read(const char* key, bool& out) const {
        const Json::Value* value = find(key);
        if (!value) {
            return;
        }
        if (!value->isBool()) {
            report_type_error(key, "boolean");
            return;
        }
        out = value->asBool();
    }

    void read(const char* key, double& out) const {
        const Json::Value* value = find(key);
        if (!value) {
            return;
        }
        if (!value->isNumeric()) {
            report_type_error(key, "number");
            return;
        }
        out = value->asDouble();
    }

    template <typename Int>
    void read_int(const char* key, Int& out, int64_t min_value,
                  int64_t max_value = std::numeric_limits<int64_t>::max()) const {
        const Json::Value* value = find(key);
        if (!value) {
            return;
        }
        if (!value->isIntegral() || value->asInt64() < min_value || value->asInt64() > max_value) {
            report_type_error(key, "integer");
            return;
        }
        out = static_cast<Int>(value->asInt64());
    }

private:
    const Json::Value* find(const char* key) const {
        if (!section_.isObject()) {
            return nullptr;
        }
        return section_.find(key, key + std::char_traits<char>::length(key));
    }

    void report_type_error(const char* key, const char* expected) const {
        LOG_CPP_WARNING(logger_, "[Settings] Ignoring %s.%s: expected %s.", name_.c_str(), key, expected);
    }

    const Json::Value& section_;
    std::string name_;
    const logging::LoggerPtr& logger_;
};

} // namespace

std::optional<logging::LogLevel> parse_log_level(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug") return logging::LogLevel::DEBUG;
    if (lowered == "info") return logging::LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return logging::LogLevel::WARNING;
    if (lowered == "error") return logging::LogLevel::ERR;
    return std::nullopt;
}

void configure_logger(const LoggingSettings& settings, logging::Logger& logger) {
    if (auto level = parse_log_level(settings.level)) {
        logger.set_level(*level);
    }
    logger.set_mirror_to_stderr(settings.mirror_to_stderr);
}

void apply_settings_json(const Json::Value& root, SendspinSettings& settings,
                         const logging::LoggerPtr& logger) {
    if (!root.isObject()) {
        LOG_CPP_WARNING(logger, "[Settings] Settings document is not an object; keeping defaults.");
        return;
    }

    const SectionReader service(root["service"], "service", logger);
    service.read("device_name", settings.service.device_name);
    service.read_int("port", settings.service.port, 1, 65535);
    service.read("path", settings.service.path);
    service.read("state_dir", settings.service.state_dir);
    service.read("hostname", settings.service.hostname);
    service.read("advertise_mdns", settings.service.advertise_mdns);
    service.read_int("connection_timeout_ms", settings.service.connection_timeout_ms, 0);

    const SectionReader clock(root["clock_sync"], "clock_sync", logger);
    clock.read_int("max_samples", settings.clock_sync.max_samples, 1);
    clock.read_int("min_samples_for_sync", settings.clock_sync.min_samples_for_sync, 1);
    clock.read_int("burst_count", settings.clock_sync.burst_count, 0);
    clock.read_int("burst_interval_ms", settings.clock_sync.burst_interval_ms, 0);
    clock.read_int("resync_interval_ms", settings.clock_sync.resync_interval_ms, 1);

    const SectionReader buffer(root["buffer"], "buffer", logger);
    buffer.read_int("capacity_bytes", settings.buffer.capacity_bytes, 1);

    const SectionReader playback(root["playback"], "playback", logger);
    playback.read_int("device_buffer_factor", settings.playback.device_buffer_factor, 1);
    playback.read_int("prebuffer_timeout_ms", settings.playback.prebuffer_timeout_ms, 0);
    playback.read_int("fast_forward_threshold_us", settings.playback.fast_forward_threshold_us, 0);
    playback.read_int("ahead_threshold_us", settings.playback.ahead_threshold_us, 0);
    playback.read_int("max_ahead_sleep_us", settings.playback.max_ahead_sleep_us, 0);
    playback.read_int("sleep_margin_us", settings.playback.sleep_margin_us, 0);
    playback.read_int("late_drop_threshold_us", settings.playback.late_drop_threshold_us, 0);
    playback.read_int("empty_poll_ms", settings.playback.empty_poll_ms, 1);
    playback.read_int("health_update_interval_ms", settings.playback.health_update_interval_ms, 0);
    playback.read_int("late_drop_log_interval", settings.playback.late_drop_log_interval, 1);

    const SectionReader system_audio(root["system_audio"], "system_audio", logger);
    system_audio.read("alsa_device", settings.system_audio.alsa_device);
    system_audio.read("alsa_target_latency_ms", settings.system_audio.alsa_target_latency_ms);
    system_audio.read_int("alsa_periods_per_buffer", settings.system_audio.alsa_periods_per_buffer, 1);

    const SectionReader session(root["session"], "session", logger);
    session.read_int("buffer_full_log_interval", settings.session.buffer_full_log_interval, 1);
    session.read_int("health_refresh_interval_ms", settings.session.health_refresh_interval_ms, 0);

    const SectionReader telemetry(root["telemetry"], "telemetry", logger);
    telemetry.read("enabled", settings.telemetry.enabled);
    telemetry.read_int("log_interval_ms", settings.telemetry.log_interval_ms, 1);

    const SectionReader log_section(root["logging"], "logging", logger);
    std::string level = settings.logging.level;
    log_section.read("level", level);
    if (parse_log_level(level)) {
        settings.logging.level = level;
    } else {
        LOG_CPP_WARNING(logger, "[Settings] Unknown log level '%s'; keeping '%s'.",
                        level.c_str(), settings.logging.level.c_str());
    }
    log_section.read("mirror_to_stderr", settings.logging.mirror_to_stderr);

    if (settings.clock_sync.min_samples_for_sync > settings.clock_sync.max_samples) {
        LOG_CPP_WARNING(logger, "[Settings] clock_sync.min_samples_for_sync (%zu) exceeds max_samples (%zu); clamping.",
                        settings.clock_sync.min_samples_for_sync, settings.clock_sync.max_samples);
        settings.clock_sync.min_samples_for_sync = settings.clock_sync.max_samples;
    }
}

SendspinSettingsPtr parse_settings_json(const std::string& text, const logging::LoggerPtr& logger) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw std::runtime_error("Invalid settings JSON: " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Settings JSON must be an object");
    }

    auto settings = std::make_shared<SendspinSettings>();
    apply_settings_json(root, *settings, logger);
    return settings;
}

SendspinSettingsPtr load_settings_from_file(const std::string& path, const logging::LoggerPtr& logger) {
    std::ifstream file(path);
    if (!file.good()) {
        throw std::runtime_error("Unable to open settings file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    auto settings = parse_settings_json(contents.str(), logger);
    LOG_CPP_INFO(logger, "[Settings] Loaded settings from %s.", path.c_str());
    return settings;
}

} // namespace config
} // namespace audio
} // namespace sendspin
