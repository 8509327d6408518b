#pragma once

#include "sendspin_settings.h"
#include "../utils/cpp_logger.h"

#include <optional>
#include <string>

namespace Json {
class Value;
}

namespace sendspin {
namespace audio {
namespace config {

/**
 * @brief Overlays the keys present in `root` onto `settings`.
 * @details Layout mirrors `SendspinSettings`: one object per tuning struct
 *          ("service", "clock_sync", "buffer", "playback", "system_audio",
 *          "session", "telemetry", "logging"). Unknown keys are ignored;
 *          wrongly-typed values are logged and keep their previous value.
 */
void apply_settings_json(const Json::Value& root, SendspinSettings& settings,
                         const logging::LoggerPtr& logger);

/**
 * @brief Parses a JSON document and applies it over default settings.
 * @throws std::runtime_error if the text is not a JSON object.
 */
SendspinSettingsPtr parse_settings_json(const std::string& text, const logging::LoggerPtr& logger);

/**
 * @brief Reads and parses a settings file.
 * @throws std::runtime_error if the file cannot be read or parsed.
 */
SendspinSettingsPtr load_settings_from_file(const std::string& path, const logging::LoggerPtr& logger);

/** @brief Maps "debug", "info", "warning" and "error" to a level. */
std::optional<logging::LogLevel> parse_log_level(const std::string& name);

/** @brief Applies the "logging" section (level and stderr mirroring) to a logger. */
void configure_logger(const LoggingSettings& settings, logging::Logger& logger);

} // namespace config
} // namespace audio
} // namespace sendspin
