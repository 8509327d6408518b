#include <gtest/gtest.h>
#include "configuration/settings_loader.h"
#include "../mocks/temp_state_dir.h"

#include <json/json.h>

#include <fstream>
#include <stdexcept>

using namespace sendspin::audio;
using sendspin::audio::testing::TempStateDir;

TEST(SettingsLoaderTest, DefaultsMatchProtocolConstants) {
    SendspinSettings settings;
    EXPECT_EQ(settings.service.port, 8927);
    EXPECT_EQ(settings.service.path, "/sendspin");
    EXPECT_TRUE(settings.service.advertise_mdns);
    EXPECT_EQ(settings.buffer.capacity_bytes, 4u * 1024u * 1024u);
    EXPECT_EQ(settings.clock_sync.max_samples, 10u);
    EXPECT_EQ(settings.clock_sync.min_samples_for_sync, 3u);
    EXPECT_EQ(settings.playback.device_buffer_factor, 6);
}

TEST(SettingsLoaderTest, OverlaysPresentKeysOnly) {
    auto settings = config::parse_settings_json(R"({
        "service": {"device_name": "Study", "port": 9000, "advertise_mdns": false},
        "clock_sync": {"burst_count": 8},
        "buffer": {"capacity_bytes": 65536},
        "system_audio": {"alsa_device": "hw:1,0", "alsa_target_latency_ms": 40},
        "logging": {"level": "DEBUG"}
    })", nullptr);

    EXPECT_EQ(settings->service.device_name, "Study");
    EXPECT_EQ(settings->service.port, 9000);
    EXPECT_FALSE(settings->service.advertise_mdns);
    EXPECT_EQ(settings->service.path, "/sendspin");
    EXPECT_EQ(settings->clock_sync.burst_count, 8);
    EXPECT_EQ(settings->clock_sync.resync_interval_ms, 30000);
    EXPECT_EQ(settings->buffer.capacity_bytes, 65536u);
    EXPECT_EQ(settings->system_audio.alsa_device, "hw:1,0");
    EXPECT_DOUBLE_EQ(settings->system_audio.alsa_target_latency_ms, 40.0);
    EXPECT_EQ(settings->logging.level, "DEBUG");
}

TEST(SettingsLoaderTest, WronglyTypedValuesKeepDefaults) {
    auto logger = std::make_shared<logging::Logger>(logging::LogLevel::DEBUG);
    auto settings = config::parse_settings_json(R"({
        "service": {"port": "8000", "advertise_mdns": 1},
        "buffer": {"capacity_bytes": 0},
        "playback": {"device_buffer_factor": -2},
        "logging": {"level": "chatty"}
    })", logger);

    EXPECT_EQ(settings->service.port, 8927);
    EXPECT_TRUE(settings->service.advertise_mdns);
    EXPECT_EQ(settings->buffer.capacity_bytes, kDefaultBufferCapacityBytes);
    EXPECT_EQ(settings->playback.device_buffer_factor, 6);
    EXPECT_EQ(settings->logging.level, "info");
    EXPECT_GE(logger->pending(), 5u);
}

TEST(SettingsLoaderTest, PortOutOfRangeIsRejected) {
    auto settings = config::parse_settings_json(R"({"service": {"port": 70000}})", nullptr);
    EXPECT_EQ(settings->service.port, 8927);
}

TEST(SettingsLoaderTest, MinSamplesClampedToHistorySize) {
    auto settings = config::parse_settings_json(
        R"({"clock_sync": {"max_samples": 4, "min_samples_for_sync": 9}})", nullptr);
    EXPECT_EQ(settings->clock_sync.max_samples, 4u);
    EXPECT_EQ(settings->clock_sync.min_samples_for_sync, 4u);
}

TEST(SettingsLoaderTest, ApplyOverExistingSettings) {
    SendspinSettings settings;
    settings.service.device_name = "Existing";
    Json::Value root(Json::objectValue);
    root["telemetry"]["enabled"] = false;
    config::apply_settings_json(root, settings, nullptr);

    EXPECT_EQ(settings.service.device_name, "Existing");
    EXPECT_FALSE(settings.telemetry.enabled);
}

TEST(SettingsLoaderTest, InvalidDocumentsThrow) {
    EXPECT_THROW(config::parse_settings_json("{ nope", nullptr), std::runtime_error);
    EXPECT_THROW(config::parse_settings_json("[1, 2]", nullptr), std::runtime_error);
    EXPECT_THROW(config::load_settings_from_file("/nonexistent/sendspin.json", nullptr), std::runtime_error);
}

TEST(SettingsLoaderTest, LoadsFromFile) {
    TempStateDir dir;
    const std::string path = dir.path() + "/settings.json";
    {
        std::ofstream out(path);
        out << R"({"service": {"device_name": "Garage"}})";
    }
    auto settings = config::load_settings_from_file(path, nullptr);
    EXPECT_EQ(settings->service.device_name, "Garage");
}

TEST(SettingsLoaderTest, ParsesLogLevels) {
    EXPECT_EQ(config::parse_log_level("debug"), logging::LogLevel::DEBUG);
    EXPECT_EQ(config::parse_log_level("Warn"), logging::LogLevel::WARNING);
    EXPECT_EQ(config::parse_log_level("ERROR"), logging::LogLevel::ERR);
    EXPECT_FALSE(config::parse_log_level("verbose").has_value());
}

TEST(SettingsLoaderTest, ConfiguresLoggerFromLoggingSection) {
    auto settings = config::parse_settings_json(
        R"({"logging": {"level": "warning", "mirror_to_stderr": true}})", nullptr);
    logging::Logger logger(logging::LogLevel::DEBUG);

    config::configure_logger(settings->logging, logger);

    EXPECT_EQ(logger.level(), logging::LogLevel::WARNING);
    EXPECT_TRUE(logger.mirrors_to_stderr());
    EXPECT_FALSE(logger.is_enabled(logging::LogLevel::INFO));

    settings->logging.mirror_to_stderr = false;
    settings->logging.level = "bogus";
    config::configure_logger(settings->logging, logger);
    EXPECT_FALSE(logger.mirrors_to_stderr());
    EXPECT_EQ(logger.level(), logging::LogLevel::WARNING);
}
