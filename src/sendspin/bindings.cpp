/**
 * @file bindings.cpp
 * @brief Defines the Python module for the Sendspin player engine.
 * @details This file uses pybind11 to create the `sendspin_player_engine` Python module.
 *          The binding functions below are called in dependency order: the logger and
 *          the plain data types first, then the settings, then the service that uses them.
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "configuration/sendspin_settings.h"
#include "configuration/settings_loader.h"
#include "playback/alsa_audio_output.h"
#include "sendspin_types.h"
#include "service/sendspin_service.h"
#include "session/websocket_session_server.h"
#include "utils/cpp_logger.h"

#include <tuple>

namespace py = pybind11;
using namespace sendspin;

namespace {

void bind_logger(py::module_& m) {
    using audio::logging::LogLevel;
    using audio::logging::Logger;

    py::enum_<LogLevel>(m, "LogLevel_CPP")
        .value("DEBUG", LogLevel::DEBUG)
        .value("INFO", LogLevel::INFO)
        .value("WARNING", LogLevel::WARNING)
        .value("ERROR", LogLevel::ERR)
        .export_values();

    py::class_<Logger, std::shared_ptr<Logger>>(m, "Logger")
        .def(py::init<LogLevel, bool>(), py::arg("level") = LogLevel::INFO, py::arg("mirror_to_stderr") = false)
        .def("get_messages", [](Logger& self, int timeout_ms) {
            std::vector<audio::logging::LogEntry> cpp_entries;
            {
                py::gil_scoped_release release_gil;
                cpp_entries = self.retrieve_log_entries(timeout_ms);
            }
            std::vector<std::tuple<LogLevel, std::string, std::string, int>> entries_tuples;
            entries_tuples.reserve(cpp_entries.size());
            for (const auto& entry : cpp_entries) {
                entries_tuples.emplace_back(entry.level, entry.message, entry.filename, entry.line_number);
            }
            return entries_tuples;
        }, py::arg("timeout_ms") = 100,
           "Retrieves buffered log messages, blocking until messages are available or timeout occurs (in ms). "
           "Returns a list of (level, message, filename, line) tuples.")
        .def("shutdown", &Logger::shutdown,
             "Unblocks any waiting get_messages call and stops accepting messages.")
        .def("set_level", &Logger::set_level, py::arg("level"))
        .def_property_readonly("level", &Logger::level)
        .def("set_mirror_to_stderr", &Logger::set_mirror_to_stderr, py::arg("enabled"));
}

void bind_types(py::module_& m) {
    using namespace audio;

    py::enum_<ConnectionState>(m, "ConnectionState")
        .value("DISCONNECTED", ConnectionState::DISCONNECTED)
        .value("CONNECTING", ConnectionState::CONNECTING)
        .value("HANDSHAKING", ConnectionState::HANDSHAKING)
        .value("SYNCING_CLOCK", ConnectionState::SYNCING_CLOCK)
        .value("CONNECTED", ConnectionState::CONNECTED)
        .value("STREAMING", ConnectionState::STREAMING)
        .value("ERROR", ConnectionState::ERROR);

    py::class_<StreamConfig>(m, "StreamConfig")
        .def(py::init<>())
        .def_readwrite("codec", &StreamConfig::codec)
        .def_readwrite("sample_rate", &StreamConfig::sample_rate)
        .def_readwrite("channels", &StreamConfig::channels)
        .def_readwrite("bit_depth", &StreamConfig::bit_depth)
        .def_property_readonly("codec_header", [](const StreamConfig& self) {
            return py::bytes(reinterpret_cast<const char*>(self.codec_header.data()), self.codec_header.size());
        });

    py::class_<PlayerState>(m, "PlayerState")
        .def_readonly("connection_state", &PlayerState::connection_state)
        .def_readonly("volume", &PlayerState::volume)
        .def_readonly("muted", &PlayerState::muted)
        .def_readonly("buffer_health_percent", &PlayerState::buffer_health_percent)
        .def_readonly("stream_active", &PlayerState::stream_active)
        .def_readonly("error_message", &PlayerState::error_message)
        .def_readonly("server_id", &PlayerState::server_id)
        .def_readonly("server_name", &PlayerState::server_name)
        .def_readonly("clock_offset_us", &PlayerState::clock_offset_us)
        .def_readonly("clock_synced", &PlayerState::clock_synced)
        .def_readonly("codec", &PlayerState::codec)
        .def_readonly("sample_rate", &PlayerState::sample_rate)
        .def_readonly("channels", &PlayerState::channels);

    py::class_<PlaybackEngine::Stats>(m, "PlaybackStats")
        .def_readonly("chunks_played", &PlaybackEngine::Stats::chunks_played)
        .def_readonly("chunks_dropped_late", &PlaybackEngine::Stats::chunks_dropped_late)
        .def_readonly("chunks_skipped_fast_forward", &PlaybackEngine::Stats::chunks_skipped_fast_forward)
        .def_readonly("write_errors", &PlaybackEngine::Stats::write_errors);
}

void bind_settings(py::module_& m) {
    using namespace audio;

    py::class_<ServiceSettings>(m, "ServiceSettings")
        .def(py::init<>())
        .def_readwrite("device_name", &ServiceSettings::device_name)
        .def_readwrite("port", &ServiceSettings::port)
        .def_readwrite("path", &ServiceSettings::path)
        .def_readwrite("state_dir", &ServiceSettings::state_dir)
        .def_readwrite("hostname", &ServiceSettings::hostname)
        .def_readwrite("advertise_mdns", &ServiceSettings::advertise_mdns)
        .def_readwrite("connection_timeout_ms", &ServiceSettings::connection_timeout_ms);

    py::class_<ClockSyncTuning>(m, "ClockSyncTuning")
        .def(py::init<>())
        .def_readwrite("max_samples", &ClockSyncTuning::max_samples)
        .def_readwrite("min_samples_for_sync", &ClockSyncTuning::min_samples_for_sync)
        .def_readwrite("burst_count", &ClockSyncTuning::burst_count)
        .def_readwrite("burst_interval_ms", &ClockSyncTuning::burst_interval_ms)
        .def_readwrite("resync_interval_ms", &ClockSyncTuning::resync_interval_ms);

    py::class_<BufferTuning>(m, "BufferTuning")
        .def(py::init<>())
        .def_readwrite("capacity_bytes", &BufferTuning::capacity_bytes);

    py::class_<PlaybackTuning>(m, "PlaybackTuning")
        .def(py::init<>())
        .def_readwrite("device_buffer_factor", &PlaybackTuning::device_buffer_factor)
        .def_readwrite("prebuffer_timeout_ms", &PlaybackTuning::prebuffer_timeout_ms)
        .def_readwrite("fast_forward_threshold_us", &PlaybackTuning::fast_forward_threshold_us)
        .def_readwrite("ahead_threshold_us", &PlaybackTuning::ahead_threshold_us)
        .def_readwrite("max_ahead_sleep_us", &PlaybackTuning::max_ahead_sleep_us)
        .def_readwrite("sleep_margin_us", &PlaybackTuning::sleep_margin_us)
        .def_readwrite("late_drop_threshold_us", &PlaybackTuning::late_drop_threshold_us)
        .def_readwrite("empty_poll_ms", &PlaybackTuning::empty_poll_ms)
        .def_readwrite("health_update_interval_ms", &PlaybackTuning::health_update_interval_ms)
        .def_readwrite("late_drop_log_interval", &PlaybackTuning::late_drop_log_interval);

    py::class_<SystemAudioTuning>(m, "SystemAudioTuning")
        .def(py::init<>())
        .def_readwrite("alsa_device", &SystemAudioTuning::alsa_device)
        .def_readwrite("alsa_target_latency_ms", &SystemAudioTuning::alsa_target_latency_ms)
        .def_readwrite("alsa_periods_per_buffer", &SystemAudioTuning::alsa_periods_per_buffer);

    py::class_<SessionTuning>(m, "SessionTuning")
        .def(py::init<>())
        .def_readwrite("buffer_full_log_interval", &SessionTuning::buffer_full_log_interval)
        .def_readwrite("health_refresh_interval_ms", &SessionTuning::health_refresh_interval_ms);

    py::class_<TelemetrySettings>(m, "TelemetrySettings")
        .def(py::init<>())
        .def_readwrite("enabled", &TelemetrySettings::enabled)
        .def_readwrite("log_interval_ms", &TelemetrySettings::log_interval_ms);

    py::class_<LoggingSettings>(m, "LoggingSettings")
        .def(py::init<>())
        .def_readwrite("level", &LoggingSettings::level)
        .def_readwrite("mirror_to_stderr", &LoggingSettings::mirror_to_stderr);

    py::class_<SendspinSettings, std::shared_ptr<SendspinSettings>>(m, "SendspinSettings")
        .def(py::init<>())
        .def_readwrite("service", &SendspinSettings::service)
        .def_readwrite("clock_sync", &SendspinSettings::clock_sync)
        .def_readwrite("buffer", &SendspinSettings::buffer)
        .def_readwrite("playback", &SendspinSettings::playback)
        .def_readwrite("system_audio", &SendspinSettings::system_audio)
        .def_readwrite("session", &SendspinSettings::session)
        .def_readwrite("telemetry", &SendspinSettings::telemetry)
        .def_readwrite("logging", &SendspinSettings::logging);

    m.def("load_settings_from_file", &config::load_settings_from_file,
          py::arg("path"), py::arg("logger") = nullptr,
          "Loads settings from a JSON file. Raises RuntimeError if the file cannot be read or parsed.");
    m.def("parse_settings_json", &config::parse_settings_json,
          py::arg("text"), py::arg("logger") = nullptr,
          "Parses settings from a JSON string. Raises RuntimeError on invalid JSON.");
}

void bind_service(py::module_& m) {
    using namespace audio;

    py::class_<SendspinService, std::shared_ptr<SendspinService>>(m, "SendspinService")
        .def(py::init([](SendspinSettingsPtr settings, logging::LoggerPtr logger) {
                 auto resolved = resolve_settings(settings);
                 if (logger) {
                     config::configure_logger(resolved->logging, *logger);
                 }
                 auto output = std::make_shared<AlsaAudioOutput>(resolved, logger);
                 auto listener = std::make_unique<WebSocketSessionServer>(logger);
                 // Destruction joins the dispatch thread, whose hooks need the GIL.
                 return std::shared_ptr<SendspinService>(
                     new SendspinService(resolved, logger, output, std::move(listener)),
                     [](SendspinService* service) {
                         if (PyGILState_Check()) {
                             py::gil_scoped_release release_gil;
                             delete service;
                         } else {
                             delete service;
                         }
                     });
             }),
             py::arg("settings") = nullptr, py::arg("logger") = nullptr)
        .def("set_hooks", [](SendspinService& self,
                             std::function<void(const StreamConfig&)> on_stream_start,
                             std::function<void()> on_stream_end,
                             std::function<void(int)> on_volume_change,
                             std::function<void(bool)> on_mute_change,
                             std::function<void(ConnectionState)> on_state_change) {
                 HostHooks hooks;
                 hooks.on_stream_start = std::move(on_stream_start);
                 hooks.on_stream_end = std::move(on_stream_end);
                 hooks.on_volume_change = std::move(on_volume_change);
                 hooks.on_mute_change = std::move(on_mute_change);
                 hooks.on_state_change = std::move(on_state_change);
                 self.set_hooks(std::move(hooks));
             },
             py::arg("on_stream_start") = nullptr, py::arg("on_stream_end") = nullptr,
             py::arg("on_volume_change") = nullptr, py::arg("on_mute_change") = nullptr,
             py::arg("on_state_change") = nullptr,
             "Installs callbacks invoked on the service dispatch thread.")
        .def("start", &SendspinService::start, py::call_guard<py::gil_scoped_release>())
        .def("stop", &SendspinService::stop, py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("running", &SendspinService::is_running)
        .def("set_volume", &SendspinService::set_volume, py::arg("volume"),
             py::call_guard<py::gil_scoped_release>())
        .def("set_muted", &SendspinService::set_muted, py::arg("muted"),
             py::call_guard<py::gil_scoped_release>())
        .def("set_device_name", &SendspinService::set_device_name, py::arg("name"),
             py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("device_name", &SendspinService::device_name)
        .def_property_readonly("client_id", &SendspinService::client_id)
        .def("get_state", [](const SendspinService& self) { return PlayerState(*self.get_state()); })
        .def("get_playback_stats", &SendspinService::playback_stats);
}

} // namespace

PYBIND11_MODULE(sendspin_player_engine, m) {
    m.doc() = "Sendspin synchronized audio player engine";

    bind_logger(m);
    bind_types(m);
    bind_settings(m);
    bind_service(m);

    m.attr("DEFAULT_PORT") = audio::kDefaultServicePort;
    m.attr("DEFAULT_PATH") = audio::kDefaultServicePath;
    m.attr("SERVICE_TYPE") = audio::kSendspinServiceType;
}
