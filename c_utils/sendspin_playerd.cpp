// Standalone Sendspin player: advertises itself over mDNS, accepts one
// controller at a time and plays its stream on an ALSA device.
//
// Usage: sendspin_playerd [settings.json] [--name <device name>] [--port <port>]

#include "configuration/settings_loader.h"
#include "playback/alsa_audio_output.h"
#include "service/sendspin_service.h"
#include "session/websocket_session_server.h"
#include "utils/cpp_logger.h"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

using namespace sendspin::audio;

namespace {

std::atomic<bool> running{true};

void handle_signal(int) {
    running = false;
}

void print_usage(const char* program) {
    fprintf(stderr, "Usage: %s [settings.json] [--name <device name>] [--port <port>]\n", program);
}

// Entries already mirrored to stderr by the logger are only drained.
void drain_logs(logging::Logger& logger, int timeout_ms) {
    const bool print = !logger.mirrors_to_stderr();
    for (const auto& entry : logger.retrieve_log_entries(timeout_ms)) {
        if (!print) {
            continue;
        }
        fprintf(stderr, "[%s] %s:%d %s\n", logging::level_name(entry.level),
                entry.filename.c_str(), entry.line_number, entry.message.c_str());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string settings_path;
    std::string name_override;
    long port_override = 0;

    for (int argi = 1; argi < argc; argi++) {
        const std::string arg = argv[argi];
        if (arg == "--name" && argi + 1 < argc) {
            name_override = argv[++argi];
        } else if (arg == "--port" && argi + 1 < argc) {
            port_override = std::strtol(argv[++argi], nullptr, 10);
            if (port_override <= 0 || port_override > 65535) {
                fprintf(stderr, "Invalid port '%s'\n", argv[argi]);
                return 2;
            }
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (settings_path.empty() && arg.rfind("--", 0) != 0) {
            settings_path = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    auto logger = std::make_shared<logging::Logger>();

    SendspinSettingsPtr settings;
    try {
        settings = settings_path.empty() ? std::make_shared<SendspinSettings>()
                                         : config::load_settings_from_file(settings_path, logger);
    } catch (const std::exception& e) {
        drain_logs(*logger, 0);
        fprintf(stderr, "Failed to load settings: %s\n", e.what());
        return 1;
    }
    if (!name_override.empty()) {
        settings->service.device_name = name_override;
    }
    if (port_override > 0) {
        settings->service.port = static_cast<uint16_t>(port_override);
    }
    config::configure_logger(settings->logging, *logger);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);

    auto output = std::make_shared<AlsaAudioOutput>(settings, logger);
    SendspinService service(settings, logger, output, std::make_unique<WebSocketSessionServer>(logger));
    if (!service.start()) {
        drain_logs(*logger, 0);
        fprintf(stderr, "Failed to start the Sendspin service\n");
        return 1;
    }

    while (running) {
        drain_logs(*logger, 200);
    }

    service.stop();
    logger->shutdown();
    drain_logs(*logger, 0);
    return 0;
}
