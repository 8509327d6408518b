#pragma once

#include "../sendspin_types.h"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sendspin {
namespace audio {
namespace protocol {

namespace message_type {
inline constexpr const char* kClientHello = "client/hello";
inline constexpr const char* kServerHello = "server/hello";
inline constexpr const char* kClientTime = "client/time";
inline constexpr const char* kServerTime = "server/time";
inline constexpr const char* kClientState = "client/state";
inline constexpr const char* kServerState = "server/state";
inline constexpr const char* kServerCommand = "server/command";
inline constexpr const char* kStreamStart = "stream/start";
inline constexpr const char* kStreamClear = "stream/clear";
inline constexpr const char* kStreamEnd = "stream/end";
inline constexpr const char* kStreamRequestFormat = "stream/request-format";
} // namespace message_type

namespace binary_type {
inline constexpr uint8_t kAudio = 4;
inline constexpr uint8_t kArtworkFirst = 8;
inline constexpr uint8_t kArtworkLast = 11;
inline constexpr uint8_t kVisualizer = 16;
} // namespace binary_type

inline constexpr size_t kBinaryHeaderSize = 9;
inline constexpr int kProtocolVersion = 1;
inline constexpr const char* kPlayerRole = "player@v1";
inline constexpr const char* kPlayerRoleName = "player";

struct AudioFormat {
    std::string codec;
    int channels = 0;
    int sample_rate = 0;
    int bit_depth = 0;
};

/// PCM stereo 16-bit at 48000 and 44100 Hz, preferred format first.
std::vector<AudioFormat> default_supported_formats();

struct DeviceInfo {
    std::string product_name;
    std::string manufacturer;
    std::string software_version;
};

struct ClientHello {
    std::string client_id;
    std::string name;
    DeviceInfo device_info;
    std::vector<AudioFormat> supported_formats;
    size_t buffer_capacity = 0;
    std::vector<std::string> supported_commands{"volume", "mute"};
};

struct ServerHello {
    std::string server_id;
    std::string name;
    int version = 0;
    std::vector<std::string> active_roles;
    std::string connection_reason;
};

struct ServerTime {
    int64_t client_transmitted = 0;
    int64_t server_received = 0;
    int64_t server_transmitted = 0;
};

struct PlayerCommand {
    std::string command;
    std::optional<int> volume;
    std::optional<bool> mute;
};

enum class ReportedPlayerState {
    SYNCHRONIZED,
    ERROR
};

/// A decoded `{type, payload}` envelope. `payload` is null when absent.
struct Envelope {
    std::string type;
    Json::Value payload;
};

} // namespace protocol
} // namespace audio
} // namespace sendspin
