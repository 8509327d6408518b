#include "sendspin_protocol.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <memory>

namespace sendspin {
namespace audio {
namespace protocol {

namespace {

std::string write_compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value format_to_json(const AudioFormat& format) {
    Json::Value entry(Json::objectValue);
    entry["codec"] = format.codec;
    entry["channels"] = format.channels;
    entry["sample_rate"] = format.sample_rate;
    entry["bit_depth"] = format.bit_depth;
    return entry;
}

bool read_int64(const Json::Value& object, const char* key, int64_t& out) {
    const Json::Value& value = object[key];
    if (!value.isIntegral()) {
        return false;
    }
    out = value.asInt64();
    return true;
}

bool read_int(const Json::Value& object, const char* key, int& out) {
    const Json::Value& value = object[key];
    if (!value.isInt()) {
        return false;
    }
    out = value.asInt();
    return true;
}

bool read_string(const Json::Value& object, const char* key, std::string& out) {
    const Json::Value& value = object[key];
    if (!value.isString()) {
        return false;
    }
    out = value.asString();
    return true;
}

} // namespace

std::vector<AudioFormat> default_supported_formats() {
    return {
        {"pcm", 2, 48000, 16},
        {"pcm", 2, 44100, 16},
    };
}

std::string write_envelope(const std::string& type, const Json::Value& payload) {
    Json::Value root(Json::objectValue);
    root["type"] = type;
    root["payload"] = payload;
    return write_compact(root);
}

std::string make_client_hello(const ClientHello& hello) {
    Json::Value payload(Json::objectValue);
    payload["client_id"] = hello.client_id;
    payload["name"] = hello.name;

    Json::Value device_info(Json::objectValue);
    device_info["product_name"] = hello.device_info.product_name;
    device_info["manufacturer"] = hello.device_info.manufacturer;
    device_info["software_version"] = hello.device_info.software_version;
    payload["device_info"] = device_info;

    payload["version"] = kProtocolVersion;

    Json::Value roles(Json::arrayValue);
    roles.append(kPlayerRole);
    payload["supported_roles"] = roles;

    Json::Value player_support(Json::objectValue);
    Json::Value formats(Json::arrayValue);
    for (const auto& format : hello.supported_formats) {
        formats.append(format_to_json(format));
    }
    player_support["supported_formats"] = formats;
    player_support["buffer_capacity"] = static_cast<Json::UInt64>(hello.buffer_capacity);
    Json::Value commands(Json::arrayValue);
    for (const auto& command : hello.supported_commands) {
        commands.append(command);
    }
    player_support["supported_commands"] = commands;
    payload["player_support"] = player_support;

    return write_envelope(message_type::kClientHello, payload);
}

std::string make_client_time(int64_t client_transmitted_us) {
    Json::Value payload(Json::objectValue);
    payload["client_transmitted"] = static_cast<Json::Int64>(client_transmitted_us);
    return write_envelope(message_type::kClientTime, payload);
}

std::string make_client_state(ReportedPlayerState state, int volume, bool muted) {
    Json::Value player(Json::objectValue);
    player["state"] = (state == ReportedPlayerState::ERROR) ? "error" : "synchronized";
    player["volume"] = std::clamp(volume, 0, 100);
    player["muted"] = muted;

    Json::Value payload(Json::objectValue);
    payload["player"] = player;
    return write_envelope(message_type::kClientState, payload);
}

std::string make_stream_request_format(const AudioFormat& format) {
    Json::Value player(Json::objectValue);
    player["codec"] = format.codec;
    player["sample_rate"] = format.sample_rate;
    player["channels"] = format.channels;
    player["bit_depth"] = format.bit_depth;

    Json::Value payload(Json::objectValue);
    payload["player"] = player;
    return write_envelope(message_type::kStreamRequestFormat, payload);
}

std::optional<Envelope> parse_envelope(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return std::nullopt;
    }
    if (!root.isObject() || !root["type"].isString()) {
        return std::nullopt;
    }

    Envelope envelope;
    envelope.type = root["type"].asString();
    envelope.payload = root["payload"];
    return envelope;
}

std::optional<ServerHello> parse_server_hello(const Json::Value& payload) {
    if (!payload.isObject()) {
        return std::nullopt;
    }
    ServerHello hello;
    if (!read_string(payload, "server_id", hello.server_id) ||
        !read_string(payload, "name", hello.name)) {
        return std::nullopt;
    }
    read_int(payload, "version", hello.version);
    read_string(payload, "connection_reason", hello.connection_reason);
    const Json::Value& roles = payload["active_roles"];
    if (roles.isArray()) {
        for (const auto& role : roles) {
            if (role.isString()) {
                hello.active_roles.push_back(role.asString());
            }
        }
    }
    return hello;
}

std::optional<ServerTime> parse_server_time(const Json::Value& payload) {
    if (!payload.isObject()) {
        return std::nullopt;
    }
    ServerTime time;
    if (!read_int64(payload, "client_transmitted", time.client_transmitted) ||
        !read_int64(payload, "server_received", time.server_received) ||
        !read_int64(payload, "server_transmitted", time.server_transmitted)) {
        return std::nullopt;
    }
    return time;
}

std::optional<StreamConfig> parse_stream_start(const Json::Value& payload) {
    if (!payload.isObject() || !payload["player"].isObject()) {
        return std::nullopt;
    }
    const Json::Value& player = payload["player"];

    StreamConfig config;
    if (!read_string(player, "codec", config.codec) ||
        !read_int(player, "sample_rate", config.sample_rate) ||
        !read_int(player, "channels", config.channels) ||
        !read_int(player, "bit_depth", config.bit_depth)) {
        return std::nullopt;
    }

    const Json::Value& header = player["codec_header"];
    if (header.isString()) {
        if (auto decoded = decode_base64(header.asString())) {
            config.codec_header = std::move(*decoded);
        }
    }
    return config;
}

std::optional<PlayerCommand> parse_server_command(const Json::Value& payload) {
    if (!payload.isObject() || !payload["player"].isObject()) {
        return std::nullopt;
    }
    const Json::Value& player = payload["player"];

    PlayerCommand command;
    if (!read_string(player, "command", command.command)) {
        return std::nullopt;
    }
    int volume = 0;
    if (read_int(player, "volume", volume)) {
        command.volume = volume;
    }
    if (player["mute"].isBool()) {
        command.mute = player["mute"].asBool();
    }
    return command;
}

std::optional<std::vector<std::string>> parse_stream_roles(const Json::Value& payload) {
    if (!payload.isObject() || !payload["roles"].isArray()) {
        return std::nullopt;
    }
    std::vector<std::string> roles;
    for (const auto& role : payload["roles"]) {
        if (role.isString()) {
            roles.push_back(role.asString());
        }
    }
    return roles;
}

bool roles_include_player(const std::vector<std::string>& roles) {
    return std::find(roles.begin(), roles.end(), kPlayerRoleName) != roles.end();
}

std::optional<AudioChunk> parse_binary_frame(const uint8_t* data, size_t size) {
    if (!data || size < kBinaryHeaderSize) {
        return std::nullopt;
    }
    if (data[0] != binary_type::kAudio) {
        return std::nullopt;
    }

    uint64_t raw = 0;
    for (size_t i = 1; i < kBinaryHeaderSize; ++i) {
        raw = (raw << 8) | data[i];
    }

    AudioChunk chunk;
    chunk.timestamp_us = static_cast<int64_t>(raw);
    chunk.payload.assign(data + kBinaryHeaderSize, data + size);
    return chunk;
}

std::vector<uint8_t> make_binary_audio_frame(int64_t timestamp_us, const std::vector<uint8_t>& pcm) {
    std::vector<uint8_t> frame(kBinaryHeaderSize + pcm.size());
    frame[0] = binary_type::kAudio;
    const uint64_t raw = static_cast<uint64_t>(timestamp_us);
    for (size_t i = 0; i < 8; ++i) {
        frame[1 + i] = static_cast<uint8_t>(raw >> (56 - 8 * i));
    }
    std::copy(pcm.begin(), pcm.end(), frame.begin() + kBinaryHeaderSize);
    return frame;
}

std::optional<std::vector<uint8_t>> decode_base64(const std::string& text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }
    if (compact.empty()) {
        return std::vector<uint8_t>{};
    }
    if (compact.size() % 4 != 0 ||
        compact.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }

    std::vector<uint8_t> decoded(compact.size() / 4 * 3);
    const int length = EVP_DecodeBlock(decoded.data(),
                                       reinterpret_cast<const unsigned char*>(compact.data()),
                                       static_cast<int>(compact.size()));
    if (length < 0 || static_cast<size_t>(length) > decoded.size()) {
        return std::nullopt;
    }
    decoded.resize(static_cast<size_t>(length));

    // EVP_DecodeBlock emits a zero byte for each '=' pad character.
    size_t padding = 0;
    if (compact[compact.size() - 1] == '=') ++padding;
    if (compact[compact.size() - 2] == '=') ++padding;
    decoded.resize(decoded.size() - std::min(padding, decoded.size()));
    return decoded;
}

bool is_supported_format(const StreamConfig& config, const std::vector<AudioFormat>& supported) {
    return std::any_of(supported.begin(), supported.end(), [&](const AudioFormat& format) {
        return format.codec == config.codec && format.channels == config.channels &&
               format.sample_rate == config.sample_rate && format.bit_depth == config.bit_depth;
    });
}

} // namespace protocol
} // namespace audio
} // namespace sendspin
