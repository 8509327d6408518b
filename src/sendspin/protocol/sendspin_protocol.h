/**
 * @file sendspin_protocol.h
 * @brief Encoding and decoding of Sendspin control messages and binary frames.
 * @details Control messages are JSON envelopes `{"type": ..., "payload": {...}}`.
 *          Decoders never throw: malformed input yields an empty optional and
 *          the caller drops the frame.
 */
#ifndef SENDSPIN_PROTOCOL_H
#define SENDSPIN_PROTOCOL_H

#include "protocol_types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sendspin {
namespace audio {
namespace protocol {

// --- Encoders -------------------------------------------------------------

std::string make_client_hello(const ClientHello& hello);
std::string make_client_time(int64_t client_transmitted_us);
std::string make_client_state(ReportedPlayerState state, int volume, bool muted);
std::string make_stream_request_format(const AudioFormat& format);

/** @brief Serializes `{type, payload}` without indentation. */
std::string write_envelope(const std::string& type, const Json::Value& payload);

// --- Decoders -------------------------------------------------------------

/**
 * @brief Parses a text frame into its type and payload.
 * @return nullopt when the text is not a JSON object or has no string `type`.
 */
std::optional<Envelope> parse_envelope(const std::string& text);

std::optional<ServerHello> parse_server_hello(const Json::Value& payload);
std::optional<ServerTime> parse_server_time(const Json::Value& payload);

/**
 * @brief Decodes the `player` object of a stream/start payload.
 * @details An invalid base64 `codec_header` is dropped; the config still decodes.
 */
std::optional<StreamConfig> parse_stream_start(const Json::Value& payload);
std::optional<PlayerCommand> parse_server_command(const Json::Value& payload);

/**
 * @brief Extracts `roles` from stream/clear or stream/end.
 * @return nullopt when the payload has no `roles` array.
 */
std::optional<std::vector<std::string>> parse_stream_roles(const Json::Value& payload);

bool roles_include_player(const std::vector<std::string>& roles);

/**
 * @brief Decodes a binary frame carrying audio (type tag 4).
 * @details Layout: tag (1 byte), big-endian int64 timestamp in microseconds,
 *          then raw PCM. Shorter buffers and other tags decode to nullopt.
 */
std::optional<AudioChunk> parse_binary_frame(const uint8_t* data, size_t size);

/** @brief Builds a binary audio frame. Used by tests and tooling. */
std::vector<uint8_t> make_binary_audio_frame(int64_t timestamp_us, const std::vector<uint8_t>& pcm);

std::optional<std::vector<uint8_t>> decode_base64(const std::string& text);

bool is_supported_format(const StreamConfig& config, const std::vector<AudioFormat>& supported);

} // namespace protocol
} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_PROTOCOL_H
