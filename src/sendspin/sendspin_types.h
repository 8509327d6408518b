/**
 * @file sendspin_types.h
 * @brief Core data types shared across the Sendspin player engine.
 */
#ifndef SENDSPIN_TYPES_H
#define SENDSPIN_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sendspin {
namespace audio {

/**
 * @enum ConnectionState
 * @brief Lifecycle of the single active controller session.
 */
enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    HANDSHAKING,
    SYNCING_CLOCK,
    CONNECTED,
    STREAMING,
    ERROR
};

const char* connection_state_name(ConnectionState state);

/**
 * @struct StreamConfig
 * @brief Format announced by `stream/start`. Replaced wholesale per stream.
 */
struct StreamConfig {
    std::string codec;
    int sample_rate = 0;
    int channels = 0;
    int bit_depth = 0;
    std::vector<uint8_t> codec_header;

    int bytes_per_frame() const {
        if (channels <= 0 || bit_depth <= 0 || (bit_depth % 8) != 0) {
            return 0;
        }
        return channels * (bit_depth / 8);
    }

    bool operator==(const StreamConfig& other) const {
        return codec == other.codec && sample_rate == other.sample_rate &&
               channels == other.channels && bit_depth == other.bit_depth &&
               codec_header == other.codec_header;
    }
    bool operator!=(const StreamConfig& other) const { return !(*this == other); }
};

/**
 * @struct AudioChunk
 * @brief One decoded binary audio frame: producer-clock timestamp plus raw PCM.
 */
struct AudioChunk {
    int64_t timestamp_us = 0;
    std::vector<uint8_t> payload;
};

/**
 * @struct PlayerState
 * @brief Observable snapshot of the player. Published as immutable snapshots.
 */
struct PlayerState {
    ConnectionState connection_state = ConnectionState::DISCONNECTED;
    int volume = 100;
    bool muted = false;
    int buffer_health_percent = 0;
    bool stream_active = false;
    std::string error_message;

    std::string server_id;
    std::string server_name;
    int64_t clock_offset_us = 0;
    bool clock_synced = false;
    std::string codec;
    int sample_rate = 0;
    int channels = 0;
};

// Events emitted by a session towards the service dispatch thread.
struct StreamStartEvent {
    StreamConfig config;
};
struct StreamEndEvent {};
struct VolumeChangedEvent {
    int volume = 0;
};
struct MuteChangedEvent {
    bool muted = false;
};
struct StateChangedEvent {
    ConnectionState state = ConnectionState::DISCONNECTED;
};

using SessionEvent = std::variant<StreamStartEvent, StreamEndEvent, VolumeChangedEvent,
                                  MuteChangedEvent, StateChangedEvent>;

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_TYPES_H
