#include "sendspin_types.h"

namespace sendspin {
namespace audio {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::HANDSHAKING: return "HANDSHAKING";
        case ConnectionState::SYNCING_CLOCK: return "SYNCING_CLOCK";
        case ConnectionState::CONNECTED: return "CONNECTED";
        case ConnectionState::STREAMING: return "STREAMING";
        case ConnectionState::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace audio
} // namespace sendspin
