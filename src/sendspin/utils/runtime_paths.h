#pragma once

#include <cstdlib>
#include <string>

namespace sendspin {
namespace audio {
namespace utils {

inline std::string strip_trailing_slashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

/// $XDG_STATE_HOME, else $HOME/.local/state, else the working directory.
inline std::string resolve_state_base_dir() {
    const char* xdg_state = std::getenv("XDG_STATE_HOME");
    if (xdg_state && xdg_state[0] != '\0') {
        return strip_trailing_slashes(xdg_state);
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return strip_trailing_slashes(home) + "/.local/state";
    }
    return ".";
}

inline std::string sendspin_state_dir() {
    return resolve_state_base_dir() + "/sendspin-player";
}

} // namespace utils
} // namespace audio
} // namespace sendspin
