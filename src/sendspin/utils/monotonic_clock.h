#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace sendspin {
namespace audio {
namespace utils {

/// Source of local monotonic time in microseconds.
using TimeSource = std::function<int64_t()>;

inline int64_t steady_now_us() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

inline TimeSource default_time_source() {
    return &steady_now_us;
}

} // namespace utils
} // namespace audio
} // namespace sendspin
