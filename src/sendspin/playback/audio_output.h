#ifndef SENDSPIN_AUDIO_OUTPUT_H
#define SENDSPIN_AUDIO_OUTPUT_H

#include "../sendspin_types.h"

#include <cstddef>
#include <cstdint>

namespace sendspin {
namespace audio {

/**
 * @class IAudioOutput
 * @brief PCM output device consumed by the playback engine.
 * @details `open`, `start`, `write`, `stop` and `release` are called from the
 *          engine's control and playback threads, never concurrently.
 *          `set_volume` and `interrupt` may be called from any thread.
 */
class IAudioOutput {
public:
    virtual ~IAudioOutput() = default;

    /** @brief Smallest usable device buffer for `format`, in bytes; 0 if unsupported. */
    virtual size_t min_buffer_size_bytes(const StreamConfig& format) = 0;

    virtual bool open(const StreamConfig& format, size_t buffer_bytes) = 0;
    virtual bool start() = 0;

    /** @return Bytes accepted, or a negative error code. */
    virtual long write(const uint8_t* data, size_t size) = 0;

    virtual void stop() = 0;
    virtual void release() = 0;

    /**
     * @brief Makes a `write` blocked on the device return promptly with -EINTR.
     * @details Writes stay interrupted until the next `open` or `start`.
     */
    virtual void interrupt() = 0;

    /** @brief Linear gain in [0, 1]. */
    virtual void set_volume(float volume) = 0;

    /** @brief Estimated output latency of the opened device in microseconds. */
    virtual int64_t latency_us() const = 0;
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_AUDIO_OUTPUT_H
