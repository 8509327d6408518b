/**
 * @file audio_chunk_buffer.h
 * @brief Bounded FIFO of timestamped PCM chunks between the network receive
 *        path and the playback thread.
 */
#ifndef SENDSPIN_AUDIO_CHUNK_BUFFER_H
#define SENDSPIN_AUDIO_CHUNK_BUFFER_H

#include "../sendspin_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace sendspin {
namespace audio {

/**
 * @class AudioChunkBuffer
 * @brief Byte-capacity-limited chunk queue.
 * @details Chunks leave in the order they were written; the embedded
 *          timestamps are never used to reorder. A write that would push the
 *          byte total over capacity is rejected with no side effect, so the
 *          newest data is the one lost on overflow.
 */
class AudioChunkBuffer {
public:
    explicit AudioChunkBuffer(size_t capacity_bytes);

    AudioChunkBuffer(const AudioChunkBuffer&) = delete;
    AudioChunkBuffer& operator=(const AudioChunkBuffer&) = delete;

    /** @return false when the chunk does not fit; the buffer is unchanged. */
    bool write(AudioChunk chunk);

    /** @brief Removes and returns the oldest chunk. */
    std::optional<AudioChunk> read();

    /** @brief Copy of the oldest chunk without removing it. */
    std::optional<AudioChunk> peek() const;

    /** @brief Timestamp of the oldest chunk without copying its payload. */
    std::optional<int64_t> peek_timestamp() const;

    /** @brief Drops all chunks and zeroes the byte total. Counters are kept. */
    void clear();

    /**
     * @brief Blocks until at least `min_bytes` are buffered.
     * @return true if the threshold was reached, false on timeout or when
     *         `stop_flag` became true.
     */
    bool wait_for_bytes(size_t min_bytes, std::chrono::milliseconds timeout,
                        const std::atomic<bool>& stop_flag);

    /** @brief Wakes any `wait_for_bytes` caller so it can re-check its stop flag. */
    void notify_waiters();

    size_t size_bytes() const;
    size_t capacity() const { return capacity_bytes_; }
    size_t available_bytes() const;
    size_t chunk_count() const;
    bool empty() const;

    /** @brief Buffered bytes as a percentage of capacity, 0-100. */
    int usage_percent() const;
    int health_percent() const { return usage_percent(); }

    uint64_t chunks_written() const { return chunks_written_.load(); }
    uint64_t chunks_read() const { return chunks_read_.load(); }
    uint64_t chunks_rejected() const { return chunks_rejected_.load(); }
    void reset_stats();

private:
    const size_t capacity_bytes_;

    mutable std::mutex mutex_;
    std::condition_variable data_cv_;
    std::deque<AudioChunk> chunks_;
    size_t total_bytes_ = 0;

    std::atomic<uint64_t> chunks_written_{0};
    std::atomic<uint64_t> chunks_read_{0};
    std::atomic<uint64_t> chunks_rejected_{0};
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_AUDIO_CHUNK_BUFFER_H
