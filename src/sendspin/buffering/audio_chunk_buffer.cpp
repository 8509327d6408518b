#include "audio_chunk_buffer.h"

namespace sendspin {
namespace audio {

AudioChunkBuffer::AudioChunkBuffer(size_t capacity_bytes)
    : capacity_bytes_(capacity_bytes) {}

bool AudioChunkBuffer::write(AudioChunk chunk) {
    const size_t chunk_bytes = chunk.payload.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (chunk_bytes > capacity_bytes_ || total_bytes_ > capacity_bytes_ - chunk_bytes) {
            chunks_rejected_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        total_bytes_ += chunk_bytes;
        chunks_.push_back(std::move(chunk));
    }
    chunks_written_.fetch_add(1, std::memory_order_relaxed);
    data_cv_.notify_all();
    return true;
}

std::optional<AudioChunk> AudioChunkBuffer::read() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunks_.empty()) {
        return std::nullopt;
    }
    AudioChunk chunk = std::move(chunks_.front());
    chunks_.pop_front();
    total_bytes_ -= chunk.payload.size();
    chunks_read_.fetch_add(1, std::memory_order_relaxed);
    return chunk;
}

std::optional<AudioChunk> AudioChunkBuffer::peek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunks_.empty()) {
        return std::nullopt;
    }
    return chunks_.front();
}

std::optional<int64_t> AudioChunkBuffer::peek_timestamp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunks_.empty()) {
        return std::nullopt;
    }
    return chunks_.front().timestamp_us;
}

void AudioChunkBuffer::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.clear();
        total_bytes_ = 0;
    }
    data_cv_.notify_all();
}

bool AudioChunkBuffer::wait_for_bytes(size_t min_bytes, std::chrono::milliseconds timeout,
                                      const std::atomic<bool>& stop_flag) {
    std::unique_lock<std::mutex> lock(mutex_);
    data_cv_.wait_for(lock, timeout, [&] {
        return total_bytes_ >= min_bytes || stop_flag.load();
    });
    return total_bytes_ >= min_bytes && !stop_flag.load();
}

void AudioChunkBuffer::notify_waiters() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    data_cv_.notify_all();
}

size_t AudioChunkBuffer::size_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_bytes_;
}

size_t AudioChunkBuffer::available_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_bytes_ - total_bytes_;
}

size_t AudioChunkBuffer::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

bool AudioChunkBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.empty();
}

int AudioChunkBuffer::usage_percent() const {
    if (capacity_bytes_ == 0) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>((static_cast<uint64_t>(total_bytes_) * 100) / capacity_bytes_);
}

void AudioChunkBuffer::reset_stats() {
    chunks_written_.store(0);
    chunks_read_.store(0);
    chunks_rejected_.store(0);
}

} // namespace audio
} // namespace sendspin
