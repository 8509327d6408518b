#include "cpp_logger.h"

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace sendspin {
namespace audio {
namespace logging {

const char* get_base_filename(const char* path) {
    if (!path) {
        return "";
    }
    const char* last_slash = strrchr(path, '/');
    const char* last_backslash = strrchr(path, '\\');

    const char* base = nullptr;
    if (last_slash && last_backslash) {
        base = (last_slash > last_backslash) ? last_slash + 1 : last_backslash + 1;
    } else if (last_slash) {
        base = last_slash + 1;
    } else if (last_backslash) {
        base = last_backslash + 1;
    } else {
        base = path;
    }
    return base;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERR: return "ERROR";
    }
    return "UNKNOWN";
}

Logger::Logger(LogLevel level, bool mirror_to_stderr)
    : level_(level), mirror_to_stderr_(mirror_to_stderr) {}

void Logger::log_message(LogLevel level, const char* file, int line, const char* format, ...) {
    std::vector<char> buffer(1024);
    va_list args;
    va_start(args, format);
    int needed = vsnprintf(buffer.data(), buffer.size(), format, args);
    va_end(args);

    if (needed < 0) {
        std::cerr << "SendspinLogger: Encoding error in log_message for file "
                  << (file ? file : "unknown_file") << ":" << line << std::endl;
        return;
    }

    if (static_cast<size_t>(needed) >= buffer.size()) {
        buffer.resize(static_cast<size_t>(needed) + 1);
        va_start(args, format);
        vsnprintf(buffer.data(), buffer.size(), format, args);
        va_end(args);
    }

    LogEntry new_entry;
    new_entry.level = level;
    new_entry.message = std::string(buffer.data());
    new_entry.filename = (file ? std::string(file) : "unknown_file");
    new_entry.line_number = line;

    if (mirror_to_stderr_.load()) {
        std::cerr << "[" << level_name(level) << "][" << new_entry.filename << ":" << line << "] "
                  << new_entry.message << std::endl;
    }

    enqueue(std::move(new_entry));
}

void Logger::enqueue(LogEntry entry) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (shutdown_requested_) {
        return;
    }

    if (queue_.size() >= kMaxQueueSize) {
        queue_.pop_front();
        if (!overflow_logged_since_clear_) {
            LogEntry overflow_entry;
            overflow_entry.level = LogLevel::WARNING;
            overflow_entry.message = "C++ log queue overflow. Oldest messages dropped.";
            overflow_entry.filename = "cpp_logger.cpp";
            overflow_entry.line_number = __LINE__;
            queue_.push_back(std::move(overflow_entry));
            overflow_logged_since_clear_ = true;
        }
    }
    queue_.push_back(std::move(entry));
    lock.unlock();
    queue_cv_.notify_one();
}

std::vector<LogEntry> Logger::retrieve_log_entries(int timeout_ms) {
    std::vector<LogEntry> batch;
    std::unique_lock<std::mutex> lock(queue_mutex_);

    if (!queue_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this] { return !queue_.empty() || shutdown_requested_; })) {
        return batch;
    }

    if (shutdown_requested_ && queue_.empty()) {
        return batch;
    }

    size_t items_to_grab = std::min(queue_.size(), kMaxBatchSize);
    batch.reserve(items_to_grab);
    for (size_t i = 0; i < items_to_grab && !queue_.empty(); ++i) {
        batch.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }

    if (overflow_logged_since_clear_ && queue_.size() < (kMaxQueueSize / 2)) {
        overflow_logged_since_clear_ = false;
    }

    return batch;
}

void Logger::shutdown() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    shutdown_requested_ = true;
    lock.unlock();
    queue_cv_.notify_all();
}

size_t Logger::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

} // namespace logging
} // namespace audio
} // namespace sendspin
