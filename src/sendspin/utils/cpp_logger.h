/**
 * @file cpp_logger.h
 * @brief Defines the logging framework for the Sendspin player engine.
 * @details Log messages are formatted printf-style, queued inside a `Logger`
 *          instance and retrieved in batches by the host (Python or the daemon).
 *          Every component receives its logger explicitly; a null logger
 *          disables logging for that component.
 */
#ifndef SENDSPIN_CPP_LOGGER_H
#define SENDSPIN_CPP_LOGGER_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sendspin {
namespace audio {
namespace logging {

/**
 * @enum LogLevel
 * @brief Defines the severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,   ///< Detailed information, typically of interest only when diagnosing problems.
    INFO,    ///< Confirmation that things are working as expected.
    WARNING, ///< An indication that something unexpected happened, or a potential problem.
    ERR      ///< A serious problem, preventing the program from performing a function.
};

/**
 * @struct LogEntry
 * @brief Represents a single log message.
 */
struct LogEntry {
    LogLevel level;         ///< The severity level of the log message.
    std::string message;    ///< The log message content.
    std::string filename;   ///< The source file where the log was generated.
    int line_number;        ///< The line number in the source file.
};

/**
 * @class Logger
 * @brief A bounded, thread-safe queue of log entries.
 * @details Producers call `log_message` (normally through the `LOG_CPP_*` macros).
 *          A single consumer drains the queue with `retrieve_log_entries`. When the
 *          queue is full the oldest entry is dropped and one overflow warning is
 *          queued until the consumer catches up.
 */
class Logger {
public:
    static constexpr size_t kMaxQueueSize = 2048;
    static constexpr size_t kMaxBatchSize = 100;

    explicit Logger(LogLevel level = LogLevel::INFO, bool mirror_to_stderr = false);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Formats and queues a message.
     * @param level The log level.
     * @param file The base source file name.
     * @param line The source line number.
     * @param format The printf-style format string.
     */
    void log_message(LogLevel level, const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 5, 6)))
#endif
        ;

    /**
     * @brief Retrieves buffered log entries.
     * @details Blocks until messages are available, the timeout expires or
     *          `shutdown` is called. Returns at most `kMaxBatchSize` entries.
     * @param timeout_ms The maximum time to wait in milliseconds.
     */
    std::vector<LogEntry> retrieve_log_entries(int timeout_ms = 100);

    /**
     * @brief Stops accepting messages and wakes any waiting retriever.
     */
    void shutdown();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }
    bool is_enabled(LogLevel level) const { return level >= level_.load(); }

    void set_mirror_to_stderr(bool enabled) { mirror_to_stderr_.store(enabled); }
    bool mirrors_to_stderr() const { return mirror_to_stderr_.load(); }

    size_t pending() const;

private:
    void enqueue(LogEntry entry);

    std::atomic<LogLevel> level_;
    std::atomic<bool> mirror_to_stderr_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<LogEntry> queue_;
    bool shutdown_requested_ = false;
    bool overflow_logged_since_clear_ = false;
};

using LoggerPtr = std::shared_ptr<Logger>;

/**
 * @brief Helper function to extract the base filename from a full path.
 * @param path The full path to the file.
 * @return A pointer to the base filename within the path string.
 */
const char* get_base_filename(const char* path);

/** @brief Returns the textual name used when printing a level. */
const char* level_name(LogLevel level);

} // namespace logging
} // namespace audio
} // namespace sendspin

/**
 * @def LOG_CPP_BASE
 * @brief A base macro for logging. Not intended for direct use.
 */
#define LOG_CPP_BASE(logger, level, fmt, ...)                                      \
    do {                                                                           \
        const auto& sendspin_log_target_ = (logger);                               \
        if (sendspin_log_target_ && sendspin_log_target_->is_enabled(level)) {     \
            sendspin_log_target_->log_message(                                     \
                level,                                                             \
                sendspin::audio::logging::get_base_filename(__FILE__),             \
                __LINE__,                                                          \
                fmt,                                                               \
                ##__VA_ARGS__);                                                    \
        }                                                                          \
    } while (0)

/** @def LOG_CPP_DEBUG(logger, fmt, ...) @brief Logs a message at the DEBUG level. */
#define LOG_CPP_DEBUG(logger, fmt, ...)   LOG_CPP_BASE(logger, sendspin::audio::logging::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_INFO(logger, fmt, ...) @brief Logs a message at the INFO level. */
#define LOG_CPP_INFO(logger, fmt, ...)    LOG_CPP_BASE(logger, sendspin::audio::logging::LogLevel::INFO, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_WARNING(logger, fmt, ...) @brief Logs a message at the WARNING level. */
#define LOG_CPP_WARNING(logger, fmt, ...) LOG_CPP_BASE(logger, sendspin::audio::logging::LogLevel::WARNING, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_ERROR(logger, fmt, ...) @brief Logs a message at the ERROR level. */
#define LOG_CPP_ERROR(logger, fmt, ...)   LOG_CPP_BASE(logger, sendspin::audio::logging::LogLevel::ERR, fmt, ##__VA_ARGS__)

#endif // SENDSPIN_CPP_LOGGER_H
