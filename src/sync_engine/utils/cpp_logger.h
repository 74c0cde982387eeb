/**
 * @file cpp_logger.h
 * @brief Process-wide logger for the sync engine.
 * @details Log calls format a message and append it to a bounded in-process queue. The Python
 *          host drains that queue through `retrieve_log_entries` (exposed as
 *          `get_cpp_log_messages` in bindings.cpp); the standalone server enables a stderr echo
 *          instead. The core libraries never depend on Python headers.
 */
#ifndef CPP_LOGGER_H
#define CPP_LOGGER_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace syncroom {
namespace engine {
namespace logging {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERR
};

/** @brief Entries below this level are discarded at the call site. */
extern std::atomic<LogLevel> current_log_level;

/** @brief Capacity of the in-process queue; the oldest entry is dropped beyond it. */
constexpr std::size_t kLogQueueCapacity = 2048;

/** @brief Maximum number of entries handed out by one `retrieve_log_entries` call. */
constexpr std::size_t kLogBatchSize = 100;

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string filename;
    int line_number;
    int64_t timestamp_ms; ///< Wall clock, milliseconds since the Unix epoch.
};

/**
 * @brief Takes up to `kLogBatchSize` queued entries.
 * @details Blocks for at most `timeout_ms` while the queue is empty. Returns immediately with
 *          whatever remains once the logger is shut down.
 */
std::vector<LogEntry> retrieve_log_entries(int timeout_ms = 100);

/** @brief Stops accepting entries and wakes every reader blocked in `retrieve_log_entries`. */
void shutdown_cpp_logger();

/** @brief Clears the queue and accepts entries again after `shutdown_cpp_logger`. */
void reset_cpp_logger();

void set_cpp_log_level(LogLevel level);

/** @brief Mirrors accepted entries to stderr. Used when no Python reader is attached. */
void set_cpp_log_console_echo(bool enabled);

/**
 * @brief printf-style entry point behind the `LOG_CPP_*` macros.
 * @param file Base name of the calling source file.
 */
void log_message(LogLevel level, const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

/** @brief Returns the part of `path` after the last '/' or '\\'. */
const char* get_base_filename(const char* path);

const char* log_level_name(LogLevel level);

} // namespace logging
} // namespace engine
} // namespace syncroom

#define LOG_CPP_BASE(level, fmt, ...) \
    syncroom::engine::logging::log_message( \
        level, \
        syncroom::engine::logging::get_base_filename(__FILE__), \
        __LINE__, \
        fmt, \
        ##__VA_ARGS__)

#define LOG_CPP_DEBUG(fmt, ...)   LOG_CPP_BASE(syncroom::engine::logging::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_CPP_INFO(fmt, ...)    LOG_CPP_BASE(syncroom::engine::logging::LogLevel::INFO, fmt, ##__VA_ARGS__)
#define LOG_CPP_WARNING(fmt, ...) LOG_CPP_BASE(syncroom::engine::logging::LogLevel::WARNING, fmt, ##__VA_ARGS__)
#define LOG_CPP_ERROR(fmt, ...)   LOG_CPP_BASE(syncroom::engine::logging::LogLevel::ERR, fmt, ##__VA_ARGS__)

#endif // CPP_LOGGER_H
