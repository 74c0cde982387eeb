#include "cpp_logger.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <deque>
#include <mutex>

namespace syncroom {
namespace engine {
namespace logging {

std::atomic<LogLevel> current_log_level{LogLevel::INFO};

namespace {

// ============================================================================
// LogQueue
// ============================================================================

class LogQueue {
public:
    void append(LogEntry entry) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            if (entries_.size() >= kLogQueueCapacity) {
                entries_.pop_front();
                if (!overflow_reported_) {
                    entries_.push_back(LogEntry{LogLevel::WARNING,
                                                "Log queue overflow, oldest entries dropped.",
                                                "cpp_logger.cpp", __LINE__, entry.timestamp_ms});
                    overflow_reported_ = true;
                }
            }
            entries_.push_back(std::move(entry));
        }
        available_.notify_one();
    }

    std::vector<LogEntry> take(int timeout_ms) {
        std::vector<LogEntry> batch;
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait_for(lock, std::chrono::milliseconds(std::max(timeout_ms, 0)),
                            [this] { return closed_ || !entries_.empty(); });

        const std::size_t count = std::min(entries_.size(), kLogBatchSize);
        batch.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            batch.push_back(std::move(entries_.front()));
            entries_.pop_front();
        }
        // Re-arm the overflow marker once the reader has caught up.
        if (entries_.size() < kLogQueueCapacity / 2) {
            overflow_reported_ = false;
        }
        return batch;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        available_.notify_all();
    }

    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        closed_ = false;
        overflow_reported_ = false;
    }

private:
    std::mutex mutex_;
    std::condition_variable available_;
    std::deque<LogEntry> entries_;
    bool closed_ = false;
    bool overflow_reported_ = false;
};

LogQueue& log_queue() {
    static LogQueue queue;
    return queue;
}

std::atomic<bool> console_echo{false};

int64_t wall_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

const char* get_base_filename(const char* path) {
    if (!path) {
        return "";
    }
    const char* base = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            base = p + 1;
        }
    }
    return base;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERR:     return "ERROR";
    }
    return "UNKNOWN";
}

void set_cpp_log_level(LogLevel level) {
    current_log_level.store(level);
}

void set_cpp_log_console_echo(bool enabled) {
    console_echo.store(enabled);
}

void log_message(LogLevel level, const char* file, int line, const char* format, ...) {
    if (static_cast<int>(level) < static_cast<int>(current_log_level.load())) {
        return;
    }

    char small[512];
    va_list args;
    va_start(args, format);
    int needed = std::vsnprintf(small, sizeof(small), format, args);
    va_end(args);
    if (needed < 0) {
        std::fprintf(stderr, "[cpp_logger] Bad format string at %s:%d\n", file ? file : "?", line);
        return;
    }

    std::string message;
    if (static_cast<std::size_t>(needed) < sizeof(small)) {
        message.assign(small, static_cast<std::size_t>(needed));
    } else {
        message.resize(static_cast<std::size_t>(needed) + 1);
        va_start(args, format);
        std::vsnprintf(&message[0], message.size(), format, args);
        va_end(args);
        message.resize(static_cast<std::size_t>(needed));
    }

    LogEntry entry{level, std::move(message), file ? file : "unknown_file", line, wall_clock_ms()};

    if (console_echo.load()) {
        std::fprintf(stderr, "[%s][%s:%d] %s\n", log_level_name(level),
                     entry.filename.c_str(), line, entry.message.c_str());
    }
    log_queue().append(std::move(entry));
}

std::vector<LogEntry> retrieve_log_entries(int timeout_ms) {
    return log_queue().take(timeout_ms);
}

void shutdown_cpp_logger() {
    log_queue().close();
}

void reset_cpp_logger() {
    log_queue().reopen();
}

} // namespace logging
} // namespace engine
} // namespace syncroom
