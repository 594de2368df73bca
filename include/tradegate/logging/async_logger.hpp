#pragma once

#include "../util/time_utils.hpp"

#include <array>
#include <cctype>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <functional>
#include <string>
#include <thread>

namespace tradegate {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

// Accepts "trace", "DEBUG", "info", "warn"/"warning", "error", "fatal"; unknown text maps to Info
inline LogLevel parse_level(std::string text) {
    for (auto& c : text)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (text == "trace")
        return LogLevel::Trace;
    if (text == "debug")
        return LogLevel::Debug;
    if (text == "warn" || text == "warning")
        return LogLevel::Warn;
    if (text == "error")
        return LogLevel::Error;
    if (text == "fatal" || text == "critical")
        return LogLevel::Fatal;
    return LogLevel::Info;
}

// Category constants
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Runner = 1;
constexpr uint8_t Risk = 2;
constexpr uint8_t Intent = 3;
constexpr uint8_t Approval = 4;
constexpr uint8_t Execution = 5;
constexpr uint8_t Backtest = 6;
constexpr uint8_t Store = 7;
constexpr uint8_t Market = 8;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    static constexpr const char* names[] = {"system",    "runner",   "risk",  "intent", "approval",
                                            "execution", "backtest", "store", "market"};
    return category < sizeof(names) / sizeof(names[0]) ? names[category] : "other";
}

/**
 * Log Entry - fixed size, four cache lines
 */
struct alignas(64) LogEntry {
    int64_t timestamp_ms; // 8 bytes, wall clock
    LogLevel level;       // 1 byte
    uint8_t category;     // 1 byte
    uint16_t reserved;    // 2 bytes padding
    uint32_t thread_id;   // 4 bytes
    char message[240];    // 240 bytes (null-terminated)
    // Total: 256 bytes

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Lock-Free SPSC Ring Buffer
 *
 * Single Producer, Single Consumer - no locks needed.
 */
template <size_t Capacity = 4096>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {}

    bool try_push(const LogEntry& entry) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false; // Buffer full
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false; // Buffer empty
        }

        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail + Capacity) & (Capacity - 1);
    }

    bool empty() const { return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire); }

private:
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    alignas(64) std::array<LogEntry, Capacity> buffer_;
};

/**
 * Async Logger
 *
 * The calling thread formats into a fixed entry and pushes it to the ring.
 * A background thread does the I/O. One producer thread per logger.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   TG_LOGF_INFO(&logger, Runner, "runner.cycle duration=%.3f", secs);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start() {
        if (running_.exchange(true))
            return;

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the logger and flush remaining entries
     */
    void stop() {
        if (!running_.exchange(false))
            return;

        if (consumer_thread_.joinable()) {
            consumer_thread_.join();
        }

        flush();
    }

    // Drain pending entries on the calling thread (only when the consumer is not running)
    void flush() {
        if (running_.load())
            return;
        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_)
            return;

        LogEntry entry;
        entry.timestamp_ms = util::wall_clock_ms();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        if (!buffer_.try_push(entry)) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /**
     * Log with printf-style formatting (truncated to the entry size)
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_)
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }

private:
    LogRingBuffer<4096> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    LogLevel min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            std::fprintf(stderr, "%s [%s] [%s] %s\n", util::format_iso8601(entry.timestamp_ms).c_str(),
                         level_to_string(entry.level), category_to_string(entry.category), entry.message);
        }
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

} // namespace logging
} // namespace tradegate

// Convenience macros. The logger argument is a pointer; a null logger drops the line.
#define TG_LOG(logger, level, cat, msg)                                                                      \
    do {                                                                                                     \
        if (logger)                                                                                          \
            (logger)->log(level, ::tradegate::logging::LogCategory::cat, msg);                                \
    } while (0)

#define TG_LOGF(logger, level, cat, fmt, ...)                                                                \
    do {                                                                                                     \
        if (logger)                                                                                          \
            (logger)->logf(level, ::tradegate::logging::LogCategory::cat, fmt, ##__VA_ARGS__);                \
    } while (0)

#define TG_LOG_DEBUG(logger, cat, msg) TG_LOG(logger, ::tradegate::logging::LogLevel::Debug, cat, msg)
#define TG_LOG_INFO(logger, cat, msg) TG_LOG(logger, ::tradegate::logging::LogLevel::Info, cat, msg)
#define TG_LOG_WARN(logger, cat, msg) TG_LOG(logger, ::tradegate::logging::LogLevel::Warn, cat, msg)
#define TG_LOG_ERROR(logger, cat, msg) TG_LOG(logger, ::tradegate::logging::LogLevel::Error, cat, msg)

#define TG_LOGF_DEBUG(logger, cat, fmt, ...) TG_LOGF(logger, ::tradegate::logging::LogLevel::Debug, cat, fmt, ##__VA_ARGS__)
#define TG_LOGF_INFO(logger, cat, fmt, ...) TG_LOGF(logger, ::tradegate::logging::LogLevel::Info, cat, fmt, ##__VA_ARGS__)
#define TG_LOGF_WARN(logger, cat, fmt, ...) TG_LOGF(logger, ::tradegate::logging::LogLevel::Warn, cat, fmt, ##__VA_ARGS__)
#define TG_LOGF_ERROR(logger, cat, fmt, ...) TG_LOGF(logger, ::tradegate::logging::LogLevel::Error, cat, fmt, ##__VA_ARGS__)
