#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <mutex>
#include <thread>

namespace rme {
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

// Category constants for the decision pipeline
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Regime = 1;
constexpr uint8_t Signal = 2;
constexpr uint8_t Ledger = 3;
constexpr uint8_t Sizing = 4;
constexpr uint8_t Ladder = 5;
constexpr uint8_t Stop = 6;
constexpr uint8_t Rebalance = 7;
constexpr uint8_t Gate = 8;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Regime:
        return "regime";
    case LogCategory::Signal:
        return "signal";
    case LogCategory::Ledger:
        return "ledger";
    case LogCategory::Sizing:
        return "sizing";
    case LogCategory::Ladder:
        return "ladder";
    case LogCategory::Stop:
        return "stop";
    case LogCategory::Rebalance:
        return "rebalance";
    case LogCategory::Gate:
        return "gate";
    default:
        return "?";
    }
}

/**
 * Log Entry - Fixed size for predictable latency
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // 8 bytes
    LogLevel level;        // 1 byte
    uint8_t category;      // 1 byte
    uint16_t reserved;     // 2 bytes padding
    uint32_t thread_id;    // 4 bytes
    char message[112];     // 112 bytes (null-terminated)
    // Total: 128 bytes (two cache lines)

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 128, "LogEntry must be 128 bytes");

/**
 * Ring buffer for log entries
 *
 * Several instrument workers log concurrently, so producers serialize on a
 * small mutex. The single consumer stays lock-free.
 */
template <size_t Capacity = 8192>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) { std::memset(buffer_.data(), 0, sizeof(buffer_)); }

    /**
     * Try to push a log entry (producer side)
     * Returns false if buffer is full.
     */
    bool try_push(const LogEntry& entry) {
        std::lock_guard<std::mutex> lock(producer_mutex_);
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false; // Buffer full
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    /**
     * Try to pop a log entry (consumer side)
     */
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
    std::mutex producer_mutex_;
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    alignas(64) std::array<LogEntry, Capacity> buffer_;
};

/**
 * Async Logger
 *
 * Log calls only format and enqueue; a background thread does the I/O.
 * Entries that do not fit in the ring are counted as dropped, never block.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   LOGF_INFO(logger, Ledger, "reserve %.2f for %s", amount, category.c_str());
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger()
        : running_(false), min_level_(LogLevel::Info), category_mask_(~0u), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * Start the background consumer thread
     */
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

        drain();
    }

    /**
     * Drain pending entries on the calling thread and return how many were
     * written. A no-op while the consumer thread is running, since the ring
     * has a single consumer.
     */
    size_t flush() {
        if (running_.load(std::memory_order_acquire))
            return 0;
        return drain();
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (!enabled(level, category))
            return;

        LogEntry entry;
        entry.timestamp_ns = get_timestamp_ns();
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
     * Log with printf-style formatting
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (!enabled(level, category))
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    // Categories above 31 cannot be muted
    void set_category_enabled(uint8_t category, bool on) {
        if (category >= 32)
            return;
        uint32_t bit = 1u << category;
        if (on)
            category_mask_.fetch_or(bit, std::memory_order_relaxed);
        else
            category_mask_.fetch_and(~bit, std::memory_order_relaxed);
    }

    bool enabled(LogLevel level, uint8_t category) const {
        if (level < min_level_.load(std::memory_order_relaxed))
            return false;
        return category >= 32 || (category_mask_.load(std::memory_order_relaxed) & (1u << category)) != 0;
    }

    // Statistics
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }

private:
    LogRingBuffer<8192> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    std::atomic<LogLevel> min_level_;
    std::atomic<uint32_t> category_mask_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    size_t drain() {
        size_t count = 0;
        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
            ++count;
        }
        return count;
    }

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            auto ts_ms = entry.timestamp_ns / 1000000;
            std::fprintf(stderr, "[%llu.%03llu] [%s] [%s] %s\n", static_cast<unsigned long long>(ts_ms / 1000),
                         static_cast<unsigned long long>(ts_ms % 1000), level_to_string(entry.level),
                         category_to_string(entry.category), entry.message);
        }
    }

    static uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
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

// Convenience macros (logger is a reference)
#define LOG_DEBUG(logger, cat, msg) (logger).log(rme::logging::LogLevel::Debug, rme::logging::LogCategory::cat, msg)
#define LOG_INFO(logger, cat, msg) (logger).log(rme::logging::LogLevel::Info, rme::logging::LogCategory::cat, msg)
#define LOG_WARN(logger, cat, msg) (logger).log(rme::logging::LogLevel::Warn, rme::logging::LogCategory::cat, msg)
#define LOG_ERROR(logger, cat, msg) (logger).log(rme::logging::LogLevel::Error, rme::logging::LogCategory::cat, msg)

// Printf-style variants
#define LOGF_DEBUG(logger, cat, fmt, ...)                                                                              \
    (logger).logf(rme::logging::LogLevel::Debug, rme::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_INFO(logger, cat, fmt, ...)                                                                               \
    (logger).logf(rme::logging::LogLevel::Info, rme::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_WARN(logger, cat, fmt, ...)                                                                               \
    (logger).logf(rme::logging::LogLevel::Warn, rme::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace rme
