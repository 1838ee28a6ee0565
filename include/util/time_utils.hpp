#pragma once

/**
 * Time utilities for the decision engine
 *
 * The engine never reads the system clock directly: every elapsed-time check
 * (ladder spacing, stop time decay, take-profit schedule, rebalance cadence)
 * goes through a Clock so tests and replays can drive time explicitly.
 */

#include "../types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace rme {
namespace util {

/**
 * Returns current time in nanoseconds since steady_clock epoch.
 */
inline uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 * Use for timestamps that need to correlate with snapshot timestamps.
 */
inline uint64_t wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now_ns() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now_ns() const override { return wall_clock_ns(); }
};

/**
 * ManualClock - caller-driven time source
 *
 * Safe to read from worker threads while a driver thread advances it.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now_ns() const override { return now_.load(std::memory_order_acquire); }

    void set(Timestamp ts) { now_.store(ts, std::memory_order_release); }
    void advance(Timestamp delta) { now_.fetch_add(delta, std::memory_order_acq_rel); }
    void advance_seconds(double seconds) { advance(seconds_to_ns(seconds)); }
    void advance_hours(double hours) { advance(seconds_to_ns(hours * 3600.0)); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace util
} // namespace rme
