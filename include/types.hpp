#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace rme {

using InstrumentId = std::string; // e.g. "BTC/USDT"
using Category = std::string;     // e.g. "btc", "alt", "stable"
using Timestamp = uint64_t;       // nanoseconds
using ReservationId = uint64_t;

constexpr ReservationId INVALID_RESERVATION = 0;

constexpr uint64_t NANOS_PER_SECOND = 1'000'000'000ULL;
constexpr uint64_t NANOS_PER_MINUTE = 60 * NANOS_PER_SECOND;
constexpr uint64_t NANOS_PER_HOUR = 60 * NANOS_PER_MINUTE;

inline constexpr Timestamp seconds_to_ns(double seconds) {
    return seconds <= 0 ? 0 : static_cast<Timestamp>(seconds * static_cast<double>(NANOS_PER_SECOND));
}

inline constexpr double ns_to_hours(Timestamp ns) {
    return static_cast<double>(ns) / static_cast<double>(NANOS_PER_HOUR);
}

enum class Side : uint8_t { Long = 0, Short = 1 };

inline const char* side_to_string(Side side) {
    return side == Side::Long ? "LONG" : "SHORT";
}

// +1 for long, -1 for short. Profit ratio = sign * (price - open) / open.
inline constexpr double side_sign(Side side) {
    return side == Side::Long ? 1.0 : -1.0;
}

/**
 * Why a position is (or would be) exited.
 *
 * StopLoss and Emergency always pass the admission gate.
 * Signal and Roi are profit-taking exits and may be delayed.
 */
enum class ExitReason : uint8_t {
    None = 0,
    Signal,    // Exit predicate family fired
    Roi,       // Time-based take-profit schedule reached
    StopLoss,  // Protective stop crossed
    Emergency, // Caller-forced liquidation
    Rebalance  // Category over target allocation
};

inline const char* exit_reason_to_string(ExitReason reason) {
    switch (reason) {
    case ExitReason::Signal:
        return "exit_signal";
    case ExitReason::Roi:
        return "roi";
    case ExitReason::StopLoss:
        return "stop_loss";
    case ExitReason::Emergency:
        return "emergency_exit";
    case ExitReason::Rebalance:
        return "rebalance";
    default:
        return "none";
    }
}

/**
 * Data quality of a per-tick input.
 * Anything other than Ok degrades to "no action this tick".
 */
enum class DataStatus : uint8_t {
    Ok = 0,
    DataUnavailable, // Missing or short indicator history
    DegenerateInput  // Zero price, zero balance
};

inline const char* data_status_to_string(DataStatus status) {
    switch (status) {
    case DataStatus::Ok:
        return "Ok";
    case DataStatus::DataUnavailable:
        return "DataUnavailable";
    case DataStatus::DegenerateInput:
        return "DegenerateInput";
    default:
        return "Unknown";
    }
}

} // namespace rme
