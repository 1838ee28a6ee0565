#pragma once

#include "../config/defaults.hpp"
#include "../types.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rme {
namespace risk {

struct LedgerConfig {
    double max_total_risk = config::ledger::MAX_TOTAL_RISK_PCT; // Fraction of capital at risk
};

enum class ReserveResult : uint8_t {
    Granted = 0,
    InsufficientBudget, // Would break reserved <= ceiling
    InvalidAmount       // Non-positive or non-finite amount
};

inline const char* reserve_result_to_string(ReserveResult result) {
    switch (result) {
    case ReserveResult::Granted:
        return "Granted";
    case ReserveResult::InsufficientBudget:
        return "InsufficientBudget";
    case ReserveResult::InvalidAmount:
        return "InvalidAmount";
    default:
        return "Unknown";
    }
}

struct Reservation {
    ReserveResult result = ReserveResult::InvalidAmount;
    ReservationId id = INVALID_RESERVATION;
    double amount = 0;

    bool granted() const { return result == ReserveResult::Granted; }
};

enum class ReservationState : uint8_t {
    Pending = 0, // Reserved this tick, not yet admitted
    Active       // Backs an admitted order until the position closes
};

/**
 * RiskBudgetLedger - aggregate risk across all open positions
 *
 * Invariant: sum(pending + active) <= total_capital * max_total_risk.
 * reserve() checks and records under one lock, so two concurrent callers
 * can never both pass a check only one of them fits into.
 *
 * Pending reservations are released if not committed within the tick
 * (ReservationGuard, or release_pending() at the end of a tick).
 */
class RiskBudgetLedger {
public:
    explicit RiskBudgetLedger(double total_capital, const LedgerConfig& config = LedgerConfig());

    RiskBudgetLedger(const RiskBudgetLedger&) = delete;
    RiskBudgetLedger& operator=(const RiskBudgetLedger&) = delete;

    Reservation reserve(double amount, const Category& category, const InstrumentId& instrument = {});

    // Pending -> Active. False if the id is unknown or already active.
    bool commit(ReservationId id);

    // Drops a pending or active reservation. False if unknown.
    bool release(ReservationId id);

    // Drops every pending reservation, returns how many
    size_t release_pending();

    bool is_pending(ReservationId id) const;
    bool is_active(ReservationId id) const;

    double current_utilization() const; // reserved / ceiling
    double reserved() const;
    double reserved_for(const Category& category) const;
    double available() const;
    double ceiling() const;
    double total_capital() const;
    size_t pending_count() const;
    size_t active_count() const;

    // Existing reservations stay; a lower ceiling only blocks new ones
    void set_total_capital(double capital);

    const LedgerConfig& config() const { return config_; }

private:
    struct Entry {
        double amount;
        Category category;
        InstrumentId instrument;
        ReservationState state;
    };

    LedgerConfig config_;
    mutable std::mutex mutex_;
    double total_capital_;
    double reserved_ = 0;
    ReservationId next_id_ = 1;
    std::unordered_map<ReservationId, Entry> entries_;

    double ceiling_locked() const { return total_capital_ > 0 ? total_capital_ * config_.max_total_risk : 0.0; }
};

/**
 * ReservationGuard - releases a pending reservation on scope exit
 *
 * Call dismiss() once the reservation has been committed (ownership now
 * belongs to the position registry). Every early return or rejection path
 * in between gives the budget back.
 */
class ReservationGuard {
public:
    ReservationGuard(RiskBudgetLedger& ledger, ReservationId id) : ledger_(&ledger), id_(id) {}
    ~ReservationGuard() { reset(); }

    ReservationGuard(const ReservationGuard&) = delete;
    ReservationGuard& operator=(const ReservationGuard&) = delete;

    ReservationGuard(ReservationGuard&& other) noexcept : ledger_(other.ledger_), id_(other.id_) {
        other.id_ = INVALID_RESERVATION;
    }

    ReservationId id() const { return id_; }
    bool armed() const { return id_ != INVALID_RESERVATION; }

    void dismiss() { id_ = INVALID_RESERVATION; }

    void reset() {
        if (id_ != INVALID_RESERVATION && ledger_->is_pending(id_)) {
            ledger_->release(id_);
        }
        id_ = INVALID_RESERVATION;
    }

private:
    RiskBudgetLedger* ledger_;
    ReservationId id_;
};

} // namespace risk
} // namespace rme
