#include "../../include/risk/risk_budget_ledger.hpp"

#include <cmath>

namespace rme::risk {

RiskBudgetLedger::RiskBudgetLedger(double total_capital, const LedgerConfig& config)
    : config_(config), total_capital_(total_capital > 0 ? total_capital : 0.0) {}

Reservation RiskBudgetLedger::reserve(double amount, const Category& category, const InstrumentId& instrument) {
    if (!std::isfinite(amount) || amount <= 0) {
        return Reservation{ReserveResult::InvalidAmount, INVALID_RESERVATION, 0};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (reserved_ + amount > ceiling_locked()) {
        return Reservation{ReserveResult::InsufficientBudget, INVALID_RESERVATION, 0};
    }

    ReservationId id = next_id_++;
    entries_.emplace(id, Entry{amount, category, instrument, ReservationState::Pending});
    reserved_ += amount;
    return Reservation{ReserveResult::Granted, id, amount};
}

bool RiskBudgetLedger::commit(ReservationId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.state != ReservationState::Pending)
        return false;
    it->second.state = ReservationState::Active;
    return true;
}

bool RiskBudgetLedger::release(ReservationId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end())
        return false;
    reserved_ -= it->second.amount;
    entries_.erase(it);
    if (entries_.empty())
        reserved_ = 0; // Drop accumulated rounding
    return true;
}

size_t RiskBudgetLedger::release_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t released = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.state == ReservationState::Pending) {
            reserved_ -= it->second.amount;
            it = entries_.erase(it);
            ++released;
        } else {
            ++it;
        }
    }
    if (entries_.empty())
        reserved_ = 0;
    return released;
}

bool RiskBudgetLedger::is_pending(ReservationId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it != entries_.end() && it->second.state == ReservationState::Pending;
}

bool RiskBudgetLedger::is_active(ReservationId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it != entries_.end() && it->second.state == ReservationState::Active;
}

double RiskBudgetLedger::current_utilization() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double ceiling = ceiling_locked();
    return ceiling > 0 ? reserved_ / ceiling : 0.0;
}

double RiskBudgetLedger::reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_;
}

double RiskBudgetLedger::reserved_for(const Category& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0;
    for (const auto& [id, entry] : entries_) {
        if (entry.category == category)
            total += entry.amount;
    }
    return total;
}

double RiskBudgetLedger::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double headroom = ceiling_locked() - reserved_;
    return headroom > 0 ? headroom : 0.0;
}

double RiskBudgetLedger::ceiling() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ceiling_locked();
}

double RiskBudgetLedger::total_capital() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_capital_;
}

size_t RiskBudgetLedger::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, entry] : entries_) {
        if (entry.state == ReservationState::Pending)
            ++count;
    }
    return count;
}

size_t RiskBudgetLedger::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, entry] : entries_) {
        if (entry.state == ReservationState::Active)
            ++count;
    }
    return count;
}

void RiskBudgetLedger::set_total_capital(double capital) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_capital_ = (std::isfinite(capital) && capital > 0) ? capital : 0.0;
}

} // namespace rme::risk
