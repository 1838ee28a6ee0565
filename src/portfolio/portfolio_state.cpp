#include "../../include/portfolio/portfolio_state.hpp"

#include <cmath>

namespace rme::portfolio {

PortfolioState::PortfolioState(double total_capital, const risk::LedgerConfig& ledger_config, Category cash_category)
    : total_capital_(total_capital > 0 ? total_capital : 0.0), ledger_(total_capital, ledger_config),
      cash_category_(std::move(cash_category)) {}

// =============================================================================
// Transaction
// =============================================================================

double PortfolioState::Transaction::committed() const {
    double total = 0;
    for (const auto& [instrument, entry] : state_.registry_)
        total += entry.stake;
    return total;
}

double PortfolioState::Transaction::uncommitted() const {
    double free = state_.total_capital_ - committed();
    return free > 0 ? free : 0.0;
}

bool PortfolioState::Transaction::has_position(const InstrumentId& instrument) const {
    return state_.registry_.count(instrument) > 0;
}

const RegistryEntry* PortfolioState::Transaction::find(const InstrumentId& instrument) const {
    auto it = state_.registry_.find(instrument);
    return it == state_.registry_.end() ? nullptr : &it->second;
}

double PortfolioState::Transaction::category_stake(const Category& category) const {
    double value = 0;
    for (const auto& [instrument, entry] : state_.registry_) {
        if (entry.category == category)
            value += entry.stake;
    }
    return value;
}

double PortfolioState::Transaction::category_value(const Category& category) const {
    double value = category_stake(category);
    if (category == state_.cash_category_)
        value += uncommitted();
    return value;
}

std::map<Category, double> PortfolioState::Transaction::category_values() const {
    std::map<Category, double> values;
    for (const auto& [instrument, entry] : state_.registry_)
        values[entry.category] += entry.stake;
    values[state_.cash_category_] += uncommitted();
    return values;
}

bool PortfolioState::Transaction::register_position(const InstrumentId& instrument, const Category& category,
                                                    Side side, double stake, ReservationId reservation) {
    if (stake <= 0 || !std::isfinite(stake) || has_position(instrument))
        return false;

    RegistryEntry entry;
    entry.category = category;
    entry.side = side;
    entry.stake = stake;
    if (reservation != INVALID_RESERVATION)
        entry.reservations.push_back(reservation);
    state_.registry_.emplace(instrument, std::move(entry));
    return true;
}

bool PortfolioState::Transaction::add_stake(const InstrumentId& instrument, double stake, ReservationId reservation) {
    auto it = state_.registry_.find(instrument);
    if (it == state_.registry_.end() || stake <= 0 || !std::isfinite(stake))
        return false;

    it->second.stake += stake;
    if (reservation != INVALID_RESERVATION)
        it->second.reservations.push_back(reservation);
    return true;
}

std::optional<double> PortfolioState::Transaction::close_position(const InstrumentId& instrument) {
    auto it = state_.registry_.find(instrument);
    if (it == state_.registry_.end())
        return std::nullopt;

    for (ReservationId id : it->second.reservations)
        state_.ledger_.release(id);

    double stake = it->second.stake;
    state_.registry_.erase(it);
    return stake;
}

void PortfolioState::Transaction::set_total_capital(double capital) {
    state_.total_capital_ = (std::isfinite(capital) && capital > 0) ? capital : 0.0;
    state_.ledger_.set_total_capital(state_.total_capital_);
}

// =============================================================================
// Locked convenience reads
// =============================================================================

double PortfolioState::total_capital() {
    return begin().total_capital();
}

size_t PortfolioState::open_position_count() {
    return begin().open_positions();
}

std::map<Category, double> PortfolioState::category_values() {
    return begin().category_values();
}

} // namespace rme::portfolio
