#pragma once

#include "../risk/risk_budget_ledger.hpp"
#include "../types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rme {
namespace portfolio {

/**
 * Portfolio-level view of one open position.
 * The Position itself stays with its instrument's pipeline.
 */
struct RegistryEntry {
    Category category;
    Side side = Side::Long;
    double stake = 0;
    std::vector<ReservationId> reservations; // Active ledger reservations backing the stake
};

/**
 * PortfolioState - the single shared mutable portfolio state
 *
 * Owns total capital, the risk ledger, the open-position registry and the
 * per-category values derived from it. Every read-check-write sequence
 * goes through a Transaction, which holds the portfolio lock for its
 * lifetime. Lock order is portfolio, then ledger; the ledger never calls
 * back into the portfolio.
 *
 * Uncommitted capital (total minus open stakes) is attributed to the cash
 * category ("stable" by default).
 */
class PortfolioState {
public:
    explicit PortfolioState(double total_capital, const risk::LedgerConfig& ledger_config = risk::LedgerConfig(),
                            Category cash_category = "stable");

    PortfolioState(const PortfolioState&) = delete;
    PortfolioState& operator=(const PortfolioState&) = delete;

    class Transaction {
    public:
        explicit Transaction(PortfolioState& state) : state_(state), lock_(state.mutex_) {}

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        risk::RiskBudgetLedger& ledger() { return state_.ledger_; }

        double total_capital() const { return state_.total_capital_; }
        double committed() const;
        double uncommitted() const;

        size_t open_positions() const { return state_.registry_.size(); }
        bool has_position(const InstrumentId& instrument) const;
        const RegistryEntry* find(const InstrumentId& instrument) const;

        // Sum of open stakes in the category
        double category_stake(const Category& category) const;
        // category_stake, plus uncommitted capital for the cash category
        double category_value(const Category& category) const;
        std::map<Category, double> category_values() const;

        // New position; the reservation must already be committed
        bool register_position(const InstrumentId& instrument, const Category& category, Side side, double stake,
                               ReservationId reservation);

        // Ladder or rebalance fill on an existing position
        bool add_stake(const InstrumentId& instrument, double stake, ReservationId reservation);

        // Removes the position and releases all of its reservations; returns its stake
        std::optional<double> close_position(const InstrumentId& instrument);

        void set_total_capital(double capital);

    private:
        PortfolioState& state_;
        std::unique_lock<std::mutex> lock_;
    };

    Transaction begin() { return Transaction(*this); }

    // Locked convenience reads
    double total_capital();
    size_t open_position_count();
    std::map<Category, double> category_values();

    // The ledger is internally synchronized; safe to use without a Transaction
    risk::RiskBudgetLedger& ledger() { return ledger_; }
    const Category& cash_category() const { return cash_category_; }

private:
    std::mutex mutex_;
    double total_capital_;
    risk::RiskBudgetLedger ledger_;
    Category cash_category_;
    std::map<InstrumentId, RegistryEntry> registry_;
};

} // namespace portfolio
} // namespace rme
