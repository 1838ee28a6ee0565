#pragma once

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "../market/instrument_snapshot.hpp"
#include "../portfolio/portfolio_state.hpp"
#include "../types.hpp"

#include <map>
#include <string>

namespace rme {
namespace risk {

struct AdmissionConfig {
    uint32_t max_open_positions = config::admission::MAX_OPEN_POSITIONS;

    // Category value after the order, as a fraction of capital
    double max_category_fraction = config::admission::MAX_CATEGORY_ALLOCATION_PCT;
    std::map<Category, double> category_ceilings; // Per-category overrides

    // Entry market conditions
    double max_spread = config::admission::MAX_SPREAD_PCT;
    double max_bb_width = config::admission::MAX_BB_WIDTH;
    double min_volume_ratio = config::admission::MIN_VOLUME_RATIO;

    // Profit-taking exit delay
    double min_profit_for_exit = config::admission::MIN_PROFIT_FOR_EXIT;
    double overbought_rsi = config::admission::OVERBOUGHT_RSI;
    double overextended_bb_width = config::admission::OVEREXTENDED_BB_WIDTH;

    // false: rebalance exits follow the same delay rule as signal exits
    bool rebalance_exit_bypasses_delay = false;

    double ceiling_for(const Category& category) const {
        auto it = category_ceilings.find(category);
        return it == category_ceilings.end() ? max_category_fraction : it->second;
    }
};

enum class OrderIntent : uint8_t {
    Entry = 0, // New position
    AddOn,     // Ladder or rebalance fill on an open position
    Exit
};

inline const char* order_intent_to_string(OrderIntent intent) {
    switch (intent) {
    case OrderIntent::Entry:
        return "entry";
    case OrderIntent::AddOn:
        return "add_on";
    case OrderIntent::Exit:
        return "exit";
    default:
        return "unknown";
    }
}

enum class AdmissionResult : uint8_t {
    Accepted = 0,
    MaxPositions,
    DuplicatePosition,
    CategoryCeiling,
    BudgetExceeded,  // Reservation missing or no longer pending
    Illiquid,        // Spread above threshold
    Volatile,        // Bollinger width above ceiling
    LowVolume,
    Delayed,         // Profit-taking exit, re-check next tick
    UnknownPosition, // Exit/add-on for an instrument not in the registry
    InvalidRequest
};

inline const char* admission_result_to_string(AdmissionResult result) {
    switch (result) {
    case AdmissionResult::Accepted:
        return "Accepted";
    case AdmissionResult::MaxPositions:
        return "MaxPositions";
    case AdmissionResult::DuplicatePosition:
        return "DuplicatePosition";
    case AdmissionResult::CategoryCeiling:
        return "CategoryCeiling";
    case AdmissionResult::BudgetExceeded:
        return "BudgetExceeded";
    case AdmissionResult::Illiquid:
        return "Illiquid";
    case AdmissionResult::Volatile:
        return "Volatile";
    case AdmissionResult::LowVolume:
        return "LowVolume";
    case AdmissionResult::Delayed:
        return "Delayed";
    case AdmissionResult::UnknownPosition:
        return "UnknownPosition";
    case AdmissionResult::InvalidRequest:
        return "InvalidRequest";
    default:
        return "Unknown";
    }
}

struct AdmissionRequest {
    OrderIntent intent = OrderIntent::Entry;
    InstrumentId instrument;
    Category category;
    Side side = Side::Long;

    // Entry / AddOn
    double stake = 0;
    ReservationId reservation = INVALID_RESERVATION;

    // Exit
    ExitReason exit_reason = ExitReason::None;
    double profit_ratio = 0;

    const market::InstrumentSnapshot* snapshot = nullptr; // Market-condition checks; may be null
    market::MarketContext market;
};

/**
 * AdmissionGate - final accept/reject before an order is committed
 *
 * Runs entirely under the caller's portfolio Transaction: the checks and
 * the resulting registry/ledger update are one atomic step. On Accepted:
 *   Entry  -> reservation committed, position registered
 *   AddOn  -> reservation committed, stake added
 *   Exit   -> position removed, its reservations released
 * On rejection nothing changes; releasing the pending reservation stays
 * with the caller's ReservationGuard.
 */
class AdmissionGate {
public:
    explicit AdmissionGate(const AdmissionConfig& config = AdmissionConfig(), logging::AsyncLogger* logger = nullptr)
        : config_(config), logger_(logger) {}

    AdmissionResult admit(const AdmissionRequest& request, portfolio::PortfolioState::Transaction& txn) const;

    // Exit rule alone, without touching state
    AdmissionResult check_exit(const AdmissionRequest& request) const;

    const AdmissionConfig& config() const { return config_; }

private:
    AdmissionConfig config_;
    logging::AsyncLogger* logger_;

    AdmissionResult check_entry(const AdmissionRequest& request, portfolio::PortfolioState::Transaction& txn) const;
    AdmissionResult check_market(const AdmissionRequest& request) const;
    void log_result(const AdmissionRequest& request, AdmissionResult result) const;
};

} // namespace risk
} // namespace rme
