#pragma once

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "../strategy/regime_classifier.hpp"
#include "../types.hpp"
#include "portfolio_state.hpp"

#include <atomic>
#include <map>
#include <optional>
#include <vector>

namespace rme {
namespace portfolio {

struct RebalanceConfig {
    bool enabled = true;
    std::map<Category, double> targets; // Fractions of total capital, sum <= 1
    double threshold = config::rebalance::THRESHOLD_PCT;
    double min_amount = config::rebalance::MIN_AMOUNT;
    double max_volatility = config::rebalance::MAX_PORTFOLIO_VOLATILITY;
    double min_volume_ratio = config::rebalance::MIN_VOLUME_RATIO;
    double interval_sec = config::rebalance::INTERVAL_SEC;

    static RebalanceConfig defaults() {
        RebalanceConfig cfg;
        cfg.targets = {{"btc", config::rebalance::TARGET_BTC},
                       {"eth", config::rebalance::TARGET_ETH},
                       {"alt", config::rebalance::TARGET_ALT},
                       {"stable", config::rebalance::TARGET_STABLE},
                       {"other", config::rebalance::TARGET_OTHER}};
        return cfg;
    }
};

/**
 * Market conditions for a category, as seen by the caller this cycle.
 */
struct CategoryView {
    strategy::Regime regime = strategy::Regime::Uncertain;
    std::optional<double> volatility;
    std::optional<double> volume_ratio;
};

struct CategoryAllocation {
    Category category;
    double current_value = 0;
    double current_fraction = 0;
    double target = 0;
    double drift = 0; // |current_fraction - target|
};

enum class RebalanceDirection : uint8_t { Increase = 0, Decrease };

inline const char* rebalance_direction_to_string(RebalanceDirection direction) {
    return direction == RebalanceDirection::Increase ? "increase" : "decrease";
}

enum class RebalanceReason : uint8_t {
    UnderTarget = 0,
    OverTarget
};

inline const char* rebalance_reason_to_string(RebalanceReason reason) {
    return reason == RebalanceReason::UnderTarget ? "under_target" : "over_target";
}

enum class RebalanceSkip : uint8_t {
    None = 0,
    BelowThreshold,
    BelowMinAmount,
    Downtrend,      // Increase into a falling category
    HighVolatility,
    LowVolume,
    DataUnavailable // No market view for the category
};

inline const char* rebalance_skip_to_string(RebalanceSkip skip) {
    switch (skip) {
    case RebalanceSkip::None:
        return "None";
    case RebalanceSkip::BelowThreshold:
        return "BelowThreshold";
    case RebalanceSkip::BelowMinAmount:
        return "BelowMinAmount";
    case RebalanceSkip::Downtrend:
        return "Downtrend";
    case RebalanceSkip::HighVolatility:
        return "HighVolatility";
    case RebalanceSkip::LowVolume:
        return "LowVolume";
    case RebalanceSkip::DataUnavailable:
        return "DataUnavailable";
    default:
        return "Unknown";
    }
}

/**
 * Ephemeral: consumed by DecisionEngine::evaluate_rebalance, then discarded.
 */
struct RebalanceProposal {
    Category category;
    RebalanceDirection direction = RebalanceDirection::Increase;
    double amount = 0;
    RebalanceReason reason = RebalanceReason::UnderTarget;
    double drift = 0;
};

/**
 * Rebalancer - category allocation drift correction
 *
 * Runs on its own cadence (interval_sec), not per tick. Reads allocations
 * under the portfolio Transaction, the same lock entries take. Proposals
 * carry no privilege: they pass through the admission gate like any
 * organic order. The cash category is never proposed directly; it moves
 * as a side effect of the others.
 */
class Rebalancer {
public:
    explicit Rebalancer(const RebalanceConfig& config = RebalanceConfig::defaults(),
                        logging::AsyncLogger* logger = nullptr)
        : config_(config), logger_(logger) {}

    bool due(Timestamp now) const;

    // Marks the run time; returns nothing when not due or disabled
    std::vector<RebalanceProposal> run(PortfolioState& portfolio, const std::map<Category, CategoryView>& views,
                                       Timestamp now);

    std::vector<CategoryAllocation> allocations(const PortfolioState::Transaction& txn) const;

    // Drift and market gates for one category; None means propose
    RebalanceSkip check(const CategoryAllocation& allocation, double total_value,
                        const std::map<Category, CategoryView>& views) const;

    std::optional<Timestamp> last_run() const;
    const RebalanceConfig& config() const { return config_; }

private:
    RebalanceConfig config_;
    logging::AsyncLogger* logger_;
    std::atomic<bool> has_run_{false};
    std::atomic<Timestamp> last_run_{0};
};

} // namespace portfolio
} // namespace rme
