#include "../../include/config/engine_config.hpp"

#include <cmath>
#include <set>

namespace rme::config {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition)
        throw ConfigError(message);
}

// Fractions live in (0, 1]
void require_fraction(double value, const std::string& field) {
    require(std::isfinite(value) && value > 0.0 && value <= 1.0, field + " must be in (0, 1], got " +
                                                                     std::to_string(value));
}

void require_non_negative(double value, const std::string& field) {
    require(std::isfinite(value) && value >= 0.0, field + " must be >= 0, got " + std::to_string(value));
}

void validate_families(const std::vector<strategy::PredicateFamily>& families, const std::string& section) {
    std::set<std::string> tags;
    for (const auto& family : families) {
        require(!family.tag.empty(), section + ": predicate family without tag");
        require(tags.insert(family.tag).second, section + ": duplicate tag '" + family.tag + "'");
        require(!family.all_of.empty(), section + ": family '" + family.tag + "' has no conditions");
        for (const auto& cond : family.all_of) {
            require(!cond.lhs.empty(), section + ": family '" + family.tag + "' has a condition without lhs");
        }
    }
}

/**
 * Walks the ladder in units of the entry price, each level filling exactly at
 * its trigger with stake proportional to its multiplier. The stop price never
 * moves below the floor stop set at entry, so every level has to fill on the
 * safe side of it.
 */
void validate_ladder_reachable(const risk::LadderConfig& ladder, double static_floor, Side side) {
    const double sign = side_sign(side);
    const double stop = 1.0 - sign * static_floor;
    double stake = 1.0;
    double quantity = 1.0;
    for (size_t i = 0; i < ladder.levels.size(); ++i) {
        const auto& level = ladder.levels[i];
        double price = (stake / quantity) * (1.0 + sign * level.trigger);
        require(sign * (price - stop) > 0, "ladder.levels[" + std::to_string(i) + "].trigger is not reached before the " +
                                               side_to_string(side) + " stop at stop_loss.static_floor");
        stake += level.multiplier;
        quantity += level.multiplier / price;
    }
}

} // namespace

void EngineConfig::validate() const {
    // Regime
    require(regime.range_threshold <= regime.trend_threshold,
            "regime.range_threshold must not exceed regime.trend_threshold");
    require(!regime.trend_key.empty(), "regime.trend_key must not be empty");

    // Signals
    require(!signal.entry_families.empty(), "signal.entry_families must not be empty");
    validate_families(signal.entry_families, "signal.entry_families");
    validate_families(signal.exit_families, "signal.exit_families");
    for (size_t i = 0; i < signal.roi_table.size(); ++i) {
        require_non_negative(signal.roi_table[i].minutes, "signal.roi.minutes");
        if (i > 0)
            require(signal.roi_table[i].minutes > signal.roi_table[i - 1].minutes,
                    "signal.roi rows must be strictly ascending by minutes");
    }

    // Stop loss
    require_fraction(stop_loss.static_floor, "stop_loss.static_floor");
    require_non_negative(stop_loss.atr_multiplier, "stop_loss.atr_multiplier");
    require_fraction(stop_loss.max_volatility_distance, "stop_loss.max_volatility_distance");
    require(stop_loss.decay_hours > 0, "stop_loss.decay_hours must be > 0");
    require_fraction(stop_loss.min_time_factor, "stop_loss.min_time_factor");
    require_non_negative(stop_loss.trailing_activation, "stop_loss.trailing_activation");
    require_fraction(stop_loss.trailing_start_distance, "stop_loss.trailing_start_distance");
    require_fraction(stop_loss.trailing_min_distance, "stop_loss.trailing_min_distance");
    require(stop_loss.trailing_min_distance <= stop_loss.trailing_start_distance,
            "stop_loss.trailing_min_distance must not exceed trailing_start_distance");
    require(stop_loss.trailing_full_profit > 0, "stop_loss.trailing_full_profit must be > 0");

    // Sizing
    require_fraction(sizing.base_fraction, "sizing.base_fraction");
    require_fraction(sizing.max_order_fraction, "sizing.max_order_fraction");
    require_non_negative(sizing.min_stake, "sizing.min_stake");
    require(sizing.min_stake <= sizing.max_stake, "sizing.min_stake must not exceed sizing.max_stake");
    require(sizing.reference_volatility > 0, "sizing.reference_volatility must be > 0");
    require(sizing.min_volatility_multiplier > 0 &&
                sizing.min_volatility_multiplier <= sizing.max_volatility_multiplier,
            "sizing volatility multiplier bounds must satisfy 0 < min <= max");
    require_fraction(sizing.risk_per_trade, "sizing.risk_per_trade");
    require_fraction(sizing.assumed_adverse_move, "sizing.assumed_adverse_move");

    // Ladder: strictly more severe triggers, strictly larger multipliers
    require(ladder.levels.size() <= config::ladder::MAX_LEVELS,
            "ladder.levels must have at most " + std::to_string(config::ladder::MAX_LEVELS) + " entries");
    for (size_t i = 0; i < ladder.levels.size(); ++i) {
        const auto& level = ladder.levels[i];
        std::string name = "ladder.levels[" + std::to_string(i) + "]";
        require(std::isfinite(level.trigger) && level.trigger < 0, name + ".trigger must be negative");
        require(std::isfinite(level.multiplier) && level.multiplier > 0, name + ".multiplier must be > 0");
        if (i > 0) {
            require(level.trigger < ladder.levels[i - 1].trigger,
                    name + ".trigger must be more severe than the previous level");
            require(level.multiplier > ladder.levels[i - 1].multiplier,
                    name + ".multiplier must be larger than the previous level");
        }
    }
    if (ladder.enabled) {
        validate_ladder_reachable(ladder, stop_loss.static_floor, Side::Long);
        if (signal.allow_short)
            validate_ladder_reachable(ladder, stop_loss.static_floor, Side::Short);
    }
    require_fraction(ladder.max_position_allocation, "ladder.max_position_allocation");
    require_non_negative(ladder.min_spacing_sec, "ladder.min_spacing_sec");
    require_non_negative(ladder.max_limit_discount, "ladder.max_limit_discount");

    // Rebalance
    double target_sum = 0;
    for (const auto& [category, target] : rebalance.targets) {
        require(!category.empty(), "rebalance.targets has an empty category");
        require(std::isfinite(target) && target >= 0 && target <= 1.0,
                "rebalance.targets." + category + " must be in [0, 1]");
        target_sum += target;
    }
    require(target_sum <= 1.0 + 1e-9, "rebalance.targets sum to more than 1");
    require_fraction(rebalance.threshold, "rebalance.threshold");
    require_non_negative(rebalance.min_amount, "rebalance.min_amount");
    require(rebalance.max_volatility > 0, "rebalance.max_volatility must be > 0");
    require_non_negative(rebalance.min_volume_ratio, "rebalance.min_volume_ratio");
    require_non_negative(rebalance.interval_sec, "rebalance.interval_sec");

    // Admission
    require(admission.max_open_positions > 0, "admission.max_open_positions must be > 0");
    require_fraction(admission.max_category_fraction, "admission.max_category_fraction");
    for (const auto& [category, ceiling] : admission.category_ceilings)
        require_fraction(ceiling, "admission.category_ceilings." + category);
    require_non_negative(admission.max_spread, "admission.max_spread");
    require_non_negative(admission.min_profit_for_exit, "admission.min_profit_for_exit");

    // Ledger
    require_fraction(ledger.max_total_risk, "ledger.max_total_risk");

    require(!cash_category.empty(), "cash_category must not be empty");
}

} // namespace rme::config
