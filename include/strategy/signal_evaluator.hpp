#pragma once

/**
 * SignalEvaluator - declarative entry/exit predicates
 *
 * Strategy variants differ only in their thresholds, so the rules live in a
 * table of predicate families instead of code. A family fires when the
 * regime is one it allows and every condition holds. Entry is the OR over
 * the entry families; exit families are evaluated independently for the
 * open position's side, followed by the take-profit (ROI) schedule.
 *
 * A condition that reads a missing indicator is false.
 */

#include "../config/defaults.hpp"
#include "../market/instrument_snapshot.hpp"
#include "../types.hpp"
#include "regime_classifier.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace rme {
namespace strategy {

// =============================================================================
// Predicate Table
// =============================================================================

enum class CompareOp : uint8_t {
    Gt,
    Lt,
    Ge,
    Le,
    CrossesAbove, // prev lhs <= prev rhs && lhs > rhs
    CrossesBelow  // prev lhs >= prev rhs && lhs < rhs
};

inline const char* compare_op_to_string(CompareOp op) {
    switch (op) {
    case CompareOp::Gt:
        return ">";
    case CompareOp::Lt:
        return "<";
    case CompareOp::Ge:
        return ">=";
    case CompareOp::Le:
        return "<=";
    case CompareOp::CrossesAbove:
        return "crosses_above";
    case CompareOp::CrossesBelow:
        return "crosses_below";
    default:
        return "?";
    }
}

/**
 * One comparison: lhs <op> (rhs_key ? snapshot[rhs_key] : rhs_value) * rhs_scale
 */
struct Condition {
    std::string lhs;
    CompareOp op = CompareOp::Gt;
    std::string rhs_key; // Empty: compare against rhs_value
    double rhs_value = 0.0;
    double rhs_scale = 1.0;

    static Condition against_value(std::string lhs, CompareOp op, double value) {
        return Condition{std::move(lhs), op, "", value, 1.0};
    }

    static Condition against_key(std::string lhs, CompareOp op, std::string rhs, double scale = 1.0) {
        return Condition{std::move(lhs), op, std::move(rhs), 0.0, scale};
    }
};

struct PredicateFamily {
    std::string tag;
    Side side = Side::Long;
    std::vector<Regime> regimes; // Empty: any regime
    std::vector<Condition> all_of;

    bool allows(Regime regime) const {
        return regimes.empty() || std::find(regimes.begin(), regimes.end(), regime) != regimes.end();
    }
};

/**
 * Take-profit schedule row: after `minutes` open, exit at `min_profit`
 */
struct RoiStep {
    double minutes = 0.0;
    double min_profit = 0.0;
};

struct SignalConfig {
    std::vector<PredicateFamily> entry_families;
    std::vector<PredicateFamily> exit_families;
    std::vector<RoiStep> roi_table; // Ascending by minutes; empty disables
    bool allow_short = false;

    static SignalConfig defaults();
};

// =============================================================================
// Evaluation
// =============================================================================

/**
 * Position context for one evaluation. No position: entry only.
 */
struct SignalContext {
    std::optional<Side> position_side;
    double profit_ratio = 0.0;
    double minutes_open = 0.0;
};

struct SignalDecision {
    bool enter = false;
    Side enter_side = Side::Long;
    std::string enter_tag;

    bool exit = false;
    std::string exit_tag;
    ExitReason exit_reason = ExitReason::None;
};

class SignalEvaluator {
public:
    explicit SignalEvaluator(const SignalConfig& config = SignalConfig::defaults()) : config_(config) {}

    SignalDecision evaluate(Regime regime, const market::InstrumentSnapshot& snapshot,
                            const SignalContext& context = SignalContext()) const {
        SignalDecision decision;

        for (const auto& family : config_.entry_families) {
            if (family.side == Side::Short && !config_.allow_short)
                continue;
            if (matches(family, regime, snapshot)) {
                decision.enter = true;
                decision.enter_side = family.side;
                decision.enter_tag = family.tag;
                break;
            }
        }

        if (!context.position_side)
            return decision;

        for (const auto& family : config_.exit_families) {
            if (family.side != *context.position_side)
                continue;
            if (matches(family, regime, snapshot)) {
                decision.exit = true;
                decision.exit_tag = family.tag;
                decision.exit_reason = ExitReason::Signal;
                return decision;
            }
        }

        auto target = roi_target(context.minutes_open);
        if (target && context.profit_ratio >= *target) {
            decision.exit = true;
            decision.exit_tag = exit_reason_to_string(ExitReason::Roi);
            decision.exit_reason = ExitReason::Roi;
        }

        return decision;
    }

    /**
     * Minimum profit the take-profit schedule demands at this age.
     * nullopt when the table is empty or the first row is not yet reached.
     */
    std::optional<double> roi_target(double minutes_open) const {
        std::optional<double> target;
        for (const auto& step : config_.roi_table) {
            if (minutes_open >= step.minutes)
                target = step.min_profit;
        }
        return target;
    }

    static bool check(const Condition& cond, const market::InstrumentSnapshot& snapshot) {
        auto lhs = snapshot.get(cond.lhs);
        if (!lhs)
            return false;

        std::optional<double> rhs;
        if (cond.rhs_key.empty()) {
            rhs = cond.rhs_value;
        } else {
            rhs = snapshot.get(cond.rhs_key);
        }
        if (!rhs)
            return false;
        double rhs_now = *rhs * cond.rhs_scale;

        switch (cond.op) {
        case CompareOp::Gt:
            return *lhs > rhs_now;
        case CompareOp::Lt:
            return *lhs < rhs_now;
        case CompareOp::Ge:
            return *lhs >= rhs_now;
        case CompareOp::Le:
            return *lhs <= rhs_now;
        case CompareOp::CrossesAbove:
        case CompareOp::CrossesBelow: {
            auto lhs_prev = snapshot.previous(cond.lhs);
            std::optional<double> rhs_prev = cond.rhs_key.empty() ? std::optional<double>(cond.rhs_value)
                                                                  : snapshot.previous(cond.rhs_key);
            if (!lhs_prev || !rhs_prev)
                return false;
            double rhs_before = *rhs_prev * cond.rhs_scale;
            if (cond.op == CompareOp::CrossesAbove)
                return *lhs_prev <= rhs_before && *lhs > rhs_now;
            return *lhs_prev >= rhs_before && *lhs < rhs_now;
        }
        }
        return false;
    }

    const SignalConfig& config() const { return config_; }

private:
    SignalConfig config_;

    static bool matches(const PredicateFamily& family, Regime regime, const market::InstrumentSnapshot& snapshot) {
        if (!family.allows(regime) || family.all_of.empty())
            return false;
        return std::all_of(family.all_of.begin(), family.all_of.end(),
                           [&](const Condition& c) { return check(c, snapshot); });
    }
};

// =============================================================================
// Default predicate table
// =============================================================================

inline SignalConfig SignalConfig::defaults() {
    namespace k = market::keys;
    namespace d = config::signal;
    using C = Condition;

    SignalConfig cfg;

    // Trend following: regime agrees, MACD cross confirms, EMA stack and volume agree
    cfg.entry_families.push_back({"trend_following_long",
                                  Side::Long,
                                  {Regime::Uptrend},
                                  {C::against_key(k::MACD, CompareOp::CrossesAbove, k::MACD_SIGNAL),
                                   C::against_key(k::EMA_FAST, CompareOp::Gt, k::EMA_SLOW),
                                   C::against_value(k::VOLUME_RATIO, CompareOp::Gt, d::VOLUME_CONFIRM_RATIO)}});
    cfg.entry_families.push_back({"trend_following_short",
                                  Side::Short,
                                  {Regime::Downtrend},
                                  {C::against_key(k::MACD, CompareOp::CrossesBelow, k::MACD_SIGNAL),
                                   C::against_key(k::EMA_FAST, CompareOp::Lt, k::EMA_SLOW),
                                   C::against_value(k::VOLUME_RATIO, CompareOp::Gt, d::VOLUME_CONFIRM_RATIO)}});

    // Mean reversion: ranging market, oscillator turns out of an extreme at a band edge
    cfg.entry_families.push_back({"mean_reversion_long",
                                  Side::Long,
                                  {Regime::Range},
                                  {C::against_value(k::STOCH_K, CompareOp::Lt, d::STOCH_OVERSOLD),
                                   C::against_key(k::STOCH_K, CompareOp::CrossesAbove, k::STOCH_D),
                                   C::against_key(k::CLOSE, CompareOp::Lt, k::BB_LOWER, d::BB_LOWER_TOUCH)}});
    cfg.entry_families.push_back({"mean_reversion_short",
                                  Side::Short,
                                  {Regime::Range},
                                  {C::against_value(k::STOCH_K, CompareOp::Gt, d::STOCH_OVERBOUGHT),
                                   C::against_key(k::STOCH_K, CompareOp::CrossesBelow, k::STOCH_D),
                                   C::against_key(k::CLOSE, CompareOp::Gt, k::BB_UPPER, d::BB_UPPER_TOUCH)}});

    cfg.exit_families.push_back(
        {"exit_macd_cross", Side::Long, {}, {C::against_key(k::MACD, CompareOp::CrossesBelow, k::MACD_SIGNAL)}});
    cfg.exit_families.push_back({"exit_stoch_ob",
                                 Side::Long,
                                 {},
                                 {C::against_value(k::STOCH_K, CompareOp::Gt, d::STOCH_EXIT_OVERBOUGHT),
                                  C::against_key(k::STOCH_K, CompareOp::CrossesBelow, k::STOCH_D)}});
    cfg.exit_families.push_back({"exit_overbought",
                                 Side::Long,
                                 {},
                                 {C::against_value(k::RSI, CompareOp::Gt, d::RSI_EXIT_OVERBOUGHT),
                                  C::against_value(k::BB_POSITION, CompareOp::Gt, d::BB_POSITION_EXIT_HIGH)}});
    cfg.exit_families.push_back({"exit_macd_cross_short",
                                 Side::Short,
                                 {},
                                 {C::against_key(k::MACD, CompareOp::CrossesAbove, k::MACD_SIGNAL)}});
    cfg.exit_families.push_back({"exit_stoch_os_short",
                                 Side::Short,
                                 {},
                                 {C::against_value(k::STOCH_K, CompareOp::Lt, d::STOCH_EXIT_OVERSOLD),
                                  C::against_key(k::STOCH_K, CompareOp::CrossesAbove, k::STOCH_D)}});
    cfg.exit_families.push_back({"exit_oversold_short",
                                 Side::Short,
                                 {},
                                 {C::against_value(k::RSI, CompareOp::Lt, d::RSI_EXIT_OVERSOLD),
                                  C::against_value(k::BB_POSITION, CompareOp::Lt, d::BB_POSITION_EXIT_LOW)}});

    for (size_t i = 0; i < std::size(d::ROI_MINUTES); ++i) {
        cfg.roi_table.push_back({d::ROI_MINUTES[i], d::ROI_PROFITS[i]});
    }

    return cfg;
}

} // namespace strategy
} // namespace rme
