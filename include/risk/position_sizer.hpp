#pragma once

#include "../config/defaults.hpp"
#include "../types.hpp"
#include "risk_budget_ledger.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace rme {
namespace risk {

/**
 * SizingConfig - stake computation bounds
 *
 * Fractions are of total capital.
 */
struct SizingConfig {
    double base_fraction = config::sizing::BASE_FRACTION_PCT;
    double max_order_fraction = config::sizing::MAX_ORDER_FRACTION_PCT; // Hard per-order ceiling
    double min_stake = config::sizing::MIN_STAKE;
    double max_stake = config::sizing::MAX_STAKE;

    // Volatility multiplier = clamp(reference / volatility, min, max)
    double reference_volatility = config::sizing::REFERENCE_VOLATILITY;
    double min_volatility_multiplier = config::sizing::MIN_VOLATILITY_MULTIPLIER;
    double max_volatility_multiplier = config::sizing::MAX_VOLATILITY_MULTIPLIER;

    double risk_per_trade = config::sizing::RISK_PER_TRADE_PCT;
    double assumed_adverse_move = config::sizing::ASSUMED_ADVERSE_MOVE_PCT; // Risk = stake * this

    bool allow_reduced = true; // Shrink to the remaining budget instead of declining
};

enum class OrderKind : uint8_t { Initial = 0, Ladder, Rebalance };

inline const char* order_kind_to_string(OrderKind kind) {
    switch (kind) {
    case OrderKind::Initial:
        return "initial";
    case OrderKind::Ladder:
        return "ladder";
    case OrderKind::Rebalance:
        return "rebalance";
    default:
        return "unknown";
    }
}

struct SizingRequest {
    InstrumentId instrument;
    Category category;
    OrderKind kind = OrderKind::Initial;
    size_t ladder_level = 0;
    double level_multiplier = 1.0;           // Ladder orders only
    std::optional<double> volatility;        // Recent volatility estimate
    std::optional<double> max_stake;         // Caller bound, tighter than config
    std::optional<double> requested_stake;   // Rebalance: amount to move instead of base
};

enum class SizeOutcome : uint8_t {
    Full = 0, // Computed stake reserved
    Reduced,  // Shrunk to the remaining budget
    Declined  // No order
};

inline const char* size_outcome_to_string(SizeOutcome outcome) {
    switch (outcome) {
    case SizeOutcome::Full:
        return "Full";
    case SizeOutcome::Reduced:
        return "Reduced";
    case SizeOutcome::Declined:
        return "Declined";
    default:
        return "Unknown";
    }
}

enum class DeclineReason : uint8_t {
    None = 0,
    BudgetExceeded,  // Ledger denied, no reduced amount fits
    BelowMinimum,    // Bounds leave nothing >= min_stake
    DegenerateInput  // Zero capital, bad multiplier
};

inline const char* decline_reason_to_string(DeclineReason reason) {
    switch (reason) {
    case DeclineReason::None:
        return "None";
    case DeclineReason::BudgetExceeded:
        return "BudgetExceeded";
    case DeclineReason::BelowMinimum:
        return "BelowMinimum";
    case DeclineReason::DegenerateInput:
        return "DegenerateInput";
    default:
        return "Unknown";
    }
}

/**
 * A non-declined result holds a pending reservation that the caller must
 * either commit (through the admission gate) or release.
 */
struct SizingResult {
    SizeOutcome outcome = SizeOutcome::Declined;
    DeclineReason reason = DeclineReason::None;
    double stake = 0;
    double risk = 0;
    Reservation reservation;

    bool ok() const { return outcome != SizeOutcome::Declined; }

    static SizingResult declined(DeclineReason reason) {
        SizingResult r;
        r.reason = reason;
        return r;
    }
};

/**
 * PositionSizer
 *
 *   stake = capital * base_fraction * vol_multiplier * level_multiplier
 *   clamped to [min_stake, min(max_stake, capital * max_order_fraction,
 *                                capital * risk_per_trade / adverse_move)]
 *   risk  = stake * assumed_adverse_move   (reserved in the ledger)
 */
class PositionSizer {
public:
    explicit PositionSizer(const SizingConfig& config = SizingConfig()) : config_(config) {}

    SizingResult size(const SizingRequest& request, RiskBudgetLedger& ledger) const {
        const double capital = ledger.total_capital();
        if (capital <= 0 || !std::isfinite(request.level_multiplier) || request.level_multiplier <= 0)
            return SizingResult::declined(DeclineReason::DegenerateInput);

        double upper = upper_bound(request, capital);
        if (upper < config_.min_stake)
            return SizingResult::declined(DeclineReason::BelowMinimum);

        double stake = std::clamp(target_stake(request, capital), config_.min_stake, upper);

        SizingResult result;
        result.stake = stake;
        result.risk = stake * config_.assumed_adverse_move;
        result.reservation = ledger.reserve(result.risk, request.category, request.instrument);
        if (result.reservation.granted()) {
            result.outcome = SizeOutcome::Full;
            return result;
        }

        if (!config_.allow_reduced || result.reservation.result != ReserveResult::InsufficientBudget)
            return SizingResult::declined(DeclineReason::BudgetExceeded);

        // Shrink to what is left; a concurrent caller may take it first
        double reduced = std::min(ledger.available() / config_.assumed_adverse_move, stake);
        if (reduced < config_.min_stake)
            return SizingResult::declined(DeclineReason::BudgetExceeded);

        result.stake = reduced;
        result.risk = reduced * config_.assumed_adverse_move;
        result.reservation = ledger.reserve(result.risk, request.category, request.instrument);
        if (!result.reservation.granted())
            return SizingResult::declined(DeclineReason::BudgetExceeded);

        result.outcome = SizeOutcome::Reduced;
        return result;
    }

    double volatility_multiplier(std::optional<double> volatility) const {
        if (!volatility || !std::isfinite(*volatility) || *volatility <= 0)
            return 1.0;
        return std::clamp(config_.reference_volatility / *volatility, config_.min_volatility_multiplier,
                          config_.max_volatility_multiplier);
    }

    double target_stake(const SizingRequest& request, double capital) const {
        if (request.requested_stake)
            return *request.requested_stake;
        double multiplier = request.kind == OrderKind::Ladder ? request.level_multiplier : 1.0;
        return capital * config_.base_fraction * volatility_multiplier(request.volatility) * multiplier;
    }

    double upper_bound(const SizingRequest& request, double capital) const {
        double upper = std::min(config_.max_stake, capital * config_.max_order_fraction);
        if (config_.assumed_adverse_move > 0)
            upper = std::min(upper, capital * config_.risk_per_trade / config_.assumed_adverse_move);
        if (request.max_stake)
            upper = std::min(upper, *request.max_stake);
        return upper;
    }

    const SizingConfig& config() const { return config_; }

private:
    SizingConfig config_;
};

} // namespace risk
} // namespace rme
