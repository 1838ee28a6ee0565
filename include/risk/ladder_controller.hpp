#pragma once

/**
 * LadderController - DCA averaging on losing positions
 *
 * Per-position state lives in Position::ladder. Levels are ordered from the
 * least to the most severe loss and fire strictly in that order, each at
 * most once, never sooner than min_spacing after the previous fill, and
 * never past the position's maximum allocation.
 */

#include "../config/defaults.hpp"
#include "../portfolio/position.hpp"
#include "../types.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <optional>
#include <vector>

namespace rme {
namespace risk {

static_assert(config::ladder::MAX_LEVELS <= 256, "ladder level index must fit FillTag::level");

struct LadderLevel {
    double trigger = 0;      // Profit ratio at or below which the level fires (negative)
    double multiplier = 1.0; // Applied on top of the base stake
};

struct LadderConfig {
    bool enabled = true;
    std::vector<LadderLevel> levels;
    double max_position_allocation = config::ladder::MAX_POSITION_ALLOCATION_PCT; // Of capital
    double min_spacing_sec = config::ladder::MIN_SPACING_SEC;

    // Limit price hint: min(max_limit_discount, atr_discount_factor * atr / price)
    double max_limit_discount = config::ladder::MAX_LIMIT_DISCOUNT_PCT;
    double atr_discount_factor = config::ladder::ATR_DISCOUNT_FACTOR;

    static LadderConfig defaults() {
        LadderConfig cfg;
        for (size_t i = 0; i < std::size(config::ladder::TRIGGERS); ++i) {
            cfg.levels.push_back({config::ladder::TRIGGERS[i], config::ladder::MULTIPLIERS[i]});
        }
        return cfg;
    }
};

enum class LadderBlock : uint8_t {
    None = 0,
    Disabled,
    Exhausted,
    AboveTrigger,      // Loss not yet deep enough for the next level
    SpacingNotElapsed, // Too soon after the last fill
    AllocationCap,     // No room under max_position_allocation
    DegenerateInput    // Zero capital
};

inline const char* ladder_block_to_string(LadderBlock block) {
    switch (block) {
    case LadderBlock::None:
        return "None";
    case LadderBlock::Disabled:
        return "Disabled";
    case LadderBlock::Exhausted:
        return "Exhausted";
    case LadderBlock::AboveTrigger:
        return "AboveTrigger";
    case LadderBlock::SpacingNotElapsed:
        return "SpacingNotElapsed";
    case LadderBlock::AllocationCap:
        return "AllocationCap";
    case LadderBlock::DegenerateInput:
        return "DegenerateInput";
    default:
        return "Unknown";
    }
}

/**
 * LevelTriggered(n) is transient: the candidate is handed to sizing and the
 * gate, and only an admitted fill advances the ladder via on_fill().
 */
struct LadderCandidate {
    bool fire = false;
    size_t level = 0;
    double multiplier = 1.0;
    double max_stake = 0; // Allocation headroom for this order
    LadderBlock blocked = LadderBlock::None;

    static LadderCandidate block(LadderBlock reason) {
        LadderCandidate c;
        c.blocked = reason;
        return c;
    }
};

class LadderController {
public:
    explicit LadderController(const LadderConfig& config = LadderConfig::defaults()) : config_(config) {}

    LadderCandidate evaluate(const portfolio::Position& position, double profit_ratio, Timestamp now,
                             double total_capital, double min_stake) const {
        if (!config_.enabled || config_.levels.empty())
            return LadderCandidate::block(LadderBlock::Disabled);

        const auto& state = position.ladder;
        size_t level = state.next_level();
        if (level >= config_.levels.size() || state.phase() == portfolio::LadderPhase::Exhausted)
            return LadderCandidate::block(LadderBlock::Exhausted);

        if (total_capital <= 0)
            return LadderCandidate::block(LadderBlock::DegenerateInput);

        if (profit_ratio > config_.levels[level].trigger)
            return LadderCandidate::block(LadderBlock::AboveTrigger);

        Timestamp spacing = seconds_to_ns(config_.min_spacing_sec);
        if (now < state.last_fill_ts || now - state.last_fill_ts < spacing)
            return LadderCandidate::block(LadderBlock::SpacingNotElapsed);

        double headroom = config_.max_position_allocation * total_capital - position.stake();
        if (headroom < min_stake || headroom <= 0)
            return LadderCandidate::block(LadderBlock::AllocationCap);

        LadderCandidate c;
        c.fire = true;
        c.level = level;
        c.multiplier = config_.levels[level].multiplier;
        c.max_stake = headroom;
        return c;
    }

    /**
     * Record an admitted ladder fill. Only the next level in order is accepted.
     */
    bool on_fill(portfolio::LadderState& state, size_t level, Timestamp now) const {
        if (level != state.next_level() || level >= config_.levels.size())
            return false;
        state.levels_used = level + 1;
        state.last_fill_ts = now;
        return true;
    }

    /**
     * Suggested limit price for a ladder order, discounted in the position's favor.
     */
    double limit_price(Side side, double price, std::optional<double> atr) const {
        double discount = config_.max_limit_discount;
        if (atr && *atr > 0 && price > 0)
            discount = std::min(discount, config_.atr_discount_factor * *atr / price);
        return side == Side::Long ? price * (1.0 - discount) : price * (1.0 + discount);
    }

    size_t level_count() const { return config_.levels.size(); }
    const LadderConfig& config() const { return config_; }

private:
    LadderConfig config_;
};

} // namespace risk
} // namespace rme
