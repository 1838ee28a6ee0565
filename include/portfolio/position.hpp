#pragma once

#include "../types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace rme {
namespace portfolio {

// =============================================================================
// Fill
// =============================================================================

enum class FillKind : uint8_t { Initial = 0, Ladder, Rebalance };

struct FillTag {
    FillKind kind = FillKind::Initial;
    uint8_t level = 0; // Ladder level index, Ladder fills only

    static FillTag initial() { return FillTag{FillKind::Initial, 0}; }
    static FillTag ladder(size_t level) { return FillTag{FillKind::Ladder, static_cast<uint8_t>(level)}; }
    static FillTag rebalance() { return FillTag{FillKind::Rebalance, 0}; }

    std::string to_string() const {
        switch (kind) {
        case FillKind::Initial:
            return "initial";
        case FillKind::Ladder:
            return "ladder_" + std::to_string(level + 1);
        case FillKind::Rebalance:
            return "rebalance";
        }
        return "unknown";
    }
};

/**
 * One executed order. `size` is the capital committed (stake), not units.
 */
struct Fill {
    double size = 0;
    double price = 0;
    Timestamp ts = 0;
    FillTag tag;

    double quantity() const { return price > 0 ? size / price : 0.0; }
};

// =============================================================================
// DCA Ladder State
// =============================================================================

enum class LadderPhase : uint8_t { Idle = 0, Exhausted };

inline const char* ladder_phase_to_string(LadderPhase phase) {
    return phase == LadderPhase::Idle ? "IDLE" : "EXHAUSTED";
}

/**
 * Levels fire strictly in order, so the used set is always a prefix:
 * levels [0, levels_used) have fired, level `levels_used` is next.
 */
struct LadderState {
    size_t level_count = 0;
    size_t levels_used = 0;
    Timestamp last_fill_ts = 0;

    LadderPhase phase() const { return levels_used >= level_count ? LadderPhase::Exhausted : LadderPhase::Idle; }
    bool used(size_t level) const { return level < levels_used; }
    size_t next_level() const { return levels_used; }
};

// =============================================================================
// Position
// =============================================================================

/**
 * Position - one open position, owned by its instrument's pipeline
 *
 * Created when an entry is admitted, grown by ladder/rebalance fills,
 * dropped by the owner when an exit is admitted.
 */
struct Position {
    InstrumentId instrument;
    Category category;
    Side side = Side::Long;
    Timestamp opened_at = 0;

    std::vector<Fill> fills;
    std::optional<double> stop_offset; // Last returned stop, offset from average price
    double best_price = 0;             // Most favorable price seen (high for long, low for short)
    LadderState ladder;

    static Position open(const InstrumentId& instrument, const Category& category, Side side, const Fill& fill,
                         size_t ladder_levels) {
        Position pos;
        pos.instrument = instrument;
        pos.category = category;
        pos.side = side;
        pos.opened_at = fill.ts;
        pos.fills.push_back(fill);
        pos.best_price = fill.price;
        pos.ladder.level_count = ladder_levels;
        pos.ladder.last_fill_ts = fill.ts;
        return pos;
    }

    void add_fill(const Fill& fill) {
        fills.push_back(fill);
        ladder.last_fill_ts = std::max(ladder.last_fill_ts, fill.ts);
    }

    double stake() const {
        double total = 0;
        for (const auto& f : fills)
            total += f.size;
        return total;
    }

    double quantity() const {
        double total = 0;
        for (const auto& f : fills)
            total += f.quantity();
        return total;
    }

    // Stake-weighted entry price; 0 when nothing has a usable price
    double average_price() const {
        double qty = quantity();
        return qty > 0 ? stake() / qty : 0.0;
    }

    // Signed so that positive means in profit for either side
    double profit_ratio(double price) const {
        double avg = average_price();
        if (avg <= 0 || price <= 0)
            return 0.0;
        return side_sign(side) * (price - avg) / avg;
    }

    void observe_price(double price) {
        if (price <= 0)
            return;
        if (best_price <= 0) {
            best_price = price;
        } else if (side == Side::Long) {
            best_price = std::max(best_price, price);
        } else {
            best_price = std::min(best_price, price);
        }
    }

    Timestamp last_fill_ts() const { return ladder.last_fill_ts; }

    double hours_open(Timestamp now) const { return now > opened_at ? ns_to_hours(now - opened_at) : 0.0; }
};

} // namespace portfolio
} // namespace rme
