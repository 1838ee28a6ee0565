/**
 * Test LadderController - ordered levels, spacing, allocation cap
 */

#include "../include/risk/ladder_controller.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace rme;
using namespace rme::risk;
using rme::portfolio::Fill;
using rme::portfolio::FillTag;
using rme::portfolio::LadderPhase;
using rme::portfolio::Position;

#define TEST(name) void name()

#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        try {                                                                                                          \
            name();                                                                                                    \
            std::cout << "PASSED\n";                                                                                   \
        } catch (...) {                                                                                                \
            std::cout << "FAILED (exception)\n";                                                                       \
            return 1;                                                                                                  \
        }                                                                                                              \
    } while (0)

#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

#define ASSERT_NEAR(a, b, tol)                                                                                         \
    do {                                                                                                               \
        if (std::abs((a) - (b)) > (tol)) {                                                                             \
            std::cerr << "\nFAIL: " << #a << " (" << (a) << ") != " << #b << " (" << (b) << ") within " << (tol)       \
                      << "\n";                                                                                         \
            assert(false);                                                                                             \
        }                                                                                                              \
    } while (0)

static constexpr double CAPITAL = 10000.0;
static constexpr double MIN_STAKE = 10.0;
static constexpr Timestamp SPACING = 4 * NANOS_PER_HOUR;

static Position open_position(double stake = 1000.0) {
    LadderController ladder;
    return Position::open("ETH/USDT", "eth", Side::Long, Fill{stake, 100.0, 0, FillTag::initial()},
                          ladder.level_count());
}

// ============================================
// Triggering
// ============================================

TEST(test_first_level_fires_at_trigger) {
    LadderController ladder;
    auto pos = open_position();

    auto c = ladder.evaluate(pos, -0.05, SPACING, CAPITAL, MIN_STAKE);
    ASSERT_TRUE(c.fire);
    ASSERT_TRUE(c.level == 0);
    ASSERT_NEAR(c.multiplier, 1.2, 1e-12);
    ASSERT_NEAR(c.max_stake, 2500.0, 1e-9); // 35% of 10000 minus 1000 held
}

TEST(test_shallow_loss_does_not_fire) {
    LadderController ladder;
    auto pos = open_position();
    auto c = ladder.evaluate(pos, -0.03, SPACING, CAPITAL, MIN_STAKE);
    ASSERT_FALSE(c.fire);
    ASSERT_TRUE(c.blocked == LadderBlock::AboveTrigger);
}

TEST(test_level_never_retriggers) {
    LadderController ladder;
    auto pos = open_position();

    auto first = ladder.evaluate(pos, -0.06, SPACING, CAPITAL, MIN_STAKE);
    ASSERT_TRUE(first.fire);
    ASSERT_TRUE(ladder.on_fill(pos.ladder, first.level, SPACING));

    // Same loss long after the spacing: level 0 is used, level 1 needs -10%
    auto again = ladder.evaluate(pos, -0.06, 10 * SPACING, CAPITAL, MIN_STAKE);
    ASSERT_FALSE(again.fire);
    ASSERT_TRUE(again.blocked == LadderBlock::AboveTrigger);

    // Recovery and relapse does not re-arm level 0
    ASSERT_FALSE(ladder.evaluate(pos, 0.02, 11 * SPACING, CAPITAL, MIN_STAKE).fire);
    ASSERT_FALSE(ladder.evaluate(pos, -0.06, 12 * SPACING, CAPITAL, MIN_STAKE).fire);
}

TEST(test_deep_drop_fires_next_level_only) {
    LadderController ladder;
    auto pos = open_position();

    // -20% crosses levels 0, 1 and 2 at once; only level 0 fires
    auto c = ladder.evaluate(pos, -0.20, SPACING, CAPITAL, MIN_STAKE);
    ASSERT_TRUE(c.fire);
    ASSERT_TRUE(c.level == 0);
}

TEST(test_on_fill_rejects_out_of_order_level) {
    LadderController ladder;
    auto pos = open_position();
    ASSERT_FALSE(ladder.on_fill(pos.ladder, 1, SPACING));
    ASSERT_TRUE(pos.ladder.levels_used == 0);
    ASSERT_TRUE(ladder.on_fill(pos.ladder, 0, SPACING));
    ASSERT_FALSE(ladder.on_fill(pos.ladder, 0, SPACING));
}

TEST(test_ladder_exhausts) {
    LadderController ladder;
    auto pos = open_position(100.0);

    Timestamp now = 0;
    for (size_t level = 0; level < ladder.level_count(); ++level) {
        now += SPACING;
        auto c = ladder.evaluate(pos, -0.30, now, CAPITAL, MIN_STAKE);
        ASSERT_TRUE(c.fire);
        ASSERT_TRUE(c.level == level);
        ASSERT_TRUE(ladder.on_fill(pos.ladder, c.level, now));
    }

    ASSERT_TRUE(pos.ladder.phase() == LadderPhase::Exhausted);
    auto c = ladder.evaluate(pos, -0.50, now + SPACING, CAPITAL, MIN_STAKE);
    ASSERT_TRUE(c.blocked == LadderBlock::Exhausted);
}

// ============================================
// Spacing and allocation
// ============================================

TEST(test_spacing_from_last_fill) {
    LadderController ladder;
    auto pos = open_position();

    auto early = ladder.evaluate(pos, -0.06, SPACING - 1, CAPITAL, MIN_STAKE);
    ASSERT_TRUE(early.blocked == LadderBlock::SpacingNotElapsed);

    ASSERT_TRUE(ladder.on_fill(pos.ladder, 0, SPACING));
    auto second = ladder.evaluate(pos, -0.12, SPACING + NANOS_PER_HOUR, CAPITAL, MIN_STAKE);
    ASSERT_TRUE(second.blocked == LadderBlock::SpacingNotElapsed);

    auto later = ladder.evaluate(pos, -0.12, 2 * SPACING, CAPITAL, MIN_STAKE);
    ASSERT_TRUE(later.fire);
    ASSERT_TRUE(later.level == 1);
}

TEST(test_allocation_cap_blocks) {
    LadderController ladder;
    auto pos = open_position(3495.0); // 5 below the 3500 cap
    auto c = ladder.evaluate(pos, -0.06, SPACING, CAPITAL, MIN_STAKE);
    ASSERT_FALSE(c.fire);
    ASSERT_TRUE(c.blocked == LadderBlock::AllocationCap);
}

TEST(test_disabled_and_degenerate) {
    LadderConfig config = LadderConfig::defaults();
    config.enabled = false;
    LadderController off(config);
    auto pos = open_position();
    ASSERT_TRUE(off.evaluate(pos, -0.30, SPACING, CAPITAL, MIN_STAKE).blocked == LadderBlock::Disabled);

    LadderController ladder;
    ASSERT_TRUE(ladder.evaluate(pos, -0.30, SPACING, 0.0, MIN_STAKE).blocked == LadderBlock::DegenerateInput);
}

// ============================================
// Limit price
// ============================================

TEST(test_limit_price_discount) {
    LadderController ladder;
    // 0.5 * 1.0 / 100 = 0.5% below
    ASSERT_NEAR(ladder.limit_price(Side::Long, 100.0, 1.0), 99.5, 1e-9);
    // Capped at 1%
    ASSERT_NEAR(ladder.limit_price(Side::Long, 100.0, 10.0), 99.0, 1e-9);
    ASSERT_NEAR(ladder.limit_price(Side::Long, 100.0, std::nullopt), 99.0, 1e-9);
    ASSERT_NEAR(ladder.limit_price(Side::Short, 100.0, 1.0), 100.5, 1e-9);
}

int main() {
    std::cout << "=== LadderController Tests ===\n";

    RUN_TEST(test_first_level_fires_at_trigger);
    RUN_TEST(test_shallow_loss_does_not_fire);
    RUN_TEST(test_level_never_retriggers);
    RUN_TEST(test_deep_drop_fires_next_level_only);
    RUN_TEST(test_on_fill_rejects_out_of_order_level);
    RUN_TEST(test_ladder_exhausts);

    RUN_TEST(test_spacing_from_last_fill);
    RUN_TEST(test_allocation_cap_blocks);
    RUN_TEST(test_disabled_and_degenerate);

    RUN_TEST(test_limit_price_discount);

    std::cout << "\nAll LadderController tests passed!\n";
    return 0;
}
