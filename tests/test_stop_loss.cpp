/**
 * Test StopLossCalculator - floor, volatility, trailing, monotonic stops
 */

#include "../include/strategy/stop_loss_calculator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace rme;
using namespace rme::strategy;
using rme::portfolio::Fill;
using rme::portfolio::FillTag;
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

static Position open_position(Side side, double price, Timestamp ts = 0) {
    return Position::open("BTC/USDT", "btc", side, Fill{1000.0, price, ts, FillTag::initial()}, 4);
}

static market::InstrumentSnapshot snapshot(double close, double atr) {
    market::InstrumentSnapshot snap;
    snap.with("close", close);
    if (atr > 0)
        snap.with("atr", atr);
    return snap;
}

// Floor 10%, volatility stop = atr * 2.5 / price, no decay at t=0
static StopLossConfig test_config() {
    StopLossConfig config;
    config.static_floor = 0.10;
    return config;
}

// ============================================
// Candidate selection
// ============================================

TEST(test_volatility_stop_tighter_than_floor) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Long, 100.0);

    // 2.4 * 2.5 / 100 = 6%
    auto r = calc.compute(pos, snapshot(100.0, 2.4), 0);
    ASSERT_NEAR(r.offset, -0.06, 1e-9);
    ASSERT_TRUE(r.source == StopSource::Volatility);
    ASSERT_TRUE(r.status == DataStatus::Ok);
}

TEST(test_floor_bounds_wide_volatility_stop) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Long, 100.0);

    // 5 * 2.5 / 100 = 12.5% > floor 10%
    auto r = calc.compute(pos, snapshot(100.0, 5.0), 0);
    ASSERT_NEAR(r.offset, -0.10, 1e-9);
    ASSERT_TRUE(r.source == StopSource::StaticFloor);
}

TEST(test_stop_never_loosens_tick_over_tick) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Long, 100.0);

    // Volatility falling: -6% then -4%, tighter is allowed
    auto first = calc.compute(pos, snapshot(100.0, 2.4), 0);
    ASSERT_NEAR(first.offset, -0.06, 1e-9);
    pos.stop_offset = first.offset;

    auto second = calc.compute(pos, snapshot(100.0, 1.6), 0);
    ASSERT_NEAR(second.offset, -0.04, 1e-9);
    pos.stop_offset = second.offset;

    // Volatility rising again: candidate is -6%, stop holds at -4%
    auto third = calc.compute(pos, snapshot(100.0, 2.4), 0);
    ASSERT_NEAR(third.offset, -0.04, 1e-9);
    ASSERT_TRUE(third.source == StopSource::Previous);
}

TEST(test_six_percent_does_not_loosen_to_wider_candidate) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Long, 100.0);
    pos.stop_offset = -0.06;

    // Wide candidate (8%) must not replace the held -6%
    auto r = calc.compute(pos, snapshot(100.0, 3.2), 0);
    ASSERT_TRUE(r.offset >= -0.06 - 1e-12);
}

TEST(test_time_decay_tightens_volatility_stop) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Long, 100.0, 0);

    // 24h open: factor 0.5 -> 2.4 * 2.5 * 0.5 / 100 = 3%
    auto r = calc.compute(pos, snapshot(100.0, 2.4), 24 * NANOS_PER_HOUR);
    ASSERT_NEAR(r.offset, -0.03, 1e-9);

    // Factor never drops below 0.5
    ASSERT_NEAR(calc.volatility_distance(2.4, 100.0, 96.0), 0.03, 1e-9);
}

TEST(test_volatility_distance_cap) {
    StopLossConfig config;
    config.static_floor = 0.50;
    StopLossCalculator calc(config);
    ASSERT_NEAR(calc.volatility_distance(20.0, 100.0, 0.0), 0.15, 1e-12);
}

// ============================================
// Trailing
// ============================================

TEST(test_trailing_shape) {
    StopLossCalculator calc;
    ASSERT_NEAR(calc.trailing_distance(0.0), 0.05, 1e-12);
    ASSERT_NEAR(calc.trailing_distance(0.10), 0.035, 1e-12);
    ASSERT_NEAR(calc.trailing_distance(0.20), 0.02, 1e-12);
    ASSERT_NEAR(calc.trailing_distance(0.50), 0.02, 1e-12);
}

TEST(test_trailing_locks_profit_on_long) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Long, 100.0);

    // Price 110: profit 10%, trail 3.5% below 110 = 106.15 -> offset +6.15%
    auto r = calc.compute(pos, snapshot(110.0, 0), 0);
    ASSERT_TRUE(r.source == StopSource::Trailing);
    ASSERT_NEAR(r.offset, 0.0615, 1e-9);
    ASSERT_NEAR(StopLossCalculator::stop_price(pos, r.offset), 106.15, 1e-9);
}

TEST(test_trailing_inactive_below_activation) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Long, 100.0);
    auto r = calc.compute(pos, snapshot(104.0, 0), 0);
    ASSERT_TRUE(r.source == StopSource::StaticFloor);
    ASSERT_NEAR(r.offset, -0.10, 1e-12);
}

// ============================================
// Short side
// ============================================

TEST(test_short_volatility_stop_is_positive) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Short, 100.0);

    auto r = calc.compute(pos, snapshot(100.0, 2.4), 0);
    ASSERT_NEAR(r.offset, 0.06, 1e-9);
    ASSERT_NEAR(StopLossCalculator::stop_price(pos, r.offset), 106.0, 1e-9);
}

TEST(test_short_floor_is_positive) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Short, 100.0);
    auto r = calc.compute(pos, snapshot(100.0, 0), 0);
    ASSERT_NEAR(r.offset, 0.10, 1e-12);
}

TEST(test_short_trailing_follows_low) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Short, 100.0);
    pos.observe_price(90.0);

    // Profit 10%, trail 3.5% above 90 = 93.15 -> offset -6.85%
    auto r = calc.compute(pos, snapshot(90.0, 0), 0);
    ASSERT_TRUE(r.source == StopSource::Trailing);
    ASSERT_NEAR(r.offset, -0.0685, 1e-9);
}

TEST(test_short_never_loosens) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Short, 100.0);
    pos.stop_offset = 0.04;

    auto r = calc.compute(pos, snapshot(100.0, 2.4), 0);
    ASSERT_NEAR(r.offset, 0.04, 1e-12);
    ASSERT_TRUE(r.source == StopSource::Previous);
}

// ============================================
// Fallbacks
// ============================================

TEST(test_missing_atr_falls_back_to_floor) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Long, 100.0);
    auto r = calc.compute(pos, snapshot(100.0, 0), 0);
    ASSERT_NEAR(r.offset, -0.10, 1e-12);
    ASSERT_TRUE(r.status == DataStatus::DataUnavailable);
}

TEST(test_zero_open_price_falls_back_to_floor) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Long, 0.0);
    auto r = calc.compute(pos, snapshot(100.0, 2.4), 0);
    ASSERT_NEAR(r.offset, -0.10, 1e-12);
    ASSERT_TRUE(r.status == DataStatus::DegenerateInput);
}

TEST(test_zero_price_keeps_previous_stop) {
    StopLossCalculator calc(test_config());
    auto pos = open_position(Side::Long, 100.0);
    pos.stop_offset = -0.05;
    auto r = calc.compute(pos, snapshot(0.0, 2.4), 0);
    ASSERT_NEAR(r.offset, -0.05, 1e-12);
    ASSERT_TRUE(r.status == DataStatus::DegenerateInput);
}

// ============================================
// Breach
// ============================================

TEST(test_breach_detection_by_side) {
    auto lng = open_position(Side::Long, 100.0);
    ASSERT_TRUE(StopLossCalculator::breached(lng, -0.06, 93.9));
    ASSERT_FALSE(StopLossCalculator::breached(lng, -0.06, 94.1));

    auto sht = open_position(Side::Short, 100.0);
    ASSERT_TRUE(StopLossCalculator::breached(sht, 0.06, 106.5));
    ASSERT_FALSE(StopLossCalculator::breached(sht, 0.06, 105.0));
}

int main() {
    std::cout << "=== StopLossCalculator Tests ===\n";

    RUN_TEST(test_volatility_stop_tighter_than_floor);
    RUN_TEST(test_floor_bounds_wide_volatility_stop);
    RUN_TEST(test_stop_never_loosens_tick_over_tick);
    RUN_TEST(test_six_percent_does_not_loosen_to_wider_candidate);
    RUN_TEST(test_time_decay_tightens_volatility_stop);
    RUN_TEST(test_volatility_distance_cap);

    RUN_TEST(test_trailing_shape);
    RUN_TEST(test_trailing_locks_profit_on_long);
    RUN_TEST(test_trailing_inactive_below_activation);

    RUN_TEST(test_short_volatility_stop_is_positive);
    RUN_TEST(test_short_floor_is_positive);
    RUN_TEST(test_short_trailing_follows_low);
    RUN_TEST(test_short_never_loosens);

    RUN_TEST(test_missing_atr_falls_back_to_floor);
    RUN_TEST(test_zero_open_price_falls_back_to_floor);
    RUN_TEST(test_zero_price_keeps_previous_stop);

    RUN_TEST(test_breach_detection_by_side);

    std::cout << "\nAll StopLossCalculator tests passed!\n";
    return 0;
}
