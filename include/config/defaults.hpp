#pragma once

#include <cstddef>
#include <cstdint>

/**
 * Centralized configuration defaults for the decision engine.
 *
 * All default values are defined here to avoid duplication across:
 * - EngineConfig sub-configs
 * - ConfigLoader (absent keys keep these values)
 * - rme_config_check output
 *
 * Naming:
 * - _PCT suffix: fraction as decimal (0.02 = 2%)
 * - _SEC suffix: duration in seconds
 * - Loss thresholds are negative profit ratios (-0.05 = 5% loss)
 */

namespace rme::config {

// =============================================================================
// Regime Classification
// =============================================================================
namespace regime {
constexpr double TREND_THRESHOLD = 25.0; // ADX above: trending
constexpr double RANGE_THRESHOLD = 20.0; // ADX below: ranging
} // namespace regime

// =============================================================================
// Signal Predicates
// =============================================================================
namespace signal {
constexpr double VOLUME_CONFIRM_RATIO = 1.1; // volume > 1.1x its moving average
constexpr double STOCH_OVERSOLD = 25.0;
constexpr double STOCH_OVERBOUGHT = 75.0;
constexpr double BB_LOWER_TOUCH = 1.01; // close < bb_lower * 1.01
constexpr double BB_UPPER_TOUCH = 0.99; // close > bb_upper * 0.99
constexpr double RSI_EXIT_OVERBOUGHT = 72.0;
constexpr double RSI_EXIT_OVERSOLD = 28.0;
constexpr double BB_POSITION_EXIT_HIGH = 0.8;
constexpr double BB_POSITION_EXIT_LOW = 0.2;
constexpr double STOCH_EXIT_OVERBOUGHT = 80.0;
constexpr double STOCH_EXIT_OVERSOLD = 20.0;

// Take-profit schedule: (minutes open, minimum profit ratio)
constexpr double ROI_MINUTES[] = {0.0, 60.0, 120.0};
constexpr double ROI_PROFITS[] = {0.15, 0.05, 0.02};
} // namespace signal

// =============================================================================
// Stop Loss
// =============================================================================
namespace stops {
constexpr double STATIC_FLOOR_PCT = 0.12;      // Hard maximum loss, wide enough for the ladder
constexpr double ATR_MULTIPLIER = 2.5;         // Volatility stop distance = atr * 2.5
constexpr double MAX_VOLATILITY_STOP_PCT = 0.15;
constexpr double DECAY_HOURS = 48.0;           // Volatility distance shrinks over 48h
constexpr double MIN_TIME_FACTOR = 0.5;
constexpr double TRAILING_ACTIVATION_PCT = 0.05;
constexpr double TRAILING_START_DISTANCE_PCT = 0.05;
constexpr double TRAILING_MIN_DISTANCE_PCT = 0.02;
constexpr double TRAILING_FULL_PROFIT_PCT = 0.20; // Distance reaches minimum at 20% profit
} // namespace stops

// =============================================================================
// Position Sizing
// =============================================================================
namespace sizing {
constexpr double BASE_FRACTION_PCT = 0.10;
constexpr double MAX_ORDER_FRACTION_PCT = 0.15; // Per-order ceiling
constexpr double MIN_STAKE = 10.0;
constexpr double MAX_STAKE = 1'000'000.0;
constexpr double REFERENCE_VOLATILITY = 0.02;
constexpr double MIN_VOLATILITY_MULTIPLIER = 0.5;
constexpr double MAX_VOLATILITY_MULTIPLIER = 2.0;
constexpr double RISK_PER_TRADE_PCT = 0.02;
constexpr double ASSUMED_ADVERSE_MOVE_PCT = 0.08;
} // namespace sizing

// =============================================================================
// Risk Budget
// =============================================================================
namespace ledger {
constexpr double MAX_TOTAL_RISK_PCT = 0.25;
} // namespace ledger

// =============================================================================
// DCA Ladder
// =============================================================================
namespace ladder {
// Every level must fill above the floor stop held since entry
constexpr double TRIGGERS[] = {-0.04, -0.08};
constexpr double MULTIPLIERS[] = {1.2, 1.5};
constexpr size_t MAX_LEVELS = 32;
constexpr double MAX_POSITION_ALLOCATION_PCT = 0.35;
constexpr double MIN_SPACING_SEC = 4.0 * 3600.0;
constexpr double MAX_LIMIT_DISCOUNT_PCT = 0.01;
constexpr double ATR_DISCOUNT_FACTOR = 0.5;
} // namespace ladder

// =============================================================================
// Rebalancing
// =============================================================================
namespace rebalance {
constexpr double THRESHOLD_PCT = 0.15;
constexpr double MIN_AMOUNT = 100.0;
constexpr double MAX_PORTFOLIO_VOLATILITY = 0.25;
constexpr double MIN_VOLUME_RATIO = 0.5;
constexpr double INTERVAL_SEC = 24.0 * 3600.0;
constexpr double TARGET_BTC = 0.40;
constexpr double TARGET_ETH = 0.25;
constexpr double TARGET_ALT = 0.20;
constexpr double TARGET_STABLE = 0.10;
constexpr double TARGET_OTHER = 0.05;
} // namespace rebalance

// =============================================================================
// Admission Gate
// =============================================================================
namespace admission {
constexpr uint32_t MAX_OPEN_POSITIONS = 10;
constexpr double MAX_CATEGORY_ALLOCATION_PCT = 0.50;
constexpr double MAX_SPREAD_PCT = 0.005; // 50 bps
constexpr double MAX_BB_WIDTH = 0.25;
constexpr double MIN_VOLUME_RATIO = 0.5;
constexpr double MIN_PROFIT_FOR_EXIT = 0.02;
constexpr double OVERBOUGHT_RSI = 80.0;
constexpr double OVEREXTENDED_BB_WIDTH = 0.20;
} // namespace admission

} // namespace rme::config
