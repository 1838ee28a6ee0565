#pragma once

/**
 * RegimeClassifier - coarse market state from one snapshot
 *
 * Reads a trend-strength indicator (ADX by default) and the directional
 * bias (+DI minus -DI). No history of its own: identical snapshots always
 * classify identically.
 */

#include "../config/defaults.hpp"
#include "../market/instrument_snapshot.hpp"

#include <string>

namespace rme {
namespace strategy {

/**
 * Market Regime Types
 */
enum class Regime : uint8_t {
    Uptrend,   // Strong trend, positive bias
    Downtrend, // Strong trend, negative bias
    Range,     // Weak trend, mean-reverting
    Uncertain  // Between thresholds, or missing data
};

inline const char* regime_to_string(Regime regime) {
    switch (regime) {
    case Regime::Uptrend:
        return "UPTREND";
    case Regime::Downtrend:
        return "DOWNTREND";
    case Regime::Range:
        return "RANGE";
    default:
        return "UNCERTAIN";
    }
}

/**
 * Regime Classification Configuration
 */
struct RegimeConfig {
    std::string trend_key = market::keys::ADX;
    std::string plus_key = market::keys::PLUS_DI;
    std::string minus_key = market::keys::MINUS_DI;

    double trend_threshold = config::regime::TREND_THRESHOLD; // above: trending
    double range_threshold = config::regime::RANGE_THRESHOLD; // below: ranging
};

class RegimeClassifier {
public:
    explicit RegimeClassifier(const RegimeConfig& config = RegimeConfig()) : config_(config) {}

    Regime classify(const market::InstrumentSnapshot& snapshot) const {
        auto strength = snapshot.get(config_.trend_key);
        if (!strength)
            return Regime::Uncertain;

        if (*strength < config_.range_threshold)
            return Regime::Range;

        if (*strength > config_.trend_threshold) {
            auto plus = snapshot.get(config_.plus_key);
            auto minus = snapshot.get(config_.minus_key);
            if (!plus || !minus)
                return Regime::Uncertain;

            double bias = *plus - *minus;
            if (bias > 0.0)
                return Regime::Uptrend;
            if (bias < 0.0)
                return Regime::Downtrend;
        }

        return Regime::Uncertain;
    }

    const RegimeConfig& config() const { return config_; }

private:
    RegimeConfig config_;
};

} // namespace strategy
} // namespace rme
