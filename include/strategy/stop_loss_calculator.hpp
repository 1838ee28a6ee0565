#pragma once

#include "../config/defaults.hpp"
#include "../market/instrument_snapshot.hpp"
#include "../portfolio/position.hpp"
#include "../types.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace rme {
namespace strategy {

/**
 * StopLossConfig - adaptive stop parameters
 *
 * All distances are fractions (0.08 = 8%).
 */
struct StopLossConfig {
    double static_floor = config::stops::STATIC_FLOOR_PCT; // Loosest stop ever allowed

    // Volatility stop: current price -/+ atr * multiplier * time_factor
    std::string atr_key = market::keys::ATR;
    double atr_multiplier = config::stops::ATR_MULTIPLIER;
    double max_volatility_distance = config::stops::MAX_VOLATILITY_STOP_PCT;
    double decay_hours = config::stops::DECAY_HOURS;
    double min_time_factor = config::stops::MIN_TIME_FACTOR;

    // Profit trailing
    double trailing_activation = config::stops::TRAILING_ACTIVATION_PCT;
    double trailing_start_distance = config::stops::TRAILING_START_DISTANCE_PCT;
    double trailing_min_distance = config::stops::TRAILING_MIN_DISTANCE_PCT;
    double trailing_full_profit = config::stops::TRAILING_FULL_PROFIT_PCT;
};

enum class StopSource : uint8_t {
    StaticFloor = 0,
    Volatility,
    Trailing,
    Previous // Held at last tick's tighter level
};

inline const char* stop_source_to_string(StopSource source) {
    switch (source) {
    case StopSource::StaticFloor:
        return "static_floor";
    case StopSource::Volatility:
        return "volatility";
    case StopSource::Trailing:
        return "trailing";
    case StopSource::Previous:
        return "previous";
    default:
        return "unknown";
    }
}

/**
 * Offset from the position's average price: negative below it, positive above.
 * For a long the stop normally sits below (negative), for a short above.
 */
struct StopResult {
    double offset = 0;
    StopSource source = StopSource::StaticFloor;
    DataStatus status = DataStatus::Ok;
};

/**
 * StopLossCalculator
 *
 * Internally works in "allowed loss" L relative to the average price:
 *   long:  stop = avg * (1 - L)      short: stop = avg * (1 + L)
 * Smaller L is tighter; L < 0 locks in profit. The result is
 *   L = min(floor, volatility, trailing, previous)
 * so it is never looser than the static floor nor the previous tick.
 * Long and short are computed on separate branches.
 */
class StopLossCalculator {
public:
    explicit StopLossCalculator(const StopLossConfig& config = StopLossConfig()) : config_(config) {}

    StopResult compute(const portfolio::Position& position, const market::InstrumentSnapshot& snapshot,
                       Timestamp now) const {
        const double avg = position.average_price();
        auto current = snapshot.price();

        double allowed = config_.static_floor;
        StopSource source = StopSource::StaticFloor;
        DataStatus status = DataStatus::Ok;

        if (avg <= 0 || !current) {
            status = DataStatus::DegenerateInput;
        } else {
            double price = *current;
            double best = favorable(position, price);

            auto atr = snapshot.get(config_.atr_key);
            if (atr && *atr > 0) {
                double distance = volatility_distance(*atr, price, position.hours_open(now));
                double loss = position.side == Side::Long ? long_loss(avg, price * (1.0 - distance))
                                                          : short_loss(avg, price * (1.0 + distance));
                if (loss < allowed) {
                    allowed = loss;
                    source = StopSource::Volatility;
                }
            } else {
                status = DataStatus::DataUnavailable;
            }

            double profit = position.profit_ratio(price);
            if (profit > config_.trailing_activation) {
                double distance = trailing_distance(profit);
                double loss = position.side == Side::Long ? long_loss(avg, best * (1.0 - distance))
                                                          : short_loss(avg, best * (1.0 + distance));
                if (loss < allowed) {
                    allowed = loss;
                    source = StopSource::Trailing;
                }
            }
        }

        if (position.stop_offset) {
            double previous = offset_to_loss(position.side, *position.stop_offset);
            if (previous < allowed) {
                allowed = previous;
                source = StopSource::Previous;
            }
        }

        return StopResult{loss_to_offset(position.side, allowed), source, status};
    }

    static double stop_price(const portfolio::Position& position, double offset) {
        return position.average_price() * (1.0 + offset);
    }

    /**
     * Offset from the current average price that puts the stop at `level`.
     * Used to carry a stop price across a fill that moves the average.
     */
    static std::optional<double> offset_for_level(const portfolio::Position& position, double level) {
        double avg = position.average_price();
        if (avg <= 0 || level <= 0)
            return std::nullopt;
        return level / avg - 1.0;
    }

    static bool breached(const portfolio::Position& position, double offset, double price) {
        if (price <= 0 || position.average_price() <= 0)
            return false;
        double level = stop_price(position, offset);
        return position.side == Side::Long ? price <= level : price >= level;
    }

    /**
     * Volatility distance as a fraction of current price, shrinking with age.
     */
    double volatility_distance(double atr, double price, double hours_open) const {
        double time_factor = std::max(config_.min_time_factor, 1.0 - hours_open / config_.decay_hours);
        double distance = atr * config_.atr_multiplier * time_factor / price;
        return std::min(distance, config_.max_volatility_distance);
    }

    /**
     * Trailing distance from the best price: start distance at zero profit,
     * linearly down to the minimum at full profit.
     */
    double trailing_distance(double profit) const {
        double progress = std::clamp(profit / config_.trailing_full_profit, 0.0, 1.0);
        return config_.trailing_start_distance -
               (config_.trailing_start_distance - config_.trailing_min_distance) * progress;
    }

    const StopLossConfig& config() const { return config_; }

private:
    StopLossConfig config_;

    static double favorable(const portfolio::Position& position, double price) {
        if (position.best_price <= 0)
            return price;
        return position.side == Side::Long ? std::max(position.best_price, price)
                                           : std::min(position.best_price, price);
    }

    static double long_loss(double avg, double stop) { return 1.0 - stop / avg; }
    static double short_loss(double avg, double stop) { return stop / avg - 1.0; }

    static double loss_to_offset(Side side, double loss) { return side == Side::Long ? -loss : loss; }
    static double offset_to_loss(Side side, double offset) { return side == Side::Long ? -offset : offset; }
};

} // namespace strategy
} // namespace rme
