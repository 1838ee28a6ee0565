#pragma once

#include "../types.hpp"

#include <cmath>
#include <map>
#include <optional>
#include <string>

namespace rme::market {

// Well-known indicator keys
namespace keys {
constexpr const char* CLOSE = "close";
constexpr const char* HIGH = "high";
constexpr const char* LOW = "low";
constexpr const char* VOLUME = "volume";
constexpr const char* ADX = "adx";
constexpr const char* PLUS_DI = "plus_di";
constexpr const char* MINUS_DI = "minus_di";
constexpr const char* EMA_FAST = "ema_fast";
constexpr const char* EMA_SLOW = "ema_slow";
constexpr const char* MACD = "macd";
constexpr const char* MACD_SIGNAL = "macd_signal";
constexpr const char* STOCH_K = "stoch_k";
constexpr const char* STOCH_D = "stoch_d";
constexpr const char* RSI = "rsi";
constexpr const char* BB_LOWER = "bb_lower";
constexpr const char* BB_MIDDLE = "bb_middle";
constexpr const char* BB_UPPER = "bb_upper";
constexpr const char* BB_WIDTH = "bb_width";
constexpr const char* BB_POSITION = "bb_position";
constexpr const char* ATR = "atr";
constexpr const char* VOLATILITY = "volatility";
constexpr const char* VOLUME_RATIO = "volume_ratio";
constexpr const char* PRICE_POSITION = "price_position";

// Previous-bar values are stored under "<key>_prev"
constexpr const char* PREV_SUFFIX = "_prev";
} // namespace keys

/**
 * InstrumentSnapshot - one instrument, one tick
 *
 * Produced by the indicator pipeline and never mutated by the engine.
 * Lookups treat absent and non-finite values the same way: no value.
 */
struct InstrumentSnapshot {
    InstrumentId instrument;
    Category category;
    Timestamp timestamp = 0;
    std::map<std::string, double> indicators;

    std::optional<double> get(const std::string& key) const {
        auto it = indicators.find(key);
        if (it == indicators.end() || !std::isfinite(it->second))
            return std::nullopt;
        return it->second;
    }

    std::optional<double> previous(const std::string& key) const { return get(key + keys::PREV_SUFFIX); }

    bool has(const std::string& key) const { return get(key).has_value(); }

    // Last traded price; nullopt when absent or not positive
    std::optional<double> price() const {
        auto close = get(keys::CLOSE);
        if (!close || *close <= 0.0)
            return std::nullopt;
        return close;
    }

    InstrumentSnapshot& with(const std::string& key, double value) {
        indicators[key] = value;
        return *this;
    }

    // Sets both the current and the previous-bar value
    InstrumentSnapshot& with(const std::string& key, double value, double prev_value) {
        indicators[key] = value;
        indicators[key + keys::PREV_SUFFIX] = prev_value;
        return *this;
    }
};

/**
 * MarketContext - optional order-book view supplied by the caller
 */
struct MarketContext {
    std::optional<double> best_bid;
    std::optional<double> best_ask;

    // Relative spread against the mid price, nullopt without a usable book
    std::optional<double> spread_pct() const {
        if (!best_bid || !best_ask || *best_bid <= 0.0 || *best_ask < *best_bid)
            return std::nullopt;
        double mid = (*best_bid + *best_ask) / 2.0;
        return (*best_ask - *best_bid) / mid;
    }
};

} // namespace rme::market
