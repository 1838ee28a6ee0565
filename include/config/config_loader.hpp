#pragma once

#include "engine_config.hpp"

#include <string>

namespace rme {
namespace config {

/**
 * ConfigLoader - JSON configuration
 *
 * Sections mirror EngineConfig: "regime", "signal", "stop_loss", "sizing",
 * "ladder", "rebalance", "admission", "ledger", plus "cash_category".
 * Absent keys keep their defaults. Unknown keys are ignored.
 *
 * Example:
 *   {
 *     "stop_loss": { "static_floor": 0.10 },
 *     "ladder": { "levels": [ {"trigger": -0.05, "multiplier": 1.2},
 *                             {"trigger": -0.10, "multiplier": 1.5} ] },
 *     "signal": { "entry_families": [
 *       { "tag": "oversold", "side": "long", "regimes": ["range"],
 *         "all_of": [ {"lhs": "rsi", "op": "<", "value": 30} ] } ] }
 *   }
 *
 * Malformed JSON, wrong types and unknown enum names throw ConfigError.
 * The returned config has passed validate().
 */
class ConfigLoader {
public:
    static EngineConfig load(const std::string& path);
    static EngineConfig parse(const std::string& text);

    // Effective settings as JSON text, for rme_config_check
    static std::string dump(const EngineConfig& config, int indent = 2);
};

} // namespace config
} // namespace rme
