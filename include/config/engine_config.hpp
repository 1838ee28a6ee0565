#pragma once

#include "../portfolio/rebalancer.hpp"
#include "../risk/admission_gate.hpp"
#include "../risk/ladder_controller.hpp"
#include "../risk/position_sizer.hpp"
#include "../risk/risk_budget_ledger.hpp"
#include "../strategy/regime_classifier.hpp"
#include "../strategy/signal_evaluator.hpp"
#include "../strategy/stop_loss_calculator.hpp"

#include <stdexcept>
#include <string>

namespace rme {
namespace config {

/**
 * Thrown at startup for invalid configuration. Never thrown per tick.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * EngineConfig - everything the decision engine is parameterized by
 *
 * Plain structs with defaults; defaults() fills in the tables
 * (predicate families, ladder levels, category targets).
 */
struct EngineConfig {
    strategy::RegimeConfig regime;
    strategy::SignalConfig signal;
    strategy::StopLossConfig stop_loss;
    risk::SizingConfig sizing;
    risk::LadderConfig ladder;
    portfolio::RebalanceConfig rebalance;
    risk::AdmissionConfig admission;
    risk::LedgerConfig ledger;

    // Category holding uncommitted capital
    Category cash_category = "stable";

    static EngineConfig defaults() {
        EngineConfig cfg;
        cfg.signal = strategy::SignalConfig::defaults();
        cfg.ladder = risk::LadderConfig::defaults();
        cfg.rebalance = portfolio::RebalanceConfig::defaults();
        return cfg;
    }

    /**
     * Fail fast on inconsistent settings. Throws ConfigError naming the field.
     */
    void validate() const;
};

} // namespace config
} // namespace rme
