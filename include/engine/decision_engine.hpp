#pragma once

#include "../config/engine_config.hpp"
#include "../logging/async_logger.hpp"
#include "../market/instrument_snapshot.hpp"
#include "../portfolio/portfolio_state.hpp"
#include "../portfolio/position.hpp"
#include "../portfolio/rebalancer.hpp"
#include "../risk/admission_gate.hpp"
#include "../risk/ladder_controller.hpp"
#include "../risk/position_sizer.hpp"
#include "../strategy/regime_classifier.hpp"
#include "../strategy/signal_evaluator.hpp"
#include "../strategy/stop_loss_calculator.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rme {
namespace engine {

/**
 * Per-instrument state, owned by that instrument's worker.
 * No locking: only one evaluation per instrument runs at a time.
 */
struct InstrumentState {
    InstrumentId instrument;
    Category category;
    std::optional<portfolio::Position> position;
};

enum class Action : uint8_t {
    None = 0, // Nothing to do (possibly a delayed exit or a declined entry)
    Enter,
    Exit,
    Ladder,   // Averaging order on an open position
    Rebalance // Rebalance add-on to an open position
};

inline const char* action_to_string(Action action) {
    switch (action) {
    case Action::None:
        return "none";
    case Action::Enter:
        return "enter";
    case Action::Exit:
        return "exit";
    case Action::Ladder:
        return "ladder";
    case Action::Rebalance:
        return "rebalance";
    default:
        return "unknown";
    }
}

/**
 * Result of one evaluation. Anything but an admitted order is "no action";
 * `reasons` says why, for the observability log.
 */
struct Decision {
    Action action = Action::None;
    bool enter = false;
    bool exit = false;
    Side side = Side::Long;
    double stake = 0;

    std::optional<double> stop_level;  // Protective stop price for the (remaining) position
    std::optional<double> stop_offset; // Same, as offset from average price
    std::optional<double> limit_price; // Ladder orders only

    std::string tag;
    ExitReason exit_reason = ExitReason::None;
    risk::AdmissionResult admission = risk::AdmissionResult::Accepted;
    DataStatus status = DataStatus::Ok;
    strategy::Regime regime = strategy::Regime::Uncertain;
    std::vector<std::string> reasons;

    bool acted() const { return action != Action::None; }
};

/**
 * DecisionEngine - per-tick decision pipeline
 *
 *   snapshot -> regime -> signals -> {sizer, ladder} -> ledger reserve
 *            -> admission gate -> stop update
 *
 * Safe to call concurrently for distinct instruments. Shared state is
 * only touched through PortfolioState (Transaction) and the ledger. An
 * admitted decision is applied to the handed-in state at the snapshot
 * price; submitting the order stays with the caller.
 */
class DecisionEngine {
public:
    DecisionEngine(const config::EngineConfig& config, const util::Clock& clock,
                   logging::AsyncLogger* logger = nullptr);

    Decision evaluate(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                      portfolio::PortfolioState& portfolio,
                      const market::MarketContext& market = market::MarketContext());

    Decision evaluate_rebalance(const portfolio::RebalanceProposal& proposal,
                                const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                                portfolio::PortfolioState& portfolio,
                                const market::MarketContext& market = market::MarketContext());

    // Caller-forced liquidation; always passes the gate
    Decision emergency_exit(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                            portfolio::PortfolioState& portfolio);

    // Runs the rebalancer if due
    std::vector<portfolio::RebalanceProposal>
    run_rebalance(portfolio::PortfolioState& portfolio, const std::map<Category, portfolio::CategoryView>& views);

    const config::EngineConfig& config() const { return config_; }
    const strategy::RegimeClassifier& classifier() const { return classifier_; }
    const strategy::SignalEvaluator& signals() const { return signals_; }
    const strategy::StopLossCalculator& stops() const { return stops_; }
    const risk::PositionSizer& sizer() const { return sizer_; }
    const risk::LadderController& ladder() const { return ladder_; }
    const risk::AdmissionGate& gate() const { return gate_; }
    portfolio::Rebalancer& rebalancer() { return rebalancer_; }

private:
    config::EngineConfig config_;
    const util::Clock& clock_;
    logging::AsyncLogger* logger_;

    strategy::RegimeClassifier classifier_;
    strategy::SignalEvaluator signals_;
    strategy::StopLossCalculator stops_;
    risk::PositionSizer sizer_;
    risk::LadderController ladder_;
    risk::AdmissionGate gate_;
    portfolio::Rebalancer rebalancer_;

    Decision evaluate_open(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                           portfolio::PortfolioState& portfolio, const market::MarketContext& market,
                           Decision decision, Timestamp now);
    Decision evaluate_flat(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                           portfolio::PortfolioState& portfolio, const market::MarketContext& market,
                           Decision decision, Timestamp now);

    // Sizes, reserves and admits a new position
    Decision try_enter(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                       portfolio::PortfolioState& portfolio, const market::MarketContext& market, Side side,
                       const std::string& tag, std::optional<double> requested_stake, Decision decision,
                       Timestamp now);

    // Sizes, reserves and admits an add-on fill (ladder or rebalance)
    Decision try_add_on(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                        portfolio::PortfolioState& portfolio, const market::MarketContext& market,
                        const risk::SizingRequest& request, portfolio::FillTag fill_tag, Decision decision,
                        Timestamp now);

    Decision try_exit(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                      portfolio::PortfolioState& portfolio, ExitReason reason, const std::string& tag,
                      Decision decision);

    void update_stop(const market::InstrumentSnapshot& snapshot, portfolio::Position& position, Decision& decision,
                     Timestamp now) const;

    std::optional<double> volatility_estimate(const market::InstrumentSnapshot& snapshot) const;
    void note(Decision& decision, const InstrumentState& state, const std::string& reason) const;
};

} // namespace engine
} // namespace rme
