#include "../../include/engine/decision_engine.hpp"

namespace rme::engine {

DecisionEngine::DecisionEngine(const config::EngineConfig& config, const util::Clock& clock,
                               logging::AsyncLogger* logger)
    : config_(config), clock_(clock), logger_(logger), classifier_(config.regime), signals_(config.signal),
      stops_(config.stop_loss), sizer_(config.sizing), ladder_(config.ladder), gate_(config.admission, logger),
      rebalancer_(config.rebalance, logger) {
    config_.validate();
}

// =============================================================================
// Per-tick evaluation
// =============================================================================

Decision DecisionEngine::evaluate(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                                  portfolio::PortfolioState& portfolio, const market::MarketContext& market) {
    Timestamp now = clock_.now_ns();

    Decision decision;
    decision.regime = classifier_.classify(snapshot);
    if (logger_)
        LOGF_DEBUG(*logger_, Regime, "%s regime %s", state.instrument.c_str(),
                   strategy::regime_to_string(decision.regime));

    if (state.position)
        return evaluate_open(snapshot, state, portfolio, market, std::move(decision), now);
    return evaluate_flat(snapshot, state, portfolio, market, std::move(decision), now);
}

Decision DecisionEngine::evaluate_open(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                                       portfolio::PortfolioState& portfolio, const market::MarketContext& market,
                                       Decision decision, Timestamp now) {
    portfolio::Position& pos = *state.position;
    decision.side = pos.side;

    auto price = snapshot.price();
    if (price)
        pos.observe_price(*price);

    update_stop(snapshot, pos, decision, now);

    if (!price) {
        decision.status = DataStatus::DegenerateInput;
        note(decision, state, "no usable price, holding with current stop");
        return decision;
    }

    double profit = pos.profit_ratio(*price);

    if (decision.stop_offset && strategy::StopLossCalculator::breached(pos, *decision.stop_offset, *price))
        return try_exit(snapshot, state, portfolio, ExitReason::StopLoss,
                        exit_reason_to_string(ExitReason::StopLoss), std::move(decision));

    strategy::SignalContext context;
    context.position_side = pos.side;
    context.profit_ratio = profit;
    context.minutes_open = pos.hours_open(now) * 60.0;

    auto signal = signals_.evaluate(decision.regime, snapshot, context);
    if (signal.exit) {
        if (logger_)
            LOGF_INFO(*logger_, Signal, "%s exit signal %s profit=%.4f", state.instrument.c_str(),
                      signal.exit_tag.c_str(), profit);
        return try_exit(snapshot, state, portfolio, signal.exit_reason, signal.exit_tag, std::move(decision));
    }

    auto candidate = ladder_.evaluate(pos, profit, now, portfolio.total_capital(), sizer_.config().min_stake);
    if (!candidate.fire) {
        if (candidate.blocked == risk::LadderBlock::SpacingNotElapsed ||
            candidate.blocked == risk::LadderBlock::AllocationCap) {
            if (logger_)
                LOGF_DEBUG(*logger_, Ladder, "%s ladder blocked: %s", state.instrument.c_str(),
                           risk::ladder_block_to_string(candidate.blocked));
        }
        return decision;
    }

    risk::SizingRequest request;
    request.instrument = state.instrument;
    request.category = state.category;
    request.kind = risk::OrderKind::Ladder;
    request.ladder_level = candidate.level;
    request.level_multiplier = candidate.multiplier;
    request.volatility = volatility_estimate(snapshot);
    request.max_stake = candidate.max_stake;

    decision = try_add_on(snapshot, state, portfolio, market, request, portfolio::FillTag::ladder(candidate.level),
                          std::move(decision), now);
    if (decision.action == Action::Ladder) {
        ladder_.on_fill(pos.ladder, candidate.level, now);
        decision.limit_price = ladder_.limit_price(pos.side, *price, snapshot.get(config_.stop_loss.atr_key));
        if (logger_)
            LOGF_INFO(*logger_, Ladder, "%s level %zu filled stake=%.2f (%s)", state.instrument.c_str(),
                      candidate.level + 1, decision.stake, portfolio::ladder_phase_to_string(pos.ladder.phase()));
    }
    return decision;
}

Decision DecisionEngine::evaluate_flat(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                                       portfolio::PortfolioState& portfolio, const market::MarketContext& market,
                                       Decision decision, Timestamp now) {
    if (!snapshot.price()) {
        decision.status = DataStatus::DegenerateInput;
        note(decision, state, "no usable price, no entry");
        return decision;
    }
    if (!snapshot.has(config_.regime.trend_key)) {
        decision.status = DataStatus::DataUnavailable;
        note(decision, state, "missing " + config_.regime.trend_key + ", no entry");
        return decision;
    }

    auto signal = signals_.evaluate(decision.regime, snapshot);
    if (!signal.enter)
        return decision;

    if (logger_)
        LOGF_INFO(*logger_, Signal, "%s entry signal %s %s", state.instrument.c_str(), signal.enter_tag.c_str(),
                  side_to_string(signal.enter_side));

    return try_enter(snapshot, state, portfolio, market, signal.enter_side, signal.enter_tag, std::nullopt,
                     std::move(decision), now);
}

// =============================================================================
// Rebalance and emergency
// =============================================================================

std::vector<portfolio::RebalanceProposal>
DecisionEngine::run_rebalance(portfolio::PortfolioState& portfolio,
                              const std::map<Category, portfolio::CategoryView>& views) {
    return rebalancer_.run(portfolio, views, clock_.now_ns());
}

Decision DecisionEngine::evaluate_rebalance(const portfolio::RebalanceProposal& proposal,
                                            const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                                            portfolio::PortfolioState& portfolio,
                                            const market::MarketContext& market) {
    Timestamp now = clock_.now_ns();

    Decision decision;
    decision.regime = classifier_.classify(snapshot);

    if (proposal.category != state.category) {
        note(decision, state, "rebalance proposal for category " + proposal.category + " ignored");
        return decision;
    }

    auto price = snapshot.price();
    if (!price) {
        decision.status = DataStatus::DegenerateInput;
        note(decision, state, "no usable price, rebalance skipped");
        return decision;
    }

    const std::string tag = "rebalance";

    if (proposal.direction == portfolio::RebalanceDirection::Decrease) {
        if (!state.position) {
            note(decision, state, "nothing to reduce");
            return decision;
        }
        decision.side = state.position->side;
        state.position->observe_price(*price);
        update_stop(snapshot, *state.position, decision, now);
        return try_exit(snapshot, state, portfolio, ExitReason::Rebalance, tag, std::move(decision));
    }

    if (!state.position)
        return try_enter(snapshot, state, portfolio, market, Side::Long, tag, proposal.amount, std::move(decision),
                         now);

    if (state.position->side != Side::Long) {
        note(decision, state, "rebalance increase skipped on short position");
        return decision;
    }

    decision.side = Side::Long;
    state.position->observe_price(*price);
    update_stop(snapshot, *state.position, decision, now);

    risk::SizingRequest request;
    request.instrument = state.instrument;
    request.category = state.category;
    request.kind = risk::OrderKind::Rebalance;
    request.volatility = volatility_estimate(snapshot);
    request.requested_stake = proposal.amount;
    request.max_stake = proposal.amount;

    return try_add_on(snapshot, state, portfolio, market, request, portfolio::FillTag::rebalance(),
                      std::move(decision), now);
}

Decision DecisionEngine::emergency_exit(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                                        portfolio::PortfolioState& portfolio) {
    Decision decision;
    if (!state.position) {
        note(decision, state, "emergency exit without position");
        return decision;
    }
    decision.side = state.position->side;
    return try_exit(snapshot, state, portfolio, ExitReason::Emergency, exit_reason_to_string(ExitReason::Emergency),
                    std::move(decision));
}

// =============================================================================
// Order paths
// =============================================================================

Decision DecisionEngine::try_enter(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                                   portfolio::PortfolioState& portfolio, const market::MarketContext& market,
                                   Side side, const std::string& tag, std::optional<double> requested_stake,
                                   Decision decision, Timestamp now) {
    decision.side = side;
    decision.tag = tag;

    risk::SizingRequest request;
    request.instrument = state.instrument;
    request.category = state.category;
    request.kind = requested_stake ? risk::OrderKind::Rebalance : risk::OrderKind::Initial;
    request.volatility = volatility_estimate(snapshot);
    request.requested_stake = requested_stake;
    if (requested_stake)
        request.max_stake = requested_stake;

    auto sizing = sizer_.size(request, portfolio.ledger());
    if (!sizing.ok()) {
        if (sizing.reason == risk::DeclineReason::BudgetExceeded)
            decision.admission = risk::AdmissionResult::BudgetExceeded;
        if (sizing.reason == risk::DeclineReason::DegenerateInput)
            decision.status = DataStatus::DegenerateInput;
        note(decision, state, std::string("entry declined by sizer: ") + risk::decline_reason_to_string(sizing.reason));
        return decision;
    }

    risk::ReservationGuard guard(portfolio.ledger(), sizing.reservation.id);

    risk::AdmissionRequest admission;
    admission.intent = risk::OrderIntent::Entry;
    admission.instrument = state.instrument;
    admission.category = state.category;
    admission.side = side;
    admission.stake = sizing.stake;
    admission.reservation = guard.id();
    admission.snapshot = &snapshot;
    admission.market = market;

    {
        auto txn = portfolio.begin();
        decision.admission = gate_.admit(admission, txn);
    }
    if (decision.admission != risk::AdmissionResult::Accepted) {
        note(decision, state, std::string("entry rejected: ") + risk::admission_result_to_string(decision.admission));
        return decision;
    }
    guard.dismiss();

    double price = *snapshot.price();
    portfolio::FillTag fill_tag = requested_stake ? portfolio::FillTag::rebalance() : portfolio::FillTag::initial();
    state.position = portfolio::Position::open(state.instrument, state.category, side,
                                               portfolio::Fill{sizing.stake, price, now, fill_tag},
                                               ladder_.level_count());

    decision.action = Action::Enter;
    decision.enter = true;
    decision.stake = sizing.stake;
    if (sizing.outcome == risk::SizeOutcome::Reduced)
        decision.reasons.push_back("stake reduced to remaining risk budget");

    update_stop(snapshot, *state.position, decision, now);

    if (logger_)
        LOGF_INFO(*logger_, Sizing, "%s entered %s stake=%.2f risk=%.2f (%s)", state.instrument.c_str(),
                  side_to_string(side), sizing.stake, sizing.risk, risk::size_outcome_to_string(sizing.outcome));
    return decision;
}

Decision DecisionEngine::try_add_on(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                                    portfolio::PortfolioState& portfolio, const market::MarketContext& market,
                                    const risk::SizingRequest& request, portfolio::FillTag fill_tag,
                                    Decision decision, Timestamp now) {
    portfolio::Position& pos = *state.position;
    decision.tag = fill_tag.to_string();

    auto sizing = sizer_.size(request, portfolio.ledger());
    if (!sizing.ok()) {
        if (sizing.reason == risk::DeclineReason::BudgetExceeded)
            decision.admission = risk::AdmissionResult::BudgetExceeded;
        note(decision, state,
             decision.tag + " declined by sizer: " + risk::decline_reason_to_string(sizing.reason));
        return decision;
    }

    risk::ReservationGuard guard(portfolio.ledger(), sizing.reservation.id);

    risk::AdmissionRequest admission;
    admission.intent = risk::OrderIntent::AddOn;
    admission.instrument = state.instrument;
    admission.category = state.category;
    admission.side = pos.side;
    admission.stake = sizing.stake;
    admission.reservation = guard.id();
    admission.snapshot = &snapshot;
    admission.market = market;

    {
        auto txn = portfolio.begin();
        decision.admission = gate_.admit(admission, txn);
    }
    if (decision.admission != risk::AdmissionResult::Accepted) {
        note(decision, state,
             decision.tag + " rejected: " + risk::admission_result_to_string(decision.admission));
        return decision;
    }
    guard.dismiss();

    std::optional<double> held_level;
    if (pos.stop_offset && pos.average_price() > 0)
        held_level = strategy::StopLossCalculator::stop_price(pos, *pos.stop_offset);

    pos.add_fill(portfolio::Fill{sizing.stake, *snapshot.price(), now, fill_tag});

    // The fill moved the average; keep the stop price where it was
    if (held_level)
        pos.stop_offset = strategy::StopLossCalculator::offset_for_level(pos, *held_level);
    update_stop(snapshot, pos, decision, now);

    decision.action = fill_tag.kind == portfolio::FillKind::Ladder ? Action::Ladder : Action::Rebalance;
    decision.enter = true;
    decision.side = pos.side;
    decision.stake = sizing.stake;
    return decision;
}

Decision DecisionEngine::try_exit(const market::InstrumentSnapshot& snapshot, InstrumentState& state,
                                  portfolio::PortfolioState& portfolio, ExitReason reason, const std::string& tag,
                                  Decision decision) {
    portfolio::Position& pos = *state.position;
    auto price = snapshot.price();

    risk::AdmissionRequest admission;
    admission.intent = risk::OrderIntent::Exit;
    admission.instrument = state.instrument;
    admission.category = state.category;
    admission.side = pos.side;
    admission.exit_reason = reason;
    admission.profit_ratio = price ? pos.profit_ratio(*price) : 0.0;
    admission.snapshot = &snapshot;

    {
        auto txn = portfolio.begin();
        decision.admission = gate_.admit(admission, txn);
    }

    decision.exit_reason = reason;
    decision.tag = tag;

    if (decision.admission != risk::AdmissionResult::Accepted) {
        if (decision.admission == risk::AdmissionResult::Delayed) {
            decision.reasons.push_back(tag + " delayed, re-check next tick");
            if (logger_)
                LOGF_DEBUG(*logger_, Gate, "%s %s delayed profit=%.4f", state.instrument.c_str(), tag.c_str(),
                           admission.profit_ratio);
        } else {
            note(decision, state, tag + " rejected: " + risk::admission_result_to_string(decision.admission));
        }
        return decision;
    }

    decision.action = Action::Exit;
    decision.exit = true;
    decision.stake = pos.stake();

    if (logger_ && reason == ExitReason::StopLoss)
        LOGF_WARN(*logger_, Stop, "%s stop hit at offset %.4f", state.instrument.c_str(),
                  decision.stop_offset ? *decision.stop_offset : 0.0);

    state.position.reset();
    return decision;
}

// =============================================================================
// Helpers
// =============================================================================

void DecisionEngine::update_stop(const market::InstrumentSnapshot& snapshot, portfolio::Position& position,
                                 Decision& decision, Timestamp now) const {
    auto stop = stops_.compute(position, snapshot, now);
    if (logger_ && (!position.stop_offset || *position.stop_offset != stop.offset))
        LOGF_DEBUG(*logger_, Stop, "%s stop %.4f (%s)", position.instrument.c_str(), stop.offset,
                   strategy::stop_source_to_string(stop.source));

    position.stop_offset = stop.offset;
    decision.stop_offset = stop.offset;
    if (position.average_price() > 0)
        decision.stop_level = strategy::StopLossCalculator::stop_price(position, stop.offset);

    if (stop.status != DataStatus::Ok && decision.status == DataStatus::Ok) {
        decision.status = stop.status;
        decision.reasons.push_back(std::string("stop fallback: ") + data_status_to_string(stop.status));
    }
}

std::optional<double> DecisionEngine::volatility_estimate(const market::InstrumentSnapshot& snapshot) const {
    if (auto vol = snapshot.get(market::keys::VOLATILITY))
        return vol;
    auto atr = snapshot.get(config_.stop_loss.atr_key);
    auto price = snapshot.price();
    if (atr && price)
        return *atr / *price;
    return std::nullopt;
}

void DecisionEngine::note(Decision& decision, const InstrumentState& state, const std::string& reason) const {
    decision.reasons.push_back(reason);
    if (logger_)
        LOGF_INFO(*logger_, System, "%s: %s", state.instrument.c_str(), reason.c_str());
}

} // namespace rme::engine
