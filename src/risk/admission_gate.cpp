#include "../../include/risk/admission_gate.hpp"

#include <cmath>

namespace rme::risk {

AdmissionResult AdmissionGate::admit(const AdmissionRequest& request,
                                     portfolio::PortfolioState::Transaction& txn) const {
    AdmissionResult result = AdmissionResult::Accepted;

    if (request.intent == OrderIntent::Exit) {
        bool unconditional =
            request.exit_reason == ExitReason::StopLoss || request.exit_reason == ExitReason::Emergency;
        if (!unconditional && !txn.has_position(request.instrument)) {
            result = AdmissionResult::UnknownPosition;
        } else {
            result = check_exit(request);
        }
        if (result == AdmissionResult::Accepted)
            txn.close_position(request.instrument);
        log_result(request, result);
        return result;
    }

    result = check_entry(request, txn);
    if (result == AdmissionResult::Accepted) {
        // Checks passed under the lock, so neither step below can fail
        txn.ledger().commit(request.reservation);
        if (request.intent == OrderIntent::Entry) {
            txn.register_position(request.instrument, request.category, request.side, request.stake,
                                  request.reservation);
        } else {
            txn.add_stake(request.instrument, request.stake, request.reservation);
        }
    }

    log_result(request, result);
    return result;
}

AdmissionResult AdmissionGate::check_entry(const AdmissionRequest& request,
                                           portfolio::PortfolioState::Transaction& txn) const {
    if (!std::isfinite(request.stake) || request.stake <= 0 || request.instrument.empty())
        return AdmissionResult::InvalidRequest;

    if (request.intent == OrderIntent::Entry) {
        if (txn.open_positions() >= config_.max_open_positions)
            return AdmissionResult::MaxPositions;
        if (txn.has_position(request.instrument))
            return AdmissionResult::DuplicatePosition;
    } else if (!txn.has_position(request.instrument)) {
        return AdmissionResult::UnknownPosition;
    }

    double capital = txn.total_capital();
    if (capital <= 0)
        return AdmissionResult::InvalidRequest;

    double category_after = txn.category_stake(request.category) + request.stake;
    if (category_after / capital > config_.ceiling_for(request.category))
        return AdmissionResult::CategoryCeiling;

    if (request.reservation == INVALID_RESERVATION || !txn.ledger().is_pending(request.reservation))
        return AdmissionResult::BudgetExceeded;

    return check_market(request);
}

AdmissionResult AdmissionGate::check_market(const AdmissionRequest& request) const {
    auto spread = request.market.spread_pct();
    if (spread && *spread > config_.max_spread)
        return AdmissionResult::Illiquid;

    // Averaging into an open position is expected in wide, quiet markets
    if (request.intent == OrderIntent::Entry && request.snapshot) {
        auto width = request.snapshot->get(market::keys::BB_WIDTH);
        if (width && *width > config_.max_bb_width)
            return AdmissionResult::Volatile;

        auto volume = request.snapshot->get(market::keys::VOLUME_RATIO);
        if (volume && *volume < config_.min_volume_ratio)
            return AdmissionResult::LowVolume;
    }

    return AdmissionResult::Accepted;
}

AdmissionResult AdmissionGate::check_exit(const AdmissionRequest& request) const {
    switch (request.exit_reason) {
    case ExitReason::StopLoss:
    case ExitReason::Emergency:
        return AdmissionResult::Accepted;
    case ExitReason::Rebalance:
        if (config_.rebalance_exit_bypasses_delay)
            return AdmissionResult::Accepted;
        break;
    case ExitReason::Signal:
    case ExitReason::Roi:
        break;
    default:
        return AdmissionResult::InvalidRequest;
    }

    // Losing exits pass; only barely-profitable ones wait
    if (request.profit_ratio < 0 || request.profit_ratio >= config_.min_profit_for_exit)
        return AdmissionResult::Accepted;

    if (request.snapshot) {
        auto rsi = request.snapshot->get(market::keys::RSI);
        if (rsi && *rsi > config_.overbought_rsi)
            return AdmissionResult::Accepted;

        auto width = request.snapshot->get(market::keys::BB_WIDTH);
        if (width && *width > config_.overextended_bb_width)
            return AdmissionResult::Accepted;
    }

    return AdmissionResult::Delayed;
}

void AdmissionGate::log_result(const AdmissionRequest& request, AdmissionResult result) const {
    if (!logger_)
        return;

    if (result == AdmissionResult::Accepted) {
        LOGF_INFO(*logger_, Gate, "%s %s %s accepted stake=%.2f", request.instrument.c_str(),
                  order_intent_to_string(request.intent), side_to_string(request.side), request.stake);
    } else {
        LOGF_INFO(*logger_, Gate, "%s %s rejected: %s", request.instrument.c_str(),
                  order_intent_to_string(request.intent), admission_result_to_string(result));
    }
}

} // namespace rme::risk
