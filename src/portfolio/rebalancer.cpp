#include "../../include/portfolio/rebalancer.hpp"

#include <cmath>

namespace rme::portfolio {

bool Rebalancer::due(Timestamp now) const {
    if (!config_.enabled)
        return false;
    if (!has_run_.load(std::memory_order_acquire))
        return true;
    Timestamp last = last_run_.load(std::memory_order_acquire);
    return now >= last && now - last >= seconds_to_ns(config_.interval_sec);
}

std::optional<Timestamp> Rebalancer::last_run() const {
    if (!has_run_.load(std::memory_order_acquire))
        return std::nullopt;
    return last_run_.load(std::memory_order_acquire);
}

std::vector<CategoryAllocation> Rebalancer::allocations(const PortfolioState::Transaction& txn) const {
    std::vector<CategoryAllocation> result;
    double total = txn.total_capital();
    auto values = txn.category_values();

    for (const auto& [category, target] : config_.targets) {
        CategoryAllocation a;
        a.category = category;
        auto it = values.find(category);
        a.current_value = it == values.end() ? 0.0 : it->second;
        a.current_fraction = total > 0 ? a.current_value / total : 0.0;
        a.target = target;
        a.drift = std::abs(a.current_fraction - target);
        result.push_back(a);
    }
    return result;
}

RebalanceSkip Rebalancer::check(const CategoryAllocation& allocation, double total_value,
                                const std::map<Category, CategoryView>& views) const {
    if (allocation.drift <= config_.threshold)
        return RebalanceSkip::BelowThreshold;

    double amount = std::abs(allocation.target * total_value - allocation.current_value);
    if (amount < config_.min_amount)
        return RebalanceSkip::BelowMinAmount;

    auto it = views.find(allocation.category);
    if (it == views.end())
        return RebalanceSkip::DataUnavailable;

    const CategoryView& view = it->second;
    bool increase = allocation.current_fraction < allocation.target;

    if (increase && view.regime == strategy::Regime::Downtrend)
        return RebalanceSkip::Downtrend;
    if (view.volatility && *view.volatility > config_.max_volatility)
        return RebalanceSkip::HighVolatility;
    if (view.volume_ratio && *view.volume_ratio < config_.min_volume_ratio)
        return RebalanceSkip::LowVolume;

    return RebalanceSkip::None;
}

std::vector<RebalanceProposal> Rebalancer::run(PortfolioState& portfolio,
                                               const std::map<Category, CategoryView>& views, Timestamp now) {
    std::vector<RebalanceProposal> proposals;
    auto txn = portfolio.begin();
    if (!due(now))
        return proposals;

    double total = txn.total_capital();

    last_run_.store(now, std::memory_order_release);
    has_run_.store(true, std::memory_order_release);

    if (total <= 0) {
        if (logger_)
            LOG_WARN(*logger_, Rebalance, "skip cycle: zero total capital");
        return proposals;
    }

    for (const auto& allocation : allocations(txn)) {
        if (allocation.category == portfolio.cash_category())
            continue;

        RebalanceSkip skip = check(allocation, total, views);
        if (skip != RebalanceSkip::None) {
            if (logger_ && skip != RebalanceSkip::BelowThreshold)
                LOGF_INFO(*logger_, Rebalance, "%s drift %.3f skipped: %s", allocation.category.c_str(),
                          allocation.drift, rebalance_skip_to_string(skip));
            continue;
        }

        RebalanceProposal p;
        p.category = allocation.category;
        p.drift = allocation.drift;
        p.amount = std::abs(allocation.target * total - allocation.current_value);
        if (allocation.current_fraction < allocation.target) {
            p.direction = RebalanceDirection::Increase;
            p.reason = RebalanceReason::UnderTarget;
        } else {
            p.direction = RebalanceDirection::Decrease;
            p.reason = RebalanceReason::OverTarget;
        }

        if (logger_)
            LOGF_INFO(*logger_, Rebalance, "%s %s %.2f (drift %.3f)", p.category.c_str(),
                      rebalance_direction_to_string(p.direction), p.amount, p.drift);
        proposals.push_back(p);
    }

    return proposals;
}

} // namespace rme::portfolio
