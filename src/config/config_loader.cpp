#include "../../include/config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace rme::config {

using json = nlohmann::json;

namespace {

// Reads obj[key] into out when present; type mismatch becomes ConfigError
template <typename T>
void read(const json& obj, const char* key, T& out, const std::string& path) {
    if (!obj.contains(key))
        return;
    try {
        out = obj.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(path + "." + key + ": " + e.what());
    }
}

const json* section(const json& root, const char* key) {
    if (!root.contains(key))
        return nullptr;
    const json& node = root.at(key);
    if (!node.is_object())
        throw ConfigError(std::string(key) + ": expected an object");
    return &node;
}

const json& array_at(const json& obj, const char* key, const std::string& path) {
    const json& node = obj.at(key);
    if (!node.is_array())
        throw ConfigError(path + "." + key + ": expected an array");
    return node;
}

Side parse_side(const std::string& text, const std::string& path) {
    if (text == "long")
        return Side::Long;
    if (text == "short")
        return Side::Short;
    throw ConfigError(path + ": unknown side '" + text + "'");
}

const char* side_name(Side side) {
    return side == Side::Long ? "long" : "short";
}

strategy::Regime parse_regime(const std::string& text, const std::string& path) {
    if (text == "uptrend")
        return strategy::Regime::Uptrend;
    if (text == "downtrend")
        return strategy::Regime::Downtrend;
    if (text == "range")
        return strategy::Regime::Range;
    if (text == "uncertain")
        return strategy::Regime::Uncertain;
    throw ConfigError(path + ": unknown regime '" + text + "'");
}

const char* regime_name(strategy::Regime regime) {
    switch (regime) {
    case strategy::Regime::Uptrend:
        return "uptrend";
    case strategy::Regime::Downtrend:
        return "downtrend";
    case strategy::Regime::Range:
        return "range";
    default:
        return "uncertain";
    }
}

strategy::CompareOp parse_op(const std::string& text, const std::string& path) {
    using strategy::CompareOp;
    if (text == ">")
        return CompareOp::Gt;
    if (text == "<")
        return CompareOp::Lt;
    if (text == ">=")
        return CompareOp::Ge;
    if (text == "<=")
        return CompareOp::Le;
    if (text == "crosses_above")
        return CompareOp::CrossesAbove;
    if (text == "crosses_below")
        return CompareOp::CrossesBelow;
    throw ConfigError(path + ": unknown op '" + text + "'");
}

strategy::Condition parse_condition(const json& node, const std::string& path) {
    if (!node.is_object())
        throw ConfigError(path + ": expected an object");

    strategy::Condition cond;
    std::string op = ">";
    read(node, "lhs", cond.lhs, path);
    read(node, "op", op, path);
    read(node, "rhs", cond.rhs_key, path);
    read(node, "value", cond.rhs_value, path);
    read(node, "scale", cond.rhs_scale, path);
    cond.op = parse_op(op, path + ".op");

    if (cond.rhs_key.empty() && !node.contains("value"))
        throw ConfigError(path + ": needs either 'rhs' or 'value'");
    return cond;
}

std::vector<strategy::PredicateFamily> parse_families(const json& node, const std::string& path) {
    std::vector<strategy::PredicateFamily> families;
    for (size_t i = 0; i < node.size(); ++i) {
        const json& f = node.at(i);
        std::string fpath = path + "[" + std::to_string(i) + "]";
        if (!f.is_object())
            throw ConfigError(fpath + ": expected an object");

        strategy::PredicateFamily family;
        std::string side = "long";
        read(f, "tag", family.tag, fpath);
        read(f, "side", side, fpath);
        family.side = parse_side(side, fpath + ".side");

        if (f.contains("regimes")) {
            std::vector<std::string> regimes;
            read(f, "regimes", regimes, fpath);
            for (const auto& r : regimes)
                family.regimes.push_back(parse_regime(r, fpath + ".regimes"));
        }

        if (f.contains("all_of")) {
            const json& conds = array_at(f, "all_of", fpath);
            for (size_t j = 0; j < conds.size(); ++j)
                family.all_of.push_back(parse_condition(conds.at(j), fpath + ".all_of[" + std::to_string(j) + "]"));
        }
        families.push_back(std::move(family));
    }
    return families;
}

void parse_regime_section(const json& s, strategy::RegimeConfig& cfg) {
    read(s, "trend_key", cfg.trend_key, "regime");
    read(s, "plus_key", cfg.plus_key, "regime");
    read(s, "minus_key", cfg.minus_key, "regime");
    read(s, "trend_threshold", cfg.trend_threshold, "regime");
    read(s, "range_threshold", cfg.range_threshold, "regime");
}

void parse_signal_section(const json& s, strategy::SignalConfig& cfg) {
    read(s, "allow_short", cfg.allow_short, "signal");
    if (s.contains("entry_families"))
        cfg.entry_families = parse_families(array_at(s, "entry_families", "signal"), "signal.entry_families");
    if (s.contains("exit_families"))
        cfg.exit_families = parse_families(array_at(s, "exit_families", "signal"), "signal.exit_families");
    if (s.contains("roi")) {
        const json& rows = array_at(s, "roi", "signal");
        cfg.roi_table.clear();
        for (size_t i = 0; i < rows.size(); ++i) {
            std::string path = "signal.roi[" + std::to_string(i) + "]";
            strategy::RoiStep step;
            read(rows.at(i), "minutes", step.minutes, path);
            read(rows.at(i), "profit", step.min_profit, path);
            cfg.roi_table.push_back(step);
        }
    }
}

void parse_stop_section(const json& s, strategy::StopLossConfig& cfg) {
    read(s, "static_floor", cfg.static_floor, "stop_loss");
    read(s, "atr_key", cfg.atr_key, "stop_loss");
    read(s, "atr_multiplier", cfg.atr_multiplier, "stop_loss");
    read(s, "max_volatility_distance", cfg.max_volatility_distance, "stop_loss");
    read(s, "decay_hours", cfg.decay_hours, "stop_loss");
    read(s, "min_time_factor", cfg.min_time_factor, "stop_loss");
    read(s, "trailing_activation", cfg.trailing_activation, "stop_loss");
    read(s, "trailing_start_distance", cfg.trailing_start_distance, "stop_loss");
    read(s, "trailing_min_distance", cfg.trailing_min_distance, "stop_loss");
    read(s, "trailing_full_profit", cfg.trailing_full_profit, "stop_loss");
}

void parse_sizing_section(const json& s, risk::SizingConfig& cfg) {
    read(s, "base_fraction", cfg.base_fraction, "sizing");
    read(s, "max_order_fraction", cfg.max_order_fraction, "sizing");
    read(s, "min_stake", cfg.min_stake, "sizing");
    read(s, "max_stake", cfg.max_stake, "sizing");
    read(s, "reference_volatility", cfg.reference_volatility, "sizing");
    read(s, "min_volatility_multiplier", cfg.min_volatility_multiplier, "sizing");
    read(s, "max_volatility_multiplier", cfg.max_volatility_multiplier, "sizing");
    read(s, "risk_per_trade", cfg.risk_per_trade, "sizing");
    read(s, "assumed_adverse_move", cfg.assumed_adverse_move, "sizing");
    read(s, "allow_reduced", cfg.allow_reduced, "sizing");
}

void parse_ladder_section(const json& s, risk::LadderConfig& cfg) {
    read(s, "enabled", cfg.enabled, "ladder");
    read(s, "max_position_allocation", cfg.max_position_allocation, "ladder");
    read(s, "min_spacing_sec", cfg.min_spacing_sec, "ladder");
    read(s, "max_limit_discount", cfg.max_limit_discount, "ladder");
    read(s, "atr_discount_factor", cfg.atr_discount_factor, "ladder");
    if (s.contains("levels")) {
        const json& levels = array_at(s, "levels", "ladder");
        cfg.levels.clear();
        for (size_t i = 0; i < levels.size(); ++i) {
            std::string path = "ladder.levels[" + std::to_string(i) + "]";
            risk::LadderLevel level;
            read(levels.at(i), "trigger", level.trigger, path);
            read(levels.at(i), "multiplier", level.multiplier, path);
            cfg.levels.push_back(level);
        }
    }
}

void parse_rebalance_section(const json& s, portfolio::RebalanceConfig& cfg) {
    read(s, "enabled", cfg.enabled, "rebalance");
    read(s, "targets", cfg.targets, "rebalance");
    read(s, "threshold", cfg.threshold, "rebalance");
    read(s, "min_amount", cfg.min_amount, "rebalance");
    read(s, "max_volatility", cfg.max_volatility, "rebalance");
    read(s, "min_volume_ratio", cfg.min_volume_ratio, "rebalance");
    read(s, "interval_sec", cfg.interval_sec, "rebalance");
}

void parse_admission_section(const json& s, risk::AdmissionConfig& cfg) {
    read(s, "max_open_positions", cfg.max_open_positions, "admission");
    read(s, "max_category_fraction", cfg.max_category_fraction, "admission");
    read(s, "category_ceilings", cfg.category_ceilings, "admission");
    read(s, "max_spread", cfg.max_spread, "admission");
    read(s, "max_bb_width", cfg.max_bb_width, "admission");
    read(s, "min_volume_ratio", cfg.min_volume_ratio, "admission");
    read(s, "min_profit_for_exit", cfg.min_profit_for_exit, "admission");
    read(s, "overbought_rsi", cfg.overbought_rsi, "admission");
    read(s, "overextended_bb_width", cfg.overextended_bb_width, "admission");
    read(s, "rebalance_exit_bypasses_delay", cfg.rebalance_exit_bypasses_delay, "admission");
}

json families_to_json(const std::vector<strategy::PredicateFamily>& families) {
    json out = json::array();
    for (const auto& f : families) {
        json conds = json::array();
        for (const auto& c : f.all_of) {
            json cj = {{"lhs", c.lhs}, {"op", strategy::compare_op_to_string(c.op)}};
            if (c.rhs_key.empty()) {
                cj["value"] = c.rhs_value;
            } else {
                cj["rhs"] = c.rhs_key;
                cj["scale"] = c.rhs_scale;
            }
            conds.push_back(cj);
        }
        json regimes = json::array();
        for (auto r : f.regimes)
            regimes.push_back(regime_name(r));
        out.push_back({{"tag", f.tag}, {"side", side_name(f.side)}, {"regimes", regimes}, {"all_of", conds}});
    }
    return out;
}

} // namespace

EngineConfig ConfigLoader::parse(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed JSON: ") + e.what());
    }
    if (!root.is_object())
        throw ConfigError("top-level JSON value must be an object");

    EngineConfig cfg = EngineConfig::defaults();

    if (auto s = section(root, "regime"))
        parse_regime_section(*s, cfg.regime);
    if (auto s = section(root, "signal"))
        parse_signal_section(*s, cfg.signal);
    if (auto s = section(root, "stop_loss"))
        parse_stop_section(*s, cfg.stop_loss);
    if (auto s = section(root, "sizing"))
        parse_sizing_section(*s, cfg.sizing);
    if (auto s = section(root, "ladder"))
        parse_ladder_section(*s, cfg.ladder);
    if (auto s = section(root, "rebalance"))
        parse_rebalance_section(*s, cfg.rebalance);
    if (auto s = section(root, "admission"))
        parse_admission_section(*s, cfg.admission);
    if (auto s = section(root, "ledger"))
        read(*s, "max_total_risk", cfg.ledger.max_total_risk, "ledger");
    read(root, "cash_category", cfg.cash_category, "root");

    cfg.validate();
    return cfg;
}

EngineConfig ConfigLoader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file)
        throw ConfigError("cannot open config file: " + path);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::string ConfigLoader::dump(const EngineConfig& cfg, int indent) {
    json roi = json::array();
    for (const auto& step : cfg.signal.roi_table)
        roi.push_back({{"minutes", step.minutes}, {"profit", step.min_profit}});

    json levels = json::array();
    for (const auto& level : cfg.ladder.levels)
        levels.push_back({{"trigger", level.trigger}, {"multiplier", level.multiplier}});

    json root;
    root["regime"] = {{"trend_key", cfg.regime.trend_key},
                      {"plus_key", cfg.regime.plus_key},
                      {"minus_key", cfg.regime.minus_key},
                      {"trend_threshold", cfg.regime.trend_threshold},
                      {"range_threshold", cfg.regime.range_threshold}};
    root["signal"] = {{"allow_short", cfg.signal.allow_short},
                      {"entry_families", families_to_json(cfg.signal.entry_families)},
                      {"exit_families", families_to_json(cfg.signal.exit_families)},
                      {"roi", roi}};
    root["stop_loss"] = {{"static_floor", cfg.stop_loss.static_floor},
                         {"atr_key", cfg.stop_loss.atr_key},
                         {"atr_multiplier", cfg.stop_loss.atr_multiplier},
                         {"max_volatility_distance", cfg.stop_loss.max_volatility_distance},
                         {"decay_hours", cfg.stop_loss.decay_hours},
                         {"min_time_factor", cfg.stop_loss.min_time_factor},
                         {"trailing_activation", cfg.stop_loss.trailing_activation},
                         {"trailing_start_distance", cfg.stop_loss.trailing_start_distance},
                         {"trailing_min_distance", cfg.stop_loss.trailing_min_distance},
                         {"trailing_full_profit", cfg.stop_loss.trailing_full_profit}};
    root["sizing"] = {{"base_fraction", cfg.sizing.base_fraction},
                      {"max_order_fraction", cfg.sizing.max_order_fraction},
                      {"min_stake", cfg.sizing.min_stake},
                      {"max_stake", cfg.sizing.max_stake},
                      {"reference_volatility", cfg.sizing.reference_volatility},
                      {"min_volatility_multiplier", cfg.sizing.min_volatility_multiplier},
                      {"max_volatility_multiplier", cfg.sizing.max_volatility_multiplier},
                      {"risk_per_trade", cfg.sizing.risk_per_trade},
                      {"assumed_adverse_move", cfg.sizing.assumed_adverse_move},
                      {"allow_reduced", cfg.sizing.allow_reduced}};
    root["ladder"] = {{"enabled", cfg.ladder.enabled},
                      {"levels", levels},
                      {"max_position_allocation", cfg.ladder.max_position_allocation},
                      {"min_spacing_sec", cfg.ladder.min_spacing_sec},
                      {"max_limit_discount", cfg.ladder.max_limit_discount},
                      {"atr_discount_factor", cfg.ladder.atr_discount_factor}};
    root["rebalance"] = {{"enabled", cfg.rebalance.enabled},
                         {"targets", cfg.rebalance.targets},
                         {"threshold", cfg.rebalance.threshold},
                         {"min_amount", cfg.rebalance.min_amount},
                         {"max_volatility", cfg.rebalance.max_volatility},
                         {"min_volume_ratio", cfg.rebalance.min_volume_ratio},
                         {"interval_sec", cfg.rebalance.interval_sec}};
    root["admission"] = {{"max_open_positions", cfg.admission.max_open_positions},
                         {"max_category_fraction", cfg.admission.max_category_fraction},
                         {"category_ceilings", cfg.admission.category_ceilings},
                         {"max_spread", cfg.admission.max_spread},
                         {"max_bb_width", cfg.admission.max_bb_width},
                         {"min_volume_ratio", cfg.admission.min_volume_ratio},
                         {"min_profit_for_exit", cfg.admission.min_profit_for_exit},
                         {"overbought_rsi", cfg.admission.overbought_rsi},
                         {"overextended_bb_width", cfg.admission.overextended_bb_width},
                         {"rebalance_exit_bypasses_delay", cfg.admission.rebalance_exit_bypasses_delay}};
    root["ledger"] = {{"max_total_risk", cfg.ledger.max_total_risk}};
    root["cash_category"] = cfg.cash_category;

    return root.dump(indent);
}

} // namespace rme::config
