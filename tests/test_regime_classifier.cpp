/**
 * Test RegimeClassifier - ADX/DI regime labels
 */

#include "../include/strategy/regime_classifier.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace rme;
using namespace rme::strategy;

#define TEST(name) void name()

#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        try {                                                                                                          \
            name();                                                                                                    \
            std::cout << "PASSED\n";                                                                                   \
        } catch (...) {                                                                                                \
            std::cout << "FAILED (exception)\n";                                                                       \
            return 1;                                                                                                  \
        }                                                                                                              \
    } while (0)

#define ASSERT_TRUE(x) assert(x)

static market::InstrumentSnapshot make_snapshot(double adx, double plus_di, double minus_di) {
    market::InstrumentSnapshot snap;
    snap.instrument = "BTC/USDT";
    snap.category = "btc";
    snap.with("close", 100.0).with("adx", adx).with("plus_di", plus_di).with("minus_di", minus_di);
    return snap;
}

// ============================================
// Classification
// ============================================

TEST(test_strong_positive_bias_is_uptrend) {
    RegimeClassifier classifier;
    ASSERT_TRUE(classifier.classify(make_snapshot(32, 28, 14)) == Regime::Uptrend);
}

TEST(test_strong_negative_bias_is_downtrend) {
    RegimeClassifier classifier;
    ASSERT_TRUE(classifier.classify(make_snapshot(40, 10, 30)) == Regime::Downtrend);
}

TEST(test_weak_trend_is_range) {
    RegimeClassifier classifier;
    ASSERT_TRUE(classifier.classify(make_snapshot(15, 30, 10)) == Regime::Range);
}

TEST(test_between_thresholds_is_uncertain) {
    RegimeClassifier classifier;
    ASSERT_TRUE(classifier.classify(make_snapshot(22, 30, 10)) == Regime::Uncertain);
}

TEST(test_zero_bias_is_uncertain) {
    RegimeClassifier classifier;
    ASSERT_TRUE(classifier.classify(make_snapshot(35, 20, 20)) == Regime::Uncertain);
}

TEST(test_range_is_deterministic_on_repeat) {
    RegimeClassifier classifier;
    auto snap = make_snapshot(12, 18, 22);
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(classifier.classify(snap) == Regime::Range);
    }
}

// ============================================
// Missing data
// ============================================

TEST(test_missing_adx_is_uncertain) {
    RegimeClassifier classifier;
    market::InstrumentSnapshot snap;
    snap.with("close", 100.0).with("plus_di", 30).with("minus_di", 10);
    ASSERT_TRUE(classifier.classify(snap) == Regime::Uncertain);
}

TEST(test_nan_adx_is_uncertain) {
    RegimeClassifier classifier;
    ASSERT_TRUE(classifier.classify(make_snapshot(std::nan(""), 30, 10)) == Regime::Uncertain);
}

TEST(test_trending_without_di_is_uncertain) {
    RegimeClassifier classifier;
    market::InstrumentSnapshot snap;
    snap.with("adx", 40);
    ASSERT_TRUE(classifier.classify(snap) == Regime::Uncertain);
}

TEST(test_range_needs_no_di) {
    RegimeClassifier classifier;
    market::InstrumentSnapshot snap;
    snap.with("adx", 10);
    ASSERT_TRUE(classifier.classify(snap) == Regime::Range);
}

// ============================================
// Configuration
// ============================================

TEST(test_custom_thresholds_and_keys) {
    RegimeConfig config;
    config.trend_key = "trend_strength";
    config.trend_threshold = 40;
    config.range_threshold = 30;
    RegimeClassifier classifier(config);

    market::InstrumentSnapshot snap;
    snap.with("trend_strength", 35).with("plus_di", 30).with("minus_di", 10);
    ASSERT_TRUE(classifier.classify(snap) == Regime::Uncertain);

    snap.with("trend_strength", 45);
    ASSERT_TRUE(classifier.classify(snap) == Regime::Uptrend);

    snap.with("trend_strength", 25);
    ASSERT_TRUE(classifier.classify(snap) == Regime::Range);
}

TEST(test_regime_names) {
    ASSERT_TRUE(std::string(regime_to_string(Regime::Uptrend)) == "UPTREND");
    ASSERT_TRUE(std::string(regime_to_string(Regime::Range)) == "RANGE");
    ASSERT_TRUE(std::string(regime_to_string(Regime::Uncertain)) == "UNCERTAIN");
}

int main() {
    std::cout << "=== RegimeClassifier Tests ===\n";

    RUN_TEST(test_strong_positive_bias_is_uptrend);
    RUN_TEST(test_strong_negative_bias_is_downtrend);
    RUN_TEST(test_weak_trend_is_range);
    RUN_TEST(test_between_thresholds_is_uncertain);
    RUN_TEST(test_zero_bias_is_uncertain);
    RUN_TEST(test_range_is_deterministic_on_repeat);

    RUN_TEST(test_missing_adx_is_uncertain);
    RUN_TEST(test_nan_adx_is_uncertain);
    RUN_TEST(test_trending_without_di_is_uncertain);
    RUN_TEST(test_range_needs_no_di);

    RUN_TEST(test_custom_thresholds_and_keys);
    RUN_TEST(test_regime_names);

    std::cout << "\nAll RegimeClassifier tests passed!\n";
    return 0;
}
