/// @file tests/select/test_selector.cpp
/// @brief Unit tests for WindowSelector.
///
/// Test categories:
///   - spread_pct / clears on positive, zero and negative prices
///   - Full three-pass selection on a ramp day
///   - Spread gate stops charge growth; rejected candidates are not retried
///   - Discharge gate and aggressive re-labelling
///   - Discharge-only and charge-only modes
///   - Round-trip efficiency and minimum absolute difference
///   - Disjointness when every price is equal

#include <gtest/gtest.h>
#include "cew/classifier.hpp"
#include "cew/selector.hpp"
#include "../test_helpers.hpp"

#include <algorithm>
#include <vector>

using namespace cew;
using namespace cew::test;

namespace {

Selection run(const WindowSeries& w, const Settings& s) {
    return WindowSelector::select(w, PercentileClassifier::classify(w, s), s);
}

std::vector<std::size_t> range(std::size_t first, std::size_t last) {
    std::vector<std::size_t> v;
    for (std::size_t i = first; i <= last; ++i) v.push_back(i);
    return v;
}

}  // namespace

// ─── spread_pct / clears ─────────────────────────────────────────────────────

TEST(SpreadPct, RelativeToCheapPrice) {
    EXPECT_DOUBLE_EQ(*WindowSelector::spread_pct(1.0, 1.5), 50.0);
    EXPECT_DOUBLE_EQ(*WindowSelector::spread_pct(2.0, 1.0), -50.0);
}

TEST(SpreadPct, NegativeCheapGivesNegativeSpread) {
    EXPECT_DOUBLE_EQ(*WindowSelector::spread_pct(-0.1, 0.1), -200.0);
    EXPECT_FALSE(WindowSelector::clears(-0.1, 0.1, 10.0, 0.0));
}

TEST(SpreadPct, ZeroCheapIsUndefined) {
    EXPECT_FALSE(WindowSelector::spread_pct(0.0, 0.3).has_value());
}

TEST(Clears, ThresholdAndAbsoluteDifference) {
    EXPECT_TRUE(WindowSelector::clears(1.0, 1.25, 20.0, 0.0));
    EXPECT_FALSE(WindowSelector::clears(1.0, 1.25, 30.0, 0.0));
    EXPECT_FALSE(WindowSelector::clears(1.0, 1.25, 20.0, 0.3));
}

TEST(Clears, ZeroCheapClearsWhenExpensiveIsHigher) {
    EXPECT_TRUE(WindowSelector::clears(0.0, 0.1, 50.0, 0.0));
    EXPECT_FALSE(WindowSelector::clears(0.0, 0.0, 0.0, 0.0));
}

// ─── Full selection ──────────────────────────────────────────────────────────

TEST(WindowSelector, RampDaySelectsExtremes) {
    const auto w = make_windows(ramp(96));
    const auto sel = run(w, plain_settings());

    EXPECT_EQ(sel.charge, range(0, 3));
    EXPECT_EQ(sel.discharge, range(92, 95));
    EXPECT_EQ(sel.aggressive, range(92, 95));
    ASSERT_TRUE(sel.cheap_reference.has_value());
    EXPECT_DOUBLE_EQ(*sel.cheap_reference, 2.5);
}

TEST(WindowSelector, SpreadGateStopsChargeGrowth) {
    // Hourly: 1.00, 1.10, 1.15, 1.30, 18 × 1.25, 1.40, 1.40 (at 20, 21).
    std::vector<double> p(24, 1.25);
    p[0] = 1.00;
    p[1] = 1.10;
    p[2] = 1.15;
    p[3] = 1.30;
    p[20] = 1.40;
    p[21] = 1.40;
    const auto w = make_windows(p, 60min);

    Settings s = plain_settings();
    s.expensive_window_count = 2;
    s.min_spread_pct = 25.0;

    const auto sel = run(w, s);
    // Reference 1.40; a 4th window at 1.25 drops the spread to 24.4 %.
    EXPECT_EQ(sel.charge, (std::vector<std::size_t>{0, 1, 2}));
    EXPECT_EQ(sel.charge_rejected, 18u);
    EXPECT_EQ(sel.discharge, (std::vector<std::size_t>{20, 21}));
    EXPECT_TRUE(sel.aggressive.empty());
}

TEST(WindowSelector, DischargeGateAndAggressiveSubset) {
    std::vector<double> p(24, 1.1);
    p[0]  = 1.0;
    p[1]  = 1.0;
    p[10] = 1.5;
    p[11] = 1.2;
    p[12] = 1.2;
    const auto w = make_windows(p, 60min);

    Settings s = plain_settings();
    s.charge_window_count    = 2;
    s.expensive_window_count = 3;
    s.cheap_percentile       = 10.0;
    s.discharge_spread_pct   = 32.0;

    const auto sel = run(w, s);
    EXPECT_EQ(sel.charge, (std::vector<std::size_t>{0, 1}));
    // 1.5 → 50 %, +1.2 → 35 %, +1.2 → 30 % (rejected).
    EXPECT_EQ(sel.discharge, (std::vector<std::size_t>{10, 11}));
    EXPECT_EQ(sel.discharge_rejected, 20u);
    EXPECT_EQ(sel.aggressive, (std::vector<std::size_t>{10}));
}

// ─── Modes ───────────────────────────────────────────────────────────────────

TEST(WindowSelector, DischargeOnlyTakesTopWindowsUngated) {
    const auto w = make_windows(ramp(96));
    Settings s = plain_settings();
    s.charge_window_count = 0;

    const auto sel = run(w, s);
    EXPECT_TRUE(sel.charge.empty());
    EXPECT_EQ(sel.discharge, range(92, 95));
    // Reference: mean of prices below q(25) = 24.75, i.e. 1..24.
    ASSERT_TRUE(sel.cheap_reference.has_value());
    EXPECT_DOUBLE_EQ(*sel.cheap_reference, 12.5);
    EXPECT_EQ(sel.aggressive, range(92, 95));
}

TEST(WindowSelector, ChargeOnlyUsesAllExpensiveCandidatesAsReference) {
    const auto w = make_windows(ramp(96));
    Settings s = plain_settings();
    s.expensive_window_count = 0;

    const auto sel = run(w, s);
    EXPECT_EQ(sel.charge, range(0, 3));
    EXPECT_TRUE(sel.discharge.empty());
    EXPECT_TRUE(sel.aggressive.empty());
}

TEST(WindowSelector, ZeroCountsSelectNothing) {
    const auto w = make_windows(ramp(96));
    Settings s = plain_settings();
    s.charge_window_count    = 0;
    s.expensive_window_count = 0;

    const auto sel = run(w, s);
    EXPECT_TRUE(sel.charge.empty());
    EXPECT_TRUE(sel.discharge.empty());
    EXPECT_TRUE(sel.aggressive.empty());
}

// ─── Efficiency and absolute difference ─────────────────────────────────────

TEST(WindowSelector, RoundTripLossRejectsThinSpreads) {
    std::vector<double> p(24, 1.0);
    std::fill(p.begin() + 12, p.end(), 1.15);
    const auto w = make_windows(p, 60min);

    Settings s = plain_settings();
    s.discharge_spread_pct = 10.0;

    const auto lossless = run(w, s);
    EXPECT_EQ(lossless.charge.size(), 4u);
    EXPECT_EQ(lossless.discharge.size(), 4u);

    // 1.0 · 100/80 = 1.25 exceeds the 1.15 discharge price.
    s.round_trip_efficiency_pct = 80.0;
    const auto lossy = run(w, s);
    EXPECT_TRUE(lossy.charge.empty());
    EXPECT_EQ(lossy.charge_rejected, 12u);
    EXPECT_EQ(lossy.discharge, range(12, 15));
}

TEST(WindowSelector, MinimumPriceDifferenceBlocksCheapDays) {
    std::vector<double> p(24, 0.01);
    std::fill(p.begin() + 12, p.end(), 0.02);
    const auto w = make_windows(p, 60min);

    Settings s = plain_settings();
    s.min_price_difference = 0.05;

    const auto sel = run(w, s);
    EXPECT_TRUE(sel.charge.empty());
}

TEST(WindowSelector, NegativeCheapAverageIsNotCharged) {
    std::vector<double> p(24, -0.05);
    std::fill(p.begin() + 12, p.end(), 0.20);
    const auto w = make_windows(p, 60min);

    Settings s = plain_settings();
    s.round_trip_efficiency_pct = 50.0;

    const auto sel = run(w, s);
    EXPECT_TRUE(sel.charge.empty());
    EXPECT_EQ(sel.charge_rejected, 12u);
    EXPECT_EQ(sel.discharge, range(12, 15));
}

TEST(WindowSelector, ZeroPricedChargeWindowsAreAdmitted) {
    std::vector<double> p(24, 0.0);
    std::fill(p.begin() + 12, p.end(), 0.2);
    const auto w = make_windows(p, 60min);

    const auto sel = run(w, plain_settings());
    EXPECT_EQ(sel.charge, range(0, 3));
    EXPECT_EQ(sel.discharge, range(12, 15));
}

// ─── Invariants ──────────────────────────────────────────────────────────────

TEST(WindowSelector, FlatDayKeepsSetsDisjoint) {
    const auto w = make_windows(std::vector<double>(96, 5.0));
    Settings s = plain_settings();
    s.min_spread_pct       = 0.0;
    s.discharge_spread_pct = 0.0;

    const auto sel = run(w, s);
    EXPECT_EQ(sel.charge, range(0, 3));
    EXPECT_EQ(sel.discharge, range(4, 7));
    EXPECT_TRUE(sel.aggressive.empty());
}

TEST(WindowSelector, CapsAreRespected) {
    const auto w = make_windows(ramp(96));
    Settings s = plain_settings();
    s.charge_window_count    = 7;
    s.expensive_window_count = 3;

    const auto sel = run(w, s);
    EXPECT_LE(sel.charge.size(), 7u);
    EXPECT_LE(sel.discharge.size(), 3u);
    EXPECT_TRUE(std::includes(sel.discharge.begin(), sel.discharge.end(),
                              sel.aggressive.begin(), sel.aggressive.end()));
}

TEST(WindowSelector, EmptyDay) {
    const WindowSeries none;
    const auto sel = run(none, plain_settings());
    EXPECT_TRUE(sel.charge.empty());
    EXPECT_TRUE(sel.discharge.empty());
    EXPECT_FALSE(sel.cheap_reference.has_value());
}
