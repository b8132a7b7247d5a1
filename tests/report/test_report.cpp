/// @file tests/report/test_report.cpp
/// @brief Unit tests for attribute and text rendering.

#include <gtest/gtest.h>
#include "cew/report.hpp"
#include "../test_helpers.hpp"

#include <string>

using namespace cew;
using namespace cew::test;

namespace {

ClassificationResult sample() {
    ClassificationResult r;
    r.day            = DAY;
    r.window_count   = 96;
    r.charge_windows = {
        PriceWindow{.start = at(2), .duration = 15min, .price = 0.1},
        PriceWindow{.start = at(3), .duration = 15min, .price = 0.12345678},
    };
    r.avg_cheap_price = 0.111;
    r.spread_pct      = 42.04;
    r.spread_met      = true;
    r.current_state   = OperatingState::Charge;
    r.net_kwh         = -1.5;
    return r;
}

const std::string& value_of(const report::Attributes& attrs, const std::string& name) {
    for (const auto& [k, v] : attrs) {
        if (k == name) return v;
    }
    static const std::string missing{"<missing>"};
    return missing;
}

}  // namespace

TEST(Report, AttributeOrderIsStable) {
    const auto a = report::to_attributes(sample(), 0min);
    ASSERT_GE(a.size(), 4u);
    EXPECT_EQ(a[0].first, "state");
    EXPECT_EQ(a[1].first, "day");
    EXPECT_EQ(a[2].first, "window_count");
    EXPECT_EQ(a[3].first, "cheapest_times");
    EXPECT_EQ(a.back().first, "net_price_per_kwh");
}

TEST(Report, RendersValues) {
    const auto a = report::to_attributes(sample(), 0min);
    EXPECT_EQ(value_of(a, "state"), "charge");
    EXPECT_EQ(value_of(a, "day"), "2025-03-10");
    EXPECT_EQ(value_of(a, "window_count"), "96");
    EXPECT_EQ(value_of(a, "cheapest_prices"), "[0.10000, 0.12346]");
    EXPECT_EQ(value_of(a, "expensive_prices"), "[]");
    EXPECT_EQ(value_of(a, "avg_cheap_price"), "0.11100");
    EXPECT_EQ(value_of(a, "avg_expensive_price"), "none");
    EXPECT_EQ(value_of(a, "spread_percentage"), "42.0");
    EXPECT_EQ(value_of(a, "spread_met"), "true");
    EXPECT_EQ(value_of(a, "discharge_spread_met"), "false");
    EXPECT_EQ(value_of(a, "net_kwh"), "-1.500");
}

TEST(Report, TimesCarryLocalOffset) {
    const auto r = sample();
    const auto utc = report::to_attributes(r, 0min);
    EXPECT_EQ(value_of(utc, "cheapest_times"),
              "[2025-03-10T02:00:00+00:00, 2025-03-10T03:00:00+00:00]");

    const auto cet = report::to_attributes(r, 60min);
    EXPECT_EQ(value_of(cet, "cheapest_times"),
              "[2025-03-10T03:00:00+01:00, 2025-03-10T04:00:00+01:00]");
}

TEST(Report, TextSummaryHasHeaderAndEveryAttribute) {
    const auto r    = sample();
    const auto text = report::to_string(r, 0min);
    EXPECT_EQ(text.rfind("Cheapest Energy Windows", 0), 0u);
    EXPECT_NE(text.find("state: charge"), std::string::npos);
    for (const auto& [name, _] : report::to_attributes(r, 0min)) {
        EXPECT_NE(text.find(name), std::string::npos) << name;
    }
}
