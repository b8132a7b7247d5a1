/// @file tests/core/test_data_loader.cpp
/// @brief Unit tests for the CSV price loader and the settings file loader.

#include <gtest/gtest.h>
#include "cew/data_loader.hpp"
#include "cew/errors.hpp"
#include "../test_helpers.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace cew;
using namespace cew::test;

// ─── CSV ─────────────────────────────────────────────────────────────────────

TEST(DataLoaderCsv, ParsesRowsAndSkipsHeader) {
    const std::string csv =
        "start,value,unit\n"
        "2025-03-10T00:00:00Z,0.10,kwh\n"
        "2025-03-10T00:15:00Z,95.5,mwh\n"
        "2025-03-10T00:30:00Z,0.12\n";
    const auto points = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[0].start, at(0));
    EXPECT_DOUBLE_EQ(points[0].value, 0.10);
    EXPECT_EQ(points[0].unit, PriceUnit::PerKWh);
    EXPECT_EQ(points[1].unit, PriceUnit::PerMWh);
    EXPECT_DOUBLE_EQ(points[1].value, 95.5);
    EXPECT_EQ(points[2].start, at(0, 30));
}

TEST(DataLoaderCsv, SkipsMalformedRows) {
    const std::string csv =
        "start,value\n"
        "2025-03-10T00:00:00Z,0.10\n"
        "not-a-time,0.11\n"
        "2025-03-10T00:30:00Z,abc\n"
        "2025-03-10T00:45:00Z,nan\n"
        "2025-03-10T01:00:00Z,0.2,gwh\n"
        "\n"
        "# comment\n"
        "2025-03-10T01:15:00Z,0.13\n";
    const auto points = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(points.size(), 2u);
    EXPECT_DOUBLE_EQ(points[1].value, 0.13);
}

TEST(DataLoaderCsv, HandlesCrlfAndNegativePrices) {
    const std::string csv =
        "start,value\r\n"
        "2025-03-10T00:00:00Z,-0.0312\r\n";
    const auto points = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(points.size(), 1u);
    EXPECT_DOUBLE_EQ(points[0].value, -0.0312);
}

TEST(DataLoaderCsv, LocalTimestampsUseDefaultOffset) {
    const std::string csv = "start,value\n2025-03-10 01:00,0.2\n";
    const auto points = DataLoader::parse_csv_string(csv, std::chrono::minutes{60});
    ASSERT_EQ(points.size(), 1u);
    EXPECT_EQ(points[0].start, at(0));
}

TEST(DataLoaderCsv, EmptyAndHeaderOnlyInput) {
    EXPECT_TRUE(DataLoader::parse_csv_string("").empty());
    EXPECT_TRUE(DataLoader::parse_csv_string("start,value\n").empty());
}

TEST(DataLoaderCsv, MissingFileReturnsNullopt) {
    EXPECT_FALSE(DataLoader::load_csv("/nonexistent/cew/prices.csv").has_value());
}

TEST(DataLoaderCsv, LoadsFromDisk) {
    const std::string path = ::testing::TempDir() + "cew_loader_test.csv";
    {
        std::ofstream out(path);
        out << "start,value\n2025-03-10T00:00:00Z,0.25\n";
    }
    const auto points = DataLoader::load_csv(path);
    ASSERT_TRUE(points.has_value());
    ASSERT_EQ(points->size(), 1u);
    EXPECT_DOUBLE_EQ((*points)[0].value, 0.25);
    std::remove(path.c_str());
}

// ─── Settings ────────────────────────────────────────────────────────────────

TEST(DataLoaderSettings, ParsesEveryKind) {
    const std::string text =
        "# battery\n"
        "window_duration = 60\n"
        "charge_window_count = 6   # cheap hours\n"
        "expensive_window_count=3\n"
        "cheap_percentile = 30\n"
        "round_trip_efficiency_pct = 85.5\n"
        "price_override = 0.05\n"
        "discharge_price_override = none\n"
        "time_override = charge 01:00-03:00\n"
        "time_override = discharge_aggressive 18:00-19:00\n"
        "automation_enabled = off\n"
        "calculation_window = 22:00-06:00\n"
        "utc_offset = +01:00\n";
    const Settings s = DataLoader::parse_settings_string(text);

    EXPECT_EQ(s.window_duration, WindowDuration::Hour);
    EXPECT_EQ(s.charge_window_count, 6);
    EXPECT_EQ(s.expensive_window_count, 3);
    EXPECT_DOUBLE_EQ(s.cheap_percentile, 30.0);
    EXPECT_DOUBLE_EQ(s.round_trip_efficiency_pct, 85.5);
    ASSERT_TRUE(s.price_override.has_value());
    EXPECT_DOUBLE_EQ(*s.price_override, 0.05);
    EXPECT_FALSE(s.discharge_price_override.has_value());
    ASSERT_EQ(s.time_overrides.size(), 2u);
    EXPECT_EQ(s.time_overrides[0].mode, OverrideMode::Charge);
    EXPECT_EQ(s.time_overrides[0].start.since_midnight.count(), 60);
    EXPECT_EQ(s.time_overrides[1].mode, OverrideMode::DischargeAggressive);
    EXPECT_FALSE(s.automation_enabled);
    ASSERT_TRUE(s.calculation_window.has_value());
    EXPECT_EQ(s.calculation_window->start.since_midnight.count(), 22 * 60);
    EXPECT_EQ(s.utc_offset.count(), 60);
}

TEST(DataLoaderSettings, UnspecifiedKeysKeepBase) {
    Settings base;
    base.min_spread_pct = 33.0;
    const Settings s = DataLoader::parse_settings_string("vat_pct = 9\n", base);
    EXPECT_DOUBLE_EQ(s.min_spread_pct, 33.0);
    EXPECT_DOUBLE_EQ(s.vat_pct, 9.0);
}

TEST(DataLoaderSettings, UnknownKeyThrows) {
    try {
        (void)DataLoader::parse_settings_string("turbo_mode = on\n");
        FAIL() << "expected InvalidSettings";
    } catch (const InvalidSettings& e) {
        EXPECT_EQ(e.field(), "turbo_mode");
    }
}

TEST(DataLoaderSettings, UnparsableValueThrows) {
    EXPECT_THROW((void)DataLoader::parse_settings_string("charge_window_count = many\n"),
                 InvalidSettings);
    EXPECT_THROW((void)DataLoader::parse_settings_string("time_override = charge 25:00-03:00\n"),
                 InvalidSettings);
    EXPECT_THROW((void)DataLoader::parse_settings_string("window_duration = 30\n"),
                 InvalidSettings);
}

TEST(DataLoaderSettings, LoadedSettingsAreValidated) {
    EXPECT_THROW((void)DataLoader::parse_settings_string("cheap_percentile = 140\n"),
                 InvalidSettings);
}

TEST(DataLoaderSettings, NegativeOffset) {
    const Settings s = DataLoader::parse_settings_string("utc_offset = -05:30\n");
    EXPECT_EQ(s.utc_offset.count(), -330);
}

TEST(DataLoaderSettings, MissingFileReturnsNullopt) {
    EXPECT_FALSE(DataLoader::load_settings("/nonexistent/cew/settings.conf").has_value());
}
