/// @file tests/core/test_time_utils.cpp
/// @brief Unit tests for local-day arithmetic and ISO-8601 helpers.
///
/// Test categories:
///   - Time-of-day parsing and formatting
///   - Local day / local midnight under non-zero offsets
///   - Overnight ranges in in_range
///   - ISO-8601 parsing with and without zone designators
///   - ISO-8601 formatting with the local offset

#include <gtest/gtest.h>
#include "cew/time_utils.hpp"
#include "../test_helpers.hpp"

#include <cstdlib>
#include <ctime>
#include <string>

using namespace cew;
using namespace cew::time;
using namespace cew::test;

namespace {

TimeOfDay tod(int hh, int mm) {
    return TimeOfDay{std::chrono::minutes{hh * 60 + mm}};
}

}  // namespace

// ─── Time of day ─────────────────────────────────────────────────────────────

TEST(TimeOfDay, ParsesHoursAndMinutes) {
    auto t = parse_time_of_day("06:30");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->since_midnight.count(), 390);
}

TEST(TimeOfDay, SecondsAreAcceptedAndDropped) {
    auto t = parse_time_of_day("23:59:59");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->since_midnight.count(), 23 * 60 + 59);
}

TEST(TimeOfDay, RejectsMalformedText) {
    EXPECT_FALSE(parse_time_of_day("24:00").has_value());
    EXPECT_FALSE(parse_time_of_day("6:30").has_value());
    EXPECT_FALSE(parse_time_of_day("06:60").has_value());
    EXPECT_FALSE(parse_time_of_day("06:30x").has_value());
    EXPECT_FALSE(parse_time_of_day("").has_value());
}

TEST(TimeOfDay, FormatsWithLeadingZeros) {
    EXPECT_EQ(format_time_of_day(tod(6, 5)), "06:05");
    EXPECT_EQ(format_time_of_day(tod(0, 0)), "00:00");
}

// ─── Local day ───────────────────────────────────────────────────────────────

TEST(LocalDay, PositiveOffsetMovesLateUtcIntoNextDay) {
    // 23:30 UTC on the 9th is 00:30 on the 10th at +01:00.
    const Timestamp t = Timestamp{DAY} - 30min;
    EXPECT_EQ(local_day(t, 60min), DAY);
    EXPECT_EQ(local_day(t, 0min), DAY - std::chrono::days{1});
}

TEST(LocalDay, LocalMidnightSubtractsOffset) {
    EXPECT_EQ(local_midnight(DAY, 60min), Timestamp{DAY} - 60min);
    EXPECT_EQ(local_midnight(DAY, -300min), Timestamp{DAY} + 300min);
}

TEST(LocalDay, TimeOfDayUsesLocalClock) {
    EXPECT_EQ(time_of_day(at(12, 15), 0min), tod(12, 15));
    EXPECT_EQ(time_of_day(at(12, 15), 120min), tod(14, 15));
    EXPECT_EQ(time_of_day(at(23, 0), 120min), tod(1, 0));
}

// ─── in_range ────────────────────────────────────────────────────────────────

TEST(InRange, DaytimeRangeIsHalfOpen) {
    EXPECT_TRUE(in_range(tod(8, 0), tod(8, 0), tod(17, 0)));
    EXPECT_TRUE(in_range(tod(16, 59), tod(8, 0), tod(17, 0)));
    EXPECT_FALSE(in_range(tod(17, 0), tod(8, 0), tod(17, 0)));
    EXPECT_FALSE(in_range(tod(7, 59), tod(8, 0), tod(17, 0)));
}

TEST(InRange, OvernightRangeWrapsPastMidnight) {
    EXPECT_TRUE(in_range(tod(23, 0), tod(22, 0), tod(6, 0)));
    EXPECT_TRUE(in_range(tod(0, 0), tod(22, 0), tod(6, 0)));
    EXPECT_TRUE(in_range(tod(5, 59), tod(22, 0), tod(6, 0)));
    EXPECT_FALSE(in_range(tod(6, 0), tod(22, 0), tod(6, 0)));
    EXPECT_FALSE(in_range(tod(12, 0), tod(22, 0), tod(6, 0)));
}

TEST(InRange, EmptyRangeContainsNothing) {
    EXPECT_FALSE(in_range(tod(10, 0), tod(10, 0), tod(10, 0)));
}

// ─── ISO-8601 ────────────────────────────────────────────────────────────────

TEST(Iso8601, ParsesUtcDesignator) {
    auto t = parse_iso8601("2025-03-10T12:00:00Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, at(12));
}

TEST(Iso8601, ParsesExplicitOffset) {
    auto a = parse_iso8601("2025-03-10T12:00:00+01:00");
    auto b = parse_iso8601("2025-03-10T12:00+0100");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, at(11));
    EXPECT_EQ(*a, *b);
}

TEST(Iso8601, MissingDesignatorUsesDefaultOffset) {
    auto t = parse_iso8601("2025-03-10 12:00", 60min);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, at(11));
}

TEST(Iso8601, ToleratesQuotesAndFractions) {
    auto t = parse_iso8601("\"2025-03-10T12:00:00.250Z\"");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, at(12));
}

TEST(Iso8601, RejectsInvalidDates) {
    EXPECT_FALSE(parse_iso8601("2025-02-30T00:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("2025-03-10T25:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("2025-03-10T12:00:00Zjunk").has_value());
}

TEST(Iso8601, FormatsInLocalZone) {
    EXPECT_EQ(format_iso8601(at(12), 60min), "2025-03-10T13:00:00+01:00");
    EXPECT_EQ(format_iso8601(at(2), -330min), "2025-03-09T20:30:00-05:30");
}

TEST(Iso8601, FormattingIgnoresHostZone) {
    const char* saved = std::getenv("TZ");
    const std::string previous = saved ? saved : "";
    ::setenv("TZ", "America/New_York", 1);
    ::tzset();

    const auto text = format_iso8601(at(0, 30), 0min);
    const auto day  = format_day(DAY);

    if (saved) {
        ::setenv("TZ", previous.c_str(), 1);
    } else {
        ::unsetenv("TZ");
    }
    ::tzset();

    EXPECT_EQ(text, "2025-03-10T00:30:00+00:00");
    EXPECT_EQ(day, "2025-03-10");
}

TEST(Iso8601, NegativeOffsetWithoutSeconds) {
    const auto t = parse_iso8601("2025-03-10T07:00-05:00");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, at(12));
}

TEST(Iso8601, FormatParseIdentity) {
    const Timestamp t = at(17, 45);
    EXPECT_EQ(parse_iso8601(format_iso8601(t, 120min)), t);
}

TEST(Iso8601, FormatDay) {
    EXPECT_EQ(format_day(DAY), "2025-03-10");
}
