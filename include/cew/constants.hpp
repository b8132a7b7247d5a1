#pragma once

#include <chrono>
#include <cstddef>

/// @file include/cew/constants.hpp
/// @brief Defaults and numeric tolerances for the CEW engine.

namespace cew::constants {

// ─── Selection Defaults ───────────────────────────────────────────────────────

/// Default number of charge windows per day.
static constexpr int DEFAULT_CHARGE_WINDOWS = 4;

/// Default number of discharge windows per day.
static constexpr int DEFAULT_EXPENSIVE_WINDOWS = 4;

/// Default cheap / expensive tail widths (percent of the day).
static constexpr double DEFAULT_CHEAP_PERCENTILE     = 25.0;
static constexpr double DEFAULT_EXPENSIVE_PERCENTILE = 25.0;

/// Default spread thresholds (percent).
static constexpr double DEFAULT_MIN_SPREAD        = 10.0;
static constexpr double DEFAULT_DISCHARGE_SPREAD  = 20.0;
static constexpr double DEFAULT_AGGRESSIVE_SPREAD = 40.0;

/// Default absolute price gap every spread check must also clear (per kWh).
static constexpr double DEFAULT_MIN_PRICE_DIFFERENCE = 0.05;

// ─── Cost Composition Defaults ────────────────────────────────────────────────

static constexpr double DEFAULT_VAT_PCT         = 21.0;
static constexpr double DEFAULT_TAX_PER_KWH     = 0.12286;
static constexpr double DEFAULT_ADDITIONAL_COST = 0.02398;

// ─── Battery Defaults ─────────────────────────────────────────────────────────

static constexpr double DEFAULT_ROUND_TRIP_EFFICIENCY = 90.0;
static constexpr double DEFAULT_CHARGE_POWER_W        = 2400.0;
static constexpr double DEFAULT_DISCHARGE_POWER_W     = 2400.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Prices whose magnitude is below this are treated as zero in divisions.
static constexpr double PRICE_EPSILON = 1e-12;

/// Watts per kilowatt.
static constexpr double WATTS_PER_KW = 1000.0;

/// kWh per MWh.
static constexpr double KWH_PER_MWH = 1000.0;

// ─── Cache ────────────────────────────────────────────────────────────────────

/// Cache time-to-live: just under the host's one-minute polling interval.
static constexpr std::chrono::seconds DEFAULT_CACHE_TTL{55};

}  // namespace cew::constants
