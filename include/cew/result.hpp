#pragma once

/// @file include/cew/result.hpp
/// @brief ClassificationResult — complete output of one window computation.
///
/// A result is produced whole by `Engine::compute` and never patched
/// afterwards; the cache hands out copies.

#include "cew/types.hpp"

#include <cstddef>
#include <optional>

namespace cew {

/// Window sets, spread statistics, accounting and state for one day.
struct ClassificationResult {
    LocalDay     day{};           ///< evaluated local day
    WindowSeries windows;         ///< the normalized day
    std::size_t  window_count = 0;

    // ── Planned sets (chronological) ─────────────────────────────────────────
    WindowSeries charge_windows;
    WindowSeries discharge_windows;
    WindowSeries aggressive_discharge_windows;  ///< ⊆ discharge_windows

    // ── Sets after overrides ──────────────────────────────────────────────────
    WindowSeries actual_charge_windows;
    WindowSeries actual_discharge_windows;

    // ── Spread ────────────────────────────────────────────────────────────────
    std::optional<double> avg_cheap_price;
    std::optional<double> avg_expensive_price;
    std::optional<double> spread_pct;
    std::optional<double> effective_spread_pct;
    bool spread_met            = false;
    bool discharge_spread_met  = false;
    bool aggressive_spread_met = false;

    // ── Current state ─────────────────────────────────────────────────────────
    OperatingState        current_state = OperatingState::Idle;
    std::optional<double> current_price;
    bool price_override_active = false;
    bool time_override_active  = false;

    // ── Completed-window accounting ───────────────────────────────────────────
    int    completed_charge_windows    = 0;
    int    completed_discharge_windows = 0;
    double completed_charge_cost       = 0.0;
    double completed_discharge_revenue = 0.0;
    double actual_charged_kwh          = 0.0;
    double actual_discharged_kwh       = 0.0;
    double net_kwh                     = 0.0;  ///< charged − discharged
    double net_cost                    = 0.0;  ///< negative = profit
    std::optional<double> net_price_per_kwh;

    friend bool operator==(const ClassificationResult&,
                           const ClassificationResult&) = default;
};

}  // namespace cew
