#pragma once

/// @file include/cew/economics.hpp
/// @brief EconomicsEvaluator — spread metrics and completed-window accounting.
///
/// # Module: Spread & Economics Evaluator
///
/// ## Spread
///   avg_cheap     = mean(charge prices)        (absent when empty)
///   avg_expensive = mean(discharge prices)     (absent when empty)
///   spread_pct    = (avg_expensive − avg_cheap) / |avg_cheap| · 100
///   effective     = same, with avg_cheap · 100 / round_trip_efficiency_pct
///
/// `spread_met` is forced true in discharge-only mode; otherwise it needs
/// both averages and an effective spread clearing min_spread_pct.
///
/// ## Accounting
/// Only windows whose end has passed count. Energy per window is
/// hours · power_kW.
///
///   net_kwh   = charged_kwh − discharged_kwh     (may be negative)
///   net_cost  = charge_cost − discharge_revenue  (negative = profit)
///   net_price = net_cost / |net_kwh|             (net_kwh ≠ 0)
///             = avg_expensive − avg_cheap        (otherwise, if defined)
///
/// The absolute value in the denominator keeps the sign of net_cost as the
/// profit/cost indicator.

#include "cew/settings.hpp"
#include "cew/types.hpp"

#include <optional>
#include <span>

namespace cew {

/// Aggregate price statistics over the selected sets.
struct SpreadSummary {
    std::optional<double> avg_cheap_price;
    std::optional<double> avg_expensive_price;
    std::optional<double> spread_pct;
    std::optional<double> effective_spread_pct;
    bool spread_met            = false;
    bool discharge_spread_met  = false;
    bool aggressive_spread_met = false;
};

/// Energy and money over completed windows.
struct EnergyAccount {
    int    completed_charge_windows    = 0;
    int    completed_discharge_windows = 0;
    double completed_charge_cost       = 0.0;
    double completed_discharge_revenue = 0.0;
    double actual_charged_kwh          = 0.0;
    double actual_discharged_kwh       = 0.0;
    double net_kwh                     = 0.0;
    double net_cost                    = 0.0;
    std::optional<double> net_price_per_kwh;
};

/// Stateless evaluator.
class EconomicsEvaluator {
public:
    /// Arithmetic mean of window prices; `nullopt` when empty.
    [[nodiscard]] static std::optional<double>
    average(std::span<const PriceWindow> windows) noexcept;

    /// Spread metrics for the selected sets.
    ///
    /// # Arguments
    /// * `cheap_reference` — price the aggressive test used; stands in for the
    ///                       charge average in the discharge/aggressive flags
    ///                       when nothing is charged.
    [[nodiscard]] static SpreadSummary
    summarize(std::span<const PriceWindow> charge,
              std::span<const PriceWindow> discharge,
              std::optional<double> cheap_reference,
              const Settings& settings) noexcept;

    /// Accounting over the actual (override-adjusted) windows ended by `now`.
    [[nodiscard]] static EnergyAccount
    account(std::span<const PriceWindow> actual_charge,
            std::span<const PriceWindow> actual_discharge,
            const SpreadSummary& spread,
            const Settings& settings,
            Timestamp now) noexcept;

    /// Effective price per kWh of today's net energy flow.
    [[nodiscard]] static std::optional<double>
    net_price_per_kwh(double net_cost,
                      double net_kwh,
                      std::optional<double> avg_cheap,
                      std::optional<double> avg_expensive) noexcept;
};

}  // namespace cew
