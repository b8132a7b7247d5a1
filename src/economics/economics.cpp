/// @file src/economics/economics.cpp
/// @brief EconomicsEvaluator — spread metrics and completed-window accounting.

#include "cew/economics.hpp"
#include "cew/constants.hpp"
#include "cew/selector.hpp"

#include <cmath>
#include <vector>

namespace cew {

// ─── average ──────────────────────────────────────────────────────────────────

std::optional<double>
EconomicsEvaluator::average(std::span<const PriceWindow> windows) noexcept {
    if (windows.empty()) {
        return std::nullopt;
    }
    PriceVector prices(static_cast<Eigen::Index>(windows.size()));
    for (std::size_t i = 0; i < windows.size(); ++i) {
        prices(static_cast<Eigen::Index>(i)) = windows[i].price;
    }
    return prices.mean();
}

// ─── summarize ────────────────────────────────────────────────────────────────

SpreadSummary
EconomicsEvaluator::summarize(std::span<const PriceWindow> charge,
                              std::span<const PriceWindow> discharge,
                              std::optional<double> cheap_reference,
                              const Settings& settings) noexcept {
    SpreadSummary out;
    out.avg_cheap_price     = average(charge);
    out.avg_expensive_price = average(discharge);

    const double eff = settings.efficiency_factor();

    if (out.avg_cheap_price && out.avg_expensive_price) {
        out.spread_pct = WindowSelector::spread_pct(*out.avg_cheap_price,
                                                    *out.avg_expensive_price);
        out.effective_spread_pct = WindowSelector::spread_pct(*out.avg_cheap_price * eff,
                                                              *out.avg_expensive_price);
        out.spread_met = WindowSelector::clears(*out.avg_cheap_price * eff,
                                                *out.avg_expensive_price,
                                                settings.min_spread_pct,
                                                settings.min_price_difference);
    }

    if (settings.discharge_only() || (charge.empty() && !discharge.empty())) {
        // No charge side, nothing to violate.
        out.spread_met = true;
    }

    const auto cheap = out.avg_cheap_price ? out.avg_cheap_price : cheap_reference;
    if (cheap && out.avg_expensive_price) {
        out.discharge_spread_met = WindowSelector::clears(
            *cheap * eff, *out.avg_expensive_price,
            settings.discharge_spread_pct, settings.min_price_difference);
        out.aggressive_spread_met = WindowSelector::clears(
            *cheap * eff, *out.avg_expensive_price,
            settings.aggressive_spread_pct, settings.min_price_difference);
    }
    return out;
}

// ─── account ──────────────────────────────────────────────────────────────────

EnergyAccount
EconomicsEvaluator::account(std::span<const PriceWindow> actual_charge,
                            std::span<const PriceWindow> actual_discharge,
                            const SpreadSummary& spread,
                            const Settings& settings,
                            Timestamp now) noexcept {
    EnergyAccount out;
    const double charge_kw    = settings.charge_power_w / constants::WATTS_PER_KW;
    const double discharge_kw = settings.discharge_power_w / constants::WATTS_PER_KW;

    for (const auto& w : actual_charge) {
        if (w.end() > now) continue;
        const double kwh = w.hours() * charge_kw;
        ++out.completed_charge_windows;
        out.actual_charged_kwh    += kwh;
        out.completed_charge_cost += w.price * kwh;
    }
    for (const auto& w : actual_discharge) {
        if (w.end() > now) continue;
        const double kwh = w.hours() * discharge_kw;
        ++out.completed_discharge_windows;
        out.actual_discharged_kwh       += kwh;
        out.completed_discharge_revenue += w.price * kwh;
    }

    // Unclamped: discharging more than was charged today draws on energy
    // already in the battery.
    out.net_kwh  = out.actual_charged_kwh - out.actual_discharged_kwh;
    out.net_cost = out.completed_charge_cost - out.completed_discharge_revenue;
    out.net_price_per_kwh = net_price_per_kwh(out.net_cost, out.net_kwh,
                                              spread.avg_cheap_price,
                                              spread.avg_expensive_price);
    return out;
}

// ─── net_price_per_kwh ────────────────────────────────────────────────────────

std::optional<double>
EconomicsEvaluator::net_price_per_kwh(double net_cost,
                                      double net_kwh,
                                      std::optional<double> avg_cheap,
                                      std::optional<double> avg_expensive) noexcept {
    if (std::abs(net_kwh) > constants::PRICE_EPSILON) {
        return net_cost / std::abs(net_kwh);
    }
    if (avg_cheap && avg_expensive) {
        return *avg_expensive - *avg_cheap;
    }
    return std::nullopt;
}

}  // namespace cew
