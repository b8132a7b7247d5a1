#pragma once

/// @file include/cew/selector.hpp
/// @brief WindowSelector — progressive growth of the charge, discharge and
///        aggressive-discharge sets.
///
/// # Module: Progressive Window Selector
///
/// ## The Core Idea
/// Walk each candidate list from its most extreme price inward and admit a
/// window only if the set average *with* it still leaves a profitable spread
/// against the other side. Selection is monotone: a rejected candidate is
/// skipped and never reconsidered.
///
/// ## Efficiency
/// Round-trip loss makes stored energy dearer. Every spread check uses the
/// effective charge price
///
///   cheap_eff = cheap · 100 / round_trip_efficiency_pct
///
/// ## Spread of a pair
///   spread(cheap, exp) = (exp − cheap) / |cheap| · 100        (cheap ≠ 0)
///
/// A pair clears threshold T when spread ≥ T and exp − cheap ≥
/// min_price_difference. At cheap = 0 the percentage is undefined and the
/// pair clears iff exp > cheap (and the absolute gap is large enough).
///
/// ## Passes
/// 1. Charge (skipped when charge_window_count = 0): reference = mean of the
///    first min(E, |expensive|) expensive candidates (all of them when E = 0);
///    admit while spread(avg_with_candidate · eff, reference) clears
///    min_spread_pct.
/// 2. Discharge: skip windows already charging. With no charge windows admit
///    the top E candidates outright; otherwise admit while
///    spread(charge_avg · eff, avg_with_candidate) clears discharge_spread_pct.
/// 3. Aggressive: re-label discharge windows whose own price clears
///    aggressive_spread_pct against the cheap reference. Never adds windows.
///
/// ## Guarantees
/// - Sets are disjoint; aggressive ⊆ discharge
/// - |charge| ≤ charge_window_count, |discharge| ≤ expensive_window_count
/// - Deterministic; result indices are chronological

#include "cew/classifier.hpp"
#include "cew/settings.hpp"
#include "cew/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace cew {

/// Result of one selection run. Indices refer to the classified series.
struct Selection {
    std::vector<std::size_t> charge;       ///< chronological
    std::vector<std::size_t> discharge;    ///< chronological
    std::vector<std::size_t> aggressive;   ///< chronological, ⊆ discharge

    /// Un-inflated cheap price the aggressive test was made against.
    std::optional<double> cheap_reference;

    std::size_t charge_rejected    = 0;  ///< candidates refused by the spread gate
    std::size_t discharge_rejected = 0;  ///< candidates refused by the spread gate
};

/// Stateless progressive selector.
class WindowSelector {
public:
    /// Percentage spread of `expensive` over `cheap`.
    ///
    /// # Returns
    /// `nullopt` when |cheap| is below PRICE_EPSILON.
    [[nodiscard]] static std::optional<double>
    spread_pct(double cheap, double expensive) noexcept;

    /// True if the pair clears `threshold_pct` and `min_difference`.
    [[nodiscard]] static bool
    clears(double cheap, double expensive,
           double threshold_pct, double min_difference) noexcept;

    /// Run all three passes.
    [[nodiscard]] static Selection
    select(std::span<const PriceWindow> windows,
           const Classification& classes,
           const Settings& settings);

private:
    [[nodiscard]] static std::vector<std::size_t>
    select_charge(std::span<const PriceWindow> windows,
                  const Classification& classes,
                  const Settings& settings,
                  std::size_t& rejected);

    [[nodiscard]] static std::vector<std::size_t>
    select_discharge(std::span<const PriceWindow> windows,
                     const Classification& classes,
                     const std::vector<std::size_t>& charge,
                     const Settings& settings,
                     std::size_t& rejected);
};

}  // namespace cew
