#pragma once

/// @file include/cew/normalizer.hpp
/// @brief PriceNormalizer — turns an upstream price feed into one day of
///        uniform, all-in price windows.
///
/// # Module: Price Normalizer
///
/// ## Responsibility
/// Convert a heterogeneous raw series (15- or 60-minute points, per-kWh or
/// per-MWh values, any storage order) into an ordered `WindowSeries` at the
/// configured window duration.
///
/// ## Formula
/// For each raw point, after converting to currency/kWh:
///   price = base · (1 + vat_pct/100) + tax_per_kwh + additional_cost_per_kwh
///
/// Hourly windows built from quarter-hours take the arithmetic mean of the
/// four all-in prices; the window starts at the first quarter-hour.
///
/// ## Edge Cases
/// - Empty input (prices not published yet): returns an empty series
/// - Duplicate timestamps, uneven spacing, wrong count, day not starting at
///   local midnight, target finer than native: throws MalformedSeries
///
/// ## Guarantees
/// - Output is sorted, contiguous and covers exactly one local day
/// - Output does not depend on the storage order of the input

#include "cew/settings.hpp"
#include "cew/types.hpp"

#include <span>

namespace cew {

/// Cost components added on top of the market price.
struct PriceComposition {
    double vat_pct                 = 0.0;
    double tax_per_kwh             = 0.0;
    double additional_cost_per_kwh = 0.0;

    /// Composition taken from a Settings object.
    [[nodiscard]] static PriceComposition from(const Settings& s) noexcept {
        return PriceComposition{
            .vat_pct                 = s.vat_pct,
            .tax_per_kwh             = s.tax_per_kwh,
            .additional_cost_per_kwh = s.additional_cost_per_kwh,
        };
    }

    /// All-in per-kWh price of one raw point.
    [[nodiscard]] double apply(const RawPrice& raw) const noexcept;
};

/// Stateless normalizer from raw feed to window series.
class PriceNormalizer {
public:
    /// Normalize one day of raw prices.
    ///
    /// # Arguments
    /// * `raw`         — upstream points, any order
    /// * `target`      — window duration to produce
    /// * `composition` — VAT / tax / additional cost
    /// * `utc_offset`  — local zone offset defining the calendar day
    ///
    /// # Returns
    /// 96 or 24 windows, or an empty series when `raw` is empty.
    ///
    /// # Throws
    /// MalformedSeries when the day cannot be laid out contiguously.
    [[nodiscard]] static WindowSeries
    normalize(std::span<const RawPrice> raw,
              WindowDuration target,
              const PriceComposition& composition,
              std::chrono::minutes utc_offset);

    /// Shorthand taking every parameter from `settings`.
    [[nodiscard]] static WindowSeries
    normalize(std::span<const RawPrice> raw, const Settings& settings);

    /// Keep only windows whose local start time lies in the calculation
    /// window. Returns `windows` unchanged when no calculation window is set.
    [[nodiscard]] static WindowSeries
    restrict_to(const WindowSeries& windows,
                const std::optional<CalculationWindow>& calc,
                std::chrono::minutes utc_offset);

private:
    /// Check the sorted series forms one contiguous local day at `step`.
    static void check_coverage(const WindowSeries& sorted,
                               std::chrono::minutes step,
                               std::chrono::minutes utc_offset);

    /// Average each run of `group` consecutive windows into one.
    [[nodiscard]] static WindowSeries
    aggregate(const WindowSeries& fine, std::size_t group);
};

}  // namespace cew
