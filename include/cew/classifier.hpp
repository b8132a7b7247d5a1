#pragma once

/// @file include/cew/classifier.hpp
/// @brief PercentileClassifier — price cutoffs and candidate lists.
///
/// # Module: Percentile Classifier
///
/// ## Quantile Method
/// Linear interpolation between closest ranks over the sorted day prices
/// v[0] ≤ … ≤ v[n−1]:
///
///   pos = p/100 · (n − 1)
///   q(p) = v[⌊pos⌋] + (pos − ⌊pos⌋) · (v[⌈pos⌉] − v[⌊pos⌋])
///
/// For 96 distinct prices 1..96 and p = 10: pos = 9.5, q = 10.5, so exactly
/// the ten cheapest windows are cheap candidates.
///
/// ## Cutoffs
///   cheap cutoff     = q(cheap_percentile)
///   expensive cutoff = q(100 − expensive_percentile)
///
/// A window is a cheap candidate iff price ≤ cheap cutoff and an expensive
/// candidate iff price ≥ expensive cutoff. With every price equal both
/// cutoffs coincide and every window is both.
///
/// ## Ordering
/// Candidate lists hold indices into the window series: cheap ascending by
/// price, expensive descending; equal prices keep the earlier window first.

#include "cew/settings.hpp"
#include "cew/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace cew {

/// Output of one classification pass.
struct Classification {
    std::optional<double>    cheap_cutoff;      ///< nullopt in discharge-only mode or empty day
    std::optional<double>    expensive_cutoff;  ///< nullopt on an empty day
    std::vector<std::size_t> cheap;             ///< indices, most extreme first
    std::vector<std::size_t> expensive;         ///< indices, most extreme first
    std::vector<bool>        is_cheap;          ///< per-window cheap candidacy flag
    std::vector<bool>        is_expensive;      ///< per-window expensive candidacy flag
};

/// Stateless percentile classifier.
class PercentileClassifier {
public:
    /// Quantile of `values` at percentile `p` ∈ [0, 100] (linear method).
    ///
    /// # Returns
    /// `nullopt` for empty input or p outside [0, 100].
    [[nodiscard]] static std::optional<double>
    quantile(std::span<const double> values, double p) noexcept;

    /// Classify one day of windows.
    ///
    /// Cheap candidates are not generated when `charge_window_count` is 0.
    [[nodiscard]] static Classification
    classify(std::span<const PriceWindow> windows, const Settings& settings);

    /// Mean of the day's prices strictly below q(p), or of the whole day
    /// when nothing lies below. `nullopt` on an empty day.
    [[nodiscard]] static std::optional<double>
    mean_below(std::span<const PriceWindow> windows, double p);
};

}  // namespace cew
