/// @file src/classify/classifier.cpp
/// @brief PercentileClassifier — linear-interpolation quantiles and
///        candidate generation.

#include "cew/classifier.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace cew {

namespace {

std::vector<double> prices_of(std::span<const PriceWindow> windows) {
    std::vector<double> v;
    v.reserve(windows.size());
    for (const auto& w : windows) v.push_back(w.price);
    return v;
}

}  // namespace

// ─── quantile ─────────────────────────────────────────────────────────────────

std::optional<double>
PercentileClassifier::quantile(std::span<const double> values, double p) noexcept {
    if (values.empty() || !std::isfinite(p) || p < 0.0 || p > 100.0) {
        return std::nullopt;
    }

    std::vector<double> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    const double pos  = p / 100.0 * static_cast<double>(sorted.size() - 1);
    const auto   lo   = static_cast<std::size_t>(std::floor(pos));
    const auto   hi   = std::min(lo + 1, sorted.size() - 1);
    const double frac = pos - static_cast<double>(lo);

    return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

// ─── classify ─────────────────────────────────────────────────────────────────

Classification
PercentileClassifier::classify(std::span<const PriceWindow> windows,
                               const Settings& settings) {
    Classification out;
    out.is_cheap.assign(windows.size(), false);
    out.is_expensive.assign(windows.size(), false);
    if (windows.empty()) {
        return out;
    }

    const auto prices = prices_of(windows);

    if (!settings.discharge_only()) {
        out.cheap_cutoff = quantile(prices, settings.cheap_percentile);
    }
    out.expensive_cutoff = quantile(prices, 100.0 - settings.expensive_percentile);

    for (std::size_t i = 0; i < windows.size(); ++i) {
        const double p = windows[i].price;
        if (out.cheap_cutoff && p <= *out.cheap_cutoff) {
            out.is_cheap[i] = true;
            out.cheap.push_back(i);
        }
        if (out.expensive_cutoff && p >= *out.expensive_cutoff) {
            out.is_expensive[i] = true;
            out.expensive.push_back(i);
        }
    }

    // Stable sorts over chronologically ordered indices: ties stay earliest-first.
    std::stable_sort(out.cheap.begin(), out.cheap.end(),
                     [&](std::size_t a, std::size_t b) {
                         return windows[a].price < windows[b].price;
                     });
    std::stable_sort(out.expensive.begin(), out.expensive.end(),
                     [&](std::size_t a, std::size_t b) {
                         return windows[a].price > windows[b].price;
                     });
    return out;
}

// ─── mean_below ───────────────────────────────────────────────────────────────

std::optional<double>
PercentileClassifier::mean_below(std::span<const PriceWindow> windows, double p) {
    if (windows.empty()) {
        return std::nullopt;
    }
    const auto prices = prices_of(windows);
    const auto cutoff = quantile(prices, p);

    std::vector<double> below;
    below.reserve(prices.size());
    for (double v : prices) {
        if (cutoff && v < *cutoff) below.push_back(v);
    }
    const auto& source = below.empty() ? prices : below;
    return ConstPriceMap(source.data(), static_cast<Eigen::Index>(source.size())).mean();
}

}  // namespace cew
