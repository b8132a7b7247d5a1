/// @file src/select/selector.cpp
/// @brief WindowSelector — progressive charge/discharge selection.
///
/// Running sums keep each admission test O(1); the whole pass is linear in
/// the candidate count after the classifier's sort.

#include "cew/selector.hpp"
#include "cew/constants.hpp"

#include <algorithm>
#include <cmath>

namespace cew {

namespace {

double mean_of(std::span<const PriceWindow> windows,
               const std::vector<std::size_t>& idx) noexcept {
    double sum = 0.0;
    for (std::size_t i : idx) sum += windows[i].price;
    return sum / static_cast<double>(idx.size());
}

}  // namespace

// ─── spread_pct / clears ──────────────────────────────────────────────────────

std::optional<double>
WindowSelector::spread_pct(double cheap, double expensive) noexcept {
    if (std::abs(cheap) < constants::PRICE_EPSILON) {
        return std::nullopt;
    }
    // A negative cheap average yields a negative spread.
    return (expensive - cheap) / cheap * 100.0;
}

bool WindowSelector::clears(double cheap, double expensive,
                            double threshold_pct, double min_difference) noexcept {
    const double diff = expensive - cheap;
    if (diff < min_difference) {
        return false;
    }
    const auto pct = spread_pct(cheap, expensive);
    if (!pct) {
        return expensive > cheap;
    }
    return *pct >= threshold_pct;
}

// ─── charge pass ──────────────────────────────────────────────────────────────

std::vector<std::size_t>
WindowSelector::select_charge(std::span<const PriceWindow> windows,
                              const Classification& classes,
                              const Settings& settings,
                              std::size_t& rejected) {
    std::vector<std::size_t> selected;
    if (settings.discharge_only() || classes.cheap.empty() || classes.expensive.empty()) {
        return selected;
    }

    // The discharge average this charge set will be paired with.
    std::size_t pool = classes.expensive.size();
    if (!settings.charge_only()) {
        pool = std::min(pool, static_cast<std::size_t>(settings.expensive_window_count));
    }
    double ref_sum = 0.0;
    for (std::size_t k = 0; k < pool; ++k) {
        ref_sum += windows[classes.expensive[k]].price;
    }
    const double reference = ref_sum / static_cast<double>(pool);

    const auto cap    = static_cast<std::size_t>(settings.charge_window_count);
    const double eff  = settings.efficiency_factor();
    double       sum  = 0.0;

    for (std::size_t idx : classes.cheap) {
        if (selected.size() >= cap) break;

        const double tentative = (sum + windows[idx].price) /
                                 static_cast<double>(selected.size() + 1);
        if (clears(tentative * eff, reference,
                   settings.min_spread_pct, settings.min_price_difference)) {
            selected.push_back(idx);
            sum += windows[idx].price;
        } else {
            ++rejected;
        }
    }
    return selected;
}

// ─── discharge pass ───────────────────────────────────────────────────────────

std::vector<std::size_t>
WindowSelector::select_discharge(std::span<const PriceWindow> windows,
                                 const Classification& classes,
                                 const std::vector<std::size_t>& charge,
                                 const Settings& settings,
                                 std::size_t& rejected) {
    std::vector<std::size_t> selected;
    const auto cap = static_cast<std::size_t>(settings.expensive_window_count);
    if (cap == 0) {
        return selected;
    }

    std::vector<bool> charging(windows.size(), false);
    for (std::size_t i : charge) charging[i] = true;

    const bool   gated     = !charge.empty();
    const double cheap_eff = gated ? mean_of(windows, charge) * settings.efficiency_factor()
                                   : 0.0;
    double sum = 0.0;

    for (std::size_t idx : classes.expensive) {
        if (selected.size() >= cap) break;
        if (charging[idx]) continue;

        if (!gated) {
            selected.push_back(idx);
            continue;
        }

        const double tentative = (sum + windows[idx].price) /
                                 static_cast<double>(selected.size() + 1);
        if (clears(cheap_eff, tentative,
                   settings.discharge_spread_pct, settings.min_price_difference)) {
            selected.push_back(idx);
            sum += windows[idx].price;
        } else {
            ++rejected;
        }
    }
    return selected;
}

// ─── select ───────────────────────────────────────────────────────────────────

Selection WindowSelector::select(std::span<const PriceWindow> windows,
                                 const Classification& classes,
                                 const Settings& settings) {
    Selection out;
    if (windows.empty()) {
        return out;
    }

    out.charge    = select_charge(windows, classes, settings, out.charge_rejected);
    out.discharge = select_discharge(windows, classes, out.charge, settings,
                                     out.discharge_rejected);

    // Aggressive re-labelling against the charge average, or the day's lower
    // tail when nothing is charged.
    out.cheap_reference = out.charge.empty()
        ? PercentileClassifier::mean_below(windows, settings.expensive_percentile)
        : std::optional<double>{mean_of(windows, out.charge)};

    if (out.cheap_reference) {
        const double cheap_eff = *out.cheap_reference * settings.efficiency_factor();
        for (std::size_t idx : out.discharge) {
            if (clears(cheap_eff, windows[idx].price,
                       settings.aggressive_spread_pct, settings.min_price_difference)) {
                out.aggressive.push_back(idx);
            }
        }
    }

    std::sort(out.charge.begin(), out.charge.end());
    std::sort(out.discharge.begin(), out.discharge.end());
    std::sort(out.aggressive.begin(), out.aggressive.end());
    return out;
}

}  // namespace cew
