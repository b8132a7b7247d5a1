/// @file src/normalize/normalizer.cpp
/// @brief PriceNormalizer — raw feed to one contiguous day of windows.
///
/// Each normalize() call:
///   1. Applies unit conversion and VAT / tax / additional cost per point
///   2. Sorts by timestamp and rejects duplicates
///   3. Derives the native step and rejects uneven spacing
///   4. Checks the day starts at local midnight and has 1440/step points
///   5. Passes through, or averages runs of quarter-hours into hours

#include "cew/normalizer.hpp"
#include "cew/constants.hpp"
#include "cew/errors.hpp"
#include "cew/time_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <vector>

namespace cew {

// ─── PriceComposition ─────────────────────────────────────────────────────────

double PriceComposition::apply(const RawPrice& raw) const noexcept {
    const double base = raw.unit == PriceUnit::PerMWh
                            ? raw.value / constants::KWH_PER_MWH
                            : raw.value;
    return base * (1.0 + vat_pct / 100.0) + tax_per_kwh + additional_cost_per_kwh;
}

// ─── check_coverage ───────────────────────────────────────────────────────────

void PriceNormalizer::check_coverage(const WindowSeries& sorted,
                                     std::chrono::minutes step,
                                     std::chrono::minutes utc_offset) {
    const auto expected = static_cast<std::size_t>(std::chrono::days{1} / step);
    if (sorted.size() != expected) {
        throw MalformedSeries(fmt::format(
            "expected {} windows of {} min, got {}",
            expected, step.count(), sorted.size()));
    }

    const auto day      = time::local_day(sorted.front().start, utc_offset);
    const auto midnight = time::local_midnight(day, utc_offset);
    if (sorted.front().start != midnight) {
        throw MalformedSeries(fmt::format(
            "first window {} does not start at local midnight",
            time::format_iso8601(sorted.front().start, utc_offset)));
    }
}

// ─── aggregate ────────────────────────────────────────────────────────────────

WindowSeries PriceNormalizer::aggregate(const WindowSeries& fine, std::size_t group) {
    const std::size_t n_out = fine.size() / group;

    std::vector<double> prices;
    prices.reserve(fine.size());
    for (const auto& w : fine) prices.push_back(w.price);

    // Column j of the group×n_out view holds the quarter-hours of output j.
    const Eigen::Map<const Eigen::MatrixXd> grid(
        prices.data(),
        static_cast<Eigen::Index>(group),
        static_cast<Eigen::Index>(n_out));
    const Eigen::RowVectorXd means = grid.colwise().mean();

    WindowSeries out;
    out.reserve(n_out);
    for (std::size_t j = 0; j < n_out; ++j) {
        const auto& first = fine[j * group];
        out.push_back(PriceWindow{
            .start    = first.start,
            .duration = first.duration * static_cast<int>(group),
            .price    = means(static_cast<Eigen::Index>(j)),
        });
    }
    return out;
}

// ─── normalize ────────────────────────────────────────────────────────────────

WindowSeries PriceNormalizer::normalize(std::span<const RawPrice> raw,
                                        WindowDuration target,
                                        const PriceComposition& composition,
                                        std::chrono::minutes utc_offset) {
    if (raw.empty()) {
        // Not published yet: zero windows, not an error.
        return {};
    }
    if (raw.size() < 2) {
        throw MalformedSeries("a single point cannot cover a day");
    }

    WindowSeries sorted;
    sorted.reserve(raw.size());
    for (const auto& p : raw) {
        sorted.push_back(PriceWindow{
            .start    = p.start,
            .duration = std::chrono::minutes{0},
            .price    = composition.apply(p),
        });
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const PriceWindow& a, const PriceWindow& b) {
                         return a.start < b.start;
                     });

    const auto step_s = sorted[1].start - sorted[0].start;
    const auto step   = std::chrono::duration_cast<std::chrono::minutes>(step_s);
    if (step_s.count() <= 0) {
        throw MalformedSeries(fmt::format(
            "duplicate timestamp {}",
            time::format_iso8601(sorted[0].start, utc_offset)));
    }
    if (step != step_s ||
        (step != to_minutes(WindowDuration::QuarterHour) &&
         step != to_minutes(WindowDuration::Hour))) {
        throw MalformedSeries(fmt::format(
            "unsupported native granularity of {} s", step_s.count()));
    }

    for (std::size_t i = 1; i < sorted.size(); ++i) {
        const auto gap = sorted[i].start - sorted[i - 1].start;
        if (gap != step_s) {
            throw MalformedSeries(fmt::format(
                "{} between {} and {} (expected {} min)",
                gap.count() == 0 ? "duplicate timestamp" : "gap",
                time::format_iso8601(sorted[i - 1].start, utc_offset),
                time::format_iso8601(sorted[i].start, utc_offset),
                step.count()));
        }
    }
    for (auto& w : sorted) w.duration = step;

    check_coverage(sorted, step, utc_offset);

    const auto target_min = to_minutes(target);
    if (target_min == step) {
        return sorted;
    }
    if (target_min < step) {
        throw MalformedSeries(fmt::format(
            "cannot split {} min prices into {} min windows",
            step.count(), target_min.count()));
    }
    return aggregate(sorted, static_cast<std::size_t>(target_min / step));
}

WindowSeries PriceNormalizer::normalize(std::span<const RawPrice> raw,
                                        const Settings& settings) {
    return normalize(raw, settings.window_duration,
                     PriceComposition::from(settings), settings.utc_offset);
}

// ─── restrict_to ──────────────────────────────────────────────────────────────

WindowSeries PriceNormalizer::restrict_to(const WindowSeries& windows,
                                          const std::optional<CalculationWindow>& calc,
                                          std::chrono::minutes utc_offset) {
    if (!calc) {
        return windows;
    }
    WindowSeries kept;
    kept.reserve(windows.size());
    for (const auto& w : windows) {
        if (time::in_range(time::time_of_day(w.start, utc_offset), calc->start, calc->end)) {
            kept.push_back(w);
        }
    }
    return kept;
}

}  // namespace cew
