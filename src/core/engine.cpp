/// @file src/core/engine.cpp
/// @brief Engine — pipeline orchestration and cached evaluation.

#include "cew/engine.hpp"
#include "cew/classifier.hpp"
#include "cew/economics.hpp"
#include "cew/errors.hpp"
#include "cew/fingerprint.hpp"
#include "cew/normalizer.hpp"
#include "cew/selector.hpp"
#include "cew/state.hpp"
#include "cew/time_utils.hpp"

#include <fmt/core.h>

#include <utility>
#include <vector>

namespace cew {

namespace {

WindowSeries pick(const WindowSeries& windows, const std::vector<std::size_t>& idx) {
    WindowSeries out;
    out.reserve(idx.size());
    for (std::size_t i : idx) out.push_back(windows[i]);
    return out;
}

/// Position of each eligible window inside the full day. Both series are
/// chronological and `eligible` is a subsequence of `day`.
std::vector<std::size_t> origin_of(const WindowSeries& day, const WindowSeries& eligible) {
    std::vector<std::size_t> origin;
    origin.reserve(eligible.size());
    std::size_t j = 0;
    for (std::size_t i = 0; i < day.size() && j < eligible.size(); ++i) {
        if (day[i].start == eligible[j].start) {
            origin.push_back(i);
            ++j;
        }
    }
    return origin;
}

void remap(std::vector<std::size_t>& idx, const std::vector<std::size_t>& origin) {
    for (auto& i : idx) i = origin[i];
}

}  // namespace

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

// ─── Engine::compute ──────────────────────────────────────────────────────────

ClassificationResult
Engine::compute(std::span<const RawPrice> raw,
                const Settings& settings,
                Timestamp now,
                LocalDay day) const {
    validate(settings);

    // ── Step 1: Normalize to one local day ────────────────────────────────────
    WindowSeries windows = PriceNormalizer::normalize(raw, settings);
    if (!windows.empty()) {
        const LocalDay covered = time::local_day(windows.front().start, settings.utc_offset);
        if (covered != day) {
            throw MalformedSeries(fmt::format("series covers {}, expected {}",
                                              time::format_day(covered),
                                              time::format_day(day)));
        }
    }

    // ── Step 2: Calculation-window filter ─────────────────────────────────────
    const WindowSeries eligible =
        PriceNormalizer::restrict_to(windows, settings.calculation_window, settings.utc_offset);

    // ── Step 3: Candidates and progressive selection ──────────────────────────
    const Classification classes = PercentileClassifier::classify(eligible, settings);
    Selection selection = WindowSelector::select(eligible, classes, settings);

    // Selection indices refer to `eligible`; everything below works on the day.
    if (eligible.size() != windows.size()) {
        const auto origin = origin_of(windows, eligible);
        remap(selection.charge, origin);
        remap(selection.discharge, origin);
        remap(selection.aggressive, origin);
    }

    ClassificationResult result;
    result.day                          = day;
    result.window_count                 = windows.size();
    result.charge_windows               = pick(windows, selection.charge);
    result.discharge_windows            = pick(windows, selection.discharge);
    result.aggressive_discharge_windows = pick(windows, selection.aggressive);

    // ── Step 4: Spread ────────────────────────────────────────────────────────
    const SpreadSummary spread = EconomicsEvaluator::summarize(
        result.charge_windows, result.discharge_windows, selection.cheap_reference, settings);

    result.avg_cheap_price       = spread.avg_cheap_price;
    result.avg_expensive_price   = spread.avg_expensive_price;
    result.spread_pct            = spread.spread_pct;
    result.effective_spread_pct  = spread.effective_spread_pct;
    result.spread_met            = spread.spread_met;
    result.discharge_spread_met  = spread.discharge_spread_met;
    result.aggressive_spread_met = spread.aggressive_spread_met;

    // ── Step 5: Current state and actual timeline ─────────────────────────────
    StateResolution state =
        StateResolver::resolve(windows, selection, spread.spread_met, settings, now);
    if (now < time::local_midnight(day, settings.utc_offset)) {
        // The day has not started: nothing applies to it yet.
        state = StateResolution{};
        state.state = settings.automation_enabled ? OperatingState::Idle : OperatingState::Off;
    }
    result.current_state         = state.state;
    result.current_price         = state.current_price;
    result.price_override_active = state.price_override_active;
    result.time_override_active  = state.time_override_active;

    ActualTimeline actual = StateResolver::timeline(windows, selection, spread.spread_met, settings);

    // ── Step 6: Completed-window accounting ───────────────────────────────────
    const EnergyAccount account = EconomicsEvaluator::account(
        actual.charge, actual.discharge, spread, settings, now);

    result.completed_charge_windows    = account.completed_charge_windows;
    result.completed_discharge_windows = account.completed_discharge_windows;
    result.completed_charge_cost       = account.completed_charge_cost;
    result.completed_discharge_revenue = account.completed_discharge_revenue;
    result.actual_charged_kwh          = account.actual_charged_kwh;
    result.actual_discharged_kwh       = account.actual_discharged_kwh;
    result.net_kwh                     = account.net_kwh;
    result.net_cost                    = account.net_cost;
    result.net_price_per_kwh           = account.net_price_per_kwh;

    result.actual_charge_windows    = std::move(actual.charge);
    result.actual_discharge_windows = std::move(actual.discharge);
    result.windows                  = std::move(windows);

    if (config_.verbose) {
        fmt::print(stderr,
                   "[cew] {} windows={} eligible={} charge={} (rejected {}) "
                   "discharge={} (rejected {}) aggressive={} spread_met={} state={}\n",
                   time::format_day(day), result.window_count, eligible.size(),
                   result.charge_windows.size(), selection.charge_rejected,
                   result.discharge_windows.size(), selection.discharge_rejected,
                   result.aggressive_discharge_windows.size(), result.spread_met,
                   to_string(result.current_state));
    }
    return result;
}

// ─── Engine::evaluate / evaluate_tomorrow ─────────────────────────────────────

ClassificationResult
Engine::evaluate(std::span<const RawPrice> today,
                 std::span<const RawPrice> tomorrow,
                 const Settings& settings,
                 Timestamp now,
                 ResultCache& cache) const {
    const LocalDay day = time::local_day(now, settings.utc_offset);
    return evaluate_day(today, tomorrow, settings, now, day, cache);
}

ClassificationResult
Engine::evaluate_tomorrow(std::span<const RawPrice> tomorrow,
                          std::span<const RawPrice> today,
                          const Settings& settings,
                          Timestamp now,
                          ResultCache& cache) const {
    const LocalDay day = time::local_day(now, settings.utc_offset) + std::chrono::days{1};
    return evaluate_day(tomorrow, today, settings, now, day, cache);
}

ClassificationResult
Engine::evaluate_day(std::span<const RawPrice> primary,
                     std::span<const RawPrice> secondary,
                     const Settings& settings,
                     Timestamp now,
                     LocalDay day,
                     ResultCache& cache) const {
    validate(settings);

    const CacheKey key{
        .today    = fingerprint(primary),
        .tomorrow = fingerprint(secondary),
        .settings = fingerprint(settings),
        .day      = day,
    };
    const std::int64_t slot = window_slot(now, settings);

    bool hit = false;
    auto result = cache.get_or_compute(
        key, slot, [&] { return compute(primary, settings, now, day); }, &hit);

    if (config_.verbose) {
        fmt::print(stderr, "[cew] cache {} for {} (slot {}, {} entries)\n",
                   hit ? "hit" : "miss", time::format_day(day), slot, cache.size());
    }
    return result;
}

// ─── Engine helpers ───────────────────────────────────────────────────────────

std::unique_ptr<ResultCache> Engine::make_cache(ResultCache::ClockFn clock) const {
    return std::make_unique<ResultCache>(config_.cache_ttl, std::move(clock));
}

std::int64_t Engine::window_slot(Timestamp now, const Settings& settings) noexcept {
    const auto local = std::chrono::floor<std::chrono::minutes>(now) + settings.utc_offset;
    const auto step  = to_minutes(settings.window_duration).count();
    const auto m     = local.time_since_epoch().count();
    // Floor division so instants before the epoch still bucket correctly.
    return static_cast<std::int64_t>(m >= 0 ? m / step : (m - step + 1) / step);
}

}  // namespace cew
