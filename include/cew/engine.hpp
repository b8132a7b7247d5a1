#pragma once

/// @file include/cew/engine.hpp
/// @brief Engine — public entry point of the window computation.
///
/// # Module: Engine
///
/// ## Responsibility
/// Orchestrate the pipeline for one local day:
///   raw prices → PriceNormalizer → calculation-window filter →
///   PercentileClassifier → WindowSelector → EconomicsEvaluator →
///   StateResolver → ClassificationResult
/// and memoize it in a ResultCache.
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// ResultCache cache;
/// auto today = DataLoader::load_csv("today.csv");
/// if (today) {
///     auto result = engine.evaluate(*today, {}, settings, now, cache);
///     fmt::print("{}\n", report::to_string(result, settings.utc_offset));
/// }
/// ```
///
/// ## Guarantees
/// - Deterministic: equal inputs give equal results
/// - `compute` has no side effects; `evaluate` touches only the cache
/// - Safe to call concurrently from several threads on a shared cache

#include "cew/cache.hpp"
#include "cew/constants.hpp"
#include "cew/result.hpp"
#include "cew/settings.hpp"
#include "cew/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>

namespace cew {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Engine-level options, independent of the user Settings.
struct EngineConfig {
    /// If true, emit one-line diagnostics to stderr.
    bool verbose = false;

    /// Lifetime of cache entries created through `make_cache`.
    std::chrono::seconds cache_ttl = constants::DEFAULT_CACHE_TTL;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Run the uncached pipeline for `day`.
    ///
    /// # Arguments
    /// * `raw`  — one day of upstream prices; empty means "not published"
    /// * `now`  — instant used for the current state and completed windows
    /// * `day`  — local day the series must cover
    ///
    /// # Throws
    /// - InvalidSettings if `settings` fails validation
    /// - MalformedSeries if `raw` does not form `day`
    [[nodiscard]] ClassificationResult
    compute(std::span<const RawPrice> raw,
            const Settings& settings,
            Timestamp now,
            LocalDay day) const;

    /// Today's result, served from `cache` when fresh.
    ///
    /// `tomorrow` is part of the cache key only; publishing tomorrow's
    /// prices invalidates today's entry but does not change its content.
    [[nodiscard]] ClassificationResult
    evaluate(std::span<const RawPrice> today,
             std::span<const RawPrice> tomorrow,
             const Settings& settings,
             Timestamp now,
             ResultCache& cache) const;

    /// Tomorrow's planned windows. An empty `tomorrow` yields a zero-window
    /// result for the next day.
    [[nodiscard]] ClassificationResult
    evaluate_tomorrow(std::span<const RawPrice> tomorrow,
                      std::span<const RawPrice> today,
                      const Settings& settings,
                      Timestamp now,
                      ResultCache& cache) const;

    /// A cache using this engine's TTL.
    [[nodiscard]] std::unique_ptr<ResultCache>
    make_cache(ResultCache::ClockFn clock = {}) const;

    /// Index of the local window slot containing `now` since the epoch.
    [[nodiscard]] static std::int64_t
    window_slot(Timestamp now, const Settings& settings) noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] ClassificationResult
    evaluate_day(std::span<const RawPrice> primary,
                 std::span<const RawPrice> secondary,
                 const Settings& settings,
                 Timestamp now,
                 LocalDay day,
                 ResultCache& cache) const;

    EngineConfig config_;
};

}  // namespace cew
