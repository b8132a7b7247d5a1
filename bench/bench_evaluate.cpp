/**
 * @file  bench/bench_evaluate.cpp
 * @brief Google Benchmark suite for the window computation.
 *
 * Benchmarks
 * ----------
 *   BM_Compute_QuarterHour   — full pipeline on a 96-window day
 *   BM_Compute_Hourly        — same day aggregated to 24 windows
 *   BM_Evaluate_CacheHit     — fingerprinting plus a cache lookup
 *   BM_Normalize             — normalization alone
 *
 * Build (CMake):
 *   cmake -DCEW_BENCH=ON ..
 *   cmake --build build --target bench_evaluate
 *   ./build/bench_evaluate --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "cew/engine.hpp"
#include "cew/normalizer.hpp"

#include <chrono>
#include <cmath>
#include <numbers>
#include <vector>

using namespace cew;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const LocalDay BENCH_DAY = std::chrono::sys_days{std::chrono::year{2025} / 1 / 15};

/// A two-humped day: cheap night and midday, expensive morning and evening.
static RawPriceSeries make_day() {
    RawPriceSeries raw;
    Timestamp t{BENCH_DAY};
    for (int q = 0; q < 96; ++q) {
        const double x = static_cast<double>(q) / 96.0;
        const double p = 0.25 + 0.10 * std::sin(4.0 * std::numbers::pi * x - 0.5 * std::numbers::pi);
        raw.push_back(RawPrice{.start = t, .value = p, .unit = PriceUnit::PerKWh});
        t += std::chrono::minutes{15};
    }
    return raw;
}

static const Timestamp BENCH_NOW = Timestamp{BENCH_DAY} + std::chrono::hours{17};

// ── Benchmarks ─────────────────────────────────────────────────────────────────

static void BM_Compute_QuarterHour(benchmark::State& state) {
    const auto raw = make_day();
    const Settings s;
    const Engine engine;
    for (auto _ : state) {
        auto r = engine.compute(raw, s, BENCH_NOW, BENCH_DAY);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 96);
}
BENCHMARK(BM_Compute_QuarterHour)->Unit(benchmark::kMicrosecond);

static void BM_Compute_Hourly(benchmark::State& state) {
    const auto raw = make_day();
    Settings s;
    s.window_duration = WindowDuration::Hour;
    const Engine engine;
    for (auto _ : state) {
        auto r = engine.compute(raw, s, BENCH_NOW, BENCH_DAY);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 96);
}
BENCHMARK(BM_Compute_Hourly)->Unit(benchmark::kMicrosecond);

static void BM_Evaluate_CacheHit(benchmark::State& state) {
    const auto raw = make_day();
    const Settings s;
    const Engine engine;
    auto cache = engine.make_cache();
    (void)engine.evaluate(raw, {}, s, BENCH_NOW, *cache);
    for (auto _ : state) {
        auto r = engine.evaluate(raw, {}, s, BENCH_NOW, *cache);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Evaluate_CacheHit)->Unit(benchmark::kMicrosecond);

static void BM_Normalize(benchmark::State& state) {
    const auto raw = make_day();
    const Settings s;
    for (auto _ : state) {
        auto w = PriceNormalizer::normalize(raw, s);
        benchmark::DoNotOptimize(w);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 96);
}
BENCHMARK(BM_Normalize)->Unit(benchmark::kMicrosecond);
