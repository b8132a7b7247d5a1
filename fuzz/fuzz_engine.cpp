/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for the full Engine pipeline (end-to-end)
 *
 * Build:
 *   cmake -DCEW_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * The input bytes become one quarter-hour price per byte pair, so the fuzzer
 * explores malformed lengths as well as complete 96-point days.
 *
 * Safety invariants verified on every input:
 *   1. Either a result or MalformedSeries; nothing else escapes.
 *   2. charge and discharge sets are disjoint and within their caps.
 *   3. aggressive windows are a subset of discharge windows.
 *   4. net_kwh equals charged minus discharged energy.
 */

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include "cew/engine.hpp"
#include "cew/errors.hpp"

using namespace cew;

namespace {

bool contains(const WindowSeries& set, const PriceWindow& w) {
    return std::any_of(set.begin(), set.end(),
                       [&](const PriceWindow& x) { return x.start == w.start; });
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const LocalDay day = std::chrono::sys_days{std::chrono::year{2025} / 1 / 15};

    RawPriceSeries raw;
    Timestamp t{day};
    for (size_t i = 0; i + 1 < size; i += 2) {
        const int cents = static_cast<int>(data[i]) - 64;
        raw.push_back(RawPrice{.start = t, .value = cents / 100.0, .unit = PriceUnit::PerKWh});
        // A low nibble of 0xF repeats the timestamp to exercise duplicate rejection.
        if ((data[i + 1] & 0x0F) != 0x0F) t += std::chrono::minutes{15};
    }

    Settings s;
    if (size > 0) {
        s.charge_window_count    = data[0] % 12;
        s.expensive_window_count = data[size - 1] % 12;
    }

    const Engine engine;
    try {
        const auto r = engine.compute(raw, s, Timestamp{day} + std::chrono::hours{18}, day);

        assert(r.charge_windows.size() <= static_cast<size_t>(s.charge_window_count));
        assert(r.discharge_windows.size() <= static_cast<size_t>(s.expensive_window_count));
        for (const auto& w : r.charge_windows) {
            assert(!contains(r.discharge_windows, w));
        }
        for (const auto& w : r.aggressive_discharge_windows) {
            assert(contains(r.discharge_windows, w));
        }
        assert(std::abs(r.net_kwh - (r.actual_charged_kwh - r.actual_discharged_kwh)) < 1e-9);
    } catch (const MalformedSeries&) {
        // Partial, gapped or duplicated days are rejected.
    }

    return 0;
}
