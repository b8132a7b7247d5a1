/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV and settings parsers.
 *
 * Build:
 *   cmake -DCEW_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed price point carries a finite value.
 *   3. The settings parser either returns validated settings or throws
 *      InvalidSettings; no other exception escapes.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "cew/data_loader.hpp"
#include "cew/errors.hpp"

using namespace cew;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto points = DataLoader::parse_csv_string(input, std::chrono::minutes{0});
    for (const auto& p : points) {
        assert(std::isfinite(p.value));
    }

    try {
        const Settings s = DataLoader::parse_settings_string(input);
        assert(s.round_trip_efficiency_pct > 0.0);
        assert(s.charge_window_count >= 0);
    } catch (const InvalidSettings&) {
        // Rejected input is the expected outcome for most byte strings.
    }

    return 0;
}
