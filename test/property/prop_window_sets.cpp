/**
 * @file  prop_window_sets.cpp
 * @brief Property: selected window sets are bounded, disjoint and nested.
 *
 * Run with 1,000 random days:
 *   RC_PARAMS="max_success=1000" ./prop_window_sets
 *
 * For every day and every count / percentile setting:
 *   |charge| ≤ charge_window_count
 *   |discharge| ≤ expensive_window_count
 *   charge ∩ discharge = ∅
 *   aggressive ⊆ discharge
 *   every set is chronological
 */

#include <rapidcheck.h>

#include <algorithm>
#include <chrono>
#include <vector>

#include "cew/engine.hpp"

using namespace cew;
using namespace std::chrono_literals;

namespace {

const LocalDay DAY = std::chrono::sys_days{std::chrono::year{2025} / std::chrono::June / 2};

RawPriceSeries make_day(const std::vector<int>& cents) {
    RawPriceSeries raw;
    Timestamp t{DAY};
    for (int c : cents) {
        raw.push_back(RawPrice{.start = t, .value = c / 100.0, .unit = PriceUnit::PerKWh});
        t += 15min;
    }
    return raw;
}

bool chronological(const WindowSeries& w) {
    return std::is_sorted(w.begin(), w.end(),
                          [](const PriceWindow& a, const PriceWindow& b) {
                              return a.start < b.start;
                          }) &&
           std::adjacent_find(w.begin(), w.end(),
                              [](const PriceWindow& a, const PriceWindow& b) {
                                  return a.start == b.start;
                              }) == w.end();
}

bool contains(const WindowSeries& set, const PriceWindow& w) {
    return std::any_of(set.begin(), set.end(),
                       [&](const PriceWindow& x) { return x.start == w.start; });
}

}  // namespace

int main() {
    rc::check(
        "window_sets: caps, disjointness and aggressive subset hold",
        [] {
            const auto cents = *rc::gen::container<std::vector<int>>(
                96, rc::gen::inRange(-10, 60));

            Settings s;
            s.charge_window_count    = *rc::gen::inRange(0, 30);
            s.expensive_window_count = *rc::gen::inRange(0, 30);
            s.cheap_percentile       = *rc::gen::inRange(0, 101);
            s.expensive_percentile   = *rc::gen::inRange(0, 101);
            s.min_spread_pct         = *rc::gen::inRange(0, 60);
            s.window_duration        = *rc::gen::element(WindowDuration::QuarterHour,
                                                         WindowDuration::Hour);

            const Engine engine;
            const auto r = engine.compute(make_day(cents), s, Timestamp{DAY} + 23h, DAY);

            RC_ASSERT(r.charge_windows.size() <= static_cast<std::size_t>(s.charge_window_count));
            RC_ASSERT(r.discharge_windows.size() <= static_cast<std::size_t>(s.expensive_window_count));
            RC_ASSERT(chronological(r.charge_windows));
            RC_ASSERT(chronological(r.discharge_windows));
            RC_ASSERT(chronological(r.aggressive_discharge_windows));

            for (const auto& w : r.charge_windows) {
                RC_ASSERT(!contains(r.discharge_windows, w));
            }
            for (const auto& w : r.aggressive_discharge_windows) {
                RC_ASSERT(contains(r.discharge_windows, w));
            }
        }
    );

    return 0;
}
