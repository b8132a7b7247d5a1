#pragma once

/// @file tests/test_helpers.hpp
/// @brief Synthetic price days shared by the GoogleTest suites.

#include "cew/settings.hpp"
#include "cew/types.hpp"

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

namespace cew::test {

using namespace std::chrono_literals;

/// 2025-03-10, a plain Monday without a DST change.
inline constexpr LocalDay DAY = std::chrono::sys_days{std::chrono::year{2025} /
                                                      std::chrono::March / 10};

/// Instant `hh:mm` local time on `day`.
inline Timestamp at(int hh, int mm = 0, LocalDay day = DAY,
                    std::chrono::minutes offset = 0min) {
    return Timestamp{day} - offset + std::chrono::hours{hh} + std::chrono::minutes{mm};
}

/// Settings that leave raw kWh prices untouched: no VAT, tax, surcharge or
/// minimum absolute difference, lossless round trip.
inline Settings plain_settings() {
    Settings s;
    s.vat_pct                   = 0.0;
    s.tax_per_kwh               = 0.0;
    s.additional_cost_per_kwh   = 0.0;
    s.min_price_difference      = 0.0;
    s.round_trip_efficiency_pct = 100.0;
    return s;
}

/// One raw kWh point per entry of `prices`, starting at local midnight.
inline RawPriceSeries make_raw(const std::vector<double>& prices,
                               std::chrono::minutes step = 15min,
                               LocalDay day = DAY,
                               std::chrono::minutes offset = 0min) {
    RawPriceSeries raw;
    raw.reserve(prices.size());
    Timestamp t = Timestamp{day} - offset;
    for (double p : prices) {
        raw.push_back(RawPrice{.start = t, .value = p, .unit = PriceUnit::PerKWh});
        t += step;
    }
    return raw;
}

/// Already-normalized windows, starting at local midnight.
inline WindowSeries make_windows(const std::vector<double>& prices,
                                 std::chrono::minutes step = 15min,
                                 LocalDay day = DAY) {
    WindowSeries out;
    out.reserve(prices.size());
    Timestamp t = Timestamp{day};
    for (double p : prices) {
        out.push_back(PriceWindow{.start = t, .duration = step, .price = p});
        t += step;
    }
    return out;
}

/// 1, 2, ..., n.
inline std::vector<double> ramp(std::size_t n, double first = 1.0, double step = 1.0) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) v[i] = first + step * static_cast<double>(i);
    return v;
}

/// `n` copies of `base` with the given (index, price) pairs overwritten.
inline std::vector<double> flat_with(std::size_t n, double base,
                                     std::initializer_list<std::pair<std::size_t, double>> spikes) {
    std::vector<double> v(n, base);
    for (const auto& [i, p] : spikes) v[i] = p;
    return v;
}

}  // namespace cew::test
