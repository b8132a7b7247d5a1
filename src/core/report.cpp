/// @file src/core/report.cpp
/// @brief Attribute and text rendering of ClassificationResult.

#include "cew/report.hpp"
#include "cew/time_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>

namespace cew::report {

namespace {

std::string times_of(const WindowSeries& windows, std::chrono::minutes offset) {
    std::vector<std::string> parts;
    parts.reserve(windows.size());
    for (const auto& w : windows) parts.push_back(time::format_iso8601(w.start, offset));
    return fmt::format("[{}]", fmt::join(parts, ", "));
}

std::string prices_of(const WindowSeries& windows) {
    std::vector<std::string> parts;
    parts.reserve(windows.size());
    for (const auto& w : windows) parts.push_back(fmt::format("{:.5f}", w.price));
    return fmt::format("[{}]", fmt::join(parts, ", "));
}

std::string opt(const std::optional<double>& v, int decimals) {
    return v ? fmt::format("{:.{}f}", *v, decimals) : std::string{"none"};
}

std::string flag(bool b) {
    return b ? "true" : "false";
}

}  // namespace

// ─── to_attributes ────────────────────────────────────────────────────────────

Attributes to_attributes(const ClassificationResult& r, std::chrono::minutes offset) {
    Attributes a;
    a.reserve(40);

    a.emplace_back("state",        std::string{cew::to_string(r.current_state)});
    a.emplace_back("day",          time::format_day(r.day));
    a.emplace_back("window_count", fmt::format("{}", r.window_count));

    a.emplace_back("cheapest_times",              times_of(r.charge_windows, offset));
    a.emplace_back("cheapest_prices",             prices_of(r.charge_windows));
    a.emplace_back("expensive_times",             times_of(r.discharge_windows, offset));
    a.emplace_back("expensive_prices",            prices_of(r.discharge_windows));
    a.emplace_back("expensive_times_aggressive",  times_of(r.aggressive_discharge_windows, offset));
    a.emplace_back("expensive_prices_aggressive", prices_of(r.aggressive_discharge_windows));
    a.emplace_back("actual_charge_times",         times_of(r.actual_charge_windows, offset));
    a.emplace_back("actual_charge_prices",        prices_of(r.actual_charge_windows));
    a.emplace_back("actual_discharge_times",      times_of(r.actual_discharge_windows, offset));
    a.emplace_back("actual_discharge_prices",     prices_of(r.actual_discharge_windows));

    a.emplace_back("avg_cheap_price",             opt(r.avg_cheap_price, 5));
    a.emplace_back("avg_expensive_price",         opt(r.avg_expensive_price, 5));
    a.emplace_back("spread_percentage",           opt(r.spread_pct, 1));
    a.emplace_back("effective_spread_percentage", opt(r.effective_spread_pct, 1));
    a.emplace_back("spread_met",                  flag(r.spread_met));
    a.emplace_back("discharge_spread_met",        flag(r.discharge_spread_met));
    a.emplace_back("aggressive_discharge_spread_met", flag(r.aggressive_spread_met));

    a.emplace_back("current_price",               opt(r.current_price, 5));
    a.emplace_back("price_override_active",       flag(r.price_override_active));
    a.emplace_back("time_override_active",        flag(r.time_override_active));

    a.emplace_back("completed_charge_windows",    fmt::format("{}", r.completed_charge_windows));
    a.emplace_back("completed_discharge_windows", fmt::format("{}", r.completed_discharge_windows));
    a.emplace_back("completed_charge_cost",       fmt::format("{:.3f}", r.completed_charge_cost));
    a.emplace_back("completed_discharge_revenue", fmt::format("{:.3f}", r.completed_discharge_revenue));
    a.emplace_back("actual_charged_kwh",          fmt::format("{:.3f}", r.actual_charged_kwh));
    a.emplace_back("actual_discharged_kwh",       fmt::format("{:.3f}", r.actual_discharged_kwh));
    a.emplace_back("net_kwh",                     fmt::format("{:.3f}", r.net_kwh));
    a.emplace_back("net_cost",                    fmt::format("{:.3f}", r.net_cost));
    a.emplace_back("net_price_per_kwh",           opt(r.net_price_per_kwh, 5));
    return a;
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string to_string(const ClassificationResult& r, std::chrono::minutes offset) {
    const auto attrs = to_attributes(r, offset);

    std::size_t width = 0;
    for (const auto& [name, _] : attrs) width = std::max(width, name.size());

    std::string out = fmt::format("Cheapest Energy Windows — {} — state: {}\n",
                                  time::format_day(r.day), cew::to_string(r.current_state));
    for (const auto& [name, value] : attrs) {
        out += fmt::format("  {:<{}}  {}\n", name, width, value);
    }
    return out;
}

}  // namespace cew::report
