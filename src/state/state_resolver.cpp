/// @file src/state/state_resolver.cpp
/// @brief StateResolver — override precedence and actual timeline.

#include "cew/state.hpp"

#include <algorithm>

namespace cew {

namespace {

bool member(const std::vector<std::size_t>& sorted, std::size_t idx) noexcept {
    return std::binary_search(sorted.begin(), sorted.end(), idx);
}

}  // namespace

// ─── lookups ──────────────────────────────────────────────────────────────────

std::optional<std::size_t>
StateResolver::window_at(std::span<const PriceWindow> windows, Timestamp t) noexcept {
    // Windows are chronological: first one ending after t is the candidate.
    const auto it = std::upper_bound(windows.begin(), windows.end(), t,
                                     [](Timestamp v, const PriceWindow& w) {
                                         return v < w.end();
                                     });
    if (it == windows.end() || !it->contains(t)) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - windows.begin());
}

std::optional<OverrideMode>
StateResolver::active_override(const Settings& settings, Timestamp t) noexcept {
    const auto tod = time::time_of_day(t, settings.utc_offset);
    for (const auto& o : settings.time_overrides) {
        if (time::in_range(tod, o.start, o.end)) {
            return o.mode;
        }
    }
    return std::nullopt;
}

std::optional<OperatingState>
StateResolver::price_override(const Settings& settings, double price) noexcept {
    if (settings.price_override && price <= *settings.price_override) {
        return OperatingState::Charge;
    }
    if (settings.discharge_price_override && price >= *settings.discharge_price_override) {
        return OperatingState::Discharge;
    }
    return std::nullopt;
}

// ─── window_state ─────────────────────────────────────────────────────────────

OperatingState
StateResolver::window_state(std::span<const PriceWindow> windows,
                            std::size_t idx,
                            const Selection& selection,
                            bool spread_met,
                            const Settings& settings) {
    const auto& w = windows[idx];

    if (const auto mode = active_override(settings, w.start)) {
        return to_state(*mode);
    }
    if (const auto forced = price_override(settings, w.price)) {
        return *forced;
    }
    if (spread_met && member(selection.aggressive, idx)) {
        return OperatingState::DischargeAggressive;
    }
    if (spread_met && member(selection.discharge, idx)) {
        return OperatingState::Discharge;
    }
    if ((spread_met || settings.charge_only()) && member(selection.charge, idx)) {
        return OperatingState::Charge;
    }
    return OperatingState::Idle;
}

// ─── resolve ──────────────────────────────────────────────────────────────────

StateResolution
StateResolver::resolve(std::span<const PriceWindow> windows,
                       const Selection& selection,
                       bool spread_met,
                       const Settings& settings,
                       Timestamp now) {
    StateResolution out;
    out.current_index = window_at(windows, now);
    if (out.current_index) {
        out.current_price = windows[*out.current_index].price;
    }
    out.time_override_active  = active_override(settings, now).has_value();
    out.price_override_active = out.current_price &&
                                price_override(settings, *out.current_price).has_value();

    if (!settings.automation_enabled) {
        out.state = OperatingState::Off;
        return out;
    }

    if (const auto mode = active_override(settings, now)) {
        out.state = to_state(*mode);
    } else if (out.current_index) {
        out.state = window_state(windows, *out.current_index, selection, spread_met, settings);
    } else {
        out.state = OperatingState::Idle;
    }
    return out;
}

// ─── timeline ─────────────────────────────────────────────────────────────────

ActualTimeline
StateResolver::timeline(std::span<const PriceWindow> windows,
                        const Selection& selection,
                        bool spread_met,
                        const Settings& settings) {
    ActualTimeline out;
    for (std::size_t i = 0; i < windows.size(); ++i) {
        switch (window_state(windows, i, selection, spread_met, settings)) {
            case OperatingState::Charge:
                out.charge.push_back(windows[i]);
                break;
            case OperatingState::Discharge:
            case OperatingState::DischargeAggressive:
                out.discharge.push_back(windows[i]);
                break;
            case OperatingState::Off:
            case OperatingState::Idle:
                break;
        }
    }
    return out;
}

}  // namespace cew
