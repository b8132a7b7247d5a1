/// @file src/core/settings.cpp
/// @brief Settings validation, fingerprinting and the SettingsStore.

#include "cew/settings.hpp"
#include "cew/errors.hpp"
#include "cew/fingerprint.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string>

namespace cew {

// ─── Override modes ───────────────────────────────────────────────────────────

OperatingState to_state(OverrideMode mode) noexcept {
    switch (mode) {
        case OverrideMode::Idle:                return OperatingState::Idle;
        case OverrideMode::Charge:              return OperatingState::Charge;
        case OverrideMode::Discharge:           return OperatingState::Discharge;
        case OverrideMode::DischargeAggressive: return OperatingState::DischargeAggressive;
    }
    return OperatingState::Idle;
}

std::optional<OverrideMode> parse_override_mode(std::string_view label) noexcept {
    if (label == "idle")                 return OverrideMode::Idle;
    if (label == "charge")               return OverrideMode::Charge;
    if (label == "discharge")            return OverrideMode::Discharge;
    if (label == "discharge_aggressive") return OverrideMode::DischargeAggressive;
    return std::nullopt;
}

// ─── validate ─────────────────────────────────────────────────────────────────

namespace {

void require_finite(const char* field, double value) {
    if (!std::isfinite(value)) {
        throw InvalidSettings(field, "must be finite");
    }
}

void require_range(const char* field, double value, double lo, double hi) {
    require_finite(field, value);
    if (value < lo || value > hi) {
        throw InvalidSettings(field, fmt::format("{} is outside [{}, {}]", value, lo, hi));
    }
}

void require_non_negative(const char* field, double value) {
    require_finite(field, value);
    if (value < 0.0) {
        throw InvalidSettings(field, fmt::format("{} must be >= 0", value));
    }
}

}  // namespace

void validate(const Settings& s) {
    if (s.window_duration != WindowDuration::QuarterHour &&
        s.window_duration != WindowDuration::Hour) {
        throw InvalidSettings("window_duration", "must be 15 or 60 minutes");
    }
    if (s.charge_window_count < 0) {
        throw InvalidSettings("charge_window_count",
                              fmt::format("{} must be >= 0", s.charge_window_count));
    }
    if (s.expensive_window_count < 0) {
        throw InvalidSettings("expensive_window_count",
                              fmt::format("{} must be >= 0", s.expensive_window_count));
    }

    require_range("cheap_percentile",     s.cheap_percentile,     0.0, 100.0);
    require_range("expensive_percentile", s.expensive_percentile, 0.0, 100.0);

    require_non_negative("min_spread_pct",        s.min_spread_pct);
    require_non_negative("discharge_spread_pct",  s.discharge_spread_pct);
    require_non_negative("aggressive_spread_pct", s.aggressive_spread_pct);
    require_non_negative("min_price_difference",  s.min_price_difference);

    require_finite("vat_pct",                 s.vat_pct);
    require_finite("tax_per_kwh",             s.tax_per_kwh);
    require_finite("additional_cost_per_kwh", s.additional_cost_per_kwh);
    if (s.vat_pct <= -100.0) {
        throw InvalidSettings("vat_pct", "must be > -100");
    }

    require_finite("round_trip_efficiency_pct", s.round_trip_efficiency_pct);
    if (s.round_trip_efficiency_pct <= 0.0 || s.round_trip_efficiency_pct > 100.0) {
        throw InvalidSettings("round_trip_efficiency_pct",
                              fmt::format("{} is outside (0, 100]", s.round_trip_efficiency_pct));
    }

    require_non_negative("charge_power_w",    s.charge_power_w);
    require_non_negative("discharge_power_w", s.discharge_power_w);

    if (s.price_override) {
        require_finite("price_override", *s.price_override);
    }
    if (s.discharge_price_override) {
        require_finite("discharge_price_override", *s.discharge_price_override);
    }

    // ±18h covers every real zone.
    if (s.utc_offset.count() < -18 * 60 || s.utc_offset.count() > 18 * 60) {
        throw InvalidSettings("utc_offset", "must be within +/-18 hours");
    }
}

// ─── fingerprint ──────────────────────────────────────────────────────────────

std::uint64_t fingerprint(const Settings& s) noexcept {
    Fnv1a h;
    h.add(std::string_view{"settings"});
    h.add(static_cast<int>(s.window_duration));
    h.add(s.charge_window_count);
    h.add(s.expensive_window_count);
    h.add(s.cheap_percentile);
    h.add(s.expensive_percentile);
    h.add(s.min_spread_pct);
    h.add(s.discharge_spread_pct);
    h.add(s.aggressive_spread_pct);
    h.add(s.min_price_difference);
    h.add(s.vat_pct);
    h.add(s.tax_per_kwh);
    h.add(s.additional_cost_per_kwh);
    h.add(s.round_trip_efficiency_pct);
    h.add(s.charge_power_w);
    h.add(s.discharge_power_w);

    h.add(s.price_override.has_value());
    if (s.price_override) h.add(*s.price_override);
    h.add(s.discharge_price_override.has_value());
    if (s.discharge_price_override) h.add(*s.discharge_price_override);

    h.add(static_cast<std::uint64_t>(s.time_overrides.size()));
    for (const auto& o : s.time_overrides) {
        h.add(static_cast<int>(o.mode));
        h.add(static_cast<int>(o.start.since_midnight.count()));
        h.add(static_cast<int>(o.end.since_midnight.count()));
    }

    h.add(s.automation_enabled);

    h.add(s.calculation_window.has_value());
    if (s.calculation_window) {
        h.add(static_cast<int>(s.calculation_window->start.since_midnight.count()));
        h.add(static_cast<int>(s.calculation_window->end.since_midnight.count()));
    }

    h.add(static_cast<int>(s.utc_offset.count()));
    return h.digest();
}

// ─── SettingsStore ────────────────────────────────────────────────────────────

SettingsStore::SettingsStore(Settings initial) {
    validate(initial);
    today_    = std::make_shared<const Settings>(initial);
    tomorrow_ = std::make_shared<const Settings>(std::move(initial));
}

std::shared_ptr<const Settings> SettingsStore::today() const {
    std::lock_guard lock(mutex_);
    return today_;
}

std::shared_ptr<const Settings> SettingsStore::for_tomorrow() const {
    std::lock_guard lock(mutex_);
    return tomorrow_enabled_ ? tomorrow_ : today_;
}

void SettingsStore::set_today(Settings settings) {
    validate(settings);
    auto next = std::make_shared<const Settings>(std::move(settings));
    std::lock_guard lock(mutex_);
    today_ = std::move(next);
}

void SettingsStore::set_tomorrow(Settings settings) {
    validate(settings);
    auto next = std::make_shared<const Settings>(std::move(settings));
    std::lock_guard lock(mutex_);
    tomorrow_         = std::move(next);
    tomorrow_enabled_ = true;
}

bool SettingsStore::tomorrow_enabled() const {
    std::lock_guard lock(mutex_);
    return tomorrow_enabled_;
}

bool SettingsStore::rotate() {
    std::lock_guard lock(mutex_);
    if (!tomorrow_enabled_) {
        return false;
    }
    today_            = std::make_shared<const Settings>(*tomorrow_);
    tomorrow_enabled_ = false;
    return true;
}

}  // namespace cew
