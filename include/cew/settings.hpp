#pragma once

/// @file include/cew/settings.hpp
/// @brief Settings value object, validation, fingerprinting and the
///        today/tomorrow settings store.
///
/// # Module: Settings
///
/// ## Responsibility
/// Hold every user-tunable input of one computation as an immutable value.
/// `validate` is the acceptance boundary: it throws `InvalidSettings` naming
/// the first out-of-range field, so nothing downstream re-checks ranges.
///
/// ## SettingsStore
/// Two slots, "today" and "tomorrow". Readers take `shared_ptr<const Settings>`
/// snapshots; `rotate()` swaps a copy of tomorrow into today under one lock,
/// so no evaluation can observe a half-rotated object.

#include "cew/constants.hpp"
#include "cew/time_utils.hpp"
#include "cew/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace cew {

// ─── Overrides ────────────────────────────────────────────────────────────────

/// Mode forced by a time override.
enum class OverrideMode : std::uint8_t {
    Idle,
    Charge,
    Discharge,
    DischargeAggressive,
};

/// State a forced mode maps to.
[[nodiscard]] OperatingState to_state(OverrideMode mode) noexcept;

/// Parse "idle" / "charge" / "discharge" / "discharge_aggressive".
[[nodiscard]] std::optional<OverrideMode>
parse_override_mode(std::string_view label) noexcept;

/// A forced mode over a local time-of-day range [start, end).
/// When end < start the range wraps past midnight.
struct TimeOverride {
    OverrideMode    mode  = OverrideMode::Charge;
    time::TimeOfDay start{};
    time::TimeOfDay end{};

    friend bool operator==(const TimeOverride&, const TimeOverride&) = default;
};

/// Local time-of-day range restricting which windows take part in selection.
struct CalculationWindow {
    time::TimeOfDay start{};
    time::TimeOfDay end{};

    friend bool operator==(const CalculationWindow&, const CalculationWindow&) = default;
};

// ─── Settings ─────────────────────────────────────────────────────────────────

/// Every input of one window computation besides the prices themselves.
struct Settings {
    WindowDuration window_duration = WindowDuration::QuarterHour;

    int charge_window_count    = constants::DEFAULT_CHARGE_WINDOWS;
    int expensive_window_count = constants::DEFAULT_EXPENSIVE_WINDOWS;

    double cheap_percentile     = constants::DEFAULT_CHEAP_PERCENTILE;      ///< [0, 100]
    double expensive_percentile = constants::DEFAULT_EXPENSIVE_PERCENTILE;  ///< [0, 100]

    double min_spread_pct        = constants::DEFAULT_MIN_SPREAD;
    double discharge_spread_pct  = constants::DEFAULT_DISCHARGE_SPREAD;
    double aggressive_spread_pct = constants::DEFAULT_AGGRESSIVE_SPREAD;
    double min_price_difference  = constants::DEFAULT_MIN_PRICE_DIFFERENCE;

    double vat_pct                 = constants::DEFAULT_VAT_PCT;
    double tax_per_kwh             = constants::DEFAULT_TAX_PER_KWH;
    double additional_cost_per_kwh = constants::DEFAULT_ADDITIONAL_COST;

    double round_trip_efficiency_pct = constants::DEFAULT_ROUND_TRIP_EFFICIENCY;  ///< (0, 100]
    double charge_power_w            = constants::DEFAULT_CHARGE_POWER_W;
    double discharge_power_w         = constants::DEFAULT_DISCHARGE_POWER_W;

    /// Force `charge` while the current price is at or below this.
    std::optional<double> price_override;
    /// Force `discharge` while the current price is at or above this.
    std::optional<double> discharge_price_override;

    /// Evaluated in order; the first active override wins.
    std::vector<TimeOverride> time_overrides;

    bool automation_enabled = true;

    std::optional<CalculationWindow> calculation_window;

    /// Offset of the local zone from UTC.
    std::chrono::minutes utc_offset{0};

    /// Discharge-only mode: no charge windows are selected.
    [[nodiscard]] bool discharge_only() const noexcept {
        return charge_window_count == 0;
    }

    /// Charge-only mode: no discharge windows are selected.
    [[nodiscard]] bool charge_only() const noexcept {
        return expensive_window_count == 0;
    }

    /// Multiplier applied to a charge price to account for round-trip loss.
    [[nodiscard]] double efficiency_factor() const noexcept {
        return 100.0 / round_trip_efficiency_pct;
    }

    friend bool operator==(const Settings&, const Settings&) = default;
};

/// Throw `InvalidSettings` for the first out-of-range field.
void validate(const Settings& settings);

/// 64-bit content fingerprint. Any single field change alters it.
[[nodiscard]] std::uint64_t fingerprint(const Settings& settings) noexcept;

// ─── SettingsStore ────────────────────────────────────────────────────────────

/// Thread-safe holder of the "today" and "tomorrow" settings slots.
class SettingsStore {
public:
    /// Both slots start as `initial`; tomorrow settings start disabled.
    explicit SettingsStore(Settings initial = Settings{});

    /// Snapshot of today's settings.
    [[nodiscard]] std::shared_ptr<const Settings> today() const;

    /// Settings to evaluate tomorrow's prices with: the tomorrow slot when
    /// enabled, otherwise today's.
    [[nodiscard]] std::shared_ptr<const Settings> for_tomorrow() const;

    /// Replace today's settings. Throws InvalidSettings; the slot is left
    /// untouched on failure.
    void set_today(Settings settings);

    /// Replace tomorrow's settings and enable them. Throws InvalidSettings.
    void set_tomorrow(Settings settings);

    /// Whether the tomorrow slot is in use.
    [[nodiscard]] bool tomorrow_enabled() const;

    /// Copy tomorrow into today and disable the tomorrow slot.
    ///
    /// # Returns
    /// true if a rotation happened; false when tomorrow settings were not
    /// enabled (a repeated call is a no-op).
    bool rotate();

private:
    mutable std::mutex             mutex_;
    std::shared_ptr<const Settings> today_;
    std::shared_ptr<const Settings> tomorrow_;
    bool                           tomorrow_enabled_ = false;
};

}  // namespace cew
