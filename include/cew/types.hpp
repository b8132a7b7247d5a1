#pragma once

/// @file include/cew/types.hpp
/// @brief Shared value types for the Cheapest Energy Windows (CEW) engine.
///
/// Every module includes this file. It defines the time aliases, the price
/// window value type, the operating-state enumeration and the Eigen aliases
/// used for vectorized price statistics.

#include <Eigen/Dense>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace cew {

// ─── Time ─────────────────────────────────────────────────────────────────────

/// An absolute instant with one-second resolution (UTC based).
using Timestamp = std::chrono::sys_seconds;

/// A calendar day counted from the Unix epoch in the configured local zone.
using LocalDay = std::chrono::sys_days;

/// Length of one price window.
enum class WindowDuration : std::uint8_t {
    QuarterHour = 15,  ///< 96 windows per day
    Hour        = 60,  ///< 24 windows per day
};

/// Window length as a chrono duration.
[[nodiscard]] constexpr std::chrono::minutes
to_minutes(WindowDuration d) noexcept {
    return std::chrono::minutes{static_cast<int>(d)};
}

/// Number of windows that cover one calendar day.
[[nodiscard]] constexpr std::size_t
windows_per_day(WindowDuration d) noexcept {
    return static_cast<std::size_t>(24 * 60 / static_cast<int>(d));
}

// ─── Raw upstream prices ──────────────────────────────────────────────────────

/// Unit of an upstream price value.
enum class PriceUnit : std::uint8_t {
    PerKWh,  ///< currency / kWh
    PerMWh,  ///< currency / MWh (divided by 1000 on ingestion)
};

/// One point of an upstream price feed, at its native granularity.
struct RawPrice {
    Timestamp start;                    ///< Start of the priced interval
    double    value;                    ///< Base market price (no VAT/tax)
    PriceUnit unit = PriceUnit::PerKWh; ///< Unit of `value`
};

/// An upstream series. An empty vector means "not published yet".
using RawPriceSeries = std::vector<RawPrice>;

// ─── Price windows ────────────────────────────────────────────────────────────

/// One window of the normalized day: start, length and all-in price.
struct PriceWindow {
    Timestamp            start;     ///< Window start (inclusive)
    std::chrono::minutes duration;  ///< Window length
    double               price;     ///< All-in price, currency / kWh

    /// Window end (exclusive).
    [[nodiscard]] Timestamp end() const noexcept { return start + duration; }

    /// True if `t` falls inside [start, end).
    [[nodiscard]] bool contains(Timestamp t) const noexcept {
        return start <= t && t < end();
    }

    /// Window length in hours (0.25 or 1.0).
    [[nodiscard]] double hours() const noexcept {
        return static_cast<double>(duration.count()) / 60.0;
    }

    friend bool operator==(const PriceWindow&, const PriceWindow&) = default;
};

/// An ordered sequence of price windows.
using WindowSeries = std::vector<PriceWindow>;

// ─── Operating state ──────────────────────────────────────────────────────────

/// Discrete operating state reported to the host.
enum class OperatingState : std::uint8_t {
    Off,
    Idle,
    Charge,
    Discharge,
    DischargeAggressive,
};

/// Host-facing label: "off", "idle", "charge", "discharge",
/// "discharge_aggressive".
[[nodiscard]] std::string_view to_string(OperatingState s) noexcept;

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Dense column of prices used for vectorized statistics.
using PriceVector = Eigen::VectorXd;

/// Read-only view of a contiguous double buffer as an Eigen vector.
using ConstPriceMap = Eigen::Map<const Eigen::VectorXd>;

}  // namespace cew
