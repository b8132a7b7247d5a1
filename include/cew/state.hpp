#pragma once

/// @file include/cew/state.hpp
/// @brief StateResolver — operating state for an instant and the per-window
///        actual timeline.
///
/// # Module: State Resolver
///
/// ## Precedence (highest first)
/// 1. `off`         — automation disabled
/// 2. time override — first entry whose local [start, end) covers the instant
/// 3. price override — price ≤ price_override → charge,
///                     price ≥ discharge_price_override → discharge
/// 4. `discharge_aggressive` — aggressive window and gate holds
/// 5. `discharge`   — discharge window and gate holds
/// 6. `charge`      — charge window and (gate holds or charge-only mode)
/// 7. `idle`
///
/// The gate is `spread_met`. The timeline applies rules 2–7 to every window
/// start and collects the windows that end up charging or discharging.

#include "cew/selector.hpp"
#include "cew/settings.hpp"
#include "cew/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace cew {

/// Outcome for the current instant.
struct StateResolution {
    OperatingState             state = OperatingState::Idle;
    std::optional<std::size_t> current_index;  ///< window containing `now`
    std::optional<double>      current_price;
    bool price_override_active = false;  ///< a price threshold holds for the current price
    bool time_override_active  = false;  ///< a time override covers `now`
};

/// Windows whose final role, after overrides, is charging or discharging.
struct ActualTimeline {
    WindowSeries charge;
    WindowSeries discharge;  ///< includes aggressive windows
};

/// Stateless resolver.
class StateResolver {
public:
    /// Index of the window containing `t`, or `nullopt`.
    [[nodiscard]] static std::optional<std::size_t>
    window_at(std::span<const PriceWindow> windows, Timestamp t) noexcept;

    /// First time override covering `t`.
    [[nodiscard]] static std::optional<OverrideMode>
    active_override(const Settings& settings, Timestamp t) noexcept;

    /// Price-override state implied by `price`, if any.
    [[nodiscard]] static std::optional<OperatingState>
    price_override(const Settings& settings, double price) noexcept;

    /// Rules 2–7 for window `idx`.
    [[nodiscard]] static OperatingState
    window_state(std::span<const PriceWindow> windows,
                 std::size_t idx,
                 const Selection& selection,
                 bool spread_met,
                 const Settings& settings);

    /// Full precedence at `now`.
    [[nodiscard]] static StateResolution
    resolve(std::span<const PriceWindow> windows,
            const Selection& selection,
            bool spread_met,
            const Settings& settings,
            Timestamp now);

    /// Per-window roles after overrides.
    [[nodiscard]] static ActualTimeline
    timeline(std::span<const PriceWindow> windows,
             const Selection& selection,
             bool spread_met,
             const Settings& settings);
};

}  // namespace cew
