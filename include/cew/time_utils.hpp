#pragma once

/// @file include/cew/time_utils.hpp
/// @brief Local-day arithmetic and ISO-8601 helpers.
///
/// # Module: Time Utilities
///
/// ## Responsibility
/// The engine works on UTC instants (`Timestamp`) but reasons about a
/// calendar day in the host's local zone. The zone is modelled as a fixed
/// UTC offset carried by Settings; DST transitions are the host's concern
/// (it passes the offset valid for the evaluated day).
///
/// ## Guarantees
/// - All functions are pure and `noexcept`
/// - Parsing never throws; malformed text yields `nullopt`

#include "cew/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace cew::time {

/// A wall-clock time of day, minutes since local midnight in [0, 1440).
struct TimeOfDay {
    std::chrono::minutes since_midnight{0};

    friend bool operator==(const TimeOfDay&, const TimeOfDay&) = default;
};

/// Parse "HH:MM" or "HH:MM:SS". Seconds are accepted and dropped.
[[nodiscard]] std::optional<TimeOfDay>
parse_time_of_day(std::string_view text) noexcept;

/// Format as "HH:MM".
[[nodiscard]] std::string format_time_of_day(TimeOfDay tod);

/// Local calendar day containing instant `t`.
[[nodiscard]] LocalDay local_day(Timestamp t,
                                 std::chrono::minutes utc_offset) noexcept;

/// UTC instant of local midnight starting `day`.
[[nodiscard]] Timestamp local_midnight(LocalDay day,
                                       std::chrono::minutes utc_offset) noexcept;

/// Local time of day of instant `t`.
[[nodiscard]] TimeOfDay time_of_day(Timestamp t,
                                    std::chrono::minutes utc_offset) noexcept;

/// True if `tod` lies in [start, end). When end < start the range wraps
/// past midnight. An empty range (start == end) contains nothing.
[[nodiscard]] bool in_range(TimeOfDay tod,
                            TimeOfDay start,
                            TimeOfDay end) noexcept;

/// Parse an ISO-8601 instant: "YYYY-MM-DDTHH:MM[:SS][Z|±HH:MM]".
/// A space may replace 'T'. Without a zone designator the text is read as
/// local time at `default_offset`.
[[nodiscard]] std::optional<Timestamp>
parse_iso8601(std::string_view text,
              std::chrono::minutes default_offset = std::chrono::minutes{0}) noexcept;

/// Format `t` as "YYYY-MM-DDTHH:MM:SS±HH:MM" in the zone at `utc_offset`.
[[nodiscard]] std::string format_iso8601(Timestamp t,
                                         std::chrono::minutes utc_offset);

/// Format a day as "YYYY-MM-DD".
[[nodiscard]] std::string format_day(LocalDay day);

}  // namespace cew::time
