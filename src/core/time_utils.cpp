/// @file src/core/time_utils.cpp
/// @brief Local-day arithmetic and ISO-8601 parsing/formatting.
///
/// Parsing goes through Boost.DateTime; formatting through fmt/chrono.

#include "cew/time_utils.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <string>

namespace cew::time {

namespace {

/// Parse exactly `width` decimal digits at `pos`. Advances `pos` on success.
std::optional<int> parse_fixed(std::string_view text,
                               std::size_t& pos,
                               std::size_t width) noexcept {
    if (pos + width > text.size()) return std::nullopt;
    int value = 0;
    const char* first = text.data() + pos;
    const char* last  = first + width;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    pos += width;
    return value;
}

/// Consume `c` at `pos` if present.
bool consume(std::string_view text, std::size_t& pos, char c) noexcept {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

}  // namespace

// ─── Time of day ──────────────────────────────────────────────────────────────

std::optional<TimeOfDay> parse_time_of_day(std::string_view text) noexcept {
    std::size_t pos = 0;
    const auto hh = parse_fixed(text, pos, 2);
    if (!hh || !consume(text, pos, ':')) return std::nullopt;
    const auto mm = parse_fixed(text, pos, 2);
    if (!mm) return std::nullopt;
    if (consume(text, pos, ':')) {
        const auto ss = parse_fixed(text, pos, 2);
        if (!ss || *ss > 59) return std::nullopt;
    }
    if (pos != text.size()) return std::nullopt;
    if (*hh > 23 || *mm > 59) return std::nullopt;
    return TimeOfDay{std::chrono::minutes{*hh * 60 + *mm}};
}

std::string format_time_of_day(TimeOfDay tod) {
    const auto m = tod.since_midnight.count();
    return fmt::format("{:02}:{:02}", m / 60, m % 60);
}

// ─── Local day ────────────────────────────────────────────────────────────────

LocalDay local_day(Timestamp t, std::chrono::minutes utc_offset) noexcept {
    return std::chrono::floor<std::chrono::days>(t + utc_offset);
}

Timestamp local_midnight(LocalDay day, std::chrono::minutes utc_offset) noexcept {
    return Timestamp{day} - utc_offset;
}

TimeOfDay time_of_day(Timestamp t, std::chrono::minutes utc_offset) noexcept {
    const auto local = t + utc_offset;
    const auto since = std::chrono::floor<std::chrono::minutes>(
        local - std::chrono::floor<std::chrono::days>(local));
    return TimeOfDay{since};
}

bool in_range(TimeOfDay tod, TimeOfDay start, TimeOfDay end) noexcept {
    const auto t = tod.since_midnight;
    const auto s = start.since_midnight;
    const auto e = end.since_midnight;
    if (e < s) {
        // Overnight range, e.g. 22:00-06:00.
        return t >= s || t < e;
    }
    return s <= t && t < e;
}

// ─── ISO-8601 ─────────────────────────────────────────────────────────────────

std::optional<Timestamp>
parse_iso8601(std::string_view text, std::chrono::minutes default_offset) noexcept {
    namespace pt = boost::posix_time;

    // Tolerate surrounding quotes and whitespace from CSV cells.
    while (!text.empty() && (text.front() == '"' || text.front() == ' ')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == '"' || text.back() == ' ')) {
        text.remove_suffix(1);
    }
    if (text.size() < 16 || (text[10] != 'T' && text[10] != ' ')) {
        return std::nullopt;
    }

    try {
        std::chrono::minutes offset = default_offset;
        std::string_view clock = text.substr(11);
        if (!clock.empty() && clock.back() == 'Z') {
            offset = std::chrono::minutes{0};
            clock.remove_suffix(1);
        } else if (const auto z = clock.find_first_of("+-"); z != std::string_view::npos) {
            // "+hh:mm" or "+hhmm".
            std::string zone{clock.substr(z + 1)};
            if (zone.size() == 4) zone.insert(2, 1, ':');
            if (zone.size() != 5 || zone[2] != ':') return std::nullopt;
            const pt::time_duration shift = pt::duration_from_string(zone);
            offset = std::chrono::minutes{shift.total_seconds() / 60};
            if (clock[z] == '-') offset = -offset;
            clock = clock.substr(0, z);
        }

        const boost::gregorian::date date =
            boost::gregorian::from_simple_string(std::string{text.substr(0, 10)});
        const pt::time_duration tod = pt::duration_from_string(std::string{clock});
        if (tod.is_negative() || tod >= pt::hours(24)) return std::nullopt;

        // Fractional seconds are truncated.
        const pt::time_duration since_epoch =
            pt::ptime(date, tod) - pt::ptime(boost::gregorian::date(1970, 1, 1));
        return Timestamp{std::chrono::seconds{since_epoch.total_seconds()}} - offset;
    } catch (const std::exception&) {
        // boost::bad_lexical_cast for non-numeric fields, std::out_of_range
        // subclasses for impossible calendar dates.
        return std::nullopt;
    }
}

std::string format_iso8601(Timestamp t, std::chrono::minutes utc_offset) {
    // The shifted instant is rendered as UTC so the host zone never applies.
    const std::tm local = fmt::gmtime(std::chrono::system_clock::to_time_t(t + utc_offset));

    const auto off   = utc_offset.count();
    const char sign  = off < 0 ? '-' : '+';
    const auto abs_o = std::abs(off);

    return fmt::format("{:%Y-%m-%dT%H:%M:%S}{}{:02}:{:02}",
                       local, sign, abs_o / 60, abs_o % 60);
}

std::string format_day(LocalDay day) {
    return fmt::format("{:%Y-%m-%d}",
                       fmt::gmtime(std::chrono::system_clock::to_time_t(day)));
}

}  // namespace cew::time
