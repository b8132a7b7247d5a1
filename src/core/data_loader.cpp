/// @file src/core/data_loader.cpp
/// @brief CSV price loader and key=value settings loader.

#include "cew/data_loader.hpp"
#include "cew/errors.hpp"
#include "cew/time_utils.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace cew {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n";

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

std::string lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    for (;;) {
        const auto next = s.find(sep, pos);
        parts.push_back(s.substr(pos, next == std::string_view::npos ? next : next - pos));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return parts;
}

std::optional<double> parse_double(std::string_view s) noexcept {
    s = trim(s);
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::optional<int> parse_int(std::string_view s) noexcept {
    s = trim(s);
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

std::optional<bool> parse_bool(std::string_view s) {
    const auto v = lower(trim(s));
    if (v == "true" || v == "on" || v == "yes" || v == "1")  return true;
    if (v == "false" || v == "off" || v == "no" || v == "0") return false;
    return std::nullopt;
}

/// "HH:MM-HH:MM"
std::optional<std::pair<time::TimeOfDay, time::TimeOfDay>>
parse_range(std::string_view s) {
    const auto parts = split(trim(s), '-');
    if (parts.size() != 2) {
        return std::nullopt;
    }
    const auto start = time::parse_time_of_day(trim(parts[0]));
    const auto end   = time::parse_time_of_day(trim(parts[1]));
    if (!start || !end) {
        return std::nullopt;
    }
    return std::make_pair(*start, *end);
}

/// "Z", "+HH:MM", "-HHMM" or a plain minute count.
std::optional<std::chrono::minutes> parse_offset(std::string_view s) {
    s = trim(s);
    if (s == "Z" || s == "z") {
        return std::chrono::minutes{0};
    }
    if (s.size() >= 5 && (s[0] == '+' || s[0] == '-')) {
        const int sign = s[0] == '-' ? -1 : 1;
        std::string digits;
        for (char c : s.substr(1)) {
            if (c != ':') digits.push_back(c);
        }
        if (digits.size() == 4) {
            const auto hh = parse_int(std::string_view(digits).substr(0, 2));
            const auto mm = parse_int(std::string_view(digits).substr(2, 2));
            if (hh && mm && *mm < 60) {
                return std::chrono::minutes{sign * (*hh * 60 + *mm)};
            }
        }
        return std::nullopt;
    }
    if (const auto m = parse_int(s)) {
        return std::chrono::minutes{*m};
    }
    return std::nullopt;
}

[[noreturn]] void bad_value(std::string_view key, std::string_view value) {
    throw InvalidSettings(std::string(key), fmt::format("cannot parse '{}'", value));
}

template <typename T>
T require(std::optional<T> parsed, std::string_view key, std::string_view value) {
    if (!parsed) bad_value(key, value);
    return *parsed;
}

std::optional<double> optional_price(std::string_view key, std::string_view value) {
    const auto v = lower(trim(value));
    if (v.empty() || v == "none" || v == "off") {
        return std::nullopt;
    }
    return require(parse_double(value), key, value);
}

std::optional<std::string> read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

}  // namespace

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<RawPrice>
DataLoader::parse_row(std::string_view line, std::chrono::minutes default_offset) {
    line = trim(line);
    // Skip blank lines and comment lines.
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    const auto fields = split(line, ',');
    if (fields.size() < 2 || fields.size() > 3) {
        return std::nullopt;
    }

    const auto start = time::parse_iso8601(trim(fields[0]), default_offset);
    const auto value = parse_double(fields[1]);
    if (!start || !value) {
        return std::nullopt;
    }

    PriceUnit unit = PriceUnit::PerKWh;
    if (fields.size() == 3) {
        const auto u = lower(trim(fields[2]));
        if (u == "mwh") {
            unit = PriceUnit::PerMWh;
        } else if (!u.empty() && u != "kwh") {
            return std::nullopt;
        }
    }

    return RawPrice{.start = *start, .value = *value, .unit = unit};
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

RawPriceSeries
DataLoader::parse_csv_string(std::string_view csv_content, std::chrono::minutes default_offset) {
    RawPriceSeries points;
    bool header_skipped = false;

    for (std::string_view line : split(csv_content, '\n')) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            const auto t = trim(line);
            if (!t.empty() && t.front() != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (auto p = parse_row(line, default_offset)) {
            points.push_back(*p);
        }
    }
    return points;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<RawPriceSeries>
DataLoader::load_csv(const std::string& filepath, std::chrono::minutes default_offset) {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_csv_string(*contents, default_offset);
}

// ─── Settings ─────────────────────────────────────────────────────────────────

void DataLoader::apply_setting(Settings& s, std::string_view key, std::string_view value) {
    if (key == "window_duration") {
        const int m = require(parse_int(value), key, value);
        if (m == 15)      s.window_duration = WindowDuration::QuarterHour;
        else if (m == 60) s.window_duration = WindowDuration::Hour;
        else throw InvalidSettings(std::string(key), "must be 15 or 60 minutes");
    } else if (key == "charge_window_count") {
        s.charge_window_count = require(parse_int(value), key, value);
    } else if (key == "expensive_window_count") {
        s.expensive_window_count = require(parse_int(value), key, value);
    } else if (key == "cheap_percentile") {
        s.cheap_percentile = require(parse_double(value), key, value);
    } else if (key == "expensive_percentile") {
        s.expensive_percentile = require(parse_double(value), key, value);
    } else if (key == "min_spread_pct") {
        s.min_spread_pct = require(parse_double(value), key, value);
    } else if (key == "discharge_spread_pct") {
        s.discharge_spread_pct = require(parse_double(value), key, value);
    } else if (key == "aggressive_spread_pct") {
        s.aggressive_spread_pct = require(parse_double(value), key, value);
    } else if (key == "min_price_difference") {
        s.min_price_difference = require(parse_double(value), key, value);
    } else if (key == "vat_pct") {
        s.vat_pct = require(parse_double(value), key, value);
    } else if (key == "tax_per_kwh") {
        s.tax_per_kwh = require(parse_double(value), key, value);
    } else if (key == "additional_cost_per_kwh") {
        s.additional_cost_per_kwh = require(parse_double(value), key, value);
    } else if (key == "round_trip_efficiency_pct") {
        s.round_trip_efficiency_pct = require(parse_double(value), key, value);
    } else if (key == "charge_power_w") {
        s.charge_power_w = require(parse_double(value), key, value);
    } else if (key == "discharge_power_w") {
        s.discharge_power_w = require(parse_double(value), key, value);
    } else if (key == "price_override") {
        s.price_override = optional_price(key, value);
    } else if (key == "discharge_price_override") {
        s.discharge_price_override = optional_price(key, value);
    } else if (key == "time_override") {
        // "<mode> HH:MM-HH:MM"
        const auto v     = trim(value);
        const auto space = v.find_first_of(" \t");
        if (space == std::string_view::npos) bad_value(key, value);
        const auto mode  = parse_override_mode(lower(v.substr(0, space)));
        const auto range = parse_range(v.substr(space + 1));
        if (!mode || !range) bad_value(key, value);
        s.time_overrides.push_back(TimeOverride{
            .mode  = *mode,
            .start = range->first,
            .end   = range->second,
        });
    } else if (key == "automation_enabled") {
        s.automation_enabled = require(parse_bool(value), key, value);
    } else if (key == "calculation_window") {
        const auto v = lower(trim(value));
        if (v.empty() || v == "none" || v == "off") {
            s.calculation_window.reset();
        } else {
            const auto range = require(parse_range(value), key, value);
            s.calculation_window = CalculationWindow{.start = range.first, .end = range.second};
        }
    } else if (key == "utc_offset") {
        s.utc_offset = require(parse_offset(value), key, value);
    } else {
        throw InvalidSettings(std::string(key), "unknown setting");
    }
}

Settings DataLoader::parse_settings_string(std::string_view content, const Settings& base) {
    Settings s = base;
    for (std::string_view line : split(content, '\n')) {
        // Strip trailing comment.
        if (const auto hash = line.find('#'); hash != std::string_view::npos) {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty()) continue;

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            throw InvalidSettings(std::string(line), "expected 'key = value'");
        }
        apply_setting(s, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
    }
    validate(s);
    return s;
}

std::optional<Settings>
DataLoader::load_settings(const std::string& filepath, const Settings& base) {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_settings_string(*contents, base);
}

}  // namespace cew
