#pragma once

/// @file include/cew/data_loader.hpp
/// @brief CSV price loader and key=value settings loader.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Turn files into the engine's inputs: raw price points and Settings.
///
/// ## Expected CSV Format
/// ```
/// start,value,unit
/// 2025-03-10T00:00:00+01:00,0.0912,kwh
/// 2025-03-10T00:15:00+01:00,88.40,mwh
/// ```
/// The first line is treated as a header and skipped. `unit` is optional
/// (default kWh). Malformed or non-finite rows are skipped; the series
/// checks themselves belong to the normalizer.
///
/// ## Settings File Format
/// ```
/// # comment
/// charge_window_count = 6
/// price_override      = 0.05
/// time_override       = charge 01:00-03:00   # repeatable
/// calculation_window  = 06:00-22:00
/// utc_offset          = +01:00
/// ```
/// Unknown keys and unparsable values raise InvalidSettings naming the key;
/// the loaded object is validated before it is returned.

#include "cew/settings.hpp"
#include "cew/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace cew {

class DataLoader {
public:
    /// Load raw prices from a CSV file on disk.
    ///
    /// # Arguments
    /// * `filepath`       — CSV with header row (start, value[, unit])
    /// * `default_offset` — zone for timestamps without a designator
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Points parsed from every well-formed row, in file order
    [[nodiscard]] static std::optional<RawPriceSeries>
    load_csv(const std::string& filepath,
             std::chrono::minutes default_offset = std::chrono::minutes{0});

    /// Parse raw prices from CSV text. Never fails; bad rows are skipped.
    [[nodiscard]] static RawPriceSeries
    parse_csv_string(std::string_view csv_content,
                     std::chrono::minutes default_offset = std::chrono::minutes{0});

    /// Load settings from a file.
    ///
    /// # Returns
    /// `nullopt` if the file cannot be opened.
    ///
    /// # Throws
    /// InvalidSettings on an unknown key, a bad value, or a failed validation.
    [[nodiscard]] static std::optional<Settings>
    load_settings(const std::string& filepath, const Settings& base = Settings{});

    /// Apply the `key = value` lines of `content` on top of `base`.
    [[nodiscard]] static Settings
    parse_settings_string(std::string_view content, const Settings& base = Settings{});

private:
    /// Parse a single CSV data row. `nullopt` if malformed.
    [[nodiscard]] static std::optional<RawPrice>
    parse_row(std::string_view line, std::chrono::minutes default_offset);

    /// Apply one key/value pair.
    static void apply_setting(Settings& s, std::string_view key, std::string_view value);
};

}  // namespace cew
