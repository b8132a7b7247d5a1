#pragma once

/// @file include/cew/report.hpp
/// @brief Rendering of a ClassificationResult as host attributes and text.
///
/// Attribute order is fixed; list values are rendered as "[a, b, c]",
/// absent optionals as "none", instants as ISO-8601 with the local offset.
/// Prices carry five decimals, money three, percentages one.

#include "cew/result.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace cew::report {

/// Ordered (name, value) pairs.
using Attributes = std::vector<std::pair<std::string, std::string>>;

/// Host-facing attributes of `result`.
[[nodiscard]] Attributes to_attributes(const ClassificationResult& result,
                                       std::chrono::minutes utc_offset);

/// Multi-line human-readable summary: a header with the day and state,
/// followed by one "name: value" line per attribute.
[[nodiscard]] std::string to_string(const ClassificationResult& result,
                                    std::chrono::minutes utc_offset);

}  // namespace cew::report
