#pragma once

/// @file include/cew/errors.hpp
/// @brief Exception types raised across the CEW public boundary.
///
/// Numeric helpers inside the pipeline report failure through
/// `std::optional`. Only two conditions escape to the caller as exceptions:
///
///   - MalformedSeries  — a price series failed contiguity/coverage checks
///   - InvalidSettings  — a settings value is out of range
///
/// An absent price series is not an error (it normalizes to zero windows).

#include <stdexcept>
#include <string>
#include <utility>

namespace cew {

/// A price series that cannot be laid out as one contiguous local day.
class MalformedSeries : public std::runtime_error {
public:
    explicit MalformedSeries(const std::string& what)
        : std::runtime_error("malformed price series: " + what) {}
};

/// A settings value outside its documented range.
class InvalidSettings : public std::invalid_argument {
public:
    InvalidSettings(std::string field, const std::string& what)
        : std::invalid_argument("invalid setting '" + field + "': " + what),
          field_(std::move(field)) {}

    /// Name of the offending field.
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

}  // namespace cew
