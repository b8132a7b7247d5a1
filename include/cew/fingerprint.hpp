#pragma once

/// @file include/cew/fingerprint.hpp
/// @brief FNV-1a content hashing for cache keys.
///
/// Doubles are hashed by bit pattern, so 0.1 + 0.2 and 0.3 hash differently:
/// the fingerprint answers "is this the same input", not "is it equal within
/// tolerance".

#include "cew/types.hpp"

#include <cstdint>
#include <span>
#include <string_view>

namespace cew {

/// Incremental 64-bit FNV-1a hasher.
class Fnv1a {
public:
    Fnv1a& add(std::uint64_t value) noexcept;
    Fnv1a& add(std::int64_t value) noexcept;
    Fnv1a& add(int value) noexcept { return add(static_cast<std::int64_t>(value)); }
    Fnv1a& add(bool value) noexcept { return add(static_cast<std::uint64_t>(value)); }
    Fnv1a& add(double value) noexcept;
    Fnv1a& add(std::string_view text) noexcept;

    [[nodiscard]] std::uint64_t digest() const noexcept { return state_; }

private:
    void mix_bytes(const unsigned char* data, std::size_t size) noexcept;

    static constexpr std::uint64_t OFFSET_BASIS = 0xcbf29ce484222325ULL;
    static constexpr std::uint64_t PRIME        = 0x100000001b3ULL;

    std::uint64_t state_ = OFFSET_BASIS;
};

/// Fingerprint of a raw series. Independent of the storage order of points.
/// An empty series hashes to a fixed sentinel distinct from any non-empty one.
[[nodiscard]] std::uint64_t fingerprint(std::span<const RawPrice> series);

}  // namespace cew
