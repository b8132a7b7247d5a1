/// @file src/cache/fingerprint.cpp
/// @brief FNV-1a hashing of raw price series.

#include "cew/fingerprint.hpp"

#include <algorithm>
#include <bit>
#include <vector>

namespace cew {

void Fnv1a::mix_bytes(const unsigned char* data, std::size_t size) noexcept {
    for (std::size_t i = 0; i < size; ++i) {
        state_ ^= static_cast<std::uint64_t>(data[i]);
        state_ *= PRIME;
    }
}

Fnv1a& Fnv1a::add(std::uint64_t value) noexcept {
    // Little-endian byte order regardless of host, so digests are portable.
    unsigned char bytes[8];
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xffU);
    }
    mix_bytes(bytes, sizeof(bytes));
    return *this;
}

Fnv1a& Fnv1a::add(std::int64_t value) noexcept {
    return add(static_cast<std::uint64_t>(value));
}

Fnv1a& Fnv1a::add(double value) noexcept {
    // Collapse -0.0 onto 0.0 so they fingerprint alike.
    if (value == 0.0) value = 0.0;
    return add(std::bit_cast<std::uint64_t>(value));
}

Fnv1a& Fnv1a::add(std::string_view text) noexcept {
    add(static_cast<std::uint64_t>(text.size()));
    mix_bytes(reinterpret_cast<const unsigned char*>(text.data()), text.size());
    return *this;
}

std::uint64_t fingerprint(std::span<const RawPrice> series) {
    Fnv1a h;
    h.add(std::string_view{"raw-series"});
    h.add(static_cast<std::uint64_t>(series.size()));
    if (series.empty()) {
        return h.digest();
    }

    // Hash in timestamp order so a shuffled copy of the same feed matches.
    std::vector<const RawPrice*> ordered;
    ordered.reserve(series.size());
    for (const auto& p : series) ordered.push_back(&p);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const RawPrice* a, const RawPrice* b) {
                         if (a->start != b->start) return a->start < b->start;
                         return a->value < b->value;
                     });

    for (const RawPrice* p : ordered) {
        h.add(static_cast<std::int64_t>(p->start.time_since_epoch().count()));
        h.add(p->value);
        h.add(static_cast<std::uint64_t>(p->unit));
    }
    return h.digest();
}

}  // namespace cew
