#pragma once

/// @file include/cew/cache.hpp
/// @brief ResultCache — TTL cache of ClassificationResults keyed by input
///        fingerprints.
///
/// # Module: Result Cache
///
/// ## Key
/// (today series hash, tomorrow series hash, settings hash, local day).
/// Any change to either series or to any setting yields a new key.
///
/// ## Freshness
/// An entry is served while
///   clock() − computed_at < ttl   and   slot == slot at computation
/// where `slot` is the index of the window containing "now". The slot check
/// keeps the current state and completed-window totals from going stale
/// across a window boundary inside the TTL.
///
/// ## Concurrency
/// One mutex guards the map. At most one computation per key runs at a
/// time; other callers for that key block on a condition variable and are
/// served the fresh entry. A throwing computation releases the key and the
/// exception propagates to its caller.
///
/// ## Eviction
/// Inserting an entry removes every other entry of the same day, so an
/// edited Settings object leaves no stale window sets behind.

#include "cew/constants.hpp"
#include "cew/result.hpp"
#include "cew/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace cew {

// ─── CacheKey ─────────────────────────────────────────────────────────────────

/// Content address of one computation.
struct CacheKey {
    std::uint64_t today    = 0;  ///< fingerprint of today's raw series
    std::uint64_t tomorrow = 0;  ///< fingerprint of tomorrow's raw series
    std::uint64_t settings = 0;  ///< fingerprint of the Settings object
    LocalDay      day{};         ///< evaluated local day

    friend bool operator==(const CacheKey&, const CacheKey&) = default;
};

struct CacheKeyHash {
    [[nodiscard]] std::size_t operator()(const CacheKey& k) const noexcept;
};

// ─── ResultCache ──────────────────────────────────────────────────────────────

class ResultCache {
public:
    using Clock   = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;
    using Compute = std::function<ClassificationResult()>;

    /// Hit/miss counters since construction.
    struct Stats {
        std::size_t hits   = 0;
        std::size_t misses = 0;
    };

    /// # Arguments
    /// * `ttl`   — entry lifetime
    /// * `clock` — time source; `Clock::now` when empty
    explicit ResultCache(std::chrono::seconds ttl = constants::DEFAULT_CACHE_TTL,
                         ClockFn clock = {});

    ResultCache(const ResultCache&)            = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /// Fresh entry for `key` in window slot `slot`, if any.
    [[nodiscard]] std::optional<ClassificationResult>
    get(const CacheKey& key, std::int64_t slot) const;

    /// Store `value`, evicting every other entry of `key.day`.
    void put(const CacheKey& key, std::int64_t slot, ClassificationResult value);

    /// Serve a fresh entry or run `compute` once and store its result.
    ///
    /// # Arguments
    /// * `hit` — set to whether the value came from the cache (optional)
    ///
    /// # Throws
    /// Whatever `compute` throws; nothing is stored in that case.
    [[nodiscard]] ClassificationResult
    get_or_compute(const CacheKey& key, std::int64_t slot,
                   const Compute& compute, bool* hit = nullptr);

    /// Newest unexpired entry of `day`, ignoring key and slot. Serves as the
    /// last good result when a recomputation fails.
    [[nodiscard]] std::optional<ClassificationResult> latest(LocalDay day) const;

    /// Drop every entry of `day`.
    void invalidate(LocalDay day);

    /// Drop everything.
    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] Stats stats() const;
    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return ttl_; }

private:
    struct Entry {
        ClassificationResult value;
        Clock::time_point    computed_at;
        std::int64_t         slot = 0;
    };

    [[nodiscard]] bool expired(const Entry& e) const;
    [[nodiscard]] const Entry* fresh_locked(const CacheKey& key, std::int64_t slot) const;
    void insert_locked(const CacheKey& key, std::int64_t slot, ClassificationResult value);

    std::chrono::seconds ttl_;
    ClockFn              clock_;

    mutable std::mutex                                   mutex_;
    std::condition_variable                              in_flight_done_;
    std::unordered_map<CacheKey, Entry, CacheKeyHash>    entries_;
    std::unordered_set<CacheKey, CacheKeyHash>           in_flight_;
    mutable Stats                                        stats_;
};

}  // namespace cew
