/// @file src/cache/result_cache.cpp
/// @brief ResultCache — TTL, window-slot staleness and in-flight dedup.

#include "cew/cache.hpp"
#include "cew/fingerprint.hpp"

#include <utility>

namespace cew {

// ─── CacheKeyHash ─────────────────────────────────────────────────────────────

std::size_t CacheKeyHash::operator()(const CacheKey& k) const noexcept {
    Fnv1a h;
    h.add(k.today)
     .add(k.tomorrow)
     .add(k.settings)
     .add(static_cast<std::int64_t>(k.day.time_since_epoch().count()));
    return static_cast<std::size_t>(h.digest());
}

// ─── construction ─────────────────────────────────────────────────────────────

ResultCache::ResultCache(std::chrono::seconds ttl, ClockFn clock)
    : ttl_(ttl)
    , clock_(clock ? std::move(clock) : ClockFn{[] { return Clock::now(); }})
{}

// ─── helpers (mutex held) ─────────────────────────────────────────────────────

bool ResultCache::expired(const Entry& e) const {
    return clock_() - e.computed_at >= ttl_;
}

const ResultCache::Entry*
ResultCache::fresh_locked(const CacheKey& key, std::int64_t slot) const {
    const auto it = entries_.find(key);
    if (it == entries_.end() || it->second.slot != slot || expired(it->second)) {
        return nullptr;
    }
    return &it->second;
}

void ResultCache::insert_locked(const CacheKey& key, std::int64_t slot,
                                ClassificationResult value) {
    std::erase_if(entries_, [&](const auto& kv) {
        return kv.first.day == key.day && !(kv.first == key);
    });
    entries_[key] = Entry{
        .value       = std::move(value),
        .computed_at = clock_(),
        .slot        = slot,
    };
}

// ─── public API ───────────────────────────────────────────────────────────────

std::optional<ClassificationResult>
ResultCache::get(const CacheKey& key, std::int64_t slot) const {
    std::lock_guard lock(mutex_);
    if (const Entry* e = fresh_locked(key, slot)) {
        ++stats_.hits;
        return e->value;
    }
    return std::nullopt;
}

void ResultCache::put(const CacheKey& key, std::int64_t slot, ClassificationResult value) {
    std::lock_guard lock(mutex_);
    insert_locked(key, slot, std::move(value));
}

ClassificationResult
ResultCache::get_or_compute(const CacheKey& key, std::int64_t slot,
                            const Compute& compute, bool* hit) {
    std::unique_lock lock(mutex_);
    for (;;) {
        if (const Entry* e = fresh_locked(key, slot)) {
            ++stats_.hits;
            if (hit) *hit = true;
            return e->value;
        }
        if (!in_flight_.contains(key)) break;
        in_flight_done_.wait(lock);
    }
    in_flight_.insert(key);
    ++stats_.misses;
    if (hit) *hit = false;
    lock.unlock();

    ClassificationResult value;
    try {
        value = compute();
    } catch (...) {
        lock.lock();
        in_flight_.erase(key);
        in_flight_done_.notify_all();
        throw;
    }

    lock.lock();
    insert_locked(key, slot, value);
    in_flight_.erase(key);
    in_flight_done_.notify_all();
    return value;
}

std::optional<ClassificationResult> ResultCache::latest(LocalDay day) const {
    std::lock_guard lock(mutex_);
    const Entry* best = nullptr;
    for (const auto& [key, entry] : entries_) {
        if (key.day != day || expired(entry)) continue;
        if (!best || entry.computed_at > best->computed_at) best = &entry;
    }
    if (!best) {
        return std::nullopt;
    }
    return best->value;
}

void ResultCache::invalidate(LocalDay day) {
    std::lock_guard lock(mutex_);
    std::erase_if(entries_, [&](const auto& kv) { return kv.first.day == day; });
}

void ResultCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

std::size_t ResultCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

ResultCache::Stats ResultCache::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

}  // namespace cew
