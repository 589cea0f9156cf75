// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_RESPONSE_CACHE_H
#define CALLGUARD_RESPONSE_CACHE_H

/**
 * @file response_cache.h
 * @brief Fingerprint-keyed response cache with per-entry TTL
 *
 * Successful provider responses are cached for the normal TTL; fallback
 * responses produced while every provider is unavailable are cached for a
 * much shorter TTL so that recovery is picked up quickly. Expired entries
 * are never served. When the cache is full the oldest inserted entry is
 * evicted.
 */

#include <callguard/callguard_common.h>
#include <callguard/clock.h>
#include <sync.h>

#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace callguard {

// ============================================================================
// Constants
// ============================================================================

/** Default lifetime of a provider response (one hour) */
static constexpr int64_t DEFAULT_CACHE_TTL_MS = 3600 * 1000;

/** Default lifetime of a cached fallback response (one minute) */
static constexpr int64_t DEFAULT_FALLBACK_CACHE_TTL_MS = 60 * 1000;

/** Default maximum number of cached responses */
static constexpr size_t DEFAULT_CACHE_MAX_ENTRIES = 10000;

// ============================================================================
// Data Structures
// ============================================================================

struct CacheEntry {
    std::string payload;
    /** Clock::NowMillis() at insertion */
    int64_t createdAt;
    int64_t ttlMs;
    /** "provider/model" that produced the payload, or "fallback" */
    std::string providerUsed;
    bool isFallback;

    CacheEntry() : createdAt(0), ttlMs(0), isFallback(false) {}

    bool IsExpired(int64_t now) const { return now >= createdAt + ttlMs; }
};

struct CacheStats {
    uint64_t hits;
    uint64_t misses;
    uint64_t expired;
    uint64_t evictions;
    uint64_t insertions;
    size_t entries;

    CacheStats() : hits(0), misses(0), expired(0), evictions(0), insertions(0), entries(0) {}

    double HitRate() const {
        const uint64_t lookups = hits + misses;
        return lookups == 0 ? 0.0 : static_cast<double>(hits) / lookups;
    }
};

// ============================================================================
// Response Cache Class
// ============================================================================

/**
 * @brief Response cache
 *
 * Thread-safe. Lookups and insertions are atomic per key; concurrent puts
 * for the same fingerprint leave exactly one entry (the last writer's).
 */
class ResponseCache {
public:
    explicit ResponseCache(const Clock& clock, size_t maxEntries = DEFAULT_CACHE_MAX_ENTRIES);

    /**
     * @brief Look up an unexpired entry
     * @param fingerprint Request fingerprint
     * @return The entry, or nullopt on miss. An expired entry is removed and
     *         reported as a miss.
     */
    std::optional<CacheEntry> Get(const std::string& fingerprint);

    /**
     * @brief Insert or replace an entry
     * @param fingerprint Request fingerprint
     * @param payload Response text
     * @param ttlMs Lifetime; a non-positive TTL stores nothing
     * @param providerUsed Producer of the payload
     * @param isFallback Whether the payload is degraded content
     */
    void Put(const std::string& fingerprint, const std::string& payload, int64_t ttlMs,
             const std::string& providerUsed, bool isFallback);

    /** Remove an entry. Returns whether one existed. */
    bool Invalidate(const std::string& fingerprint);

    void Clear();

    /** Drop every expired entry, returning how many were removed */
    size_t PurgeExpired();

    size_t Size() const;
    size_t GetMaxEntries() const { return maxEntries_; }

    CacheStats GetStats() const;

private:
    struct Slot {
        std::shared_ptr<const CacheEntry> entry;
        std::list<std::string>::iterator order;
    };

    void EraseSlot(std::map<std::string, Slot>::iterator it);

    const Clock& clock_;
    const size_t maxEntries_;

    mutable CCriticalSection cs_cache_;
    std::map<std::string, Slot> entries_;
    /** Fingerprints in insertion order, oldest first */
    std::list<std::string> insertionOrder_;
    CacheStats stats_;
};

} // namespace callguard

#endif // CALLGUARD_RESPONSE_CACHE_H
