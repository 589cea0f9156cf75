// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_RATE_LIMITER_H
#define CALLGUARD_RATE_LIMITER_H

/**
 * @file rate_limiter.h
 * @brief Per-subject, per-operation-class rate limiting
 *
 * Each (subject, operation class) pair owns a fixed-window counter. The
 * first request of a window opens it; once the window length has passed
 * the next request opens a fresh window. Concurrency tiers (streaming)
 * count active operations instead of requests per window.
 *
 * A fixed window admits up to twice the limit across a window boundary
 * (limit at the end of one window, limit at the start of the next). This
 * burst is accepted; do not replace the window with a sliding one without
 * revisiting the tier definitions.
 *
 * Key features:
 * - Tier table keyed by operation class, replaceable at runtime
 * - Optional default tier for classes missing from the table
 * - Per-bucket locking so unrelated subjects never contend
 * - Idle bucket eviction
 */

#include <callguard/clock.h>
#include <callguard/event_sink.h>
#include <sync.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace callguard {

// ============================================================================
// Constants
// ============================================================================

/** Default window length for every built-in tier */
static constexpr int64_t DEFAULT_RATE_WINDOW_MS = 60 * 1000;

/** Help requests per window */
static constexpr uint32_t DEFAULT_HELP_LIMIT = 20;

/** Analysis requests per window */
static constexpr uint32_t DEFAULT_ANALYSIS_LIMIT = 5;

/** Recommendation requests per window */
static constexpr uint32_t DEFAULT_RECOMMENDATIONS_LIMIT = 10;

/** Quick checks per window */
static constexpr uint32_t DEFAULT_QUICK_CHECK_LIMIT = 30;

/** Concurrent streaming operations per subject */
static constexpr uint32_t DEFAULT_STREAMING_CONCURRENCY = 3;

/** Buckets untouched for this long are eligible for eviction */
static constexpr int64_t DEFAULT_BUCKET_IDLE_MS = 10 * 60 * 1000;

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Limit applied to one operation class
 */
struct RateLimitTier {
    uint32_t limit;
    int64_t windowMs;
    /** Count active operations instead of requests per window */
    bool concurrent;

    RateLimitTier() : limit(0), windowMs(DEFAULT_RATE_WINDOW_MS), concurrent(false) {}

    static RateLimitTier Window(uint32_t limit, int64_t windowMs) {
        RateLimitTier tier;
        tier.limit = limit;
        tier.windowMs = windowMs;
        tier.concurrent = false;
        return tier;
    }

    static RateLimitTier Concurrent(uint32_t limit) {
        RateLimitTier tier;
        tier.limit = limit;
        tier.windowMs = 0;
        tier.concurrent = true;
        return tier;
    }

    std::string ToString() const;
};

/** help 20/60s, analysis 5/60s, recommendations 10/60s, quick-check 30/60s, streaming 3 concurrent */
std::map<std::string, RateLimitTier> DefaultRateLimitTiers();

/**
 * @brief Result of a rate limit check
 */
struct RateLimitCheckResult {
    /** Whether the request is admitted */
    bool allowed;

    /** Reason if not allowed */
    std::string reason;

    /** Limit of the applicable tier */
    uint32_t limit;

    /** Requests counted in the current window (or active operations) */
    uint32_t used;

    /** Time until the window resets; 0 for concurrency tiers */
    int64_t retryAfterMs;

    RateLimitCheckResult()
        : allowed(true)
        , limit(0)
        , used(0)
        , retryAfterMs(0)
    {}

    static RateLimitCheckResult Allowed(uint32_t limit, uint32_t used) {
        RateLimitCheckResult result;
        result.allowed = true;
        result.limit = limit;
        result.used = used;
        return result;
    }

    static RateLimitCheckResult Denied(const std::string& reason, uint32_t limit, uint32_t used, int64_t retryAfterMs = 0) {
        RateLimitCheckResult result;
        result.allowed = false;
        result.reason = reason;
        result.limit = limit;
        result.used = used;
        result.retryAfterMs = retryAfterMs;
        return result;
    }
};

/** Request counters for one operation class */
struct OperationClassStats {
    uint64_t requests;
    uint64_t rejected;

    OperationClassStats() : requests(0), rejected(0) {}
};

// ============================================================================
// Rate Limiter Class
// ============================================================================

/**
 * @brief Rate limiter
 *
 * Thread-safe. The bucket registry lock is held only to find or create a
 * bucket; the check-and-increment itself runs under the bucket's own lock,
 * so two concurrent requests for one bucket can never both take its last
 * slot.
 */
class RateLimiter {
public:
    /**
     * @param clock Time source for windows
     * @param events Sink for rate_limit_exceeded events (may be null)
     * @param tiers Tier table keyed by operation class
     */
    RateLimiter(const Clock& clock, EventSink* events,
                const std::map<std::string, RateLimitTier>& tiers = DefaultRateLimitTiers());

    /**
     * @brief Count a request and decide whether it is admitted
     * @param subjectId User or session the request belongs to
     * @param operationClass Operation class selecting the tier
     * @return Decision with limit, usage and retry hint
     * @throws InvalidRequestError if the class has no tier and no default tier is set
     *
     * A denied windowed request still counts against the window.
     */
    RateLimitCheckResult CheckAndIncrement(const std::string& subjectId, const std::string& operationClass);

    /**
     * @brief CheckAndIncrement, raising on denial
     * @throws RateLimitExceededError if the request is denied
     */
    void Enforce(const std::string& subjectId, const std::string& operationClass);

    /** End an operation admitted under a concurrency tier */
    void ReleaseConcurrent(const std::string& subjectId, const std::string& operationClass);

    // =========================================================================
    // Tier Management
    // =========================================================================

    void SetTier(const std::string& operationClass, const RateLimitTier& tier);
    void SetDefaultTier(const std::optional<RateLimitTier>& tier);
    std::optional<RateLimitTier> GetTier(const std::string& operationClass) const;
    bool IsConcurrentClass(const std::string& operationClass) const;

    // =========================================================================
    // Inspection and Maintenance
    // =========================================================================

    /** Requests counted in the live window, or active operations */
    uint32_t GetUsage(const std::string& subjectId, const std::string& operationClass) const;

    /** Drop buckets not touched within idleMs. Returns the number dropped. */
    size_t EvictIdle(int64_t idleMs = DEFAULT_BUCKET_IDLE_MS);

    size_t GetBucketCount() const;

    std::map<std::string, OperationClassStats> GetStats() const;

    void Clear();

private:
    struct Bucket {
        mutable CCriticalSection cs;
        RateLimitTier tier;
        int64_t windowStart;
        /** Requests this window, or active operations for concurrency tiers */
        uint32_t count;
        int64_t lastSeen;
        /** Removed from the registry; callers holding it must look the key up again */
        bool evicted;

        Bucket() : windowStart(0), count(0), lastSeen(0), evicted(false) {}
    };

    typedef std::pair<std::string, std::string> BucketKey;

    std::optional<RateLimitTier> ResolveTier(const std::string& operationClass) const;
    std::shared_ptr<Bucket> GetOrCreateBucket(const BucketKey& key, const RateLimitTier& tier);
    std::shared_ptr<Bucket> FindBucket(const BucketKey& key) const;
    void RecordStats(const std::string& operationClass, bool allowed);

    const Clock& clock_;
    EventSink* events_;

    mutable CCriticalSection cs_tiers_;
    std::map<std::string, RateLimitTier> tiers_;
    std::optional<RateLimitTier> defaultTier_;

    mutable CCriticalSection cs_buckets_;
    std::map<BucketKey, std::shared_ptr<Bucket>> buckets_;

    mutable CCriticalSection cs_stats_;
    std::map<std::string, OperationClassStats> stats_;
};

} // namespace callguard

#endif // CALLGUARD_RATE_LIMITER_H
