// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/rate_limiter.h>
#include <callguard/errors.h>
#include <logging.h>

namespace callguard {

std::string RateLimitTier::ToString() const
{
    if (concurrent) {
        return strprintf("%u concurrent", limit);
    }
    return strprintf("%u per %ds", limit, windowMs / 1000);
}

std::map<std::string, RateLimitTier> DefaultRateLimitTiers()
{
    std::map<std::string, RateLimitTier> tiers;
    tiers["help"] = RateLimitTier::Window(DEFAULT_HELP_LIMIT, DEFAULT_RATE_WINDOW_MS);
    tiers["analysis"] = RateLimitTier::Window(DEFAULT_ANALYSIS_LIMIT, DEFAULT_RATE_WINDOW_MS);
    tiers["recommendations"] = RateLimitTier::Window(DEFAULT_RECOMMENDATIONS_LIMIT, DEFAULT_RATE_WINDOW_MS);
    tiers["quick-check"] = RateLimitTier::Window(DEFAULT_QUICK_CHECK_LIMIT, DEFAULT_RATE_WINDOW_MS);
    tiers["streaming"] = RateLimitTier::Concurrent(DEFAULT_STREAMING_CONCURRENCY);
    return tiers;
}

RateLimiter::RateLimiter(const Clock& clock, EventSink* events,
                         const std::map<std::string, RateLimitTier>& tiers)
    : clock_(clock)
    , events_(events)
    , tiers_(tiers)
{
}

// ============================================================================
// Rate Limit Checking
// ============================================================================

std::optional<RateLimitTier> RateLimiter::ResolveTier(const std::string& operationClass) const
{
    LOCK(cs_tiers_);
    auto it = tiers_.find(operationClass);
    if (it != tiers_.end()) {
        return it->second;
    }
    return defaultTier_;
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::GetOrCreateBucket(const BucketKey& key, const RateLimitTier& tier)
{
    LOCK(cs_buckets_);
    auto it = buckets_.find(key);
    if (it != buckets_.end()) {
        return it->second;
    }
    auto bucket = std::make_shared<Bucket>();
    bucket->tier = tier;
    buckets_[key] = bucket;
    return bucket;
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::FindBucket(const BucketKey& key) const
{
    LOCK(cs_buckets_);
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        return nullptr;
    }
    return it->second;
}

void RateLimiter::RecordStats(const std::string& operationClass, bool allowed)
{
    LOCK(cs_stats_);
    OperationClassStats& stats = stats_[operationClass];
    stats.requests++;
    if (!allowed) {
        stats.rejected++;
    }
}

RateLimitCheckResult RateLimiter::CheckAndIncrement(const std::string& subjectId, const std::string& operationClass)
{
    std::optional<RateLimitTier> tier = ResolveTier(operationClass);
    if (!tier) {
        throw InvalidRequestError("unknown operation class: " + operationClass);
    }

    const BucketKey key(subjectId, operationClass);
    const int64_t now = clock_.NowMillis();

    RateLimitCheckResult result;
    while (true) {
        std::shared_ptr<Bucket> bucket = GetOrCreateBucket(key, *tier);
        LOCK(bucket->cs);
        // EvictIdle may have dropped the bucket between lookup and lock
        if (bucket->evicted) {
            continue;
        }
        bucket->lastSeen = now;

        if (tier->concurrent) {
            bucket->tier = *tier;
            if (bucket->count >= tier->limit) {
                result = RateLimitCheckResult::Denied("too many concurrent operations", tier->limit, bucket->count);
            } else {
                bucket->count++;
                result = RateLimitCheckResult::Allowed(tier->limit, bucket->count);
            }
        } else {
            // Open a fresh window on the first request or once the current one has run out
            if (bucket->windowStart == 0 || now - bucket->windowStart >= bucket->tier.windowMs) {
                bucket->tier = *tier;
                bucket->windowStart = now;
                bucket->count = 0;
            }
            bucket->count++;
            if (bucket->count > bucket->tier.limit) {
                const int64_t retryAfter = bucket->windowStart + bucket->tier.windowMs - now;
                result = RateLimitCheckResult::Denied("rate limit exceeded", bucket->tier.limit,
                                                      bucket->count, retryAfter);
            } else {
                result = RateLimitCheckResult::Allowed(bucket->tier.limit, bucket->count);
            }
        }
        break;
    }

    RecordStats(operationClass, result.allowed);

    if (!result.allowed) {
        LogPrint(CGLog::LIMITER, "Rate limit hit: subject=%s class=%s used=%u limit=%u retry_after=%dms\n",
                 subjectId, operationClass, result.used, result.limit, result.retryAfterMs);
        if (events_) {
            events_->Emit(EventType::RATE_LIMIT_EXCEEDED, {
                {"subject", subjectId},
                {"operation_class", operationClass},
                {"limit", strprintf("%u", result.limit)},
                {"retry_after_ms", strprintf("%d", result.retryAfterMs)}});
        }
    }

    return result;
}

void RateLimiter::Enforce(const std::string& subjectId, const std::string& operationClass)
{
    RateLimitCheckResult result = CheckAndIncrement(subjectId, operationClass);
    if (!result.allowed) {
        throw RateLimitExceededError(subjectId, operationClass, result.retryAfterMs);
    }
}

void RateLimiter::ReleaseConcurrent(const std::string& subjectId, const std::string& operationClass)
{
    std::shared_ptr<Bucket> bucket = FindBucket(BucketKey(subjectId, operationClass));
    if (!bucket) {
        return;
    }
    LOCK(bucket->cs);
    if (!bucket->evicted && bucket->tier.concurrent && bucket->count > 0) {
        bucket->count--;
        bucket->lastSeen = clock_.NowMillis();
    }
}

// ============================================================================
// Tier Management
// ============================================================================

void RateLimiter::SetTier(const std::string& operationClass, const RateLimitTier& tier)
{
    LOCK(cs_tiers_);
    tiers_[operationClass] = tier;
    LogPrint(CGLog::LIMITER, "Tier for %s set to %s\n", operationClass, tier.ToString());
}

void RateLimiter::SetDefaultTier(const std::optional<RateLimitTier>& tier)
{
    LOCK(cs_tiers_);
    defaultTier_ = tier;
}

std::optional<RateLimitTier> RateLimiter::GetTier(const std::string& operationClass) const
{
    return ResolveTier(operationClass);
}

bool RateLimiter::IsConcurrentClass(const std::string& operationClass) const
{
    std::optional<RateLimitTier> tier = ResolveTier(operationClass);
    return tier && tier->concurrent;
}

// ============================================================================
// Inspection and Maintenance
// ============================================================================

uint32_t RateLimiter::GetUsage(const std::string& subjectId, const std::string& operationClass) const
{
    std::shared_ptr<Bucket> bucket = FindBucket(BucketKey(subjectId, operationClass));
    if (!bucket) {
        return 0;
    }
    LOCK(bucket->cs);
    if (!bucket->tier.concurrent && clock_.NowMillis() - bucket->windowStart >= bucket->tier.windowMs) {
        return 0;
    }
    return bucket->count;
}

size_t RateLimiter::EvictIdle(int64_t idleMs)
{
    const int64_t now = clock_.NowMillis();
    size_t evicted = 0;

    LOCK(cs_buckets_);
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        bool idle;
        {
            LOCK(it->second->cs);
            // A concurrency bucket with operations still running is never idle
            idle = now - it->second->lastSeen >= idleMs &&
                   !(it->second->tier.concurrent && it->second->count > 0);
            // Marked under the bucket lock so a caller that already holds the
            // pointer sees it before counting against the orphan
            if (idle) {
                it->second->evicted = true;
            }
        }
        if (idle) {
            it = buckets_.erase(it);
            evicted++;
        } else {
            ++it;
        }
    }

    if (evicted > 0) {
        LogPrint(CGLog::LIMITER, "Evicted %u idle rate limit buckets\n", evicted);
    }
    return evicted;
}

size_t RateLimiter::GetBucketCount() const
{
    LOCK(cs_buckets_);
    return buckets_.size();
}

std::map<std::string, OperationClassStats> RateLimiter::GetStats() const
{
    LOCK(cs_stats_);
    return stats_;
}

void RateLimiter::Clear()
{
    {
        LOCK(cs_buckets_);
        buckets_.clear();
    }
    LOCK(cs_stats_);
    stats_.clear();
}

} // namespace callguard
