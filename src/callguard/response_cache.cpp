// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/response_cache.h>
#include <callguard/fingerprint.h>
#include <logging.h>

namespace callguard {

ResponseCache::ResponseCache(const Clock& clock, size_t maxEntries)
    : clock_(clock)
    , maxEntries_(maxEntries > 0 ? maxEntries : 1)
{
}

void ResponseCache::EraseSlot(std::map<std::string, Slot>::iterator it)
{
    insertionOrder_.erase(it->second.order);
    entries_.erase(it);
}

std::optional<CacheEntry> ResponseCache::Get(const std::string& fingerprint)
{
    LOCK(cs_cache_);

    auto it = entries_.find(fingerprint);
    if (it == entries_.end()) {
        stats_.misses++;
        return std::nullopt;
    }

    if (it->second.entry->IsExpired(clock_.NowMillis())) {
        LogPrint(CGLog::CACHE, "Cache entry %s expired\n", FingerprintPrefix(fingerprint));
        EraseSlot(it);
        stats_.expired++;
        stats_.misses++;
        return std::nullopt;
    }

    stats_.hits++;
    return *it->second.entry;
}

void ResponseCache::Put(const std::string& fingerprint, const std::string& payload, int64_t ttlMs,
                        const std::string& providerUsed, bool isFallback)
{
    if (ttlMs <= 0) {
        return;
    }

    auto entry = std::make_shared<CacheEntry>();
    entry->payload = payload;
    entry->createdAt = clock_.NowMillis();
    entry->ttlMs = ttlMs;
    entry->providerUsed = providerUsed;
    entry->isFallback = isFallback;

    LOCK(cs_cache_);

    auto it = entries_.find(fingerprint);
    if (it != entries_.end()) {
        EraseSlot(it);
    }

    while (entries_.size() >= maxEntries_ && !insertionOrder_.empty()) {
        auto oldest = entries_.find(insertionOrder_.front());
        LogPrint(CGLog::CACHE, "Cache full, evicting %s\n", FingerprintPrefix(insertionOrder_.front()));
        EraseSlot(oldest);
        stats_.evictions++;
    }

    insertionOrder_.push_back(fingerprint);
    Slot slot;
    slot.entry = entry;
    slot.order = std::prev(insertionOrder_.end());
    entries_[fingerprint] = slot;
    stats_.insertions++;

    LogPrint(CGLog::CACHE, "Cached %s from %s (ttl=%dms%s)\n", FingerprintPrefix(fingerprint),
             providerUsed, ttlMs, isFallback ? ", fallback" : "");
}

bool ResponseCache::Invalidate(const std::string& fingerprint)
{
    LOCK(cs_cache_);
    auto it = entries_.find(fingerprint);
    if (it == entries_.end()) {
        return false;
    }
    EraseSlot(it);
    return true;
}

void ResponseCache::Clear()
{
    LOCK(cs_cache_);
    entries_.clear();
    insertionOrder_.clear();
}

size_t ResponseCache::PurgeExpired()
{
    LOCK(cs_cache_);
    const int64_t now = clock_.NowMillis();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.entry->IsExpired(now)) {
            auto next = std::next(it);
            EraseSlot(it);
            it = next;
            removed++;
        } else {
            ++it;
        }
    }
    stats_.expired += removed;
    if (removed > 0) {
        LogPrint(CGLog::CACHE, "Purged %u expired cache entries\n", removed);
    }
    return removed;
}

size_t ResponseCache::Size() const
{
    LOCK(cs_cache_);
    return entries_.size();
}

CacheStats ResponseCache::GetStats() const
{
    LOCK(cs_cache_);
    CacheStats stats = stats_;
    stats.entries = entries_.size();
    return stats;
}

} // namespace callguard
