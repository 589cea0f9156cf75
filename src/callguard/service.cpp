// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/service.h>
#include <callguard/errors.h>
#include <logging.h>

#include <sstream>

namespace callguard {

CallguardService::CallguardService(const CallguardConfig& config, const Clock& clock)
    : config_(config)
    , events_(clock)
    , cache_(clock, config.cacheMaxEntries)
    , limiter_(clock, &events_, config.rateLimitTiers)
    , breakers_(config.breaker, clock, &events_)
    , governor_(clock, &events_, config.governor)
    , router_(config.router, cache_, limiter_, breakers_, governor_, fallback_, &events_)
{
    limiter_.SetDefaultTier(config.defaultRateLimitTier);
    for (const auto& budget : config.budgets) {
        governor_.SetBudget(budget.first, budget.second);
    }
    for (const auto& tenant : config.tenantProviders) {
        router_.SetTenantProviders(tenant.first, tenant.second);
    }
    LogPrintf("Callguard service started: %u providers configured, failure threshold %u, recovery %ds\n",
              config.providers.size(), config.breaker.failureThreshold, config.breaker.recoveryTimeoutMs / 1000);
}

size_t CallguardService::BindProvider(const std::string& providerId, std::shared_ptr<IProvider> transport)
{
    size_t registered = 0;
    for (const ProviderDescriptor& descriptor : config_.providers) {
        if (descriptor.providerId == providerId) {
            router_.RegisterProvider(descriptor, transport);
            registered++;
        }
    }
    if (registered == 0) {
        throw ConfigError("no -provider entry for " + providerId);
    }
    return registered;
}

std::string CallguardService::GetStatusReport()
{
    std::ostringstream report;

    report << "Circuit breakers:\n";
    for (const CircuitBreakerStatus& status : breakers_.GetAllStatus()) {
        report << strprintf("  %-28s %-9s failures=%u successes=%u rejected=%u opened=%u\n",
                            status.providerId + "/" + status.modelId, BreakerStateToString(status.state),
                            status.totalFailures, status.totalSuccesses, status.totalRejections, status.timesOpened);
    }

    report << "Rate limits:\n";
    for (const auto& entry : limiter_.GetStats()) {
        report << strprintf("  %-28s requests=%u rejected=%u\n", entry.first, entry.second.requests, entry.second.rejected);
    }

    const CacheStats cache = cache_.GetStats();
    report << strprintf("Cache: entries=%u hits=%u misses=%u expired=%u evictions=%u hit_rate=%.1f%%\n",
                        cache.entries, cache.hits, cache.misses, cache.expired, cache.evictions, cache.HitRate() * 100.0);

    report << "Budgets:\n";
    for (const BudgetStatus& status : governor_.GetAllStatus()) {
        report << strprintf("  %-28s actual=%s reserved=%s hard=%s usage=%.1f%% overrun=%s drift=%.1f%%%s%s\n",
                            status.ledger.tenantId, FormatCost(status.ledger.spentActual),
                            FormatCost(status.ledger.spentEstimated), FormatCost(status.policy.hardCap),
                            status.usagePercent, FormatCost(status.ledger.overrun), status.drift * 100.0,
                            status.softCapReached ? " soft-cap" : "", status.overrideActive ? " override" : "");
    }

    const FallbackStats fallback = fallback_.GetStats();
    report << strprintf("Fallbacks: total=%u\n", fallback.total);
    for (const auto& entry : fallback.byReason) {
        report << strprintf("  %-28s %u\n", DegradeReasonToString(entry.first), entry.second);
    }

    const RouterStats router = router_.GetStats();
    report << strprintf("Router: requests=%u cache_hits=%u provider=%u fallback=%u upstream_failures=%u timeouts=%u saturated=%u\n",
                        router.requests, router.cacheHits, router.providerSuccesses, router.fallbacks,
                        router.upstreamFailures, router.upstreamTimeouts, router.saturatedSkips);
    return report.str();
}

} // namespace callguard
