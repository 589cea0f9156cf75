// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_SERVICE_H
#define CALLGUARD_SERVICE_H

/**
 * @file service.h
 * @brief Owner of one complete resilience core
 *
 * The service builds every component from a CallguardConfig and keeps them
 * alive together, so all callers share the same breakers, limiter buckets,
 * cache and ledgers.
 */

#include <callguard/callguard_config.h>
#include <callguard/circuit_breaker.h>
#include <callguard/clock.h>
#include <callguard/cost_governor.h>
#include <callguard/event_sink.h>
#include <callguard/fallback_generator.h>
#include <callguard/provider.h>
#include <callguard/provider_router.h>
#include <callguard/rate_limiter.h>
#include <callguard/response_cache.h>

#include <memory>
#include <string>

namespace callguard {

class CallguardService {
public:
    /**
     * @param config Validated configuration
     * @param clock Time source; must outlive the service
     */
    CallguardService(const CallguardConfig& config, const Clock& clock);

    CallguardService(const CallguardService&) = delete;
    CallguardService& operator=(const CallguardService&) = delete;

    /**
     * @brief Attach a transport to every configured model of a provider
     * @return Number of provider/model pairs registered
     * @throws ConfigError if the provider is not configured or already bound
     */
    size_t BindProvider(const std::string& providerId, std::shared_ptr<IProvider> transport);

    GenerateResponse Generate(const GenerateRequest& request) { return router_.Generate(request); }

    /** Multi-line human readable snapshot of every component */
    std::string GetStatusReport();

    const CallguardConfig& GetConfig() const { return config_; }
    EventSink& GetEventSink() { return events_; }
    ResponseCache& GetCache() { return cache_; }
    RateLimiter& GetRateLimiter() { return limiter_; }
    CircuitBreakerRegistry& GetBreakers() { return breakers_; }
    CostGovernor& GetGovernor() { return governor_; }
    FallbackGenerator& GetFallbackGenerator() { return fallback_; }
    ProviderRouter& GetRouter() { return router_; }

private:
    const CallguardConfig config_;
    EventSink events_;
    ResponseCache cache_;
    RateLimiter limiter_;
    CircuitBreakerRegistry breakers_;
    CostGovernor governor_;
    FallbackGenerator fallback_;
    ProviderRouter router_;
};

} // namespace callguard

#endif // CALLGUARD_SERVICE_H
