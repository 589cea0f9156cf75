// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_PROVIDER_ROUTER_H
#define CALLGUARD_PROVIDER_ROUTER_H

/**
 * @file provider_router.h
 * @brief Single entry point composing cache, limits, failover and fallback
 *
 * For one logical request the router:
 *
 * 1. fingerprints the request and serves an unexpired cache entry if any;
 * 2. consults the rate limiter and degrades to a fallback if refused;
 * 3. walks the tenant's providers strictly by priority rank; for each one
 *    it reserves the estimated cost with the governor, asks the provider's
 *    breaker for admission and invokes the transport under a hard timeout;
 * 4. on success caches the reply, settles the real cost and returns it;
 *    on failure settles the breaker and governor and moves on;
 * 5. when every candidate is exhausted, returns fallback content.
 *
 * An exhaustion fallback is cached under a key that also covers the tenant
 * and the candidate set, so it is only replayed to requests that would have
 * tried exactly the same providers.
 *
 * Provider-side failures never escape Generate(). Only malformed requests
 * (InvalidRequestError) and unexpected transport exceptions propagate.
 */

#include <callguard/callguard_common.h>
#include <callguard/circuit_breaker.h>
#include <callguard/cost_governor.h>
#include <callguard/event_sink.h>
#include <callguard/fallback_generator.h>
#include <callguard/fingerprint.h>
#include <callguard/invocation_pool.h>
#include <callguard/provider.h>
#include <callguard/rate_limiter.h>
#include <callguard/response_cache.h>
#include <sync.h>

#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace callguard {

// ============================================================================
// Constants
// ============================================================================

/** Hard per-call timeout for upstream invocations */
static constexpr int64_t DEFAULT_PROVIDER_TIMEOUT_MS = 30 * 1000;

/** Granularity at which an in-flight call checks its deadline and cancellation */
static constexpr int64_t INVOCATION_POLL_MS = 5;

/** providerUsed value for fallback content */
static const char* const FALLBACK_PROVIDER_NAME = "fallback";

// ============================================================================
// Data Structures
// ============================================================================

struct RouterConfig {
    int64_t providerTimeoutMs;
    int64_t cacheTtlMs;
    /** 0 disables caching of fallback responses */
    int64_t fallbackCacheTtlMs;
    uint64_t expectedOutputTokens;
    /** Worker threads running upstream calls */
    size_t invocationThreads;
    /** Calls one provider/model may have outstanding, abandoned ones included */
    size_t maxInFlightPerProvider;

    RouterConfig()
        : providerTimeoutMs(DEFAULT_PROVIDER_TIMEOUT_MS)
        , cacheTtlMs(DEFAULT_CACHE_TTL_MS)
        , fallbackCacheTtlMs(DEFAULT_FALLBACK_CACHE_TTL_MS)
        , expectedOutputTokens(DEFAULT_EXPECTED_OUTPUT_TOKENS)
        , invocationThreads(DEFAULT_INVOCATION_THREADS)
        , maxInFlightPerProvider(DEFAULT_MAX_IN_FLIGHT_PER_PROVIDER)
    {}
};

struct GenerateRequest {
    /** User or session, for rate limiting */
    std::string subjectId;
    /** Tenant, for provider lists and budgets */
    std::string tenantId;
    std::string taskType;
    /** Rate limit class; the task type when empty */
    std::string operationClass;
    std::string prompt;
    RequestContext context;
    /** Restrict the tenant's providers to these ids (order still by rank) */
    std::vector<std::string> preferredProviders;
    /** Caller-side cancellation */
    std::shared_ptr<CancellationToken> cancel;

    const std::string& GetOperationClass() const {
        return operationClass.empty() ? taskType : operationClass;
    }
};

struct GenerateResponse {
    std::string text;
    ResponseSource source;
    bool degraded;
    DegradeReason reason;
    /** Explanation for degraded responses, empty otherwise */
    std::string reasonMessage;
    std::string providerUsed;
    std::string modelUsed;
    uint64_t tokensUsed;
    CostAmount cost;
    std::string fingerprint;
    /** Upstream invocations made for this request */
    uint32_t attempts;
    /** 1.0 for live and cached provider output, the template's confidence for fallbacks */
    double confidence;

    GenerateResponse()
        : source(ResponseSource::PROVIDER)
        , degraded(false)
        , reason(DegradeReason::NONE)
        , tokensUsed(0)
        , cost(0)
        , attempts(0)
        , confidence(1.0)
    {}
};

struct RouterStats {
    uint64_t requests;
    uint64_t cacheHits;
    uint64_t providerSuccesses;
    uint64_t fallbacks;
    uint64_t upstreamFailures;
    uint64_t upstreamTimeouts;
    /** Candidates skipped because too many of their calls were outstanding */
    uint64_t saturatedSkips;

    RouterStats()
        : requests(0)
        , cacheHits(0)
        , providerSuccesses(0)
        , fallbacks(0)
        , upstreamFailures(0)
        , upstreamTimeouts(0)
        , saturatedSkips(0)
    {}
};

// ============================================================================
// Provider Router Class
// ============================================================================

/**
 * @brief Provider router
 *
 * Thread-safe; Generate() may be called from many threads at once. The
 * router does not own its collaborators. It owns the invocation pool, whose
 * workers are joined when the router is destroyed.
 */
class ProviderRouter {
public:
    ProviderRouter(const RouterConfig& config, ResponseCache& cache, RateLimiter& limiter,
                   CircuitBreakerRegistry& breakers, CostGovernor& governor,
                   FallbackGenerator& fallback, EventSink* events);

    /**
     * @brief Register a provider/model pair and its transport
     * @throws ConfigError if the pair is already registered or the transport is null
     */
    void RegisterProvider(const ProviderDescriptor& descriptor, std::shared_ptr<IProvider> transport);

    /** Providers a tenant may use; tenants without a list use every provider */
    void SetTenantProviders(const std::string& tenantId, const std::vector<std::string>& providerIds);

    /**
     * @brief Candidates for a tenant in the order they will be tried
     * @param tenantId Tenant
     * @param preferred Optional filter of provider ids
     */
    std::vector<ProviderDescriptor> GetCandidates(const std::string& tenantId,
                                                  const std::vector<std::string>& preferred) const;

    /**
     * @brief Serve one logical request
     * @throws InvalidRequestError for an empty subject, tenant, task type or
     *         prompt, or an operation class without a rate limit tier
     */
    GenerateResponse Generate(const GenerateRequest& request);

    RouterStats GetStats() const;

    /** Upstream calls queued or running for a provider/model key, abandoned ones included */
    size_t GetInFlight(const std::string& providerKey) const;

private:
    struct RegisteredProvider {
        ProviderDescriptor descriptor;
        std::shared_ptr<IProvider> transport;
        size_t registrationOrder;
    };

    enum class InvocationStatus {
        SUCCESS,
        TIMEOUT,
        FAILED,
        CANCELLED,
        UNEXPECTED,
        /** Not started: the provider has too many calls outstanding */
        SATURATED
    };

    struct InvocationOutcome {
        InvocationStatus status;
        ProviderReply reply;
        std::string error;
        std::exception_ptr exception;

        InvocationOutcome() : status(InvocationStatus::FAILED) {}
    };

    std::vector<RegisteredProvider> SelectCandidates(const std::string& tenantId,
                                                     const std::vector<std::string>& preferred) const;

    /**
     * Run the transport on a pool worker and wait for it, the deadline or
     * caller cancellation, whichever comes first. The outcome is always
     * settled here, on the calling thread.
     */
    InvocationOutcome InvokeWithDeadline(const RegisteredProvider& provider, const GenerateRequest& request);

    /** Reject replies whose token counts cannot be real */
    static bool CheckReply(const ProviderReply& reply, std::string& error);

    GenerateResponse ServeCached(const GenerateRequest& request, const std::string& fingerprint,
                                 const CacheEntry& entry);

    /**
     * Build, count and report a degraded response. An exhaustion fallback
     * is cached under fallbackKey when one is given.
     */
    GenerateResponse ServeFallback(const GenerateRequest& request, const std::string& fingerprint,
                                   const std::string& fallbackKey, DegradeReason reason, uint32_t attempts);

    static void ValidateRequest(const GenerateRequest& request);

    const RouterConfig config_;
    ResponseCache& cache_;
    RateLimiter& limiter_;
    CircuitBreakerRegistry& breakers_;
    CostGovernor& governor_;
    FallbackGenerator& fallback_;
    EventSink* events_;

    mutable CCriticalSection cs_providers_;
    std::vector<RegisteredProvider> providers_;
    std::map<std::string, std::vector<std::string>> tenantProviders_;

    mutable CCriticalSection cs_stats_;
    RouterStats stats_;

    InvocationPool pool_;
};

} // namespace callguard

#endif // CALLGUARD_PROVIDER_ROUTER_H
