// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file provider_router_tests.cpp
 * @brief End-to-end tests for request routing, failover and degradation
 *
 * Every test wires the router to real components driven by a MockClock.
 * Upstream providers are ScriptedProvider instances, so each test states
 * exactly how every upstream call behaves.
 */

#include <callguard/circuit_breaker.h>
#include <callguard/cost_governor.h>
#include <callguard/errors.h>
#include <callguard/fallback_generator.h>
#include <callguard/provider_router.h>
#include <callguard/rate_limiter.h>
#include <callguard/response_cache.h>
#include <test/test_callguard.h>
#include <logging.h>
#include <utiltime.h>

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <future>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace callguard;

namespace {

/** Transport that blocks every call until opened, ignoring cancellation */
class GatedProvider : public IProvider {
public:
    GatedProvider() : m_gate(m_open.get_future().share()), m_calls(0) {}

    ProviderReply Invoke(const InvocationRequest& request) override
    {
        m_calls++;
        m_gate.wait();
        ProviderReply reply;
        reply.text = "gated reply to " + request.modelId;
        reply.tokensIn = 100;
        reply.tokensOut = 200;
        return reply;
    }

    void Open() { m_open.set_value(); }
    uint64_t GetCallCount() const { return m_calls.load(); }

private:
    std::promise<void> m_open;
    std::shared_future<void> m_gate;
    std::atomic<uint64_t> m_calls;
};

struct RouterTestingSetup : public BasicTestingSetup {
    ResponseCache cache;
    RateLimiter limiter;
    CircuitBreakerRegistry breakers;
    CostGovernor governor;
    FallbackGenerator fallback;

    std::shared_ptr<ScriptedProvider> primary;
    std::shared_ptr<ScriptedProvider> secondary;
    std::shared_ptr<ScriptedProvider> backup;

    std::unique_ptr<ProviderRouter> router;

    RouterTestingSetup()
        : cache(clock)
        , limiter(clock, &events)
        , breakers(CircuitBreakerConfig(), clock, &events)
        , governor(clock, &events)
        , primary(std::make_shared<ScriptedProvider>())
        , secondary(std::make_shared<ScriptedProvider>())
        , backup(std::make_shared<ScriptedProvider>())
    {
        RouterConfig config;
        config.providerTimeoutMs = 5000;
        router = MakeRouter(config);
    }

    /** A router over the fixture's components with the three providers registered */
    std::unique_ptr<ProviderRouter> MakeRouter(const RouterConfig& config)
    {
        std::unique_ptr<ProviderRouter> result(
            new ProviderRouter(config, cache, limiter, breakers, governor, fallback, &events));
        result->RegisterProvider(ProviderDescriptor("primary", "large-v2", 0, 10000, 30000, QualityTier::PREMIUM), primary);
        result->RegisterProvider(ProviderDescriptor("secondary", "medium-v1", 1, 2000, 6000), secondary);
        result->RegisterProvider(ProviderDescriptor("backup", "small-v1", 2, 500, 1500, QualityTier::ECONOMY), backup);
        return result;
    }

    GenerateRequest MakeRequest(const std::string& prompt) const
    {
        GenerateRequest request;
        request.subjectId = "user-1";
        request.tenantId = "acme";
        request.taskType = "help";
        request.prompt = prompt;
        request.context.businessProfileId = "profile-1";
        request.context.frameworkId = "gdpr";
        return request;
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(provider_router_tests, RouterTestingSetup)

// ============================================================================
// Live path
// ============================================================================

BOOST_AUTO_TEST_CASE(serves_from_highest_priority_provider)
{
    GenerateResponse response = router->Generate(MakeRequest("Explain GDPR article 5"));

    BOOST_CHECK_EQUAL(response.source, ResponseSource::PROVIDER);
    BOOST_CHECK(!response.degraded);
    BOOST_CHECK_EQUAL(response.reason, DegradeReason::NONE);
    BOOST_CHECK_EQUAL(response.text, "scripted reply");
    BOOST_CHECK_EQUAL(response.providerUsed, "primary");
    BOOST_CHECK_EQUAL(response.modelUsed, "large-v2");
    BOOST_CHECK_EQUAL(response.attempts, 1u);
    BOOST_CHECK_EQUAL(response.tokensUsed, 300u);
    // 100 tokens in at $0.01/1k plus 200 out at $0.03/1k
    BOOST_CHECK_EQUAL(response.cost, 7000);
    BOOST_CHECK_EQUAL(response.fingerprint.size(), 64u);

    BOOST_CHECK_EQUAL(primary->GetCallCount(), 1u);
    BOOST_CHECK_EQUAL(secondary->GetCallCount(), 0u);

    BudgetStatus budget = governor.GetStatus("acme");
    BOOST_CHECK_EQUAL(budget.ledger.spentActual, 7000);
    BOOST_CHECK_EQUAL(budget.ledger.spentEstimated, 7000);
    BOOST_CHECK_EQUAL(budget.ledger.tokensActual, 300u);
}

BOOST_AUTO_TEST_CASE(fails_over_in_priority_order)
{
    primary->Push(ScriptedProvider::Behaviour::FAIL);
    secondary->Push(ScriptedProvider::Behaviour::TIME_OUT);

    GenerateResponse response = router->Generate(MakeRequest("Explain GDPR article 5"));
    BOOST_CHECK_EQUAL(response.source, ResponseSource::PROVIDER);
    BOOST_CHECK_EQUAL(response.providerUsed, "backup");
    BOOST_CHECK_EQUAL(response.attempts, 3u);

    BOOST_CHECK_EQUAL(breakers.GetBreaker("primary", "large-v2")->GetConsecutiveFailures(), 1u);
    BOOST_CHECK_EQUAL(breakers.GetBreaker("secondary", "medium-v1")->GetConsecutiveFailures(), 1u);
    BOOST_CHECK_EQUAL(breakers.GetBreaker("backup", "small-v1")->GetConsecutiveFailures(), 0u);

    RouterStats stats = router->GetStats();
    BOOST_CHECK_EQUAL(stats.upstreamFailures, 2u);
    BOOST_CHECK_EQUAL(stats.upstreamTimeouts, 1u);
    BOOST_CHECK_EQUAL(stats.providerSuccesses, 1u);

    // Failed attempts leave nothing reserved
    BOOST_CHECK_EQUAL(governor.GetStatus("acme").ledger.spentEstimated,
                      governor.GetStatus("acme").ledger.spentActual);
}

BOOST_AUTO_TEST_CASE(identical_requests_hit_the_cache)
{
    GenerateResponse first = router->Generate(MakeRequest("What does GDPR require?"));
    GenerateResponse second = router->Generate(MakeRequest("  what does   gdpr require?"));

    BOOST_CHECK_EQUAL(primary->GetCallCount(), 1u);
    BOOST_CHECK_EQUAL(first.source, ResponseSource::PROVIDER);
    BOOST_CHECK_EQUAL(second.source, ResponseSource::CACHE);
    BOOST_CHECK(!second.degraded);
    BOOST_CHECK_EQUAL(second.text, first.text);
    BOOST_CHECK_EQUAL(second.providerUsed, "primary");
    BOOST_CHECK_EQUAL(second.modelUsed, "large-v2");
    BOOST_CHECK_EQUAL(second.fingerprint, first.fingerprint);
    BOOST_CHECK_EQUAL(second.attempts, 0u);
    BOOST_CHECK_EQUAL(CountEvents(EventType::CACHE_HIT), 1u);
    BOOST_CHECK_EQUAL(router->GetStats().cacheHits, 1u);

    // Cache hits are not rate limited and not billed
    BOOST_CHECK_EQUAL(limiter.GetUsage("user-1", "help"), 1u);
    BOOST_CHECK_EQUAL(governor.GetStatus("acme").ledger.callsSettled, 1u);

    clock.AdvanceMillis(DEFAULT_CACHE_TTL_MS);
    router->Generate(MakeRequest("What does GDPR require?"));
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 2u);
}

BOOST_AUTO_TEST_CASE(preferred_and_tenant_providers)
{
    GenerateRequest request = MakeRequest("prompt one");
    request.preferredProviders = {"backup"};
    BOOST_CHECK_EQUAL(router->Generate(request).providerUsed, "backup");

    router->SetTenantProviders("acme", {"secondary", "backup"});
    std::vector<ProviderDescriptor> candidates = router->GetCandidates("acme", {});
    BOOST_REQUIRE_EQUAL(candidates.size(), 2u);
    BOOST_CHECK_EQUAL(candidates[0].providerId, "secondary");
    BOOST_CHECK_EQUAL(candidates[1].providerId, "backup");
    BOOST_CHECK_EQUAL(router->GetCandidates("other-tenant", {}).size(), 3u);

    BOOST_CHECK_EQUAL(router->Generate(MakeRequest("prompt two")).providerUsed, "secondary");
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 0u);
}

BOOST_AUTO_TEST_CASE(concurrent_requests_settle_independently)
{
    RouterConfig config;
    config.providerTimeoutMs = 5000;
    config.maxInFlightPerProvider = 16;
    std::unique_ptr<ProviderRouter> wide = MakeRouter(config);

    std::vector<GenerateResponse> responses(8);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            GenerateRequest request = MakeRequest(strprintf("parallel prompt %d", t));
            request.subjectId = strprintf("user-%d", t);
            responses[t] = wide->Generate(request);
        });
    }
    for (std::thread& t : threads) t.join();

    for (const GenerateResponse& response : responses) {
        BOOST_CHECK_EQUAL(response.source, ResponseSource::PROVIDER);
        BOOST_CHECK_EQUAL(response.providerUsed, "primary");
        BOOST_CHECK_EQUAL(response.cost, 7000);
    }
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 8u);
    BOOST_CHECK_EQUAL(wide->GetStats().providerSuccesses, 8u);
    BOOST_CHECK_EQUAL(wide->GetStats().requests, 8u);
    BOOST_CHECK_EQUAL(cache.Size(), 8u);

    BudgetStatus budget = governor.GetStatus("acme");
    BOOST_CHECK_EQUAL(budget.ledger.spentActual, 8 * 7000);
    BOOST_CHECK_EQUAL(budget.ledger.spentEstimated, budget.ledger.spentActual);
    BOOST_CHECK_EQUAL(budget.ledger.callsSettled, 8u);
    BOOST_CHECK_EQUAL(wide->GetInFlight("primary/large-v2"), 0u);
}

BOOST_AUTO_TEST_CASE(malformed_token_counts_count_as_failure)
{
    primary->tokensOut = 100000000000000ULL;

    GenerateResponse response;
    BOOST_CHECK_NO_THROW(response = router->Generate(MakeRequest("Explain GDPR article 5")));
    BOOST_CHECK_EQUAL(response.source, ResponseSource::PROVIDER);
    BOOST_CHECK_EQUAL(response.providerUsed, "secondary");
    BOOST_CHECK_EQUAL(response.attempts, 2u);
    // 100 tokens in at $0.002/1k plus 200 out at $0.006/1k
    BOOST_CHECK_EQUAL(response.cost, 1400);

    BOOST_CHECK_EQUAL(breakers.GetBreaker("primary", "large-v2")->GetConsecutiveFailures(), 1u);
    BOOST_CHECK_EQUAL(router->GetStats().upstreamFailures, 1u);

    BudgetStatus budget = governor.GetStatus("acme");
    BOOST_CHECK_EQUAL(budget.ledger.spentActual, 1400);
    BOOST_CHECK_EQUAL(budget.ledger.spentEstimated, 1400);
    BOOST_CHECK_EQUAL(budget.ledger.callsSettled, 1u);
}

BOOST_AUTO_TEST_CASE(call_cost_saturates)
{
    ProviderDescriptor descriptor("primary", "large-v2", 0, 10000, 30000);
    BOOST_CHECK_EQUAL(EstimateCallCost(descriptor, 100, 200), 7000);
    BOOST_CHECK_EQUAL(EstimateCallCost(descriptor, 0, std::numeric_limits<uint64_t>::max()), MAX_COST);
    BOOST_CHECK_EQUAL(EstimateCallCost(descriptor, std::numeric_limits<uint64_t>::max(),
                                       std::numeric_limits<uint64_t>::max()), MAX_COST);
    BOOST_CHECK_EQUAL(EstimateCallCost(ProviderDescriptor("free", "m", 0, 0, 0), 1000000, 1000000), 0);
}

BOOST_AUTO_TEST_CASE(registration_errors)
{
    BOOST_CHECK_THROW(router->RegisterProvider(ProviderDescriptor("primary", "large-v2", 5, 1, 1), primary),
                      ConfigError);
    BOOST_CHECK_THROW(router->RegisterProvider(ProviderDescriptor("other", "m", 5, 1, 1), nullptr), ConfigError);
    BOOST_CHECK_THROW(router->RegisterProvider(ProviderDescriptor("", "m", 5, 1, 1), primary), ConfigError);
    BOOST_CHECK_NO_THROW(router->RegisterProvider(ProviderDescriptor("primary", "small-v1", 5, 1, 1), primary));
}

BOOST_AUTO_TEST_CASE(invalid_requests_throw)
{
    BOOST_CHECK_THROW(router->Generate(MakeRequest("")), InvalidRequestError);

    GenerateRequest noTenant = MakeRequest("prompt");
    noTenant.tenantId.clear();
    BOOST_CHECK_THROW(router->Generate(noTenant), InvalidRequestError);

    GenerateRequest noSubject = MakeRequest("prompt");
    noSubject.subjectId.clear();
    BOOST_CHECK_THROW(router->Generate(noSubject), InvalidRequestError);

    GenerateRequest unknownClass = MakeRequest("prompt");
    unknownClass.operationClass = "translate";
    BOOST_CHECK_THROW(router->Generate(unknownClass), InvalidRequestError);

    BOOST_CHECK_EQUAL(primary->GetCallCount(), 0u);
}

// ============================================================================
// Degradation
// ============================================================================

BOOST_AUTO_TEST_CASE(open_breakers_degrade_without_throwing)
{
    primary->SetDefault(ScriptedProvider::Behaviour::FAIL);
    secondary->SetDefault(ScriptedProvider::Behaviour::FAIL);
    backup->SetDefault(ScriptedProvider::Behaviour::FAIL);

    for (int i = 0; i < 3; ++i) {
        GenerateResponse response = router->Generate(MakeRequest(strprintf("failing prompt %d", i)));
        BOOST_CHECK_EQUAL(response.source, ResponseSource::FALLBACK);
        BOOST_CHECK_EQUAL(response.attempts, 3u);
    }
    BOOST_CHECK_EQUAL(CountEvents(EventType::BREAKER_OPENED), 3u);

    GenerateResponse response = router->Generate(MakeRequest("Explain GDPR article 5"));
    BOOST_CHECK_EQUAL(response.source, ResponseSource::FALLBACK);
    BOOST_CHECK(response.degraded);
    BOOST_CHECK_EQUAL(response.reason, DegradeReason::ALL_PROVIDERS_EXHAUSTED);
    BOOST_CHECK_EQUAL(response.providerUsed, FALLBACK_PROVIDER_NAME);
    BOOST_CHECK_EQUAL(response.attempts, 0u);
    BOOST_CHECK(!response.reasonMessage.empty());
    BOOST_CHECK(response.text.find("GDPR") != std::string::npos);
    BOOST_CHECK_CLOSE(response.confidence, 0.7, 0.0001);

    // Open breakers fail fast: no further upstream calls
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 3u);
    BOOST_CHECK_EQUAL(secondary->GetCallCount(), 3u);
    BOOST_CHECK_EQUAL(backup->GetCallCount(), 3u);

    std::vector<ResilienceEvent> served = EventsOfType(EventType::FALLBACK_SERVED);
    BOOST_REQUIRE_EQUAL(served.size(), 4u);
    BOOST_CHECK_EQUAL(served.back().GetField("reason"), "all_providers_exhausted");
    BOOST_CHECK_EQUAL(served.back().GetField("tenant"), "acme");
    BOOST_CHECK_EQUAL(served.back().GetField("fingerprint_prefix"), response.fingerprint.substr(0, 12));

    // Nothing stays reserved for calls that were never made
    BOOST_CHECK_EQUAL(governor.GetStatus("acme").ledger.spentEstimated, 0);
}

BOOST_AUTO_TEST_CASE(breaker_recovers_through_trial_call)
{
    primary->SetDefault(ScriptedProvider::Behaviour::FAIL);
    for (int i = 0; i < 3; ++i) {
        BOOST_CHECK_EQUAL(router->Generate(MakeRequest(strprintf("prompt %d", i))).providerUsed, "secondary");
    }
    BOOST_CHECK_EQUAL(breakers.GetBreaker("primary", "large-v2")->GetState(), BreakerState::OPEN);

    router->Generate(MakeRequest("prompt while open"));
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 3u);

    primary->SetDefault(ScriptedProvider::Behaviour::SUCCEED);
    clock.AdvanceMillis(DEFAULT_RECOVERY_TIMEOUT_MS);
    BOOST_CHECK_EQUAL(router->Generate(MakeRequest("prompt after recovery")).providerUsed, "primary");
    BOOST_CHECK_EQUAL(breakers.GetBreaker("primary", "large-v2")->GetState(), BreakerState::CLOSED);
    BOOST_CHECK_EQUAL(CountEvents(EventType::BREAKER_CLOSED), 1u);
}

BOOST_AUTO_TEST_CASE(exhaustion_fallback_is_cached_briefly)
{
    primary->SetDefault(ScriptedProvider::Behaviour::FAIL);
    secondary->SetDefault(ScriptedProvider::Behaviour::FAIL);
    backup->SetDefault(ScriptedProvider::Behaviour::FAIL);

    GenerateResponse first = router->Generate(MakeRequest("outage prompt"));
    BOOST_CHECK_EQUAL(first.reason, DegradeReason::ALL_PROVIDERS_EXHAUSTED);

    GenerateResponse cached = router->Generate(MakeRequest("outage prompt"));
    BOOST_CHECK_EQUAL(cached.source, ResponseSource::CACHE);
    BOOST_CHECK(cached.degraded);
    BOOST_CHECK_EQUAL(cached.reason, DegradeReason::ALL_PROVIDERS_EXHAUSTED);
    BOOST_CHECK_EQUAL(cached.providerUsed, FALLBACK_PROVIDER_NAME);
    BOOST_CHECK_EQUAL(cached.text, first.text);
    BOOST_CHECK_CLOSE(cached.confidence, first.confidence, 0.0001);
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 1u);

    std::vector<ResilienceEvent> hits = EventsOfType(EventType::CACHE_HIT);
    BOOST_REQUIRE_EQUAL(hits.size(), 1u);
    BOOST_CHECK_EQUAL(hits[0].GetField("fallback"), "1");

    clock.AdvanceMillis(DEFAULT_FALLBACK_CACHE_TTL_MS);
    primary->SetDefault(ScriptedProvider::Behaviour::SUCCEED);
    GenerateResponse recovered = router->Generate(MakeRequest("outage prompt"));
    BOOST_CHECK_EQUAL(recovered.source, ResponseSource::PROVIDER);
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 2u);
}

BOOST_AUTO_TEST_CASE(exhaustion_fallback_is_scoped_to_tenant)
{
    primary->SetDefault(ScriptedProvider::Behaviour::FAIL);
    router->SetTenantProviders("acme", {"primary"});

    GenerateResponse first = router->Generate(MakeRequest("shared outage prompt"));
    BOOST_CHECK_EQUAL(first.reason, DegradeReason::ALL_PROVIDERS_EXHAUSTED);
    BOOST_CHECK_EQUAL(router->Generate(MakeRequest("shared outage prompt")).source, ResponseSource::CACHE);
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 1u);

    // Same prompt, tenant with the full provider list
    GenerateRequest other = MakeRequest("shared outage prompt");
    other.tenantId = "beta";
    other.subjectId = "user-2";
    GenerateResponse served = router->Generate(other);
    BOOST_CHECK_EQUAL(served.source, ResponseSource::PROVIDER);
    BOOST_CHECK(!served.degraded);
    BOOST_CHECK_EQUAL(served.providerUsed, "secondary");
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 2u);
    BOOST_CHECK_EQUAL(secondary->GetCallCount(), 1u);
}

BOOST_AUTO_TEST_CASE(exhaustion_fallback_is_scoped_to_preferred_providers)
{
    primary->SetDefault(ScriptedProvider::Behaviour::FAIL);

    GenerateRequest pinned = MakeRequest("pinned outage prompt");
    pinned.preferredProviders = {"primary"};
    GenerateResponse first = router->Generate(pinned);
    BOOST_CHECK_EQUAL(first.source, ResponseSource::FALLBACK);
    BOOST_CHECK_EQUAL(first.reason, DegradeReason::ALL_PROVIDERS_EXHAUSTED);

    GenerateResponse open = router->Generate(MakeRequest("pinned outage prompt"));
    BOOST_CHECK_EQUAL(open.source, ResponseSource::PROVIDER);
    BOOST_CHECK(!open.degraded);
    BOOST_CHECK_EQUAL(open.providerUsed, "secondary");
    BOOST_CHECK_EQUAL(CountEvents(EventType::CACHE_HIT), 0u);
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 2u);
}

BOOST_AUTO_TEST_CASE(rate_limited_requests_degrade)
{
    limiter.SetTier("help", RateLimitTier::Window(1, 60000));

    BOOST_CHECK_EQUAL(router->Generate(MakeRequest("first prompt")).source, ResponseSource::PROVIDER);
    GenerateResponse limited = router->Generate(MakeRequest("second prompt"));
    BOOST_CHECK_EQUAL(limited.source, ResponseSource::FALLBACK);
    BOOST_CHECK(limited.degraded);
    BOOST_CHECK_EQUAL(limited.reason, DegradeReason::RATE_LIMITED);
    BOOST_CHECK_EQUAL(limited.attempts, 0u);
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 1u);
    BOOST_CHECK_EQUAL(CountEvents(EventType::RATE_LIMIT_EXCEEDED), 1u);

    // Subject-specific fallbacks are never cached
    BOOST_CHECK_EQUAL(cache.Size(), 1u);

    // Another subject is unaffected
    GenerateRequest other = MakeRequest("second prompt");
    other.subjectId = "user-2";
    BOOST_CHECK_EQUAL(router->Generate(other).source, ResponseSource::PROVIDER);
}

BOOST_AUTO_TEST_CASE(budget_skips_expensive_providers)
{
    // Enough for the secondary model's estimate but not the primary's
    governor.SetBudget("acme", BudgetPolicy::FromHardCap(10000));
    GenerateResponse response = router->Generate(MakeRequest("Explain GDPR article 5"));
    BOOST_CHECK_EQUAL(response.source, ResponseSource::PROVIDER);
    BOOST_CHECK_EQUAL(response.providerUsed, "secondary");
    BOOST_CHECK_EQUAL(response.attempts, 1u);
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 0u);
}

BOOST_AUTO_TEST_CASE(budget_exhausted_for_every_candidate)
{
    governor.SetBudget("acme", BudgetPolicy::FromHardCap(100));
    GenerateResponse response = router->Generate(MakeRequest("Explain GDPR article 5"));
    BOOST_CHECK_EQUAL(response.source, ResponseSource::FALLBACK);
    BOOST_CHECK_EQUAL(response.reason, DegradeReason::BUDGET_EXCEEDED);
    BOOST_CHECK_EQUAL(response.attempts, 0u);
    BOOST_CHECK_EQUAL(primary->GetCallCount() + secondary->GetCallCount() + backup->GetCallCount(), 0u);
    BOOST_CHECK_EQUAL(CountEvents(EventType::BUDGET_EXCEEDED), 3u);
    BOOST_CHECK_EQUAL(cache.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(no_candidates_means_exhausted)
{
    GenerateRequest request = MakeRequest("prompt");
    request.preferredProviders = {"unknown"};
    GenerateResponse response = router->Generate(request);
    BOOST_CHECK_EQUAL(response.reason, DegradeReason::ALL_PROVIDERS_EXHAUSTED);
    BOOST_CHECK_EQUAL(response.attempts, 0u);
}

BOOST_AUTO_TEST_CASE(hung_provider_times_out)
{
    RouterConfig config;
    config.providerTimeoutMs = 50;
    std::unique_ptr<ProviderRouter> fast = MakeRouter(config);
    primary->Push(ScriptedProvider::Behaviour::HANG);

    const int64_t start = GetSteadyTimeMillis();
    GenerateResponse response = fast->Generate(MakeRequest("slow prompt"));
    BOOST_CHECK_EQUAL(response.providerUsed, "secondary");
    BOOST_CHECK_EQUAL(response.attempts, 2u);
    BOOST_CHECK(GetSteadyTimeMillis() - start < 5000);

    BOOST_CHECK_EQUAL(fast->GetStats().upstreamTimeouts, 1u);
    BOOST_CHECK_EQUAL(breakers.GetBreaker("primary", "large-v2")->GetConsecutiveFailures(), 1u);
}

BOOST_AUTO_TEST_CASE(stuck_calls_are_capped_per_provider)
{
    auto gated = std::make_shared<GatedProvider>();
    RouterConfig config;
    config.providerTimeoutMs = 50;
    config.invocationThreads = 4;
    config.maxInFlightPerProvider = 1;
    std::unique_ptr<ProviderRouter> capped(
        new ProviderRouter(config, cache, limiter, breakers, governor, fallback, &events));
    capped->RegisterProvider(ProviderDescriptor("primary", "large-v2", 0, 10000, 30000), gated);
    capped->RegisterProvider(ProviderDescriptor("secondary", "medium-v1", 1, 2000, 6000), secondary);

    // Times out but keeps its worker busy
    GenerateResponse first = capped->Generate(MakeRequest("first prompt"));
    BOOST_CHECK_EQUAL(first.providerUsed, "secondary");
    BOOST_CHECK_EQUAL(first.attempts, 2u);
    BOOST_CHECK_EQUAL(capped->GetInFlight("primary/large-v2"), 1u);

    GenerateResponse second = capped->Generate(MakeRequest("second prompt"));
    BOOST_CHECK_EQUAL(second.providerUsed, "secondary");
    BOOST_CHECK_EQUAL(second.attempts, 1u);
    BOOST_CHECK_EQUAL(gated->GetCallCount(), 1u);

    RouterStats stats = capped->GetStats();
    BOOST_CHECK_EQUAL(stats.saturatedSkips, 1u);
    BOOST_CHECK_EQUAL(stats.upstreamTimeouts, 1u);
    // Skipping a saturated provider is not a breaker failure
    BOOST_CHECK_EQUAL(breakers.GetBreaker("primary", "large-v2")->GetConsecutiveFailures(), 1u);
    BOOST_CHECK_EQUAL(governor.GetStatus("acme").ledger.spentEstimated,
                      governor.GetStatus("acme").ledger.spentActual);

    gated->Open();
    const int64_t start = GetSteadyTimeMillis();
    while (capped->GetInFlight("primary/large-v2") > 0 && GetSteadyTimeMillis() - start < 5000) {
        MilliSleep(5);
    }
    BOOST_CHECK_EQUAL(capped->GetInFlight("primary/large-v2"), 0u);

    GenerateResponse third = capped->Generate(MakeRequest("third prompt"));
    BOOST_CHECK_EQUAL(third.providerUsed, "primary");
    BOOST_CHECK_EQUAL(gated->GetCallCount(), 2u);
}

BOOST_AUTO_TEST_CASE(cancelled_before_start)
{
    GenerateRequest request = MakeRequest("prompt");
    request.cancel = std::make_shared<CancellationToken>();
    request.cancel->Cancel();

    GenerateResponse response = router->Generate(request);
    BOOST_CHECK_EQUAL(response.reason, DegradeReason::CANCELLED);
    BOOST_CHECK_EQUAL(response.source, ResponseSource::FALLBACK);
    BOOST_CHECK_EQUAL(primary->GetCallCount(), 0u);
    BOOST_CHECK_EQUAL(limiter.GetUsage("user-1", "help"), 0u);
    BOOST_CHECK_EQUAL(cache.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(cancelled_during_call)
{
    primary->Push(ScriptedProvider::Behaviour::HANG);
    GenerateRequest request = MakeRequest("prompt");
    request.cancel = std::make_shared<CancellationToken>();

    std::shared_ptr<CancellationToken> token = request.cancel;
    std::thread canceller([token]() {
        MilliSleep(50);
        token->Cancel();
    });
    GenerateResponse response = router->Generate(request);
    canceller.join();

    BOOST_CHECK_EQUAL(response.reason, DegradeReason::CANCELLED);
    BOOST_CHECK_EQUAL(response.attempts, 1u);
    BOOST_CHECK_EQUAL(secondary->GetCallCount(), 0u);
    BOOST_CHECK_EQUAL(governor.GetStatus("acme").ledger.spentEstimated, 0);
    BOOST_CHECK_EQUAL(cache.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(unexpected_errors_propagate)
{
    primary->Push(ScriptedProvider::Behaviour::THROW_UNEXPECTED);
    BOOST_CHECK_THROW(router->Generate(MakeRequest("prompt")), std::logic_error);

    BOOST_CHECK_EQUAL(secondary->GetCallCount(), 0u);
    BOOST_CHECK_EQUAL(breakers.GetBreaker("primary", "large-v2")->GetConsecutiveFailures(), 0u);
    BOOST_CHECK_EQUAL(governor.GetStatus("acme").ledger.spentEstimated, 0);
}

BOOST_AUTO_TEST_CASE(streaming_slot_released_after_each_request)
{
    for (int i = 0; i < 5; ++i) {
        GenerateRequest request = MakeRequest(strprintf("stream %d", i));
        request.operationClass = "streaming";
        BOOST_CHECK_EQUAL(router->Generate(request).source, ResponseSource::PROVIDER);
    }
    BOOST_CHECK_EQUAL(limiter.GetUsage("user-1", "streaming"), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
