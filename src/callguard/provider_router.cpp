// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/provider_router.h>
#include <callguard/errors.h>
#include <logging.h>
#include <utiltime.h>

#include <algorithm>
#include <chrono>
#include <future>

namespace callguard {

namespace {

/** Holds a concurrency-tier slot until the request returns */
class ConcurrencySlot {
public:
    ConcurrencySlot(RateLimiter& limiter, const std::string& subjectId, const std::string& operationClass)
        : limiter_(limiter), subjectId_(subjectId), operationClass_(operationClass), held_(false) {}

    ~ConcurrencySlot() {
        if (held_) {
            limiter_.ReleaseConcurrent(subjectId_, operationClass_);
        }
    }

    void Hold() { held_ = true; }

private:
    RateLimiter& limiter_;
    const std::string subjectId_;
    const std::string operationClass_;
    bool held_;
};

bool Contains(const std::vector<std::string>& ids, const std::string& id)
{
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool IsCancelled(const GenerateRequest& request)
{
    return request.cancel && request.cancel->IsCancelled();
}

} // namespace

ProviderRouter::ProviderRouter(const RouterConfig& config, ResponseCache& cache, RateLimiter& limiter,
                               CircuitBreakerRegistry& breakers, CostGovernor& governor,
                               FallbackGenerator& fallback, EventSink* events)
    : config_(config)
    , cache_(cache)
    , limiter_(limiter)
    , breakers_(breakers)
    , governor_(governor)
    , fallback_(fallback)
    , events_(events)
    , pool_(config.invocationThreads, config.maxInFlightPerProvider)
{
}

// ============================================================================
// Provider Registration
// ============================================================================

void ProviderRouter::RegisterProvider(const ProviderDescriptor& descriptor, std::shared_ptr<IProvider> transport)
{
    if (!transport) {
        throw ConfigError("no transport for provider " + descriptor.GetKey());
    }
    if (descriptor.providerId.empty() || descriptor.modelId.empty()) {
        throw ConfigError("provider and model ids must not be empty");
    }

    LOCK(cs_providers_);
    for (const RegisteredProvider& existing : providers_) {
        if (existing.descriptor.providerId == descriptor.providerId &&
            existing.descriptor.modelId == descriptor.modelId) {
            throw ConfigError("provider registered twice: " + descriptor.GetKey());
        }
    }

    RegisteredProvider entry;
    entry.descriptor = descriptor;
    entry.transport = std::move(transport);
    entry.registrationOrder = providers_.size();
    providers_.push_back(entry);

    LogPrint(CGLog::ROUTER, "Registered provider %s (rank %d, %s in / %s out per 1k tokens, %s)\n",
             descriptor.GetKey(), descriptor.priorityRank, FormatCost(descriptor.costPerKInput),
             FormatCost(descriptor.costPerKOutput), QualityTierToString(descriptor.qualityTier));
}

void ProviderRouter::SetTenantProviders(const std::string& tenantId, const std::vector<std::string>& providerIds)
{
    LOCK(cs_providers_);
    tenantProviders_[tenantId] = providerIds;
}

std::vector<ProviderRouter::RegisteredProvider> ProviderRouter::SelectCandidates(
    const std::string& tenantId, const std::vector<std::string>& preferred) const
{
    std::vector<RegisteredProvider> selected;
    {
        LOCK(cs_providers_);
        auto allowed = tenantProviders_.find(tenantId);
        for (const RegisteredProvider& entry : providers_) {
            const std::string& id = entry.descriptor.providerId;
            if (allowed != tenantProviders_.end() && !Contains(allowed->second, id)) continue;
            if (!preferred.empty() && !Contains(preferred, id)) continue;
            selected.push_back(entry);
        }
    }

    // Strict priority order; registration order breaks ties
    std::stable_sort(selected.begin(), selected.end(),
                     [](const RegisteredProvider& a, const RegisteredProvider& b) {
                         return a.descriptor.priorityRank < b.descriptor.priorityRank;
                     });
    return selected;
}

std::vector<ProviderDescriptor> ProviderRouter::GetCandidates(const std::string& tenantId,
                                                              const std::vector<std::string>& preferred) const
{
    std::vector<ProviderDescriptor> result;
    for (const RegisteredProvider& entry : SelectCandidates(tenantId, preferred)) {
        result.push_back(entry.descriptor);
    }
    return result;
}

// ============================================================================
// Request Handling
// ============================================================================

void ProviderRouter::ValidateRequest(const GenerateRequest& request)
{
    if (request.subjectId.empty()) {
        throw InvalidRequestError("request has no subject id");
    }
    if (request.tenantId.empty()) {
        throw InvalidRequestError("request has no tenant id");
    }
    if (request.taskType.empty()) {
        throw InvalidRequestError("request has no task type");
    }
    if (request.prompt.empty()) {
        throw InvalidRequestError("request has an empty prompt");
    }
}

ProviderRouter::InvocationOutcome ProviderRouter::InvokeWithDeadline(const RegisteredProvider& provider,
                                                                     const GenerateRequest& request)
{
    auto token = std::make_shared<CancellationToken>();

    InvocationRequest invocation;
    invocation.modelId = provider.descriptor.modelId;
    invocation.prompt = request.prompt;
    invocation.timeoutMs = config_.providerTimeoutMs;
    invocation.cancel = token;

    auto promise = std::make_shared<std::promise<ProviderReply>>();
    std::future<ProviderReply> future = promise->get_future();
    std::shared_ptr<IProvider> transport = provider.transport;

    InvocationOutcome outcome;

    // The worker only produces a value; every outcome is settled by this thread
    const bool queued = pool_.Submit(provider.descriptor.GetKey(), token, [transport, invocation, promise]() {
        try {
            if (invocation.cancel->IsCancelled()) {
                throw ProviderCancelledError("call abandoned before it started");
            }
            promise->set_value(transport->Invoke(invocation));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    if (!queued) {
        outcome.status = InvocationStatus::SATURATED;
        outcome.error = strprintf("%u calls already outstanding", pool_.GetOutstanding(provider.descriptor.GetKey()));
        return outcome;
    }

    const int64_t deadline = GetSteadyTimeMillis() + config_.providerTimeoutMs;
    while (future.wait_for(std::chrono::milliseconds(INVOCATION_POLL_MS)) != std::future_status::ready) {
        if (IsCancelled(request) && !token->IsCancelled()) {
            LogPrint(CGLog::ROUTER, "Caller cancelled call to %s\n", provider.descriptor.GetKey());
            token->Cancel();
        }
        if (GetSteadyTimeMillis() >= deadline) {
            token->Cancel();
            outcome.status = InvocationStatus::TIMEOUT;
            outcome.error = strprintf("no reply within %d ms", config_.providerTimeoutMs);
            return outcome;
        }
    }

    try {
        outcome.reply = future.get();
        if (CheckReply(outcome.reply, outcome.error)) {
            outcome.status = InvocationStatus::SUCCESS;
        } else {
            outcome.status = InvocationStatus::FAILED;
        }
    } catch (const ProviderTimeoutError& e) {
        outcome.status = InvocationStatus::TIMEOUT;
        outcome.error = e.what();
    } catch (const ProviderCancelledError& e) {
        outcome.status = InvocationStatus::CANCELLED;
        outcome.error = e.what();
    } catch (const ProviderError& e) {
        outcome.status = InvocationStatus::FAILED;
        outcome.error = e.what();
    } catch (...) {
        outcome.status = InvocationStatus::UNEXPECTED;
        outcome.exception = std::current_exception();
    }
    return outcome;
}

bool ProviderRouter::CheckReply(const ProviderReply& reply, std::string& error)
{
    if (reply.tokensIn > MAX_REPLY_TOKENS || reply.tokensOut > MAX_REPLY_TOKENS) {
        error = strprintf("malformed reply: %u tokens in, %u tokens out", reply.tokensIn, reply.tokensOut);
        return false;
    }
    return true;
}

GenerateResponse ProviderRouter::ServeCached(const GenerateRequest& request, const std::string& fingerprint,
                                             const CacheEntry& entry)
{
    GenerateResponse response;
    response.text = entry.payload;
    response.source = ResponseSource::CACHE;
    response.degraded = entry.isFallback;
    const size_t slash = entry.providerUsed.find('/');
    response.providerUsed = entry.providerUsed.substr(0, slash);
    if (slash != std::string::npos) {
        response.modelUsed = entry.providerUsed.substr(slash + 1);
    }
    response.fingerprint = fingerprint;
    if (entry.isFallback) {
        response.reason = DegradeReason::ALL_PROVIDERS_EXHAUSTED;
        response.reasonMessage = DegradeReasonMessage(response.reason);
        response.confidence = fallback_.SelectTemplate(request.taskType, request.context).confidence;
    }
    {
        LOCK(cs_stats_);
        stats_.cacheHits++;
    }
    LogPrint(CGLog::ROUTER, "Cache hit for %s (tenant %s%s)\n", FingerprintPrefix(fingerprint), request.tenantId,
             entry.isFallback ? ", fallback" : "");
    if (events_) {
        events_->Emit(EventType::CACHE_HIT, {
            {"fingerprint_prefix", FingerprintPrefix(fingerprint)},
            {"fallback", entry.isFallback ? "1" : "0"}});
    }
    return response;
}

GenerateResponse ProviderRouter::ServeFallback(const GenerateRequest& request, const std::string& fingerprint,
                                               const std::string& fallbackKey, DegradeReason reason,
                                               uint32_t attempts)
{
    FallbackContent content = fallback_.Generate(request.taskType, request.context, reason);

    GenerateResponse response;
    response.text = content.text;
    response.source = ResponseSource::FALLBACK;
    response.degraded = true;
    response.reason = reason;
    response.reasonMessage = DegradeReasonMessage(reason);
    response.providerUsed = FALLBACK_PROVIDER_NAME;
    response.fingerprint = fingerprint;
    response.attempts = attempts;
    response.confidence = content.confidence;

    // Only an outage is worth remembering; rate limit, budget and
    // cancellation fallbacks belong to one subject or one request
    if (reason == DegradeReason::ALL_PROVIDERS_EXHAUSTED && !fallbackKey.empty()) {
        cache_.Put(fallbackKey, content.text, config_.fallbackCacheTtlMs, FALLBACK_PROVIDER_NAME, true);
    }

    {
        LOCK(cs_stats_);
        stats_.fallbacks++;
    }

    LogPrint(CGLog::ROUTER, "Serving fallback for %s (tenant %s, task %s, reason %s, %u attempts)\n",
             FingerprintPrefix(fingerprint), request.tenantId, request.taskType,
             DegradeReasonToString(reason), attempts);

    if (events_) {
        events_->Emit(EventType::FALLBACK_SERVED, {
            {"reason", DegradeReasonToString(reason)},
            {"tenant", request.tenantId},
            {"task_type", request.taskType},
            {"fingerprint_prefix", FingerprintPrefix(fingerprint)}});
    }
    return response;
}

GenerateResponse ProviderRouter::Generate(const GenerateRequest& request)
{
    ValidateRequest(request);
    {
        LOCK(cs_stats_);
        stats_.requests++;
    }

    const std::string fingerprint = ComputeFingerprint(request.prompt, request.taskType, request.context);

    // 1. Cache: provider output is shared by every tenant, a cached outage
    // only by requests resolving to the same tenant and candidates
    std::optional<CacheEntry> cached = cache_.Get(fingerprint);
    if (cached) {
        return ServeCached(request, fingerprint, *cached);
    }

    const std::vector<RegisteredProvider> candidates = SelectCandidates(request.tenantId, request.preferredProviders);

    std::string fallbackKey;
    if (config_.fallbackCacheTtlMs > 0) {
        std::vector<std::string> candidateKeys;
        for (const RegisteredProvider& candidate : candidates) {
            candidateKeys.push_back(candidate.descriptor.GetKey());
        }
        fallbackKey = ComputeFallbackKey(fingerprint, request.tenantId, candidateKeys);
        cached = cache_.Get(fallbackKey);
        if (cached) {
            return ServeCached(request, fingerprint, *cached);
        }
    }

    if (IsCancelled(request)) {
        return ServeFallback(request, fingerprint, "", DegradeReason::CANCELLED, 0);
    }

    // 2. Rate limit
    const std::string& operationClass = request.GetOperationClass();
    const bool concurrentClass = limiter_.IsConcurrentClass(operationClass);
    RateLimitCheckResult admission = limiter_.CheckAndIncrement(request.subjectId, operationClass);
    if (!admission.allowed) {
        return ServeFallback(request, fingerprint, "", DegradeReason::RATE_LIMITED, 0);
    }
    ConcurrencySlot slot(limiter_, request.subjectId, operationClass);
    if (concurrentClass) {
        slot.Hold();
    }

    // 3. Providers in priority order
    const uint64_t promptTokens = EstimatePromptTokens(request.prompt);
    uint32_t attempts = 0;
    size_t budgetDenied = 0;
    bool cancelled = false;

    for (const RegisteredProvider& candidate : candidates) {
        if (IsCancelled(request)) {
            cancelled = true;
            break;
        }

        const ProviderDescriptor& descriptor = candidate.descriptor;
        const CostAmount estimate = EstimateCallCost(descriptor, promptTokens, config_.expectedOutputTokens);

        BudgetAuthorization auth = governor_.Authorize(request.tenantId, estimate);
        if (!auth.allowed) {
            budgetDenied++;
            LogPrint(CGLog::ROUTER, "Skipping %s: %s\n", descriptor.GetKey(), auth.reason);
            continue;
        }

        std::shared_ptr<CircuitBreaker> breaker = breakers_.GetBreaker(descriptor.providerId, descriptor.modelId);
        const BreakerAdmission breakerAdmission = breaker->Admit();
        if (breakerAdmission == BreakerAdmission::REJECTED) {
            governor_.Release(auth.reservation);
            LogPrint(CGLog::ROUTER, "Skipping %s: circuit open\n", descriptor.GetKey());
            continue;
        }
        const bool trial = breakerAdmission == BreakerAdmission::ADMITTED_TRIAL;

        InvocationOutcome outcome = InvokeWithDeadline(candidate, request);
        if (outcome.status == InvocationStatus::SATURATED) {
            breaker->AbandonCall(trial);
            governor_.Release(auth.reservation);
            {
                LOCK(cs_stats_);
                stats_.saturatedSkips++;
            }
            LogPrint(CGLog::ROUTER, "Skipping %s: %s\n", descriptor.GetKey(), outcome.error);
            continue;
        }
        attempts++;

        if (outcome.status == InvocationStatus::SUCCESS) {
            breaker->RecordSuccess(trial);

            const ProviderReply& reply = outcome.reply;
            const CostAmount actual = EstimateCallCost(descriptor, reply.tokensIn, reply.tokensOut);
            governor_.RecordActual(auth.reservation, actual, reply.tokensIn + reply.tokensOut);
            cache_.Put(fingerprint, reply.text, config_.cacheTtlMs, descriptor.GetKey(), false);

            {
                LOCK(cs_stats_);
                stats_.providerSuccesses++;
            }

            GenerateResponse response;
            response.text = reply.text;
            response.source = ResponseSource::PROVIDER;
            response.providerUsed = descriptor.providerId;
            response.modelUsed = descriptor.modelId;
            response.tokensUsed = reply.tokensIn + reply.tokensOut;
            response.cost = actual;
            response.fingerprint = fingerprint;
            response.attempts = attempts;

            LogPrint(CGLog::ROUTER, "Served %s from %s (attempt %u, %u tokens, %s)\n",
                     FingerprintPrefix(fingerprint), descriptor.GetKey(), attempts, response.tokensUsed,
                     FormatCost(actual));
            return response;
        }

        if (outcome.status == InvocationStatus::UNEXPECTED) {
            breaker->AbandonCall(trial);
            governor_.Release(auth.reservation);
            LogPrintf("ERROR: unexpected failure from provider %s\n", descriptor.GetKey());
            std::rethrow_exception(outcome.exception);
        }

        breaker->RecordFailure(trial);
        governor_.Release(auth.reservation);
        {
            LOCK(cs_stats_);
            stats_.upstreamFailures++;
            if (outcome.status == InvocationStatus::TIMEOUT) {
                stats_.upstreamTimeouts++;
            }
        }
        LogPrint(CGLog::ROUTER, "Call to %s failed: %s\n", descriptor.GetKey(), outcome.error);
    }

    // 4. Fallback
    DegradeReason reason = DegradeReason::ALL_PROVIDERS_EXHAUSTED;
    if (cancelled || IsCancelled(request)) {
        reason = DegradeReason::CANCELLED;
    } else if (!candidates.empty() && budgetDenied == candidates.size()) {
        reason = DegradeReason::BUDGET_EXCEEDED;
    }
    return ServeFallback(request, fingerprint, reason == DegradeReason::ALL_PROVIDERS_EXHAUSTED ? fallbackKey : "",
                         reason, attempts);
}

RouterStats ProviderRouter::GetStats() const
{
    LOCK(cs_stats_);
    return stats_;
}

size_t ProviderRouter::GetInFlight(const std::string& providerKey) const
{
    return pool_.GetOutstanding(providerKey);
}

} // namespace callguard
