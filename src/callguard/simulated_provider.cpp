// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/simulated_provider.h>
#include <callguard/errors.h>
#include <logging.h>
#include <utiltime.h>

namespace callguard {

SimulatedProvider::SimulatedProvider(const std::string& providerId, uint32_t failurePercent,
                                     int64_t latencyMs, uint32_t seed)
    : providerId_(providerId)
    , failurePercent_(failurePercent > 100 ? 100 : failurePercent)
    , latencyMs_(latencyMs)
    , outputTokens_(200)
    , invocations_(0)
    , failures_(0)
    , cancelled_(0)
    , rng_(seed)
{
}

bool SimulatedProvider::RollFailure()
{
    const uint32_t percent = failurePercent_.load();
    if (percent == 0) return false;
    if (percent >= 100) return true;
    std::lock_guard<std::mutex> lock(rngMutex_);
    std::uniform_int_distribution<uint32_t> dist(0, 99);
    return dist(rng_) < percent;
}

ProviderReply SimulatedProvider::Invoke(const InvocationRequest& request)
{
    invocations_++;

    const int64_t latency = latencyMs_.load();
    const bool overDeadline = request.timeoutMs > 0 && latency > request.timeoutMs;
    const int64_t wait = overDeadline ? request.timeoutMs : latency;

    if (wait > 0) {
        bool wasCancelled = false;
        if (request.cancel) {
            wasCancelled = request.cancel->WaitFor(wait);
        } else {
            MilliSleep(wait);
        }
        if (wasCancelled) {
            cancelled_++;
            LogPrint(CGLog::PROVIDER, "%s: call to %s cancelled\n", providerId_, request.modelId);
            throw ProviderCancelledError(providerId_ + ": call cancelled");
        }
    } else if (request.cancel && request.cancel->IsCancelled()) {
        cancelled_++;
        throw ProviderCancelledError(providerId_ + ": call cancelled");
    }

    if (overDeadline) {
        failures_++;
        throw ProviderTimeoutError(strprintf("%s: no answer within %d ms", providerId_, request.timeoutMs));
    }

    if (RollFailure()) {
        failures_++;
        LogPrint(CGLog::PROVIDER, "%s: simulated failure for %s\n", providerId_, request.modelId);
        throw ProviderInvocationError(providerId_ + ": upstream returned an error");
    }

    ProviderReply reply;
    reply.tokensIn = EstimatePromptTokens(request.prompt);
    reply.tokensOut = outputTokens_.load();
    reply.text = strprintf("[%s/%s] analysis of %u prompt tokens", providerId_, request.modelId, reply.tokensIn);
    return reply;
}

} // namespace callguard
