// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_PROVIDER_H
#define CALLGUARD_PROVIDER_H

/**
 * @file provider.h
 * @brief Upstream provider interface and descriptors
 */

#include <callguard/callguard_common.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace callguard {

/** Output tokens assumed when estimating a call before it is made */
static constexpr uint64_t DEFAULT_EXPECTED_OUTPUT_TOKENS = 500;

/** Rough prompt size heuristic used for estimates */
static constexpr uint64_t CHARS_PER_TOKEN = 4;

/** Replies reporting more input or output tokens than this are rejected as malformed */
static constexpr uint64_t MAX_REPLY_TOKENS = 10000000;

/**
 * @brief Static description of one provider/model pair
 */
struct ProviderDescriptor {
    std::string providerId;
    std::string modelId;
    /** Lower ranks are tried first */
    int priorityRank;
    /** Price per 1000 input tokens */
    CostAmount costPerKInput;
    /** Price per 1000 output tokens */
    CostAmount costPerKOutput;
    QualityTier qualityTier;

    ProviderDescriptor()
        : priorityRank(0)
        , costPerKInput(0)
        , costPerKOutput(0)
        , qualityTier(QualityTier::STANDARD)
    {}

    ProviderDescriptor(const std::string& provider, const std::string& model, int rank,
                       CostAmount perKInput, CostAmount perKOutput,
                       QualityTier tier = QualityTier::STANDARD)
        : providerId(provider)
        , modelId(model)
        , priorityRank(rank)
        , costPerKInput(perKInput)
        , costPerKOutput(perKOutput)
        , qualityTier(tier)
    {}

    /** "provider/model" */
    std::string GetKey() const { return providerId + "/" + modelId; }
};

/**
 * @brief Cooperative cancellation flag shared with a transport
 *
 * Once cancelled it stays cancelled.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void Cancel();
    bool IsCancelled() const { return cancelled_.load(); }

    /**
     * Sleep for up to the given time, waking early on cancellation.
     * @return true if the token was cancelled
     */
    bool WaitFor(int64_t ms) const;

private:
    std::atomic<bool> cancelled_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cond_;
};

struct InvocationRequest {
    std::string modelId;
    std::string prompt;
    /** Deadline the transport should respect, in milliseconds */
    int64_t timeoutMs;
    /** Fired when the router gives up on the call */
    std::shared_ptr<CancellationToken> cancel;

    InvocationRequest() : timeoutMs(0) {}
};

struct ProviderReply {
    std::string text;
    uint64_t tokensIn;
    uint64_t tokensOut;

    ProviderReply() : tokensIn(0), tokensOut(0) {}
};

/**
 * @brief Upstream transport
 *
 * Invoke() may block. Failures are reported by throwing ProviderError (or
 * one of its subclasses); a transport should abandon work and throw
 * ProviderCancelledError once the request's token is cancelled.
 * Implementations must be safe to call from several threads at once.
 */
class IProvider {
public:
    virtual ~IProvider() {}

    virtual ProviderReply Invoke(const InvocationRequest& request) = 0;
};

/** Tokens a prompt is expected to consume (chars / 4, at least 1) */
uint64_t EstimatePromptTokens(const std::string& prompt);

/** Price of a call with the given token counts, saturating at MAX_COST */
CostAmount EstimateCallCost(const ProviderDescriptor& descriptor, uint64_t tokensIn, uint64_t tokensOut);

} // namespace callguard

#endif // CALLGUARD_PROVIDER_H
