// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_SIMULATED_PROVIDER_H
#define CALLGUARD_SIMULATED_PROVIDER_H

#include <callguard/provider.h>

#include <atomic>
#include <mutex>
#include <random>
#include <string>

namespace callguard {

/**
 * @brief In-process stand-in for an upstream model API
 *
 * Sleeps for a configurable latency (waking early on cancellation) and
 * fails a configurable percentage of calls. Used by callguard-sim and the
 * unit tests.
 */
class SimulatedProvider : public IProvider {
public:
    SimulatedProvider(const std::string& providerId, uint32_t failurePercent, int64_t latencyMs,
                      uint32_t seed = 0);

    ProviderReply Invoke(const InvocationRequest& request) override;

    void SetFailurePercent(uint32_t percent) { failurePercent_.store(percent > 100 ? 100 : percent); }
    void SetLatencyMillis(int64_t ms) { latencyMs_.store(ms); }

    /** Output tokens reported per reply */
    void SetOutputTokens(uint64_t tokens) { outputTokens_.store(tokens); }

    uint64_t GetInvocationCount() const { return invocations_.load(); }
    uint64_t GetFailureCount() const { return failures_.load(); }
    uint64_t GetCancelledCount() const { return cancelled_.load(); }

private:
    bool RollFailure();

    const std::string providerId_;
    std::atomic<uint32_t> failurePercent_;
    std::atomic<int64_t> latencyMs_;
    std::atomic<uint64_t> outputTokens_;

    std::atomic<uint64_t> invocations_;
    std::atomic<uint64_t> failures_;
    std::atomic<uint64_t> cancelled_;

    std::mutex rngMutex_;
    std::mt19937 rng_;
};

} // namespace callguard

#endif // CALLGUARD_SIMULATED_PROVIDER_H
