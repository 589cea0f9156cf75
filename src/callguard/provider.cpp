// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/provider.h>

#include <algorithm>
#include <chrono>

namespace callguard {

void CancellationToken::Cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cond_.notify_all();
}

bool CancellationToken::WaitFor(int64_t ms) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (ms <= 0) return cancelled_.load();
    return cond_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return cancelled_.load(); });
}

uint64_t EstimatePromptTokens(const std::string& prompt)
{
    uint64_t tokens = prompt.size() / CHARS_PER_TOKEN;
    return tokens > 0 ? tokens : 1;
}

namespace {

CostAmount PriceTokens(uint64_t tokens, CostAmount pricePerK)
{
    if (pricePerK <= 0) return 0;
    // tokens * pricePerK must stay below MAX_COST * 1000, which fits in int64
    if (tokens > static_cast<uint64_t>(MAX_COST / pricePerK) * 1000) return MAX_COST;
    // Round up to the next micro-dollar so small calls are never free
    return std::min(MAX_COST, (static_cast<CostAmount>(tokens) * pricePerK + 999) / 1000);
}

} // namespace

CostAmount EstimateCallCost(const ProviderDescriptor& descriptor, uint64_t tokensIn, uint64_t tokensOut)
{
    const CostAmount inputCost = PriceTokens(tokensIn, descriptor.costPerKInput);
    const CostAmount outputCost = PriceTokens(tokensOut, descriptor.costPerKOutput);
    return std::min(MAX_COST, inputCost + outputCost);
}

} // namespace callguard
