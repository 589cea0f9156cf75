// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_CALLGUARD_COMMON_H
#define CALLGUARD_CALLGUARD_COMMON_H

/**
 * @file callguard_common.h
 * @brief Common definitions and types for the Callguard resilience core
 *
 * Shared enums, cost amounts and string conversions used by every
 * component that sits between the task layer and the upstream language
 * model providers: response cache, rate limiter, circuit breakers, cost
 * governor and provider router.
 */

#include <cstdint>
#include <ostream>
#include <string>

namespace callguard {

/**
 * Monetary amounts are integer micro-dollars so that ledgers never
 * accumulate floating point error.
 */
typedef int64_t CostAmount;

/** One US dollar */
static constexpr CostAmount COST_UNIT = 1000000;

/** Upper bound for any single cost figure (one billion dollars) */
static constexpr CostAmount MAX_COST = 1000000000LL * COST_UNIT;

inline bool CostRange(CostAmount value) { return value >= 0 && value <= MAX_COST; }

/** Circuit breaker states */
enum class BreakerState : uint8_t {
    CLOSED = 0,         // Calls flow normally
    OPEN = 1,           // Calls fail fast until the recovery timeout elapses
    HALF_OPEN = 2       // A single trial call tests the provider
};

/** Where a response handed back to the task layer came from */
enum class ResponseSource : uint8_t {
    CACHE = 0,
    PROVIDER = 1,
    FALLBACK = 2
};

/** Why a response is degraded */
enum class DegradeReason : uint8_t {
    NONE = 0,
    RATE_LIMITED = 1,               // Subject exceeded its operation-class tier
    BUDGET_EXCEEDED = 2,            // Every candidate was refused by the governor
    ALL_PROVIDERS_EXHAUSTED = 3,    // Breakers open or upstream calls failed
    CANCELLED = 4                   // Caller abandoned the request
};

/** Coarse quality classification of a provider/model pair */
enum class QualityTier : uint8_t {
    ECONOMY = 0,
    STANDARD = 1,
    PREMIUM = 2
};

std::string BreakerStateToString(BreakerState state);
std::string ResponseSourceToString(ResponseSource source);
std::string DegradeReasonToString(DegradeReason reason);
std::string QualityTierToString(QualityTier tier);

/** Human-readable explanation shown alongside a degraded response */
std::string DegradeReasonMessage(DegradeReason reason);

/** Parse "economy", "standard" or "premium" (case-insensitive) */
bool ParseQualityTier(const std::string& str, QualityTier& tier);

/** Format as dollars with six decimals, e.g. "0.120000" */
std::string FormatCost(CostAmount amount);

/** Parse a non-negative dollar amount such as "12.5" */
bool ParseCost(const std::string& str, CostAmount& amount);

/**
 * Stream output operators for enum types (needed for Boost.Test)
 */
inline std::ostream& operator<<(std::ostream& os, BreakerState state) {
    return os << BreakerStateToString(state);
}

inline std::ostream& operator<<(std::ostream& os, ResponseSource source) {
    return os << ResponseSourceToString(source);
}

inline std::ostream& operator<<(std::ostream& os, DegradeReason reason) {
    return os << DegradeReasonToString(reason);
}

inline std::ostream& operator<<(std::ostream& os, QualityTier tier) {
    return os << QualityTierToString(tier);
}

} // namespace callguard

#endif // CALLGUARD_CALLGUARD_COMMON_H
