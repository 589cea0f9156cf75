// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_CALLGUARD_CONFIG_H
#define CALLGUARD_CALLGUARD_CONFIG_H

/**
 * @file callguard_config.h
 * @brief Command line / config file options for the resilience core
 *
 * Options are read from an ArgsManager and validated into a
 * CallguardConfig. Every malformed value raises ConfigError naming the
 * option; nothing is silently replaced by a default.
 */

#include <callguard/circuit_breaker.h>
#include <callguard/cost_governor.h>
#include <callguard/provider.h>
#include <callguard/provider_router.h>
#include <callguard/rate_limiter.h>
#include <callguard/response_cache.h>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class ArgsManager;

namespace callguard {

struct CallguardConfig {
    CircuitBreakerConfig breaker;

    std::map<std::string, RateLimitTier> rateLimitTiers;
    std::optional<RateLimitTier> defaultRateLimitTier;

    size_t cacheMaxEntries;

    /** Timeouts, cache TTLs and estimate parameters */
    RouterConfig router;

    /** Default policy, period and drift parameters */
    CostGovernorConfig governor;
    std::map<std::string, BudgetPolicy> budgets;

    std::vector<ProviderDescriptor> providers;
    std::map<std::string, std::vector<std::string>> tenantProviders;

    CallguardConfig()
        : rateLimitTiers(DefaultRateLimitTiers())
        , cacheMaxEntries(DEFAULT_CACHE_MAX_ENTRIES)
    {}
};

/** Help text for every option LoadCallguardConfig() understands */
std::string GetCallguardHelpMessage();

/**
 * @brief Build a validated configuration from parsed arguments
 * @throws ConfigError on any malformed or inconsistent option
 */
CallguardConfig LoadCallguardConfig(const ArgsManager& args);

/** Apply -debug, -printtoconsole, -logfile and -logtimestamps to the global logger */
void InitLogging(const ArgsManager& args);

// ============================================================================
// Option value parsers (throw ConfigError)
// ============================================================================

/** "<class>:<count>/<windowsec>" */
std::pair<std::string, RateLimitTier> ParseRateLimitSpec(const std::string& spec);

/** "<class>:<n>" */
std::pair<std::string, RateLimitTier> ParseConcurrentLimitSpec(const std::string& spec);

/** "<count>/<windowsec>" */
RateLimitTier ParseWindowSpec(const std::string& spec);

/** "<id>:<model>:<rank>:<in_per_1k>:<out_per_1k>:<tier>" */
ProviderDescriptor ParseProviderSpec(const std::string& spec);

/** "<tenant>:<id>[,<id>...]" */
std::pair<std::string, std::vector<std::string>> ParseTenantProvidersSpec(const std::string& spec);

/** "<tenant>:<hard>[:<soft>]"; the soft cap defaults to softCapPercent of the hard cap */
std::pair<std::string, BudgetPolicy> ParseBudgetSpec(const std::string& spec, uint32_t softCapPercent);

} // namespace callguard

#endif // CALLGUARD_CALLGUARD_CONFIG_H
