// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/callguard_config.h>
#include <callguard/errors.h>
#include <logging.h>
#include <util.h>

#include <limits>
#include <set>

namespace callguard {

namespace {

int64_t ParseIntValue(const std::string& option, const std::string& value, int64_t minValue, int64_t maxValue)
{
    int64_t n = 0;
    if (!ParseInt64(TrimString(value), &n)) {
        throw ConfigError(strprintf("Invalid value for %s: '%s' is not an integer", option, value));
    }
    if (n < minValue || n > maxValue) {
        throw ConfigError(strprintf("Invalid value for %s: %d is outside [%d, %d]", option, n, minValue, maxValue));
    }
    return n;
}

int64_t GetIntOption(const ArgsManager& args, const std::string& option, int64_t defaultValue,
                     int64_t minValue, int64_t maxValue = std::numeric_limits<int64_t>::max())
{
    if (!args.IsArgSet(option)) {
        return defaultValue;
    }
    return ParseIntValue(option, args.GetArg(option, ""), minValue, maxValue);
}

CostAmount ParseCostValue(const std::string& option, const std::string& value)
{
    CostAmount amount = 0;
    if (!ParseCost(TrimString(value), amount)) {
        throw ConfigError(strprintf("Invalid amount for %s: '%s'", option, value));
    }
    return amount;
}

/** Split "<key>:<rest>" at the first colon */
std::pair<std::string, std::string> SplitKey(const std::string& option, const std::string& spec)
{
    const size_t colon = spec.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == spec.size()) {
        throw ConfigError(strprintf("Invalid value for %s: '%s'", option, spec));
    }
    return std::make_pair(TrimString(spec.substr(0, colon)), spec.substr(colon + 1));
}

} // namespace

// ============================================================================
// Option value parsers
// ============================================================================

RateLimitTier ParseWindowSpec(const std::string& spec)
{
    std::vector<std::string> parts = SplitString(spec, '/');
    if (parts.size() != 2) {
        throw ConfigError(strprintf("Invalid rate limit '%s', expected <count>/<windowsec>", spec));
    }
    const int64_t count = ParseIntValue("rate limit count", parts[0], 0, std::numeric_limits<uint32_t>::max());
    const int64_t windowSec = ParseIntValue("rate limit window", parts[1], 1, 365LL * 24 * 3600);
    return RateLimitTier::Window(static_cast<uint32_t>(count), windowSec * 1000);
}

std::pair<std::string, RateLimitTier> ParseRateLimitSpec(const std::string& spec)
{
    std::pair<std::string, std::string> kv = SplitKey("-ratelimit", spec);
    return std::make_pair(kv.first, ParseWindowSpec(kv.second));
}

std::pair<std::string, RateLimitTier> ParseConcurrentLimitSpec(const std::string& spec)
{
    std::pair<std::string, std::string> kv = SplitKey("-concurrentlimit", spec);
    const int64_t limit = ParseIntValue("-concurrentlimit", kv.second, 0, std::numeric_limits<uint32_t>::max());
    return std::make_pair(kv.first, RateLimitTier::Concurrent(static_cast<uint32_t>(limit)));
}

ProviderDescriptor ParseProviderSpec(const std::string& spec)
{
    std::vector<std::string> parts = SplitString(spec, ':');
    if (parts.size() != 6) {
        throw ConfigError(strprintf("Invalid -provider '%s', expected <id>:<model>:<rank>:<in_per_1k>:<out_per_1k>:<tier>", spec));
    }
    for (std::string& part : parts) {
        part = TrimString(part);
    }
    if (parts[0].empty() || parts[1].empty()) {
        throw ConfigError(strprintf("Invalid -provider '%s': empty provider or model id", spec));
    }

    ProviderDescriptor descriptor;
    descriptor.providerId = parts[0];
    descriptor.modelId = parts[1];
    descriptor.priorityRank = static_cast<int>(ParseIntValue("-provider rank", parts[2], 0, std::numeric_limits<int>::max()));
    descriptor.costPerKInput = ParseCostValue("-provider input price", parts[3]);
    descriptor.costPerKOutput = ParseCostValue("-provider output price", parts[4]);
    if (!ParseQualityTier(parts[5], descriptor.qualityTier)) {
        throw ConfigError(strprintf("Invalid -provider quality tier '%s' (economy, standard, premium)", parts[5]));
    }
    return descriptor;
}

std::pair<std::string, std::vector<std::string>> ParseTenantProvidersSpec(const std::string& spec)
{
    std::pair<std::string, std::string> kv = SplitKey("-tenantproviders", spec);
    std::vector<std::string> ids;
    for (const std::string& id : SplitString(kv.second, ',')) {
        const std::string trimmed = TrimString(id);
        if (trimmed.empty()) {
            throw ConfigError(strprintf("Invalid -tenantproviders '%s': empty provider id", spec));
        }
        ids.push_back(trimmed);
    }
    return std::make_pair(kv.first, ids);
}

std::pair<std::string, BudgetPolicy> ParseBudgetSpec(const std::string& spec, uint32_t softCapPercent)
{
    std::vector<std::string> parts = SplitString(spec, ':');
    if (parts.size() < 2 || parts.size() > 3 || TrimString(parts[0]).empty()) {
        throw ConfigError(strprintf("Invalid -budget '%s', expected <tenant>:<hard>[:<soft>]", spec));
    }
    BudgetPolicy policy = BudgetPolicy::FromHardCap(ParseCostValue("-budget", parts[1]), softCapPercent);
    if (parts.size() == 3) {
        policy.softCap = ParseCostValue("-budget", parts[2]);
    }
    if (policy.softCap > policy.hardCap) {
        throw ConfigError(strprintf("Invalid -budget '%s': soft cap above hard cap", spec));
    }
    return std::make_pair(TrimString(parts[0]), policy);
}

// ============================================================================
// Help and loading
// ============================================================================

std::string GetCallguardHelpMessage()
{
    std::string strUsage;

    strUsage += HelpMessageGroup("Circuit breaker options:");
    strUsage += HelpMessageOpt("-failurethreshold=<n>", strprintf("Consecutive failures that open a provider's breaker (default: %u)", DEFAULT_FAILURE_THRESHOLD));
    strUsage += HelpMessageOpt("-recoverytimeout=<sec>", strprintf("Seconds an open breaker waits before a trial call (default: %d)", DEFAULT_RECOVERY_TIMEOUT_MS / 1000));

    strUsage += HelpMessageGroup("Rate limiting options:");
    strUsage += HelpMessageOpt("-ratelimit=<class>:<count>/<windowsec>", "Requests allowed per window for an operation class; can be specified multiple times (default: help:20/60, analysis:5/60, recommendations:10/60, quick-check:30/60)");
    strUsage += HelpMessageOpt("-concurrentlimit=<class>:<n>", strprintf("Concurrent operations allowed for an operation class (default: streaming:%u)", DEFAULT_STREAMING_CONCURRENCY));
    strUsage += HelpMessageOpt("-defaultratelimit=<count>/<windowsec>", "Limit for operation classes without a tier (default: none, such requests are rejected)");

    strUsage += HelpMessageGroup("Cache options:");
    strUsage += HelpMessageOpt("-cachettl=<sec>", strprintf("Lifetime of cached provider responses (default: %d)", DEFAULT_CACHE_TTL_MS / 1000));
    strUsage += HelpMessageOpt("-fallbackcachettl=<sec>", strprintf("Lifetime of cached fallback responses, 0 to disable (default: %d)", DEFAULT_FALLBACK_CACHE_TTL_MS / 1000));
    strUsage += HelpMessageOpt("-cachemaxentries=<n>", strprintf("Maximum cached responses (default: %u)", DEFAULT_CACHE_MAX_ENTRIES));

    strUsage += HelpMessageGroup("Provider options:");
    strUsage += HelpMessageOpt("-provider=<id>:<model>:<rank>:<in>:<out>:<tier>", "Register a provider model with priority rank, USD price per 1000 input and output tokens and quality tier (economy, standard, premium); can be specified multiple times");
    strUsage += HelpMessageOpt("-tenantproviders=<tenant>:<id>[,<id>...]", "Providers a tenant may use (default: all)");
    strUsage += HelpMessageOpt("-providertimeout=<ms>", strprintf("Hard timeout for one upstream call (default: %d)", DEFAULT_PROVIDER_TIMEOUT_MS));
    strUsage += HelpMessageOpt("-expectedoutputtokens=<n>", strprintf("Output tokens assumed when estimating a call (default: %u)", DEFAULT_EXPECTED_OUTPUT_TOKENS));
    strUsage += HelpMessageOpt("-invocationthreads=<n>", strprintf("Worker threads running upstream calls (default: %u)", DEFAULT_INVOCATION_THREADS));
    strUsage += HelpMessageOpt("-maxinflight=<n>", strprintf("Upstream calls one provider model may have outstanding, timed out calls included (default: %u)", DEFAULT_MAX_IN_FLIGHT_PER_PROVIDER));

    strUsage += HelpMessageGroup("Budget options:");
    strUsage += HelpMessageOpt("-budget=<tenant>:<hard>[:<soft>]", "Per-period spending caps in USD for a tenant; can be specified multiple times");
    strUsage += HelpMessageOpt("-defaulthardcap=<usd>", strprintf("Hard cap for tenants without -budget (default: %s)", FormatCost(DEFAULT_HARD_CAP)));
    strUsage += HelpMessageOpt("-defaultsoftcappct=<pct>", strprintf("Soft cap as a percentage of the hard cap (default: %u)", DEFAULT_SOFT_CAP_PERCENT));
    strUsage += HelpMessageOpt("-budgetperiod=<sec>", strprintf("Length of a billing period (default: %d)", DEFAULT_BUDGET_PERIOD_SECONDS));
    strUsage += HelpMessageOpt("-driftthreshold=<pct>", strprintf("Estimate drift that raises an alert (default: %d)", static_cast<int>(DEFAULT_DRIFT_THRESHOLD * 100)));
    strUsage += HelpMessageOpt("-driftwindow=<sec>", strprintf("Rolling window for drift aggregation (default: %d)", DEFAULT_DRIFT_WINDOW_MS / 1000));

    strUsage += HelpMessageGroup("Logging options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0). <category> can be 1, all or one of: " + ListLogCategories());
    strUsage += HelpMessageOpt("-printtoconsole", strprintf("Send log output to the console (default: %u)", DEFAULT_PRINTTOCONSOLE));
    strUsage += HelpMessageOpt("-logfile=<file>", "Append log output to <file>");
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend log output with a timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));

    return strUsage;
}

CallguardConfig LoadCallguardConfig(const ArgsManager& args)
{
    CallguardConfig config;

    // Circuit breaker
    config.breaker.failureThreshold = static_cast<uint32_t>(
        GetIntOption(args, "-failurethreshold", DEFAULT_FAILURE_THRESHOLD, 1, 1000000));
    config.breaker.recoveryTimeoutMs =
        GetIntOption(args, "-recoverytimeout", DEFAULT_RECOVERY_TIMEOUT_MS / 1000, 0, 86400) * 1000;

    // Rate limits
    for (const std::string& spec : args.GetArgs("-ratelimit")) {
        std::pair<std::string, RateLimitTier> tier = ParseRateLimitSpec(spec);
        config.rateLimitTiers[tier.first] = tier.second;
    }
    for (const std::string& spec : args.GetArgs("-concurrentlimit")) {
        std::pair<std::string, RateLimitTier> tier = ParseConcurrentLimitSpec(spec);
        config.rateLimitTiers[tier.first] = tier.second;
    }
    if (args.IsArgSet("-defaultratelimit")) {
        config.defaultRateLimitTier = ParseWindowSpec(args.GetArg("-defaultratelimit", ""));
    }

    // Cache
    config.router.cacheTtlMs = GetIntOption(args, "-cachettl", DEFAULT_CACHE_TTL_MS / 1000, 0, 365LL * 86400) * 1000;
    config.router.fallbackCacheTtlMs =
        GetIntOption(args, "-fallbackcachettl", DEFAULT_FALLBACK_CACHE_TTL_MS / 1000, 0, 365LL * 86400) * 1000;
    config.cacheMaxEntries = static_cast<size_t>(
        GetIntOption(args, "-cachemaxentries", DEFAULT_CACHE_MAX_ENTRIES, 1, 100000000));
    if (config.router.fallbackCacheTtlMs > config.router.cacheTtlMs) {
        throw ConfigError("-fallbackcachettl must not exceed -cachettl");
    }

    // Router
    config.router.providerTimeoutMs = GetIntOption(args, "-providertimeout", DEFAULT_PROVIDER_TIMEOUT_MS, 1, 3600 * 1000);
    config.router.expectedOutputTokens = static_cast<uint64_t>(
        GetIntOption(args, "-expectedoutputtokens", DEFAULT_EXPECTED_OUTPUT_TOKENS, 0, MAX_REPLY_TOKENS));
    config.router.invocationThreads = static_cast<size_t>(
        GetIntOption(args, "-invocationthreads", DEFAULT_INVOCATION_THREADS, 1, 1024));
    config.router.maxInFlightPerProvider = static_cast<size_t>(
        GetIntOption(args, "-maxinflight", DEFAULT_MAX_IN_FLIGHT_PER_PROVIDER, 1, 1024));

    // Budgets
    const uint32_t softCapPercent = static_cast<uint32_t>(
        GetIntOption(args, "-defaultsoftcappct", DEFAULT_SOFT_CAP_PERCENT, 0, 100));
    CostAmount defaultHardCap = DEFAULT_HARD_CAP;
    if (args.IsArgSet("-defaulthardcap")) {
        defaultHardCap = ParseCostValue("-defaulthardcap", args.GetArg("-defaulthardcap", ""));
    }
    config.governor.defaultPolicy = BudgetPolicy::FromHardCap(defaultHardCap, softCapPercent);
    config.governor.periodSeconds = GetIntOption(args, "-budgetperiod", DEFAULT_BUDGET_PERIOD_SECONDS, 1);
    config.governor.driftWindowMs = GetIntOption(args, "-driftwindow", DEFAULT_DRIFT_WINDOW_MS / 1000, 1, 30LL * 86400) * 1000;
    if (args.IsArgSet("-driftthreshold")) {
        double pct = 0;
        const std::string value = args.GetArg("-driftthreshold", "");
        if (!ParseDouble(TrimString(value), &pct) || pct < 0 || pct > 1000) {
            throw ConfigError(strprintf("Invalid value for -driftthreshold: '%s'", value));
        }
        config.governor.driftThreshold = pct / 100.0;
    }
    for (const std::string& spec : args.GetArgs("-budget")) {
        std::pair<std::string, BudgetPolicy> budget = ParseBudgetSpec(spec, softCapPercent);
        config.budgets[budget.first] = budget.second;
    }

    // Providers
    std::set<std::string> providerKeys;
    std::set<std::string> providerIds;
    for (const std::string& spec : args.GetArgs("-provider")) {
        ProviderDescriptor descriptor = ParseProviderSpec(spec);
        if (!providerKeys.insert(descriptor.GetKey()).second) {
            throw ConfigError("Provider configured twice: " + descriptor.GetKey());
        }
        providerIds.insert(descriptor.providerId);
        config.providers.push_back(descriptor);
    }
    for (const std::string& spec : args.GetArgs("-tenantproviders")) {
        std::pair<std::string, std::vector<std::string>> tenant = ParseTenantProvidersSpec(spec);
        for (const std::string& id : tenant.second) {
            if (!providerIds.count(id)) {
                throw ConfigError(strprintf("-tenantproviders for %s names unknown provider %s", tenant.first, id));
            }
        }
        config.tenantProviders[tenant.first] = tenant.second;
    }

    LogPrint(CGLog::CONFIG, "Loaded configuration: %u providers, %u rate limit tiers, %u tenant budgets\n",
             config.providers.size(), config.rateLimitTiers.size(), config.budgets.size());
    return config;
}

void InitLogging(const ArgsManager& args)
{
    g_logger->m_print_to_console = args.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    g_logger->m_log_timestamps = args.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (args.IsArgSet("-logfile")) {
        g_logger->m_file_path = args.GetArg("-logfile", "");
        g_logger->m_print_to_file = true;
        if (!g_logger->OpenDebugLog()) {
            throw ConfigError("Could not open log file " + g_logger->m_file_path.string());
        }
    }

    for (const std::string& category : args.GetArgs("-debug")) {
        if (!g_logger->EnableCategory(category)) {
            LogPrintf("Unsupported logging category -debug=%s.\n", category);
        }
    }
}

} // namespace callguard
