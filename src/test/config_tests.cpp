// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/callguard_config.h>
#include <callguard/errors.h>
#include <test/test_callguard.h>
#include <util.h>

#include <boost/filesystem/operations.hpp>
#include <boost/test/unit_test.hpp>

#include <fstream>

using namespace callguard;

BOOST_FIXTURE_TEST_SUITE(config_tests, BasicTestingSetup)

// ============================================================================
// Cost amounts
// ============================================================================

BOOST_AUTO_TEST_CASE(cost_format_and_parse)
{
    BOOST_CHECK_EQUAL(FormatCost(0), "0.000000");
    BOOST_CHECK_EQUAL(FormatCost(120000), "0.120000");
    BOOST_CHECK_EQUAL(FormatCost(12 * COST_UNIT + 5), "12.000005");
    BOOST_CHECK_EQUAL(FormatCost(-1500000), "-1.500000");

    CostAmount amount = 0;
    BOOST_CHECK(ParseCost("12.5", amount));
    BOOST_CHECK_EQUAL(amount, 12500000);
    BOOST_CHECK(ParseCost("0.000001", amount));
    BOOST_CHECK_EQUAL(amount, 1);
    BOOST_CHECK(ParseCost(".5", amount));
    BOOST_CHECK_EQUAL(amount, 500000);
    BOOST_CHECK(ParseCost("100", amount));
    BOOST_CHECK_EQUAL(amount, 100 * COST_UNIT);

    BOOST_CHECK(!ParseCost("", amount));
    BOOST_CHECK(!ParseCost(".", amount));
    BOOST_CHECK(!ParseCost("-1", amount));
    BOOST_CHECK(!ParseCost("1.2.3", amount));
    BOOST_CHECK(!ParseCost("0.0000001", amount));
    BOOST_CHECK(!ParseCost("1e6", amount));
    BOOST_CHECK(!ParseCost("99999999999", amount));
}

BOOST_AUTO_TEST_CASE(quality_tiers)
{
    QualityTier tier = QualityTier::STANDARD;
    BOOST_CHECK(ParseQualityTier("Premium", tier));
    BOOST_CHECK_EQUAL(tier, QualityTier::PREMIUM);
    BOOST_CHECK(ParseQualityTier("economy", tier));
    BOOST_CHECK_EQUAL(tier, QualityTier::ECONOMY);
    BOOST_CHECK(!ParseQualityTier("gold", tier));
    BOOST_CHECK_EQUAL(tier, QualityTier::ECONOMY);
}

// ============================================================================
// Option value parsers
// ============================================================================

BOOST_AUTO_TEST_CASE(parse_rate_limits)
{
    std::pair<std::string, RateLimitTier> tier = ParseRateLimitSpec("help:50/30");
    BOOST_CHECK_EQUAL(tier.first, "help");
    BOOST_CHECK_EQUAL(tier.second.limit, 50u);
    BOOST_CHECK_EQUAL(tier.second.windowMs, 30000);
    BOOST_CHECK(!tier.second.concurrent);

    std::pair<std::string, RateLimitTier> streaming = ParseConcurrentLimitSpec("streaming:2");
    BOOST_CHECK_EQUAL(streaming.first, "streaming");
    BOOST_CHECK_EQUAL(streaming.second.limit, 2u);
    BOOST_CHECK(streaming.second.concurrent);

    BOOST_CHECK_THROW(ParseRateLimitSpec("help:10"), ConfigError);
    BOOST_CHECK_THROW(ParseRateLimitSpec(":10/60"), ConfigError);
    BOOST_CHECK_THROW(ParseRateLimitSpec("help:10/0"), ConfigError);
    BOOST_CHECK_THROW(ParseRateLimitSpec("help:ten/60"), ConfigError);
    BOOST_CHECK_THROW(ParseConcurrentLimitSpec("streaming"), ConfigError);
    BOOST_CHECK_THROW(ParseWindowSpec("5/60/1"), ConfigError);
}

BOOST_AUTO_TEST_CASE(parse_provider)
{
    ProviderDescriptor descriptor = ParseProviderSpec("primary:large-v2:0:0.010:0.030:premium");
    BOOST_CHECK_EQUAL(descriptor.providerId, "primary");
    BOOST_CHECK_EQUAL(descriptor.modelId, "large-v2");
    BOOST_CHECK_EQUAL(descriptor.priorityRank, 0);
    BOOST_CHECK_EQUAL(descriptor.costPerKInput, 10000);
    BOOST_CHECK_EQUAL(descriptor.costPerKOutput, 30000);
    BOOST_CHECK_EQUAL(descriptor.qualityTier, QualityTier::PREMIUM);

    BOOST_CHECK_THROW(ParseProviderSpec("primary:large-v2:0:0.010:0.030"), ConfigError);
    BOOST_CHECK_THROW(ParseProviderSpec("primary:large-v2:0:0.010:0.030:gold"), ConfigError);
    BOOST_CHECK_THROW(ParseProviderSpec("primary:large-v2:-1:0.010:0.030:premium"), ConfigError);
    BOOST_CHECK_THROW(ParseProviderSpec(":large-v2:0:0.010:0.030:premium"), ConfigError);
    BOOST_CHECK_THROW(ParseProviderSpec("primary:large-v2:0:free:0.030:premium"), ConfigError);
}

BOOST_AUTO_TEST_CASE(parse_tenant_providers)
{
    std::pair<std::string, std::vector<std::string>> tenant = ParseTenantProvidersSpec("acme: primary , backup");
    BOOST_CHECK_EQUAL(tenant.first, "acme");
    BOOST_REQUIRE_EQUAL(tenant.second.size(), 2u);
    BOOST_CHECK_EQUAL(tenant.second[0], "primary");
    BOOST_CHECK_EQUAL(tenant.second[1], "backup");

    BOOST_CHECK_THROW(ParseTenantProvidersSpec("acme:primary,,backup"), ConfigError);
    BOOST_CHECK_THROW(ParseTenantProvidersSpec("acme:"), ConfigError);
}

BOOST_AUTO_TEST_CASE(parse_budget)
{
    std::pair<std::string, BudgetPolicy> budget = ParseBudgetSpec("acme:25:20", 80);
    BOOST_CHECK_EQUAL(budget.first, "acme");
    BOOST_CHECK_EQUAL(budget.second.hardCap, 25 * COST_UNIT);
    BOOST_CHECK_EQUAL(budget.second.softCap, 20 * COST_UNIT);

    BOOST_CHECK_EQUAL(ParseBudgetSpec("globex:10", 50).second.softCap, 5 * COST_UNIT);

    BOOST_CHECK_THROW(ParseBudgetSpec("acme:10:11", 80), ConfigError);
    BOOST_CHECK_THROW(ParseBudgetSpec("acme", 80), ConfigError);
    BOOST_CHECK_THROW(ParseBudgetSpec(":10", 80), ConfigError);
    BOOST_CHECK_THROW(ParseBudgetSpec("acme:1:2:3", 80), ConfigError);
}

// ============================================================================
// LoadCallguardConfig
// ============================================================================

BOOST_AUTO_TEST_CASE(load_defaults)
{
    ArgsManager args;
    CallguardConfig config = LoadCallguardConfig(args);

    BOOST_CHECK_EQUAL(config.breaker.failureThreshold, DEFAULT_FAILURE_THRESHOLD);
    BOOST_CHECK_EQUAL(config.breaker.recoveryTimeoutMs, DEFAULT_RECOVERY_TIMEOUT_MS);
    BOOST_CHECK_EQUAL(config.rateLimitTiers.size(), 5u);
    BOOST_CHECK(!config.defaultRateLimitTier);
    BOOST_CHECK_EQUAL(config.cacheMaxEntries, DEFAULT_CACHE_MAX_ENTRIES);
    BOOST_CHECK_EQUAL(config.router.cacheTtlMs, DEFAULT_CACHE_TTL_MS);
    BOOST_CHECK_EQUAL(config.router.fallbackCacheTtlMs, DEFAULT_FALLBACK_CACHE_TTL_MS);
    BOOST_CHECK_EQUAL(config.router.providerTimeoutMs, DEFAULT_PROVIDER_TIMEOUT_MS);
    BOOST_CHECK_EQUAL(config.router.invocationThreads, DEFAULT_INVOCATION_THREADS);
    BOOST_CHECK_EQUAL(config.router.maxInFlightPerProvider, DEFAULT_MAX_IN_FLIGHT_PER_PROVIDER);
    BOOST_CHECK_EQUAL(config.governor.defaultPolicy.hardCap, DEFAULT_HARD_CAP);
    BOOST_CHECK_EQUAL(config.governor.defaultPolicy.softCap, 80 * COST_UNIT);
    BOOST_CHECK_CLOSE(config.governor.driftThreshold, DEFAULT_DRIFT_THRESHOLD, 0.0001);
    BOOST_CHECK(config.providers.empty());
    BOOST_CHECK(config.budgets.empty());
}

BOOST_AUTO_TEST_CASE(load_overrides)
{
    ArgsManager args;
    args.ForceSetArg("-failurethreshold", "5");
    args.ForceSetArg("-recoverytimeout", "10");
    args.ForceSetMultiArg("-ratelimit", "help:50/30");
    args.ForceSetMultiArg("-ratelimit", "translate:2/10");
    args.ForceSetArg("-concurrentlimit", "streaming:1");
    args.ForceSetArg("-defaultratelimit", "7/60");
    args.ForceSetArg("-cachettl", "120");
    args.ForceSetArg("-fallbackcachettl", "30");
    args.ForceSetArg("-cachemaxentries", "500");
    args.ForceSetArg("-providertimeout", "2500");
    args.ForceSetArg("-expectedoutputtokens", "800");
    args.ForceSetArg("-invocationthreads", "4");
    args.ForceSetArg("-maxinflight", "2");
    args.ForceSetArg("-defaulthardcap", "50");
    args.ForceSetArg("-defaultsoftcappct", "50");
    args.ForceSetArg("-budgetperiod", "86400");
    args.ForceSetArg("-driftthreshold", "12.5");
    args.ForceSetArg("-driftwindow", "600");
    args.ForceSetMultiArg("-budget", "acme:25:20");
    args.ForceSetMultiArg("-budget", "globex:10");
    args.ForceSetMultiArg("-provider", "primary:large-v2:0:0.010:0.030:premium");
    args.ForceSetMultiArg("-provider", "primary:mini:1:0.001:0.002:economy");
    args.ForceSetMultiArg("-provider", "backup:small-v1:2:0.0005:0.0015:economy");
    args.ForceSetArg("-tenantproviders", "acme:backup");

    CallguardConfig config = LoadCallguardConfig(args);

    BOOST_CHECK_EQUAL(config.breaker.failureThreshold, 5u);
    BOOST_CHECK_EQUAL(config.breaker.recoveryTimeoutMs, 10000);
    BOOST_CHECK_EQUAL(config.rateLimitTiers.size(), 6u);
    BOOST_CHECK_EQUAL(config.rateLimitTiers["help"].limit, 50u);
    BOOST_CHECK_EQUAL(config.rateLimitTiers["help"].windowMs, 30000);
    BOOST_CHECK_EQUAL(config.rateLimitTiers["translate"].limit, 2u);
    BOOST_CHECK_EQUAL(config.rateLimitTiers["streaming"].limit, 1u);
    BOOST_CHECK_EQUAL(config.rateLimitTiers["analysis"].limit, DEFAULT_ANALYSIS_LIMIT);
    BOOST_REQUIRE(config.defaultRateLimitTier);
    BOOST_CHECK_EQUAL(config.defaultRateLimitTier->limit, 7u);

    BOOST_CHECK_EQUAL(config.router.cacheTtlMs, 120000);
    BOOST_CHECK_EQUAL(config.router.fallbackCacheTtlMs, 30000);
    BOOST_CHECK_EQUAL(config.cacheMaxEntries, 500u);
    BOOST_CHECK_EQUAL(config.router.providerTimeoutMs, 2500);
    BOOST_CHECK_EQUAL(config.router.expectedOutputTokens, 800u);
    BOOST_CHECK_EQUAL(config.router.invocationThreads, 4u);
    BOOST_CHECK_EQUAL(config.router.maxInFlightPerProvider, 2u);

    BOOST_CHECK_EQUAL(config.governor.defaultPolicy.hardCap, 50 * COST_UNIT);
    BOOST_CHECK_EQUAL(config.governor.defaultPolicy.softCap, 25 * COST_UNIT);
    BOOST_CHECK_EQUAL(config.governor.periodSeconds, 86400);
    BOOST_CHECK_CLOSE(config.governor.driftThreshold, 0.125, 0.0001);
    BOOST_CHECK_EQUAL(config.governor.driftWindowMs, 600000);
    BOOST_CHECK_EQUAL(config.budgets["acme"].softCap, 20 * COST_UNIT);
    BOOST_CHECK_EQUAL(config.budgets["globex"].softCap, 5 * COST_UNIT);

    BOOST_REQUIRE_EQUAL(config.providers.size(), 3u);
    BOOST_CHECK_EQUAL(config.providers[1].GetKey(), "primary/mini");
    BOOST_REQUIRE_EQUAL(config.tenantProviders["acme"].size(), 1u);
    BOOST_CHECK_EQUAL(config.tenantProviders["acme"][0], "backup");
}

BOOST_AUTO_TEST_CASE(load_rejects_invalid_values)
{
    {
        ArgsManager args;
        args.ForceSetArg("-failurethreshold", "0");
        BOOST_CHECK_THROW(LoadCallguardConfig(args), ConfigError);
    }
    {
        ArgsManager args;
        args.ForceSetArg("-recoverytimeout", "soon");
        BOOST_CHECK_THROW(LoadCallguardConfig(args), ConfigError);
    }
    {
        ArgsManager args;
        args.ForceSetArg("-cachettl", "60");
        args.ForceSetArg("-fallbackcachettl", "120");
        BOOST_CHECK_THROW(LoadCallguardConfig(args), ConfigError);
    }
    {
        ArgsManager args;
        args.ForceSetArg("-cachemaxentries", "0");
        BOOST_CHECK_THROW(LoadCallguardConfig(args), ConfigError);
    }
    {
        ArgsManager args;
        args.ForceSetArg("-maxinflight", "0");
        BOOST_CHECK_THROW(LoadCallguardConfig(args), ConfigError);
    }
    {
        ArgsManager args;
        args.ForceSetArg("-driftthreshold", "-1");
        BOOST_CHECK_THROW(LoadCallguardConfig(args), ConfigError);
    }
    {
        ArgsManager args;
        args.ForceSetArg("-defaultsoftcappct", "120");
        BOOST_CHECK_THROW(LoadCallguardConfig(args), ConfigError);
    }
    {
        ArgsManager args;
        args.ForceSetMultiArg("-provider", "primary:large-v2:0:0.010:0.030:premium");
        args.ForceSetMultiArg("-provider", "primary:large-v2:1:0.010:0.030:premium");
        BOOST_CHECK_THROW(LoadCallguardConfig(args), ConfigError);
    }
    {
        ArgsManager args;
        args.ForceSetMultiArg("-provider", "primary:large-v2:0:0.010:0.030:premium");
        args.ForceSetArg("-tenantproviders", "acme:primary,missing");
        BOOST_CHECK_THROW(LoadCallguardConfig(args), ConfigError);
    }
}

BOOST_AUTO_TEST_CASE(config_file_and_command_line)
{
    boost::filesystem::path path = boost::filesystem::temp_directory_path() /
                                   boost::filesystem::unique_path("callguard-test-%%%%-%%%%.conf");
    {
        std::ofstream file(path.string());
        file << "failurethreshold=4\n";
        file << "ratelimit=help:3/60\n";
        file << "provider=backup:small-v1:2:0.0005:0.0015:economy\n";
    }

    const char* argv[] = {"callguard-sim", "-failurethreshold=6", "-provider=primary:large-v2:0:0.010:0.030:premium"};
    ArgsManager args;
    args.ParseParameters(3, argv);
    args.ReadConfigFile(path.string());
    boost::filesystem::remove(path);

    CallguardConfig config = LoadCallguardConfig(args);
    // The command line wins for single values; multi-valued options merge
    BOOST_CHECK_EQUAL(config.breaker.failureThreshold, 6u);
    BOOST_CHECK_EQUAL(config.rateLimitTiers["help"].limit, 3u);
    BOOST_CHECK_EQUAL(config.providers.size(), 2u);

    BOOST_CHECK_THROW(args.ReadConfigFile(path.string()), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(negated_and_bare_flags)
{
    const char* argv[] = {"callguard-sim", "-printtoconsole", "-nologtimestamps", "--debug=breaker"};
    ArgsManager args;
    args.ParseParameters(4, argv);
    BOOST_CHECK(args.GetBoolArg("-printtoconsole", false));
    BOOST_CHECK(!args.GetBoolArg("-logtimestamps", true));
    BOOST_CHECK_EQUAL(args.GetArg("-debug", ""), "breaker");
    BOOST_CHECK(!args.SoftSetArg("-debug", "all"));
    BOOST_CHECK(args.SoftSetBoolArg("-logfile", false));
}

BOOST_AUTO_TEST_CASE(help_message_lists_options)
{
    const std::string help = GetCallguardHelpMessage();
    for (const char* option : {"-failurethreshold", "-recoverytimeout", "-ratelimit", "-concurrentlimit",
                               "-cachettl", "-fallbackcachettl", "-provider", "-tenantproviders",
                               "-providertimeout", "-maxinflight", "-budget", "-driftthreshold", "-debug"}) {
        BOOST_CHECK_MESSAGE(help.find(option) != std::string::npos, "missing " << option);
    }
}

BOOST_AUTO_TEST_SUITE_END()
