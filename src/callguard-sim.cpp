// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/callguard_config.h>
#include <callguard/errors.h>
#include <callguard/service.h>
#include <callguard/simulated_provider.h>
#include <logging.h>
#include <util.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <thread>
#include <vector>

static const int64_t DEFAULT_SIM_WORKERS = 4;
static const int64_t DEFAULT_SIM_REQUESTS = 50;
static const int64_t DEFAULT_SIM_LATENCY_MS = 20;

static const char* const SIM_TASK_TYPES[] = {"help", "analysis", "recommendations", "quick-check"};

static std::string GetSimHelpMessage()
{
    std::string strUsage;
    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", CALLGUARD_CONF_FILENAME));
    strUsage += callguard::GetCallguardHelpMessage();
    strUsage += HelpMessageGroup("Simulation options:");
    strUsage += HelpMessageOpt("-simworkers=<n>", strprintf("Concurrent request threads (default: %d)", DEFAULT_SIM_WORKERS));
    strUsage += HelpMessageOpt("-simrequests=<n>", strprintf("Requests per worker (default: %d)", DEFAULT_SIM_REQUESTS));
    strUsage += HelpMessageOpt("-simtenants=<id>[,<id>...]", "Tenants the workers rotate through (default: tenant-a)");
    strUsage += HelpMessageOpt("-simfailrate=<id>:<pct>", "Failure percentage of a simulated provider; can be specified multiple times (default: 0)");
    strUsage += HelpMessageOpt("-simlatency=<id>:<ms>", strprintf("Latency of a simulated provider (default: %d)", DEFAULT_SIM_LATENCY_MS));
    return strUsage;
}

/** Parse repeated "<id>:<n>" options into a map */
static std::map<std::string, int64_t> ParsePerProvider(const std::string& option)
{
    std::map<std::string, int64_t> values;
    for (const std::string& spec : gArgs.GetArgs(option)) {
        std::vector<std::string> parts = SplitString(spec, ':');
        int64_t n = 0;
        if (parts.size() != 2 || parts[0].empty() || !ParseInt64(parts[1], &n) || n < 0) {
            throw callguard::ConfigError(strprintf("Invalid value for %s: '%s'", option, spec));
        }
        values[parts[0]] = n;
    }
    return values;
}

static void RunWorker(callguard::CallguardService& service, int worker, int64_t requests,
                      const std::vector<std::string>& tenants, std::atomic<uint64_t>& errors)
{
    for (int64_t i = 0; i < requests; ++i) {
        callguard::GenerateRequest request;
        request.subjectId = strprintf("user-%d", worker);
        request.tenantId = tenants[(worker + i) % tenants.size()];
        request.taskType = SIM_TASK_TYPES[i % 4];
        request.prompt = strprintf("How do we meet control %d for our organisation?", i % 10);
        request.context.businessProfileId = strprintf("profile-%d", worker % 2);
        request.context.frameworkId = (i % 3 == 0) ? "gdpr" : "iso27001";
        request.context.attributes["request_id"] = strprintf("%d-%d", worker, i);
        try {
            callguard::GenerateResponse response = service.Generate(request);
            LogPrint(CGLog::ROUTER, "worker %d request %d: source=%s degraded=%u reason=%s\n", worker, i,
                     callguard::ResponseSourceToString(response.source), response.degraded,
                     callguard::DegradeReasonToString(response.reason));
        } catch (const callguard::CallguardError& e) {
            errors++;
            LogPrintf("worker %d request %d failed: %s\n", worker, i, e.what());
        }
    }
}

static int AppInit(int argc, char* argv[])
{
    gArgs.ParseParameters(argc, argv);

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        std::string strUsage = "callguard-sim\n\nUsage:\n  callguard-sim [options]   Drive simulated traffic through the resilience core\n\n";
        strUsage += GetSimHelpMessage();
        fprintf(stdout, "%s", strUsage.c_str());
        return EXIT_SUCCESS;
    }

    try {
        if (gArgs.IsArgSet("-conf")) {
            gArgs.ReadConfigFile(gArgs.GetArg("-conf", CALLGUARD_CONF_FILENAME));
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "Error reading configuration file: %s\n", e.what());
        return EXIT_FAILURE;
    }

    // Without configured providers, simulate a three-deep failover chain
    if (gArgs.GetArgs("-provider").empty()) {
        gArgs.ForceSetMultiArg("-provider", "primary:large-v2:0:0.010:0.030:premium");
        gArgs.ForceSetMultiArg("-provider", "secondary:medium-v1:1:0.002:0.006:standard");
        gArgs.ForceSetMultiArg("-provider", "backup:small-v1:2:0.0005:0.0015:economy");
    }
    gArgs.SoftSetBoolArg("-printtoconsole", true);

    try {
        callguard::InitLogging(gArgs);
        callguard::CallguardConfig config = callguard::LoadCallguardConfig(gArgs);

        const std::map<std::string, int64_t> failRates = ParsePerProvider("-simfailrate");
        const std::map<std::string, int64_t> latencies = ParsePerProvider("-simlatency");

        callguard::SystemClock clock;
        callguard::CallguardService service(config, clock);

        std::map<std::string, std::shared_ptr<callguard::SimulatedProvider>> transports;
        uint32_t seed = 1;
        for (const callguard::ProviderDescriptor& descriptor : config.providers) {
            if (transports.count(descriptor.providerId)) continue;
            auto rate = failRates.find(descriptor.providerId);
            auto latency = latencies.find(descriptor.providerId);
            auto transport = std::make_shared<callguard::SimulatedProvider>(
                descriptor.providerId,
                rate != failRates.end() ? static_cast<uint32_t>(rate->second) : 0,
                latency != latencies.end() ? latency->second : DEFAULT_SIM_LATENCY_MS,
                seed++);
            service.BindProvider(descriptor.providerId, transport);
            transports[descriptor.providerId] = transport;
        }

        std::vector<std::string> tenants = SplitString(gArgs.GetArg("-simtenants", "tenant-a"), ',');
        const int64_t workers = gArgs.GetArg("-simworkers", DEFAULT_SIM_WORKERS);
        const int64_t requests = gArgs.GetArg("-simrequests", DEFAULT_SIM_REQUESTS);
        if (workers < 1 || requests < 0 || tenants.empty()) {
            throw callguard::ConfigError("-simworkers must be positive and -simrequests non-negative");
        }

        LogPrintf("Starting simulation: %d workers x %d requests\n", workers, requests);
        std::atomic<uint64_t> errors(0);
        std::vector<std::thread> threads;
        for (int64_t w = 0; w < workers; ++w) {
            threads.emplace_back(RunWorker, std::ref(service), static_cast<int>(w), requests,
                                 std::cref(tenants), std::ref(errors));
        }
        for (std::thread& thread : threads) {
            thread.join();
        }

        fprintf(stdout, "\n%s", service.GetStatusReport().c_str());
        for (const auto& entry : transports) {
            fprintf(stdout, "Provider %s: invocations=%lu failures=%lu cancelled=%lu\n", entry.first.c_str(),
                    static_cast<unsigned long>(entry.second->GetInvocationCount()),
                    static_cast<unsigned long>(entry.second->GetFailureCount()),
                    static_cast<unsigned long>(entry.second->GetCancelledCount()));
        }
        return errors.load() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const callguard::ConfigError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }
}

int main(int argc, char* argv[])
{
    return AppInit(argc, argv);
}
