// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/circuit_breaker.h>
#include <logging.h>

#include <algorithm>
#include <limits>

namespace callguard {

BreakerStateData TransitionBreaker(const BreakerStateData& current, const CircuitBreakerConfig& config,
                                   int64_t now, std::optional<CallOutcome> outcome, bool trial)
{
    BreakerStateData next = current;

    if (!outcome) {
        if (current.state == BreakerState::OPEN &&
            now - current.lastFailureTime >= config.recoveryTimeoutMs) {
            next.state = BreakerState::HALF_OPEN;
            next.trialInFlight = false;
        }
        return next;
    }

    if (current.state == BreakerState::HALF_OPEN && !trial) {
        return next;
    }

    if (*outcome == CallOutcome::SUCCESS) {
        if (current.state != BreakerState::OPEN) {
            next.state = BreakerState::CLOSED;
            next.consecutiveFailures = 0;
            next.trialInFlight = false;
        }
        return next;
    }

    if (next.consecutiveFailures < std::numeric_limits<uint32_t>::max()) {
        next.consecutiveFailures++;
    }
    next.lastFailureTime = now;

    switch (current.state) {
        case BreakerState::CLOSED:
            if (next.consecutiveFailures >= std::max<uint32_t>(1, config.failureThreshold)) {
                next.state = BreakerState::OPEN;
            }
            break;
        case BreakerState::HALF_OPEN:
            next.state = BreakerState::OPEN;
            next.trialInFlight = false;
            break;
        case BreakerState::OPEN:
            break;
    }
    return next;
}

std::string BreakerAdmissionToString(BreakerAdmission admission)
{
    switch (admission) {
        case BreakerAdmission::ADMITTED:       return "ADMITTED";
        case BreakerAdmission::ADMITTED_TRIAL: return "ADMITTED_TRIAL";
        case BreakerAdmission::REJECTED:       return "REJECTED";
        default:                               return "UNKNOWN";
    }
}

// ============================================================================
// CircuitBreaker
// ============================================================================

CircuitBreaker::CircuitBreaker(const std::string& providerId, const std::string& modelId,
                               const CircuitBreakerConfig& config, const Clock& clock, EventSink* events)
    : providerId_(providerId)
    , modelId_(modelId)
    , clock_(clock)
    , events_(events)
    , config_(config)
    , totalSuccesses_(0)
    , totalFailures_(0)
    , totalRejections_(0)
    , timesOpened_(0)
{
}

std::optional<BreakerState> CircuitBreaker::ApplyLocked(std::optional<CallOutcome> outcome, int64_t now, bool trial)
{
    const BreakerState before = data_.state;
    data_ = TransitionBreaker(data_, config_, now, outcome, trial);
    if (data_.state == before) {
        return std::nullopt;
    }
    if (data_.state == BreakerState::OPEN) {
        timesOpened_++;
    }
    return before;
}

void CircuitBreaker::ReportTransition(BreakerState from, BreakerState to, uint32_t failures)
{
    LogPrint(CGLog::BREAKER, "Breaker %s/%s: %s -> %s (failures=%u)\n",
             providerId_, modelId_, BreakerStateToString(from), BreakerStateToString(to), failures);

    if (!events_) return;

    std::map<std::string, std::string> fields = {
        {"provider", providerId_},
        {"model", modelId_}};

    switch (to) {
        case BreakerState::OPEN:
            fields["failure_count"] = strprintf("%u", failures);
            events_->Emit(EventType::BREAKER_OPENED, fields);
            break;
        case BreakerState::HALF_OPEN:
            events_->Emit(EventType::BREAKER_HALF_OPEN, fields);
            break;
        case BreakerState::CLOSED:
            events_->Emit(EventType::BREAKER_CLOSED, fields);
            break;
    }
}

BreakerAdmission CircuitBreaker::Admit()
{
    BreakerAdmission admission = BreakerAdmission::REJECTED;
    std::optional<BreakerState> changedFrom;
    BreakerState state;
    uint32_t failures;
    {
        LOCK(cs_breaker_);
        changedFrom = ApplyLocked(std::nullopt, clock_.NowMillis());
        state = data_.state;
        failures = data_.consecutiveFailures;

        switch (data_.state) {
            case BreakerState::CLOSED:
                admission = BreakerAdmission::ADMITTED;
                break;
            case BreakerState::HALF_OPEN:
                if (!data_.trialInFlight) {
                    data_.trialInFlight = true;
                    admission = BreakerAdmission::ADMITTED_TRIAL;
                }
                break;
            case BreakerState::OPEN:
                break;
        }

        if (admission == BreakerAdmission::REJECTED) {
            totalRejections_++;
        }
    }

    if (changedFrom) {
        ReportTransition(*changedFrom, state, failures);
    }
    if (admission == BreakerAdmission::ADMITTED_TRIAL) {
        LogPrint(CGLog::BREAKER, "Breaker %s/%s: admitting trial call\n", providerId_, modelId_);
    }
    return admission;
}

void CircuitBreaker::RecordSuccess(bool trial)
{
    std::optional<BreakerState> changedFrom;
    BreakerState state;
    {
        LOCK(cs_breaker_);
        totalSuccesses_++;
        changedFrom = ApplyLocked(CallOutcome::SUCCESS, clock_.NowMillis(), trial);
        if (trial && data_.state == BreakerState::HALF_OPEN) {
            data_.trialInFlight = false;
        }
        state = data_.state;
    }

    if (changedFrom) {
        ReportTransition(*changedFrom, state, 0);
    }
}

void CircuitBreaker::RecordFailure(bool trial)
{
    std::optional<BreakerState> changedFrom;
    BreakerState state;
    uint32_t failures;
    {
        LOCK(cs_breaker_);
        totalFailures_++;
        changedFrom = ApplyLocked(CallOutcome::FAILURE, clock_.NowMillis(), trial);
        if (trial && data_.state == BreakerState::HALF_OPEN) {
            data_.trialInFlight = false;
        }
        state = data_.state;
        failures = data_.consecutiveFailures;
    }

    LogPrint(CGLog::BREAKER, "Breaker %s/%s: failure recorded (%u consecutive%s)\n",
             providerId_, modelId_, failures, trial ? ", trial" : "");

    if (changedFrom) {
        ReportTransition(*changedFrom, state, failures);
    }
}

void CircuitBreaker::AbandonCall(bool trial)
{
    LOCK(cs_breaker_);
    if (trial && data_.state == BreakerState::HALF_OPEN) {
        data_.trialInFlight = false;
    }
}

BreakerState CircuitBreaker::GetState() const
{
    LOCK(cs_breaker_);
    return TransitionBreaker(data_, config_, clock_.NowMillis(), std::nullopt).state;
}

uint32_t CircuitBreaker::GetConsecutiveFailures() const
{
    LOCK(cs_breaker_);
    return data_.consecutiveFailures;
}

int64_t CircuitBreaker::GetRetryAfterMillis() const
{
    LOCK(cs_breaker_);
    if (data_.state != BreakerState::OPEN) {
        return 0;
    }
    const int64_t remaining = data_.lastFailureTime + config_.recoveryTimeoutMs - clock_.NowMillis();
    return remaining > 0 ? remaining : 0;
}

CircuitBreakerStatus CircuitBreaker::GetStatus() const
{
    const int64_t retryAfter = GetRetryAfterMillis();

    LOCK(cs_breaker_);
    const BreakerStateData view = TransitionBreaker(data_, config_, clock_.NowMillis(), std::nullopt);

    CircuitBreakerStatus status;
    status.providerId = providerId_;
    status.modelId = modelId_;
    status.state = view.state;
    status.consecutiveFailures = view.consecutiveFailures;
    status.lastFailureTime = view.lastFailureTime;
    status.trialInFlight = view.trialInFlight;
    status.retryAfterMs = view.state == BreakerState::OPEN ? retryAfter : 0;
    status.totalSuccesses = totalSuccesses_;
    status.totalFailures = totalFailures_;
    status.totalRejections = totalRejections_;
    status.timesOpened = timesOpened_;
    return status;
}

void CircuitBreaker::Reset()
{
    BreakerState before;
    {
        LOCK(cs_breaker_);
        before = data_.state;
        data_ = BreakerStateData();
    }
    LogPrint(CGLog::BREAKER, "Breaker %s/%s reset\n", providerId_, modelId_);
    if (before != BreakerState::CLOSED) {
        ReportTransition(before, BreakerState::CLOSED, 0);
    }
}

void CircuitBreaker::SetConfig(const CircuitBreakerConfig& config)
{
    LOCK(cs_breaker_);
    config_ = config;
}

CircuitBreakerConfig CircuitBreaker::GetConfig() const
{
    LOCK(cs_breaker_);
    return config_;
}

// ============================================================================
// CircuitBreakerRegistry
// ============================================================================

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreakerConfig& defaultConfig,
                                               const Clock& clock, EventSink* events)
    : clock_(clock)
    , events_(events)
    , defaultConfig_(defaultConfig)
{
}

CircuitBreakerConfig CircuitBreakerRegistry::ConfigFor(const std::string& providerId) const
{
    auto it = providerConfigs_.find(providerId);
    if (it != providerConfigs_.end()) {
        return it->second;
    }
    return defaultConfig_;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::GetBreaker(const std::string& providerId,
                                                                   const std::string& modelId)
{
    LOCK(cs_registry_);
    auto key = std::make_pair(providerId, modelId);
    auto it = breakers_.find(key);
    if (it != breakers_.end()) {
        return it->second;
    }
    auto breaker = std::make_shared<CircuitBreaker>(providerId, modelId, ConfigFor(providerId), clock_, events_);
    breakers_[key] = breaker;
    LogPrint(CGLog::BREAKER, "Created breaker for %s/%s\n", providerId, modelId);
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::FindBreaker(const std::string& providerId,
                                                                    const std::string& modelId) const
{
    LOCK(cs_registry_);
    auto it = breakers_.find(std::make_pair(providerId, modelId));
    if (it == breakers_.end()) {
        return nullptr;
    }
    return it->second;
}

void CircuitBreakerRegistry::SetProviderConfig(const std::string& providerId, const CircuitBreakerConfig& config)
{
    LOCK(cs_registry_);
    providerConfigs_[providerId] = config;
    for (auto& entry : breakers_) {
        if (entry.first.first == providerId) {
            entry.second->SetConfig(config);
        }
    }
}

std::vector<CircuitBreakerStatus> CircuitBreakerRegistry::GetAllStatus() const
{
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        LOCK(cs_registry_);
        for (const auto& entry : breakers_) {
            breakers.push_back(entry.second);
        }
    }
    std::vector<CircuitBreakerStatus> result;
    for (const auto& breaker : breakers) {
        result.push_back(breaker->GetStatus());
    }
    return result;
}

size_t CircuitBreakerRegistry::Size() const
{
    LOCK(cs_registry_);
    return breakers_.size();
}

void CircuitBreakerRegistry::ResetAll()
{
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        LOCK(cs_registry_);
        for (const auto& entry : breakers_) {
            breakers.push_back(entry.second);
        }
    }
    for (const auto& breaker : breakers) {
        breaker->Reset();
    }
}

} // namespace callguard
