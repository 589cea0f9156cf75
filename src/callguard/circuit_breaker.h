// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_CIRCUIT_BREAKER_H
#define CALLGUARD_CIRCUIT_BREAKER_H

/**
 * @file circuit_breaker.h
 * @brief Per provider/model circuit breakers
 *
 * A breaker trips to OPEN after a run of consecutive upstream failures and
 * fails calls fast until the recovery timeout has elapsed. It then admits a
 * single trial call (HALF_OPEN); success closes it, failure reopens it.
 *
 * State transitions are computed by the pure function TransitionBreaker()
 * so that they can be tested without threads or clocks. CircuitBreaker
 * wraps it with locking, counters and event reporting.
 *
 * Only ProviderError (and subclasses) count as failures. Any other
 * exception thrown by a guarded operation propagates unchanged and leaves
 * the failure count alone.
 */

#include <callguard/callguard_common.h>
#include <callguard/clock.h>
#include <callguard/errors.h>
#include <callguard/event_sink.h>
#include <sync.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace callguard {

// ============================================================================
// Constants
// ============================================================================

/** Consecutive failures that trip a breaker */
static constexpr uint32_t DEFAULT_FAILURE_THRESHOLD = 3;

/** Time an open breaker waits before admitting a trial call */
static constexpr int64_t DEFAULT_RECOVERY_TIMEOUT_MS = 30 * 1000;

// ============================================================================
// Data Structures
// ============================================================================

struct CircuitBreakerConfig {
    uint32_t failureThreshold;
    int64_t recoveryTimeoutMs;

    CircuitBreakerConfig()
        : failureThreshold(DEFAULT_FAILURE_THRESHOLD)
        , recoveryTimeoutMs(DEFAULT_RECOVERY_TIMEOUT_MS)
    {}

    CircuitBreakerConfig(uint32_t threshold, int64_t recoveryMs)
        : failureThreshold(threshold)
        , recoveryTimeoutMs(recoveryMs)
    {}
};

enum class CallOutcome : uint8_t {
    SUCCESS = 0,
    FAILURE = 1
};

/**
 * @brief Mutable part of a breaker
 */
struct BreakerStateData {
    BreakerState state;
    uint32_t consecutiveFailures;
    /** Clock::NowMillis() of the last counted failure */
    int64_t lastFailureTime;
    /** A HALF_OPEN trial call has been admitted and not yet settled */
    bool trialInFlight;

    BreakerStateData()
        : state(BreakerState::CLOSED)
        , consecutiveFailures(0)
        , lastFailureTime(0)
        , trialInFlight(false)
    {}
};

/**
 * @brief Compute the next breaker state
 * @param current Current state
 * @param config Threshold and recovery timeout
 * @param now Current monotonic time in milliseconds
 * @param outcome Outcome of a settled call, or nullopt for a pure time tick
 * @param trial Whether the outcome belongs to the half-open trial call
 * @return The new state
 *
 * - tick: OPEN becomes HALF_OPEN once recoveryTimeoutMs has passed since
 *   the last failure.
 * - SUCCESS in CLOSED, or the trial's SUCCESS in HALF_OPEN: CLOSED with the
 *   failure count reset. A late success arriving while OPEN changes nothing.
 * - FAILURE in CLOSED: count it and open at the threshold.
 * - the trial's FAILURE in HALF_OPEN: reopen.
 * - FAILURE while OPEN: count it and restart the recovery timeout.
 * - any other outcome in HALF_OPEN comes from a call admitted before the
 *   breaker opened and changes nothing; only the trial decides.
 */
BreakerStateData TransitionBreaker(const BreakerStateData& current, const CircuitBreakerConfig& config,
                                   int64_t now, std::optional<CallOutcome> outcome, bool trial = false);

enum class BreakerAdmission : uint8_t {
    ADMITTED = 0,           // Normal call in CLOSED state
    ADMITTED_TRIAL = 1,     // The single HALF_OPEN trial
    REJECTED = 2            // Breaker open, or a trial is already running
};

std::string BreakerAdmissionToString(BreakerAdmission admission);

inline std::ostream& operator<<(std::ostream& os, BreakerAdmission admission) {
    return os << BreakerAdmissionToString(admission);
}

/**
 * @brief Point-in-time view of a breaker
 */
struct CircuitBreakerStatus {
    std::string providerId;
    std::string modelId;
    BreakerState state;
    uint32_t consecutiveFailures;
    int64_t lastFailureTime;
    bool trialInFlight;
    /** Time until an OPEN breaker admits a trial */
    int64_t retryAfterMs;
    uint64_t totalSuccesses;
    uint64_t totalFailures;
    uint64_t totalRejections;
    uint64_t timesOpened;

    CircuitBreakerStatus()
        : state(BreakerState::CLOSED)
        , consecutiveFailures(0)
        , lastFailureTime(0)
        , trialInFlight(false)
        , retryAfterMs(0)
        , totalSuccesses(0)
        , totalFailures(0)
        , totalRejections(0)
        , timesOpened(0)
    {}
};

// ============================================================================
// Circuit Breaker Class
// ============================================================================

/**
 * @brief Circuit breaker guarding one provider/model pair
 *
 * Thread-safe. At most one trial call is admitted per HALF_OPEN episode.
 * Callers either use Execute() or drive Admit() / RecordSuccess() /
 * RecordFailure() / AbandonCall() themselves; every admitted call must be
 * settled exactly once.
 */
class CircuitBreaker {
public:
    CircuitBreaker(const std::string& providerId, const std::string& modelId,
                   const CircuitBreakerConfig& config, const Clock& clock, EventSink* events);

    /**
     * @brief Ask to make a call
     * @return ADMITTED, ADMITTED_TRIAL (caller makes the single trial call) or REJECTED
     */
    BreakerAdmission Admit();

    /** Settle an admitted call that succeeded */
    void RecordSuccess(bool trial);

    /** Settle an admitted call that failed upstream */
    void RecordFailure(bool trial);

    /**
     * Settle an admitted call that ended for a reason that says nothing about
     * the provider. Frees the trial slot without changing the failure count.
     */
    void AbandonCall(bool trial);

    /**
     * @brief Run an operation through the breaker
     * @throws CircuitOpenError without invoking the operation if rejected
     *
     * ProviderError from the operation is counted and rethrown; any other
     * exception is rethrown without being counted.
     */
    template <typename Operation>
    auto Execute(Operation&& operation) -> decltype(operation())
    {
        const BreakerAdmission admission = Admit();
        if (admission == BreakerAdmission::REJECTED) {
            throw CircuitOpenError(providerId_, modelId_, GetRetryAfterMillis());
        }
        const bool trial = admission == BreakerAdmission::ADMITTED_TRIAL;
        try {
            auto result = operation();
            RecordSuccess(trial);
            return result;
        } catch (const ProviderError&) {
            RecordFailure(trial);
            throw;
        } catch (...) {
            AbandonCall(trial);
            throw;
        }
    }

    /** State as of now, with any due OPEN -> HALF_OPEN transition applied */
    BreakerState GetState() const;

    uint32_t GetConsecutiveFailures() const;

    /** Time until an OPEN breaker admits a trial, 0 otherwise */
    int64_t GetRetryAfterMillis() const;

    CircuitBreakerStatus GetStatus() const;

    /** Force the breaker back to CLOSED */
    void Reset();

    void SetConfig(const CircuitBreakerConfig& config);
    CircuitBreakerConfig GetConfig() const;

    const std::string& GetProviderId() const { return providerId_; }
    const std::string& GetModelId() const { return modelId_; }

private:
    /** Apply a transition and report a state change. Requires cs_breaker_. */
    std::optional<BreakerState> ApplyLocked(std::optional<CallOutcome> outcome, int64_t now, bool trial = false);

    void ReportTransition(BreakerState from, BreakerState to, uint32_t failures);

    const std::string providerId_;
    const std::string modelId_;
    const Clock& clock_;
    EventSink* events_;

    mutable CCriticalSection cs_breaker_;
    CircuitBreakerConfig config_;
    BreakerStateData data_;
    uint64_t totalSuccesses_;
    uint64_t totalFailures_;
    uint64_t totalRejections_;
    uint64_t timesOpened_;
};

// ============================================================================
// Circuit Breaker Registry
// ============================================================================

/**
 * @brief Lazily created breakers keyed by (provider, model)
 *
 * Breakers are never removed, so references handed out stay valid for the
 * registry's lifetime.
 */
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry(const CircuitBreakerConfig& defaultConfig, const Clock& clock, EventSink* events);

    /** Breaker for the pair, created on first use */
    std::shared_ptr<CircuitBreaker> GetBreaker(const std::string& providerId, const std::string& modelId);

    /** Existing breaker or null */
    std::shared_ptr<CircuitBreaker> FindBreaker(const std::string& providerId, const std::string& modelId) const;

    /** Override the configuration for every model of a provider */
    void SetProviderConfig(const std::string& providerId, const CircuitBreakerConfig& config);

    std::vector<CircuitBreakerStatus> GetAllStatus() const;

    size_t Size() const;

    void ResetAll();

private:
    CircuitBreakerConfig ConfigFor(const std::string& providerId) const;

    const Clock& clock_;
    EventSink* events_;

    mutable CCriticalSection cs_registry_;
    CircuitBreakerConfig defaultConfig_;
    std::map<std::string, CircuitBreakerConfig> providerConfigs_;
    std::map<std::pair<std::string, std::string>, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace callguard

#endif // CALLGUARD_CIRCUIT_BREAKER_H
