// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_COST_GOVERNOR_H
#define CALLGUARD_COST_GOVERNOR_H

/**
 * @file cost_governor.h
 * @brief Per-tenant spend control and estimate drift monitoring
 *
 * Calls are authorized against an estimated cost before they are made and
 * settled with the real cost afterwards. Each tenant has a ledger per
 * billing period holding both figures:
 *
 * - spentEstimated: settled actual costs plus the estimates of calls still
 *   in flight. Authorization refuses a call that would push it past the
 *   hard cap.
 * - spentActual: settled actual costs only. Clamped at the hard cap; the
 *   part of a settlement beyond the cap is tracked as overrun.
 *
 * Drift between estimated and actual cost is aggregated over a rolling
 * window and raises an edge-triggered alert when it exceeds the threshold.
 */

#include <callguard/callguard_common.h>
#include <callguard/clock.h>
#include <callguard/event_sink.h>
#include <sync.h>

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace callguard {

// ============================================================================
// Constants
// ============================================================================

/** Default hard cap per tenant per period ($100) */
static constexpr CostAmount DEFAULT_HARD_CAP = 100 * COST_UNIT;

/** Soft cap as a percentage of the hard cap */
static constexpr uint32_t DEFAULT_SOFT_CAP_PERCENT = 80;

/** Billing period length (30 days) */
static constexpr int64_t DEFAULT_BUDGET_PERIOD_SECONDS = 30 * 24 * 60 * 60;

/** Relative drift that raises an alert (5%) */
static constexpr double DEFAULT_DRIFT_THRESHOLD = 0.05;

/** Rolling window drift is aggregated over (one hour) */
static constexpr int64_t DEFAULT_DRIFT_WINDOW_MS = 3600 * 1000;

// ============================================================================
// Data Structures
// ============================================================================

struct BudgetPolicy {
    CostAmount hardCap;
    CostAmount softCap;

    BudgetPolicy()
        : hardCap(DEFAULT_HARD_CAP)
        , softCap(DEFAULT_HARD_CAP / 100 * DEFAULT_SOFT_CAP_PERCENT)
    {}

    BudgetPolicy(CostAmount hard, CostAmount soft) : hardCap(hard), softCap(soft) {}

    /** Policy with the soft cap at a percentage of the hard cap */
    static BudgetPolicy FromHardCap(CostAmount hardCap, uint32_t softCapPercent = DEFAULT_SOFT_CAP_PERCENT) {
        return BudgetPolicy(hardCap, hardCap / 100 * softCapPercent + (hardCap % 100) * softCapPercent / 100);
    }
};

struct CostGovernorConfig {
    BudgetPolicy defaultPolicy;
    int64_t periodSeconds;
    double driftThreshold;
    int64_t driftWindowMs;

    CostGovernorConfig()
        : periodSeconds(DEFAULT_BUDGET_PERIOD_SECONDS)
        , driftThreshold(DEFAULT_DRIFT_THRESHOLD)
        , driftWindowMs(DEFAULT_DRIFT_WINDOW_MS)
    {}
};

/**
 * @brief Provisional charge handed out by Authorize()
 *
 * Must be settled exactly once with RecordActual() or Release().
 */
struct BudgetReservation {
    std::string tenantId;
    CostAmount estimatedCost;
    int64_t periodIndex;

    BudgetReservation() : estimatedCost(0), periodIndex(0) {}
};

struct BudgetAuthorization {
    bool allowed;
    std::string reason;
    BudgetReservation reservation;

    BudgetAuthorization() : allowed(false) {}

    static BudgetAuthorization Allowed(const BudgetReservation& reservation) {
        BudgetAuthorization auth;
        auth.allowed = true;
        auth.reservation = reservation;
        return auth;
    }

    static BudgetAuthorization Denied(const std::string& reason) {
        BudgetAuthorization auth;
        auth.allowed = false;
        auth.reason = reason;
        return auth;
    }
};

/**
 * @brief Ledger of one tenant for one billing period
 */
struct BudgetLedger {
    std::string tenantId;
    int64_t periodIndex;
    CostAmount spentEstimated;
    CostAmount spentActual;
    /** Settled cost beyond the hard cap */
    CostAmount overrun;
    uint64_t tokensActual;
    uint64_t callsAuthorized;
    uint64_t callsDenied;
    uint64_t callsSettled;
    bool softCapWarned;

    BudgetLedger()
        : periodIndex(0)
        , spentEstimated(0)
        , spentActual(0)
        , overrun(0)
        , tokensActual(0)
        , callsAuthorized(0)
        , callsDenied(0)
        , callsSettled(0)
        , softCapWarned(false)
    {}
};

struct BudgetStatus {
    BudgetLedger ledger;
    BudgetPolicy policy;
    bool overrideActive;
    /** Spend (estimated exposure) as a percentage of the hard cap */
    double usagePercent;
    CostAmount remaining;
    bool softCapReached;
    bool hardCapReached;
    /** Aggregate drift over the rolling window */
    double drift;
    bool driftAlertActive;

    BudgetStatus()
        : overrideActive(false)
        , usagePercent(0)
        , remaining(0)
        , softCapReached(false)
        , hardCapReached(false)
        , drift(0)
        , driftAlertActive(false)
    {}
};

// ============================================================================
// Cost Governor Class
// ============================================================================

/**
 * @brief Cost governor
 *
 * Thread-safe. Each tenant's ledger has its own lock; authorizations for
 * one tenant are serialized so concurrent calls can never jointly overshoot
 * the hard cap.
 */
class CostGovernor {
public:
    CostGovernor(const Clock& clock, EventSink* events, const CostGovernorConfig& config = CostGovernorConfig());

    /**
     * @brief Reserve the estimated cost of a call
     * @param tenantId Tenant to charge
     * @param estimatedCost Estimate for the call
     * @return Allowed with a reservation, or Denied with a reason
     */
    BudgetAuthorization Authorize(const std::string& tenantId, CostAmount estimatedCost);

    /**
     * @brief Authorize, raising on denial
     * @throws BudgetExceededError if the call is refused
     */
    BudgetReservation AuthorizeOrThrow(const std::string& tenantId, CostAmount estimatedCost);

    /**
     * @brief Settle a reservation with the real cost
     *
     * Replaces the provisional estimate with the actual figure and feeds the
     * drift monitor. A reservation from an earlier period is billed to the
     * current one.
     */
    void RecordActual(const BudgetReservation& reservation, CostAmount actualCost, uint64_t actualTokens);

    /** Settle a reservation for a call that was never billed */
    void Release(const BudgetReservation& reservation);

    // =========================================================================
    // Administration
    // =========================================================================

    void SetBudget(const std::string& tenantId, const BudgetPolicy& policy);

    /** Allow calls past the hard cap until the override is lifted */
    void SetOverride(const std::string& tenantId, bool active);

    /** Zero the tenant's ledger for the current period */
    void ResetPeriod(const std::string& tenantId);

    BudgetStatus GetStatus(const std::string& tenantId);
    std::vector<BudgetStatus> GetAllStatus();

    double GetDrift(const std::string& tenantId);
    bool IsDriftAlertActive(const std::string& tenantId);

    int64_t GetCurrentPeriodIndex() const;

private:
    struct DriftSample {
        int64_t time;
        CostAmount estimated;
        CostAmount actual;
    };

    struct TenantAccount {
        CCriticalSection cs;
        BudgetLedger ledger;
        BudgetPolicy policy;
        bool overrideActive;
        std::deque<DriftSample> driftSamples;
        bool driftAlertActive;

        TenantAccount() : overrideActive(false), driftAlertActive(false) {}
    };

    std::shared_ptr<TenantAccount> GetAccount(const std::string& tenantId);

    /** Start a fresh ledger when the period has moved on. Requires account.cs. */
    void RollPeriodLocked(TenantAccount& account, int64_t periodIndex);

    /** Drop drift samples outside the window. Requires account.cs. */
    void PruneDriftLocked(TenantAccount& account, int64_t now) const;

    static double ComputeDrift(const std::deque<DriftSample>& samples);

    BudgetStatus BuildStatusLocked(TenantAccount& account);

    const Clock& clock_;
    EventSink* events_;
    const CostGovernorConfig config_;

    mutable CCriticalSection cs_accounts_;
    std::map<std::string, std::shared_ptr<TenantAccount>> accounts_;
    std::map<std::string, BudgetPolicy> policies_;
};

} // namespace callguard

#endif // CALLGUARD_COST_GOVERNOR_H
