// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/cost_governor.h>
#include <callguard/errors.h>
#include <logging.h>

#include <cmath>
#include <utility>

namespace callguard {

namespace {

typedef std::vector<std::pair<EventType, std::map<std::string, std::string>>> PendingEvents;

void EmitAll(EventSink* events, const PendingEvents& pending)
{
    if (!events) return;
    for (const auto& event : pending) {
        events->Emit(event.first, event.second);
    }
}

} // namespace

CostGovernor::CostGovernor(const Clock& clock, EventSink* events, const CostGovernorConfig& config)
    : clock_(clock)
    , events_(events)
    , config_(config)
{
}

int64_t CostGovernor::GetCurrentPeriodIndex() const
{
    const int64_t period = config_.periodSeconds > 0 ? config_.periodSeconds : DEFAULT_BUDGET_PERIOD_SECONDS;
    return clock_.WallTimeSeconds() / period;
}

std::shared_ptr<CostGovernor::TenantAccount> CostGovernor::GetAccount(const std::string& tenantId)
{
    LOCK(cs_accounts_);
    auto it = accounts_.find(tenantId);
    if (it != accounts_.end()) {
        return it->second;
    }

    auto account = std::make_shared<TenantAccount>();
    account->ledger.tenantId = tenantId;
    account->ledger.periodIndex = GetCurrentPeriodIndex();
    auto policy = policies_.find(tenantId);
    account->policy = policy != policies_.end() ? policy->second : config_.defaultPolicy;
    accounts_[tenantId] = account;
    return account;
}

void CostGovernor::RollPeriodLocked(TenantAccount& account, int64_t periodIndex)
{
    if (account.ledger.periodIndex == periodIndex) {
        return;
    }
    LogPrint(CGLog::BUDGET, "Tenant %s: budget period %d closed (actual %s, overrun %s), starting period %d\n",
             account.ledger.tenantId, account.ledger.periodIndex, FormatCost(account.ledger.spentActual),
             FormatCost(account.ledger.overrun), periodIndex);
    const std::string tenantId = account.ledger.tenantId;
    account.ledger = BudgetLedger();
    account.ledger.tenantId = tenantId;
    account.ledger.periodIndex = periodIndex;
}

void CostGovernor::PruneDriftLocked(TenantAccount& account, int64_t now) const
{
    while (!account.driftSamples.empty() && now - account.driftSamples.front().time > config_.driftWindowMs) {
        account.driftSamples.pop_front();
    }
}

double CostGovernor::ComputeDrift(const std::deque<DriftSample>& samples)
{
    CostAmount estimated = 0;
    CostAmount actual = 0;
    for (const DriftSample& sample : samples) {
        estimated += sample.estimated;
        actual += sample.actual;
    }
    if (estimated <= 0) {
        return 0.0;
    }
    return std::fabs(static_cast<double>(actual - estimated)) / static_cast<double>(estimated);
}

// ============================================================================
// Authorization and Settlement
// ============================================================================

BudgetAuthorization CostGovernor::Authorize(const std::string& tenantId, CostAmount estimatedCost)
{
    if (!CostRange(estimatedCost)) {
        throw InvalidRequestError(strprintf("invalid cost estimate %d", estimatedCost));
    }

    const int64_t periodIndex = GetCurrentPeriodIndex();
    std::shared_ptr<TenantAccount> account = GetAccount(tenantId);
    PendingEvents pending;
    BudgetAuthorization result;

    {
        LOCK(account->cs);
        RollPeriodLocked(*account, periodIndex);
        BudgetLedger& ledger = account->ledger;
        const BudgetPolicy& policy = account->policy;

        std::string denial;
        if (!account->overrideActive) {
            if (ledger.spentActual >= policy.hardCap) {
                denial = "hard cap reached";
            } else if (ledger.spentEstimated + estimatedCost > policy.hardCap) {
                denial = "estimated cost exceeds remaining budget";
            }
        }

        if (!denial.empty()) {
            ledger.callsDenied++;
            result = BudgetAuthorization::Denied(denial);
            pending.push_back({EventType::BUDGET_EXCEEDED, {
                {"tenant", tenantId},
                {"reason", denial},
                {"spent", FormatCost(ledger.spentEstimated)},
                {"estimate", FormatCost(estimatedCost)},
                {"hard_cap", FormatCost(policy.hardCap)}}});
        } else {
            ledger.spentEstimated += estimatedCost;
            ledger.callsAuthorized++;

            BudgetReservation reservation;
            reservation.tenantId = tenantId;
            reservation.estimatedCost = estimatedCost;
            reservation.periodIndex = ledger.periodIndex;
            result = BudgetAuthorization::Allowed(reservation);

            if (!ledger.softCapWarned && ledger.spentEstimated >= policy.softCap) {
                ledger.softCapWarned = true;
                pending.push_back({EventType::BUDGET_SOFT_CAP, {
                    {"tenant", tenantId},
                    {"spent", FormatCost(ledger.spentEstimated)},
                    {"soft_cap", FormatCost(policy.softCap)}}});
            }
        }
    }

    if (result.allowed) {
        LogPrint(CGLog::BUDGET, "Tenant %s: reserved %s\n", tenantId, FormatCost(estimatedCost));
    } else {
        LogPrint(CGLog::BUDGET, "Tenant %s: refused %s (%s)\n", tenantId, FormatCost(estimatedCost), result.reason);
    }

    EmitAll(events_, pending);
    return result;
}

BudgetReservation CostGovernor::AuthorizeOrThrow(const std::string& tenantId, CostAmount estimatedCost)
{
    BudgetAuthorization auth = Authorize(tenantId, estimatedCost);
    if (!auth.allowed) {
        throw BudgetExceededError(tenantId, auth.reason);
    }
    return auth.reservation;
}

void CostGovernor::RecordActual(const BudgetReservation& reservation, CostAmount actualCost, uint64_t actualTokens)
{
    if (reservation.tenantId.empty()) {
        throw InvalidRequestError("settling an empty reservation");
    }
    if (!CostRange(actualCost)) {
        throw InvalidRequestError(strprintf("invalid actual cost %d", actualCost));
    }

    const int64_t periodIndex = GetCurrentPeriodIndex();
    const int64_t now = clock_.NowMillis();
    std::shared_ptr<TenantAccount> account = GetAccount(reservation.tenantId);
    PendingEvents pending;

    {
        LOCK(account->cs);
        RollPeriodLocked(*account, periodIndex);
        BudgetLedger& ledger = account->ledger;
        const BudgetPolicy& policy = account->policy;

        if (reservation.periodIndex == ledger.periodIndex) {
            ledger.spentEstimated -= reservation.estimatedCost;
            if (ledger.spentEstimated < 0) ledger.spentEstimated = 0;
        }

        CostAmount billed = actualCost;
        if (!account->overrideActive && ledger.spentActual + actualCost > policy.hardCap) {
            const CostAmount headroom = policy.hardCap > ledger.spentActual ? policy.hardCap - ledger.spentActual : 0;
            const CostAmount excess = actualCost - headroom;
            billed = headroom;
            ledger.overrun += excess;
            pending.push_back({EventType::BUDGET_EXCEEDED, {
                {"tenant", reservation.tenantId},
                {"reason", "actual cost past hard cap"},
                {"overrun", FormatCost(ledger.overrun)},
                {"hard_cap", FormatCost(policy.hardCap)}}});
        }

        ledger.spentActual += billed;
        ledger.spentEstimated += billed;
        ledger.tokensActual += actualTokens;
        ledger.callsSettled++;

        if (!ledger.softCapWarned && ledger.spentEstimated >= policy.softCap) {
            ledger.softCapWarned = true;
            pending.push_back({EventType::BUDGET_SOFT_CAP, {
                {"tenant", reservation.tenantId},
                {"spent", FormatCost(ledger.spentEstimated)},
                {"soft_cap", FormatCost(policy.softCap)}}});
        }

        if (reservation.estimatedCost > 0) {
            account->driftSamples.push_back(DriftSample{now, reservation.estimatedCost, actualCost});
        }
        PruneDriftLocked(*account, now);
        const double drift = ComputeDrift(account->driftSamples);

        if (drift > config_.driftThreshold && !account->driftAlertActive) {
            account->driftAlertActive = true;
            pending.push_back({EventType::DRIFT_ALERT, {
                {"tenant", reservation.tenantId},
                {"drift_pct", strprintf("%.2f", drift * 100.0)},
                {"threshold_pct", strprintf("%.2f", config_.driftThreshold * 100.0)}}});
        } else if (drift <= config_.driftThreshold && account->driftAlertActive) {
            account->driftAlertActive = false;
            LogPrint(CGLog::BUDGET, "Tenant %s: cost drift back within threshold (%.2f%%)\n",
                     reservation.tenantId, drift * 100.0);
        }
    }

    LogPrint(CGLog::BUDGET, "Tenant %s: settled estimate %s with actual %s (%u tokens)\n", reservation.tenantId,
             FormatCost(reservation.estimatedCost), FormatCost(actualCost), actualTokens);

    EmitAll(events_, pending);
}

void CostGovernor::Release(const BudgetReservation& reservation)
{
    if (reservation.tenantId.empty()) {
        throw InvalidRequestError("releasing an empty reservation");
    }

    const int64_t periodIndex = GetCurrentPeriodIndex();
    std::shared_ptr<TenantAccount> account = GetAccount(reservation.tenantId);

    LOCK(account->cs);
    RollPeriodLocked(*account, periodIndex);
    BudgetLedger& ledger = account->ledger;
    if (reservation.periodIndex == ledger.periodIndex) {
        ledger.spentEstimated -= reservation.estimatedCost;
        if (ledger.spentEstimated < 0) ledger.spentEstimated = 0;
    }
    LogPrint(CGLog::BUDGET, "Tenant %s: released reservation of %s\n", reservation.tenantId,
             FormatCost(reservation.estimatedCost));
}

// ============================================================================
// Administration
// ============================================================================

void CostGovernor::SetBudget(const std::string& tenantId, const BudgetPolicy& policy)
{
    {
        LOCK(cs_accounts_);
        policies_[tenantId] = policy;
    }
    std::shared_ptr<TenantAccount> account = GetAccount(tenantId);
    LOCK(account->cs);
    account->policy = policy;
    LogPrint(CGLog::BUDGET, "Tenant %s: hard cap %s, soft cap %s\n", tenantId, FormatCost(policy.hardCap),
             FormatCost(policy.softCap));
}

void CostGovernor::SetOverride(const std::string& tenantId, bool active)
{
    std::shared_ptr<TenantAccount> account = GetAccount(tenantId);
    LOCK(account->cs);
    account->overrideActive = active;
    LogPrintf("Tenant %s: budget override %s\n", tenantId, active ? "enabled" : "lifted");
}

void CostGovernor::ResetPeriod(const std::string& tenantId)
{
    std::shared_ptr<TenantAccount> account = GetAccount(tenantId);
    LOCK(account->cs);
    const int64_t periodIndex = GetCurrentPeriodIndex();
    account->ledger = BudgetLedger();
    account->ledger.tenantId = tenantId;
    account->ledger.periodIndex = periodIndex;
    LogPrintf("Tenant %s: budget ledger reset\n", tenantId);
}

BudgetStatus CostGovernor::BuildStatusLocked(TenantAccount& account)
{
    RollPeriodLocked(account, GetCurrentPeriodIndex());
    PruneDriftLocked(account, clock_.NowMillis());

    BudgetStatus status;
    status.ledger = account.ledger;
    status.policy = account.policy;
    status.overrideActive = account.overrideActive;

    const BudgetLedger& ledger = account.ledger;
    const BudgetPolicy& policy = account.policy;
    if (policy.hardCap > 0) {
        status.usagePercent = static_cast<double>(ledger.spentEstimated) * 100.0 / static_cast<double>(policy.hardCap);
    } else {
        status.usagePercent = 100.0;
    }
    status.remaining = policy.hardCap > ledger.spentEstimated ? policy.hardCap - ledger.spentEstimated : 0;
    status.softCapReached = ledger.spentEstimated >= policy.softCap;
    status.hardCapReached = ledger.spentActual >= policy.hardCap;
    status.drift = ComputeDrift(account.driftSamples);
    status.driftAlertActive = account.driftAlertActive;
    return status;
}

BudgetStatus CostGovernor::GetStatus(const std::string& tenantId)
{
    std::shared_ptr<TenantAccount> account = GetAccount(tenantId);
    LOCK(account->cs);
    return BuildStatusLocked(*account);
}

std::vector<BudgetStatus> CostGovernor::GetAllStatus()
{
    std::vector<std::shared_ptr<TenantAccount>> accounts;
    {
        LOCK(cs_accounts_);
        for (const auto& entry : accounts_) {
            accounts.push_back(entry.second);
        }
    }
    std::vector<BudgetStatus> result;
    for (const auto& account : accounts) {
        LOCK(account->cs);
        result.push_back(BuildStatusLocked(*account));
    }
    return result;
}

double CostGovernor::GetDrift(const std::string& tenantId)
{
    std::shared_ptr<TenantAccount> account = GetAccount(tenantId);
    LOCK(account->cs);
    PruneDriftLocked(*account, clock_.NowMillis());
    return ComputeDrift(account->driftSamples);
}

bool CostGovernor::IsDriftAlertActive(const std::string& tenantId)
{
    std::shared_ptr<TenantAccount> account = GetAccount(tenantId);
    LOCK(account->cs);
    return account->driftAlertActive;
}

} // namespace callguard
