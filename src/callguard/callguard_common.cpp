// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/callguard_common.h>
#include <logging.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <cctype>

namespace callguard {

std::string BreakerStateToString(BreakerState state)
{
    switch (state) {
        case BreakerState::CLOSED:    return "CLOSED";
        case BreakerState::OPEN:      return "OPEN";
        case BreakerState::HALF_OPEN: return "HALF_OPEN";
        default:                      return "UNKNOWN";
    }
}

std::string ResponseSourceToString(ResponseSource source)
{
    switch (source) {
        case ResponseSource::CACHE:    return "cache";
        case ResponseSource::PROVIDER: return "provider";
        case ResponseSource::FALLBACK: return "fallback";
        default:                       return "unknown";
    }
}

std::string DegradeReasonToString(DegradeReason reason)
{
    switch (reason) {
        case DegradeReason::NONE:                    return "none";
        case DegradeReason::RATE_LIMITED:            return "rate_limited";
        case DegradeReason::BUDGET_EXCEEDED:         return "budget_exceeded";
        case DegradeReason::ALL_PROVIDERS_EXHAUSTED: return "all_providers_exhausted";
        case DegradeReason::CANCELLED:               return "cancelled";
        default:                                     return "unknown";
    }
}

std::string QualityTierToString(QualityTier tier)
{
    switch (tier) {
        case QualityTier::ECONOMY:  return "economy";
        case QualityTier::STANDARD: return "standard";
        case QualityTier::PREMIUM:  return "premium";
        default:                    return "unknown";
    }
}

std::string DegradeReasonMessage(DegradeReason reason)
{
    switch (reason) {
        case DegradeReason::NONE:
            return "";
        case DegradeReason::RATE_LIMITED:
            return "Request limit reached for this feature. Showing general guidance until the limit resets.";
        case DegradeReason::BUDGET_EXCEEDED:
            return "The AI usage budget for your organisation has been reached. Showing general guidance.";
        case DegradeReason::ALL_PROVIDERS_EXHAUSTED:
            return "AI analysis is temporarily unavailable. Showing general guidance.";
        case DegradeReason::CANCELLED:
            return "The request was cancelled before the analysis completed.";
        default:
            return "The AI service is degraded.";
    }
}

bool ParseQualityTier(const std::string& str, QualityTier& tier)
{
    const std::string lower = boost::algorithm::to_lower_copy(str);
    if (lower == "economy") {
        tier = QualityTier::ECONOMY;
    } else if (lower == "standard") {
        tier = QualityTier::STANDARD;
    } else if (lower == "premium") {
        tier = QualityTier::PREMIUM;
    } else {
        return false;
    }
    return true;
}

std::string FormatCost(CostAmount amount)
{
    int64_t n_abs = (amount > 0 ? amount : -amount);
    int64_t quotient = n_abs / COST_UNIT;
    int64_t remainder = n_abs % COST_UNIT;
    return strprintf("%s%d.%06d", amount < 0 ? "-" : "", quotient, remainder);
}

bool ParseCost(const std::string& str, CostAmount& amount)
{
    if (str.empty()) {
        return false;
    }

    std::string whole;
    std::string fraction;
    bool seenPoint = false;
    for (char c : str) {
        if (c == '.') {
            if (seenPoint) return false;
            seenPoint = true;
            continue;
        }
        if (!isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        if (seenPoint) {
            fraction += c;
        } else {
            whole += c;
        }
    }

    if (whole.empty() && fraction.empty()) return false;
    if (fraction.size() > 6) return false;
    if (whole.size() > 10) return false;

    while (fraction.size() < 6) fraction += '0';

    CostAmount value = 0;
    for (char c : whole) {
        value = value * 10 + (c - '0');
    }
    value *= COST_UNIT;
    CostAmount frac = 0;
    for (char c : fraction) {
        frac = frac * 10 + (c - '0');
    }
    value += frac;

    if (!CostRange(value)) return false;
    amount = value;
    return true;
}

} // namespace callguard
