// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "silo/silo_plan.h"

#include "consensus/validation.h"
#include "logging.h"
#include "silo/silo_view.h"
#include "utilmoneystr.h"

#include <set>

bool CWithdrawalPlan::AddSource(const Address& token, const std::vector<int64_t>& vStems,
                                const std::vector<CAmount>& vAmounts, CAmount nAvailableBeans)
{
    if (!MoneyRange(nAvailableBeans) || !MoneyRange(totalAvailableBeans) ||
        nAvailableBeans > MAX_MONEY - totalAvailableBeans) {
        return false;
    }
    sourceTokens.push_back(token);
    stems.push_back(vStems);
    amounts.push_back(vAmounts);
    availableBeans.push_back(nAvailableBeans);
    totalAvailableBeans += nAvailableBeans;
    return true;
}

int CWithdrawalPlan::GetSourceIndex(const Address& token) const
{
    for (size_t i = 0; i < sourceTokens.size(); ++i) {
        if (sourceTokens[i] == token) return (int)i;
    }
    return -1;
}

bool CWithdrawalPlan::CheckInvariants(CValidationState& state) const
{
    const size_t nSources = sourceTokens.size();
    if (stems.size() != nSources || amounts.size() != nSources || availableBeans.size() != nSources) {
        return state.Invalid(false, SiloError::INVALID_ARGUMENT, "plan-bad-shape",
                             strprintf("sources=%u stems=%u amounts=%u beans=%u", nSources,
                                       stems.size(), amounts.size(), availableBeans.size()));
    }

    std::set<Address> setTokens;
    CAmount nTotal = 0;
    for (size_t i = 0; i < nSources; ++i) {
        if (!setTokens.insert(sourceTokens[i]).second) {
            return state.Invalid(false, SiloError::INVALID_ARGUMENT, "plan-duplicate-source", sourceTokens[i]);
        }
        if (stems[i].size() != amounts[i].size()) {
            return state.Invalid(false, SiloError::INVALID_ARGUMENT, "plan-misaligned",
                                 strprintf("%s: %u stems vs %u amounts", sourceTokens[i],
                                           stems[i].size(), amounts[i].size()));
        }
        std::set<int64_t> setStems;
        CAmount nSourceAmount = 0;
        for (size_t k = 0; k < stems[i].size(); ++k) {
            if (!setStems.insert(stems[i][k]).second) {
                return state.Invalid(false, SiloError::INVALID_ARGUMENT, "plan-duplicate-stem",
                                     strprintf("%s stem %d", sourceTokens[i], stems[i][k]));
            }
            if (!MoneyRange(amounts[i][k]) || amounts[i][k] == 0) {
                return state.Invalid(false, SiloError::INVALID_ARGUMENT, "plan-bad-amount",
                                     strprintf("%s stem %d amount %d", sourceTokens[i], stems[i][k], amounts[i][k]));
            }
            nSourceAmount += amounts[i][k];
            if (!MoneyRange(nSourceAmount)) {
                return state.Invalid(false, SiloError::INVALID_ARGUMENT, "plan-bad-amount",
                                     strprintf("%s amounts exceed %d", sourceTokens[i], MAX_MONEY));
            }
        }
        if (!MoneyRange(availableBeans[i])) {
            return state.Invalid(false, SiloError::INVALID_ARGUMENT, "plan-bad-available",
                                 strprintf("%s available %d", sourceTokens[i], availableBeans[i]));
        }
        // Both terms are within MAX_MONEY so the sum cannot overflow
        nTotal += availableBeans[i];
        if (!MoneyRange(nTotal)) {
            return state.Invalid(false, SiloError::INVALID_ARGUMENT, "plan-bad-total",
                                 strprintf("sum exceeds %d after %s", MAX_MONEY, sourceTokens[i]));
        }
    }

    if (nTotal != totalAvailableBeans) {
        return state.Invalid(false, SiloError::INVALID_ARGUMENT, "plan-bad-total",
                             strprintf("sum=%d total=%d", nTotal, totalAvailableBeans));
    }
    return true;
}

std::string CWithdrawalPlan::ToString() const
{
    std::string str = strprintf("CWithdrawalPlan(sources=%u, total=%s)\n", sourceTokens.size(),
                                FormatMoney(totalAvailableBeans));
    for (size_t i = 0; i < sourceTokens.size(); ++i) {
        str += strprintf("  %s available=%s:", sourceTokens[i],
                         i < availableBeans.size() ? FormatMoney(availableBeans[i]) : std::string("?"));
        if (i < stems.size() && i < amounts.size()) {
            for (size_t k = 0; k < stems[i].size() && k < amounts[i].size(); ++k) {
                str += strprintf(" (%d,%d)", stems[i][k], amounts[i][k]);
            }
        }
        str += "\n";
    }
    return str;
}

// ============================================================================
// Claims
// ============================================================================

CAmount GetAmountAlreadyUsed(const CWithdrawalPlan& plan, const Address& token, int64_t nStem)
{
    CAmount nUsed = 0;
    for (size_t i = 0; i < plan.sourceTokens.size(); ++i) {
        if (plan.sourceTokens[i] != token) continue;
        if (i >= plan.stems.size() || i >= plan.amounts.size()) continue;
        for (size_t k = 0; k < plan.stems[i].size() && k < plan.amounts[i].size(); ++k) {
            if (plan.stems[i][k] != nStem || plan.amounts[i][k] <= 0) continue;
            if (plan.amounts[i][k] >= MAX_MONEY - nUsed) {
                return MAX_MONEY;
            }
            nUsed += plan.amounts[i][k];
        }
    }
    return nUsed;
}

CAmount GetAmountAlreadyUsed(const std::vector<CWithdrawalPlan>& plans, const Address& token, int64_t nStem)
{
    CAmount nUsed = 0;
    for (const CWithdrawalPlan& plan : plans) {
        const CAmount nPlanUsed = GetAmountAlreadyUsed(plan, token, nStem);
        // Saturate: no deposit exceeds MAX_MONEY
        if (nPlanUsed >= MAX_MONEY - nUsed) {
            return MAX_MONEY;
        }
        nUsed += nPlanUsed;
    }
    return nUsed;
}

bool CombineWithdrawalPlans(const CSiloView& view,
                            const Address& account,
                            const std::vector<CWithdrawalPlan>& plans,
                            CWithdrawalPlan& combined,
                            CValidationState& state)
{
    combined.SetNull();

    // 1. Every input must be well formed on its own
    for (size_t p = 0; p < plans.size(); ++p) {
        if (!plans[p].CheckInvariants(state)) {
            LogPrint(BCLog::SILO, "%s: plan %u rejected: %s\n", __func__, p, state.ToString());
            return false;
        }
    }

    // 2. Merge in first-appearance order
    for (const CWithdrawalPlan& plan : plans) {
        for (size_t i = 0; i < plan.sourceTokens.size(); ++i) {
            int idx = combined.GetSourceIndex(plan.sourceTokens[i]);
            if (idx < 0) {
                combined.AddSource(plan.sourceTokens[i], std::vector<int64_t>(), std::vector<CAmount>(), 0);
                idx = (int)combined.sourceTokens.size() - 1;
            }
            if (plan.availableBeans[i] > MAX_MONEY - combined.totalAvailableBeans) {
                combined.SetNull();
                return state.Invalid(error("%s: combined value exceeds %d", __func__, MAX_MONEY),
                                     SiloError::INVALID_ARGUMENT, "plan-bad-total");
            }

            std::vector<int64_t>& vStems = combined.stems[idx];
            std::vector<CAmount>& vAmounts = combined.amounts[idx];
            for (size_t k = 0; k < plan.stems[i].size(); ++k) {
                size_t pos = 0;
                while (pos < vStems.size() && vStems[pos] != plan.stems[i][k]) ++pos;
                if (pos == vStems.size()) {
                    vStems.push_back(plan.stems[i][k]);
                    vAmounts.push_back(0);
                }
                // More than MAX_MONEY is more than any deposit holds
                if (plan.amounts[i][k] > MAX_MONEY - vAmounts[pos]) {
                    const std::string strDebug = strprintf("%s stem %d claimed beyond %d", plan.sourceTokens[i],
                                                           plan.stems[i][k], MAX_MONEY);
                    combined.SetNull();
                    return state.Invalid(error("%s: over-allocation %s", __func__, strDebug),
                                         SiloError::LEDGER_INCONSISTENCY, "plan-over-allocated", strDebug);
                }
                vAmounts[pos] += plan.amounts[i][k];
            }

            combined.availableBeans[idx] += plan.availableBeans[i];
            combined.totalAvailableBeans += plan.availableBeans[i];
        }
    }

    // 3. Combined claims must fit the deposits
    for (size_t i = 0; i < combined.sourceTokens.size(); ++i) {
        for (size_t k = 0; k < combined.stems[i].size(); ++k) {
            const CAmount deposited = view.GetDepositAmount(account, combined.sourceTokens[i], combined.stems[i][k]);
            if (combined.amounts[i][k] > deposited) {
                const std::string strDebug = strprintf("%s stem %d claimed %d of %d", combined.sourceTokens[i],
                                                       combined.stems[i][k], combined.amounts[i][k], deposited);
                combined.SetNull();
                return state.Invalid(error("%s: over-allocation %s", __func__, strDebug),
                                     SiloError::LEDGER_INCONSISTENCY, "plan-over-allocated", strDebug);
            }
        }
    }

    LogPrint(BCLog::SILO, "%s: merged %u plans into %u sources, %s beans\n",
             __func__, plans.size(), combined.sourceTokens.size(), FormatMoney(combined.totalAvailableBeans));
    return true;
}

bool CheckPlanCoverage(const CWithdrawalPlan& plan, CAmount nRequired, CValidationState& state)
{
    if (plan.totalAvailableBeans < nRequired) {
        return state.Invalid(false, SiloError::INSUFFICIENT_FUNDS, "plan-insufficient-funds",
                             strprintf("available %s, required %s", FormatMoney(plan.totalAvailableBeans),
                                       FormatMoney(nRequired)));
    }
    return true;
}
