// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "silo/silo_selector.h"

#include "consensus/validation.h"
#include "logging.h"
#include "silo/silo_filter.h"
#include "silo/silo_plan.h"
#include "silo/silo_view.h"
#include "utilmoneystr.h"

#include <algorithm>

std::string CStemSelection::ToString() const
{
    std::string str = strprintf("CStemSelection(total=%d:", totalSelected);
    for (size_t i = 0; i < stems.size(); ++i) {
        str += strprintf(" (%d,%d)", stems[i], amounts[i]);
    }
    return str + ")";
}

/** Take from deposit, return the amount taken */
static CAmount TakeFromDeposit(const CDeposit& deposit, CAmount nNeed,
                               const CWithdrawalPlan* pExcludingPlan, CStemSelection& selection)
{
    CAmount nRemaining = deposit.amount;
    if (pExcludingPlan) {
        nRemaining -= GetAmountAlreadyUsed(*pExcludingPlan, deposit.token, deposit.nStem);
    }
    if (nRemaining <= 0) {
        return 0;
    }

    const CAmount nTake = std::min(nRemaining, nNeed);
    selection.Add(deposit.nStem, nTake);
    return nTake;
}

bool SelectDepositStems(const CSiloView& view,
                        const Address& account,
                        const Address& token,
                        CAmount nTarget,
                        const FilterParams& filter,
                        const CWithdrawalPlan* pExcludingPlan,
                        CStemSelection& selection,
                        CValidationState& state)
{
    selection.SetNull();

    if (nTarget <= 0) {
        return state.Invalid(error("%s: non-positive target %d for %s", __func__, nTarget, token),
                             SiloError::INVALID_ARGUMENT, "silo-select-bad-target");
    }
    if (!CheckFilterParams(filter, state)) {
        return false;
    }

    const std::vector<CDeposit> deposits = view.GetDeposits(account, token);
    if (deposits.empty()) {
        LogPrint(BCLog::SILO, "%s: %s has no %s deposits\n", __func__, account, token);
        return true;
    }

    const CStemRange range = GetStemRange(view, token, filter);

    // Primary pass, newest first
    std::vector<const CDeposit*> vDeferred;
    CAmount nNeed = nTarget;
    for (std::vector<CDeposit>::const_reverse_iterator it = deposits.rbegin(); it != deposits.rend() && nNeed > 0; ++it) {
        const CDeposit& deposit = *it;

        if (deposit.nStem < range.nMinStem) {
            continue;
        }
        if (filter.excludeGerminatingDeposits && deposit.nStem >= range.nGerminatingStem) {
            continue;
        }
        if (deposit.nStem > range.nMaxStem) {
            if (filter.lowStalkDeposits == LowStalkDeposits::OMIT) {
                continue;
            }
            if (filter.lowStalkDeposits == LowStalkDeposits::USE_LAST) {
                vDeferred.push_back(&deposit);
                continue;
            }
        }

        nNeed -= TakeFromDeposit(deposit, nNeed, pExcludingPlan, selection);
    }

    // Low stalk pass, in the order the deposits were deferred
    for (size_t i = 0; i < vDeferred.size() && nNeed > 0; ++i) {
        nNeed -= TakeFromDeposit(*vDeferred[i], nNeed, pExcludingPlan, selection);
    }

    LogPrint(BCLog::SILO, "%s: %s %s target=%s selected=%s from %u of %u deposits\n",
             __func__, account, token, FormatMoney(nTarget), FormatMoney(selection.totalSelected),
             selection.stems.size(), deposits.size());
    return true;
}
