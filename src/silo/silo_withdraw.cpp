// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "silo/silo_withdraw.h"

#include "chainparams.h"
#include "consensus/validation.h"
#include "logging.h"
#include "silo/silo_filter.h"
#include "silo/silo_plan.h"
#include "silo/silo_sources.h"
#include "silo/silo_view.h"
#include "utilmoneystr.h"
#include "well/well.h"

static CAmount SumAmounts(const std::vector<CAmount>& amounts)
{
    CAmount nSum = 0;
    for (const CAmount amount : amounts) {
        nSum += amount;
    }
    return nSum;
}

/** Convert LP deposits of one well into beans at destination */
static bool ExecuteWellSource(CSiloView& view,
                              const Address& account,
                              const Address& wellToken,
                              const Address& bean,
                              const std::vector<int64_t>& stems,
                              const std::vector<CAmount>& amounts,
                              CAmount nMinBeans,
                              int64_t nSlippageRatio,
                              const Address& destination,
                              TransferMode mode,
                              CAmount& nBeansOut,
                              CValidationState& state)
{
    nBeansOut = 0;

    CWellState well;
    if (!view.GetWellState(wellToken, well)) {
        return state.Invalid(error("%s: %s is neither bean nor a well", __func__, wellToken),
                             SiloError::INVALID_ARGUMENT, "silo-source-not-well");
    }
    const int beanIndex = well.GetTokenIndex(bean);
    if (beanIndex < 0) {
        return state.Invalid(error("%s: well %s does not pair bean", __func__, wellToken),
                             SiloError::INVALID_ARGUMENT, "silo-source-not-bean-well");
    }

    // 1. Price manipulation guard
    if (!IsValidSlippage(well, (size_t)beanIndex, nSlippageRatio)) {
        return state.Invalid(error("%s: %s price deviates beyond ratio %d", __func__, wellToken, nSlippageRatio),
                             SiloError::PRICE_MANIPULATION, "silo-price-manipulation", well.ToString());
    }

    // 2. LP to the account's internal balance
    if (!WithdrawDeposits(view, account, wellToken, stems, amounts, account, TransferMode::INTERNAL, state)) {
        return false;
    }

    // 3. LP to beans, never below the planned value
    const CAmount nLpAmount = SumAmounts(amounts);
    if (!RemoveLiquidityOneToken(view, wellToken, nLpAmount, bean, nMinBeans, account, account,
                                 TransferMode::INTERNAL, nBeansOut, state)) {
        return false;
    }

    // 4. Beans to destination
    return TransferToken(view, bean, nBeansOut, account, TransferMode::INTERNAL, destination, mode, state);
}

bool ExecuteWithdrawalPlan(CSiloView& view,
                           const Address& account,
                           const CWithdrawalPlan& plan,
                           int64_t nSlippageRatio,
                           const Address& destination,
                           TransferMode mode,
                           CAmount& nTotalWithdrawn,
                           CValidationState& state)
{
    nTotalWithdrawn = 0;

    if (!plan.CheckInvariants(state)) {
        LogPrint(BCLog::SILO, "%s: malformed plan: %s\n", __func__, state.ToString());
        return false;
    }

    if (nSlippageRatio < 0) {
        nSlippageRatio = Params().GetSilo().nDefaultSlippageRatio;
    }

    CSiloViewCache cache(&view);
    const Address bean = cache.GetBeanToken();

    CAmount nTotal = 0;
    for (size_t i = 0; i < plan.sourceTokens.size(); ++i) {
        const Address& token = plan.sourceTokens[i];

        if (token == bean) {
            if (SumAmounts(plan.amounts[i]) != plan.availableBeans[i]) {
                return state.Invalid(error("%s: bean source lists %d but claims %d", __func__,
                                           SumAmounts(plan.amounts[i]), plan.availableBeans[i]),
                                     SiloError::INVALID_ARGUMENT, "plan-bean-mismatch");
            }
            if (!WithdrawDeposits(cache, account, bean, plan.stems[i], plan.amounts[i], destination, mode, state)) {
                return false;
            }
            nTotal += plan.availableBeans[i];
            continue;
        }

        CAmount nBeansOut = 0;
        if (!ExecuteWellSource(cache, account, token, bean, plan.stems[i], plan.amounts[i], plan.availableBeans[i],
                               nSlippageRatio, destination, mode, nBeansOut, state)) {
            LogPrint(BCLog::SILO, "%s: source %s failed, nothing applied: %s\n", __func__, token, state.ToString());
            return false;
        }
        nTotal += nBeansOut;
    }

    if (!cache.Flush()) {
        return state.Error("silo-flush-failed");
    }

    nTotalWithdrawn = nTotal;
    LogPrint(BCLog::SILO, "%s: %s delivered %s beans to %s from %u sources\n",
             __func__, account, FormatMoney(nTotalWithdrawn), destination, plan.sourceTokens.size());
    return true;
}

bool WithdrawBeansFromSources(CSiloView& view,
                              const Address& account,
                              const CSourceSelection& sources,
                              CAmount nAmount,
                              const FilterParams& filter,
                              int64_t nSlippageRatio,
                              const Address& destination,
                              TransferMode mode,
                              const CWithdrawalPlan* pExcludingPlan,
                              CWithdrawalPlan& plan,
                              CAmount& nTotalWithdrawn,
                              CValidationState& state)
{
    nTotalWithdrawn = 0;

    if (!BuildWithdrawalPlan(view, account, sources, nAmount, filter, pExcludingPlan, plan, state)) {
        return false;
    }
    if (!CheckPlanCoverage(plan, nAmount, state)) {
        LogPrint(BCLog::SILO, "%s: %s\n", __func__, state.ToString());
        return false;
    }
    return ExecuteWithdrawalPlan(view, account, plan, nSlippageRatio, destination, mode, nTotalWithdrawn, state);
}
