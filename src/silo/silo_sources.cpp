// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "silo/silo_sources.h"

#include "chainparams.h"
#include "consensus/validation.h"
#include "logging.h"
#include "silo/silo_filter.h"
#include "silo/silo_plan.h"
#include "silo/silo_selector.h"
#include "silo/silo_view.h"
#include "utilmoneystr.h"
#include "well/well.h"
#include "well/well_function.h"

#include <algorithm>
#include <set>
#include <utility>

std::string CSourceSelection::ToString() const
{
    switch (strategy) {
    case ASCENDING_PRICE: return "CSourceSelection(ascending-price)";
    case ASCENDING_SEEDS: return "CSourceSelection(ascending-seeds)";
    case EXPLICIT: break;
    }
    std::string str = "CSourceSelection(explicit:";
    for (const uint8_t idx : vIndices) {
        str += strprintf(" %u", (unsigned int)idx);
    }
    return str + ")";
}

// ============================================================================
// Strategies
// ============================================================================

bool GetTokenPrice(const CSiloView& view, const Address& token, CAmount& price)
{
    price = 0;
    const Address bean = view.GetBeanToken();
    if (token == bean) {
        price = Params().GetSilo().nPegPrice;
        return true;
    }

    CWellState well;
    if (!view.GetWellState(token, well)) {
        return false;
    }
    const int beanIndex = well.GetTokenIndex(bean);
    if (beanIndex < 0) {
        return false;
    }
    return GetBeanPrice(well, (size_t)beanIndex, well.reserves, price);
}

/** Stable ascending sort of the whitelist by key; ties keep whitelist order */
static std::vector<Address> SortWhitelist(std::vector<std::pair<Address, CAmount>>& keyed)
{
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const std::pair<Address, CAmount>& a, const std::pair<Address, CAmount>& b) {
                         return a.second < b.second;
                     });
    std::vector<Address> tokens;
    tokens.reserve(keyed.size());
    for (const auto& entry : keyed) {
        tokens.push_back(entry.first);
    }
    return tokens;
}

bool GetTokensAscendingPrice(const CSiloView& view, bool fExcludeBean, std::vector<Address>& tokens, CValidationState& state)
{
    tokens.clear();
    const Address bean = view.GetBeanToken();

    std::vector<std::pair<Address, CAmount>> keyed;
    for (const Address& token : view.GetWhitelistedTokens()) {
        if (fExcludeBean && token == bean) continue;
        CAmount price = 0;
        if (!GetTokenPrice(view, token, price)) {
            return state.Invalid(error("%s: no price for whitelisted token %s", __func__, token),
                                 SiloError::INVALID_ARGUMENT, "silo-source-no-price");
        }
        keyed.emplace_back(token, price);
    }

    tokens = SortWhitelist(keyed);
    return true;
}

std::vector<Address> GetTokensAscendingSeeds(const CSiloView& view, bool fExcludeBean)
{
    const Address bean = view.GetBeanToken();

    std::vector<std::pair<Address, CAmount>> keyed;
    for (const Address& token : view.GetWhitelistedTokens()) {
        if (fExcludeBean && token == bean) continue;
        keyed.emplace_back(token, view.GetSeeds(token));
    }
    return SortWhitelist(keyed);
}

bool ResolveSourceTokens(const CSiloView& view,
                         const CSourceSelection& sources,
                         const FilterParams& filter,
                         std::vector<Address>& tokens,
                         CValidationState& state)
{
    tokens.clear();

    switch (sources.GetStrategy()) {
    case CSourceSelection::ASCENDING_PRICE:
        return GetTokensAscendingPrice(view, filter.excludeBean, tokens, state);
    case CSourceSelection::ASCENDING_SEEDS:
        tokens = GetTokensAscendingSeeds(view, filter.excludeBean);
        return true;
    case CSourceSelection::EXPLICIT:
        break;
    }

    const std::vector<uint8_t>& vIndices = sources.GetIndices();
    if (vIndices.empty()) {
        return state.Invalid(error("%s: empty source list", __func__),
                             SiloError::INVALID_ARGUMENT, "silo-source-empty");
    }
    const size_t nMaxSources = Params().GetSilo().nMaxSourceTokens;
    if (vIndices.size() > nMaxSources) {
        return state.Invalid(error("%s: %u sources, maximum %u", __func__, vIndices.size(), nMaxSources),
                             SiloError::INVALID_ARGUMENT, "silo-source-too-many");
    }

    const std::vector<Address> whitelist = view.GetWhitelistedTokens();
    std::set<Address> setSeen;
    for (const uint8_t idx : vIndices) {
        if (idx >= whitelist.size()) {
            return state.Invalid(error("%s: source index %u outside whitelist of %u", __func__,
                                       (unsigned int)idx, whitelist.size()),
                                 SiloError::INVALID_ARGUMENT, "silo-source-bad-index");
        }
        if (setSeen.insert(whitelist[idx]).second) {
            tokens.push_back(whitelist[idx]);
        }
    }
    return true;
}

// ============================================================================
// Plan building
// ============================================================================

/**
 * Move well to the state it reaches once the LP that plan claims from it is
 * removed for beans. Plans composed on top of plan are priced from there, so
 * the sum of both availableBeans stays a valid minimum output when plan
 * executes first or when both are combined.
 */
static bool ApplyPriorRemoval(const CWithdrawalPlan& plan, size_t beanIndex, CWellState& well)
{
    const int idx = plan.GetSourceIndex(well.well);
    if (idx < 0 || (size_t)idx >= plan.amounts.size()) {
        return true;
    }

    CAmount nPriorLp = 0;
    for (const CAmount amount : plan.amounts[idx]) {
        nPriorLp += amount;
    }
    if (nPriorLp == 0) {
        return true;
    }

    CAmount nPriorOut = 0;
    if (!GetRemoveLiquidityOneTokenOut(well, beanIndex, nPriorLp, nPriorOut)) {
        LogPrint(BCLog::SILO, "%s: %s cannot absorb %d LP of the prior plan, skipped\n", __func__, well.well, nPriorLp);
        return false;
    }
    well.reserves[beanIndex] -= nPriorOut;
    well.nTotalSupply -= nPriorLp;

    LogPrint(BCLog::SILO, "%s: %s priced after prior removal of %d LP for %s beans\n",
             __func__, well.well, nPriorLp, FormatMoney(nPriorOut));
    return true;
}

/**
 * Select LP deposits of a well worth nNeed beans and value them.
 * Leaves selection empty when the well cannot contribute.
 */
static bool SelectWellSource(const CSiloView& view,
                             const Address& account,
                             const Address& wellToken,
                             const Address& bean,
                             CAmount nNeed,
                             const FilterParams& filter,
                             const CWithdrawalPlan* pExcludingPlan,
                             CStemSelection& selection,
                             CAmount& nValue,
                             CValidationState& state)
{
    selection.SetNull();
    nValue = 0;

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
    if (well.reserves.size() != well_function::N_TOKENS) {
        LogPrint(BCLog::SILO, "%s: %s has %u reserves, skipped\n", __func__, wellToken, well.reserves.size());
        return true;
    }

    // 1. LP claimed by the prior plan leaves the well first
    if (pExcludingPlan && !ApplyPriorRemoval(*pExcludingPlan, (size_t)beanIndex, well)) {
        return true;
    }

    // 2. LP needed for nNeed beans, capped at the whole supply
    bool fCapped = false;
    CAmount nLpNeeded = 0;
    if (nNeed >= well.reserves[beanIndex]) {
        fCapped = true;
        if (!well_function::CalcLpTokenSupply(well.reserves, nLpNeeded)) {
            LogPrint(BCLog::SILO, "%s: %s has malformed reserves, skipped\n", __func__, wellToken);
            return true;
        }
    } else if (!GetRemoveLiquidityOneTokenIn(well, (size_t)beanIndex, nNeed, nLpNeeded)) {
        LogPrint(BCLog::SILO, "%s: %s cannot price %d beans, skipped\n", __func__, wellToken, nNeed);
        return true;
    }
    if (nLpNeeded <= 0) {
        return true;
    }

    // 3. LP deposits
    if (!SelectDepositStems(view, account, wellToken, nLpNeeded, filter, pExcludingPlan, selection, state)) {
        return false;
    }
    if (selection.totalSelected == 0) {
        return true;
    }

    // 4. Realizable beans
    if (selection.totalSelected < nLpNeeded || fCapped) {
        if (!GetRemoveLiquidityOneTokenOut(well, (size_t)beanIndex, selection.totalSelected, nValue)) {
            LogPrint(BCLog::SILO, "%s: %s cannot quote %d LP, skipped\n", __func__, wellToken, selection.totalSelected);
            selection.SetNull();
            nValue = 0;
            return true;
        }
    } else {
        nValue = nNeed;
    }

    if (nValue <= 0) {
        selection.SetNull();
        nValue = 0;
    }
    return true;
}

bool BuildWithdrawalPlan(const CSiloView& view,
                         const Address& account,
                         const CSourceSelection& sources,
                         CAmount nTarget,
                         const FilterParams& filter,
                         const CWithdrawalPlan* pExcludingPlan,
                         CWithdrawalPlan& plan,
                         CValidationState& state)
{
    plan.SetNull();

    // 1. Arguments, before touching the ledger
    if (sources.IsExplicit() && sources.GetIndices().empty()) {
        return state.Invalid(error("%s: empty source list", __func__),
                             SiloError::INVALID_ARGUMENT, "silo-source-empty");
    }
    if (nTarget <= 0 || !MoneyRange(nTarget)) {
        return state.Invalid(error("%s: target %d out of range", __func__, nTarget),
                             SiloError::INVALID_ARGUMENT, "silo-plan-bad-target");
    }
    if (!CheckFilterParams(filter, state)) {
        return false;
    }
    if (pExcludingPlan && !pExcludingPlan->CheckInvariants(state)) {
        LogPrint(BCLog::SILO, "%s: malformed prior plan: %s\n", __func__, state.ToString());
        return false;
    }

    // 2. Concrete token order
    std::vector<Address> tokens;
    if (!ResolveSourceTokens(view, sources, filter, tokens, state)) {
        return false;
    }
    const Address bean = view.GetBeanToken();

    // 3. Visit sources until the need is covered
    CAmount nNeed = nTarget;
    for (size_t i = 0; i < tokens.size() && nNeed > 0; ++i) {
        const Address& token = tokens[i];
        CStemSelection selection;
        CAmount nValue = 0;

        if (token == bean) {
            if (!SelectDepositStems(view, account, token, nNeed, filter, pExcludingPlan, selection, state)) {
                return false;
            }
            nValue = selection.totalSelected;
        } else if (!SelectWellSource(view, account, token, bean, nNeed, filter, pExcludingPlan, selection, nValue, state)) {
            return false;
        }

        if (selection.IsNull() || nValue == 0) {
            LogPrint(BCLog::SILO, "%s: source %s yields nothing\n", __func__, token);
            continue;
        }

        if (!plan.AddSource(token, selection.stems, selection.amounts, nValue)) {
            plan.SetNull();
            return state.Invalid(error("%s: planned value out of range at %s", __func__, token),
                                 SiloError::INVALID_ARGUMENT, "plan-bad-total");
        }
        nNeed -= nValue;
    }

    // 4. Nothing anywhere
    if (plan.totalAvailableBeans == 0) {
        plan.SetNull();
        return state.Invalid(error("%s: %s has no withdrawable beans in %u sources", __func__, account, tokens.size()),
                             SiloError::NO_LIQUIDITY, "silo-no-liquidity");
    }

    LogPrint(BCLog::SILO, "%s: %s target=%s planned=%s over %u sources\n",
             __func__, account, FormatMoney(nTarget), FormatMoney(plan.totalAvailableBeans), plan.sourceTokens.size());
    return true;
}

bool GetBeanAmountAvailable(const CSiloView& view,
                            const Address& account,
                            const CSourceSelection& sources,
                            const FilterParams& filter,
                            const CWithdrawalPlan* pExcludingPlan,
                            CAmount& nAvailable,
                            CValidationState& state)
{
    nAvailable = 0;

    CWithdrawalPlan plan;
    CValidationState planState;
    if (!BuildWithdrawalPlan(view, account, sources, MAX_MONEY, filter, pExcludingPlan, plan, planState)) {
        if (planState.GetError() == SiloError::NO_LIQUIDITY) {
            return true;
        }
        state = planState;
        return false;
    }

    nAvailable = plan.totalAvailableBeans;
    return true;
}
