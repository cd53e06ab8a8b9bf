// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_SILO_PLAN_H
#define PINTO_SILO_PLAN_H

#include "amount.h"
#include "silo/silo_deposit.h"

#include <stdint.h>
#include <string>
#include <vector>

class CSiloView;
class CValidationState;

/**
 * CWithdrawalPlan - Deposits chosen to cover a bean amount
 *
 * Per source i: stems[i] and amounts[i] are aligned and listed in the order
 * they must be withdrawn; availableBeans[i] is the bean value the source
 * realizes (the literal amount for bean, the quoted removal for wells).
 *
 * A plan is a value. It touches the ledger only when executed.
 */
struct CWithdrawalPlan
{
    std::vector<Address> sourceTokens;
    std::vector<std::vector<int64_t>> stems;
    std::vector<std::vector<CAmount>> amounts;
    std::vector<CAmount> availableBeans;
    CAmount totalAvailableBeans;

    CWithdrawalPlan()
    {
        SetNull();
    }

    void SetNull()
    {
        sourceTokens.clear();
        stems.clear();
        amounts.clear();
        availableBeans.clear();
        totalAvailableBeans = 0;
    }

    bool IsNull() const
    {
        return sourceTokens.empty();
    }

    /** Append a source entry and account its bean value. False, and nothing
     *  appended, when the value or the new total leaves the money range. */
    bool AddSource(const Address& token, const std::vector<int64_t>& vStems,
                   const std::vector<CAmount>& vAmounts, CAmount nAvailableBeans);

    /** Index of token in sourceTokens, or -1 */
    int GetSourceIndex(const Address& token) const;

    /**
     * Structural checks:
     * - stems, amounts, availableBeans have one entry per source
     * - stems[i] and amounts[i] are aligned, amounts positive
     * - sum(availableBeans) == totalAvailableBeans
     * - no token listed twice, no stem listed twice per token
     */
    bool CheckInvariants(CValidationState& state) const;

    bool operator==(const CWithdrawalPlan& other) const
    {
        return sourceTokens == other.sourceTokens &&
               stems == other.stems &&
               amounts == other.amounts &&
               availableBeans == other.availableBeans &&
               totalAvailableBeans == other.totalAvailableBeans;
    }

    std::string ToString() const;
};

/** Amount of (token, stem) already claimed by plan */
CAmount GetAmountAlreadyUsed(const CWithdrawalPlan& plan, const Address& token, int64_t nStem);

/** Amount of (token, stem) already claimed across plans */
CAmount GetAmountAlreadyUsed(const std::vector<CWithdrawalPlan>& plans, const Address& token, int64_t nStem);

/**
 * CombineWithdrawalPlans - Merge plans into one claim set
 *
 * Sums amounts per (token, stem) and availableBeans per source, keeping the
 * first-appearance order of tokens and stems.
 *
 * @param[in]  view     Ledger view used to bound the combined claims
 * @param[in]  account  Owner of the deposits
 * @param[in]  plans    Plans to merge
 * @param[out] combined Merged plan
 * @param[out] state    INVALID_ARGUMENT for malformed plans,
 *                      LEDGER_INCONSISTENCY when a combined claim exceeds its deposit
 */
bool CombineWithdrawalPlans(const CSiloView& view,
                            const Address& account,
                            const std::vector<CWithdrawalPlan>& plans,
                            CWithdrawalPlan& combined,
                            CValidationState& state);

/** Reject with INSUFFICIENT_FUNDS when the plan realizes less than nRequired */
bool CheckPlanCoverage(const CWithdrawalPlan& plan, CAmount nRequired, CValidationState& state);

#endif // PINTO_SILO_PLAN_H
