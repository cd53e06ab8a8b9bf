// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_SILO_SELECTOR_H
#define PINTO_SILO_SELECTOR_H

#include "amount.h"
#include "silo/silo_deposit.h"

#include <stdint.h>
#include <string>
#include <vector>

class CSiloView;
class CValidationState;
struct CWithdrawalPlan;
struct FilterParams;

/** Stems chosen from one token, in withdrawal order */
struct CStemSelection
{
    std::vector<int64_t> stems;
    std::vector<CAmount> amounts;
    CAmount totalSelected;

    CStemSelection()
    {
        SetNull();
    }

    void SetNull()
    {
        stems.clear();
        amounts.clear();
        totalSelected = 0;
    }

    bool IsNull() const
    {
        return stems.empty();
    }

    void Add(int64_t nStem, CAmount amount)
    {
        stems.push_back(nStem);
        amounts.push_back(amount);
        totalSelected += amount;
    }

    std::string ToString() const;
};

/**
 * SelectDepositStems - Pick deposits of one token covering nTarget
 *
 * Deposits are walked newest first (descending stem) so the least grown
 * stalk is forfeited. Amounts already claimed by pExcludingPlan are not
 * available again.
 *
 * RULES (per deposit, in order):
 * 1. stem < min stem                                    -> skip
 * 2. excludeGerminatingDeposits && stem >= germinating  -> skip
 * 3. stem > max stem: OMIT skips, USE_LAST defers, USE falls through
 * 4. remaining = amount - already used; skip if zero
 * 5. take min(remaining, need); stop when need is zero
 * Deferred deposits are replayed afterwards in the order they were met.
 *
 * Best effort: selection.totalSelected may be below nTarget. An account
 * without deposits yields an empty selection.
 *
 * @param[in]  view           Ledger view (read only)
 * @param[in]  account        Owner of the deposits
 * @param[in]  token          Deposited token
 * @param[in]  nTarget        Amount of token wanted (> 0)
 * @param[in]  filter         Deposit filter
 * @param[in]  pExcludingPlan Prior claims, may be nullptr
 * @param[out] selection      Chosen stems and amounts
 * @param[out] state          INVALID_ARGUMENT on non-positive target or bad filter
 * @return true on success
 */
bool SelectDepositStems(const CSiloView& view,
                        const Address& account,
                        const Address& token,
                        CAmount nTarget,
                        const FilterParams& filter,
                        const CWithdrawalPlan* pExcludingPlan,
                        CStemSelection& selection,
                        CValidationState& state);

#endif // PINTO_SILO_SELECTOR_H
