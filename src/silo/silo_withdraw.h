// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_SILO_WITHDRAW_H
#define PINTO_SILO_WITHDRAW_H

#include "amount.h"
#include "silo/silo_deposit.h"

#include <stdint.h>

class CSiloView;
class CSourceSelection;
class CValidationState;
struct CWithdrawalPlan;
struct FilterParams;

/**
 * ExecuteWithdrawalPlan - Withdraw the plan's deposits and deliver beans to destination
 *
 * RULES (per source, in plan order):
 * - bean: withdraw the listed stems straight to destination
 * - well: 1. instantaneous price within nSlippageRatio of the time-weighted price
 *         2. withdraw the LP to account's internal balance
 *         3. remove liquidity for beans, at least availableBeans[i]
 *         4. transfer the beans to destination
 *
 * All writes go through a cache over view that is flushed only when every
 * source succeeded. On failure view is untouched.
 *
 * @param[in,out] view            Ledger view
 * @param[in]     account         Owner of the deposits
 * @param[in]     plan            Plan to execute
 * @param[in]     nSlippageRatio  Tolerated price deviation (SLIPPAGE_PRECISION), negative for the network default
 * @param[in]     destination     Receiver of the beans
 * @param[in]     mode            Balance of destination to credit
 * @param[out]    nTotalWithdrawn Beans delivered
 * @param[out]    state           Failure details
 * @return true on success
 */
bool ExecuteWithdrawalPlan(CSiloView& view,
                           const Address& account,
                           const CWithdrawalPlan& plan,
                           int64_t nSlippageRatio,
                           const Address& destination,
                           TransferMode mode,
                           CAmount& nTotalWithdrawn,
                           CValidationState& state);

/**
 * WithdrawBeansFromSources - Plan, require full coverage and execute
 *
 * Fails with INSUFFICIENT_FUNDS when the sources cannot cover nAmount.
 */
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
                              CValidationState& state);

#endif // PINTO_SILO_WITHDRAW_H
