// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_WELL_WELL_H
#define PINTO_WELL_WELL_H

#include "amount.h"
#include "silo/silo_deposit.h"

#include <stddef.h>
#include <string>
#include <vector>

class CSiloView;
class CValidationState;

/** Precision of slippage ratios (1e18 == 100%) */
static const int64_t SLIPPAGE_PRECISION = 1000000000000000000LL;

/**
 * CWellState - Snapshot of a two-token constant product well
 *
 * The well's LP token is itself whitelisted in the silo, so deposits of
 * `well` are pool-share deposits. `twaReserves` are the time-weighted
 * reserves reported by the well's pump; they are the manipulation-resistant
 * reference for the slippage guard.
 */
struct CWellState
{
    Address well;                     //!< LP token of the well
    std::vector<Address> tokens;      //!< pair tokens, aligned with reserves
    std::vector<CAmount> reserves;    //!< instantaneous reserves
    std::vector<CAmount> twaReserves; //!< time-weighted reserves
    CAmount nTotalSupply;             //!< LP shares outstanding
    CAmount nPairPrice;               //!< USD price of one non-bean base unit per bean base unit (PRICE_PRECISION)

    CWellState()
    {
        SetNull();
    }

    void SetNull()
    {
        well.clear();
        tokens.clear();
        reserves.clear();
        twaReserves.clear();
        nTotalSupply = 0;
        nPairPrice = 0;
    }

    bool IsNull() const
    {
        return well.empty();
    }

    /** Index of token in the pair, or -1 */
    int GetTokenIndex(const Address& token) const;

    std::string ToString() const;
};

/**
 * GetRemoveLiquidityOneTokenIn - LP needed to take amountOut of token j out of the well
 *
 * lpAmountIn = supply(reserves) - supply(reserves with r_j reduced by amountOut)
 *
 * @return false if amountOut is not positive or would drain the reserve
 */
bool GetRemoveLiquidityOneTokenIn(const CWellState& well, size_t j, CAmount amountOut, CAmount& lpAmountIn);

/**
 * GetRemoveLiquidityOneTokenOut - Quote for burning lpAmountIn for token j only
 *
 * @return false if lpAmountIn is negative or exceeds the supply implied by the reserves
 */
bool GetRemoveLiquidityOneTokenOut(const CWellState& well, size_t j, CAmount lpAmountIn, CAmount& amountOut);

/** Bean price (PRICE_PRECISION) implied by a reserve pair of the well */
bool GetBeanPrice(const CWellState& well, size_t beanIndex, const std::vector<CAmount>& reserves, CAmount& price);

/**
 * IsValidSlippage - Price manipulation guard
 *
 * Accepts when the instantaneous bean/pair rate lies within
 * twa * (1 -/+ nSlippageRatio / SLIPPAGE_PRECISION).
 */
bool IsValidSlippage(const CWellState& well, size_t beanIndex, int64_t nSlippageRatio);

/**
 * RemoveLiquidityOneToken - Burn LP from account's internal balance for a single token
 *
 * The received tokens are credited to recipient's balance selected by mode and the
 * well reserves and supply are updated in view.
 *
 * @param[in,out] view        Ledger view (mutated: LP balance, well state, recipient balance)
 * @param[in]     wellToken   LP token of the well
 * @param[in]     lpAmountIn  LP to burn
 * @param[in]     tokenOut    Pair token to receive
 * @param[in]     minAmountOut Reject with SLIPPAGE if the output is lower
 * @param[in]     account     Owner of the LP (internal balance)
 * @param[in]     recipient   Receiver of tokenOut
 * @param[in]     mode        Balance of recipient to credit
 * @param[out]    amountOut   Tokens received
 * @param[out]    state       Failure details
 */
bool RemoveLiquidityOneToken(CSiloView& view,
                             const Address& wellToken,
                             CAmount lpAmountIn,
                             const Address& tokenOut,
                             CAmount minAmountOut,
                             const Address& account,
                             const Address& recipient,
                             TransferMode mode,
                             CAmount& amountOut,
                             CValidationState& state);

#endif // PINTO_WELL_WELL_H
