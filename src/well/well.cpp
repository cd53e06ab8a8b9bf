// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "well/well.h"

#include "consensus/validation.h"
#include "logging.h"
#include "silo/silo_view.h"
#include "utilmoneystr.h"
#include "well/well_function.h"

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>

using uint256_t = boost::multiprecision::uint256_t;

int CWellState::GetTokenIndex(const Address& token) const
{
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] == token) return (int)i;
    }
    return -1;
}

std::string CWellState::ToString() const
{
    std::string strTokens;
    std::string strReserves;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            strTokens += ",";
            strReserves += ",";
        }
        strTokens += tokens[i];
        if (i < reserves.size()) strReserves += strprintf("%d", reserves[i]);
    }
    return strprintf("CWellState(well=%s, tokens=[%s], reserves=[%s], supply=%d, pairPrice=%d)",
                     well, strTokens, strReserves, nTotalSupply, nPairPrice);
}

// ============================================================================
// Quotes
// ============================================================================

bool GetRemoveLiquidityOneTokenIn(const CWellState& well, size_t j, CAmount amountOut, CAmount& lpAmountIn)
{
    lpAmountIn = 0;
    if (j >= well.reserves.size() || amountOut <= 0) {
        return false;
    }
    if (amountOut >= well.reserves[j]) {
        LogPrint(BCLog::WELL, "%s: %s cannot release %d of reserve %d\n",
                 __func__, well.well, amountOut, well.reserves[j]);
        return false;
    }

    CAmount supplyBefore = 0;
    if (!well_function::CalcLpTokenSupply(well.reserves, supplyBefore)) {
        return false;
    }

    std::vector<CAmount> reduced = well.reserves;
    reduced[j] -= amountOut;

    CAmount supplyAfter = 0;
    if (!well_function::CalcLpTokenSupply(reduced, supplyAfter)) {
        return false;
    }

    lpAmountIn = supplyBefore - supplyAfter;
    return true;
}

bool GetRemoveLiquidityOneTokenOut(const CWellState& well, size_t j, CAmount lpAmountIn, CAmount& amountOut)
{
    amountOut = 0;
    if (j >= well.reserves.size() || lpAmountIn < 0) {
        return false;
    }
    if (lpAmountIn == 0) {
        return true;
    }

    CAmount supply = 0;
    if (!well_function::CalcLpTokenSupply(well.reserves, supply)) {
        return false;
    }
    if (lpAmountIn > supply) {
        LogPrint(BCLog::WELL, "%s: %s lpIn %d exceeds supply %d\n", __func__, well.well, lpAmountIn, supply);
        return false;
    }

    CAmount newReserve = 0;
    if (!well_function::CalcReserve(well.reserves, j, supply - lpAmountIn, newReserve)) {
        return false;
    }

    // Rounding up the new reserve can leave nothing to hand out for dust LP
    if (newReserve < well.reserves[j]) {
        amountOut = well.reserves[j] - newReserve;
    }
    return true;
}

// ============================================================================
// Price
// ============================================================================

/** Pair units per bean unit scaled by SLIPPAGE_PRECISION */
static bool GetRate(const std::vector<CAmount>& reserves, size_t beanIndex, uint256_t& rate)
{
    if (reserves.size() != well_function::N_TOKENS || beanIndex >= reserves.size()) {
        return false;
    }
    const CAmount beanReserve = reserves[beanIndex];
    const CAmount pairReserve = reserves[1 - beanIndex];
    if (beanReserve <= 0 || pairReserve < 0) {
        return false;
    }
    rate = uint256_t(pairReserve) * uint256_t(SLIPPAGE_PRECISION) / uint256_t(beanReserve);
    return true;
}

bool GetBeanPrice(const CWellState& well, size_t beanIndex, const std::vector<CAmount>& reserves, CAmount& price)
{
    price = 0;
    if (reserves.size() != well_function::N_TOKENS || beanIndex >= reserves.size()) {
        return false;
    }
    const CAmount beanReserve = reserves[beanIndex];
    const CAmount pairReserve = reserves[1 - beanIndex];
    if (beanReserve <= 0 || pairReserve < 0 || well.nPairPrice < 0) {
        return false;
    }

    const uint256_t result = uint256_t(pairReserve) * uint256_t(well.nPairPrice) / uint256_t(beanReserve);
    if (result > uint256_t(std::numeric_limits<CAmount>::max())) {
        return false;
    }
    price = result.convert_to<CAmount>();
    return true;
}

bool IsValidSlippage(const CWellState& well, size_t beanIndex, int64_t nSlippageRatio)
{
    if (nSlippageRatio < 0) {
        return false;
    }

    uint256_t instantRate;
    uint256_t twaRate;
    if (!GetRate(well.reserves, beanIndex, instantRate)) {
        LogPrint(BCLog::WELL, "%s: %s has no usable instantaneous reserves\n", __func__, well.well);
        return false;
    }
    if (!GetRate(well.twaReserves, beanIndex, twaRate)) {
        LogPrint(BCLog::WELL, "%s: %s has no usable time-weighted reserves\n", __func__, well.well);
        return false;
    }

    const uint256_t precision(SLIPPAGE_PRECISION);
    const uint256_t ratio(nSlippageRatio);
    const uint256_t upper = twaRate * (precision + ratio) / precision;
    uint256_t lower = 0;
    if (ratio < precision) {
        lower = twaRate * (precision - ratio) / precision;
    }

    const bool fValid = instantRate >= lower && instantRate <= upper;
    if (!fValid) {
        LogPrint(BCLog::WELL, "%s: %s instant rate %s outside [%s, %s]\n", __func__, well.well,
                 instantRate.str(), lower.str(), upper.str());
    }
    return fValid;
}

// ============================================================================
// Liquidity removal
// ============================================================================

bool RemoveLiquidityOneToken(CSiloView& view,
                             const Address& wellToken,
                             CAmount lpAmountIn,
                             const Address& tokenOut,
                             CAmount minAmountOut,
                             const Address& account,
                             const Address& recipient,
                             TransferMode mode,
                             CAmount& amountOut,
                             CValidationState& state)
{
    amountOut = 0;

    // 1. Well and output token
    CWellState well;
    if (!view.GetWellState(wellToken, well)) {
        return state.Invalid(error("%s: unknown well %s", __func__, wellToken),
                             SiloError::INVALID_ARGUMENT, "well-unknown");
    }
    const int j = well.GetTokenIndex(tokenOut);
    if (j < 0) {
        return state.Invalid(error("%s: %s is not a token of %s", __func__, tokenOut, wellToken),
                             SiloError::INVALID_ARGUMENT, "well-bad-token-out");
    }
    if (lpAmountIn <= 0) {
        return state.Invalid(error("%s: non-positive lp amount %d", __func__, lpAmountIn),
                             SiloError::INVALID_ARGUMENT, "well-bad-lp-amount");
    }

    // 2. LP is burnt from the account's internal balance
    const CAmount lpBalance = view.GetBalance(account, wellToken, TransferMode::INTERNAL);
    if (lpBalance < lpAmountIn) {
        return state.Invalid(error("%s: %s holds %d LP of %s, needs %d", __func__, account, lpBalance,
                                   wellToken, lpAmountIn),
                             SiloError::LEDGER_INCONSISTENCY, "well-lp-balance-too-low");
    }
    if (lpAmountIn > well.nTotalSupply) {
        return state.Invalid(error("%s: lp amount %d exceeds supply %d of %s", __func__, lpAmountIn,
                                   well.nTotalSupply, wellToken),
                             SiloError::LEDGER_INCONSISTENCY, "well-lp-exceeds-supply");
    }

    // 3. Quote against current reserves
    if (!GetRemoveLiquidityOneTokenOut(well, (size_t)j, lpAmountIn, amountOut)) {
        return state.Invalid(error("%s: cannot quote %d LP of %s", __func__, lpAmountIn, wellToken),
                             SiloError::LEDGER_INCONSISTENCY, "well-quote-failed");
    }
    if (amountOut < minAmountOut) {
        return state.Invalid(error("%s: %s returned %d, minimum %d", __func__, wellToken, amountOut, minAmountOut),
                             SiloError::SLIPPAGE, "well-slippage",
                             strprintf("out=%s min=%s", FormatMoney(amountOut), FormatMoney(minAmountOut)));
    }

    // 4. Apply
    well.reserves[j] -= amountOut;
    well.nTotalSupply -= lpAmountIn;

    const CAmount recipientBalance = view.GetBalance(recipient, tokenOut, mode);
    if (!view.SetBalance(account, wellToken, TransferMode::INTERNAL, lpBalance - lpAmountIn) ||
        !view.SetWellState(well) ||
        !view.SetBalance(recipient, tokenOut, mode, recipientBalance + amountOut)) {
        return state.Error("well-write-failed");
    }

    LogPrint(BCLog::WELL, "%s: %s burnt %d LP of %s for %s %s\n",
             __func__, account, lpAmountIn, wellToken, FormatMoney(amountOut), tokenOut);
    return true;
}
