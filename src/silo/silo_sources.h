// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_SILO_SOURCES_H
#define PINTO_SILO_SOURCES_H

#include "amount.h"
#include "silo/silo_deposit.h"

#include <stdint.h>
#include <string>
#include <vector>

class CSiloView;
class CValidationState;
struct CWithdrawalPlan;
struct FilterParams;

/**
 * CSourceSelection - Which whitelisted tokens to withdraw from, and in what order
 *
 * Either an explicit list of whitelist indices or a strategy that is
 * resolved against current protocol state on every call.
 */
class CSourceSelection
{
public:
    enum Strategy : uint8_t {
        EXPLICIT = 0,
        ASCENDING_PRICE = 1,
        ASCENDING_SEEDS = 2,
    };

private:
    Strategy strategy;
    std::vector<uint8_t> vIndices;

    CSourceSelection(Strategy strategyIn, const std::vector<uint8_t>& vIndicesIn)
        : strategy(strategyIn), vIndices(vIndicesIn) {}

public:
    static CSourceSelection Explicit(const std::vector<uint8_t>& vIndicesIn) { return CSourceSelection(EXPLICIT, vIndicesIn); }
    static CSourceSelection AscendingPrice() { return CSourceSelection(ASCENDING_PRICE, std::vector<uint8_t>()); }
    static CSourceSelection AscendingSeeds() { return CSourceSelection(ASCENDING_SEEDS, std::vector<uint8_t>()); }

    Strategy GetStrategy() const { return strategy; }
    bool IsExplicit() const { return strategy == EXPLICIT; }
    const std::vector<uint8_t>& GetIndices() const { return vIndices; }

    std::string ToString() const;
};

/**
 * GetTokenPrice - Bean price associated with a whitelisted token (PRICE_PRECISION)
 *
 * The bean token is valued at the configured peg. A well is valued at the
 * bean price implied by its instantaneous reserves.
 *
 * @return false if token is neither bean nor a well with usable reserves
 */
bool GetTokenPrice(const CSiloView& view, const Address& token, CAmount& price);

/** Whitelisted tokens ordered by ascending price, ties in whitelist order */
bool GetTokensAscendingPrice(const CSiloView& view, bool fExcludeBean, std::vector<Address>& tokens, CValidationState& state);

/** Whitelisted tokens ordered by ascending seeds, ties in whitelist order */
std::vector<Address> GetTokensAscendingSeeds(const CSiloView& view, bool fExcludeBean);

/**
 * ResolveSourceTokens - Turn a source selection into an ordered token list
 *
 * Explicit lists are bounded by nMaxSourceTokens and must index into the
 * whitelist. A token listed more than once is kept at its first position.
 */
bool ResolveSourceTokens(const CSiloView& view,
                         const CSourceSelection& sources,
                         const FilterParams& filter,
                         std::vector<Address>& tokens,
                         CValidationState& state);

/**
 * BuildWithdrawalPlan - Plan the withdrawal of nTarget beans from account's deposits
 *
 * Sources are visited in order until the need is covered. Bean deposits
 * count at face value. For a well, the LP needed for the remaining beans is
 * selected; a partial (or capped) LP selection is valued with a removal
 * quote, a full one at exactly the remaining need. Sources that realize
 * nothing are skipped.
 *
 * Deposits claimed by pExcludingPlan are not selected again. When it also
 * claims LP of a well, that well is priced as if the prior LP had already
 * been removed for beans.
 *
 * An under-filled plan is not an error here, see CheckPlanCoverage().
 *
 * @param[in]  view           Ledger view (read only)
 * @param[in]  account        Owner of the deposits
 * @param[in]  sources        Explicit indices or a strategy
 * @param[in]  nTarget        Beans wanted (> 0)
 * @param[in]  filter         Deposit filter
 * @param[in]  pExcludingPlan Prior claims to respect, may be nullptr
 * @param[out] plan           Resulting plan
 * @param[out] state          INVALID_ARGUMENT (also for a malformed pExcludingPlan) or NO_LIQUIDITY on failure
 * @return true on success
 */
bool BuildWithdrawalPlan(const CSiloView& view,
                         const Address& account,
                         const CSourceSelection& sources,
                         CAmount nTarget,
                         const FilterParams& filter,
                         const CWithdrawalPlan* pExcludingPlan,
                         CWithdrawalPlan& plan,
                         CValidationState& state);

/**
 * GetBeanAmountAvailable - Beans account could withdraw from sources right now
 *
 * nAvailable is 0 when no source holds anything withdrawable.
 */
bool GetBeanAmountAvailable(const CSiloView& view,
                            const Address& account,
                            const CSourceSelection& sources,
                            const FilterParams& filter,
                            const CWithdrawalPlan* pExcludingPlan,
                            CAmount& nAvailable,
                            CValidationState& state);

#endif // PINTO_SILO_SOURCES_H
