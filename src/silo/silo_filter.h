// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_SILO_FILTER_H
#define PINTO_SILO_FILTER_H

#include "silo/silo_deposit.h"

#include <stdint.h>
#include <string>

class CSiloView;
class CValidationState;

/** Treatment of deposits above the effective max stem (little grown stalk) */
enum class LowStalkDeposits : uint8_t {
    USE = 0,      //!< consume in the normal descending pass
    OMIT = 1,     //!< never consume
    USE_LAST = 2, //!< consume only after every other eligible deposit
};

std::string LowStalkDepositsToString(LowStalkDeposits mode);

/**
 * FilterParams - Which deposits a withdrawal may draw from
 *
 * RULES:
 * - stem < max(minStem, tip - maxGrownStalkPerBdv)           -> skipped
 * - stem >= germinating stem and excludeGerminatingDeposits  -> skipped
 * - stem > min(maxStem, tip - lowGrownStalkPerBdv)           -> low-stalk band
 *   (the tip bound only applies when lowGrownStalkPerBdv > 0)
 * - excludeBean removes the bean token from strategy derived source lists
 */
struct FilterParams
{
    int64_t maxGrownStalkPerBdv;
    int64_t minStem;
    int64_t lowGrownStalkPerBdv;
    int64_t maxStem;
    bool excludeGerminatingDeposits;
    bool excludeBean;
    LowStalkDeposits lowStalkDeposits;

    FilterParams()
        : maxGrownStalkPerBdv(STEM_MAX),
          minStem(STEM_MIN),
          lowGrownStalkPerBdv(0),
          maxStem(STEM_MAX),
          excludeGerminatingDeposits(false),
          excludeBean(false),
          lowStalkDeposits(LowStalkDeposits::USE)
    {}

    std::string ToString() const;
};

/** Effective per-token bounds derived from FilterParams and the token's stem tip */
struct CStemRange
{
    int64_t nMinStem;
    int64_t nMaxStem;
    int64_t nGerminatingStem;

    CStemRange() : nMinStem(STEM_MIN), nMaxStem(STEM_MAX), nGerminatingStem(STEM_MAX) {}
};

/** Permissive defaults with a grown stalk ceiling */
FilterParams GetDefaultFilterParams(int64_t maxGrownStalkPerBdv);

/** Permissive defaults without a grown stalk ceiling */
FilterParams GetDefaultFilterParams();

/** Reject negative thresholds and minStem > maxStem */
bool CheckFilterParams(const FilterParams& filter, CValidationState& state);

/**
 * GetStemRange - Resolve the filter against token's current stem tip
 *
 * Subtractions saturate at STEM_MIN.
 */
CStemRange GetStemRange(const CSiloView& view, const Address& token, const FilterParams& filter);

#endif // PINTO_SILO_FILTER_H
