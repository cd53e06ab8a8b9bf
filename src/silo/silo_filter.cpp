// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "silo/silo_filter.h"

#include "consensus/validation.h"
#include "logging.h"
#include "silo/silo_view.h"

#include <algorithm>

std::string LowStalkDepositsToString(LowStalkDeposits mode)
{
    switch (mode) {
    case LowStalkDeposits::USE: return "use";
    case LowStalkDeposits::OMIT: return "omit";
    case LowStalkDeposits::USE_LAST: return "use-last";
    }
    return "unknown";
}

std::string FilterParams::ToString() const
{
    return strprintf("FilterParams(maxGrown=%d, minStem=%d, lowGrown=%d, maxStem=%d, excludeGerminating=%d, excludeBean=%d, lowStalk=%s)",
                     maxGrownStalkPerBdv, minStem, lowGrownStalkPerBdv, maxStem,
                     excludeGerminatingDeposits, excludeBean, LowStalkDepositsToString(lowStalkDeposits));
}

FilterParams GetDefaultFilterParams(int64_t maxGrownStalkPerBdv)
{
    FilterParams filter;
    filter.maxGrownStalkPerBdv = maxGrownStalkPerBdv;
    return filter;
}

FilterParams GetDefaultFilterParams()
{
    return FilterParams();
}

bool CheckFilterParams(const FilterParams& filter, CValidationState& state)
{
    if (filter.maxGrownStalkPerBdv < 0 || filter.lowGrownStalkPerBdv < 0) {
        return state.Invalid(error("%s: negative grown stalk threshold (%s)", __func__, filter.ToString()),
                             SiloError::INVALID_ARGUMENT, "silo-filter-negative-threshold");
    }
    if (filter.minStem > filter.maxStem) {
        return state.Invalid(error("%s: minStem %d > maxStem %d", __func__, filter.minStem, filter.maxStem),
                             SiloError::INVALID_ARGUMENT, "silo-filter-bad-stem-range");
    }
    return true;
}

/** a - b for b >= 0, saturating at STEM_MIN */
static int64_t SaturatingSub(int64_t a, int64_t b)
{
    if (b <= 0) {
        return a;
    }
    if (a < STEM_MIN + b) {
        return STEM_MIN;
    }
    return a - b;
}

CStemRange GetStemRange(const CSiloView& view, const Address& token, const FilterParams& filter)
{
    CStemRange range;
    const int64_t nTip = view.GetStemTip(token);

    range.nMinStem = std::max(filter.minStem, SaturatingSub(nTip, filter.maxGrownStalkPerBdv));
    range.nMaxStem = filter.maxStem;
    if (filter.lowGrownStalkPerBdv > 0) {
        range.nMaxStem = std::min(filter.maxStem, SaturatingSub(nTip, filter.lowGrownStalkPerBdv));
    }
    range.nGerminatingStem = view.GetGerminatingStem(token);

    LogPrint(BCLog::SILO, "%s: %s tip=%d min=%d max=%d germinating=%d\n",
             __func__, token, nTip, range.nMinStem, range.nMaxStem, range.nGerminatingStem);
    return range;
}
