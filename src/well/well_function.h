// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_WELL_WELL_FUNCTION_H
#define PINTO_WELL_WELL_FUNCTION_H

#include "amount.h"

#include <stddef.h>
#include <vector>

/**
 * Constant product well function for two-token wells.
 *
 *   lpSupply = floor(sqrt(r0 * r1))
 *   r_j      = ceil(lpSupply^2 / r_(1-j))
 *
 * Supply rounds down and reserves round up, so any sequence of
 * "how much LP for x out" followed by "how much out for that LP" never hands
 * out more than the reserves can back.
 *
 * All intermediates are 256 bit. Functions return false when inputs are
 * malformed or a result does not fit into CAmount.
 */
namespace well_function {

static const size_t N_TOKENS = 2;

/**
 * CalcLpTokenSupply - LP supply implied by a reserve pair
 *
 * @param reserves Two non-negative reserves
 * @param lpSupply Output: floor(sqrt(r0 * r1))
 * @return false on malformed reserves
 */
bool CalcLpTokenSupply(const std::vector<CAmount>& reserves, CAmount& lpSupply);

/**
 * CalcReserve - Reserve of token j that keeps lpSupply with the other reserve fixed
 *
 * @param reserves Current reserves (reserves[j] is ignored)
 * @param j Index of the reserve to solve for
 * @param lpSupply Target LP supply
 * @param reserve Output: ceil(lpSupply^2 / reserves[1 - j])
 * @return false on malformed input, zero opposite reserve or overflow
 */
bool CalcReserve(const std::vector<CAmount>& reserves, size_t j, CAmount lpSupply, CAmount& reserve);

} // namespace well_function

#endif // PINTO_WELL_WELL_FUNCTION_H
