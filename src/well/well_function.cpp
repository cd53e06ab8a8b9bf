// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "well/well_function.h"

#include "logging.h"

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/integer.hpp>

#include <limits>

namespace well_function {

using uint256_t = boost::multiprecision::uint256_t;

static bool CheckReserves(const std::vector<CAmount>& reserves)
{
    if (reserves.size() != N_TOKENS) {
        return false;
    }
    for (const CAmount r : reserves) {
        if (r < 0) return false;
    }
    return true;
}

static bool ToAmount(const uint256_t& value, CAmount& out)
{
    if (value > uint256_t(std::numeric_limits<CAmount>::max())) {
        return false;
    }
    out = value.convert_to<CAmount>();
    return true;
}

bool CalcLpTokenSupply(const std::vector<CAmount>& reserves, CAmount& lpSupply)
{
    lpSupply = 0;
    if (!CheckReserves(reserves)) {
        LogPrint(BCLog::WELL, "CalcLpTokenSupply: malformed reserves (size=%u)\n", reserves.size());
        return false;
    }

    const uint256_t product = uint256_t(reserves[0]) * uint256_t(reserves[1]);
    const uint256_t root = boost::multiprecision::sqrt(product);

    return ToAmount(root, lpSupply);
}

bool CalcReserve(const std::vector<CAmount>& reserves, size_t j, CAmount lpSupply, CAmount& reserve)
{
    reserve = 0;
    if (!CheckReserves(reserves) || j >= N_TOKENS || lpSupply < 0) {
        LogPrint(BCLog::WELL, "CalcReserve: malformed input (j=%u, lpSupply=%d)\n", j, lpSupply);
        return false;
    }

    const CAmount other = reserves[1 - j];
    if (other == 0) {
        LogPrint(BCLog::WELL, "CalcReserve: opposite reserve is empty\n");
        return false;
    }

    const uint256_t numerator = uint256_t(lpSupply) * uint256_t(lpSupply);
    const uint256_t denominator(other);

    uint256_t result = numerator / denominator;
    if (numerator % denominator != 0) {
        ++result; // round up
    }

    if (!ToAmount(result, reserve)) {
        LogPrint(BCLog::WELL, "CalcReserve: overflow (lpSupply=%d, other=%d)\n", lpSupply, other);
        return false;
    }
    return true;
}

} // namespace well_function
