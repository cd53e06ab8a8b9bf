// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_AMOUNT_H
#define PINTO_AMOUNT_H

#include <stdint.h>

/** Amount in token base units. Bean uses 6 decimals. */
typedef int64_t CAmount;

static const CAmount BEAN = 1000000;

/**
 * Upper bound for any single token amount handled by the silo engine.
 * 1e12 beans in base units, well below the int64 limit so that sums of a
 * handful of amounts cannot overflow.
 */
static const CAmount MAX_MONEY = 1000000000000LL * BEAN;

inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // PINTO_AMOUNT_H
