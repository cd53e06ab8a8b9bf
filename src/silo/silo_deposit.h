// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_SILO_DEPOSIT_H
#define PINTO_SILO_DEPOSIT_H

#include "amount.h"

#include <limits>
#include <stdint.h>
#include <string>

/** Account or token identifier as known to the ledger */
typedef std::string Address;

static constexpr int64_t STEM_MIN = std::numeric_limits<int64_t>::min();
static constexpr int64_t STEM_MAX = std::numeric_limits<int64_t>::max();

/** Which balance of an account receives or provides tokens */
enum class TransferMode : uint8_t {
    EXTERNAL = 0, //!< wallet balance
    INTERNAL = 1, //!< protocol-internal balance
};

/**
 * CDeposit - One silo deposit of an account
 *
 * The stem is a per-token counter recorded at deposit time. A higher stem
 * means a more recent deposit with less grown stalk. Deposits are created by
 * the ledger; the withdrawal engine only ever reduces their amount.
 */
struct CDeposit
{
    Address account;
    Address token;
    int64_t nStem;
    CAmount amount;

    CDeposit()
    {
        SetNull();
    }

    CDeposit(const Address& accountIn, const Address& tokenIn, int64_t nStemIn, CAmount amountIn)
        : account(accountIn),
          token(tokenIn),
          nStem(nStemIn),
          amount(amountIn)
    {}

    void SetNull()
    {
        account.clear();
        token.clear();
        nStem = 0;
        amount = 0;
    }

    bool IsNull() const
    {
        return (amount == 0 && token.empty());
    }

    std::string ToString() const;
};

#endif // PINTO_SILO_DEPOSIT_H
