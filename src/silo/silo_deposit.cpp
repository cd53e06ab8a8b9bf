// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "silo/silo_deposit.h"

#include "util/strprintf.h"

std::string CDeposit::ToString() const
{
    return strprintf("CDeposit(account=%s, token=%s, stem=%d, amount=%d)",
                     account, token, nStem, amount);
}
