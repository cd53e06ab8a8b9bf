// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_UTILMONEYSTR_H
#define PINTO_UTILMONEYSTR_H

#include "amount.h"

#include <string>

/** Render a bean amount with 6 decimals, trimming trailing zeros down to 2 */
std::string FormatMoney(const CAmount& n);

#endif // PINTO_UTILMONEYSTR_H
