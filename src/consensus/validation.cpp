// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"

std::string SiloErrorString(SiloError code)
{
    switch (code) {
    case SiloError::NONE:                 return "none";
    case SiloError::INVALID_ARGUMENT:     return "invalid-argument";
    case SiloError::NO_LIQUIDITY:         return "no-liquidity";
    case SiloError::INSUFFICIENT_FUNDS:   return "insufficient-funds";
    case SiloError::PRICE_MANIPULATION:   return "price-manipulation";
    case SiloError::LEDGER_INCONSISTENCY: return "ledger-inconsistency";
    case SiloError::SLIPPAGE:             return "slippage";
    }
    return "unknown";
}

std::string CValidationState::ToString() const
{
    if (IsValid()) {
        return "Valid";
    }
    std::string str = strRejectReason;
    if (code != SiloError::NONE) {
        str += " (" + SiloErrorString(code) + ")";
    }
    if (!strDebugMessage.empty()) {
        str += ", " + strDebugMessage;
    }
    return str;
}
