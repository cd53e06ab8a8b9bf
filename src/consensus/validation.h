// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_CONSENSUS_VALIDATION_H
#define PINTO_CONSENSUS_VALIDATION_H

#include <string>

/**
 * Failure classes of the silo withdrawal engine.
 *
 * None of them is retried internally. Every failing operation leaves the
 * ledger exactly as it found it.
 */
enum class SiloError {
    NONE = 0,
    INVALID_ARGUMENT,     //!< caller-fixable input problem (empty sources, zero target, bad index)
    NO_LIQUIDITY,         //!< every candidate source yielded zero
    INSUFFICIENT_FUNDS,   //!< plan covers less than the caller requires
    PRICE_MANIPULATION,   //!< well price outside the tolerated band at execution time
    LEDGER_INCONSISTENCY, //!< plan claims more than a deposit or balance holds
    SLIPPAGE,             //!< liquidity removal returned less than the planned minimum
};

std::string SiloErrorString(SiloError code);

/** Capture information about the outcome of a planning or execution call */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< rejected input or ledger state
        MODE_ERROR,   //!< run-time error
    } mode;
    SiloError code;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), code(SiloError::NONE) {}

    bool Invalid(bool ret = false,
                 SiloError codeIn = SiloError::NONE,
                 const std::string& strRejectReasonIn = "",
                 const std::string& strDebugMessageIn = "")
    {
        code = codeIn;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }
    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const { return mode == MODE_VALID; }
    bool IsInvalid() const { return mode == MODE_INVALID; }
    bool IsError() const { return mode == MODE_ERROR; }
    SiloError GetError() const { return code; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
    std::string ToString() const;
};

#endif // PINTO_CONSENSUS_VALIDATION_H
