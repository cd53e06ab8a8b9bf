// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_CHAINPARAMS_H
#define PINTO_CHAINPARAMS_H

#include "amount.h"

#include <memory>
#include <stddef.h>
#include <string>

/** Network names accepted by SelectParams() */
class CBaseChainParams
{
public:
    static const std::string MAIN;
    static const std::string TESTNET;
    static const std::string REGTEST;
};

/** Precision of bean prices (6 decimals, 1e6 == $1) */
static const CAmount PRICE_PRECISION = 1000000;

namespace Silo {

/**
 * Parameters of the withdrawal plan engine that differ per network.
 */
struct Params {
    /**
     * Maximum number of explicit source indices accepted in one call.
     * Whitelist indices are 8 bit wide and the top two values were
     * historically reserved for the strategy sentinels.
     */
    size_t nMaxSourceTokens;
    /** Bean price used when ordering sources by ascending price (PRICE_PRECISION) */
    CAmount nPegPrice;
    /** Default tolerated deviation between instantaneous and time-weighted price (1e18 == 100%) */
    int64_t nDefaultSlippageRatio;
};

} // namespace Silo

/**
 * CChainParams defines the per-network tunables of the silo engine.
 */
class CChainParams
{
public:
    const Silo::Params& GetSilo() const { return silo; }
    /** Return the network string */
    std::string NetworkIDString() const { return strNetworkID; }
    bool IsRegTestNet() const { return strNetworkID == CBaseChainParams::REGTEST; }

protected:
    CChainParams() {}

    std::string strNetworkID;
    Silo::Params silo;
};

/**
 * Creates and returns a std::unique_ptr<CChainParams> of the chosen chain.
 * @returns a CChainParams* of the chosen chain.
 * @throws a std::runtime_error if the chain is not supported.
 */
std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain);

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CChainParams& Params();

/**
 * Sets the params returned by Params() to those for the given network.
 * @throws std::runtime_error when the chain is not supported.
 */
void SelectParams(const std::string& chain);

#endif // PINTO_CHAINPARAMS_H
