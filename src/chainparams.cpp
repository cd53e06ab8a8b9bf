// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"

#include "util/strprintf.h"

#include <stdexcept>

const std::string CBaseChainParams::MAIN = "main";
const std::string CBaseChainParams::TESTNET = "test";
const std::string CBaseChainParams::REGTEST = "regtest";

/**
 * Main network
 */
class CMainParams : public CChainParams
{
public:
    CMainParams()
    {
        strNetworkID = CBaseChainParams::MAIN;

        silo.nMaxSourceTokens = 254;
        silo.nPegPrice = PRICE_PRECISION;       // $1.00
        silo.nDefaultSlippageRatio = 10000000000000000LL; // 1%
    }
};

/**
 * Testnet
 */
class CTestNetParams : public CChainParams
{
public:
    CTestNetParams()
    {
        strNetworkID = CBaseChainParams::TESTNET;

        silo.nMaxSourceTokens = 254;
        silo.nPegPrice = PRICE_PRECISION;
        silo.nDefaultSlippageRatio = 20000000000000000LL; // 2%
    }
};

/**
 * Regression test
 */
class CRegTestParams : public CChainParams
{
public:
    CRegTestParams()
    {
        strNetworkID = CBaseChainParams::REGTEST;

        silo.nMaxSourceTokens = 16;
        silo.nPegPrice = PRICE_PRECISION;
        silo.nDefaultSlippageRatio = 50000000000000000LL; // 5%
    }
};

static std::unique_ptr<CChainParams> globalChainParams;

const CChainParams& Params()
{
    if (!globalChainParams) {
        globalChainParams = CreateChainParams(CBaseChainParams::MAIN);
    }
    return *globalChainParams;
}

std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain)
{
    if (chain == CBaseChainParams::MAIN)
        return std::unique_ptr<CChainParams>(new CMainParams());
    else if (chain == CBaseChainParams::TESTNET)
        return std::unique_ptr<CChainParams>(new CTestNetParams());
    else if (chain == CBaseChainParams::REGTEST)
        return std::unique_ptr<CChainParams>(new CRegTestParams());
    throw std::runtime_error(strprintf("%s: Unknown chain %s.", __func__, chain));
}

void SelectParams(const std::string& network)
{
    globalChainParams = CreateChainParams(network);
}
