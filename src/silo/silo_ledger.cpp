// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "silo/silo_ledger.h"

#include "logging.h"
#include "utilmoneystr.h"

#include <algorithm>

void CSiloLedger::SetBeanToken(const Address& token)
{
    beanToken = token;
}

void CSiloLedger::WhitelistToken(const Address& token, int64_t nSeeds)
{
    if (std::find(vWhitelist.begin(), vWhitelist.end(), token) == vWhitelist.end()) {
        vWhitelist.push_back(token);
    }
    mapSeeds[token] = nSeeds;
}

void CSiloLedger::SetStemTip(const Address& token, int64_t nStem)
{
    mapStemTips[token] = nStem;
}

void CSiloLedger::SetGerminatingStem(const Address& token, int64_t nStem)
{
    mapGerminatingStems[token] = nStem;
}

bool CSiloLedger::AddDeposit(const Address& account, const Address& token, int64_t nStem, CAmount amount)
{
    if (amount <= 0) {
        return error("%s: non-positive deposit %d", __func__, amount);
    }
    const CAmount deposited = GetDepositAmount(account, token, nStem);
    if (!MoneyRange(amount) || !MoneyRange(deposited + amount)) {
        return error("%s: deposit out of range", __func__);
    }
    mapDeposits[DepositKey(account, token)][nStem] = deposited + amount;

    LogPrint(BCLog::SILO, "%s: %s deposited %s %s at stem %d\n",
             __func__, account, FormatMoney(amount), token, nStem);
    return true;
}

bool CSiloLedger::AddWell(const CWellState& wellState)
{
    if (wellState.IsNull() || wellState.tokens.size() != wellState.reserves.size()) {
        return error("%s: malformed well %s", __func__, wellState.ToString());
    }
    mapWells[wellState.well] = wellState;
    return true;
}

std::vector<CDeposit> CSiloLedger::GetDeposits(const Address& account, const Address& token) const
{
    std::vector<CDeposit> deposits;
    DepositMap::const_iterator it = mapDeposits.find(DepositKey(account, token));
    if (it == mapDeposits.end()) {
        return deposits;
    }
    for (const auto& entry : it->second) {
        deposits.emplace_back(account, token, entry.first, entry.second);
    }
    return deposits;
}

CAmount CSiloLedger::GetDepositAmount(const Address& account, const Address& token, int64_t nStem) const
{
    DepositMap::const_iterator it = mapDeposits.find(DepositKey(account, token));
    if (it == mapDeposits.end()) {
        return 0;
    }
    std::map<int64_t, CAmount>::const_iterator itStem = it->second.find(nStem);
    return itStem == it->second.end() ? 0 : itStem->second;
}

int64_t CSiloLedger::GetStemTip(const Address& token) const
{
    std::map<Address, int64_t>::const_iterator it = mapStemTips.find(token);
    return it == mapStemTips.end() ? 0 : it->second;
}

int64_t CSiloLedger::GetGerminatingStem(const Address& token) const
{
    std::map<Address, int64_t>::const_iterator it = mapGerminatingStems.find(token);
    return it == mapGerminatingStems.end() ? STEM_MAX : it->second;
}

bool CSiloLedger::GetWellState(const Address& well, CWellState& wellState) const
{
    WellMap::const_iterator it = mapWells.find(well);
    if (it == mapWells.end()) {
        return false;
    }
    wellState = it->second;
    return true;
}

int64_t CSiloLedger::GetSeeds(const Address& token) const
{
    std::map<Address, int64_t>::const_iterator it = mapSeeds.find(token);
    return it == mapSeeds.end() ? 0 : it->second;
}

std::vector<Address> CSiloLedger::GetWhitelistedTokens() const
{
    return vWhitelist;
}

Address CSiloLedger::GetBeanToken() const
{
    return beanToken;
}

CAmount CSiloLedger::GetBalance(const Address& account, const Address& token, TransferMode mode) const
{
    BalanceMap::const_iterator it = mapBalances.find(BalanceKey(account, token, mode));
    return it == mapBalances.end() ? 0 : it->second;
}

bool CSiloLedger::SetDepositAmount(const Address& account, const Address& token, int64_t nStem, CAmount amount)
{
    if (!MoneyRange(amount)) {
        return false;
    }

    DepositMap::iterator it = mapDeposits.find(DepositKey(account, token));
    if (amount == 0) {
        if (it != mapDeposits.end()) {
            it->second.erase(nStem);
            if (it->second.empty()) mapDeposits.erase(it);
        }
        return true;
    }
    mapDeposits[DepositKey(account, token)][nStem] = amount;
    return true;
}

bool CSiloLedger::SetBalance(const Address& account, const Address& token, TransferMode mode, CAmount amount)
{
    if (!MoneyRange(amount)) {
        return false;
    }
    if (amount == 0) {
        mapBalances.erase(BalanceKey(account, token, mode));
        return true;
    }
    mapBalances[BalanceKey(account, token, mode)] = amount;
    return true;
}

bool CSiloLedger::SetWellState(const CWellState& wellState)
{
    if (wellState.IsNull() || mapWells.count(wellState.well) == 0) {
        return false;
    }
    mapWells[wellState.well] = wellState;
    return true;
}

CAmount CSiloLedger::GetTotalDeposited(const Address& account, const Address& token) const
{
    CAmount total = 0;
    for (const CDeposit& deposit : GetDeposits(account, token)) {
        total += deposit.amount;
    }
    return total;
}
