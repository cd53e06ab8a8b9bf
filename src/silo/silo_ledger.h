// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_SILO_LEDGER_H
#define PINTO_SILO_LEDGER_H

#include "silo/silo_view.h"

#include <map>
#include <vector>

/**
 * CSiloLedger - In-memory silo ledger
 *
 * Holds the persistent side of the silo: whitelist with seeds, stem tips,
 * germination boundaries, deposits, balances and wells. It is the bottom
 * of every view stack; the withdrawal engine only reaches it through a
 * CSiloViewCache.
 */
class CSiloLedger : public CSiloView
{
private:
    Address beanToken;
    std::vector<Address> vWhitelist;
    std::map<Address, int64_t> mapSeeds;
    std::map<Address, int64_t> mapStemTips;
    std::map<Address, int64_t> mapGerminatingStems;
    DepositMap mapDeposits;
    BalanceMap mapBalances;
    WellMap mapWells;

public:
    // Setup
    void SetBeanToken(const Address& token);
    /** Append token to the whitelist; re-whitelisting only updates the seeds */
    void WhitelistToken(const Address& token, int64_t nSeeds);
    void SetStemTip(const Address& token, int64_t nStem);
    void SetGerminatingStem(const Address& token, int64_t nStem);
    /** Add amount to the deposit at (account, token, nStem) */
    bool AddDeposit(const Address& account, const Address& token, int64_t nStem, CAmount amount);
    bool AddWell(const CWellState& wellState);

    // CSiloView
    std::vector<CDeposit> GetDeposits(const Address& account, const Address& token) const override;
    CAmount GetDepositAmount(const Address& account, const Address& token, int64_t nStem) const override;
    int64_t GetStemTip(const Address& token) const override;
    int64_t GetGerminatingStem(const Address& token) const override;
    bool GetWellState(const Address& well, CWellState& wellState) const override;
    int64_t GetSeeds(const Address& token) const override;
    std::vector<Address> GetWhitelistedTokens() const override;
    Address GetBeanToken() const override;
    CAmount GetBalance(const Address& account, const Address& token, TransferMode mode) const override;
    bool SetDepositAmount(const Address& account, const Address& token, int64_t nStem, CAmount amount) override;
    bool SetBalance(const Address& account, const Address& token, TransferMode mode, CAmount amount) override;
    bool SetWellState(const CWellState& wellState) override;

    /** Sum of all deposits of account in token */
    CAmount GetTotalDeposited(const Address& account, const Address& token) const;
};

#endif // PINTO_SILO_LEDGER_H
