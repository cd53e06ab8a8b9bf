// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_SILO_VIEW_H
#define PINTO_SILO_VIEW_H

#include "amount.h"
#include "silo/silo_deposit.h"
#include "well/well.h"

#include <map>
#include <stdint.h>
#include <string>
#include <tuple>
#include <vector>

class CValidationState;

/**
 * CSiloView - Abstract view on the silo ledger
 *
 * Read side: deposits, stem tips, germination boundaries, wells, seeds,
 * whitelist and balances. Write side: three primitives that overwrite a
 * deposit amount, a balance or a well. Higher level mutations are built
 * on the primitives (WithdrawDeposits, TransferToken, RemoveLiquidityOneToken).
 *
 * Deposit amounts of zero do not exist; setting a deposit to zero removes it.
 */
class CSiloView
{
public:
    /** Deposits of account in token, ascending by stem */
    virtual std::vector<CDeposit> GetDeposits(const Address& account, const Address& token) const;

    /** Amount of a single deposit, 0 if absent */
    virtual CAmount GetDepositAmount(const Address& account, const Address& token, int64_t nStem) const;

    /** Current stem tip of token */
    virtual int64_t GetStemTip(const Address& token) const;

    /** Lowest stem that is still germinating for token (STEM_MAX if none) */
    virtual int64_t GetGerminatingStem(const Address& token) const;

    /** Retrieve the state of a well, false if token is not a well */
    virtual bool GetWellState(const Address& well, CWellState& wellState) const;

    /** Seeds per BDV of a whitelisted token */
    virtual int64_t GetSeeds(const Address& token) const;

    /** Whitelisted tokens, in whitelist index order */
    virtual std::vector<Address> GetWhitelistedTokens() const;

    /** The silo's base asset */
    virtual Address GetBeanToken() const;

    virtual CAmount GetBalance(const Address& account, const Address& token, TransferMode mode) const;

    virtual bool SetDepositAmount(const Address& account, const Address& token, int64_t nStem, CAmount amount);
    virtual bool SetBalance(const Address& account, const Address& token, TransferMode mode, CAmount amount);
    virtual bool SetWellState(const CWellState& wellState);

    //! As we use CSiloViews polymorphically, have a virtual destructor
    virtual ~CSiloView() {}
};


/** CSiloView backed by another CSiloView */
class CSiloViewBacked : public CSiloView
{
protected:
    CSiloView* base;

public:
    explicit CSiloViewBacked(CSiloView* viewIn);

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
};


typedef std::pair<Address, Address> DepositKey;                      // (account, token)
typedef std::map<DepositKey, std::map<int64_t, CAmount>> DepositMap; // stem -> amount
typedef std::tuple<Address, Address, TransferMode> BalanceKey;        // (account, token, mode)
typedef std::map<BalanceKey, CAmount> BalanceMap;
typedef std::map<Address, CWellState> WellMap;

/**
 * CSiloViewCache - Buffers writes on top of another view
 *
 * Reads see the buffered writes. Nothing reaches the backing view until
 * Flush(), so discarding the cache discards every write made through it.
 */
class CSiloViewCache : public CSiloViewBacked
{
protected:
    DepositMap cacheDeposits;
    BalanceMap cacheBalances;
    WellMap cacheWells;

public:
    explicit CSiloViewCache(CSiloView* baseIn);

    /**
     * By deleting the copy constructor, we prevent accidentally using it when one intends to create a cache on top of a base cache.
     */
    CSiloViewCache(const CSiloViewCache&) = delete;

    std::vector<CDeposit> GetDeposits(const Address& account, const Address& token) const override;
    CAmount GetDepositAmount(const Address& account, const Address& token, int64_t nStem) const override;
    bool GetWellState(const Address& well, CWellState& wellState) const override;
    CAmount GetBalance(const Address& account, const Address& token, TransferMode mode) const override;
    bool SetDepositAmount(const Address& account, const Address& token, int64_t nStem, CAmount amount) override;
    bool SetBalance(const Address& account, const Address& token, TransferMode mode, CAmount amount) override;
    bool SetWellState(const CWellState& wellState) override;

    /**
     * Push the modifications applied to this cache to its base and wipe the cache.
     * Failure to call this method before destruction will cause the changes to be forgotten.
     */
    bool Flush();

    /** Number of buffered entries */
    size_t GetCacheSize() const;
};

/**
 * WithdrawDeposits - Remove amounts from deposits and send the tokens to recipient
 *
 * stems and amounts are aligned. Every listed amount must be positive and no
 * larger than the deposit it refers to.
 *
 * @param[in,out] view      Ledger view (deposits reduced, recipient credited)
 * @param[in]     account   Deposit owner
 * @param[in]     token     Deposited token
 * @param[in]     stems     Stems to withdraw from
 * @param[in]     amounts   Amount per stem
 * @param[in]     recipient Receiver of the withdrawn tokens
 * @param[in]     mode      Balance of recipient to credit
 * @param[out]    state     Failure details
 * @return true on success
 */
bool WithdrawDeposits(CSiloView& view,
                      const Address& account,
                      const Address& token,
                      const std::vector<int64_t>& stems,
                      const std::vector<CAmount>& amounts,
                      const Address& recipient,
                      TransferMode mode,
                      CValidationState& state);

/** Move amount of token between two balances */
bool TransferToken(CSiloView& view,
                   const Address& token,
                   CAmount amount,
                   const Address& from,
                   TransferMode fromMode,
                   const Address& to,
                   TransferMode toMode,
                   CValidationState& state);

#endif // PINTO_SILO_VIEW_H
