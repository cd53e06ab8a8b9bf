// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "silo/silo_view.h"

#include "consensus/validation.h"
#include "logging.h"
#include "utilmoneystr.h"

std::vector<CDeposit> CSiloView::GetDeposits(const Address& account, const Address& token) const { return std::vector<CDeposit>(); }
CAmount CSiloView::GetDepositAmount(const Address& account, const Address& token, int64_t nStem) const { return 0; }
int64_t CSiloView::GetStemTip(const Address& token) const { return 0; }
int64_t CSiloView::GetGerminatingStem(const Address& token) const { return STEM_MAX; }
bool CSiloView::GetWellState(const Address& well, CWellState& wellState) const { return false; }
int64_t CSiloView::GetSeeds(const Address& token) const { return 0; }
std::vector<Address> CSiloView::GetWhitelistedTokens() const { return std::vector<Address>(); }
Address CSiloView::GetBeanToken() const { return Address(); }
CAmount CSiloView::GetBalance(const Address& account, const Address& token, TransferMode mode) const { return 0; }
bool CSiloView::SetDepositAmount(const Address& account, const Address& token, int64_t nStem, CAmount amount) { return false; }
bool CSiloView::SetBalance(const Address& account, const Address& token, TransferMode mode, CAmount amount) { return false; }
bool CSiloView::SetWellState(const CWellState& wellState) { return false; }


CSiloViewBacked::CSiloViewBacked(CSiloView* viewIn) : base(viewIn) {}
std::vector<CDeposit> CSiloViewBacked::GetDeposits(const Address& account, const Address& token) const { return base->GetDeposits(account, token); }
CAmount CSiloViewBacked::GetDepositAmount(const Address& account, const Address& token, int64_t nStem) const { return base->GetDepositAmount(account, token, nStem); }
int64_t CSiloViewBacked::GetStemTip(const Address& token) const { return base->GetStemTip(token); }
int64_t CSiloViewBacked::GetGerminatingStem(const Address& token) const { return base->GetGerminatingStem(token); }
bool CSiloViewBacked::GetWellState(const Address& well, CWellState& wellState) const { return base->GetWellState(well, wellState); }
int64_t CSiloViewBacked::GetSeeds(const Address& token) const { return base->GetSeeds(token); }
std::vector<Address> CSiloViewBacked::GetWhitelistedTokens() const { return base->GetWhitelistedTokens(); }
Address CSiloViewBacked::GetBeanToken() const { return base->GetBeanToken(); }
CAmount CSiloViewBacked::GetBalance(const Address& account, const Address& token, TransferMode mode) const { return base->GetBalance(account, token, mode); }
bool CSiloViewBacked::SetDepositAmount(const Address& account, const Address& token, int64_t nStem, CAmount amount) { return base->SetDepositAmount(account, token, nStem, amount); }
bool CSiloViewBacked::SetBalance(const Address& account, const Address& token, TransferMode mode, CAmount amount) { return base->SetBalance(account, token, mode, amount); }
bool CSiloViewBacked::SetWellState(const CWellState& wellState) { return base->SetWellState(wellState); }


CSiloViewCache::CSiloViewCache(CSiloView* baseIn) : CSiloViewBacked(baseIn) {}

std::vector<CDeposit> CSiloViewCache::GetDeposits(const Address& account, const Address& token) const
{
    DepositMap::const_iterator it = cacheDeposits.find(DepositKey(account, token));
    if (it == cacheDeposits.end()) {
        return base->GetDeposits(account, token);
    }

    // Overlay buffered amounts on the base deposits, keyed by stem so the result stays ascending
    std::map<int64_t, CAmount> merged;
    for (const CDeposit& deposit : base->GetDeposits(account, token)) {
        merged[deposit.nStem] = deposit.amount;
    }
    for (const auto& entry : it->second) {
        merged[entry.first] = entry.second;
    }

    std::vector<CDeposit> deposits;
    for (const auto& entry : merged) {
        if (entry.second > 0) {
            deposits.emplace_back(account, token, entry.first, entry.second);
        }
    }
    return deposits;
}

CAmount CSiloViewCache::GetDepositAmount(const Address& account, const Address& token, int64_t nStem) const
{
    DepositMap::const_iterator it = cacheDeposits.find(DepositKey(account, token));
    if (it != cacheDeposits.end()) {
        std::map<int64_t, CAmount>::const_iterator itStem = it->second.find(nStem);
        if (itStem != it->second.end()) {
            return itStem->second;
        }
    }
    return base->GetDepositAmount(account, token, nStem);
}

bool CSiloViewCache::GetWellState(const Address& well, CWellState& wellState) const
{
    WellMap::const_iterator it = cacheWells.find(well);
    if (it != cacheWells.end()) {
        wellState = it->second;
        return true;
    }
    return base->GetWellState(well, wellState);
}

CAmount CSiloViewCache::GetBalance(const Address& account, const Address& token, TransferMode mode) const
{
    BalanceMap::const_iterator it = cacheBalances.find(BalanceKey(account, token, mode));
    if (it != cacheBalances.end()) {
        return it->second;
    }
    return base->GetBalance(account, token, mode);
}

bool CSiloViewCache::SetDepositAmount(const Address& account, const Address& token, int64_t nStem, CAmount amount)
{
    if (!MoneyRange(amount)) {
        return false;
    }
    cacheDeposits[DepositKey(account, token)][nStem] = amount;
    return true;
}

bool CSiloViewCache::SetBalance(const Address& account, const Address& token, TransferMode mode, CAmount amount)
{
    if (!MoneyRange(amount)) {
        return false;
    }
    cacheBalances[BalanceKey(account, token, mode)] = amount;
    return true;
}

bool CSiloViewCache::SetWellState(const CWellState& wellState)
{
    if (wellState.IsNull()) {
        return false;
    }
    cacheWells[wellState.well] = wellState;
    return true;
}

bool CSiloViewCache::Flush()
{
    bool fOk = true;
    for (const auto& entry : cacheWells) {
        fOk &= base->SetWellState(entry.second);
    }
    for (const auto& entry : cacheDeposits) {
        for (const auto& stemEntry : entry.second) {
            fOk &= base->SetDepositAmount(entry.first.first, entry.first.second, stemEntry.first, stemEntry.second);
        }
    }
    for (const auto& entry : cacheBalances) {
        fOk &= base->SetBalance(std::get<0>(entry.first), std::get<1>(entry.first), std::get<2>(entry.first), entry.second);
    }

    cacheWells.clear();
    cacheDeposits.clear();
    cacheBalances.clear();
    return fOk;
}

size_t CSiloViewCache::GetCacheSize() const
{
    size_t nSize = cacheWells.size() + cacheBalances.size();
    for (const auto& entry : cacheDeposits) {
        nSize += entry.second.size();
    }
    return nSize;
}

// ============================================================================
// Composite writes
// ============================================================================

bool WithdrawDeposits(CSiloView& view,
                      const Address& account,
                      const Address& token,
                      const std::vector<int64_t>& stems,
                      const std::vector<CAmount>& amounts,
                      const Address& recipient,
                      TransferMode mode,
                      CValidationState& state)
{
    if (stems.size() != amounts.size()) {
        return state.Invalid(error("%s: %u stems vs %u amounts", __func__, stems.size(), amounts.size()),
                             SiloError::INVALID_ARGUMENT, "silo-withdraw-misaligned");
    }

    CAmount total = 0;
    for (size_t i = 0; i < stems.size(); ++i) {
        const CAmount deposited = view.GetDepositAmount(account, token, stems[i]);
        if (amounts[i] <= 0) {
            return state.Invalid(error("%s: non-positive amount %d at stem %d", __func__, amounts[i], stems[i]),
                                 SiloError::INVALID_ARGUMENT, "silo-withdraw-bad-amount");
        }
        if (amounts[i] > deposited) {
            return state.Invalid(error("%s: %s %s stem %d holds %d, asked %d", __func__, account, token,
                                       stems[i], deposited, amounts[i]),
                                 SiloError::LEDGER_INCONSISTENCY, "silo-withdraw-exceeds-deposit");
        }
        if (!view.SetDepositAmount(account, token, stems[i], deposited - amounts[i])) {
            return state.Error("silo-write-failed");
        }
        total += amounts[i];
    }

    if (total == 0) {
        return true;
    }

    const CAmount balance = view.GetBalance(recipient, token, mode);
    if (!view.SetBalance(recipient, token, mode, balance + total)) {
        return state.Error("silo-write-failed");
    }

    LogPrint(BCLog::SILO, "%s: %s withdrew %s %s from %u deposits to %s\n",
             __func__, account, FormatMoney(total), token, stems.size(), recipient);
    return true;
}

bool TransferToken(CSiloView& view,
                   const Address& token,
                   CAmount amount,
                   const Address& from,
                   TransferMode fromMode,
                   const Address& to,
                   TransferMode toMode,
                   CValidationState& state)
{
    if (amount < 0) {
        return state.Invalid(error("%s: negative amount %d", __func__, amount),
                             SiloError::INVALID_ARGUMENT, "silo-transfer-bad-amount");
    }
    if (amount == 0) {
        return true;
    }

    const CAmount fromBalance = view.GetBalance(from, token, fromMode);
    if (fromBalance < amount) {
        return state.Invalid(error("%s: %s holds %d %s, asked %d", __func__, from, fromBalance, token, amount),
                             SiloError::LEDGER_INCONSISTENCY, "silo-transfer-balance-too-low");
    }
    if (!view.SetBalance(from, token, fromMode, fromBalance - amount)) {
        return state.Error("silo-write-failed");
    }

    // Read after the debit so a self-transfer nets out
    const CAmount toBalance = view.GetBalance(to, token, toMode);
    if (!view.SetBalance(to, token, toMode, toBalance + amount)) {
        return state.Error("silo-write-failed");
    }
    return true;
}
