// POWERBOND - In-Memory Token Ledgers Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <powerbond/exchange/memory_ledger.h>

namespace powerbond {
namespace exchange {

namespace {

Uint256 Lookup(const std::map<Address, Uint256>& map, const Address& account) {
    auto it = map.find(account);
    return it == map.end() ? Uint256() : it->second;
}

void Debit(std::map<Address, Uint256>& balances, const Address& from,
           const Uint256& amount) {
    Uint256 balance = Lookup(balances, from);
    if (balance < amount) {
        throw LedgerError("insufficient balance of " + from.ToString() + ": have " +
                          balance.ToDecimal() + ", need " + amount.ToDecimal());
    }
    balances[from] = balance - amount;
}

void RequireNonZero(const Address& account, const char* what) {
    if (account.IsZero()) {
        throw LedgerError(std::string(what) + " is the zero address");
    }
}

} // namespace

// ============================================================================
// MemoryUtilityLedger
// ============================================================================

void MemoryUtilityLedger::Mint(const Address& to, const Uint256& amount) {
    RequireNonZero(to, "mint recipient");
    std::lock_guard<std::mutex> lock(mutex_);
    Uint256 supply = totalSupply_ + amount;
    balances_[to] += amount;
    totalSupply_ = supply;
}

void MemoryUtilityLedger::BurnByBurner(const Address& from, const Uint256& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Debit(balances_, from, amount);
    totalSupply_ -= amount;
}

void MemoryUtilityLedger::TransferFrom(const Address& spender, const Address& from,
                                       const Address& to, const Uint256& amount) {
    RequireNonZero(to, "transfer recipient");
    std::lock_guard<std::mutex> lock(mutex_);

    auto key = std::make_pair(from, spender);
    auto it = allowances_.find(key);
    Uint256 allowance = it == allowances_.end() ? Uint256() : it->second;
    if (allowance < amount) {
        throw LedgerError("insufficient allowance of " + spender.ToString() + " over " +
                          from.ToString() + ": have " + allowance.ToDecimal() +
                          ", need " + amount.ToDecimal());
    }

    Debit(balances_, from, amount);
    balances_[to] += amount;
    if (allowance != Uint256::Max()) {
        allowances_[key] = allowance - amount;
    }
}

void MemoryUtilityLedger::Approve(const Address& owner, const Address& spender,
                                  const Uint256& amount) {
    RequireNonZero(owner, "approver");
    RequireNonZero(spender, "spender");
    std::lock_guard<std::mutex> lock(mutex_);
    allowances_[std::make_pair(owner, spender)] = amount;
}

Uint256 MemoryUtilityLedger::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Lookup(balances_, account);
}

Uint256 MemoryUtilityLedger::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find(std::make_pair(owner, spender));
    return it == allowances_.end() ? Uint256() : it->second;
}

Uint256 MemoryUtilityLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

// ============================================================================
// MemoryGovernanceLedger
// ============================================================================

void MemoryGovernanceLedger::Mint(const Address& to, const Uint256& amount) {
    RequireNonZero(to, "mint recipient");
    std::lock_guard<std::mutex> lock(mutex_);
    Uint256 supply = totalSupply_ + amount;
    balances_[to] += amount;
    totalSupply_ = supply;
}

void MemoryGovernanceLedger::BurnByBurner(const Address& from, const Uint256& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Debit(balances_, from, amount);
    totalSupply_ -= amount;
}

Uint256 MemoryGovernanceLedger::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Lookup(balances_, account);
}

Uint256 MemoryGovernanceLedger::BurnedAmountOfUtilToken(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Lookup(burned_, account);
}

void MemoryGovernanceLedger::SetBurnedAmountOfUtilToken(const Address& account,
                                                       const Uint256& amount) {
    RequireNonZero(account, "holder");
    std::lock_guard<std::mutex> lock(mutex_);
    burned_[account] = amount;
}

Uint256 MemoryGovernanceLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

} // namespace exchange
} // namespace powerbond
