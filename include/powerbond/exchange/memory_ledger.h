// POWERBOND - In-Memory Token Ledgers
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Map-backed ledgers used by tests and the command line tool.

#ifndef POWERBOND_EXCHANGE_MEMORY_LEDGER_H
#define POWERBOND_EXCHANGE_MEMORY_LEDGER_H

#include <powerbond/exchange/ledger.h>

#include <map>
#include <mutex>
#include <utility>

namespace powerbond {
namespace exchange {

class MemoryUtilityLedger : public IUtilityLedger {
public:
    explicit MemoryUtilityLedger(const Address& tokenAddress) : address_(tokenAddress) {}

    Address GetAddress() const override { return address_; }

    void Mint(const Address& to, const Uint256& amount) override;
    void BurnByBurner(const Address& from, const Uint256& amount) override;
    void TransferFrom(const Address& spender, const Address& from,
                      const Address& to, const Uint256& amount) override;
    void Approve(const Address& owner, const Address& spender,
                 const Uint256& amount) override;

    Uint256 BalanceOf(const Address& account) const override;
    Uint256 Allowance(const Address& owner, const Address& spender) const override;

    Uint256 TotalSupply() const;

private:
    Address address_;
    std::map<Address, Uint256> balances_;
    std::map<std::pair<Address, Address>, Uint256> allowances_;
    Uint256 totalSupply_;
    mutable std::mutex mutex_;
};

class MemoryGovernanceLedger : public IGovernanceLedger {
public:
    explicit MemoryGovernanceLedger(const Address& tokenAddress) : address_(tokenAddress) {}

    Address GetAddress() const override { return address_; }

    void Mint(const Address& to, const Uint256& amount) override;
    void BurnByBurner(const Address& from, const Uint256& amount) override;
    Uint256 BalanceOf(const Address& account) const override;

    Uint256 BurnedAmountOfUtilToken(const Address& account) const override;
    void SetBurnedAmountOfUtilToken(const Address& account, const Uint256& amount) override;

    Uint256 TotalSupply() const;

private:
    Address address_;
    std::map<Address, Uint256> balances_;
    std::map<Address, Uint256> burned_;
    Uint256 totalSupply_;
    mutable std::mutex mutex_;
};

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_MEMORY_LEDGER_H
