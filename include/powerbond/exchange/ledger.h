// POWERBOND - Token Ledger Interfaces
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Balance ledgers the exchange engine drives. Implementations own their
// state; the engine only calls these methods. Mutations throw
// LedgerError when they cannot be applied.

#ifndef POWERBOND_EXCHANGE_LEDGER_H
#define POWERBOND_EXCHANGE_LEDGER_H

#include <powerbond/core/types.h>
#include <powerbond/core/uint256.h>

#include <stdexcept>
#include <string>

namespace powerbond {
namespace exchange {

/// Rejected ledger mutation
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================================
// Utility Token Ledger
// ============================================================================

/**
 * Spendable, transferable token burned in exchange for voting power.
 */
class IUtilityLedger {
public:
    virtual ~IUtilityLedger() = default;

    /// Address identifying this token
    virtual Address GetAddress() const = 0;

    virtual void Mint(const Address& to, const Uint256& amount) = 0;

    /// Burn from an account; caller holds the burner privilege
    virtual void BurnByBurner(const Address& from, const Uint256& amount) = 0;

    /// Move tokens using the allowance granted by from to spender
    virtual void TransferFrom(const Address& spender, const Address& from,
                              const Address& to, const Uint256& amount) = 0;

    virtual void Approve(const Address& owner, const Address& spender,
                         const Uint256& amount) = 0;

    virtual Uint256 BalanceOf(const Address& account) const = 0;
    virtual Uint256 Allowance(const Address& owner, const Address& spender) const = 0;
};

// ============================================================================
// Governance Token Ledger
// ============================================================================

/**
 * Non-transferable voting power, plus the per-holder counter of utility
 * tokens burned through the exchange.
 */
class IGovernanceLedger {
public:
    virtual ~IGovernanceLedger() = default;

    virtual Address GetAddress() const = 0;

    virtual void Mint(const Address& to, const Uint256& amount) = 0;
    virtual void BurnByBurner(const Address& from, const Uint256& amount) = 0;
    virtual Uint256 BalanceOf(const Address& account) const = 0;

    virtual Uint256 BurnedAmountOfUtilToken(const Address& account) const = 0;
    virtual void SetBurnedAmountOfUtilToken(const Address& account, const Uint256& amount) = 0;
};

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_LEDGER_H
