// POWERBOND - Exchange Engine
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Converts utility tokens into voting power for signed intents submitted
// by an exchanger. The exchanger funds the burn: tokens move from the
// exchanger to the requester and are burned from the requester.

#ifndef POWERBOND_EXCHANGE_ENGINE_H
#define POWERBOND_EXCHANGE_ENGINE_H

#include <powerbond/core/types.h>
#include <powerbond/core/uint256.h>
#include <powerbond/exchange/access.h>
#include <powerbond/exchange/authorization.h>
#include <powerbond/exchange/cap_policy.h>
#include <powerbond/exchange/curve.h>
#include <powerbond/exchange/ledger.h>
#include <powerbond/exchange/replay_guard.h>

#include <functional>
#include <string>
#include <vector>

namespace powerbond {
namespace exchange {

// ============================================================================
// Exchange Status
// ============================================================================

/// Outcome of an exchange request
enum class ExchangeStatus {
    Success,
    Unauthorized,                 ///< Caller lacks the exchanger role
    AddressIsZero,                ///< Requester is the zero address
    AmountIsTooSmall,             ///< Amount below MIN_EXCHANGE_AMOUNT
    InvalidNonce,                 ///< Nonce already consumed
    SignatureExpired,             ///< now > expiration
    VotingPowerIsHigherThanCap,   ///< Requester already at or over the cap
    InvalidSignature,             ///< Signature does not match the requester
    InsufficientAllowance,        ///< Exchanger has not approved enough for the engine
    InsufficientBalance,          ///< Exchanger cannot fund the burn
};

/// Convert exchange status to string
const char* ExchangeStatusToString(ExchangeStatus status);

// ============================================================================
// Quote
// ============================================================================

/**
 * Grant computed for an amount on top of a holder's current state.
 */
struct ExchangeQuote {
    Uint256 currentVotingPower;
    Uint256 currentBurned;

    /// Voting power to mint
    Uint256 grantedPower;

    /// Utility tokens to burn (less than requested when capped)
    Uint256 burnAmount;

    /// True when the cap forced a partial fill
    bool capped{false};
};

/**
 * Grant for burning amount given a holder's state and the cap.
 * Requires currentVotingPower < cap.
 * @throws std::invalid_argument if currentVotingPower >= cap
 */
ExchangeQuote ComputeQuote(const Uint256& amount, const Uint256& currentBurned,
                           const Uint256& currentVotingPower, const Uint256& cap);

// ============================================================================
// Result
// ============================================================================

struct ExchangeResult {
    ExchangeStatus status{ExchangeStatus::Success};

    Address requester;

    /// Applied on success
    Uint256 burnAmount;
    Uint256 grantedPower;
    bool capped{false};

    /// InvalidSignature context
    Hash256 digest;
    std::vector<Byte> signature;

    /// VotingPowerIsHigherThanCap context
    Uint256 currentVotingPower;
    Uint256 cap;

    /// SignatureExpired context
    Timestamp expiration{0};
    Timestamp now{0};

    /// InsufficientAllowance / InsufficientBalance context
    Uint256 available;
    Uint256 required;

    bool Ok() const { return status == ExchangeStatus::Success; }

    /// One line description including the diagnostic context
    std::string ToString() const;
};

/// Emitted for every successful exchange
struct VotingPowerReceived {
    Address requester;
    Uint256 burnAmount;
    Uint256 grantedPower;
};

// ============================================================================
// Exchange Engine
// ============================================================================

/**
 * Orchestrates authorization, replay protection, curve math and the cap.
 *
 * Collaborators are borrowed and must outlive the engine. Calls must be
 * serialized by the host; the engine takes no locks.
 */
class ExchangeEngine {
public:
    using VotingPowerReceivedCallback = std::function<void(const VotingPowerReceived&)>;

    /**
     * @param engineAddress Account the engine acts as (spender of the
     *                      exchanger's allowance)
     */
    ExchangeEngine(const Address& engineAddress,
                   IUtilityLedger& utility,
                   IGovernanceLedger& governance,
                   const IAccessControl& access,
                   const AuthorizationVerifier& verifier,
                   ReplayGuard& replayGuard,
                   CapPolicy& capPolicy);

    ExchangeEngine(const ExchangeEngine&) = delete;
    ExchangeEngine& operator=(const ExchangeEngine&) = delete;

    /**
     * Burn the intent's amount (or the part that fits under the cap) and
     * mint the voting power it buys.
     *
     * Rejections leave every ledger and the nonce untouched.
     * @throws whatever a ledger throws once mutation has begun. Steps already
     *         applied are reversed and the nonce is released before the
     *         exception leaves; if the reversal fails the nonce stays spent.
     */
    ExchangeResult Exchange(const Address& caller, const ExchangeIntent& intent);

    /**
     * Preview of what Exchange would grant, without any checks on the
     * intent. Returns a quote with zero grant if the requester is at the cap.
     */
    ExchangeQuote QuoteExchange(const Address& requester, const Uint256& amount) const;

    /// Raise the cap; caller must hold the manager role
    CapUpdateStatus SetVotingPowerCap(const Address& caller, const Uint256& newCap);

    void SubscribeVotingPowerReceived(VotingPowerReceivedCallback callback);

    // ========================================================================
    // Accessors
    // ========================================================================

    const Uint256& GetVotingPowerCap() const { return capPolicy_.GetCap(); }
    const Hash256& GetExchangeTypeHash() const;
    const Hash256& GetDomainSeparator() const { return verifier_.GetDomainSeparator(); }

    static constexpr const Uint256& Precision() { return PRECISION; }
    static constexpr const Uint256& PrecisionFix() { return PRECISION_FIX; }
    static constexpr const Uint256& MinExchangeAmount() { return MIN_EXCHANGE_AMOUNT; }

    Address GetAddress() const { return address_; }
    Address GetUtilityToken() const { return utility_.GetAddress(); }
    Address GetGovernanceToken() const { return governance_.GetAddress(); }

    bool IsNonceUsed(const Address& requester, const Nonce& nonce) const {
        return replayGuard_.IsConsumed(requester, nonce);
    }

private:
    /// Ledger mutations of one exchange, in the order they are applied
    enum class AppliedStep {
        None,
        Transferred,
        Burned,
        BurnedCounterSet,
    };

    ExchangeResult Reject(ExchangeResult result, ExchangeStatus status) const;

    /// Reverse the steps up to and including applied; false if a ledger refused
    bool RollBack(AppliedStep applied, const Address& caller, const Address& requester,
                  const Uint256& burnAmount, const Uint256& allowance,
                  const Uint256& currentBurned) noexcept;

    Address address_;
    IUtilityLedger& utility_;
    IGovernanceLedger& governance_;
    const IAccessControl& access_;
    const AuthorizationVerifier& verifier_;
    ReplayGuard& replayGuard_;
    CapPolicy& capPolicy_;

    std::vector<VotingPowerReceivedCallback> subscribers_;
};

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_ENGINE_H
