// POWERBOND - Exchange Engine Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <powerbond/exchange/engine.h>
#include <powerbond/core/hex.h>
#include <powerbond/util/logging.h>
#include <powerbond/util/time.h>

#include <sstream>
#include <stdexcept>

namespace powerbond {
namespace exchange {

// ============================================================================
// ExchangeStatus Utilities
// ============================================================================

const char* ExchangeStatusToString(ExchangeStatus status) {
    switch (status) {
        case ExchangeStatus::Success:                    return "Success";
        case ExchangeStatus::Unauthorized:               return "Unauthorized";
        case ExchangeStatus::AddressIsZero:              return "AddressIsZero";
        case ExchangeStatus::AmountIsTooSmall:           return "AmountIsTooSmall";
        case ExchangeStatus::InvalidNonce:               return "InvalidNonce";
        case ExchangeStatus::SignatureExpired:           return "SignatureExpired";
        case ExchangeStatus::VotingPowerIsHigherThanCap: return "VotingPowerIsHigherThanCap";
        case ExchangeStatus::InvalidSignature:           return "InvalidSignature";
        case ExchangeStatus::InsufficientAllowance:      return "InsufficientAllowance";
        case ExchangeStatus::InsufficientBalance:        return "InsufficientBalance";
        default:                                         return "Unknown";
    }
}

// ============================================================================
// ExchangeResult
// ============================================================================

std::string ExchangeResult::ToString() const {
    std::ostringstream ss;
    ss << ExchangeStatusToString(status) << " requester=" << requester.ToString();

    switch (status) {
        case ExchangeStatus::Success:
            ss << " burned=" << burnAmount << " granted=" << grantedPower;
            if (capped) ss << " (capped)";
            break;
        case ExchangeStatus::InvalidSignature:
            ss << " digest=0x" << digest.ToHex() << " signature=0x" << BytesToHex(signature);
            break;
        case ExchangeStatus::VotingPowerIsHigherThanCap:
            ss << " votingPower=" << currentVotingPower << " cap=" << cap;
            break;
        case ExchangeStatus::SignatureExpired:
            ss << " expiration=" << expiration << " now=" << now;
            break;
        case ExchangeStatus::InsufficientAllowance:
        case ExchangeStatus::InsufficientBalance:
            ss << " available=" << available << " required=" << required;
            break;
        default:
            break;
    }
    return ss.str();
}

// ============================================================================
// Quote
// ============================================================================

ExchangeQuote ComputeQuote(const Uint256& amount, const Uint256& currentBurned,
                           const Uint256& currentVotingPower, const Uint256& cap) {
    if (currentVotingPower >= cap) {
        throw std::invalid_argument("voting power " + currentVotingPower.ToDecimal() +
                                    " already at cap " + cap.ToDecimal());
    }

    ExchangeQuote quote;
    quote.currentVotingPower = currentVotingPower;
    quote.currentBurned = currentBurned;
    quote.grantedPower = IncrementalVotingPower(amount, currentBurned);
    quote.burnAmount = amount;

    // Partial fill: charge exactly what reaching the cap costs
    if (currentVotingPower + quote.grantedPower > cap) {
        quote.grantedPower = cap - currentVotingPower;
        quote.burnAmount = IncrementalBurnedAmount(quote.grantedPower, currentVotingPower);
        quote.capped = true;
    }
    return quote;
}

// ============================================================================
// ExchangeEngine
// ============================================================================

ExchangeEngine::ExchangeEngine(const Address& engineAddress,
                               IUtilityLedger& utility,
                               IGovernanceLedger& governance,
                               const IAccessControl& access,
                               const AuthorizationVerifier& verifier,
                               ReplayGuard& replayGuard,
                               CapPolicy& capPolicy)
    : address_(engineAddress),
      utility_(utility),
      governance_(governance),
      access_(access),
      verifier_(verifier),
      replayGuard_(replayGuard),
      capPolicy_(capPolicy) {
    if (address_.IsZero()) {
        throw std::invalid_argument("engine address must not be zero");
    }
}

const Hash256& ExchangeEngine::GetExchangeTypeHash() const {
    return ExchangeTypeHash();
}

ExchangeResult ExchangeEngine::Reject(ExchangeResult result, ExchangeStatus status) const {
    result.status = status;
    LOG_DEBUG(util::LogCategory::EXCHANGE) << "Exchange rejected: " << result.ToString();
    return result;
}

ExchangeResult ExchangeEngine::Exchange(const Address& caller, const ExchangeIntent& intent) {
    ExchangeResult result;
    result.requester = intent.requester;

    if (!access_.HasRole(ExchangerRole(), caller)) {
        LOG_WARN(util::LogCategory::EXCHANGE) << caller.ToString()
                                              << " lacks the exchanger role";
        return Reject(std::move(result), ExchangeStatus::Unauthorized);
    }

    // Validation
    if (intent.requester.IsZero()) {
        return Reject(std::move(result), ExchangeStatus::AddressIsZero);
    }
    if (intent.amount < MIN_EXCHANGE_AMOUNT) {
        return Reject(std::move(result), ExchangeStatus::AmountIsTooSmall);
    }
    if (replayGuard_.IsConsumed(intent.requester, intent.nonce)) {
        return Reject(std::move(result), ExchangeStatus::InvalidNonce);
    }

    Timestamp now = util::GetTime();
    if (AuthorizationVerifier::IsExpired(intent, now)) {
        result.expiration = intent.expiration;
        result.now = now;
        return Reject(std::move(result), ExchangeStatus::SignatureExpired);
    }

    const Uint256& cap = capPolicy_.GetCap();
    Uint256 currentVotingPower = governance_.BalanceOf(intent.requester);
    if (currentVotingPower >= cap) {
        result.currentVotingPower = currentVotingPower;
        result.cap = cap;
        return Reject(std::move(result), ExchangeStatus::VotingPowerIsHigherThanCap);
    }

    // Authorization
    Hash256 digest = verifier_.Digest(intent);
    if (!verifier_.VerifyDigest(intent.requester, digest, intent.signature)) {
        result.digest = digest;
        result.signature = intent.signature;
        LOG_WARN(util::LogCategory::AUTH) << "Invalid signature from "
                                          << intent.requester.ToString();
        return Reject(std::move(result), ExchangeStatus::InvalidSignature);
    }

    ExchangeQuote quote = ComputeQuote(intent.amount,
                                       governance_.BurnedAmountOfUtilToken(intent.requester),
                                       currentVotingPower, cap);

    // The exchanger funds the burn
    Uint256 allowance = utility_.Allowance(caller, address_);
    if (allowance < quote.burnAmount) {
        result.available = allowance;
        result.required = quote.burnAmount;
        return Reject(std::move(result), ExchangeStatus::InsufficientAllowance);
    }
    Uint256 balance = utility_.BalanceOf(caller);
    if (balance < quote.burnAmount) {
        result.available = balance;
        result.required = quote.burnAmount;
        return Reject(std::move(result), ExchangeStatus::InsufficientBalance);
    }

    // Spent from here on, withdrawn again if anything below throws
    ReplayGuard::Reservation reservation = replayGuard_.Reserve(intent.requester, intent.nonce);

    Uint256 currentBurned = quote.currentBurned;
    AppliedStep applied = AppliedStep::None;
    try {
        utility_.TransferFrom(address_, caller, intent.requester, quote.burnAmount);
        applied = AppliedStep::Transferred;
        utility_.BurnByBurner(intent.requester, quote.burnAmount);
        applied = AppliedStep::Burned;

        governance_.SetBurnedAmountOfUtilToken(intent.requester,
                                               currentBurned + quote.burnAmount);
        applied = AppliedStep::BurnedCounterSet;
        governance_.Mint(intent.requester, quote.grantedPower);
    } catch (const std::exception& e) {
        LOG_FATAL(util::LogCategory::EXCHANGE) << "Exchange for " << intent.requester.ToString()
                                               << " failed after authorization: " << e.what();
        if (!RollBack(applied, caller, intent.requester, quote.burnAmount, allowance,
                      currentBurned)) {
            // Partially applied; the intent must not be honoured a second time
            reservation.Commit();
        }
        throw;
    }

    reservation.Commit();

    result.burnAmount = quote.burnAmount;
    result.grantedPower = quote.grantedPower;
    result.capped = quote.capped;

    LOG_INFO(util::LogCategory::EXCHANGE) << "VotingPowerReceived requester="
                                          << intent.requester.ToString()
                                          << " burned=" << quote.burnAmount
                                          << " granted=" << quote.grantedPower
                                          << (quote.capped ? " (capped)" : "");

    VotingPowerReceived event{intent.requester, quote.burnAmount, quote.grantedPower};
    for (const auto& callback : subscribers_) {
        callback(event);
    }
    return result;
}

bool ExchangeEngine::RollBack(AppliedStep applied, const Address& caller,
                              const Address& requester, const Uint256& burnAmount,
                              const Uint256& allowance, const Uint256& currentBurned) noexcept {
    try {
        if (applied == AppliedStep::BurnedCounterSet) {
            governance_.SetBurnedAmountOfUtilToken(requester, currentBurned);
        }
        if (applied == AppliedStep::Transferred) {
            // Still held by the requester
            utility_.BurnByBurner(requester, burnAmount);
        }
        if (applied != AppliedStep::None) {
            utility_.Mint(caller, burnAmount);
            utility_.Approve(caller, address_, allowance);
        }
    } catch (const std::exception& e) {
        LOG_FATAL(util::LogCategory::EXCHANGE) << "Cannot reverse exchange for "
                                               << requester.ToString() << ", nonce stays spent: "
                                               << e.what();
        return false;
    }

    if (applied != AppliedStep::None) {
        LOG_WARN(util::LogCategory::EXCHANGE) << "Reversed partial exchange for "
                                              << requester.ToString()
                                              << " burn=" << burnAmount;
    }
    return true;
}

ExchangeQuote ExchangeEngine::QuoteExchange(const Address& requester,
                                            const Uint256& amount) const {
    Uint256 currentVotingPower = governance_.BalanceOf(requester);
    Uint256 currentBurned = governance_.BurnedAmountOfUtilToken(requester);
    const Uint256& cap = capPolicy_.GetCap();

    if (currentVotingPower >= cap) {
        ExchangeQuote quote;
        quote.currentVotingPower = currentVotingPower;
        quote.currentBurned = currentBurned;
        quote.capped = true;
        return quote;
    }
    return ComputeQuote(amount, currentBurned, currentVotingPower, cap);
}

CapUpdateStatus ExchangeEngine::SetVotingPowerCap(const Address& caller, const Uint256& newCap) {
    if (!access_.HasRole(ManagerRole(), caller)) {
        LOG_WARN(util::LogCategory::CAP) << caller.ToString() << " lacks the manager role";
        return CapUpdateStatus::Unauthorized;
    }
    return capPolicy_.SetCap(newCap);
}

void ExchangeEngine::SubscribeVotingPowerReceived(VotingPowerReceivedCallback callback) {
    if (callback) {
        subscribers_.push_back(std::move(callback));
    }
}

} // namespace exchange
} // namespace powerbond
