// POWERBOND - Exchange Authorization
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Checks that an exchange intent was signed by its requester for this
// domain and has not expired.

#ifndef POWERBOND_EXCHANGE_AUTHORIZATION_H
#define POWERBOND_EXCHANGE_AUTHORIZATION_H

#include <powerbond/core/types.h>
#include <powerbond/core/uint256.h>
#include <powerbond/exchange/signature_checker.h>
#include <powerbond/exchange/typed_data.h>

#include <vector>

namespace powerbond {
namespace exchange {

// ============================================================================
// Exchange Intent
// ============================================================================

/**
 * A signed request to burn utility tokens for voting power.
 * Built by the caller and consumed by a single Exchange call.
 */
struct ExchangeIntent {
    /// Account that signed the intent and receives the voting power
    Address requester;

    /// Utility tokens offered for burning
    Uint256 amount;

    /// One-time token, unique per requester
    Nonce nonce;

    /// Unix time after which the intent is void
    Timestamp expiration{0};

    /// r || s || v over the typed-data digest
    std::vector<Byte> signature;
};

// ============================================================================
// Authorization Verifier
// ============================================================================

class AuthorizationVerifier {
public:
    /**
     * @param domain   Signing domain of this deployment
     * @param accounts Programmable accounts; nullptr accepts plain keys only
     */
    explicit AuthorizationVerifier(TypedDataDomain domain,
                                   const AccountRegistry* accounts = nullptr);

    const TypedDataDomain& GetDomain() const { return domain_; }
    const Hash256& GetDomainSeparator() const { return domainSeparator_; }

    /// Typed-data digest the requester must have signed
    /// @throws std::invalid_argument if the expiration is negative
    Hash256 Digest(const ExchangeIntent& intent) const;

    /**
     * Check the signature against the requester.
     * Plain key recovery is tried first; a programmable account's own
     * validator is consulted when recovery does not match.
     * @throws std::invalid_argument if the expiration is negative
     */
    bool Verify(const ExchangeIntent& intent) const;

    /// Same check for a digest computed by the caller
    bool VerifyDigest(const Address& signer, const Hash256& digest,
                      const std::vector<Byte>& signature) const;

    /// True iff expiration < now
    static bool IsExpired(const ExchangeIntent& intent, Timestamp now) {
        return intent.expiration < now;
    }

private:
    TypedDataDomain domain_;
    Hash256 domainSeparator_;

    /// Tried in order
    std::vector<SignatureVerifier> verifiers_;
};

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_AUTHORIZATION_H
