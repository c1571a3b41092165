// POWERBOND - Signature Verification
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// A signer is either a plain key (secp256k1 recovery) or a programmable
// account that validates signatures itself and answers with a magic value.

#ifndef POWERBOND_EXCHANGE_SIGNATURE_CHECKER_H
#define POWERBOND_EXCHANGE_SIGNATURE_CHECKER_H

#include <powerbond/core/types.h>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace powerbond {
namespace exchange {

/// Value a programmable account returns for a valid signature
inline constexpr uint32_t DELEGATED_MAGIC_VALUE = 0x1626ba7e;

/// Validation logic of a programmable account
using AccountValidator =
    std::function<uint32_t(const Hash256& digest, const std::vector<Byte>& signature)>;

// ============================================================================
// Account Registry
// ============================================================================

/**
 * Registry of programmable accounts and their validators.
 *
 * Thread-safe.
 */
class AccountRegistry {
public:
    /// Register or replace the validator of an account
    /// @throws std::invalid_argument for the zero address or an empty validator
    void Register(const Address& account, AccountValidator validator);

    /// @return true if the account was registered
    bool Unregister(const Address& account);

    bool IsProgrammable(const Address& account) const;

    /// Run the account's validator; nullopt if the account is unknown
    std::optional<uint32_t> Validate(const Address& account, const Hash256& digest,
                                     const std::vector<Byte>& signature) const;

    size_t Size() const;

private:
    std::map<Address, AccountValidator> accounts_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Verifiers
// ============================================================================

/// Recovers the signing key and compares its address with the signer
struct DirectKeyVerifier {
    bool Verify(const Address& signer, const Hash256& digest,
                const std::vector<Byte>& signature) const;
};

/// Delegates validation to the signer's registered account logic
class DelegatedAccountVerifier {
public:
    explicit DelegatedAccountVerifier(const AccountRegistry& registry)
        : registry_(&registry) {}

    bool Verify(const Address& signer, const Hash256& digest,
                const std::vector<Byte>& signature) const;

    /// Whether this verifier has an opinion about the signer at all
    bool Handles(const Address& signer) const { return registry_->IsProgrammable(signer); }

private:
    const AccountRegistry* registry_;
};

using SignatureVerifier = std::variant<DirectKeyVerifier, DelegatedAccountVerifier>;

/// Dispatch to whichever verifier the variant holds
bool VerifySignature(const SignatureVerifier& verifier, const Address& signer,
                     const Hash256& digest, const std::vector<Byte>& signature);

/// Short name of the variant held ("direct" or "delegated")
const char* VerifierName(const SignatureVerifier& verifier);

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_SIGNATURE_CHECKER_H
