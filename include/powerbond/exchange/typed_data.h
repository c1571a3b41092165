// POWERBOND - Typed Structured Data Hashing
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Domain-separated digests for signed exchange intents (EIP-712 layout):
//
//   digest = keccak256(0x19 0x01 || domainSeparator || structHash)
//
// Every encoded field is one 32-byte big-endian word.

#ifndef POWERBOND_EXCHANGE_TYPED_DATA_H
#define POWERBOND_EXCHANGE_TYPED_DATA_H

#include <powerbond/core/types.h>
#include <powerbond/core/uint256.h>

#include <array>
#include <string>
#include <vector>

namespace powerbond {
namespace exchange {

/// Type descriptor of the signing domain
inline constexpr const char* EIP712_DOMAIN_TYPE =
    "EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)";

/// Type descriptor of an exchange intent
inline constexpr const char* EXCHANGE_TYPE =
    "Exchange(address requester,uint256 amount,bytes32 nonce,uint256 expiration)";

/// keccak256(EIP712_DOMAIN_TYPE)
const Hash256& DomainTypeHash();

/// keccak256(EXCHANGE_TYPE)
const Hash256& ExchangeTypeHash();

// ============================================================================
// Domain
// ============================================================================

/**
 * Context a signature is bound to. Two deployments with different
 * domains never accept each other's signatures.
 */
struct TypedDataDomain {
    std::string name;
    std::string version;
    Uint256 chainId;
    Address verifyingContract;

    /// keccak256(typeHash || keccak(name) || keccak(version) || chainId || contract)
    Hash256 Separator() const;

    bool operator==(const TypedDataDomain& other) const {
        return name == other.name && version == other.version &&
               chainId == other.chainId && verifyingContract == other.verifyingContract;
    }
};

// ============================================================================
// Encoding
// ============================================================================

/**
 * Builds a sequence of 32-byte ABI words.
 */
class AbiWordWriter {
public:
    AbiWordWriter& Write(const Hash256& word);
    AbiWordWriter& Write(const Uint256& value);

    /// Left-padded with zeros
    AbiWordWriter& Write(const Address& address);

    const std::vector<Byte>& Data() const { return data_; }

    Hash256 Hash() const;

private:
    std::vector<Byte> data_;
};

/**
 * Struct hash of an exchange intent.
 * @throws std::invalid_argument if expiration is negative
 */
Hash256 ExchangeStructHash(const Address& requester, const Uint256& amount,
                           const Nonce& nonce, Timestamp expiration);

/// keccak256(0x19 0x01 || domainSeparator || structHash)
Hash256 TypedDataDigest(const Hash256& domainSeparator, const Hash256& structHash);

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_TYPED_DATA_H
