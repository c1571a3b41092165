// POWERBOND - secp256k1 Elliptic Curve Operations
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Low-level secp256k1 operations backed by OpenSSL.
// For high-level key operations, see keys.h instead.

#ifndef POWERBOND_CRYPTO_SECP256K1_H
#define POWERBOND_CRYPTO_SECP256K1_H

#include <cstdint>
#include <cstddef>
#include <array>
#include "powerbond/core/types.h"

namespace powerbond {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Private key size (32 bytes)
constexpr size_t PRIVATE_KEY_SIZE = 32;

/// Uncompressed public key size (65 bytes: 0x04 + 32 bytes X + 32 bytes Y)
constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;

/// Recoverable signature size (65 bytes: 32 R + 32 S + 1 V)
constexpr size_t RECOVERABLE_SIGNATURE_SIZE = 65;

/// Curve order n
extern const std::array<Byte, 32> CURVE_ORDER;

/// n / 2, the largest accepted S value
extern const std::array<Byte, 32> HALF_CURVE_ORDER;

// ============================================================================
// Key Operations
// ============================================================================

/// Check that a 32-byte big-endian scalar lies in [1, n-1]
bool IsValidPrivateKey(const Byte privateKey[PRIVATE_KEY_SIZE]);

/// Derive the uncompressed public key for a private key
/// @return false if the private key is out of range
bool ComputePublicKey(const Byte privateKey[PRIVATE_KEY_SIZE],
                      Byte publicKey[UNCOMPRESSED_PUBKEY_SIZE]);

// ============================================================================
// Recoverable ECDSA
// ============================================================================

/// True if the big-endian S value is at most n/2
bool IsLowS(const Byte s[32]);

/**
 * Sign a 32-byte digest producing r || s || v.
 *
 * S is normalised to the lower half of the order and v = 27 + recovery id,
 * so the output is accepted by RecoverPublicKey.
 */
bool SignRecoverable(const Byte hash[32], const Byte privateKey[PRIVATE_KEY_SIZE],
                     Byte signature[RECOVERABLE_SIGNATURE_SIZE]);

/**
 * Recover the signer's uncompressed public key from r || s || v.
 *
 * v may be 27/28 or 0/1. Signatures with r or s outside [1, n-1], with a
 * high S, or with any other v are rejected.
 */
bool RecoverPublicKey(const Byte hash[32], const Byte signature[RECOVERABLE_SIGNATURE_SIZE],
                      Byte publicKey[UNCOMPRESSED_PUBKEY_SIZE]);

} // namespace secp256k1
} // namespace powerbond

#endif // POWERBOND_CRYPTO_SECP256K1_H
