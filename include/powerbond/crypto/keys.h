// POWERBOND - secp256k1 Keys
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Account keys: a secp256k1 key pair whose address is the last 20 bytes
// of keccak256 over the 64-byte uncompressed public key.

#ifndef POWERBOND_CRYPTO_KEYS_H
#define POWERBOND_CRYPTO_KEYS_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "powerbond/core/types.h"
#include "powerbond/crypto/secp256k1.h"

namespace powerbond {

// ============================================================================
// PublicKey
// ============================================================================

/**
 * A secp256k1 public key in uncompressed (65 byte) form.
 */
class PublicKey {
public:
    static constexpr size_t SIZE = secp256k1::UNCOMPRESSED_PUBKEY_SIZE;

    /// Default constructor - invalid/empty key
    PublicKey() { data_.fill(0); }

    /// Construct from raw uncompressed bytes
    explicit PublicKey(const std::array<Byte, SIZE>& data) : data_(data) {}

    /// Check if key carries the uncompressed prefix
    bool IsValid() const { return data_[0] == 0x04; }

    /// Get raw data
    const Byte* data() const { return data_.data(); }
    const Byte* begin() const { return data_.data(); }
    const Byte* end() const { return data_.data() + SIZE; }
    static constexpr size_t size() { return SIZE; }

    /// Account address derived from this key
    Address GetAddress() const;

    /// Recover the signer's key from a 65-byte r || s || v signature
    static std::optional<PublicKey> Recover(const Hash256& digest,
                                            const std::vector<Byte>& signature);

    bool operator==(const PublicKey& other) const { return data_ == other.data_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

    /// Convert to hex string
    std::string ToHex() const;

private:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 private key.
 *
 * Always exactly 32 bytes in the range [1, n-1]. Key material is wiped on
 * destruction and on Clear().
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;

    /// Default constructor - invalid key
    PrivateKey() { data_.fill(0); }

    /// Construct from raw 32 bytes
    explicit PrivateKey(const std::array<Byte, SIZE>& data);

    ~PrivateKey();

    PrivateKey(const PrivateKey& other);
    PrivateKey& operator=(const PrivateKey& other);

    /// Generate a new random private key
    static PrivateKey Generate();

    /// Parse from hex
    static std::optional<PrivateKey> FromHex(const std::string& hex);

    /// Check if key is valid
    bool IsValid() const { return valid_; }

    /// Derive public key
    PublicKey GetPublicKey() const;

    /// Address of the derived public key
    Address GetAddress() const { return GetPublicKey().GetAddress(); }

    /// Sign a 32-byte digest, returning 65-byte r || s || v (v = 27/28)
    /// @throws std::runtime_error if the key is invalid or signing fails
    std::vector<Byte> SignDigest(const Hash256& digest) const;

    /// Clear and invalidate the key
    void Clear();

private:
    std::array<Byte, SIZE> data_;
    bool valid_{false};
};

// ============================================================================
// Helpers
// ============================================================================

/// Address of the key that produced a signature over digest
std::optional<Address> RecoverAddress(const Hash256& digest,
                                      const std::vector<Byte>& signature);

} // namespace powerbond

#endif // POWERBOND_CRYPTO_KEYS_H
