// POWERBOND - Keccak-256 Hash Function
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Original Keccak-256 (pad10*1 with domain byte 0x01), as used by Ethereum.
// This is NOT the NIST SHA3-256 variant, which pads with 0x06.

#ifndef POWERBOND_CRYPTO_KECCAK_H
#define POWERBOND_CRYPTO_KECCAK_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "powerbond/core/types.h"

namespace powerbond {

/// Keccak-256 hasher class
/// Provides incremental hashing with the same shape as the other hashers
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2*256 bits)
    static constexpr size_t RATE = 136;

    /// Default constructor - initializes to empty state
    Keccak256();

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    Keccak256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    /// @return Reference to this hasher (for chaining)
    Keccak256& Reset();

private:
    /// Sponge state (5 x 5 lanes of 64 bits)
    uint64_t state_[25];

    /// Buffer for partial block
    Byte buffer_[RATE];

    /// Bytes currently buffered
    size_t buffered_;

    /// XOR one full block into the state and permute
    void Absorb(const Byte block[RATE]);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute Keccak-256 of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

/// Compute Keccak-256 of a vector
inline Hash256 Keccak256Hash(const std::vector<Byte>& data) {
    return Keccak256Hash(data.data(), data.size());
}

/// Compute Keccak-256 of the bytes of a string (no terminator)
Hash256 Keccak256Hash(const std::string& str);

} // namespace powerbond

#endif // POWERBOND_CRYPTO_KECCAK_H
