// POWERBOND - Core Types Header
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// This file defines fundamental types used throughout POWERBOND.

#ifndef POWERBOND_CORE_TYPES_H
#define POWERBOND_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace powerbond {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

// ============================================================================
// Fixed-size byte strings
// ============================================================================

/// Fixed-size opaque byte string (hashes, addresses, nonces).
/// Bytes are kept and displayed in natural (big-endian) order.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null value
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded on the right)
    BaseHash(const Byte* data, size_t len) noexcept {
        if (len >= SIZE) {
            std::memcpy(data_.data(), data, SIZE);
        } else {
            data_.fill(0);
            if (data && len > 0) {
                std::memcpy(data_.data(), data, len);
            }
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set all bytes to zero
    void SetNull() noexcept {
        data_.fill(0);
    }

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    /// Iterators
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    /// Comparison operators
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex string (no prefix)
    std::string ToHex() const;

    /// Parse from hex string, with or without 0x prefix
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    explicit Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 20-byte account identifier
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    explicit Address(const BaseHash<160>& h) : BaseHash<160>(h) {}

    /// True for the zero address
    bool IsZero() const noexcept { return IsNull(); }

    /// "0x"-prefixed lowercase hex
    std::string ToString() const { return "0x" + ToHex(); }

    static Address FromHex(const std::string& hex) {
        return Address(BaseHash<160>::FromHex(hex));
    }
};

/// One-time token carried by a signed intent
using Nonce = Hash256;

/// Role identifier for access control
using RoleId = Hash256;

} // namespace powerbond

#endif // POWERBOND_CORE_TYPES_H
