// POWERBOND - 256-bit Unsigned Integer
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Fixed-width unsigned integer used for token amounts and curve math.
//
// All arithmetic operators are checked: a result that does not fit in
// 256 bits throws instead of wrapping.
//   - overflow (add, mul, shift-free)  -> std::overflow_error
//   - subtraction below zero          -> std::underflow_error
//   - division or modulo by zero      -> std::domain_error
// The raw Add/Sub/Mul primitives expose carry/borrow/high words for callers
// that need wrapping behaviour.

#ifndef POWERBOND_CORE_UINT256_H
#define POWERBOND_CORE_UINT256_H

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include "powerbond/core/types.h"

namespace powerbond {

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;

    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;

    /// Default constructor - zero
    constexpr Uint256() : limbs{0, 0, 0, 0} {}

    /// Construct from limbs (little-endian)
    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}

    /// Construct from single value
    explicit constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    /// Largest representable value (2^256 - 1)
    static constexpr Uint256 Max() {
        return Uint256(~0ULL, ~0ULL, ~0ULL, ~0ULL);
    }

    /// 10^exp, throws std::overflow_error past 10^77
    static Uint256 Pow10(unsigned exp);

    // ========================================================================
    // Conversions
    // ========================================================================

    /// Parse decimal digits, optionally followed by e<exp> ("100e18")
    static Uint256 FromDecimal(const std::string& str);

    /// Parse hex (with or without 0x prefix, at most 64 digits)
    static Uint256 FromHex(const std::string& hex);

    /// Parse either format: "0x..." is hex, anything else is decimal
    static Uint256 FromString(const std::string& str);

    /// Decimal representation without leading zeros
    std::string ToDecimal() const;

    /// Hex representation, 64 digits, no prefix
    std::string ToHex() const;

    /// Construct from big-endian bytes (at most 32)
    static Uint256 FromBigEndian(const Byte* data, size_t len);

    /// 32-byte big-endian encoding (one ABI word)
    std::array<Byte, 32> ToBigEndian() const;

    /// True if value fits in 64 bits
    bool FitsUint64() const { return limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0; }

    /// Low 64 bits
    uint64_t GetLow64() const { return limbs[0]; }

    /// Check if zero
    bool IsZero() const;

    /// Number of significant bits (0 for zero)
    unsigned Bits() const;

    // ========================================================================
    // Comparison
    // ========================================================================

    bool operator==(const Uint256& other) const;
    bool operator!=(const Uint256& other) const;
    bool operator<(const Uint256& other) const;
    bool operator<=(const Uint256& other) const;
    bool operator>(const Uint256& other) const;
    bool operator>=(const Uint256& other) const;

    // ========================================================================
    // Checked arithmetic
    // ========================================================================

    Uint256 operator+(const Uint256& other) const;
    Uint256 operator-(const Uint256& other) const;
    Uint256 operator*(const Uint256& other) const;
    Uint256 operator/(const Uint256& other) const;
    Uint256 operator%(const Uint256& other) const;

    Uint256& operator+=(const Uint256& other);
    Uint256& operator-=(const Uint256& other);
    Uint256& operator*=(const Uint256& other);
    Uint256& operator/=(const Uint256& other);

    /// Shifts (bits shifted out are discarded)
    Uint256 operator<<(unsigned shift) const;
    Uint256 operator>>(unsigned shift) const;

    /// Floor square root (Newton's method)
    Uint256 Sqrt() const;

    // ========================================================================
    // Raw primitives
    // ========================================================================

    static Uint256 Add(const Uint256& a, const Uint256& b, bool& carry);
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);
    static Uint256 Mul(const Uint256& a, const Uint256& b, Uint256& high);

    /// Quotient and remainder; throws std::domain_error when divisor is zero
    static void DivMod(const Uint256& a, const Uint256& b,
                       Uint256& quotient, Uint256& remainder);

private:
    /// Divide in place by a small divisor, returning the remainder
    uint64_t DivModSmall(uint64_t divisor);
};

/// Writes the decimal representation
std::ostream& operator<<(std::ostream& os, const Uint256& value);

} // namespace powerbond

#endif // POWERBOND_CORE_UINT256_H
