// POWERBOND - 256-bit Unsigned Integer Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include "powerbond/core/uint256.h"
#include "powerbond/core/hex.h"

#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace powerbond {

// ============================================================================
// Construction & Conversion
// ============================================================================

Uint256 Uint256::Pow10(unsigned exp) {
    if (exp > 77) {
        throw std::overflow_error("Uint256: 10^" + std::to_string(exp) + " out of range");
    }
    Uint256 result(1);
    const Uint256 ten(10);
    for (unsigned i = 0; i < exp; ++i) {
        result *= ten;
    }
    return result;
}

Uint256 Uint256::FromDecimal(const std::string& str) {
    if (str.empty()) {
        throw std::invalid_argument("Uint256: empty decimal string");
    }

    size_t ePos = str.find_first_of("eE");
    std::string mantissa = str.substr(0, ePos);
    if (mantissa.empty()) {
        throw std::invalid_argument("Uint256: missing digits in '" + str + "'");
    }

    Uint256 result;
    const Uint256 ten(10);
    for (char c : mantissa) {
        if (c == '_') continue;
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Uint256: invalid decimal digit in '" + str + "'");
        }
        result = result * ten + Uint256(static_cast<uint64_t>(c - '0'));
    }

    if (ePos != std::string::npos) {
        std::string expStr = str.substr(ePos + 1);
        if (expStr.empty() || expStr.size() > 2 ||
            !std::all_of(expStr.begin(), expStr.end(), ::isdigit)) {
            throw std::invalid_argument("Uint256: invalid exponent in '" + str + "'");
        }
        result *= Pow10(static_cast<unsigned>(std::stoul(expStr)));
    }

    return result;
}

Uint256 Uint256::FromHex(const std::string& hex) {
    std::string h = StripHexPrefix(hex);
    if (h.empty() || h.size() > 64) {
        throw std::invalid_argument("Uint256: invalid hex length");
    }
    if (h.size() % 2 != 0) {
        h = "0" + h;
    }
    std::vector<Byte> bytes = HexToBytes(h);
    return FromBigEndian(bytes.data(), bytes.size());
}

Uint256 Uint256::FromString(const std::string& str) {
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        return FromHex(str);
    }
    return FromDecimal(str);
}

std::string Uint256::ToDecimal() const {
    if (IsZero()) {
        return "0";
    }

    Uint256 tmp = *this;
    std::string digits;
    while (!tmp.IsZero()) {
        uint64_t rem = tmp.DivModSmall(10);
        digits.push_back(static_cast<char>('0' + rem));
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string Uint256::ToHex() const {
    auto bytes = ToBigEndian();
    return BytesToHex(bytes.data(), bytes.size());
}

Uint256 Uint256::FromBigEndian(const Byte* data, size_t len) {
    if (len > 32) {
        throw std::invalid_argument("Uint256: more than 32 bytes");
    }
    Uint256 result;
    for (size_t i = 0; i < len; ++i) {
        size_t bytePos = len - 1 - i;  // position from least significant
        result.limbs[bytePos / 8] |= static_cast<uint64_t>(data[i]) << (8 * (bytePos % 8));
    }
    return result;
}

std::array<Byte, 32> Uint256::ToBigEndian() const {
    std::array<Byte, 32> result;
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 8; ++j) {
            result[31 - (i * 8 + j)] = static_cast<Byte>(limbs[i] >> (8 * j));
        }
    }
    return result;
}

bool Uint256::IsZero() const {
    return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

unsigned Uint256::Bits() const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] != 0) {
            unsigned bits = 64;
            uint64_t top = limbs[i];
            while ((top & (1ULL << 63)) == 0) {
                top <<= 1;
                --bits;
            }
            return static_cast<unsigned>(i) * 64 + bits;
        }
    }
    return 0;
}

// ============================================================================
// Comparison
// ============================================================================

bool Uint256::operator==(const Uint256& other) const {
    return limbs == other.limbs;
}

bool Uint256::operator!=(const Uint256& other) const {
    return !(*this == other);
}

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] < other.limbs[i]) return true;
        if (limbs[i] > other.limbs[i]) return false;
    }
    return false;
}

bool Uint256::operator<=(const Uint256& other) const {
    return !(other < *this);
}

bool Uint256::operator>(const Uint256& other) const {
    return other < *this;
}

bool Uint256::operator>=(const Uint256& other) const {
    return !(*this < other);
}

// ============================================================================
// Raw Primitives
// ============================================================================

Uint256 Uint256::Add(const Uint256& a, const Uint256& b, bool& carry) {
    Uint256 result;
    uint64_t c = 0;

    for (int i = 0; i < 4; ++i) {
        __uint128_t sum = static_cast<__uint128_t>(a.limbs[i]) +
                          static_cast<__uint128_t>(b.limbs[i]) + c;
        result.limbs[i] = static_cast<uint64_t>(sum);
        c = static_cast<uint64_t>(sum >> 64);
    }

    carry = (c != 0);
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;

    for (int i = 0; i < 4; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(a.limbs[i]) -
                           static_cast<__uint128_t>(b.limbs[i]) - bw;
        result.limbs[i] = static_cast<uint64_t>(diff);
        bw = static_cast<uint64_t>((diff >> 127) & 1);  // negative => borrow
    }

    borrow = (bw != 0);
    return result;
}

Uint256 Uint256::Mul(const Uint256& a, const Uint256& b, Uint256& high) {
    // Schoolbook 256 x 256 -> 512
    uint64_t r[8] = {0};

    for (int i = 0; i < 4; ++i) {
        uint64_t carry = 0;
        for (int j = 0; j < 4; ++j) {
            __uint128_t cur = static_cast<__uint128_t>(a.limbs[i]) * b.limbs[j] +
                              r[i + j] + carry;
            r[i + j] = static_cast<uint64_t>(cur);
            carry = static_cast<uint64_t>(cur >> 64);
        }
        r[i + 4] = carry;
    }

    high = Uint256(r[4], r[5], r[6], r[7]);
    return Uint256(r[0], r[1], r[2], r[3]);
}

void Uint256::DivMod(const Uint256& a, const Uint256& b,
                     Uint256& quotient, Uint256& remainder) {
    if (b.IsZero()) {
        throw std::domain_error("Uint256: division by zero");
    }

    quotient = Uint256();
    remainder = Uint256();
    if (a < b) {
        remainder = a;
        return;
    }

    // Shift-subtract long division over the significant bits of a
    for (int bit = static_cast<int>(a.Bits()) - 1; bit >= 0; --bit) {
        remainder = remainder << 1;
        remainder.limbs[0] |= (a.limbs[bit / 64] >> (bit % 64)) & 1;
        if (remainder >= b) {
            bool borrow;
            remainder = Sub(remainder, b, borrow);
            quotient.limbs[bit / 64] |= 1ULL << (bit % 64);
        }
    }
}

uint64_t Uint256::DivModSmall(uint64_t divisor) {
    __uint128_t rem = 0;
    for (int i = 3; i >= 0; --i) {
        __uint128_t cur = (rem << 64) | limbs[i];
        limbs[i] = static_cast<uint64_t>(cur / divisor);
        rem = cur % divisor;
    }
    return static_cast<uint64_t>(rem);
}

// ============================================================================
// Checked Arithmetic
// ============================================================================

Uint256 Uint256::operator+(const Uint256& other) const {
    bool carry;
    Uint256 result = Add(*this, other, carry);
    if (carry) {
        throw std::overflow_error("Uint256: addition overflow");
    }
    return result;
}

Uint256 Uint256::operator-(const Uint256& other) const {
    bool borrow;
    Uint256 result = Sub(*this, other, borrow);
    if (borrow) {
        throw std::underflow_error("Uint256: subtraction underflow");
    }
    return result;
}

Uint256 Uint256::operator*(const Uint256& other) const {
    Uint256 high;
    Uint256 result = Mul(*this, other, high);
    if (!high.IsZero()) {
        throw std::overflow_error("Uint256: multiplication overflow");
    }
    return result;
}

Uint256 Uint256::operator/(const Uint256& other) const {
    Uint256 q, r;
    DivMod(*this, other, q, r);
    return q;
}

Uint256 Uint256::operator%(const Uint256& other) const {
    Uint256 q, r;
    DivMod(*this, other, q, r);
    return r;
}

Uint256& Uint256::operator+=(const Uint256& other) {
    *this = *this + other;
    return *this;
}

Uint256& Uint256::operator-=(const Uint256& other) {
    *this = *this - other;
    return *this;
}

Uint256& Uint256::operator*=(const Uint256& other) {
    *this = *this * other;
    return *this;
}

Uint256& Uint256::operator/=(const Uint256& other) {
    *this = *this / other;
    return *this;
}

Uint256 Uint256::operator<<(unsigned shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    unsigned limbShift = shift / 64;
    unsigned bitShift = shift % 64;

    for (int i = 3; i >= static_cast<int>(limbShift); --i) {
        result.limbs[i] = limbs[i - limbShift] << bitShift;
        if (bitShift > 0 && i - static_cast<int>(limbShift) - 1 >= 0) {
            result.limbs[i] |= limbs[i - limbShift - 1] >> (64 - bitShift);
        }
    }

    return result;
}

Uint256 Uint256::operator>>(unsigned shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    unsigned limbShift = shift / 64;
    unsigned bitShift = shift % 64;

    for (unsigned i = 0; i + limbShift < 4; ++i) {
        result.limbs[i] = limbs[i + limbShift] >> bitShift;
        if (bitShift > 0 && i + limbShift + 1 < 4) {
            result.limbs[i] |= limbs[i + limbShift + 1] << (64 - bitShift);
        }
    }

    return result;
}

Uint256 Uint256::Sqrt() const {
    if (IsZero()) {
        return Uint256();
    }

    // 2^ceil(bits/2) is always >= floor(sqrt(x)); Newton descends from above
    Uint256 r = Uint256(1) << ((Bits() + 1) / 2);
    while (true) {
        Uint256 next = (r + *this / r) >> 1;
        if (next >= r) {
            return r;
        }
        r = next;
    }
}

std::ostream& operator<<(std::ostream& os, const Uint256& value) {
    return os << value.ToDecimal();
}

} // namespace powerbond
