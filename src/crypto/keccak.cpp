// POWERBOND - Keccak-256 Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Keccak-f[1600] permutation with the original (pre-FIPS 202) padding.
// Reference: https://keccak.team/keccak_specs_summary.html

#include "powerbond/crypto/keccak.h"
#include <algorithm>
#include <cstring>

namespace powerbond {

// ============================================================================
// Keccak Constants
// ============================================================================

namespace {

/// Iota round constants
constexpr uint64_t RC[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

/// Rho rotation offsets, in pi traversal order
constexpr int ROTATIONS[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

/// Pi lane permutation
constexpr int PI_LANES[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

// ============================================================================
// Helper Functions
// ============================================================================

/// Left rotate a 64-bit lane
inline uint64_t ROTL(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

/// Keccak-f[1600] permutation (24 rounds)
void KeccakF1600(uint64_t st[25]) {
    uint64_t bc[5];

    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ ROTL(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }

        // Rho and Pi
        uint64_t t = st[1];
        for (int i = 0; i < 24; ++i) {
            int j = PI_LANES[i];
            uint64_t tmp = st[j];
            st[j] = ROTL(t, ROTATIONS[i]);
            t = tmp;
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        st[0] ^= RC[round];
    }
}

/// Read a little-endian 64-bit lane
inline uint64_t ReadLE64(const Byte* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
    }
    return v;
}

} // anonymous namespace

// ============================================================================
// Keccak256 Implementation
// ============================================================================

Keccak256::Keccak256() {
    Reset();
}

Keccak256& Keccak256::Reset() {
    std::memset(state_, 0, sizeof(state_));
    std::memset(buffer_, 0, sizeof(buffer_));
    buffered_ = 0;
    return *this;
}

void Keccak256::Absorb(const Byte block[RATE]) {
    for (size_t i = 0; i < RATE / 8; ++i) {
        state_[i] ^= ReadLE64(block + i * 8);
    }
    KeccakF1600(state_);
}

Keccak256& Keccak256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }

    // Fill a partially buffered block first
    if (buffered_ > 0) {
        size_t take = std::min(len, RATE - buffered_);
        std::memcpy(buffer_ + buffered_, data, take);
        buffered_ += take;
        data += take;
        len -= take;

        if (buffered_ < RATE) {
            return *this;
        }
        Absorb(buffer_);
        buffered_ = 0;
    }

    // Absorb whole blocks directly from the input
    while (len >= RATE) {
        Absorb(data);
        data += RATE;
        len -= RATE;
    }

    if (len > 0) {
        std::memcpy(buffer_, data, len);
        buffered_ = len;
    }

    return *this;
}

void Keccak256::Finalize(Byte hash[OUTPUT_SIZE]) {
    // pad10*1 with the Keccak domain bit
    std::memset(buffer_ + buffered_, 0, RATE - buffered_);
    buffer_[buffered_] |= 0x01;
    buffer_[RATE - 1] |= 0x80;
    Absorb(buffer_);

    for (size_t i = 0; i < OUTPUT_SIZE; ++i) {
        hash[i] = static_cast<Byte>(state_[i / 8] >> (8 * (i % 8)));
    }

    Reset();
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 Keccak256Hash(const Byte* data, size_t len) {
    Hash256 result;
    Keccak256().Write(data, len).Finalize(result.data());
    return result;
}

Hash256 Keccak256Hash(const std::string& str) {
    return Keccak256Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

} // namespace powerbond
