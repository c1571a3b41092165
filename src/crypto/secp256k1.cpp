// POWERBOND - secp256k1 Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Recoverable ECDSA over secp256k1 using OpenSSL's EC and BN primitives.

#include "powerbond/crypto/secp256k1.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <cstring>
#include <memory>

namespace powerbond {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

const std::array<Byte, 32> CURVE_ORDER = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
};

const std::array<Byte, 32> HALF_CURVE_ORDER = {
    0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0x5D, 0x57, 0x6E, 0x73, 0x57, 0xA4, 0x50, 0x1D,
    0xDF, 0xE9, 0x2F, 0x46, 0x68, 0x1B, 0x20, 0xA0
};

namespace {

// ============================================================================
// OpenSSL handle ownership
// ============================================================================

struct BNDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };
struct BNCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct GroupDeleter { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct KeyDeleter { void operator()(EC_KEY* p) const { EC_KEY_free(p); } };
struct SigDeleter { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;
using BNCtxPtr = std::unique_ptr<BN_CTX, BNCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using KeyPtr = std::unique_ptr<EC_KEY, KeyDeleter>;
using SigPtr = std::unique_ptr<ECDSA_SIG, SigDeleter>;

/// Compare two 32-byte big-endian numbers
int Compare32(const Byte* a, const Byte* b) {
    return std::memcmp(a, b, 32);
}

bool IsZero32(const Byte* a) {
    for (int i = 0; i < 32; ++i) {
        if (a[i] != 0) return false;
    }
    return true;
}

/// Scalar in [1, n-1]
bool IsValidScalar(const Byte* a) {
    return !IsZero32(a) && Compare32(a, CURVE_ORDER.data()) < 0;
}

/// Write a BIGNUM as a left-padded 32-byte big-endian value
bool WriteBN32(const BIGNUM* bn, Byte out[32]) {
    return BN_bn2binpad(bn, out, 32) == 32;
}

/// Recover Q = r^-1 (s*R - e*G) for a given recovery id (0 or 1)
bool RecoverWithId(const Byte hash[32], const Byte r32[32], const Byte s32[32],
                   int recid, Byte publicKey[UNCOMPRESSED_PUBKEY_SIZE]) {
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    BNCtxPtr ctx(BN_CTX_new());
    if (!group || !ctx) return false;

    BNPtr r(BN_bin2bn(r32, 32, nullptr));
    BNPtr s(BN_bin2bn(s32, 32, nullptr));
    BNPtr e(BN_bin2bn(hash, 32, nullptr));
    BNPtr n(BN_bin2bn(CURVE_ORDER.data(), 32, nullptr));
    if (!r || !s || !e || !n) return false;

    // R has x = r and the y parity selected by recid
    PointPtr R(EC_POINT_new(group.get()));
    PointPtr Q(EC_POINT_new(group.get()));
    if (!R || !Q) return false;
    if (EC_POINT_set_compressed_coordinates(group.get(), R.get(), r.get(),
                                            recid & 1, ctx.get()) != 1) {
        return false;
    }

    BNPtr rInv(BN_mod_inverse(nullptr, r.get(), n.get(), ctx.get()));
    BNPtr u1(BN_new());
    BNPtr u2(BN_new());
    if (!rInv || !u1 || !u2) return false;

    // u1 = -e / r, u2 = s / r  (mod n)
    if (BN_mod_mul(u1.get(), e.get(), rInv.get(), n.get(), ctx.get()) != 1 ||
        BN_mod_sub(u1.get(), n.get(), u1.get(), n.get(), ctx.get()) != 1 ||
        BN_mod_mul(u2.get(), s.get(), rInv.get(), n.get(), ctx.get()) != 1) {
        return false;
    }

    if (EC_POINT_mul(group.get(), Q.get(), u1.get(), R.get(), u2.get(), ctx.get()) != 1) {
        return false;
    }
    if (EC_POINT_is_at_infinity(group.get(), Q.get())) {
        return false;
    }

    return EC_POINT_point2oct(group.get(), Q.get(), POINT_CONVERSION_UNCOMPRESSED,
                              publicKey, UNCOMPRESSED_PUBKEY_SIZE, ctx.get()) ==
           UNCOMPRESSED_PUBKEY_SIZE;
}

} // anonymous namespace

// ============================================================================
// Key Operations
// ============================================================================

bool IsValidPrivateKey(const Byte privateKey[PRIVATE_KEY_SIZE]) {
    return IsValidScalar(privateKey);
}

bool ComputePublicKey(const Byte privateKey[PRIVATE_KEY_SIZE],
                      Byte publicKey[UNCOMPRESSED_PUBKEY_SIZE]) {
    if (!IsValidScalar(privateKey)) return false;

    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    BNCtxPtr ctx(BN_CTX_new());
    BNPtr priv(BN_bin2bn(privateKey, 32, nullptr));
    if (!group || !ctx || !priv) return false;

    PointPtr pub(EC_POINT_new(group.get()));
    if (!pub) return false;
    if (EC_POINT_mul(group.get(), pub.get(), priv.get(), nullptr, nullptr, ctx.get()) != 1) {
        return false;
    }

    return EC_POINT_point2oct(group.get(), pub.get(), POINT_CONVERSION_UNCOMPRESSED,
                              publicKey, UNCOMPRESSED_PUBKEY_SIZE, ctx.get()) ==
           UNCOMPRESSED_PUBKEY_SIZE;
}

// ============================================================================
// Recoverable ECDSA
// ============================================================================

bool IsLowS(const Byte s[32]) {
    return Compare32(s, HALF_CURVE_ORDER.data()) <= 0;
}

bool SignRecoverable(const Byte hash[32], const Byte privateKey[PRIVATE_KEY_SIZE],
                     Byte signature[RECOVERABLE_SIGNATURE_SIZE]) {
    Byte expected[UNCOMPRESSED_PUBKEY_SIZE];
    if (!ComputePublicKey(privateKey, expected)) return false;

    KeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    BNPtr priv(BN_bin2bn(privateKey, 32, nullptr));
    BNPtr n(BN_bin2bn(CURVE_ORDER.data(), 32, nullptr));
    if (!key || !priv || !n) return false;
    if (EC_KEY_set_private_key(key.get(), priv.get()) != 1) return false;

    // The rare signature whose R.x overflows the order needs recid 2/3,
    // which this format does not carry; sign again in that case.
    for (int attempt = 0; attempt < 8; ++attempt) {
        SigPtr sig(ECDSA_do_sign(hash, 32, key.get()));
        if (!sig) return false;

        const BIGNUM* r = nullptr;
        const BIGNUM* s = nullptr;
        ECDSA_SIG_get0(sig.get(), &r, &s);

        Byte r32[32];
        Byte s32[32];
        if (!WriteBN32(r, r32) || !WriteBN32(s, s32)) return false;

        // Normalise to low S
        if (!IsLowS(s32)) {
            BNPtr lowS(BN_new());
            if (!lowS || BN_sub(lowS.get(), n.get(), s) != 1) return false;
            if (!WriteBN32(lowS.get(), s32)) return false;
        }

        for (int recid = 0; recid < 2; ++recid) {
            Byte recovered[UNCOMPRESSED_PUBKEY_SIZE];
            if (RecoverWithId(hash, r32, s32, recid, recovered) &&
                std::memcmp(recovered, expected, UNCOMPRESSED_PUBKEY_SIZE) == 0) {
                std::memcpy(signature, r32, 32);
                std::memcpy(signature + 32, s32, 32);
                signature[64] = static_cast<Byte>(27 + recid);
                return true;
            }
        }
    }

    return false;
}

bool RecoverPublicKey(const Byte hash[32], const Byte signature[RECOVERABLE_SIGNATURE_SIZE],
                      Byte publicKey[UNCOMPRESSED_PUBKEY_SIZE]) {
    Byte v = signature[64];
    int recid;
    if (v == 27 || v == 28) {
        recid = v - 27;
    } else if (v == 0 || v == 1) {
        recid = v;
    } else {
        return false;
    }

    const Byte* r = signature;
    const Byte* s = signature + 32;
    if (!IsValidScalar(r) || !IsValidScalar(s)) return false;
    if (!IsLowS(s)) return false;

    return RecoverWithId(hash, r, s, recid, publicKey);
}

} // namespace secp256k1
} // namespace powerbond
