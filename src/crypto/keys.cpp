// POWERBOND - Key Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include "powerbond/crypto/keys.h"
#include "powerbond/crypto/keccak.h"
#include "powerbond/core/hex.h"

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <algorithm>
#include <stdexcept>

namespace powerbond {

// ============================================================================
// PublicKey
// ============================================================================

Address PublicKey::GetAddress() const {
    // Skip the 0x04 prefix; the address is the low 20 bytes of the hash
    Hash256 hash = Keccak256Hash(data_.data() + 1, SIZE - 1);
    return Address(hash.data() + 12, 20);
}

std::optional<PublicKey> PublicKey::Recover(const Hash256& digest,
                                            const std::vector<Byte>& signature) {
    if (signature.size() != secp256k1::RECOVERABLE_SIGNATURE_SIZE) {
        return std::nullopt;
    }

    std::array<Byte, SIZE> pub;
    if (!secp256k1::RecoverPublicKey(digest.data(), signature.data(), pub.data())) {
        return std::nullopt;
    }
    return PublicKey(pub);
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_);
}

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey::PrivateKey(const std::array<Byte, SIZE>& data) : data_(data) {
    valid_ = secp256k1::IsValidPrivateKey(data_.data());
}

PrivateKey::~PrivateKey() {
    Clear();
}

PrivateKey::PrivateKey(const PrivateKey& other)
    : data_(other.data_), valid_(other.valid_) {}

PrivateKey& PrivateKey::operator=(const PrivateKey& other) {
    if (this != &other) {
        data_ = other.data_;
        valid_ = other.valid_;
    }
    return *this;
}

PrivateKey PrivateKey::Generate() {
    std::array<Byte, SIZE> bytes;
    do {
        if (RAND_bytes(bytes.data(), static_cast<int>(SIZE)) != 1) {
            throw std::runtime_error("PrivateKey: random generator failure");
        }
    } while (!secp256k1::IsValidPrivateKey(bytes.data()));

    PrivateKey key(bytes);
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return key;
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    if (StripHexPrefix(hex).size() != SIZE * 2 || !IsValidHex(hex)) {
        return std::nullopt;
    }

    std::vector<Byte> bytes = HexToBytes(hex);
    std::array<Byte, SIZE> arr;
    std::copy(bytes.begin(), bytes.end(), arr.begin());
    OPENSSL_cleanse(bytes.data(), bytes.size());

    PrivateKey key(arr);
    OPENSSL_cleanse(arr.data(), arr.size());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

PublicKey PrivateKey::GetPublicKey() const {
    std::array<Byte, PublicKey::SIZE> pub;
    if (!valid_ || !secp256k1::ComputePublicKey(data_.data(), pub.data())) {
        return PublicKey();
    }
    return PublicKey(pub);
}

std::vector<Byte> PrivateKey::SignDigest(const Hash256& digest) const {
    if (!valid_) {
        throw std::runtime_error("PrivateKey: cannot sign with an invalid key");
    }

    std::vector<Byte> signature(secp256k1::RECOVERABLE_SIGNATURE_SIZE);
    if (!secp256k1::SignRecoverable(digest.data(), data_.data(), signature.data())) {
        throw std::runtime_error("PrivateKey: signing failed");
    }
    return signature;
}

void PrivateKey::Clear() {
    OPENSSL_cleanse(data_.data(), data_.size());
    valid_ = false;
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<Address> RecoverAddress(const Hash256& digest,
                                      const std::vector<Byte>& signature) {
    auto pub = PublicKey::Recover(digest, signature);
    if (!pub) {
        return std::nullopt;
    }
    return pub->GetAddress();
}

} // namespace powerbond
