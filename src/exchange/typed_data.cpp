// POWERBOND - Typed Structured Data Hashing Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <powerbond/exchange/typed_data.h>
#include <powerbond/crypto/keccak.h>

#include <stdexcept>

namespace powerbond {
namespace exchange {

const Hash256& DomainTypeHash() {
    static const Hash256 hash = Keccak256Hash(std::string(EIP712_DOMAIN_TYPE));
    return hash;
}

const Hash256& ExchangeTypeHash() {
    static const Hash256 hash = Keccak256Hash(std::string(EXCHANGE_TYPE));
    return hash;
}

// ============================================================================
// AbiWordWriter
// ============================================================================

AbiWordWriter& AbiWordWriter::Write(const Hash256& word) {
    data_.insert(data_.end(), word.begin(), word.end());
    return *this;
}

AbiWordWriter& AbiWordWriter::Write(const Uint256& value) {
    auto bytes = value.ToBigEndian();
    data_.insert(data_.end(), bytes.begin(), bytes.end());
    return *this;
}

AbiWordWriter& AbiWordWriter::Write(const Address& address) {
    data_.insert(data_.end(), 32 - Address::SIZE, 0);
    data_.insert(data_.end(), address.begin(), address.end());
    return *this;
}

Hash256 AbiWordWriter::Hash() const {
    return Keccak256Hash(data_);
}

// ============================================================================
// Domain
// ============================================================================

Hash256 TypedDataDomain::Separator() const {
    return AbiWordWriter()
        .Write(DomainTypeHash())
        .Write(Keccak256Hash(name))
        .Write(Keccak256Hash(version))
        .Write(chainId)
        .Write(verifyingContract)
        .Hash();
}

// ============================================================================
// Digest
// ============================================================================

Hash256 ExchangeStructHash(const Address& requester, const Uint256& amount,
                           const Nonce& nonce, Timestamp expiration) {
    if (expiration < 0) {
        throw std::invalid_argument("expiration must not be negative");
    }

    return AbiWordWriter()
        .Write(ExchangeTypeHash())
        .Write(requester)
        .Write(amount)
        .Write(nonce)
        .Write(Uint256(static_cast<uint64_t>(expiration)))
        .Hash();
}

Hash256 TypedDataDigest(const Hash256& domainSeparator, const Hash256& structHash) {
    std::vector<Byte> message;
    message.reserve(2 + 2 * Hash256::SIZE);
    message.push_back(0x19);
    message.push_back(0x01);
    message.insert(message.end(), domainSeparator.begin(), domainSeparator.end());
    message.insert(message.end(), structHash.begin(), structHash.end());
    return Keccak256Hash(message);
}

} // namespace exchange
} // namespace powerbond
