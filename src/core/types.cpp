// POWERBOND - Core Types Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include "powerbond/core/types.h"
#include "powerbond/core/hex.h"

namespace powerbond {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string h = StripHexPrefix(hex);
    if (h.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length");
    }

    std::vector<Byte> bytes = HexToBytes(h);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

} // namespace powerbond
