// POWERBOND - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#ifndef POWERBOND_CORE_HEX_H
#define POWERBOND_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace powerbond {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes (accepts an optional 0x prefix)
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

/// Remove a leading "0x"/"0X" if present
std::string StripHexPrefix(const std::string& hex);

} // namespace powerbond

#endif // POWERBOND_CORE_HEX_H
