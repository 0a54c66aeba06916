// BTCSTAKER - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#ifndef BTCSTAKER_CORE_HEX_H
#define BTCSTAKER_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace btcstaker {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Value of a single hex digit, or -1
int HexCharToNibble(char c);

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. Throws std::invalid_argument.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Non-throwing variant of HexToBytes
std::optional<std::vector<HexByte>> TryHexToBytes(const std::string& hex);

/// Check if string is valid, non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace btcstaker

#endif // BTCSTAKER_CORE_HEX_H
