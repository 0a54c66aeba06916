// BTCSTAKER - Core Types Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/core/types.h"
#include "btcstaker/core/hex.h"

namespace btcstaker {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    // Internal order is little-endian, display is most significant byte first
    std::string result;
    result.reserve(SIZE * 2);

    static const char hexChars[] = "0123456789abcdef";

    for (int i = SIZE - 1; i >= 0; --i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }

    return result;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    BaseHash result;

    for (size_t i = 0; i < SIZE; ++i) {
        size_t hexIdx = (SIZE - 1 - i) * 2;
        int high = HexCharToNibble(hex[hexIdx]);
        int low = HexCharToNibble(hex[hexIdx + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        result.data_[i] = static_cast<Byte>((high << 4) | low);
    }

    return result;
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

} // namespace btcstaker
