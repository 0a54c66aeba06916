// BTCSTAKER - Core Types Header
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Fundamental byte and hash types shared by the transaction model, the
// key-value layer and the tracked transaction store.

#ifndef BTCSTAKER_CORE_TYPES_H
#define BTCSTAKER_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <stdexcept>
#include <cstring>

namespace btcstaker {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in satoshis
using Amount = int64_t;

/// Satoshis per bitcoin
constexpr Amount COIN = 100000000LL;

/// Total supply cap in satoshis
constexpr Amount MAX_MONEY = 21000000LL * COIN;

inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width hash stored in internal (little-endian) byte order.
/// Hex conversion uses the reversed display order Bitcoin tooling prints.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Copies SIZE bytes; shorter input is zero padded
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    /// Raw bytes in internal order, as stored in database keys
    std::vector<Byte> ToBytes() const {
        return std::vector<Byte>(data_.begin(), data_.end());
    }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        for (int i = SIZE - 1; i >= 0; --i) {
            if (data_[i] < other.data_[i]) return true;
            if (data_[i] > other.data_[i]) return false;
        }
        return false;
    }

    /// Display-order hex (most significant byte first)
    std::string ToHex() const;

    /// Parse display-order hex. Throws std::invalid_argument on bad input.
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex).data(), SIZE);
    }
};

/// 160-bit hash (20 bytes), RIPEMD160(SHA256(x)) in address payloads
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
};

/// Bitcoin block hash
class BlockHash : public Hash256 {
public:
    using Hash256::Hash256;
    BlockHash() = default;
    explicit BlockHash(const Hash256& h) : Hash256(h) {}

    static BlockHash FromHex(const std::string& hex) {
        return BlockHash(Hash256::FromHex(hex));
    }
};

/// Bitcoin transaction id
class TxHash : public Hash256 {
public:
    using Hash256::Hash256;
    TxHash() = default;
    explicit TxHash(const Hash256& h) : Hash256(h) {}

    static TxHash FromHex(const std::string& hex) {
        return TxHash(Hash256::FromHex(hex));
    }
};

} // namespace btcstaker

#endif // BTCSTAKER_CORE_TYPES_H
