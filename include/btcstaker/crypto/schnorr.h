// BTCSTAKER - BIP340 Key and Signature Types
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// x-only public keys and Schnorr signatures as carried by covenant
// signature sets. Only well-formedness is checked here; signature
// verification against a message is done by the signing party.

#ifndef BTCSTAKER_CRYPTO_SCHNORR_H
#define BTCSTAKER_CRYPTO_SCHNORR_H

#include "btcstaker/core/types.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace btcstaker {

/// secp256k1 field prime p, big-endian
extern const std::array<uint8_t, 32> FIELD_PRIME;

/// secp256k1 group order n, big-endian
extern const std::array<uint8_t, 32> CURVE_ORDER;

/// Compare two 32-byte big-endian numbers
int Compare32(const uint8_t* a, const uint8_t* b);

// ============================================================================
// XOnlyPubKey
// ============================================================================

/// 32-byte BIP340 public key: the x coordinate of a curve point with even y
class XOnlyPubKey {
public:
    static constexpr size_t SIZE = 32;

    /**
     * Parse a serialized key. Fails unless the input is exactly 32 bytes,
     * x < p and x is the abscissa of a point on secp256k1.
     */
    static std::optional<XOnlyPubKey> Parse(const std::vector<uint8_t>& bytes);

    const std::array<uint8_t, SIZE>& data() const { return data_; }
    std::vector<uint8_t> ToBytes() const { return {data_.begin(), data_.end()}; }
    std::string ToHex() const;

    bool operator==(const XOnlyPubKey& other) const { return data_ == other.data_; }
    bool operator!=(const XOnlyPubKey& other) const { return !(*this == other); }

private:
    explicit XOnlyPubKey(const std::array<uint8_t, SIZE>& data) : data_(data) {}

    std::array<uint8_t, SIZE> data_;
};

// ============================================================================
// SchnorrSignature
// ============================================================================

/// 64-byte BIP340 signature (r || s)
class SchnorrSignature {
public:
    static constexpr size_t SIZE = 64;

    /// Parse a serialized signature. Requires 64 bytes, r < p and s < n.
    static std::optional<SchnorrSignature> Parse(const std::vector<uint8_t>& bytes);

    const std::array<uint8_t, SIZE>& data() const { return data_; }
    std::vector<uint8_t> ToBytes() const { return {data_.begin(), data_.end()}; }
    std::string ToHex() const;

    bool operator==(const SchnorrSignature& other) const { return data_ == other.data_; }
    bool operator!=(const SchnorrSignature& other) const { return !(*this == other); }

private:
    explicit SchnorrSignature(const std::array<uint8_t, SIZE>& data) : data_(data) {}

    std::array<uint8_t, SIZE> data_;
};

} // namespace btcstaker

#endif // BTCSTAKER_CRYPTO_SCHNORR_H
