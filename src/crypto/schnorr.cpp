// BTCSTAKER - BIP340 Key and Signature Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/crypto/schnorr.h"
#include "btcstaker/core/hex.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <cstring>

namespace btcstaker {

// ============================================================================
// Curve Constants
// ============================================================================

const std::array<uint8_t, 32> FIELD_PRIME = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFE, 0xFF, 0xFF, 0xFC, 0x2F
}};

const std::array<uint8_t, 32> CURVE_ORDER = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
}};

int Compare32(const uint8_t* a, const uint8_t* b) {
    for (int i = 0; i < 32; ++i) {
        if (a[i] < b[i]) return -1;
        if (a[i] > b[i]) return 1;
    }
    return 0;
}

namespace {

/// Lift x to the even-y point 0x02 || x and check it lies on secp256k1
bool IsOnCurveX(const uint8_t x[32]) {
    uint8_t compressed[33];
    compressed[0] = 0x02;
    std::memcpy(compressed + 1, x, 32);

    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    EC_POINT* point = group ? EC_POINT_new(group) : nullptr;
    BN_CTX* ctx = BN_CTX_new();

    bool valid = false;
    if (group && point && ctx) {
        valid = EC_POINT_oct2point(group, point, compressed, sizeof(compressed), ctx) == 1 &&
                EC_POINT_is_on_curve(group, point, ctx) == 1 &&
                EC_POINT_is_at_infinity(group, point) == 0;
    }

    BN_CTX_free(ctx);
    EC_POINT_free(point);
    EC_GROUP_free(group);
    return valid;
}

} // namespace

// ============================================================================
// XOnlyPubKey
// ============================================================================

std::optional<XOnlyPubKey> XOnlyPubKey::Parse(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != SIZE) {
        return std::nullopt;
    }
    if (Compare32(bytes.data(), FIELD_PRIME.data()) >= 0) {
        return std::nullopt;
    }
    if (!IsOnCurveX(bytes.data())) {
        return std::nullopt;
    }
    std::array<uint8_t, SIZE> data;
    std::memcpy(data.data(), bytes.data(), SIZE);
    return XOnlyPubKey(data);
}

std::string XOnlyPubKey::ToHex() const {
    return BytesToHex(data_.data(), data_.size());
}

// ============================================================================
// SchnorrSignature
// ============================================================================

std::optional<SchnorrSignature> SchnorrSignature::Parse(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != SIZE) {
        return std::nullopt;
    }
    // r is a field element, s a scalar
    if (Compare32(bytes.data(), FIELD_PRIME.data()) >= 0) {
        return std::nullopt;
    }
    if (Compare32(bytes.data() + 32, CURVE_ORDER.data()) >= 0) {
        return std::nullopt;
    }
    std::array<uint8_t, SIZE> data;
    std::memcpy(data.data(), bytes.data(), SIZE);
    return SchnorrSignature(data);
}

std::string SchnorrSignature::ToHex() const {
    return BytesToHex(data_.data(), data_.size());
}

} // namespace btcstaker
