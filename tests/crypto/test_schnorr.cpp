// BTCSTAKER - BIP340 Key and Signature Tests
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include <gtest/gtest.h>
#include "btcstaker/crypto/schnorr.h"
#include "btcstaker/core/hex.h"

namespace btcstaker {
namespace test {

namespace {

std::vector<uint8_t> SmallX(uint8_t x) {
    std::vector<uint8_t> bytes(32, 0);
    bytes[31] = x;
    return bytes;
}

const char* GENERATOR_X =
    "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";

} // namespace

// ============================================================================
// XOnlyPubKey
// ============================================================================

TEST(XOnlyPubKeyTest, GeneratorIsValid) {
    auto key = XOnlyPubKey::Parse(HexToBytes(GENERATOR_X));
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->ToHex(), GENERATOR_X);
    EXPECT_EQ(key->ToBytes(), HexToBytes(GENERATOR_X));
}

TEST(XOnlyPubKeyTest, PointsOnCurve) {
    for (uint8_t x : {1, 2, 3, 4, 6, 8}) {
        EXPECT_TRUE(XOnlyPubKey::Parse(SmallX(x)).has_value()) << int(x);
    }
}

TEST(XOnlyPubKeyTest, PointsOffCurve) {
    for (uint8_t x : {0, 5, 7, 9}) {
        EXPECT_FALSE(XOnlyPubKey::Parse(SmallX(x)).has_value()) << int(x);
    }
}

TEST(XOnlyPubKeyTest, RejectsValuesAboveFieldPrime) {
    EXPECT_FALSE(XOnlyPubKey::Parse(std::vector<uint8_t>(32, 0xff)).has_value());
    std::vector<uint8_t> p(FIELD_PRIME.begin(), FIELD_PRIME.end());
    EXPECT_FALSE(XOnlyPubKey::Parse(p).has_value());
}

TEST(XOnlyPubKeyTest, RejectsWrongLength) {
    auto bytes = HexToBytes(GENERATOR_X);
    bytes.push_back(0);
    EXPECT_FALSE(XOnlyPubKey::Parse(bytes).has_value());
    bytes.resize(31);
    EXPECT_FALSE(XOnlyPubKey::Parse(bytes).has_value());
    EXPECT_FALSE(XOnlyPubKey::Parse({}).has_value());
}

TEST(XOnlyPubKeyTest, Equality) {
    auto a = XOnlyPubKey::Parse(SmallX(1));
    auto b = XOnlyPubKey::Parse(SmallX(1));
    auto c = XOnlyPubKey::Parse(SmallX(2));
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(*a, *b);
    EXPECT_NE(*a, *c);
}

// ============================================================================
// SchnorrSignature
// ============================================================================

TEST(SchnorrSignatureTest, AcceptsInRangeValues) {
    std::vector<uint8_t> sig(64, 0);
    sig[31] = 1;
    sig[63] = 1;
    auto parsed = SchnorrSignature::Parse(sig);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->ToBytes(), sig);
    EXPECT_EQ(parsed->ToHex().size(), 128u);
}

TEST(SchnorrSignatureTest, RejectsRAtFieldPrime) {
    std::vector<uint8_t> sig(FIELD_PRIME.begin(), FIELD_PRIME.end());
    sig.resize(64, 0);
    sig[63] = 1;
    EXPECT_FALSE(SchnorrSignature::Parse(sig).has_value());
}

TEST(SchnorrSignatureTest, RejectsSAtCurveOrder) {
    std::vector<uint8_t> sig(32, 0);
    sig[31] = 1;
    sig.insert(sig.end(), CURVE_ORDER.begin(), CURVE_ORDER.end());
    EXPECT_FALSE(SchnorrSignature::Parse(sig).has_value());
}

TEST(SchnorrSignatureTest, RejectsWrongLength) {
    EXPECT_FALSE(SchnorrSignature::Parse(std::vector<uint8_t>(63, 1)).has_value());
    EXPECT_FALSE(SchnorrSignature::Parse(std::vector<uint8_t>(65, 1)).has_value());
}

TEST(Compare32Test, BigEndianOrder) {
    std::vector<uint8_t> a(32, 0), b(32, 0);
    a[0] = 1;
    b[31] = 0xff;
    EXPECT_GT(Compare32(a.data(), b.data()), 0);
    EXPECT_LT(Compare32(b.data(), a.data()), 0);
    EXPECT_EQ(Compare32(a.data(), a.data()), 0);
}

} // namespace test
} // namespace btcstaker
