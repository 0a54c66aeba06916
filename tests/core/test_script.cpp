// BTCSTAKER - Script Tests
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include <gtest/gtest.h>
#include "btcstaker/core/script.h"
#include "btcstaker/core/hex.h"
#include <ios>
#include <string>

namespace btcstaker {
namespace test {

namespace {

Script ScriptFromHex(const std::string& hex) {
    std::vector<uint8_t> bytes = HexToBytes(hex);
    return Script(bytes.begin(), bytes.end());
}

} // namespace

// ============================================================================
// Building
// ============================================================================

TEST(ScriptTest, PushSmallData) {
    Script script;
    script << std::vector<uint8_t>{0xaa, 0xbb};
    EXPECT_EQ(BytesToHex(script), "02aabb");
}

TEST(ScriptTest, PushDataPrefixes) {
    Script s1;
    s1 << std::vector<uint8_t>(75, 0);
    EXPECT_EQ(s1[0], 75);
    EXPECT_EQ(s1.size(), 76u);

    Script s2;
    s2 << std::vector<uint8_t>(76, 0);
    EXPECT_EQ(s2[0], OP_PUSHDATA1);
    EXPECT_EQ(s2[1], 76);

    Script s3;
    s3 << std::vector<uint8_t>(0x1234, 0);
    EXPECT_EQ(s3[0], OP_PUSHDATA2);
    EXPECT_EQ(s3[1], 0x34);
    EXPECT_EQ(s3[2], 0x12);
}

TEST(ScriptTest, OpN) {
    EXPECT_EQ(Script::EncodeOP_N(0), OP_0);
    EXPECT_EQ(Script::EncodeOP_N(1), OP_1);
    EXPECT_EQ(Script::EncodeOP_N(16), OP_16);
    EXPECT_EQ(Script::DecodeOP_N(OP_0), 0);
    EXPECT_EQ(Script::DecodeOP_N(OP_16), 16);
    EXPECT_EQ(Script::DecodeOP_N(OP_RETURN), -1);
}

// ============================================================================
// Templates
// ============================================================================

TEST(ScriptTest, P2PKH) {
    Hash160 hash;
    hash[0] = 0x11;
    Script script = Script::CreateP2PKH(hash);
    EXPECT_EQ(script.size(), 25u);
    EXPECT_TRUE(script.IsPayToPublicKeyHash());
    EXPECT_FALSE(script.IsPayToScriptHash());
}

TEST(ScriptTest, P2SH) {
    Hash160 hash;
    Script script = Script::CreateP2SH(hash);
    EXPECT_EQ(script.size(), 23u);
    EXPECT_TRUE(script.IsPayToScriptHash());
    EXPECT_FALSE(script.IsPayToPublicKeyHash());
}

TEST(ScriptTest, WitnessProgram) {
    std::vector<uint8_t> program(32, 0x77);
    Script script = Script::CreateWitnessProgram(1, program);
    EXPECT_EQ(script[0], OP_1);
    EXPECT_EQ(script[1], 32);

    int version = -1;
    std::vector<uint8_t> decoded;
    ASSERT_TRUE(script.IsWitnessProgram(version, decoded));
    EXPECT_EQ(version, 1);
    EXPECT_EQ(decoded, program);
}

TEST(ScriptTest, WitnessProgramV0) {
    Script script = ScriptFromHex("0014751e76e8199196d454941c45d1b3a323f1433bd6");
    int version = -1;
    std::vector<uint8_t> program;
    ASSERT_TRUE(script.IsWitnessProgram(version, program));
    EXPECT_EQ(version, 0);
    EXPECT_EQ(BytesToHex(program), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

TEST(ScriptTest, NotWitnessProgram) {
    int version = 0;
    std::vector<uint8_t> program;

    // Length byte disagrees with the script size
    EXPECT_FALSE(ScriptFromHex("0015751e76e8199196d454941c45d1b3a323f1433bd6")
                     .IsWitnessProgram(version, program));
    // Too short
    EXPECT_FALSE(ScriptFromHex("5101aa").IsWitnessProgram(version, program));
    // Not a version opcode
    EXPECT_FALSE(ScriptFromHex("6a02aabb").IsWitnessProgram(version, program));
    // Program longer than 40 bytes
    Script tooLong;
    tooLong << OP_1 << std::vector<uint8_t>(41, 0);
    EXPECT_FALSE(tooLong.IsWitnessProgram(version, program));
}

// ============================================================================
// Serialization
// ============================================================================

TEST(ScriptTest, SerializeWithLengthPrefix) {
    Script script = ScriptFromHex("51");
    DataStream ss;
    Serialize(ss, script);
    EXPECT_EQ(ss.size(), 2u);

    Script decoded;
    Unserialize(ss, decoded);
    EXPECT_EQ(decoded, script);
}

TEST(ScriptTest, UnserializeRejectsOverlongLength) {
    DataStream ss;
    WriteCompactSize(ss, 10);
    ss.Write(reinterpret_cast<const uint8_t*>("abc"), 3);
    Script script;
    EXPECT_THROW(Unserialize(ss, script), std::ios_base::failure);
}

} // namespace test
} // namespace btcstaker
