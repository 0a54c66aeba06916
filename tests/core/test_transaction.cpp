// BTCSTAKER - Transaction Tests
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include <gtest/gtest.h>
#include "btcstaker/core/transaction.h"
#include "btcstaker/core/hex.h"

namespace btcstaker {
namespace test {

namespace {

// Coinbase transaction of the Bitcoin genesis block
const char* GENESIS_COINBASE_HEX =
    "01000000010000000000000000000000000000000000000000000000000000000000000000"
    "ffffffff4d04ffff001d0104455468652054696d65732030332f4a616e2f32303039204368"
    "616e63656c6c6f72206f6e206272696e6b206f66207365636f6e64206261696c6f757420"
    "666f722062616e6b73ffffffff0100f2052a01000000434104678afdb0fe5548271967f1"
    "a67130b7105cd6a828e03909a67962e0ea1f61deb649f6bc3f4cef38c4f35504e51ec112"
    "de5c384df7ba0b8d578a4c702b6bf11d5fac00000000";

const char* GENESIS_COINBASE_TXID =
    "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

MutableTransaction MakeSegwitTransaction() {
    MutableTransaction tx;
    tx.version = 2;
    TxIn in(OutPoint(TxHash::FromHex(std::string(64, '1')), 3));
    in.scriptWitness.stack.push_back({0x30, 0x44, 0x02});
    in.scriptWitness.stack.push_back({0x02, 0xaa});
    tx.vin.push_back(in);
    tx.vout.emplace_back(50000, Script::CreateWitnessProgram(1, std::vector<uint8_t>(32, 0x07)));
    tx.nLockTime = 800000;
    return tx;
}

} // namespace

// ============================================================================
// OutPoint Tests
// ============================================================================

TEST(OutPointTest, DefaultIsNull) {
    OutPoint op;
    EXPECT_TRUE(op.IsNull());
    EXPECT_EQ(op.n, OutPoint::NULL_INDEX);
}

TEST(OutPointTest, Ordering) {
    TxHash h = TxHash::FromHex(std::string(64, 'a'));
    EXPECT_TRUE(OutPoint(h, 0) < OutPoint(h, 1));
    EXPECT_EQ(OutPoint(h, 1), OutPoint(h, 1));
    EXPECT_NE(OutPoint(h, 1), OutPoint(h, 2));
}

TEST(OutPointTest, ToString) {
    TxHash h = TxHash::FromHex(GENESIS_COINBASE_TXID);
    EXPECT_EQ(OutPoint(h, 5).ToString(), std::string(GENESIS_COINBASE_TXID) + ":5");
}

// ============================================================================
// Legacy Format
// ============================================================================

TEST(TransactionTest, DecodeGenesisCoinbase) {
    MutableTransaction tx;
    ASSERT_TRUE(DecodeTransaction(HexToBytes(GENESIS_COINBASE_HEX), tx));

    EXPECT_EQ(tx.version, 1u);
    ASSERT_EQ(tx.vin.size(), 1u);
    EXPECT_TRUE(tx.vin[0].prevout.hash.IsNull());
    EXPECT_EQ(tx.vin[0].prevout.n, 0xffffffffu);
    EXPECT_EQ(tx.vin[0].scriptSig.size(), 0x4du);
    ASSERT_EQ(tx.vout.size(), 1u);
    EXPECT_EQ(tx.vout[0].nValue, 50 * COIN);
    EXPECT_EQ(tx.nLockTime, 0u);
    EXPECT_FALSE(tx.HasWitness());
}

TEST(TransactionTest, GenesisCoinbaseTxid) {
    MutableTransaction tx;
    ASSERT_TRUE(DecodeTransaction(HexToBytes(GENESIS_COINBASE_HEX), tx));
    EXPECT_EQ(tx.GetHash().ToHex(), GENESIS_COINBASE_TXID);
    EXPECT_EQ(tx.GetWitnessHash(), Hash256(tx.GetHash()));
}

TEST(TransactionTest, EncodeReproducesWireBytes) {
    MutableTransaction tx;
    ASSERT_TRUE(DecodeTransaction(HexToBytes(GENESIS_COINBASE_HEX), tx));
    EXPECT_EQ(BytesToHex(EncodeTransaction(tx)), GENESIS_COINBASE_HEX);
    EXPECT_EQ(EncodeTransaction(tx).size(), 204u);
}

TEST(TransactionTest, DecodeRejectsTrailingBytes) {
    auto bytes = HexToBytes(GENESIS_COINBASE_HEX);
    bytes.push_back(0x00);
    MutableTransaction tx;
    EXPECT_FALSE(DecodeTransaction(bytes, tx));
}

TEST(TransactionTest, DecodeRejectsTruncated) {
    auto bytes = HexToBytes(GENESIS_COINBASE_HEX);
    bytes.resize(bytes.size() - 1);
    MutableTransaction tx;
    EXPECT_FALSE(DecodeTransaction(bytes, tx));
    EXPECT_FALSE(DecodeTransaction({}, tx));
}

// ============================================================================
// Segwit Format
// ============================================================================

TEST(TransactionTest, SegwitRoundTrip) {
    MutableTransaction tx = MakeSegwitTransaction();
    ASSERT_TRUE(tx.HasWitness());

    auto bytes = EncodeTransaction(tx);
    // version, then marker and flag
    ASSERT_GT(bytes.size(), 6u);
    EXPECT_EQ(bytes[4], 0x00);
    EXPECT_EQ(bytes[5], 0x01);

    MutableTransaction decoded;
    ASSERT_TRUE(DecodeTransaction(bytes, decoded));
    EXPECT_EQ(decoded, tx);
    EXPECT_EQ(decoded.vin[0].scriptWitness, tx.vin[0].scriptWitness);
}

TEST(TransactionTest, TxidIgnoresWitness) {
    MutableTransaction tx = MakeSegwitTransaction();
    MutableTransaction stripped = tx;
    stripped.vin[0].scriptWitness.SetNull();

    EXPECT_EQ(tx.GetHash(), stripped.GetHash());
    EXPECT_NE(tx.GetWitnessHash(), stripped.GetWitnessHash());
}

TEST(TransactionTest, SuperfluousWitnessFlagRejected) {
    MutableTransaction tx = MakeSegwitTransaction();
    auto bytes = EncodeTransaction(tx);

    // Replace the witness section with empty stacks
    MutableTransaction stripped = tx;
    stripped.vin[0].scriptWitness.SetNull();
    auto legacy = EncodeTransaction(stripped);

    std::vector<uint8_t> forged(legacy.begin(), legacy.begin() + 4);
    forged.push_back(0x00);
    forged.push_back(0x01);
    forged.insert(forged.end(), legacy.begin() + 4, legacy.end() - 4);
    forged.push_back(0x00);  // empty witness stack
    forged.insert(forged.end(), legacy.end() - 4, legacy.end());

    MutableTransaction decoded;
    EXPECT_FALSE(DecodeTransaction(forged, decoded));
}

TEST(TransactionTest, ChangingOutputChangesTxid) {
    MutableTransaction a = MakeSegwitTransaction();
    MutableTransaction b = a;
    b.vout[0].nValue += 1;
    EXPECT_NE(a.GetHash(), b.GetHash());
    EXPECT_NE(a, b);
}

} // namespace test
} // namespace btcstaker
