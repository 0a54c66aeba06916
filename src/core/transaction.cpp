// BTCSTAKER - Transaction Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/core/transaction.h"
#include "btcstaker/crypto/sha256.h"
#include <ios>

namespace btcstaker {

// ============================================================================
// Static Member Definitions
// ============================================================================

const uint32_t TxIn::SEQUENCE_FINAL;
const uint32_t MutableTransaction::CURRENT_VERSION;

// ============================================================================
// OutPoint Implementation
// ============================================================================

std::string OutPoint::ToString() const {
    return hash.ToHex() + ":" + std::to_string(n);
}

// ============================================================================
// MutableTransaction Implementation
// ============================================================================

MutableTransaction::MutableTransaction()
    : version(CURRENT_VERSION), nLockTime(0) {}

bool MutableTransaction::HasWitness() const {
    for (const auto& in : vin) {
        if (!in.scriptWitness.IsNull()) {
            return true;
        }
    }
    return false;
}

TxHash MutableTransaction::GetHash() const {
    DataStream ss;
    SerializeTransaction(ss, *this, false);
    return TxHash(DoubleSHA256(ss.data(), ss.size()));
}

Hash256 MutableTransaction::GetWitnessHash() const {
    DataStream ss;
    SerializeTransaction(ss, *this, true);
    return DoubleSHA256(ss.data(), ss.size());
}


// ============================================================================
// Wire Encoding Helpers
// ============================================================================

std::vector<uint8_t> EncodeTransaction(const MutableTransaction& tx) {
    DataStream ss;
    Serialize(ss, tx);
    return ss.Bytes();
}

bool DecodeTransaction(const std::vector<uint8_t>& bytes, MutableTransaction& tx) {
    DataStream ss(bytes);
    try {
        UnserializeTransaction(ss, tx);
    } catch (const std::ios_base::failure&) {
        return false;
    }
    return ss.empty();
}

} // namespace btcstaker
