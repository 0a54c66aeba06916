// BTCSTAKER - Tracked Transaction Codec
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Binary layout of stored records and index keys.
//
// Record (integers little-endian, byte strings CompactSize-prefixed):
//
//   u8      schema version
//   u64     index
//   bytes   staking transaction (wire format)
//   u32     staking output index
//   u32     staking time (<= 65535)
//   string  staker address
//   u8      presence flag, then u32 height + 32-byte block hash
//   u8      presence flag, then unbonding data
//   string  delegation reference
//
// Unbonding data:
//
//   bytes   unbonding transaction (wire format)
//   u32     unbonding time (<= 65535)
//   varint  signature count, then per entry: bytes pubkey (32), bytes sig (64)
//   u8      presence flag, then confirmation info

#ifndef BTCSTAKER_STAKERDB_CODEC_H
#define BTCSTAKER_STAKERDB_CODEC_H

#include "btcstaker/core/serialize.h"
#include "btcstaker/core/transaction.h"
#include "btcstaker/db/database.h"
#include "btcstaker/stakerdb/tracked_tx.h"
#include <cstdint>
#include <ios>
#include <limits>
#include <string>
#include <vector>

namespace btcstaker {
namespace stakerdb {

/// Version byte leading every encoded record
constexpr uint8_t RECORD_SCHEMA_VERSION = 1;

/// Upper bound of the lock time fields
constexpr uint32_t MAX_LOCK_TIME = std::numeric_limits<uint16_t>::max();

namespace detail {

template<typename Stream>
void SerializeTxBytes(Stream& s, const MutableTransaction& tx) {
    Serialize(s, EncodeTransaction(tx));
}

template<typename Stream>
void UnserializeTxBytes(Stream& s, MutableTransaction& tx, const char* what) {
    std::vector<uint8_t> bytes;
    Unserialize(s, bytes);
    if (!DecodeTransaction(bytes, tx)) {
        throw std::ios_base::failure(std::string("undecodable ") + what);
    }
}

template<typename Stream>
uint16_t UnserializeLockTime(Stream& s, const char* what) {
    uint32_t value = 0;
    Unserialize(s, value);
    if (value > MAX_LOCK_TIME) {
        throw std::ios_base::failure(std::string(what) + " out of range: " +
                                     std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

} // namespace detail

// ============================================================================
// ConfirmationInfo
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const ConfirmationInfo& info) {
    Serialize(s, info.height);
    Serialize(s, info.blockHash);
}

template<typename Stream>
void Unserialize(Stream& s, ConfirmationInfo& info) {
    Unserialize(s, info.height);
    Unserialize(s, info.blockHash);
}

// ============================================================================
// UnbondingData
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const UnbondingData& data) {
    detail::SerializeTxBytes(s, data.unbondingTx);
    Serialize(s, static_cast<uint32_t>(data.unbondingTime));
    WriteCompactSize(s, data.covenantSignatures.size());
    for (const auto& sig : data.covenantSignatures) {
        Serialize(s, sig.pubKey.ToBytes());
        Serialize(s, sig.signature.ToBytes());
    }
    Serialize(s, data.unbondingConfirmation);
}

template<typename Stream>
void Unserialize(Stream& s, UnbondingData& data) {
    detail::UnserializeTxBytes(s, data.unbondingTx, "unbonding transaction");
    data.unbondingTime = detail::UnserializeLockTime(s, "unbonding time");

    uint64_t count = ReadCompactSize(s);
    data.covenantSignatures.clear();
    for (uint64_t i = 0; i < count; ++i) {
        std::vector<uint8_t> keyBytes;
        std::vector<uint8_t> sigBytes;
        Unserialize(s, keyBytes);
        Unserialize(s, sigBytes);

        auto key = XOnlyPubKey::Parse(keyBytes);
        if (!key) {
            throw std::ios_base::failure("malformed covenant public key");
        }
        auto sig = SchnorrSignature::Parse(sigBytes);
        if (!sig) {
            throw std::ios_base::failure("malformed covenant signature");
        }
        data.covenantSignatures.emplace_back(*key, *sig);
    }

    Unserialize(s, data.unbondingConfirmation);
}

// ============================================================================
// StoredTransaction
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const StoredTransaction& tx) {
    Serialize(s, RECORD_SCHEMA_VERSION);
    Serialize(s, tx.index);
    detail::SerializeTxBytes(s, tx.stakingTx);
    Serialize(s, tx.stakingOutputIndex);
    Serialize(s, static_cast<uint32_t>(tx.stakingTime));
    Serialize(s, tx.stakerAddress);
    Serialize(s, tx.stakingConfirmation);
    Serialize(s, tx.unbondingData);
    Serialize(s, tx.delegationReference);
}

template<typename Stream>
void Unserialize(Stream& s, StoredTransaction& tx) {
    uint8_t version = ReadLE<uint8_t>(s);
    if (version != RECORD_SCHEMA_VERSION) {
        throw std::ios_base::failure("unknown record schema version " +
                                     std::to_string(version));
    }
    Unserialize(s, tx.index);
    detail::UnserializeTxBytes(s, tx.stakingTx, "staking transaction");
    Unserialize(s, tx.stakingOutputIndex);
    tx.stakingTime = detail::UnserializeLockTime(s, "staking time");
    Unserialize(s, tx.stakerAddress);
    Unserialize(s, tx.stakingConfirmation);
    Unserialize(s, tx.unbondingData);
    Unserialize(s, tx.delegationReference);
}

// ============================================================================
// Record and Key Encoding
// ============================================================================

/// Encode a record for the transactions bucket
std::string EncodeStoredTransaction(const StoredTransaction& tx);

/**
 * Decode a record. Fails on truncation, trailing bytes, bad presence flags,
 * unknown schema versions, out of range lock times, undecodable transactions
 * and malformed keys or signatures.
 * @param error Receives the reason on failure (optional)
 */
bool DecodeStoredTransaction(const db::Slice& data, StoredTransaction& tx,
                             std::string* error = nullptr);

/// 8-byte big-endian record key
std::string EncodeIndexKey(uint64_t index);

/// Parse an 8-byte big-endian record key
bool DecodeIndexKey(const db::Slice& key, uint64_t& index);

/// 36-byte outpoint key: txid (internal byte order) ‖ big-endian output index
std::string EncodeOutpointKey(const OutPoint& outpoint);

} // namespace stakerdb
} // namespace btcstaker

#endif // BTCSTAKER_STAKERDB_CODEC_H
