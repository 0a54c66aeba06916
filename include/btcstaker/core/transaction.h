// BTCSTAKER - Transaction Header
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Bitcoin transaction primitives and their wire format, including the
// BIP144 segregated witness encoding. Staking and unbonding transactions
// are stored as these wire bytes and identified by their txid.

#ifndef BTCSTAKER_CORE_TRANSACTION_H
#define BTCSTAKER_CORE_TRANSACTION_H

#include "btcstaker/core/types.h"
#include "btcstaker/core/script.h"
#include "btcstaker/core/serialize.h"
#include <cstdint>
#include <vector>
#include <string>
#include <limits>

namespace btcstaker {

// ============================================================================
// OutPoint - Reference to a previous transaction output
// ============================================================================

/// An outpoint - a combination of a transaction hash and an index n into its vout
class OutPoint {
public:
    TxHash hash;
    uint32_t n;

    /// Index value representing a null/invalid outpoint
    static constexpr uint32_t NULL_INDEX = std::numeric_limits<uint32_t>::max();

    OutPoint() : hash(), n(NULL_INDEX) {}

    OutPoint(const TxHash& hashIn, uint32_t nIn) : hash(hashIn), n(nIn) {}

    void SetNull() {
        hash.SetNull();
        n = NULL_INDEX;
    }

    bool IsNull() const {
        return hash.IsNull() && n == NULL_INDEX;
    }

    friend bool operator<(const OutPoint& a, const OutPoint& b) {
        if (a.hash != b.hash) return a.hash < b.hash;
        return a.n < b.n;
    }

    friend bool operator==(const OutPoint& a, const OutPoint& b) {
        return a.hash == b.hash && a.n == b.n;
    }

    friend bool operator!=(const OutPoint& a, const OutPoint& b) {
        return !(a == b);
    }

    /// "<txid>:<n>"
    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const OutPoint& outpoint) {
    Serialize(s, outpoint.hash);
    Serialize(s, outpoint.n);
}

template<typename Stream>
void Unserialize(Stream& s, OutPoint& outpoint) {
    Unserialize(s, outpoint.hash);
    Unserialize(s, outpoint.n);
}

// ============================================================================
// TxIn - Transaction Input
// ============================================================================

/// An input of a transaction. The witness is serialized separately from
/// the rest of the input, after all outputs.
class TxIn {
public:
    OutPoint prevout;
    Script scriptSig;
    uint32_t nSequence;
    ScriptWitness scriptWitness;

    static const uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;

    TxIn() : nSequence(SEQUENCE_FINAL) {}

    explicit TxIn(const OutPoint& prevoutIn,
                  Script scriptSigIn = Script(),
                  uint32_t nSequenceIn = SEQUENCE_FINAL)
        : prevout(prevoutIn), scriptSig(std::move(scriptSigIn)), nSequence(nSequenceIn) {}

    friend bool operator==(const TxIn& a, const TxIn& b) {
        return a.prevout == b.prevout &&
               a.scriptSig == b.scriptSig &&
               a.nSequence == b.nSequence &&
               a.scriptWitness == b.scriptWitness;
    }

    friend bool operator!=(const TxIn& a, const TxIn& b) {
        return !(a == b);
    }
};

/// Serialization for TxIn (without witness)
template<typename Stream>
void Serialize(Stream& s, const TxIn& txin) {
    Serialize(s, txin.prevout);
    Serialize(s, txin.scriptSig);
    Serialize(s, txin.nSequence);
}

template<typename Stream>
void Unserialize(Stream& s, TxIn& txin) {
    Unserialize(s, txin.prevout);
    Unserialize(s, txin.scriptSig);
    Unserialize(s, txin.nSequence);
}

// ============================================================================
// TxOut - Transaction Output
// ============================================================================

class TxOut {
public:
    Amount nValue;
    Script scriptPubKey;

    TxOut() {
        SetNull();
    }

    TxOut(Amount nValueIn, Script scriptPubKeyIn)
        : nValue(nValueIn), scriptPubKey(std::move(scriptPubKeyIn)) {}

    void SetNull() {
        nValue = -1;
        scriptPubKey.clear();
    }

    bool IsNull() const {
        return nValue == -1;
    }

    friend bool operator==(const TxOut& a, const TxOut& b) {
        return a.nValue == b.nValue && a.scriptPubKey == b.scriptPubKey;
    }

    friend bool operator!=(const TxOut& a, const TxOut& b) {
        return !(a == b);
    }
};

template<typename Stream>
void Serialize(Stream& s, const TxOut& txout) {
    Serialize(s, static_cast<int64_t>(txout.nValue));
    Serialize(s, txout.scriptPubKey);
}

template<typename Stream>
void Unserialize(Stream& s, TxOut& txout) {
    int64_t value;
    Unserialize(s, value);
    txout.nValue = value;
    Unserialize(s, txout.scriptPubKey);
}

// ============================================================================
// MutableTransaction
// ============================================================================

/// A Bitcoin transaction. Staking records hold this by value; the store never
/// needs the shared immutable form used by a full node.
class MutableTransaction {
public:
    std::vector<TxIn> vin;
    std::vector<TxOut> vout;
    uint32_t version;
    uint32_t nLockTime;

    static const uint32_t CURRENT_VERSION = 2;

    MutableTransaction();

    bool IsNull() const {
        return vin.empty() && vout.empty();
    }

    /// True if any input carries a witness stack
    bool HasWitness() const;

    /// Transaction id: double SHA256 of the serialization without witnesses
    TxHash GetHash() const;

    /// Witness transaction id: double SHA256 of the full serialization
    Hash256 GetWitnessHash() const;

    friend bool operator==(const MutableTransaction& a, const MutableTransaction& b) {
        return a.version == b.version &&
               a.vin == b.vin &&
               a.vout == b.vout &&
               a.nLockTime == b.nLockTime;
    }

    friend bool operator!=(const MutableTransaction& a, const MutableTransaction& b) {
        return !(a == b);
    }
};

/// Write a transaction. With allowWitness and at least one witness present
/// the extended format is used: version, marker 0x00, flag 0x01, inputs,
/// outputs, one witness stack per input, lock time.
template<typename Stream>
void SerializeTransaction(Stream& s, const MutableTransaction& tx, bool allowWitness) {
    Serialize(s, tx.version);
    uint8_t flags = 0;
    if (allowWitness && tx.HasWitness()) {
        flags |= 1;
    }
    if (flags) {
        // Marker (an empty input vector) then flags
        std::vector<TxIn> dummy;
        Serialize(s, dummy);
        Serialize(s, flags);
    }
    Serialize(s, tx.vin);
    Serialize(s, tx.vout);
    if (flags & 1) {
        for (const auto& in : tx.vin) {
            Serialize(s, in.scriptWitness.stack);
        }
    }
    Serialize(s, tx.nLockTime);
}

/// Read a transaction in either format. Throws std::ios_base::failure on
/// malformed data.
template<typename Stream>
void UnserializeTransaction(Stream& s, MutableTransaction& tx) {
    Unserialize(s, tx.version);
    uint8_t flags = 0;
    tx.vin.clear();
    tx.vout.clear();
    Unserialize(s, tx.vin);
    if (tx.vin.empty()) {
        // Either a marker or a transaction without inputs
        Unserialize(s, flags);
        if (flags != 0) {
            Unserialize(s, tx.vin);
            Unserialize(s, tx.vout);
        }
    } else {
        Unserialize(s, tx.vout);
    }
    if (flags & 1) {
        flags ^= 1;
        for (auto& in : tx.vin) {
            Unserialize(s, in.scriptWitness.stack);
        }
        if (!tx.HasWitness()) {
            throw std::ios_base::failure("Superfluous witness record");
        }
    }
    if (flags) {
        throw std::ios_base::failure("Unknown transaction optional data");
    }
    Unserialize(s, tx.nLockTime);
}

template<typename Stream>
void Serialize(Stream& s, const MutableTransaction& tx) {
    SerializeTransaction(s, tx, true);
}

template<typename Stream>
void Unserialize(Stream& s, MutableTransaction& tx) {
    UnserializeTransaction(s, tx);
}

// ============================================================================
// Wire Encoding Helpers
// ============================================================================

/// Full wire bytes (witness included when present)
std::vector<uint8_t> EncodeTransaction(const MutableTransaction& tx);

/// Decode wire bytes. Fails on malformed data or trailing bytes.
bool DecodeTransaction(const std::vector<uint8_t>& bytes, MutableTransaction& tx);

} // namespace btcstaker

#endif // BTCSTAKER_CORE_TRANSACTION_H
