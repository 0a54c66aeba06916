// BTCSTAKER - Tracked Transaction Records
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// In-memory form of the records kept by the tracked transaction store.

#ifndef BTCSTAKER_STAKERDB_TRACKED_TX_H
#define BTCSTAKER_STAKERDB_TRACKED_TX_H

#include "btcstaker/core/types.h"
#include "btcstaker/core/transaction.h"
#include "btcstaker/crypto/schnorr.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace btcstaker {
namespace stakerdb {

// ============================================================================
// Confirmation Info
// ============================================================================

/// Block in which a transaction was confirmed on Bitcoin
struct ConfirmationInfo {
    uint32_t height{0};
    BlockHash blockHash;

    ConfirmationInfo() = default;
    ConfirmationInfo(uint32_t h, const BlockHash& hash) : height(h), blockHash(hash) {}

    bool operator==(const ConfirmationInfo& other) const {
        return height == other.height && blockHash == other.blockHash;
    }
    bool operator!=(const ConfirmationInfo& other) const { return !(*this == other); }
};

// ============================================================================
// Covenant Signature
// ============================================================================

/// Signature of one covenant committee member over the unbonding transaction
struct CovenantSignature {
    XOnlyPubKey pubKey;
    SchnorrSignature signature;

    CovenantSignature(const XOnlyPubKey& key, const SchnorrSignature& sig)
        : pubKey(key), signature(sig) {}

    bool operator==(const CovenantSignature& other) const {
        return pubKey == other.pubKey && signature == other.signature;
    }
    bool operator!=(const CovenantSignature& other) const { return !(*this == other); }
};

// ============================================================================
// Unbonding Data
// ============================================================================

struct UnbondingData {
    MutableTransaction unbondingTx;

    /// Relative lock of the unbonding output, in blocks
    uint16_t unbondingTime{0};

    /// Empty until the covenant signatures arrive, then set once
    std::vector<CovenantSignature> covenantSignatures;

    std::optional<ConfirmationInfo> unbondingConfirmation;

    bool IsConfirmed() const { return unbondingConfirmation.has_value(); }

    bool operator==(const UnbondingData& other) const;
    bool operator!=(const UnbondingData& other) const { return !(*this == other); }
};

// ============================================================================
// Staking State
// ============================================================================

/// Lifecycle label derived from a record
enum class StakingState {
    SENT_TO_BABYLON,
    CONFIRMED_ON_BTC,
    UNBONDING_SIGNATURES_RECEIVED,
    UNBONDING_CONFIRMED_ON_BTC,
};

const char* StakingStateToString(StakingState state);

// ============================================================================
// Stored Transaction
// ============================================================================

/**
 * One tracked staking attempt.
 */
struct StoredTransaction {
    /// Position in the store, assigned on insert starting at 1
    uint64_t index{0};

    MutableTransaction stakingTx;
    uint32_t stakingOutputIndex{0};

    /// Relative lock of the staking output, in blocks
    uint16_t stakingTime{0};

    /// Canonical encoding of the staker's address
    std::string stakerAddress;

    std::optional<ConfirmationInfo> stakingConfirmation;
    std::optional<UnbondingData> unbondingData;

    /// Delegation identifier on the remote chain
    std::string delegationReference;

    TxHash GetStakingTxHash() const { return stakingTx.GetHash(); }

    /// True only if the staking transaction was confirmed on Bitcoin
    bool StakingTxConfirmedOnBtc() const { return stakingConfirmation.has_value(); }

    /// True only if the unbonding transaction was confirmed on Bitcoin
    bool UnbondingTxConfirmedOnBtc() const {
        return unbondingData && unbondingData->IsConfirmed();
    }

    StakingState GetState() const;

    bool operator==(const StoredTransaction& other) const;
    bool operator!=(const StoredTransaction& other) const { return !(*this == other); }
};

// ============================================================================
// Staking Details
// ============================================================================

/// Flat summary of a record as reported to users
struct StakingDetails {
    std::string stakingTxHash;
    std::string stakerAddress;
    std::string stakingState;
    std::string transactionIdx;
};

StakingDetails GetStakingDetails(const StoredTransaction& tx);

} // namespace stakerdb
} // namespace btcstaker

#endif // BTCSTAKER_STAKERDB_TRACKED_TX_H
