// BTCSTAKER - Tracked Transaction Store
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Persistent ledger of staking transactions submitted by the staker.
//
// Layout (one bucket per keyspace):
//   transactions    8-byte big-endian index -> encoded StoredTransaction
//   transactionIdx  32-byte tx hash -> 8-byte index
//                   "ntk" -> next index to assign (absent means 1)
//   inputs          32-byte txid ‖ 4-byte big-endian vout -> consuming tx hash
//
// Records are never deleted. Indices form the range 1..N.

#ifndef BTCSTAKER_STAKERDB_TX_STORE_H
#define BTCSTAKER_STAKERDB_TX_STORE_H

#include "btcstaker/core/transaction.h"
#include "btcstaker/crypto/address.h"
#include "btcstaker/db/kvstore.h"
#include "btcstaker/stakerdb/errors.h"
#include "btcstaker/stakerdb/params.h"
#include "btcstaker/stakerdb/store_config.h"
#include "btcstaker/stakerdb/tracked_tx.h"
#include "btcstaker/stakerdb/withdrawable.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace btcstaker {
namespace stakerdb {

// ============================================================================
// Buckets and Reserved Keys
// ============================================================================

namespace buckets {
    extern const db::Bucket TRANSACTIONS;
    extern const db::Bucket TRANSACTION_INDEX;
    extern const db::Bucket INPUTS;
}

/// Key in the transaction index holding the next index to assign
constexpr const char* NEXT_TX_KEY = "ntk";

/// Metadata key holding the store layout version
constexpr const char* STORE_VERSION_KEY = "stakerdb/version";

/// Current store layout version
constexpr uint32_t STORE_VERSION = 1;

// ============================================================================
// Transitions
// ============================================================================

/// Staking transaction confirmed on Bitcoin
struct SetStakingConfirmed {
    uint32_t height{0};
    BlockHash blockHash;
};

/// Delegation reported active on the remote chain together with its
/// Bitcoin confirmation
struct SetDelegationActiveAndConfirmed {
    uint32_t height{0};
    BlockHash blockHash;
};

/// Covenant signatures over the unbonding transaction received
struct SetUnbondingSignaturesReceived {
    std::vector<CovenantSignature> signatures;
};

/// Unbonding transaction confirmed on Bitcoin
struct SetUnbondingConfirmed {
    uint32_t height{0};
    BlockHash blockHash;
};

using Transition = std::variant<SetStakingConfirmed,
                                SetDelegationActiveAndConfirmed,
                                SetUnbondingSignaturesReceived,
                                SetUnbondingConfirmed>;

const char* TransitionName(const Transition& transition);

/**
 * Apply a transition to a record in memory.
 * @return UnbondingDataNotFound or UnbondingAlreadySet when the record does
 *         not allow it; the record is left untouched in that case
 */
StoreStatus ApplyTransitionTo(StoredTransaction& tx, const Transition& transition);

// ============================================================================
// Queries
// ============================================================================

struct StoredTransactionQuery {
    /// Raw records to skip from the start (or from the end when reversed)
    uint64_t offset{0};

    /// Maximum number of records returned
    uint64_t limit{DEFAULT_PAGE_LIMIT};

    /// Walk from the newest record; results are still returned ascending
    bool reversed{false};

    /// Only return withdrawable records
    std::optional<WithdrawableFilter> withdrawable;

    /// offset 0, limit 50, forward, no filter
    static StoredTransactionQuery Default() { return StoredTransactionQuery(); }

    StoredTransactionQuery& WithWithdrawableFilter(uint32_t bestHeight) {
        withdrawable = WithdrawableFilter{bestHeight};
        return *this;
    }
};

struct StoredTransactionQueryResult {
    /// Ascending by index
    std::vector<StoredTransaction> transactions;

    /// Number of records in the store, ignoring offset, limit and filter
    uint64_t total{0};
};

/// Data for the unbonding path registered with a staking transaction
struct UnbondingRequest {
    MutableTransaction unbondingTx;
    uint16_t unbondingTime{0};
};

/// Return non-OK to stop a scan
using ScanVisitor = std::function<StoreStatus(const StoredTransaction&)>;

// ============================================================================
// TrackedTransactionStore
// ============================================================================

class TrackedTransactionStore {
public:
    /**
     * Take ownership of a key-value store, create the buckets if missing and
     * check the layout version.
     * @return Pair of (status, store)
     */
    static std::pair<StoreStatus, std::unique_ptr<TrackedTransactionStore>> Open(
        std::unique_ptr<db::KVStore> kv);

    /// Open the database at config.DatabasePath()
    static std::pair<StoreStatus, std::unique_ptr<TrackedTransactionStore>> Open(
        const StoreConfig& config);

    ~TrackedTransactionStore();

    TrackedTransactionStore(const TrackedTransactionStore&) = delete;
    TrackedTransactionStore& operator=(const TrackedTransactionStore&) = delete;

    // ========================================================================
    // Insertion
    // ========================================================================

    /**
     * Track a staking transaction that was sent to the remote chain.
     *
     * The record, its hash index entry, the advanced counter and one inputs
     * entry per staking input are written in one batch.
     *
     * @param index Receives the assigned index (optional)
     * @return DuplicateTransaction if the hash is already tracked
     */
    StoreStatus AddTransaction(const MutableTransaction& stakingTx,
                               uint32_t stakingOutputIndex,
                               uint16_t stakingTime,
                               const BitcoinAddress& stakerAddress,
                               const std::optional<UnbondingRequest>& unbonding,
                               const std::string& delegationReference,
                               uint64_t* index = nullptr);

    // ========================================================================
    // Lookup
    // ========================================================================

    /// TransactionNotFound if untracked, CorruptedStore if unreadable
    StoreStatus GetTransaction(const TxHash& txHash, StoredTransaction* out) const;

    /// Records in the store
    StoreStatus Count(uint64_t* count) const;

    /// True if a tracked staking transaction spends the outpoint
    StoreStatus OutpointUsed(const OutPoint& outpoint, bool* used) const;

    // ========================================================================
    // Transitions
    // ========================================================================

    /// Read, transition and rewrite the record in one write transaction
    StoreStatus ApplyTransition(const TxHash& txHash, const Transition& transition);

    StoreStatus SetTxConfirmed(const TxHash& txHash, const BlockHash& blockHash,
                               uint32_t blockHeight);

    StoreStatus SetDelegationActiveOnBabylonAndConfirmedOnBtc(const TxHash& txHash,
                                                              const BlockHash& blockHash,
                                                              uint32_t blockHeight);

    StoreStatus SetTxUnbondingSignaturesReceived(
        const TxHash& txHash, const std::vector<CovenantSignature>& signatures);

    StoreStatus SetTxUnbondingConfirmedOnBtc(const TxHash& txHash,
                                             const BlockHash& blockHash,
                                             uint32_t blockHeight);

    // ========================================================================
    // Listing
    // ========================================================================

    StoreStatus QueryStoredTransactions(const StoredTransactionQuery& query,
                                        StoredTransactionQueryResult* out) const;

    /// Every record, ascending
    StoreStatus GetAllStoredTransactions(std::vector<StoredTransaction>* out) const;

    /// Visit every record in ascending order
    StoreStatus ScanTrackedTransactions(const ScanVisitor& visit) const;

    db::KVStore& GetKVStore() { return *kv_; }

private:
    explicit TrackedTransactionStore(std::unique_ptr<db::KVStore> kv);

    StoreStatus Init();

    std::unique_ptr<db::KVStore> kv_;
};

} // namespace stakerdb
} // namespace btcstaker

#endif // BTCSTAKER_STAKERDB_TX_STORE_H
