// BTCSTAKER - Tracked Transaction Store Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/stakerdb/tx_store.h"
#include "btcstaker/stakerdb/codec.h"
#include "btcstaker/stakerdb/paginator.h"
#include "btcstaker/util/logging.h"

#include <algorithm>

namespace btcstaker {
namespace stakerdb {

namespace buckets {
    const db::Bucket TRANSACTIONS{"transactions", 't'};
    const db::Bucket TRANSACTION_INDEX{"transactionIdx", 'i'};
    const db::Bucket INPUTS{"inputs", 's'};
}

namespace {

using util::LogCategory::STORE;

std::string HashKey(const TxHash& hash) {
    return std::string(reinterpret_cast<const char*>(hash.data()), TxHash::SIZE);
}

StoreStatus Corrupted(const std::string& msg) {
    LOG_ERROR(STORE) << "Corrupted store: " << msg;
    return StoreStatus::CorruptedStore(msg);
}

StoreStatus FromBackend(const db::Status& s) {
    if (s.IsCorruption()) {
        return Corrupted(s.ToString());
    }
    return StoreStatus::FromDb(s);
}

/// Next index to assign; 1 on an empty store
template<typename Tx>
StoreStatus ReadNextIndex(const Tx& tx, uint64_t* next) {
    std::string value;
    db::Status s = tx.Get(buckets::TRANSACTION_INDEX, NEXT_TX_KEY, &value);
    if (s.IsNotFound()) {
        *next = 1;
        return StoreStatus::Ok();
    }
    if (!s.ok()) {
        return FromBackend(s);
    }
    if (!DecodeIndexKey(value, *next) || *next == 0) {
        return Corrupted("malformed next index counter");
    }
    return StoreStatus::Ok();
}

StoreStatus DecodeRecord(uint64_t index, const db::Slice& value, StoredTransaction* out) {
    std::string error;
    if (!DecodeStoredTransaction(value, *out, &error)) {
        return Corrupted("record " + std::to_string(index) + ": " + error);
    }
    return StoreStatus::Ok();
}

/// Resolve hash -> index -> record
template<typename Tx>
StoreStatus LoadByHash(const Tx& tx, const TxHash& hash,
                       std::string* recordKey, StoredTransaction* out) {
    std::string indexValue;
    db::Status s = tx.Get(buckets::TRANSACTION_INDEX, HashKey(hash), &indexValue);
    if (s.IsNotFound()) {
        return StoreStatus::TransactionNotFound(hash.ToHex());
    }
    if (!s.ok()) {
        return FromBackend(s);
    }

    uint64_t index = 0;
    if (!DecodeIndexKey(indexValue, index)) {
        return Corrupted("malformed index entry for " + hash.ToHex());
    }

    *recordKey = EncodeIndexKey(index);
    std::string value;
    s = tx.Get(buckets::TRANSACTIONS, *recordKey, &value);
    if (s.IsNotFound()) {
        return Corrupted("index entry for " + hash.ToHex() + " points at missing record " +
                         std::to_string(index));
    }
    if (!s.ok()) {
        return FromBackend(s);
    }

    return DecodeRecord(index, value, out);
}

/// Applies one transition alternative to a record
struct TransitionApplier {
    StoredTransaction& tx;

    StoreStatus operator()(const SetStakingConfirmed& t) const {
        tx.stakingConfirmation = ConfirmationInfo(t.height, t.blockHash);
        return StoreStatus::Ok();
    }

    StoreStatus operator()(const SetDelegationActiveAndConfirmed& t) const {
        tx.stakingConfirmation = ConfirmationInfo(t.height, t.blockHash);
        return StoreStatus::Ok();
    }

    StoreStatus operator()(const SetUnbondingSignaturesReceived& t) const {
        if (!tx.unbondingData) {
            return StoreStatus::UnbondingDataNotFound(
                "cannot set unbonding signatures received, unbonding data does not exist");
        }
        if (!tx.unbondingData->covenantSignatures.empty()) {
            return StoreStatus::UnbondingAlreadySet(
                "cannot set unbonding signatures received, signatures already exist");
        }
        tx.unbondingData->covenantSignatures = t.signatures;
        return StoreStatus::Ok();
    }

    StoreStatus operator()(const SetUnbondingConfirmed& t) const {
        if (!tx.unbondingData) {
            return StoreStatus::UnbondingDataNotFound(
                "cannot set unbonding confirmed on btc, unbonding data does not exist");
        }
        tx.unbondingData->unbondingConfirmation = ConfirmationInfo(t.height, t.blockHash);
        return StoreStatus::Ok();
    }
};

struct TransitionNamer {
    const char* operator()(const SetStakingConfirmed&) const { return "SetStakingConfirmed"; }
    const char* operator()(const SetDelegationActiveAndConfirmed&) const {
        return "SetDelegationActiveAndConfirmed";
    }
    const char* operator()(const SetUnbondingSignaturesReceived&) const {
        return "SetUnbondingSignaturesReceived";
    }
    const char* operator()(const SetUnbondingConfirmed&) const { return "SetUnbondingConfirmed"; }
};

} // namespace

// ============================================================================
// Transitions
// ============================================================================

const char* TransitionName(const Transition& transition) {
    return std::visit(TransitionNamer{}, transition);
}

StoreStatus ApplyTransitionTo(StoredTransaction& tx, const Transition& transition) {
    return std::visit(TransitionApplier{tx}, transition);
}

// ============================================================================
// Construction
// ============================================================================

TrackedTransactionStore::TrackedTransactionStore(std::unique_ptr<db::KVStore> kv)
    : kv_(std::move(kv)) {}

TrackedTransactionStore::~TrackedTransactionStore() = default;

std::pair<StoreStatus, std::unique_ptr<TrackedTransactionStore>>
TrackedTransactionStore::Open(std::unique_ptr<db::KVStore> kv) {
    if (!kv) {
        return {StoreStatus::InvalidArgument("no key-value store"), nullptr};
    }

    std::unique_ptr<TrackedTransactionStore> store(new TrackedTransactionStore(std::move(kv)));
    StoreStatus s = store->Init();
    if (!s.ok()) {
        return {s, nullptr};
    }
    return {StoreStatus::Ok(), std::move(store)};
}

std::pair<StoreStatus, std::unique_ptr<TrackedTransactionStore>>
TrackedTransactionStore::Open(const StoreConfig& config) {
    auto [status, kv] = db::KVStore::Open(config.DatabasePath(), config.ToDbOptions(),
                                          config.ToWriteOptions());
    if (!status.ok()) {
        return {FromBackend(status), nullptr};
    }
    return Open(std::move(kv));
}

StoreStatus TrackedTransactionStore::Init() {
    auto tx = kv_->BeginWrite();

    for (const db::Bucket* bucket : {&buckets::TRANSACTIONS, &buckets::TRANSACTION_INDEX,
                                     &buckets::INPUTS}) {
        db::Status s = tx->CreateBucketIfNotExists(*bucket);
        if (!s.ok()) {
            return FromBackend(s);
        }
    }

    std::string version;
    db::Status s = tx->GetMeta(STORE_VERSION_KEY, &version);
    if (s.IsNotFound()) {
        uint8_t buf[4];
        WriteBE32(buf, STORE_VERSION);
        tx->PutMeta(STORE_VERSION_KEY, db::Slice(reinterpret_cast<const char*>(buf), 4));
    } else if (!s.ok()) {
        return FromBackend(s);
    } else if (version.size() != 4 ||
               ReadBE32(reinterpret_cast<const uint8_t*>(version.data())) != STORE_VERSION) {
        return Corrupted("unsupported store version");
    }

    s = tx->Commit();
    if (!s.ok()) {
        return FromBackend(s);
    }

    uint64_t count = 0;
    StoreStatus cs = Count(&count);
    if (!cs.ok()) {
        return cs;
    }
    LOG_INFO(STORE) << "Tracked transaction store ready (" << kv_->GetDatabase().Name()
                    << " backend, " << count << " transactions)";
    return StoreStatus::Ok();
}

// ============================================================================
// Insertion
// ============================================================================

StoreStatus TrackedTransactionStore::AddTransaction(
    const MutableTransaction& stakingTx,
    uint32_t stakingOutputIndex,
    uint16_t stakingTime,
    const BitcoinAddress& stakerAddress,
    const std::optional<UnbondingRequest>& unbonding,
    const std::string& delegationReference,
    uint64_t* index) {
    if (stakingTx.vin.empty()) {
        return StoreStatus::InvalidArgument("staking transaction has no inputs");
    }
    if (unbonding && unbonding->unbondingTx.vin.empty()) {
        return StoreStatus::InvalidArgument("unbonding transaction has no inputs");
    }

    const TxHash txHash = stakingTx.GetHash();
    const std::string hashKey = HashKey(txHash);

    auto tx = kv_->BeginWrite();

    // Check the index first so duplicates leave no trace
    std::string existing;
    db::Status s = tx->Get(buckets::TRANSACTION_INDEX, hashKey, &existing);
    if (s.ok()) {
        LOG_DEBUG(STORE) << "Rejecting duplicate staking transaction " << txHash.ToHex();
        return StoreStatus::DuplicateTransaction(txHash.ToHex());
    }
    if (!s.IsNotFound()) {
        return FromBackend(s);
    }

    uint64_t next = 0;
    StoreStatus ss = ReadNextIndex(*tx, &next);
    if (!ss.ok()) {
        return ss;
    }

    StoredTransaction record;
    record.index = next;
    record.stakingTx = stakingTx;
    record.stakingOutputIndex = stakingOutputIndex;
    record.stakingTime = stakingTime;
    record.stakerAddress = stakerAddress.Encode();
    record.delegationReference = delegationReference;
    if (unbonding) {
        UnbondingData data;
        data.unbondingTx = unbonding->unbondingTx;
        data.unbondingTime = unbonding->unbondingTime;
        record.unbondingData = std::move(data);
    }

    const std::string recordKey = EncodeIndexKey(next);
    tx->Put(buckets::TRANSACTIONS, recordKey, EncodeStoredTransaction(record));
    tx->Put(buckets::TRANSACTION_INDEX, hashKey, recordKey);
    tx->Put(buckets::TRANSACTION_INDEX, NEXT_TX_KEY, EncodeIndexKey(next + 1));
    for (const auto& in : stakingTx.vin) {
        tx->Put(buckets::INPUTS, EncodeOutpointKey(in.prevout), hashKey);
    }

    s = tx->Commit();
    if (!s.ok()) {
        return FromBackend(s);
    }

    LOG_DEBUG(STORE) << "Tracking staking transaction " << txHash.ToHex()
                     << " at index " << next;
    if (index) {
        *index = next;
    }
    return StoreStatus::Ok();
}

// ============================================================================
// Lookup
// ============================================================================

StoreStatus TrackedTransactionStore::GetTransaction(const TxHash& txHash,
                                                    StoredTransaction* out) const {
    auto tx = kv_->BeginRead();
    std::string recordKey;
    StoredTransaction record;
    StoreStatus s = LoadByHash(*tx, txHash, &recordKey, &record);
    if (!s.ok()) {
        return s;
    }
    *out = std::move(record);
    return StoreStatus::Ok();
}

StoreStatus TrackedTransactionStore::Count(uint64_t* count) const {
    auto tx = kv_->BeginRead();
    uint64_t next = 0;
    StoreStatus s = ReadNextIndex(*tx, &next);
    if (!s.ok()) {
        return s;
    }
    *count = next - 1;
    return StoreStatus::Ok();
}

StoreStatus TrackedTransactionStore::OutpointUsed(const OutPoint& outpoint, bool* used) const {
    auto tx = kv_->BeginRead();
    std::string value;
    db::Status s = tx->Get(buckets::INPUTS, EncodeOutpointKey(outpoint), &value);
    if (s.ok()) {
        *used = true;
        return StoreStatus::Ok();
    }
    if (s.IsNotFound()) {
        *used = false;
        return StoreStatus::Ok();
    }
    return FromBackend(s);
}

// ============================================================================
// Transitions
// ============================================================================

StoreStatus TrackedTransactionStore::ApplyTransition(const TxHash& txHash,
                                                     const Transition& transition) {
    auto tx = kv_->BeginWrite();

    std::string recordKey;
    StoredTransaction record;
    StoreStatus s = LoadByHash(*tx, txHash, &recordKey, &record);
    if (!s.ok()) {
        return s;
    }

    s = ApplyTransitionTo(record, transition);
    if (!s.ok()) {
        LOG_DEBUG(STORE) << TransitionName(transition) << " rejected for "
                         << txHash.ToHex() << ": " << s.ToString();
        return s;
    }

    tx->Put(buckets::TRANSACTIONS, recordKey, EncodeStoredTransaction(record));
    db::Status ds = tx->Commit();
    if (!ds.ok()) {
        return FromBackend(ds);
    }

    LOG_DEBUG(STORE) << TransitionName(transition) << " applied to " << txHash.ToHex()
                     << " (index " << record.index << ", now "
                     << StakingStateToString(record.GetState()) << ")";
    return StoreStatus::Ok();
}

StoreStatus TrackedTransactionStore::SetTxConfirmed(const TxHash& txHash,
                                                    const BlockHash& blockHash,
                                                    uint32_t blockHeight) {
    return ApplyTransition(txHash, SetStakingConfirmed{blockHeight, blockHash});
}

StoreStatus TrackedTransactionStore::SetDelegationActiveOnBabylonAndConfirmedOnBtc(
    const TxHash& txHash, const BlockHash& blockHash, uint32_t blockHeight) {
    return ApplyTransition(txHash, SetDelegationActiveAndConfirmed{blockHeight, blockHash});
}

StoreStatus TrackedTransactionStore::SetTxUnbondingSignaturesReceived(
    const TxHash& txHash, const std::vector<CovenantSignature>& signatures) {
    return ApplyTransition(txHash, SetUnbondingSignaturesReceived{signatures});
}

StoreStatus TrackedTransactionStore::SetTxUnbondingConfirmedOnBtc(const TxHash& txHash,
                                                                  const BlockHash& blockHash,
                                                                  uint32_t blockHeight) {
    return ApplyTransition(txHash, SetUnbondingConfirmed{blockHeight, blockHash});
}

// ============================================================================
// Listing
// ============================================================================

StoreStatus TrackedTransactionStore::QueryStoredTransactions(
    const StoredTransactionQuery& query, StoredTransactionQueryResult* out) const {
    auto tx = kv_->BeginRead();

    uint64_t next = 0;
    StoreStatus s = ReadNextIndex(*tx, &next);
    if (!s.ok()) {
        return s;
    }

    StoredTransactionQueryResult result;
    result.total = next - 1;
    if (result.total == 0) {
        *out = std::move(result);
        return StoreStatus::Ok();
    }

    auto cursor = tx->NewCursor(buckets::TRANSACTIONS);
    Paginator paginator(*cursor, query.reversed, query.offset, query.limit);

    s = paginator.Query([&](const db::Slice& key, const db::Slice& value, bool* accepted) {
        uint64_t index = 0;
        if (!DecodeIndexKey(key, index)) {
            return Corrupted("malformed record key");
        }
        StoredTransaction record;
        StoreStatus ds = DecodeRecord(index, value, &record);
        if (!ds.ok()) {
            return ds;
        }
        if (query.withdrawable && !(*query.withdrawable)(record)) {
            *accepted = false;
            return StoreStatus::Ok();
        }
        result.transactions.push_back(std::move(record));
        *accepted = true;
        return StoreStatus::Ok();
    });
    if (!s.ok()) {
        return s;
    }

    // Pages are always ascending
    if (query.reversed) {
        std::reverse(result.transactions.begin(), result.transactions.end());
    }

    *out = std::move(result);
    return StoreStatus::Ok();
}

StoreStatus TrackedTransactionStore::GetAllStoredTransactions(
    std::vector<StoredTransaction>* out) const {
    StoredTransactionQuery query = StoredTransactionQuery::Default();
    query.limit = UNBOUNDED_LIMIT;

    StoredTransactionQueryResult result;
    StoreStatus s = QueryStoredTransactions(query, &result);
    if (!s.ok()) {
        return s;
    }
    *out = std::move(result.transactions);
    return StoreStatus::Ok();
}

StoreStatus TrackedTransactionStore::ScanTrackedTransactions(const ScanVisitor& visit) const {
    auto tx = kv_->BeginRead();
    auto cursor = tx->NewCursor(buckets::TRANSACTIONS);
    Paginator paginator(*cursor, false, 0, UNBOUNDED_LIMIT);

    return paginator.Query([&](const db::Slice& key, const db::Slice& value, bool* accepted) {
        uint64_t index = 0;
        if (!DecodeIndexKey(key, index)) {
            return Corrupted("malformed record key");
        }
        StoredTransaction record;
        StoreStatus ds = DecodeRecord(index, value, &record);
        if (!ds.ok()) {
            return ds;
        }
        *accepted = true;
        return visit(record);
    });
}

} // namespace stakerdb
} // namespace btcstaker
