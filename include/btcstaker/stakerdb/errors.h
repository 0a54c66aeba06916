// BTCSTAKER - Staker Database Errors
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Error taxonomy of the tracked transaction store.

#ifndef BTCSTAKER_STAKERDB_ERRORS_H
#define BTCSTAKER_STAKERDB_ERRORS_H

#include "btcstaker/db/database.h"
#include <string>

namespace btcstaker {
namespace stakerdb {

/// Closed set of store failure kinds
enum class StoreError {
    OK = 0,
    /// The staking transaction hash is already tracked
    DuplicateTransaction,
    /// No record for the transaction hash
    TransactionNotFound,
    /// Index and record disagree, or a record fails to decode
    CorruptedStore,
    /// Transition needs unbonding data the record does not have
    UnbondingDataNotFound,
    /// Covenant signatures were already recorded
    UnbondingAlreadySet,
    /// Bad caller input, rejected before touching the store
    InvalidArgument,
    /// Backend failure
    IOError,
};

const char* StoreErrorName(StoreError error);

/**
 * Result of a store operation: an error code plus a message.
 */
class StoreStatus {
public:
    StoreStatus() : code_(StoreError::OK) {}
    StoreStatus(StoreError code, const std::string& msg = "") : code_(code), message_(msg) {}

    static StoreStatus Ok() { return StoreStatus(); }
    static StoreStatus DuplicateTransaction(const std::string& msg = "") {
        return StoreStatus(StoreError::DuplicateTransaction, msg);
    }
    static StoreStatus TransactionNotFound(const std::string& msg = "") {
        return StoreStatus(StoreError::TransactionNotFound, msg);
    }
    static StoreStatus CorruptedStore(const std::string& msg = "") {
        return StoreStatus(StoreError::CorruptedStore, msg);
    }
    static StoreStatus UnbondingDataNotFound(const std::string& msg = "") {
        return StoreStatus(StoreError::UnbondingDataNotFound, msg);
    }
    static StoreStatus UnbondingAlreadySet(const std::string& msg = "") {
        return StoreStatus(StoreError::UnbondingAlreadySet, msg);
    }
    static StoreStatus InvalidArgument(const std::string& msg = "") {
        return StoreStatus(StoreError::InvalidArgument, msg);
    }
    static StoreStatus IOError(const std::string& msg = "") {
        return StoreStatus(StoreError::IOError, msg);
    }

    /// Map a backend status. Backend corruption is store corruption, every
    /// other failure is an I/O error.
    static StoreStatus FromDb(const db::Status& s);

    bool ok() const { return code_ == StoreError::OK; }
    bool Is(StoreError code) const { return code_ == code; }

    StoreError code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    StoreError code_;
    std::string message_;
};

} // namespace stakerdb
} // namespace btcstaker

#endif // BTCSTAKER_STAKERDB_ERRORS_H
