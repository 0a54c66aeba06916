// BTCSTAKER - Staker Database Errors Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/stakerdb/errors.h"

namespace btcstaker {
namespace stakerdb {

const char* StoreErrorName(StoreError error) {
    switch (error) {
        case StoreError::OK: return "OK";
        case StoreError::DuplicateTransaction: return "DuplicateTransaction";
        case StoreError::TransactionNotFound: return "TransactionNotFound";
        case StoreError::CorruptedStore: return "CorruptedStore";
        case StoreError::UnbondingDataNotFound: return "UnbondingDataNotFound";
        case StoreError::UnbondingAlreadySet: return "UnbondingAlreadySet";
        case StoreError::InvalidArgument: return "InvalidArgument";
        case StoreError::IOError: return "IOError";
    }
    return "Unknown";
}

StoreStatus StoreStatus::FromDb(const db::Status& s) {
    if (s.ok()) {
        return Ok();
    }
    if (s.IsCorruption()) {
        return CorruptedStore(s.ToString());
    }
    return IOError(s.ToString());
}

std::string StoreStatus::ToString() const {
    if (ok()) return "OK";
    std::string result = StoreErrorName(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace stakerdb
} // namespace btcstaker
