// BTCSTAKER - Withdrawable Filter
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Decides whether the funds of a tracked transaction can be withdrawn at a
// given chain height.

#ifndef BTCSTAKER_STAKERDB_WITHDRAWABLE_H
#define BTCSTAKER_STAKERDB_WITHDRAWABLE_H

#include "btcstaker/stakerdb/tracked_tx.h"
#include <cstdint>

namespace btcstaker {
namespace stakerdb {

/**
 * A relative lock of lockTime blocks on an output confirmed at
 * confirmationHeight is satisfied once the next block
 * (bestHeight + 1) is at least confirmationHeight + lockTime.
 */
bool IsTimeLockExpired(uint32_t confirmationHeight, uint16_t lockTime,
                       uint32_t bestHeight);

/**
 * True if the record's spendable output is past its lock at bestHeight.
 *
 * - staking not confirmed: never
 * - staking confirmed, unbonding not confirmed: staking output and lock
 * - staking and unbonding confirmed: unbonding output and lock
 */
bool IsWithdrawable(const StoredTransaction& tx, uint32_t bestHeight);

/// Query predicate selecting withdrawable records
struct WithdrawableFilter {
    uint32_t bestHeight{0};

    bool operator()(const StoredTransaction& tx) const {
        return IsWithdrawable(tx, bestHeight);
    }
};

} // namespace stakerdb
} // namespace btcstaker

#endif // BTCSTAKER_STAKERDB_WITHDRAWABLE_H
