// BTCSTAKER - Withdrawable Filter Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/stakerdb/withdrawable.h"

namespace btcstaker {
namespace stakerdb {

bool IsTimeLockExpired(uint32_t confirmationHeight, uint16_t lockTime,
                       uint32_t bestHeight) {
    // The spend can only land in the next block
    int64_t nextBlockHeight = static_cast<int64_t>(bestHeight) + 1;
    int64_t pastLock = nextBlockHeight - static_cast<int64_t>(confirmationHeight) -
                       static_cast<int64_t>(lockTime);
    return pastLock >= 0;
}

bool IsWithdrawable(const StoredTransaction& tx, uint32_t bestHeight) {
    if (!tx.StakingTxConfirmedOnBtc()) {
        return false;
    }

    if (tx.UnbondingTxConfirmedOnBtc()) {
        return IsTimeLockExpired(tx.unbondingData->unbondingConfirmation->height,
                                 tx.unbondingData->unbondingTime, bestHeight);
    }

    return IsTimeLockExpired(tx.stakingConfirmation->height, tx.stakingTime, bestHeight);
}

} // namespace stakerdb
} // namespace btcstaker
