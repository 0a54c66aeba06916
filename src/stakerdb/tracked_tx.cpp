// BTCSTAKER - Tracked Transaction Records Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/stakerdb/tracked_tx.h"

namespace btcstaker {
namespace stakerdb {

bool UnbondingData::operator==(const UnbondingData& other) const {
    return unbondingTx == other.unbondingTx &&
           unbondingTime == other.unbondingTime &&
           covenantSignatures == other.covenantSignatures &&
           unbondingConfirmation == other.unbondingConfirmation;
}

const char* StakingStateToString(StakingState state) {
    switch (state) {
        case StakingState::SENT_TO_BABYLON: return "SENT_TO_BABYLON";
        case StakingState::CONFIRMED_ON_BTC: return "CONFIRMED_ON_BTC";
        case StakingState::UNBONDING_SIGNATURES_RECEIVED: return "UNBONDING_SIGNATURES_RECEIVED";
        case StakingState::UNBONDING_CONFIRMED_ON_BTC: return "UNBONDING_CONFIRMED_ON_BTC";
    }
    return "UNKNOWN";
}

StakingState StoredTransaction::GetState() const {
    if (UnbondingTxConfirmedOnBtc()) {
        return StakingState::UNBONDING_CONFIRMED_ON_BTC;
    }
    if (unbondingData && !unbondingData->covenantSignatures.empty()) {
        return StakingState::UNBONDING_SIGNATURES_RECEIVED;
    }
    if (StakingTxConfirmedOnBtc()) {
        return StakingState::CONFIRMED_ON_BTC;
    }
    return StakingState::SENT_TO_BABYLON;
}

bool StoredTransaction::operator==(const StoredTransaction& other) const {
    return index == other.index &&
           stakingTx == other.stakingTx &&
           stakingOutputIndex == other.stakingOutputIndex &&
           stakingTime == other.stakingTime &&
           stakerAddress == other.stakerAddress &&
           stakingConfirmation == other.stakingConfirmation &&
           unbondingData == other.unbondingData &&
           delegationReference == other.delegationReference;
}

StakingDetails GetStakingDetails(const StoredTransaction& tx) {
    StakingDetails details;
    details.stakingTxHash = tx.GetStakingTxHash().ToHex();
    details.stakerAddress = tx.stakerAddress;
    details.stakingState = StakingStateToString(tx.GetState());
    details.transactionIdx = std::to_string(tx.index);
    return details;
}

} // namespace stakerdb
} // namespace btcstaker
