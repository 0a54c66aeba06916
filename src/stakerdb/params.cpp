// BTCSTAKER - Request Parameter Helpers Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/stakerdb/params.h"
#include "btcstaker/core/hex.h"

#include <algorithm>

namespace btcstaker {
namespace stakerdb {

StoreStatus ParseTxHash(const std::string& hex, TxHash* out) {
    if (hex.size() != TxHash::SIZE * 2) {
        return StoreStatus::InvalidArgument("transaction hash must be " +
                                            std::to_string(TxHash::SIZE * 2) +
                                            " hex characters, got " +
                                            std::to_string(hex.size()));
    }
    if (!IsValidHex(hex)) {
        return StoreStatus::InvalidArgument("transaction hash is not hex: " + hex);
    }
    *out = TxHash::FromHex(hex);
    return StoreStatus::Ok();
}

StoreStatus NormalizePageParams(std::optional<int64_t> offset,
                                std::optional<int64_t> limit,
                                PageParams* out,
                                uint64_t defaultLimit,
                                uint64_t maxLimit) {
    PageParams params;

    if (!limit) {
        params.limit = defaultLimit;
    } else if (*limit < 0) {
        return StoreStatus::InvalidArgument("limit cannot be negative");
    } else {
        params.limit = static_cast<uint64_t>(*limit);
    }
    params.limit = std::min(params.limit, maxLimit);

    if (!offset) {
        params.offset = 0;
    } else if (*offset < 0) {
        return StoreStatus::InvalidArgument("offset cannot be negative");
    } else {
        params.offset = static_cast<uint64_t>(*offset);
    }

    *out = params;
    return StoreStatus::Ok();
}

} // namespace stakerdb
} // namespace btcstaker
