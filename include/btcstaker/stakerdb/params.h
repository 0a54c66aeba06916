// BTCSTAKER - Request Parameter Helpers
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Validation of caller supplied values before they reach the store.

#ifndef BTCSTAKER_STAKERDB_PARAMS_H
#define BTCSTAKER_STAKERDB_PARAMS_H

#include "btcstaker/core/types.h"
#include "btcstaker/stakerdb/errors.h"
#include <cstdint>
#include <optional>
#include <string>

namespace btcstaker {
namespace stakerdb {

/// Page size used when the caller gives none
constexpr uint64_t DEFAULT_PAGE_LIMIT = 50;

/// Largest page a caller may request
constexpr uint64_t MAX_PAGE_LIMIT = 100;

/// Validated offset and limit
struct PageParams {
    uint64_t offset{0};
    uint64_t limit{DEFAULT_PAGE_LIMIT};
};

/**
 * Parse a transaction hash given as 64 hex characters in display order.
 * @return InvalidArgument on any other input
 */
StoreStatus ParseTxHash(const std::string& hex, TxHash* out);

/**
 * Apply the paging rules: a missing offset is 0, a missing limit is
 * defaultLimit, a limit above maxLimit is clamped, negative values are
 * rejected with InvalidArgument.
 */
StoreStatus NormalizePageParams(std::optional<int64_t> offset,
                                std::optional<int64_t> limit,
                                PageParams* out,
                                uint64_t defaultLimit = DEFAULT_PAGE_LIMIT,
                                uint64_t maxLimit = MAX_PAGE_LIMIT);

} // namespace stakerdb
} // namespace btcstaker

#endif // BTCSTAKER_STAKERDB_PARAMS_H
