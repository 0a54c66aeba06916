// BTCSTAKER - Bucket Paginator
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Offset/limit walk over an ordered bucket, in either direction, with an
// accept/skip decision per entry.

#ifndef BTCSTAKER_STAKERDB_PAGINATOR_H
#define BTCSTAKER_STAKERDB_PAGINATOR_H

#include "btcstaker/db/kvstore.h"
#include "btcstaker/stakerdb/errors.h"
#include <cstdint>
#include <functional>
#include <limits>

namespace btcstaker {
namespace stakerdb {

/// Limit meaning "no limit"
constexpr uint64_t UNBOUNDED_LIMIT = std::numeric_limits<uint64_t>::max();

/**
 * Called once per visited entry. Sets *accepted when the entry counts
 * toward the limit. A non-OK return stops the walk and is passed through.
 */
using PageVisitor = std::function<StoreStatus(const db::Slice& key,
                                              const db::Slice& value,
                                              bool* accepted)>;

/**
 * Walks a bucket cursor.
 *
 * Forward: start at the (offset+1)-th smallest key and move up.
 * Reversed: start at the (offset+1)-th largest key and move down.
 * The offset counts raw entries whether or not they would be accepted;
 * rejected entries do not use up the limit. The walk ends after limit
 * accepted entries or at the end of the bucket.
 */
class Paginator {
public:
    Paginator(db::BucketCursor& cursor, bool reversed, uint64_t offset, uint64_t limit)
        : cursor_(cursor), reversed_(reversed), offset_(offset), limit_(limit) {}

    StoreStatus Query(const PageVisitor& visit);

    /// Number of entries accepted by the last Query
    uint64_t Accepted() const { return accepted_; }

private:
    void Start();
    void Step();

    db::BucketCursor& cursor_;
    bool reversed_;
    uint64_t offset_;
    uint64_t limit_;
    uint64_t accepted_{0};
};

} // namespace stakerdb
} // namespace btcstaker

#endif // BTCSTAKER_STAKERDB_PAGINATOR_H
