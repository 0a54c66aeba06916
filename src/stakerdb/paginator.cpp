// BTCSTAKER - Bucket Paginator Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/stakerdb/paginator.h"

namespace btcstaker {
namespace stakerdb {

void Paginator::Start() {
    if (reversed_) {
        cursor_.Last();
    } else {
        cursor_.First();
    }
}

void Paginator::Step() {
    if (reversed_) {
        cursor_.Prev();
    } else {
        cursor_.Next();
    }
}

StoreStatus Paginator::Query(const PageVisitor& visit) {
    accepted_ = 0;
    if (limit_ == 0) {
        return StoreStatus::Ok();
    }

    Start();
    for (uint64_t skipped = 0; skipped < offset_ && cursor_.Valid(); ++skipped) {
        Step();
    }

    while (cursor_.Valid() && accepted_ < limit_) {
        bool accepted = false;
        StoreStatus s = visit(cursor_.key(), cursor_.value(), &accepted);
        if (!s.ok()) {
            return s;
        }
        if (accepted) {
            ++accepted_;
        }
        Step();
    }

    return StoreStatus::FromDb(cursor_.status());
}

} // namespace stakerdb
} // namespace btcstaker
