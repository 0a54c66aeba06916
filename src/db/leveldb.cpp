// BTCSTAKER - LevelDB Wrapper Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/db/leveldb.h"

#ifdef BTCSTAKER_USE_LEVELDB

namespace btcstaker {
namespace db {

Status ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBDatabase::MakeReadOptions(const ReadOptions& options,
                                        leveldb::ReadOptions* out) const {
    *out = leveldb::ReadOptions();
    if (options.snapshot) {
        const auto* snap = dynamic_cast<const LevelDBSnapshot*>(options.snapshot);
        if (!snap || snap->Owner() != db_.get()) {
            return Status::InvalidArgument("snapshot does not belong to this database");
        }
        out->snapshot = snap->Get();
    }
    return Status::Ok();
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    leveldb::ReadOptions lo;
    Status s = MakeReadOptions(options, &lo);
    if (!s.ok()) {
        return s;
    }
    return ConvertStatus(db_->Get(lo, leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    if (!batch) {
        return Status::InvalidArgument("null write batch");
    }
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Write(lo, &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    leveldb::ReadOptions lo;
    Status s = MakeReadOptions(options, &lo);
    if (!s.ok()) {
        return NewErrorIterator(s);
    }
    return std::make_unique<LevelDBIterator>(db_->NewIterator(lo));
}

std::unique_ptr<Snapshot> LevelDBDatabase::GetSnapshot() {
    return std::make_unique<LevelDBSnapshot>(db_.get());
}

} // namespace db
} // namespace btcstaker

#endif // BTCSTAKER_USE_LEVELDB
