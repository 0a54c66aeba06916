// BTCSTAKER - LevelDB Wrapper
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// LevelDB implementation of the database interface. Only compiled when the
// build found LevelDB (BTCSTAKER_USE_LEVELDB).

#ifndef BTCSTAKER_DB_LEVELDB_H
#define BTCSTAKER_DB_LEVELDB_H

#include "btcstaker/db/database.h"

#ifdef BTCSTAKER_USE_LEVELDB
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

namespace btcstaker {
namespace db {

/// Map a LevelDB status onto ours
Status ConvertStatus(const leveldb::Status& s);

class LevelDBSnapshot : public Snapshot {
public:
    explicit LevelDBSnapshot(leveldb::DB* db) : db_(db), snapshot_(db->GetSnapshot()) {}
    ~LevelDBSnapshot() override { db_->ReleaseSnapshot(snapshot_); }

    LevelDBSnapshot(const LevelDBSnapshot&) = delete;
    LevelDBSnapshot& operator=(const LevelDBSnapshot&) = delete;

    const leveldb::Snapshot* Get() const { return snapshot_; }
    const leveldb::DB* Owner() const { return db_; }

private:
    leveldb::DB* db_;
    const leveldb::Snapshot* snapshot_;
};

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToLast() override { iter_->SeekToLast(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }
    void Prev() override { iter_->Prev(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return ConvertStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(std::unique_ptr<leveldb::DB> db, std::unique_ptr<leveldb::Cache> cache,
                    std::unique_ptr<const leveldb::FilterPolicy> filter)
        : cache_(std::move(cache)), filter_(std::move(filter)), db_(std::move(db)) {}

    using Database::Get;
    using Database::NewIterator;
    using Database::Write;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    std::unique_ptr<Snapshot> GetSnapshot() override;

    bool IsPersistent() const override { return true; }
    const char* Name() const override { return "leveldb"; }

private:
    /// InvalidArgument when the snapshot was taken from another database
    Status MakeReadOptions(const ReadOptions& options, leveldb::ReadOptions* out) const;

    // Declared before db_ so they are destroyed after it
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_;
    std::unique_ptr<leveldb::DB> db_;
};

} // namespace db
} // namespace btcstaker

#endif // BTCSTAKER_USE_LEVELDB

#endif // BTCSTAKER_DB_LEVELDB_H
