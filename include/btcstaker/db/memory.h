// BTCSTAKER - In-Memory Database
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Ordered map backed implementation of the database interface, used for
// tests and when LevelDB is not available. Nothing is persisted.

#ifndef BTCSTAKER_DB_MEMORY_H
#define BTCSTAKER_DB_MEMORY_H

#include "btcstaker/db/database.h"
#include <map>
#include <memory>
#include <mutex>

namespace btcstaker {
namespace db {

/**
 * In-memory database.
 *
 * Every committed batch publishes a new immutable map version. Iterators and
 * snapshots hold the version that was current when they were created, so
 * they never observe a later batch, and a batch becomes visible all at once.
 */
class MemoryDatabase : public Database {
public:
    using Map = std::map<std::string, std::string>;

    MemoryDatabase();

    using Database::Get;
    using Database::NewIterator;
    using Database::Write;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    std::unique_ptr<Snapshot> GetSnapshot() override;

    bool IsPersistent() const override { return false; }
    const char* Name() const override { return "memory"; }

private:
    /// Current version, or the snapshot's version when one is requested
    Status Version(const ReadOptions& options, std::shared_ptr<const Map>* out) const;

    std::shared_ptr<const Map> current_;
    mutable std::mutex mutex_;
};

/// Snapshot of a MemoryDatabase: the map version current at the time
class MemorySnapshot : public Snapshot {
public:
    MemorySnapshot(const MemoryDatabase* owner, std::shared_ptr<const MemoryDatabase::Map> data)
        : owner_(owner), data_(std::move(data)) {}

    const MemoryDatabase* Owner() const { return owner_; }
    const std::shared_ptr<const MemoryDatabase::Map>& Data() const { return data_; }

private:
    const MemoryDatabase* owner_;
    std::shared_ptr<const MemoryDatabase::Map> data_;
};

/// Iterator over one map version, which it keeps alive
class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::shared_ptr<const MemoryDatabase::Map> data)
        : data_(std::move(data)), iter_(data_->end()) {}

    bool Valid() const override { return iter_ != data_->end(); }

    void SeekToLast() override {
        iter_ = data_->empty() ? data_->end() : std::prev(data_->end());
    }

    void Seek(const Slice& target) override {
        iter_ = data_->lower_bound(target.ToString());
    }

    void Next() override { ++iter_; }

    void Prev() override {
        iter_ = iter_ == data_->begin() ? data_->end() : std::prev(iter_);
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    std::shared_ptr<const MemoryDatabase::Map> data_;
    MemoryDatabase::Map::const_iterator iter_;
};

} // namespace db
} // namespace btcstaker

#endif // BTCSTAKER_DB_MEMORY_H
