// BTCSTAKER - Bucketed Key-Value Store
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Named buckets and transaction scopes on top of a flat ordered database.
//
// A bucket is a one-byte key prefix registered under a metadata key, so
// several logical keyspaces share one database. Reads run in a ReadTx bound
// to a snapshot. Writes run in a WriteTx that holds the store's write lock,
// sees its own pending changes, and commits them as one WriteBatch. A WriteTx
// destroyed without Commit() discards everything it buffered.

#ifndef BTCSTAKER_DB_KVSTORE_H
#define BTCSTAKER_DB_KVSTORE_H

#include "btcstaker/db/database.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace btcstaker {
namespace db {

// ============================================================================
// Bucket
// ============================================================================

/**
 * A named keyspace. All keys of the bucket are stored as prefix ‖ key.
 */
struct Bucket {
    std::string name;
    char prefix;

    /// Full database key for a key inside this bucket
    std::string Key(const Slice& key) const;
};

/// Prefix reserved for bucket registrations and other store metadata
constexpr char META_PREFIX = 'M';

// ============================================================================
// Bucket Cursor
// ============================================================================

/**
 * Ordered cursor restricted to one bucket. Keys are returned without the
 * bucket prefix. Leaving the bucket in either direction makes it invalid.
 */
class BucketCursor {
public:
    BucketCursor(std::unique_ptr<Iterator> iter, char prefix);

    /// Position at the smallest key of the bucket
    void First();

    /// Position at the largest key of the bucket
    void Last();

    /// Position at the first key >= target
    void Seek(const Slice& target);

    void Next();
    void Prev();

    bool Valid() const { return valid_; }

    /// REQUIRES: Valid()
    Slice key() const;
    Slice value() const;

    /// Backend error, if any, encountered while iterating
    Status status() const { return iter_->status(); }

private:
    void Check();

    std::unique_ptr<Iterator> iter_;
    char prefix_;
    bool valid_{false};
};

// ============================================================================
// Read Transaction
// ============================================================================

/**
 * Read-only scope over a consistent snapshot. Commits made after BeginRead()
 * are not visible.
 */
class ReadTx {
public:
    ReadTx(Database& db, std::unique_ptr<Snapshot> snapshot);
    ~ReadTx();

    ReadTx(const ReadTx&) = delete;
    ReadTx& operator=(const ReadTx&) = delete;

    /// NotFound if the key is absent
    Status Get(const Bucket& bucket, const Slice& key, std::string* value) const;

    /// True if the bucket was registered
    bool HasBucket(const Bucket& bucket) const;

    /// Cursor over the bucket as of the snapshot
    std::unique_ptr<BucketCursor> NewCursor(const Bucket& bucket) const;

    /// Raw metadata lookup
    Status GetMeta(const Slice& key, std::string* value) const;

private:
    Database& db_;
    std::unique_ptr<Snapshot> snapshot_;
    ReadOptions options_;
};

// ============================================================================
// Write Transaction
// ============================================================================

/**
 * Read-write scope. Holds the store's write lock for its whole lifetime.
 */
class WriteTx {
public:
    WriteTx(Database& db, std::unique_lock<std::mutex> lock,
            const WriteOptions& options);
    ~WriteTx();

    WriteTx(const WriteTx&) = delete;
    WriteTx& operator=(const WriteTx&) = delete;

    /// Reads see this transaction's own pending writes
    Status Get(const Bucket& bucket, const Slice& key, std::string* value) const;

    void Put(const Bucket& bucket, const Slice& key, const Slice& value);
    void Delete(const Bucket& bucket, const Slice& key);

    /// Register the bucket if missing. Corruption if its name is registered
    /// with a different prefix.
    Status CreateBucketIfNotExists(const Bucket& bucket);

    bool HasBucket(const Bucket& bucket) const;

    Status GetMeta(const Slice& key, std::string* value) const;
    void PutMeta(const Slice& key, const Slice& value);

    /// Apply every buffered write atomically. The transaction is finished
    /// afterwards whatever the outcome.
    Status Commit();

    /// Discard buffered writes
    void Rollback();

    bool IsFinished() const { return finished_; }

    /// Number of buffered operations
    size_t PendingCount() const { return batch_.Count(); }

private:
    Status GetRaw(const std::string& fullKey, std::string* value) const;
    void PutRaw(const std::string& fullKey, const Slice& value);

    Database& db_;
    std::unique_lock<std::mutex> lock_;
    std::unique_ptr<Snapshot> snapshot_;
    ReadOptions read_options_;
    WriteOptions write_options_;
    WriteBatch batch_;
    std::map<std::string, std::optional<std::string>> pending_;
    bool finished_{false};
};

// ============================================================================
// KVStore
// ============================================================================

/**
 * Owns a database and hands out transaction scopes.
 */
class KVStore {
public:
    explicit KVStore(std::unique_ptr<Database> db,
                     const WriteOptions& writeOptions = WriteOptions());
    ~KVStore();

    KVStore(const KVStore&) = delete;
    KVStore& operator=(const KVStore&) = delete;

    /**
     * Open (or create) the database at path.
     * @return Pair of (status, store)
     */
    static std::pair<Status, std::unique_ptr<KVStore>> Open(
        const std::filesystem::path& path,
        const Options& options = Options(),
        const WriteOptions& writeOptions = WriteOptions());

    /// Store on a fresh in-memory database
    static std::unique_ptr<KVStore> OpenInMemory();

    std::unique_ptr<ReadTx> BeginRead() const;

    /// Blocks while another write transaction is alive
    std::unique_ptr<WriteTx> BeginWrite();

    /// Run fn in a read transaction
    Status View(const std::function<Status(ReadTx&)>& fn) const;

    /// Run fn in a write transaction; commit if it returns OK, roll back
    /// otherwise
    Status Update(const std::function<Status(WriteTx&)>& fn);

    Database& GetDatabase() { return *db_; }
    const Database& GetDatabase() const { return *db_; }

private:
    std::unique_ptr<Database> db_;
    WriteOptions write_options_;
    std::mutex write_mutex_;
};

/// Metadata key under which a bucket name is registered
std::string BucketMetaKey(const Bucket& bucket);

} // namespace db
} // namespace btcstaker

#endif // BTCSTAKER_DB_KVSTORE_H
