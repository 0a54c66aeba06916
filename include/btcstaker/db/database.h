// BTCSTAKER - Database Abstraction Layer
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Ordered key-value database seen by the bucket store. Writes only happen
// through WriteBatch so every change is applied atomically. The store runs
// on LevelDB when it is compiled in, or on the in-memory backend otherwise.

#ifndef BTCSTAKER_DB_DATABASE_H
#define BTCSTAKER_DB_DATABASE_H

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace btcstaker {
namespace db {

// ============================================================================
// Status
// ============================================================================

/// Outcome of a database call. Backend messages are kept verbatim.
class Status {
public:
    enum class Code : uint8_t {
        Ok,
        NotFound,
        Corruption,
        NotSupported,
        InvalidArgument,
        IOError,
    };

    Status() = default;

    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(Code::NotFound, std::move(msg)); }
    static Status Corruption(std::string msg) { return Status(Code::Corruption, std::move(msg)); }
    static Status NotSupported(std::string msg) { return Status(Code::NotSupported, std::move(msg)); }
    static Status InvalidArgument(std::string msg) {
        return Status(Code::InvalidArgument, std::move(msg));
    }
    static Status IOError(std::string msg) { return Status(Code::IOError, std::move(msg)); }

    bool ok() const { return code_ == Code::Ok; }
    bool IsNotFound() const { return code_ == Code::NotFound; }
    bool IsCorruption() const { return code_ == Code::Corruption; }
    bool IsInvalidArgument() const { return code_ == Code::InvalidArgument; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "OK", or "<Code>: <message>"
    std::string ToString() const;

private:
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    Code code_{Code::Ok};
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/// Non-owning view of a byte range; the buffer must outlive the Slice
class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    char operator[](size_t n) const { return data_[n]; }

    void remove_prefix(size_t n) {
        data_ += n;
        size_ -= n;
    }

    std::string ToString() const { return std::string(data_, size_); }

    bool operator==(const Slice& b) const {
        return size_ == b.size_ && (size_ == 0 || std::memcmp(data_, b.data_, size_) == 0);
    }
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    /// Create the database directory when it does not exist
    bool create_if_missing = true;

    /// Block cache in bytes, 0 for the backend default
    size_t block_cache_size = 8 * 1024 * 1024;

    bool compression = true;

    /// Bloom filter bits per key, 0 to disable
    int bloom_filter_bits = 10;
};

class Snapshot;

struct ReadOptions {
    /// Read as of a snapshot taken from the same database (nullptr for latest)
    const Snapshot* snapshot = nullptr;
};

struct WriteOptions {
    /// fsync before the write returns
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/// Puts and deletes applied in insertion order, all or nothing
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        ops_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        ops_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { ops_.clear(); }
    size_t Count() const { return ops_.size(); }
    bool Empty() const { return ops_.empty(); }

    /// fn(key, value); value is nullopt for a delete
    template<typename Func>
    void Iterate(Func&& fn) const {
        for (const auto& op : ops_) {
            fn(op.first, op.second);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> ops_;
};

// ============================================================================
// Snapshot and Iterator
// ============================================================================

/// Frozen view of a database. Must not outlive the database.
class Snapshot {
public:
    virtual ~Snapshot() = default;
};

/// Cursor over keys in ascending byte order
class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToLast() = 0;

    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;

    /// REQUIRES: Valid()
    virtual void Next() = 0;
    virtual void Prev() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;

    virtual Status status() const = 0;
};

/// Iterator with no entries that reports the given error
std::unique_ptr<Iterator> NewErrorIterator(const Status& status);

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    /// NotFound if the key is absent. InvalidArgument for a foreign snapshot.
    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;

    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }

    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;

    Status Write(WriteBatch* batch) { return Write(WriteOptions(), batch); }

    /// A foreign snapshot yields an error iterator
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;

    std::unique_ptr<Iterator> NewIterator() { return NewIterator(ReadOptions()); }

    virtual std::unique_ptr<Snapshot> GetSnapshot() = 0;

    /// True when data survives closing the database
    virtual bool IsPersistent() const = 0;

    /// Backend name for diagnostics ("leveldb", "memory")
    virtual const char* Name() const = 0;
};

/**
 * Open the database directory at path. Uses LevelDB when built with
 * BTCSTAKER_USE_LEVELDB, otherwise a non-persistent in-memory database
 * (the directory is still created when create_if_missing is set).
 * @return Pair of (status, database)
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

} // namespace db
} // namespace btcstaker

#endif // BTCSTAKER_DB_DATABASE_H
