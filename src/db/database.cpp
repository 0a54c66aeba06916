// BTCSTAKER - Database Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/db/database.h"
#include "btcstaker/db/leveldb.h"
#include "btcstaker/db/memory.h"
#include "btcstaker/util/logging.h"

namespace btcstaker {
namespace db {

std::string Status::ToString() const {
    const char* name = "Unknown";
    switch (code_) {
        case Code::Ok: return "OK";
        case Code::NotFound: name = "NotFound"; break;
        case Code::Corruption: name = "Corruption"; break;
        case Code::NotSupported: name = "NotSupported"; break;
        case Code::InvalidArgument: name = "InvalidArgument"; break;
        case Code::IOError: name = "IOError"; break;
    }
    return std::string(name) + ": " + message_;
}

// ============================================================================
// Error Iterator
// ============================================================================

namespace {

class ErrorIterator : public Iterator {
public:
    explicit ErrorIterator(Status status) : status_(std::move(status)) {}

    bool Valid() const override { return false; }
    void SeekToLast() override {}
    void Seek(const Slice&) override {}
    void Next() override {}
    void Prev() override {}
    Slice key() const override { return Slice(); }
    Slice value() const override { return Slice(); }
    Status status() const override { return status_; }

private:
    Status status_;
};

Status CreateDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Status::IOError("cannot create " + dir.string() + ": " + ec.message());
    }
    return Status::Ok();
}

} // namespace

std::unique_ptr<Iterator> NewErrorIterator(const Status& status) {
    return std::make_unique<ErrorIterator>(status);
}

// ============================================================================
// OpenDatabase
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef BTCSTAKER_USE_LEVELDB
    if (options.create_if_missing && path.has_parent_path()) {
        Status s = CreateDirectory(path.parent_path());
        if (!s.ok()) {
            return {s, nullptr};
        }
    } else if (!options.create_if_missing) {
        // LevelDB creates the directory before noticing the database is missing
        std::error_code ec;
        if (!std::filesystem::is_directory(path, ec)) {
            return {Status::InvalidArgument(path.string() + " does not exist"), nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.compression = options.compression ? leveldb::kSnappyCompression
                                         : leveldb::kNoCompression;

    std::unique_ptr<leveldb::Cache> cache;
    if (options.block_cache_size > 0) {
        cache.reset(leveldb::NewLRUCache(options.block_cache_size));
        lo.block_cache = cache.get();
    }
    std::unique_ptr<const leveldb::FilterPolicy> filter;
    if (options.bloom_filter_bits > 0) {
        filter.reset(leveldb::NewBloomFilterPolicy(options.bloom_filter_bits));
        lo.filter_policy = filter.get();
    }

    leveldb::DB* raw = nullptr;
    leveldb::Status ls = leveldb::DB::Open(lo, path.string(), &raw);
    if (!ls.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << ls.ToString();
        return {ConvertStatus(ls), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB database at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(
                              std::unique_ptr<leveldb::DB>(raw), std::move(cache),
                              std::move(filter))};
#else
    if (options.create_if_missing) {
        Status s = CreateDirectory(path);
        if (!s.ok()) {
            return {s, nullptr};
        }
    } else {
        std::error_code ec;
        if (!std::filesystem::is_directory(path, ec)) {
            return {Status::InvalidArgument(path.string() + " does not exist"), nullptr};
        }
    }

    LOG_WARN(util::LogCategory::DB) << "LevelDB support not compiled in; "
                                    << path.string()
                                    << " is backed by a non-persistent memory database";
    return {Status::Ok(), std::make_unique<MemoryDatabase>()};
#endif
}

} // namespace db
} // namespace btcstaker
