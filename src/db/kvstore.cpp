// BTCSTAKER - Bucketed Key-Value Store Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/db/kvstore.h"
#include "btcstaker/db/memory.h"
#include "btcstaker/util/logging.h"

namespace btcstaker {
namespace db {

namespace {

std::string PrefixedKey(char prefix, const Slice& key = Slice()) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

} // namespace

std::string Bucket::Key(const Slice& key) const {
    return PrefixedKey(prefix, key);
}

std::string BucketMetaKey(const Bucket& bucket) {
    return PrefixedKey(META_PREFIX, "bucket/" + bucket.name);
}

// ============================================================================
// BucketCursor
// ============================================================================

BucketCursor::BucketCursor(std::unique_ptr<Iterator> iter, char prefix)
    : iter_(std::move(iter)), prefix_(prefix) {}

void BucketCursor::Check() {
    valid_ = iter_->Valid() && iter_->key().size() >= 1 && iter_->key()[0] == prefix_;
}

void BucketCursor::First() {
    iter_->Seek(PrefixedKey(prefix_));
    Check();
}

void BucketCursor::Last() {
    unsigned char p = static_cast<unsigned char>(prefix_);
    if (p == 0xFF) {
        iter_->SeekToLast();
    } else {
        // First key of the following prefix, then step back
        iter_->Seek(PrefixedKey(static_cast<char>(p + 1)));
        if (iter_->Valid()) {
            iter_->Prev();
        } else {
            iter_->SeekToLast();
        }
    }
    Check();
}

void BucketCursor::Seek(const Slice& target) {
    iter_->Seek(PrefixedKey(prefix_, target));
    Check();
}

void BucketCursor::Next() {
    if (!valid_) return;
    iter_->Next();
    Check();
}

void BucketCursor::Prev() {
    if (!valid_) return;
    iter_->Prev();
    Check();
}

Slice BucketCursor::key() const {
    Slice k = iter_->key();
    k.remove_prefix(1);
    return k;
}

Slice BucketCursor::value() const {
    return iter_->value();
}

// ============================================================================
// ReadTx
// ============================================================================

ReadTx::ReadTx(Database& db, std::unique_ptr<Snapshot> snapshot)
    : db_(db), snapshot_(std::move(snapshot)) {
    options_.snapshot = snapshot_.get();
}

ReadTx::~ReadTx() = default;

Status ReadTx::Get(const Bucket& bucket, const Slice& key, std::string* value) const {
    return db_.Get(options_, bucket.Key(key), value);
}

bool ReadTx::HasBucket(const Bucket& bucket) const {
    std::string value;
    return db_.Get(options_, BucketMetaKey(bucket), &value).ok();
}

std::unique_ptr<BucketCursor> ReadTx::NewCursor(const Bucket& bucket) const {
    return std::make_unique<BucketCursor>(db_.NewIterator(options_), bucket.prefix);
}

Status ReadTx::GetMeta(const Slice& key, std::string* value) const {
    return db_.Get(options_, PrefixedKey(META_PREFIX, key), value);
}

// ============================================================================
// WriteTx
// ============================================================================

WriteTx::WriteTx(Database& db, std::unique_lock<std::mutex> lock,
                 const WriteOptions& options)
    : db_(db), lock_(std::move(lock)), snapshot_(db.GetSnapshot()),
      write_options_(options) {
    read_options_.snapshot = snapshot_.get();
}

WriteTx::~WriteTx() {
    if (!finished_) {
        if (!batch_.Empty()) {
            LOG_DEBUG(util::LogCategory::DB) << "Discarding " << batch_.Count()
                                             << " uncommitted writes";
        }
        Rollback();
    }
}

Status WriteTx::GetRaw(const std::string& fullKey, std::string* value) const {
    auto it = pending_.find(fullKey);
    if (it != pending_.end()) {
        if (!it->second) {
            return Status::NotFound();
        }
        *value = *it->second;
        return Status::Ok();
    }
    return db_.Get(read_options_, fullKey, value);
}

void WriteTx::PutRaw(const std::string& fullKey, const Slice& value) {
    pending_[fullKey] = value.ToString();
    batch_.Put(fullKey, value);
}

Status WriteTx::Get(const Bucket& bucket, const Slice& key, std::string* value) const {
    return GetRaw(bucket.Key(key), value);
}

void WriteTx::Put(const Bucket& bucket, const Slice& key, const Slice& value) {
    PutRaw(bucket.Key(key), value);
}

void WriteTx::Delete(const Bucket& bucket, const Slice& key) {
    std::string fullKey = bucket.Key(key);
    pending_[fullKey] = std::nullopt;
    batch_.Delete(fullKey);
}

Status WriteTx::CreateBucketIfNotExists(const Bucket& bucket) {
    std::string metaKey = BucketMetaKey(bucket);
    std::string existing;
    Status s = GetRaw(metaKey, &existing);
    if (s.ok()) {
        if (existing != std::string(1, bucket.prefix)) {
            return Status::Corruption("bucket " + bucket.name +
                                      " registered with a different prefix");
        }
        return Status::Ok();
    }
    if (!s.IsNotFound()) {
        return s;
    }
    PutRaw(metaKey, std::string(1, bucket.prefix));
    return Status::Ok();
}

bool WriteTx::HasBucket(const Bucket& bucket) const {
    std::string value;
    return GetRaw(BucketMetaKey(bucket), &value).ok();
}

Status WriteTx::GetMeta(const Slice& key, std::string* value) const {
    return GetRaw(PrefixedKey(META_PREFIX, key), value);
}

void WriteTx::PutMeta(const Slice& key, const Slice& value) {
    PutRaw(PrefixedKey(META_PREFIX, key), value);
}

Status WriteTx::Commit() {
    if (finished_) {
        return Status::InvalidArgument("transaction already finished");
    }

    Status s;
    if (!batch_.Empty()) {
        s = db_.Write(write_options_, &batch_);
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Commit of " << batch_.Count()
                                             << " writes failed: " << s.ToString();
        }
    }

    batch_.Clear();
    pending_.clear();
    snapshot_.reset();
    finished_ = true;
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
    return s;
}

void WriteTx::Rollback() {
    batch_.Clear();
    pending_.clear();
    snapshot_.reset();
    finished_ = true;
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
}

// ============================================================================
// KVStore
// ============================================================================

KVStore::KVStore(std::unique_ptr<Database> db, const WriteOptions& writeOptions)
    : db_(std::move(db)), write_options_(writeOptions) {}

KVStore::~KVStore() = default;

std::pair<Status, std::unique_ptr<KVStore>> KVStore::Open(
    const std::filesystem::path& path,
    const Options& options,
    const WriteOptions& writeOptions) {
    auto [status, db] = OpenDatabase(path, options);
    if (!status.ok()) {
        return {status, nullptr};
    }
    return {Status::Ok(), std::make_unique<KVStore>(std::move(db), writeOptions)};
}

std::unique_ptr<KVStore> KVStore::OpenInMemory() {
    return std::make_unique<KVStore>(std::make_unique<MemoryDatabase>());
}

std::unique_ptr<ReadTx> KVStore::BeginRead() const {
    return std::make_unique<ReadTx>(*db_, db_->GetSnapshot());
}

std::unique_ptr<WriteTx> KVStore::BeginWrite() {
    std::unique_lock<std::mutex> lock(write_mutex_);
    return std::make_unique<WriteTx>(*db_, std::move(lock), write_options_);
}

Status KVStore::View(const std::function<Status(ReadTx&)>& fn) const {
    auto tx = BeginRead();
    return fn(*tx);
}

Status KVStore::Update(const std::function<Status(WriteTx&)>& fn) {
    auto tx = BeginWrite();
    Status s = fn(*tx);
    if (!s.ok()) {
        tx->Rollback();
        return s;
    }
    return tx->Commit();
}

} // namespace db
} // namespace btcstaker
