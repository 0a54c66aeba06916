// BTCSTAKER - In-Memory Database Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/db/memory.h"

namespace btcstaker {
namespace db {

MemoryDatabase::MemoryDatabase() : current_(std::make_shared<const Map>()) {}

Status MemoryDatabase::Version(const ReadOptions& options,
                               std::shared_ptr<const Map>* out) const {
    if (options.snapshot) {
        const auto* snap = dynamic_cast<const MemorySnapshot*>(options.snapshot);
        if (!snap || snap->Owner() != this) {
            return Status::InvalidArgument("snapshot does not belong to this database");
        }
        *out = snap->Data();
        return Status::Ok();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    *out = current_;
    return Status::Ok();
}

Status MemoryDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    std::shared_ptr<const Map> version;
    Status s = Version(options, &version);
    if (!s.ok()) {
        return s;
    }
    auto it = version->find(key.ToString());
    if (it == version->end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions& /*options*/, WriteBatch* batch) {
    if (!batch) {
        return Status::InvalidArgument("null write batch");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<Map>(*current_);
    batch->Iterate([&next](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            (*next)[key] = *value;
        } else {
            next->erase(key);
        }
    });
    current_ = std::move(next);
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions& options) {
    std::shared_ptr<const Map> version;
    Status s = Version(options, &version);
    if (!s.ok()) {
        return NewErrorIterator(s);
    }
    return std::make_unique<MemoryIterator>(std::move(version));
}

std::unique_ptr<Snapshot> MemoryDatabase::GetSnapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemorySnapshot>(this, current_);
}

} // namespace db
} // namespace btcstaker
