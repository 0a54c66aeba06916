// BTCSTAKER - Bucketed Key-Value Store Tests
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include <gtest/gtest.h>
#include "btcstaker/db/kvstore.h"
#include <thread>

using namespace btcstaker;
using namespace btcstaker::db;

namespace {

const Bucket FRUIT{"fruit", 'f'};
const Bucket GRAIN{"grain", 'g'};

} // namespace

class KVStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = KVStore::OpenInMemory();
        Status s = store_->Update([](WriteTx& tx) {
            Status bs = tx.CreateBucketIfNotExists(FRUIT);
            if (!bs.ok()) return bs;
            return tx.CreateBucketIfNotExists(GRAIN);
        });
        ASSERT_TRUE(s.ok()) << s.ToString();
    }

    void PutAll(const Bucket& bucket, const std::vector<std::string>& keys) {
        auto tx = store_->BeginWrite();
        for (const auto& key : keys) {
            tx->Put(bucket, key, "v-" + key);
        }
        ASSERT_TRUE(tx->Commit().ok());
    }

    std::vector<std::string> ScanForward(const Bucket& bucket) {
        std::vector<std::string> keys;
        auto tx = store_->BeginRead();
        auto cursor = tx->NewCursor(bucket);
        for (cursor->First(); cursor->Valid(); cursor->Next()) {
            keys.push_back(cursor->key().ToString());
        }
        return keys;
    }

    std::vector<std::string> ScanBackward(const Bucket& bucket) {
        std::vector<std::string> keys;
        auto tx = store_->BeginRead();
        auto cursor = tx->NewCursor(bucket);
        for (cursor->Last(); cursor->Valid(); cursor->Prev()) {
            keys.push_back(cursor->key().ToString());
        }
        return keys;
    }

    std::unique_ptr<KVStore> store_;
};

// ============================================================================
// Buckets
// ============================================================================

TEST_F(KVStoreTest, BucketsAreRegistered) {
    auto tx = store_->BeginRead();
    EXPECT_TRUE(tx->HasBucket(FRUIT));
    EXPECT_TRUE(tx->HasBucket(GRAIN));
    EXPECT_FALSE(tx->HasBucket(Bucket{"nuts", 'n'}));
}

TEST_F(KVStoreTest, CreateBucketIsIdempotent) {
    Status s = store_->Update([](WriteTx& tx) { return tx.CreateBucketIfNotExists(FRUIT); });
    EXPECT_TRUE(s.ok());
}

TEST_F(KVStoreTest, CreateBucketPrefixMismatchIsCorruption) {
    Status s = store_->Update([](WriteTx& tx) {
        return tx.CreateBucketIfNotExists(Bucket{"fruit", 'x'});
    });
    EXPECT_TRUE(s.IsCorruption());
}

TEST_F(KVStoreTest, BucketKeyspacesAreSeparate) {
    PutAll(FRUIT, {"apple"});
    PutAll(GRAIN, {"apple", "wheat"});

    auto tx = store_->BeginRead();
    std::string value;
    ASSERT_TRUE(tx->Get(FRUIT, "apple", &value).ok());
    EXPECT_EQ(value, "v-apple");
    EXPECT_TRUE(tx->Get(FRUIT, "wheat", &value).IsNotFound());

    EXPECT_EQ(ScanForward(FRUIT), (std::vector<std::string>{"apple"}));
    EXPECT_EQ(ScanForward(GRAIN), (std::vector<std::string>{"apple", "wheat"}));
}

TEST_F(KVStoreTest, MetadataRoundTrip) {
    Status s = store_->Update([](WriteTx& tx) {
        tx.PutMeta("schema", "7");
        return Status::Ok();
    });
    ASSERT_TRUE(s.ok());

    std::string value;
    ASSERT_TRUE(store_->BeginRead()->GetMeta("schema", &value).ok());
    EXPECT_EQ(value, "7");
}

// ============================================================================
// Cursors
// ============================================================================

TEST_F(KVStoreTest, CursorWalksOnlyItsBucket) {
    PutAll(FRUIT, {"b", "a", "c"});
    PutAll(GRAIN, {"oat", "rye"});

    EXPECT_EQ(ScanForward(FRUIT), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(ScanBackward(FRUIT), (std::vector<std::string>{"c", "b", "a"}));
    EXPECT_EQ(ScanBackward(GRAIN), (std::vector<std::string>{"rye", "oat"}));
}

TEST_F(KVStoreTest, CursorOnEmptyBucket) {
    PutAll(GRAIN, {"oat"});
    EXPECT_TRUE(ScanForward(FRUIT).empty());
    EXPECT_TRUE(ScanBackward(FRUIT).empty());
}

TEST_F(KVStoreTest, CursorSeek) {
    PutAll(FRUIT, {"apple", "cherry", "plum"});

    auto tx = store_->BeginRead();
    auto cursor = tx->NewCursor(FRUIT);
    cursor->Seek("banana");
    ASSERT_TRUE(cursor->Valid());
    EXPECT_EQ(cursor->key().ToString(), "cherry");
    EXPECT_EQ(cursor->value().ToString(), "v-cherry");

    cursor->Seek("zebra");
    EXPECT_FALSE(cursor->Valid());
    EXPECT_TRUE(cursor->status().ok());
}

// ============================================================================
// Write Transactions
// ============================================================================

TEST_F(KVStoreTest, WriteTxSeesOwnWrites) {
    PutAll(FRUIT, {"apple"});

    auto tx = store_->BeginWrite();
    tx->Put(FRUIT, "kiwi", "green");
    tx->Delete(FRUIT, "apple");
    EXPECT_EQ(tx->PendingCount(), 2u);

    std::string value;
    ASSERT_TRUE(tx->Get(FRUIT, "kiwi", &value).ok());
    EXPECT_EQ(value, "green");
    EXPECT_TRUE(tx->Get(FRUIT, "apple", &value).IsNotFound());

    // Not visible outside until committed
    EXPECT_EQ(ScanForward(FRUIT), (std::vector<std::string>{"apple"}));

    ASSERT_TRUE(tx->Commit().ok());
    EXPECT_TRUE(tx->IsFinished());
    EXPECT_EQ(ScanForward(FRUIT), (std::vector<std::string>{"kiwi"}));
}

TEST_F(KVStoreTest, DestroyedWriteTxDiscardsWrites) {
    {
        auto tx = store_->BeginWrite();
        tx->Put(FRUIT, "ghost", "boo");
    }
    EXPECT_TRUE(ScanForward(FRUIT).empty());

    // The lock was released
    PutAll(FRUIT, {"real"});
    EXPECT_EQ(ScanForward(FRUIT), (std::vector<std::string>{"real"}));
}

TEST_F(KVStoreTest, UpdateRollsBackOnError) {
    Status s = store_->Update([](WriteTx& tx) {
        tx.Put(FRUIT, "partial", "x");
        return Status::InvalidArgument("nope");
    });
    EXPECT_TRUE(s.IsInvalidArgument());
    EXPECT_TRUE(ScanForward(FRUIT).empty());
}

TEST_F(KVStoreTest, CommitTwiceFails) {
    auto tx = store_->BeginWrite();
    tx->Put(FRUIT, "a", "1");
    ASSERT_TRUE(tx->Commit().ok());
    EXPECT_TRUE(tx->Commit().IsInvalidArgument());
}

TEST_F(KVStoreTest, ViewRunsOnSnapshot) {
    PutAll(FRUIT, {"a"});
    Status s = store_->View([&](ReadTx& tx) {
        PutAll(FRUIT, {"b"});
        std::string value;
        return tx.Get(FRUIT, "b", &value);
    });
    EXPECT_TRUE(s.IsNotFound());
}

TEST_F(KVStoreTest, ReadTxIsolatedFromLaterCommits) {
    PutAll(FRUIT, {"a"});
    auto reader = store_->BeginRead();
    PutAll(FRUIT, {"b"});

    std::string value;
    EXPECT_TRUE(reader->Get(FRUIT, "b", &value).IsNotFound());

    std::vector<std::string> keys;
    auto cursor = reader->NewCursor(FRUIT);
    for (cursor->First(); cursor->Valid(); cursor->Next()) {
        keys.push_back(cursor->key().ToString());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"a"}));
}

TEST_F(KVStoreTest, WritersAreSerialized) {
    const int kThreads = 4;
    const int kIncrements = 50;

    auto increment = [this]() {
        for (int i = 0; i < kIncrements; ++i) {
            Status s = store_->Update([](WriteTx& tx) {
                std::string value;
                Status gs = tx.Get(FRUIT, "counter", &value);
                int n = gs.ok() ? std::stoi(value) : 0;
                tx.Put(FRUIT, "counter", std::to_string(n + 1));
                return Status::Ok();
            });
            EXPECT_TRUE(s.ok());
        }
    };

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back(increment);
    }
    for (auto& t : threads) {
        t.join();
    }

    std::string value;
    ASSERT_TRUE(store_->BeginRead()->Get(FRUIT, "counter", &value).ok());
    EXPECT_EQ(value, std::to_string(kThreads * kIncrements));
}
