// BTCSTAKER - Store Configuration Tests
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include <gtest/gtest.h>
#include "btcstaker/stakerdb/store_config.h"

namespace btcstaker {
namespace test {

using namespace stakerdb;

class StoreConfigTest : public ::testing::Test {
protected:
    StoreStatus Load(const std::string& content, StoreConfig* out) {
        auto result = config_.ParseString(content);
        EXPECT_TRUE(result.success) << result.errorMessage;
        return LoadStoreConfig(config_, out);
    }

    util::ConfigManager config_;
};

TEST_F(StoreConfigTest, Defaults) {
    StoreConfig config;
    ASSERT_TRUE(LoadStoreConfig(config_, &config).ok());

    EXPECT_EQ(config.dataDir, std::filesystem::path(util::ConfigManager::GetDefaultDataDir()));
    EXPECT_EQ(config.dbName, DEFAULT_DB_NAME);
    EXPECT_FALSE(config.sync);
    EXPECT_TRUE(config.compression);
    EXPECT_EQ(config.cacheSizeMiB, DEFAULT_DB_CACHE_MIB);
    EXPECT_EQ(config.queryDefaultLimit, DEFAULT_PAGE_LIMIT);
    EXPECT_EQ(config.queryMaxLimit, MAX_PAGE_LIMIT);
    EXPECT_EQ(config.network, Network::MAINNET);
    EXPECT_EQ(config.logLevel, util::LogLevel::Info);
    EXPECT_TRUE(config.printToConsole);
    EXPECT_TRUE(config.logFile.empty());
    EXPECT_TRUE(config.logCategories.empty());
    EXPECT_TRUE(config.createIfMissing);
}

TEST_F(StoreConfigTest, ReadsValues) {
    StoreConfig config;
    StoreStatus s = Load(
        "datadir=/var/lib/staker\n"
        "dbname=tracked.db\n"
        "dbsync=1\n"
        "dbcompression=0\n"
        "dbcachesize=64\n"
        "querydefaultlimit=20\n"
        "querymaxlimit=40\n"
        "network=signet\n"
        "loglevel=debug\n"
        "noprinttoconsole\n"
        "logfile=/tmp/staker.log\n",
        &config);
    ASSERT_TRUE(s.ok()) << s.ToString();

    EXPECT_EQ(config.DatabasePath(), std::filesystem::path("/var/lib/staker/tracked.db"));
    EXPECT_TRUE(config.sync);
    EXPECT_FALSE(config.compression);
    EXPECT_EQ(config.cacheSizeMiB, 64u);
    EXPECT_EQ(config.queryDefaultLimit, 20u);
    EXPECT_EQ(config.queryMaxLimit, 40u);
    EXPECT_EQ(config.network, Network::SIGNET);
    EXPECT_EQ(config.logLevel, util::LogLevel::Debug);
    EXPECT_FALSE(config.printToConsole);
    EXPECT_EQ(config.logFile, "/tmp/staker.log");
}

TEST_F(StoreConfigTest, DbOptions) {
    StoreConfig config;
    ASSERT_TRUE(Load("dbcachesize=16\ndbsync=yes\n", &config).ok());

    db::Options options = config.ToDbOptions();
    EXPECT_TRUE(options.create_if_missing);
    EXPECT_EQ(options.block_cache_size, 16u * 1024 * 1024);
    EXPECT_TRUE(options.compression);
    EXPECT_TRUE(config.ToWriteOptions().sync);
}

TEST_F(StoreConfigTest, ExistingDatabaseOnly) {
    StoreConfig config;
    config.createIfMissing = false;
    EXPECT_FALSE(config.ToDbOptions().create_if_missing);
}

TEST_F(StoreConfigTest, DebugCategories) {
    StoreConfig config;
    ASSERT_TRUE(Load("debug=store,db\n", &config).ok());
    EXPECT_EQ(config.logCategories, (std::vector<std::string>{"store", "db"}));
}

TEST_F(StoreConfigTest, DebugFlagSelectsAllCategories) {
    StoreConfig config;
    config.logCategories = {"cli"};
    ASSERT_TRUE(Load("debug\n", &config).ok());
    EXPECT_TRUE(config.logCategories.empty());
}

TEST_F(StoreConfigTest, RejectsUnknownDebugCategory) {
    StoreConfig config;
    StoreStatus s = Load("debug=store,net\n", &config);
    EXPECT_TRUE(s.Is(StoreError::InvalidArgument));
    EXPECT_NE(s.message().find("debug"), std::string::npos);
}

TEST_F(StoreConfigTest, NetworkSectionOverridesGlobal) {
    ASSERT_TRUE(config_.ParseString(
        "dbname=main.db\n"
        "[signet]\n"
        "dbname=signet.db\n"
        "querymaxlimit=30\n").success);
    config_.SelectSection("signet");

    StoreConfig config;
    ASSERT_TRUE(LoadStoreConfig(config_, &config).ok());
    EXPECT_EQ(config.dbName, "signet.db");
    EXPECT_EQ(config.queryMaxLimit, 30u);
}

TEST_F(StoreConfigTest, RejectsDbNameWithSeparator) {
    StoreConfig config;
    EXPECT_TRUE(Load("dbname=a/b\n", &config).Is(StoreError::InvalidArgument));
}

TEST_F(StoreConfigTest, RejectsMalformedBool) {
    StoreConfig config;
    StoreStatus s = Load("dbsync=sometimes\n", &config);
    EXPECT_TRUE(s.Is(StoreError::InvalidArgument));
    EXPECT_NE(s.message().find("dbsync"), std::string::npos);
}

TEST_F(StoreConfigTest, RejectsNegativeCacheSize) {
    StoreConfig config;
    EXPECT_TRUE(Load("dbcachesize=-1\n", &config).Is(StoreError::InvalidArgument));
}

TEST_F(StoreConfigTest, RejectsDefaultLimitAboveMax) {
    StoreConfig config;
    StoreStatus s = Load("querydefaultlimit=200\n", &config);
    EXPECT_TRUE(s.Is(StoreError::InvalidArgument));
    EXPECT_NE(s.message().find("exceeds"), std::string::npos);
}

TEST_F(StoreConfigTest, RejectsZeroMaxLimit) {
    StoreConfig config;
    EXPECT_TRUE(Load("querydefaultlimit=0\nquerymaxlimit=0\n", &config)
                    .Is(StoreError::InvalidArgument));
}

TEST_F(StoreConfigTest, RejectsUnknownNetwork) {
    StoreConfig config;
    EXPECT_TRUE(Load("network=litecoin\n", &config).Is(StoreError::InvalidArgument));
}

TEST_F(StoreConfigTest, RejectsUnknownLogLevel) {
    StoreConfig config;
    EXPECT_TRUE(Load("loglevel=verbose\n", &config).Is(StoreError::InvalidArgument));
}

TEST_F(StoreConfigTest, AcceptsInfoLogLevel) {
    StoreConfig config;
    config.logLevel = util::LogLevel::Error;
    ASSERT_TRUE(Load("loglevel=INFO\n", &config).ok());
    EXPECT_EQ(config.logLevel, util::LogLevel::Info);
}

TEST_F(StoreConfigTest, FailureLeavesOutputUntouched) {
    StoreConfig config;
    config.dbName = "keep.db";
    EXPECT_FALSE(Load("dbname=new.db\nnetwork=nowhere\n", &config).ok());
    EXPECT_EQ(config.dbName, "keep.db");
}

} // namespace test
} // namespace btcstaker
