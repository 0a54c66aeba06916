// BTCSTAKER - Store Configuration
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Settings of the tracked transaction store, read from a ConfigManager.

#ifndef BTCSTAKER_STAKERDB_STORE_CONFIG_H
#define BTCSTAKER_STAKERDB_STORE_CONFIG_H

#include "btcstaker/crypto/address.h"
#include "btcstaker/db/database.h"
#include "btcstaker/stakerdb/errors.h"
#include "btcstaker/stakerdb/params.h"
#include "btcstaker/util/config.h"
#include "btcstaker/util/logging.h"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace btcstaker {
namespace stakerdb {

/// Database directory name inside the data directory
constexpr const char* DEFAULT_DB_NAME = "staker.db";

/// Block cache size in MiB
constexpr uint64_t DEFAULT_DB_CACHE_MIB = 8;

struct StoreConfig {
    std::filesystem::path dataDir;
    std::string dbName{DEFAULT_DB_NAME};

    /// Create the database directory when it does not exist
    bool createIfMissing{true};

    /// fsync every commit
    bool sync{false};
    uint64_t cacheSizeMiB{DEFAULT_DB_CACHE_MIB};
    bool compression{true};

    uint64_t queryDefaultLimit{DEFAULT_PAGE_LIMIT};
    uint64_t queryMaxLimit{MAX_PAGE_LIMIT};

    /// Network whose addresses are accepted
    Network network{Network::MAINNET};

    util::LogLevel logLevel{util::LogLevel::Info};
    bool printToConsole{true};

    /// Log file path, empty for none
    std::string logFile;

    /// Categories to log, empty for all
    std::vector<std::string> logCategories;

    /// dataDir / dbName
    std::filesystem::path DatabasePath() const { return dataDir / dbName; }

    db::Options ToDbOptions() const;
    db::WriteOptions ToWriteOptions() const;
};

/**
 * Build a StoreConfig from configuration values, falling back to defaults
 * for missing keys. Malformed values yield InvalidArgument.
 */
StoreStatus LoadStoreConfig(const util::ConfigManager& config, StoreConfig* out);

/// Install console and file sinks and the level described by the config
void ApplyLoggingConfig(const StoreConfig& config);

} // namespace stakerdb
} // namespace btcstaker

#endif // BTCSTAKER_STAKERDB_STORE_CONFIG_H
