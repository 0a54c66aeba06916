// BTCSTAKER - Store Configuration Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/stakerdb/store_config.h"

#include <memory>
#include <sstream>

namespace btcstaker {
namespace stakerdb {

using util::ConfigKeys::DATADIR;
using util::ConfigKeys::DBCACHESIZE;
using util::ConfigKeys::DBCOMPRESSION;
using util::ConfigKeys::DBNAME;
using util::ConfigKeys::DBSYNC;
using util::ConfigKeys::DEBUG;
using util::ConfigKeys::LOGFILE;
using util::ConfigKeys::LOGLEVEL;
using util::ConfigKeys::NETWORK;
using util::ConfigKeys::PRINTTOCONSOLE;
using util::ConfigKeys::QUERYDEFAULTLIMIT;
using util::ConfigKeys::QUERYMAXLIMIT;

namespace {

StoreStatus BadValue(const util::ConfigManager& config, const char* key) {
    return StoreStatus::InvalidArgument(std::string("invalid value for ") + key + ": '" +
                                        config.GetString(key, "") + "'");
}

bool ReadBool(const util::ConfigManager& config, const char* key, bool* out) {
    if (!config.HasKey(key)) return true;
    auto value = config.TryGetBool(key);
    if (!value) return false;
    *out = *value;
    return true;
}

bool ReadUInt(const util::ConfigManager& config, const char* key, uint64_t* out) {
    if (!config.HasKey(key)) return true;
    auto value = config.TryGetUInt(key);
    if (!value) return false;
    *out = *value;
    return true;
}

/// Comma separated category names; "all", "1" and a bare flag select every category
bool ReadCategories(const util::ConfigManager& config, std::vector<std::string>* out) {
    if (!config.HasKey(DEBUG)) return true;
    std::string value = config.GetString(DEBUG, "");
    if (value == "all" || value == "1" || value == "true") {
        out->clear();
        return true;
    }

    std::vector<std::string> categories;
    std::istringstream in(value);
    std::string name;
    while (std::getline(in, name, ',')) {
        if (!util::IsKnownLogCategory(name)) return false;
        categories.push_back(name);
    }
    if (categories.empty()) return false;
    *out = std::move(categories);
    return true;
}

} // namespace

db::Options StoreConfig::ToDbOptions() const {
    db::Options options;
    options.create_if_missing = createIfMissing;
    options.block_cache_size = static_cast<size_t>(cacheSizeMiB) * 1024 * 1024;
    options.compression = compression;
    return options;
}

db::WriteOptions StoreConfig::ToWriteOptions() const {
    db::WriteOptions options;
    options.sync = sync;
    return options;
}

StoreStatus LoadStoreConfig(const util::ConfigManager& config, StoreConfig* out) {
    StoreConfig result;

    result.dataDir = config.GetPath(DATADIR, util::ConfigManager::GetDefaultDataDir());
    result.dbName = config.GetString(DBNAME, DEFAULT_DB_NAME);
    if (result.dbName.empty() || result.dbName.find('/') != std::string::npos) {
        return BadValue(config, DBNAME);
    }

    if (!ReadBool(config, DBSYNC, &result.sync)) {
        return BadValue(config, DBSYNC);
    }
    if (!ReadBool(config, DBCOMPRESSION, &result.compression)) {
        return BadValue(config, DBCOMPRESSION);
    }
    if (!ReadUInt(config, DBCACHESIZE, &result.cacheSizeMiB)) {
        return BadValue(config, DBCACHESIZE);
    }

    if (!ReadUInt(config, QUERYDEFAULTLIMIT, &result.queryDefaultLimit)) {
        return BadValue(config, QUERYDEFAULTLIMIT);
    }
    if (!ReadUInt(config, QUERYMAXLIMIT, &result.queryMaxLimit) || result.queryMaxLimit == 0) {
        return BadValue(config, QUERYMAXLIMIT);
    }
    if (result.queryDefaultLimit > result.queryMaxLimit) {
        return StoreStatus::InvalidArgument(
            std::string(QUERYDEFAULTLIMIT) + " (" + std::to_string(result.queryDefaultLimit) +
            ") exceeds " + QUERYMAXLIMIT + " (" + std::to_string(result.queryMaxLimit) + ")");
    }

    if (config.HasKey(NETWORK)) {
        auto network = ParseNetwork(config.GetString(NETWORK, ""));
        if (!network) {
            return BadValue(config, NETWORK);
        }
        result.network = *network;
    }

    if (config.HasKey(LOGLEVEL)) {
        auto level = util::ParseLogLevel(config.GetString(LOGLEVEL, ""));
        if (!level) {
            return BadValue(config, LOGLEVEL);
        }
        result.logLevel = *level;
    }
    if (!ReadCategories(config, &result.logCategories)) {
        return BadValue(config, DEBUG);
    }
    if (!ReadBool(config, PRINTTOCONSOLE, &result.printToConsole)) {
        return BadValue(config, PRINTTOCONSOLE);
    }
    result.logFile = config.GetPath(LOGFILE, "");

    *out = std::move(result);
    return StoreStatus::Ok();
}

void ApplyLoggingConfig(const StoreConfig& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(config.logLevel);
    logger.SetCategories(config.logCategories);

    if (config.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.useStderr = true;
        consoleConfig.level = config.logLevel;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!config.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = config.logFile;
        fileConfig.level = config.logLevel;
        auto sink = std::make_shared<util::FileSink>(fileConfig);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            LOG_WARN(util::LogCategory::CONFIG) << "Cannot open log file " << config.logFile;
        }
    }
}

} // namespace stakerdb
} // namespace btcstaker
