// BTCSTAKER DB - Tracked Transaction Store Inspector
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// The btcstaker-db tool opens a staker database and prints its records,
// pages of records, withdrawable records and outpoint checks.

#include <btcstaker/core/hex.h>
#include <btcstaker/crypto/address.h>
#include <btcstaker/stakerdb/params.h>
#include <btcstaker/stakerdb/store_config.h>
#include <btcstaker/stakerdb/tx_store.h>
#include <btcstaker/util/config.h>
#include <btcstaker/util/logging.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace btcstaker {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "BTCSTAKER DB";

// ============================================================================
// Default Configuration
// ============================================================================

namespace defaults {
    constexpr const char* CONFIG_FILENAME = util::DEFAULT_CONFIG_FILENAME;
}

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    stakerdb::StoreConfig store;

    // Paging
    std::optional<int64_t> offset;
    std::optional<int64_t> limit;
    bool reverse{false};

    // Command
    std::string method;
    std::vector<std::string> args;

    // Flags
    bool showHelp{false};
    bool showVersion{false};
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: btcstaker-db [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file path\n";
    std::cout << "  -datadir=DIR               Data directory path\n";
    std::cout << "  -dbname=NAME               Database directory name (default: staker.db)\n";
    std::cout << "  -network=NAME              mainnet, testnet, regtest or signet\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error, off\n";
    std::cout << "  -debug=CATS                Only log categories CATS (store,db,cli,config)\n";
    std::cout << "  -printtoconsole            Log to stderr (default: on)\n";
    std::cout << "  -logfile=FILE              Also log to FILE\n";
    std::cout << "\nPaging Options:\n";
    std::cout << "  -offset=N                  Records to skip (default: 0)\n";
    std::cout << "  -limit=N                   Records per page (default: 50, max: 100)\n";
    std::cout << "  -reverse                   Page from the newest record\n";
    std::cout << "\nCommands:\n";
    std::cout << "  count                      Number of tracked transactions\n";
    std::cout << "  list                       One page of tracked transactions\n";
    std::cout << "  withdrawable <height>      Page of transactions withdrawable at height\n";
    std::cout << "  get <txhash>               Full record of a staking transaction\n";
    std::cout << "  outpoint <txid:n>          Whether a tracked transaction spends an output\n";
    std::cout << "  validateaddress <address>  Check an address against the network\n";
    std::cout << "\nExamples:\n";
    std::cout << "  btcstaker-db -datadir=/srv/staker list -limit=10\n";
    std::cout << "  btcstaker-db -network=testnet withdrawable 2500000\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 BTCSTAKER Developers\n";
    std::cout << "MIT License\n";
}

void PrintError(const stakerdb::StoreStatus& status) {
    std::cerr << "error: " << status.ToString() << "\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseOptionalInt(const util::ConfigManager& config, const char* key,
                      std::optional<int64_t>* out) {
    if (!config.HasKey(key)) {
        return true;
    }
    auto value = config.TryGetInt(key);
    if (!value) {
        std::cerr << "error: invalid value for -" << key << "\n";
        return false;
    }
    *out = *value;
    return true;
}

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    util::ConfigManager options;
    std::vector<std::string> positional;

    auto result = options.ParseCommandLine(argc, argv, &positional);
    if (!result.success) {
        std::cerr << "error: " << result.errorMessage << "\n";
        return false;
    }

    config.showHelp = options.GetBool(util::ConfigKeys::HELP, false);
    config.showVersion = options.GetBool("version", false);
    if (config.showHelp || config.showVersion) {
        return true;
    }

    // Command-line values take precedence over the config file
    std::string dataDir = options.GetPath(util::ConfigKeys::DATADIR,
                                          util::ConfigManager::GetDefaultDataDir());
    std::string confPath = options.GetPath(util::ConfigKeys::CONF, "");
    bool explicitConf = !confPath.empty();
    if (!explicitConf) {
        confPath = (std::filesystem::path(dataDir) / defaults::CONFIG_FILENAME).string();
    }

    std::error_code ec;
    if (std::filesystem::exists(confPath, ec)) {
        auto fileResult = options.ParseFile(confPath);
        if (!fileResult.success) {
            std::cerr << "error: " << fileResult.errorFile << ":" << fileResult.errorLine
                      << ": " << fileResult.errorMessage << "\n";
            return false;
        }
    } else if (explicitConf) {
        std::cerr << "error: config file not found: " << confPath << "\n";
        return false;
    }

    if (!options.HasKey(util::ConfigKeys::DATADIR)) {
        options.Set(util::ConfigKeys::DATADIR, dataDir);
    }

    // [network] section entries apply on top of the global ones
    auto network = ParseNetwork(options.GetString(util::ConfigKeys::NETWORK, "mainnet"));
    if (network) {
        options.SelectSection(NetworkName(*network));
    }

    auto status = stakerdb::LoadStoreConfig(options, &config.store);
    if (!status.ok()) {
        PrintError(status);
        return false;
    }

    // Inspection never creates a database
    config.store.createIfMissing = false;

    if (!ParseOptionalInt(options, "offset", &config.offset) ||
        !ParseOptionalInt(options, "limit", &config.limit)) {
        return false;
    }
    config.reverse = options.GetBool("reverse", false);

    if (positional.empty()) {
        std::cerr << "error: no command given (see -help)\n";
        return false;
    }
    config.method = positional.front();
    config.args.assign(positional.begin() + 1, positional.end());
    return true;
}

// ============================================================================
// Output Formatting
// ============================================================================

void PrintConfirmation(const char* label,
                       const std::optional<stakerdb::ConfirmationInfo>& info) {
    std::cout << "  " << label << ": ";
    if (info) {
        std::cout << "height " << info->height << ", block " << info->blockHash.ToHex();
    } else {
        std::cout << "unconfirmed";
    }
    std::cout << "\n";
}

void PrintSummary(const stakerdb::StoredTransaction& tx) {
    auto details = stakerdb::GetStakingDetails(tx);
    std::cout << details.transactionIdx << "  " << details.stakingTxHash << "  "
              << details.stakingState << "  " << details.stakerAddress << "\n";
}

void PrintRecord(const stakerdb::StoredTransaction& tx) {
    auto details = stakerdb::GetStakingDetails(tx);
    std::cout << "index: " << details.transactionIdx << "\n";
    std::cout << "txid: " << details.stakingTxHash << "\n";
    std::cout << "state: " << details.stakingState << "\n";
    std::cout << "staker: " << details.stakerAddress << "\n";
    std::cout << "staking output: " << tx.stakingOutputIndex << "\n";
    std::cout << "staking time: " << tx.stakingTime << "\n";
    std::cout << "delegation: " << tx.delegationReference << "\n";
    std::cout << "inputs:\n";
    for (const auto& in : tx.stakingTx.vin) {
        std::cout << "  " << in.prevout.hash.ToHex() << ":" << in.prevout.n << "\n";
    }
    PrintConfirmation("staking confirmation", tx.stakingConfirmation);

    if (!tx.unbondingData) {
        std::cout << "unbonding: none\n";
        return;
    }
    const auto& unbonding = *tx.unbondingData;
    std::cout << "unbonding:\n";
    std::cout << "  txid: " << unbonding.unbondingTx.GetHash().ToHex() << "\n";
    std::cout << "  time: " << unbonding.unbondingTime << "\n";
    std::cout << "  covenant signatures: " << unbonding.covenantSignatures.size() << "\n";
    for (const auto& sig : unbonding.covenantSignatures) {
        std::cout << "    " << sig.pubKey.ToHex() << " " << sig.signature.ToHex() << "\n";
    }
    PrintConfirmation("unbonding confirmation", unbonding.unbondingConfirmation);
}

// ============================================================================
// Commands
// ============================================================================

bool ParseOutPoint(const std::string& str, OutPoint* out) {
    size_t colon = str.rfind(':');
    if (colon == std::string::npos) {
        return false;
    }
    TxHash hash;
    if (!stakerdb::ParseTxHash(str.substr(0, colon), &hash).ok()) {
        return false;
    }
    std::string index = str.substr(colon + 1);
    if (index.empty() || index.size() > 10 ||
        index.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    unsigned long long n = std::strtoull(index.c_str(), nullptr, 10);
    if (n > 0xffffffffULL) {
        return false;
    }
    *out = OutPoint(hash, static_cast<uint32_t>(n));
    return true;
}

int RequireArgs(const CLIConfig& config, size_t count) {
    if (config.args.size() != count) {
        std::cerr << "error: " << config.method << " takes " << count
                  << " argument" << (count == 1 ? "" : "s") << "\n";
        return 1;
    }
    return 0;
}

int CmdValidateAddress(const CLIConfig& config) {
    if (int rc = RequireArgs(config, 1)) return rc;
    auto address = BitcoinAddress::Parse(config.args[0], config.store.network);
    if (!address) {
        std::cout << "invalid address for " << NetworkName(config.store.network) << "\n";
        return 1;
    }
    std::cout << address->Encode() << "\n";
    std::cout << "scriptPubKey: " << BytesToHex(address->GetScriptPubKey()) << "\n";
    return 0;
}

int ExecuteStoreCommand(const CLIConfig& config) {
    auto [status, store] = stakerdb::TrackedTransactionStore::Open(config.store);
    if (!status.ok()) {
        PrintError(status);
        return 1;
    }

    if (config.method == "count") {
        if (int rc = RequireArgs(config, 0)) return rc;
        uint64_t count = 0;
        status = store->Count(&count);
        if (!status.ok()) {
            PrintError(status);
            return 1;
        }
        std::cout << count << "\n";
        return 0;
    }

    if (config.method == "list" || config.method == "withdrawable") {
        stakerdb::PageParams page;
        status = stakerdb::NormalizePageParams(config.offset, config.limit, &page,
                                               config.store.queryDefaultLimit,
                                               config.store.queryMaxLimit);
        if (!status.ok()) {
            PrintError(status);
            return 1;
        }

        stakerdb::StoredTransactionQuery query;
        query.offset = page.offset;
        query.limit = page.limit;
        query.reversed = config.reverse;

        if (config.method == "withdrawable") {
            if (int rc = RequireArgs(config, 1)) return rc;
            const std::string& height = config.args[0];
            if (height.empty() || height.size() > 10 ||
                height.find_first_not_of("0123456789") != std::string::npos ||
                std::strtoull(height.c_str(), nullptr, 10) > 0xffffffffULL) {
                std::cerr << "error: invalid block height: " << height << "\n";
                return 1;
            }
            query.WithWithdrawableFilter(
                static_cast<uint32_t>(std::strtoull(height.c_str(), nullptr, 10)));
        } else if (int rc = RequireArgs(config, 0)) {
            return rc;
        }

        stakerdb::StoredTransactionQueryResult result;
        status = store->QueryStoredTransactions(query, &result);
        if (!status.ok()) {
            PrintError(status);
            return 1;
        }
        for (const auto& tx : result.transactions) {
            PrintSummary(tx);
        }
        if (config.method == "withdrawable") {
            std::cout << "last index: "
                      << (result.transactions.empty()
                              ? std::string("0")
                              : std::to_string(result.transactions.back().index))
                      << "\n";
        }
        std::cout << "total: " << result.total << "\n";
        return 0;
    }

    if (config.method == "get") {
        if (int rc = RequireArgs(config, 1)) return rc;
        TxHash hash;
        status = stakerdb::ParseTxHash(config.args[0], &hash);
        if (!status.ok()) {
            PrintError(status);
            return 1;
        }
        stakerdb::StoredTransaction tx;
        status = store->GetTransaction(hash, &tx);
        if (!status.ok()) {
            PrintError(status);
            return 1;
        }
        PrintRecord(tx);
        return 0;
    }

    if (config.method == "outpoint") {
        if (int rc = RequireArgs(config, 1)) return rc;
        OutPoint outpoint;
        if (!ParseOutPoint(config.args[0], &outpoint)) {
            std::cerr << "error: outpoint must be <txid>:<n>\n";
            return 1;
        }
        bool used = false;
        status = store->OutpointUsed(outpoint, &used);
        if (!status.ok()) {
            PrintError(status);
            return 1;
        }
        std::cout << (used ? "used" : "unused") << "\n";
        return 0;
    }

    std::cerr << "error: unknown command: " << config.method << "\n";
    return 1;
}

int ExecuteCommand(const CLIConfig& config) {
    LOG_DEBUG(util::LogCategory::CLI) << "Running " << config.method << " on "
                                      << config.store.DatabasePath().string();
    if (config.method == "validateaddress") {
        return CmdValidateAddress(config);
    }
    return ExecuteStoreCommand(config);
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig config;
    if (!ParseCommandLine(argc, argv, config)) {
        return 1;
    }

    if (config.showHelp) {
        PrintHelp();
        return 0;
    }
    if (config.showVersion) {
        PrintVersion();
        return 0;
    }

    stakerdb::ApplyLoggingConfig(config.store);
    int rc = ExecuteCommand(config);
    util::Logger::Instance().Shutdown();
    return rc;
}

} // namespace cli
} // namespace btcstaker

int main(int argc, char* argv[]) {
    try {
        return btcstaker::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
