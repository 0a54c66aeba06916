// BTCSTAKER - Configuration File Parser
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Parses INI-style configuration for the staker database tools.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"; single quotes are literal
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Bare keys are flags; "nokey" sets key to false
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME
// - "include <path>" reads another file

#ifndef BTCSTAKER_UTIL_CONFIG_H
#define BTCSTAKER_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace btcstaker {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".btcstaker";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "btcstaker.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from the command line and configuration files.
 *
 * Lookup order (highest to lowest):
 * 1. Command-line arguments and Set()
 * 2. The selected file section ([mainnet], [testnet], ...)
 * 3. Global (section-less) file entries
 *
 * A repeated key within the same layer replaces the earlier value.
 */
class ConfigManager {
public:
    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file (~ and $VAR in the path are expanded)
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text; sourceName is used in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line options. Arguments not starting with '-' are
     * returned in positional order through @p positional.
     *
     * Forms: -key=value, --key=value, -flag, -noflag. A bare option never
     * consumes the following argument, so flags may precede the command.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[],
                                       std::vector<std::string>* positional = nullptr);

    /// Make the entries of a file section visible; empty selects none
    void SelectSection(const std::string& section) { section_ = section; }
    const std::string& GetSection() const { return section_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key) const;

    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// Integer with optional k/m/g suffix (powers of 1024). nullopt if the
    /// key is missing or the value is not a number.
    std::optional<int64_t> TryGetInt(const std::string& key) const;

    /// As TryGetInt, and nullopt for negative values
    std::optional<uint64_t> TryGetUInt(const std::string& key) const;

    /// nullopt if missing or not a boolean
    std::optional<bool> TryGetBool(const std::string& key) const;

    bool GetBool(const std::string& key, bool defaultValue) const;

    /// String value with ~ and environment variables expanded
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value with command-line precedence
    void Set(const std::string& key, const std::string& value);

    /// Default data directory ($HOME/.btcstaker)
    static std::string GetDefaultDataDir();

private:
    using Settings = std::map<std::string, std::string>;

    const std::string* Find(const std::string& key) const;

    ConfigParseResult ParseLines(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    Settings overrides_;
    /// Section name ("" for global) to its entries
    std::map<std::string, Settings> fileSettings_;
    std::string section_;
    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* NETWORK = "network";
    constexpr const char* HELP = "help";

    // Database
    constexpr const char* DBNAME = "dbname";
    constexpr const char* DBSYNC = "dbsync";
    constexpr const char* DBCACHESIZE = "dbcachesize";
    constexpr const char* DBCOMPRESSION = "dbcompression";

    // Queries
    constexpr const char* QUERYDEFAULTLIMIT = "querydefaultlimit";
    constexpr const char* QUERYMAXLIMIT = "querymaxlimit";

    // Logging
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* DEBUG = "debug";
}

} // namespace util
} // namespace btcstaker

#endif // BTCSTAKER_UTIL_CONFIG_H
