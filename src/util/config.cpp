// BTCSTAKER - Configuration File Parser Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace btcstaker {
namespace util {

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

bool IsValidKey(const std::string& key, char& bad) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            bad = c;
            return false;
        }
    }
    return true;
}

/// "nofoo" -> "foo" when the remainder looks like a flag name
bool StripNegation(std::string& key) {
    if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(key[2]))) {
        key = key.substr(2);
        return true;
    }
    return false;
}

bool IsSingleQuoted(const std::string& str) {
    return str.length() >= 2 && str.front() == '\'' && str.back() == '\'';
}

/// Strip surrounding quotes; escapes are processed inside double quotes only
std::string Unquote(const std::string& str) {
    if (IsSingleQuoted(str)) {
        return str.substr(1, str.length() - 2);
    }
    if (str.length() < 2 || str.front() != '"' || str.back() != '"') {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n': unescaped += '\n'; ++i; continue;
                case 't': unescaped += '\t'; ++i; continue;
                case 'r': unescaped += '\r'; ++i; continue;
                case '\\': unescaped += '\\'; ++i; continue;
                case '"': unescaped += '"'; ++i; continue;
                default: break;
            }
        }
        unescaped += inner[i];
    }
    return unescaped;
}

std::optional<bool> ParseBool(const std::string& str) {
    std::string lower = ToLower(Trim(str));
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

/// ${VAR} and $VAR; unset variables expand to nothing
std::string ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            size_t nameStart = i + 1;
            size_t nameEnd = nameStart;
            size_t next = 0;
            if (value[nameStart] == '{') {
                ++nameStart;
                nameEnd = value.find('}', nameStart);
                next = nameEnd == std::string::npos ? 0 : nameEnd + 1;
            } else {
                while (nameEnd < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                next = nameEnd > nameStart ? nameEnd : 0;
            }
            if (next != 0) {
                std::string name = value.substr(nameStart, nameEnd - nameStart);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = next;
                continue;
            }
        }
        result += value[i];
        ++i;
    }
    return result;
}

/// "~" and "~/..." only; "~user" is left alone
std::string ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.length() > 1 && path[1] != '/')) {
        return path;
    }

    std::string home;
    if (const char* homeEnv = std::getenv("HOME")) {
        home = homeEnv;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    return home.empty() ? path : home + path.substr(1);
}

} // namespace

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        return DEFAULT_DATADIR_NAME;
    }
    return std::string(home) + "/" + DEFAULT_DATADIR_NAME;
}

// ============================================================================
// File Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }

    if (trimmed.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            result = ConfigParseResult::Error(
                "Maximum include depth exceeded", source, lineNum);
            return false;
        }

        ++includeDepth_;
        ConfigParseResult includeResult = ParseFile(Unquote(Trim(trimmed.substr(8))));
        --includeDepth_;

        if (!includeResult.success) {
            result = includeResult;
            return false;
        }
        return true;
    }

    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        key = trimmed;
        value = StripNegation(key) ? "false" : "true";
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        std::string raw = Trim(trimmed.substr(eqPos + 1));
        value = IsSingleQuoted(raw) ? Unquote(raw) : ExpandEnvVars(Unquote(raw));
    }

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }

    char bad = 0;
    if (!IsValidKey(key, bad)) {
        result = ConfigParseResult::Error(
            "Invalid character in key: " + std::string(1, bad), source, lineNum);
        return false;
    }

    fileSettings_[currentSection][key] = value;
    return true;
}

ConfigParseResult ConfigManager::ParseLines(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    std::string continuationLine;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuationLine += line.substr(0, line.length() - 1);
            continue;
        }

        if (!continuationLine.empty()) {
            line = continuationLine + line;
            continuationLine.clear();
        }

        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuationLine.empty() &&
        !ParseLine(continuationLine, source, lineNum, currentSection, result)) {
        return result;
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string expandedPath = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(expandedPath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }

    return ParseLines(file, expandedPath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseLines(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[],
                                                  std::vector<std::string>* positional) {
    bool optionsEnded = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i] ? argv[i] : "";

        if (!optionsEnded && arg == "--") {
            optionsEnded = true;
            continue;
        }

        if (optionsEnded || arg.empty() || arg[0] != '-' || arg == "-") {
            if (positional) {
                positional->push_back(arg);
            }
            continue;
        }

        size_t nameStart = arg.find_first_not_of('-');
        if (nameStart == std::string::npos) {
            return ConfigParseResult::Error("Invalid option: " + arg, "<command-line>", i);
        }
        arg = arg.substr(nameStart);

        std::string key;
        std::string value;
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else {
            key = arg;
            value = StripNegation(key) ? "false" : "true";
        }

        char bad = 0;
        if (key.empty() || !IsValidKey(key, bad)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            "<command-line>", i);
        }

        overrides_[key] = value;
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

const std::string* ConfigManager::Find(const std::string& key) const {
    auto it = overrides_.find(key);
    if (it != overrides_.end()) {
        return &it->second;
    }

    auto lookupSection = [this, &key](const std::string& section) -> const std::string* {
        auto sec = fileSettings_.find(section);
        if (sec == fileSettings_.end()) {
            return nullptr;
        }
        auto entry = sec->second.find(key);
        return entry != sec->second.end() ? &entry->second : nullptr;
    };

    if (!section_.empty()) {
        if (const std::string* value = lookupSection(section_)) {
            return value;
        }
    }
    return lookupSection("");
}

bool ConfigManager::HasKey(const std::string& key) const {
    return Find(key) != nullptr;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    const std::string* value = Find(key);
    return value ? *value : defaultValue;
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    const std::string* raw = Find(key);
    if (!raw) {
        return std::nullopt;
    }
    const std::string strValue = Trim(*raw);

    int64_t value = 0;
    size_t pos = 0;
    try {
        value = std::stoll(strValue, &pos);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    std::string suffix = ToLower(Trim(strValue.substr(pos)));
    if (suffix.empty()) {
        return value;
    }
    if (suffix.size() != 1) {
        return std::nullopt;
    }
    switch (suffix[0]) {
        case 'k': return value * 1024;
        case 'm': return value * 1024 * 1024;
        case 'g': return value * 1024LL * 1024 * 1024;
        default: return std::nullopt;
    }
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key) const {
    auto intValue = TryGetInt(key);
    if (!intValue || *intValue < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*intValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    const std::string* value = Find(key);
    if (!value) {
        return std::nullopt;
    }
    return ParseBool(*value);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue)));
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
    overrides_[key] = value;
}

} // namespace util
} // namespace btcstaker
