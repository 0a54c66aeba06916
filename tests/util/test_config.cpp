// BTCSTAKER - Configuration File Parser Tests
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include <gtest/gtest.h>

#include "btcstaker/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace btcstaker {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/btcstaker_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigParseResult ParseArgs(std::vector<const char*> args,
                                std::vector<std::string>* positional = nullptr) {
        args.insert(args.begin(), "btcstaker-db");
        return config_.ParseCommandLine(static_cast<int>(args.size()), args.data(),
                                        positional);
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(config_.HasKey("dbname"));
}

TEST_F(ConfigTest, ParseComments) {
    auto result = config_.ParseString(
        "# comment\n"
        "; another comment\n"
        "   # indented comment\n"
        "dbname=kept\n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("dbname", ""), "kept");
    EXPECT_FALSE(config_.HasKey("#"));
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    ASSERT_TRUE(config_.ParseString("dbname=staker.db").success);
    EXPECT_EQ(config_.GetString("dbname", ""), "staker.db");
}

TEST_F(ConfigTest, ParseKeyWithSpaces) {
    ASSERT_TRUE(config_.ParseString("  network   =   testnet  ").success);
    EXPECT_EQ(config_.GetString("network", ""), "testnet");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    ASSERT_TRUE(config_.ParseString(
        "a=\"quoted value\"\n"
        "b='single $HOME'\n").success);
    EXPECT_EQ(config_.GetString("a", ""), "quoted value");
    EXPECT_EQ(config_.GetString("b", ""), "single $HOME");
}

TEST_F(ConfigTest, ParseEscapeSequences) {
    ASSERT_TRUE(config_.ParseString("msg=\"line1\\nline2\\t\\\"x\\\"\"").success);
    EXPECT_EQ(config_.GetString("msg", ""), "line1\nline2\t\"x\"");
}

TEST_F(ConfigTest, ParseBooleanFlag) {
    ASSERT_TRUE(config_.ParseString("dbsync").success);
    EXPECT_TRUE(config_.GetBool("dbsync", false));
}

TEST_F(ConfigTest, ParseNegatedFlag) {
    ASSERT_TRUE(config_.ParseString("noprinttoconsole").success);
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_FALSE(config_.HasKey("noprinttoconsole"));
}

TEST_F(ConfigTest, SectionEntriesHiddenUntilSelected) {
    ASSERT_TRUE(config_.ParseString(
        "dbname=global.db\n"
        "[testnet]\n"
        "dbname=testnet.db\n"
        "querymaxlimit=50\n").success);
    EXPECT_EQ(config_.GetString("dbname", ""), "global.db");
    EXPECT_FALSE(config_.HasKey("querymaxlimit"));

    config_.SelectSection("testnet");
    EXPECT_EQ(config_.GetSection(), "testnet");
    EXPECT_EQ(config_.GetString("dbname", ""), "testnet.db");
    EXPECT_EQ(config_.TryGetUInt("querymaxlimit"), 50u);
}

TEST_F(ConfigTest, SelectedSectionFallsBackToGlobal) {
    ASSERT_TRUE(config_.ParseString(
        "[signet]\n"
        "dbname=signet.db\n"
        "[]\n"
        "loglevel=warn\n").success);
    config_.SelectSection("regtest");
    EXPECT_FALSE(config_.HasKey("dbname"));
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
}

TEST_F(ConfigTest, RepeatedKeyReplacesEarlierValue) {
    ASSERT_TRUE(config_.ParseString("dbname=a\ndbname=b\n").success);
    EXPECT_EQ(config_.GetString("dbname", ""), "b");
}

TEST_F(ConfigTest, LineContinuation) {
    ASSERT_TRUE(config_.ParseString("logfile=/var/log/\\\nstaker.log\n").success);
    EXPECT_EQ(config_.GetString("logfile", ""), "/var/log/staker.log");
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, TryGetInt) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=abc\n").success);
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_EQ(config_.TryGetInt("b"), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("missing").has_value());
}

TEST_F(ConfigTest, GetIntWithSuffix) {
    ASSERT_TRUE(config_.ParseString("k=2k\nm=3M\ng=1g\nbad=4x\nlong=5kb\n").success);
    EXPECT_EQ(config_.TryGetInt("k"), 2048);
    EXPECT_EQ(config_.TryGetInt("m"), 3 * 1024 * 1024);
    EXPECT_EQ(config_.TryGetInt("g"), 1024LL * 1024 * 1024);
    EXPECT_FALSE(config_.TryGetInt("bad").has_value());
    EXPECT_FALSE(config_.TryGetInt("long").has_value());
}

TEST_F(ConfigTest, TryGetUInt) {
    ASSERT_TRUE(config_.ParseString("pos=10\nneg=-1\n").success);
    EXPECT_EQ(config_.TryGetUInt("pos"), 10u);
    EXPECT_FALSE(config_.TryGetUInt("neg").has_value());
}

TEST_F(ConfigTest, GetBool) {
    ASSERT_TRUE(config_.ParseString(
        "t1=true\nt2=YES\nt3=on\nt4=1\n"
        "f1=false\nf2=no\nf3=OFF\nf4=0\n"
        "x=maybe\n").success);
    for (const char* key : {"t1", "t2", "t3", "t4"}) {
        EXPECT_TRUE(config_.GetBool(key, false)) << key;
    }
    for (const char* key : {"f1", "f2", "f3", "f4"}) {
        EXPECT_FALSE(config_.GetBool(key, true)) << key;
    }
    EXPECT_FALSE(config_.TryGetBool("x").has_value());
    EXPECT_TRUE(config_.GetBool("x", true));
    EXPECT_FALSE(config_.TryGetBool("missing").has_value());
}

TEST_F(ConfigTest, GetBoolTrimsValue) {
    ASSERT_TRUE(config_.ParseString("dbsync=\" Yes \"\n").success);
    EXPECT_EQ(config_.TryGetBool("dbsync"), true);
}

TEST_F(ConfigTest, GetStringMissing) {
    EXPECT_EQ(config_.GetString("missing", "fallback"), "fallback");
}

// ============================================================================
// Expansion
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("BTCSTAKER_TEST_VAR", "value", 1);
    ASSERT_TRUE(config_.ParseString(
        "braced=${BTCSTAKER_TEST_VAR}/x\n"
        "bare=$BTCSTAKER_TEST_VAR-y\n"
        "unset=$BTCSTAKER_UNDEFINED_VAR_XYZ\n"
        "dollar=cost $\n").success);
    EXPECT_EQ(config_.GetString("braced", ""), "value/x");
    EXPECT_EQ(config_.GetString("bare", ""), "value-y");
    EXPECT_EQ(config_.GetString("unset", "x"), "");
    EXPECT_EQ(config_.GetString("dollar", ""), "cost $");
    unsetenv("BTCSTAKER_TEST_VAR");
}

TEST_F(ConfigTest, ParsedValueExpansionByQuoting) {
    setenv("BTCSTAKER_TEST_VAR", "value", 1);
    ASSERT_TRUE(config_.ParseString(
        "plain=$BTCSTAKER_TEST_VAR/a\n"
        "double=\"${BTCSTAKER_TEST_VAR}/b\"\n"
        "single='${BTCSTAKER_TEST_VAR}/c'\n").success);
    EXPECT_EQ(config_.GetString("plain", ""), "value/a");
    EXPECT_EQ(config_.GetString("double", ""), "value/b");
    EXPECT_EQ(config_.GetString("single", ""), "${BTCSTAKER_TEST_VAR}/c");
    unsetenv("BTCSTAKER_TEST_VAR");
}

TEST_F(ConfigTest, GetPathExpandsTilde) {
    setenv("HOME", "/home/staker", 1);
    config_.Set("a", "~/data");
    config_.Set("b", "~");
    config_.Set("c", "~other/data");
    config_.Set("d", "/a/~/b");
    EXPECT_EQ(config_.GetPath("a"), "/home/staker/data");
    EXPECT_EQ(config_.GetPath("b"), "/home/staker");
    EXPECT_EQ(config_.GetPath("c"), "~other/data");
    EXPECT_EQ(config_.GetPath("d"), "/a/~/b");
}

TEST_F(ConfigTest, GetPath) {
    setenv("HOME", "/home/staker", 1);
    ASSERT_TRUE(config_.ParseString("datadir=~/.btcstaker").success);
    EXPECT_EQ(config_.GetPath("datadir"), "/home/staker/.btcstaker");
    EXPECT_EQ(config_.GetPath("missing", "/fallback"), "/fallback");
}

TEST_F(ConfigTest, GetDefaultDataDir) {
    setenv("HOME", "/home/staker", 1);
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/staker/.btcstaker");
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("dbname=file.db\nquerymaxlimit=80\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString("dbname", ""), "file.db");
    EXPECT_EQ(config_.TryGetUInt("querymaxlimit"), 80u);
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/btcstaker.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

TEST_F(ConfigTest, IncludeFile) {
    std::string inner = CreateTempFile("loglevel=debug\n");
    std::string outer = CreateTempFile("include " + inner + "\ndbname=outer.db\n");
    ASSERT_TRUE(config_.ParseFile(outer).success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetString("dbname", ""), "outer.db");
}

TEST_F(ConfigTest, SelfIncludeHitsDepthLimit) {
    std::string path = CreateTempFile("");
    {
        std::ofstream file(path);
        file << "include " << path << "\n";
    }
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("include depth"), std::string::npos);
}

TEST_F(ConfigTest, CommandLineBeatsFile) {
    ASSERT_TRUE(ParseArgs({"-dbname=cli.db"}).success);
    std::string path = CreateTempFile(
        "dbname=file.db\nnetwork=testnet\n[testnet]\ndbname=section.db\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    config_.SelectSection("testnet");

    EXPECT_EQ(config_.GetString("dbname", ""), "cli.db");
    EXPECT_EQ(config_.GetString("network", ""), "testnet");
}

TEST_F(ConfigTest, ParseFileExpandsHomeInPath) {
    char dir[] = "/tmp/btcstaker_home_XXXXXX";
    ASSERT_NE(mkdtemp(dir), nullptr);
    std::string path = std::string(dir) + "/btcstaker.conf";
    {
        std::ofstream file(path);
        file << "dbname=home.db\n";
    }
    tempFiles_.push_back(path);

    setenv("HOME", dir, 1);
    ASSERT_TRUE(config_.ParseFile("~/btcstaker.conf").success);
    EXPECT_EQ(config_.GetString("dbname", ""), "home.db");

    std::remove(path.c_str());
    tempFiles_.pop_back();
    rmdir(dir);
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, ParseCommandLineBasic) {
    std::vector<std::string> positional;
    auto result = ParseArgs({"-datadir=/tmp/x", "--limit=5", "list"}, &positional);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp/x");
    EXPECT_EQ(config_.TryGetInt("limit"), 5);
    EXPECT_EQ(positional, (std::vector<std::string>{"list"}));
}

TEST_F(ConfigTest, ParseCommandLineFlagsDoNotConsumeArguments) {
    std::vector<std::string> positional;
    ASSERT_TRUE(ParseArgs({"-reverse", "withdrawable", "100"}, &positional).success);
    EXPECT_TRUE(config_.GetBool("reverse", false));
    EXPECT_EQ(positional, (std::vector<std::string>{"withdrawable", "100"}));
}

TEST_F(ConfigTest, ParseCommandLineNegated) {
    ASSERT_TRUE(ParseArgs({"-noprinttoconsole"}).success);
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
}

TEST_F(ConfigTest, ParseCommandLineDoubleDash) {
    std::vector<std::string> positional;
    ASSERT_TRUE(ParseArgs({"--", "-notanoption"}, &positional).success);
    EXPECT_EQ(positional, (std::vector<std::string>{"-notanoption"}));
    EXPECT_FALSE(config_.HasKey("notanoption"));
}

TEST_F(ConfigTest, ParseCommandLineInvalidOption) {
    auto result = ParseArgs({"-bad key=1"});
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid option"), std::string::npos);
}

// ============================================================================
// Setters and Utilities
// ============================================================================

TEST_F(ConfigTest, SetOverwrites) {
    config_.Set("dbname", "a");
    config_.Set("dbname", "b");
    EXPECT_EQ(config_.GetString("dbname", ""), "b");
}

TEST_F(ConfigTest, SetBeatsFile) {
    ASSERT_TRUE(config_.ParseString("dbname=file.db\n").success);
    config_.Set("dbname", "set.db");
    EXPECT_EQ(config_.GetString("dbname", ""), "set.db");
}


// ============================================================================
// Errors
// ============================================================================

TEST_F(ConfigTest, InvalidSectionHeader) {
    auto result = config_.ParseString("[broken\n", "bad.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "bad.conf");
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, EmptyKey) {
    EXPECT_FALSE(config_.ParseString("=value").success);
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    auto result = config_.ParseString("ok=1\nbad$key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string line = "key=" + std::string(MAX_LINE_LENGTH + 1, 'x');
    EXPECT_FALSE(config_.ParseString(line).success);
}

TEST_F(ConfigTest, ConfigKeysAreDefined) {
    EXPECT_STREQ(ConfigKeys::DATADIR, "datadir");
    EXPECT_STREQ(ConfigKeys::DBNAME, "dbname");
    EXPECT_STREQ(ConfigKeys::QUERYMAXLIMIT, "querymaxlimit");
    EXPECT_STREQ(ConfigKeys::LOGLEVEL, "loglevel");
    EXPECT_STREQ(ConfigKeys::DEBUG, "debug");
}

} // namespace test
} // namespace util
} // namespace btcstaker
