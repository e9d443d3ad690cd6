// FEEDROUTE - Configuration File Parser Tests
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <gtest/gtest.h>

#include "feedroute/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace feedroute {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/feedroute_config_test_XXXXXX";
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

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
# protocolid=5
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    auto result = config_.ParseString("  loglevel =  debug  ");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    config_.ParseString("a=\"two words\"\nb='raw \\n'\nc=\"tab\\there\"");
    EXPECT_EQ(config_.GetString("a", ""), "two words");
    EXPECT_EQ(config_.GetString("b", ""), "raw \\n");
    EXPECT_EQ(config_.GetString("c", ""), "tab\there");
}

TEST_F(ConfigTest, ParseBareFlag) {
    config_.ParseString("logcolors");
    EXPECT_TRUE(config_.GetBool("logcolors", false));
}

TEST_F(ConfigTest, ParseSection) {
    config_.ParseString("protocolid=1\n[test]\nprotocolid=2\n");
    EXPECT_EQ(config_.GetInt("protocolid", 0), 1);
    EXPECT_EQ(config_.GetInt("protocolid", 0, "test"), 2);
}

TEST_F(ConfigTest, LineContinuation) {
    config_.ParseString("debug=registry,\\\nfees\n");
    EXPECT_EQ(config_.GetList("debug"), std::vector<std::string>({"registry", "fees"}));
}

TEST_F(ConfigTest, InvalidSectionHeader) {
    auto result = config_.ParseString("[broken\n", "bad.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
    EXPECT_EQ(result.ToString(), "bad.conf:1: Missing closing bracket in section header");
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    auto result = config_.ParseString("key$=1");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string content = "key=" + std::string(MAX_LINE_LENGTH, 'x');
    EXPECT_FALSE(config_.ParseString(content).success);
}

// ============================================================================
// Value Retrieval Tests
// ============================================================================

TEST_F(ConfigTest, TryGetIntStrict) {
    config_.ParseString("a=42\nb=42x\nc=-7\n");
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_FALSE(config_.TryGetInt("b").has_value());
    EXPECT_EQ(config_.TryGetInt("c"), -7);
    EXPECT_FALSE(config_.TryGetInt("missing").has_value());
    EXPECT_EQ(config_.GetInt("b", 5), 5);
}

TEST_F(ConfigTest, GetBool) {
    config_.ParseString("a=yes\nb=OFF\nc=maybe\n");
    EXPECT_EQ(config_.TryGetBool("a"), true);
    EXPECT_EQ(config_.TryGetBool("b"), false);
    EXPECT_FALSE(config_.TryGetBool("c").has_value());
    EXPECT_TRUE(config_.GetBool("c", true));
}

TEST_F(ConfigTest, GetListCombinesRepeatsAndCommas) {
    config_.ParseString("debug=registry, alias\ndebug=proof\n");
    EXPECT_EQ(config_.GetList("debug"),
              std::vector<std::string>({"registry", "alias", "proof"}));
}

TEST_F(ConfigTest, GetEntryRecordsLocation) {
    config_.ParseString("\n\nprotocolid=3\n", "feedroute.conf");
    auto entry = config_.GetEntry("protocolid");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->source, "feedroute.conf");
    EXPECT_EQ(entry->lineNumber, 3);
}

TEST_F(ConfigTest, ExpandEnvVarsBraced) {
    setenv("FEEDROUTE_TEST_VAR", "value", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("pre_${FEEDROUTE_TEST_VAR}_post"), "pre_value_post");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${FEEDROUTE_UNDEFINED_VAR}x"), "x");
    unsetenv("FEEDROUTE_TEST_VAR");
}

TEST_F(ConfigTest, ExpandEnvVarsInConfig) {
    setenv("FEEDROUTE_TEST_LEVEL", "warn", 1);
    config_.ParseString("loglevel=${FEEDROUTE_TEST_LEVEL}");
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
    unsetenv("FEEDROUTE_TEST_LEVEL");
}

// ============================================================================
// Files and Precedence
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("protocolid=100\nloglevel=info\n");
    auto result = config_.ParseFile(path);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetInt("protocolid", 0), 100);
    EXPECT_EQ(config_.GetEntry("protocolid")->source, path);
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/feedroute.conf");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, LaterFileOverwritesOnlyWhenAsked) {
    std::string first = CreateTempFile("loglevel=info\n");
    std::string second = CreateTempFile("loglevel=debug\n");

    config_.ParseFile(first);
    config_.ParseFile(second);
    EXPECT_EQ(config_.GetString("loglevel", ""), "info");

    config_.ParseFile(second, true);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

TEST_F(ConfigTest, ParseCommandLineBasic) {
    const char* argv[] = {"prog", "-protocolid=7", "--loglevel=debug", "-logcolors"};
    auto result = config_.ParseCommandLine(4, argv);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetInt("protocolid", 0), 7);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_TRUE(config_.GetBool("logcolors", false));
}

TEST_F(ConfigTest, ParseCommandLineNegated) {
    const char* argv[] = {"prog", "-nologcolors"};
    config_.ParseCommandLine(2, argv);
    EXPECT_FALSE(config_.GetBool("logcolors", true));
}

TEST_F(ConfigTest, ParseCommandLinePositional) {
    const char* argv[] = {"prog", "-loglevel=warn", "towei", "12345678", "-2"};
    auto result = config_.ParseCommandLine(5, argv);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetPositionalArgs(),
              std::vector<std::string>({"towei", "12345678", "-2"}));
    EXPECT_FALSE(config_.HasKey("2"));
}

TEST_F(ConfigTest, ParseCommandLineInvalidOption) {
    const char* argv[] = {"prog", "-bad$key"};
    auto result = config_.ParseCommandLine(2, argv);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "<command-line>");
}

TEST_F(ConfigTest, CommandLineBeatsFile) {
    const char* argv[] = {"prog", "-loglevel=error"};
    config_.ParseCommandLine(2, argv);
    config_.ParseString("loglevel=info\n", "feedroute.conf");
    EXPECT_EQ(config_.GetString("loglevel", ""), "error");
}

// ============================================================================
// Value Setting Tests
// ============================================================================

TEST_F(ConfigTest, SetOverwrites) {
    config_.Set("key", "one");
    config_.Set("key", "two");
    EXPECT_EQ(config_.GetString("key", ""), "two");
}

TEST_F(ConfigTest, SetDefault) {
    config_.SetDefault("key", "default");
    EXPECT_EQ(config_.GetString("key", ""), "default");

    config_.ParseString("key=parsed");
    EXPECT_EQ(config_.GetString("key", ""), "parsed");

    config_.SetDefault("key", "ignored");
    EXPECT_EQ(config_.GetString("key", ""), "parsed");
}

TEST_F(ConfigTest, ParseBool) {
    EXPECT_EQ(ConfigManager::ParseBool("TRUE"), true);
    EXPECT_EQ(ConfigManager::ParseBool("0"), false);
    EXPECT_FALSE(ConfigManager::ParseBool("2").has_value());
}

TEST_F(ConfigTest, Clear) {
    const char* argv[] = {"prog", "cmd"};
    config_.ParseCommandLine(2, argv);
    config_.Set("a", "1");
    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_TRUE(config_.GetPositionalArgs().empty());
}

} // namespace test
} // namespace util
} // namespace feedroute
