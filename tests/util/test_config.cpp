// COINKEY - Configuration File Parser Tests
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include <gtest/gtest.h>

#include "coinkey/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace coinkey {
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
        char filename[] = "/tmp/coinkey_config_test_XXXXXX";
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

TEST_F(ConfigTest, ParseKeyValue) {
    auto result = config_.ParseString("loglevel=debug\nlogfile = /tmp/coinkey.log\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetString("logfile", ""), "/tmp/coinkey.log");
}

TEST_F(ConfigTest, CommentsAndBlankLines) {
    auto result = config_.ParseString("# comment\n\n; other comment\nstrictsentinel=1\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 1u);
    EXPECT_TRUE(config_.GetBool("strictsentinel", false));
}

TEST_F(ConfigTest, QuotedValues) {
    auto result = config_.ParseString("a=\"two words\"\nb='single'\nc=\"tab\\there\"\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("a", ""), "two words");
    EXPECT_EQ(config_.GetString("b", ""), "single");
    EXPECT_EQ(config_.GetString("c", ""), "tab\there");
}

TEST_F(ConfigTest, BareFlagAndNegation) {
    auto result = config_.ParseString("uncompressed\nnoprinttoconsole\n");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool("uncompressed", false));
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
}

TEST_F(ConfigTest, Sections) {
    auto result = config_.ParseString("loglevel=warn\n[tool]\nloglevel=debug\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
    EXPECT_EQ(config_.GetString("loglevel", "", "tool"), "debug");
    
    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0], "tool");
}

TEST_F(ConfigTest, UnclosedSectionFails) {
    auto result = config_.ParseString("[tool\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, InvalidKeyFails) {
    auto result = config_.ParseString("ok=1\nbad key=2\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, LineTooLongFails) {
    std::string line = "key=" + std::string(MAX_LINE_LENGTH + 1, 'x');
    EXPECT_FALSE(config_.ParseString(line).success);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, ParseBool) {
    EXPECT_EQ(ConfigManager::ParseBool("yes"), true);
    EXPECT_EQ(ConfigManager::ParseBool("ON"), true);
    EXPECT_EQ(ConfigManager::ParseBool("1"), true);
    EXPECT_EQ(ConfigManager::ParseBool("false"), false);
    EXPECT_EQ(ConfigManager::ParseBool("0"), false);
    EXPECT_FALSE(ConfigManager::ParseBool("maybe").has_value());
}

TEST_F(ConfigTest, GetInt) {
    ASSERT_TRUE(config_.ParseString("n=42\nbad=4x\n").success);
    EXPECT_EQ(config_.GetInt("n", 0), 42);
    EXPECT_FALSE(config_.TryGetInt("bad").has_value());
    EXPECT_EQ(config_.GetInt("missing", 7), 7);
}

TEST_F(ConfigTest, GetBoolDefault) {
    ASSERT_TRUE(config_.ParseString("strictsentinel=perhaps\n").success);
    EXPECT_FALSE(config_.TryGetBool("strictsentinel").has_value());
    EXPECT_TRUE(config_.GetBool("strictsentinel", true));
    EXPECT_FALSE(config_.GetBool("absent", false));
}

TEST_F(ConfigTest, EntryRecordsSource) {
    ASSERT_TRUE(config_.ParseString("a=1\nb=2\n", "inline").success);
    auto entry = config_.GetEntry("b");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->source, "inline");
    EXPECT_EQ(entry->lineNumber, 2);
    EXPECT_FALSE(entry->isDefault);
}

// ============================================================================
// Defaults and Overrides
// ============================================================================

TEST_F(ConfigTest, SetDefaultDoesNotOverride) {
    config_.Set("loglevel", "debug");
    config_.SetDefault("loglevel", "warn");
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    
    config_.SetDefault("logfile", "a.log");
    EXPECT_EQ(config_.GetString("logfile", ""), "a.log");
    EXPECT_TRUE(config_.GetEntry("logfile")->isDefault);
    
    config_.Set("logfile", "b.log");
    EXPECT_EQ(config_.GetString("logfile", ""), "b.log");
}

TEST_F(ConfigTest, LaterValueWins) {
    ASSERT_TRUE(config_.ParseString("loglevel=info\nloglevel=error\n").success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "error");
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("loglevel=trace\nstrictsentinel=yes\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString("loglevel", ""), "trace");
    EXPECT_TRUE(config_.GetBool("strictsentinel", false));
    EXPECT_EQ(config_.GetEntry("loglevel")->source, path);
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/coinkey.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

TEST_F(ConfigTest, FileErrorReportsLine) {
    std::string path = CreateTempFile("a=1\n\n[broken\n");
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, path);
    EXPECT_EQ(result.errorLine, 3);
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, CommandLineOptionsAndPositionals) {
    const char* argv[] = {"coinkey-tool", "derive", "--uncompressed", "--loglevel=debug",
                          "0x01", "-strict"};
    auto result = config_.ParseCommandLine(6, argv);
    ASSERT_TRUE(result.success);
    
    EXPECT_TRUE(config_.GetBool("uncompressed", false));
    EXPECT_TRUE(config_.GetBool("strict", false));
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    
    const auto& args = config_.GetPositionalArgs();
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "derive");
    EXPECT_EQ(args[1], "0x01");
}

TEST_F(ConfigTest, CommandLineNegation) {
    const char* argv[] = {"coinkey-tool", "--noprinttoconsole"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
}

TEST_F(ConfigTest, CommandLineFlagDoesNotConsumeNext) {
    const char* argv[] = {"coinkey-tool", "--uncompressed", "generate"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);
    EXPECT_TRUE(config_.GetBool("uncompressed", false));
    ASSERT_EQ(config_.GetPositionalArgs().size(), 1u);
}

TEST_F(ConfigTest, CommandLineInvalidOption) {
    const char* argv[] = {"coinkey-tool", "--bad key"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    std::string path = CreateTempFile("loglevel=trace\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    
    const char* argv[] = {"coinkey-tool", "--loglevel=error"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "error");
}

TEST_F(ConfigTest, GettersFallBackToCallerDefault) {
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, "warn"), "warn");
    EXPECT_TRUE(config_.GetBool(ConfigKeys::PRINTTOCONSOLE, true));
    EXPECT_EQ(config_.GetInt("depth", 3), 3);
    
    config_.SetDefault(ConfigKeys::LOGLEVEL, "info");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, "warn"), "info");
    
    const char* argv[] = {"coinkey-tool", "--loglevel=trace", "--strictsentinel"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, "warn"), "trace");
    EXPECT_TRUE(config_.GetBool(ConfigKeys::STRICTSENTINEL, false));
    EXPECT_FALSE(config_.GetBool(ConfigKeys::STRICT, false));
}

TEST_F(ConfigTest, CommandLineReparsedAfterConfFile) {
    std::string path = CreateTempFile("loglevel=trace\nuncompressed=1\n");
    const char* argv[] = {"coinkey-tool", "--loglevel=error", "derive", "01"};
    
    ASSERT_TRUE(config_.ParseCommandLine(4, argv).success);
    ASSERT_TRUE(config_.ParseFile(path).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "trace");
    
    auto result = config_.ParseCommandLine(4, argv);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "error");
    EXPECT_TRUE(config_.GetBool(ConfigKeys::UNCOMPRESSED, false));
    EXPECT_EQ(config_.GetPositionalArgs(), (std::vector<std::string>{"derive", "01"}));
}

TEST_F(ConfigTest, CommandLineErrorNamesOption) {
    const char* argv[] = {"coinkey-tool", "derive", "--lo g"};
    auto result = config_.ParseCommandLine(3, argv);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Invalid option: --lo g");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, DumpShowsOrigin) {
    ASSERT_TRUE(config_.ParseString("loglevel=debug\n[tool]\nstrict=1\n", "coinkey.conf").success);
    config_.SetDefault("printtoconsole", "1");
    
    std::string dump = config_.Dump();
    EXPECT_NE(dump.find("loglevel=debug  # coinkey.conf:1\n"), std::string::npos);
    EXPECT_NE(dump.find("tool:strict=1  # coinkey.conf:3\n"), std::string::npos);
    EXPECT_NE(dump.find("printtoconsole=1  # default\n"), std::string::npos);
}

TEST_F(ConfigTest, GlobalConfigIsShared) {
    EXPECT_EQ(&GetConfig(), &GetConfig());
}

} // namespace test
} // namespace util
} // namespace coinkey
