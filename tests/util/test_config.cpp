// STAKEVAULT - Configuration File Parser Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>

#include "stakevault/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <unistd.h>

namespace stakevault {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
        if (const char* home = std::getenv("HOME")) {
            savedHome_ = home;
        }
    }

    void TearDown() override {
        if (savedHome_) {
            setenv("HOME", savedHome_->c_str(), 1);
        }
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/stakevault_config_test_XXXXXX";
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
    std::optional<std::string> savedHome_;
};

// ============================================================================
// String Parsing
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseCommentsAndKeys) {
    auto result = config_.ParseString(
        "# comment\n"
        "; also a comment\n"
        "stakelimit = 25\n"
        "from=0x0101010101010101010101010101010101010101\n");
    ASSERT_TRUE(result.success) << result.errorMessage;

    EXPECT_EQ(config_.Size(), 2u);
    EXPECT_EQ(config_.GetInt("stakelimit", 0), 25);
    EXPECT_EQ(config_.GetString("from", ""), "0x0101010101010101010101010101010101010101");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    config_.ParseString("logfile = \"/var/log/vault log.txt\"\nname='a\\nb'\n");
    EXPECT_EQ(config_.GetString("logfile", ""), "/var/log/vault log.txt");
    EXPECT_EQ(config_.GetString("name", ""), "a\\nb");
}

TEST_F(ConfigTest, ParseFlags) {
    config_.ParseString("printtoconsole\nnodebug\n");
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("debug", true));
}

TEST_F(ConfigTest, ParseSection) {
    config_.ParseString("blocktime=12\n[test]\nblocktime=2\n");
    EXPECT_EQ(config_.GetInt("blocktime", 0), 12);
    EXPECT_EQ(config_.GetInt("blocktime", 0, "test"), 2);
}

TEST_F(ConfigTest, LineContinuation) {
    config_.ParseString("rewardperblock=12\\\n34\n");
    EXPECT_EQ(config_.GetInt("rewardperblock", 0), 1234);
}

TEST_F(ConfigTest, InvalidLines) {
    EXPECT_FALSE(config_.ParseString("[broken\n").success);
    EXPECT_FALSE(config_.ParseString("=value\n").success);

    auto result = config_.ParseString("ok=1\nbad key=2\n", "sample.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "sample.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string line = "key=" + std::string(MAX_LINE_LENGTH, 'x');
    EXPECT_FALSE(config_.ParseString(line).success);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, TryGetIntIsStrict) {
    config_.Set("a", "42");
    config_.Set("b", " -7 ");
    config_.Set("c", "12abc");
    config_.Set("d", "99999999999999999999");
    config_.Set("e", "");

    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_EQ(config_.TryGetInt("b"), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_FALSE(config_.TryGetInt("e").has_value());
    EXPECT_FALSE(config_.TryGetInt("missing").has_value());
    EXPECT_EQ(config_.GetInt("c", 5), 5);
}

TEST_F(ConfigTest, GetBool) {
    config_.Set("t1", "yes");
    config_.Set("t2", "ON");
    config_.Set("f1", "0");
    config_.Set("bad", "maybe");

    EXPECT_EQ(config_.TryGetBool("t1"), true);
    EXPECT_EQ(config_.TryGetBool("t2"), true);
    EXPECT_EQ(config_.TryGetBool("f1"), false);
    EXPECT_FALSE(config_.TryGetBool("bad").has_value());
    EXPECT_TRUE(config_.GetBool("bad", true));
}

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("STAKEVAULT_TEST_VAR", "value", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a_${STAKEVAULT_TEST_VAR}_b"), "a_value_b");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$STAKEVAULT_TEST_VAR/x"), "value/x");
    unsetenv("STAKEVAULT_TEST_VAR");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a_${STAKEVAULT_TEST_VAR}_b"), "a__b");
}

TEST_F(ConfigTest, ExpandTilde) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/vault"), "/home/tester/vault");
    EXPECT_EQ(ConfigManager::ExpandTilde("~"), "/home/tester");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/vault"), "~other/vault");
    EXPECT_EQ(ConfigManager::ExpandTilde("/a/~/b"), "/a/~/b");
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, ParseCommandLineOptionsAndPositionals) {
    const char* argv[] = {"stakevault-cli", "-datadir=/tmp/vault", "stake",
                          "--from=0xabc", "42", "-printtoconsole", "-nodebug"};
    auto result = config_.ParseCommandLine(7, argv);
    ASSERT_TRUE(result.success) << result.errorMessage;

    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp/vault");
    EXPECT_EQ(config_.GetString("from", ""), "0xabc");
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("debug", true));
    EXPECT_EQ(config_.GetPositionalArgs(), (std::vector<std::string>{"stake", "42"}));
}

TEST_F(ConfigTest, ParseCommandLineRejectsBadOption) {
    const char* argv[] = {"stakevault-cli", "-bad key=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    const char* argv[] = {"stakevault-cli", "-stakelimit=5"};
    config_.ParseCommandLine(2, argv);

    std::string file = CreateTempFile("stakelimit=50\nblocktime=6\n");
    ASSERT_TRUE(config_.ParseFile(file).success);

    EXPECT_EQ(config_.GetInt("stakelimit", 0), 5);
    EXPECT_EQ(config_.GetInt("blocktime", 0), 6);
}

TEST_F(ConfigTest, OverwriteReplacesEarlierSource) {
    config_.ParseString("blocktime=12\n", "first.conf");
    config_.ParseString("blocktime=3\n", "second.conf");
    EXPECT_EQ(config_.GetInt("blocktime", 0), 12);

    config_.ParseString("blocktime=3\n", "second.conf", true);
    EXPECT_EQ(config_.GetInt("blocktime", 0), 3);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFileAndInclude) {
    std::string inner = CreateTempFile("carryamount=7\n");
    std::string outer = CreateTempFile("include " + inner + "\nearlyexittax=3\n");

    ASSERT_TRUE(config_.ParseFile(outer).success);
    EXPECT_EQ(config_.GetInt("carryamount", 0), 7);
    EXPECT_EQ(config_.GetInt("earlyexittax", 0), 3);
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    EXPECT_FALSE(config_.ParseFile("/nonexistent/stakevault.conf").success);
}

TEST_F(ConfigTest, LoadConfigFileMissingDefaultIsNotAnError) {
    auto result = config_.LoadConfigFile("/nonexistent/datadir");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(ConfigTest, LoadConfigFileExplicitMustExist) {
    config_.Set("conf", "/nonexistent/explicit.conf");
    EXPECT_FALSE(config_.LoadConfigFile().success);

    std::string file = CreateTempFile("unbondinghours=9\n");
    config_.Set("conf", file);
    ASSERT_TRUE(config_.LoadConfigFile().success);
    EXPECT_EQ(config_.GetInt("unbondinghours", 0), 9);
}

// ============================================================================
// Data Directory and Sample File
// ============================================================================

TEST_F(ConfigTest, GetDataDir) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(config_.GetDataDir(), "/home/tester/.stakevault");

    config_.Set("datadir", "~/custom");
    EXPECT_EQ(config_.GetDataDir(), "/home/tester/custom");
}

TEST_F(ConfigTest, GenerateSampleConfigParses) {
    std::string sample = ConfigManager::GenerateSampleConfig();
    EXPECT_NE(sample.find("stakinghours"), std::string::npos);
    EXPECT_TRUE(config_.ParseString(sample).success);
    EXPECT_EQ(config_.Size(), 0u);
}

} // namespace test
} // namespace util
} // namespace stakevault
