// POWERBOND - Configuration File Parser Tests
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <gtest/gtest.h>

#include "powerbond/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace powerbond {
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
        char filename[] = "/tmp/powerbond_config_test_XXXXXX";
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
# key=value
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    auto result = config_.ParseString("  loglevel =  debug  ");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

TEST_F(ConfigTest, ParseSections) {
    std::string content = R"(
datadir=/var/lib/powerbond

[domain]
name=PowerBond
chainid=5

[exchange]
cap=100e18
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("datadir", ""), "/var/lib/powerbond");
    EXPECT_EQ(config_.GetString("name", "", "domain"), "PowerBond");
    EXPECT_EQ(config_.GetInt("chainid", 0, "domain"), 5);
    EXPECT_EQ(config_.GetString("cap", "", "exchange"), "100e18");
    EXPECT_FALSE(config_.HasKey("cap"));

    auto keys = config_.GetKeys("domain");
    EXPECT_EQ(keys.size(), 2u);
}

TEST_F(ConfigTest, QuotedValues) {
    std::string content = R"(
name="Power Bond"
single='it''s'
escaped="line\none \"q\""
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("name", ""), "Power Bond");
    EXPECT_EQ(config_.GetString("single", ""), "it''s");
    EXPECT_EQ(config_.GetString("escaped", ""), "line\none \"q\"");
}

TEST_F(ConfigTest, BareFlagsAndNegation) {
    auto result = config_.ParseString("printtoconsole\nnodebug\n");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("debug", true));
    EXPECT_TRUE(config_.HasKey("debug"));
}

TEST_F(ConfigTest, BooleanSpellings) {
    config_.Set("a", "yes");
    config_.Set("b", "Off");
    config_.Set("c", "1");
    config_.Set("d", "maybe");
    EXPECT_EQ(config_.TryGetBool("a"), std::optional<bool>(true));
    EXPECT_EQ(config_.TryGetBool("b"), std::optional<bool>(false));
    EXPECT_EQ(config_.TryGetBool("c"), std::optional<bool>(true));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, IntegerParsingIsStrict) {
    config_.Set("ok", "42");
    config_.Set("neg", "-7");
    config_.Set("junk", "42abc");
    config_.Set("word", "many");
    EXPECT_EQ(config_.TryGetInt("ok"), std::optional<int64_t>(42));
    EXPECT_EQ(config_.TryGetInt("neg"), std::optional<int64_t>(-7));
    EXPECT_FALSE(config_.TryGetInt("junk").has_value());
    EXPECT_FALSE(config_.TryGetInt("word").has_value());
    EXPECT_EQ(config_.GetInt("missing", 9), 9);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("POWERBOND_TEST_DIR", "/opt/pb", 1);
    auto result = config_.ParseString("datadir=${POWERBOND_TEST_DIR}/data");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/opt/pb/data");
    unsetenv("POWERBOND_TEST_DIR");

    EXPECT_EQ(ConfigManager::ExpandEnvVars("x${POWERBOND_UNSET_VAR}y"), "xy");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${unterminated"), "${unterminated");
}

TEST_F(ConfigTest, TildeExpansion) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/state"), "/home/tester/state");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/state"), "~other/state");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/tester/.powerbond");
}

TEST_F(ConfigTest, DuplicateKeyWarns) {
    auto result = config_.ParseString("loglevel=info\nloglevel=debug\n");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("loglevel"), std::string::npos);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

TEST_F(ConfigTest, DefaultDoesNotTriggerDuplicateWarning) {
    config_.SetDefault("loglevel", "warn");
    auto result = config_.ParseString("loglevel=info");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(config_.GetString("loglevel", ""), "info");

    config_.SetDefault("loglevel", "error");
    EXPECT_EQ(config_.GetString("loglevel", ""), "info");
}

// ============================================================================
// Error Handling Tests
// ============================================================================

TEST_F(ConfigTest, UnterminatedSection) {
    auto result = config_.ParseString("key=1\n[domain\nname=x\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, InvalidKey) {
    auto result = config_.ParseString("bad key=1");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid key"), std::string::npos);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string content = "key=" + std::string(MAX_LINE_LENGTH + 1, 'x');
    auto result = config_.ParseString(content);
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config_.ParseFile("/nonexistent/powerbond.conf");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Command Line Tests
// ============================================================================

TEST_F(ConfigTest, ParseCommandLine) {
    char arg0[] = "powerbond-cli";
    char arg1[] = "-loglevel=debug";
    char arg2[] = "--exchange.cap=5e18";
    char arg3[] = "-noprinttoconsole";
    char arg4[] = "curve";
    char* argv[] = {arg0, arg1, arg2, arg3, arg4};

    auto result = config_.ParseCommandLine(5, argv);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetString("cap", "", "exchange"), "5e18");
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_FALSE(config_.HasKey("curve"));
}

TEST_F(ConfigTest, CommandLineRejectsBadOption) {
    char arg0[] = "powerbond-cli";
    char arg1[] = "-bad$key=1";
    char* argv[] = {arg0, arg1};

    auto result = config_.ParseCommandLine(2, argv);
    EXPECT_FALSE(result.success);
}

// ============================================================================
// File Loading Tests
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[domain]\nversion=2\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("version", "", "domain"), "2");
}

TEST_F(ConfigTest, LoadConfigFileHonoursConf) {
    std::string path = CreateTempFile("loglevel=trace\n");
    config_.Set(ConfigKeys::CONF, path);

    auto result = config_.LoadConfigFile();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "trace");
}

TEST_F(ConfigTest, LoadConfigFileMissingConfIsError) {
    config_.Set(ConfigKeys::CONF, "/nonexistent/other.conf");
    EXPECT_FALSE(config_.LoadConfigFile().success);
}

TEST_F(ConfigTest, LoadConfigFileWithoutDefaultIsFine) {
    config_.SetDataDir("/nonexistent/powerbond-datadir");
    auto result = config_.LoadConfigFile();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetDataDir(), "/nonexistent/powerbond-datadir");
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(ConfigTest, ValidateRequiredAndUnknownKeys) {
    config_.RequireKey(ConfigKeys::DOMAIN_CONTRACT, ConfigKeys::DOMAIN_SECTION);
    config_.AllowKey(ConfigKeys::LOGLEVEL);
    config_.Set(ConfigKeys::LOGLEVEL, "info");
    config_.Set("typo", "1");

    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 2u);

    bool sawMissing = false;
    bool sawUnknown = false;
    for (const auto& e : errors) {
        if (e.find("domain.contract") != std::string::npos) sawMissing = true;
        if (e.find("typo") != std::string::npos) sawUnknown = true;
    }
    EXPECT_TRUE(sawMissing);
    EXPECT_TRUE(sawUnknown);
}

TEST_F(ConfigTest, ValidateWithoutAllowListAcceptsAnything) {
    config_.Set("anything", "1");
    EXPECT_TRUE(config_.Validate().empty());
}

} // namespace test
} // namespace util
} // namespace powerbond
