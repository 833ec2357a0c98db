// HYDROSTAKE - Configuration File Parser Tests
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "hydrostake/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace hydrostake {
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
        char filename[] = "/tmp/hydrostake_config_test_XXXXXX";
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
    auto result = config_.ParseString("datadir=/var/lib/hydrostake\nloglevel = debug\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/var/lib/hydrostake");
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

TEST_F(ConfigTest, CommentsAndBlankLines) {
    auto result = config_.ParseString("# comment\n\n; another\nminutes=60\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 1u);
    EXPECT_EQ(config_.GetInt("minutes", 0), 60);
}

TEST_F(ConfigTest, Sections) {
    auto result = config_.ParseString(
        "loglevel=info\n"
        "[staking]\n"
        "max_rate=380517503805\n"
        "stake_active=0\n");
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("max_rate", "", "staking"), "380517503805");
    EXPECT_FALSE(config_.HasKey("max_rate"));
    EXPECT_FALSE(config_.GetBool("stake_active", true, "staking"));

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0], "staking");

    auto keys = config_.GetKeys("staking");
    EXPECT_EQ(keys.size(), 2u);
}

TEST_F(ConfigTest, UnterminatedSectionIsError) {
    auto result = config_.ParseString("[staking\nmax_rate=1\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 1);
    EXPECT_EQ(result.ToString().substr(0, 12), "test.conf:1:");
}

TEST_F(ConfigTest, InvalidKeyIsError) {
    auto result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, BareFlagsAndNegation) {
    auto result = config_.ParseString("printtoconsole\nnoverbose\n");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("verbose", true));
}

TEST_F(ConfigTest, QuotedValues) {
    auto result = config_.ParseString(
        "double=\"a\\tb\"\n"
        "single='keep \\t raw'\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("double", ""), "a\tb");
    EXPECT_EQ(config_.GetString("single", ""), "keep \\t raw");
}

TEST_F(ConfigTest, LineContinuation) {
    auto result = config_.ParseString("stake=12\\\n34\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("stake", ""), "1234");
}

TEST_F(ConfigTest, LaterValueOverrides) {
    auto result = config_.ParseString("minutes=1\nminutes=2\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetInt("minutes", 0), 2);
}

// ============================================================================
// Typed Access Tests
// ============================================================================

TEST_F(ConfigTest, IntegerParsing) {
    config_.Set("good", "-42");
    config_.Set("bad", "12abc");
    config_.Set("empty", "");

    ASSERT_TRUE(config_.TryGetInt("good").has_value());
    EXPECT_EQ(*config_.TryGetInt("good"), -42);
    EXPECT_FALSE(config_.TryGetInt("bad").has_value());
    EXPECT_FALSE(config_.TryGetInt("empty").has_value());
    EXPECT_FALSE(config_.TryGetInt("missing").has_value());
    EXPECT_EQ(config_.GetInt("missing", 7), 7);
}

TEST_F(ConfigTest, UnsignedRejectsNegative) {
    config_.Set("n", "-1");
    config_.Set("p", "18446744073709551615");
    EXPECT_FALSE(config_.TryGetUInt("n").has_value());
    EXPECT_EQ(*config_.TryGetUInt("p"), 18446744073709551615ULL);
}

TEST_F(ConfigTest, BoolSpellings) {
    for (const char* yes : {"1", "true", "YES", "on"}) {
        config_.Set("flag", yes);
        EXPECT_TRUE(config_.GetBool("flag", false)) << yes;
    }
    for (const char* no : {"0", "false", "No", "off"}) {
        config_.Set("flag", no);
        EXPECT_FALSE(config_.GetBool("flag", true)) << no;
    }
    config_.Set("flag", "maybe");
    EXPECT_FALSE(config_.TryGetBool("flag").has_value());
}

TEST_F(ConfigTest, SetDefaultDoesNotOverride) {
    config_.Set("loglevel", "debug");
    config_.SetDefault("loglevel", "info");
    config_.SetDefault("logfile", "hydrostake.log");
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetString("logfile", ""), "hydrostake.log");
}

// ============================================================================
// Command Line Tests
// ============================================================================

TEST_F(ConfigTest, CommandLineForms) {
    const char* argv[] = {"hydrostake-sim", "positional", "-stake=100", "--minutes", "30",
                          "-noprinttoconsole", "-help"};
    auto result = config_.ParseCommandLine(7, argv);
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("stake", ""), "100");
    EXPECT_EQ(config_.GetInt("minutes", 0), 30);
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_TRUE(config_.GetBool("help", false));
    ASSERT_EQ(result.warnings.size(), 1u);
}

TEST_F(ConfigTest, CommandLineWinsOverLaterFile) {
    const char* argv[] = {"hydrostake-sim", "-stake=5"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    ASSERT_TRUE(config_.ParseString("stake=9\nminutes=15\n").success);

    EXPECT_EQ(config_.GetString("stake", ""), "5");
    EXPECT_EQ(config_.GetInt("minutes", 0), 15);

    config_.Set("stake", "7");
    EXPECT_EQ(config_.GetString("stake", ""), "7");
}

TEST_F(ConfigTest, CommandLineRejectsBadOption) {
    const char* argv[] = {"hydrostake-sim", "-bad key=1"};
    auto result = config_.ParseCommandLine(2, argv);
    EXPECT_FALSE(result.success);
}

// ============================================================================
// File Tests
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("datadir=/tmp/state\n[staking]\nrate_step=5\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp/state");
    EXPECT_EQ(config_.GetInt("rate_step", 0, "staking"), 5);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config_.ParseFile("/nonexistent/hydrostake.conf");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, IncludeDirective) {
    std::string inner = CreateTempFile("minutes=90\n");
    std::string outer = CreateTempFile("include " + inner + "\nstake=5\n");
    auto result = config_.ParseFile(outer);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetInt("minutes", 0), 90);
    EXPECT_EQ(config_.GetString("stake", ""), "5");
}

TEST_F(ConfigTest, SelfIncludeHitsDepthLimit) {
    std::string path = CreateTempFile("");
    {
        std::ofstream file(path);
        file << "include " << path << "\n";
    }
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Validation and Expansion Tests
// ============================================================================

TEST_F(ConfigTest, ValidateReportsUnknownKeys) {
    config_.AllowKey("stake");
    config_.ParseString("stake=1\ntypo=2\n", "sim.conf");

    auto unknown = config_.Validate("");
    ASSERT_EQ(unknown.size(), 1u);
    EXPECT_NE(unknown[0].find("typo"), std::string::npos);
    EXPECT_NE(unknown[0].find("sim.conf"), std::string::npos);
}

TEST_F(ConfigTest, ValidateSilentWithoutAllowList) {
    config_.ParseString("anything=1\n");
    EXPECT_TRUE(config_.Validate("").empty());
}

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("HYDROSTAKE_TEST_VAR", "value", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("x-${HYDROSTAKE_TEST_VAR}-y"), "x-value-y");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${HYDROSTAKE_UNSET_VAR_123}"), "");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${unterminated"), "${unterminated");
    unsetenv("HYDROSTAKE_TEST_VAR");
}

TEST_F(ConfigTest, ExpandTilde) {
    const char* oldHome = std::getenv("HOME");
    std::string saved = oldHome ? oldHome : "";

    setenv("HOME", "/home/staker", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/data"), "/home/staker/data");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/data"), "~other/data");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");

    if (oldHome) {
        setenv("HOME", saved.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}

TEST_F(ConfigTest, DumpRoundTrips) {
    config_.ParseString("a=1\n[staking]\nb=2\n");
    ConfigManager copy;
    ASSERT_TRUE(copy.ParseString(config_.Dump()).success);
    EXPECT_EQ(copy.GetString("a", ""), "1");
    EXPECT_EQ(copy.GetString("b", "", "staking"), "2");
}

TEST_F(ConfigTest, ClearRemovesEverything) {
    config_.Set("a", "1");
    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_FALSE(config_.HasKey("a"));
}

} // namespace test
} // namespace util
} // namespace hydrostake
