/**
 * @file test_config.cpp
 * @brief Unit tests for configuration sections and file loading
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "config/config.hpp"

namespace simdeck::config::test {

namespace fs = std::filesystem;
using ::testing::HasSubstr;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("simdeck_config_test_" +
                std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);

        if (const char* home = std::getenv("HOME")) {
            savedHome_ = home;
        }
        if (const char* env = std::getenv(kConfigEnvVar)) {
            savedEnv_ = env;
        }
        unsetenv(kConfigEnvVar);
        setenv("HOME", dir_.c_str(), 1);
    }

    void TearDown() override {
        if (savedHome_) {
            setenv("HOME", savedHome_->c_str(), 1);
        } else {
            unsetenv("HOME");
        }
        if (savedEnv_) {
            setenv(kConfigEnvVar, savedEnv_->c_str(), 1);
        } else {
            unsetenv(kConfigEnvVar);
        }
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    auto writeFile(const std::string& name, const std::string& content)
        -> fs::path {
        auto path = dir_ / name;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
        return path;
    }

    fs::path dir_;
    std::optional<std::string> savedHome_;
    std::optional<std::string> savedEnv_;
};

// ============================================================================
// Section Tests
// ============================================================================

TEST(ConfigSectionTest, Defaults) {
    SimdeckConfig config;
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_EQ(config.control.xcrunPath, "xcrun");
    EXPECT_EQ(config.control.commandTimeoutSec, 120);
    EXPECT_EQ(config.lifecycle.pollIntervalMs, 500);
    EXPECT_EQ(config.lifecycle.bootTimeoutSec, 60);
    EXPECT_EQ(config.remote.defaultPort, 22);
    EXPECT_EQ(config.output.indent, 2);
    EXPECT_NO_THROW(config.logging.validate());
    EXPECT_NO_THROW(config.remote.validate());
}

TEST(ConfigSectionTest, PartialSectionKeepsDefaults) {
    auto lifecycle =
        LifecycleConfig::fromJson(json{{"bootTimeoutSec", 120}});
    EXPECT_EQ(lifecycle.bootTimeoutSec, 120);
    EXPECT_EQ(lifecycle.pollIntervalMs, 500);
    EXPECT_EQ(lifecycle.shutdownTimeoutSec, 60);
}

TEST(ConfigSectionTest, RoundTrip) {
    RemoteConfig remote;
    remote.defaultPort = 2222;
    remote.remoteBinary = "/opt/homebrew/bin/simdeck";
    EXPECT_EQ(RemoteConfig::fromJson(remote.toJson()), remote);
    EXPECT_EQ(RemoteConfig::path(), "remote");
}

TEST(ConfigSectionTest, ValidationNamesTheKey) {
    try {
        (void)LifecycleConfig::fromJson(json{{"pollIntervalMs", 0}});
        FAIL() << "Expected InvalidConfigException";
    } catch (const InvalidConfigException& e) {
        EXPECT_EQ(e.key(), "lifecycle.pollIntervalMs");
        EXPECT_THAT(e.what(), HasSubstr("must be positive"));
    }
}

TEST(ConfigSectionTest, WrongTypeIsInvalid) {
    EXPECT_THROW((void)OutputConfig::fromJson(json{{"indent", "two"}}),
                 InvalidConfigException);
    EXPECT_THROW((void)OutputConfig::fromJson(json::array()),
                 InvalidConfigException);
    EXPECT_THROW((void)OutputConfig::fromJson(json{{"indent", 12}}),
                 InvalidConfigException);
}

TEST(ConfigSectionTest, LogLevels) {
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(logLevelFromString("fatal"), LogLevel::Critical);
    EXPECT_EQ(logLevelFromString("loud"), std::nullopt);
    EXPECT_EQ(logLevelToString(LogLevel::Debug), "debug");

    LoggingConfig logging;
    logging.level = "loud";
    EXPECT_THROW(logging.validate(), InvalidConfigException);
}

TEST(ConfigSectionTest, RemotePortRange) {
    EXPECT_THROW((void)RemoteConfig::fromJson(json{{"defaultPort", 0}}),
                 InvalidConfigException);
    EXPECT_THROW((void)RemoteConfig::fromJson(json{{"defaultPort", 65536}}),
                 InvalidConfigException);
}

TEST(ConfigSectionTest, FromJsonIgnoresUnknownSections) {
    auto config = SimdeckConfig::fromJson(
        json{{"output", {{"indent", -1}}}, {"telemetry", {{"on", true}}}});
    EXPECT_EQ(config.output.indent, -1);
    EXPECT_EQ(config.control, ControlConfig{});
}

TEST(ConfigSectionTest, ToJsonHasEverySection) {
    auto j = SimdeckConfig{}.toJson();
    for (const auto* key :
         {"logging", "control", "lifecycle", "remote", "output"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(SimdeckConfig::fromJson(j), SimdeckConfig{});
}

// ============================================================================
// File Loading Tests
// ============================================================================

TEST_F(ConfigLoaderTest, LoadFile_WithComments) {
    auto path = writeFile("simdeck.json", R"({
        // local tools
        "control": {"idbPath": "/opt/homebrew/bin/idb"},
        "lifecycle": {"pollIntervalMs": 250}
    })");

    auto config = loadConfigFile(path);
    EXPECT_EQ(config.control.idbPath, "/opt/homebrew/bin/idb");
    EXPECT_EQ(config.control.xcrunPath, "xcrun");
    EXPECT_EQ(config.lifecycle.pollIntervalMs, 250);
}

TEST_F(ConfigLoaderTest, LoadFile_Missing) {
    try {
        (void)loadConfigFile(dir_ / "absent.json");
        FAIL() << "Expected ConfigIOException";
    } catch (const ConfigIOException& e) {
        EXPECT_THAT(e.key(), HasSubstr("absent.json"));
    }
}

TEST_F(ConfigLoaderTest, LoadFile_NotJson) {
    auto path = writeFile("broken.json", "{ \"output\": ");
    EXPECT_THROW((void)loadConfigFile(path), ConfigIOException);
}

TEST_F(ConfigLoaderTest, LoadFile_InvalidValue) {
    auto path = writeFile("bad.json", R"({"remote": {"sshPath": ""}})");
    EXPECT_THROW((void)loadConfigFile(path), InvalidConfigException);
}

TEST_F(ConfigLoaderTest, Resolve_NothingFound) {
    EXPECT_EQ(resolveConfigPath(""), std::nullopt);
    EXPECT_EQ(loadConfig(), SimdeckConfig{});
}

TEST_F(ConfigLoaderTest, Resolve_HomeFallback) {
    auto path = writeFile(".config/simdeck/config.json",
                          R"({"output": {"indent": 4}})");
    EXPECT_EQ(resolveConfigPath(""), path);
    EXPECT_EQ(loadConfig().output.indent, 4);
}

TEST_F(ConfigLoaderTest, Resolve_EnvBeatsHome) {
    writeFile(".config/simdeck/config.json", R"({"output": {"indent": 4}})");
    auto envPath = writeFile("env.json", R"({"output": {"indent": 0}})");
    setenv(kConfigEnvVar, envPath.c_str(), 1);

    EXPECT_EQ(resolveConfigPath(""), envPath);
    EXPECT_EQ(loadConfig().output.indent, 0);
}

TEST_F(ConfigLoaderTest, Resolve_ExplicitBeatsEnv) {
    auto envPath = writeFile("env.json", R"({"output": {"indent": 0}})");
    auto explicitPath =
        writeFile("explicit.json", R"({"output": {"indent": 8}})");
    setenv(kConfigEnvVar, envPath.c_str(), 1);

    EXPECT_EQ(loadConfig(explicitPath.string()).output.indent, 8);
}

TEST_F(ConfigLoaderTest, Resolve_ExplicitMissingIsAnError) {
    EXPECT_THROW((void)loadConfig((dir_ / "nope.json").string()),
                 ConfigIOException);
}

}  // namespace simdeck::config::test
