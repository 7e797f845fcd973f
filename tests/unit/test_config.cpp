#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>

using namespace sttmon::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        configPath_ = ::testing::TempDir() + "sttmon_config_test.json";
        std::remove(configPath_.c_str());
    }
    
    void TearDown() override {
        std::remove(configPath_.c_str());
        unsetenv("PORT");
        unsetenv("RESP_CHECKCODE");
        unsetenv("OUTPUT_SUBTITLE_INSERTER_ENABLE");
    }
    
    void writeConfig(const std::string& content) {
        std::ofstream file(configPath_);
        file << content;
    }
    
    std::string configPath_;
};

TEST_F(ConfigTest, DefaultValues) {
    auto config = Config::load("nonexistent.json");
    EXPECT_EQ(config.getHost(), "127.0.0.1");
    EXPECT_EQ(config.getPort(), 26072);
    EXPECT_EQ(config.getResponseCheckcode(), 20250918);
    EXPECT_EQ(config.getUpdateIntervalMs(), 500);
    EXPECT_EQ(config.getSubtitleHost(), "127.0.0.1");
    EXPECT_EQ(config.getSubtitlePort(), 26071);
    EXPECT_EQ(config.getSubtitleCheckcode(), 20250918);
    EXPECT_FALSE(config.isSubtitleForwardingEnabled());
    EXPECT_EQ(config.getRawOutPath(), "./raw_out");
    EXPECT_DOUBLE_EQ(config.getSimilarityThreshold(), 0.6);
    EXPECT_EQ(config.getMaxLookahead(), 3);
    EXPECT_EQ(config.getAlignStrategy(), "sequential");
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_TRUE(config.validate().isValid);
}

TEST_F(ConfigTest, LoadsJsonSections) {
    writeConfig(R"({
        "monitor": {"host": "0.0.0.0", "port": 30000, "updateIntervalMs": 250},
        "subtitle": {"port": 30001, "enabled": true, "rawOutPath": "/tmp/out.txt"},
        "alignment": {"similarityThreshold": 0.75, "maxLookahead": 5, "strategy": "Levenshtein"},
        "logging": {"level": "DEBUG"}
    })");
    
    auto config = Config::load(configPath_);
    
    EXPECT_EQ(config.getHost(), "0.0.0.0");
    EXPECT_EQ(config.getPort(), 30000);
    EXPECT_EQ(config.getUpdateIntervalMs(), 250);
    EXPECT_EQ(config.getSubtitlePort(), 30001);
    EXPECT_TRUE(config.isSubtitleForwardingEnabled());
    EXPECT_EQ(config.getRawOutPath(), "/tmp/out.txt");
    EXPECT_DOUBLE_EQ(config.getSimilarityThreshold(), 0.75);
    EXPECT_EQ(config.getMaxLookahead(), 5);
    EXPECT_EQ(config.getAlignStrategy(), "levenshtein");
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
}

TEST_F(ConfigTest, EmptyFileYieldsDefaults) {
    writeConfig("   \n");
    auto config = Config::load(configPath_);
    EXPECT_EQ(config.getPort(), 26072);
}

TEST_F(ConfigTest, MalformedJsonThrows) {
    writeConfig("{ \"monitor\": ");
    EXPECT_THROW(Config::load(configPath_), ConfigurationException);
    EXPECT_THROW(Config::fromJson("[1, 2]"), ConfigurationException);
}

TEST_F(ConfigTest, HexCheckcode) {
    auto config = Config::fromJson(R"({"monitor": {"responseCheckcode": "0x01350126"}})");
    EXPECT_EQ(config.getResponseCheckcode(), 0x01350126);
}

TEST_F(ConfigTest, SubtitleCheckcodeFollowsResponseCheckcode) {
    Config config;
    config.applyOverrides({{"RESP_CHECKCODE", "1234"}});
    EXPECT_EQ(config.getSubtitleCheckcode(), 1234);
    
    config.applyOverrides({{"SUBTITLE_CHECKCODE", "99"}});
    config.applyOverrides({{"RESP_CHECKCODE", "5678"}});
    EXPECT_EQ(config.getResponseCheckcode(), 5678);
    EXPECT_EQ(config.getSubtitleCheckcode(), 99);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    writeConfig(R"({"monitor": {"port": 30000}})");
    setenv("PORT", "31000", 1);
    setenv("RESP_CHECKCODE", "0x10", 1);
    setenv("OUTPUT_SUBTITLE_INSERTER_ENABLE", "TRUE", 1);
    
    auto config = Config::load(configPath_);
    config.applyEnvironment();
    
    EXPECT_EQ(config.getPort(), 31000);
    EXPECT_EQ(config.getResponseCheckcode(), 16);
    EXPECT_TRUE(config.isSubtitleForwardingEnabled());
}

TEST_F(ConfigTest, InvalidValuesThrow) {
    Config config;
    EXPECT_THROW(config.applyOverrides({{"PORT", "abc"}}), ConfigurationException);
    EXPECT_THROW(config.applyOverrides({{"SIMILARITY_THRESHOLD", "0.6x"}}), ConfigurationException);
    EXPECT_THROW(config.applyOverrides({{"RESP_CHECKCODE", "0x1FFFFFFFF"}}), ConfigurationException);
}

TEST_F(ConfigTest, OnlyTrueEnablesForwarding) {
    Config config;
    config.applyOverrides({{"OUTPUT_SUBTITLE_INSERTER_ENABLE", "yes"}});
    EXPECT_FALSE(config.isSubtitleForwardingEnabled());
    config.applyOverrides({{"OUTPUT_SUBTITLE_INSERTER_ENABLE", "true"}});
    EXPECT_TRUE(config.isSubtitleForwardingEnabled());
}

TEST_F(ConfigTest, ValidationErrors) {
    Config config;
    config.applyOverrides({
        {"PORT", "70000"},
        {"SIMILARITY_THRESHOLD", "1.5"},
        {"MAX_LOOKAHEAD", "0"},
        {"ALIGN_STRATEGY", "dtw"},
        {"UPDATE_INTERVAL_MS", "0"}
    });
    
    auto result = config.validate();
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 5u);
}

TEST_F(ConfigTest, ValidationWarnings) {
    Config config;
    config.applyOverrides({{"UPDATE_INTERVAL_MS", "10"}, {"LOG_LEVEL", "verbose"}});
    
    auto result = config.validate();
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(result.warnings.size(), 2u);
}

TEST_F(ConfigTest, ToJsonRoundTripsThroughLoader) {
    Config original;
    original.setPort(32000);
    original.setSimilarityThreshold(0.8);
    
    auto reloaded = Config::fromJson(original.toJson());
    EXPECT_EQ(reloaded.getPort(), 32000);
    EXPECT_DOUBLE_EQ(reloaded.getSimilarityThreshold(), 0.8);
    EXPECT_EQ(reloaded.getAlignStrategy(), "sequential");
    EXPECT_EQ(reloaded.getResponseCheckcode(), 20250918);
}
