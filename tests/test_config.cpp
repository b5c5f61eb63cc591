/**
 * Valstore - Configuration Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "core/config/ConfigManager.hpp"
#include "core/config/EngineConfig.hpp"

using namespace valstore;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for tests
        testDir = std::filesystem::temp_directory_path() / "valstore-config-test";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        // Clean up test directory
        std::filesystem::remove_all(testDir);
    }

    std::filesystem::path testDir;
};

TEST_F(ConfigManagerTest, InitializesWithDefaults) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.initialize(testDir));

    const auto& config = manager.engineConfig();
    EXPECT_EQ(config.language, "ja-JP");
    EXPECT_TRUE(config.usesKeyring());
    EXPECT_TRUE(config.legacyFileStoreEnabled);
    EXPECT_EQ(config.httpTimeoutMs, 15000);
    EXPECT_EQ(config.clientVersionTtlSeconds, 600);
}

TEST_F(ConfigManagerTest, DetectsFirstRun) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.initialize(testDir));
    EXPECT_TRUE(manager.isFirstRun());
    EXPECT_TRUE(std::filesystem::exists(testDir / "config.json"));

    ASSERT_TRUE(manager.initialize(testDir));
    EXPECT_FALSE(manager.isFirstRun());
}

TEST_F(ConfigManagerTest, SavesAndLoadsConfig) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.initialize(testDir));

    EngineConfig config = manager.engineConfig();
    config.language = "en-US";
    config.primaryStore = "none";
    config.retryBackoffMs = 0;
    manager.setEngineConfig(config);

    ASSERT_TRUE(manager.initialize(testDir));
    EXPECT_EQ(manager.engineConfig().language, "en-US");
    EXPECT_FALSE(manager.engineConfig().usesKeyring());
    EXPECT_EQ(manager.engineConfig().retryBackoffMs, 0);
}

TEST(EngineConfigTest, PartialJsonKeepsOtherDefaults) {
    auto config = EngineConfig::fromJson(R"({"language": "ko-KR", "skinIndexTtlSeconds": 60})");

    EXPECT_EQ(config.language, "ko-KR");
    EXPECT_EQ(config.skinIndexTtlSeconds, 60);
    EXPECT_EQ(config.maxTransientRetries, 3);
    EXPECT_EQ(config.primaryStore, "keyring");
}

TEST(EngineConfigTest, InvalidJsonFallsBackToDefaults) {
    auto config = EngineConfig::fromJson("{ not json");
    EXPECT_EQ(config.language, "ja-JP");

    auto wrongType = EngineConfig::fromJson(R"({"httpTimeoutMs": "soon"})");
    EXPECT_EQ(wrongType.httpTimeoutMs, 15000);
}

TEST(EngineConfigTest, SerializesEveryField) {
    auto json = nlohmann::json::parse(EngineConfig().toJson());

    for (const char* key : {"language", "defaultUserAgent", "primaryStore",
                            "legacyFileStoreEnabled", "cookiesDirectory", "httpTimeoutMs",
                            "maxTransientRetries", "retryBackoffMs", "clientVersionTtlSeconds",
                            "skinIndexTtlSeconds", "logVerbosity"}) {
        EXPECT_TRUE(json.contains(key)) << key;
    }
}
