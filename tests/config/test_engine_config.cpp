// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for EngineConfig
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "config/engine_config.hpp"
#include "core/exception.hpp"

using namespace beacon;
using namespace beacon::config;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() /
                   ("beacon_config_test_" +
                    std::to_string(::testing::UnitTest::GetInstance()
                                       ->random_seed()));
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override { std::filesystem::remove_all(tempDir_); }

    auto writeFile(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = tempDir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path tempDir_;
};

TEST_F(EngineConfigTest, DefaultsAreValid) {
    EngineConfig cfg;
    EXPECT_TRUE(cfg.validate().empty());
    EXPECT_EQ(cfg.coldStart.threshold, 3u);
    EXPECT_EQ(cfg.defaultK, 10);
    EXPECT_TRUE(cfg.rejectUnknownActions);
    EXPECT_EQ(cfg.store.type, "memory");
    EXPECT_DOUBLE_EQ(cfg.coldStart.brandWeight, 0.1);
    EXPECT_DOUBLE_EQ(cfg.coldStart.priceBandWeight, 0.05);
    EXPECT_EQ(cfg.dedup.pruneEvery, 1000u);
}

TEST_F(EngineConfigTest, AbsentKeysKeepDefaults) {
    auto cfg = EngineConfig::fromJson(
        {{"coldStart", {{"threshold", 5}}}, {"maxK", 20}});
    EXPECT_EQ(cfg.coldStart.threshold, 5u);
    EXPECT_DOUBLE_EQ(cfg.coldStart.popularityWeight, 0.6);
    EXPECT_EQ(cfg.maxK, 20);
    EXPECT_EQ(cfg.defaultK, 10);
}

TEST_F(EngineConfigTest, SerializationPreservesValues) {
    EngineConfig cfg;
    cfg.bandit.explorationCoefficient = 0.5;
    cfg.store = {"sqlite", "/tmp/arms.db"};
    cfg.rewards.purchase = 7.0;

    auto restored = EngineConfig::fromJson(cfg.toJson());
    EXPECT_DOUBLE_EQ(restored.bandit.explorationCoefficient, 0.5);
    EXPECT_EQ(restored.store.type, "sqlite");
    EXPECT_EQ(restored.store.path, "/tmp/arms.db");
    EXPECT_DOUBLE_EQ(restored.rewards.purchase, 7.0);
}

TEST_F(EngineConfigTest, PreferenceWeightsAndPruningAreValidated) {
    auto cfg = EngineConfig::fromJson(
        {{"coldStart", {{"brandWeight", 0.3}, {"priceBandWeight", 0.0}}},
         {"dedup", {{"pruneEvery", 50}}}});
    EXPECT_DOUBLE_EQ(cfg.coldStart.brandWeight, 0.3);
    EXPECT_DOUBLE_EQ(cfg.coldStart.priceBandWeight, 0.0);
    EXPECT_EQ(cfg.dedup.pruneEvery, 50u);
    EXPECT_TRUE(cfg.validate().empty());

    cfg.coldStart.brandWeight = -0.1;
    cfg.dedup.pruneEvery = 0;
    EXPECT_EQ(cfg.validate().size(), 2u);
}

TEST_F(EngineConfigTest, ValidateReportsEveryProblem) {
    EngineConfig cfg;
    cfg.defaultK = 0;
    cfg.affinityAlpha = 1.5;
    cfg.store.type = "redis";
    cfg.bandit.explorationCoefficient = -1.0;

    auto errors = cfg.validate();
    EXPECT_EQ(errors.size(), 4u);
}

TEST_F(EngineConfigTest, LoadReadsFile) {
    auto path = writeFile("engine.json", R"({
        "bandit": {"explorationCoefficient": 1.0},
        "catalog": {"stalenessToleranceSeconds": 60},
        "rejectUnknownActions": false
    })");

    auto cfg = loadEngineConfig(path);
    EXPECT_DOUBLE_EQ(cfg.bandit.explorationCoefficient, 1.0);
    EXPECT_EQ(cfg.catalog.stalenessTolerance, std::chrono::seconds(60));
    EXPECT_FALSE(cfg.rejectUnknownActions);
}

TEST_F(EngineConfigTest, LoadRejectsMissingMalformedAndInvalidFiles) {
    EXPECT_THROW(loadEngineConfig(tempDir_ / "absent.json"), ConfigError);
    EXPECT_THROW(loadEngineConfig(writeFile("broken.json", "{ not json")),
                 ConfigError);
    EXPECT_THROW(loadEngineConfig(writeFile("array.json", "[1, 2]")),
                 ConfigError);
    EXPECT_THROW(loadEngineConfig(writeFile("invalid.json", R"({"maxK": 0})")),
                 ConfigError);
    EXPECT_THROW(
        loadEngineConfig(writeFile("typed.json", R"({"maxK": "lots"})")),
        ConfigError);
}
