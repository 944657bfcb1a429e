// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_CONFIG_ENGINE_CONFIG_HPP
#define BEACON_CONFIG_ENGINE_CONFIG_HPP

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "logging_config.hpp"
#include "model/interaction.hpp"

namespace beacon::config {

struct BanditConfig {
    double explorationCoefficient{std::sqrt(2.0)};  ///< UCB constant c

    [[nodiscard]] json toJson() const {
        return {{"explorationCoefficient", explorationCoefficient}};
    }

    [[nodiscard]] static BanditConfig fromJson(const json& j) {
        BanditConfig cfg;
        cfg.explorationCoefficient =
            j.value("explorationCoefficient", cfg.explorationCoefficient);
        return cfg;
    }
};

/**
 * @brief Threshold and weights of the new-user heuristic
 */
struct ColdStartConfig {
    uint64_t threshold{3};  ///< Interactions needed to become warm
    double popularityWeight{0.6};
    double recencyWeight{0.2};
    double affinityWeight{0.2};     ///< Category affinity
    double brandWeight{0.1};        ///< Brand affinity
    double priceBandWeight{0.05};   ///< Price-band affinity
    double jitterScale{0.05};            ///< Jitter lies in [0, jitterScale)
    int64_t jitterBucketSeconds{3600};   ///< Jitter is stable per bucket
    double recencyHalfLifeDays{30.0};

    [[nodiscard]] json toJson() const {
        return {{"threshold", threshold},
                {"popularityWeight", popularityWeight},
                {"recencyWeight", recencyWeight},
                {"affinityWeight", affinityWeight},
                {"brandWeight", brandWeight},
                {"priceBandWeight", priceBandWeight},
                {"jitterScale", jitterScale},
                {"jitterBucketSeconds", jitterBucketSeconds},
                {"recencyHalfLifeDays", recencyHalfLifeDays}};
    }

    [[nodiscard]] static ColdStartConfig fromJson(const json& j) {
        ColdStartConfig cfg;
        cfg.threshold = j.value("threshold", cfg.threshold);
        cfg.popularityWeight = j.value("popularityWeight", cfg.popularityWeight);
        cfg.recencyWeight = j.value("recencyWeight", cfg.recencyWeight);
        cfg.affinityWeight = j.value("affinityWeight", cfg.affinityWeight);
        cfg.brandWeight = j.value("brandWeight", cfg.brandWeight);
        cfg.priceBandWeight = j.value("priceBandWeight", cfg.priceBandWeight);
        cfg.jitterScale = j.value("jitterScale", cfg.jitterScale);
        cfg.jitterBucketSeconds =
            j.value("jitterBucketSeconds", cfg.jitterBucketSeconds);
        cfg.recencyHalfLifeDays =
            j.value("recencyHalfLifeDays", cfg.recencyHalfLifeDays);
        return cfg;
    }
};

struct CatalogConfig {
    std::chrono::seconds refreshInterval{300};
    std::chrono::seconds stalenessTolerance{900};

    [[nodiscard]] json toJson() const {
        return {{"refreshIntervalSeconds", refreshInterval.count()},
                {"stalenessToleranceSeconds", stalenessTolerance.count()}};
    }

    [[nodiscard]] static CatalogConfig fromJson(const json& j) {
        CatalogConfig cfg;
        cfg.refreshInterval = std::chrono::seconds(
            j.value("refreshIntervalSeconds", cfg.refreshInterval.count()));
        cfg.stalenessTolerance = std::chrono::seconds(j.value(
            "stalenessToleranceSeconds", cfg.stalenessTolerance.count()));
        return cfg;
    }
};

/**
 * @brief Bounds of the recently-seen event id set
 *
 * The sqlite store also drops durable event ids older than the TTL once
 * every pruneEvery applied updates.
 */
struct DedupConfig {
    size_t capacity{100000};
    std::chrono::seconds ttl{86400};
    uint64_t pruneEvery{1000};

    [[nodiscard]] json toJson() const {
        return {{"capacity", capacity},
                {"ttlSeconds", ttl.count()},
                {"pruneEvery", pruneEvery}};
    }

    [[nodiscard]] static DedupConfig fromJson(const json& j) {
        DedupConfig cfg;
        cfg.capacity = j.value("capacity", cfg.capacity);
        cfg.ttl = std::chrono::seconds(j.value("ttlSeconds", cfg.ttl.count()));
        cfg.pruneEvery = j.value("pruneEvery", cfg.pruneEvery);
        return cfg;
    }
};

struct StoreConfig {
    std::string type{"memory"};  ///< "memory" or "sqlite"
    std::string path{"beacon.db"};

    [[nodiscard]] json toJson() const {
        return {{"type", type}, {"path", path}};
    }

    [[nodiscard]] static StoreConfig fromJson(const json& j) {
        StoreConfig cfg;
        cfg.type = j.value("type", cfg.type);
        cfg.path = j.value("path", cfg.path);
        return cfg;
    }
};

/**
 * @brief Complete engine configuration
 *
 * Every key is optional in the JSON file; absent keys keep the defaults
 * below.
 */
struct EngineConfig {
    model::RewardTable rewards;
    bool rejectUnknownActions{true};
    std::chrono::seconds maxClockSkew{300};  ///< Tolerated future timestamps
    double affinityAlpha{0.2};               ///< Category affinity EMA rate

    BanditConfig bandit;
    ColdStartConfig coldStart;

    int defaultK{10};
    int maxK{100};
    bool failOnEmptyPool{false};

    CatalogConfig catalog;
    DedupConfig dedup;
    StoreConfig store;
    LoggingConfig logging;

    [[nodiscard]] json toJson() const;

    /**
     * @brief Deserialize, keeping defaults for absent keys
     * @throws nlohmann::json::exception when a present key has the wrong type
     */
    [[nodiscard]] static EngineConfig fromJson(const json& j);

    /**
     * @brief Check value ranges
     * @return One message per problem; empty when the config is usable
     */
    [[nodiscard]] auto validate() const -> std::vector<std::string>;
};

/**
 * @brief Load and validate a JSON configuration file
 * @throws ConfigError if the file is missing, unparsable or invalid
 */
[[nodiscard]] auto loadEngineConfig(const std::filesystem::path& path)
    -> EngineConfig;

}  // namespace beacon::config

#endif  // BEACON_CONFIG_ENGINE_CONFIG_HPP
