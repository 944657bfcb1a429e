// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "engine_config.hpp"

#include <cmath>
#include <fstream>

#include <spdlog/spdlog.h>

#include "core/exception.hpp"

namespace beacon::config {

json EngineConfig::toJson() const {
    return {{"rewards", rewards.toJson()},
            {"rejectUnknownActions", rejectUnknownActions},
            {"maxClockSkewSeconds", maxClockSkew.count()},
            {"affinityAlpha", affinityAlpha},
            {"bandit", bandit.toJson()},
            {"coldStart", coldStart.toJson()},
            {"defaultK", defaultK},
            {"maxK", maxK},
            {"failOnEmptyPool", failOnEmptyPool},
            {"catalog", catalog.toJson()},
            {"dedup", dedup.toJson()},
            {"store", store.toJson()},
            {"logging", logging.toJson()}};
}

EngineConfig EngineConfig::fromJson(const json& j) {
    EngineConfig cfg;
    if (j.contains("rewards")) {
        cfg.rewards = model::RewardTable::fromJson(j["rewards"]);
    }
    cfg.rejectUnknownActions =
        j.value("rejectUnknownActions", cfg.rejectUnknownActions);
    cfg.maxClockSkew = std::chrono::seconds(
        j.value("maxClockSkewSeconds", cfg.maxClockSkew.count()));
    cfg.affinityAlpha = j.value("affinityAlpha", cfg.affinityAlpha);
    if (j.contains("bandit")) {
        cfg.bandit = BanditConfig::fromJson(j["bandit"]);
    }
    if (j.contains("coldStart")) {
        cfg.coldStart = ColdStartConfig::fromJson(j["coldStart"]);
    }
    cfg.defaultK = j.value("defaultK", cfg.defaultK);
    cfg.maxK = j.value("maxK", cfg.maxK);
    cfg.failOnEmptyPool = j.value("failOnEmptyPool", cfg.failOnEmptyPool);
    if (j.contains("catalog")) {
        cfg.catalog = CatalogConfig::fromJson(j["catalog"]);
    }
    if (j.contains("dedup")) {
        cfg.dedup = DedupConfig::fromJson(j["dedup"]);
    }
    if (j.contains("store")) {
        cfg.store = StoreConfig::fromJson(j["store"]);
    }
    if (j.contains("logging")) {
        cfg.logging = LoggingConfig::fromJson(j["logging"]);
    }
    return cfg;
}

auto EngineConfig::validate() const -> std::vector<std::string> {
    std::vector<std::string> errors;

    if (!std::isfinite(bandit.explorationCoefficient) ||
        bandit.explorationCoefficient < 0.0) {
        errors.emplace_back(
            "bandit.explorationCoefficient must be finite and >= 0");
    }
    if (!(affinityAlpha > 0.0 && affinityAlpha <= 1.0)) {
        errors.emplace_back("affinityAlpha must be in (0, 1]");
    }
    if (maxClockSkew.count() < 0) {
        errors.emplace_back("maxClockSkewSeconds must be >= 0");
    }

    if (coldStart.popularityWeight < 0.0 || coldStart.recencyWeight < 0.0 ||
        coldStart.affinityWeight < 0.0 || coldStart.brandWeight < 0.0 ||
        coldStart.priceBandWeight < 0.0) {
        errors.emplace_back("coldStart weights must be non-negative");
    }
    if (coldStart.jitterScale < 0.0) {
        errors.emplace_back("coldStart.jitterScale must be >= 0");
    }
    if (coldStart.jitterBucketSeconds <= 0) {
        errors.emplace_back("coldStart.jitterBucketSeconds must be > 0");
    }
    if (!(coldStart.recencyHalfLifeDays > 0.0)) {
        errors.emplace_back("coldStart.recencyHalfLifeDays must be > 0");
    }

    if (maxK < 1) {
        errors.emplace_back("maxK must be >= 1");
    }
    if (defaultK < 1 || defaultK > maxK) {
        errors.emplace_back("defaultK must be in [1, maxK]");
    }

    if (catalog.refreshInterval.count() <= 0) {
        errors.emplace_back("catalog.refreshIntervalSeconds must be > 0");
    }
    if (catalog.stalenessTolerance.count() <= 0) {
        errors.emplace_back("catalog.stalenessToleranceSeconds must be > 0");
    }

    if (dedup.capacity == 0) {
        errors.emplace_back("dedup.capacity must be > 0");
    }
    if (dedup.ttl.count() <= 0) {
        errors.emplace_back("dedup.ttlSeconds must be > 0");
    }
    if (dedup.pruneEvery == 0) {
        errors.emplace_back("dedup.pruneEvery must be > 0");
    }

    if (store.type != "memory" && store.type != "sqlite") {
        errors.emplace_back("store.type must be \"memory\" or \"sqlite\"");
    }
    if (store.type == "sqlite" && store.path.empty()) {
        errors.emplace_back("store.path is required for the sqlite store");
    }

    if (logging.maxFiles == 0) {
        errors.emplace_back("logging.maxFiles must be > 0");
    }
    return errors;
}

auto loadEngineConfig(const std::filesystem::path& path) -> EngineConfig {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_CONFIG_ERROR("Failed to open config file: " + path.string());
    }

    EngineConfig cfg;
    try {
        json root;
        file >> root;
        if (!root.is_object()) {
            THROW_CONFIG_ERROR("Config root must be a JSON object: " +
                               path.string());
        }
        cfg = EngineConfig::fromJson(root);
    } catch (const json::exception& e) {
        THROW_CONFIG_ERROR("Invalid config " + path.string() + ": " +
                           e.what());
    }

    auto errors = cfg.validate();
    if (!errors.empty()) {
        for (const auto& error : errors) {
            spdlog::error("Config {}: {}", path.string(), error);
        }
        THROW_CONFIG_ERROR("Invalid config " + path.string() + ": " +
                           errors.front());
    }

    spdlog::info("Loaded engine config from {}", path.string());
    return cfg;
}

}  // namespace beacon::config
