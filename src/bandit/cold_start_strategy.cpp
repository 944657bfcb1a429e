// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "cold_start_strategy.hpp"

#include <algorithm>
#include <cmath>

#include "ranking.hpp"

namespace beacon::bandit {

namespace {

/**
 * @brief djb2 string hash
 */
uint64_t hashString(const std::string& str) {
    uint64_t hash = 5381;
    for (unsigned char c : str) {
        hash = ((hash << 5) + hash) + c;  // hash * 33 + c
    }
    return hash;
}

constexpr uint64_t kJitterResolution = 1000000;
constexpr double kSecondsPerDay = 86400.0;

}  // namespace

ColdStartStrategy::ColdStartStrategy(config::ColdStartConfig config)
    : config_(std::move(config)) {}

auto ColdStartStrategy::recency(const model::Product& product,
                                model::Timestamp now) const -> double {
    if (!product.listedAt) {
        return 0.0;
    }
    auto ageSeconds =
        std::chrono::duration<double>(now - *product.listedAt).count();
    double ageDays = std::max(0.0, ageSeconds / kSecondsPerDay);
    return std::pow(0.5, ageDays / config_.recencyHalfLifeDays);
}

auto ColdStartStrategy::jitter(const std::string& userId,
                               const std::string& productId,
                               model::Timestamp now) const -> double {
    if (config_.jitterScale <= 0.0) {
        return 0.0;
    }
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                       now.time_since_epoch())
                       .count();
    auto bucket = seconds / std::max<int64_t>(config_.jitterBucketSeconds, 1);

    auto hash = hashString(userId + '\x1f' + productId + '\x1f' +
                           std::to_string(bucket));
    double unit = static_cast<double>(hash % kJitterResolution) /
                  static_cast<double>(kJitterResolution);
    return unit * config_.jitterScale;
}

auto ColdStartStrategy::score(const model::Product& product,
                              int64_t maxPopularity,
                              const model::UserProfile& profile,
                              model::Timestamp now) const -> double {
    double popularity =
        maxPopularity > 0 ? static_cast<double>(std::max<int64_t>(
                                product.popularity, 0)) /
                                static_cast<double>(maxPopularity)
                          : 0.0;
    double category = profile.affinityFor(product.category).value_or(0.0);
    double brand = product.brand.empty()
                       ? 0.0
                       : profile.brandAffinityFor(product.brand).value_or(0.0);
    double priceBand =
        profile.priceBandAffinityFor(product.priceBand()).value_or(0.0);

    return config_.popularityWeight * popularity +
           config_.recencyWeight * recency(product, now) +
           config_.affinityWeight * category + config_.brandWeight * brand +
           config_.priceBandWeight * priceBand +
           jitter(profile.userId, product.id, now);
}

auto ColdStartStrategy::select(const std::vector<const model::Product*>& pool,
                               const model::UserProfile& profile, size_t k,
                               model::Timestamp now) const
    -> std::vector<model::RecommendedItem> {
    int64_t maxPopularity = 0;
    for (const auto* product : pool) {
        maxPopularity = std::max(maxPopularity, product->popularity);
    }

    std::vector<ScoredCandidate> scored;
    scored.reserve(pool.size());
    for (const auto* product : pool) {
        scored.push_back({product, score(*product, maxPopularity, profile, now)});
    }
    return takeTopK(std::move(scored), k);
}

}  // namespace beacon::bandit
