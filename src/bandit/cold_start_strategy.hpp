// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_BANDIT_COLD_START_STRATEGY_HPP
#define BEACON_BANDIT_COLD_START_STRATEGY_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "config/engine_config.hpp"
#include "model/product.hpp"
#include "model/recommendation.hpp"
#include "model/timestamp.hpp"
#include "model/user_profile.hpp"

namespace beacon::bandit {

/**
 * @brief Popularity, recency and preference blend for users still warming up
 *
 *   score = wp * popularity / maxPopularity
 *         + wr * 0.5 ^ (ageDays / halfLifeDays)
 *         + wa * affinity(category)
 *         + wb * affinity(brand)
 *         + wpb * affinity(price band)
 *         + jitter
 *
 * Affinities the user has no history for count as 0.
 *
 * Jitter lies in [0, jitterScale) and depends only on the user, the product
 * and the current time bucket, so repeated calls within a bucket agree.
 */
class ColdStartStrategy {
public:
    explicit ColdStartStrategy(config::ColdStartConfig config);

    /**
     * @brief Whether the profile is still served by this strategy
     */
    [[nodiscard]] auto isCold(const model::UserProfile& profile) const
        -> bool {
        return profile.state == model::ColdStartState::New;
    }

    [[nodiscard]] auto score(const model::Product& product,
                             int64_t maxPopularity,
                             const model::UserProfile& profile,
                             model::Timestamp now) const -> double;

    [[nodiscard]] auto select(const std::vector<const model::Product*>& pool,
                              const model::UserProfile& profile, size_t k,
                              model::Timestamp now = model::Clock::now()) const
        -> std::vector<model::RecommendedItem>;

    /**
     * @brief 0.5 ^ (age / halfLife); 0 when the listing time is unknown
     */
    [[nodiscard]] auto recency(const model::Product& product,
                               model::Timestamp now) const -> double;

    [[nodiscard]] auto jitter(const std::string& userId,
                              const std::string& productId,
                              model::Timestamp now) const -> double;

    [[nodiscard]] auto config() const noexcept
        -> const config::ColdStartConfig& {
        return config_;
    }

private:
    config::ColdStartConfig config_;
};

}  // namespace beacon::bandit

#endif  // BEACON_BANDIT_COLD_START_STRATEGY_HPP
