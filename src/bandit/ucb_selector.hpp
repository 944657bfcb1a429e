// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_BANDIT_UCB_SELECTOR_HPP
#define BEACON_BANDIT_UCB_SELECTOR_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "model/arm_stat.hpp"
#include "model/product.hpp"
#include "model/recommendation.hpp"
#include "ranking.hpp"

namespace beacon::bandit {

/**
 * @brief UCB1 ranking over a user's arms
 *
 *   score = mean + c * sqrt(ln(totalPulls + 1) / (pulls + 1))
 *
 * An arm never pulled scores +inf.
 */
class UcbSelector {
public:
    explicit UcbSelector(double explorationCoefficient);

    [[nodiscard]] auto score(const model::ArmStat* stat,
                             uint64_t totalPulls) const -> double;

    /**
     * @brief Score the whole pool, best first
     */
    [[nodiscard]] auto rank(const std::vector<const model::Product*>& pool,
                            const model::UserArmSnapshot& arms) const
        -> std::vector<ScoredCandidate>;

    /**
     * @brief Top-k products of the pool; fewer when the pool is smaller
     */
    [[nodiscard]] auto select(const std::vector<const model::Product*>& pool,
                              const model::UserArmSnapshot& arms,
                              size_t k) const
        -> std::vector<model::RecommendedItem>;

    [[nodiscard]] auto explorationCoefficient() const noexcept -> double {
        return c_;
    }

private:
    double c_;
};

}  // namespace beacon::bandit

#endif  // BEACON_BANDIT_UCB_SELECTOR_HPP
