// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "ucb_selector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace beacon::bandit {

UcbSelector::UcbSelector(double explorationCoefficient)
    : c_(explorationCoefficient) {}

auto UcbSelector::score(const model::ArmStat* stat, uint64_t totalPulls) const
    -> double {
    if (stat == nullptr || stat->isUntried()) {
        return std::numeric_limits<double>::infinity();
    }
    const double pulls = static_cast<double>(stat->pulls);
    const double bonus =
        std::sqrt(std::log(static_cast<double>(totalPulls) + 1.0) /
                  (pulls + 1.0));
    return stat->meanReward + c_ * bonus;
}

auto UcbSelector::rank(const std::vector<const model::Product*>& pool,
                       const model::UserArmSnapshot& arms) const
    -> std::vector<ScoredCandidate> {
    std::vector<ScoredCandidate> scored;
    scored.reserve(pool.size());
    for (const auto* product : pool) {
        scored.push_back(
            {product, score(arms.find(product->id), arms.totalPulls)});
    }
    std::sort(scored.begin(), scored.end(), ranksBefore);
    return scored;
}

auto UcbSelector::select(const std::vector<const model::Product*>& pool,
                         const model::UserArmSnapshot& arms, size_t k) const
    -> std::vector<model::RecommendedItem> {
    return takeTopK(rank(pool, arms), k);
}

}  // namespace beacon::bandit
