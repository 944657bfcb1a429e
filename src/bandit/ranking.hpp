// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_BANDIT_RANKING_HPP
#define BEACON_BANDIT_RANKING_HPP

#include <cstddef>
#include <vector>

#include "model/product.hpp"
#include "model/recommendation.hpp"

namespace beacon::bandit {

struct ScoredCandidate {
    const model::Product* product = nullptr;
    double score = 0.0;
};

/**
 * @brief Order by score desc, then popularity desc, then id asc
 *
 * Two +inf scores compare equal, so untried arms fall through to the
 * popularity and id tie-breaks.
 */
[[nodiscard]] auto ranksBefore(const ScoredCandidate& a,
                               const ScoredCandidate& b) -> bool;

/**
 * @brief Sort candidates and keep the first k distinct product ids
 */
[[nodiscard]] auto takeTopK(std::vector<ScoredCandidate> candidates, size_t k)
    -> std::vector<model::RecommendedItem>;

}  // namespace beacon::bandit

#endif  // BEACON_BANDIT_RANKING_HPP
