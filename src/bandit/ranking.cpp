// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "ranking.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>

namespace beacon::bandit {

auto ranksBefore(const ScoredCandidate& a, const ScoredCandidate& b) -> bool {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    if (a.product->popularity != b.product->popularity) {
        return a.product->popularity > b.product->popularity;
    }
    return a.product->id < b.product->id;
}

auto takeTopK(std::vector<ScoredCandidate> candidates, size_t k)
    -> std::vector<model::RecommendedItem> {
    std::sort(candidates.begin(), candidates.end(), ranksBefore);

    std::vector<model::RecommendedItem> items;
    items.reserve(std::min(k, candidates.size()));
    std::unordered_set<std::string> seen;
    for (const auto& candidate : candidates) {
        if (items.size() >= k) {
            break;
        }
        if (!seen.insert(candidate.product->id).second) {
            continue;
        }
        items.push_back({candidate.product->id, candidate.score,
                         static_cast<int>(items.size()) + 1});
    }
    return items;
}

}  // namespace beacon::bandit
