// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_MODEL_USER_PROFILE_HPP
#define BEACON_MODEL_USER_PROFILE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "atom/type/json.hpp"

#include "product.hpp"
#include "timestamp.hpp"

namespace beacon::model {

/**
 * @brief Cold-start state of a user
 *
 * New -> Warm is one-directional and driven only by the interaction count.
 */
enum class ColdStartState { New, Warm };

[[nodiscard]] inline auto coldStartStateToString(ColdStartState state)
    -> std::string {
    return state == ColdStartState::Warm ? "warm" : "new";
}

struct UserProfile {
    std::string userId;
    uint64_t totalInteractions = 0;
    ColdStartState state = ColdStartState::New;
    std::unordered_map<std::string, double> categoryAffinity;  ///< EMA
    std::unordered_map<std::string, double> brandAffinity;     ///< EMA
    std::unordered_map<std::string, double> priceBandAffinity; ///< EMA
    double cumulativeReward = 0.0;
    Timestamp firstSeen{};
    std::optional<Timestamp> lastInteraction;

    /**
     * @brief Affinity for a category, if the user ever touched it
     * @param category Category name (matched case-insensitively)
     */
    [[nodiscard]] auto affinityFor(const std::string& category) const
        -> std::optional<double>;

    [[nodiscard]] auto brandAffinityFor(const std::string& brand) const
        -> std::optional<double>;

    [[nodiscard]] auto priceBandAffinityFor(PriceBand band) const
        -> std::optional<double>;

    /**
     * @brief Categories with the highest affinity first
     */
    [[nodiscard]] auto topCategories(size_t limit) const
        -> std::vector<std::pair<std::string, double>>;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace beacon::model

#endif  // BEACON_MODEL_USER_PROFILE_HPP
