// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_MODEL_ARM_STAT_HPP
#define BEACON_MODEL_ARM_STAT_HPP

#include <cstdint>
#include <string>
#include <unordered_map>

#include "atom/type/json.hpp"

#include "timestamp.hpp"

namespace beacon::model {

/**
 * @brief Pull/reward counters of one (user, product) arm
 *
 * The mean is maintained with Welford's streaming update rather than
 * recomputed from the running sum, so it stays accurate for arms with very
 * large pull counts.
 */
struct ArmStat {
    std::string userId;
    std::string productId;
    uint64_t pulls = 0;
    double cumulativeReward = 0.0;
    double meanReward = 0.0;
    Timestamp lastUpdated{};

    [[nodiscard]] auto isUntried() const noexcept -> bool {
        return pulls == 0;
    }

    void applyReward(double reward, Timestamp at) noexcept {
        ++pulls;
        cumulativeReward += reward;
        meanReward += (reward - meanReward) / static_cast<double>(pulls);
        lastUpdated = at;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"user_id", userId},
                {"product_id", productId},
                {"pulls", pulls},
                {"cumulative_reward", cumulativeReward},
                {"mean_reward", meanReward}};
    }
};

/**
 * @brief Point-in-time copy of every arm of one user
 */
struct UserArmSnapshot {
    std::string userId;
    std::unordered_map<std::string, ArmStat> arms;  ///< Keyed by product id
    uint64_t totalPulls = 0;

    [[nodiscard]] auto find(const std::string& productId) const
        -> const ArmStat* {
        auto it = arms.find(productId);
        return it == arms.end() ? nullptr : &it->second;
    }
};

}  // namespace beacon::model

#endif  // BEACON_MODEL_ARM_STAT_HPP
