// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_MODEL_RECOMMENDATION_HPP
#define BEACON_MODEL_RECOMMENDATION_HPP

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "atom/type/expected.hpp"
#include "atom/type/json.hpp"

#include "interaction.hpp"
#include "timestamp.hpp"

namespace beacon::model {

/**
 * @brief Policy that produced a recommendation list
 */
enum class Strategy { ColdStart, Bandit };

[[nodiscard]] inline auto strategyToString(Strategy strategy) -> std::string {
    return strategy == Strategy::Bandit ? "bandit" : "cold_start";
}

enum class ResultStatus { Ok, NoCandidates };

[[nodiscard]] inline auto resultStatusToString(ResultStatus status)
    -> std::string {
    return status == ResultStatus::NoCandidates ? "no_candidates" : "ok";
}

struct RecommendedItem {
    std::string productId;
    double score = 0.0;  ///< +inf for arms the user never pulled
    int rank = 0;        ///< 1-based

    [[nodiscard]] auto isUntried() const noexcept -> bool {
        return std::isinf(score) && score > 0.0;
    }
};

/**
 * @brief Ranked output of one recommendation call
 *
 * Never holds duplicate product ids and never more items than requested.
 */
struct RecommendationResult {
    std::string userId;
    std::vector<RecommendedItem> items;
    Strategy strategy = Strategy::ColdStart;
    ResultStatus status = ResultStatus::Ok;
    Timestamp generatedAt{};
    bool stale = false;  ///< Served from a catalog older than the tolerance
    uint64_t catalogGeneration = 0;
    std::chrono::seconds catalogAge{0};

    [[nodiscard]] auto empty() const noexcept -> bool { return items.empty(); }

    [[nodiscard]] auto productIds() const -> std::vector<std::string>;

    /**
     * @brief Serialize for the recommendation endpoint
     *
     * JSON has no infinity, so untried arms are written with a null score
     * and "untried": true.
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Recommendation request
 */
struct RecommendationQuery {
    std::string userId;
    std::optional<std::string> category;
    std::optional<int> k;               ///< Engine default when absent
    std::vector<std::string> exclude;   ///< Product ids to leave out

    static auto fromJson(const nlohmann::json& j)
        -> atom::type::Expected<RecommendationQuery, FieldError>;
};

}  // namespace beacon::model

#endif  // BEACON_MODEL_RECOMMENDATION_HPP
