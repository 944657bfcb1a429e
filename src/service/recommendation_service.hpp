// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_SERVICE_RECOMMENDATION_SERVICE_HPP
#define BEACON_SERVICE_RECOMMENDATION_SERVICE_HPP

#include <string>

#include "engine/recommendation_engine.hpp"
#include "response.hpp"

namespace beacon::service {

/**
 * @brief JSON request handlers in front of the engine
 *
 * Every handler returns an envelope and never throws; engine exceptions
 * are mapped to error codes:
 *
 * | Exception               | code                  | status |
 * |-------------------------|-----------------------|--------|
 * | ValidationError         | reason, e.g. unknown_action | 400 |
 * | UserNotFoundError       | user_not_found        | 404    |
 * | NoCandidatesError       | no_candidates         | 404    |
 * | CatalogUnavailableError | catalog_unavailable   | 503    |
 * | StoreError              | store_error           | 500    |
 */
class RecommendationService {
public:
    explicit RecommendationService(engine::RecommendationEngine& engine);

    /**
     * @brief {user_id, category?, k?, exclude?} -> ranked recommendations
     */
    auto handleRecommend(const json& request) -> ServiceResponse;

    /**
     * @brief {user_id, product_id, action, event_id, timestamp, context?}
     *        -> {accepted, reward_applied, duplicate}
     */
    auto handleFeedback(const json& request) -> ServiceResponse;

    /**
     * @brief {events: [...]} -> batch ingest report
     *
     * Events that cannot be decoded are reported as rejected alongside the
     * ones that fail validation.
     */
    auto handleFeedbackBatch(const json& request) -> ServiceResponse;

    /**
     * @brief {products: [...]} -> {generation, product_count}
     */
    auto handleCatalogSync(const json& request) -> ServiceResponse;

    auto handleCatalogRefresh() -> ServiceResponse;

    auto handleRegisterUser(const json& request) -> ServiceResponse;
    auto handleUserStats(const std::string& userId) -> ServiceResponse;
    auto handleUserResync(const std::string& userId) -> ServiceResponse;

    auto handleHealth() -> ServiceResponse;
    auto handleSystemStats() -> ServiceResponse;

private:
    template <typename Handler>
    auto guarded(const char* operation, Handler&& handler) -> ServiceResponse;

    engine::RecommendationEngine& engine_;
};

}  // namespace beacon::service

#endif  // BEACON_SERVICE_RECOMMENDATION_SERVICE_HPP
