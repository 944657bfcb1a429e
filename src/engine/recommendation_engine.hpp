// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_ENGINE_RECOMMENDATION_ENGINE_HPP
#define BEACON_ENGINE_RECOMMENDATION_ENGINE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "atom/type/json.hpp"

#include "catalog/catalog_cache.hpp"
#include "catalog/catalog_source.hpp"
#include "config/engine_config.hpp"
#include "ingest/history_source.hpp"
#include "ingest/reward_ingestor.hpp"
#include "model/interaction.hpp"
#include "model/product.hpp"
#include "model/recommendation.hpp"
#include "profile/user_profile_store.hpp"
#include "store/arm_stats_store.hpp"

namespace beacon::engine {

/**
 * @brief Collaborators injected into the engine; all optional
 */
struct EngineDependencies {
    /// Built from the store configuration when null
    std::unique_ptr<store::IArmStatsStore> armStore;
    /// Consulted for users the engine has not seen yet
    std::shared_ptr<ingest::IInteractionHistorySource> historySource;
    /// Used by refreshCatalog() and the background sync worker
    std::shared_ptr<catalog::ICatalogSource> catalogSource;
    /// Time source, system clock when empty
    std::function<model::Timestamp()> clock;
};

/**
 * @brief Recommendation orchestrator
 *
 * Owns the catalog cache, the arm statistics store and the user profiles,
 * and exposes the read path (recommend) and the write path (ingest). The
 * read path never modifies arm statistics; the only state it creates is
 * the profile of a user bootstrapped from the history source.
 *
 * @par Usage Example:
 * @code
 * RecommendationEngine engine(config::EngineConfig{});
 * engine.syncCatalog(products);
 * engine.registerUser("u1");
 * auto result = engine.recommend("u1", std::nullopt, 5);
 * @endcode
 */
class RecommendationEngine {
public:
    explicit RecommendationEngine(config::EngineConfig config,
                                  EngineDependencies deps = {});
    ~RecommendationEngine();

    RecommendationEngine(const RecommendationEngine&) = delete;
    RecommendationEngine& operator=(const RecommendationEngine&) = delete;

    // Recommendations

    /**
     * @brief Ranked products for a user
     *
     * @param k Result size, engine default when absent
     * @throws ValidationError for an empty user id or k outside [1, maxK]
     * @throws UserNotFoundError if neither the engine nor the history
     *         source knows the user
     * @throws CatalogUnavailableError if no catalog was ever loaded
     * @throws NoCandidatesError on an empty pool with failOnEmptyPool
     */
    [[nodiscard]] auto recommend(
        const std::string& userId,
        const std::optional<std::string>& category = std::nullopt,
        std::optional<int> k = std::nullopt) -> model::RecommendationResult;

    /**
     * @brief Same as above, also leaving out the query's excluded ids
     */
    [[nodiscard]] auto recommend(const model::RecommendationQuery& query)
        -> model::RecommendationResult;

    // Feedback

    /**
     * @throws ValidationError for a malformed event
     */
    auto ingest(const model::InteractionEvent& event) -> ingest::IngestReceipt;

    auto ingestBatch(const std::vector<model::InteractionEvent>& events)
        -> ingest::BatchIngestReport;

    // Catalog

    /**
     * @brief Publish a full product list
     * @return New catalog generation
     */
    auto syncCatalog(std::vector<model::Product> products) -> uint64_t;

    /**
     * @brief Pull the catalog from the configured source now
     * @return False if the source failed; the previous catalog is kept
     * @throws CatalogUnavailableError if no catalog source is configured
     */
    auto refreshCatalog() -> bool;

    /**
     * @brief Start periodic refreshes from the catalog source
     * @throws CatalogUnavailableError if no catalog source is configured
     */
    void startCatalogSync();
    void stopCatalogSync();

    // Users

    /**
     * @return True if the user was not known before
     */
    auto registerUser(const std::string& userId) -> bool;

    /**
     * @brief Replay the user's history from the history source
     *
     * Events already applied are recognised by their ids, so a resync only
     * adds what is missing.
     *
     * @throws UserNotFoundError if neither side knows the user
     */
    auto resyncUser(const std::string& userId) -> ingest::BatchIngestReport;

    /**
     * @brief Profile and arm statistics of a known user
     * @throws UserNotFoundError for an unknown user
     */
    [[nodiscard]] auto userStats(const std::string& userId) const
        -> nlohmann::json;

    [[nodiscard]] auto engineStats() const -> nlohmann::json;

    /**
     * @brief "ok", "degraded" (stale catalog) or "unavailable" (no catalog)
     */
    [[nodiscard]] auto health() const -> nlohmann::json;

    [[nodiscard]] auto servedCount() const noexcept -> uint64_t;

    // Components

    [[nodiscard]] auto config() const noexcept -> const config::EngineConfig&;
    [[nodiscard]] auto catalog() noexcept -> catalog::CatalogCache&;
    [[nodiscard]] auto armStore() noexcept -> store::IArmStatsStore&;
    [[nodiscard]] auto profiles() noexcept -> profile::UserProfileStore&;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace beacon::engine

#endif  // BEACON_ENGINE_RECOMMENDATION_ENGINE_HPP
