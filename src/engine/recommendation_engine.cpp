// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "recommendation_engine.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "bandit/cold_start_strategy.hpp"
#include "bandit/ucb_selector.hpp"
#include "catalog/catalog_sync.hpp"
#include "core/exception.hpp"

namespace beacon::engine {

namespace {
auto systemClock() -> std::function<model::Timestamp()> {
    return [] { return model::Clock::now(); };
}
}  // namespace

// --------------------- RecommendationEngine::Impl ---------------------

class RecommendationEngine::Impl {
public:
    Impl(config::EngineConfig config, EngineDependencies deps)
        : config_(std::move(config)),
          clock_(deps.clock ? std::move(deps.clock) : systemClock()),
          armStore_(deps.armStore
                        ? std::move(deps.armStore)
                        : store::createArmStatsStore(config_.store,
                                                     config_.dedup, clock_)),
          profiles_(config_.coldStart.threshold, config_.affinityAlpha),
          ingestor_(*armStore_, profiles_, catalog_,
                    ingest::IngestPolicy{config_.rewards,
                                         config_.rejectUnknownActions,
                                         config_.maxClockSkew}),
          ucb_(config_.bandit.explorationCoefficient),
          coldStart_(config_.coldStart),
          historySource_(std::move(deps.historySource)),
          catalogSource_(std::move(deps.catalogSource)),
          startedAt_(clock_()) {
        spdlog::info(
            "RecommendationEngine initialized: store={}, threshold={}, c={}",
            armStore_->backendName(), config_.coldStart.threshold,
            config_.bandit.explorationCoefficient);
    }

    ~Impl() { stopCatalogSync(); }

    auto now() const -> model::Timestamp { return clock_(); }

    auto recommend(const model::RecommendationQuery& query)
        -> model::RecommendationResult {
        if (query.userId.empty()) {
            THROW_VALIDATION_ERROR(ValidationReason::MissingField,
                                   "Missing required field: user_id");
        }
        const int k = query.k.value_or(config_.defaultK);
        if (k < 1 || k > config_.maxK) {
            THROW_VALIDATION_ERROR(ValidationReason::InvalidValue,
                                   "k must be between 1 and " +
                                       std::to_string(config_.maxK) +
                                       ", got " + std::to_string(k));
        }

        const auto current = now();
        ensureHistory(query.userId, current);
        auto found = profiles_.find(query.userId);
        if (!found) {
            THROW_USER_NOT_FOUND("Unknown user: " + query.userId);
        }
        const auto& profile = *found;

        auto pool = catalog_.getCandidates(query.category);
        if (!query.exclude.empty()) {
            std::unordered_set<std::string> excluded(query.exclude.begin(),
                                                     query.exclude.end());
            std::erase_if(pool.products, [&](const model::Product* product) {
                return excluded.contains(product->id);
            });
        }

        model::RecommendationResult result;
        result.userId = query.userId;
        result.generatedAt = current;
        result.catalogGeneration = pool.snapshot->generation;
        result.catalogAge = std::max(
            std::chrono::seconds(0),
            std::chrono::duration_cast<std::chrono::seconds>(
                current - pool.snapshot->loadedAt));
        result.stale = result.catalogAge > config_.catalog.stalenessTolerance;
        if (result.stale) {
            spdlog::warn(
                "Serving user {} from stale catalog generation {} ({}s old)",
                query.userId, result.catalogGeneration,
                result.catalogAge.count());
        }

        const bool cold = coldStart_.isCold(profile);
        result.strategy =
            cold ? model::Strategy::ColdStart : model::Strategy::Bandit;

        if (pool.empty()) {
            if (config_.failOnEmptyPool) {
                THROW_NO_CANDIDATES("No eligible products for user " +
                                    query.userId);
            }
            result.status = model::ResultStatus::NoCandidates;
            spdlog::info("No candidates for user {} (category: {})",
                         query.userId, query.category.value_or("*"));
            served_.fetch_add(1);
            return result;
        }

        if (cold) {
            result.items = coldStart_.select(pool.products, profile,
                                             static_cast<size_t>(k), current);
        } else {
            auto arms = armStore_->snapshot(query.userId);
            result.items =
                ucb_.select(pool.products, arms, static_cast<size_t>(k));
        }

        served_.fetch_add(1);
        spdlog::debug("Recommended {} of {} products to {} via {}",
                      result.items.size(), pool.size(), query.userId,
                      model::strategyToString(result.strategy));
        return result;
    }

    auto ingest(const model::InteractionEvent& event) -> ingest::IngestReceipt {
        const auto current = now();
        ensureHistory(event.userId, current);
        return ingestor_.ingest(event, current);
    }

    auto ingestBatch(const std::vector<model::InteractionEvent>& events)
        -> ingest::BatchIngestReport {
        const auto current = now();
        std::unordered_set<std::string> users;
        for (const auto& event : events) {
            if (users.insert(event.userId).second) {
                ensureHistory(event.userId, current);
            }
        }
        return ingestor_.ingestBatch(events, current);
    }

    auto syncCatalog(std::vector<model::Product> products) -> uint64_t {
        return catalog_.refresh(std::move(products), now());
    }

    auto refreshCatalog() -> bool {
        return catalog_.refreshFrom(requireCatalogSource(), now());
    }

    void startCatalogSync() {
        std::lock_guard lock(syncMutex_);
        if (!syncWorker_) {
            requireCatalogSource();
            syncWorker_ = std::make_unique<catalog::CatalogSyncWorker>(
                catalog_, catalogSource_, config_.catalog.refreshInterval,
                clock_);
        }
        syncWorker_->start();
    }

    void stopCatalogSync() {
        std::lock_guard lock(syncMutex_);
        if (syncWorker_) {
            syncWorker_->stop();
        }
    }

    auto registerUser(const std::string& userId) -> bool {
        if (userId.empty()) {
            THROW_VALIDATION_ERROR(ValidationReason::MissingField,
                                   "Missing required field: user_id");
        }
        const auto current = now();
        ensureHistory(userId, current);
        bool created = profiles_.registerUser(userId, current);
        if (created) {
            spdlog::info("Registered user {}", userId);
        }
        return created;
    }

    auto resyncUser(const std::string& userId) -> ingest::BatchIngestReport {
        const bool known = profiles_.contains(userId);
        const bool upstream =
            historySource_ && historySource_->userExists(userId);
        if (!known && !upstream) {
            THROW_USER_NOT_FOUND("Unknown user: " + userId);
        }
        if (!upstream) {
            spdlog::info("No upstream history for user {}", userId);
            return {};
        }
        std::lock_guard lock(bootstrapMutex_);
        auto report = bootstrapLocked(userId, now());
        markHistoryLoaded(userId);
        return report;
    }

    auto userStats(const std::string& userId) const -> nlohmann::json {
        auto profile = profiles_.find(userId);
        if (!profile) {
            THROW_USER_NOT_FOUND("Unknown user: " + userId);
        }

        auto arms = armStore_->snapshot(userId);
        std::vector<model::ArmStat> ordered;
        ordered.reserve(arms.arms.size());
        for (const auto& [productId, stat] : arms.arms) {
            ordered.push_back(stat);
        }
        std::sort(ordered.begin(), ordered.end(),
                  [](const model::ArmStat& a, const model::ArmStat& b) {
                      if (a.pulls != b.pulls) {
                          return a.pulls > b.pulls;
                      }
                      return a.productId < b.productId;
                  });

        nlohmann::json armList = nlohmann::json::array();
        for (const auto& stat : ordered) {
            armList.push_back(stat.toJson());
        }
        nlohmann::json top = nlohmann::json::array();
        for (const auto& [category, weight] : profile->topCategories(5)) {
            top.push_back({{"category", category}, {"affinity", weight}});
        }

        auto j = profile->toJson();
        j["strategy"] = model::strategyToString(
            coldStart_.isCold(*profile) ? model::Strategy::ColdStart
                                        : model::Strategy::Bandit);
        j["total_pulls"] = arms.totalPulls;
        j["arms"] = std::move(armList);
        j["top_categories"] = std::move(top);
        return j;
    }

    auto engineStats() const -> nlohmann::json {
        const auto current = now();
        bool syncing = false;
        {
            std::lock_guard lock(syncMutex_);
            syncing = syncWorker_ && syncWorker_->isRunning();
        }
        return {{"catalog", catalog_.stats(current)},
                {"arms",
                 {{"backend", armStore_->backendName()},
                  {"arm_count", armStore_->armCount()},
                  {"user_count", armStore_->userCount()}}},
                {"profiles", profiles_.stats()},
                {"ingest", ingestor_.stats()},
                {"recommendations_served", served_.load()},
                {"catalog_sync_running", syncing},
                {"uptime_seconds",
                 std::chrono::duration_cast<std::chrono::seconds>(current -
                                                                  startedAt_)
                     .count()}};
    }

    auto health() const -> nlohmann::json {
        const auto current = now();
        const bool loaded = catalog_.hasSnapshot();
        const bool stale =
            catalog_.isStale(config_.catalog.stalenessTolerance, current);

        nlohmann::json j = {
            {"status", !loaded ? "unavailable" : (stale ? "degraded" : "ok")},
            {"catalog_loaded", loaded},
            {"catalog_stale", stale},
            {"catalog_generation", catalog_.generation()},
            {"store_backend", armStore_->backendName()}};
        auto age = catalog_.age(current);
        j["catalog_age_seconds"] =
            age ? nlohmann::json(age->count()) : nlohmann::json(nullptr);
        auto error = catalog_.lastError();
        j["last_catalog_error"] =
            error ? nlohmann::json(*error) : nlohmann::json(nullptr);
        return j;
    }

    config::EngineConfig config_;
    std::function<model::Timestamp()> clock_;
    catalog::CatalogCache catalog_;
    std::unique_ptr<store::IArmStatsStore> armStore_;
    profile::UserProfileStore profiles_;
    ingest::RewardIngestor ingestor_;
    bandit::UcbSelector ucb_;
    bandit::ColdStartStrategy coldStart_;
    std::shared_ptr<ingest::IInteractionHistorySource> historySource_;
    std::shared_ptr<catalog::ICatalogSource> catalogSource_;

    // Users whose upstream history has been replayed into the engine
    std::mutex bootstrapMutex_;
    mutable std::shared_mutex historyMutex_;
    std::unordered_set<std::string> historyLoaded_;

    mutable std::mutex syncMutex_;
    std::unique_ptr<catalog::CatalogSyncWorker> syncWorker_;

    std::atomic<uint64_t> served_{0};
    model::Timestamp startedAt_;

private:
    auto requireCatalogSource() -> catalog::ICatalogSource& {
        if (!catalogSource_) {
            THROW_CATALOG_UNAVAILABLE("No catalog source configured");
        }
        return *catalogSource_;
    }

    auto historyLoaded(const std::string& userId) const -> bool {
        std::shared_lock lock(historyMutex_);
        return historyLoaded_.contains(userId);
    }

    void markHistoryLoaded(const std::string& userId) {
        std::unique_lock lock(historyMutex_);
        historyLoaded_.insert(userId);
    }

    /**
     * @brief Replay a user's upstream history the first time any call
     *        touches them
     *
     * The user is only marked once the replay succeeded, so a store failure
     * midway leaves them to be retried by the next call. Replayed events
     * keep their ids, so the retry does not double count.
     */
    void ensureHistory(const std::string& userId, model::Timestamp current) {
        if (!historySource_ || userId.empty() || historyLoaded(userId)) {
            return;
        }
        std::lock_guard lock(bootstrapMutex_);
        if (historyLoaded(userId)) {
            return;
        }
        if (historySource_->userExists(userId)) {
            bootstrapLocked(userId, current);
        }
        markHistoryLoaded(userId);
    }

    /**
     * @brief Apply a user's history, then publish their profile
     */
    auto bootstrapLocked(const std::string& userId, model::Timestamp current)
        -> ingest::BatchIngestReport {
        auto history = historySource_->loadHistory(userId);
        auto report = ingestor_.ingestBatch(history, current);
        profiles_.registerUser(userId, current);
        spdlog::info(
            "Bootstrapped user {} from history: {} events, {} applied",
            userId, report.total, report.accepted);
        return report;
    }
};

// --------------------- RecommendationEngine ---------------------

RecommendationEngine::RecommendationEngine(config::EngineConfig config,
                                           EngineDependencies deps)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::move(deps))) {}

RecommendationEngine::~RecommendationEngine() = default;

auto RecommendationEngine::recommend(const std::string& userId,
                                     const std::optional<std::string>& category,
                                     std::optional<int> k)
    -> model::RecommendationResult {
    model::RecommendationQuery query;
    query.userId = userId;
    query.category = category;
    query.k = k;
    return pImpl_->recommend(query);
}

auto RecommendationEngine::recommend(const model::RecommendationQuery& query)
    -> model::RecommendationResult {
    return pImpl_->recommend(query);
}

auto RecommendationEngine::ingest(const model::InteractionEvent& event)
    -> ingest::IngestReceipt {
    return pImpl_->ingest(event);
}

auto RecommendationEngine::ingestBatch(
    const std::vector<model::InteractionEvent>& events)
    -> ingest::BatchIngestReport {
    return pImpl_->ingestBatch(events);
}

auto RecommendationEngine::syncCatalog(std::vector<model::Product> products)
    -> uint64_t {
    return pImpl_->syncCatalog(std::move(products));
}

auto RecommendationEngine::refreshCatalog() -> bool {
    return pImpl_->refreshCatalog();
}

void RecommendationEngine::startCatalogSync() { pImpl_->startCatalogSync(); }

void RecommendationEngine::stopCatalogSync() { pImpl_->stopCatalogSync(); }

auto RecommendationEngine::registerUser(const std::string& userId) -> bool {
    return pImpl_->registerUser(userId);
}

auto RecommendationEngine::resyncUser(const std::string& userId)
    -> ingest::BatchIngestReport {
    return pImpl_->resyncUser(userId);
}

auto RecommendationEngine::userStats(const std::string& userId) const
    -> nlohmann::json {
    return pImpl_->userStats(userId);
}

auto RecommendationEngine::engineStats() const -> nlohmann::json {
    return pImpl_->engineStats();
}

auto RecommendationEngine::health() const -> nlohmann::json {
    return pImpl_->health();
}

auto RecommendationEngine::servedCount() const noexcept -> uint64_t {
    return pImpl_->served_.load();
}

auto RecommendationEngine::config() const noexcept
    -> const config::EngineConfig& {
    return pImpl_->config_;
}

auto RecommendationEngine::catalog() noexcept -> catalog::CatalogCache& {
    return pImpl_->catalog_;
}

auto RecommendationEngine::armStore() noexcept -> store::IArmStatsStore& {
    return *pImpl_->armStore_;
}

auto RecommendationEngine::profiles() noexcept -> profile::UserProfileStore& {
    return pImpl_->profiles_;
}

}  // namespace beacon::engine
