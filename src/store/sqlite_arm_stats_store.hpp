// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_STORE_SQLITE_ARM_STATS_STORE_HPP
#define BEACON_STORE_SQLITE_ARM_STATS_STORE_HPP

#include <memory>
#include <mutex>
#include <string>

#include "arm_stats_store.hpp"
#include "database/database.hpp"
#include "event_deduplicator.hpp"

namespace beacon::store {

/**
 * @brief Durable arm statistics in SQLite
 *
 * Each update is one transaction that records the event id in
 * processed_events and upserts the arm row, so a redelivered event is
 * recognised even after a restart. The recently-seen set in front of the
 * database only saves a round trip.
 *
 * Schema:
 * - arm_stats(user_id, product_id, pulls, cumulative_reward, mean_reward,
 *   last_updated) keyed by (user_id, product_id)
 * - processed_events(event_id, user_id, product_id, processed_at)
 *
 * Every dedup.pruneEvery applied updates, ids processed more than dedup.ttl
 * ago are deleted from processed_events.
 */
class SqliteArmStatsStore : public IArmStatsStore {
public:
    /**
     * @param dbPath Database file, or ":memory:"
     * @param clock Stamps processed_at and drives pruning
     * @throws StoreError if the database cannot be opened or initialized
     */
    explicit SqliteArmStatsStore(const std::string& dbPath,
                                 const config::DedupConfig& dedup = {},
                                 model::TimeSource clock = {});
    ~SqliteArmStatsStore() override;

    auto getOrCreate(const std::string& userId, const std::string& productId)
        -> model::ArmStat override;

    [[nodiscard]] auto find(const std::string& userId,
                            const std::string& productId) const
        -> std::optional<model::ArmStat> override;

    auto update(const std::string& userId, const std::string& productId,
                double reward, const std::string& eventId,
                model::Timestamp at = model::Clock::now())
        -> ArmUpdate override;

    [[nodiscard]] auto snapshot(const std::string& userId) const
        -> model::UserArmSnapshot override;

    [[nodiscard]] auto armCount() const -> size_t override;
    [[nodiscard]] auto userCount() const -> size_t override;

    [[nodiscard]] auto backendName() const -> std::string override {
        return "sqlite";
    }

    /**
     * @brief Delete durable event ids processed before a point in time
     * @return Number of ids removed
     */
    auto pruneProcessedEvents(model::Timestamp olderThan) -> size_t;

    [[nodiscard]] auto processedEventCount() const -> size_t;

private:
    void initializeSchema();

    auto selectArm(const std::string& userId,
                   const std::string& productId) const
        -> std::optional<model::ArmStat>;

    auto countRows(const std::string& sql) const -> size_t;

    auto pruneLocked(model::Timestamp olderThan) -> size_t;

    mutable std::mutex dbMutex_;
    std::unique_ptr<database::Database> db_;
    EventDeduplicator recent_;
    model::TimeSource clock_;
    std::chrono::seconds ttl_;
    uint64_t pruneEvery_;
    uint64_t appliedSincePrune_{0};
};

}  // namespace beacon::store

#endif  // BEACON_STORE_SQLITE_ARM_STATS_STORE_HPP
