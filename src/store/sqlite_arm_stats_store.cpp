// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "sqlite_arm_stats_store.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "database/statement.hpp"
#include "database/transaction.hpp"

namespace beacon::store {

namespace {

constexpr const char* kArmColumns =
    "user_id, product_id, pulls, cumulative_reward, mean_reward, "
    "last_updated";

auto readArm(const database::Statement& stmt) -> model::ArmStat {
    model::ArmStat stat;
    stat.userId = stmt.getText(0);
    stat.productId = stmt.getText(1);
    stat.pulls = static_cast<uint64_t>(stmt.getInt64(2));
    stat.cumulativeReward = stmt.getDouble(3);
    stat.meanReward = stmt.getDouble(4);
    stat.lastUpdated = model::fromEpochMillis(stmt.getInt64(5));
    return stat;
}

}  // namespace

SqliteArmStatsStore::SqliteArmStatsStore(const std::string& dbPath,
                                         const config::DedupConfig& dedup,
                                         model::TimeSource clock)
    : db_(std::make_unique<database::Database>(dbPath)),
      recent_(dedup),
      clock_(clock ? std::move(clock)
                   : model::TimeSource([] { return model::Clock::now(); })),
      ttl_(dedup.ttl),
      pruneEvery_(std::max<uint64_t>(dedup.pruneEvery, 1)) {
    initializeSchema();
    SPDLOG_INFO("SqliteArmStatsStore initialized with database: {}", dbPath);
}

SqliteArmStatsStore::~SqliteArmStatsStore() = default;

void SqliteArmStatsStore::initializeSchema() {
    std::lock_guard lock(dbMutex_);
    db_->execute(R"(
        CREATE TABLE IF NOT EXISTS arm_stats (
            user_id TEXT NOT NULL,
            product_id TEXT NOT NULL,
            pulls INTEGER NOT NULL DEFAULT 0,
            cumulative_reward REAL NOT NULL DEFAULT 0,
            mean_reward REAL NOT NULL DEFAULT 0,
            last_updated INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (user_id, product_id)
        );
        CREATE TABLE IF NOT EXISTS processed_events (
            event_id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL,
            product_id TEXT NOT NULL,
            processed_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_processed_events_at
            ON processed_events(processed_at);
    )");
}

auto SqliteArmStatsStore::selectArm(const std::string& userId,
                                    const std::string& productId) const
    -> std::optional<model::ArmStat> {
    auto stmt = db_->prepare(std::string("SELECT ") + kArmColumns +
                             " FROM arm_stats WHERE user_id = ?1 AND "
                             "product_id = ?2");
    stmt->bind(1, userId).bind(2, productId);
    if (!stmt->step()) {
        return std::nullopt;
    }
    return readArm(*stmt);
}

auto SqliteArmStatsStore::getOrCreate(const std::string& userId,
                                      const std::string& productId)
    -> model::ArmStat {
    std::lock_guard lock(dbMutex_);
    auto stmt = db_->prepare(
        "INSERT OR IGNORE INTO arm_stats (user_id, product_id) "
        "VALUES (?1, ?2)");
    stmt->bind(1, userId).bind(2, productId);
    stmt->execute();

    auto stat = selectArm(userId, productId);
    if (!stat) {
        THROW_STORE_ERROR("Arm (" + userId + ", " + productId +
                          ") missing after insert");
    }
    return *stat;
}

auto SqliteArmStatsStore::find(const std::string& userId,
                               const std::string& productId) const
    -> std::optional<model::ArmStat> {
    std::lock_guard lock(dbMutex_);
    return selectArm(userId, productId);
}

auto SqliteArmStatsStore::update(const std::string& userId,
                                 const std::string& productId, double reward,
                                 const std::string& eventId,
                                 model::Timestamp at) -> ArmUpdate {
    auto duplicateOf = [&](std::optional<model::ArmStat> current) {
        if (!current) {
            current = model::ArmStat{};
            current->userId = userId;
            current->productId = productId;
        }
        SPDLOG_DEBUG("Duplicate event {} for arm ({}, {})", eventId, userId,
                     productId);
        return ArmUpdate{UpdateStatus::Duplicate, *current};
    };

    if (!eventId.empty() && recent_.contains(eventId)) {
        return duplicateOf(find(userId, productId));
    }

    std::lock_guard lock(dbMutex_);
    auto txn = db_->beginTransaction();

    if (!eventId.empty()) {
        auto mark = db_->prepare(
            "INSERT OR IGNORE INTO processed_events "
            "(event_id, user_id, product_id, processed_at) "
            "VALUES (?1, ?2, ?3, ?4)");
        mark->bind(1, eventId)
            .bind(2, userId)
            .bind(3, productId)
            .bind(4, model::toEpochMillis(clock_()));
        mark->execute();
        if (db_->changes() == 0) {
            txn->rollback();
            recent_.tryMark(eventId);
            return duplicateOf(selectArm(userId, productId));
        }
    }

    auto upsert = db_->prepare(R"(
        INSERT INTO arm_stats (user_id, product_id, pulls, cumulative_reward,
                               mean_reward, last_updated)
        VALUES (?1, ?2, 1, ?3, ?3, ?4)
        ON CONFLICT (user_id, product_id) DO UPDATE SET
            pulls = pulls + 1,
            cumulative_reward = cumulative_reward + excluded.cumulative_reward,
            mean_reward = mean_reward +
                (excluded.cumulative_reward - mean_reward) / (pulls + 1),
            last_updated = excluded.last_updated
    )");
    upsert->bind(1, userId)
        .bind(2, productId)
        .bind(3, reward)
        .bind(4, model::toEpochMillis(at));
    upsert->execute();

    auto stat = selectArm(userId, productId);
    txn->commit();

    if (++appliedSincePrune_ >= pruneEvery_) {
        appliedSincePrune_ = 0;
        pruneLocked(clock_() - ttl_);
    }

    if (!eventId.empty()) {
        recent_.tryMark(eventId);
    }
    if (!stat) {
        THROW_STORE_ERROR("Arm (" + userId + ", " + productId +
                          ") missing after update");
    }
    return {UpdateStatus::Applied, *stat};
}

auto SqliteArmStatsStore::snapshot(const std::string& userId) const
    -> model::UserArmSnapshot {
    model::UserArmSnapshot snap;
    snap.userId = userId;

    std::lock_guard lock(dbMutex_);
    auto stmt = db_->prepare(std::string("SELECT ") + kArmColumns +
                             " FROM arm_stats WHERE user_id = ?1");
    stmt->bind(1, userId);
    while (stmt->step()) {
        auto stat = readArm(*stmt);
        snap.totalPulls += stat.pulls;
        snap.arms.emplace(stat.productId, std::move(stat));
    }
    return snap;
}

auto SqliteArmStatsStore::countRows(const std::string& sql) const -> size_t {
    std::lock_guard lock(dbMutex_);
    auto stmt = db_->prepare(sql);
    return stmt->step() ? static_cast<size_t>(stmt->getInt64(0)) : 0;
}

auto SqliteArmStatsStore::armCount() const -> size_t {
    return countRows("SELECT COUNT(*) FROM arm_stats");
}

auto SqliteArmStatsStore::userCount() const -> size_t {
    return countRows("SELECT COUNT(DISTINCT user_id) FROM arm_stats");
}

auto SqliteArmStatsStore::processedEventCount() const -> size_t {
    return countRows("SELECT COUNT(*) FROM processed_events");
}

auto SqliteArmStatsStore::pruneProcessedEvents(model::Timestamp olderThan)
    -> size_t {
    std::lock_guard lock(dbMutex_);
    return pruneLocked(olderThan);
}

auto SqliteArmStatsStore::pruneLocked(model::Timestamp olderThan) -> size_t {
    auto stmt =
        db_->prepare("DELETE FROM processed_events WHERE processed_at < ?1");
    stmt->bind(1, model::toEpochMillis(olderThan));
    stmt->execute();
    auto removed = static_cast<size_t>(db_->changes());
    if (removed > 0) {
        spdlog::info("Pruned {} processed event ids", removed);
    }
    return removed;
}

}  // namespace beacon::store
