// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "memory_arm_stats_store.hpp"

#include <spdlog/spdlog.h>

namespace beacon::store {

MemoryArmStatsStore::MemoryArmStatsStore(const config::DedupConfig& dedup)
    : dedup_(dedup) {
    SPDLOG_INFO("MemoryArmStatsStore initialized");
}

auto MemoryArmStatsStore::findBucket(const std::string& userId) const
    -> UserBucket* {
    std::shared_lock lock(usersMutex_);
    auto it = users_.find(userId);
    return it == users_.end() ? nullptr : it->second.get();
}

auto MemoryArmStatsStore::bucketFor(const std::string& userId) -> UserBucket& {
    if (auto* bucket = findBucket(userId)) {
        return *bucket;
    }
    std::unique_lock lock(usersMutex_);
    auto& slot = users_[userId];
    if (!slot) {
        slot = std::make_unique<UserBucket>();
    }
    return *slot;
}

auto MemoryArmStatsStore::cellFor(UserBucket& bucket,
                                  const std::string& userId,
                                  const std::string& productId) -> ArmCell& {
    {
        std::shared_lock lock(bucket.mutex);
        auto it = bucket.arms.find(productId);
        if (it != bucket.arms.end()) {
            return *it->second;
        }
    }
    std::unique_lock lock(bucket.mutex);
    auto& slot = bucket.arms[productId];
    if (!slot) {
        slot = std::make_unique<ArmCell>();
        slot->stat.userId = userId;
        slot->stat.productId = productId;
    }
    return *slot;
}

auto MemoryArmStatsStore::getOrCreate(const std::string& userId,
                                      const std::string& productId)
    -> model::ArmStat {
    auto& cell = cellFor(bucketFor(userId), userId, productId);
    std::lock_guard lock(cell.mutex);
    return cell.stat;
}

auto MemoryArmStatsStore::find(const std::string& userId,
                               const std::string& productId) const
    -> std::optional<model::ArmStat> {
    auto* bucket = findBucket(userId);
    if (!bucket) {
        return std::nullopt;
    }
    std::shared_lock bucketLock(bucket->mutex);
    auto it = bucket->arms.find(productId);
    if (it == bucket->arms.end()) {
        return std::nullopt;
    }
    std::lock_guard cellLock(it->second->mutex);
    return it->second->stat;
}

auto MemoryArmStatsStore::update(const std::string& userId,
                                 const std::string& productId, double reward,
                                 const std::string& eventId,
                                 model::Timestamp at) -> ArmUpdate {
    if (!eventId.empty() && !dedup_.tryMark(eventId)) {
        SPDLOG_DEBUG("Duplicate event {} for arm ({}, {})", eventId, userId,
                     productId);
        auto current = find(userId, productId);
        if (!current) {
            current = model::ArmStat{};
            current->userId = userId;
            current->productId = productId;
        }
        return {UpdateStatus::Duplicate, *current};
    }

    try {
        auto& cell = cellFor(bucketFor(userId), userId, productId);
        std::lock_guard lock(cell.mutex);
        cell.stat.applyReward(reward, at);
        return {UpdateStatus::Applied, cell.stat};
    } catch (const std::exception& e) {
        if (!eventId.empty()) {
            dedup_.forget(eventId);
        }
        spdlog::error("Failed to update arm ({}, {}): {}", userId, productId,
                      e.what());
        throw;
    }
}

auto MemoryArmStatsStore::snapshot(const std::string& userId) const
    -> model::UserArmSnapshot {
    model::UserArmSnapshot snap;
    snap.userId = userId;

    auto* bucket = findBucket(userId);
    if (!bucket) {
        return snap;
    }
    std::shared_lock bucketLock(bucket->mutex);
    snap.arms.reserve(bucket->arms.size());
    for (const auto& [productId, cell] : bucket->arms) {
        std::lock_guard cellLock(cell->mutex);
        snap.totalPulls += cell->stat.pulls;
        snap.arms.emplace(productId, cell->stat);
    }
    return snap;
}

auto MemoryArmStatsStore::armCount() const -> size_t {
    std::shared_lock lock(usersMutex_);
    size_t count = 0;
    for (const auto& [userId, bucket] : users_) {
        std::shared_lock bucketLock(bucket->mutex);
        count += bucket->arms.size();
    }
    return count;
}

auto MemoryArmStatsStore::userCount() const -> size_t {
    std::shared_lock lock(usersMutex_);
    return users_.size();
}

}  // namespace beacon::store
