// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_STORE_MEMORY_ARM_STATS_STORE_HPP
#define BEACON_STORE_MEMORY_ARM_STATS_STORE_HPP

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "arm_stats_store.hpp"
#include "event_deduplicator.hpp"

namespace beacon::store {

/**
 * @brief Process-local arm statistics
 *
 * Users map to buckets under a shared mutex; each arm cell has its own
 * mutex, so writers of different arms never contend once the cell exists.
 */
class MemoryArmStatsStore : public IArmStatsStore {
public:
    explicit MemoryArmStatsStore(const config::DedupConfig& dedup = {});
    ~MemoryArmStatsStore() override = default;

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

    /**
     * @brief Drop every arm and event id; not safe against concurrent updates
     */

    [[nodiscard]] auto backendName() const -> std::string override {
        return "memory";
    }

private:
    struct ArmCell {
        std::mutex mutex;
        model::ArmStat stat;
    };

    struct UserBucket {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::unique_ptr<ArmCell>> arms;
    };

    auto findBucket(const std::string& userId) const -> UserBucket*;
    auto bucketFor(const std::string& userId) -> UserBucket&;
    auto cellFor(UserBucket& bucket, const std::string& userId,
                 const std::string& productId) -> ArmCell&;

    mutable std::shared_mutex usersMutex_;
    std::unordered_map<std::string, std::unique_ptr<UserBucket>> users_;
    EventDeduplicator dedup_;
};

}  // namespace beacon::store

#endif  // BEACON_STORE_MEMORY_ARM_STATS_STORE_HPP
