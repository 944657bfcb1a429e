// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_STORE_ARM_STATS_STORE_HPP
#define BEACON_STORE_ARM_STATS_STORE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "config/engine_config.hpp"
#include "model/arm_stat.hpp"
#include "model/timestamp.hpp"

namespace beacon::store {

enum class UpdateStatus { Applied, Duplicate };

[[nodiscard]] inline auto updateStatusToString(UpdateStatus status)
    -> std::string {
    return status == UpdateStatus::Duplicate ? "duplicate" : "applied";
}

/**
 * @brief Outcome of one reward update
 *
 * For a duplicate, stat holds the arm as it currently is.
 */
struct ArmUpdate {
    UpdateStatus status = UpdateStatus::Applied;
    model::ArmStat stat;

    [[nodiscard]] auto applied() const noexcept -> bool {
        return status == UpdateStatus::Applied;
    }
};

/**
 * @brief Per-(user, product) pull and reward counters
 *
 * Implementations must be thread-safe: updates of one arm are serialized,
 * updates of different arms may run in parallel. update() is idempotent on
 * the event id.
 */
class IArmStatsStore {
public:
    virtual ~IArmStatsStore() = default;

    IArmStatsStore(const IArmStatsStore&) = delete;
    IArmStatsStore& operator=(const IArmStatsStore&) = delete;

    /**
     * @brief Current stat of an arm, creating an untried one if needed
     */
    virtual auto getOrCreate(const std::string& userId,
                             const std::string& productId)
        -> model::ArmStat = 0;

    [[nodiscard]] virtual auto find(const std::string& userId,
                                    const std::string& productId) const
        -> std::optional<model::ArmStat> = 0;

    /**
     * @brief Apply one reward to an arm
     *
     * @param eventId Idempotency key; an id seen before is not applied
     *        again. An empty id disables the check.
     * @throws StoreError if a durable backend fails
     */
    virtual auto update(const std::string& userId,
                        const std::string& productId, double reward,
                        const std::string& eventId,
                        model::Timestamp at = model::Clock::now())
        -> ArmUpdate = 0;

    /**
     * @brief Every arm of a user, with the summed pulls
     */
    [[nodiscard]] virtual auto snapshot(const std::string& userId) const
        -> model::UserArmSnapshot = 0;

    [[nodiscard]] virtual auto armCount() const -> size_t = 0;
    [[nodiscard]] virtual auto userCount() const -> size_t = 0;

    [[nodiscard]] virtual auto backendName() const -> std::string = 0;

protected:
    IArmStatsStore() = default;
};

/**
 * @brief Build the backend named by the store configuration
 * @throws ConfigError for an unknown backend type
 * @throws StoreError if the sqlite database cannot be opened
 */
[[nodiscard]] auto createArmStatsStore(const config::StoreConfig& store,
                                       const config::DedupConfig& dedup,
                                       model::TimeSource clock = {})
    -> std::unique_ptr<IArmStatsStore>;

}  // namespace beacon::store

#endif  // BEACON_STORE_ARM_STATS_STORE_HPP
