// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_INGEST_REWARD_INGESTOR_HPP
#define BEACON_INGEST_REWARD_INGESTOR_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "atom/type/json.hpp"

#include "catalog/catalog_cache.hpp"
#include "core/exception.hpp"
#include "model/interaction.hpp"
#include "profile/user_profile_store.hpp"
#include "store/arm_stats_store.hpp"

namespace beacon::ingest {

struct IngestPolicy {
    model::RewardTable rewards;
    bool rejectUnknownActions = true;
    std::chrono::seconds maxClockSkew{300};
};

/**
 * @brief Acknowledgement of one feedback event
 */
struct IngestReceipt {
    std::string eventId;
    std::string userId;
    std::string productId;
    bool accepted = false;
    bool duplicate = false;
    double rewardApplied = 0.0;  ///< 0 for duplicates
    uint64_t pulls = 0;          ///< Arm pulls after the event

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"accepted", accepted},
                {"reward_applied", rewardApplied},
                {"duplicate", duplicate},
                {"event_id", eventId}};
    }
};

struct IngestRejection {
    size_t index = 0;  ///< Position in the batch
    std::string eventId;
    ValidationReason reason = ValidationReason::InvalidValue;
    std::string message;
};

struct BatchIngestReport {
    size_t total = 0;
    size_t accepted = 0;
    size_t duplicates = 0;
    std::vector<IngestRejection> rejected;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Turns feedback events into arm and profile updates
 */
class RewardIngestor {
public:
    RewardIngestor(store::IArmStatsStore& arms,
                   profile::UserProfileStore& profiles,
                   const catalog::CatalogCache& catalog, IngestPolicy policy);

    /**
     * @brief Validate and apply one event
     *
     * A duplicate event id is acknowledged with duplicate = true and
     * changes nothing.
     *
     * @throws ValidationError for a malformed event
     * @throws StoreError if the arm store fails
     */
    auto ingest(const model::InteractionEvent& event,
                model::Timestamp now = model::Clock::now()) -> IngestReceipt;

    /**
     * @brief Apply events in order, collecting rejections instead of throwing
     * @throws StoreError if the arm store fails
     */
    auto ingestBatch(const std::vector<model::InteractionEvent>& events,
                     model::Timestamp now = model::Clock::now())
        -> BatchIngestReport;

    /**
     * @brief Reward the configured table assigns to an action
     */
    [[nodiscard]] auto rewardFor(model::Action action) const noexcept
        -> double {
        return policy_.rewards.rewardFor(action);
    }

    [[nodiscard]] auto stats() const -> nlohmann::json;

private:
    void validate(const model::InteractionEvent& event,
                  model::Timestamp now) const;

    store::IArmStatsStore& arms_;
    profile::UserProfileStore& profiles_;
    const catalog::CatalogCache& catalog_;
    IngestPolicy policy_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> duplicates_{0};
    std::atomic<uint64_t> rejected_{0};
};

}  // namespace beacon::ingest

#endif  // BEACON_INGEST_REWARD_INGESTOR_HPP
