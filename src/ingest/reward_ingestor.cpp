// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "reward_ingestor.hpp"

#include <spdlog/spdlog.h>

namespace beacon::ingest {

auto BatchIngestReport::toJson() const -> nlohmann::json {
    nlohmann::json rejections = nlohmann::json::array();
    for (const auto& rejection : rejected) {
        rejections.push_back(
            {{"index", rejection.index},
             {"event_id", rejection.eventId},
             {"reason", validationReasonToString(rejection.reason)},
             {"message", rejection.message}});
    }
    return {{"total", total},
            {"accepted", accepted},
            {"duplicates", duplicates},
            {"rejected_count", rejected.size()},
            {"rejected", std::move(rejections)}};
}

RewardIngestor::RewardIngestor(store::IArmStatsStore& arms,
                               profile::UserProfileStore& profiles,
                               const catalog::CatalogCache& catalog,
                               IngestPolicy policy)
    : arms_(arms),
      profiles_(profiles),
      catalog_(catalog),
      policy_(std::move(policy)) {}

void RewardIngestor::validate(const model::InteractionEvent& event,
                              model::Timestamp now) const {
    if (event.eventId.empty()) {
        THROW_VALIDATION_ERROR(ValidationReason::MissingField,
                               "Missing required field: event_id");
    }
    if (event.userId.empty()) {
        THROW_VALIDATION_ERROR(ValidationReason::MissingField,
                               "Missing required field: user_id");
    }
    if (event.productId.empty()) {
        THROW_VALIDATION_ERROR(ValidationReason::MissingField,
                               "Missing required field: product_id");
    }
    if (event.action == model::Action::Unknown &&
        policy_.rejectUnknownActions) {
        THROW_VALIDATION_ERROR(ValidationReason::UnknownAction,
                               "Unknown action: " + event.actionName);
    }
    if (event.timestamp == model::Timestamp{}) {
        THROW_VALIDATION_ERROR(ValidationReason::InvalidTimestamp,
                               "Missing event timestamp");
    }
    if (event.timestamp > now + policy_.maxClockSkew) {
        THROW_VALIDATION_ERROR(
            ValidationReason::InvalidTimestamp,
            "Event timestamp " + model::formatIsoTimestamp(event.timestamp) +
                " is in the future");
    }
}

auto RewardIngestor::ingest(const model::InteractionEvent& event,
                            model::Timestamp now) -> IngestReceipt {
    try {
        validate(event, now);
    } catch (const ValidationError& e) {
        rejected_.fetch_add(1);
        spdlog::warn("Rejected event {}: {}", event.eventId, e.what());
        throw;
    }

    const double reward = policy_.rewards.rewardFor(event.action);

    IngestReceipt receipt;
    receipt.eventId = event.eventId;
    receipt.userId = event.userId;
    receipt.productId = event.productId;
    receipt.accepted = true;

    auto update = arms_.update(event.userId, event.productId, reward,
                               event.eventId, event.timestamp);
    receipt.pulls = update.stat.pulls;

    if (!update.applied()) {
        duplicates_.fetch_add(1);
        receipt.duplicate = true;
        spdlog::info("Duplicate event {} ignored", event.eventId);
        return receipt;
    }

    auto product = catalog_.findProduct(event.productId);
    if (!product) {
        spdlog::debug("Product {} not in catalog, preferences unchanged",
                      event.productId);
    }
    profiles_.recordInteraction(event.userId,
                                product ? &*product : nullptr, reward,
                                event.timestamp);

    accepted_.fetch_add(1);
    receipt.rewardApplied = reward;
    spdlog::debug("Event {}: {} {} {} -> reward {}", event.eventId,
                  event.userId, model::actionToString(event.action),
                  event.productId, reward);
    return receipt;
}

auto RewardIngestor::ingestBatch(
    const std::vector<model::InteractionEvent>& events, model::Timestamp now)
    -> BatchIngestReport {
    BatchIngestReport report;
    report.total = events.size();

    for (size_t i = 0; i < events.size(); ++i) {
        try {
            auto receipt = ingest(events[i], now);
            if (receipt.duplicate) {
                ++report.duplicates;
            } else {
                ++report.accepted;
            }
        } catch (const ValidationError& e) {
            report.rejected.push_back(
                {i, events[i].eventId, e.reason(), e.what()});
        }
    }

    spdlog::info("Ingested batch of {}: {} accepted, {} duplicates, {} rejected",
                 report.total, report.accepted, report.duplicates,
                 report.rejected.size());
    return report;
}

auto RewardIngestor::stats() const -> nlohmann::json {
    return {{"accepted", accepted_.load()},
            {"duplicates", duplicates_.load()},
            {"rejected", rejected_.load()},
            {"reject_unknown_actions", policy_.rejectUnknownActions}};
}

}  // namespace beacon::ingest
