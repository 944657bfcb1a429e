// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_MODEL_INTERACTION_HPP
#define BEACON_MODEL_INTERACTION_HPP

#include <optional>
#include <string>

#include "atom/type/expected.hpp"
#include "atom/type/json.hpp"

#include "core/exception.hpp"
#include "timestamp.hpp"

namespace beacon::model {

/**
 * @brief User action reported by the storefront
 *
 * Unknown is never produced for a recognised action string; it only marks
 * events whose action text did not match, so that the ingestion policy can
 * decide whether to reject them.
 */
enum class Action { View, Tick, Cross, CartAdd, Purchase, ArView, Unknown };

[[nodiscard]] auto actionToString(Action action) -> std::string;

/**
 * @brief Parse the wire name of an action ("cart_add", "ar_view", ...)
 * @return Action, or std::nullopt for an unrecognised name
 */
[[nodiscard]] auto actionFromString(const std::string& name)
    -> std::optional<Action>;

/**
 * @brief Fixed action -> reward mapping
 */
struct RewardTable {
    double view = 0.1;
    double tick = 1.0;
    double cross = -1.0;
    double cartAdd = 2.0;
    double purchase = 5.0;
    double arView = 1.5;
    double unknown = 0.0;

    [[nodiscard]] auto rewardFor(Action action) const noexcept -> double;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> RewardTable;
};

/**
 * @brief Field-level problem found while decoding a request
 */
struct FieldError {
    ValidationReason reason = ValidationReason::InvalidValue;
    std::string message;
};

/**
 * @brief One user feedback event
 *
 * The reward is not part of the event; it is derived from the action at
 * ingestion time.
 */
struct InteractionEvent {
    std::string eventId;
    std::string userId;
    std::string productId;
    Action action = Action::View;
    std::string actionName;  ///< Action text as received, kept for Unknown
    Timestamp timestamp{};
    nlohmann::json context;  ///< Optional free-form context, null if absent

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Decode a feedback payload
     *
     * Accepts snake_case keys ("event_id", "user_id", "product_id") and the
     * camelCase spelling used by the interaction store ("id", "userId",
     * "productId", "createdAt"). An unrecognised action decodes to
     * Action::Unknown; rejecting it is left to ingestion.
     */
    static auto fromJson(const nlohmann::json& j)
        -> atom::type::Expected<InteractionEvent, FieldError>;
};

}  // namespace beacon::model

#endif  // BEACON_MODEL_INTERACTION_HPP
