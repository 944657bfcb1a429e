// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "interaction.hpp"

#include <initializer_list>

#include "product.hpp"

namespace beacon::model {

namespace {

/**
 * @brief Read the first present key as an identifier string
 *
 * Numeric ids are accepted and rendered as decimal text.
 */
auto readIdentifier(const nlohmann::json& j,
                    std::initializer_list<const char*> keys)
    -> std::optional<std::string> {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            continue;
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        if (it->is_number_integer()) {
            return std::to_string(it->get<int64_t>());
        }
        return std::string{};
    }
    return std::nullopt;
}

auto missing(const std::string& field) -> FieldError {
    return FieldError{ValidationReason::MissingField,
                      "Missing required field: " + field};
}

}  // namespace

auto actionToString(Action action) -> std::string {
    switch (action) {
        case Action::View:
            return "view";
        case Action::Tick:
            return "tick";
        case Action::Cross:
            return "cross";
        case Action::CartAdd:
            return "cart_add";
        case Action::Purchase:
            return "purchase";
        case Action::ArView:
            return "ar_view";
        case Action::Unknown:
            return "unknown";
    }
    return "unknown";
}

auto actionFromString(const std::string& name) -> std::optional<Action> {
    auto key = normalizeKey(name);
    if (key == "view") return Action::View;
    if (key == "tick") return Action::Tick;
    if (key == "cross") return Action::Cross;
    if (key == "cart_add") return Action::CartAdd;
    if (key == "purchase") return Action::Purchase;
    if (key == "ar_view") return Action::ArView;
    return std::nullopt;
}

auto RewardTable::rewardFor(Action action) const noexcept -> double {
    switch (action) {
        case Action::View:
            return view;
        case Action::Tick:
            return tick;
        case Action::Cross:
            return cross;
        case Action::CartAdd:
            return cartAdd;
        case Action::Purchase:
            return purchase;
        case Action::ArView:
            return arView;
        case Action::Unknown:
            return unknown;
    }
    return unknown;
}

auto RewardTable::toJson() const -> nlohmann::json {
    return {{"view", view},           {"tick", tick},
            {"cross", cross},         {"cart_add", cartAdd},
            {"purchase", purchase},   {"ar_view", arView},
            {"unknown", unknown}};
}

auto RewardTable::fromJson(const nlohmann::json& j) -> RewardTable {
    RewardTable table;
    table.view = j.value("view", table.view);
    table.tick = j.value("tick", table.tick);
    table.cross = j.value("cross", table.cross);
    table.cartAdd = j.value("cart_add", table.cartAdd);
    table.purchase = j.value("purchase", table.purchase);
    table.arView = j.value("ar_view", table.arView);
    table.unknown = j.value("unknown", table.unknown);
    return table;
}

auto InteractionEvent::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"event_id", eventId},
                        {"user_id", userId},
                        {"product_id", productId},
                        {"action", action == Action::Unknown
                                       ? actionName
                                       : actionToString(action)},
                        {"timestamp", formatIsoTimestamp(timestamp)}};
    if (!context.is_null()) {
        j["context"] = context;
    }
    return j;
}

auto InteractionEvent::fromJson(const nlohmann::json& j)
    -> atom::type::Expected<InteractionEvent, FieldError> {
    if (!j.is_object()) {
        return atom::type::unexpected(FieldError{
            ValidationReason::InvalidValue, "Event must be a JSON object"});
    }

    InteractionEvent event;

    auto eventId = readIdentifier(j, {"event_id", "eventId", "id"});
    if (!eventId) {
        return atom::type::unexpected(missing("event_id"));
    }
    event.eventId = *eventId;

    auto userId = readIdentifier(j, {"user_id", "userId"});
    if (!userId) {
        return atom::type::unexpected(missing("user_id"));
    }
    event.userId = *userId;

    auto productId = readIdentifier(j, {"product_id", "productId"});
    if (!productId) {
        return atom::type::unexpected(missing("product_id"));
    }
    event.productId = *productId;

    auto actionIt = j.find("action");
    if (actionIt == j.end() || actionIt->is_null()) {
        return atom::type::unexpected(missing("action"));
    }
    if (!actionIt->is_string()) {
        return atom::type::unexpected(FieldError{
            ValidationReason::InvalidValue, "Field 'action' must be a string"});
    }
    event.actionName = actionIt->get<std::string>();
    event.action = actionFromString(event.actionName).value_or(Action::Unknown);

    const nlohmann::json* tsField = nullptr;
    for (const char* key : {"timestamp", "createdAt", "created_at"}) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            tsField = &*it;
            break;
        }
    }
    if (tsField == nullptr) {
        return atom::type::unexpected(missing("timestamp"));
    }
    auto timestamp = timestampFromJson(*tsField);
    if (!timestamp) {
        return atom::type::unexpected(
            FieldError{ValidationReason::InvalidTimestamp,
                       "Unparseable timestamp: " + tsField->dump()});
    }
    event.timestamp = *timestamp;

    if (auto it = j.find("context"); it != j.end()) {
        event.context = *it;
    }
    return event;
}

}  // namespace beacon::model
