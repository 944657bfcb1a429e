// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "recommendation.hpp"

namespace beacon::model {

auto RecommendationResult::productIds() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    ids.reserve(items.size());
    for (const auto& item : items) {
        ids.push_back(item.productId);
    }
    return ids;
}

auto RecommendationResult::toJson() const -> nlohmann::json {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& item : items) {
        nlohmann::json entry = {{"product_id", item.productId},
                                {"rank", item.rank}};
        if (item.isUntried()) {
            entry["score"] = nullptr;
            entry["untried"] = true;
        } else {
            entry["score"] = item.score;
        }
        list.push_back(std::move(entry));
    }

    return {{"user_id", userId},
            {"recommendations", std::move(list)},
            {"strategy", strategyToString(strategy)},
            {"status", resultStatusToString(status)},
            {"generated_at", formatIsoTimestamp(generatedAt)},
            {"stale", stale},
            {"catalog_generation", catalogGeneration},
            {"catalog_age_seconds", catalogAge.count()}};
}

auto RecommendationQuery::fromJson(const nlohmann::json& j)
    -> atom::type::Expected<RecommendationQuery, FieldError> {
    if (!j.is_object()) {
        return atom::type::unexpected(FieldError{
            ValidationReason::InvalidValue, "Request must be a JSON object"});
    }

    RecommendationQuery query;
    auto userIt = j.find("user_id");
    if (userIt == j.end()) {
        userIt = j.find("userId");
    }
    if (userIt == j.end() || userIt->is_null()) {
        return atom::type::unexpected(FieldError{
            ValidationReason::MissingField, "Missing required field: user_id"});
    }
    if (!userIt->is_string()) {
        return atom::type::unexpected(FieldError{
            ValidationReason::InvalidValue, "Field 'user_id' must be a string"});
    }
    query.userId = userIt->get<std::string>();

    if (auto it = j.find("category"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return atom::type::unexpected(
                FieldError{ValidationReason::InvalidValue,
                           "Field 'category' must be a string"});
        }
        query.category = it->get<std::string>();
    }

    if (auto it = j.find("k"); it != j.end() && !it->is_null()) {
        if (!it->is_number_integer()) {
            return atom::type::unexpected(FieldError{
                ValidationReason::InvalidValue, "Field 'k' must be an integer"});
        }
        query.k = it->get<int>();
    }

    if (auto it = j.find("exclude"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return atom::type::unexpected(
                FieldError{ValidationReason::InvalidValue,
                           "Field 'exclude' must be an array of ids"});
        }
        for (const auto& id : *it) {
            if (!id.is_string()) {
                return atom::type::unexpected(
                    FieldError{ValidationReason::InvalidValue,
                               "Field 'exclude' must be an array of ids"});
            }
            query.exclude.push_back(id.get<std::string>());
        }
    }
    return query;
}

}  // namespace beacon::model
