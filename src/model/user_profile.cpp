// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "user_profile.hpp"

#include <algorithm>

namespace beacon::model {

namespace {

auto lookup(const std::unordered_map<std::string, double>& weights,
            const std::string& key) -> std::optional<double> {
    auto it = weights.find(key);
    if (it == weights.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto toJsonObject(const std::unordered_map<std::string, double>& weights)
    -> nlohmann::json {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, weight] : weights) {
        j[key] = weight;
    }
    return j;
}

}  // namespace

auto UserProfile::affinityFor(const std::string& category) const
    -> std::optional<double> {
    return lookup(categoryAffinity, normalizeKey(category));
}

auto UserProfile::brandAffinityFor(const std::string& brand) const
    -> std::optional<double> {
    return lookup(brandAffinity, normalizeKey(brand));
}

auto UserProfile::priceBandAffinityFor(PriceBand band) const
    -> std::optional<double> {
    return lookup(priceBandAffinity, priceBandToString(band));
}

auto UserProfile::topCategories(size_t limit) const
    -> std::vector<std::pair<std::string, double>> {
    std::vector<std::pair<std::string, double>> result(
        categoryAffinity.begin(), categoryAffinity.end());
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

auto UserProfile::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"user_id", userId},
                        {"total_interactions", totalInteractions},
                        {"cold_start_state", coldStartStateToString(state)},
                        {"category_affinity", toJsonObject(categoryAffinity)},
                        {"brand_affinity", toJsonObject(brandAffinity)},
                        {"price_band_affinity",
                         toJsonObject(priceBandAffinity)},
                        {"cumulative_reward", cumulativeReward},
                        {"first_seen", formatIsoTimestamp(firstSeen)}};
    j["last_interaction"] =
        lastInteraction ? nlohmann::json(formatIsoTimestamp(*lastInteraction))
                        : nlohmann::json(nullptr);
    return j;
}

}  // namespace beacon::model
