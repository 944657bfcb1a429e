// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "user_profile_store.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "model/product.hpp"

namespace beacon::profile {

UserProfileStore::UserProfileStore(uint64_t warmThreshold,
                                   double affinityAlpha)
    : warmThreshold_(warmThreshold), affinityAlpha_(affinityAlpha) {}

auto UserProfileStore::createLocked(const std::string& userId,
                                    model::Timestamp now)
    -> model::UserProfile& {
    auto [it, inserted] = profiles_.try_emplace(userId);
    if (inserted) {
        it->second.userId = userId;
        it->second.firstSeen = now;
        // A zero threshold means nobody needs a warm-up
        if (warmThreshold_ == 0) {
            it->second.state = model::ColdStartState::Warm;
        }
        spdlog::debug("Created profile for user {}", userId);
    }
    return it->second;
}

auto UserProfileStore::registerUser(const std::string& userId,
                                    model::Timestamp now) -> bool {
    std::unique_lock lock(mutex_);
    auto before = profiles_.size();
    createLocked(userId, now);
    return profiles_.size() != before;
}

auto UserProfileStore::contains(const std::string& userId) const -> bool {
    std::shared_lock lock(mutex_);
    return profiles_.contains(userId);
}

auto UserProfileStore::find(const std::string& userId) const
    -> std::optional<model::UserProfile> {
    std::shared_lock lock(mutex_);
    auto it = profiles_.find(userId);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto UserProfileStore::getOrCreate(const std::string& userId,
                                   model::Timestamp now)
    -> model::UserProfile {
    std::unique_lock lock(mutex_);
    return createLocked(userId, now);
}

auto UserProfileStore::recordInteraction(
    const std::string& userId, const model::Product* product, double reward,
    model::Timestamp at) -> model::UserProfile {
    std::unique_lock lock(mutex_);
    auto& profile = createLocked(userId, at);

    ++profile.totalInteractions;
    profile.cumulativeReward += reward;
    if (!profile.lastInteraction || *profile.lastInteraction < at) {
        profile.lastInteraction = at;
    }

    if (product != nullptr) {
        auto blend = [this, reward](double& affinity) {
            affinity =
                (1.0 - affinityAlpha_) * affinity + affinityAlpha_ * reward;
        };
        if (!product->category.empty()) {
            blend(profile.categoryAffinity[model::normalizeKey(
                product->category)]);
        }
        if (!product->brand.empty()) {
            blend(profile.brandAffinity[model::normalizeKey(product->brand)]);
        }
        blend(profile.priceBandAffinity[model::priceBandToString(
            product->priceBand())]);
    }

    if (profile.state == model::ColdStartState::New &&
        profile.totalInteractions >= warmThreshold_) {
        profile.state = model::ColdStartState::Warm;
        spdlog::info("User {} is warm after {} interactions", userId,
                     profile.totalInteractions);
    }
    return profile;
}

auto UserProfileStore::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return profiles_.size();
}

auto UserProfileStore::warmCount() const -> size_t {
    std::shared_lock lock(mutex_);
    size_t count = 0;
    for (const auto& [id, profile] : profiles_) {
        if (profile.state == model::ColdStartState::Warm) {
            ++count;
        }
    }
    return count;
}

auto UserProfileStore::stats() const -> nlohmann::json {
    auto total = size();
    auto warm = warmCount();
    return {{"users", total},
            {"warm_users", warm},
            {"new_users", total - warm},
            {"warm_threshold", warmThreshold_}};
}

}  // namespace beacon::profile
