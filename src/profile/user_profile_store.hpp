// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_PROFILE_USER_PROFILE_STORE_HPP
#define BEACON_PROFILE_USER_PROFILE_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "atom/type/json.hpp"

#include "model/timestamp.hpp"
#include "model/user_profile.hpp"

namespace beacon::profile {

/**
 * @brief Server-side user profiles
 *
 * The interaction counter here is the only input of the cold-start
 * decision. A profile turns WARM once it reaches the threshold and never
 * goes back.
 */
class UserProfileStore {
public:
    UserProfileStore(uint64_t warmThreshold, double affinityAlpha);

    UserProfileStore(const UserProfileStore&) = delete;
    UserProfileStore& operator=(const UserProfileStore&) = delete;

    /**
     * @brief Make a user known without any interaction
     * @return True if the user was not known before
     */
    auto registerUser(const std::string& userId,
                      model::Timestamp now = model::Clock::now()) -> bool;

    [[nodiscard]] auto contains(const std::string& userId) const -> bool;

    [[nodiscard]] auto find(const std::string& userId) const
        -> std::optional<model::UserProfile>;

    auto getOrCreate(const std::string& userId,
                     model::Timestamp now = model::Clock::now())
        -> model::UserProfile;

    /**
     * @brief Count one applied interaction
     *
     * Increments totalInteractions, adds the reward and promotes the profile
     * once the threshold is reached. When the product is in the catalog, its
     * category, brand and price band each move toward the reward:
     * a = (1 - alpha) * a + alpha * reward, starting from 0.
     *
     * @param product Catalog entry of the product, or nullptr if unknown
     * @return Profile after the update
     */
    auto recordInteraction(const std::string& userId,
                           const model::Product* product, double reward,
                           model::Timestamp at) -> model::UserProfile;

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto warmCount() const -> size_t;

    [[nodiscard]] auto warmThreshold() const noexcept -> uint64_t {
        return warmThreshold_;
    }

    [[nodiscard]] auto stats() const -> nlohmann::json;

private:
    auto createLocked(const std::string& userId, model::Timestamp now)
        -> model::UserProfile&;

    uint64_t warmThreshold_;
    double affinityAlpha_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, model::UserProfile> profiles_;
};

}  // namespace beacon::profile

#endif  // BEACON_PROFILE_USER_PROFILE_STORE_HPP
