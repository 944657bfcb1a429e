// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_MODEL_PRODUCT_HPP
#define BEACON_MODEL_PRODUCT_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "atom/type/expected.hpp"
#include "atom/type/json.hpp"

#include "timestamp.hpp"

namespace beacon::model {

/**
 * @brief Coarse price segment used for shopper preferences
 *
 * Budget below 100, MidRange below 500, Premium below 1000, Luxury above.
 */
enum class PriceBand { Budget, MidRange, Premium, Luxury };

[[nodiscard]] auto priceBandFor(double price) noexcept -> PriceBand;

[[nodiscard]] auto priceBandToString(PriceBand band) -> std::string;

/**
 * @brief Catalog entry as delivered by the catalog collaborator
 *
 * Products are immutable once published in a catalog snapshot; a refresh
 * replaces the whole set.
 */
struct Product {
    std::string id;
    std::string name;
    std::string category;
    std::string brand;
    double price = 0.0;
    int64_t popularity = 0;  ///< Popularity counter maintained upstream
    bool active = true;
    int64_t inventory = 0;
    std::optional<Timestamp> listedAt;  ///< Listing time, recency signal

    /**
     * @brief Whether the product may be shown at all (active and in stock)
     */
    [[nodiscard]] auto isEligible() const noexcept -> bool {
        return active && inventory > 0;
    }

    [[nodiscard]] auto priceBand() const noexcept -> PriceBand {
        return priceBandFor(price);
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Deserialize from a catalog sync entry
     *
     * Requires "id"; every other field falls back to its default.
     * Accepts both "listed_at" and "listedAt".
     */
    static auto fromJson(const nlohmann::json& j)
        -> atom::type::Expected<Product, std::string>;
};

/**
 * @brief Lower-case a category or brand key for case-insensitive matching
 */
[[nodiscard]] auto normalizeKey(const std::string& value) -> std::string;

}  // namespace beacon::model

#endif  // BEACON_MODEL_PRODUCT_HPP
