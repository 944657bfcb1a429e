// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "product.hpp"

#include <algorithm>
#include <cctype>

namespace beacon::model {

auto priceBandFor(double price) noexcept -> PriceBand {
    if (price < 100.0) {
        return PriceBand::Budget;
    }
    if (price < 500.0) {
        return PriceBand::MidRange;
    }
    if (price < 1000.0) {
        return PriceBand::Premium;
    }
    return PriceBand::Luxury;
}

auto priceBandToString(PriceBand band) -> std::string {
    switch (band) {
        case PriceBand::Budget:
            return "budget";
        case PriceBand::MidRange:
            return "mid_range";
        case PriceBand::Premium:
            return "premium";
        case PriceBand::Luxury:
            return "luxury";
    }
    return "budget";
}

auto normalizeKey(const std::string& value) -> std::string {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

auto Product::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"id", id},
                        {"name", name},
                        {"category", category},
                        {"brand", brand},
                        {"price", price},
                        {"popularity", popularity},
                        {"active", active},
                        {"inventory", inventory}};
    if (listedAt) {
        j["listed_at"] = formatIsoTimestamp(*listedAt);
    }
    return j;
}

auto Product::fromJson(const nlohmann::json& j)
    -> atom::type::Expected<Product, std::string> {
    if (!j.is_object()) {
        return atom::type::make_unexpected(
            std::string("Product entry must be a JSON object"));
    }

    Product product;
    try {
        const auto& idField = j.at("id");
        // Upstream ids are sometimes numeric
        product.id = idField.is_string() ? idField.get<std::string>()
                                         : idField.dump();
        product.name = j.value("name", "");
        product.category = j.value("category", "general");
        product.brand = j.value("brand", "");
        product.price = j.value("price", 0.0);
        product.popularity = j.value("popularity", int64_t{0});
        product.active = j.value("active", true);
        product.inventory = j.value("inventory", int64_t{0});

        const char* listedKey = j.contains("listed_at") ? "listed_at"
                                                        : "listedAt";
        if (j.contains(listedKey) && !j[listedKey].is_null()) {
            auto listed = timestampFromJson(j[listedKey]);
            if (!listed) {
                return atom::type::make_unexpected(
                    "Invalid listed_at for product " + product.id);
            }
            product.listedAt = listed;
        }
    } catch (const nlohmann::json::exception& e) {
        return atom::type::make_unexpected(
            std::string("Invalid product entry: ") + e.what());
    }

    if (product.id.empty()) {
        return atom::type::make_unexpected(
            std::string("Product id must not be empty"));
    }
    if (product.price < 0.0 || product.inventory < 0 ||
        product.popularity < 0) {
        return atom::type::make_unexpected(
            "Negative price, inventory or popularity for product " +
            product.id);
    }
    return product;
}

}  // namespace beacon::model
