// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_CATALOG_CATALOG_SOURCE_HPP
#define BEACON_CATALOG_CATALOG_SOURCE_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "atom/type/expected.hpp"
#include "atom/type/json.hpp"

#include "model/product.hpp"

namespace beacon::catalog {

/**
 * @brief Upstream provider of the full product list
 */
class ICatalogSource {
public:
    virtual ~ICatalogSource() = default;

    /**
     * @brief Fetch every product currently in the catalog
     * @throws CatalogUnavailableError if the catalog cannot be read
     */
    [[nodiscard]] virtual auto fetchProducts()
        -> std::vector<model::Product> = 0;

    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

/**
 * @brief Decode a catalog sync payload {"products": [...]}
 *
 * A bare array of products is accepted too. Fails on the first malformed
 * product, naming its position.
 */
[[nodiscard]] auto parseCatalogJson(const nlohmann::json& payload)
    -> atom::type::Expected<std::vector<model::Product>, std::string>;

/**
 * @brief Catalog read from a JSON file on every fetch
 */
class JsonFileCatalogSource : public ICatalogSource {
public:
    explicit JsonFileCatalogSource(std::filesystem::path path);

    [[nodiscard]] auto fetchProducts() -> std::vector<model::Product> override;

    [[nodiscard]] auto describe() const -> std::string override;

private:
    std::filesystem::path path_;
};

}  // namespace beacon::catalog

#endif  // BEACON_CATALOG_CATALOG_SOURCE_HPP
