// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "catalog_source.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

#include "core/exception.hpp"

namespace beacon::catalog {

auto parseCatalogJson(const nlohmann::json& payload)
    -> atom::type::Expected<std::vector<model::Product>, std::string> {
    const nlohmann::json* list = &payload;
    if (payload.is_object()) {
        auto it = payload.find("products");
        if (it == payload.end()) {
            return atom::type::make_unexpected(
                std::string("Missing required field: products"));
        }
        list = &*it;
    }
    if (!list->is_array()) {
        return atom::type::make_unexpected(
            std::string("Field 'products' must be an array"));
    }

    std::vector<model::Product> products;
    products.reserve(list->size());
    size_t position = 0;
    for (const auto& entry : *list) {
        auto product = model::Product::fromJson(entry);
        if (!product.has_value()) {
            return atom::type::make_unexpected(
                "products[" + std::to_string(position) +
                "]: " + product.error());
        }
        products.push_back(std::move(product.value()));
        ++position;
    }
    return products;
}

JsonFileCatalogSource::JsonFileCatalogSource(std::filesystem::path path)
    : path_(std::move(path)) {}

auto JsonFileCatalogSource::fetchProducts() -> std::vector<model::Product> {
    std::ifstream file(path_);
    if (!file.is_open()) {
        THROW_CATALOG_UNAVAILABLE("Failed to open catalog file: " +
                                  path_.string());
    }

    nlohmann::json payload;
    try {
        file >> payload;
    } catch (const nlohmann::json::exception& e) {
        THROW_CATALOG_UNAVAILABLE("Invalid catalog file " + path_.string() +
                                  ": " + e.what());
    }

    auto products = parseCatalogJson(payload);
    if (!products.has_value()) {
        THROW_CATALOG_UNAVAILABLE("Invalid catalog file " + path_.string() +
                                  ": " + products.error());
    }
    spdlog::debug("Read {} products from {}", products.value().size(),
                  path_.string());
    return std::move(products.value());
}

auto JsonFileCatalogSource::describe() const -> std::string {
    return "file:" + path_.string();
}

}  // namespace beacon::catalog
