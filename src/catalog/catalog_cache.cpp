// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "catalog_cache.hpp"

#include <spdlog/spdlog.h>

#include "core/exception.hpp"

namespace beacon::catalog {

auto CatalogSnapshot::find(const std::string& id) const
    -> const model::Product* {
    auto it = index.find(id);
    return it == index.end() ? nullptr : &products[it->second];
}

auto CatalogCache::refresh(std::vector<model::Product> products,
                           model::Timestamp now) -> uint64_t {
    auto next = std::make_shared<CatalogSnapshot>();
    next->loadedAt = now;
    next->products.reserve(products.size());
    next->index.reserve(products.size());

    size_t duplicates = 0;
    for (auto& product : products) {
        auto it = next->index.find(product.id);
        if (it != next->index.end()) {
            next->products[it->second] = std::move(product);
            ++duplicates;
            continue;
        }
        next->index.emplace(product.id, next->products.size());
        next->products.push_back(std::move(product));
    }
    if (duplicates > 0) {
        spdlog::warn("Catalog refresh collapsed {} duplicate product ids",
                     duplicates);
    }

    std::lock_guard lock(writeMutex_);
    next->generation = nextGeneration_++;
    const auto generation = next->generation;
    const auto count = next->products.size();
    current_.store(std::shared_ptr<const CatalogSnapshot>(std::move(next)));

    {
        std::lock_guard errorLock(errorMutex_);
        lastError_.reset();
    }
    spdlog::info("Catalog generation {} published with {} products",
                 generation, count);
    return generation;
}

auto CatalogCache::refreshFrom(ICatalogSource& source, model::Timestamp now)
    -> bool {
    try {
        refresh(source.fetchProducts(), now);
        return true;
    } catch (const std::exception& e) {
        failures_.fetch_add(1);
        {
            std::lock_guard lock(errorMutex_);
            lastError_ = e.what();
        }
        if (hasSnapshot()) {
            spdlog::warn(
                "Catalog refresh from {} failed, keeping generation {}: {}",
                source.describe(), generation(), e.what());
        } else {
            spdlog::error("Catalog refresh from {} failed: {}",
                          source.describe(), e.what());
        }
        return false;
    }
}

auto CatalogCache::snapshot() const -> std::shared_ptr<const CatalogSnapshot> {
    return current_.load();
}

auto CatalogCache::getCandidates(const std::optional<std::string>& category)
    const -> CandidatePool {
    CandidatePool pool;
    pool.snapshot = current_.load();
    if (!pool.snapshot) {
        THROW_CATALOG_UNAVAILABLE("No catalog snapshot has been loaded");
    }

    std::string wanted;
    if (category && !category->empty()) {
        wanted = model::normalizeKey(*category);
    }

    pool.products.reserve(pool.snapshot->products.size());
    for (const auto& product : pool.snapshot->products) {
        if (!product.isEligible()) {
            continue;
        }
        if (!wanted.empty() && model::normalizeKey(product.category) != wanted) {
            continue;
        }
        pool.products.push_back(&product);
    }
    return pool;
}

auto CatalogCache::findProduct(const std::string& id) const
    -> std::optional<model::Product> {
    auto snap = current_.load();
    if (!snap) {
        return std::nullopt;
    }
    if (const auto* product = snap->find(id)) {
        return *product;
    }
    return std::nullopt;
}

auto CatalogCache::hasSnapshot() const -> bool {
    return current_.load() != nullptr;
}

auto CatalogCache::generation() const -> uint64_t {
    auto snap = current_.load();
    return snap ? snap->generation : 0;
}

auto CatalogCache::lastRefreshed() const -> std::optional<model::Timestamp> {
    auto snap = current_.load();
    if (!snap) {
        return std::nullopt;
    }
    return snap->loadedAt;
}

auto CatalogCache::age(model::Timestamp now) const
    -> std::optional<std::chrono::seconds> {
    auto snap = current_.load();
    if (!snap) {
        return std::nullopt;
    }
    auto elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(now - snap->loadedAt);
    return elapsed.count() < 0 ? std::chrono::seconds(0) : elapsed;
}

auto CatalogCache::isStale(std::chrono::seconds tolerance,
                           model::Timestamp now) const -> bool {
    auto current = age(now);
    return !current || *current > tolerance;
}

auto CatalogCache::lastError() const -> std::optional<std::string> {
    std::lock_guard lock(errorMutex_);
    return lastError_;
}

auto CatalogCache::stats(model::Timestamp now) const -> nlohmann::json {
    auto snap = current_.load();
    nlohmann::json j = {{"loaded", snap != nullptr},
                        {"generation", snap ? snap->generation : 0},
                        {"product_count", snap ? snap->products.size() : 0},
                        {"refresh_failures", failures_.load()}};
    if (snap) {
        size_t eligible = 0;
        for (const auto& product : snap->products) {
            if (product.isEligible()) {
                ++eligible;
            }
        }
        j["eligible_count"] = eligible;
        j["last_refreshed"] = model::formatIsoTimestamp(snap->loadedAt);
        j["age_seconds"] = age(now)->count();
    }
    auto error = lastError();
    j["last_error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
    return j;
}

}  // namespace beacon::catalog
