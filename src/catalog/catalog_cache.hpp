// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_CATALOG_CATALOG_CACHE_HPP
#define BEACON_CATALOG_CATALOG_CACHE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "atom/type/json.hpp"

#include "catalog_source.hpp"
#include "model/product.hpp"
#include "model/timestamp.hpp"

namespace beacon::catalog {

/**
 * @brief Immutable catalog generation
 */
struct CatalogSnapshot {
    uint64_t generation = 0;
    model::Timestamp loadedAt{};
    std::vector<model::Product> products;
    std::unordered_map<std::string, size_t> index;  ///< id -> position

    [[nodiscard]] auto find(const std::string& id) const
        -> const model::Product*;

    [[nodiscard]] auto size() const noexcept -> size_t {
        return products.size();
    }
};

/**
 * @brief Eligible products together with the snapshot that owns them
 *
 * The pointers stay valid for as long as the pool holds the snapshot.
 */
struct CandidatePool {
    std::shared_ptr<const CatalogSnapshot> snapshot;
    std::vector<const model::Product*> products;

    [[nodiscard]] auto empty() const noexcept -> bool {
        return products.empty();
    }
    [[nodiscard]] auto size() const noexcept -> size_t {
        return products.size();
    }
};

/**
 * @brief In-memory catalog with lock-free reads
 *
 * Each refresh builds a complete snapshot and publishes it with one atomic
 * pointer swap. Readers keep whatever snapshot they loaded, so they never
 * see a half-applied refresh and are never blocked by one.
 */
class CatalogCache {
public:
    CatalogCache() = default;

    CatalogCache(const CatalogCache&) = delete;
    CatalogCache& operator=(const CatalogCache&) = delete;

    /**
     * @brief Replace the catalog with a new product list
     *
     * Duplicate ids are collapsed, the last occurrence wins.
     *
     * @return Generation number of the published snapshot
     */
    auto refresh(std::vector<model::Product> products,
                 model::Timestamp now = model::Clock::now()) -> uint64_t;

    /**
     * @brief Pull the product list from a source and publish it
     *
     * On failure the current snapshot stays in place and the error is
     * recorded.
     *
     * @param now Load time recorded on the new snapshot
     * @return True if a new snapshot was published
     */
    auto refreshFrom(ICatalogSource& source,
                     model::Timestamp now = model::Clock::now()) -> bool;

    /**
     * @brief Current snapshot, or nullptr before the first refresh
     */
    [[nodiscard]] auto snapshot() const
        -> std::shared_ptr<const CatalogSnapshot>;

    /**
     * @brief Active, in-stock products, optionally limited to one category
     *
     * @param category Case-insensitive category filter; empty means all
     * @throws CatalogUnavailableError if no snapshot was ever loaded
     */
    [[nodiscard]] auto getCandidates(
        const std::optional<std::string>& category = std::nullopt) const
        -> CandidatePool;

    [[nodiscard]] auto findProduct(const std::string& id) const
        -> std::optional<model::Product>;

    [[nodiscard]] auto hasSnapshot() const -> bool;
    [[nodiscard]] auto generation() const -> uint64_t;
    [[nodiscard]] auto lastRefreshed() const
        -> std::optional<model::Timestamp>;

    /**
     * @brief Time since the current snapshot was loaded
     */
    [[nodiscard]] auto age(model::Timestamp now = model::Clock::now()) const
        -> std::optional<std::chrono::seconds>;

    /**
     * @brief True when older than the tolerance, or when nothing is loaded
     */
    [[nodiscard]] auto isStale(std::chrono::seconds tolerance,
                               model::Timestamp now = model::Clock::now())
        const -> bool;

    [[nodiscard]] auto lastError() const -> std::optional<std::string>;
    [[nodiscard]] auto failureCount() const noexcept -> uint64_t {
        return failures_.load();
    }

    [[nodiscard]] auto stats(model::Timestamp now = model::Clock::now()) const
        -> nlohmann::json;

private:
    std::atomic<std::shared_ptr<const CatalogSnapshot>> current_;
    std::mutex writeMutex_;  ///< Serializes refreshes, never taken by readers
    uint64_t nextGeneration_ = 1;

    mutable std::mutex errorMutex_;
    std::optional<std::string> lastError_;
    std::atomic<uint64_t> failures_{0};
};

}  // namespace beacon::catalog

#endif  // BEACON_CATALOG_CATALOG_CACHE_HPP
