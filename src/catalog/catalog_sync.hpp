// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_CATALOG_CATALOG_SYNC_HPP
#define BEACON_CATALOG_CATALOG_SYNC_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "catalog_cache.hpp"
#include "catalog_source.hpp"

namespace beacon::catalog {

/**
 * @brief Background thread that keeps a CatalogCache fresh
 *
 * Refreshes once when started and then every interval. Failures are
 * recorded on the cache and never leave the thread.
 */
class CatalogSyncWorker {
public:
    CatalogSyncWorker(CatalogCache& cache,
                      std::shared_ptr<ICatalogSource> source,
                      std::chrono::seconds interval,
                      model::TimeSource clock = {});
    ~CatalogSyncWorker();

    CatalogSyncWorker(const CatalogSyncWorker&) = delete;
    CatalogSyncWorker& operator=(const CatalogSyncWorker&) = delete;

    void start();

    /**
     * @brief Wake the thread and wait for it to exit
     */
    void stop();

    /**
     * @brief Refresh immediately on the calling thread
     */
    auto syncNow() -> bool;

    [[nodiscard]] auto isRunning() const noexcept -> bool {
        return running_.load();
    }
    [[nodiscard]] auto completedRuns() const noexcept -> uint64_t {
        return runs_.load();
    }

private:
    void run();

    CatalogCache& cache_;
    std::shared_ptr<ICatalogSource> source_;
    std::chrono::seconds interval_;
    model::TimeSource clock_;

    std::thread worker_;
    std::mutex stopMutex_;
    std::condition_variable stopCond_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runs_{0};
};

}  // namespace beacon::catalog

#endif  // BEACON_CATALOG_CATALOG_SYNC_HPP
