// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "catalog_sync.hpp"

#include <spdlog/spdlog.h>

namespace beacon::catalog {

CatalogSyncWorker::CatalogSyncWorker(CatalogCache& cache,
                                     std::shared_ptr<ICatalogSource> source,
                                     std::chrono::seconds interval,
                                     model::TimeSource clock)
    : cache_(cache),
      source_(std::move(source)),
      interval_(interval),
      clock_(clock ? std::move(clock)
                   : model::TimeSource([] { return model::Clock::now(); })) {}

CatalogSyncWorker::~CatalogSyncWorker() { stop(); }

void CatalogSyncWorker::start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_.store(false);
    }
    worker_ = std::thread(&CatalogSyncWorker::run, this);
    spdlog::info("Catalog sync started for {} every {}s", source_->describe(),
                 interval_.count());
}

void CatalogSyncWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_.store(true);
    }
    stopCond_.notify_one();

    if (worker_.joinable()) {
        worker_.join();
        spdlog::info("Catalog sync stopped after {} runs", runs_.load());
    }
    running_.store(false);
}

auto CatalogSyncWorker::syncNow() -> bool {
    bool ok = cache_.refreshFrom(*source_, clock_());
    runs_.fetch_add(1);
    return ok;
}

void CatalogSyncWorker::run() {
    try {
        while (true) {
            syncNow();

            std::unique_lock<std::mutex> lock(stopMutex_);
            if (stopCond_.wait_for(lock, interval_,
                                   [this] { return stopRequested_.load(); })) {
                break;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Exception in catalog sync thread: {}", e.what());
    }
}

}  // namespace beacon::catalog
