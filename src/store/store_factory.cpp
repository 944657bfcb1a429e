// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "arm_stats_store.hpp"

#include <utility>

#include "core/exception.hpp"
#include "memory_arm_stats_store.hpp"
#include "sqlite_arm_stats_store.hpp"

namespace beacon::store {

auto createArmStatsStore(const config::StoreConfig& store,
                         const config::DedupConfig& dedup,
                         model::TimeSource clock)
    -> std::unique_ptr<IArmStatsStore> {
    if (store.type == "memory") {
        return std::make_unique<MemoryArmStatsStore>(dedup);
    }
    if (store.type == "sqlite") {
        return std::make_unique<SqliteArmStatsStore>(store.path, dedup,
                                                     std::move(clock));
    }
    THROW_CONFIG_ERROR("Unknown arm store type: " + store.type);
}

}  // namespace beacon::store
