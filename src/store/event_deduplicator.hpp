// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_STORE_EVENT_DEDUPLICATOR_HPP
#define BEACON_STORE_EVENT_DEDUPLICATOR_HPP

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

#include "atom/search/lru.hpp"

#include "config/engine_config.hpp"

namespace beacon::store {

/**
 * @brief Bounded set of recently seen event ids
 *
 * Ids expire after the TTL or when evicted by newer ids once the capacity
 * is reached. A redelivery older than that is treated as a new event.
 */
class EventDeduplicator {
public:
    explicit EventDeduplicator(const config::DedupConfig& config = {});

    /**
     * @brief Record an id
     * @return True if the id was not present (the caller owns the event)
     */
    auto tryMark(const std::string& eventId) -> bool;

    /**
     * @brief Drop an id so that a failed event can be retried
     */
    void forget(const std::string& eventId);

    [[nodiscard]] auto contains(const std::string& eventId) const -> bool;
    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto capacity() const noexcept -> size_t {
        return capacity_;
    }

private:
    size_t capacity_;
    std::chrono::seconds ttl_;
    // get + put on the cache is not atomic; markMutex_ makes tryMark one step
    mutable std::mutex markMutex_;
    mutable atom::search::ThreadSafeLRUCache<std::string, bool> seen_;
};

}  // namespace beacon::store

#endif  // BEACON_STORE_EVENT_DEDUPLICATOR_HPP
