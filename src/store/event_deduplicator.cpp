// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "event_deduplicator.hpp"

#include <spdlog/spdlog.h>

namespace beacon::store {

EventDeduplicator::EventDeduplicator(const config::DedupConfig& config)
    : capacity_(config.capacity > 0 ? config.capacity : 1),
      ttl_(config.ttl),
      seen_(capacity_) {
    spdlog::debug("Event deduplicator: capacity {}, ttl {}s", capacity_,
                  ttl_.count());
}

auto EventDeduplicator::tryMark(const std::string& eventId) -> bool {
    std::lock_guard lock(markMutex_);
    if (seen_.get(eventId)) {
        return false;
    }
    seen_.put(eventId, true, ttl_);
    return true;
}

void EventDeduplicator::forget(const std::string& eventId) {
    std::lock_guard lock(markMutex_);
    seen_.erase(eventId);
}

auto EventDeduplicator::contains(const std::string& eventId) const -> bool {
    std::lock_guard lock(markMutex_);
    return seen_.get(eventId).has_value();
}

auto EventDeduplicator::size() const -> size_t {
    std::lock_guard lock(markMutex_);
    return seen_.size();
}

}  // namespace beacon::store
