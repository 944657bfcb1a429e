// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_INGEST_HISTORY_SOURCE_HPP
#define BEACON_INGEST_HISTORY_SOURCE_HPP

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/interaction.hpp"

namespace beacon::ingest {

/**
 * @brief Upstream store of past interactions, consulted for unseen users
 */
class IInteractionHistorySource {
public:
    virtual ~IInteractionHistorySource() = default;

    [[nodiscard]] virtual auto userExists(const std::string& userId) -> bool = 0;

    /**
     * @brief Every recorded interaction of a user, oldest first
     */
    [[nodiscard]] virtual auto loadHistory(const std::string& userId)
        -> std::vector<model::InteractionEvent> = 0;
};

/**
 * @brief History kept in memory, filled by the caller
 */
class InMemoryHistorySource : public IInteractionHistorySource {
public:
    void addUser(const std::string& userId) {
        std::lock_guard lock(mutex_);
        history_.try_emplace(userId);
    }

    void addEvent(const model::InteractionEvent& event) {
        std::lock_guard lock(mutex_);
        history_[event.userId].push_back(event);
    }

    [[nodiscard]] auto userExists(const std::string& userId) -> bool override {
        std::lock_guard lock(mutex_);
        return history_.contains(userId);
    }

    [[nodiscard]] auto loadHistory(const std::string& userId)
        -> std::vector<model::InteractionEvent> override {
        std::lock_guard lock(mutex_);
        auto it = history_.find(userId);
        if (it == history_.end()) {
            return {};
        }
        return it->second;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::vector<model::InteractionEvent>>
        history_;
};

}  // namespace beacon::ingest

#endif  // BEACON_INGEST_HISTORY_SOURCE_HPP
