// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_MODEL_TIMESTAMP_HPP
#define BEACON_MODEL_TIMESTAMP_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "atom/type/json.hpp"

namespace beacon::model {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/// Injectable "now"; an empty one stands for the system clock
using TimeSource = std::function<Timestamp()>;

[[nodiscard]] auto toEpochMillis(Timestamp tp) -> int64_t;

[[nodiscard]] auto fromEpochMillis(int64_t millis) -> Timestamp;

/**
 * @brief Format as ISO-8601 UTC with millisecond precision
 *        ("2024-05-01T12:00:00.000Z")
 */
[[nodiscard]] auto formatIsoTimestamp(Timestamp tp) -> std::string;

/**
 * @brief Parse an ISO-8601 UTC timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with an optional fractional part and an
 * optional trailing 'Z'.
 *
 * @return Parsed time point, or std::nullopt if the text is malformed
 */
[[nodiscard]] auto parseIsoTimestamp(const std::string& text)
    -> std::optional<Timestamp>;

/**
 * @brief Read a timestamp from JSON: epoch milliseconds or ISO-8601 string
 */
[[nodiscard]] auto timestampFromJson(const nlohmann::json& value)
    -> std::optional<Timestamp>;

}  // namespace beacon::model

#endif  // BEACON_MODEL_TIMESTAMP_HPP
