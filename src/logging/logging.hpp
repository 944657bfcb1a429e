// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_LOGGING_LOGGING_HPP
#define BEACON_LOGGING_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "config/logging_config.hpp"

namespace beacon::logging {

/**
 * @brief Parse a case-insensitive level name
 *
 * Besides spdlog's own names, "warning" and "fatal" are understood. Unknown
 * names fall back to info.
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

/**
 * @brief Build the "beacon" logger and make it the spdlog default
 *
 * A file sink that cannot be created is skipped with a warning. Calling
 * this again replaces the previous default.
 */
auto setupLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace beacon::logging

#endif  // BEACON_LOGGING_LOGGING_HPP
