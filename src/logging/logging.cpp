// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <utility>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace beacon::logging {

namespace {

constexpr std::array<std::pair<const char*, spdlog::level::level_enum>, 10>
    kLevelNames{{{"trace", spdlog::level::trace},
                 {"debug", spdlog::level::debug},
                 {"info", spdlog::level::info},
                 {"warn", spdlog::level::warn},
                 {"warning", spdlog::level::warn},
                 {"error", spdlog::level::err},
                 {"err", spdlog::level::err},
                 {"critical", spdlog::level::critical},
                 {"fatal", spdlog::level::critical},
                 {"off", spdlog::level::off}}};

auto makeConsoleSink(const config::LoggingConfig& config) -> spdlog::sink_ptr {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>(
        config.consoleColor ? spdlog::color_mode::automatic
                            : spdlog::color_mode::never);
    sink->set_level(levelFromString(config.consoleLevel));
    return sink;
}

// Returns null when the directory or file cannot be created; the engine
// keeps running on the console sink alone.
auto makeFileSink(const config::LoggingConfig& config) -> spdlog::sink_ptr {
    const auto file =
        std::filesystem::path(config.logDir) / (config.logFilename + ".log");
    try {
        std::filesystem::create_directories(file.parent_path());
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file.string(), config.maxFileSize, config.maxFiles);
        sink->set_level(levelFromString(config.fileLevel));
        return sink;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::warn("log file {} disabled: {}", file.string(), e.what());
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("log file {} disabled: {}", file.string(), e.what());
    }
    return nullptr;
}

}  // namespace

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    std::string lowered(level.size(), '\0');
    std::transform(level.begin(), level.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                           [&](const auto& entry) {
                               return lowered == entry.first;
                           });
    return it == kLevelNames.end() ? spdlog::level::info : it->second;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto name = spdlog::level::to_string_view(level);
    return {name.data(), name.size()};
}

auto setupLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enableConsole) {
        sinks.push_back(makeConsoleSink(config));
    }
    if (config.enableFile) {
        if (auto sink = makeFileSink(config)) {
            sinks.push_back(std::move(sink));
        }
    }

    // The logger passes everything its most verbose sink wants.
    auto threshold = spdlog::level::off;
    for (const auto& sink : sinks) {
        threshold = std::min(threshold, sink->level());
    }

    auto logger =
        std::make_shared<spdlog::logger>("beacon", sinks.begin(), sinks.end());
    logger->set_level(threshold);
    logger->set_pattern(config.pattern);
    logger->flush_on(levelFromString(config.flushLevel));
    spdlog::set_default_logger(logger);
    return logger;
}

}  // namespace beacon::logging
