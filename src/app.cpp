// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/type/json.hpp"
#include "atom/utils/argsview.hpp"

#include "catalog/catalog_source.hpp"
#include "config/engine_config.hpp"
#include "core/exception.hpp"
#include "engine/recommendation_engine.hpp"
#include "logging/logging.hpp"
#include "service/recommendation_service.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

namespace {

/**
 * @brief Read a JSON-lines file; blank lines are skipped
 */
auto readJsonLines(const fs::path& path) -> nlohmann::json {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open events file: " +
                                 path.string());
    }

    nlohmann::json events = nlohmann::json::array();
    std::string line;
    size_t lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            events.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("{}:{}: skipping malformed line: {}", path.string(),
                         lineNo, e.what());
        }
    }
    return events;
}

}  // namespace

int main(int argc, char* argv[]) {
    atom::utils::ArgumentParser program("beacon"s);

    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Path to the engine config (JSON)", {"c"});
    program.addArgument("catalog",
                        atom::utils::ArgumentParser::ArgType::STRING, true,
                        ""s, "Catalog file {\"products\": [...]}", {"p"});
    program.addArgument("events", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Interaction events, one JSON per line",
                        {"e"});
    program.addArgument("user", atom::utils::ArgumentParser::ArgType::STRING,
                        true, ""s, "User to recommend for", {"u"});
    program.addArgument("category",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Restrict recommendations to a category", {"t"});
    program.addArgument("k", atom::utils::ArgumentParser::ArgType::INTEGER,
                        false, 0, "Number of recommendations", {"k"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Log level (trace/debug/info/warn/error)", {"l"});

    program.addDescription("Beacon contextual-bandit recommender:");
    program.addEpilog(
        "Loads the catalog, replays the events and prints the "
        "recommendations for one user.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    beacon::config::EngineConfig config;
    try {
        auto configPath = program.get<std::string>("config").value_or(""s);
        if (!configPath.empty()) {
            config = beacon::config::loadEngineConfig(configPath);
        }
    } catch (const beacon::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    auto logLevel = program.get<std::string>("log-level").value_or(""s);
    if (!logLevel.empty()) {
        config.logging.consoleLevel = logLevel;
    }
    beacon::logging::setupLogging(config.logging);

    auto catalogPath = program.get<std::string>("catalog").value_or(""s);
    auto userId = program.get<std::string>("user").value_or(""s);
    if (catalogPath.empty() || userId.empty()) {
        spdlog::error("--catalog and --user are required");
        return 1;
    }

    try {
        beacon::engine::EngineDependencies deps;
        deps.catalogSource =
            std::make_shared<beacon::catalog::JsonFileCatalogSource>(
                catalogPath);
        beacon::engine::RecommendationEngine engine(config, std::move(deps));
        beacon::service::RecommendationService service(engine);

        auto refreshed = service.handleCatalogRefresh();
        if (!refreshed.ok()) {
            std::cout << refreshed.body.dump(2) << std::endl;
            return 1;
        }

        auto eventsPath = program.get<std::string>("events").value_or(""s);
        if (!eventsPath.empty()) {
            auto report = service.handleFeedbackBatch(
                {{"events", readJsonLines(eventsPath)}});
            std::cout << report.body.dump(2) << std::endl;
        }

        nlohmann::json request = {{"user_id", userId}};
        auto category = program.get<std::string>("category").value_or(""s);
        if (!category.empty()) {
            request["category"] = category;
        }
        auto k = program.get<int>("k").value_or(0);
        if (k > 0) {
            request["k"] = k;
        }

        auto response = service.handleRecommend(request);
        std::cout << response.body.dump(2) << std::endl;
        return response.ok() ? 0 : 2;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
