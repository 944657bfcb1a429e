// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_CONFIG_LOGGING_CONFIG_HPP
#define BEACON_CONFIG_LOGGING_CONFIG_HPP

#include <cstddef>
#include <string>

#include "atom/type/json.hpp"

namespace beacon::config {

using json = nlohmann::json;

/**
 * @brief Where engine log lines go
 *
 * The console sink is on by default. The rotating file sink is opt-in and
 * writes <logDir>/<logFilename>.log. Level names are those accepted by
 * logging::levelFromString.
 */
struct LoggingConfig {
    bool enableConsole{true};
    std::string consoleLevel{"info"};
    bool consoleColor{true};

    bool enableFile{false};
    std::string logDir{"logs"};
    std::string logFilename{"beacon"};
    std::string fileLevel{"debug"};
    size_t maxFileSize{8 * 1024 * 1024};
    size_t maxFiles{3};

    std::string flushLevel{"warn"};  ///< Lines at or above are flushed at once
    std::string pattern{"%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ [%t] %v"};

    [[nodiscard]] json toJson() const {
        json j;
        j["enableConsole"] = enableConsole;
        j["consoleLevel"] = consoleLevel;
        j["consoleColor"] = consoleColor;
        j["enableFile"] = enableFile;
        j["logDir"] = logDir;
        j["logFilename"] = logFilename;
        j["fileLevel"] = fileLevel;
        j["maxFileSize"] = maxFileSize;
        j["maxFiles"] = maxFiles;
        j["flushLevel"] = flushLevel;
        j["pattern"] = pattern;
        return j;
    }

    [[nodiscard]] static LoggingConfig fromJson(const json& j) {
        LoggingConfig out;
        auto read = [&j](const char* key, auto& field) {
            if (auto it = j.find(key); it != j.end()) {
                it->get_to(field);
            }
        };
        read("enableConsole", out.enableConsole);
        read("consoleLevel", out.consoleLevel);
        read("consoleColor", out.consoleColor);
        read("enableFile", out.enableFile);
        read("logDir", out.logDir);
        read("logFilename", out.logFilename);
        read("fileLevel", out.fileLevel);
        read("maxFileSize", out.maxFileSize);
        read("maxFiles", out.maxFiles);
        read("flushLevel", out.flushLevel);
        read("pattern", out.pattern);
        return out;
    }
};

}  // namespace beacon::config

#endif  // BEACON_CONFIG_LOGGING_CONFIG_HPP
