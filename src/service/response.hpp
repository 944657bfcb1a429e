// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_SERVICE_RESPONSE_HPP
#define BEACON_SERVICE_RESPONSE_HPP

#include <string>
#include <utility>

#include "atom/type/json.hpp"

namespace beacon::service {

using json = nlohmann::json;

/**
 * @brief Outcome of one service call
 *
 * statusCode follows HTTP conventions so a transport can forward it as is.
 */
struct ServiceResponse {
    int statusCode = 200;
    json body;

    [[nodiscard]] auto ok() const noexcept -> bool {
        return statusCode / 100 == 2;
    }
};

/**
 * @brief Builds the two envelope shapes every call returns
 *
 * Success: {"status": "success", "data": <payload>}.
 * Failure: {"status": "error", "error": {"code", "message"[, "details"]}}.
 */
class ResponseBuilder {
public:
    static ServiceResponse success(const json& data, int code = 200) {
        ServiceResponse response{code, json::object()};
        response.body["status"] = "success";
        response.body["data"] = data;
        return response;
    }

    static ServiceResponse error(const std::string& code,
                                 const std::string& message,
                                 int httpCode = 400,
                                 const json& details = nullptr) {
        json failure{{"code", code}, {"message", message}};
        if (!details.is_null()) {
            failure["details"] = details;
        }
        ServiceResponse response{httpCode, json::object()};
        response.body["status"] = "error";
        response.body["error"] = std::move(failure);
        return response;
    }

    static ServiceResponse invalidJson(const std::string& parseError) {
        return error("invalid_json", "malformed request: " + parseError);
    }

    static ServiceResponse internalError(const std::string& message) {
        return error("internal_error", message, 500);
    }
};

}  // namespace beacon::service

#endif  // BEACON_SERVICE_RESPONSE_HPP
