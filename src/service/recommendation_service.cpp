// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "recommendation_service.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "catalog/catalog_source.hpp"
#include "core/exception.hpp"

namespace beacon::service {

namespace {

auto fieldError(const model::FieldError& error) -> ServiceResponse {
    return ResponseBuilder::error(validationReasonToString(error.reason),
                                  error.message, 400);
}

}  // namespace

RecommendationService::RecommendationService(
    engine::RecommendationEngine& engine)
    : engine_(engine) {}

template <typename Handler>
auto RecommendationService::guarded(const char* operation, Handler&& handler)
    -> ServiceResponse {
    try {
        return handler();
    } catch (const ValidationError& e) {
        return ResponseBuilder::error(validationReasonToString(e.reason()),
                                      e.what(), 400);
    } catch (const UserNotFoundError& e) {
        return ResponseBuilder::error("user_not_found", e.what(), 404);
    } catch (const NoCandidatesError& e) {
        return ResponseBuilder::error("no_candidates", e.what(), 404);
    } catch (const CatalogUnavailableError& e) {
        spdlog::warn("{}: catalog unavailable: {}", operation, e.what());
        return ResponseBuilder::error("catalog_unavailable", e.what(), 503);
    } catch (const StoreError& e) {
        spdlog::error("{}: store failure: {}", operation, e.what());
        return ResponseBuilder::error("store_error", e.what(), 500);
    } catch (const json::exception& e) {
        return ResponseBuilder::invalidJson(e.what());
    } catch (const std::exception& e) {
        spdlog::error("{}: unexpected error: {}", operation, e.what());
        return ResponseBuilder::internalError(e.what());
    }
}

auto RecommendationService::handleRecommend(const json& request)
    -> ServiceResponse {
    return guarded("recommend", [&]() -> ServiceResponse {
        auto query = model::RecommendationQuery::fromJson(request);
        if (!query.has_value()) {
            return fieldError(query.error());
        }
        auto result = engine_.recommend(query.value());
        return ResponseBuilder::success(result.toJson());
    });
}

auto RecommendationService::handleFeedback(const json& request)
    -> ServiceResponse {
    return guarded("feedback", [&]() -> ServiceResponse {
        auto event = model::InteractionEvent::fromJson(request);
        if (!event.has_value()) {
            return fieldError(event.error());
        }
        auto receipt = engine_.ingest(event.value());
        return ResponseBuilder::success(receipt.toJson());
    });
}

auto RecommendationService::handleFeedbackBatch(const json& request)
    -> ServiceResponse {
    return guarded("feedback_batch", [&]() -> ServiceResponse {
        const json* list = &request;
        if (request.is_object()) {
            auto it = request.find("events");
            if (it == request.end()) {
                return ResponseBuilder::error("missing_field",
                                              "Missing required field: events");
            }
            list = &*it;
        }
        if (!list->is_array()) {
            return ResponseBuilder::error("invalid_value",
                                          "Field 'events' must be an array");
        }

        std::vector<model::InteractionEvent> events;
        std::vector<ingest::IngestRejection> undecodable;
        std::vector<size_t> positions;
        for (size_t i = 0; i < list->size(); ++i) {
            auto event = model::InteractionEvent::fromJson((*list)[i]);
            if (!event.has_value()) {
                undecodable.push_back(
                    {i, "", event.error().reason, event.error().message});
                continue;
            }
            positions.push_back(i);
            events.push_back(std::move(event.value()));
        }

        auto report = engine_.ingestBatch(events);
        for (auto& rejection : report.rejected) {
            rejection.index = positions[rejection.index];
        }
        report.total = list->size();
        report.rejected.insert(report.rejected.end(), undecodable.begin(),
                               undecodable.end());
        std::sort(report.rejected.begin(), report.rejected.end(),
                  [](const auto& a, const auto& b) { return a.index < b.index; });
        return ResponseBuilder::success(report.toJson());
    });
}

auto RecommendationService::handleCatalogSync(const json& request)
    -> ServiceResponse {
    return guarded("catalog_sync", [&]() -> ServiceResponse {
        auto products = catalog::parseCatalogJson(request);
        if (!products.has_value()) {
            return ResponseBuilder::error("invalid_value", products.error());
        }
        const auto count = products.value().size();
        auto generation = engine_.syncCatalog(std::move(products.value()));
        return ResponseBuilder::success(
            {{"generation", generation}, {"product_count", count}});
    });
}

auto RecommendationService::handleCatalogRefresh() -> ServiceResponse {
    return guarded("catalog_refresh", [&]() -> ServiceResponse {
        if (!engine_.refreshCatalog()) {
            auto error = engine_.catalog().lastError();
            return ResponseBuilder::error(
                "catalog_unavailable",
                "Catalog refresh failed: " + error.value_or("unknown error"),
                503, {{"generation", engine_.catalog().generation()}});
        }
        return ResponseBuilder::success(
            {{"generation", engine_.catalog().generation()},
             {"product_count", engine_.catalog().snapshot()->size()}});
    });
}

auto RecommendationService::handleRegisterUser(const json& request)
    -> ServiceResponse {
    return guarded("register_user", [&]() -> ServiceResponse {
        if (!request.is_object() || !request.contains("user_id")) {
            return ResponseBuilder::error("missing_field",
                                          "Missing required field: user_id");
        }
        if (!request["user_id"].is_string()) {
            return ResponseBuilder::error("invalid_value",
                                          "Field 'user_id' must be a string");
        }
        auto userId = request["user_id"].get<std::string>();
        bool created = engine_.registerUser(userId);
        return ResponseBuilder::success(
            {{"user_id", userId}, {"created", created}}, created ? 201 : 200);
    });
}

auto RecommendationService::handleUserStats(const std::string& userId)
    -> ServiceResponse {
    return guarded("user_stats", [&]() -> ServiceResponse {
        return ResponseBuilder::success(engine_.userStats(userId));
    });
}

auto RecommendationService::handleUserResync(const std::string& userId)
    -> ServiceResponse {
    return guarded("user_resync", [&]() -> ServiceResponse {
        auto report = engine_.resyncUser(userId);
        auto data = report.toJson();
        data["user_id"] = userId;
        return ResponseBuilder::success(data);
    });
}

auto RecommendationService::handleHealth() -> ServiceResponse {
    return guarded("health", [&]() -> ServiceResponse {
        auto health = engine_.health();
        const bool available = health["status"] != "unavailable";
        return ResponseBuilder::success(health, available ? 200 : 503);
    });
}

auto RecommendationService::handleSystemStats() -> ServiceResponse {
    return guarded("system_stats", [&]() -> ServiceResponse {
        return ResponseBuilder::success(engine_.engineStats());
    });
}

}  // namespace beacon::service
