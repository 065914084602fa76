#include "http/DiagnosticsHandler.h"
#include "core/ErrorHandler.h"
#include <spdlog/spdlog.h>
#include <limits>
#include <stdexcept>

namespace opcuasub {

DiagnosticsHandler::DiagnosticsHandler(PublishEngine* engine, const Configuration& config)
    : engine_(engine)
    , config_(config)
    , startTime_(std::chrono::steady_clock::now()) {
    if (!engine_) {
        throw std::invalid_argument("PublishEngine cannot be null");
    }
}

void DiagnosticsHandler::setupRoutes(crow::App<crow::CORSHandler>& app) {
    auto& cors = app.get_middleware<crow::CORSHandler>();
    auto& globalCors = cors.global()
        .headers("Content-Type", "Accept", "Origin", "X-Requested-With")
        .methods("GET"_method, "OPTIONS"_method);

    if (config_.allowedOrigins.empty()) {
        globalCors.origin("*");
        spdlog::debug("CORS middleware configured to allow all origins");
    } else {
        // Crow's CORS rule carries a single origin
        globalCors.origin(config_.allowedOrigins[0]);
        spdlog::debug("CORS middleware configured for origin: {}", config_.allowedOrigins[0]);
        for (size_t i = 1; i < config_.allowedOrigins.size(); ++i) {
            spdlog::warn("Additional CORS origin ignored: {}", config_.allowedOrigins[i]);
        }
    }

    CROW_ROUTE(app, "/health")
    ([this]() {
        return handleHealthRequest();
    });

    CROW_ROUTE(app, "/status")
    ([this]() {
        return handleStatusRequest();
    });

    CROW_ROUTE(app, "/subscriptions")
    ([this]() {
        return handleSubscriptionsRequest();
    });

    CROW_ROUTE(app, "/subscriptions/<uint>")
    ([this](uint64_t subscriptionId) {
        return handleSubscriptionRequest(subscriptionId);
    });

    spdlog::info("Diagnostics routes configured");
}

crow::response DiagnosticsHandler::handleHealthRequest() {
    try {
        bool healthy = !engine_->isShutdown();
        nlohmann::json health = {
            {"status", healthy ? "ok" : "shutting_down"},
            {"timestamp", getCurrentTimestamp()},
            {"uptime_seconds", std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - startTime_).count()},
            {"subscriptions", engine_->subscriptionCount()},
            {"pending_requests", engine_->pendingRequestCount()}
        };

        return record(buildJSONResponse(health, healthy ? 200 : 503));

    } catch (const std::exception& e) {
        ErrorHandler::handleError(ErrorHandler::ErrorType::HTTP_ERROR,
                                  std::string("Health request failed: ") + e.what());
        return record(buildErrorResponse(500, "Internal Server Error", e.what()));
    }
}

crow::response DiagnosticsHandler::handleStatusRequest() {
    try {
        RequestStats stats = getStats();
        nlohmann::json status = {
            {"timestamp", getCurrentTimestamp()},
            {"engine", engine_->getStatus()},
            {"http", {
                {"total_requests", stats.totalRequests},
                {"successful_requests", stats.successfulRequests},
                {"failed_requests", stats.failedRequests}
            }},
            {"limits", {
                {"min_publishing_interval_ms", config_.minPublishingIntervalMs},
                {"max_publishing_interval_ms", config_.maxPublishingIntervalMs},
                {"min_sampling_interval_ms", config_.minSamplingIntervalMs},
                {"max_sampling_interval_ms", config_.maxSamplingIntervalMs},
                {"max_keepalive_count", config_.maxKeepAliveCount},
                {"max_lifetime_count", config_.maxLifetimeCount},
                {"max_queue_size", config_.maxQueueSize},
                {"max_monitored_items_per_subscription", config_.maxMonitoredItemsPerSubscription},
                {"max_subscriptions_per_session", config_.maxSubscriptionsPerSession},
                {"max_publish_requests_in_queue", config_.maxPublishRequestsInQueue},
                {"max_retransmission_queue_size", config_.maxRetransmissionQueueSize}
            }}
        };

        return record(buildJSONResponse(status));

    } catch (const std::exception& e) {
        ErrorHandler::handleError(ErrorHandler::ErrorType::HTTP_ERROR,
                                  std::string("Status request failed: ") + e.what());
        return record(buildErrorResponse(500, "Internal Server Error", e.what()));
    }
}

crow::response DiagnosticsHandler::handleSubscriptionsRequest() {
    try {
        nlohmann::json subscriptions = nlohmann::json::array();
        for (UA_UInt32 subscriptionId : engine_->getSubscriptionIds()) {
            auto subscription = engine_->findSubscription(subscriptionId);
            if (!subscription) {
                continue;
            }

            nlohmann::json diagnostics = subscription->getDiagnostics();
            diagnostics.erase("monitoredItems");
            diagnostics["monitoredItemCount"] = subscription->getMonitoredItemCount();
            subscriptions.push_back(diagnostics);
        }

        return record(buildJSONResponse({{"subscriptions", subscriptions}}));

    } catch (const std::exception& e) {
        ErrorHandler::handleError(ErrorHandler::ErrorType::HTTP_ERROR,
                                  std::string("Subscriptions request failed: ") + e.what());
        return record(buildErrorResponse(500, "Internal Server Error", e.what()));
    }
}

crow::response DiagnosticsHandler::handleSubscriptionRequest(uint64_t subscriptionId) {
    try {
        std::shared_ptr<Subscription> subscription;
        if (subscriptionId <= std::numeric_limits<UA_UInt32>::max()) {
            subscription = engine_->findSubscription(static_cast<UA_UInt32>(subscriptionId));
        }

        if (!subscription) {
            return record(buildErrorResponse(404, "Not Found",
                                             "Unknown subscription " + std::to_string(subscriptionId)));
        }

        return record(buildJSONResponse(subscription->getDiagnostics()));

    } catch (const std::exception& e) {
        ErrorHandler::handleError(ErrorHandler::ErrorType::HTTP_ERROR,
                                  std::string("Subscription request failed: ") + e.what());
        return record(buildErrorResponse(500, "Internal Server Error", e.what()));
    }
}

DiagnosticsHandler::RequestStats DiagnosticsHandler::getStats() const {
    RequestStats stats;
    stats.totalRequests = totalRequests_.load();
    stats.successfulRequests = successfulRequests_.load();
    stats.failedRequests = failedRequests_.load();
    return stats;
}

crow::response DiagnosticsHandler::buildErrorResponse(int statusCode,
                                                      const std::string& message,
                                                      const std::string& details) {
    nlohmann::json error = {
        {"error", {
            {"code", statusCode},
            {"message", message},
            {"timestamp", getCurrentTimestamp()}
        }}
    };

    if (!details.empty()) {
        error["error"]["details"] = details;
    }

    return buildJSONResponse(error, statusCode);
}

crow::response DiagnosticsHandler::buildJSONResponse(const nlohmann::json& data, int statusCode) {
    crow::response response(statusCode);
    response.add_header("Content-Type", "application/json; charset=utf-8");
    response.write(data.dump());

    // Add security headers
    response.add_header("X-Content-Type-Options", "nosniff");
    response.add_header("X-Frame-Options", "DENY");
    response.add_header("Cache-Control", "no-cache, no-store, must-revalidate");

    return response;
}

crow::response DiagnosticsHandler::record(crow::response response) {
    totalRequests_++;
    if (response.code >= 200 && response.code < 300) {
        successfulRequests_++;
    } else {
        failedRequests_++;
    }
    return response;
}

uint64_t DiagnosticsHandler::getCurrentTimestamp() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace opcuasub
