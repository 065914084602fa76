#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

#include <crow.h>
#include <crow/middlewares/cors.h>
#include <nlohmann/json.hpp>

#include "config/Configuration.h"
#include "publish/PublishEngine.h"

namespace opcuasub {

/**
 * @brief Read-only HTTP diagnostics of the publish engine and its subscriptions
 *
 * Routes: /health, /status, /subscriptions and /subscriptions/<id>, all GET
 * and all answering JSON.
 */
class DiagnosticsHandler {
public:
    /**
     * @brief Request statistics for monitoring
     */
    struct RequestStats {
        uint64_t totalRequests;         // Total requests processed
        uint64_t successfulRequests;    // Requests answered with 2xx
        uint64_t failedRequests;        // Requests answered with an error
    };

    /**
     * @brief Constructor
     * @param engine Publish engine to report on (must remain valid during lifetime)
     * @param config Configuration settings
     */
    DiagnosticsHandler(PublishEngine* engine, const Configuration& config);

    ~DiagnosticsHandler() = default;

    // Disable copy constructor and assignment operator
    DiagnosticsHandler(const DiagnosticsHandler&) = delete;
    DiagnosticsHandler& operator=(const DiagnosticsHandler&) = delete;

    /**
     * @brief Set up all routes in the Crow application
     * @param app Crow application instance to configure
     */
    void setupRoutes(crow::App<crow::CORSHandler>& app);

    /**
     * @brief Handle health check endpoint
     * @return HTTP response with engine liveness
     */
    crow::response handleHealthRequest();

    /**
     * @brief Handle status endpoint
     * @return HTTP response with engine statistics and configuration
     */
    crow::response handleStatusRequest();

    /**
     * @brief List all subscriptions with their state and counters
     */
    crow::response handleSubscriptionsRequest();

    /**
     * @brief Full diagnostics of one subscription including its monitored items
     * @param subscriptionId Subscription identifier from the URL
     * @return 200 with diagnostics, or 404 for an unknown subscription
     */
    crow::response handleSubscriptionRequest(uint64_t subscriptionId);

    RequestStats getStats() const;

protected:
    /**
     * @brief Build JSON response
     * @param data JSON data to return
     * @param statusCode HTTP status code (default: 200)
     * @return HTTP response with JSON content
     */
    crow::response buildJSONResponse(const nlohmann::json& data, int statusCode = 200);

    /**
     * @brief Build error response
     * @param statusCode HTTP status code
     * @param message Error message
     * @param details Optional additional error details
     */
    crow::response buildErrorResponse(int statusCode,
                                      const std::string& message,
                                      const std::string& details = "");

private:
    PublishEngine* engine_;
    Configuration config_;
    std::chrono::steady_clock::time_point startTime_;

    std::atomic<uint64_t> totalRequests_{0};
    std::atomic<uint64_t> successfulRequests_{0};
    std::atomic<uint64_t> failedRequests_{0};

    uint64_t getCurrentTimestamp() const;
    crow::response record(crow::response response);
};

} // namespace opcuasub
