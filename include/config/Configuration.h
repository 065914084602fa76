#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include "subscription/SubscriptionTypes.h"

namespace opcuasub {

/**
 * @brief Configuration structure for the subscription server
 *
 * This structure holds all configuration parameters loaded from environment
 * variables: the service limits applied when revising subscription and
 * monitored item parameters, the hosted node store and diagnostics ports,
 * and the settings of the demonstration subscription created at startup.
 */
struct Configuration {
    // Hosted Server Configuration
    int opcServerPort;                    // OPC_SERVER_PORT
    int httpPort;                         // HTTP_PORT
    std::vector<std::string> allowedOrigins; // ALLOWED_ORIGINS (comma-separated)

    // Subscription Limits
    int minPublishingIntervalMs;          // MIN_PUBLISHING_INTERVAL_MS
    int maxPublishingIntervalMs;          // MAX_PUBLISHING_INTERVAL_MS
    int maxKeepAliveCount;                // MAX_KEEPALIVE_COUNT
    int maxLifetimeCount;                 // MAX_LIFETIME_COUNT
    int maxSubscriptionsPerSession;       // MAX_SUBSCRIPTIONS_PER_SESSION
    int maxRetransmissionQueueSize;       // MAX_RETRANSMISSION_QUEUE_SIZE

    // Monitored Item Limits
    int minSamplingIntervalMs;            // MIN_SAMPLING_INTERVAL_MS
    int maxSamplingIntervalMs;            // MAX_SAMPLING_INTERVAL_MS
    int maxQueueSize;                     // MAX_QUEUE_SIZE
    int maxMonitoredItemsPerSubscription; // MAX_MONITORED_ITEMS_PER_SUBSCRIPTION

    // Publish Engine Configuration
    int maxPublishRequestsInQueue;        // MAX_PUBLISH_REQUESTS_IN_QUEUE
    int requestTimeoutCheckIntervalMs;    // REQUEST_TIMEOUT_CHECK_INTERVAL_MS

    // Demonstration Subscription
    int publishingIntervalMs;             // PUBLISHING_INTERVAL_MS
    int samplingIntervalMs;               // SAMPLING_INTERVAL_MS
    int publishRequestDepth;              // PUBLISH_REQUEST_DEPTH
    int simulationUpdateMs;               // SIMULATION_UPDATE_MS

    // Logging Configuration
    std::string logLevel;                 // LOG_LEVEL

    /**
     * @brief Load configuration from environment variables
     * @return Configuration instance with values from environment or defaults
     */
    static Configuration loadFromEnvironment();

    /**
     * @brief Validate configuration parameters
     * @return true if configuration is valid, false otherwise
     */
    bool validate() const;

    /**
     * @brief Service limits derived from this configuration
     */
    ServiceLimits getServiceLimits() const;

    /**
     * @brief Get configuration as string for logging
     * @return String representation of configuration
     */
    std::string toString() const;

private:
    /**
     * @brief Validate the ranges of the service limits
     * @return true if the limits are consistent, false otherwise
     */
    bool validateLimits() const;

    /**
     * @brief Get environment variable as string with default value
     * @param name Environment variable name
     * @param defaultValue Default value if variable is not set
     * @return Environment variable value or default
     */
    static std::string getEnvString(const std::string& name, const std::string& defaultValue = "");

    /**
     * @brief Get environment variable as integer with default value
     * @param name Environment variable name
     * @param defaultValue Default value if variable is not set or invalid
     * @return Environment variable value as integer or default
     */
    static int getEnvInt(const std::string& name, int defaultValue = 0);

    /**
     * @brief Parse comma-separated string into vector
     * @param value Comma-separated string
     * @return Vector of trimmed strings
     */
    static std::vector<std::string> parseCommaSeparated(const std::string& value);
};

} // namespace opcuasub
