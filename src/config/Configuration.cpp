#include "config/Configuration.h"
#include <cstdlib>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace opcuasub {

Configuration Configuration::loadFromEnvironment() {
    Configuration config;

    // Hosted Server Configuration
    config.opcServerPort = getEnvInt("OPC_SERVER_PORT", 4840);
    config.httpPort = getEnvInt("HTTP_PORT", 3000);

    std::string allowedOriginsStr = getEnvString("ALLOWED_ORIGINS");
    if (!allowedOriginsStr.empty()) {
        config.allowedOrigins = parseCommaSeparated(allowedOriginsStr);
    }

    // Subscription Limits
    config.minPublishingIntervalMs = getEnvInt("MIN_PUBLISHING_INTERVAL_MS", 50);
    config.maxPublishingIntervalMs = getEnvInt("MAX_PUBLISHING_INTERVAL_MS", 3600000);
    config.maxKeepAliveCount = getEnvInt("MAX_KEEPALIVE_COUNT", 12000);
    config.maxLifetimeCount = getEnvInt("MAX_LIFETIME_COUNT", 36000);
    config.maxSubscriptionsPerSession = getEnvInt("MAX_SUBSCRIPTIONS_PER_SESSION", 100);
    config.maxRetransmissionQueueSize = getEnvInt("MAX_RETRANSMISSION_QUEUE_SIZE", 10);

    // Monitored Item Limits
    config.minSamplingIntervalMs = getEnvInt("MIN_SAMPLING_INTERVAL_MS", 50);
    config.maxSamplingIntervalMs = getEnvInt("MAX_SAMPLING_INTERVAL_MS", 3600000);
    config.maxQueueSize = getEnvInt("MAX_QUEUE_SIZE", 1000);
    config.maxMonitoredItemsPerSubscription = getEnvInt("MAX_MONITORED_ITEMS_PER_SUBSCRIPTION", 10000);

    // Publish Engine Configuration
    config.maxPublishRequestsInQueue = getEnvInt("MAX_PUBLISH_REQUESTS_IN_QUEUE", 100);
    config.requestTimeoutCheckIntervalMs = getEnvInt("REQUEST_TIMEOUT_CHECK_INTERVAL_MS", 100);

    // Demonstration Subscription
    config.publishingIntervalMs = getEnvInt("PUBLISHING_INTERVAL_MS", 1000);
    config.samplingIntervalMs = getEnvInt("SAMPLING_INTERVAL_MS", 250);
    config.publishRequestDepth = getEnvInt("PUBLISH_REQUEST_DEPTH", 3);
    config.simulationUpdateMs = getEnvInt("SIMULATION_UPDATE_MS", 500);

    // Logging Configuration
    config.logLevel = getEnvString("LOG_LEVEL", "info");

    return config;
}

bool Configuration::validate() const {
    if (opcServerPort <= 0 || opcServerPort > 65535) {
        std::cerr << "Error: OPC_SERVER_PORT must be between 1 and 65535" << std::endl;
        return false;
    }

    if (httpPort <= 0 || httpPort > 65535) {
        std::cerr << "Error: HTTP_PORT must be between 1 and 65535" << std::endl;
        return false;
    }

    if (httpPort == opcServerPort) {
        std::cerr << "Error: HTTP_PORT and OPC_SERVER_PORT must differ" << std::endl;
        return false;
    }

    if (!validateLimits()) {
        return false;
    }

    if (publishingIntervalMs < minPublishingIntervalMs) {
        std::cerr << "Warning: PUBLISHING_INTERVAL_MS (" << publishingIntervalMs
                  << ") is below MIN_PUBLISHING_INTERVAL_MS and will be revised" << std::endl;
    }

    if (publishRequestDepth <= 0 || publishRequestDepth > maxPublishRequestsInQueue) {
        std::cerr << "Error: PUBLISH_REQUEST_DEPTH must be between 1 and MAX_PUBLISH_REQUESTS_IN_QUEUE" << std::endl;
        return false;
    }

    if (simulationUpdateMs <= 0) {
        std::cerr << "Error: SIMULATION_UPDATE_MS must be positive" << std::endl;
        return false;
    }

    return true;
}

bool Configuration::validateLimits() const {
    if (minPublishingIntervalMs <= 0 || minPublishingIntervalMs > maxPublishingIntervalMs) {
        std::cerr << "Error: MIN_PUBLISHING_INTERVAL_MS must be positive and not exceed MAX_PUBLISHING_INTERVAL_MS" << std::endl;
        return false;
    }

    if (minSamplingIntervalMs <= 0 || minSamplingIntervalMs > maxSamplingIntervalMs) {
        std::cerr << "Error: MIN_SAMPLING_INTERVAL_MS must be positive and not exceed MAX_SAMPLING_INTERVAL_MS" << std::endl;
        return false;
    }

    if (maxKeepAliveCount <= 0) {
        std::cerr << "Error: MAX_KEEPALIVE_COUNT must be positive" << std::endl;
        return false;
    }

    // The lifetime count is revised to at least three keep-alive periods
    if (maxLifetimeCount < 3 * maxKeepAliveCount) {
        std::cerr << "Error: MAX_LIFETIME_COUNT (" << maxLifetimeCount
                  << ") must be at least 3 * MAX_KEEPALIVE_COUNT (" << maxKeepAliveCount << ")" << std::endl;
        return false;
    }

    if (maxQueueSize <= 0) {
        std::cerr << "Error: MAX_QUEUE_SIZE must be positive" << std::endl;
        return false;
    }

    if (maxMonitoredItemsPerSubscription <= 0) {
        std::cerr << "Error: MAX_MONITORED_ITEMS_PER_SUBSCRIPTION must be positive" << std::endl;
        return false;
    }

    if (maxSubscriptionsPerSession <= 0) {
        std::cerr << "Error: MAX_SUBSCRIPTIONS_PER_SESSION must be positive" << std::endl;
        return false;
    }

    if (maxPublishRequestsInQueue <= 0) {
        std::cerr << "Error: MAX_PUBLISH_REQUESTS_IN_QUEUE must be positive" << std::endl;
        return false;
    }

    if (maxRetransmissionQueueSize < 0) {
        std::cerr << "Error: MAX_RETRANSMISSION_QUEUE_SIZE must be non-negative" << std::endl;
        return false;
    }

    if (requestTimeoutCheckIntervalMs <= 0) {
        std::cerr << "Error: REQUEST_TIMEOUT_CHECK_INTERVAL_MS must be positive" << std::endl;
        return false;
    }

    return true;
}

ServiceLimits Configuration::getServiceLimits() const {
    ServiceLimits limits;
    limits.minPublishingInterval = minPublishingIntervalMs;
    limits.maxPublishingInterval = maxPublishingIntervalMs;
    limits.minSamplingInterval = minSamplingIntervalMs;
    limits.maxSamplingInterval = maxSamplingIntervalMs;
    limits.maxKeepAliveCount = static_cast<UA_UInt32>(maxKeepAliveCount);
    limits.maxLifetimeCount = static_cast<UA_UInt32>(maxLifetimeCount);
    limits.maxQueueSize = static_cast<UA_UInt32>(maxQueueSize);
    limits.maxMonitoredItemsPerSubscription = static_cast<size_t>(maxMonitoredItemsPerSubscription);
    limits.maxSubscriptionsPerSession = static_cast<size_t>(maxSubscriptionsPerSession);
    limits.maxPublishRequestsInQueue = static_cast<size_t>(maxPublishRequestsInQueue);
    limits.maxRetransmissionQueueSize = static_cast<size_t>(maxRetransmissionQueueSize);
    limits.requestTimeoutCheckInterval = requestTimeoutCheckIntervalMs;
    return limits;
}

std::string Configuration::toString() const {
    std::ostringstream oss;
    oss << "Configuration:\n";
    oss << "  OPC UA Server Port: " << opcServerPort << "\n";
    oss << "  HTTP Port: " << httpPort << "\n";
    oss << "  Publishing Interval Limits: " << minPublishingIntervalMs << "ms - "
        << maxPublishingIntervalMs << "ms\n";
    oss << "  Sampling Interval Limits: " << minSamplingIntervalMs << "ms - "
        << maxSamplingIntervalMs << "ms\n";
    oss << "  Max KeepAlive Count: " << maxKeepAliveCount << "\n";
    oss << "  Max Lifetime Count: " << maxLifetimeCount << "\n";
    oss << "  Max Queue Size: " << maxQueueSize << "\n";
    oss << "  Max Monitored Items Per Subscription: " << maxMonitoredItemsPerSubscription << "\n";
    oss << "  Max Subscriptions Per Session: " << maxSubscriptionsPerSession << "\n";
    oss << "  Max Publish Requests In Queue: " << maxPublishRequestsInQueue << "\n";
    oss << "  Max Retransmission Queue Size: " << maxRetransmissionQueueSize << "\n";
    oss << "  Request Timeout Check Interval: " << requestTimeoutCheckIntervalMs << "ms\n";
    oss << "  Publishing Interval: " << publishingIntervalMs << "ms\n";
    oss << "  Sampling Interval: " << samplingIntervalMs << "ms\n";
    oss << "  Publish Request Depth: " << publishRequestDepth << "\n";
    oss << "  Simulation Update: " << simulationUpdateMs << "ms\n";
    oss << "  Log Level: " << logLevel << "\n";

    if (!allowedOrigins.empty()) {
        std::string origins;
        for (const auto& origin : allowedOrigins) {
            origins += origins.empty() ? origin : ", " + origin;
        }
        oss << "  Allowed Origins: " << origins << "\n";
    }

    return oss.str();
}

std::string Configuration::getEnvString(const std::string& name, const std::string& defaultValue) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : defaultValue;
}

int Configuration::getEnvInt(const std::string& name, int defaultValue) {
    const std::string text = getEnvString(name);
    if (text.empty()) {
        return defaultValue;
    }

    size_t consumed = 0;
    try {
        int parsed = std::stoi(text, &consumed);
        if (consumed == text.size()) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // Not a number or out of range
    }

    spdlog::warn("Ignoring {}='{}': not an integer, using {}", name, text, defaultValue);
    return defaultValue;
}

std::vector<std::string> Configuration::parseCommaSeparated(const std::string& value) {
    static const char* const WHITESPACE = " \t\r\n";
    std::vector<std::string> result;

    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) {
            comma = value.size();
        }

        std::string entry = value.substr(start, comma - start);
        size_t first = entry.find_first_not_of(WHITESPACE);
        if (first != std::string::npos) {
            size_t last = entry.find_last_not_of(WHITESPACE);
            result.push_back(entry.substr(first, last - first + 1));
        }
        start = comma + 1;
    }

    return result;
}

} // namespace opcuasub
