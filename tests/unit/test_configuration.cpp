#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>

#include "config/Configuration.h"

using namespace opcuasub;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const auto& name : variables) {
            unsetenv(name.c_str());
        }
    }

    void TearDown() override {
        SetUp();
    }

    const std::vector<std::string> variables = {
        "OPC_SERVER_PORT", "HTTP_PORT", "ALLOWED_ORIGINS",
        "MIN_PUBLISHING_INTERVAL_MS", "MAX_PUBLISHING_INTERVAL_MS",
        "MAX_KEEPALIVE_COUNT", "MAX_LIFETIME_COUNT",
        "MAX_SUBSCRIPTIONS_PER_SESSION", "MAX_RETRANSMISSION_QUEUE_SIZE",
        "MIN_SAMPLING_INTERVAL_MS", "MAX_SAMPLING_INTERVAL_MS",
        "MAX_QUEUE_SIZE", "MAX_MONITORED_ITEMS_PER_SUBSCRIPTION",
        "MAX_PUBLISH_REQUESTS_IN_QUEUE", "REQUEST_TIMEOUT_CHECK_INTERVAL_MS",
        "PUBLISHING_INTERVAL_MS", "SAMPLING_INTERVAL_MS",
        "PUBLISH_REQUEST_DEPTH", "SIMULATION_UPDATE_MS", "LOG_LEVEL"
    };
};

TEST_F(ConfigurationTest, Defaults_AreValid) {
    Configuration config = Configuration::loadFromEnvironment();

    EXPECT_EQ(4840, config.opcServerPort);
    EXPECT_EQ(3000, config.httpPort);
    EXPECT_EQ(50, config.minPublishingIntervalMs);
    EXPECT_EQ(12000, config.maxKeepAliveCount);
    EXPECT_EQ(36000, config.maxLifetimeCount);
    EXPECT_EQ(10, config.maxRetransmissionQueueSize);
    EXPECT_EQ(1000, config.publishingIntervalMs);
    EXPECT_EQ(3, config.publishRequestDepth);
    EXPECT_EQ("info", config.logLevel);
    EXPECT_TRUE(config.allowedOrigins.empty());
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigurationTest, EnvironmentOverrides_AreApplied) {
    setenv("OPC_SERVER_PORT", "4841", 1);
    setenv("MAX_QUEUE_SIZE", "25", 1);
    setenv("ALLOWED_ORIGINS", " http://a.example , ,http://b.example", 1);
    setenv("LOG_LEVEL", "debug", 1);

    Configuration config = Configuration::loadFromEnvironment();

    EXPECT_EQ(4841, config.opcServerPort);
    EXPECT_EQ(25, config.maxQueueSize);
    EXPECT_EQ((std::vector<std::string>{"http://a.example", "http://b.example"}), config.allowedOrigins);
    EXPECT_EQ("debug", config.logLevel);
}

TEST_F(ConfigurationTest, InvalidInteger_FallsBackToDefault) {
    setenv("HTTP_PORT", "not-a-port", 1);

    EXPECT_EQ(3000, Configuration::loadFromEnvironment().httpPort);
}

TEST_F(ConfigurationTest, Validate_RejectsBadPorts) {
    Configuration config = Configuration::loadFromEnvironment();

    config.opcServerPort = 0;
    EXPECT_FALSE(config.validate());

    config.opcServerPort = 4840;
    config.httpPort = 4840;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigurationTest, Validate_RejectsInconsistentLimits) {
    Configuration base = Configuration::loadFromEnvironment();

    Configuration config = base;
    config.minPublishingIntervalMs = 5000;
    config.maxPublishingIntervalMs = 1000;
    EXPECT_FALSE(config.validate());

    config = base;
    config.maxLifetimeCount = 3 * config.maxKeepAliveCount - 1;
    EXPECT_FALSE(config.validate());

    config = base;
    config.maxQueueSize = 0;
    EXPECT_FALSE(config.validate());

    config = base;
    config.maxRetransmissionQueueSize = -1;
    EXPECT_FALSE(config.validate());

    config = base;
    config.publishRequestDepth = config.maxPublishRequestsInQueue + 1;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigurationTest, Validate_PublishingIntervalBelowMinimum_OnlyWarns) {
    Configuration config = Configuration::loadFromEnvironment();
    config.publishingIntervalMs = 10;

    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigurationTest, GetServiceLimits_MirrorsConfiguration) {
    setenv("MAX_SUBSCRIPTIONS_PER_SESSION", "4", 1);
    setenv("MIN_SAMPLING_INTERVAL_MS", "20", 1);

    ServiceLimits limits = Configuration::loadFromEnvironment().getServiceLimits();

    EXPECT_EQ(4u, limits.maxSubscriptionsPerSession);
    EXPECT_DOUBLE_EQ(20.0, limits.minSamplingInterval);
    EXPECT_DOUBLE_EQ(50.0, limits.minPublishingInterval);
    EXPECT_EQ(12000u, limits.maxKeepAliveCount);
    EXPECT_EQ(100, limits.requestTimeoutCheckInterval);
}

TEST_F(ConfigurationTest, ToString_ListsSettings) {
    setenv("ALLOWED_ORIGINS", "http://a.example", 1);
    std::string text = Configuration::loadFromEnvironment().toString();

    EXPECT_NE(text.find("OPC UA Server Port: 4840"), std::string::npos);
    EXPECT_NE(text.find("Max Lifetime Count: 36000"), std::string::npos);
    EXPECT_NE(text.find("Allowed Origins: http://a.example"), std::string::npos);
}
