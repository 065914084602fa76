#include <gtest/gtest.h>
#include <sstream>
#include "core/OPCUALogBridge.h"
#include <open62541/plugin/log.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

using namespace opcuasub;

class OPCUALogBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Save the original logger
        original_logger = spdlog::default_logger();

        log_stream = std::make_shared<std::ostringstream>();
        auto ostream_sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(*log_stream);

        test_logger = std::make_shared<spdlog::logger>("log_bridge_test", ostream_sink);
        test_logger->set_pattern("%l %v");
        spdlog::set_default_logger(test_logger);
        spdlog::set_level(spdlog::level::trace);

        OPCUALogBridge::setLogLevel(UA_LOGLEVEL_TRACE);
        logger = OPCUALogBridge::createLogger();
    }

    void TearDown() override {
        OPCUALogBridge::setLogLevel(UA_LOGLEVEL_INFO);
        spdlog::set_default_logger(original_logger);
        spdlog::set_level(spdlog::level::warn);
    }

    std::string getLogOutput() {
        test_logger->flush();
        return log_stream->str();
    }

    UA_Logger logger;
    std::shared_ptr<std::ostringstream> log_stream;
    std::shared_ptr<spdlog::logger> test_logger;
    std::shared_ptr<spdlog::logger> original_logger;
};

TEST_F(OPCUALogBridgeTest, CreateLogger_HasCallbacksAndNoContext) {
    EXPECT_NE(logger.log, nullptr);
    EXPECT_NE(logger.clear, nullptr);
    EXPECT_EQ(logger.context, nullptr);
}

TEST_F(OPCUALogBridgeTest, ClearCallback_DoesNotThrow) {
    EXPECT_NO_THROW(logger.clear(&logger));
}

TEST_F(OPCUALogBridgeTest, LogCallback_FormatsArgumentsWithCategoryPrefix) {
    UA_LOG_WARNING(&logger, UA_LOGCATEGORY_SERVER, "Namespace %d has %s", 2, "4 variables");

    std::string output = getLogOutput();
    EXPECT_NE(output.find("warning [OPC UA][Server] Namespace 2 has 4 variables"), std::string::npos);
}

TEST_F(OPCUALogBridgeTest, LogCallback_ErrorLevel_MapsToSpdlogError) {
    UA_LOG_ERROR(&logger, UA_LOGCATEGORY_NETWORK, "Port %d in use", 4840);

    EXPECT_NE(getLogOutput().find("error [OPC UA][Network] Port 4840 in use"), std::string::npos);
}

TEST_F(OPCUALogBridgeTest, LogCallback_BelowMinimumLevel_IsFiltered) {
    OPCUALogBridge::setLogLevel(UA_LOGLEVEL_ERROR);

    UA_LOG_WARNING(&logger, UA_LOGCATEGORY_SESSION, "filtered warning");
    UA_LOG_ERROR(&logger, UA_LOGCATEGORY_SESSION, "visible error");

    std::string output = getLogOutput();
    EXPECT_EQ(output.find("filtered warning"), std::string::npos);
    EXPECT_NE(output.find("visible error"), std::string::npos);
}

TEST_F(OPCUALogBridgeTest, FromSpdlogLevel_MapsEveryLevel) {
    EXPECT_EQ(UA_LOGLEVEL_TRACE, OPCUALogBridge::fromSpdlogLevel(spdlog::level::trace));
    EXPECT_EQ(UA_LOGLEVEL_DEBUG, OPCUALogBridge::fromSpdlogLevel(spdlog::level::debug));
    EXPECT_EQ(UA_LOGLEVEL_INFO, OPCUALogBridge::fromSpdlogLevel(spdlog::level::info));
    EXPECT_EQ(UA_LOGLEVEL_WARNING, OPCUALogBridge::fromSpdlogLevel(spdlog::level::warn));
    EXPECT_EQ(UA_LOGLEVEL_ERROR, OPCUALogBridge::fromSpdlogLevel(spdlog::level::err));
    EXPECT_EQ(UA_LOGLEVEL_FATAL, OPCUALogBridge::fromSpdlogLevel(spdlog::level::critical));
    EXPECT_EQ(UA_LOGLEVEL_FATAL, OPCUALogBridge::fromSpdlogLevel(spdlog::level::off));
}

TEST_F(OPCUALogBridgeTest, GetCategoryName_KnownCategories) {
    EXPECT_STREQ("Network", OPCUALogBridge::getCategoryName(UA_LOGCATEGORY_NETWORK));
    EXPECT_STREQ("SecureChannel", OPCUALogBridge::getCategoryName(UA_LOGCATEGORY_SECURECHANNEL));
    EXPECT_STREQ("Session", OPCUALogBridge::getCategoryName(UA_LOGCATEGORY_SESSION));
    EXPECT_STREQ("Server", OPCUALogBridge::getCategoryName(UA_LOGCATEGORY_SERVER));
    EXPECT_STREQ("Userland", OPCUALogBridge::getCategoryName(UA_LOGCATEGORY_USERLAND));
}

TEST_F(OPCUALogBridgeTest, MultipleLoggers_ShareCallbacks) {
    UA_Logger other = OPCUALogBridge::createLogger();

    EXPECT_EQ(logger.log, other.log);
    EXPECT_EQ(logger.clear, other.clear);
}

TEST_F(OPCUALogBridgeTest, ToSpdlogLevel_MapsEachOpcuaLevel) {
    EXPECT_EQ(spdlog::level::trace, OPCUALogBridge::toSpdlogLevel(UA_LOGLEVEL_TRACE));
    EXPECT_EQ(spdlog::level::debug, OPCUALogBridge::toSpdlogLevel(UA_LOGLEVEL_DEBUG));
    EXPECT_EQ(spdlog::level::info, OPCUALogBridge::toSpdlogLevel(UA_LOGLEVEL_INFO));
    EXPECT_EQ(spdlog::level::warn, OPCUALogBridge::toSpdlogLevel(UA_LOGLEVEL_WARNING));
    EXPECT_EQ(spdlog::level::err, OPCUALogBridge::toSpdlogLevel(UA_LOGLEVEL_ERROR));
    EXPECT_EQ(spdlog::level::critical, OPCUALogBridge::toSpdlogLevel(UA_LOGLEVEL_FATAL));
}

TEST_F(OPCUALogBridgeTest, GetCategoryName_OutOfRange_IsUnknown) {
    EXPECT_STREQ("Unknown", OPCUALogBridge::getCategoryName(static_cast<UA_LogCategory>(99)));
}
