#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include "core/ErrorHandler.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using namespace opcuasub;

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        original_logger = spdlog::default_logger();

        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_stream);
        auto logger = std::make_shared<spdlog::logger>("error_handler_test", sink);
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);

        recovery_called = false;
    }

    void TearDown() override {
        spdlog::set_default_logger(original_logger);
    }

    std::string output() {
        spdlog::default_logger()->flush();
        return log_stream.str();
    }

    ErrorHandler::RecoveryCallback createRecoveryCallback(bool success) {
        return [this, success]() -> bool {
            recovery_called = true;
            return success;
        };
    }

    std::ostringstream log_stream;
    std::shared_ptr<spdlog::logger> original_logger;
    bool recovery_called;
};

TEST_F(ErrorHandlerTest, HandleError_WithoutRecovery_LogsTypeAndDetails) {
    bool result = ErrorHandler::handleError(ErrorHandler::ErrorType::SAMPLING_FAILED,
                                            "Monitored item 3: read failed");

    EXPECT_FALSE(result);
    EXPECT_NE(output().find("[SAMPLING_FAILED] Monitored item 3: read failed"), std::string::npos);
}

TEST_F(ErrorHandlerTest, HandleError_WithSuccessfulRecovery_ReturnsTrue) {
    bool result = ErrorHandler::handleError(ErrorHandler::ErrorType::TRANSPORT_ERROR,
                                            "Send failed", createRecoveryCallback(true));

    EXPECT_TRUE(result);
    EXPECT_TRUE(recovery_called);
    EXPECT_NE(output().find("Error recovery successful"), std::string::npos);
}

TEST_F(ErrorHandlerTest, HandleError_WithFailedRecovery_ReturnsFalse) {
    bool result = ErrorHandler::handleError(ErrorHandler::ErrorType::TIMER_ERROR,
                                            "Timer callback failed", createRecoveryCallback(false));

    EXPECT_FALSE(result);
    EXPECT_TRUE(recovery_called);
    EXPECT_NE(output().find("Error recovery failed"), std::string::npos);
}

TEST_F(ErrorHandlerTest, HandleException_ReportsContextAndMessage) {
    std::runtime_error exception("queue corrupted");

    EXPECT_FALSE(ErrorHandler::handleException(exception, "publish cycle"));

    std::string log = output();
    EXPECT_NE(log.find("UNKNOWN_ERROR"), std::string::npos);
    EXPECT_NE(log.find("Exception in publish cycle: queue corrupted"), std::string::npos);
}

TEST_F(ErrorHandlerTest, CheckStatus_Good_ReportsNothing) {
    EXPECT_TRUE(ErrorHandler::checkStatus(ErrorHandler::ErrorType::ADDRESS_SPACE_ERROR,
                                          UA_STATUSCODE_GOOD, "Writing value"));
    EXPECT_TRUE(output().empty());
}

TEST_F(ErrorHandlerTest, CheckStatus_Bad_ReportsStatusName) {
    EXPECT_FALSE(ErrorHandler::checkStatus(ErrorHandler::ErrorType::ADDRESS_SPACE_ERROR,
                                           UA_STATUSCODE_BADNODEIDUNKNOWN, "Writing value"));

    std::string log = output();
    EXPECT_NE(log.find("ADDRESS_SPACE_ERROR"), std::string::npos);
    EXPECT_NE(log.find("Writing value returned BadNodeIdUnknown"), std::string::npos);
}

TEST_F(ErrorHandlerTest, ErrorTypeToString_AllTypes_ReturnsNames) {
    EXPECT_EQ("SAMPLING_FAILED", ErrorHandler::errorTypeToString(ErrorHandler::ErrorType::SAMPLING_FAILED));
    EXPECT_EQ("PUBLISH_FAILED", ErrorHandler::errorTypeToString(ErrorHandler::ErrorType::PUBLISH_FAILED));
    EXPECT_EQ("TRANSPORT_ERROR", ErrorHandler::errorTypeToString(ErrorHandler::ErrorType::TRANSPORT_ERROR));
    EXPECT_EQ("TIMER_ERROR", ErrorHandler::errorTypeToString(ErrorHandler::ErrorType::TIMER_ERROR));
    EXPECT_EQ("ADDRESS_SPACE_ERROR",
              ErrorHandler::errorTypeToString(ErrorHandler::ErrorType::ADDRESS_SPACE_ERROR));
    EXPECT_EQ("HTTP_ERROR", ErrorHandler::errorTypeToString(ErrorHandler::ErrorType::HTTP_ERROR));
    EXPECT_EQ("CONFIGURATION_ERROR",
              ErrorHandler::errorTypeToString(ErrorHandler::ErrorType::CONFIGURATION_ERROR));
    EXPECT_EQ("INITIALIZATION_ERROR",
              ErrorHandler::errorTypeToString(ErrorHandler::ErrorType::INITIALIZATION_ERROR));
    EXPECT_EQ("UNKNOWN_ERROR", ErrorHandler::errorTypeToString(ErrorHandler::ErrorType::UNKNOWN_ERROR));
}

TEST_F(ErrorHandlerTest, ExecuteWithErrorHandling_SuccessfulFunction_ReturnsTrue) {
    bool called = false;

    EXPECT_TRUE(ErrorHandler::executeWithErrorHandling([&called]() { called = true; }, "observer"));
    EXPECT_TRUE(called);
}

TEST_F(ErrorHandlerTest, ExecuteWithErrorHandling_ThrowingFunction_ReturnsFalse) {
    bool result = ErrorHandler::executeWithErrorHandling(
        []() { throw std::runtime_error("observer failed"); }, "Monitored item created observer");

    EXPECT_FALSE(result);
    EXPECT_NE(output().find("Exception in Monitored item created observer: observer failed"),
              std::string::npos);
}

TEST_F(ErrorHandlerTest, ExecuteWithErrorHandling_WithRecovery_AttemptsRecovery) {
    bool result = ErrorHandler::executeWithErrorHandling(
        []() { throw std::runtime_error("startup failed"); }, "Server runtime",
        createRecoveryCallback(true));

    EXPECT_TRUE(result);
    EXPECT_TRUE(recovery_called);
}

TEST_F(ErrorHandlerTest, ExecuteWithErrorHandling_UnknownException_HandlesGracefully) {
    bool result = ErrorHandler::executeWithErrorHandling([]() { throw 42; }, "timer callback");

    EXPECT_FALSE(result);
    EXPECT_NE(output().find("Unknown exception in timer callback"), std::string::npos);
}

TEST_F(ErrorHandlerTest, RecoveryCallback_Throws_ReturnsFalse) {
    auto throwingRecovery = []() -> bool { throw std::runtime_error("recovery exploded"); };

    EXPECT_FALSE(ErrorHandler::handleError(ErrorHandler::ErrorType::PUBLISH_FAILED, "error",
                                           throwingRecovery));
    EXPECT_NE(output().find("Exception during error recovery: recovery exploded"), std::string::npos);
}
