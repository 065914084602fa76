#include "core/ErrorHandler.h"
#include <spdlog/spdlog.h>

namespace opcuasub {

bool ErrorHandler::handleError(ErrorType type, const std::string& details,
                               RecoveryCallback recovery) {
    logError(type, details);
    return recovery ? attemptRecovery(recovery) : false;
}

bool ErrorHandler::handleException(const std::exception& e, const std::string& context,
                                   RecoveryCallback recovery) {
    return handleError(ErrorType::UNKNOWN_ERROR, "Exception in " + context + ": " + e.what(),
                       std::move(recovery));
}

bool ErrorHandler::checkStatus(ErrorType type, UA_StatusCode status, const std::string& context) {
    if (status == UA_STATUSCODE_GOOD) {
        return true;
    }
    logError(type, context + " returned " + UA_StatusCode_name(status));
    return false;
}

std::string ErrorHandler::errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::SAMPLING_FAILED:      return "SAMPLING_FAILED";
        case ErrorType::PUBLISH_FAILED:       return "PUBLISH_FAILED";
        case ErrorType::TRANSPORT_ERROR:      return "TRANSPORT_ERROR";
        case ErrorType::TIMER_ERROR:          return "TIMER_ERROR";
        case ErrorType::ADDRESS_SPACE_ERROR:  return "ADDRESS_SPACE_ERROR";
        case ErrorType::HTTP_ERROR:           return "HTTP_ERROR";
        case ErrorType::CONFIGURATION_ERROR:  return "CONFIGURATION_ERROR";
        case ErrorType::INITIALIZATION_ERROR: return "INITIALIZATION_ERROR";
        case ErrorType::UNKNOWN_ERROR:        return "UNKNOWN_ERROR";
    }
    return "UNDEFINED_ERROR";
}

void ErrorHandler::logError(ErrorType type, const std::string& details) {
    spdlog::error("[{}] {}", errorTypeToString(type), details);
}

bool ErrorHandler::attemptRecovery(const RecoveryCallback& recovery) {
    bool recovered = false;
    try {
        recovered = recovery();
    } catch (const std::exception& e) {
        spdlog::error("Exception during error recovery: {}", e.what());
        return false;
    }

    if (recovered) {
        spdlog::info("Error recovery successful");
    } else {
        spdlog::warn("Error recovery failed");
    }
    return recovered;
}

} // namespace opcuasub
