#include "core/OPCUALogBridge.h"
#include <cstdio>
#include <cstdarg>

namespace opcuasub {

UA_LogLevel OPCUALogBridge::minLogLevel_ = UA_LOGLEVEL_INFO;

UA_Logger OPCUALogBridge::createLogger() {
    UA_Logger bridge;
    bridge.context = nullptr;
    bridge.log = &OPCUALogBridge::logCallback;
    bridge.clear = &OPCUALogBridge::clearCallback;
    return bridge;
}

void OPCUALogBridge::setLogLevel(UA_LogLevel level) {
    minLogLevel_ = level;
}

UA_LogLevel OPCUALogBridge::fromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return UA_LOGLEVEL_TRACE;
        case spdlog::level::debug:    return UA_LOGLEVEL_DEBUG;
        case spdlog::level::warn:     return UA_LOGLEVEL_WARNING;
        case spdlog::level::err:      return UA_LOGLEVEL_ERROR;
        case spdlog::level::critical:
        case spdlog::level::off:      return UA_LOGLEVEL_FATAL;
        default:                      return UA_LOGLEVEL_INFO;
    }
}

spdlog::level::level_enum OPCUALogBridge::toSpdlogLevel(UA_LogLevel level) {
    if (level >= UA_LOGLEVEL_FATAL) {
        return spdlog::level::critical;
    }
    if (level >= UA_LOGLEVEL_ERROR) {
        return spdlog::level::err;
    }
    if (level >= UA_LOGLEVEL_WARNING) {
        return spdlog::level::warn;
    }
    if (level >= UA_LOGLEVEL_INFO) {
        return spdlog::level::info;
    }
    return level >= UA_LOGLEVEL_DEBUG ? spdlog::level::debug : spdlog::level::trace;
}

void OPCUALogBridge::logCallback(void* logContext, UA_LogLevel level,
                                 UA_LogCategory category, const char* msg, va_list args) {
    (void)logContext;
    if (level < minLogLevel_) {
        return;
    }

    // open62541 messages are printf-style; longer messages are truncated
    char text[1024];
    std::vsnprintf(text, sizeof(text), msg, args);

    spdlog::log(toSpdlogLevel(level), "[OPC UA][{}] {}", getCategoryName(category), text);
}

void OPCUALogBridge::clearCallback(UA_Logger* logger) {
    // spdlog owns the sinks
    (void)logger;
}

const char* OPCUALogBridge::getCategoryName(UA_LogCategory category) {
    static const char* const names[] = {
        "Network", "SecureChannel", "Session", "Server", "Client", "Userland", "SecurityPolicy"
    };
    auto index = static_cast<size_t>(category);
    return index < sizeof(names) / sizeof(names[0]) ? names[index] : "Unknown";
}

} // namespace opcuasub
