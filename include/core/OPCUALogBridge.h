#pragma once

#include <open62541/types.h>
#include <open62541/plugin/log.h>
#include <spdlog/spdlog.h>
#include <string>

namespace opcuasub {

/**
 * @brief Routes open62541 server log output into spdlog
 *
 * The hosted UA_Server is configured with the logger returned by
 * createLogger(), so node store, network and session messages share the
 * application's log sinks and pattern.
 */
class OPCUALogBridge {
public:
    /**
     * @brief Create a UA_Logger that forwards to spdlog
     * @return Configured UA_Logger instance
     */
    static UA_Logger createLogger();

    /**
     * @brief Set the minimum log level for OPC UA messages
     * @param level Minimum log level to capture
     */
    static void setLogLevel(UA_LogLevel level);

    /**
     * @brief Minimum open62541 level matching an spdlog level
     * @param level spdlog level configured for the application
     * @return Corresponding open62541 level
     */
    static UA_LogLevel fromSpdlogLevel(spdlog::level::level_enum level);

    /**
     * @brief spdlog level used to emit a message of an open62541 level
     */
    static spdlog::level::level_enum toSpdlogLevel(UA_LogLevel level);

    /**
     * @brief Short name of an open62541 log category, used as message prefix
     */
    static const char* getCategoryName(UA_LogCategory category);

private:
    static void logCallback(void* logContext, UA_LogLevel level,
                            UA_LogCategory category, const char* msg, va_list args);
    static void clearCallback(UA_Logger* logger);

    // Messages below this level are dropped before formatting
    static UA_LogLevel minLogLevel_;
};

} // namespace opcuasub
