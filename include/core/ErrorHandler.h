#pragma once

#include <string>
#include <exception>
#include <functional>
#include <utility>

#include <open62541/types.h>

namespace opcuasub {

/**
 * @brief Centralized error reporting and recovery for callback boundaries
 *
 * Service-level outcomes travel as UA_StatusCode values; this class is used
 * where a fault must be logged and absorbed instead, such as address-space
 * reads during sampling, transport sends and timer callbacks.
 */
class ErrorHandler {
public:
    enum class ErrorType {
        SAMPLING_FAILED,
        PUBLISH_FAILED,
        TRANSPORT_ERROR,
        TIMER_ERROR,
        ADDRESS_SPACE_ERROR,
        HTTP_ERROR,
        CONFIGURATION_ERROR,
        INITIALIZATION_ERROR,
        UNKNOWN_ERROR
    };

    // Returns true when the fault was repaired
    using RecoveryCallback = std::function<bool()>;

    /**
     * @brief Log a fault and run the optional recovery
     * @return Result of the recovery, false when there is none
     */
    static bool handleError(ErrorType type, const std::string& details,
                            RecoveryCallback recovery = nullptr);

    /**
     * @brief Log an exception caught in @p context as UNKNOWN_ERROR
     */
    static bool handleException(const std::exception& e, const std::string& context,
                                RecoveryCallback recovery = nullptr);

    /**
     * @brief Report a bad status code returned by open62541
     * @param type Type of error
     * @param status Status code that was returned
     * @param context Operation that produced the status code
     * @return true if the status code is Good (nothing was reported)
     */
    static bool checkStatus(ErrorType type, UA_StatusCode status, const std::string& context);

    static std::string errorTypeToString(ErrorType type);

    /**
     * @brief Run @p func, logging anything it throws
     *
     * Used at callback boundaries (timers, observers, transport sends) so a
     * throwing callback cannot unwind into the scheduler or the node store.
     *
     * @return true if func completed or the recovery succeeded
     */
    template<typename Func>
    static bool executeWithErrorHandling(Func&& func, const std::string& context,
                                         RecoveryCallback recovery = nullptr) {
        try {
            func();
        } catch (const std::exception& e) {
            return handleException(e, context, std::move(recovery));
        } catch (...) {
            return handleError(ErrorType::UNKNOWN_ERROR, "Unknown exception in " + context,
                               std::move(recovery));
        }
        return true;
    }

private:
    static void logError(ErrorType type, const std::string& details);

    static bool attemptRecovery(const RecoveryCallback& recovery);
};

} // namespace opcuasub
