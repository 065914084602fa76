#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>

#include <open62541/types.h>
#include <nlohmann/json.hpp>

#include "core/DataValue.h"

namespace opcuasub {

/**
 * @brief Limits applied when revising client-requested parameters
 */
struct ServiceLimits {
    double minPublishingInterval = 50.0;           // ms
    double maxPublishingInterval = 3600000.0;      // ms
    double minSamplingInterval = 50.0;             // ms
    double maxSamplingInterval = 3600000.0;        // ms
    UA_UInt32 maxKeepAliveCount = 12000;
    UA_UInt32 maxLifetimeCount = 36000;
    UA_UInt32 maxQueueSize = 1000;
    size_t maxMonitoredItemsPerSubscription = 10000;
    size_t maxSubscriptionsPerSession = 100;
    size_t maxPublishRequestsInQueue = 100;
    size_t maxRetransmissionQueueSize = 10;
    int requestTimeoutCheckInterval = 100;         // ms
};

/**
 * @brief Data change filter of a monitored item
 */
struct DataChangeFilter {
    UA_DataChangeTrigger trigger = UA_DATACHANGETRIGGER_STATUSVALUE;
    UA_DeadbandType deadbandType = UA_DEADBANDTYPE_NONE;
    double deadbandValue = 0.0;
};

/**
 * @brief Client-requested sampling and queuing parameters
 */
struct MonitoringParameters {
    UA_UInt32 clientHandle = 0;
    double samplingInterval = -1.0;                // <0: publishing interval, 0: on change
    std::optional<DataChangeFilter> filter;
    UA_UInt32 queueSize = 1;
    bool discardOldest = true;
};

struct MonitoredItemCreateRequest {
    std::string nodeId;                            // e.g. "ns=1;s=Temperature"
    UA_UInt32 attributeId = UA_ATTRIBUTEID_VALUE;
    UA_MonitoringMode monitoringMode = UA_MONITORINGMODE_REPORTING;
    MonitoringParameters requestedParameters;
};

struct MonitoredItemCreateResult {
    UA_StatusCode statusCode = UA_STATUSCODE_GOOD;
    UA_UInt32 monitoredItemId = 0;
    double revisedSamplingInterval = 0.0;
    UA_UInt32 revisedQueueSize = 0;
    UA_StatusCode filterResult = UA_STATUSCODE_GOOD;

    nlohmann::json toJson() const;
};

struct MonitoredItemModifyResult {
    UA_StatusCode statusCode = UA_STATUSCODE_GOOD;
    double revisedSamplingInterval = 0.0;
    UA_UInt32 revisedQueueSize = 0;
    UA_StatusCode filterResult = UA_STATUSCODE_GOOD;
};

struct SetTriggeringResult {
    UA_StatusCode statusCode = UA_STATUSCODE_GOOD;
    std::vector<UA_StatusCode> addResults;
    std::vector<UA_StatusCode> removeResults;

    nlohmann::json toJson() const;
};

/**
 * @brief Requested subscription parameters, revised at creation
 */
struct SubscriptionParameters {
    double publishingInterval = 1000.0;            // ms
    UA_UInt32 lifetimeCount = 60;
    UA_UInt32 maxKeepAliveCount = 10;
    UA_UInt32 maxNotificationsPerPublish = 0;
    bool publishingEnabled = true;
    UA_Byte priority = 0;
};

// Wire notification structures

struct MonitoredItemNotification {
    UA_UInt32 clientHandle = 0;
    DataValue value;
};

struct DataChangeNotification {
    std::vector<MonitoredItemNotification> monitoredItems;
};

struct EventFieldList {
    UA_UInt32 clientHandle = 0;
    std::vector<DataValue> eventFields;
};

struct EventNotificationList {
    std::vector<EventFieldList> events;
};

struct StatusChangeNotification {
    UA_StatusCode status = UA_STATUSCODE_GOOD;
};

using NotificationData = std::variant<DataChangeNotification, EventNotificationList, StatusChangeNotification>;

struct NotificationMessage {
    UA_UInt32 sequenceNumber = 0;
    UA_DateTime publishTime = 0;
    std::vector<NotificationData> notificationData;

    /**
     * @brief A keep-alive carries no notification data
     */
    bool isKeepAlive() const { return notificationData.empty(); }

    /**
     * @brief Total number of data change entries in the message
     */
    size_t dataChangeCount() const;

    nlohmann::json toJson() const;
};

/**
 * @brief Readable names for open62541 enums used in diagnostics
 */
std::string monitoringModeToString(UA_MonitoringMode mode);
std::string statusCodeListToString(const std::vector<UA_StatusCode>& codes);

} // namespace opcuasub
