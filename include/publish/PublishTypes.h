#pragma once

#include <vector>

#include <open62541/types.h>
#include <nlohmann/json.hpp>

#include "subscription/SubscriptionTypes.h"

namespace opcuasub {

struct SubscriptionAcknowledgement {
    UA_UInt32 subscriptionId = 0;
    UA_UInt32 sequenceNumber = 0;
};

/**
 * @brief Publish request as received from the session layer
 */
struct PublishRequest {
    UA_UInt32 requestHandle = 0;
    UA_UInt32 timeoutHint = 0;                     // ms, 0: no hint
    std::vector<SubscriptionAcknowledgement> subscriptionAcknowledgements;

    nlohmann::json toJson() const;
};

/**
 * @brief Response bound to exactly one publish request
 */
struct PublishResponse {
    UA_UInt32 requestHandle = 0;
    UA_StatusCode serviceResult = UA_STATUSCODE_GOOD;
    UA_UInt32 subscriptionId = 0;
    std::vector<UA_UInt32> availableSequenceNumbers;
    bool moreNotifications = false;
    NotificationMessage notificationMessage;
    std::vector<UA_StatusCode> results;            // One per acknowledgement

    nlohmann::json toJson() const;
};

} // namespace opcuasub
