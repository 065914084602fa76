#pragma once

#include <vector>

#include <open62541/types.h>

#include "subscription/SubscriptionTypes.h"

namespace opcuasub {

/**
 * @brief Receiver of the messages a Subscription produces in its publish cycle
 *
 * Implemented by PublishEngine. Called with the subscription's mutex held,
 * so implementations must not call back into the subscription.
 */
class PublishSink {
public:
    virtual ~PublishSink() = default;

    /**
     * @brief Bind a message to the oldest queued publish request
     * @param subscriptionId Subscription that produced the message
     * @param message Data, keep-alive or status change message
     * @param availableSequenceNumbers Sequence numbers retained for republish
     * @return false when no request was available; the sink then remembers
     *         the subscription as late
     */
    virtual bool deliver(UA_UInt32 subscriptionId, const NotificationMessage& message,
                         const std::vector<UA_UInt32>& availableSequenceNumbers) = 0;

    /**
     * @brief True if at least one publish request is queued
     */
    virtual bool hasPendingRequests() const = 0;
};

} // namespace opcuasub
