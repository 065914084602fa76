#pragma once

#include <map>
#include <deque>
#include <mutex>
#include <atomic>
#include <memory>
#include <vector>
#include <functional>
#include <cstdint>

#include <open62541/types.h>
#include <nlohmann/json.hpp>

#include "publish/PublishTypes.h"
#include "subscription/PublishSink.h"
#include "subscription/Subscription.h"
#include "subscription/SubscriptionTypes.h"
#include "timing/Scheduler.h"

namespace opcuasub {

/**
 * @brief Matches queued publish requests with the subscriptions of a session
 *
 * Requests wait in arrival order. A subscription that produces a message
 * takes the oldest request that has not timed out; a subscription that finds
 * no request is remembered as late and served first when one arrives.
 * Every consumed request gets exactly one response through the send callback.
 *
 * Lock order is subscription before engine: the engine never calls into a
 * subscription while holding its own mutex.
 */
class PublishEngine : public PublishSink {
public:
    using SendResponseCallback = std::function<void(const PublishRequest&, const PublishResponse&)>;

    /**
     * @brief Statistics structure for monitoring request handling
     */
    struct EngineStats {
        uint64_t requestsReceived{0};       // Publish requests received
        uint64_t responsesSent{0};          // Responses of any kind
        uint64_t dataResponses{0};          // Responses carrying notifications
        uint64_t keepAliveResponses{0};     // Responses carrying keep-alives
        uint64_t errorResponses{0};         // Responses with a bad service result
        uint64_t timedOutRequests{0};       // Requests answered with BadTimeout
        uint64_t transportFailures{0};      // Send callbacks that threw
        size_t pendingRequests{0};
        size_t subscriptions{0};
        size_t lateSubscriptions{0};
    };

    /**
     * @brief Constructor
     * @param scheduler Clock for request timeouts and subscriptions (must outlive this object)
     * @param limits Service limits handed to subscriptions
     * @param sendResponse Transport send operation; invoked with a subscription
     *        mutex held, so it must not re-enter the engine synchronously
     */
    PublishEngine(Scheduler& scheduler, const ServiceLimits& limits, SendResponseCallback sendResponse);

    /**
     * @brief Destructor - shuts the engine down
     */
    ~PublishEngine() override;

    // Disable copy constructor and assignment operator
    PublishEngine(const PublishEngine&) = delete;
    PublishEngine& operator=(const PublishEngine&) = delete;

    /**
     * @brief Create and start a subscription
     * @return The subscription, or nullptr when the subscription limit is
     *         reached (BadTooManySubscriptions) or the engine is shut down
     */
    std::shared_ptr<Subscription> createSubscription(const SubscriptionParameters& parameters);

    /**
     * @brief Terminate and remove a subscription
     *
     * Removing the last subscription answers all queued requests with
     * BadSubscriptionIdInvalid.
     *
     * @return Good or BadSubscriptionIdInvalid
     */
    UA_StatusCode deleteSubscription(UA_UInt32 subscriptionId);

    std::shared_ptr<Subscription> findSubscription(UA_UInt32 subscriptionId) const;
    std::vector<UA_UInt32> getSubscriptionIds() const;

    /**
     * @brief Accept a publish request
     *
     * Acknowledgements are retired at once. Without any subscription the
     * request is answered BadNoSubscription; otherwise it is queued and a
     * late subscription is served immediately.
     */
    void onPublishRequest(const PublishRequest& request);

    /**
     * @brief Retransmit a retained message
     * @return Good, BadSubscriptionIdInvalid or BadMessageNotAvailable
     */
    UA_StatusCode republish(UA_UInt32 subscriptionId, UA_UInt32 sequenceNumber,
                            NotificationMessage& message) const;

    bool deliver(UA_UInt32 subscriptionId, const NotificationMessage& message,
                 const std::vector<UA_UInt32>& availableSequenceNumbers) override;
    bool hasPendingRequests() const override;

    /**
     * @brief Expire timed-out requests and purge closed subscriptions
     *
     * Runs on the housekeeping timer.
     */
    void performHousekeeping();

    /**
     * @brief Terminate all subscriptions and answer queued requests with BadShutdown
     *
     * Idempotent.
     */
    void shutdown();

    bool isShutdown() const { return shutdown_.load(); }
    size_t pendingRequestCount() const;
    size_t subscriptionCount() const;
    EngineStats getStats() const;
    nlohmann::json getStatus() const;

private:
    struct QueuedRequest {
        PublishRequest request;
        std::vector<UA_StatusCode> acknowledgementResults;
        Scheduler::Duration deadline;
    };

    std::vector<std::shared_ptr<Subscription>> snapshotSubscriptions() const;
    Scheduler::Duration requestTimeout(const PublishRequest& request,
                                       const std::vector<std::shared_ptr<Subscription>>& subscriptions) const;
    void serveLateSubscriptions();
    void respondWithStatus(const PublishRequest& request,
                           const std::vector<UA_StatusCode>& acknowledgementResults,
                           UA_StatusCode status);
    void dispatchResponse(const PublishRequest& request, const PublishResponse& response);

    Scheduler& scheduler_;
    const ServiceLimits limits_;
    SendResponseCallback sendResponse_;

    std::map<UA_UInt32, std::shared_ptr<Subscription>> subscriptions_;
    UA_UInt32 nextSubscriptionId_{1};
    std::deque<QueuedRequest> requests_;
    std::deque<UA_UInt32> lateSubscriptions_;
    TimerId housekeepingTimer_{0};
    mutable std::mutex mutex_;

    std::atomic<bool> shutdown_{false};

    // Statistics
    std::atomic<uint64_t> requestsReceived_{0};
    std::atomic<uint64_t> responsesSent_{0};
    std::atomic<uint64_t> dataResponses_{0};
    std::atomic<uint64_t> keepAliveResponses_{0};
    std::atomic<uint64_t> errorResponses_{0};
    std::atomic<uint64_t> timedOutRequests_{0};
    std::atomic<uint64_t> transportFailures_{0};
};

} // namespace opcuasub
