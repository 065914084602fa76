#pragma once

#include <map>
#include <deque>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstdint>

#include <open62541/types.h>
#include <nlohmann/json.hpp>

#include "addressspace/AddressSpace.h"
#include "subscription/MonitoredItem.h"
#include "subscription/PublishSink.h"
#include "subscription/SubscriptionTypes.h"
#include "subscription/TriggeringTable.h"
#include "timing/Scheduler.h"

namespace opcuasub {

/**
 * @brief A set of monitored items published on a common publishing interval
 *
 * Runs the publish cycle: resolves monitoring modes and triggering links to
 * the items that report, assembles NotificationMessages, and drives the
 * keep-alive and lifetime counters. Sampling timers, publish cycles and all
 * service calls are serialized by one mutex per subscription.
 *
 * Timer callbacks hold weak references, so a Subscription must be owned by a
 * std::shared_ptr before start() or createMonitoredItem() is called.
 */
class Subscription : public std::enable_shared_from_this<Subscription> {
public:
    enum class State {
        CREATING,
        NORMAL,
        LATE,
        KEEPALIVE,
        CLOSED
    };

    using MonitoredItemCreatedObserver =
        std::function<void(UA_UInt32 monitoredItemId, const MonitoredItemCreateRequest& request)>;
    using ObserverToken = uint64_t;

    /**
     * @brief Constructor
     * @param id Server-assigned subscription identifier
     * @param parameters Requested parameters (revised against limits)
     * @param scheduler Clock driving sampling and publishing (must outlive this object)
     * @param sink Receiver of produced messages (must outlive this object)
     * @param limits Service limits used for parameter revision
     */
    Subscription(UA_UInt32 id, const SubscriptionParameters& parameters,
                 Scheduler& scheduler, PublishSink& sink, const ServiceLimits& limits);

    /**
     * @brief Destructor - terminates the subscription
     */
    ~Subscription();

    // Disable copy constructor and assignment operator
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /**
     * @brief Start the publishing timer
     */
    void start();

    /**
     * @brief Create a monitored item sampling one attribute of a node
     * @param addressSpace Node store to sample from (must outlive the item)
     * @param timestampsToReturn Timestamps kept on notifications
     * @param request Item parameters
     * @return Result with the assigned id and revised parameters
     */
    MonitoredItemCreateResult createMonitoredItem(AddressSpace& addressSpace,
                                                  UA_TimestampsToReturn timestampsToReturn,
                                                  const MonitoredItemCreateRequest& request);

    MonitoredItemModifyResult modifyMonitoredItem(UA_UInt32 monitoredItemId,
                                                  const MonitoringParameters& parameters);

    UA_StatusCode deleteMonitoredItem(UA_UInt32 monitoredItemId);

    /**
     * @brief Change the monitoring mode of several items
     * @return One status code per id, in input order
     */
    std::vector<UA_StatusCode> setMonitoringMode(const std::vector<UA_UInt32>& monitoredItemIds,
                                                 UA_MonitoringMode mode);

    /**
     * @brief Add and remove triggering links of one triggering item
     *
     * Removals are applied before additions. A new link is armed at the
     * triggering item's current enqueue sequence, so only values queued
     * afterwards fire it.
     *
     * @param triggeringItemId Triggering item
     * @param linksToAdd Report items to link
     * @param linksToRemove Report items to unlink
     * @return Overall status plus per-link results in input order
     */
    SetTriggeringResult setTriggering(UA_UInt32 triggeringItemId,
                                      const std::vector<UA_UInt32>& linksToAdd,
                                      const std::vector<UA_UInt32>& linksToRemove);

    /**
     * @brief Apply new publishing parameters; counters restart
     */
    void modify(const SubscriptionParameters& parameters);

    void setPublishingMode(bool publishingEnabled);

    /**
     * @brief Retire a message from the retransmission queue
     * @return Good or BadSequenceNumberUnknown
     */
    UA_StatusCode acknowledge(UA_UInt32 sequenceNumber);

    /**
     * @brief Copy a retained message for retransmission
     * @return Good or BadMessageNotAvailable
     */
    UA_StatusCode republish(UA_UInt32 sequenceNumber, NotificationMessage& message) const;

    std::vector<UA_UInt32> availableSequenceNumbers() const;

    /**
     * @brief Register an observer invoked after each successful item creation
     * @return Token for removeObserver()
     */
    ObserverToken onMonitoredItemCreated(MonitoredItemCreatedObserver observer);
    void removeObserver(ObserverToken token);

    /**
     * @brief Run one publish cycle; normally driven by the publishing timer
     */
    void publishCycle();

    /**
     * @brief Deliver the message held while the subscription was late
     *
     * Called by the publish engine when a request arrives. A held keep-alive
     * is replaced by a data message if notifications became available.
     *
     * @return true if a message was delivered
     */
    bool publishLateMessage();

    /**
     * @brief Stop all timers and release items, links and the held message
     *
     * Idempotent. The subscription ends in CLOSED.
     */
    void terminate();

    UA_UInt32 getId() const { return id_; }
    State getState() const;
    bool isClosed() const;
    bool hasHeldMessage() const;
    double getPublishingInterval() const;
    UA_UInt32 getLifetimeCount() const;
    UA_UInt32 getMaxKeepAliveCount() const;
    UA_UInt32 getKeepAliveCounter() const;
    UA_UInt32 getLifetimeCounter() const;
    bool isPublishingEnabled() const;
    size_t getMonitoredItemCount() const;
    std::vector<UA_UInt32> getMonitoredItemIds() const;

    /**
     * @brief Diagnostics of one monitored item
     * @return JSON object, or nullopt for an unknown id
     */
    std::optional<nlohmann::json> getMonitoredItemDiagnostics(UA_UInt32 monitoredItemId) const;

    nlohmann::json getDiagnostics() const;

    static std::string stateToString(State state);

private:
    struct ItemEntry {
        std::unique_ptr<MonitoredItem> item;
        AddressSpace* addressSpace{nullptr};
        TimerId samplingTimer{0};
        AddressSpace::ObserverHandle observer{0};
    };

    void applyParameters(const SubscriptionParameters& parameters);
    TimerId schedulePublishing();
    TimerId scheduleSampling(UA_UInt32 monitoredItemId, double samplingInterval);
    void onSamplingTimer(UA_UInt32 monitoredItemId);
    void sampleItem(ItemEntry& entry);
    void releaseItem(ItemEntry& entry);

    MonitoredItemCreateResult createMonitoredItemLocked(AddressSpace& addressSpace,
                                                        UA_TimestampsToReturn timestampsToReturn,
                                                        const MonitoredItemCreateRequest& request);
    UA_StatusCode validateFilter(AddressSpace& addressSpace, const std::string& nodeId,
                                 UA_UInt32 attributeId,
                                 const std::optional<DataChangeFilter>& filter,
                                 std::optional<UA_Range>& euRange) const;
    double reviseSamplingInterval(ItemEntry& entry, UA_UInt32 monitoredItemId,
                                  const std::string& nodeId, UA_UInt32 attributeId,
                                  double requested);
    UA_UInt32 reviseQueueSize(UA_UInt32 requested) const;

    /**
     * @brief Build the data message of one publish cycle, if any item has data
     *
     * Items are visited once, in ascending id order. A Reporting item with
     * pending data is appended when visited; the Sampling report items its
     * triggering links fire follow it in link order. Marking is first come:
     * a Reporting item whose id is higher than a report item marked earlier
     * lands after that report item. A Sampling report item contributes only
     * its newest queued value.
     */
    std::optional<NotificationMessage> collectNotifications();
    NotificationMessage makeKeepAlive() const;
    UA_UInt32 consumeSequenceNumber();
    void retain(const NotificationMessage& message);
    std::vector<UA_UInt32> availableSequenceNumbersLocked() const;
    void sendMessage(NotificationMessage message);
    void onDelivered(bool keepAlive);
    void updateLifetime(bool delivered);
    void expireLifetime();
    void terminateLocked();

    const UA_UInt32 id_;
    Scheduler& scheduler_;
    PublishSink& sink_;
    const ServiceLimits limits_;

    double publishingInterval_{0.0};
    UA_UInt32 maxKeepAliveCount_{0};
    UA_UInt32 lifetimeCount_{0};
    UA_UInt32 maxNotificationsPerPublish_{0};
    bool publishingEnabled_{true};
    UA_Byte priority_{0};

    State state_{State::CREATING};
    UA_UInt32 keepAliveCounter_{0};
    UA_UInt32 lifetimeCounter_{0};
    UA_UInt32 nextSequenceNumber_{1};
    bool messageSent_{false};

    TimerId publishTimer_{0};
    std::map<UA_UInt32, ItemEntry> items_;
    UA_UInt32 nextMonitoredItemId_{1};
    TriggeringTable triggering_;

    std::optional<NotificationMessage> heldMessage_;
    std::deque<NotificationMessage> retransmissionQueue_;

    std::map<ObserverToken, MonitoredItemCreatedObserver> createdObservers_;
    ObserverToken nextObserverToken_{1};

    // Statistics
    uint64_t publishCycleCount_{0};
    uint64_t dataMessageCount_{0};
    uint64_t keepAliveMessageCount_{0};
    uint64_t notificationCount_{0};
    uint64_t lateCount_{0};
    uint64_t discardedMessageCount_{0};

    mutable std::mutex mutex_;
};

} // namespace opcuasub
