#pragma once

#include <deque>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

#include <open62541/types.h>
#include <nlohmann/json.hpp>

#include "core/DataValue.h"
#include "subscription/SubscriptionTypes.h"

namespace opcuasub {

class AddressSpace;

/**
 * @brief Samples one attribute, filters changes and buffers notifications
 *
 * A MonitoredItem only knows whether it may sample (anything but Disabled)
 * and what it has queued. Which items report in a publish cycle is decided
 * by the owning Subscription. Not thread-safe; the owning Subscription
 * serializes all access.
 */
class MonitoredItem {
public:
    /**
     * @brief Status InfoBits marking a value that follows a queue overflow
     *
     * InfoType DataValue (0x400) combined with the Overflow bit (0x80).
     */
    static constexpr UA_StatusCode OVERFLOW_INFO_BITS = 0x00000480;

    /**
     * @brief Constructor
     * @param id Server-assigned identifier
     * @param request Create request (target, mode, client handle, filter)
     * @param timestampsToReturn Timestamps kept on queued values
     * @param revisedSamplingInterval Sampling interval after revision (0: on change)
     * @param revisedQueueSize Queue capacity after revision (at least 1)
     * @param euRange EURange of the node, used by percent deadbands
     */
    MonitoredItem(UA_UInt32 id,
                  const MonitoredItemCreateRequest& request,
                  UA_TimestampsToReturn timestampsToReturn,
                  double revisedSamplingInterval,
                  UA_UInt32 revisedQueueSize,
                  std::optional<UA_Range> euRange = std::nullopt);

    // Disable copy constructor and assignment operator
    MonitoredItem(const MonitoredItem&) = delete;
    MonitoredItem& operator=(const MonitoredItem&) = delete;

    UA_UInt32 getId() const { return id_; }
    UA_UInt32 getClientHandle() const { return clientHandle_; }
    const std::string& getNodeId() const { return nodeId_; }
    UA_UInt32 getAttributeId() const { return attributeId_; }
    UA_MonitoringMode getMonitoringMode() const { return monitoringMode_; }
    double getSamplingInterval() const { return samplingInterval_; }
    UA_UInt32 getQueueSize() const { return queueSize_; }
    bool getDiscardOldest() const { return discardOldest_; }
    const std::optional<DataChangeFilter>& getFilter() const { return filter_; }

    /**
     * @brief Sample the attribute through the address space
     *
     * Disabled items never read. A node that disappeared queues a single
     * BadNodeIdUnknown notification until it is present again.
     *
     * @param addressSpace Node store to read from
     * @param now Server time of the sample
     * @return true if a notification was queued
     */
    bool sample(AddressSpace& addressSpace, UA_DateTime now);

    /**
     * @brief Run a freshly read value through the filter and queue it if it passes
     * @param value Value as read from the node
     * @param now Server time of the sample
     * @return true if the value was queued
     */
    bool processValue(DataValue value, UA_DateTime now);

    /**
     * @brief Remove and return all queued notifications
     *
     * When the queue overflowed since the last extraction, the overflow
     * InfoBits are set on the oldest value (discardOldest) or the newest value.
     */
    std::vector<MonitoredItemNotification> extractNotifications();

    /**
     * @brief Remove all queued values and return only the newest one
     *
     * Used when a triggering link flushes an item in Sampling mode. The
     * older values are dropped; a queue overflow is still flagged.
     */
    std::optional<MonitoredItemNotification> extractNewestNotification();

    /**
     * @brief True if something is queued and the item is not Disabled
     */
    bool hasPendingNotification() const;

    /**
     * @brief Change the monitoring mode; Disabled drops the queue and baseline
     */
    void setMonitoringMode(UA_MonitoringMode mode);

    /**
     * @brief Apply revised parameters of a modify request
     *
     * Shrinking the queue discards values per discardOldest and flags an overflow.
     */
    void modify(const MonitoringParameters& parameters,
                double revisedSamplingInterval,
                UA_UInt32 revisedQueueSize,
                std::optional<UA_Range> euRange);

    size_t queueLength() const { return queue_.size(); }
    bool hasOverflowed() const { return overflow_; }

    /**
     * @brief Number of notifications ever queued by this item
     */
    uint64_t getEnqueueSequence() const { return enqueueSequence_; }

    uint64_t getSampleCount() const { return sampleCount_; }

    nlohmann::json getDiagnostics() const;

private:
    bool passesFilter(const DataValue& value) const;
    bool valueChanged(const DataValue& value) const;
    void enqueue(DataValue value);
    void trimQueue();

    const UA_UInt32 id_;
    const std::string nodeId_;
    const UA_UInt32 attributeId_;
    const UA_TimestampsToReturn timestampsToReturn_;

    UA_UInt32 clientHandle_;
    UA_MonitoringMode monitoringMode_;
    double samplingInterval_;
    UA_UInt32 queueSize_;
    bool discardOldest_;
    std::optional<DataChangeFilter> filter_;
    std::optional<UA_Range> euRange_;

    std::deque<DataValue> queue_;
    std::optional<DataValue> lastValue_;        // Deadband baseline
    bool overflow_{false};
    bool nodeMissingReported_{false};
    uint64_t enqueueSequence_{0};
    uint64_t sampleCount_{0};
    uint64_t discardedCount_{0};
};

} // namespace opcuasub
