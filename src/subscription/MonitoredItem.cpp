#include "subscription/MonitoredItem.h"
#include "addressspace/AddressSpace.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace opcuasub {

MonitoredItem::MonitoredItem(UA_UInt32 id,
                             const MonitoredItemCreateRequest& request,
                             UA_TimestampsToReturn timestampsToReturn,
                             double revisedSamplingInterval,
                             UA_UInt32 revisedQueueSize,
                             std::optional<UA_Range> euRange)
    : id_(id)
    , nodeId_(request.nodeId)
    , attributeId_(request.attributeId)
    , timestampsToReturn_(timestampsToReturn)
    , clientHandle_(request.requestedParameters.clientHandle)
    , monitoringMode_(request.monitoringMode)
    , samplingInterval_(revisedSamplingInterval)
    , queueSize_(std::max<UA_UInt32>(revisedQueueSize, 1))
    , discardOldest_(request.requestedParameters.discardOldest)
    , filter_(request.requestedParameters.filter)
    , euRange_(euRange) {
}

bool MonitoredItem::sample(AddressSpace& addressSpace, UA_DateTime now) {
    if (monitoringMode_ == UA_MONITORINGMODE_DISABLED) {
        return false;
    }

    ++sampleCount_;

    if (!addressSpace.nodeExists(nodeId_)) {
        if (nodeMissingReported_) {
            return false;
        }

        nodeMissingReported_ = true;
        spdlog::warn("Monitored item {}: node {} no longer exists", id_, nodeId_);

        DataValue missing = DataValue::fromStatus(UA_STATUSCODE_BADNODEIDUNKNOWN, now);
        lastValue_ = missing;
        missing.applyTimestampsToReturn(timestampsToReturn_, now);
        enqueue(std::move(missing));
        return true;
    }

    if (nodeMissingReported_) {
        spdlog::info("Monitored item {}: node {} is available again", id_, nodeId_);
        nodeMissingReported_ = false;
    }

    return processValue(addressSpace.readAttributeValue(nodeId_, attributeId_), now);
}

bool MonitoredItem::processValue(DataValue value, UA_DateTime now) {
    if (monitoringMode_ == UA_MONITORINGMODE_DISABLED) {
        return false;
    }

    if (!value.raw().hasServerTimestamp) {
        value.setServerTimestamp(now);
    }

    if (!passesFilter(value)) {
        return false;
    }

    lastValue_ = value;
    value.applyTimestampsToReturn(timestampsToReturn_, now);
    enqueue(std::move(value));
    return true;
}

bool MonitoredItem::passesFilter(const DataValue& value) const {
    if (!lastValue_ || !filter_) {
        return true;
    }

    if (value.status() != lastValue_->status()) {
        return true;
    }

    if (filter_->trigger == UA_DATACHANGETRIGGER_STATUS) {
        return false;
    }

    if (valueChanged(value)) {
        return true;
    }

    return filter_->trigger == UA_DATACHANGETRIGGER_STATUSVALUETIMESTAMP &&
           value.sourceTimestamp() != lastValue_->sourceTimestamp();
}

bool MonitoredItem::valueChanged(const DataValue& value) const {
    const DataValue& last = *lastValue_;
    if (filter_->deadbandType == UA_DEADBANDTYPE_NONE) {
        return !value.sameValue(last);
    }

    auto newValue = value.numericValue();
    auto oldValue = last.numericValue();
    if (!newValue || !oldValue) {
        return !value.sameValue(last);
    }

    // NaN compares false against any threshold
    if (std::isnan(*newValue) || std::isnan(*oldValue)) {
        return std::isnan(*newValue) != std::isnan(*oldValue);
    }

    double threshold = filter_->deadbandValue;
    if (filter_->deadbandType == UA_DEADBANDTYPE_PERCENT) {
        if (!euRange_) {
            return !value.sameValue(last);
        }
        threshold = filter_->deadbandValue / 100.0 * (euRange_->high - euRange_->low);
    }

    return std::fabs(*newValue - *oldValue) > threshold;
}

void MonitoredItem::enqueue(DataValue value) {
    ++enqueueSequence_;

    if (queue_.size() >= queueSize_) {
        overflow_ = true;
        ++discardedCount_;
        if (discardOldest_) {
            queue_.pop_front();
        } else {
            queue_.pop_back();
        }
        spdlog::trace("Monitored item {}: queue overflow (size {})", id_, queueSize_);
    }

    queue_.push_back(std::move(value));
}

std::vector<MonitoredItemNotification> MonitoredItem::extractNotifications() {
    std::vector<MonitoredItemNotification> notifications;
    if (queue_.empty()) {
        overflow_ = false;
        return notifications;
    }

    // A single-slot queue always holds the newest value; no overflow is signalled
    if (overflow_ && queueSize_ > 1) {
        DataValue& flagged = discardOldest_ ? queue_.front() : queue_.back();
        flagged.setStatus(flagged.status() | OVERFLOW_INFO_BITS);
    }

    notifications.reserve(queue_.size());
    for (auto& value : queue_) {
        notifications.push_back(MonitoredItemNotification{clientHandle_, std::move(value)});
    }

    queue_.clear();
    overflow_ = false;
    return notifications;
}

std::optional<MonitoredItemNotification> MonitoredItem::extractNewestNotification() {
    if (queue_.empty()) {
        overflow_ = false;
        return std::nullopt;
    }

    DataValue newest = std::move(queue_.back());
    if (overflow_ && queueSize_ > 1) {
        newest.setStatus(newest.status() | OVERFLOW_INFO_BITS);
    }

    discardedCount_ += queue_.size() - 1;
    queue_.clear();
    overflow_ = false;
    return MonitoredItemNotification{clientHandle_, std::move(newest)};
}

bool MonitoredItem::hasPendingNotification() const {
    return !queue_.empty() && monitoringMode_ != UA_MONITORINGMODE_DISABLED;
}

void MonitoredItem::setMonitoringMode(UA_MonitoringMode mode) {
    if (mode == monitoringMode_) {
        return;
    }

    spdlog::debug("Monitored item {}: monitoring mode {} -> {}", id_,
                  monitoringModeToString(monitoringMode_), monitoringModeToString(mode));
    monitoringMode_ = mode;

    if (mode == UA_MONITORINGMODE_DISABLED) {
        queue_.clear();
        overflow_ = false;
        lastValue_.reset();
        nodeMissingReported_ = false;
    }
}

void MonitoredItem::modify(const MonitoringParameters& parameters,
                           double revisedSamplingInterval,
                           UA_UInt32 revisedQueueSize,
                           std::optional<UA_Range> euRange) {
    clientHandle_ = parameters.clientHandle;
    samplingInterval_ = revisedSamplingInterval;
    discardOldest_ = parameters.discardOldest;
    filter_ = parameters.filter;
    euRange_ = euRange;
    queueSize_ = std::max<UA_UInt32>(revisedQueueSize, 1);
    trimQueue();
}

void MonitoredItem::trimQueue() {
    while (queue_.size() > queueSize_) {
        overflow_ = true;
        ++discardedCount_;
        if (discardOldest_) {
            queue_.pop_front();
        } else {
            // Keep the newest value, drop the one queued just before it
            queue_.erase(queue_.end() - 2);
        }
    }
}

nlohmann::json MonitoredItem::getDiagnostics() const {
    nlohmann::json diagnostics = {
        {"monitoredItemId", id_},
        {"clientHandle", clientHandle_},
        {"nodeId", nodeId_},
        {"attributeId", attributeId_},
        {"monitoringMode", monitoringModeToString(monitoringMode_)},
        {"samplingInterval", samplingInterval_},
        {"queueSize", queueSize_},
        {"discardOldest", discardOldest_},
        {"queueLength", queue_.size()},
        {"overflow", overflow_},
        {"sampleCount", sampleCount_},
        {"enqueuedCount", enqueueSequence_},
        {"discardedCount", discardedCount_}
    };

    if (filter_) {
        diagnostics["filter"] = {
            {"trigger", static_cast<int>(filter_->trigger)},
            {"deadbandType", static_cast<int>(filter_->deadbandType)},
            {"deadbandValue", filter_->deadbandValue}
        };
    }

    if (lastValue_) {
        diagnostics["lastValue"] = lastValue_->toJson();
    }

    return diagnostics;
}

} // namespace opcuasub
