#include "subscription/Subscription.h"
#include "core/ErrorHandler.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <set>
#include <stdexcept>

namespace opcuasub {

namespace {

constexpr UA_UInt32 MAX_ATTRIBUTE_ID = UA_ATTRIBUTEID_ACCESSLEVELEX;

} // namespace

Subscription::Subscription(UA_UInt32 id, const SubscriptionParameters& parameters,
                           Scheduler& scheduler, PublishSink& sink, const ServiceLimits& limits)
    : id_(id)
    , scheduler_(scheduler)
    , sink_(sink)
    , limits_(limits) {
    applyParameters(parameters);
    keepAliveCounter_ = maxKeepAliveCount_;
    lifetimeCounter_ = lifetimeCount_;
}

Subscription::~Subscription() {
    terminate();
}

void Subscription::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::CLOSED || publishTimer_ != 0) {
        return;
    }

    publishTimer_ = schedulePublishing();
    spdlog::info("Subscription {} started (publishing interval: {}ms, keep-alive: {}, lifetime: {})",
                 id_, publishingInterval_, maxKeepAliveCount_, lifetimeCount_);
}

void Subscription::applyParameters(const SubscriptionParameters& parameters) {
    double interval = parameters.publishingInterval;
    if (std::isnan(interval)) {
        interval = limits_.minPublishingInterval;
    }
    publishingInterval_ = std::clamp(interval, limits_.minPublishingInterval,
                                     limits_.maxPublishingInterval);

    maxKeepAliveCount_ = std::clamp<UA_UInt32>(parameters.maxKeepAliveCount, 1,
                                               std::max<UA_UInt32>(limits_.maxKeepAliveCount, 1));

    UA_UInt32 minimumLifetime = maxKeepAliveCount_ * 3;
    lifetimeCount_ = std::max(parameters.lifetimeCount, minimumLifetime);
    if (lifetimeCount_ > limits_.maxLifetimeCount) {
        lifetimeCount_ = std::max(limits_.maxLifetimeCount, minimumLifetime);
    }

    maxNotificationsPerPublish_ = parameters.maxNotificationsPerPublish;
    publishingEnabled_ = parameters.publishingEnabled;
    priority_ = parameters.priority;
}

TimerId Subscription::schedulePublishing() {
    std::weak_ptr<Subscription> weak = weak_from_this();
    return scheduler_.schedulePeriodic(Scheduler::toDuration(publishingInterval_),
                                       TimerPhase::PUBLISHING,
                                       [weak]() {
                                           if (auto subscription = weak.lock()) {
                                               subscription->publishCycle();
                                           }
                                       });
}

TimerId Subscription::scheduleSampling(UA_UInt32 monitoredItemId, double samplingInterval) {
    std::weak_ptr<Subscription> weak = weak_from_this();
    return scheduler_.schedulePeriodic(Scheduler::toDuration(samplingInterval),
                                       TimerPhase::SAMPLING,
                                       [weak, monitoredItemId]() {
                                           if (auto subscription = weak.lock()) {
                                               subscription->onSamplingTimer(monitoredItemId);
                                           }
                                       });
}

void Subscription::onSamplingTimer(UA_UInt32 monitoredItemId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::CLOSED) {
        return;
    }

    auto it = items_.find(monitoredItemId);
    if (it != items_.end()) {
        sampleItem(it->second);
    }
}

void Subscription::sampleItem(ItemEntry& entry) {
    try {
        entry.item->sample(*entry.addressSpace, scheduler_.currentDateTime());
    } catch (const std::exception& e) {
        ErrorHandler::handleError(ErrorHandler::ErrorType::SAMPLING_FAILED,
                                  "Subscription " + std::to_string(id_) + ", monitored item " +
                                  std::to_string(entry.item->getId()) + ": " + e.what());
    }
}

void Subscription::releaseItem(ItemEntry& entry) {
    if (entry.samplingTimer != 0) {
        scheduler_.cancel(entry.samplingTimer);
        entry.samplingTimer = 0;
    }
    if (entry.observer != 0) {
        entry.addressSpace->removeValueObserver(entry.observer);
        entry.observer = 0;
    }
}

MonitoredItemCreateResult Subscription::createMonitoredItem(AddressSpace& addressSpace,
                                                            UA_TimestampsToReturn timestampsToReturn,
                                                            const MonitoredItemCreateRequest& request) {
    MonitoredItemCreateResult result;
    std::vector<MonitoredItemCreatedObserver> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = createMonitoredItemLocked(addressSpace, timestampsToReturn, request);
        if (result.statusCode == UA_STATUSCODE_GOOD) {
            for (const auto& entry : createdObservers_) {
                observers.push_back(entry.second);
            }
        }
    }

    for (auto& observer : observers) {
        ErrorHandler::executeWithErrorHandling(
            [&]() { observer(result.monitoredItemId, request); },
            "Monitored item created observer");
    }

    return result;
}

MonitoredItemCreateResult Subscription::createMonitoredItemLocked(AddressSpace& addressSpace,
                                                                  UA_TimestampsToReturn timestampsToReturn,
                                                                  const MonitoredItemCreateRequest& request) {
    MonitoredItemCreateResult result;

    if (state_ == State::CLOSED) {
        result.statusCode = UA_STATUSCODE_BADSUBSCRIPTIONIDINVALID;
        return result;
    }

    if (items_.size() >= limits_.maxMonitoredItemsPerSubscription) {
        result.statusCode = UA_STATUSCODE_BADTOOMANYMONITOREDITEMS;
        return result;
    }

    if (timestampsToReturn > UA_TIMESTAMPSTORETURN_NEITHER) {
        result.statusCode = UA_STATUSCODE_BADTIMESTAMPSTORETURNINVALID;
        return result;
    }

    if (request.attributeId < UA_ATTRIBUTEID_NODEID || request.attributeId > MAX_ATTRIBUTE_ID) {
        result.statusCode = UA_STATUSCODE_BADATTRIBUTEIDINVALID;
        return result;
    }

    if (!addressSpace.nodeExists(request.nodeId)) {
        result.statusCode = UA_STATUSCODE_BADNODEIDUNKNOWN;
        return result;
    }

    if (request.monitoringMode > UA_MONITORINGMODE_REPORTING) {
        result.statusCode = UA_STATUSCODE_BADMONITORINGMODEINVALID;
        return result;
    }

    std::optional<UA_Range> euRange;
    UA_StatusCode filterStatus = validateFilter(addressSpace, request.nodeId, request.attributeId,
                                                request.requestedParameters.filter, euRange);
    if (filterStatus != UA_STATUSCODE_GOOD) {
        result.statusCode = filterStatus;
        result.filterResult = filterStatus;
        return result;
    }

    UA_UInt32 monitoredItemId = nextMonitoredItemId_++;

    ItemEntry entry;
    entry.addressSpace = &addressSpace;
    double samplingInterval = reviseSamplingInterval(entry, monitoredItemId, request.nodeId,
                                                     request.attributeId,
                                                     request.requestedParameters.samplingInterval);
    UA_UInt32 queueSize = reviseQueueSize(request.requestedParameters.queueSize);

    entry.item = std::make_unique<MonitoredItem>(monitoredItemId, request, timestampsToReturn,
                                                 samplingInterval, queueSize, euRange);
    if (samplingInterval > 0) {
        entry.samplingTimer = scheduleSampling(monitoredItemId, samplingInterval);
    }

    ItemEntry& inserted = items_.emplace(monitoredItemId, std::move(entry)).first->second;

    spdlog::debug("Subscription {}: created monitored item {} for {} (mode: {}, sampling: {}ms, queue: {})",
                  id_, monitoredItemId, request.nodeId, monitoringModeToString(request.monitoringMode),
                  samplingInterval, queueSize);

    // Timer-driven items take their first sample on the first tick
    if (request.monitoringMode != UA_MONITORINGMODE_DISABLED && inserted.samplingTimer == 0) {
        sampleItem(inserted);
    }

    result.statusCode = UA_STATUSCODE_GOOD;
    result.monitoredItemId = monitoredItemId;
    result.revisedSamplingInterval = samplingInterval;
    result.revisedQueueSize = queueSize;
    return result;
}

UA_StatusCode Subscription::validateFilter(AddressSpace& addressSpace, const std::string& nodeId,
                                           UA_UInt32 attributeId,
                                           const std::optional<DataChangeFilter>& filter,
                                           std::optional<UA_Range>& euRange) const {
    if (!filter) {
        return UA_STATUSCODE_GOOD;
    }

    if (attributeId != UA_ATTRIBUTEID_VALUE) {
        return UA_STATUSCODE_BADFILTERNOTALLOWED;
    }

    if (filter->trigger > UA_DATACHANGETRIGGER_STATUSVALUETIMESTAMP) {
        return UA_STATUSCODE_BADMONITOREDITEMFILTERINVALID;
    }

    switch (filter->deadbandType) {
        case UA_DEADBANDTYPE_NONE:
            return UA_STATUSCODE_GOOD;
        case UA_DEADBANDTYPE_ABSOLUTE:
            return filter->deadbandValue < 0.0 ? UA_STATUSCODE_BADDEADBANDFILTERINVALID
                                               : UA_STATUSCODE_GOOD;
        case UA_DEADBANDTYPE_PERCENT:
            if (filter->deadbandValue < 0.0 || filter->deadbandValue > 100.0) {
                return UA_STATUSCODE_BADDEADBANDFILTERINVALID;
            }
            euRange = addressSpace.getEURange(nodeId);
            return euRange ? UA_STATUSCODE_GOOD : UA_STATUSCODE_BADDEADBANDFILTERINVALID;
        default:
            return UA_STATUSCODE_BADDEADBANDFILTERINVALID;
    }
}

double Subscription::reviseSamplingInterval(ItemEntry& entry, UA_UInt32 monitoredItemId,
                                            const std::string& nodeId, UA_UInt32 attributeId,
                                            double requested) {
    if (std::isnan(requested) || requested < 0.0) {
        requested = publishingInterval_;
    }

    if (requested == 0.0) {
        if (entry.observer == 0) {
            std::weak_ptr<Subscription> weak = weak_from_this();
            entry.observer = entry.addressSpace->addValueObserver(
                nodeId, attributeId,
                [weak, monitoredItemId]() {
                    if (auto subscription = weak.lock()) {
                        subscription->onSamplingTimer(monitoredItemId);
                    }
                });
        }
        if (entry.observer != 0) {
            return 0.0;
        }
        return limits_.minSamplingInterval;
    }

    if (entry.observer != 0) {
        entry.addressSpace->removeValueObserver(entry.observer);
        entry.observer = 0;
    }

    return std::clamp(requested, limits_.minSamplingInterval, limits_.maxSamplingInterval);
}

UA_UInt32 Subscription::reviseQueueSize(UA_UInt32 requested) const {
    UA_UInt32 maximum = std::max<UA_UInt32>(limits_.maxQueueSize, 1);
    return std::clamp<UA_UInt32>(requested, 1, maximum);
}

MonitoredItemModifyResult Subscription::modifyMonitoredItem(UA_UInt32 monitoredItemId,
                                                            const MonitoringParameters& parameters) {
    std::lock_guard<std::mutex> lock(mutex_);
    MonitoredItemModifyResult result;

    if (state_ == State::CLOSED) {
        result.statusCode = UA_STATUSCODE_BADSUBSCRIPTIONIDINVALID;
        return result;
    }

    auto it = items_.find(monitoredItemId);
    if (it == items_.end()) {
        result.statusCode = UA_STATUSCODE_BADMONITOREDITEMIDINVALID;
        return result;
    }

    ItemEntry& entry = it->second;
    MonitoredItem& item = *entry.item;

    std::optional<UA_Range> euRange;
    UA_StatusCode filterStatus = validateFilter(*entry.addressSpace, item.getNodeId(),
                                                item.getAttributeId(), parameters.filter, euRange);
    if (filterStatus != UA_STATUSCODE_GOOD) {
        result.statusCode = filterStatus;
        result.filterResult = filterStatus;
        return result;
    }

    double previousInterval = item.getSamplingInterval();
    double samplingInterval = reviseSamplingInterval(entry, monitoredItemId, item.getNodeId(),
                                                     item.getAttributeId(),
                                                     parameters.samplingInterval);
    UA_UInt32 queueSize = reviseQueueSize(parameters.queueSize);

    item.modify(parameters, samplingInterval, queueSize, euRange);

    if (samplingInterval != previousInterval || (samplingInterval > 0 && entry.samplingTimer == 0)) {
        if (entry.samplingTimer != 0) {
            scheduler_.cancel(entry.samplingTimer);
            entry.samplingTimer = 0;
        }
        if (samplingInterval > 0) {
            entry.samplingTimer = scheduleSampling(monitoredItemId, samplingInterval);
        }
    }

    spdlog::debug("Subscription {}: modified monitored item {} (sampling: {}ms, queue: {})",
                  id_, monitoredItemId, samplingInterval, queueSize);

    result.statusCode = UA_STATUSCODE_GOOD;
    result.revisedSamplingInterval = samplingInterval;
    result.revisedQueueSize = queueSize;
    return result;
}

UA_StatusCode Subscription::deleteMonitoredItem(UA_UInt32 monitoredItemId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::CLOSED) {
        return UA_STATUSCODE_BADSUBSCRIPTIONIDINVALID;
    }

    auto it = items_.find(monitoredItemId);
    if (it == items_.end()) {
        return UA_STATUSCODE_BADMONITOREDITEMIDINVALID;
    }

    releaseItem(it->second);
    triggering_.removeItem(monitoredItemId);
    items_.erase(it);

    spdlog::debug("Subscription {}: deleted monitored item {}", id_, monitoredItemId);
    return UA_STATUSCODE_GOOD;
}

std::vector<UA_StatusCode> Subscription::setMonitoringMode(const std::vector<UA_UInt32>& monitoredItemIds,
                                                           UA_MonitoringMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UA_StatusCode> results;
    results.reserve(monitoredItemIds.size());

    for (UA_UInt32 monitoredItemId : monitoredItemIds) {
        if (state_ == State::CLOSED) {
            results.push_back(UA_STATUSCODE_BADSUBSCRIPTIONIDINVALID);
            continue;
        }
        if (mode > UA_MONITORINGMODE_REPORTING) {
            results.push_back(UA_STATUSCODE_BADMONITORINGMODEINVALID);
            continue;
        }

        auto it = items_.find(monitoredItemId);
        if (it == items_.end()) {
            results.push_back(UA_STATUSCODE_BADMONITOREDITEMIDINVALID);
            continue;
        }

        UA_MonitoringMode previous = it->second.item->getMonitoringMode();
        it->second.item->setMonitoringMode(mode);
        if (previous == UA_MONITORINGMODE_DISABLED && mode != UA_MONITORINGMODE_DISABLED &&
            it->second.samplingTimer == 0) {
            sampleItem(it->second);
        }
        results.push_back(UA_STATUSCODE_GOOD);
    }

    return results;
}

SetTriggeringResult Subscription::setTriggering(UA_UInt32 triggeringItemId,
                                                const std::vector<UA_UInt32>& linksToAdd,
                                                const std::vector<UA_UInt32>& linksToRemove) {
    SetTriggeringResult result;
    if (linksToAdd.empty() && linksToRemove.empty()) {
        result.statusCode = UA_STATUSCODE_BADNOTHINGTODO;
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto trigger = items_.find(triggeringItemId);
    if (trigger == items_.end()) {
        result.statusCode = UA_STATUSCODE_BADMONITOREDITEMIDINVALID;
        return result;
    }

    result.removeResults.reserve(linksToRemove.size());
    for (UA_UInt32 reportItemId : linksToRemove) {
        if (items_.count(reportItemId) == 0) {
            result.removeResults.push_back(UA_STATUSCODE_BADMONITOREDITEMIDINVALID);
            continue;
        }
        triggering_.removeLink(triggeringItemId, reportItemId);
        result.removeResults.push_back(UA_STATUSCODE_GOOD);
    }

    uint64_t armedSequence = trigger->second.item->getEnqueueSequence();
    result.addResults.reserve(linksToAdd.size());
    for (UA_UInt32 reportItemId : linksToAdd) {
        if (items_.count(reportItemId) == 0) {
            result.addResults.push_back(UA_STATUSCODE_BADMONITOREDITEMIDINVALID);
            continue;
        }
        triggering_.addLink(triggeringItemId, reportItemId, armedSequence);
        result.addResults.push_back(UA_STATUSCODE_GOOD);
    }

    spdlog::debug("Subscription {}: set triggering for item {} (add: {}, remove: {})",
                  id_, triggeringItemId, statusCodeListToString(result.addResults),
                  statusCodeListToString(result.removeResults));

    result.statusCode = UA_STATUSCODE_GOOD;
    return result;
}

void Subscription::modify(const SubscriptionParameters& parameters) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::CLOSED) {
        return;
    }

    double previousInterval = publishingInterval_;
    applyParameters(parameters);
    keepAliveCounter_ = maxKeepAliveCount_;
    lifetimeCounter_ = lifetimeCount_;

    if (publishTimer_ != 0 && publishingInterval_ != previousInterval) {
        scheduler_.cancel(publishTimer_);
        publishTimer_ = schedulePublishing();
    }

    spdlog::info("Subscription {} modified (publishing interval: {}ms, keep-alive: {}, lifetime: {})",
                 id_, publishingInterval_, maxKeepAliveCount_, lifetimeCount_);
}

void Subscription::setPublishingMode(bool publishingEnabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    publishingEnabled_ = publishingEnabled;
    spdlog::debug("Subscription {}: publishing {}", id_, publishingEnabled ? "enabled" : "disabled");
}

UA_StatusCode Subscription::acknowledge(UA_UInt32 sequenceNumber) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(retransmissionQueue_.begin(), retransmissionQueue_.end(),
                           [sequenceNumber](const NotificationMessage& message) {
                               return message.sequenceNumber == sequenceNumber;
                           });
    if (it == retransmissionQueue_.end()) {
        return UA_STATUSCODE_BADSEQUENCENUMBERUNKNOWN;
    }

    retransmissionQueue_.erase(it);
    return UA_STATUSCODE_GOOD;
}

UA_StatusCode Subscription::republish(UA_UInt32 sequenceNumber, NotificationMessage& message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& retained : retransmissionQueue_) {
        if (retained.sequenceNumber == sequenceNumber) {
            message = retained;
            return UA_STATUSCODE_GOOD;
        }
    }
    return UA_STATUSCODE_BADMESSAGENOTAVAILABLE;
}

std::vector<UA_UInt32> Subscription::availableSequenceNumbers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return availableSequenceNumbersLocked();
}

std::vector<UA_UInt32> Subscription::availableSequenceNumbersLocked() const {
    std::vector<UA_UInt32> sequenceNumbers;
    sequenceNumbers.reserve(retransmissionQueue_.size());
    for (const auto& message : retransmissionQueue_) {
        sequenceNumbers.push_back(message.sequenceNumber);
    }
    return sequenceNumbers;
}

Subscription::ObserverToken Subscription::onMonitoredItemCreated(MonitoredItemCreatedObserver observer) {
    if (!observer) {
        throw std::invalid_argument("Monitored item observer cannot be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ObserverToken token = nextObserverToken_++;
    createdObservers_.emplace(token, std::move(observer));
    return token;
}

void Subscription::removeObserver(ObserverToken token) {
    std::lock_guard<std::mutex> lock(mutex_);
    createdObservers_.erase(token);
}

void Subscription::publishCycle() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::CLOSED) {
        return;
    }

    ++publishCycleCount_;

    if (state_ == State::LATE) {
        // The held message goes out before anything newer
        bool delivered = heldMessage_ &&
                         sink_.deliver(id_, *heldMessage_, availableSequenceNumbersLocked());
        if (delivered) {
            bool keepAlive = heldMessage_->isKeepAlive();
            heldMessage_.reset();
            onDelivered(keepAlive);
        }
        updateLifetime(delivered);
        return;
    }

    std::optional<NotificationMessage> message = collectNotifications();
    if (message) {
        keepAliveCounter_ = maxKeepAliveCount_;
        sendMessage(std::move(*message));
        return;
    }

    if (!messageSent_ || keepAliveCounter_ <= 1) {
        keepAliveCounter_ = maxKeepAliveCount_;
        sendMessage(makeKeepAlive());
        return;
    }

    --keepAliveCounter_;
    updateLifetime(false);
}

std::optional<NotificationMessage> Subscription::collectNotifications() {
    if (!publishingEnabled_) {
        return std::nullopt;
    }

    std::vector<UA_UInt32> emitOrder;
    std::set<UA_UInt32> marked;

    for (auto& [itemId, entry] : items_) {
        MonitoredItem& item = *entry.item;
        if (item.getMonitoringMode() == UA_MONITORINGMODE_DISABLED || !item.hasPendingNotification()) {
            continue;
        }

        if (item.getMonitoringMode() == UA_MONITORINGMODE_REPORTING && marked.insert(itemId).second) {
            emitOrder.push_back(itemId);
        }

        for (UA_UInt32 reportItemId : triggering_.fire(itemId, item.getEnqueueSequence())) {
            auto report = items_.find(reportItemId);
            if (report == items_.end()) {
                continue;
            }

            const MonitoredItem& reportItem = *report->second.item;
            if (reportItem.getMonitoringMode() == UA_MONITORINGMODE_SAMPLING &&
                reportItem.hasPendingNotification() && marked.insert(reportItemId).second) {
                emitOrder.push_back(reportItemId);
            }
        }
    }

    if (emitOrder.empty()) {
        return std::nullopt;
    }

    DataChangeNotification dataChange;
    for (UA_UInt32 itemId : emitOrder) {
        MonitoredItem& item = *items_.at(itemId).item;
        if (item.getMonitoringMode() == UA_MONITORINGMODE_SAMPLING) {
            if (auto newest = item.extractNewestNotification()) {
                dataChange.monitoredItems.push_back(std::move(*newest));
            }
            continue;
        }

        auto notifications = item.extractNotifications();
        std::move(notifications.begin(), notifications.end(),
                  std::back_inserter(dataChange.monitoredItems));
    }

    if (dataChange.monitoredItems.empty()) {
        return std::nullopt;
    }

    notificationCount_ += dataChange.monitoredItems.size();

    NotificationMessage message;
    message.sequenceNumber = consumeSequenceNumber();
    message.publishTime = scheduler_.currentDateTime();
    message.notificationData.emplace_back(std::move(dataChange));
    retain(message);

    spdlog::trace("Subscription {}: message {} with {} notifications", id_,
                  message.sequenceNumber, message.dataChangeCount());
    return message;
}

NotificationMessage Subscription::makeKeepAlive() const {
    NotificationMessage message;
    message.sequenceNumber = nextSequenceNumber_;
    message.publishTime = scheduler_.currentDateTime();
    return message;
}

UA_UInt32 Subscription::consumeSequenceNumber() {
    UA_UInt32 sequenceNumber = nextSequenceNumber_;
    // Sequence numbers wrap around to 1; 0 is never used
    nextSequenceNumber_ = nextSequenceNumber_ == std::numeric_limits<UA_UInt32>::max()
                              ? 1 : nextSequenceNumber_ + 1;
    return sequenceNumber;
}

void Subscription::retain(const NotificationMessage& message) {
    if (limits_.maxRetransmissionQueueSize == 0) {
        return;
    }

    retransmissionQueue_.push_back(message);
    while (retransmissionQueue_.size() > limits_.maxRetransmissionQueueSize) {
        retransmissionQueue_.pop_front();
        ++discardedMessageCount_;
    }
}

void Subscription::sendMessage(NotificationMessage message) {
    bool delivered = sink_.deliver(id_, message, availableSequenceNumbersLocked());
    if (delivered) {
        onDelivered(message.isKeepAlive());
    } else {
        if (state_ != State::LATE) {
            ++lateCount_;
            spdlog::debug("Subscription {} is late (no publish request available)", id_);
        }
        heldMessage_ = std::move(message);
        state_ = State::LATE;
    }

    updateLifetime(delivered);
}

void Subscription::onDelivered(bool keepAlive) {
    if (keepAlive) {
        ++keepAliveMessageCount_;
    } else {
        ++dataMessageCount_;
    }

    state_ = (keepAlive && messageSent_) ? State::KEEPALIVE : State::NORMAL;
    messageSent_ = true;
}

void Subscription::updateLifetime(bool delivered) {
    if (delivered || sink_.hasPendingRequests()) {
        lifetimeCounter_ = lifetimeCount_;
        return;
    }

    if (lifetimeCounter_ > 0) {
        --lifetimeCounter_;
    }
    if (lifetimeCounter_ == 0) {
        expireLifetime();
    }
}

void Subscription::expireLifetime() {
    spdlog::warn("Subscription {} lifetime expired after {} publishing intervals without a publish request",
                 id_, lifetimeCount_);

    terminateLocked();

    NotificationMessage message;
    message.sequenceNumber = consumeSequenceNumber();
    message.publishTime = scheduler_.currentDateTime();
    message.notificationData.emplace_back(StatusChangeNotification{UA_STATUSCODE_BADTIMEOUT});

    if (!sink_.deliver(id_, message, {})) {
        heldMessage_ = std::move(message);
    }
}

bool Subscription::publishLateMessage() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!heldMessage_ || (state_ != State::LATE && state_ != State::CLOSED)) {
        return false;
    }

    if (state_ == State::LATE && heldMessage_->isKeepAlive()) {
        std::optional<NotificationMessage> data = collectNotifications();
        if (data) {
            heldMessage_ = std::move(data);
            keepAliveCounter_ = maxKeepAliveCount_;
        }
    }

    if (!sink_.deliver(id_, *heldMessage_, availableSequenceNumbersLocked())) {
        return false;
    }

    bool keepAlive = heldMessage_->isKeepAlive();
    heldMessage_.reset();
    if (state_ != State::CLOSED) {
        lifetimeCounter_ = lifetimeCount_;
        onDelivered(keepAlive);
    }
    return true;
}

void Subscription::terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::CLOSED) {
        // A lifetime expiry may still hold its status change message
        heldMessage_.reset();
        return;
    }

    terminateLocked();
}

void Subscription::terminateLocked() {
    if (state_ == State::CLOSED) {
        return;
    }

    if (publishTimer_ != 0) {
        scheduler_.cancel(publishTimer_);
        publishTimer_ = 0;
    }

    for (auto& entry : items_) {
        releaseItem(entry.second);
    }
    items_.clear();
    triggering_.clear();
    heldMessage_.reset();
    retransmissionQueue_.clear();
    state_ = State::CLOSED;

    spdlog::info("Subscription {} closed", id_);
}

Subscription::State Subscription::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Subscription::isClosed() const {
    return getState() == State::CLOSED;
}

bool Subscription::hasHeldMessage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heldMessage_.has_value();
}

double Subscription::getPublishingInterval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publishingInterval_;
}

UA_UInt32 Subscription::getLifetimeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lifetimeCount_;
}

UA_UInt32 Subscription::getMaxKeepAliveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxKeepAliveCount_;
}

UA_UInt32 Subscription::getKeepAliveCounter() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keepAliveCounter_;
}

UA_UInt32 Subscription::getLifetimeCounter() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lifetimeCounter_;
}

bool Subscription::isPublishingEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publishingEnabled_;
}

size_t Subscription::getMonitoredItemCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

std::vector<UA_UInt32> Subscription::getMonitoredItemIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UA_UInt32> ids;
    ids.reserve(items_.size());
    for (const auto& entry : items_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::optional<nlohmann::json> Subscription::getMonitoredItemDiagnostics(UA_UInt32 monitoredItemId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(monitoredItemId);
    if (it == items_.end()) {
        return std::nullopt;
    }

    nlohmann::json diagnostics = it->second.item->getDiagnostics();
    diagnostics["triggers"] = triggering_.getReportItems(monitoredItemId);
    return diagnostics;
}

nlohmann::json Subscription::getDiagnostics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json items = nlohmann::json::array();
    for (const auto& [itemId, entry] : items_) {
        nlohmann::json item = entry.item->getDiagnostics();
        item["triggers"] = triggering_.getReportItems(itemId);
        items.push_back(item);
    }

    return {
        {"subscriptionId", id_},
        {"state", stateToString(state_)},
        {"publishingInterval", publishingInterval_},
        {"maxKeepAliveCount", maxKeepAliveCount_},
        {"lifetimeCount", lifetimeCount_},
        {"maxNotificationsPerPublish", maxNotificationsPerPublish_},
        {"publishingEnabled", publishingEnabled_},
        {"priority", priority_},
        {"keepAliveCounter", keepAliveCounter_},
        {"lifetimeCounter", lifetimeCounter_},
        {"nextSequenceNumber", nextSequenceNumber_},
        {"availableSequenceNumbers", availableSequenceNumbersLocked()},
        {"triggeringLinks", triggering_.linkCount()},
        {"publishCycles", publishCycleCount_},
        {"dataMessages", dataMessageCount_},
        {"keepAliveMessages", keepAliveMessageCount_},
        {"notifications", notificationCount_},
        {"lateCount", lateCount_},
        {"discardedMessages", discardedMessageCount_},
        {"monitoredItems", items}
    };
}

std::string Subscription::stateToString(State state) {
    switch (state) {
        case State::CREATING:
            return "CREATING";
        case State::NORMAL:
            return "NORMAL";
        case State::LATE:
            return "LATE";
        case State::KEEPALIVE:
            return "KEEPALIVE";
        case State::CLOSED:
            return "CLOSED";
        default:
            return "UNKNOWN";
    }
}

} // namespace opcuasub
