#include "SubscriptionTestBase.h"
#include <algorithm>
#include <variant>

namespace opcuasub {
namespace test {

bool RecordingPublishSink::deliver(UA_UInt32 subscriptionId, const NotificationMessage& message,
                                   const std::vector<UA_UInt32>& availableSequenceNumbers) {
    if (!accepting_) {
        ++refused_;
        return false;
    }

    deliveries_.push_back(Delivery{subscriptionId, message, availableSequenceNumbers});
    return true;
}

std::vector<NotificationMessage> RecordingPublishSink::dataMessages() const {
    std::vector<NotificationMessage> messages;
    for (const auto& delivery : deliveries_) {
        if (delivery.message.dataChangeCount() > 0) {
            messages.push_back(delivery.message);
        }
    }
    return messages;
}

size_t RecordingPublishSink::keepAliveCount() const {
    return static_cast<size_t>(std::count_if(deliveries_.begin(), deliveries_.end(),
                                             [](const Delivery& delivery) {
                                                 return delivery.message.isKeepAlive();
                                             }));
}

void RecordingPublishSink::clear() {
    deliveries_.clear();
    refused_ = 0;
}

std::vector<UA_UInt32> clientHandles(const NotificationMessage& message) {
    std::vector<UA_UInt32> handles;
    for (const auto& data : message.notificationData) {
        if (const auto* dataChange = std::get_if<DataChangeNotification>(&data)) {
            for (const auto& item : dataChange->monitoredItems) {
                handles.push_back(item.clientHandle);
            }
        }
    }
    return handles;
}

SubscriptionTestBase::SubscriptionTestBase()
    : scheduler_(EPOCH) {
    limits_.minPublishingInterval = 10.0;
    limits_.minSamplingInterval = 10.0;
    limits_.maxQueueSize = 100;
    limits_.maxRetransmissionQueueSize = 10;
}

void SubscriptionTestBase::SetUp() {
    sink_.clear();
}

void SubscriptionTestBase::TearDown() {
    for (auto& subscription : subscriptions_) {
        subscription->terminate();
    }
    subscriptions_.clear();
}

std::shared_ptr<Subscription> SubscriptionTestBase::createSubscription(double publishingInterval,
                                                                       UA_UInt32 maxKeepAliveCount,
                                                                       UA_UInt32 lifetimeCount) {
    SubscriptionParameters parameters;
    parameters.publishingInterval = publishingInterval;
    parameters.maxKeepAliveCount = maxKeepAliveCount;
    parameters.lifetimeCount = lifetimeCount;

    auto subscription = std::make_shared<Subscription>(nextSubscriptionId_++, parameters,
                                                       scheduler_, sink_, limits_);
    subscription->start();
    subscriptions_.push_back(subscription);
    return subscription;
}

std::string SubscriptionTestBase::addDoubleNode(const std::string& name, double value,
                                                std::optional<UA_Range> euRange) {
    std::string nodeId = "ns=1;s=" + name;
    addressSpace_.addNode(nodeId, DataValue::fromDouble(value, EPOCH), euRange);
    return nodeId;
}

MonitoredItemCreateRequest SubscriptionTestBase::makeRequest(const std::string& nodeId,
                                                             UA_UInt32 clientHandle,
                                                             UA_MonitoringMode mode,
                                                             double samplingInterval,
                                                             UA_UInt32 queueSize) {
    MonitoredItemCreateRequest request;
    request.nodeId = nodeId;
    request.monitoringMode = mode;
    request.requestedParameters.clientHandle = clientHandle;
    request.requestedParameters.samplingInterval = samplingInterval;
    request.requestedParameters.queueSize = queueSize;
    return request;
}

UA_UInt32 SubscriptionTestBase::createItem(Subscription& subscription,
                                           const MonitoredItemCreateRequest& request,
                                           UA_TimestampsToReturn timestampsToReturn) {
    auto result = subscription.createMonitoredItem(addressSpace_, timestampsToReturn, request);
    EXPECT_EQ(UA_STATUSCODE_GOOD, result.statusCode)
        << "creating item for " << request.nodeId << ": " << DataValue::statusCodeToString(result.statusCode);
    return result.monitoredItemId;
}

void SubscriptionTestBase::advance(long milliseconds) {
    scheduler_.advance(Scheduler::Duration(milliseconds));
}

} // namespace test
} // namespace opcuasub
