#include "publish/PublishEngine.h"
#include "core/ErrorHandler.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace opcuasub {

PublishEngine::PublishEngine(Scheduler& scheduler, const ServiceLimits& limits,
                             SendResponseCallback sendResponse)
    : scheduler_(scheduler)
    , limits_(limits)
    , sendResponse_(std::move(sendResponse)) {
    if (!sendResponse_) {
        throw std::invalid_argument("Send response callback cannot be null");
    }

    auto interval = Scheduler::Duration(std::max(limits_.requestTimeoutCheckInterval, 1));
    housekeepingTimer_ = scheduler_.schedulePeriodic(interval, TimerPhase::HOUSEKEEPING,
                                                     [this]() { performHousekeeping(); });

    spdlog::debug("PublishEngine created (max requests: {}, max subscriptions: {})",
                  limits_.maxPublishRequestsInQueue, limits_.maxSubscriptionsPerSession);
}

PublishEngine::~PublishEngine() {
    shutdown();
}

std::shared_ptr<Subscription> PublishEngine::createSubscription(const SubscriptionParameters& parameters) {
    if (shutdown_.load()) {
        spdlog::warn("Cannot create subscription: publish engine is shut down");
        return nullptr;
    }

    std::shared_ptr<Subscription> subscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscriptions_.size() >= limits_.maxSubscriptionsPerSession) {
            spdlog::warn("Cannot create subscription: {} (limit {})",
                         UA_StatusCode_name(UA_STATUSCODE_BADTOOMANYSUBSCRIPTIONS),
                         limits_.maxSubscriptionsPerSession);
            return nullptr;
        }

        UA_UInt32 subscriptionId = nextSubscriptionId_++;
        subscription = std::make_shared<Subscription>(subscriptionId, parameters, scheduler_, *this, limits_);
        subscriptions_.emplace(subscriptionId, subscription);
    }

    subscription->start();
    return subscription;
}

UA_StatusCode PublishEngine::deleteSubscription(UA_UInt32 subscriptionId) {
    std::shared_ptr<Subscription> subscription;
    std::deque<QueuedRequest> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(subscriptionId);
        if (it == subscriptions_.end()) {
            return UA_STATUSCODE_BADSUBSCRIPTIONIDINVALID;
        }

        subscription = it->second;
        subscriptions_.erase(it);
        lateSubscriptions_.erase(std::remove(lateSubscriptions_.begin(), lateSubscriptions_.end(),
                                             subscriptionId),
                                 lateSubscriptions_.end());
        if (subscriptions_.empty()) {
            orphaned.swap(requests_);
        }
    }

    subscription->terminate();
    spdlog::info("Deleted subscription {}", subscriptionId);

    for (const auto& queued : orphaned) {
        respondWithStatus(queued.request, queued.acknowledgementResults,
                          UA_STATUSCODE_BADSUBSCRIPTIONIDINVALID);
    }

    return UA_STATUSCODE_GOOD;
}

std::shared_ptr<Subscription> PublishEngine::findSubscription(UA_UInt32 subscriptionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(subscriptionId);
    return it != subscriptions_.end() ? it->second : nullptr;
}

std::vector<UA_UInt32> PublishEngine::getSubscriptionIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UA_UInt32> ids;
    ids.reserve(subscriptions_.size());
    for (const auto& entry : subscriptions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<std::shared_ptr<Subscription>> PublishEngine::snapshotSubscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Subscription>> subscriptions;
    subscriptions.reserve(subscriptions_.size());
    for (const auto& entry : subscriptions_) {
        subscriptions.push_back(entry.second);
    }
    return subscriptions;
}

Scheduler::Duration PublishEngine::requestTimeout(const PublishRequest& request,
                                                  const std::vector<std::shared_ptr<Subscription>>& subscriptions) const {
    // The fastest subscription bounds how long a request may wait
    double fastestInterval = 0.0;
    double timeout = 0.0;
    for (const auto& subscription : subscriptions) {
        double interval = subscription->getPublishingInterval();
        if (fastestInterval == 0.0 || interval < fastestInterval) {
            fastestInterval = interval;
            timeout = interval * subscription->getLifetimeCount();
        }
    }

    if (request.timeoutHint > 0 && (timeout == 0.0 || request.timeoutHint < timeout)) {
        timeout = request.timeoutHint;
    }

    return Scheduler::toDuration(timeout);
}

void PublishEngine::onPublishRequest(const PublishRequest& request) {
    requestsReceived_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_.load()) {
        respondWithStatus(request, {}, UA_STATUSCODE_BADSHUTDOWN);
        return;
    }

    std::vector<UA_StatusCode> acknowledgementResults;
    acknowledgementResults.reserve(request.subscriptionAcknowledgements.size());
    for (const auto& ack : request.subscriptionAcknowledgements) {
        auto subscription = findSubscription(ack.subscriptionId);
        acknowledgementResults.push_back(subscription ? subscription->acknowledge(ack.sequenceNumber)
                                                      : UA_STATUSCODE_BADSUBSCRIPTIONIDINVALID);
    }

    auto subscriptions = snapshotSubscriptions();
    if (subscriptions.empty()) {
        respondWithStatus(request, acknowledgementResults, UA_STATUSCODE_BADNOSUBSCRIPTION);
        return;
    }

    QueuedRequest queued{request, std::move(acknowledgementResults),
                         scheduler_.now() + requestTimeout(request, subscriptions)};

    std::optional<QueuedRequest> rejected;
    bool shutdown = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.load()) {
            shutdown = true;
        } else {
            requests_.push_back(std::move(queued));
            if (requests_.size() > limits_.maxPublishRequestsInQueue) {
                rejected = std::move(requests_.front());
                requests_.pop_front();
            }
        }
    }

    if (shutdown) {
        respondWithStatus(request, {}, UA_STATUSCODE_BADSHUTDOWN);
        return;
    }

    if (rejected) {
        spdlog::warn("Publish request queue full ({}), rejecting oldest request {}",
                     limits_.maxPublishRequestsInQueue, rejected->request.requestHandle);
        respondWithStatus(rejected->request, rejected->acknowledgementResults,
                          UA_STATUSCODE_BADTOOMANYPUBLISHREQUESTS);
    }

    serveLateSubscriptions();
}

void PublishEngine::serveLateSubscriptions() {
    while (true) {
        std::shared_ptr<Subscription> subscription;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (requests_.empty() || lateSubscriptions_.empty()) {
                return;
            }

            UA_UInt32 subscriptionId = lateSubscriptions_.front();
            lateSubscriptions_.pop_front();
            auto it = subscriptions_.find(subscriptionId);
            if (it == subscriptions_.end()) {
                continue;
            }
            subscription = it->second;
        }

        if (subscription->publishLateMessage()) {
            spdlog::trace("Served late subscription {}", subscription->getId());
        }
    }
}

bool PublishEngine::deliver(UA_UInt32 subscriptionId, const NotificationMessage& message,
                            const std::vector<UA_UInt32>& availableSequenceNumbers) {
    if (shutdown_.load()) {
        return false;
    }

    std::vector<QueuedRequest> expired;
    std::optional<QueuedRequest> matched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = scheduler_.now();
        while (!requests_.empty()) {
            QueuedRequest front = std::move(requests_.front());
            requests_.pop_front();
            if (front.deadline <= now) {
                expired.push_back(std::move(front));
                continue;
            }
            matched = std::move(front);
            break;
        }

        if (!matched &&
            std::find(lateSubscriptions_.begin(), lateSubscriptions_.end(), subscriptionId) ==
            lateSubscriptions_.end()) {
            lateSubscriptions_.push_back(subscriptionId);
        }
    }

    for (const auto& queued : expired) {
        timedOutRequests_.fetch_add(1, std::memory_order_relaxed);
        respondWithStatus(queued.request, queued.acknowledgementResults, UA_STATUSCODE_BADTIMEOUT);
    }

    if (!matched) {
        return false;
    }

    PublishResponse response;
    response.requestHandle = matched->request.requestHandle;
    response.serviceResult = UA_STATUSCODE_GOOD;
    response.subscriptionId = subscriptionId;
    response.availableSequenceNumbers = availableSequenceNumbers;
    response.notificationMessage = message;
    response.results = matched->acknowledgementResults;

    if (message.isKeepAlive()) {
        keepAliveResponses_.fetch_add(1, std::memory_order_relaxed);
    } else {
        dataResponses_.fetch_add(1, std::memory_order_relaxed);
    }

    dispatchResponse(matched->request, response);
    return true;
}

bool PublishEngine::hasPendingRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !requests_.empty();
}

UA_StatusCode PublishEngine::republish(UA_UInt32 subscriptionId, UA_UInt32 sequenceNumber,
                                       NotificationMessage& message) const {
    auto subscription = findSubscription(subscriptionId);
    if (!subscription) {
        return UA_STATUSCODE_BADSUBSCRIPTIONIDINVALID;
    }
    return subscription->republish(sequenceNumber, message);
}

void PublishEngine::performHousekeeping() {
    if (shutdown_.load()) {
        return;
    }

    std::vector<QueuedRequest> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = scheduler_.now();
        for (auto it = requests_.begin(); it != requests_.end();) {
            if (it->deadline <= now) {
                expired.push_back(std::move(*it));
                it = requests_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& queued : expired) {
        timedOutRequests_.fetch_add(1, std::memory_order_relaxed);
        respondWithStatus(queued.request, queued.acknowledgementResults, UA_STATUSCODE_BADTIMEOUT);
    }

    std::vector<UA_UInt32> closed;
    for (const auto& subscription : snapshotSubscriptions()) {
        if (subscription->isClosed() && !subscription->hasHeldMessage()) {
            closed.push_back(subscription->getId());
        }
    }

    if (closed.empty()) {
        return;
    }

    std::deque<QueuedRequest> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (UA_UInt32 subscriptionId : closed) {
            subscriptions_.erase(subscriptionId);
            lateSubscriptions_.erase(std::remove(lateSubscriptions_.begin(), lateSubscriptions_.end(),
                                                 subscriptionId),
                                     lateSubscriptions_.end());
        }
        if (subscriptions_.empty()) {
            orphaned.swap(requests_);
        }
    }

    for (UA_UInt32 subscriptionId : closed) {
        spdlog::info("Removed closed subscription {}", subscriptionId);
    }

    for (const auto& queued : orphaned) {
        respondWithStatus(queued.request, queued.acknowledgementResults,
                          UA_STATUSCODE_BADSUBSCRIPTIONIDINVALID);
    }
}

void PublishEngine::shutdown() {
    bool expected = false;
    if (!shutdown_.compare_exchange_strong(expected, true)) {
        return;
    }

    spdlog::info("Shutting down publish engine...");

    scheduler_.cancel(housekeepingTimer_);

    std::map<UA_UInt32, std::shared_ptr<Subscription>> subscriptions;
    std::deque<QueuedRequest> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions.swap(subscriptions_);
        pending.swap(requests_);
        lateSubscriptions_.clear();
    }

    for (auto& entry : subscriptions) {
        entry.second->terminate();
    }

    for (const auto& queued : pending) {
        respondWithStatus(queued.request, queued.acknowledgementResults, UA_STATUSCODE_BADSHUTDOWN);
    }

    spdlog::info("Publish engine shut down ({} subscriptions terminated, {} requests answered)",
                 subscriptions.size(), pending.size());
}

void PublishEngine::respondWithStatus(const PublishRequest& request,
                                      const std::vector<UA_StatusCode>& acknowledgementResults,
                                      UA_StatusCode status) {
    PublishResponse response;
    response.requestHandle = request.requestHandle;
    response.serviceResult = status;
    response.results = acknowledgementResults;

    errorResponses_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("Publish request {} answered with {}", request.requestHandle, UA_StatusCode_name(status));
    dispatchResponse(request, response);
}

void PublishEngine::dispatchResponse(const PublishRequest& request, const PublishResponse& response) {
    responsesSent_.fetch_add(1, std::memory_order_relaxed);
    try {
        sendResponse_(request, response);
    } catch (const std::exception& e) {
        transportFailures_.fetch_add(1, std::memory_order_relaxed);
        ErrorHandler::handleError(ErrorHandler::ErrorType::TRANSPORT_ERROR,
                                  "Sending publish response " + std::to_string(request.requestHandle) +
                                  " failed: " + e.what());
    }
}

size_t PublishEngine::pendingRequestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

size_t PublishEngine::subscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

PublishEngine::EngineStats PublishEngine::getStats() const {
    EngineStats stats;
    stats.requestsReceived = requestsReceived_.load();
    stats.responsesSent = responsesSent_.load();
    stats.dataResponses = dataResponses_.load();
    stats.keepAliveResponses = keepAliveResponses_.load();
    stats.errorResponses = errorResponses_.load();
    stats.timedOutRequests = timedOutRequests_.load();
    stats.transportFailures = transportFailures_.load();

    std::lock_guard<std::mutex> lock(mutex_);
    stats.pendingRequests = requests_.size();
    stats.subscriptions = subscriptions_.size();
    stats.lateSubscriptions = lateSubscriptions_.size();
    return stats;
}

nlohmann::json PublishEngine::getStatus() const {
    EngineStats stats = getStats();
    return {
        {"shutdown", shutdown_.load()},
        {"subscriptions", stats.subscriptions},
        {"pendingRequests", stats.pendingRequests},
        {"lateSubscriptions", stats.lateSubscriptions},
        {"requestsReceived", stats.requestsReceived},
        {"responsesSent", stats.responsesSent},
        {"dataResponses", stats.dataResponses},
        {"keepAliveResponses", stats.keepAliveResponses},
        {"errorResponses", stats.errorResponses},
        {"timedOutRequests", stats.timedOutRequests},
        {"transportFailures", stats.transportFailures}
    };
}

} // namespace opcuasub
