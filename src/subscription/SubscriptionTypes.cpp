#include "subscription/SubscriptionTypes.h"
#include <sstream>

namespace opcuasub {

namespace {

nlohmann::json statusCodesToJson(const std::vector<UA_StatusCode>& codes) {
    nlohmann::json result = nlohmann::json::array();
    for (UA_StatusCode code : codes) {
        result.push_back(DataValue::statusCodeToString(code));
    }
    return result;
}

struct NotificationDataToJson {
    nlohmann::json operator()(const DataChangeNotification& notification) const {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& item : notification.monitoredItems) {
            items.push_back({
                {"clientHandle", item.clientHandle},
                {"value", item.value.toJson()}
            });
        }
        return {{"type", "DataChangeNotification"}, {"monitoredItems", items}};
    }

    nlohmann::json operator()(const EventNotificationList& notification) const {
        nlohmann::json events = nlohmann::json::array();
        for (const auto& event : notification.events) {
            nlohmann::json fields = nlohmann::json::array();
            for (const auto& field : event.eventFields) {
                fields.push_back(field.toJson());
            }
            events.push_back({{"clientHandle", event.clientHandle}, {"eventFields", fields}});
        }
        return {{"type", "EventNotificationList"}, {"events", events}};
    }

    nlohmann::json operator()(const StatusChangeNotification& notification) const {
        return {
            {"type", "StatusChangeNotification"},
            {"status", DataValue::statusCodeToString(notification.status)}
        };
    }
};

} // namespace

nlohmann::json MonitoredItemCreateResult::toJson() const {
    return {
        {"statusCode", DataValue::statusCodeToString(statusCode)},
        {"monitoredItemId", monitoredItemId},
        {"revisedSamplingInterval", revisedSamplingInterval},
        {"revisedQueueSize", revisedQueueSize},
        {"filterResult", DataValue::statusCodeToString(filterResult)}
    };
}

nlohmann::json SetTriggeringResult::toJson() const {
    return {
        {"statusCode", DataValue::statusCodeToString(statusCode)},
        {"addResults", statusCodesToJson(addResults)},
        {"removeResults", statusCodesToJson(removeResults)}
    };
}

size_t NotificationMessage::dataChangeCount() const {
    size_t count = 0;
    for (const auto& data : notificationData) {
        if (const auto* dataChange = std::get_if<DataChangeNotification>(&data)) {
            count += dataChange->monitoredItems.size();
        }
    }
    return count;
}

nlohmann::json NotificationMessage::toJson() const {
    nlohmann::json data = nlohmann::json::array();
    for (const auto& entry : notificationData) {
        data.push_back(std::visit(NotificationDataToJson{}, entry));
    }

    return {
        {"sequenceNumber", sequenceNumber},
        {"publishTime", DataValue::toUnixMilliseconds(publishTime)},
        {"keepAlive", isKeepAlive()},
        {"notificationData", data}
    };
}

std::string monitoringModeToString(UA_MonitoringMode mode) {
    switch (mode) {
        case UA_MONITORINGMODE_DISABLED:
            return "Disabled";
        case UA_MONITORINGMODE_SAMPLING:
            return "Sampling";
        case UA_MONITORINGMODE_REPORTING:
            return "Reporting";
        default:
            return "Invalid";
    }
}

std::string statusCodeListToString(const std::vector<UA_StatusCode>& codes) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < codes.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << DataValue::statusCodeToString(codes[i]);
    }
    oss << "]";
    return oss.str();
}

} // namespace opcuasub
