#include "publish/PublishTypes.h"

namespace opcuasub {

nlohmann::json PublishRequest::toJson() const {
    nlohmann::json acknowledgements = nlohmann::json::array();
    for (const auto& ack : subscriptionAcknowledgements) {
        acknowledgements.push_back({
            {"subscriptionId", ack.subscriptionId},
            {"sequenceNumber", ack.sequenceNumber}
        });
    }

    return {
        {"requestHandle", requestHandle},
        {"timeoutHint", timeoutHint},
        {"subscriptionAcknowledgements", acknowledgements}
    };
}

nlohmann::json PublishResponse::toJson() const {
    nlohmann::json ackResults = nlohmann::json::array();
    for (UA_StatusCode result : results) {
        ackResults.push_back(DataValue::statusCodeToString(result));
    }

    nlohmann::json json = {
        {"requestHandle", requestHandle},
        {"serviceResult", DataValue::statusCodeToString(serviceResult)},
        {"results", ackResults}
    };

    if (serviceResult == UA_STATUSCODE_GOOD) {
        json["subscriptionId"] = subscriptionId;
        json["availableSequenceNumbers"] = availableSequenceNumbers;
        json["moreNotifications"] = moreNotifications;
        json["notificationMessage"] = notificationMessage.toJson();
    }

    return json;
}

} // namespace opcuasub
