#include "addressspace/ServerAddressSpace.h"
#include "core/ErrorHandler.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace opcuasub {

ServerAddressSpace::ServerAddressSpace(UA_Server* server)
    : server_(server) {
    if (!server_) {
        throw std::invalid_argument("UA_Server cannot be null");
    }
}

bool ServerAddressSpace::parseNodeId(const std::string& nodeId, UA_NodeId& out) {
    UA_NodeId_init(&out);
    UA_String text;
    text.length = nodeId.size();
    text.data = reinterpret_cast<UA_Byte*>(const_cast<char*>(nodeId.data()));
    return UA_NodeId_parse(&out, text) == UA_STATUSCODE_GOOD;
}

std::string ServerAddressSpace::canonicalNodeId(const std::string& nodeId) {
    UA_NodeId parsed;
    if (!parseNodeId(nodeId, parsed)) {
        return nodeId;
    }

    UA_String printed = UA_STRING_NULL;
    std::string result = nodeId;
    if (UA_NodeId_print(&parsed, &printed) == UA_STATUSCODE_GOOD) {
        result.assign(reinterpret_cast<const char*>(printed.data), printed.length);
    }
    UA_String_clear(&printed);
    UA_NodeId_clear(&parsed);
    return result;
}

DataValue ServerAddressSpace::readAttributeValue(const std::string& nodeId, UA_UInt32 attributeId) {
    UA_NodeId id;
    if (!parseNodeId(nodeId, id)) {
        return DataValue::fromStatus(UA_STATUSCODE_BADNODEIDINVALID);
    }

    UA_ReadValueId readValueId;
    UA_ReadValueId_init(&readValueId);
    readValueId.nodeId = id;
    readValueId.attributeId = attributeId;

    DataValue result;
    {
        std::lock_guard<std::mutex> lock(serverMutex_);
        result.raw() = UA_Server_read(server_, &readValueId, UA_TIMESTAMPSTORETURN_BOTH);
    }

    UA_NodeId_clear(&id);
    return result;
}

bool ServerAddressSpace::nodeExists(const std::string& nodeId) {
    UA_NodeId id;
    if (!parseNodeId(nodeId, id)) {
        return false;
    }

    UA_NodeId outId;
    UA_NodeId_init(&outId);
    UA_StatusCode status;
    {
        std::lock_guard<std::mutex> lock(serverMutex_);
        status = UA_Server_readNodeId(server_, id, &outId);
    }

    UA_NodeId_clear(&outId);
    UA_NodeId_clear(&id);
    return status == UA_STATUSCODE_GOOD;
}

std::optional<UA_Range> ServerAddressSpace::getEURange(const std::string& nodeId) {
    UA_NodeId id;
    if (!parseNodeId(nodeId, id)) {
        return std::nullopt;
    }

    UA_Variant value;
    UA_Variant_init(&value);
    UA_StatusCode status;
    {
        std::lock_guard<std::mutex> lock(serverMutex_);
        status = UA_Server_readObjectProperty(server_, id,
                                              UA_QUALIFIEDNAME(0, const_cast<char*>("EURange")),
                                              &value);
    }
    UA_NodeId_clear(&id);

    std::optional<UA_Range> result;
    if (status == UA_STATUSCODE_GOOD && UA_Variant_hasScalarType(&value, &UA_TYPES[UA_TYPES_RANGE])) {
        result = *static_cast<const UA_Range*>(value.data);
    }

    UA_Variant_clear(&value);
    return result;
}

AddressSpace::ObserverHandle ServerAddressSpace::addValueObserver(const std::string& nodeId,
                                                                  UA_UInt32 attributeId,
                                                                  ValueObserver observer) {
    // Only writeValue and deleteNode notify, and both concern the Value attribute
    if (attributeId != UA_ATTRIBUTEID_VALUE || !observer) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(observersMutex_);
    ObserverHandle handle = nextObserverHandle_++;
    observers_.emplace(handle, Observer{canonicalNodeId(nodeId), std::move(observer)});
    spdlog::debug("Registered value observer {} for node {}", handle, nodeId);
    return handle;
}

void ServerAddressSpace::removeValueObserver(ObserverHandle handle) {
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.erase(handle);
}

size_t ServerAddressSpace::observerCount() const {
    std::lock_guard<std::mutex> lock(observersMutex_);
    return observers_.size();
}

UA_UInt16 ServerAddressSpace::addNamespace(const std::string& namespaceUri) {
    std::lock_guard<std::mutex> lock(serverMutex_);
    return UA_Server_addNamespace(server_, namespaceUri.c_str());
}

UA_StatusCode ServerAddressSpace::addVariable(const std::string& nodeId, const std::string& browseName,
                                              const DataValue& initialValue,
                                              std::optional<UA_Range> euRange) {
    UA_NodeId requestedId;
    if (!parseNodeId(nodeId, requestedId)) {
        return UA_STATUSCODE_BADNODEIDINVALID;
    }

    UA_VariableAttributes attr = UA_VariableAttributes_default;
    attr.displayName = UA_LOCALIZEDTEXT(const_cast<char*>("en-US"), const_cast<char*>(browseName.c_str()));
    UA_StatusCode copyStatus = UA_Variant_copy(&initialValue.raw().value, &attr.value);
    if (copyStatus != UA_STATUSCODE_GOOD) {
        UA_NodeId_clear(&requestedId);
        return copyStatus;
    }
    if (initialValue.raw().value.type) {
        attr.dataType = initialValue.raw().value.type->typeId;
    }
    attr.valueRank = UA_VALUERANK_SCALAR;
    attr.accessLevel = UA_ACCESSLEVELMASK_READ | UA_ACCESSLEVELMASK_WRITE;
    attr.userAccessLevel = UA_ACCESSLEVELMASK_READ | UA_ACCESSLEVELMASK_WRITE;

    UA_NodeId parentNodeId = UA_NODEID_NUMERIC(0, UA_NS0ID_OBJECTSFOLDER);
    UA_NodeId parentReferenceNodeId = UA_NODEID_NUMERIC(0, UA_NS0ID_ORGANIZES);
    UA_NodeId variableType = UA_NODEID_NUMERIC(0, UA_NS0ID_BASEDATAVARIABLETYPE);
    UA_QualifiedName qualifiedName = UA_QUALIFIEDNAME(requestedId.namespaceIndex,
                                                      const_cast<char*>(browseName.c_str()));

    std::lock_guard<std::mutex> lock(serverMutex_);
    UA_StatusCode status = UA_Server_addVariableNode(server_, requestedId, parentNodeId,
                                                     parentReferenceNodeId, qualifiedName,
                                                     variableType, attr, nullptr, nullptr);
    UA_Variant_clear(&attr.value);

    if (status == UA_STATUSCODE_GOOD && euRange) {
        UA_VariableAttributes rangeAttr = UA_VariableAttributes_default;
        rangeAttr.displayName = UA_LOCALIZEDTEXT(const_cast<char*>("en-US"), const_cast<char*>("EURange"));
        rangeAttr.dataType = UA_TYPES[UA_TYPES_RANGE].typeId;
        rangeAttr.valueRank = UA_VALUERANK_SCALAR;
        status = UA_Variant_setScalarCopy(&rangeAttr.value, &*euRange, &UA_TYPES[UA_TYPES_RANGE]);

        if (status == UA_STATUSCODE_GOOD) {
            status = UA_Server_addVariableNode(server_, UA_NODEID_NULL, requestedId,
                                               UA_NODEID_NUMERIC(0, UA_NS0ID_HASPROPERTY),
                                               UA_QUALIFIEDNAME(0, const_cast<char*>("EURange")),
                                               UA_NODEID_NUMERIC(0, UA_NS0ID_PROPERTYTYPE),
                                               rangeAttr, nullptr, nullptr);
        }
        UA_Variant_clear(&rangeAttr.value);
    }

    UA_NodeId_clear(&requestedId);

    if (ErrorHandler::checkStatus(ErrorHandler::ErrorType::ADDRESS_SPACE_ERROR, status,
                                  "Adding variable '" + browseName + "'")) {
        spdlog::debug("Added variable '{}': {}", browseName, nodeId);
    }
    return status;
}

UA_StatusCode ServerAddressSpace::writeValue(const std::string& nodeId, const DataValue& value) {
    UA_NodeId id;
    if (!parseNodeId(nodeId, id)) {
        return UA_STATUSCODE_BADNODEIDINVALID;
    }

    UA_StatusCode status;
    {
        std::lock_guard<std::mutex> lock(serverMutex_);
        status = UA_Server_writeDataValue(server_, id, value.raw());
    }
    UA_NodeId_clear(&id);

    if (status != UA_STATUSCODE_GOOD) {
        spdlog::warn("Failed to write value of node {}: {}", nodeId, UA_StatusCode_name(status));
        return status;
    }

    notifyObservers(nodeId);
    return status;
}

UA_StatusCode ServerAddressSpace::deleteNode(const std::string& nodeId) {
    UA_NodeId id;
    if (!parseNodeId(nodeId, id)) {
        return UA_STATUSCODE_BADNODEIDINVALID;
    }

    UA_StatusCode status;
    {
        std::lock_guard<std::mutex> lock(serverMutex_);
        status = UA_Server_deleteNode(server_, id, true);
    }
    UA_NodeId_clear(&id);

    if (status == UA_STATUSCODE_GOOD) {
        spdlog::info("Deleted node {}", nodeId);
        notifyObservers(nodeId);
    }
    return status;
}

UA_UInt16 ServerAddressSpace::runIterate() {
    std::lock_guard<std::mutex> lock(serverMutex_);
    return UA_Server_run_iterate(server_, false);
}

void ServerAddressSpace::notifyObservers(const std::string& nodeId) {
    std::string canonical = canonicalNodeId(nodeId);
    std::vector<ValueObserver> callbacks;
    {
        std::lock_guard<std::mutex> lock(observersMutex_);
        for (const auto& [handle, observer] : observers_) {
            if (observer.nodeId == canonical) {
                callbacks.push_back(observer.callback);
            }
        }
    }

    for (auto& callback : callbacks) {
        ErrorHandler::executeWithErrorHandling(callback, "Value observer for " + nodeId);
    }
}

} // namespace opcuasub
