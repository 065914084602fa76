#pragma once

#include <string>
#include <optional>
#include <functional>
#include <cstdint>

#include <open62541/types.h>

#include "core/DataValue.h"

namespace opcuasub {

/**
 * @brief Node store consumed by the subscription core
 *
 * Node identifiers use the OPC UA text format ("ns=1;s=Temperature").
 * Implementations must not hold internal locks while invoking value
 * observers, because observers sample into subscriptions.
 */
class AddressSpace {
public:
    using ValueObserver = std::function<void()>;
    using ObserverHandle = uint64_t;

    virtual ~AddressSpace() = default;

    /**
     * @brief Read one attribute of a node
     * @param nodeId Node identifier
     * @param attributeId Attribute to read (UA_ATTRIBUTEID_*)
     * @return Value with its status code; read failures are encoded in the status
     */
    virtual DataValue readAttributeValue(const std::string& nodeId, UA_UInt32 attributeId) = 0;

    /**
     * @brief Check whether a node is present
     */
    virtual bool nodeExists(const std::string& nodeId) = 0;

    /**
     * @brief Engineering unit range of an analog node
     * @return The EURange property, or nullopt when the node has none
     */
    virtual std::optional<UA_Range> getEURange(const std::string& nodeId) = 0;

    /**
     * @brief Register for change notifications of an attribute
     * @return Observer handle, or 0 when change notifications are unsupported
     */
    virtual ObserverHandle addValueObserver(const std::string& nodeId, UA_UInt32 attributeId,
                                            ValueObserver observer) {
        (void)nodeId;
        (void)attributeId;
        (void)observer;
        return 0;
    }

    virtual void removeValueObserver(ObserverHandle handle) {
        (void)handle;
    }
};

} // namespace opcuasub
