#pragma once

#include <map>
#include <mutex>
#include <string>
#include <optional>

#include <open62541/server.h>

#include "addressspace/AddressSpace.h"

namespace opcuasub {

/**
 * @brief AddressSpace backed by the node store of an open62541 UA_Server
 *
 * Every call into the server is serialized by an internal mutex, including
 * run iterations driven by the host. Writes made through writeValue() and
 * deleteNode() notify registered value observers once the mutex is released.
 */
class ServerAddressSpace : public AddressSpace {
public:
    /**
     * @brief Constructor
     * @param server Server whose node store is exposed (must outlive this object)
     */
    explicit ServerAddressSpace(UA_Server* server);

    ~ServerAddressSpace() override = default;

    // Disable copy constructor and assignment operator
    ServerAddressSpace(const ServerAddressSpace&) = delete;
    ServerAddressSpace& operator=(const ServerAddressSpace&) = delete;

    DataValue readAttributeValue(const std::string& nodeId, UA_UInt32 attributeId) override;
    bool nodeExists(const std::string& nodeId) override;
    std::optional<UA_Range> getEURange(const std::string& nodeId) override;
    /**
     * @brief Observe writes and deletion of a node's Value attribute
     * @return Observer handle, or 0 for any other attribute
     */
    ObserverHandle addValueObserver(const std::string& nodeId, UA_UInt32 attributeId,
                                    ValueObserver observer) override;
    void removeValueObserver(ObserverHandle handle) override;

    /**
     * @brief Register a namespace URI
     * @return Namespace index
     */
    UA_UInt16 addNamespace(const std::string& namespaceUri);

    /**
     * @brief Add a scalar variable below the Objects folder
     * @param nodeId Identifier of the new node
     * @param browseName Browse and display name
     * @param initialValue Initial value (its variant type becomes the data type)
     * @param euRange Optional EURange property for percent deadbands
     * @return Status code of the node creation
     */
    UA_StatusCode addVariable(const std::string& nodeId, const std::string& browseName,
                              const DataValue& initialValue,
                              std::optional<UA_Range> euRange = std::nullopt);

    /**
     * @brief Write the Value attribute and notify observers
     */
    UA_StatusCode writeValue(const std::string& nodeId, const DataValue& value);

    /**
     * @brief Delete a node (and its properties) and notify observers
     */
    UA_StatusCode deleteNode(const std::string& nodeId);

    /**
     * @brief Run one non-blocking iteration of the server's event loop
     * @return Time in ms until the server wants to be iterated again
     */
    UA_UInt16 runIterate();

    /**
     * @brief Canonical text form of a node identifier
     * @return Printed identifier, or the input unchanged if it cannot be parsed
     */
    static std::string canonicalNodeId(const std::string& nodeId);

    size_t observerCount() const;

private:
    struct Observer {
        std::string nodeId;             // Canonical node identifier
        ValueObserver callback;
    };

    static bool parseNodeId(const std::string& nodeId, UA_NodeId& out);

    void notifyObservers(const std::string& nodeId);

    UA_Server* server_;
    mutable std::mutex serverMutex_;

    std::map<ObserverHandle, Observer> observers_;
    ObserverHandle nextObserverHandle_{1};
    mutable std::mutex observersMutex_;
};

} // namespace opcuasub
