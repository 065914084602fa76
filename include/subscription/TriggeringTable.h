#pragma once

#include <map>
#include <vector>
#include <cstdint>

#include <open62541/types.h>

namespace opcuasub {

/**
 * @brief Triggering links between monitored items of one subscription
 *
 * A link makes a report item deliver its queued notifications whenever the
 * triggering item reports. Each link remembers the triggering item's enqueue
 * sequence at which it was armed, so a value queued by the trigger before
 * the link existed does not fire it.
 */
class TriggeringTable {
public:
    /**
     * @brief Add a link
     * @param triggerId Triggering item
     * @param reportItemId Item reported together with the trigger
     * @param armedSequence Trigger enqueue sequence at link creation
     * @return false if the link already exists
     */
    bool addLink(UA_UInt32 triggerId, UA_UInt32 reportItemId, uint64_t armedSequence);

    /**
     * @brief Remove a link
     * @return false if there was no such link
     */
    bool removeLink(UA_UInt32 triggerId, UA_UInt32 reportItemId);

    /**
     * @brief Drop every link in which the item takes part
     */
    void removeItem(UA_UInt32 itemId);

    /**
     * @brief Fire the links of a trigger that has reported
     * @param triggerId Triggering item
     * @param currentSequence Trigger enqueue sequence of the reported values
     * @return Report items whose link was armed before currentSequence
     */
    std::vector<UA_UInt32> fire(UA_UInt32 triggerId, uint64_t currentSequence);

    std::vector<UA_UInt32> getReportItems(UA_UInt32 triggerId) const;
    bool isTrigger(UA_UInt32 itemId) const;
    size_t linkCount() const;
    void clear();

private:
    struct Link {
        UA_UInt32 reportItemId;
        uint64_t armedSequence;
    };

    std::map<UA_UInt32, std::vector<Link>> links_;
};

} // namespace opcuasub
