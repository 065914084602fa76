#include "subscription/TriggeringTable.h"
#include <algorithm>

namespace opcuasub {

bool TriggeringTable::addLink(UA_UInt32 triggerId, UA_UInt32 reportItemId, uint64_t armedSequence) {
    auto& links = links_[triggerId];
    auto existing = std::find_if(links.begin(), links.end(),
                                 [reportItemId](const Link& link) { return link.reportItemId == reportItemId; });
    if (existing != links.end()) {
        return false;
    }

    links.push_back(Link{reportItemId, armedSequence});
    return true;
}

bool TriggeringTable::removeLink(UA_UInt32 triggerId, UA_UInt32 reportItemId) {
    auto it = links_.find(triggerId);
    if (it == links_.end()) {
        return false;
    }

    auto& links = it->second;
    auto existing = std::find_if(links.begin(), links.end(),
                                 [reportItemId](const Link& link) { return link.reportItemId == reportItemId; });
    if (existing == links.end()) {
        return false;
    }

    links.erase(existing);
    if (links.empty()) {
        links_.erase(it);
    }
    return true;
}

void TriggeringTable::removeItem(UA_UInt32 itemId) {
    links_.erase(itemId);

    for (auto it = links_.begin(); it != links_.end();) {
        auto& links = it->second;
        links.erase(std::remove_if(links.begin(), links.end(),
                                   [itemId](const Link& link) { return link.reportItemId == itemId; }),
                    links.end());
        if (links.empty()) {
            it = links_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<UA_UInt32> TriggeringTable::fire(UA_UInt32 triggerId, uint64_t currentSequence) {
    std::vector<UA_UInt32> fired;
    auto it = links_.find(triggerId);
    if (it == links_.end()) {
        return fired;
    }

    for (auto& link : it->second) {
        if (link.armedSequence < currentSequence) {
            link.armedSequence = currentSequence;
            fired.push_back(link.reportItemId);
        }
    }
    return fired;
}

std::vector<UA_UInt32> TriggeringTable::getReportItems(UA_UInt32 triggerId) const {
    std::vector<UA_UInt32> result;
    auto it = links_.find(triggerId);
    if (it != links_.end()) {
        for (const auto& link : it->second) {
            result.push_back(link.reportItemId);
        }
    }
    return result;
}

bool TriggeringTable::isTrigger(UA_UInt32 itemId) const {
    return links_.find(itemId) != links_.end();
}

size_t TriggeringTable::linkCount() const {
    size_t count = 0;
    for (const auto& entry : links_) {
        count += entry.second.size();
    }
    return count;
}

void TriggeringTable::clear() {
    links_.clear();
}

} // namespace opcuasub
