#include <gtest/gtest.h>
#include <string>
#include <variant>

#include "common/SubscriptionTestBase.h"

namespace opcuasub {
namespace test {

class SetTriggeringTest : public SubscriptionTestBase {
protected:
    void SetUp() override {
        SubscriptionTestBase::SetUp();
        for (const char* name : {"Trigger", "ReportA", "ReportB"}) {
            nodes.push_back(addDoubleNode(name, 1.0));
        }
    }

    // Client handles are 1..n in creation order; unfiltered items queue every
    // sample, up to ten, on the publishing interval
    std::vector<UA_UInt32> createItems(Subscription& subscription,
                                       std::initializer_list<UA_MonitoringMode> modes) {
        std::vector<UA_UInt32> ids;
        UA_UInt32 handle = 1;
        for (UA_MonitoringMode mode : modes) {
            ids.push_back(createItem(subscription, makeRequest(nodes.at(handle - 1), handle, mode, 100.0, 10)));
            ++handle;
        }
        return ids;
    }

    std::vector<UA_UInt32> lastBatch() const {
        auto messages = sink_.dataMessages();
        return messages.empty() ? std::vector<UA_UInt32>{} : clientHandles(messages.back());
    }

    std::vector<std::string> nodes;
};

// Service preconditions

TEST_F(SetTriggeringTest, EmptyLinkLists_ReturnsNothingToDo) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING});

    auto result = subscription->setTriggering(ids[0], {}, {});
    EXPECT_EQ(UA_STATUSCODE_BADNOTHINGTODO, result.statusCode);
    EXPECT_TRUE(result.addResults.empty());
    EXPECT_TRUE(result.removeResults.empty());

    // Checked before the triggering item
    EXPECT_EQ(UA_STATUSCODE_BADNOTHINGTODO, subscription->setTriggering(999, {}, {}).statusCode);
}

TEST_F(SetTriggeringTest, UnknownTriggeringItem_ReturnsMonitoredItemIdInvalid) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING});

    auto result = subscription->setTriggering(42, {ids[1]}, {});
    EXPECT_EQ(UA_STATUSCODE_BADMONITOREDITEMIDINVALID, result.statusCode);
    EXPECT_TRUE(result.addResults.empty());
}

TEST_F(SetTriggeringTest, ValidLinks_ReturnGoodInInputOrder) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING,
                                           UA_MONITORINGMODE_SAMPLING});

    auto result = subscription->setTriggering(ids[0], {ids[2], ids[1]}, {});
    EXPECT_EQ(UA_STATUSCODE_GOOD, result.statusCode);
    EXPECT_EQ((std::vector<UA_StatusCode>{UA_STATUSCODE_GOOD, UA_STATUSCODE_GOOD}), result.addResults);
    EXPECT_TRUE(result.removeResults.empty());

    auto diagnostics = subscription->getMonitoredItemDiagnostics(ids[0]);
    ASSERT_TRUE(diagnostics.has_value());
    EXPECT_EQ((std::vector<UA_UInt32>{ids[2], ids[1]}), (*diagnostics)["triggers"].get<std::vector<UA_UInt32>>());
}

TEST_F(SetTriggeringTest, MixedLinks_ReportPerLinkResults) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING,
                                           UA_MONITORINGMODE_SAMPLING});

    auto result = subscription->setTriggering(ids[0], {ids[1], 99, ids[2]}, {});
    EXPECT_EQ(UA_STATUSCODE_GOOD, result.statusCode);
    EXPECT_EQ((std::vector<UA_StatusCode>{UA_STATUSCODE_GOOD, UA_STATUSCODE_BADMONITOREDITEMIDINVALID,
                                          UA_STATUSCODE_GOOD}),
              result.addResults);

    result = subscription->setTriggering(ids[0], {}, {ids[1], 77});
    EXPECT_EQ((std::vector<UA_StatusCode>{UA_STATUSCODE_GOOD, UA_STATUSCODE_BADMONITOREDITEMIDINVALID}),
              result.removeResults);

    auto diagnostics = subscription->getMonitoredItemDiagnostics(ids[0]);
    EXPECT_EQ((std::vector<UA_UInt32>{ids[2]}), (*diagnostics)["triggers"].get<std::vector<UA_UInt32>>());
}

TEST_F(SetTriggeringTest, RemovalsApplyBeforeAdditions) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING});
    subscription->setTriggering(ids[0], {ids[1]}, {});

    auto result = subscription->setTriggering(ids[0], {ids[1]}, {ids[1]});
    EXPECT_EQ(UA_STATUSCODE_GOOD, result.addResults.at(0));
    EXPECT_EQ(UA_STATUSCODE_GOOD, result.removeResults.at(0));

    auto diagnostics = subscription->getMonitoredItemDiagnostics(ids[0]);
    EXPECT_EQ((std::vector<UA_UInt32>{ids[1]}), (*diagnostics)["triggers"].get<std::vector<UA_UInt32>>());
}

TEST_F(SetTriggeringTest, DuplicateLink_IsGoodAndNotDuplicated) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING});

    subscription->setTriggering(ids[0], {ids[1]}, {});
    auto result = subscription->setTriggering(ids[0], {ids[1]}, {});
    EXPECT_EQ(UA_STATUSCODE_GOOD, result.addResults.at(0));
    EXPECT_EQ(1u, subscription->getDiagnostics()["triggeringLinks"].get<size_t>());

    advance(100);
    EXPECT_EQ((std::vector<UA_UInt32>{1, 2}), lastBatch());
}

// Emission of a linked pair, for every combination of monitoring modes

struct EmissionCase {
    UA_MonitoringMode trigger;
    UA_MonitoringMode report;
    std::vector<UA_UInt32> expectedHandles;
};

TEST_F(SetTriggeringTest, EmissionMatrix) {
    const std::vector<EmissionCase> cases = {
        {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_REPORTING, {1, 2}},
        {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING,  {1, 2}},
        {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_DISABLED,  {1}},
        {UA_MONITORINGMODE_SAMPLING,  UA_MONITORINGMODE_REPORTING, {2}},
        {UA_MONITORINGMODE_SAMPLING,  UA_MONITORINGMODE_SAMPLING,  {2}},
        {UA_MONITORINGMODE_SAMPLING,  UA_MONITORINGMODE_DISABLED,  {}},
        {UA_MONITORINGMODE_DISABLED,  UA_MONITORINGMODE_REPORTING, {2}},
        {UA_MONITORINGMODE_DISABLED,  UA_MONITORINGMODE_SAMPLING,  {}},
        {UA_MONITORINGMODE_DISABLED,  UA_MONITORINGMODE_DISABLED,  {}},
    };

    for (const auto& testCase : cases) {
        SCOPED_TRACE("trigger " + monitoringModeToString(testCase.trigger) +
                     ", report " + monitoringModeToString(testCase.report));
        sink_.clear();

        auto subscription = createSubscription(100.0, 100, 300);
        auto ids = createItems(*subscription, {testCase.trigger, testCase.report});
        auto result = subscription->setTriggering(ids[0], {ids[1]}, {});
        ASSERT_EQ(UA_STATUSCODE_GOOD, result.statusCode);

        for (int cycle = 0; cycle < 3; ++cycle) {
            advance(100);
        }

        auto messages = sink_.dataMessages();
        if (testCase.expectedHandles.empty()) {
            EXPECT_TRUE(messages.empty());
        } else {
            ASSERT_EQ(3u, messages.size());
            for (const auto& message : messages) {
                EXPECT_EQ(testCase.expectedHandles, clientHandles(message));
            }
        }

        subscription->terminate();
    }
}

// Link arming

TEST_F(SetTriggeringTest, NewLink_FiresOnlyForValuesQueuedAfterwards) {
    auto subscription = createSubscription();
    UA_UInt32 trigger = createItem(*subscription,
                                   makeRequest(nodes[0], 1, UA_MONITORINGMODE_REPORTING, 0.0));
    UA_UInt32 report = createItem(*subscription, makeRequest(nodes[1], 2, UA_MONITORINGMODE_SAMPLING));

    // The trigger's initial value was queued before the link existed
    subscription->setTriggering(trigger, {report}, {});
    advance(100);
    EXPECT_EQ((std::vector<UA_UInt32>{1}), lastBatch());

    addressSpace_.setDouble(nodes[0], 2.0);
    advance(100);
    EXPECT_EQ((std::vector<UA_UInt32>{1, 2}), lastBatch());
}

TEST_F(SetTriggeringTest, SamplingReportItem_DeliversNewestValueWhenTriggered) {
    auto subscription = createSubscription();
    UA_UInt32 trigger = createItem(*subscription,
                                   makeRequest(nodes[0], 1, UA_MONITORINGMODE_REPORTING, 0.0));
    UA_UInt32 report = createItem(*subscription,
                                  makeRequest(nodes[1], 2, UA_MONITORINGMODE_SAMPLING, 50.0, 10));
    subscription->setTriggering(trigger, {report}, {});

    advance(300);
    ASSERT_EQ(1u, sink_.dataMessages().size());

    // Six samples of the report item are queued by now
    addressSpace_.setDouble(nodes[1], 7.0);
    addressSpace_.setDouble(nodes[0], 5.0);
    advance(100);

    EXPECT_EQ((std::vector<UA_UInt32>{1, 2}), lastBatch());
    const auto& dataChange = std::get<DataChangeNotification>(
        sink_.dataMessages().back().notificationData.at(0));
    EXPECT_DOUBLE_EQ(7.0, *dataChange.monitoredItems.at(1).value.numericValue());
    EXPECT_EQ(UA_STATUSCODE_GOOD, dataChange.monitoredItems.at(1).value.status());

    auto diagnostics = subscription->getMonitoredItemDiagnostics(report);
    EXPECT_EQ(0u, (*diagnostics)["queueLength"].get<size_t>());
    EXPECT_EQ(7u, (*diagnostics)["discardedCount"].get<uint64_t>());
}

TEST_F(SetTriggeringTest, SamplingReportItem_FlagsOverflowOnNewestValue) {
    auto subscription = createSubscription();
    UA_UInt32 trigger = createItem(*subscription,
                                   makeRequest(nodes[0], 1, UA_MONITORINGMODE_REPORTING, 0.0));
    UA_UInt32 report = createItem(*subscription,
                                  makeRequest(nodes[1], 2, UA_MONITORINGMODE_SAMPLING, 10.0, 3));
    subscription->setTriggering(trigger, {report}, {});

    advance(100);
    addressSpace_.setDouble(nodes[0], 5.0);
    advance(100);

    const auto& dataChange = std::get<DataChangeNotification>(
        sink_.dataMessages().back().notificationData.at(0));
    ASSERT_EQ(2u, dataChange.monitoredItems.size());
    EXPECT_EQ(MonitoredItem::OVERFLOW_INFO_BITS,
              dataChange.monitoredItems[1].value.status() & MonitoredItem::OVERFLOW_INFO_BITS);
}

// Scenarios

TEST_F(SetTriggeringTest, ReportingTrigger_PullsSamplingItemsIntoBatch) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING,
                                           UA_MONITORINGMODE_SAMPLING});

    // One sample per item lands before the first publish cycle
    advance(100);
    ASSERT_EQ(1u, sink_.dataMessages().size());
    EXPECT_EQ((std::vector<UA_UInt32>{1}), lastBatch());

    auto result = subscription->setTriggering(ids[0], {ids[1], ids[2]}, {});
    EXPECT_EQ((std::vector<UA_StatusCode>{UA_STATUSCODE_GOOD, UA_STATUSCODE_GOOD}), result.addResults);

    // id2 and id3 hold two samples each; a trigger flushes only the newest
    advance(100);
    ASSERT_EQ(2u, sink_.dataMessages().size());
    EXPECT_EQ((std::vector<UA_UInt32>{1, 2, 3}), lastBatch());

    const auto messages = sink_.dataMessages();
    EXPECT_LT(messages[0].sequenceNumber, messages[1].sequenceNumber);
}

TEST_F(SetTriggeringTest, ReportItems_FollowTheirTriggerInTheBatch) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_REPORTING,
                                           UA_MONITORINGMODE_SAMPLING});
    subscription->setTriggering(ids[0], {ids[2]}, {});

    advance(100);

    // id3 is marked while id1 is visited, before id2
    EXPECT_EQ((std::vector<UA_UInt32>{1, 3, 2}), lastBatch());
}

TEST_F(SetTriggeringTest, DisabledTrigger_NeverProducesNotifications) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_DISABLED, UA_MONITORINGMODE_SAMPLING,
                                           UA_MONITORINGMODE_SAMPLING});
    subscription->setTriggering(ids[0], {ids[1], ids[2]}, {});

    for (int cycle = 0; cycle < 5; ++cycle) {
        addressSpace_.setDouble(nodes[0], 10.0 + cycle);
        advance(100);
    }

    EXPECT_TRUE(sink_.dataMessages().empty());
    EXPECT_GT(sink_.keepAliveCount(), 0u);
}

TEST_F(SetTriggeringTest, SamplingTrigger_DoesNotChangeReportingItems) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_SAMPLING, UA_MONITORINGMODE_REPORTING,
                                           UA_MONITORINGMODE_REPORTING});

    advance(100);
    EXPECT_EQ((std::vector<UA_UInt32>{2, 3}), lastBatch());

    subscription->setTriggering(ids[0], {ids[1], ids[2]}, {});
    advance(100);
    EXPECT_EQ((std::vector<UA_UInt32>{2, 3}), lastBatch());

    subscription->setTriggering(ids[0], {}, {ids[1], ids[2]});
    advance(100);
    EXPECT_EQ((std::vector<UA_UInt32>{2, 3}), lastBatch());

    for (const auto& message : sink_.dataMessages()) {
        EXPECT_EQ(2u, message.dataChangeCount());
    }
}

// Item deletion and mode changes

TEST_F(SetTriggeringTest, DeletingReportItem_RemovesItsLinksSilently) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING,
                                           UA_MONITORINGMODE_SAMPLING});
    subscription->setTriggering(ids[0], {ids[1], ids[2]}, {});

    EXPECT_EQ(UA_STATUSCODE_GOOD, subscription->deleteMonitoredItem(ids[1]));

    auto diagnostics = subscription->getMonitoredItemDiagnostics(ids[0]);
    EXPECT_EQ((std::vector<UA_UInt32>{ids[2]}), (*diagnostics)["triggers"].get<std::vector<UA_UInt32>>());

    auto result = subscription->setTriggering(ids[0], {}, {ids[1]});
    EXPECT_EQ(UA_STATUSCODE_BADMONITOREDITEMIDINVALID, result.removeResults.at(0));

    advance(100);
    EXPECT_EQ((std::vector<UA_UInt32>{1, 3}), lastBatch());
}

TEST_F(SetTriggeringTest, DeletingTrigger_KeepsReportItems) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING,
                                           UA_MONITORINGMODE_SAMPLING});
    subscription->setTriggering(ids[0], {ids[1], ids[2]}, {});

    EXPECT_EQ(UA_STATUSCODE_GOOD, subscription->deleteMonitoredItem(ids[0]));
    EXPECT_EQ(2u, subscription->getMonitoredItemCount());
    EXPECT_EQ(0u, subscription->getDiagnostics()["triggeringLinks"].get<size_t>());

    advance(300);
    EXPECT_TRUE(sink_.dataMessages().empty());
}

TEST_F(SetTriggeringTest, DisablingTrigger_StopsReportsButKeepsLinks) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING});
    subscription->setTriggering(ids[0], {ids[1]}, {});

    advance(100);
    EXPECT_EQ((std::vector<UA_UInt32>{1, 2}), lastBatch());

    subscription->setMonitoringMode({ids[0]}, UA_MONITORINGMODE_DISABLED);
    sink_.clear();
    advance(300);
    EXPECT_TRUE(sink_.dataMessages().empty());
    EXPECT_EQ(2u, subscription->getMonitoredItemCount());
    EXPECT_EQ(1u, subscription->getDiagnostics()["triggeringLinks"].get<size_t>());

    subscription->setMonitoringMode({ids[0]}, UA_MONITORINGMODE_REPORTING);
    advance(100);
    EXPECT_EQ((std::vector<UA_UInt32>{1, 2}), lastBatch());
}

TEST_F(SetTriggeringTest, ReportItemSwitchedToReporting_IsNotDuplicated) {
    auto subscription = createSubscription();
    auto ids = createItems(*subscription, {UA_MONITORINGMODE_REPORTING, UA_MONITORINGMODE_SAMPLING});
    subscription->setTriggering(ids[0], {ids[1]}, {});

    subscription->setMonitoringMode({ids[1]}, UA_MONITORINGMODE_REPORTING);
    advance(100);

    EXPECT_EQ((std::vector<UA_UInt32>{1, 2}), lastBatch());
}

} // namespace test
} // namespace opcuasub
