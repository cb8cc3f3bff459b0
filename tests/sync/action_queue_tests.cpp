/**
 * @file action_queue_tests.cpp
 * @brief Unit tests for the optimistic action queue
 */

#include <gtest/gtest.h>
#include "nightfall/sync/action_queue.h"
#include "nightfall/net/wire.h"
#include <cstdint>
#include <functional>
#include <vector>

using namespace nightfall;
using namespace nightfall::sync;

namespace {

struct RecordingTransmitter : public IActionTransmitter {
    bool connected{true};
    bool fail{false};
    SizeT fail_after{SIZE_MAX};     // transmissions allowed before failing
    std::vector<std::pair<ActionId, bool>> sent;   // id, is_retry
    std::function<void(const QueuedAction&)> on_transmit;

    bool can_transmit() const override { return connected; }

    bool transmit(const QueuedAction& action, bool is_retry) override {
        if (fail || sent.size() >= fail_after) {
            return false;
        }
        sent.emplace_back(action.id, is_retry);
        if (on_transmit) {
            on_transmit(action);
        }
        return true;
    }
};

ActionRequest vote(const std::string& target) {
    ActionRequest request;
    request.kind = net::wire::CAST_VOTE;
    request.payload = {{"targetId", target}};
    return request;
}

} // anonymous namespace

class ActionQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        queue.set_transmitter(&transmitter);
        queue.events().subscribe([this](const ActionEvent& e) { events.push_back(e); });
    }

    ActionId enqueue(const ActionRequest& request) {
        ActionId id;
        EXPECT_EQ(queue.enqueue(request, id), QueueResult::Success);
        return id;
    }

    std::vector<ActionEvent::Kind> kinds() const {
        std::vector<ActionEvent::Kind> result;
        for (const auto& e : events) result.push_back(e.kind);
        return result;
    }

    SizeT count(ActionEvent::Kind kind) const {
        SizeT n = 0;
        for (const auto& e : events) {
            if (e.kind == kind) ++n;
        }
        return n;
    }

    core::ManualScheduler scheduler;
    RecordingTransmitter transmitter;
    ActionQueue queue{scheduler};
    std::vector<ActionEvent> events;
};

// ============================================================================
// Enqueue
// ============================================================================

TEST_F(ActionQueueTest, EnqueuePublishesThenTransmits) {
    ActionId id = enqueue(vote("p2"));

    EXPECT_EQ(kinds(), (std::vector<ActionEvent::Kind>{ActionEvent::Kind::Enqueued,
                                                        ActionEvent::Kind::Transmitted}));
    ASSERT_EQ(transmitter.sent.size(), 1u);
    EXPECT_EQ(transmitter.sent[0].first, id);
    EXPECT_FALSE(transmitter.sent[0].second);

    auto action = queue.find(id);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(action->status, ActionStatus::InFlight);
    EXPECT_EQ(action->transmit_count, 1u);
    EXPECT_EQ(action->created_at, scheduler.now());
    EXPECT_EQ(action->max_retries, 3u);
    EXPECT_EQ(action->payload.at("targetId"), "p2");
}

TEST_F(ActionQueueTest, EnqueueOfflineStaysPending) {
    transmitter.connected = false;
    ActionId id = enqueue(vote("p2"));

    EXPECT_EQ(kinds(), std::vector<ActionEvent::Kind>{ActionEvent::Kind::Enqueued});
    EXPECT_TRUE(transmitter.sent.empty());
    EXPECT_EQ(queue.find(id)->status, ActionStatus::Pending);
}

TEST_F(ActionQueueTest, EnqueueValidation) {
    ActionId id;
    EXPECT_EQ(queue.enqueue(ActionRequest{}, id), QueueResult::InvalidAction);

    ActionQueueConfig config;
    config.max_queue_size = 2;
    ActionQueue small{scheduler, config};
    EXPECT_EQ(small.enqueue(vote("a"), id), QueueResult::Success);
    EXPECT_EQ(small.enqueue(vote("b"), id), QueueResult::Success);
    EXPECT_EQ(small.enqueue(vote("c"), id), QueueResult::QueueFull);
    EXPECT_EQ(small.size(), 2u);
}

TEST_F(ActionQueueTest, ActionIdsAreTimeOrdered) {
    ActionId first = generate_action_id(1'700'000'000'000);
    ActionId second = generate_action_id(1'700'000'000'000);
    ActionId later = generate_action_id(1'700'000'000'001);

    EXPECT_EQ(first.size(), 27u);
    EXPECT_EQ(first.substr(0, 13), "1700000000000");
    EXPECT_LT(first, second);
    EXPECT_LT(second, later);
}

// ============================================================================
// Acknowledge / Reject / Cancel
// ============================================================================

TEST_F(ActionQueueTest, AcknowledgeRemovesOnce) {
    ActionId id = enqueue(vote("p2"));

    EXPECT_EQ(queue.acknowledge(id), QueueResult::Success);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(count(ActionEvent::Kind::Acknowledged), 1u);

    EXPECT_EQ(queue.acknowledge(id), QueueResult::ActionNotFound);
    EXPECT_EQ(count(ActionEvent::Kind::Acknowledged), 1u);

    // The ack timer was cancelled
    scheduler.advance(Duration(60000));
    EXPECT_EQ(count(ActionEvent::Kind::TimedOut), 0u);
}

TEST_F(ActionQueueTest, RejectRetriesOnNextFlushCycle) {
    ActionId id = enqueue(vote("p2"));
    scheduler.advance(Duration(200));

    EXPECT_EQ(queue.reject(id, "not your turn"), QueueResult::Success);
    auto action = queue.find(id);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(action->status, ActionStatus::Pending);
    EXPECT_EQ(action->retry_count, 1u);
    EXPECT_EQ(action->created_at, scheduler.now());
    EXPECT_EQ(events.back().kind, ActionEvent::Kind::Retrying);
    EXPECT_EQ(events.back().reason, "not your turn");

    scheduler.advance(Duration(999));
    EXPECT_EQ(transmitter.sent.size(), 1u);
    scheduler.advance(Duration(1));
    ASSERT_EQ(transmitter.sent.size(), 2u);
    EXPECT_TRUE(transmitter.sent[1].second);
}

TEST_F(ActionQueueTest, RetriesCoalesceIntoOneFlush) {
    ActionId a = enqueue(vote("p2"));
    ActionId b = enqueue(vote("p3"));
    queue.reject(a, "busy");
    scheduler.advance(Duration(500));
    queue.reject(b, "busy");
    EXPECT_EQ(scheduler.pending_timer_count(), 1u);

    scheduler.advance(Duration(500));
    ASSERT_EQ(transmitter.sent.size(), 4u);
    EXPECT_EQ(transmitter.sent[2].first, a);
    EXPECT_EQ(transmitter.sent[3].first, b);
}

TEST_F(ActionQueueTest, DroppedAfterRetriesExhausted) {
    ActionRequest request = vote("p2");
    request.max_retries = 1;
    ActionId id = enqueue(request);

    queue.reject(id, "invalid target");
    scheduler.advance(Duration(1000));
    EXPECT_EQ(queue.reject(id, "invalid target"), QueueResult::Success);

    EXPECT_FALSE(queue.contains(id));
    EXPECT_EQ(events.back().kind, ActionEvent::Kind::Dropped);
    EXPECT_EQ(events.back().action.retry_count, 1u);
    EXPECT_EQ(queue.stats().dropped, 1u);
    EXPECT_EQ(queue.reject(id, "again"), QueueResult::ActionNotFound);
}

TEST_F(ActionQueueTest, Cancel) {
    ActionId id = enqueue(vote("p2"));
    EXPECT_EQ(queue.cancel(id), QueueResult::Success);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(events.back().kind, ActionEvent::Kind::Cancelled);
    EXPECT_EQ(queue.cancel(id), QueueResult::ActionNotFound);
}

TEST_F(ActionQueueTest, SynchronousAckDuringTransmit) {
    transmitter.on_transmit = [this](const QueuedAction& action) { queue.acknowledge(action.id); };
    ActionId id = enqueue(vote("p2"));

    EXPECT_FALSE(queue.contains(id));
    EXPECT_EQ(count(ActionEvent::Kind::Transmitted), 0u);
    EXPECT_EQ(count(ActionEvent::Kind::Acknowledged), 1u);
    EXPECT_EQ(scheduler.pending_timer_count(), 0u);
}

// ============================================================================
// Timeouts & Connectivity
// ============================================================================

TEST_F(ActionQueueTest, AckTimeoutHoldsAction) {
    ActionId id = enqueue(vote("p2"));
    scheduler.advance(Duration(5000));

    EXPECT_EQ(queue.find(id)->status, ActionStatus::TimedOut);
    EXPECT_EQ(events.back().kind, ActionEvent::Kind::TimedOut);

    EXPECT_EQ(queue.flush(), 0u);
    EXPECT_EQ(transmitter.sent.size(), 1u);

    EXPECT_EQ(queue.release_timed_out(), 1u);
    EXPECT_EQ(queue.flush(), 1u);
    ASSERT_EQ(transmitter.sent.size(), 2u);
    EXPECT_TRUE(transmitter.sent[1].second);
}

TEST_F(ActionQueueTest, DisconnectReturnsActionsToPending) {
    ActionId id = enqueue(vote("p2"));
    transmitter.connected = false;
    queue.on_disconnected();

    EXPECT_EQ(queue.find(id)->status, ActionStatus::Pending);
    scheduler.advance(Duration(10000));
    EXPECT_EQ(count(ActionEvent::Kind::TimedOut), 0u);

    transmitter.connected = true;
    EXPECT_EQ(queue.flush(), 1u);
    EXPECT_TRUE(transmitter.sent.back().second);
}

TEST_F(ActionQueueTest, FlushFollowsCreationOrder) {
    transmitter.connected = false;
    ActionId first = enqueue(vote("a"));
    scheduler.advance(Duration(10));
    ActionId second = enqueue(vote("b"));
    scheduler.advance(Duration(10));
    ActionId third = enqueue(vote("c"));

    transmitter.connected = true;
    EXPECT_EQ(queue.flush(), 3u);
    ASSERT_EQ(transmitter.sent.size(), 3u);
    EXPECT_EQ(transmitter.sent[0].first, first);
    EXPECT_EQ(transmitter.sent[1].first, second);
    EXPECT_EQ(transmitter.sent[2].first, third);
}

TEST_F(ActionQueueTest, FlushStopsAtFirstFailure) {
    transmitter.connected = false;
    enqueue(vote("a"));
    scheduler.advance(Duration(10));
    ActionId second = enqueue(vote("b"));
    scheduler.advance(Duration(10));
    ActionId third = enqueue(vote("c"));

    transmitter.connected = true;
    transmitter.fail_after = 1;
    EXPECT_EQ(queue.flush(), 1u);
    EXPECT_EQ(queue.find(second)->status, ActionStatus::Pending);
    EXPECT_EQ(queue.find(third)->status, ActionStatus::Pending);
}

TEST_F(ActionQueueTest, ClearPublishesNothing) {
    enqueue(vote("a"));
    enqueue(vote("b"));
    SizeT before = events.size();

    queue.clear();
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(events.size(), before);
    EXPECT_EQ(scheduler.pending_timer_count(), 0u);
}

// ============================================================================
// Restore & Queries
// ============================================================================

TEST_F(ActionQueueTest, RestoreDoesNotTransmit) {
    QueuedAction action;
    action.id = "1700000000000-000001-abcdef";
    action.kind = net::wire::SEND_CHAT_MESSAGE;
    action.payload = {{"message", "hi"}};
    action.created_at = 1'699'999'999'000;
    action.status = ActionStatus::InFlight;
    action.transmit_count = 1;

    EXPECT_EQ(queue.restore(action), QueueResult::Success);
    EXPECT_EQ(events.back().kind, ActionEvent::Kind::Restored);
    EXPECT_TRUE(transmitter.sent.empty());
    EXPECT_EQ(queue.find(action.id)->status, ActionStatus::Pending);

    EXPECT_EQ(queue.restore(action), QueueResult::DuplicateAction);
    EXPECT_EQ(queue.restore(QueuedAction{}), QueueResult::InvalidAction);

    EXPECT_EQ(queue.flush(), 1u);
    EXPECT_TRUE(transmitter.sent[0].second);
}

TEST_F(ActionQueueTest, SummariesAndTentativeOps) {
    transmitter.connected = false;
    ActionId first = enqueue(vote("a"));
    scheduler.advance(Duration(10));
    ActionRequest chat;
    chat.kind = net::wire::SEND_CHAT_MESSAGE;
    chat.payload = {{"message", "hello"}};
    ActionId second = enqueue(chat);

    auto summaries = queue.summaries();
    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_EQ(summaries[0].id, first);
    EXPECT_EQ(summaries[0].kind, net::wire::CAST_VOTE);
    EXPECT_EQ(summaries[1].id, second);
    EXPECT_EQ(summaries[1].created_at, scheduler.now());

    auto ops = queue.tentative_ops();
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[1].action_id, second);
    EXPECT_EQ(ops[1].payload.at("message"), "hello");
}

TEST_F(ActionQueueTest, PriorityNames) {
    EXPECT_EQ(action_priority_from_string("high"), ActionPriority::High);
    EXPECT_EQ(action_priority_from_string("low"), ActionPriority::Low);
    EXPECT_FALSE(action_priority_from_string("urgent").has_value());
    EXPECT_STREQ(action_priority_to_string(ActionPriority::Medium), "medium");
}
