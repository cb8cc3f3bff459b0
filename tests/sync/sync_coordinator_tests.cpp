/**
 * @file sync_coordinator_tests.cpp
 * @brief Unit tests for update policies, resync and conflict handling
 */

#include <gtest/gtest.h>
#include "nightfall/sync/sync_coordinator.h"
#include "nightfall/net/json_text.h"
#include "nightfall/net/wire_codec.h"
#include <vector>

using namespace nightfall;
using namespace nightfall::sync;

namespace {

struct RecordingChannel : public ISyncChannel {
    bool connected{true};
    std::vector<net::WireMessage> sent;

    bool is_connected() const override { return connected; }

    bool send(const net::WireMessage& message) override {
        sent.push_back(message);
        return true;
    }

    std::vector<net::WireMessage> with_event(const std::string& event) const {
        std::vector<net::WireMessage> result;
        for (const auto& m : sent) {
            if (m.event == event) result.push_back(m);
        }
        return result;
    }
};

game::GameState day_state() {
    game::GameState state;
    state.game_id = "g1";
    state.room_id = "r1";
    state.phase = game::GamePhase::Day;
    state.day_number = 1;
    state.time_remaining_s = 60;
    state.players = {game::Player{"me", "me", "villager", true, false},
                     game::Player{"p2", "bob", "werewolf", true, false}};
    return state;
}

} // anonymous namespace

class SyncCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        coordinator.set_channel(&channel);
        coordinator.events().subscribe([this](const SyncEvent& e) { events.push_back(e); });
    }

    /// Establish a sync point through a regular snapshot
    void sync_at(Timestamp timestamp, game::GameState state = day_state()) {
        ASSERT_EQ(coordinator.apply_snapshot(game::StateSnapshot{state, timestamp, {}}), SyncResult::Success);
    }

    ActionId enqueue_vote(const std::string& target) {
        ActionRequest request;
        request.kind = net::wire::CAST_VOTE;
        request.payload = {{"targetId", target}};
        ActionId id;
        EXPECT_EQ(queue.enqueue(request, id), QueueResult::Success);
        replica.add_tentative(queue.find(id)->to_tentative_op());
        return id;
    }

    SizeT count(SyncEvent::Kind kind) const {
        SizeT n = 0;
        for (const auto& e : events) {
            if (e.kind == kind) ++n;
        }
        return n;
    }

    core::ManualScheduler scheduler;
    ActionQueue queue{scheduler};
    game::ReplicaState replica{"me"};
    SyncCoordinator coordinator{scheduler, queue, replica};
    RecordingChannel channel;
    std::vector<SyncEvent> events;
};

// ============================================================================
// Resync
// ============================================================================

TEST_F(SyncCoordinatorTest, RequestSyncSendsPendingSummaries) {
    ActionId id = enqueue_vote("p2");
    coordinator.set_last_sync_time(500);

    EXPECT_EQ(coordinator.request_sync(), SyncResult::Success);
    EXPECT_TRUE(coordinator.is_resyncing());
    EXPECT_EQ(count(SyncEvent::Kind::ResyncStarted), 1u);

    auto requests = channel.with_event(net::wire::REQUEST_SYNC);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(net::json::find_int(requests[0].data, "lastSyncTime"), 500);
    auto pending = net::json::array_elements(*net::json::find_raw(requests[0].data, "pendingActions"));
    ASSERT_TRUE(pending.has_value());
    ASSERT_EQ(pending->size(), 1u);
    EXPECT_EQ(net::json::find_string((*pending)[0], "id"), id);
    EXPECT_EQ(net::json::find_string((*pending)[0], "event"), net::wire::CAST_VOTE);
}

TEST_F(SyncCoordinatorTest, OnlyOneResyncInFlight) {
    EXPECT_EQ(coordinator.request_sync(), SyncResult::Success);
    EXPECT_EQ(coordinator.request_sync(), SyncResult::AlreadyResyncing);
    EXPECT_EQ(channel.with_event(net::wire::REQUEST_SYNC).size(), 1u);
    EXPECT_EQ(coordinator.state().sync_attempt, 1u);
}

TEST_F(SyncCoordinatorTest, OfflineRequestIsDeferredUntilConnect) {
    channel.connected = false;
    EXPECT_EQ(coordinator.request_sync(), SyncResult::NotConnected);
    EXPECT_TRUE(channel.sent.empty());

    channel.connected = true;
    coordinator.on_connected(false);
    EXPECT_EQ(channel.with_event(net::wire::REQUEST_SYNC).size(), 1u);
    EXPECT_TRUE(coordinator.is_resyncing());
}

TEST_F(SyncCoordinatorTest, ConnectWithoutHistoryDoesNotResync) {
    coordinator.on_connected(false);
    EXPECT_TRUE(channel.sent.empty());

    coordinator.set_last_sync_time(100);
    coordinator.on_connected(true);
    EXPECT_EQ(channel.with_event(net::wire::REQUEST_SYNC).size(), 1u);
}

TEST_F(SyncCoordinatorTest, TimeoutRetriesWithBackoffThenFails) {
    ASSERT_EQ(coordinator.request_sync(), SyncResult::Success);

    scheduler.advance(Duration(10000));
    EXPECT_EQ(count(SyncEvent::Kind::SyncTimeout), 1u);
    EXPECT_FALSE(coordinator.is_resyncing());

    scheduler.advance(Duration(1000));
    EXPECT_EQ(channel.with_event(net::wire::REQUEST_SYNC).size(), 2u);

    // Attempts 3..5 follow at 2s, 4s and 8s backoff after each 10s timeout
    scheduler.advance(Duration(10000 + 2000 + 10000 + 4000 + 10000 + 8000));
    EXPECT_EQ(channel.with_event(net::wire::REQUEST_SYNC).size(), 5u);
    EXPECT_EQ(count(SyncEvent::Kind::SyncFailed), 0u);

    scheduler.advance(Duration(10000));
    EXPECT_EQ(count(SyncEvent::Kind::SyncTimeout), 5u);
    EXPECT_EQ(count(SyncEvent::Kind::SyncFailed), 1u);

    scheduler.advance(Duration(120000));
    EXPECT_EQ(channel.with_event(net::wire::REQUEST_SYNC).size(), 5u);
}

TEST_F(SyncCoordinatorTest, DisconnectDuringResyncDefersIt) {
    ASSERT_EQ(coordinator.request_sync(), SyncResult::Success);
    channel.connected = false;
    coordinator.on_disconnected();
    EXPECT_FALSE(coordinator.is_resyncing());

    scheduler.advance(Duration(60000));
    EXPECT_EQ(count(SyncEvent::Kind::SyncTimeout), 0u);

    channel.connected = true;
    coordinator.on_connected(true);
    EXPECT_EQ(channel.with_event(net::wire::REQUEST_SYNC).size(), 2u);
}

TEST_F(SyncCoordinatorTest, RespondToSyncRequestIncludesPayloads) {
    coordinator.set_last_sync_time(42);
    ActionId id = enqueue_vote("p2");

    EXPECT_EQ(coordinator.respond_to_sync_request(), SyncResult::Success);
    auto responses = channel.with_event(net::wire::SYNC_RESPONSE);
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(net::json::find_int(responses[0].data, "lastSyncTime"), 42);

    auto pending = net::json::array_elements(*net::json::find_raw(responses[0].data, "pendingActions"));
    ASSERT_EQ(pending->size(), 1u);
    EXPECT_EQ(net::json::find_string((*pending)[0], "id"), id);
    EXPECT_EQ(net::json::find_int((*pending)[0], "retryCount", -1), 0);
    auto data = net::decode_fields(*net::json::find_raw((*pending)[0], "data"));
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->at("targetId"), "p2");

    channel.connected = false;
    EXPECT_EQ(coordinator.respond_to_sync_request(), SyncResult::NotConnected);
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(SyncCoordinatorTest, SnapshotReplacesBaseAndKeepsPendingOverlay) {
    ActionId id = enqueue_vote("p2");
    sync_at(1000);

    EXPECT_EQ(coordinator.last_sync_time(), 1000);
    EXPECT_EQ(replica.confirmed().phase, game::GamePhase::Day);
    EXPECT_TRUE(replica.has_tentative(id));
    ASSERT_NE(replica.view().find_vote("me"), nullptr);
    EXPECT_EQ(count(SyncEvent::Kind::SnapshotApplied), 1u);
}

TEST_F(SyncCoordinatorTest, SnapshotAcknowledgesAppliedActions) {
    ActionId applied = enqueue_vote("p2");
    scheduler.advance(Duration(5));
    ActionId still_pending = enqueue_vote("me");

    ASSERT_EQ(coordinator.apply_snapshot(game::StateSnapshot{day_state(), 1000, {applied}}),
              SyncResult::Success);
    EXPECT_FALSE(queue.contains(applied));
    EXPECT_TRUE(queue.contains(still_pending));
    EXPECT_FALSE(replica.has_tentative(applied));
    EXPECT_TRUE(replica.has_tentative(still_pending));
}

TEST_F(SyncCoordinatorTest, StaleSnapshotIgnored) {
    sync_at(1000);
    game::GameState old = day_state();
    old.phase = game::GamePhase::Lobby;

    EXPECT_EQ(coordinator.apply_snapshot(game::StateSnapshot{old, 900, {}}), SyncResult::StaleUpdate);
    EXPECT_EQ(coordinator.apply_snapshot(game::StateSnapshot{old, 1000, {}}), SyncResult::StaleUpdate);
    EXPECT_EQ(replica.confirmed().phase, game::GamePhase::Day);
    EXPECT_EQ(coordinator.stats().stale_updates, 2u);
}

TEST_F(SyncCoordinatorTest, EqualTimestampCompletesResync) {
    sync_at(1000);
    ASSERT_EQ(coordinator.request_sync(), SyncResult::Success);

    EXPECT_EQ(coordinator.apply_snapshot(game::StateSnapshot{day_state(), 1000, {}}), SyncResult::Success);
    EXPECT_FALSE(coordinator.is_resyncing());
    EXPECT_EQ(coordinator.state().sync_attempt, 0u);

    scheduler.advance(Duration(60000));
    EXPECT_EQ(count(SyncEvent::Kind::SyncTimeout), 0u);
}

TEST_F(SyncCoordinatorTest, SnapshotReleasesTimedOutActions) {
    struct Transmitter : IActionTransmitter {
        int sends{0};
        bool can_transmit() const override { return true; }
        bool transmit(const QueuedAction&, bool) override { ++sends; return true; }
    } transmitter;
    queue.set_transmitter(&transmitter);

    ActionId id = enqueue_vote("p2");
    scheduler.advance(Duration(5000));
    ASSERT_EQ(queue.find(id)->status, ActionStatus::TimedOut);

    sync_at(scheduler.now());
    EXPECT_EQ(transmitter.sends, 2);
    EXPECT_EQ(queue.find(id)->status, ActionStatus::InFlight);
    queue.set_transmitter(nullptr);
}

// ============================================================================
// Incremental Updates
// ============================================================================

TEST_F(SyncCoordinatorTest, PhaseWithinToleranceApplies) {
    sync_at(1000);
    // 60 s remaining: the transition is expected at 61000
    EXPECT_EQ(coordinator.apply_phase_change(game::PhaseUpdate{game::GamePhase::Night, 30, 1u, 61800}),
              SyncResult::Success);
    EXPECT_EQ(replica.confirmed().phase, game::GamePhase::Night);
    EXPECT_EQ(coordinator.last_sync_time(), 61800);
}

TEST_F(SyncCoordinatorTest, PhaseOutsideToleranceIsConflict) {
    sync_at(1000);
    EXPECT_EQ(coordinator.apply_phase_change(game::PhaseUpdate{game::GamePhase::Night, 30, 1u, 20000}),
              SyncResult::ConflictDetected);

    EXPECT_EQ(replica.confirmed().phase, game::GamePhase::Day);
    auto pending = coordinator.pending_conflicts();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, "conflict-1");
    EXPECT_EQ(pending[0].subject, ConflictSubject::Phase);
    EXPECT_EQ(pending[0].local_snapshot.phase, game::GamePhase::Day);
    EXPECT_EQ(pending[0].remote_snapshot.phase, game::GamePhase::Night);
    EXPECT_EQ(pending[0].conflicting_fields, std::vector<std::string>{"phase"});
    EXPECT_EQ(coordinator.state().conflict_count, 1u);

    EXPECT_TRUE(coordinator.is_resyncing());
    EXPECT_EQ(channel.with_event(net::wire::REQUEST_SYNC).size(), 1u);
}

TEST_F(SyncCoordinatorTest, SamePhaseNeverConflicts) {
    sync_at(1000);
    EXPECT_EQ(coordinator.apply_phase_change(game::PhaseUpdate{game::GamePhase::Day, 10, std::nullopt, 90000}),
              SyncResult::Success);
    EXPECT_TRUE(coordinator.pending_conflicts().empty());
}

TEST_F(SyncCoordinatorTest, FirstPhaseWithoutSyncPointApplies) {
    EXPECT_EQ(coordinator.apply_phase_change(game::PhaseUpdate{game::GamePhase::Night, 30, 1u, 5000}),
              SyncResult::Success);
    EXPECT_EQ(replica.confirmed().phase, game::GamePhase::Night);
}

TEST_F(SyncCoordinatorTest, StalePhaseIgnored) {
    sync_at(1000);
    EXPECT_EQ(coordinator.apply_phase_change(game::PhaseUpdate{game::GamePhase::Night, 30, 1u, 999}),
              SyncResult::StaleUpdate);
    EXPECT_EQ(count(SyncEvent::Kind::UpdateIgnored), 1u);
}

TEST_F(SyncCoordinatorTest, VotesBetweenPhasesKeepPhaseClock) {
    sync_at(1000);
    game::VotesUpdate votes{{game::Vote{"p2", "me", 31000}}, 31000};
    ASSERT_EQ(coordinator.apply_votes(votes), SyncResult::Success);
    EXPECT_EQ(coordinator.last_sync_time(), 31000);

    // Still due at 61000: the votes do not move the phase clock
    EXPECT_EQ(coordinator.apply_phase_change(game::PhaseUpdate{game::GamePhase::Night, 30, 1u, 61000}),
              SyncResult::Success);
    EXPECT_TRUE(coordinator.pending_conflicts().empty());
    EXPECT_FALSE(coordinator.is_resyncing());
    EXPECT_EQ(replica.confirmed().phase, game::GamePhase::Night);
}

TEST_F(SyncCoordinatorTest, PhaseClockFollowsAppliedPhase) {
    sync_at(1000);
    ASSERT_EQ(coordinator.apply_phase_change(game::PhaseUpdate{game::GamePhase::Night, 30, 1u, 61000}),
              SyncResult::Success);
    coordinator.apply_elimination(game::EliminationUpdate{"p2", "killed", 75000});

    // Night lasts 30 s from 61000
    EXPECT_EQ(coordinator.apply_phase_change(game::PhaseUpdate{game::GamePhase::Day, 60, 2u, 91500}),
              SyncResult::Success);
    EXPECT_TRUE(coordinator.pending_conflicts().empty());
}

TEST_F(SyncCoordinatorTest, VotesApplyUnlessOlder) {
    sync_at(1000);
    game::VotesUpdate update{{game::Vote{"p2", "me", 1000}}, 1000};
    EXPECT_EQ(coordinator.apply_votes(update), SyncResult::Success);
    EXPECT_EQ(replica.confirmed().votes.size(), 1u);

    game::VotesUpdate old{{}, 500};
    EXPECT_EQ(coordinator.apply_votes(old), SyncResult::StaleUpdate);
    EXPECT_EQ(replica.confirmed().votes.size(), 1u);
}

TEST_F(SyncCoordinatorTest, CurrentEliminationApplies) {
    sync_at(1000);
    EXPECT_EQ(coordinator.apply_elimination(game::EliminationUpdate{"p2", "voted", 1500}),
              SyncResult::Success);
    EXPECT_TRUE(replica.confirmed().is_eliminated("p2"));
    EXPECT_EQ(coordinator.last_sync_time(), 1500);
}

TEST_F(SyncCoordinatorTest, OldEliminationOfAlivePlayerIsConflict) {
    sync_at(1000);
    EXPECT_EQ(coordinator.apply_elimination(game::EliminationUpdate{"p2", "voted", 500}),
              SyncResult::ConflictDetected);

    auto pending = coordinator.pending_conflicts();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].subject, ConflictSubject::Elimination);
    EXPECT_TRUE(pending[0].remote_snapshot.is_eliminated("p2"));
    EXPECT_FALSE(pending[0].remote_snapshot.find_player("p2")->is_alive);
    EXPECT_FALSE(replica.confirmed().is_eliminated("p2"));
    EXPECT_TRUE(coordinator.is_resyncing());
}

TEST_F(SyncCoordinatorTest, OldEliminationAlreadyKnownIsStale) {
    game::GameState state = day_state();
    state.eliminated_player_ids = {"p2"};
    sync_at(1000, state);

    EXPECT_EQ(coordinator.apply_elimination(game::EliminationUpdate{"p2", "voted", 500}),
              SyncResult::StaleUpdate);
    EXPECT_TRUE(coordinator.pending_conflicts().empty());
}

TEST_F(SyncCoordinatorTest, SnapshotSupersedesDetectedConflicts) {
    sync_at(1000);
    coordinator.apply_elimination(game::EliminationUpdate{"p2", "voted", 500});
    ASSERT_EQ(coordinator.pending_conflicts().size(), 1u);

    game::GameState fresh = day_state();
    fresh.eliminated_player_ids = {"p2"};
    sync_at(2000, fresh);

    EXPECT_TRUE(coordinator.pending_conflicts().empty());
    auto record = coordinator.find_conflict("conflict-1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->resolution, Resolution::Remote);
    EXPECT_EQ(record->resolved_at, scheduler.now());
}

// ============================================================================
// Server Conflicts & Resolution
// ============================================================================

TEST_F(SyncCoordinatorTest, ServerConflictWithHintAutoResolves) {
    sync_at(1000);
    ActionId id = enqueue_vote("p2");

    game::ServerConflict conflict;
    conflict.server_state = day_state();
    conflict.server_state.phase = game::GamePhase::Voting;
    conflict.conflicting_fields = {"votes"};
    conflict.conflicting_actions = {id};
    conflict.resolution_hint = "server";

    EXPECT_EQ(coordinator.handle_server_conflict(conflict), SyncResult::ConflictDetected);
    EXPECT_FALSE(queue.contains(id));
    EXPECT_EQ(replica.confirmed().phase, game::GamePhase::Voting);
    EXPECT_EQ(replica.tentative_count(), 0u);
    EXPECT_TRUE(coordinator.pending_conflicts().empty());

    auto resolved = channel.with_event(net::wire::SYNC_CONFLICT_RESOLVED);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(net::json::find_string(resolved[0].data, "conflictId"), "conflict-1");
    EXPECT_EQ(net::json::find_string(resolved[0].data, "resolution"), "server");
}

TEST_F(SyncCoordinatorTest, ServerConflictWithoutHintWaits) {
    game::ServerConflict conflict;
    conflict.server_state = day_state();
    coordinator.handle_server_conflict(conflict);

    auto pending = coordinator.pending_conflicts();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_TRUE(pending[0].server_reported);
    EXPECT_EQ(pending[0].subject, ConflictSubject::GameState);
}

TEST_F(SyncCoordinatorTest, ServerConflictEndsResync) {
    ASSERT_EQ(coordinator.request_sync(), SyncResult::Success);
    game::ServerConflict conflict;
    conflict.server_state = day_state();
    coordinator.handle_server_conflict(conflict);

    EXPECT_FALSE(coordinator.is_resyncing());
    scheduler.advance(Duration(60000));
    EXPECT_EQ(count(SyncEvent::Kind::SyncTimeout), 0u);
}

TEST_F(SyncCoordinatorTest, ManualResolutionRules) {
    game::ServerConflict conflict;
    conflict.server_state = day_state();
    coordinator.handle_server_conflict(conflict);

    EXPECT_EQ(coordinator.resolve_conflict("conflict-9", Resolution::Local), SyncResult::ConflictNotFound);
    EXPECT_EQ(coordinator.resolve_conflict("conflict-1", Resolution::Merged), SyncResult::MissingMergedState);
    EXPECT_EQ(coordinator.resolve_conflict("conflict-1", Resolution::Pending), SyncResult::InvalidResolution);

    EXPECT_EQ(coordinator.resolve_conflict("conflict-1", Resolution::Local), SyncResult::Success);
    EXPECT_EQ(coordinator.resolve_conflict("conflict-1", Resolution::Remote), SyncResult::AlreadyResolved);

    auto record = coordinator.find_conflict("conflict-1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->resolution, Resolution::Local);
    EXPECT_EQ(channel.with_event(net::wire::SYNC_CONFLICT_RESOLVED).size(), 1u);
}

TEST_F(SyncCoordinatorTest, MergedResolutionKeepsPendingOverlay) {
    ActionId id = enqueue_vote("p2");
    game::ServerConflict conflict;
    conflict.server_state = day_state();
    coordinator.handle_server_conflict(conflict);

    game::GameState merged = day_state();
    merged.phase = game::GamePhase::Night;
    EXPECT_EQ(coordinator.resolve_conflict("conflict-1", Resolution::Merged, merged), SyncResult::Success);
    EXPECT_EQ(replica.confirmed().phase, game::GamePhase::Night);
    EXPECT_TRUE(replica.has_tentative(id));

    auto resolved = channel.with_event(net::wire::SYNC_CONFLICT_RESOLVED);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(net::json::find_string(resolved[0].data, "resolution"), "merge");
    auto state = net::decode_game_state(*net::json::find_raw(resolved[0].data, "state"));
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->phase, game::GamePhase::Night);
}

TEST_F(SyncCoordinatorTest, ConflictCountResetsOnReconnect) {
    sync_at(1000);
    coordinator.apply_elimination(game::EliminationUpdate{"p2", "voted", 500});
    EXPECT_EQ(coordinator.state().conflict_count, 1u);

    coordinator.on_disconnected();
    coordinator.on_connected(true);
    EXPECT_EQ(coordinator.state().conflict_count, 0u);
}

TEST_F(SyncCoordinatorTest, HistoryEvictsOnlyResolvedRecords) {
    SyncCoordinatorConfig config;
    config.max_conflict_history = 2;
    config.auto_resolve_server_hints = false;
    SyncCoordinator small{scheduler, queue, replica, config};

    game::ServerConflict conflict;
    conflict.server_state = day_state();
    small.handle_server_conflict(conflict);
    small.handle_server_conflict(conflict);
    small.handle_server_conflict(conflict);
    EXPECT_EQ(small.conflict_history().size(), 3u);

    ASSERT_EQ(small.resolve_conflict("conflict-1", Resolution::Local), SyncResult::Success);
    small.handle_server_conflict(conflict);

    auto history = small.conflict_history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].id, "conflict-2");
}

TEST_F(SyncCoordinatorTest, ResetForgetsEverything) {
    sync_at(1000);
    coordinator.apply_elimination(game::EliminationUpdate{"p2", "voted", 500});

    coordinator.reset();
    EXPECT_EQ(coordinator.last_sync_time(), 0);
    EXPECT_FALSE(coordinator.is_resyncing());
    EXPECT_TRUE(coordinator.conflict_history().empty());
    EXPECT_EQ(coordinator.state().conflict_count, 0u);
}

TEST(ResolutionNameTest, WireNames) {
    EXPECT_EQ(resolution_from_string("server"), Resolution::Remote);
    EXPECT_EQ(resolution_from_string("client"), Resolution::Local);
    EXPECT_EQ(resolution_from_string("merge"), Resolution::Merged);
    EXPECT_FALSE(resolution_from_string("coin-flip").has_value());
    EXPECT_STREQ(resolution_to_string(Resolution::Remote), "server");
}
