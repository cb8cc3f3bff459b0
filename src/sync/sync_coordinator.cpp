/**
 * @file sync_coordinator.cpp
 * @brief Resync, update policies and conflict bookkeeping
 */

#include "nightfall/sync/sync_coordinator.h"
#include "nightfall/core/backoff.h"
#include "nightfall/core/logging.h"
#include "nightfall/net/json_text.h"
#include "nightfall/net/wire_codec.h"
#include <algorithm>

namespace nightfall::sync {

std::optional<Resolution> resolution_from_string(const std::string& name) {
    if (name == "server" || name == "remote") return Resolution::Remote;
    if (name == "client" || name == "local") return Resolution::Local;
    if (name == "merge" || name == "merged") return Resolution::Merged;
    return std::nullopt;
}

// ============================================================================
// SyncCoordinator::Impl
// ============================================================================

struct SyncCoordinator::Impl {
    Impl(core::IScheduler& s, ActionQueue& q, game::ReplicaState& r, const SyncCoordinatorConfig& c)
        : scheduler(s), queue(q), replica(r), config(c) {}

    ~Impl() {
        cancel_timers();
    }

    // Collaborators
    core::IScheduler& scheduler;
    ActionQueue& queue;
    game::ReplicaState& replica;
    SyncCoordinatorConfig config;
    ISyncChannel* channel{nullptr};

    // Sync state
    Timestamp last_sync_time{0};
    // Server time at which the confirmed phase clock was last read
    Timestamp phase_anchor_time{0};
    bool is_resyncing{false};
    bool deferred_request{false};
    UInt32 conflict_count{0};
    UInt32 sync_attempt{0};
    UInt64 generation{0};

    TimerId sync_timer{INVALID_TIMER_ID};
    TimerId retry_timer{INVALID_TIMER_ID};

    // Conflicts in detection order
    std::vector<ConflictRecord> conflicts;
    UInt64 next_conflict_seq{1};

    core::EventChannel<SyncEvent> events;
    SyncStats stats;

    // ------------------------------------------------------------------------

    bool connected() const {
        return channel && channel->is_connected();
    }

    bool send(const char* event, const std::string& data) {
        if (!connected()) {
            return false;
        }
        return channel->send(net::WireMessage{event, data});
    }

    void publish(SyncEvent::Kind kind, const std::string& detail,
                 const std::optional<ConflictRecord>& conflict = std::nullopt) {
        SyncEvent event;
        event.kind = kind;
        event.detail = detail;
        event.conflict = conflict;
        event.attempt = sync_attempt;
        events.publish(event);
    }

    void cancel_timers() {
        if (sync_timer != INVALID_TIMER_ID) {
            scheduler.cancel(sync_timer);
            sync_timer = INVALID_TIMER_ID;
        }
        if (retry_timer != INVALID_TIMER_ID) {
            scheduler.cancel(retry_timer);
            retry_timer = INVALID_TIMER_ID;
        }
    }

    ConflictRecord* locate(const ConflictId& id) {
        auto it = std::find_if(conflicts.begin(), conflicts.end(),
            [&](const ConflictRecord& c) { return c.id == id; });
        return it == conflicts.end() ? nullptr : &*it;
    }

    void trim_history() {
        while (conflicts.size() > config.max_conflict_history) {
            auto oldest_resolved = std::find_if(conflicts.begin(), conflicts.end(),
                [](const ConflictRecord& c) { return c.is_resolved(); });
            if (oldest_resolved == conflicts.end()) {
                break;   // pending records are never evicted
            }
            conflicts.erase(oldest_resolved);
        }
    }

    ConflictId record_conflict(ConflictSubject subject, game::GameState local, game::GameState remote,
                               std::vector<std::string> fields, const std::string& reason,
                               bool server_reported) {
        ConflictRecord record;
        record.id = "conflict-" + std::to_string(next_conflict_seq++);
        record.subject = subject;
        record.local_snapshot = std::move(local);
        record.remote_snapshot = std::move(remote);
        record.conflicting_fields = std::move(fields);
        record.server_reported = server_reported;
        record.detected_at = scheduler.now();
        record.reason = reason;

        ++conflict_count;
        ++stats.conflicts_detected;
        log::logger()->warn("sync: conflict {} on {} ({})", record.id,
                            conflict_subject_to_string(subject), reason);

        conflicts.push_back(record);
        trim_history();
        publish(SyncEvent::Kind::ConflictDetected, reason, record);
        return record.id;
    }

    void mark_resolved(ConflictRecord& record, Resolution resolution) {
        record.resolution = resolution;
        record.resolved_at = scheduler.now();
        ++stats.conflicts_resolved;
        log::logger()->info("sync: conflict {} resolved as {}", record.id, resolution_to_string(resolution));
        publish(SyncEvent::Kind::ConflictResolved, resolution_to_string(resolution), record);
    }

    void ignore_stale(const char* what, Timestamp timestamp) {
        ++stats.stale_updates;
        log::logger()->debug("sync: ignoring stale {} ({} < {})", what, timestamp, last_sync_time);
        publish(SyncEvent::Kind::UpdateIgnored, what);
    }

    void applied(const char* what, Timestamp timestamp) {
        last_sync_time = std::max(last_sync_time, timestamp);
        ++stats.updates_applied;
        publish(SyncEvent::Kind::UpdateApplied, what);
    }

    // ------------------------------------------------------------------------
    // Resync
    // ------------------------------------------------------------------------

    std::string encode_request() const {
        std::vector<std::string> pending;
        for (const auto& summary : queue.summaries()) {
            net::json::ObjectBuilder item;
            item.add("id", summary.id)
                .add("event", summary.kind)
                .add_int("timestamp", summary.created_at);
            pending.push_back(item.str());
        }
        net::json::ObjectBuilder data;
        data.add_int("lastSyncTime", last_sync_time)
            .add_raw("pendingActions", net::json::make_array(pending));
        return data.str();
    }

    SyncResult request_sync() {
        if (is_resyncing) {
            return SyncResult::AlreadyResyncing;
        }
        if (!connected()) {
            deferred_request = true;
            log::logger()->debug("sync: offline, resync deferred until reconnect");
            return SyncResult::NotConnected;
        }
        if (retry_timer != INVALID_TIMER_ID) {
            scheduler.cancel(retry_timer);
            retry_timer = INVALID_TIMER_ID;
        }

        if (!send(net::wire::REQUEST_SYNC, encode_request())) {
            deferred_request = true;
            return SyncResult::SendFailed;
        }

        deferred_request = false;
        is_resyncing = true;
        ++sync_attempt;
        ++stats.resyncs_started;
        log::logger()->info("sync: resync requested (attempt {}, last sync {})", sync_attempt, last_sync_time);

        UInt64 current = generation;
        sync_timer = scheduler.schedule_after(config.sync_timeout, [this, current] {
            sync_timer = INVALID_TIMER_ID;
            if (current != generation || !is_resyncing) return;
            on_sync_timeout();
        });

        publish(SyncEvent::Kind::ResyncStarted, "");
        return SyncResult::Success;
    }

    void on_sync_timeout() {
        is_resyncing = false;
        ++stats.sync_timeouts;
        log::logger()->warn("sync: no snapshot within {} ms (attempt {}/{})",
                            config.sync_timeout.count(), sync_attempt, config.max_sync_attempts);
        publish(SyncEvent::Kind::SyncTimeout, "sync timeout");

        if (sync_attempt >= config.max_sync_attempts) {
            log::logger()->error("sync: giving up after {} attempts; local state is untrusted",
                                 sync_attempt);
            publish(SyncEvent::Kind::SyncFailed, "sync attempts exhausted");
            sync_attempt = 0;
            return;
        }

        Duration delay = core::compute_backoff_delay(sync_attempt, config.sync_retry_base_delay,
                                                     config.sync_retry_max_delay);
        UInt64 current = generation;
        retry_timer = scheduler.schedule_after(delay, [this, current] {
            retry_timer = INVALID_TIMER_ID;
            if (current != generation || is_resyncing) return;
            SyncResult result = request_sync();
            if (result != SyncResult::Success) {
                log::logger()->debug("sync: retry not sent: {}", sync_result_to_string(result));
            }
        });
    }

    void finish_resync() {
        is_resyncing = false;
        sync_attempt = 0;
        deferred_request = false;
        cancel_timers();
    }
};

// ============================================================================
// SyncCoordinator
// ============================================================================

SyncCoordinator::SyncCoordinator(core::IScheduler& scheduler, ActionQueue& queue,
                                 game::ReplicaState& replica, const SyncCoordinatorConfig& config)
    : impl_(std::make_unique<Impl>(scheduler, queue, replica, config)) {}

SyncCoordinator::~SyncCoordinator() = default;

SyncCoordinator::SyncCoordinator(SyncCoordinator&&) noexcept = default;
SyncCoordinator& SyncCoordinator::operator=(SyncCoordinator&&) noexcept = default;

void SyncCoordinator::set_channel(ISyncChannel* channel) {
    impl_->channel = channel;
}

SyncResult SyncCoordinator::request_sync() {
    return impl_->request_sync();
}

SyncResult SyncCoordinator::respond_to_sync_request() {
    std::vector<std::string> pending;
    for (const auto& action : impl_->queue.pending_actions()) {
        net::json::ObjectBuilder item;
        item.add("id", action.id)
            .add("event", action.kind)
            .add_raw("data", net::encode_fields(action.payload))
            .add_int("timestamp", action.created_at)
            .add_int("retryCount", action.retry_count);
        pending.push_back(item.str());
    }
    net::json::ObjectBuilder data;
    data.add_int("lastSyncTime", impl_->last_sync_time)
        .add_raw("pendingActions", net::json::make_array(pending));

    if (!impl_->send(net::wire::SYNC_RESPONSE, data.str())) {
        return SyncResult::NotConnected;
    }
    return SyncResult::Success;
}

// ============================================================================
// Server Updates
// ============================================================================

SyncResult SyncCoordinator::apply_snapshot(const game::StateSnapshot& snapshot) {
    // A resync answer with an unchanged timestamp still completes the exchange
    bool newer = snapshot.timestamp > impl_->last_sync_time;
    bool answers_resync = impl_->is_resyncing && snapshot.timestamp >= impl_->last_sync_time;
    if (!newer && !answers_resync) {
        impl_->ignore_stale("snapshot", snapshot.timestamp);
        return SyncResult::StaleUpdate;
    }

    impl_->finish_resync();

    // Actions the server already applied count as acknowledged
    for (const auto& id : snapshot.applied_action_ids) {
        if (impl_->queue.acknowledge(id) == QueueResult::Success) {
            log::logger()->debug("sync: {} confirmed by snapshot", id);
        }
    }

    impl_->replica.replace_confirmed(snapshot.state, impl_->queue.tentative_ops());
    impl_->last_sync_time = std::max(impl_->last_sync_time, snapshot.timestamp);
    impl_->phase_anchor_time = snapshot.timestamp;

    // The snapshot supersedes every divergence we detected ourselves
    std::vector<ConflictId> superseded;
    for (const auto& record : impl_->conflicts) {
        if (!record.is_resolved() && !record.server_reported) {
            superseded.push_back(record.id);
        }
    }
    for (const auto& id : superseded) {
        if (ConflictRecord* record = impl_->locate(id)) {
            record->remote_snapshot = snapshot.state;
            impl_->mark_resolved(*record, Resolution::Remote);
        }
    }

    ++impl_->stats.snapshots_applied;
    log::logger()->info("sync: snapshot applied (ts {}, {} actions still queued)",
                        snapshot.timestamp, impl_->queue.size());
    impl_->publish(SyncEvent::Kind::SnapshotApplied, "");

    impl_->queue.release_timed_out();
    impl_->queue.flush();
    return SyncResult::Success;
}

SyncResult SyncCoordinator::apply_phase_change(const game::PhaseUpdate& update) {
    if (update.timestamp < impl_->last_sync_time) {
        impl_->ignore_stale("phase", update.timestamp);
        return SyncResult::StaleUpdate;
    }

    game::GameState local = impl_->replica.view();
    if (impl_->phase_anchor_time > 0 && update.phase != local.phase) {
        Timestamp expected = impl_->phase_anchor_time + local.time_remaining_s * 1000;
        Int64 drift = update.timestamp - expected;
        if (drift < 0) drift = -drift;

        if (drift > impl_->config.conflict_tolerance.count()) {
            game::GameState remote = local;
            remote.phase = update.phase;
            remote.time_remaining_s = update.time_remaining_s;
            if (update.day_number) remote.day_number = *update.day_number;

            std::string reason = std::string("phase ") + game::game_phase_to_string(update.phase) +
                                 " arrived " + std::to_string(drift) + " ms from expected transition";
            impl_->record_conflict(ConflictSubject::Phase, std::move(local), std::move(remote),
                                   {"phase"}, reason, false);
            SyncResult result = impl_->request_sync();
            if (result != SyncResult::Success) {
                log::logger()->debug("sync: resync after phase conflict: {}", sync_result_to_string(result));
            }
            return SyncResult::ConflictDetected;
        }
    }

    impl_->replica.apply_phase(update);
    impl_->applied("phase", update.timestamp);
    impl_->phase_anchor_time = update.timestamp;
    return SyncResult::Success;
}

SyncResult SyncCoordinator::apply_votes(const game::VotesUpdate& update) {
    if (update.timestamp < impl_->last_sync_time) {
        impl_->ignore_stale("votes", update.timestamp);
        return SyncResult::StaleUpdate;
    }
    impl_->replica.apply_votes(update);
    impl_->applied("votes", update.timestamp);
    return SyncResult::Success;
}

SyncResult SyncCoordinator::apply_elimination(const game::EliminationUpdate& update) {
    if (update.timestamp >= impl_->last_sync_time) {
        impl_->replica.apply_elimination(update);
        impl_->applied("elimination", update.timestamp);
        return SyncResult::Success;
    }

    game::GameState local = impl_->replica.view();
    if (local.is_eliminated(update.player_id)) {
        impl_->ignore_stale("elimination", update.timestamp);
        return SyncResult::StaleUpdate;
    }

    // Older than our sync point yet unknown locally: we missed something
    game::GameState remote = local;
    remote.eliminated_player_ids.push_back(update.player_id);
    if (game::Player* player = remote.find_player(update.player_id)) {
        player->is_alive = false;
    }
    impl_->record_conflict(ConflictSubject::Elimination, std::move(local), std::move(remote),
                           {"eliminatedPlayers"}, "missed elimination of " + update.player_id, false);
    SyncResult result = impl_->request_sync();
    if (result != SyncResult::Success) {
        log::logger()->debug("sync: resync after elimination conflict: {}", sync_result_to_string(result));
    }
    return SyncResult::ConflictDetected;
}

SyncResult SyncCoordinator::handle_server_conflict(const game::ServerConflict& conflict) {
    // The server's verdict ends any resync in flight
    impl_->is_resyncing = false;
    impl_->cancel_timers();
    impl_->sync_attempt = 0;

    for (const auto& id : conflict.conflicting_actions) {
        if (impl_->queue.cancel(id) == QueueResult::Success) {
            log::logger()->info("sync: withdrew conflicting action {}", id);
        }
    }

    ConflictId id = impl_->record_conflict(ConflictSubject::GameState, impl_->replica.view(),
                                           conflict.server_state, conflict.conflicting_fields,
                                           "reported by server", true);

    if (!conflict.resolution_hint.empty() && impl_->config.auto_resolve_server_hints) {
        auto hint = resolution_from_string(conflict.resolution_hint);
        if (!hint) {
            log::logger()->warn("sync: unknown resolution hint '{}'", conflict.resolution_hint);
        } else {
            std::optional<game::GameState> merged;
            if (*hint == Resolution::Merged) {
                merged = conflict.server_state;
            }
            SyncResult result = resolve_conflict(id, *hint, merged);
            if (result != SyncResult::Success) {
                log::logger()->warn("sync: auto-resolution of {} failed: {}", id, sync_result_to_string(result));
            }
        }
    }

    // Actions parked after an ack timeout go out again once the server has answered
    impl_->queue.release_timed_out();
    impl_->queue.flush();
    return SyncResult::ConflictDetected;
}

// ============================================================================
// Conflicts
// ============================================================================

SyncResult SyncCoordinator::resolve_conflict(const ConflictId& id, Resolution resolution,
                                             const std::optional<game::GameState>& merged_state) {
    ConflictRecord* record = impl_->locate(id);
    if (!record) {
        return SyncResult::ConflictNotFound;
    }
    if (record->is_resolved()) {
        return SyncResult::AlreadyResolved;
    }

    game::GameState chosen;
    switch (resolution) {
        case Resolution::Remote:
            chosen = record->remote_snapshot;
            impl_->replica.replace_confirmed(chosen, impl_->queue.tentative_ops());
            break;
        case Resolution::Local:
            chosen = impl_->replica.view();
            break;
        case Resolution::Merged:
            if (!merged_state) {
                return SyncResult::MissingMergedState;
            }
            chosen = *merged_state;
            impl_->replica.replace_confirmed(chosen, impl_->queue.tentative_ops());
            break;
        default:
            return SyncResult::InvalidResolution;
    }

    ConflictId resolved_id = record->id;
    impl_->mark_resolved(*record, resolution);

    net::json::ObjectBuilder data;
    data.add("conflictId", resolved_id)
        .add("resolution", resolution_to_string(resolution))
        .add_raw("state", net::encode_game_state(chosen));
    if (!impl_->send(net::wire::SYNC_CONFLICT_RESOLVED, data.str())) {
        log::logger()->debug("sync: resolution of {} not sent (offline)", resolved_id);
    }
    return SyncResult::Success;
}

std::vector<ConflictRecord> SyncCoordinator::pending_conflicts() const {
    std::vector<ConflictRecord> result;
    for (const auto& record : impl_->conflicts) {
        if (!record.is_resolved()) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<ConflictRecord> SyncCoordinator::conflict_history() const {
    return impl_->conflicts;
}

std::optional<ConflictRecord> SyncCoordinator::find_conflict(const ConflictId& id) const {
    for (const auto& record : impl_->conflicts) {
        if (record.id == id) {
            return record;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Session Events
// ============================================================================

void SyncCoordinator::on_connected(bool is_reconnect) {
    impl_->sync_attempt = 0;
    if (is_reconnect) {
        impl_->conflict_count = 0;
    }
    if (impl_->deferred_request || impl_->last_sync_time > 0) {
        SyncResult result = impl_->request_sync();
        if (result != SyncResult::Success) {
            log::logger()->warn("sync: resync on connect failed: {}", sync_result_to_string(result));
        }
    }
}

void SyncCoordinator::on_disconnected() {
    ++impl_->generation;
    if (impl_->is_resyncing) {
        impl_->deferred_request = true;
    }
    impl_->is_resyncing = false;
    impl_->sync_attempt = 0;
    impl_->cancel_timers();
}

void SyncCoordinator::on_action_timed_out(const ActionId& id) {
    log::logger()->info("sync: {} unanswered, forcing resync", id);
    SyncResult result = impl_->request_sync();
    if (result != SyncResult::Success) {
        log::logger()->debug("sync: resync after timeout not sent: {}", sync_result_to_string(result));
    }
}

void SyncCoordinator::set_last_sync_time(Timestamp timestamp) {
    impl_->last_sync_time = timestamp;
    impl_->phase_anchor_time = timestamp;
}

void SyncCoordinator::reset() {
    ++impl_->generation;
    impl_->cancel_timers();
    impl_->last_sync_time = 0;
    impl_->phase_anchor_time = 0;
    impl_->is_resyncing = false;
    impl_->deferred_request = false;
    impl_->conflict_count = 0;
    impl_->sync_attempt = 0;
    impl_->conflicts.clear();
}

// ============================================================================
// Queries
// ============================================================================

SyncStateSnapshot SyncCoordinator::state() const {
    SyncStateSnapshot snapshot;
    snapshot.last_sync_time = impl_->last_sync_time;
    snapshot.pending_actions = impl_->queue.summaries();
    snapshot.is_resyncing = impl_->is_resyncing;
    snapshot.conflict_count = impl_->conflict_count;
    snapshot.sync_attempt = impl_->sync_attempt;
    return snapshot;
}

Timestamp SyncCoordinator::last_sync_time() const {
    return impl_->last_sync_time;
}

bool SyncCoordinator::is_resyncing() const {
    return impl_->is_resyncing;
}

const SyncCoordinatorConfig& SyncCoordinator::config() const {
    return impl_->config;
}

SyncStats SyncCoordinator::stats() const {
    return impl_->stats;
}

core::EventChannel<SyncEvent>& SyncCoordinator::events() {
    return impl_->events;
}

} // namespace nightfall::sync
