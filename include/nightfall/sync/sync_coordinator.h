#pragma once
/**
 * @file sync_coordinator.h
 * @brief Divergence detection, resync and conflict records
 *
 * The coordinator owns SyncState. It decides for each server update whether
 * it can be applied to the local replica or signals a divergence, runs at
 * most one full resync at a time and keeps the conflict history.
 *
 * Update policies:
 * - Full snapshot: applied only when newer than the last sync point.
 * - Phase change: a different phase arriving further than the tolerance
 *   window from the locally expected transition time is a conflict.
 * - Votes: applied when not older than the last sync point.
 * - Elimination: applied when not older than the last sync point; an older
 *   one for a player still alive locally is a conflict.
 */

#include "nightfall/core/event_channel.h"
#include "nightfall/core/scheduler.h"
#include "nightfall/game/replica_state.h"
#include "nightfall/net/wire.h"
#include "nightfall/sync/action_queue.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nightfall::sync {

// ============================================================================
// Sync Result Enum
// ============================================================================

enum class SyncResult : UInt8 {
    Success = 0,

    // Resync
    AlreadyResyncing,
    NotConnected,
    SendFailed,

    // Updates
    StaleUpdate,
    ConflictDetected,

    // Conflict resolution
    ConflictNotFound,
    AlreadyResolved,
    MissingMergedState,
    InvalidResolution
};

inline const char* sync_result_to_string(SyncResult result) {
    switch (result) {
        case SyncResult::Success: return "Success";
        case SyncResult::AlreadyResyncing: return "AlreadyResyncing";
        case SyncResult::NotConnected: return "NotConnected";
        case SyncResult::SendFailed: return "SendFailed";
        case SyncResult::StaleUpdate: return "StaleUpdate";
        case SyncResult::ConflictDetected: return "ConflictDetected";
        case SyncResult::ConflictNotFound: return "ConflictNotFound";
        case SyncResult::AlreadyResolved: return "AlreadyResolved";
        case SyncResult::MissingMergedState: return "MissingMergedState";
        case SyncResult::InvalidResolution: return "InvalidResolution";
        default: return "Unknown";
    }
}

// ============================================================================
// Conflict Types
// ============================================================================

enum class ConflictSubject : UInt8 {
    GameState = 0,   ///< Reported by the server
    Phase,
    Votes,
    Elimination
};

inline const char* conflict_subject_to_string(ConflictSubject subject) {
    switch (subject) {
        case ConflictSubject::GameState: return "game_state";
        case ConflictSubject::Phase: return "phase";
        case ConflictSubject::Votes: return "votes";
        case ConflictSubject::Elimination: return "elimination";
        default: return "unknown";
    }
}

enum class Resolution : UInt8 {
    Pending = 0,
    Local,    ///< Keep the client view
    Remote,   ///< Adopt the server snapshot
    Merged    ///< Adopt a caller-supplied merged snapshot
};

inline const char* resolution_to_string(Resolution resolution) {
    switch (resolution) {
        case Resolution::Pending: return "pending";
        case Resolution::Local: return "client";
        case Resolution::Remote: return "server";
        case Resolution::Merged: return "merge";
        default: return "unknown";
    }
}

/**
 * @brief Parse a wire resolution name ("server", "client", "merge")
 */
std::optional<Resolution> resolution_from_string(const std::string& name);

struct ConflictRecord {
    ConflictId id;
    ConflictSubject subject{ConflictSubject::GameState};
    game::GameState local_snapshot;
    game::GameState remote_snapshot;
    std::vector<std::string> conflicting_fields;
    Resolution resolution{Resolution::Pending};
    bool server_reported{false};
    Timestamp detected_at{0};
    Timestamp resolved_at{0};
    std::string reason;

    bool is_resolved() const { return resolution != Resolution::Pending; }
};

// ============================================================================
// Sync State
// ============================================================================

/**
 * @brief Copy of the coordinator's state handed to collaborators
 */
struct SyncStateSnapshot {
    Timestamp last_sync_time{0};
    std::vector<PendingActionSummary> pending_actions;   ///< Creation order
    bool is_resyncing{false};
    UInt32 conflict_count{0};
    UInt32 sync_attempt{0};
};

// ============================================================================
// Configuration
// ============================================================================

struct SyncCoordinatorConfig {
    Duration conflict_tolerance{1000};
    Duration sync_timeout{10000};
    UInt32 max_sync_attempts{5};
    Duration sync_retry_base_delay{1000};
    Duration sync_retry_max_delay{30000};
    bool auto_resolve_server_hints{true};
    SizeT max_conflict_history{100};

    static SyncCoordinatorConfig default_config() { return SyncCoordinatorConfig{}; }

    /**
     * @brief Every conflict waits for an explicit decision
     */
    static SyncCoordinatorConfig manual_resolution() {
        SyncCoordinatorConfig config;
        config.auto_resolve_server_hints = false;
        return config;
    }

    /**
     * @brief Wider tolerance window for high-latency links
     */
    static SyncCoordinatorConfig lenient() {
        SyncCoordinatorConfig config;
        config.conflict_tolerance = Duration(3000);
        config.sync_timeout = Duration(20000);
        return config;
    }
};

// ============================================================================
// Events & Statistics
// ============================================================================

struct SyncEvent {
    enum class Kind : UInt8 {
        ResyncStarted,
        SnapshotApplied,
        UpdateApplied,
        UpdateIgnored,
        ConflictDetected,
        ConflictResolved,
        SyncTimeout,
        SyncFailed        ///< Retries exhausted; local state can no longer be trusted
    };

    Kind kind{Kind::ResyncStarted};
    std::string detail;
    std::optional<ConflictRecord> conflict;
    UInt32 attempt{0};
};

inline const char* sync_event_kind_to_string(SyncEvent::Kind kind) {
    switch (kind) {
        case SyncEvent::Kind::ResyncStarted: return "ResyncStarted";
        case SyncEvent::Kind::SnapshotApplied: return "SnapshotApplied";
        case SyncEvent::Kind::UpdateApplied: return "UpdateApplied";
        case SyncEvent::Kind::UpdateIgnored: return "UpdateIgnored";
        case SyncEvent::Kind::ConflictDetected: return "ConflictDetected";
        case SyncEvent::Kind::ConflictResolved: return "ConflictResolved";
        case SyncEvent::Kind::SyncTimeout: return "SyncTimeout";
        case SyncEvent::Kind::SyncFailed: return "SyncFailed";
        default: return "Unknown";
    }
}

struct SyncStats {
    UInt64 resyncs_started{0};
    UInt64 snapshots_applied{0};
    UInt64 updates_applied{0};
    UInt64 stale_updates{0};
    UInt64 conflicts_detected{0};
    UInt64 conflicts_resolved{0};
    UInt64 sync_timeouts{0};

    void reset() { *this = SyncStats{}; }
};

// ============================================================================
// Channel Interface
// ============================================================================

/**
 * @brief Outbound path for sync control messages
 */
class ISyncChannel {
public:
    virtual ~ISyncChannel() = default;
    virtual bool is_connected() const = 0;
    virtual bool send(const net::WireMessage& message) = 0;
};

// ============================================================================
// Sync Coordinator
// ============================================================================

class SyncCoordinator {
public:
    SyncCoordinator(core::IScheduler& scheduler, ActionQueue& queue, game::ReplicaState& replica,
                    const SyncCoordinatorConfig& config = SyncCoordinatorConfig::default_config());
    ~SyncCoordinator();

    // Non-copyable, movable
    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;
    SyncCoordinator(SyncCoordinator&&) noexcept;
    SyncCoordinator& operator=(SyncCoordinator&&) noexcept;

    void set_channel(ISyncChannel* channel);

    // ========================================================================
    // Resync
    // ========================================================================

    /**
     * @brief Ask the server for a full snapshot
     *
     * No-op while a resync is in flight. When offline the request is
     * remembered and issued on the next connect.
     */
    SyncResult request_sync();

    /**
     * @brief Answer a server-initiated sync request with the full queue
     */
    SyncResult respond_to_sync_request();

    // ========================================================================
    // Server Updates
    // ========================================================================

    SyncResult apply_snapshot(const game::StateSnapshot& snapshot);
    SyncResult apply_phase_change(const game::PhaseUpdate& update);
    SyncResult apply_votes(const game::VotesUpdate& update);
    SyncResult apply_elimination(const game::EliminationUpdate& update);
    SyncResult handle_server_conflict(const game::ServerConflict& conflict);

    // ========================================================================
    // Conflicts
    // ========================================================================

    /**
     * @brief Decide a pending conflict
     *
     * Resolution is final: a second call for the same id returns
     * AlreadyResolved and changes nothing.
     */
    SyncResult resolve_conflict(const ConflictId& id, Resolution resolution,
                                const std::optional<game::GameState>& merged_state = std::nullopt);

    std::vector<ConflictRecord> pending_conflicts() const;
    std::vector<ConflictRecord> conflict_history() const;
    std::optional<ConflictRecord> find_conflict(const ConflictId& id) const;

    // ========================================================================
    // Session Events
    // ========================================================================

    void on_connected(bool is_reconnect);
    void on_disconnected();

    /**
     * @brief An action got no answer in time; force a resync instead of resending
     */
    void on_action_timed_out(const ActionId& id);

    /**
     * @brief Restore the durable sync point
     */
    void set_last_sync_time(Timestamp timestamp);

    /**
     * @brief Forget conflicts, counters and the sync point (logout)
     */
    void reset();

    // ========================================================================
    // Queries
    // ========================================================================

    SyncStateSnapshot state() const;
    Timestamp last_sync_time() const;
    bool is_resyncing() const;
    const SyncCoordinatorConfig& config() const;
    SyncStats stats() const;

    core::EventChannel<SyncEvent>& events();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nightfall::sync
