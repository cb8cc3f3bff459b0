#pragma once
/**
 * @file sync_engine.h
 * @brief Facade that wires the sync components into one engine
 *
 * The engine owns the connection manager, the action queue, the sync
 * coordinator, the progressive loader and the local replica. The transport,
 * scheduler, data fetcher and persistence store are injected so the whole
 * engine can run against fakes under a ManualScheduler.
 *
 * Inbound wire events are routed here: acknowledgments and rejections to
 * the queue, state updates and conflicts to the coordinator. Failures are
 * reported on the notices channel with a severity. A fatal notice blocks
 * further optimistic actions until acknowledge_fatal_error() is called.
 */

#include "nightfall/core/event_channel.h"
#include "nightfall/core/scheduler.h"
#include "nightfall/game/replica_state.h"
#include "nightfall/interface/config.h"
#include "nightfall/loader/progressive_loader.h"
#include "nightfall/net/connection_manager.h"
#include "nightfall/persist/persistence.h"
#include "nightfall/sync/action_queue.h"
#include "nightfall/sync/sync_coordinator.h"
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nightfall::engine {

// ============================================================================
// Engine Result Enum
// ============================================================================

enum class EngineResult : UInt8 {
    Success = 0,

    // Actions
    Blocked,             ///< A fatal error awaits acknowledgment
    InvalidAction,
    QueueFull,
    Deferred,            ///< Sent while offline; held in the queue
    Discarded,           ///< Control message while offline

    // Session
    AlreadyConnected,
    ReconnectPending,
    InvalidConfiguration,
    NotConnected,
    TransportError,

    // Sync
    AlreadyResyncing,
    ConflictNotFound,
    AlreadyResolved,
    MissingMergedState,

    // Loading & storage
    InvalidRequest,
    PersistenceError
};

inline const char* engine_result_to_string(EngineResult result) {
    switch (result) {
        case EngineResult::Success: return "Success";
        case EngineResult::Blocked: return "Blocked";
        case EngineResult::InvalidAction: return "InvalidAction";
        case EngineResult::QueueFull: return "QueueFull";
        case EngineResult::Deferred: return "Deferred";
        case EngineResult::Discarded: return "Discarded";
        case EngineResult::AlreadyConnected: return "AlreadyConnected";
        case EngineResult::ReconnectPending: return "ReconnectPending";
        case EngineResult::InvalidConfiguration: return "InvalidConfiguration";
        case EngineResult::NotConnected: return "NotConnected";
        case EngineResult::TransportError: return "TransportError";
        case EngineResult::AlreadyResyncing: return "AlreadyResyncing";
        case EngineResult::ConflictNotFound: return "ConflictNotFound";
        case EngineResult::AlreadyResolved: return "AlreadyResolved";
        case EngineResult::MissingMergedState: return "MissingMergedState";
        case EngineResult::InvalidRequest: return "InvalidRequest";
        case EngineResult::PersistenceError: return "PersistenceError";
        default: return "Unknown";
    }
}

// ============================================================================
// Notices
// ============================================================================

enum class NoticeSeverity : UInt8 {
    Transient = 0,   ///< Disconnects, timeouts, reconnect attempts
    Recoverable,     ///< Dropped actions, storage hiccups
    Conflict,        ///< Divergence recorded
    Fatal            ///< Reconnect or resync exhausted
};

inline const char* notice_severity_to_string(NoticeSeverity severity) {
    switch (severity) {
        case NoticeSeverity::Transient: return "transient";
        case NoticeSeverity::Recoverable: return "recoverable";
        case NoticeSeverity::Conflict: return "conflict";
        case NoticeSeverity::Fatal: return "fatal";
        default: return "unknown";
    }
}

struct EngineNotice {
    NoticeSeverity severity{NoticeSeverity::Transient};
    std::string code;         ///< Stable machine-readable name, e.g. "action_dropped"
    std::string message;
    std::string subject_id;   ///< Action or conflict id when relevant
    Timestamp timestamp{0};
};

// ============================================================================
// Sync Engine
// ============================================================================

class SyncEngine {
public:
    SyncEngine(net::ITransport& transport, core::IScheduler& scheduler,
               loader::IDataFetcher& fetcher, persist::IPersistenceStore& store,
               const config::EngineConfig& config = config::EngineConfig::defaults());
    ~SyncEngine();

    // Non-copyable, non-movable (collaborators hold pointers into the engine)
    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    // ========================================================================
    // Session
    // ========================================================================

    EngineResult connect(const std::string& credential);
    void disconnect();

    /**
     * @brief Player the optimistic effects are attributed to
     */
    void set_local_player(const std::string& player_id);

    // ========================================================================
    // Operations
    // ========================================================================

    /**
     * @brief Record an optimistic action
     *
     * The local view reflects the action before this call returns.
     */
    EngineResult enqueue_action(const std::string& kind, const FieldMap& payload,
                                sync::ActionPriority priority = sync::ActionPriority::Medium,
                                ActionId* out_id = nullptr);

    /**
     * @brief Send a message without queueing it
     *
     * While offline, replayable events are moved into the action queue
     * (Deferred) and control messages are dropped (Discarded).
     */
    EngineResult send_event(const net::WireMessage& message);

    EngineResult resolve_conflict(const ConflictId& id, sync::Resolution resolution,
                                  const std::optional<game::GameState>& merged_state = std::nullopt);

    EngineResult load_data(const std::vector<loader::DataRequest>& requests,
                           loader::LoadCallback on_complete, loader::LoadJobId* out_job = nullptr);

    /**
     * @brief Ask for a full snapshot now
     * @return NotConnected when offline; the request is issued on reconnect
     */
    EngineResult force_sync();

    /**
     * @brief Logout: forget queue, conflicts, sync point, cache and durable keys
     */
    EngineResult clear_all_offline_data();

    /**
     * @brief Reload queue, cache and sync point from the store
     */
    EngineResult restore_durable_state();

    void acknowledge_fatal_error();

    // ========================================================================
    // Published State
    // ========================================================================

    sync::SyncStateSnapshot sync_state() const;
    std::vector<sync::ConflictRecord> pending_conflicts() const;
    std::vector<sync::QueuedAction> pending_actions() const;
    net::ConnectionStatus connection_status() const;
    UInt32 reconnect_attempt() const;
    std::optional<std::string> cached_data(const std::string& key) const;

    /// Confirmed state with the tentative overlay applied
    game::GameState game_view() const;
    const game::GameState& confirmed_state() const;

    std::optional<loader::LoadProgress> loading_progress() const;

    /// Most recent last
    std::vector<EngineNotice> recent_errors() const;
    bool has_fatal_error() const;

    const config::EngineConfig& config() const;

    core::EventChannel<EngineNotice>& notices();

    /// Published whenever the tentative view may have changed
    core::EventChannel<game::GameState>& view_changes();

    // ========================================================================
    // Components
    // ========================================================================

    net::ConnectionManager& connection();
    sync::ActionQueue& queue();
    sync::SyncCoordinator& coordinator();
    loader::ProgressiveLoader& loader();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nightfall::engine
