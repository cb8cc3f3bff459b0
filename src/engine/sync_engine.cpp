/**
 * @file sync_engine.cpp
 * @brief Component wiring, inbound routing and durable-state upkeep
 */

#include "nightfall/engine/sync_engine.h"
#include "nightfall/core/logging.h"
#include "nightfall/net/json_text.h"
#include "nightfall/net/wire_codec.h"

namespace nightfall::engine {

namespace json = net::json;

// ============================================================================
// SyncEngine::Impl
// ============================================================================

struct SyncEngine::Impl : public sync::IActionTransmitter, public sync::ISyncChannel {
    Impl(net::ITransport& transport, core::IScheduler& s, loader::IDataFetcher& fetcher,
         persist::IPersistenceStore& store, const config::EngineConfig& c)
        : config(c)
        , scheduler(s)
        , connection(transport, s, c.connection)
        , queue(s, c.queue)
        , coordinator(s, queue, replica, c.sync)
        , loader(fetcher, s, c.loader)
        , persistence(store)
    {
        queue.set_transmitter(this);
        coordinator.set_channel(this);

        connection.connection_events().subscribe([this](const net::ConnectionEvent& e) { on_connection_event(e); });
        connection.messages().subscribe([this](const net::WireMessage& m) { on_message(m); });
        queue.events().subscribe([this](const sync::ActionEvent& e) { on_action_event(e); });
        coordinator.events().subscribe([this](const sync::SyncEvent& e) { on_sync_event(e); });
        loader.progress().subscribe([this](const loader::LoadProgress& p) { last_progress = p; });
        loader.cache_changes().subscribe([this](const loader::CacheChange&) { persist_cache(); });
    }

    ~Impl() override {
        queue.set_transmitter(nullptr);
        coordinator.set_channel(nullptr);
    }

    config::EngineConfig config;
    core::IScheduler& scheduler;

    game::ReplicaState replica;
    net::ConnectionManager connection;
    sync::ActionQueue queue;
    sync::SyncCoordinator coordinator;
    loader::ProgressiveLoader loader;
    persist::PersistenceBoundary persistence;

    core::EventChannel<EngineNotice> notices;
    core::EventChannel<game::GameState> view_changes;

    std::deque<EngineNotice> recent_errors;
    std::optional<loader::LoadProgress> last_progress;
    bool fatal{false};
    bool persist_suspended{false};
    Timestamp persisted_sync_time{0};

    // ------------------------------------------------------------------------
    // IActionTransmitter
    // ------------------------------------------------------------------------

    bool can_transmit() const override {
        return connection.is_connected();
    }

    bool transmit(const sync::QueuedAction& action, bool is_retry) override {
        json::ObjectBuilder data;
        for (const auto& [key, value] : action.payload) {
            data.add(key, value);
        }
        data.add("actionId", action.id).add_bool("isRetry", is_retry);
        return connection.send(net::WireMessage{action.kind, data.str()}) == net::ConnectionResult::Success;
    }

    // ------------------------------------------------------------------------
    // ISyncChannel
    // ------------------------------------------------------------------------

    bool is_connected() const override {
        return connection.is_connected();
    }

    bool send(const net::WireMessage& message) override {
        return connection.send(message) == net::ConnectionResult::Success;
    }

    // ------------------------------------------------------------------------
    // Notices
    // ------------------------------------------------------------------------

    void notify(NoticeSeverity severity, const std::string& code, const std::string& message,
                const std::string& subject_id = "") {
        EngineNotice notice{severity, code, message, subject_id, scheduler.now()};

        recent_errors.push_back(notice);
        while (recent_errors.size() > config.max_recent_errors) {
            recent_errors.pop_front();
        }
        if (severity == NoticeSeverity::Fatal) {
            fatal = true;
            log::logger()->error("engine: {} ({})", message, code);
        }
        notices.publish(notice);
    }

    void publish_view() {
        view_changes.publish(replica.view());
    }

    // ------------------------------------------------------------------------
    // Persistence
    // ------------------------------------------------------------------------

    void persist_actions() {
        if (persist_suspended) return;
        persist::PersistResult result = persistence.save_actions(queue.pending_actions());
        if (result != persist::PersistResult::Success) {
            notify(NoticeSeverity::Recoverable, "persist_failed",
                   std::string("saving queued actions failed: ") + persist::persist_result_to_string(result));
        }
    }

    void persist_cache() {
        if (persist_suspended) return;
        persist::PersistResult result = persistence.save_cache(loader.cache_entries());
        if (result != persist::PersistResult::Success) {
            notify(NoticeSeverity::Recoverable, "persist_failed",
                   std::string("saving cache failed: ") + persist::persist_result_to_string(result));
        }
    }

    void persist_sync_time() {
        if (persist_suspended) return;
        Timestamp current = coordinator.last_sync_time();
        if (current == persisted_sync_time) return;
        persist::PersistResult result = persistence.save_last_sync_time(current);
        if (result == persist::PersistResult::Success) {
            persisted_sync_time = current;
        } else {
            notify(NoticeSeverity::Recoverable, "persist_failed",
                   std::string("saving sync point failed: ") + persist::persist_result_to_string(result));
        }
    }

    // ------------------------------------------------------------------------
    // Connection Events
    // ------------------------------------------------------------------------

    void on_connection_event(const net::ConnectionEvent& event) {
        switch (event.kind) {
            case net::ConnectionEvent::Kind::Connected:
                coordinator.on_connected(event.is_reconnect);
                queue.flush();
                break;

            case net::ConnectionEvent::Kind::Disconnected:
                queue.on_disconnected();
                coordinator.on_disconnected();
                if (!event.intentional) {
                    notify(NoticeSeverity::Transient, "disconnected", "connection lost: " + event.reason);
                }
                break;

            case net::ConnectionEvent::Kind::Reconnecting:
                notify(NoticeSeverity::Transient, "reconnecting",
                       "reconnect attempt " + std::to_string(event.attempt) + " in " +
                       std::to_string(event.delay.count()) + " ms");
                break;

            case net::ConnectionEvent::Kind::ConnectError:
                notify(NoticeSeverity::Transient, "connect_error", "connect failed: " + event.reason);
                break;

            case net::ConnectionEvent::Kind::Failed:
                notify(NoticeSeverity::Fatal, "connection_failed",
                       "could not reconnect after " + std::to_string(event.attempt) + " attempts");
                break;

            default:
                break;
        }
    }

    // ------------------------------------------------------------------------
    // Inbound Routing
    // ------------------------------------------------------------------------

    void malformed(const net::WireMessage& message) {
        log::logger()->warn("engine: malformed '{}' payload dropped", message.event);
        notify(NoticeSeverity::Transient, "malformed_message", "could not decode " + message.event);
    }

    void on_message(const net::WireMessage& message) {
        const std::string& event = message.event;

        if (event == net::wire::GAME_STATE_UPDATE) {
            auto snapshot = net::decode_state_snapshot(message.data);
            if (!snapshot) return malformed(message);
            if (coordinator.apply_snapshot(*snapshot) == sync::SyncResult::Success) {
                publish_view();
            }
        } else if (event == net::wire::PHASE_CHANGED) {
            auto update = net::decode_phase_update(message.data);
            if (!update) return malformed(message);
            if (coordinator.apply_phase_change(*update) == sync::SyncResult::Success) {
                publish_view();
            }
        } else if (event == net::wire::VOTES_UPDATED) {
            auto update = net::decode_votes_update(message.data);
            if (!update) return malformed(message);
            if (coordinator.apply_votes(*update) == sync::SyncResult::Success) {
                publish_view();
            }
        } else if (event == net::wire::PLAYER_ELIMINATED) {
            auto update = net::decode_elimination_update(message.data);
            if (!update) return malformed(message);
            if (coordinator.apply_elimination(*update) == sync::SyncResult::Success) {
                publish_view();
            }
        } else if (event == net::wire::SYNC_CONFLICT) {
            auto conflict = net::decode_server_conflict(message.data);
            if (!conflict) return malformed(message);
            sync::SyncResult result = coordinator.handle_server_conflict(*conflict);
            log::logger()->debug("engine: server conflict handled: {}", sync::sync_result_to_string(result));
            publish_view();
        } else if (event == net::wire::SYNC_REQUEST) {
            sync::SyncResult result = coordinator.respond_to_sync_request();
            if (result != sync::SyncResult::Success) {
                log::logger()->warn("engine: sync response not sent: {}", sync::sync_result_to_string(result));
            }
        } else if (event == net::wire::ACTION_ACKNOWLEDGED) {
            std::string id = json::find_string(message.data, "actionId");
            if (id.empty()) return malformed(message);
            if (queue.acknowledge(id) == sync::QueueResult::ActionNotFound) {
                log::logger()->debug("engine: repeated acknowledgment for {}", id);
            }
        } else if (event == net::wire::ACTION_REJECTED) {
            std::string id = json::find_string(message.data, "actionId");
            if (id.empty()) return malformed(message);
            std::string reason = json::find_string(message.data, "reason", "rejected");
            if (queue.reject(id, reason) == sync::QueueResult::ActionNotFound) {
                log::logger()->debug("engine: rejection for unknown action {}", id);
            }
        } else {
            log::logger()->debug("engine: unrouted event '{}'", event);
        }

        persist_sync_time();
    }

    // ------------------------------------------------------------------------
    // Queue Events
    // ------------------------------------------------------------------------

    void on_action_event(const sync::ActionEvent& event) {
        const sync::QueuedAction& action = event.action;

        switch (event.kind) {
            case sync::ActionEvent::Kind::Enqueued:
            case sync::ActionEvent::Kind::Restored:
                // Same id replaces, so a restored action is never applied twice
                replica.add_tentative(action.to_tentative_op());
                publish_view();
                break;

            case sync::ActionEvent::Kind::Acknowledged:
                replica.confirm(action.id);
                publish_view();
                break;

            case sync::ActionEvent::Kind::Dropped:
                replica.discard(action.id);
                publish_view();
                notify(NoticeSeverity::Recoverable, "action_dropped",
                       action.kind + " rejected: " + event.reason, action.id);
                if (coordinator.request_sync() == sync::SyncResult::NotConnected) {
                    log::logger()->debug("engine: resync after drop deferred until reconnect");
                }
                break;

            case sync::ActionEvent::Kind::Cancelled:
                replica.discard(action.id);
                publish_view();
                break;

            case sync::ActionEvent::Kind::TimedOut:
                notify(NoticeSeverity::Transient, "action_timeout",
                       action.kind + " got no answer", action.id);
                coordinator.on_action_timed_out(action.id);
                break;

            case sync::ActionEvent::Kind::Transmitted:
            case sync::ActionEvent::Kind::Retrying:
            default:
                break;
        }

        persist_actions();
    }

    // ------------------------------------------------------------------------
    // Sync Events
    // ------------------------------------------------------------------------

    void on_sync_event(const sync::SyncEvent& event) {
        switch (event.kind) {
            case sync::SyncEvent::Kind::ConflictDetected:
                notify(NoticeSeverity::Conflict, "conflict_detected", event.detail,
                       event.conflict ? event.conflict->id : "");
                break;

            case sync::SyncEvent::Kind::ConflictResolved:
                publish_view();
                break;

            case sync::SyncEvent::Kind::SyncTimeout:
                notify(NoticeSeverity::Transient, "sync_timeout", event.detail);
                break;

            case sync::SyncEvent::Kind::SyncFailed:
                notify(NoticeSeverity::Fatal, "sync_failed", event.detail);
                break;

            default:
                break;
        }
    }
};

// ============================================================================
// SyncEngine
// ============================================================================

SyncEngine::SyncEngine(net::ITransport& transport, core::IScheduler& scheduler,
                       loader::IDataFetcher& fetcher, persist::IPersistenceStore& store,
                       const config::EngineConfig& config)
    : impl_(std::make_unique<Impl>(transport, scheduler, fetcher, store, config)) {}

SyncEngine::~SyncEngine() = default;

EngineResult SyncEngine::connect(const std::string& credential) {
    switch (impl_->connection.connect(credential)) {
        case net::ConnectionResult::Success: return EngineResult::Success;
        case net::ConnectionResult::AlreadyConnected: return EngineResult::AlreadyConnected;
        case net::ConnectionResult::ReconnectPending: return EngineResult::ReconnectPending;
        case net::ConnectionResult::InvalidConfiguration: return EngineResult::InvalidConfiguration;
        default: return EngineResult::TransportError;
    }
}

void SyncEngine::disconnect() {
    impl_->connection.disconnect();
}

void SyncEngine::set_local_player(const std::string& player_id) {
    impl_->replica.set_local_player(player_id);
}

EngineResult SyncEngine::enqueue_action(const std::string& kind, const FieldMap& payload,
                                        sync::ActionPriority priority, ActionId* out_id) {
    if (impl_->fatal) {
        return EngineResult::Blocked;
    }

    sync::ActionRequest request;
    request.kind = kind;
    request.payload = payload;
    request.priority = priority;

    ActionId id;
    switch (impl_->queue.enqueue(request, id)) {
        case sync::QueueResult::Success:
            if (out_id) {
                *out_id = id;
            }
            return EngineResult::Success;
        case sync::QueueResult::QueueFull:
            return EngineResult::QueueFull;
        default:
            return EngineResult::InvalidAction;
    }
}

EngineResult SyncEngine::send_event(const net::WireMessage& message) {
    switch (impl_->connection.send(message)) {
        case net::ConnectionResult::Success:
            return EngineResult::Success;

        case net::ConnectionResult::Deferred: {
            auto payload = net::decode_fields(message.data);
            if (!payload) {
                return EngineResult::InvalidAction;
            }
            EngineResult result = enqueue_action(message.event, *payload);
            return result == EngineResult::Success ? EngineResult::Deferred : result;
        }

        case net::ConnectionResult::Discarded:
            return EngineResult::Discarded;

        default:
            return EngineResult::TransportError;
    }
}

EngineResult SyncEngine::resolve_conflict(const ConflictId& id, sync::Resolution resolution,
                                          const std::optional<game::GameState>& merged_state) {
    switch (impl_->coordinator.resolve_conflict(id, resolution, merged_state)) {
        case sync::SyncResult::Success: return EngineResult::Success;
        case sync::SyncResult::ConflictNotFound: return EngineResult::ConflictNotFound;
        case sync::SyncResult::AlreadyResolved: return EngineResult::AlreadyResolved;
        case sync::SyncResult::MissingMergedState: return EngineResult::MissingMergedState;
        default: return EngineResult::InvalidRequest;
    }
}

EngineResult SyncEngine::load_data(const std::vector<loader::DataRequest>& requests,
                                   loader::LoadCallback on_complete, loader::LoadJobId* out_job) {
    loader::LoaderResult result = impl_->loader.load_data(requests, std::move(on_complete), out_job);
    if (result != loader::LoaderResult::Success) {
        log::logger()->warn("engine: load rejected: {}", loader::loader_result_to_string(result));
        return EngineResult::InvalidRequest;
    }
    return EngineResult::Success;
}

EngineResult SyncEngine::force_sync() {
    switch (impl_->coordinator.request_sync()) {
        case sync::SyncResult::Success: return EngineResult::Success;
        case sync::SyncResult::AlreadyResyncing: return EngineResult::AlreadyResyncing;
        case sync::SyncResult::NotConnected: return EngineResult::NotConnected;
        default: return EngineResult::TransportError;
    }
}

EngineResult SyncEngine::clear_all_offline_data() {
    impl_->persist_suspended = true;
    impl_->queue.clear();
    impl_->coordinator.reset();
    impl_->replica.reset();
    impl_->loader.clear_cache();
    impl_->persist_suspended = false;

    impl_->recent_errors.clear();
    impl_->fatal = false;
    impl_->last_progress.reset();
    impl_->persisted_sync_time = 0;

    persist::PersistResult result = impl_->persistence.clear();
    impl_->publish_view();
    log::logger()->info("engine: offline data cleared");
    return result == persist::PersistResult::Success ? EngineResult::Success : EngineResult::PersistenceError;
}

EngineResult SyncEngine::restore_durable_state() {
    persist::DurableState state;
    persist::PersistResult result = impl_->persistence.load(state);
    if (result != persist::PersistResult::Success && result != persist::PersistResult::CorruptData) {
        impl_->notify(NoticeSeverity::Recoverable, "restore_failed",
                      std::string("durable state unavailable: ") + persist::persist_result_to_string(result));
        return EngineResult::PersistenceError;
    }
    if (result == persist::PersistResult::CorruptData) {
        impl_->notify(NoticeSeverity::Recoverable, "restore_partial", "some durable state was corrupt");
    }

    impl_->persist_suspended = true;
    SizeT restored = 0;
    for (auto& action : state.actions) {
        if (impl_->queue.restore(std::move(action)) == sync::QueueResult::Success) {
            ++restored;
        }
    }
    impl_->loader.restore_cache(state.cache);
    if (state.last_sync_time > impl_->coordinator.last_sync_time()) {
        impl_->coordinator.set_last_sync_time(state.last_sync_time);
    }
    impl_->persisted_sync_time = state.last_sync_time;
    impl_->persist_suspended = false;

    log::logger()->info("engine: restored {} actions, {} cache entries", restored, state.cache.size());

    if (impl_->connection.is_connected()) {
        impl_->queue.flush();
    }
    return EngineResult::Success;
}

void SyncEngine::acknowledge_fatal_error() {
    impl_->fatal = false;
}

sync::SyncStateSnapshot SyncEngine::sync_state() const {
    return impl_->coordinator.state();
}

std::vector<sync::ConflictRecord> SyncEngine::pending_conflicts() const {
    return impl_->coordinator.pending_conflicts();
}

std::vector<sync::QueuedAction> SyncEngine::pending_actions() const {
    return impl_->queue.pending_actions();
}

net::ConnectionStatus SyncEngine::connection_status() const {
    return impl_->connection.status();
}

UInt32 SyncEngine::reconnect_attempt() const {
    return impl_->connection.reconnect_attempt();
}

std::optional<std::string> SyncEngine::cached_data(const std::string& key) const {
    return impl_->loader.get_cached_data(key);
}

game::GameState SyncEngine::game_view() const {
    return impl_->replica.view();
}

const game::GameState& SyncEngine::confirmed_state() const {
    return impl_->replica.confirmed();
}

std::optional<loader::LoadProgress> SyncEngine::loading_progress() const {
    return impl_->last_progress;
}

std::vector<EngineNotice> SyncEngine::recent_errors() const {
    return std::vector<EngineNotice>(impl_->recent_errors.begin(), impl_->recent_errors.end());
}

bool SyncEngine::has_fatal_error() const {
    return impl_->fatal;
}

const config::EngineConfig& SyncEngine::config() const {
    return impl_->config;
}

core::EventChannel<EngineNotice>& SyncEngine::notices() {
    return impl_->notices;
}

core::EventChannel<game::GameState>& SyncEngine::view_changes() {
    return impl_->view_changes;
}

net::ConnectionManager& SyncEngine::connection() {
    return impl_->connection;
}

sync::ActionQueue& SyncEngine::queue() {
    return impl_->queue;
}

sync::SyncCoordinator& SyncEngine::coordinator() {
    return impl_->coordinator;
}

loader::ProgressiveLoader& SyncEngine::loader() {
    return impl_->loader;
}

} // namespace nightfall::engine
