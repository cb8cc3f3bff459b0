/**
 * @file connection_manager.cpp
 * @brief Connection state machine, heartbeat and backoff reconnection
 */

#include "nightfall/net/connection_manager.h"
#include "nightfall/net/json_text.h"
#include "nightfall/net/wire_codec.h"
#include "nightfall/core/logging.h"

namespace nightfall::net {

// ============================================================================
// ConnectionManager::Impl
// ============================================================================

struct ConnectionManager::Impl : public ITransportListener {
    Impl(ITransport& t, core::IScheduler& s, const ConnectionConfig& c)
        : transport(t), scheduler(s), config(c) {
        transport.set_listener(this);
    }

    ~Impl() override {
        cancel_timers();
        transport.set_listener(nullptr);
    }

    // Collaborators
    ITransport& transport;
    core::IScheduler& scheduler;
    ConnectionConfig config;

    // State
    ConnectionStatus status{ConnectionStatus::Disconnected};
    std::string credential;
    UInt32 attempt{0};
    bool awaiting_pong{false};
    UInt64 session{0};              // bumped whenever timers must go stale

    // Timers
    TimerId reconnect_timer{INVALID_TIMER_ID};
    TimerId ping_timer{INVALID_TIMER_ID};
    TimerId pong_timer{INVALID_TIMER_ID};

    // Channels
    core::EventChannel<ConnectionEvent> connection_events;
    core::EventChannel<WireMessage> messages;

    ConnectionStats stats;

    // ------------------------------------------------------------------------

    void set_status(ConnectionStatus next) {
        if (status == next) return;
        log::logger()->info("connection: {} -> {}",
                            connection_status_to_string(status),
                            connection_status_to_string(next));
        status = next;
    }

    void cancel_timer(TimerId& id) {
        if (id != INVALID_TIMER_ID) {
            scheduler.cancel(id);
            id = INVALID_TIMER_ID;
        }
    }

    void cancel_timers() {
        cancel_timer(reconnect_timer);
        cancel_timer(ping_timer);
        cancel_timer(pong_timer);
        awaiting_pong = false;
    }

    void open_transport() {
        TransportResult result = transport.open(config.url, credential);
        if (result != TransportResult::Success) {
            log::logger()->warn("connection: open failed: {}", transport_result_to_string(result));
            handle_connect_failure(transport_result_to_string(result));
        }
    }

    // ------------------------------------------------------------------------
    // Heartbeat
    // ------------------------------------------------------------------------

    void schedule_ping() {
        UInt64 current = session;
        ping_timer = scheduler.schedule_after(config.heartbeat_interval, [this, current] {
            ping_timer = INVALID_TIMER_ID;
            if (current != session || status != ConnectionStatus::Connected) return;
            send_ping();
            schedule_ping();
        });
    }

    void send_ping() {
        json::ObjectBuilder data;
        data.add_int("timestamp", scheduler.now());
        TransportResult result = transport.send(encode_message(WireMessage{wire::PING, data.str()}));
        if (result != TransportResult::Success) {
            log::logger()->warn("connection: heartbeat send failed: {}", transport_result_to_string(result));
            return;
        }
        ++stats.heartbeats_sent;

        if (awaiting_pong) {
            return;   // an earlier ping is still being timed
        }
        awaiting_pong = true;
        UInt64 current = session;
        pong_timer = scheduler.schedule_after(config.heartbeat_timeout, [this, current] {
            pong_timer = INVALID_TIMER_ID;
            if (current != session || status != ConnectionStatus::Connected || !awaiting_pong) return;
            ++stats.heartbeat_timeouts;
            log::logger()->warn("connection: no pong within {} ms", config.heartbeat_timeout.count());
            transport.close();
            handle_lost_session(wire::REASON_PING_TIMEOUT);
        });
    }

    void handle_pong() {
        awaiting_pong = false;
        cancel_timer(pong_timer);
    }

    // ------------------------------------------------------------------------
    // Reconnection
    // ------------------------------------------------------------------------

    void schedule_reconnect() {
        ++attempt;
        if (attempt > config.max_reconnect_attempts) {
            set_status(ConnectionStatus::Failed);
            log::logger()->error("connection: giving up after {} reconnect attempts",
                                 config.max_reconnect_attempts);
            ConnectionEvent event;
            event.kind = ConnectionEvent::Kind::Failed;
            event.reason = "reconnect attempts exhausted";
            event.attempt = config.max_reconnect_attempts;
            connection_events.publish(event);
            return;
        }

        set_status(ConnectionStatus::Reconnecting);
        Duration delay = core::compute_backoff_delay(attempt, config.reconnect_base_delay,
                                               config.reconnect_max_delay);
        ++stats.reconnect_attempts;
        log::logger()->info("connection: reconnect attempt {}/{} in {} ms",
                            attempt, config.max_reconnect_attempts, delay.count());

        UInt64 current = session;
        reconnect_timer = scheduler.schedule_after(delay, [this, current] {
            reconnect_timer = INVALID_TIMER_ID;
            if (current != session || status != ConnectionStatus::Reconnecting) return;
            open_transport();
        });

        ConnectionEvent event;
        event.kind = ConnectionEvent::Kind::Reconnecting;
        event.attempt = attempt;
        event.delay = delay;
        connection_events.publish(event);
    }

    void handle_connect_failure(const std::string& error) {
        if (status != ConnectionStatus::Connecting && status != ConnectionStatus::Reconnecting) {
            return;
        }
        ConnectionEvent event;
        event.kind = ConnectionEvent::Kind::ConnectError;
        event.reason = error;
        event.attempt = attempt;
        connection_events.publish(event);
        schedule_reconnect();
    }

    void handle_lost_session(const std::string& reason) {
        ++session;
        cancel_timers();
        ++stats.disconnects;

        bool terminal = wire::is_terminal_disconnect(reason);
        set_status(terminal ? ConnectionStatus::Disconnected : ConnectionStatus::Reconnecting);

        ConnectionEvent event;
        event.kind = ConnectionEvent::Kind::Disconnected;
        event.reason = reason;
        event.intentional = terminal;
        log::logger()->warn("connection: disconnected ({})", reason);
        connection_events.publish(event);

        if (!terminal) {
            attempt = 0;
            schedule_reconnect();
        }
    }

    // ------------------------------------------------------------------------
    // ITransportListener
    // ------------------------------------------------------------------------

    void on_open() override {
        if (status != ConnectionStatus::Connecting && status != ConnectionStatus::Reconnecting) {
            return;
        }
        ++session;
        cancel_timers();
        bool is_reconnect = stats.connects > 0;
        attempt = 0;
        ++stats.connects;
        set_status(ConnectionStatus::Connected);
        schedule_ping();

        ConnectionEvent event;
        event.kind = ConnectionEvent::Kind::Connected;
        event.is_reconnect = is_reconnect;
        connection_events.publish(event);
    }

    void on_close(const std::string& reason) override {
        if (status == ConnectionStatus::Connected) {
            handle_lost_session(reason.empty() ? std::string(wire::REASON_TRANSPORT_CLOSE) : reason);
        } else {
            handle_connect_failure(reason);
        }
    }

    void on_error(const std::string& error) override {
        if (status == ConnectionStatus::Connected) {
            handle_lost_session(wire::REASON_TRANSPORT_ERROR);
        } else {
            handle_connect_failure(error);
        }
    }

    void on_message(const std::string& frame) override {
        if (status != ConnectionStatus::Connected) {
            return;
        }
        auto message = decode_message(frame);
        if (!message) {
            ++stats.malformed_frames;
            log::logger()->warn("connection: dropping malformed frame ({} bytes)", frame.size());
            return;
        }
        ++stats.messages_received;
        log::logger()->trace("connection: <- {}", message->event);

        if (message->event == wire::PONG) {
            handle_pong();
            return;
        }
        messages.publish(*message);
    }
};

// ============================================================================
// ConnectionManager
// ============================================================================

ConnectionManager::ConnectionManager(ITransport& transport, core::IScheduler& scheduler,
                                     const ConnectionConfig& config)
    : impl_(std::make_unique<Impl>(transport, scheduler, config)) {}

ConnectionManager::~ConnectionManager() = default;

ConnectionManager::ConnectionManager(ConnectionManager&&) noexcept = default;
ConnectionManager& ConnectionManager::operator=(ConnectionManager&&) noexcept = default;

ConnectionResult ConnectionManager::connect(const std::string& credential) {
    switch (impl_->status) {
        case ConnectionStatus::Connected:
        case ConnectionStatus::Connecting:
            return ConnectionResult::AlreadyConnected;
        case ConnectionStatus::Reconnecting:
            return ConnectionResult::ReconnectPending;
        default:
            break;
    }

    if (impl_->config.url.empty() || impl_->config.max_reconnect_attempts == 0) {
        return ConnectionResult::InvalidConfiguration;
    }

    impl_->credential = credential;
    impl_->attempt = 0;
    impl_->set_status(ConnectionStatus::Connecting);
    impl_->open_transport();
    return ConnectionResult::Success;
}

void ConnectionManager::disconnect() {
    if (impl_->status == ConnectionStatus::Disconnected) {
        return;
    }
    ++impl_->session;
    impl_->cancel_timers();
    impl_->transport.close();
    impl_->attempt = 0;
    impl_->set_status(ConnectionStatus::Disconnected);
    ++impl_->stats.disconnects;

    ConnectionEvent event;
    event.kind = ConnectionEvent::Kind::Disconnected;
    event.reason = wire::REASON_CLIENT_DISCONNECT;
    event.intentional = true;
    impl_->connection_events.publish(event);
}

ConnectionResult ConnectionManager::send(const WireMessage& message) {
    if (impl_->status != ConnectionStatus::Connected) {
        if (wire::is_control_event(message.event)) {
            ++impl_->stats.messages_discarded;
            log::logger()->debug("connection: discarding {} while offline", message.event);
            return ConnectionResult::Discarded;
        }
        ++impl_->stats.messages_deferred;
        return ConnectionResult::Deferred;
    }

    TransportResult result = impl_->transport.send(encode_message(message));
    if (result != TransportResult::Success) {
        log::logger()->warn("connection: send {} failed: {}", message.event,
                            transport_result_to_string(result));
        return ConnectionResult::TransportError;
    }
    ++impl_->stats.messages_sent;
    log::logger()->trace("connection: -> {}", message.event);
    return ConnectionResult::Success;
}

ConnectionStatus ConnectionManager::status() const {
    return impl_->status;
}

bool ConnectionManager::is_connected() const {
    return impl_->status == ConnectionStatus::Connected;
}

UInt32 ConnectionManager::reconnect_attempt() const {
    return impl_->attempt;
}

const ConnectionConfig& ConnectionManager::config() const {
    return impl_->config;
}

ConnectionStats ConnectionManager::stats() const {
    return impl_->stats;
}

core::EventChannel<ConnectionEvent>& ConnectionManager::connection_events() {
    return impl_->connection_events;
}

core::EventChannel<WireMessage>& ConnectionManager::messages() {
    return impl_->messages;
}

} // namespace nightfall::net
