#pragma once
/**
 * @file connection_manager.h
 * @brief Session lifecycle, heartbeat and reconnection
 *
 * Maintains exactly one logical session over an ITransport:
 *
 *   Disconnected -> Connecting -> Connected -> (Disconnected | Reconnecting)
 *   Reconnecting -> Connected | Failed
 *
 * A close initiated by either side on purpose ends the session without
 * reconnecting. Any other close starts reconnection with exponential
 * backoff until the attempt cap is reached, at which point the manager
 * enters Failed and reports a fatal error.
 */

#include "nightfall/core/backoff.h"
#include "nightfall/core/event_channel.h"
#include "nightfall/core/scheduler.h"
#include "nightfall/net/transport.h"
#include "nightfall/net/wire.h"
#include <memory>
#include <string>

namespace nightfall::net {

// ============================================================================
// Connection Status & Result Enums
// ============================================================================

enum class ConnectionStatus : UInt8 {
    Disconnected = 0,
    Connecting,
    Connected,
    Reconnecting,
    Failed
};

inline const char* connection_status_to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "Disconnected";
        case ConnectionStatus::Connecting: return "Connecting";
        case ConnectionStatus::Connected: return "Connected";
        case ConnectionStatus::Reconnecting: return "Reconnecting";
        case ConnectionStatus::Failed: return "Failed";
        default: return "Unknown";
    }
}

enum class ConnectionResult : UInt8 {
    Success = 0,

    // connect()
    AlreadyConnected,
    ReconnectPending,
    InvalidConfiguration,

    // send()
    Deferred,       ///< Replayable event while offline; caller queues it
    Discarded,      ///< Control message while offline; dropped
    TransportError
};

inline const char* connection_result_to_string(ConnectionResult result) {
    switch (result) {
        case ConnectionResult::Success: return "Success";
        case ConnectionResult::AlreadyConnected: return "AlreadyConnected";
        case ConnectionResult::ReconnectPending: return "ReconnectPending";
        case ConnectionResult::InvalidConfiguration: return "InvalidConfiguration";
        case ConnectionResult::Deferred: return "Deferred";
        case ConnectionResult::Discarded: return "Discarded";
        case ConnectionResult::TransportError: return "TransportError";
        default: return "Unknown";
    }
}

// ============================================================================
// Configuration
// ============================================================================

struct ConnectionConfig {
    std::string url{"ws://localhost:3000/socket"};
    Duration reconnect_base_delay{1000};
    Duration reconnect_max_delay{30000};
    UInt32 max_reconnect_attempts{5};
    Duration heartbeat_interval{30000};
    Duration heartbeat_timeout{10000};

    static ConnectionConfig default_config() { return ConnectionConfig{}; }

    /**
     * @brief Faster failure detection for LAN play
     */
    static ConnectionConfig low_latency() {
        ConnectionConfig config;
        config.reconnect_base_delay = Duration(250);
        config.reconnect_max_delay = Duration(5000);
        config.heartbeat_interval = Duration(10000);
        config.heartbeat_timeout = Duration(3000);
        return config;
    }

    /**
     * @brief Patient settings for flaky mobile links
     */
    static ConnectionConfig mobile() {
        ConnectionConfig config;
        config.max_reconnect_attempts = 8;
        config.reconnect_max_delay = Duration(60000);
        config.heartbeat_timeout = Duration(15000);
        return config;
    }
};

// ============================================================================
// Events & Statistics
// ============================================================================

struct ConnectionEvent {
    enum class Kind : UInt8 {
        Connected,
        Disconnected,
        Reconnecting,   ///< Next attempt scheduled
        ConnectError,   ///< An attempt failed
        Failed          ///< Attempts exhausted
    };

    Kind kind{Kind::Connected};
    std::string reason;
    UInt32 attempt{0};
    Duration delay{0};
    bool intentional{false};    ///< Disconnect requested by either side
    bool is_reconnect{false};   ///< Connected after an earlier session ended
};

inline const char* connection_event_kind_to_string(ConnectionEvent::Kind kind) {
    switch (kind) {
        case ConnectionEvent::Kind::Connected: return "Connected";
        case ConnectionEvent::Kind::Disconnected: return "Disconnected";
        case ConnectionEvent::Kind::Reconnecting: return "Reconnecting";
        case ConnectionEvent::Kind::ConnectError: return "ConnectError";
        case ConnectionEvent::Kind::Failed: return "Failed";
        default: return "Unknown";
    }
}

struct ConnectionStats {
    UInt64 connects{0};
    UInt64 disconnects{0};
    UInt64 reconnect_attempts{0};
    UInt64 messages_sent{0};
    UInt64 messages_received{0};
    UInt64 messages_deferred{0};
    UInt64 messages_discarded{0};
    UInt64 malformed_frames{0};
    UInt64 heartbeats_sent{0};
    UInt64 heartbeat_timeouts{0};

    void reset() { *this = ConnectionStats{}; }
};

// ============================================================================
// Connection Manager
// ============================================================================

class ConnectionManager {
public:
    ConnectionManager(ITransport& transport, core::IScheduler& scheduler,
                      const ConnectionConfig& config = ConnectionConfig::default_config());
    ~ConnectionManager();

    // Non-copyable, movable
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;
    ConnectionManager(ConnectionManager&&) noexcept;
    ConnectionManager& operator=(ConnectionManager&&) noexcept;

    /**
     * @brief Open the session
     *
     * No-op returning AlreadyConnected while Connected or Connecting, and
     * ReconnectPending while a reconnect attempt is scheduled.
     */
    ConnectionResult connect(const std::string& credential);

    /**
     * @brief Close the session on purpose; cancels all timers
     */
    void disconnect();

    /**
     * @brief Send a message on the live session
     * @return Success, Deferred, Discarded or TransportError
     */
    ConnectionResult send(const WireMessage& message);

    ConnectionStatus status() const;
    bool is_connected() const;
    UInt32 reconnect_attempt() const;
    const ConnectionConfig& config() const;
    ConnectionStats stats() const;

    /// Lifecycle notifications
    core::EventChannel<ConnectionEvent>& connection_events();

    /// Inbound domain messages (heartbeat traffic excluded)
    core::EventChannel<WireMessage>& messages();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nightfall::net
