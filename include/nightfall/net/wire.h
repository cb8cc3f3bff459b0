#pragma once
/**
 * @file wire.h
 * @brief Wire event names and the message envelope
 *
 * Every frame on the socket is one JSON text object of the form
 * {"event":"<name>","data":{...}}.
 */

#include "nightfall/core/types.h"
#include <string>
#include <string_view>

namespace nightfall::net {

/**
 * @brief Decoded wire frame; data holds the raw JSON text of the payload
 */
struct WireMessage {
    std::string event;
    std::string data{"{}"};
};

namespace wire {

// ============================================================================
// Outbound Events
// ============================================================================

constexpr const char* JOIN_ROOM = "join-room";
constexpr const char* LEAVE_ROOM = "leave-room";
constexpr const char* CAST_VOTE = "cast-vote";
constexpr const char* START_GAME = "start-game";
constexpr const char* SEND_CHAT_MESSAGE = "send-chat-message";
constexpr const char* READY_TOGGLE = "ready-toggle";
constexpr const char* USE_ABILITY = "use-ability";
constexpr const char* REQUEST_SYNC = "request-sync";
constexpr const char* SYNC_RESPONSE = "sync-response";
constexpr const char* SYNC_CONFLICT_RESOLVED = "sync-conflict-resolved";
constexpr const char* PING = "ping";

// ============================================================================
// Inbound Events
// ============================================================================

constexpr const char* GAME_STATE_UPDATE = "game-state-update";
constexpr const char* PHASE_CHANGED = "phase-changed";
constexpr const char* VOTES_UPDATED = "votes-updated";
constexpr const char* PLAYER_ELIMINATED = "player-eliminated";
constexpr const char* SYNC_CONFLICT = "sync-conflict";
constexpr const char* SYNC_REQUEST = "sync-request";
constexpr const char* ACTION_ACKNOWLEDGED = "action-acknowledged";
constexpr const char* ACTION_REJECTED = "action-rejected";
constexpr const char* PONG = "pong";

// ============================================================================
// Disconnect Reasons
// ============================================================================

constexpr const char* REASON_SERVER_DISCONNECT = "io server disconnect";
constexpr const char* REASON_CLIENT_DISCONNECT = "io client disconnect";
constexpr const char* REASON_PING_TIMEOUT = "ping timeout";
constexpr const char* REASON_TRANSPORT_CLOSE = "transport close";
constexpr const char* REASON_TRANSPORT_ERROR = "transport error";

// ============================================================================
// Classification
// ============================================================================

/**
 * @brief Connection-scoped messages that are dropped rather than queued offline
 */
inline bool is_control_event(std::string_view event) {
    return event == PING || event == PONG ||
           event == REQUEST_SYNC || event == SYNC_RESPONSE ||
           event == SYNC_CONFLICT_RESOLVED;
}

/**
 * @brief Close reasons after which no automatic reconnect is attempted
 */
inline bool is_terminal_disconnect(std::string_view reason) {
    return reason == REASON_SERVER_DISCONNECT || reason == REASON_CLIENT_DISCONNECT;
}

} // namespace wire

} // namespace nightfall::net
