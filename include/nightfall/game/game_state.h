#pragma once
/**
 * @file game_state.h
 * @brief Replicated game state and the server updates that modify it
 */

#include "nightfall/core/types.h"
#include <optional>
#include <string>
#include <vector>

namespace nightfall::game {

// ============================================================================
// Game Phase
// ============================================================================

enum class GamePhase : UInt8 {
    Lobby = 0,
    Day,
    Night,
    Voting,
    Results
};

inline const char* game_phase_to_string(GamePhase phase) {
    switch (phase) {
        case GamePhase::Lobby: return "lobby";
        case GamePhase::Day: return "day";
        case GamePhase::Night: return "night";
        case GamePhase::Voting: return "voting";
        case GamePhase::Results: return "results";
        default: return "unknown";
    }
}

/**
 * @brief Parse a wire phase name
 */
std::optional<GamePhase> game_phase_from_string(const std::string& name);

// ============================================================================
// Game Entities
// ============================================================================

struct Player {
    std::string id;
    std::string username;
    std::string role;
    bool is_alive{true};
    bool is_host{false};

    bool operator==(const Player& other) const = default;
};

struct Vote {
    std::string player_id;
    std::string target_id;
    Timestamp timestamp{0};

    bool operator==(const Vote& other) const = default;
};

struct ChatMessage {
    std::string id;
    std::string player_id;
    std::string message;
    Timestamp timestamp{0};
    bool tentative{false};   ///< Sent locally, not yet confirmed by the server

    bool operator==(const ChatMessage& other) const = default;
};

/**
 * @brief Shared game state as seen by one client
 */
struct GameState {
    std::string game_id;
    std::string room_id;
    GamePhase phase{GamePhase::Lobby};
    UInt32 day_number{0};
    Int64 time_remaining_s{0};   ///< Seconds left in the current phase
    std::vector<Player> players;
    std::vector<Vote> votes;
    std::vector<std::string> eliminated_player_ids;
    std::vector<ChatMessage> chat_messages;
    Timestamp updated_at{0};

    const Player* find_player(const std::string& player_id) const;
    Player* find_player(const std::string& player_id);
    bool is_eliminated(const std::string& player_id) const;
    const Vote* find_vote(const std::string& voter_id) const;

    bool operator==(const GameState& other) const = default;
};

// ============================================================================
// Server Updates
// ============================================================================

/**
 * @brief Full authoritative snapshot (game-state-update)
 */
struct StateSnapshot {
    GameState state;
    Timestamp timestamp{0};
    std::vector<ActionId> applied_action_ids;   ///< Actions the server already applied
};

/**
 * @brief Incremental phase transition (phase-changed)
 */
struct PhaseUpdate {
    GamePhase phase{GamePhase::Lobby};
    Int64 time_remaining_s{0};
    std::optional<UInt32> day_number;
    Timestamp timestamp{0};
};

/**
 * @brief Replacement vote tally (votes-updated)
 */
struct VotesUpdate {
    std::vector<Vote> votes;
    Timestamp timestamp{0};
};

/**
 * @brief Player elimination (player-eliminated)
 */
struct EliminationUpdate {
    std::string player_id;
    std::string reason;
    Timestamp timestamp{0};
};

/**
 * @brief Server-reported divergence (sync-conflict)
 */
struct ServerConflict {
    GameState server_state;
    std::vector<std::string> conflicting_fields;
    std::vector<ActionId> conflicting_actions;
    std::string resolution_hint;   ///< "server", "client", "merge" or empty
};

} // namespace nightfall::game
