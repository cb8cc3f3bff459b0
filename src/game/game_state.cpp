/**
 * @file game_state.cpp
 * @brief Game state lookups
 */

#include "nightfall/game/game_state.h"
#include <algorithm>

namespace nightfall::game {

std::optional<GamePhase> game_phase_from_string(const std::string& name) {
    if (name == "lobby") return GamePhase::Lobby;
    if (name == "day") return GamePhase::Day;
    if (name == "night") return GamePhase::Night;
    if (name == "voting") return GamePhase::Voting;
    if (name == "results") return GamePhase::Results;
    return std::nullopt;
}

const Player* GameState::find_player(const std::string& player_id) const {
    auto it = std::find_if(players.begin(), players.end(),
        [&](const Player& p) { return p.id == player_id; });
    return it == players.end() ? nullptr : &*it;
}

Player* GameState::find_player(const std::string& player_id) {
    auto it = std::find_if(players.begin(), players.end(),
        [&](const Player& p) { return p.id == player_id; });
    return it == players.end() ? nullptr : &*it;
}

bool GameState::is_eliminated(const std::string& player_id) const {
    return std::find(eliminated_player_ids.begin(), eliminated_player_ids.end(), player_id)
        != eliminated_player_ids.end();
}

const Vote* GameState::find_vote(const std::string& voter_id) const {
    auto it = std::find_if(votes.begin(), votes.end(),
        [&](const Vote& v) { return v.player_id == voter_id; });
    return it == votes.end() ? nullptr : &*it;
}

} // namespace nightfall::game
