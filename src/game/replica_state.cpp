/**
 * @file replica_state.cpp
 * @brief Confirmed base / tentative overlay implementation
 */

#include "nightfall/game/replica_state.h"
#include "nightfall/net/wire.h"
#include <algorithm>

namespace nightfall::game {

namespace {

std::string field_or(const FieldMap& fields, const std::string& key, const std::string& fallback) {
    auto it = fields.find(key);
    if (it == fields.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

} // anonymous namespace

bool apply_tentative_op(GameState& state, const TentativeOp& op,
                        const std::string& local_player_id, bool tentative) {
    if (op.kind == net::wire::CAST_VOTE) {
        std::string voter = field_or(op.payload, "playerId", local_player_id);
        std::string target = field_or(op.payload, "targetId", "");
        if (voter.empty() || target.empty()) {
            return false;
        }
        // One vote per voter; a new vote replaces the previous one
        state.votes.erase(std::remove_if(state.votes.begin(), state.votes.end(),
            [&](const Vote& v) { return v.player_id == voter; }), state.votes.end());
        state.votes.push_back(Vote{voter, target, op.created_at});
        return true;
    }

    if (op.kind == net::wire::SEND_CHAT_MESSAGE) {
        std::string message = field_or(op.payload, "message", "");
        if (message.empty()) {
            return false;
        }
        auto existing = std::find_if(state.chat_messages.begin(), state.chat_messages.end(),
            [&](const ChatMessage& m) { return m.id == op.action_id; });
        if (existing != state.chat_messages.end()) {
            existing->tentative = tentative;
            return true;
        }
        ChatMessage chat;
        chat.id = op.action_id;
        chat.player_id = field_or(op.payload, "playerId", local_player_id);
        chat.message = message;
        chat.timestamp = op.created_at;
        chat.tentative = tentative;
        state.chat_messages.push_back(std::move(chat));
        return true;
    }

    if (op.kind == net::wire::JOIN_ROOM) {
        std::string room = field_or(op.payload, "roomId", "");
        if (room.empty()) {
            return false;
        }
        state.room_id = room;
        return true;
    }

    if (op.kind == net::wire::LEAVE_ROOM) {
        state.room_id.clear();
        return true;
    }

    // ready-toggle, use-ability and start-game only take effect on the server
    return false;
}

// ============================================================================
// ReplicaState
// ============================================================================

ReplicaState::ReplicaState(std::string local_player_id)
    : local_player_id_(std::move(local_player_id)) {}

GameState ReplicaState::view() const {
    GameState result = confirmed_;
    for (const auto& op : overlay_) {
        apply_tentative_op(result, op, local_player_id_, true);
    }
    return result;
}

bool ReplicaState::has_tentative(const ActionId& action_id) const {
    return std::any_of(overlay_.begin(), overlay_.end(),
        [&](const TentativeOp& op) { return op.action_id == action_id; });
}

void ReplicaState::add_tentative(TentativeOp op) {
    auto it = std::find_if(overlay_.begin(), overlay_.end(),
        [&](const TentativeOp& existing) { return existing.action_id == op.action_id; });
    if (it != overlay_.end()) {
        overlay_.erase(it);
    }

    // Overlay stays sorted by creation time so the view matches replay order
    auto pos = std::upper_bound(overlay_.begin(), overlay_.end(), op,
        [](const TentativeOp& a, const TentativeOp& b) {
            if (a.created_at != b.created_at) return a.created_at < b.created_at;
            return a.action_id < b.action_id;
        });
    overlay_.insert(pos, std::move(op));
}

bool ReplicaState::confirm(const ActionId& action_id) {
    auto it = std::find_if(overlay_.begin(), overlay_.end(),
        [&](const TentativeOp& op) { return op.action_id == action_id; });
    if (it == overlay_.end()) {
        return false;
    }
    apply_tentative_op(confirmed_, *it, local_player_id_, false);
    overlay_.erase(it);
    return true;
}

bool ReplicaState::discard(const ActionId& action_id) {
    auto it = std::find_if(overlay_.begin(), overlay_.end(),
        [&](const TentativeOp& op) { return op.action_id == action_id; });
    if (it == overlay_.end()) {
        return false;
    }
    overlay_.erase(it);
    return true;
}

void ReplicaState::replace_confirmed(GameState state, std::vector<TentativeOp> overlay) {
    confirmed_ = std::move(state);
    overlay_.clear();
    for (auto& op : overlay) {
        add_tentative(std::move(op));
    }
}

void ReplicaState::apply_phase(const PhaseUpdate& update) {
    confirmed_.phase = update.phase;
    confirmed_.time_remaining_s = update.time_remaining_s;
    if (update.day_number) {
        confirmed_.day_number = *update.day_number;
    }
    confirmed_.updated_at = update.timestamp;
}

void ReplicaState::apply_votes(const VotesUpdate& update) {
    confirmed_.votes = update.votes;
    confirmed_.updated_at = update.timestamp;
}

bool ReplicaState::apply_elimination(const EliminationUpdate& update) {
    if (Player* player = confirmed_.find_player(update.player_id)) {
        player->is_alive = false;
    }
    confirmed_.updated_at = update.timestamp;
    if (confirmed_.is_eliminated(update.player_id)) {
        return false;
    }
    confirmed_.eliminated_player_ids.push_back(update.player_id);
    return true;
}

void ReplicaState::reset() {
    confirmed_ = GameState{};
    overlay_.clear();
}

} // namespace nightfall::game
