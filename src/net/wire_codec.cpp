/**
 * @file wire_codec.cpp
 * @brief Wire frame and game payload codec
 */

#include "nightfall/net/wire_codec.h"
#include "nightfall/net/json_text.h"

namespace nightfall::net {

namespace {

std::optional<game::Player> decode_player(const std::string& text) {
    auto id = json::find_raw(text, "id");
    if (!id) return std::nullopt;

    game::Player player;
    player.id = json::unquote(*id);
    player.username = json::find_string(text, "username");
    player.role = json::find_string(text, "role");
    player.is_alive = json::find_bool(text, "isAlive", true);
    player.is_host = json::find_bool(text, "isHost", false);
    return player;
}

std::string encode_player(const game::Player& player) {
    json::ObjectBuilder builder;
    builder.add("id", player.id)
           .add("username", player.username)
           .add("role", player.role)
           .add_bool("isAlive", player.is_alive)
           .add_bool("isHost", player.is_host);
    return builder.str();
}

std::optional<game::ChatMessage> decode_chat(const std::string& text) {
    auto id = json::find_raw(text, "id");
    if (!id) return std::nullopt;

    game::ChatMessage chat;
    chat.id = json::unquote(*id);
    chat.player_id = json::find_string(text, "playerId");
    chat.message = json::find_string(text, "message");
    chat.timestamp = json::find_int(text, "timestamp");
    return chat;
}

std::string encode_chat(const game::ChatMessage& chat) {
    json::ObjectBuilder builder;
    builder.add("id", chat.id)
           .add("playerId", chat.player_id)
           .add("message", chat.message)
           .add_int("timestamp", chat.timestamp);
    return builder.str();
}

// Elements may be player objects or bare ids
std::vector<std::string> decode_player_ids(const std::string& array_text) {
    std::vector<std::string> ids;
    auto elements = json::array_elements(array_text);
    if (!elements) return ids;
    for (const auto& element : *elements) {
        if (json::is_string_token(element)) {
            ids.push_back(json::unquote(element));
        } else {
            std::string id = json::find_string(element, "id");
            if (!id.empty()) ids.push_back(id);
        }
    }
    return ids;
}

} // anonymous namespace

// ============================================================================
// Envelope
// ============================================================================

std::string encode_message(const WireMessage& message) {
    json::ObjectBuilder builder;
    builder.add("event", message.event)
           .add_raw("data", message.data.empty() ? std::string("{}") : message.data);
    return builder.str();
}

std::optional<WireMessage> decode_message(const std::string& frame) {
    auto members = json::object_members(frame);
    if (!members) return std::nullopt;

    WireMessage message;
    bool has_event = false;
    for (const auto& [key, value] : *members) {
        if (key == "event" && json::is_string_token(value)) {
            message.event = json::unquote(value);
            has_event = true;
        } else if (key == "data") {
            message.data = value;
        }
    }
    if (!has_event || message.event.empty()) return std::nullopt;
    return message;
}

// ============================================================================
// Generic Payloads
// ============================================================================

std::string encode_fields(const FieldMap& fields) {
    json::ObjectBuilder builder;
    for (const auto& [key, value] : fields) {
        builder.add(key, value);
    }
    return builder.str();
}

std::optional<FieldMap> decode_fields(const std::string& object_text) {
    auto members = json::object_members(object_text);
    if (!members) return std::nullopt;

    FieldMap fields;
    for (const auto& [key, value] : *members) {
        fields[key] = json::unquote(value);
    }
    return fields;
}

std::string encode_string_array(const std::vector<std::string>& values) {
    std::vector<std::string> raw;
    raw.reserve(values.size());
    for (const auto& value : values) {
        raw.push_back(json::quote(value));
    }
    return json::make_array(raw);
}

std::optional<std::vector<std::string>> decode_string_array(const std::string& array_text) {
    auto elements = json::array_elements(array_text);
    if (!elements) return std::nullopt;

    std::vector<std::string> values;
    values.reserve(elements->size());
    for (const auto& element : *elements) {
        values.push_back(json::unquote(element));
    }
    return values;
}

// ============================================================================
// Game Payloads
// ============================================================================

std::string encode_game_state(const game::GameState& state) {
    std::vector<std::string> players;
    for (const auto& player : state.players) {
        players.push_back(encode_player(player));
    }
    std::vector<std::string> chat;
    for (const auto& message : state.chat_messages) {
        chat.push_back(encode_chat(message));
    }

    json::ObjectBuilder builder;
    builder.add("id", state.game_id)
           .add("roomId", state.room_id)
           .add("phase", game::game_phase_to_string(state.phase))
           .add_int("dayNumber", state.day_number)
           .add_int("timeRemaining", state.time_remaining_s)
           .add_raw("players", json::make_array(players))
           .add_raw("votes", encode_votes(state.votes))
           .add_raw("eliminatedPlayers", encode_string_array(state.eliminated_player_ids))
           .add_raw("chatMessages", json::make_array(chat))
           .add_int("updatedAt", state.updated_at);
    return builder.str();
}

std::optional<game::GameState> decode_game_state(const std::string& object_text) {
    auto members = json::object_members(object_text);
    if (!members) return std::nullopt;

    game::GameState state;
    for (const auto& [key, value] : *members) {
        if (key == "id") {
            state.game_id = json::unquote(value);
        } else if (key == "roomId") {
            state.room_id = json::unquote(value);
        } else if (key == "phase") {
            auto phase = game::game_phase_from_string(json::unquote(value));
            if (!phase) return std::nullopt;
            state.phase = *phase;
        } else if (key == "dayNumber") {
            state.day_number = static_cast<UInt32>(json::to_int(value));
        } else if (key == "timeRemaining") {
            state.time_remaining_s = json::to_int(value);
        } else if (key == "updatedAt") {
            state.updated_at = json::to_int(value);
        } else if (key == "players") {
            auto elements = json::array_elements(value);
            if (!elements) return std::nullopt;
            for (const auto& element : *elements) {
                auto player = decode_player(element);
                if (!player) return std::nullopt;
                state.players.push_back(std::move(*player));
            }
        } else if (key == "votes") {
            auto votes = decode_votes(value);
            if (!votes) return std::nullopt;
            state.votes = std::move(*votes);
        } else if (key == "eliminatedPlayers") {
            state.eliminated_player_ids = decode_player_ids(value);
        } else if (key == "chatMessages") {
            auto elements = json::array_elements(value);
            if (!elements) return std::nullopt;
            for (const auto& element : *elements) {
                auto chat = decode_chat(element);
                if (chat) state.chat_messages.push_back(std::move(*chat));
            }
        }
    }
    return state;
}

std::string encode_votes(const std::vector<game::Vote>& votes) {
    std::vector<std::string> raw;
    raw.reserve(votes.size());
    for (const auto& vote : votes) {
        json::ObjectBuilder builder;
        builder.add("playerId", vote.player_id)
               .add("targetId", vote.target_id)
               .add_int("timestamp", vote.timestamp);
        raw.push_back(builder.str());
    }
    return json::make_array(raw);
}

std::optional<std::vector<game::Vote>> decode_votes(const std::string& array_text) {
    auto elements = json::array_elements(array_text);
    if (!elements) return std::nullopt;

    std::vector<game::Vote> votes;
    for (const auto& element : *elements) {
        game::Vote vote;
        vote.player_id = json::find_string(element, "playerId");
        vote.target_id = json::find_string(element, "targetId");
        vote.timestamp = json::find_int(element, "timestamp");
        if (vote.player_id.empty()) return std::nullopt;
        votes.push_back(std::move(vote));
    }
    return votes;
}

std::optional<game::StateSnapshot> decode_state_snapshot(const std::string& data) {
    auto state_text = json::find_raw(data, "gameState");
    if (!state_text) return std::nullopt;

    auto state = decode_game_state(*state_text);
    if (!state) return std::nullopt;

    game::StateSnapshot snapshot;
    snapshot.state = std::move(*state);
    snapshot.timestamp = json::find_int(data, "timestamp", snapshot.state.updated_at);
    if (auto applied = json::find_raw(data, "appliedActionIds")) {
        auto ids = decode_string_array(*applied);
        if (ids) snapshot.applied_action_ids = std::move(*ids);
    }
    return snapshot;
}

std::optional<game::PhaseUpdate> decode_phase_update(const std::string& data) {
    auto phase = game::game_phase_from_string(json::find_string(data, "phase"));
    if (!phase || !json::find_raw(data, "timestamp")) return std::nullopt;

    game::PhaseUpdate update;
    update.phase = *phase;
    update.time_remaining_s = json::find_int(data, "timeRemaining");
    if (json::find_raw(data, "dayNumber")) {
        update.day_number = static_cast<UInt32>(json::find_int(data, "dayNumber"));
    }
    update.timestamp = json::find_int(data, "timestamp");
    return update;
}

std::optional<game::VotesUpdate> decode_votes_update(const std::string& data) {
    auto votes_text = json::find_raw(data, "votes");
    if (!votes_text || !json::find_raw(data, "timestamp")) return std::nullopt;

    auto votes = decode_votes(*votes_text);
    if (!votes) return std::nullopt;

    game::VotesUpdate update;
    update.votes = std::move(*votes);
    update.timestamp = json::find_int(data, "timestamp");
    return update;
}

std::optional<game::EliminationUpdate> decode_elimination_update(const std::string& data) {
    std::string player_id = json::find_string(data, "playerId");
    if (player_id.empty() || !json::find_raw(data, "timestamp")) return std::nullopt;

    game::EliminationUpdate update;
    update.player_id = std::move(player_id);
    update.reason = json::find_string(data, "reason");
    update.timestamp = json::find_int(data, "timestamp");
    return update;
}

std::optional<game::ServerConflict> decode_server_conflict(const std::string& data) {
    auto state_text = json::find_raw(data, "serverState");
    if (!state_text) return std::nullopt;

    auto state = decode_game_state(*state_text);
    if (!state) return std::nullopt;

    game::ServerConflict conflict;
    conflict.server_state = std::move(*state);
    if (auto fields = json::find_raw(data, "conflictingFields")) {
        auto names = decode_string_array(*fields);
        if (names) conflict.conflicting_fields = std::move(*names);
    }
    if (auto actions = json::find_raw(data, "conflictingActions")) {
        auto ids = decode_string_array(*actions);
        if (ids) conflict.conflicting_actions = std::move(*ids);
    }
    conflict.resolution_hint = json::find_string(data, "resolution");
    return conflict;
}

} // namespace nightfall::net
