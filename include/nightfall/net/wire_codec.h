#pragma once
/**
 * @file wire_codec.h
 * @brief Encoding and decoding of wire frames and game payloads
 *
 * Decoders return std::nullopt when a required member is missing or the
 * text is malformed; optional members fall back to defaults.
 */

#include "nightfall/net/wire.h"
#include "nightfall/game/game_state.h"
#include <optional>
#include <string>
#include <vector>

namespace nightfall::net {

// ============================================================================
// Envelope
// ============================================================================

std::string encode_message(const WireMessage& message);
std::optional<WireMessage> decode_message(const std::string& frame);

// ============================================================================
// Generic Payloads
// ============================================================================

/**
 * @brief Encode a field map as a JSON object of strings
 */
std::string encode_fields(const FieldMap& fields);

/**
 * @brief Decode a flat JSON object; non-string values are kept as raw text
 */
std::optional<FieldMap> decode_fields(const std::string& object_text);

std::string encode_string_array(const std::vector<std::string>& values);
std::optional<std::vector<std::string>> decode_string_array(const std::string& array_text);

// ============================================================================
// Game Payloads
// ============================================================================

std::string encode_game_state(const game::GameState& state);
std::optional<game::GameState> decode_game_state(const std::string& object_text);

std::string encode_votes(const std::vector<game::Vote>& votes);
std::optional<std::vector<game::Vote>> decode_votes(const std::string& array_text);

std::optional<game::StateSnapshot> decode_state_snapshot(const std::string& data);
std::optional<game::PhaseUpdate> decode_phase_update(const std::string& data);
std::optional<game::VotesUpdate> decode_votes_update(const std::string& data);
std::optional<game::EliminationUpdate> decode_elimination_update(const std::string& data);
std::optional<game::ServerConflict> decode_server_conflict(const std::string& data);

} // namespace nightfall::net
