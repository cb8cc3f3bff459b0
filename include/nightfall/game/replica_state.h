#pragma once
/**
 * @file replica_state.h
 * @brief Two-phase local replica: confirmed base plus tentative overlay
 *
 * The confirmed base only changes on server input. Optimistic actions live
 * in the overlay keyed by action id and are layered on top when the view is
 * computed. Acknowledgment folds an op into the base, a dropped or cancelled
 * action removes it, and a full resync replaces the base and rebuilds the
 * overlay wholesale.
 */

#include "nightfall/game/game_state.h"
#include <string>
#include <vector>

namespace nightfall::game {

/**
 * @brief Local effect of one queued action
 */
struct TentativeOp {
    ActionId action_id;
    std::string kind;
    FieldMap payload;
    Timestamp created_at{0};
};

/**
 * @brief Apply the local effect of an action to a state
 * @param tentative Mark produced chat messages as unconfirmed
 * @return false if the action kind has no local effect or the payload is incomplete
 */
bool apply_tentative_op(GameState& state, const TentativeOp& op,
                        const std::string& local_player_id, bool tentative = true);

class ReplicaState {
public:
    explicit ReplicaState(std::string local_player_id = "");

    void set_local_player(const std::string& player_id) { local_player_id_ = player_id; }
    const std::string& local_player() const { return local_player_id_; }

    const GameState& confirmed() const { return confirmed_; }

    /**
     * @brief Confirmed base with every tentative op applied in creation order
     */
    GameState view() const;

    const std::vector<TentativeOp>& overlay() const { return overlay_; }
    SizeT tentative_count() const { return overlay_.size(); }
    bool has_tentative(const ActionId& action_id) const;

    /**
     * @brief Add an optimistic op; an op with the same id is replaced
     */
    void add_tentative(TentativeOp op);

    /**
     * @brief Fold an acknowledged op into the confirmed base
     * @return false if the id is not in the overlay
     */
    bool confirm(const ActionId& action_id);

    /**
     * @brief Remove an op without applying it
     */
    bool discard(const ActionId& action_id);

    /**
     * @brief Replace the confirmed base and the whole overlay
     */
    void replace_confirmed(GameState state, std::vector<TentativeOp> overlay);

    void clear_overlay() { overlay_.clear(); }

    // ========================================================================
    // Incremental server updates (confirmed base only)
    // ========================================================================

    void apply_phase(const PhaseUpdate& update);
    void apply_votes(const VotesUpdate& update);

    /**
     * @return false if the player was already eliminated
     */
    bool apply_elimination(const EliminationUpdate& update);

    /**
     * @brief Drop base and overlay (logout)
     */
    void reset();

private:
    GameState confirmed_;
    std::vector<TentativeOp> overlay_;
    std::string local_player_id_;
};

} // namespace nightfall::game
