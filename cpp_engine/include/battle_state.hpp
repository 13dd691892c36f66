/**
 * ClawCombat Battle Engine - Battle State
 *
 * Complete state of one 1v1 battle. This is the unit that is persisted
 * between turns (see battle_serialization.hpp).
 */

#pragma once

#include "combatant_state.hpp"
#include "turn_log.hpp"
#include <cstdint>

namespace clawcombat {

/**
 * Named invariant violations when loading or advancing a battle.
 */
enum class StateError : uint8_t {
    NONE,
    MALFORMED_JSON,
    MISSING_FIELD,
    INVALID_VALUE,
    BATTLE_FINISHED
};

inline const char* to_string(StateError error) {
    switch (error) {
        case StateError::NONE: return "none";
        case StateError::MALFORMED_JSON: return "malformed_json";
        case StateError::MISSING_FIELD: return "missing_field";
        case StateError::INVALID_VALUE: return "invalid_value";
        case StateError::BATTLE_FINISHED: return "battle_finished";
        default: return "unknown";
    }
}

struct BattleState {
    BattleID id;
    CombatantState agent_a;
    CombatantState agent_b;

    int turn_number = 0;
    BattleStatus status = BattleStatus::ACTIVE;
    BattlePhase current_phase = BattlePhase::WAITING;
    AgentID winner_id;
    EndReason end_reason = EndReason::NONE;

    // Side that acted first in the last resolved turn
    std::optional<Side> first_side;

    // battle_start ability messages
    std::vector<TurnEvent> opening_events;
    std::vector<TurnLog> turns;

    // ISO-8601 UTC timestamps
    std::string started_at;
    std::string last_move_at;

    // Unix milliseconds of the last resolved turn (or creation); drives timeouts
    int64_t last_turn_at_ms = 0;

    uint64_t rng_seed = 0;
    std::string rng_state;  // serialized BattleRng engine, empty = fresh from seed

    // Submitted but not yet resolved moves
    std::optional<MoveID> pending_move_a;
    std::optional<MoveID> pending_move_b;

    // ========================================================================
    // ACCESS
    // ========================================================================

    CombatantState& combatant(Side side) {
        return side == Side::A ? agent_a : agent_b;
    }

    const CombatantState& combatant(Side side) const {
        return side == Side::A ? agent_a : agent_b;
    }

    std::optional<MoveID>& pending_move(Side side) {
        return side == Side::A ? pending_move_a : pending_move_b;
    }

    const std::optional<MoveID>& pending_move(Side side) const {
        return side == Side::A ? pending_move_a : pending_move_b;
    }

    /**
     * Side of an agent id, std::nullopt if it is not a participant.
     */
    std::optional<Side> side_of(const AgentID& agent_id) const {
        if (agent_a.id == agent_id) return Side::A;
        if (agent_b.id == agent_id) return Side::B;
        return std::nullopt;
    }

    bool is_finished() const { return status == BattleStatus::FINISHED; }

    AgentID loser_id() const {
        if (!is_finished() || winner_id.empty()) return "";
        return winner_id == agent_a.id ? agent_b.id : agent_a.id;
    }
};

} // namespace clawcombat
