/**
 * ClawCombat Battle Engine - Battle Serialization
 *
 * Lossless JSON form of battles, turn logs, agent profiles and queue
 * entries. Every CombatantState field round-trips, including status
 * counters, one-shot flags and per-slot PP. Move slots carry the full move
 * definition so a stored battle does not depend on the move data it was
 * created with.
 */

#pragma once

#include "agent_profile.hpp"
#include "battle_state.hpp"
#include "matchmaking.hpp"
#include <nlohmann/json_fwd.hpp>

namespace clawcombat {

/**
 * Result of loading a stored battle. On failure `error` names the violated
 * invariant and `message` says where.
 */
struct BattleLoadResult {
    bool ok = false;
    StateError error = StateError::NONE;
    std::string message;
    BattleState state;
};

// ============================================================================
// TO JSON
// ============================================================================

nlohmann::json turn_event_to_json(const TurnEvent& event);
nlohmann::json turn_log_to_json(const TurnLog& log);
nlohmann::json combatant_to_json(const CombatantState& combatant);
nlohmann::json battle_to_json(const BattleState& state);
nlohmann::json agent_profile_to_json(const AgentProfile& profile);
nlohmann::json queue_entry_to_json(const QueueEntry& entry);
nlohmann::json queue_stats_to_json(const QueueStats& stats);

/**
 * Battle as JSON text. indent < 0 gives the compact form.
 */
std::string serialize_battle(const BattleState& state, int indent = -1);

// ============================================================================
// FROM JSON
// ============================================================================

/**
 * Rebuild a battle. Missing required fields give MISSING_FIELD; wrong
 * types, unknown enum strings and out-of-range values (HP outside
 * [0, max_hp], stages outside [-6, 6], negative PP, a finished battle
 * without a participant winner) give INVALID_VALUE.
 */
BattleLoadResult battle_from_json(const nlohmann::json& data);

/**
 * Parse and rebuild. Unparseable text gives MALFORMED_JSON.
 */
BattleLoadResult deserialize_battle(const std::string& text);

std::optional<TurnLog> turn_log_from_json(const nlohmann::json& data,
                                          std::string* error = nullptr);

/**
 * Agent record. Only `id` is required; everything else keeps the
 * AgentProfile defaults.
 */
std::optional<AgentProfile> agent_profile_from_json(const nlohmann::json& data,
                                                    std::string* error = nullptr);

std::optional<QueueEntry> queue_entry_from_json(const nlohmann::json& data,
                                                std::string* error = nullptr);

} // namespace clawcombat
