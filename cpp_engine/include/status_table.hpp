/**
 * ClawCombat Battle Engine - Status Table
 *
 * Data-driven status condition hooks. Each condition registers a record of
 * optional hooks that the turn resolver consults:
 *
 *   on_before_move - may block the move, thaw/wake/snap out, or self-hit
 *   on_turn_end    - end-of-turn damage
 *   on_attack      - outgoing damage modifier
 *   speed_mod      - turn order speed multiplier
 *
 * Turn counters are advanced by the resolver before on_before_move runs;
 * hooks only read the combatant.
 */

#pragma once

#include "combatant_state.hpp"
#include <functional>
#include <unordered_map>

namespace clawcombat {

class BattleRng;

// ============================================================================
// HOOK RESULTS
// ============================================================================

struct BeforeMoveResult {
    bool cant_move = false;
    bool thaw = false;
    bool wake = false;
    bool snap_out = false;
    bool self_hit = false;
    int damage = 0;
    std::string message;
};

struct TurnEndResult {
    int damage = 0;
    std::string message;
};

struct AttackModifier {
    double damage_mod = 1.0;
};

// ============================================================================
// CALLBACK TYPES
// ============================================================================

using BeforeMoveCallback = std::function<BeforeMoveResult(
    const CombatantState&,
    BattleRng&
)>;

using TurnEndCallback = std::function<TurnEndResult(
    const CombatantState&
)>;

using StatusAttackCallback = std::function<AttackModifier(
    const CombatantState&,
    const MoveDef&
)>;

struct StatusEffectDef {
    StatusCondition condition = StatusCondition::NONE;
    std::string name;
    BeforeMoveCallback on_before_move;
    TurnEndCallback on_turn_end;
    StatusAttackCallback on_attack;
    double speed_mod = 1.0;
};

// ============================================================================
// STATUS TABLE
// ============================================================================

/**
 * StatusTable - Registry of status hooks.
 *
 * Built once; read-only afterwards.
 */
class StatusTable {
public:
    // Tuning constants
    static constexpr double PARALYSIS_SKIP_CHANCE = 0.15;
    static constexpr double PARALYSIS_SPEED_MOD = 0.75;
    static constexpr double CONFUSION_SELF_HIT_CHANCE = 0.25;
    static constexpr double CONFUSION_SELF_HIT_FRACTION = 0.10;
    static constexpr int CONFUSION_MAX_TURNS = 3;
    static constexpr int FREEZE_TURNS = 1;
    static constexpr int SLEEP_TURNS = 2;
    static constexpr double BURN_DAMAGE_FRACTION = 0.0625;
    static constexpr double POISON_DAMAGE_FRACTION = 1.0 / 12.0;
    static constexpr double BURN_ATTACK_MOD = 0.5;

    StatusTable() = default;

    void register_status(StatusEffectDef def);

    const StatusEffectDef* get(StatusCondition condition) const;

    bool has(StatusCondition condition) const { return get(condition) != nullptr; }

    size_t size() const { return entries_.size(); }

    /**
     * Speed multiplier from the combatant's primary status (1.0 if none).
     */
    double speed_modifier(const CombatantState& combatant) const;

    /**
     * Outgoing damage multiplier from the attacker's primary status.
     */
    double attack_modifier(const CombatantState& attacker, const MoveDef& move) const;

    /**
     * Table with the six standard conditions registered.
     */
    static const StatusTable& standard();

private:
    std::unordered_map<StatusCondition, StatusEffectDef> entries_;
};

} // namespace clawcombat
