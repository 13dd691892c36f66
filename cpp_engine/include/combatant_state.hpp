/**
 * ClawCombat Battle Engine - Combatant State
 *
 * Represents one agent's complete in-battle state: stats, HP, status,
 * counters, stages, one-shot flags and move slots.
 */

#pragma once

#include "move.hpp"
#include <vector>

namespace clawcombat {

/**
 * Six stats of a combatant.
 */
struct StatBlock {
    int hp = 0;
    int attack = 0;
    int defense = 0;
    int sp_atk = 0;
    int sp_def = 0;
    int speed = 0;

    int get(StatKind stat) const;
    void set(StatKind stat, int value);
};

/**
 * Battle stages for the five non-HP stats, each clamped to [-6, +6].
 */
struct StatStages {
    int attack = 0;
    int defense = 0;
    int sp_atk = 0;
    int sp_def = 0;
    int speed = 0;

    int get(StatKind stat) const;

    /**
     * Add `delta` to a stage, clamped to [-6, +6].
     *
     * @return The change actually applied (0 if already at the limit)
     */
    int adjust(StatKind stat, int delta);

    void reset() { *this = StatStages{}; }

    bool all_zero() const {
        return attack == 0 && defense == 0 && sp_atk == 0 && sp_def == 0 && speed == 0;
    }
};

/**
 * A move slot with its own PP.
 */
struct MoveSlot {
    MoveDef move;
    int current_pp = 0;

    MoveSlot() = default;
    explicit MoveSlot(const MoveDef& def) : move(def), current_pp(def.pp) {}
};

/**
 * CombatantState - One side of a battle.
 */
struct CombatantState {
    AgentID id;
    std::string name;
    ElementType type = ElementType::NEUTRAL;
    int level = 1;
    int evolution_tier = 1;
    std::string evolution_name = "Basic";

    int max_hp = 1;
    int current_hp = 1;
    StatBlock base_stats;        // before battle_start abilities
    StatBlock effective_stats;   // after battle_start abilities

    // Primary status (mutually exclusive)
    StatusCondition status = StatusCondition::NONE;

    // Volatile confusion, may coexist with a primary status
    bool confused = false;

    // Status counters
    int freeze_turns = 0;
    int sleep_turns = 0;
    int confusion_turns = 0;
    bool woke_from_damage = false;

    StatStages stages;

    // One-shot flags
    bool sturdy_used = false;
    bool wish_pending = false;
    int wish_turn = 0;
    bool leech_seeded = false;
    bool cursed = false;

    // Turn flags - reset each turn
    bool flinched = false;
    bool took_damage_this_turn = false;

    std::string ability;
    std::vector<MoveSlot> moves;

    int consecutive_timeouts = 0;

    // ========================================================================
    // QUERIES
    // ========================================================================

    bool is_fainted() const { return current_hp <= 0; }
    bool has_status() const { return status != StatusCondition::NONE; }
    bool has_ability(const std::string& name) const { return ability == name; }
    bool at_full_hp() const { return current_hp >= max_hp; }

    double hp_ratio() const {
        return max_hp > 0 ? static_cast<double>(current_hp) / max_hp : 0.0;
    }

    MoveSlot* find_move(const MoveID& move_id);
    const MoveSlot* find_move(const MoveID& move_id) const;

    std::vector<MoveID> move_ids() const;

    /**
     * Stat with its battle stage applied (no status modifiers).
     */
    double staged_stat(StatKind stat) const;

    /**
     * Stat holding the highest stage, first of attack/defense/sp_atk/
     * sp_def/speed on ties.
     */
    StatKind highest_stage() const;

    // ========================================================================
    // MUTATION
    // ========================================================================

    void reset_turn_flags() {
        flinched = false;
        took_damage_this_turn = false;
    }

    /**
     * Lower HP by `amount`, floored at 0.
     *
     * @return HP actually lost
     */
    int take_damage(int amount);

    /**
     * Raise HP by `amount`, capped at max_hp.
     *
     * @return HP actually restored
     */
    int heal(int amount);

    /**
     * Apply a status. CONFUSION sets the volatile flag; anything else
     * replaces the primary status. Counters for the applied status restart.
     */
    void inflict(StatusCondition condition);

    void clear_status();
};

} // namespace clawcombat
