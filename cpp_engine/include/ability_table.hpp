/**
 * ClawCombat Battle Engine - Ability Table
 *
 * Every ability is a registered AbilityDef record. Behavior lives in two
 * kinds of fields:
 *
 * - Hooks (std::function) for anything conditional on battle context:
 *   battle start stat changes, damage multipliers, effectiveness
 *   adjustment, priority bonus.
 * - Plain data for fixed numbers: accuracy multiplier, dodge chance, type
 *   immunity, after-hit status procs, end-turn heal and the like.
 *
 * The resolver and damage calculator never switch on ability names; they
 * ask the table. Adding an ability is an additive registration.
 */

#pragma once

#include "combatant_state.hpp"
#include <functional>
#include <unordered_map>

namespace clawcombat {

// ============================================================================
// TRIGGERS
// ============================================================================

enum class AbilityTrigger : uint8_t {
    BATTLE_START,
    DAMAGE_CALC,
    DAMAGE_TAKEN,
    STAB_CALC,
    BEFORE_HIT,
    AFTER_HIT,
    AFTER_HIT_RECEIVED,
    END_TURN,
    BEFORE_FAINT,
    SPEED_CALC,
    ACCURACY_CALC,
    STATUS_DAMAGE
};

inline const char* to_string(AbilityTrigger trigger) {
    switch (trigger) {
        case AbilityTrigger::BATTLE_START: return "battle_start";
        case AbilityTrigger::DAMAGE_CALC: return "damage_calc";
        case AbilityTrigger::DAMAGE_TAKEN: return "damage_taken";
        case AbilityTrigger::STAB_CALC: return "stab_calc";
        case AbilityTrigger::BEFORE_HIT: return "before_hit";
        case AbilityTrigger::AFTER_HIT: return "after_hit";
        case AbilityTrigger::AFTER_HIT_RECEIVED: return "after_hit_received";
        case AbilityTrigger::END_TURN: return "end_turn";
        case AbilityTrigger::BEFORE_FAINT: return "before_faint";
        case AbilityTrigger::SPEED_CALC: return "speed_calc";
        case AbilityTrigger::ACCURACY_CALC: return "accuracy_calc";
        case AbilityTrigger::STATUS_DAMAGE: return "status_damage";
        default: return "unknown";
    }
}

// ============================================================================
// HOOK TYPES
// ============================================================================

/**
 * Stat multiplier applied once at battle start (result floored).
 */
struct StartStatChange {
    StatKind stat = StatKind::ATTACK;
    double factor = 1.0;
    EffectTarget target = EffectTarget::SELF;
};

/**
 * Read-only view of one attack for damage hooks.
 */
struct HitContext {
    const CombatantState& attacker;
    const CombatantState& defender;
    const MoveDef& move;
};

// (owner name, opponent name) -> battle start message
using StartMessageCallback = std::function<std::string(
    const std::string&,
    const std::string&
)>;

// Damage multiplier from the ability owner's side of a hit
using DamageModCallback = std::function<double(const HitContext&)>;

// Adjusts the (already capped) type effectiveness of an incoming hit
using EffectivenessCallback = std::function<double(double)>;

// Priority bonus for the owner's move this turn
using PriorityCallback = std::function<int(const CombatantState&)>;

// ============================================================================
// ABILITY DEFINITION
// ============================================================================

struct AbilityDef {
    std::string name;
    ElementType type = ElementType::NEUTRAL;
    std::string description;
    AbilityTrigger trigger = AbilityTrigger::BATTLE_START;
    double proc_chance = 1.0;

    // battle_start
    std::vector<StartStatChange> start_changes;
    StartMessageCallback start_message;

    // damage_calc / damage_taken
    DamageModCallback damage_dealt_mod;      // owner attacking
    DamageModCallback damage_taken_mod;      // owner defending
    EffectivenessCallback adjust_effectiveness;
    double target_defense_mod = 1.0;         // owner attacking

    // stab_calc
    double stab_multiplier = 0.0;            // 0 = standard STAB

    // speed_calc
    PriorityCallback priority_bonus;

    // accuracy_calc
    double accuracy_mod = 1.0;

    // before_hit
    std::optional<ElementType> immune_type;
    double absorb_heal_fraction = 0.0;       // > 0: immune hit heals instead
    double dodge_chance = 0.0;               // damaging moves only

    // after_hit (owner attacking, target must be unstatused)
    StatusCondition on_hit_status = StatusCondition::NONE;
    std::string on_hit_verb;                 // "burned", "froze", ...

    // after_hit_received (owner defending)
    StatusCondition retaliate_status = StatusCondition::NONE;
    bool retaliate_physical_only = false;
    bool retaliate_stage_drop = false;

    // end_turn
    double end_turn_heal_fraction = 0.0;

    // status_damage / before_faint
    bool status_damage_immune = false;
    bool survive_lethal_once = false;
};

// ============================================================================
// ABILITY TABLE
// ============================================================================

/**
 * AbilityTable - Registry of abilities keyed by name.
 *
 * Built once; read-only afterwards. Lookups of unknown or empty names
 * return nullptr, which every caller treats as "no ability".
 */
class AbilityTable {
public:
    AbilityTable() = default;

    void register_ability(AbilityDef def);

    const AbilityDef* get(const std::string& name) const;

    bool has(const std::string& name) const { return get(name) != nullptr; }

    size_t size() const { return abilities_.size(); }

    /**
     * Names of all abilities owned by a type, in registration order.
     */
    std::vector<std::string> abilities_for_type(ElementType type) const;

    std::vector<std::string> get_all_names() const { return order_; }

    /**
     * Table with all standard abilities registered.
     */
    static const AbilityTable& standard();

private:
    std::unordered_map<std::string, AbilityDef> abilities_;
    std::vector<std::string> order_;
};

} // namespace clawcombat
