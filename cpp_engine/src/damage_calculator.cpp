/**
 * ClawCombat Battle Engine - Damage Calculator Implementation
 */

#include "damage_calculator.hpp"
#include "battle_rng.hpp"
#include "stat_scaling.hpp"
#include "type_chart.hpp"
#include <algorithm>
#include <cmath>

namespace clawcombat {

DamageCalculator::DamageCalculator(const AbilityTable& abilities, const StatusTable& statuses)
    : abilities_(abilities), statuses_(statuses) {}

DamageResult DamageCalculator::calculate(const CombatantState& attacker,
                                         const CombatantState& defender,
                                         const MoveDef& move,
                                         BattleRng& rng) const {
    DamageResult result;
    if (!move.is_damaging()) {
        return result;
    }

    result.chart_effectiveness = effectiveness(move.type, defender.type);
    if (is_immune(result.chart_effectiveness)) {
        result.immune = true;
        result.type_effectiveness = 0.0;
        return result;
    }

    const AbilityDef* atk_ability = abilities_.get(attacker.ability);
    const AbilityDef* def_ability = abilities_.get(defender.ability);

    // Stats
    bool physical = move.is_physical();
    bool uses_physical_def = physical || move.effect_as<effects::UsePhysicalDef>() != nullptr;
    StatKind atk_kind = physical ? StatKind::ATTACK : StatKind::SP_ATK;
    StatKind def_kind = uses_physical_def ? StatKind::DEFENSE : StatKind::SP_DEF;

    // Critical roll first
    double crit_chance = BASE_CRIT_CHANCE;
    if (const auto* high_crit = move.effect_as<effects::HighCrit>()) {
        crit_chance = high_crit->crit_rate / 100.0;
    }
    result.critical = rng.chance(crit_chance);

    double atk_mod = stat_stage_multiplier(attacker.stages.get(atk_kind));
    double def_mod = stat_stage_multiplier(defender.stages.get(def_kind));
    if (result.critical) {
        atk_mod = std::max(1.0, atk_mod);
        def_mod = std::min(1.0, def_mod);
    }

    double corrosion = atk_ability ? atk_ability->target_defense_mod : 1.0;
    double atk = attacker.effective_stats.get(atk_kind) * atk_mod;
    double def = defender.effective_stats.get(def_kind) * def_mod * corrosion;

    int power = effective_move_power(move.power, attacker.level);
    double base = (atk / std::max(1.0, def)) * power * DAMAGE_SCALE;

    // STAB
    double stab = 1.0;
    if (move.type == attacker.type) {
        stab = STAB;
        if (atk_ability && atk_ability->stab_multiplier > 0.0) {
            stab = atk_ability->stab_multiplier;
        }
    }

    // Type effectiveness, capped then adjusted by the defender
    double type_eff = std::min(result.chart_effectiveness, TYPE_EFFECTIVENESS_CAP);
    if (def_ability && def_ability->adjust_effectiveness) {
        type_eff = def_ability->adjust_effectiveness(type_eff);
    }
    result.type_effectiveness = type_eff;

    // Ability multipliers
    HitContext hit{attacker, defender, move};
    if (atk_ability && atk_ability->damage_dealt_mod) {
        base *= atk_ability->damage_dealt_mod(hit);
    }
    if (def_ability && def_ability->damage_taken_mod) {
        base *= def_ability->damage_taken_mod(hit);
    }

    // Move multipliers
    if (move.effect_as<effects::HpScaling>()) {
        base *= std::max(HP_SCALING_FLOOR, attacker.hp_ratio());
    }
    if (move.effect_as<effects::DoubleIfPoisoned>() && defender.status == StatusCondition::POISON) {
        base *= 2.0;
    }

    double crit = result.critical ? CRIT_MULTIPLIER : 1.0;
    double random = RANDOM_MIN + rng.uniform() * RANDOM_SPAN;
    double burn = statuses_.attack_modifier(attacker, move);

    result.damage = std::max(1, static_cast<int>(std::floor(base * stab * type_eff * crit * random * burn)));
    return result;
}

} // namespace clawcombat
