/**
 * ClawCombat Battle Engine - Status Table Implementation
 */

#include "status_table.hpp"
#include "battle_rng.hpp"
#include <algorithm>
#include <cmath>

namespace clawcombat {

namespace {

int fraction_of_max_hp(const CombatantState& c, double fraction) {
    return std::max(1, static_cast<int>(std::floor(c.max_hp * fraction)));
}

StatusEffectDef make_burn() {
    StatusEffectDef def;
    def.condition = StatusCondition::BURNED;
    def.name = "Burn";
    def.on_turn_end = [](const CombatantState& c) {
        TurnEndResult r;
        r.damage = fraction_of_max_hp(c, StatusTable::BURN_DAMAGE_FRACTION);
        r.message = c.name + " is hurt by its burn! (-" + std::to_string(r.damage) + " HP)";
        return r;
    };
    def.on_attack = [](const CombatantState&, const MoveDef& move) {
        AttackModifier mod;
        if (move.is_physical()) mod.damage_mod = StatusTable::BURN_ATTACK_MOD;
        return mod;
    };
    return def;
}

StatusEffectDef make_paralysis() {
    StatusEffectDef def;
    def.condition = StatusCondition::PARALYSIS;
    def.name = "Paralysis";
    def.speed_mod = StatusTable::PARALYSIS_SPEED_MOD;
    def.on_before_move = [](const CombatantState& c, BattleRng& rng) {
        BeforeMoveResult r;
        if (rng.chance(StatusTable::PARALYSIS_SKIP_CHANCE)) {
            r.cant_move = true;
            r.message = c.name + " is fully paralyzed and can't move!";
        }
        return r;
    };
    return def;
}

StatusEffectDef make_poison() {
    StatusEffectDef def;
    def.condition = StatusCondition::POISON;
    def.name = "Poison";
    def.on_turn_end = [](const CombatantState& c) {
        TurnEndResult r;
        r.damage = fraction_of_max_hp(c, StatusTable::POISON_DAMAGE_FRACTION);
        r.message = c.name + " is hurt by poison! (-" + std::to_string(r.damage) + " HP)";
        return r;
    };
    return def;
}

// freeze_turns counts move attempts under freeze, including the current one
StatusEffectDef make_freeze() {
    StatusEffectDef def;
    def.condition = StatusCondition::FREEZE;
    def.name = "Freeze";
    def.on_before_move = [](const CombatantState& c, BattleRng&) {
        BeforeMoveResult r;
        if (c.freeze_turns > StatusTable::FREEZE_TURNS) {
            r.thaw = true;
            r.message = c.name + " thawed out!";
        } else {
            r.cant_move = true;
            r.message = c.name + " is frozen solid!";
        }
        return r;
    };
    return def;
}

// sleep_turns counts move attempts under sleep, including the current one
StatusEffectDef make_sleep() {
    StatusEffectDef def;
    def.condition = StatusCondition::SLEEP;
    def.name = "Sleep";
    def.on_before_move = [](const CombatantState& c, BattleRng&) {
        BeforeMoveResult r;
        if (c.sleep_turns > StatusTable::SLEEP_TURNS || c.woke_from_damage) {
            r.wake = true;
            r.message = c.name + " woke up!";
        } else {
            r.cant_move = true;
            r.message = c.name + " is fast asleep!";
        }
        return r;
    };
    return def;
}

StatusEffectDef make_confusion() {
    StatusEffectDef def;
    def.condition = StatusCondition::CONFUSION;
    def.name = "Confusion";
    def.on_before_move = [](const CombatantState& c, BattleRng& rng) {
        BeforeMoveResult r;
        if (c.confusion_turns >= StatusTable::CONFUSION_MAX_TURNS) {
            r.snap_out = true;
            r.message = c.name + " snapped out of confusion!";
            return r;
        }
        if (rng.chance(StatusTable::CONFUSION_SELF_HIT_CHANCE)) {
            r.self_hit = true;
            r.cant_move = true;
            r.damage = fraction_of_max_hp(c, StatusTable::CONFUSION_SELF_HIT_FRACTION);
            r.message = c.name + " hurt itself in confusion! (" + std::to_string(r.damage) + " damage)";
        }
        return r;
    };
    return def;
}

} // namespace

void StatusTable::register_status(StatusEffectDef def) {
    StatusCondition key = def.condition;
    entries_[key] = std::move(def);
}

const StatusEffectDef* StatusTable::get(StatusCondition condition) const {
    auto it = entries_.find(condition);
    if (it != entries_.end()) {
        return &it->second;
    }
    return nullptr;
}

double StatusTable::speed_modifier(const CombatantState& combatant) const {
    const StatusEffectDef* def = get(combatant.status);
    return def ? def->speed_mod : 1.0;
}

double StatusTable::attack_modifier(const CombatantState& attacker, const MoveDef& move) const {
    const StatusEffectDef* def = get(attacker.status);
    if (!def || !def->on_attack) return 1.0;
    return def->on_attack(attacker, move).damage_mod;
}

const StatusTable& StatusTable::standard() {
    static const StatusTable table = [] {
        StatusTable t;
        t.register_status(make_burn());
        t.register_status(make_paralysis());
        t.register_status(make_poison());
        t.register_status(make_freeze());
        t.register_status(make_sleep());
        t.register_status(make_confusion());
        return t;
    }();
    return table;
}

} // namespace clawcombat
