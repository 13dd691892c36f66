/**
 * ClawCombat Battle Engine - Turn Resolver Implementation
 */

#include "turn_resolver.hpp"
#include "battle_rng.hpp"
#include "stat_scaling.hpp"
#include "type_chart.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <variant>

namespace clawcombat {

namespace {

TurnEvent& emit(TurnLog& log, EventType type, std::optional<Side> side, std::string message) {
    log.events.emplace_back(type, side, std::move(message));
    return log.events.back();
}

int fraction_of(int value, double fraction) {
    return std::max(1, static_cast<int>(std::floor(value * fraction)));
}

int percent_of(int value, int percent) {
    return std::max(1, static_cast<int>(std::floor(value * (percent / 100.0))));
}

// Primary statuses need a clean target; confusion only needs the target unconfused
bool can_inflict(const CombatantState& target, StatusCondition status) {
    if (status == StatusCondition::CONFUSION) return !target.confused;
    return !target.has_status();
}

void stage_event(TurnLog& log, Side side, const CombatantState& target,
                 StatKind stat, bool raised) {
    TurnEvent& e = emit(log, raised ? EventType::STAT_BOOST : EventType::STAT_DROP, side,
                        target.name + "'s " + stat_display_name(stat) + (raised ? " rose!" : " fell!"));
    e.stat = stat;
}

std::string inflict_message(const CombatantState& target, StatusCondition status) {
    return target.name + " was inflicted with " + to_string(status) + "!";
}

// Non-positive limits would let a battle run forever; fall back to the defaults
ResolverSettings checked_settings(ResolverSettings settings) {
    const ResolverSettings defaults;
    if (settings.max_battle_turns <= 0) {
        std::cerr << "[TurnResolver] max_battle_turns must be positive, using "
                  << defaults.max_battle_turns << std::endl;
        settings.max_battle_turns = defaults.max_battle_turns;
    }
    if (settings.max_consecutive_timeouts <= 0) {
        std::cerr << "[TurnResolver] max_consecutive_timeouts must be positive, using "
                  << defaults.max_consecutive_timeouts << std::endl;
        settings.max_consecutive_timeouts = defaults.max_consecutive_timeouts;
    }
    return settings;
}

/**
 * Everything a secondary effect may touch while one move resolves.
 */
struct EffectContext {
    BattleState& state;
    Side side;
    Side target;
    CombatantState& attacker;
    CombatantState& defender;
    TurnLog& log;
    BattleRng& rng;
    int damage_dealt = 0;
};

/**
 * Secondary effect of a damaging move that connected. Kinds that shape the
 * hit itself (priority, crit rate, OHKO, focus, power and defense
 * modifiers) are handled before damage and do nothing here.
 */
struct HitEffect {
    EffectContext& ctx;

    template <typename T>
    void operator()(const T&) const {}

    void operator()(const effects::Recoil& recoil) const {
        int amount = percent_of(ctx.damage_dealt, recoil.percent);
        ctx.attacker.take_damage(amount);
        TurnEvent& e = emit(ctx.log, EventType::RECOIL, ctx.side,
                            ctx.attacker.name + " took " + std::to_string(amount) + " recoil damage!");
        e.amount = amount;
        e.remaining_hp = ctx.attacker.current_hp;
    }

    void operator()(const effects::Drain& drain) const {
        int amount = percent_of(ctx.damage_dealt, drain.percent);
        ctx.attacker.heal(amount);
        TurnEvent& e = emit(ctx.log, EventType::DRAIN, ctx.side,
                            ctx.attacker.name + " drained " + std::to_string(amount) + " HP!");
        e.amount = amount;
        e.remaining_hp = ctx.attacker.current_hp;
    }

    void operator()(const effects::Heal& heal) const {
        int amount = percent_of(ctx.damage_dealt, heal.percent);
        ctx.attacker.heal(amount);
        TurnEvent& e = emit(ctx.log, EventType::HEAL, ctx.side,
                            ctx.attacker.name + " healed " + std::to_string(amount) + " HP!");
        e.amount = amount;
        e.remaining_hp = ctx.attacker.current_hp;
    }

    void operator()(const effects::Flinch& flinch) const {
        if (ctx.rng.percent(flinch.chance)) {
            ctx.defender.flinched = true;
            emit(ctx.log, EventType::FLINCH_APPLIED, ctx.target, ctx.defender.name + " flinched!");
        }
    }

    void operator()(const effects::InflictStatus& inflict) const {
        if (inflict.chance <= 0) return;
        if (inflict.target == EffectTarget::SELF && inflict.delay) {
            // Rampage moves confuse their user afterwards
            ctx.attacker.inflict(inflict.status);
            TurnEvent& e = emit(ctx.log, EventType::STATUS_INFLICT, ctx.side,
                                ctx.attacker.name + " became confused from the rampage!");
            e.status = inflict.status;
        } else if (ctx.rng.percent(inflict.chance) && can_inflict(ctx.defender, inflict.status)) {
            ctx.defender.inflict(inflict.status);
            TurnEvent& e = emit(ctx.log, EventType::STATUS_INFLICT, ctx.target,
                                inflict_message(ctx.defender, inflict.status));
            e.status = inflict.status;
        }
    }

    void operator()(const effects::StatDrop& drop) const {
        if (drop.target == EffectTarget::OPPONENT) {
            int chance = drop.chance ? drop.chance : 100;
            if (ctx.rng.percent(chance)) {
                ctx.defender.stages.adjust(drop.stat, -drop.stages);
                stage_event(ctx.log, ctx.target, ctx.defender, drop.stat, false);
            }
        } else {
            ctx.attacker.stages.adjust(drop.stat, -drop.stages);
            stage_event(ctx.log, ctx.side, ctx.attacker, drop.stat, false);
        }
    }

    void operator()(const effects::StatBoost& boost) const {
        if (boost.target == EffectTarget::SELF && boost.chance > 0 && ctx.rng.percent(boost.chance)) {
            ctx.attacker.stages.adjust(boost.stat, boost.stages);
            stage_event(ctx.log, ctx.side, ctx.attacker, boost.stat, true);
        }
    }
};

// Stage changes from a hit land after the on-hit abilities, everything else before
bool lands_after_abilities(const MoveEffect& effect) {
    return std::holds_alternative<effects::StatDrop>(effect) ||
           std::holds_alternative<effects::StatBoost>(effect);
}

/**
 * Effect of a status move.
 */
struct StatusMoveEffect {
    EffectContext& ctx;

    template <typename T>
    void operator()(const T&) const {}

    void operator()(const effects::StatBoost& boost) const {
        if (boost.target != EffectTarget::SELF || boost.chance != 0) return;
        ctx.attacker.stages.adjust(boost.stat, boost.stages);
        stage_event(ctx.log, ctx.side, ctx.attacker, boost.stat, true);
        if (boost.stat2) {
            ctx.attacker.stages.adjust(*boost.stat2, boost.stages2);
            stage_event(ctx.log, ctx.side, ctx.attacker, *boost.stat2, true);
        }
    }

    void operator()(const effects::StatDrop& drop) const {
        if (drop.target != EffectTarget::OPPONENT) return;
        int chance = drop.chance ? drop.chance : 100;
        if (ctx.rng.percent(chance)) {
            ctx.defender.stages.adjust(drop.stat, -drop.stages);
            stage_event(ctx.log, ctx.target, ctx.defender, drop.stat, false);
        }
    }

    void operator()(const effects::InflictStatus& inflict) const {
        Side victim_side = inflict.target == EffectTarget::SELF ? ctx.side : ctx.target;
        CombatantState& victim = ctx.state.combatant(victim_side);
        if (!can_inflict(victim, inflict.status)) {
            TurnEvent& e = emit(ctx.log, EventType::STATUS_FAIL, victim_side,
                                victim.name + " is already statused!");
            e.status = inflict.status;
            return;
        }
        int chance = inflict.chance ? inflict.chance : 100;
        if (ctx.rng.percent(chance)) {
            victim.inflict(inflict.status);
            TurnEvent& e = emit(ctx.log, EventType::STATUS_INFLICT, victim_side,
                                inflict_message(victim, inflict.status));
            e.status = inflict.status;
        }
    }

    void operator()(const effects::Heal& heal) const {
        if (heal.delay) {
            ctx.attacker.wish_pending = true;
            ctx.attacker.wish_turn = ctx.state.turn_number + 1;
            emit(ctx.log, EventType::WISH, ctx.side, ctx.attacker.name + " made a wish!");
            return;
        }
        int amount = percent_of(ctx.attacker.max_hp, heal.percent);
        ctx.attacker.heal(amount);
        TurnEvent& e = emit(ctx.log, EventType::HEAL, ctx.side,
                            ctx.attacker.name + " healed " + std::to_string(amount) + " HP!");
        e.amount = amount;
        e.remaining_hp = ctx.attacker.current_hp;
    }

    void operator()(const effects::LeechSeed&) const {
        if (ctx.defender.leech_seeded) {
            emit(ctx.log, EventType::LEECH_SEED_FAIL, ctx.target, ctx.defender.name + " is already seeded!");
            return;
        }
        ctx.defender.leech_seeded = true;
        emit(ctx.log, EventType::LEECH_SEED, ctx.target, ctx.defender.name + " was seeded!");
    }

    void operator()(const effects::Curse&) const {
        int sacrifice = fraction_of(ctx.attacker.max_hp, TurnResolver::SELF_SACRIFICE_FRACTION);
        ctx.attacker.take_damage(sacrifice);
        ctx.defender.cursed = true;
        TurnEvent& e = emit(ctx.log, EventType::CURSE, ctx.target,
                            ctx.attacker.name + " cut its HP and cursed " + ctx.defender.name + "!");
        e.amount = sacrifice;
        e.remaining_hp = ctx.attacker.current_hp;
    }

    void operator()(const effects::ResetStats&) const {
        ctx.state.agent_a.stages.reset();
        ctx.state.agent_b.stages.reset();
        emit(ctx.log, EventType::RESET_STATS, std::nullopt, "All stat changes were reset!");
    }
};

} // anonymous namespace

TurnResolver::TurnResolver(ResolverSettings settings,
                           const StatusTable& statuses,
                           const AbilityTable& abilities)
    : settings_(checked_settings(settings)),
      statuses_(statuses),
      abilities_(abilities),
      damage_(abilities, statuses) {}

// ============================================================================
// TURN ORDER
// ============================================================================

int TurnResolver::move_priority(const CombatantState& combatant, const MoveID& move_id) const {
    int priority = 0;
    if (const MoveSlot* slot = combatant.find_move(move_id)) {
        priority = slot->move.effective_priority();
    }
    const AbilityDef* ability = abilities_.get(combatant.ability);
    if (ability && ability->priority_bonus) {
        priority += ability->priority_bonus(combatant);
    }
    return priority;
}

double TurnResolver::effective_speed(const CombatantState& combatant) const {
    return combatant.staged_stat(StatKind::SPEED) * statuses_.speed_modifier(combatant);
}

Side TurnResolver::determine_first(const BattleState& state,
                                   const MoveID& move_a,
                                   const MoveID& move_b,
                                   BattleRng& rng) const {
    const CombatantState& a = state.agent_a;
    const CombatantState& b = state.agent_b;

    int priority_a = move_priority(a, move_a);
    int priority_b = move_priority(b, move_b);
    if (priority_a != priority_b) {
        return priority_a > priority_b ? Side::A : Side::B;
    }

    double speed_a = effective_speed(a);
    double speed_b = effective_speed(b);
    if (speed_a != speed_b) {
        return speed_a > speed_b ? Side::A : Side::B;
    }

    // Speed tie: higher level, then higher unmodified speed, then a coin flip
    if (a.level != b.level) {
        return a.level > b.level ? Side::A : Side::B;
    }
    if (a.effective_stats.speed != b.effective_stats.speed) {
        return a.effective_stats.speed > b.effective_stats.speed ? Side::A : Side::B;
    }
    return rng.uniform() < 0.5 ? Side::B : Side::A;
}

// ============================================================================
// TURN RESOLUTION
// ============================================================================

TurnResult TurnResolver::resolve_turn(BattleState& state,
                                      const std::optional<MoveID>& move_a,
                                      const std::optional<MoveID>& move_b,
                                      BattleRng& rng) const {
    TurnResult result;
    if (state.is_finished()) {
        result.error = StateError::BATTLE_FINISHED;
        return result;
    }
    result.ok = true;

    state.turn_number++;
    TurnLog& log = result.log;
    log.turn_number = state.turn_number;
    log.move_a = move_a;
    log.move_b = move_b;

    state.agent_a.reset_turn_flags();
    state.agent_b.reset_turn_flags();
    state.first_side.reset();

    // Timeout bookkeeping
    for (Side side : {Side::A, Side::B}) {
        CombatantState& c = state.combatant(side);
        const auto& move = side == Side::A ? move_a : move_b;
        if (move) {
            c.consecutive_timeouts = 0;
        } else {
            c.consecutive_timeouts++;
            emit(log, EventType::TIMEOUT, side, c.name + " failed to respond and skipped the turn");
        }
    }
    for (Side side : {Side::A, Side::B}) {
        if (state.combatant(side).consecutive_timeouts >= settings_.max_consecutive_timeouts) {
            finish(state, opponent_of(side), EndReason::FORFEIT_TIMEOUT, log);
            close_log(state, log);
            return result;
        }
    }

    // Order the acting sides
    std::vector<Side> order;
    if (move_a && move_b) {
        Side first = determine_first(state, *move_a, *move_b, rng);
        order = {first, opponent_of(first)};
    } else if (move_a) {
        order = {Side::A};
    } else if (move_b) {
        order = {Side::B};
    }
    if (!order.empty()) {
        state.first_side = order.front();
        log.first_side = order.front();
    }

    for (Side side : order) {
        const MoveID& move_id = side == Side::A ? *move_a : *move_b;
        act(state, side, move_id, log, rng);
        if (check_battle_end(state, log)) {
            close_log(state, log);
            return result;
        }
    }

    // End of turn
    apply_end_of_turn(state, Side::A, log);
    apply_end_of_turn(state, Side::B, log);
    apply_end_turn_ability(state, Side::A, log);
    apply_end_turn_ability(state, Side::B, log);

    if (!check_battle_end(state, log)) {
        check_turn_cap(state, log);
    }

    close_log(state, log);
    return result;
}

TurnResult TurnResolver::surrender(BattleState& state, Side side) const {
    TurnResult result;
    if (state.is_finished()) {
        result.error = StateError::BATTLE_FINISHED;
        return result;
    }
    result.ok = true;

    state.turn_number++;
    result.log.turn_number = state.turn_number;
    emit(result.log, EventType::STATUS, side, state.combatant(side).name + " surrendered!");
    finish(state, opponent_of(side), EndReason::SURRENDER, result.log);
    close_log(state, result.log);
    return result;
}

void TurnResolver::close_log(BattleState& state, TurnLog& log) const {
    log.agent_a_hp = state.agent_a.current_hp;
    log.agent_b_hp = state.agent_b.current_hp;
    state.turns.push_back(log);
}

// ============================================================================
// ACTIONS
// ============================================================================

void TurnResolver::act(BattleState& state, Side side, const MoveID& move_id,
                       TurnLog& log, BattleRng& rng) const {
    CombatantState& attacker = state.combatant(side);
    CombatantState& defender = state.combatant(opponent_of(side));

    // Validation - nothing is mutated on failure
    MoveSlot* slot = attacker.find_move(move_id);
    if (!slot) {
        TurnEvent& e = emit(log, EventType::ERROR, side, attacker.name + " tried to use an unknown move!");
        e.move_id = move_id;
        e.failure = MoveFailure::UNKNOWN_MOVE;
        return;
    }
    if (slot->current_pp <= 0) {
        TurnEvent& e = emit(log, EventType::ERROR, side,
                            attacker.name + " has no PP left for " + slot->move.name + "!");
        e.move_id = move_id;
        e.failure = MoveFailure::NO_PP;
        return;
    }

    slot->current_pp--;
    const MoveDef& move = slot->move;
    {
        TurnEvent& e = emit(log, EventType::USE_MOVE, side, attacker.name + " used " + move.name + "!");
        e.move_id = move.id;
    }

    if (!run_gates(attacker, side, log, rng)) return;
    if (!run_before_hit(defender, side, move, log, rng)) return;

    // Accuracy
    double accuracy = move.accuracy;
    if (const AbilityDef* ability = abilities_.get(attacker.ability)) {
        accuracy = std::min(100.0, accuracy * ability->accuracy_mod);
    }
    if (rng.uniform() * 100.0 > accuracy) {
        emit(log, EventType::MISS, side, attacker.name + "'s attack missed!");
        return;
    }

    // Focus moves fail once the user has been hit this turn
    if (const auto* focus = move.effect_as<effects::Focus>()) {
        if (focus->fail_if_hit && attacker.took_damage_this_turn) {
            emit(log, EventType::FOCUS_FAIL, side,
                 attacker.name + " lost focus and couldn't use " + move.name + "!");
            return;
        }
    }

    if (move.effect_as<effects::OneHitKO>()) {
        const AbilityDef* def_ability = abilities_.get(defender.ability);
        Side target = opponent_of(side);
        if (def_ability && def_ability->survive_lethal_once && !defender.sturdy_used) {
            defender.current_hp = 1;
            defender.sturdy_used = true;
            emit(log, EventType::OHKO, target,
                 move.name + " would have KO'd, but " + defender.name + " held on with " + def_ability->name + "!");
        } else {
            defender.current_hp = 0;
            emit(log, EventType::OHKO, target, move.name + " is a one-hit KO!");
        }
        return;
    }

    if (move.is_damaging()) {
        apply_damaging_move(state, side, move, log, rng);
    } else {
        apply_status_move(state, side, move, log, rng);
    }
}

bool TurnResolver::run_gates(CombatantState& attacker, Side side, TurnLog& log, BattleRng& rng) const {
    if (attacker.flinched) {
        attacker.flinched = false;
        emit(log, EventType::FLINCH, side, attacker.name + " flinched and couldn't move!");
        return false;
    }

    // Primary status
    if (attacker.status == StatusCondition::FREEZE) attacker.freeze_turns++;
    if (attacker.status == StatusCondition::SLEEP) attacker.sleep_turns++;

    const StatusEffectDef* status_def = statuses_.get(attacker.status);
    if (status_def && status_def->on_before_move) {
        StatusCondition status = attacker.status;
        BeforeMoveResult r = status_def->on_before_move(attacker, rng);
        if (!r.message.empty()) {
            TurnEvent& e = emit(log, EventType::STATUS, side, r.message);
            e.status = status;
        }
        if (r.thaw || r.wake) {
            attacker.clear_status();
        }
        if (r.cant_move) return false;
    }

    // Volatile confusion
    if (attacker.confused) {
        attacker.confusion_turns++;
        const StatusEffectDef* confusion = statuses_.get(StatusCondition::CONFUSION);
        if (confusion && confusion->on_before_move) {
            BeforeMoveResult r = confusion->on_before_move(attacker, rng);
            if (r.snap_out) {
                attacker.confused = false;
                attacker.confusion_turns = 0;
                TurnEvent& e = emit(log, EventType::STATUS, side, r.message);
                e.status = StatusCondition::CONFUSION;
            } else if (r.self_hit) {
                int lost = attacker.take_damage(r.damage);
                TurnEvent& e = emit(log, EventType::CONFUSION_SELF_HIT, side, r.message);
                e.amount = lost;
                e.remaining_hp = attacker.current_hp;
                e.status = StatusCondition::CONFUSION;
                return false;
            }
        }
    }

    return true;
}

bool TurnResolver::run_before_hit(CombatantState& defender, Side side, const MoveDef& move,
                                  TurnLog& log, BattleRng& rng) const {
    const AbilityDef* ability = abilities_.get(defender.ability);
    if (!ability) return true;
    Side target = opponent_of(side);

    if (ability->dodge_chance > 0.0 && move.is_damaging()) {
        if (rng.chance(ability->dodge_chance)) {
            emit(log, EventType::DODGE, target,
                 defender.name + "'s " + ability->name + " allowed it to dodge the attack!");
            return false;
        }
    }

    if (ability->immune_type && move.type == *ability->immune_type) {
        if (ability->absorb_heal_fraction > 0.0) {
            int heal = static_cast<int>(std::floor(defender.max_hp * ability->absorb_heal_fraction));
            defender.heal(heal);
            TurnEvent& e = emit(log, EventType::ABILITY, target,
                                defender.name + "'s " + ability->name + " absorbed the " +
                                move.name + " and healed " + std::to_string(heal) + " HP!");
            e.amount = heal;
            e.remaining_hp = defender.current_hp;
        } else {
            emit(log, EventType::IMMUNE, target,
                 defender.name + " is immune to " + to_string(move.type) + " moves!");
        }
        return false;
    }

    return true;
}

void TurnResolver::apply_damaging_move(BattleState& state, Side side, const MoveDef& move,
                                       TurnLog& log, BattleRng& rng) const {
    CombatantState& attacker = state.combatant(side);
    CombatantState& defender = state.combatant(opponent_of(side));
    Side target = opponent_of(side);

    DamageResult result = damage_.calculate(attacker, defender, move, rng);
    if (result.immune) {
        TurnEvent& e = emit(log, EventType::IMMUNE, target, "It has no effect on " + defender.name + "!");
        e.effectiveness = 0.0;
        e.move_id = move.id;
        return;
    }

    int dmg = result.damage;

    // Survive a lethal hit from full HP once
    const AbilityDef* def_ability = abilities_.get(defender.ability);
    if (def_ability && def_ability->survive_lethal_once && !defender.sturdy_used &&
        defender.at_full_hp() && defender.current_hp - dmg <= 0) {
        dmg = defender.current_hp - 1;
        defender.sturdy_used = true;
        emit(log, EventType::ABILITY, target,
             defender.name + "'s " + def_ability->name + " let it survive with 1 HP!");
    }

    defender.take_damage(dmg);
    defender.took_damage_this_turn = true;

    if (defender.status == StatusCondition::SLEEP && dmg > 0) {
        defender.woke_from_damage = true;
        TurnEvent& e = emit(log, EventType::STATUS, target, defender.name + " was hit and woke up!");
        e.status = StatusCondition::SLEEP;
    }

    {
        std::string message = move.name + " dealt " + std::to_string(dmg) + " damage!";
        if (result.critical) message += " Critical hit!";
        if (is_super_effective(result.chart_effectiveness)) {
            message += " It's super effective!";
        } else if (is_not_very_effective(result.chart_effectiveness)) {
            message += " It's not very effective...";
        }
        TurnEvent& e = emit(log, EventType::DAMAGE, target, message);
        e.amount = dmg;
        e.remaining_hp = defender.current_hp;
        e.critical = result.critical;
        e.effectiveness = result.chart_effectiveness;
        e.move_id = move.id;
    }

    EffectContext ctx{state, side, target, attacker, defender, log, rng, dmg};
    bool late = lands_after_abilities(move.effect);
    if (!late) std::visit(HitEffect{ctx}, move.effect);
    apply_after_hit_abilities(attacker, defender, side, move, log, rng);
    if (late) std::visit(HitEffect{ctx}, move.effect);
}

void TurnResolver::apply_after_hit_abilities(CombatantState& attacker, CombatantState& defender,
                                             Side side, const MoveDef& move,
                                             TurnLog& log, BattleRng& rng) const {
    Side target = opponent_of(side);

    // Attacker's on-hit status proc
    const AbilityDef* atk_ability = abilities_.get(attacker.ability);
    if (atk_ability && atk_ability->on_hit_status != StatusCondition::NONE && !defender.has_status()) {
        if (rng.chance(atk_ability->proc_chance)) {
            defender.inflict(atk_ability->on_hit_status);
            TurnEvent& e = emit(log, EventType::ABILITY, target,
                                attacker.name + "'s " + atk_ability->name + " " +
                                atk_ability->on_hit_verb + " " + defender.name + "!");
            e.status = atk_ability->on_hit_status;
        }
    }

    // Defender's retaliation
    const AbilityDef* def_ability = abilities_.get(defender.ability);
    if (!def_ability) return;

    if (def_ability->retaliate_status != StatusCondition::NONE &&
        (!def_ability->retaliate_physical_only || move.is_physical()) &&
        !attacker.has_status()) {
        if (rng.chance(def_ability->proc_chance)) {
            attacker.inflict(def_ability->retaliate_status);
            TurnEvent& e = emit(log, EventType::ABILITY, side,
                                defender.name + "'s " + def_ability->name + " " +
                                def_ability->on_hit_verb + " " + attacker.name + "!");
            e.status = def_ability->retaliate_status;
        }
    }

    if (def_ability->retaliate_stage_drop) {
        if (rng.chance(def_ability->proc_chance)) {
            StatKind stat = attacker.highest_stage();
            attacker.stages.adjust(stat, -1);
            TurnEvent& e = emit(log, EventType::ABILITY, side,
                                defender.name + "'s " + def_ability->name + " lowered " +
                                attacker.name + "'s " + stat_display_name(stat) + "!");
            e.stat = stat;
        }
    }
}

void TurnResolver::apply_status_move(BattleState& state, Side side, const MoveDef& move,
                                     TurnLog& log, BattleRng& rng) const {
    Side target = opponent_of(side);
    EffectContext ctx{state, side, target, state.combatant(side), state.combatant(target), log, rng};
    std::visit(StatusMoveEffect{ctx}, move.effect);
}

// ============================================================================
// END OF TURN
// ============================================================================

void TurnResolver::apply_end_of_turn(BattleState& state, Side side, TurnLog& log) const {
    CombatantState& c = state.combatant(side);
    CombatantState& opponent = state.combatant(opponent_of(side));
    const AbilityDef* ability = abilities_.get(c.ability);
    bool immune = ability && ability->status_damage_immune;

    if (!immune) {
        const StatusEffectDef* status_def = statuses_.get(c.status);
        if (status_def && status_def->on_turn_end) {
            StatusCondition status = c.status;
            TurnEndResult r = status_def->on_turn_end(c);
            c.take_damage(r.damage);
            EventType type = status == StatusCondition::BURNED ? EventType::BURN_DAMAGE
                                                               : EventType::POISON_DAMAGE;
            TurnEvent& e = emit(log, type, side, r.message);
            e.amount = r.damage;
            e.remaining_hp = c.current_hp;
            e.status = status;
        }

        if (c.leech_seeded) {
            int dmg = fraction_of(c.max_hp, LEECH_SEED_FRACTION);
            c.take_damage(dmg);
            opponent.heal(dmg);
            TurnEvent& e = emit(log, EventType::LEECH_SEED, side,
                                "Leech Seed sapped " + std::to_string(dmg) + " HP from " + c.name + "!");
            e.amount = dmg;
            e.remaining_hp = c.current_hp;
        }

        if (c.cursed) {
            int dmg = fraction_of(c.max_hp, CURSE_DAMAGE_FRACTION);
            c.take_damage(dmg);
            TurnEvent& e = emit(log, EventType::CURSE_DAMAGE, side,
                                c.name + " is hurt by the curse! (-" + std::to_string(dmg) + " HP)");
            e.amount = dmg;
            e.remaining_hp = c.current_hp;
        }
    }

    if (c.wish_pending && state.turn_number >= c.wish_turn) {
        int heal = static_cast<int>(std::floor(c.max_hp * WISH_HEAL_FRACTION));
        c.heal(heal);
        c.wish_pending = false;
        TurnEvent& e = emit(log, EventType::WISH_HEAL, side,
                            c.name + "'s wish came true! Healed " + std::to_string(heal) + " HP!");
        e.amount = heal;
        e.remaining_hp = c.current_hp;
    }
}

void TurnResolver::apply_end_turn_ability(BattleState& state, Side side, TurnLog& log) const {
    CombatantState& c = state.combatant(side);
    const AbilityDef* ability = abilities_.get(c.ability);
    if (!ability || ability->end_turn_heal_fraction <= 0.0 || c.is_fainted()) return;

    int restored = c.heal(fraction_of(c.max_hp, ability->end_turn_heal_fraction));
    if (restored > 0) {
        TurnEvent& e = emit(log, EventType::ABILITY, side,
                            c.name + "'s " + ability->name + " restored " + std::to_string(restored) + " HP!");
        e.amount = restored;
        e.remaining_hp = c.current_hp;
    }
}

// ============================================================================
// BATTLE END
// ============================================================================

bool TurnResolver::check_battle_end(BattleState& state, TurnLog& log) const {
    bool a_down = state.agent_a.is_fainted();
    bool b_down = state.agent_b.is_fainted();
    if (!a_down && !b_down) return false;

    Side winner;
    if (a_down && b_down) {
        // Double faint: the side that acted first survives
        if (state.first_side) {
            winner = *state.first_side;
        } else {
            winner = effective_speed(state.agent_b) > effective_speed(state.agent_a) ? Side::B : Side::A;
        }
    } else {
        winner = a_down ? Side::B : Side::A;
    }

    finish(state, winner, EndReason::FAINT, log);
    return true;
}

bool TurnResolver::check_turn_cap(BattleState& state, TurnLog& log) const {
    if (state.turn_number < settings_.max_battle_turns) {
        return false;
    }
    double ratio_a = state.agent_a.hp_ratio();
    double ratio_b = state.agent_b.hp_ratio();
    finish(state, ratio_b > ratio_a ? Side::B : Side::A, EndReason::TURN_LIMIT, log);
    return true;
}

void TurnResolver::finish(BattleState& state, Side winner, EndReason reason, TurnLog& log) const {
    const CombatantState& w = state.combatant(winner);
    state.status = BattleStatus::FINISHED;
    state.current_phase = BattlePhase::FINISHED;
    state.winner_id = w.id;
    state.end_reason = reason;
    state.pending_move_a.reset();
    state.pending_move_b.reset();

    TurnEvent& e = emit(log, EventType::BATTLE_END, winner, w.name + " wins!");
    e.winner_id = w.id;
    e.reason = reason;
}

} // namespace clawcombat
