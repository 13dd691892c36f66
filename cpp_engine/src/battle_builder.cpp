/**
 * ClawCombat Battle Engine - Battle Builder Implementation
 */

#include "battle_builder.hpp"
#include "stat_scaling.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace clawcombat {

int64_t unix_now_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::string iso8601_utc(int64_t unix_ms) {
    std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
    int millis = static_cast<int>(unix_ms % 1000);
    std::tm tm = *std::gmtime(&seconds);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

BattleBuilder::BattleBuilder(const MoveDatabase& moves, const AbilityTable& abilities)
    : moves_(moves), abilities_(abilities) {}

CombatantState BattleBuilder::build_combatant(const AgentProfile& profile) const {
    CombatantState c;
    c.id = profile.id;
    c.name = profile.name.empty() ? "Unknown" : profile.name;
    c.type = profile.type;
    c.level = profile.level > 0 ? profile.level : 1;

    EvolutionTier tier = evolution_tier(c.level);
    c.evolution_tier = tier.tier;
    c.evolution_name = tier.name;

    // Nature: explicit pair wins over a named nature
    std::optional<StatKind> boost = profile.nature_boost;
    std::optional<StatKind> reduce = profile.nature_reduce;
    if (!boost && !reduce && !profile.nature_name.empty()) {
        if (const Nature* nature = find_nature(profile.nature_name)) {
            boost = nature->boost;
            reduce = nature->reduce;
        }
    }
    auto stat = [&](int base, int ev, StatKind kind) {
        return effective_stat(base, c.level, ev, nature_modifier(boost, reduce, kind));
    };

    c.max_hp = effective_hp(profile.base_hp, c.level, profile.ev_hp);
    c.current_hp = c.max_hp;

    c.effective_stats.hp = c.max_hp;
    c.effective_stats.attack = stat(profile.base_attack, profile.ev_attack, StatKind::ATTACK);
    c.effective_stats.defense = stat(profile.base_defense, profile.ev_defense, StatKind::DEFENSE);
    c.effective_stats.sp_atk = stat(profile.base_sp_atk, profile.ev_sp_atk, StatKind::SP_ATK);
    c.effective_stats.sp_def = stat(profile.base_sp_def, profile.ev_sp_def, StatKind::SP_DEF);
    c.effective_stats.speed = stat(profile.base_speed, profile.ev_speed, StatKind::SPEED);
    c.base_stats = c.effective_stats;

    c.ability = profile.ability;

    for (const auto& move_id : profile.moves) {
        if (c.moves.size() >= MoveDatabase::LOADOUT_SIZE) break;
        const MoveDef* move = moves_.get_move(move_id);
        if (!move || c.find_move(move->id)) continue;
        c.moves.emplace_back(*move);
    }

    if (c.moves.empty()) {
        for (const auto& move_id : moves_.default_loadout(c.type)) {
            if (const MoveDef* move = moves_.get_move(move_id)) {
                c.moves.emplace_back(*move);
            }
        }
    }

    return c;
}

std::vector<TurnEvent> BattleBuilder::apply_battle_start(BattleState& state, Side side) const {
    std::vector<TurnEvent> events;
    CombatantState& self = state.combatant(side);
    CombatantState& opponent = state.combatant(opponent_of(side));

    const AbilityDef* ability = abilities_.get(self.ability);
    if (!ability || ability->start_changes.empty()) {
        return events;
    }

    for (const auto& change : ability->start_changes) {
        CombatantState& target = change.target == EffectTarget::SELF ? self : opponent;
        int value = target.effective_stats.get(change.stat);
        target.effective_stats.set(change.stat, static_cast<int>(std::floor(value * change.factor)));
    }

    std::string message = ability->start_message
        ? ability->start_message(self.name, opponent.name)
        : self.name + "'s " + ability->name + " activated!";
    events.emplace_back(EventType::ABILITY, side, message);
    return events;
}

BattleState BattleBuilder::create_battle(const AgentProfile& profile_a,
                                         const AgentProfile& profile_b,
                                         const BattleID& battle_id,
                                         uint64_t seed,
                                         int64_t now_ms) const {
    BattleState state;
    state.id = battle_id;
    state.agent_a = build_combatant(profile_a);
    state.agent_b = build_combatant(profile_b);
    state.turn_number = 0;
    state.status = BattleStatus::ACTIVE;
    state.current_phase = BattlePhase::WAITING;
    state.rng_seed = seed;

    int64_t now = now_ms > 0 ? now_ms : unix_now_ms();
    state.started_at = iso8601_utc(now);
    state.last_turn_at_ms = now;

    for (Side side : {Side::A, Side::B}) {
        auto events = apply_battle_start(state, side);
        state.opening_events.insert(state.opening_events.end(), events.begin(), events.end());
    }

    return state;
}

} // namespace clawcombat
