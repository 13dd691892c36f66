/**
 * ClawCombat Battle Engine - AI Move Strategist Implementation
 */

#include "ai_strategist.hpp"
#include "battle_rng.hpp"
#include "type_chart.hpp"
#include <algorithm>
#include <cmath>

namespace clawcombat {

namespace {

// Stats of 0 are treated as an average stat
constexpr int FALLBACK_STAT = 50;

int stat_or_fallback(int value) {
    return value > 0 ? value : FALLBACK_STAT;
}

} // namespace

AIStrategist::AIStrategist(Difficulty difficulty, EffectivenessFn chart)
    : difficulty_(difficulty),
      chart_(chart ? std::move(chart)
                   : EffectivenessFn([](ElementType a, ElementType d) { return effectiveness(a, d); })) {}

double AIStrategist::cached_effectiveness(ElementType move_type, ElementType defender_type) const {
    auto key = std::make_pair(move_type, defender_type);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }
    double value = chart_(move_type, defender_type);
    cache_.emplace(key, value);
    return value;
}

int AIStrategist::estimate_damage(const CombatantState& attacker,
                                  const CombatantState& defender,
                                  const MoveDef& move,
                                  double effectiveness) {
    if (move.power <= 0) return 0;

    int atk = stat_or_fallback(move.is_physical() ? attacker.effective_stats.attack
                                                  : attacker.effective_stats.sp_atk);
    int def = stat_or_fallback(move.is_physical() ? defender.effective_stats.defense
                                                  : defender.effective_stats.sp_def);

    double damage = move.power * (static_cast<double>(atk) / std::max(1, def)) * effectiveness * 0.5;
    return std::max(1, static_cast<int>(std::floor(damage)));
}

double AIStrategist::evaluate_move(const CombatantState& attacker,
                                   const CombatantState& defender,
                                   const MoveDef& move) const {
    double score = SCORE_BASE;

    double eff = cached_effectiveness(move.type, defender.type);
    if (is_super_effective(eff)) {
        score += SCORE_SUPER_EFFECTIVE;
    } else if (is_immune(eff)) {
        score += SCORE_IMMUNE;
    } else if (is_not_very_effective(eff)) {
        score += SCORE_NOT_VERY_EFFECTIVE;
    }

    int estimate = estimate_damage(attacker, defender, move, eff);

    if (estimate > 0 && estimate >= defender.current_hp) {
        score += SCORE_KILL_SHOT;
    }

    if (estimate > 0 && estimate >= defender.max_hp * 0.5) {
        score += SCORE_SIGNIFICANT_DAMAGE;
    }

    double attacker_ratio = attacker.hp_ratio();
    if (attacker.max_hp > 0 && attacker_ratio < LOW_HP_THRESHOLD && estimate > 0) {
        score += SCORE_LOW_HP_AGGRESSION;
    }

    if (const auto* inflict = move.effect_as<effects::InflictStatus>()) {
        if (inflict->status != StatusCondition::NONE && !defender.has_status()) {
            score += SCORE_STATUS_VALUE;
        }
    }

    if (move.effect_as<effects::Heal>()) {
        if (attacker.max_hp > 0 && attacker_ratio < HEAL_HP_THRESHOLD) {
            score += SCORE_HEALING_VALUE;
        }
    }

    int accuracy = move.accuracy > 0 ? move.accuracy : 100;
    score -= (100 - accuracy) / 5.0;

    return std::max(0.0, std::min(100.0, score));
}

std::vector<ScoredMove> AIStrategist::rank_moves(const CombatantState& attacker,
                                                 const CombatantState& defender) const {
    std::vector<ScoredMove> ranked;
    ranked.reserve(attacker.moves.size());
    for (const auto& slot : attacker.moves) {
        ranked.push_back({slot.move.id, slot.move.name, evaluate_move(attacker, defender, slot.move)});
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const ScoredMove& a, const ScoredMove& b) {
        return a.score > b.score;
    });
    return ranked;
}

MoveID AIStrategist::choose(const CombatantState& attacker,
                            const CombatantState& defender,
                            BattleRng& rng) const {
    std::vector<const MoveSlot*> usable;
    for (const auto& slot : attacker.moves) {
        if (slot.current_pp > 0) usable.push_back(&slot);
    }

    if (usable.empty()) {
        return attacker.moves.empty() ? MoveID() : attacker.moves.front().move.id;
    }

    if (difficulty_ == Difficulty::EASY) {
        int index = rng.uniform_int(0, static_cast<int>(usable.size()) - 1);
        return usable[static_cast<size_t>(index)]->move.id;
    }

    std::vector<ScoredMove> scored;
    scored.reserve(usable.size());
    for (const MoveSlot* slot : usable) {
        scored.push_back({slot->move.id, slot->move.name,
                          evaluate_move(attacker, defender, slot->move)});
    }
    std::stable_sort(scored.begin(), scored.end(), [](const ScoredMove& a, const ScoredMove& b) {
        return a.score > b.score;
    });

    if (difficulty_ == Difficulty::HARD || scored.size() < 2) {
        return scored[0].move_id;
    }

    return rng.chance(NORMAL_BEST_CHANCE) ? scored[0].move_id : scored[1].move_id;
}

} // namespace clawcombat
