/**
 * ClawCombat Battle Engine - AI Move Strategist
 *
 * Heuristic move choice for agents without an external move source.
 * Each usable move is scored 0-100 from a base of 50:
 *
 *   +30 super effective, -20 not very effective, -40 immune
 *   +25 estimated knockout
 *   +10 estimated damage >= half the defender's max HP
 *   +10 damaging move while the attacker is below 25% HP
 *   +15 status infliction against an unstatused defender
 *   +20 healing while the attacker is below 40% HP
 *   -(100 - accuracy) / 5
 *
 * Easy picks at random, normal takes the best move 80% of the time and the
 * runner-up otherwise, hard always takes the best.
 */

#pragma once

#include "combatant_state.hpp"
#include <functional>
#include <map>
#include <utility>

namespace clawcombat {

class BattleRng;

struct ScoredMove {
    MoveID move_id;
    std::string name;
    double score = 0.0;
};

using EffectivenessFn = std::function<double(ElementType, ElementType)>;

class AIStrategist {
public:
    static constexpr double SCORE_BASE = 50.0;
    static constexpr double SCORE_SUPER_EFFECTIVE = 30.0;
    static constexpr double SCORE_NOT_VERY_EFFECTIVE = -20.0;
    static constexpr double SCORE_IMMUNE = -40.0;
    static constexpr double SCORE_KILL_SHOT = 25.0;
    static constexpr double SCORE_SIGNIFICANT_DAMAGE = 10.0;
    static constexpr double SCORE_LOW_HP_AGGRESSION = 10.0;
    static constexpr double SCORE_STATUS_VALUE = 15.0;
    static constexpr double SCORE_HEALING_VALUE = 20.0;

    static constexpr double LOW_HP_THRESHOLD = 0.25;
    static constexpr double HEAL_HP_THRESHOLD = 0.4;
    static constexpr double NORMAL_BEST_CHANCE = 0.8;

    /**
     * @param chart Effectiveness lookup; defaults to the standard type chart
     */
    explicit AIStrategist(Difficulty difficulty = Difficulty::NORMAL,
                          EffectivenessFn chart = nullptr);

    /**
     * Pick a move for `attacker`. Moves without PP are never picked; if no
     * move has PP the first move is returned, and an empty id when the
     * attacker has no moves at all.
     */
    MoveID choose(const CombatantState& attacker,
                  const CombatantState& defender,
                  BattleRng& rng) const;

    /**
     * Tactical score of one move, clamped to [0, 100].
     */
    double evaluate_move(const CombatantState& attacker,
                         const CombatantState& defender,
                         const MoveDef& move) const;

    /**
     * Every move of the attacker (PP ignored), best first. Equal scores
     * keep slot order.
     */
    std::vector<ScoredMove> rank_moves(const CombatantState& attacker,
                                       const CombatantState& defender) const;

    /**
     * Rough damage: power * atk / def * effectiveness * 0.5, floored, at
     * least 1. No crits, stages, abilities or random factor. 0 for status
     * moves.
     */
    static int estimate_damage(const CombatantState& attacker,
                               const CombatantState& defender,
                               const MoveDef& move,
                               double effectiveness);

    Difficulty difficulty() const { return difficulty_; }
    void set_difficulty(Difficulty difficulty) { difficulty_ = difficulty; }

    void clear_cache() { cache_.clear(); }
    size_t cache_size() const { return cache_.size(); }

private:
    Difficulty difficulty_;
    EffectivenessFn chart_;

    // Memoized (move type, defender type) -> effectiveness
    mutable std::map<std::pair<ElementType, ElementType>, double> cache_;

    double cached_effectiveness(ElementType move_type, ElementType defender_type) const;
};

} // namespace clawcombat
