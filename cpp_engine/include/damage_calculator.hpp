/**
 * ClawCombat Battle Engine - Damage Calculator
 *
 *   base   = (atk * atk_stage / max(1, def * def_stage * corrosion)) * power' * 0.25
 *            * ability / move multipliers
 *   damage = max(1, floor(base * stab * type * crit * random * burn))
 *
 * power' is the level-scaled move power. Type effectiveness is capped at
 * 1.5 before defensive abilities adjust it. A critical hit ignores stages
 * that would reduce damage.
 *
 * RNG draws, in order: critical roll, random factor. An immune target
 * (chart effectiveness 0) consumes no draws.
 */

#pragma once

#include "combatant_state.hpp"
#include "ability_table.hpp"
#include "status_table.hpp"

namespace clawcombat {

class BattleRng;

struct DamageResult {
    int damage = 0;
    bool critical = false;
    double type_effectiveness = 1.0;    // effectiveness applied to damage (capped, adjusted)
    double chart_effectiveness = 1.0;   // raw chart value
    bool immune = false;
};

class DamageCalculator {
public:
    static constexpr double DAMAGE_SCALE = 0.25;
    static constexpr double STAB = 1.5;
    static constexpr double TYPE_EFFECTIVENESS_CAP = 1.5;
    static constexpr double BASE_CRIT_CHANCE = 0.0625;
    static constexpr double CRIT_MULTIPLIER = 1.25;
    static constexpr double RANDOM_MIN = 0.85;
    static constexpr double RANDOM_SPAN = 0.15;
    static constexpr double HP_SCALING_FLOOR = 0.2;

    DamageCalculator(const AbilityTable& abilities = AbilityTable::standard(),
                     const StatusTable& statuses = StatusTable::standard());

    /**
     * Damage of `move` from attacker to defender. Status moves (power 0)
     * deal 0 and draw nothing.
     */
    DamageResult calculate(const CombatantState& attacker,
                           const CombatantState& defender,
                           const MoveDef& move,
                           BattleRng& rng) const;

private:
    const AbilityTable& abilities_;
    const StatusTable& statuses_;
};

} // namespace clawcombat
