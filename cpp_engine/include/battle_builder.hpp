/**
 * ClawCombat Battle Engine - Battle Builder
 *
 * Snapshots agent profiles into combatants and creates new battles.
 */

#pragma once

#include "agent_profile.hpp"
#include "battle_state.hpp"
#include "move_database.hpp"
#include "ability_table.hpp"
#include <cstdint>

namespace clawcombat {

/**
 * Current wall-clock time in Unix milliseconds.
 */
int64_t unix_now_ms();

/**
 * ISO-8601 UTC timestamp ("2026-01-31T12:00:00.000Z").
 */
std::string iso8601_utc(int64_t unix_ms);

class BattleBuilder {
public:
    explicit BattleBuilder(const MoveDatabase& moves,
                           const AbilityTable& abilities = AbilityTable::standard());

    /**
     * Build a full-HP combatant from a profile.
     *
     * Stats are scaled by level, EVs, nature and evolution tier. Unknown
     * move ids are dropped; an empty result falls back to the type's
     * default loadout. Pure: the same profile always yields the same
     * combatant.
     */
    CombatantState build_combatant(const AgentProfile& profile) const;

    /**
     * Create a new battle: both combatants, then battle_start abilities for
     * A and then B (their messages become the opening events).
     *
     * @param now_ms Creation time; 0 uses the current clock
     */
    BattleState create_battle(const AgentProfile& profile_a,
                              const AgentProfile& profile_b,
                              const BattleID& battle_id,
                              uint64_t seed,
                              int64_t now_ms = 0) const;

    /**
     * Apply battle_start abilities of `side` to the battle.
     *
     * @return Ability events (empty if the ability does nothing at start)
     */
    std::vector<TurnEvent> apply_battle_start(BattleState& state, Side side) const;

private:
    const MoveDatabase& moves_;
    const AbilityTable& abilities_;
};

} // namespace clawcombat
