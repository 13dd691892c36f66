/**
 * ClawCombat Battle Engine - Turn Resolver
 *
 * The battle state machine. One call to resolve_turn():
 *
 *   1. advances the turn counter and resets per-turn flags
 *   2. tracks timeouts for sides with no move (forfeit at the limit)
 *   3. orders the acting sides (priority, speed, level, base speed, coin)
 *   4. runs each action: validation, PP, gates, abilities, accuracy, effect
 *   5. runs end-of-turn status damage, wish and healing abilities
 *   6. decides faint, double faint and the turn cap
 *
 * All randomness comes from the BattleRng passed in, so a seeded RNG
 * replays a battle exactly.
 */

#pragma once

#include "battle_state.hpp"
#include "damage_calculator.hpp"

namespace clawcombat {

class BattleRng;

// Non-positive limits are replaced by these defaults when a resolver is built
struct ResolverSettings {
    int max_battle_turns = 50;
    int max_consecutive_timeouts = 3;
};

/**
 * Result of a resolve call. `ok` is false only when the battle could not
 * be advanced (it was already finished); the state is then untouched.
 */
struct TurnResult {
    bool ok = false;
    StateError error = StateError::NONE;
    TurnLog log;
};

class TurnResolver {
public:
    static constexpr double SELF_SACRIFICE_FRACTION = 0.25;   // curse user cost
    static constexpr double LEECH_SEED_FRACTION = 1.0 / 12.0;
    static constexpr double CURSE_DAMAGE_FRACTION = 0.125;
    static constexpr double WISH_HEAL_FRACTION = 0.5;

    explicit TurnResolver(ResolverSettings settings = {},
                          const StatusTable& statuses = StatusTable::standard(),
                          const AbilityTable& abilities = AbilityTable::standard());

    /**
     * Resolve one turn. A side with std::nullopt skipped the turn (timed
     * out): it does nothing, its consecutive timeout counter increments,
     * and reaching the limit forfeits the battle. A side with a move resets
     * its counter.
     *
     * The log is appended to state.turns.
     */
    TurnResult resolve_turn(BattleState& state,
                            const std::optional<MoveID>& move_a,
                            const std::optional<MoveID>& move_b,
                            BattleRng& rng) const;

    /**
     * Resolve a turn in which at least one side failed to submit before
     * the turn timeout. Same rules as resolve_turn().
     */
    TurnResult resolve_timeout_turn(BattleState& state,
                                    const std::optional<MoveID>& move_a,
                                    const std::optional<MoveID>& move_b,
                                    BattleRng& rng) const {
        return resolve_turn(state, move_a, move_b, rng);
    }

    /**
     * End the battle with `side` giving up. The opponent wins.
     */
    TurnResult surrender(BattleState& state, Side side) const;

    // ========================================================================
    // TURN ORDER
    // ========================================================================

    /**
     * Move priority plus ability bonus. Unknown moves count as priority 0.
     */
    int move_priority(const CombatantState& combatant, const MoveID& move_id) const;

    /**
     * speed * stage multiplier * status speed modifier.
     */
    double effective_speed(const CombatantState& combatant) const;

    /**
     * Side acting first when both sides act.
     */
    Side determine_first(const BattleState& state,
                         const MoveID& move_a,
                         const MoveID& move_b,
                         BattleRng& rng) const;

    const ResolverSettings& settings() const { return settings_; }

private:
    ResolverSettings settings_;
    const StatusTable& statuses_;
    const AbilityTable& abilities_;
    DamageCalculator damage_;

    void act(BattleState& state, Side side, const MoveID& move_id,
             TurnLog& log, BattleRng& rng) const;

    bool run_gates(CombatantState& attacker, Side side, TurnLog& log, BattleRng& rng) const;

    bool run_before_hit(CombatantState& defender, Side side, const MoveDef& move,
                        TurnLog& log, BattleRng& rng) const;

    void apply_damaging_move(BattleState& state, Side side, const MoveDef& move,
                             TurnLog& log, BattleRng& rng) const;

    void apply_status_move(BattleState& state, Side side, const MoveDef& move,
                           TurnLog& log, BattleRng& rng) const;

    void apply_after_hit_abilities(CombatantState& attacker, CombatantState& defender,
                                   Side side, const MoveDef& move,
                                   TurnLog& log, BattleRng& rng) const;

    void apply_end_of_turn(BattleState& state, Side side, TurnLog& log) const;

    void apply_end_turn_ability(BattleState& state, Side side, TurnLog& log) const;

    /**
     * Faint check. Finishes the battle and logs battle_end if a side is down.
     */
    bool check_battle_end(BattleState& state, TurnLog& log) const;

    bool check_turn_cap(BattleState& state, TurnLog& log) const;

    void finish(BattleState& state, Side winner, EndReason reason, TurnLog& log) const;

    void close_log(BattleState& state, TurnLog& log) const;
};

} // namespace clawcombat
