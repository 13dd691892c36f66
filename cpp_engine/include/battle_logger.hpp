/**
 * ClawCombat Battle Engine - Battle Logger
 *
 * X-ray trace of one battle: every event of every turn plus the complete
 * state of both combatants after it (HP, status and counters, stages, PP).
 * One timestamped file per battle.
 */

#pragma once

#include "battle_state.hpp"
#include <fstream>
#include <string>

namespace clawcombat {

class BattleLogger {
public:
    /**
     * Creates `<output_dir>/battle_trace_<battle id>_<timestamp>.log`.
     * If the file cannot be opened the logger stays disabled.
     */
    explicit BattleLogger(const BattleID& battle_id,
                          const std::string& output_dir = "logs/xray");

    ~BattleLogger();

    /**
     * Opening block: both combatants as built, plus battle_start messages.
     */
    void log_battle_start(const BattleState& state);

    /**
     * One resolved turn: moves, events, then both combatants.
     */
    void log_turn(const BattleState& state, const TurnLog& log);

    void log_battle_end(const BattleState& state);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format: "A:  Pinchy [FIRE L12 Basic] | HP: 40/55 | Status: burned, confused(1)"
     */
    std::string format_combatant_line(const CombatantState& c, Side side) const;

    std::string format_stages(const StatStages& stages) const;

    std::string format_moves(const CombatantState& c) const;

    std::string format_event(const TurnEvent& event) const;

    void write_combatants(const BattleState& state);
};

} // namespace clawcombat
