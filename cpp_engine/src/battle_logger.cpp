/**
 * ClawCombat Battle Engine - Battle Logger Implementation
 */

#include "battle_logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace clawcombat {

namespace {

std::tm local_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    return *std::localtime(&time_t);
}

std::string stage_label(StatKind stat) {
    switch (stat) {
        case StatKind::ATTACK: return "atk";
        case StatKind::DEFENSE: return "def";
        case StatKind::SP_ATK: return "claw";
        case StatKind::SP_DEF: return "shell";
        case StatKind::SPEED: return "spe";
        default: return "hp";
    }
}

} // namespace

BattleLogger::BattleLogger(const BattleID& battle_id, const std::string& output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[BattleLogger] Failed to create directory " << output_dir
                  << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    std::tm tm = local_now();

    std::ostringstream filename;
    filename << output_dir << "/battle_trace_" << battle_id << "_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[BattleLogger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "BATTLE TRACE - " << battle_id << "\n";
    log_file_ << "Started: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[BattleLogger] Logging to: " << log_path_ << std::endl;
}

BattleLogger::~BattleLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string BattleLogger::format_stages(const StatStages& stages) const {
    if (stages.all_zero()) return "-";

    std::ostringstream out;
    bool first = true;
    for (StatKind stat : STAGED_STATS) {
        int stage = stages.get(stat);
        if (stage == 0) continue;
        if (!first) out << " ";
        out << stage_label(stat) << (stage > 0 ? "+" : "") << stage;
        first = false;
    }
    return out.str();
}

std::string BattleLogger::format_moves(const CombatantState& c) const {
    std::ostringstream out;
    for (size_t i = 0; i < c.moves.size(); i++) {
        if (i > 0) out << ", ";
        out << c.moves[i].move.id << " (" << c.moves[i].current_pp << "/" << c.moves[i].move.pp << ")";
    }
    return out.str();
}

std::string BattleLogger::format_combatant_line(const CombatantState& c, Side side) const {
    std::ostringstream line;

    line << to_string(side) << ":  " << c.name << " (" << c.id << ") ["
         << to_string(c.type) << " L" << c.level << " " << c.evolution_name << "]";
    line << " | HP: " << c.current_hp << "/" << c.max_hp;

    line << " | Status: " << to_string(c.status);
    if (c.status == StatusCondition::FREEZE) line << "(" << c.freeze_turns << ")";
    if (c.status == StatusCondition::SLEEP) line << "(" << c.sleep_turns << ")";
    if (c.confused) line << ", confused(" << c.confusion_turns << ")";
    if (c.leech_seeded) line << ", seeded";
    if (c.cursed) line << ", cursed";
    if (c.wish_pending) line << ", wish@" << c.wish_turn;

    line << " | Stages: " << format_stages(c.stages);
    if (!c.ability.empty()) {
        line << " | Ability: " << c.ability;
        if (c.sturdy_used) line << " (used)";
    }
    line << "\n     Moves: [" << format_moves(c) << "]";
    if (c.consecutive_timeouts > 0) {
        line << " | Timeouts: " << c.consecutive_timeouts;
    }

    return line.str();
}

std::string BattleLogger::format_event(const TurnEvent& event) const {
    std::ostringstream out;
    out << "  [" << to_string(event.type);
    if (event.side) out << " " << to_string(*event.side);
    out << "] " << event.message;
    if (event.amount != 0) out << " {" << event.amount << "}";
    if (event.critical) out << " {crit}";
    return out.str();
}

void BattleLogger::write_combatants(const BattleState& state) {
    log_file_ << format_combatant_line(state.agent_a, Side::A) << "\n";
    log_file_ << format_combatant_line(state.agent_b, Side::B) << "\n";
}

void BattleLogger::log_battle_start(const BattleState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "[BATTLE START] seed " << state.rng_seed << "\n";
    write_combatants(state);
    for (const auto& event : state.opening_events) {
        log_file_ << format_event(event) << "\n";
    }
    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void BattleLogger::log_turn(const BattleState& state, const TurnLog& log) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << log.turn_number << "] A: " << log.move_a.value_or("(skipped)")
              << " | B: " << log.move_b.value_or("(skipped)");
    if (log.first_side) {
        log_file_ << " | First: " << to_string(*log.first_side);
    }
    log_file_ << "\n" << std::string(80, '#') << "\n";

    for (const auto& event : log.events) {
        log_file_ << format_event(event) << "\n";
    }

    log_file_ << std::string(80, '-') << "\n";
    write_combatants(state);
    log_file_ << "\n";

    log_file_.flush();
}

void BattleLogger::log_battle_end(const BattleState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    std::tm tm = local_now();

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "BATTLE END\n";
    log_file_ << std::string(80, '=') << "\n";

    if (!state.winner_id.empty()) {
        log_file_ << "Winner: " << state.winner_id << "\n";
        log_file_ << "Loser: " << state.loser_id() << "\n";
    } else {
        log_file_ << "Result: Unfinished\n";
    }

    log_file_ << "Reason: " << to_string(state.end_reason) << "\n";
    log_file_ << "Turns: " << state.turn_number << "\n";
    log_file_ << "Ended: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace clawcombat
