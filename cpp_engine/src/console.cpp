/**
 * ClawCombat Battle Engine - Interactive Test Console
 *
 * Simple REPL for manual testing of battle mechanics: create agents,
 * start a battle, submit moves by hand or let the AI pick them, and run
 * the matchmaking queue.
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <filesystem>
#include <memory>

#include <nlohmann/json.hpp>
#include "claw_engine.hpp"

using namespace clawcombat;

#ifndef CLAWCOMBAT_DATA_DIR
#define CLAWCOMBAT_DATA_DIR "data"
#endif

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

// Relative paths in the config file are relative to the config file itself
std::string resolve_data_path(const std::string& base_dir, const std::string& path) {
    std::filesystem::path p(path);
    if (p.is_absolute() || std::filesystem::exists(p)) {
        return path;
    }
    return (std::filesystem::path(base_dir) / p).string();
}

bool parse_int(const std::string& s, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

// ============================================================================
// PRINT HELP
// ============================================================================

void print_help() {
    std::cout << R"(
=== ClawCombat C++ Test Console ===

Commands:
  help                         - Show this help
  quit / exit                  - Exit console

Agents:
  agent <id> <TYPE> [level] [ability...]
                               - Create an agent with the type's default moves
  agents                       - List created agents
  moves <TYPE>                 - Show a type's move pool
  abilities <TYPE>             - Show a type's abilities

Battle:
  battle <idA> <idB>           - Start a battle
  move <agent> <move_id>       - Submit a move for the current battle
  ai <agent> [difficulty]      - Let the AI pick the agent's move
  surrender <agent>            - Surrender the current battle
  show / s                     - Show the current battle
  dump                         - Print the current battle record as JSON
  auto <idA> <idB> [dA] [dB]   - Play a whole AI vs AI battle

Matchmaking:
  queue <agent>                - Join the matchmaking queue
  leave <agent>                - Leave the queue
  match                        - Run one pairing pass and start battles
  qstats                       - Show queue statistics

Examples:
  agent pinchy FIRE 12 Blaze
  agent snappy WATER 12
  battle pinchy snappy
  move pinchy flamethrower
  ai snappy hard
)" << std::endl;
}

// ============================================================================
// BATTLE DISPLAY
// ============================================================================

void show_combatant(const CombatantState& c, Side side) {
    std::cout << "  " << to_string(side) << ": " << c.name << " (" << c.id << ") "
              << to_string(c.type) << " L" << c.level << " " << c.evolution_name << std::endl;
    std::cout << "     HP: " << c.current_hp << "/" << c.max_hp
              << "  Status: " << to_string(c.status);
    if (c.confused) std::cout << " +confused";
    if (!c.ability.empty()) std::cout << "  Ability: " << c.ability;
    std::cout << std::endl;

    std::cout << "     Moves:";
    for (const auto& slot : c.moves) {
        std::cout << "  " << slot.move.id << " [" << slot.current_pp << "/" << slot.move.pp << "]";
    }
    std::cout << std::endl;
}

void show_turn(const TurnLog& log) {
    std::cout << "--- Turn " << log.turn_number << " ---" << std::endl;
    for (const auto& event : log.events) {
        std::cout << "  " << event.message << std::endl;
    }
    std::cout << "  HP after: A=" << log.agent_a_hp << " B=" << log.agent_b_hp << std::endl;
}

void show_battle(const BattleState& state) {
    std::cout << "\n=== " << state.id << " | turn " << state.turn_number
              << " | " << to_string(state.status) << " ===" << std::endl;
    show_combatant(state.agent_a, Side::A);
    show_combatant(state.agent_b, Side::B);
    if (state.is_finished()) {
        std::cout << "  Winner: " << (state.winner_id.empty() ? "(none)" : state.winner_id)
                  << " (" << to_string(state.end_reason) << ")" << std::endl;
    } else {
        std::cout << "  Waiting on:"
                  << (state.pending_move_a ? "" : " A")
                  << (state.pending_move_b ? "" : " B") << std::endl;
    }
}

// ============================================================================
// CONSOLE CLASS
// ============================================================================

class Console {
public:
    EngineConfig config;
    MoveDatabase moves;
    InMemoryAgentDirectory directory;
    InMemoryBattleStore store;
    InMemoryQueueStore queue_store;
    UnlimitedFightPolicy fight_policy;

    std::unique_ptr<BattleService> service;
    std::unique_ptr<MatchmakingQueue> queue;

    std::vector<AgentProfile> roster;
    BattleID current_battle;

    bool init() {
        std::string data_dir = CLAWCOMBAT_DATA_DIR;
        std::string config_path = data_dir + "/engine_config.json";

        if (!config.load_from_json(config_path)) {
            std::cerr << "Warning: using default engine config." << std::endl;
        }

        std::string moves_path = resolve_data_path(data_dir, config.moves_path);
        if (!moves.load_from_json(moves_path)) {
            std::cerr << "Failed to load move database: " << moves_path << std::endl;
            return false;
        }

        service = std::make_unique<BattleService>(moves, store, directory, config);
        queue = std::make_unique<MatchmakingQueue>(queue_store, fight_policy, store,
                                                   config.matchmaking);
        return true;
    }

    const AgentProfile* find_agent(const AgentID& id) const {
        for (const auto& agent : roster) {
            if (agent.id == id) return &agent;
        }
        return nullptr;
    }

    void cmd_agent(const std::vector<std::string>& args) {
        if (args.size() < 3) {
            std::cout << "Usage: agent <id> <TYPE> [level] [ability...]" << std::endl;
            return;
        }

        auto type = parse_element_type(to_upper(args[2]));
        if (!type) {
            std::cout << "Unknown type: " << args[2] << std::endl;
            return;
        }

        AgentProfile profile;
        profile.id = args[1];
        profile.name = args[1];
        profile.type = *type;
        if (args.size() > 3 && !parse_int(args[3], profile.level)) {
            std::cout << "Invalid level: " << args[3] << std::endl;
            return;
        }
        if (args.size() > 4) {
            std::string ability;
            for (size_t i = 4; i < args.size(); i++) {
                if (i > 4) ability += " ";
                ability += args[i];
            }
            if (!AbilityTable::standard().has(ability)) {
                std::cout << "Unknown ability: " << ability << std::endl;
                return;
            }
            profile.ability = ability;
        }
        profile.moves = moves.default_loadout(*type);

        roster.erase(std::remove_if(roster.begin(), roster.end(),
                                    [&](const AgentProfile& a) { return a.id == profile.id; }),
                     roster.end());
        roster.push_back(profile);
        directory.add(profile);

        std::cout << "Created " << profile.id << " (" << to_string(profile.type)
                  << " L" << profile.level << ")" << std::endl;
    }

    void cmd_agents() {
        if (roster.empty()) {
            std::cout << "No agents. Use 'agent' to create one." << std::endl;
            return;
        }
        for (const auto& agent : roster) {
            std::cout << "  " << agent.id << " " << to_string(agent.type) << " L" << agent.level;
            if (!agent.ability.empty()) std::cout << " [" << agent.ability << "]";
            auto active = store.active_battle_for(agent.id);
            if (active) std::cout << " in " << *active;
            std::cout << std::endl;
        }
    }

    void cmd_moves(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: moves <TYPE>" << std::endl;
            return;
        }
        auto type = parse_element_type(to_upper(args[1]));
        if (!type) {
            std::cout << "Unknown type: " << args[1] << std::endl;
            return;
        }
        for (const auto& id : moves.move_pool(*type)) {
            const MoveDef* move = moves.get_move(id);
            if (!move) continue;
            std::cout << "  " << move->id << " - " << move->name << " ("
                      << to_string(move->category) << ", pow " << move->power
                      << ", acc " << move->accuracy << ", pp " << move->pp << ")" << std::endl;
        }
    }

    void cmd_abilities(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: abilities <TYPE>" << std::endl;
            return;
        }
        auto type = parse_element_type(to_upper(args[1]));
        if (!type) {
            std::cout << "Unknown type: " << args[1] << std::endl;
            return;
        }
        const auto& table = AbilityTable::standard();
        for (const auto& name : table.abilities_for_type(*type)) {
            std::cout << "  " << name << " - " << table.get(name)->description << std::endl;
        }
    }

    void cmd_battle(const std::vector<std::string>& args) {
        if (args.size() < 3) {
            std::cout << "Usage: battle <idA> <idB>" << std::endl;
            return;
        }
        const AgentProfile* a = find_agent(args[1]);
        const AgentProfile* b = find_agent(args[2]);
        if (!a || !b) {
            std::cout << "Unknown agent" << std::endl;
            return;
        }
        if (a->id == b->id) {
            std::cout << "An agent cannot fight itself" << std::endl;
            return;
        }

        BattleState state = service->start_battle(*a, *b);
        current_battle = state.id;
        for (const auto& event : state.opening_events) {
            std::cout << "  " << event.message << std::endl;
        }
        show_battle(state);
    }

    void report(const SubmitResult& result) {
        std::cout << "Result: " << to_string(result.status) << std::endl;
        if (result.turn) {
            show_turn(*result.turn);
        }
        if (result.battle_finished) {
            std::cout << "Battle over. Winner: " << result.winner_id << std::endl;
        }
    }

    bool require_battle() {
        if (current_battle.empty()) {
            std::cout << "No current battle. Use 'battle' first." << std::endl;
            return false;
        }
        return true;
    }

    void cmd_move(const std::vector<std::string>& args) {
        if (args.size() < 3) {
            std::cout << "Usage: move <agent> <move_id>" << std::endl;
            return;
        }
        if (!require_battle()) return;
        report(service->submit_move(current_battle, args[1], args[2]));
    }

    void cmd_ai(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: ai <agent> [easy|normal|hard]" << std::endl;
            return;
        }
        if (!require_battle()) return;

        std::optional<Difficulty> difficulty;
        if (args.size() > 2) {
            difficulty = parse_difficulty(args[2]);
            if (!difficulty) {
                std::cout << "Unknown difficulty: " << args[2] << std::endl;
                return;
            }
        }
        report(service->submit_ai_move(current_battle, args[1], difficulty));
    }

    void cmd_surrender(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: surrender <agent>" << std::endl;
            return;
        }
        if (!require_battle()) return;
        report(service->surrender(current_battle, args[1]));
    }

    void cmd_show() {
        if (!require_battle()) return;
        auto state = service->get_battle(current_battle);
        if (!state) {
            std::cout << "Battle " << current_battle << " not found" << std::endl;
            return;
        }
        show_battle(*state);
    }

    void cmd_dump() {
        if (!require_battle()) return;
        auto state = service->get_battle(current_battle);
        if (!state) {
            std::cout << "Battle " << current_battle << " not found" << std::endl;
            return;
        }
        std::cout << serialize_battle(*state, 2) << std::endl;
    }

    void cmd_auto(const std::vector<std::string>& args) {
        if (args.size() < 3) {
            std::cout << "Usage: auto <idA> <idB> [difficultyA] [difficultyB]" << std::endl;
            return;
        }
        const AgentProfile* a = find_agent(args[1]);
        const AgentProfile* b = find_agent(args[2]);
        if (!a || !b || a->id == b->id) {
            std::cout << "Need two different known agents" << std::endl;
            return;
        }

        Difficulty da = config.default_ai_difficulty;
        Difficulty db = config.default_ai_difficulty;
        if (args.size() > 3) {
            auto parsed = parse_difficulty(args[3]);
            if (!parsed) {
                std::cout << "Unknown difficulty: " << args[3] << std::endl;
                return;
            }
            da = db = *parsed;
        }
        if (args.size() > 4) {
            auto parsed = parse_difficulty(args[4]);
            if (!parsed) {
                std::cout << "Unknown difficulty: " << args[4] << std::endl;
                return;
            }
            db = *parsed;
        }

        BattleState state = service->play_ai_battle(*a, *b, da, db);
        for (const auto& turn : state.turns) {
            show_turn(turn);
        }
        current_battle = state.id;
        show_battle(state);
    }

    void cmd_queue(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: queue <agent>" << std::endl;
            return;
        }
        const AgentProfile* agent = find_agent(args[1]);
        if (!agent) {
            std::cout << "Unknown agent: " << args[1] << std::endl;
            return;
        }

        QueueJoinResult result = queue->join(agent->id, agent->level);
        std::cout << "Queue: " << to_string(result.status);
        if (result.queue_position > 0) std::cout << " (position " << result.queue_position << ")";
        if (!result.battle_id.empty()) std::cout << " (battle " << result.battle_id << ")";
        if (!result.reason.empty()) std::cout << " - " << result.reason;
        std::cout << std::endl;
    }

    void cmd_leave(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: leave <agent>" << std::endl;
            return;
        }
        std::cout << "Leave: " << to_string(queue->leave(args[1])) << std::endl;
    }

    void cmd_match() {
        auto started = service->run_matchmaking(*queue);
        if (started.empty()) {
            std::cout << "No matches." << std::endl;
            return;
        }
        for (const auto& id : started) {
            std::cout << "Started " << id << std::endl;
        }
        current_battle = started.back();
    }

    void cmd_qstats() {
        std::cout << queue_stats_to_json(queue->stats()).dump(2) << std::endl;
    }

    void run() {
        std::cout << "ClawCombat C++ Test Console v" << get_version() << std::endl;
        std::cout << "=====================================\n" << std::endl;
        std::cout << "Loaded " << moves.move_count() << " moves. Type 'help' for commands." << std::endl;

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "agent") {
                cmd_agent(args);
            } else if (cmd == "agents") {
                cmd_agents();
            } else if (cmd == "moves") {
                cmd_moves(args);
            } else if (cmd == "abilities") {
                cmd_abilities(args);
            } else if (cmd == "battle") {
                cmd_battle(args);
            } else if (cmd == "move" || cmd == "m") {
                cmd_move(args);
            } else if (cmd == "ai") {
                cmd_ai(args);
            } else if (cmd == "surrender") {
                cmd_surrender(args);
            } else if (cmd == "show" || cmd == "s") {
                cmd_show();
            } else if (cmd == "dump") {
                cmd_dump();
            } else if (cmd == "auto") {
                cmd_auto(args);
            } else if (cmd == "queue") {
                cmd_queue(args);
            } else if (cmd == "leave") {
                cmd_leave(args);
            } else if (cmd == "match") {
                cmd_match();
            } else if (cmd == "qstats") {
                cmd_qstats();
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main() {
    Console console;
    if (!console.init()) {
        return 1;
    }
    console.run();
    return 0;
}
