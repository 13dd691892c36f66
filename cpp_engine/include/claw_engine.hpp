/**
 * ClawCombat Battle Engine - C++ Implementation
 *
 * 1v1 lobster battle core: type and stat engine, turn resolver, status and
 * ability tables, matchmaking queue and the AI move strategist.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"

// Type & stat engine
#include "type_chart.hpp"
#include "stat_scaling.hpp"

// Moves
#include "move.hpp"
#include "move_database.hpp"

// Battle state
#include "agent_profile.hpp"
#include "combatant_state.hpp"
#include "turn_log.hpp"
#include "battle_state.hpp"
#include "battle_rng.hpp"

// Hook tables
#include "status_table.hpp"
#include "ability_table.hpp"

// Resolution
#include "battle_builder.hpp"
#include "damage_calculator.hpp"
#include "turn_resolver.hpp"

// Matchmaking and AI
#include "matchmaking.hpp"
#include "ai_strategist.hpp"

// Persistence, config, tracing
#include "battle_serialization.hpp"
#include "engine_config.hpp"
#include "battle_logger.hpp"

// Orchestration
#include "battle_service.hpp"

namespace clawcombat {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace clawcombat
