/**
 * ClawCombat Battle Engine - Agent Profile
 *
 * Stored agent record as handed to the battle builder. Missing stats keep
 * the defaults below.
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace clawcombat {

struct AgentProfile {
    AgentID id;
    std::string name = "Unknown";
    ElementType type = ElementType::NEUTRAL;
    int level = 1;

    // Base stats
    int base_hp = 17;
    int base_attack = 17;
    int base_defense = 17;
    int base_sp_atk = 17;
    int base_sp_def = 16;
    int base_speed = 16;

    // Effort values
    int ev_hp = 0;
    int ev_attack = 0;
    int ev_defense = 0;
    int ev_sp_atk = 0;
    int ev_sp_def = 0;
    int ev_speed = 0;

    // Nature: explicit boost/reduce pair, or a name resolved through the
    // nature table when the pair is absent
    std::string nature_name;
    std::optional<StatKind> nature_boost;
    std::optional<StatKind> nature_reduce;

    std::string ability;
    std::vector<MoveID> moves;
};

} // namespace clawcombat
