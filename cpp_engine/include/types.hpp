/**
 * ClawCombat Battle Engine - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 * String forms match the stored agent records and the move data files.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clawcombat {

// ============================================================================
// ENUMS
// ============================================================================

enum class ElementType : uint8_t {
    NEUTRAL,
    FIRE,
    WATER,
    ELECTRIC,
    GRASS,
    ICE,
    MARTIAL,
    VENOM,
    EARTH,
    AIR,
    PSYCHE,
    INSECT,
    STONE,
    GHOST,
    DRAGON,
    SHADOW,
    METAL,
    MYSTIC
};

constexpr size_t ELEMENT_TYPE_COUNT = 18;

constexpr std::array<ElementType, ELEMENT_TYPE_COUNT> ALL_ELEMENT_TYPES = {
    ElementType::NEUTRAL, ElementType::FIRE,   ElementType::WATER,
    ElementType::ELECTRIC, ElementType::GRASS, ElementType::ICE,
    ElementType::MARTIAL, ElementType::VENOM,  ElementType::EARTH,
    ElementType::AIR,     ElementType::PSYCHE, ElementType::INSECT,
    ElementType::STONE,   ElementType::GHOST,  ElementType::DRAGON,
    ElementType::SHADOW,  ElementType::METAL,  ElementType::MYSTIC
};

enum class MoveCategory : uint8_t {
    PHYSICAL,
    SPECIAL,
    STATUS
};

/**
 * Status conditions.
 *
 * NONE through SLEEP are primary (mutually exclusive, stored in
 * CombatantState::status). CONFUSION is volatile and tracked by its own flag.
 */
enum class StatusCondition : uint8_t {
    NONE,
    BURNED,
    PARALYSIS,
    POISON,
    FREEZE,
    SLEEP,
    CONFUSION
};

enum class StatKind : uint8_t {
    HP,
    ATTACK,
    DEFENSE,
    SP_ATK,
    SP_DEF,
    SPEED
};

// Stats that carry a battle stage (HP has none)
constexpr std::array<StatKind, 5> STAGED_STATS = {
    StatKind::ATTACK, StatKind::DEFENSE, StatKind::SP_ATK,
    StatKind::SP_DEF, StatKind::SPEED
};

enum class Side : uint8_t {
    A,
    B
};

enum class EffectTarget : uint8_t {
    OPPONENT,
    SELF
};

enum class BattleStatus : uint8_t {
    ACTIVE,
    FINISHED
};

enum class BattlePhase : uint8_t {
    WAITING,
    FINISHED
};

enum class EndReason : uint8_t {
    NONE,
    FAINT,
    TURN_LIMIT,
    FORFEIT_TIMEOUT,
    SURRENDER
};

enum class Difficulty : uint8_t {
    EASY,
    NORMAL,
    HARD
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using AgentID = std::string;    // Stored agent id (e.g., "agent_42")
using BattleID = std::string;   // Battle record id
using MoveID = std::string;     // Move id from the move database (e.g., "flamethrower")

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

inline Side opponent_of(Side side) {
    return side == Side::A ? Side::B : Side::A;
}

inline const char* to_string(ElementType type) {
    switch (type) {
        case ElementType::NEUTRAL: return "NEUTRAL";
        case ElementType::FIRE: return "FIRE";
        case ElementType::WATER: return "WATER";
        case ElementType::ELECTRIC: return "ELECTRIC";
        case ElementType::GRASS: return "GRASS";
        case ElementType::ICE: return "ICE";
        case ElementType::MARTIAL: return "MARTIAL";
        case ElementType::VENOM: return "VENOM";
        case ElementType::EARTH: return "EARTH";
        case ElementType::AIR: return "AIR";
        case ElementType::PSYCHE: return "PSYCHE";
        case ElementType::INSECT: return "INSECT";
        case ElementType::STONE: return "STONE";
        case ElementType::GHOST: return "GHOST";
        case ElementType::DRAGON: return "DRAGON";
        case ElementType::SHADOW: return "SHADOW";
        case ElementType::METAL: return "METAL";
        case ElementType::MYSTIC: return "MYSTIC";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(MoveCategory category) {
    switch (category) {
        case MoveCategory::PHYSICAL: return "physical";
        case MoveCategory::SPECIAL: return "special";
        case MoveCategory::STATUS: return "status";
        default: return "unknown";
    }
}

inline const char* to_string(StatusCondition status) {
    switch (status) {
        case StatusCondition::NONE: return "none";
        case StatusCondition::BURNED: return "burned";
        case StatusCondition::PARALYSIS: return "paralysis";
        case StatusCondition::POISON: return "poison";
        case StatusCondition::FREEZE: return "freeze";
        case StatusCondition::SLEEP: return "sleep";
        case StatusCondition::CONFUSION: return "confusion";
        default: return "unknown";
    }
}

inline const char* to_string(StatKind stat) {
    switch (stat) {
        case StatKind::HP: return "hp";
        case StatKind::ATTACK: return "attack";
        case StatKind::DEFENSE: return "defense";
        case StatKind::SP_ATK: return "sp_atk";
        case StatKind::SP_DEF: return "sp_def";
        case StatKind::SPEED: return "speed";
        default: return "unknown";
    }
}

/**
 * Display name used in battle messages ("Claw" and "Shell" are the
 * lobster names for special attack and special defense).
 */
inline const char* stat_display_name(StatKind stat) {
    switch (stat) {
        case StatKind::HP: return "HP";
        case StatKind::ATTACK: return "Attack";
        case StatKind::DEFENSE: return "Defense";
        case StatKind::SP_ATK: return "Claw";
        case StatKind::SP_DEF: return "Shell";
        case StatKind::SPEED: return "Speed";
        default: return "Unknown";
    }
}

inline const char* to_string(Side side) {
    return side == Side::A ? "A" : "B";
}

inline const char* to_string(EffectTarget target) {
    return target == EffectTarget::SELF ? "self" : "opponent";
}

inline const char* to_string(BattleStatus status) {
    return status == BattleStatus::ACTIVE ? "active" : "finished";
}

inline const char* to_string(BattlePhase phase) {
    return phase == BattlePhase::WAITING ? "waiting" : "finished";
}

inline const char* to_string(EndReason reason) {
    switch (reason) {
        case EndReason::NONE: return "none";
        case EndReason::FAINT: return "faint";
        case EndReason::TURN_LIMIT: return "turn_limit";
        case EndReason::FORFEIT_TIMEOUT: return "forfeit_timeout";
        case EndReason::SURRENDER: return "surrender";
        default: return "unknown";
    }
}

inline const char* to_string(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY: return "easy";
        case Difficulty::NORMAL: return "normal";
        case Difficulty::HARD: return "hard";
        default: return "unknown";
    }
}

// ============================================================================
// PARSING (string -> enum). Unknown strings yield std::nullopt.
// ============================================================================

inline std::optional<ElementType> parse_element_type(const std::string& s) {
    for (ElementType type : ALL_ELEMENT_TYPES) {
        if (s == to_string(type)) return type;
    }
    return std::nullopt;
}

inline std::optional<MoveCategory> parse_move_category(const std::string& s) {
    if (s == "physical") return MoveCategory::PHYSICAL;
    if (s == "special") return MoveCategory::SPECIAL;
    if (s == "status") return MoveCategory::STATUS;
    return std::nullopt;
}

inline std::optional<StatusCondition> parse_status(const std::string& s) {
    if (s.empty() || s == "none") return StatusCondition::NONE;
    if (s == "burned" || s == "burn") return StatusCondition::BURNED;
    if (s == "paralysis") return StatusCondition::PARALYSIS;
    if (s == "poison") return StatusCondition::POISON;
    if (s == "freeze") return StatusCondition::FREEZE;
    if (s == "sleep") return StatusCondition::SLEEP;
    if (s == "confusion") return StatusCondition::CONFUSION;
    return std::nullopt;
}

inline std::optional<StatKind> parse_stat(const std::string& s) {
    if (s == "hp") return StatKind::HP;
    if (s == "attack") return StatKind::ATTACK;
    if (s == "defense") return StatKind::DEFENSE;
    if (s == "sp_atk") return StatKind::SP_ATK;
    if (s == "sp_def") return StatKind::SP_DEF;
    if (s == "speed") return StatKind::SPEED;
    return std::nullopt;
}

inline std::optional<EffectTarget> parse_effect_target(const std::string& s) {
    if (s == "self") return EffectTarget::SELF;
    if (s == "opponent") return EffectTarget::OPPONENT;
    return std::nullopt;
}

inline std::optional<EndReason> parse_end_reason(const std::string& s) {
    if (s == "none") return EndReason::NONE;
    if (s == "faint") return EndReason::FAINT;
    if (s == "turn_limit") return EndReason::TURN_LIMIT;
    if (s == "forfeit_timeout") return EndReason::FORFEIT_TIMEOUT;
    if (s == "surrender") return EndReason::SURRENDER;
    return std::nullopt;
}

inline std::optional<Difficulty> parse_difficulty(const std::string& s) {
    if (s == "easy") return Difficulty::EASY;
    if (s == "normal") return Difficulty::NORMAL;
    if (s == "hard") return Difficulty::HARD;
    return std::nullopt;
}

} // namespace clawcombat
