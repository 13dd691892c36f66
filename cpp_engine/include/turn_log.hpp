/**
 * ClawCombat Battle Engine - Turn Log
 *
 * Typed events emitted while resolving a turn, and the per-turn log that
 * is appended to the battle record.
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace clawcombat {

enum class EventType : uint8_t {
    USE_MOVE,
    DAMAGE,
    MISS,
    STATUS_INFLICT,
    STATUS_FAIL,
    STATUS,
    CONFUSION_SELF_HIT,
    FLINCH,
    FLINCH_APPLIED,
    HEAL,
    DRAIN,
    RECOIL,
    STAT_BOOST,
    STAT_DROP,
    ABILITY,
    DODGE,
    IMMUNE,
    OHKO,
    FOCUS_FAIL,
    WISH,
    WISH_HEAL,
    LEECH_SEED,
    LEECH_SEED_FAIL,
    CURSE,
    CURSE_DAMAGE,
    BURN_DAMAGE,
    POISON_DAMAGE,
    RESET_STATS,
    TIMEOUT,
    ERROR,
    BATTLE_END
};

constexpr std::array<EventType, 31> ALL_EVENT_TYPES = {
    EventType::USE_MOVE, EventType::DAMAGE, EventType::MISS,
    EventType::STATUS_INFLICT, EventType::STATUS_FAIL, EventType::STATUS,
    EventType::CONFUSION_SELF_HIT, EventType::FLINCH, EventType::FLINCH_APPLIED,
    EventType::HEAL, EventType::DRAIN, EventType::RECOIL,
    EventType::STAT_BOOST, EventType::STAT_DROP, EventType::ABILITY,
    EventType::DODGE, EventType::IMMUNE, EventType::OHKO,
    EventType::FOCUS_FAIL, EventType::WISH, EventType::WISH_HEAL,
    EventType::LEECH_SEED, EventType::LEECH_SEED_FAIL, EventType::CURSE,
    EventType::CURSE_DAMAGE, EventType::BURN_DAMAGE, EventType::POISON_DAMAGE,
    EventType::RESET_STATS, EventType::TIMEOUT, EventType::ERROR,
    EventType::BATTLE_END
};

inline const char* to_string(EventType type) {
    switch (type) {
        case EventType::USE_MOVE: return "use_move";
        case EventType::DAMAGE: return "damage";
        case EventType::MISS: return "miss";
        case EventType::STATUS_INFLICT: return "status_inflict";
        case EventType::STATUS_FAIL: return "status_fail";
        case EventType::STATUS: return "status";
        case EventType::CONFUSION_SELF_HIT: return "confusion_self_hit";
        case EventType::FLINCH: return "flinch";
        case EventType::FLINCH_APPLIED: return "flinch_applied";
        case EventType::HEAL: return "heal";
        case EventType::DRAIN: return "drain";
        case EventType::RECOIL: return "recoil";
        case EventType::STAT_BOOST: return "stat_boost";
        case EventType::STAT_DROP: return "stat_drop";
        case EventType::ABILITY: return "ability";
        case EventType::DODGE: return "dodge";
        case EventType::IMMUNE: return "immune";
        case EventType::OHKO: return "ohko";
        case EventType::FOCUS_FAIL: return "focus_fail";
        case EventType::WISH: return "wish";
        case EventType::WISH_HEAL: return "wish_heal";
        case EventType::LEECH_SEED: return "leech_seed";
        case EventType::LEECH_SEED_FAIL: return "leech_seed_fail";
        case EventType::CURSE: return "curse";
        case EventType::CURSE_DAMAGE: return "curse_damage";
        case EventType::BURN_DAMAGE: return "burn_damage";
        case EventType::POISON_DAMAGE: return "poison_damage";
        case EventType::RESET_STATS: return "reset_stats";
        case EventType::TIMEOUT: return "timeout";
        case EventType::ERROR: return "error";
        case EventType::BATTLE_END: return "battle_end";
        default: return "unknown";
    }
}

inline std::optional<EventType> parse_event_type(const std::string& s) {
    for (EventType type : ALL_EVENT_TYPES) {
        if (s == to_string(type)) return type;
    }
    return std::nullopt;
}

/**
 * Why a submitted move was rejected before it could act.
 */
enum class MoveFailure : uint8_t {
    NONE,
    UNKNOWN_MOVE,
    NO_PP
};

inline const char* to_string(MoveFailure failure) {
    switch (failure) {
        case MoveFailure::NONE: return "none";
        case MoveFailure::UNKNOWN_MOVE: return "unknown_move";
        case MoveFailure::NO_PP: return "no_pp";
        default: return "unknown";
    }
}

inline std::optional<MoveFailure> parse_move_failure(const std::string& s) {
    if (s == "none") return MoveFailure::NONE;
    if (s == "unknown_move") return MoveFailure::UNKNOWN_MOVE;
    if (s == "no_pp") return MoveFailure::NO_PP;
    return std::nullopt;
}

/**
 * TurnEvent - One entry of a turn log.
 *
 * `side` is the combatant the event is about (the actor for use_move,
 * the one whose HP changed for damage/heal events). Fields that do not
 * apply to an event type keep their defaults.
 */
struct TurnEvent {
    EventType type = EventType::USE_MOVE;
    std::optional<Side> side;
    std::string message;

    int amount = 0;                     // damage dealt or HP restored
    std::optional<int> remaining_hp;
    bool critical = false;
    double effectiveness = 1.0;

    MoveID move_id;
    StatusCondition status = StatusCondition::NONE;
    std::optional<StatKind> stat;

    // battle_end
    AgentID winner_id;
    EndReason reason = EndReason::NONE;

    // error
    MoveFailure failure = MoveFailure::NONE;

    TurnEvent() = default;
    TurnEvent(EventType t, std::optional<Side> s, std::string msg)
        : type(t), side(s), message(std::move(msg)) {}
};

/**
 * TurnLog - Everything that happened in one resolved turn.
 */
struct TurnLog {
    int turn_number = 0;
    std::optional<MoveID> move_a;   // std::nullopt = side A skipped (timeout)
    std::optional<MoveID> move_b;
    std::optional<Side> first_side;
    std::vector<TurnEvent> events;
    int agent_a_hp = 0;
    int agent_b_hp = 0;

    bool has_event(EventType type) const {
        for (const auto& e : events) {
            if (e.type == type) return true;
        }
        return false;
    }

    int count(EventType type) const {
        int n = 0;
        for (const auto& e : events) {
            if (e.type == type) n++;
        }
        return n;
    }

    const TurnEvent* find(EventType type) const {
        for (const auto& e : events) {
            if (e.type == type) return &e;
        }
        return nullptr;
    }
};

} // namespace clawcombat
