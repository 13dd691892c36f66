/**
 * ClawCombat Battle Engine - Move Definitions
 *
 * A move is immutable reference data. Its optional secondary effect is a
 * tagged union with one alternative per effect kind, each carrying only the
 * parameters that kind uses. The resolver dispatches on it with std::visit.
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <variant>

namespace clawcombat {

namespace effects {

// Move acts at priority +1 when its own priority field is 0
struct Priority {};

/**
 * Status infliction.
 *
 * chance == 0 means guaranteed on status moves and never on damaging
 * moves. target SELF + delay marks a rampage move that confuses its user.
 */
struct InflictStatus {
    StatusCondition status = StatusCondition::NONE;
    int chance = 0;
    EffectTarget target = EffectTarget::OPPONENT;
    bool delay = false;
};

struct StatBoost {
    StatKind stat = StatKind::ATTACK;
    int stages = 1;
    std::optional<StatKind> stat2;
    int stages2 = 1;
    int chance = 0;  // 0 = guaranteed (status moves only)
    EffectTarget target = EffectTarget::SELF;
};

struct StatDrop {
    StatKind stat = StatKind::ATTACK;
    int stages = 1;
    int chance = 0;  // 0 = 100%
    EffectTarget target = EffectTarget::OPPONENT;
};

// Percent of max HP on status moves, percent of damage dealt on damaging moves.
// delay = wish: 50% of max HP at the end of the next turn.
struct Heal {
    int percent = 50;
    bool delay = false;
};

struct Drain {
    int percent = 50;
};

struct Recoil {
    int percent = 25;
};

struct Flinch {
    int chance = 0;
};

struct HighCrit {
    double crit_rate = 12.5;  // percent
};

struct OneHitKO {};
struct LeechSeed {};
struct Curse {};
struct ResetStats {};

struct Focus {
    bool fail_if_hit = true;
};

struct HpScaling {};
struct DoubleIfPoisoned {};
struct UsePhysicalDef {};

} // namespace effects

using MoveEffect = std::variant<
    std::monostate,
    effects::Priority,
    effects::InflictStatus,
    effects::StatBoost,
    effects::StatDrop,
    effects::Heal,
    effects::Drain,
    effects::Recoil,
    effects::Flinch,
    effects::HighCrit,
    effects::OneHitKO,
    effects::LeechSeed,
    effects::Curse,
    effects::ResetStats,
    effects::Focus,
    effects::HpScaling,
    effects::DoubleIfPoisoned,
    effects::UsePhysicalDef
>;

/**
 * Move definition (immutable).
 */
struct MoveDef {
    MoveID id;
    std::string name;
    ElementType type = ElementType::NEUTRAL;
    MoveCategory category = MoveCategory::PHYSICAL;
    int power = 0;
    int accuracy = 100;
    int pp = 10;
    int priority = 0;
    std::string description;
    MoveEffect effect;

    bool is_damaging() const { return power > 0; }
    bool is_physical() const { return category == MoveCategory::PHYSICAL; }
    bool has_effect() const { return !std::holds_alternative<std::monostate>(effect); }

    template <typename T>
    const T* effect_as() const { return std::get_if<T>(&effect); }

    /**
     * Turn-order priority. A move tagged with a priority effect but no
     * explicit priority acts at +1.
     */
    int effective_priority() const {
        if (priority == 0 && std::holds_alternative<effects::Priority>(effect)) {
            return 1;
        }
        return priority;
    }
};

/**
 * Effect kind name as written in move data ("status", "stat_boost", ...).
 * Empty string for no effect.
 */
inline const char* effect_type_name(const MoveEffect& effect) {
    struct Namer {
        const char* operator()(const std::monostate&) const { return ""; }
        const char* operator()(const effects::Priority&) const { return "priority"; }
        const char* operator()(const effects::InflictStatus&) const { return "status"; }
        const char* operator()(const effects::StatBoost&) const { return "stat_boost"; }
        const char* operator()(const effects::StatDrop&) const { return "stat_drop"; }
        const char* operator()(const effects::Heal&) const { return "heal"; }
        const char* operator()(const effects::Drain&) const { return "drain"; }
        const char* operator()(const effects::Recoil&) const { return "recoil"; }
        const char* operator()(const effects::Flinch&) const { return "flinch"; }
        const char* operator()(const effects::HighCrit&) const { return "high_crit"; }
        const char* operator()(const effects::OneHitKO&) const { return "ohko"; }
        const char* operator()(const effects::LeechSeed&) const { return "leech_seed"; }
        const char* operator()(const effects::Curse&) const { return "curse"; }
        const char* operator()(const effects::ResetStats&) const { return "reset_stats"; }
        const char* operator()(const effects::Focus&) const { return "focus"; }
        const char* operator()(const effects::HpScaling&) const { return "hp_scaling"; }
        const char* operator()(const effects::DoubleIfPoisoned&) const { return "double_if_poisoned"; }
        const char* operator()(const effects::UsePhysicalDef&) const { return "use_physical_def"; }
    };
    return std::visit(Namer{}, effect);
}

} // namespace clawcombat
