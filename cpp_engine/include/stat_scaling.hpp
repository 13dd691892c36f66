/**
 * ClawCombat Battle Engine - Stat Scaling
 *
 * Level, EV, nature and evolution-tier scaling of base stats, the battle
 * stage multiplier table, and the nature table.
 *
 * Everything here is pure. Evolution tier is always derived from the level
 * passed in and is never cached.
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace clawcombat {

// ============================================================================
// STAT STAGES
// ============================================================================

constexpr int MIN_STAT_STAGE = -6;
constexpr int MAX_STAT_STAGE = 6;

/**
 * Multiplier for a battle stage. Input is clamped to [-6, +6].
 * Stage 0 returns exactly 1.0.
 */
double stat_stage_multiplier(int stage);

// ============================================================================
// EVOLUTION TIERS
// ============================================================================

struct EvolutionTier {
    int tier = 1;
    std::string name = "Basic";
    int min_level = 1;
    int max_level = 19;
    double stat_bonus = 0.0;
};

/**
 * Tier for a level: 1-19 Basic (+0%), 20-59 Evolved (+10%), 60-100 Final (+25%).
 */
EvolutionTier evolution_tier(int level);

/**
 * Tier change caused by a level change.
 */
struct EvolutionChange {
    int from_tier = 1;
    int to_tier = 1;
    std::string tier_name;
};

/**
 * Returns the new tier when `new_level` crosses into a higher tier than
 * `old_level`, std::nullopt otherwise.
 */
std::optional<EvolutionChange> check_evolution(int old_level, int new_level);

// ============================================================================
// STAT FORMULAS
// ============================================================================

double level_multiplier(int level);

/**
 * Effective HP:
 *   round(base * level_mult * 3.0 * (1 + tier_bonus) + floor(ev/4) * level/100 + 20)
 */
int effective_hp(int base_hp, int level, int ev = 0);

/**
 * Effective non-HP stat:
 *   round(base * level_mult * (1 + tier_bonus) * nature_mod + floor(ev/4) * level/100 + 5)
 */
int effective_stat(int base, int level, int ev = 0, double nature_mod = 1.0);

/**
 * Level-scaled move power, +0.3% per level. Status moves (power 0) stay 0.
 */
int effective_move_power(int power, int level);

// ============================================================================
// NATURES
// ============================================================================

/**
 * A nature boosts one stat by 10% and reduces another by 10%.
 * Neutral natures have neither.
 */
struct Nature {
    std::string name;
    std::optional<StatKind> boost;
    std::optional<StatKind> reduce;
    std::string description;
};

/**
 * 1.1 when `stat` is boosted, 0.9 when reduced, 1.0 otherwise.
 */
double nature_modifier(std::optional<StatKind> boost,
                       std::optional<StatKind> reduce,
                       StatKind stat);

/**
 * All 25 natures, in table order.
 */
const std::vector<Nature>& all_natures();

/**
 * Case-insensitive lookup. Legacy nature names ("Adamant", "Timid", ...)
 * resolve to their current equivalents. Returns nullptr if unknown.
 */
const Nature* find_nature(const std::string& name);

} // namespace clawcombat
