/**
 * ClawCombat Battle Engine - Stat Scaling Implementation
 */

#include "stat_scaling.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace clawcombat {

namespace {

constexpr double STAGE_TABLE[] = {
    0.25, 0.29, 0.33, 0.40, 0.50, 0.67,  // -6 .. -1
    1.0,                                 //  0
    1.5, 2.0, 2.5, 3.0, 3.5, 4.0         // +1 .. +6
};

constexpr double LEVEL_GROWTH = 0.02;
constexpr double HP_MULTIPLIER = 3.0;
constexpr int HP_FLOOR = 20;
constexpr int STAT_FLOOR = 5;
constexpr double MOVE_POWER_GROWTH = 0.003;

double ev_contribution(int ev, int level) {
    return std::floor(static_cast<double>(ev) / 4.0) * (static_cast<double>(level) / 100.0);
}

std::string to_lower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::vector<Nature> build_natures() {
    using S = StatKind;
    return {
        {"Sturdy", std::nullopt, std::nullopt, "Balanced temperament"},
        {"Savage", S::ATTACK, S::DEFENSE, "Hits hard, guards little"},
        {"Fearless", S::ATTACK, S::SPEED, "Charges in without hurry"},
        {"Brutal", S::ATTACK, S::SP_ATK, "All muscle, no finesse"},
        {"Wild", S::ATTACK, S::SP_DEF, "Reckless brawler"},
        {"Defiant", S::DEFENSE, S::ATTACK, "Holds the line"},
        {"Balanced", std::nullopt, std::nullopt, "Even-keeled"},
        {"Sluggish", S::DEFENSE, S::SPEED, "Heavy shelled"},
        {"Vigilant", S::DEFENSE, S::SP_ATK, "Always on guard"},
        {"Relaxed", S::DEFENSE, S::SP_DEF, "Thick shell, thin nerves"},
        {"Evasive", S::SPEED, S::ATTACK, "Slippery in the water"},
        {"Rapid", S::SPEED, S::DEFENSE, "Fast but exposed"},
        {"Grim", std::nullopt, std::nullopt, "Stoic"},
        {"Energetic", S::SPEED, S::SP_ATK, "Never sits still"},
        {"Innocent", S::SPEED, S::SP_DEF, "Quick and carefree"},
        {"Calculated", S::SP_ATK, S::ATTACK, "Precise claw work"},
        {"Focused", S::SP_ATK, S::DEFENSE, "Single-minded"},
        {"Silent", S::SP_ATK, S::SPEED, "Patient striker"},
        {"Quiet", std::nullopt, std::nullopt, "Keeps to itself"},
        {"Impulsive", S::SP_ATK, S::SP_DEF, "Acts before thinking"},
        {"Tranquil", S::SP_DEF, S::ATTACK, "Calm under pressure"},
        {"Mellow", S::SP_DEF, S::DEFENSE, "Soft but resilient"},
        {"Stubborn", S::SP_DEF, S::SPEED, "Will not be moved"},
        {"Alert", S::SP_DEF, S::SP_ATK, "Reads every threat"},
        {"Eccentric", std::nullopt, std::nullopt, "Unpredictable"},
    };
}

// Legacy names from older agent records
const std::unordered_map<std::string, std::string>& legacy_nature_names() {
    static const std::unordered_map<std::string, std::string> legacy = {
        {"aggressive", "Brutal"},   {"defensive", "Defiant"},
        {"speedy", "Energetic"},    {"smart", "Calculated"},
        {"tough", "Vigilant"},      {"hardy", "Sturdy"},
        {"bold", "Defiant"},        {"modest", "Calculated"},
        {"calm", "Tranquil"},       {"timid", "Evasive"},
        {"lonely", "Savage"},       {"docile", "Balanced"},
        {"mild", "Focused"},        {"gentle", "Mellow"},
        {"hasty", "Rapid"},         {"adamant", "Brutal"},
        {"impish", "Vigilant"},     {"bashful", "Quiet"},
        {"careful", "Alert"},       {"rash", "Impulsive"},
        {"jolly", "Energetic"},     {"naughty", "Wild"},
        {"lax", "Relaxed"},         {"quirky", "Eccentric"},
        {"naive", "Innocent"},      {"brave", "Fearless"},
        {"sassy", "Stubborn"},      {"serious", "Grim"},
    };
    return legacy;
}

} // namespace

// ============================================================================
// STAT STAGES
// ============================================================================

double stat_stage_multiplier(int stage) {
    int clamped = std::clamp(stage, MIN_STAT_STAGE, MAX_STAT_STAGE);
    return STAGE_TABLE[clamped - MIN_STAT_STAGE];
}

// ============================================================================
// EVOLUTION TIERS
// ============================================================================

EvolutionTier evolution_tier(int level) {
    if (level >= 60) return EvolutionTier{3, "Final", 60, 100, 0.25};
    if (level >= 20) return EvolutionTier{2, "Evolved", 20, 59, 0.10};
    return EvolutionTier{1, "Basic", 1, 19, 0.0};
}

std::optional<EvolutionChange> check_evolution(int old_level, int new_level) {
    EvolutionTier old_tier = evolution_tier(old_level);
    EvolutionTier new_tier = evolution_tier(new_level);
    if (new_tier.tier > old_tier.tier) {
        return EvolutionChange{old_tier.tier, new_tier.tier, new_tier.name};
    }
    return std::nullopt;
}

// ============================================================================
// STAT FORMULAS
// ============================================================================

double level_multiplier(int level) {
    return 1.0 + (level - 1) * LEVEL_GROWTH;
}

int effective_hp(int base_hp, int level, int ev) {
    double tier_bonus = evolution_tier(level).stat_bonus;
    double scaled = base_hp * level_multiplier(level) * HP_MULTIPLIER * (1.0 + tier_bonus);
    return static_cast<int>(std::round(scaled + ev_contribution(ev, level) + HP_FLOOR));
}

int effective_stat(int base, int level, int ev, double nature_mod) {
    double tier_bonus = evolution_tier(level).stat_bonus;
    double scaled = base * level_multiplier(level) * (1.0 + tier_bonus) * nature_mod;
    return static_cast<int>(std::round(scaled + ev_contribution(ev, level) + STAT_FLOOR));
}

int effective_move_power(int power, int level) {
    if (power <= 0) return 0;
    double multiplier = 1.0 + (level - 1) * MOVE_POWER_GROWTH;
    return static_cast<int>(std::round(power * multiplier));
}

// ============================================================================
// NATURES
// ============================================================================

double nature_modifier(std::optional<StatKind> boost,
                       std::optional<StatKind> reduce,
                       StatKind stat) {
    if (boost && *boost == stat) return 1.1;
    if (reduce && *reduce == stat) return 0.9;
    return 1.0;
}

const std::vector<Nature>& all_natures() {
    static const std::vector<Nature> natures = build_natures();
    return natures;
}

const Nature* find_nature(const std::string& name) {
    std::string wanted = to_lower(name);

    auto legacy = legacy_nature_names().find(wanted);
    if (legacy != legacy_nature_names().end()) {
        wanted = to_lower(legacy->second);
    }

    for (const auto& nature : all_natures()) {
        if (to_lower(nature.name) == wanted) {
            return &nature;
        }
    }
    return nullptr;
}

} // namespace clawcombat
