/**
 * ClawCombat Battle Engine - Ability Table Implementation
 *
 * Registration of the 36 standard abilities, two per type, grouped by the
 * concern they touch.
 */

#include "ability_table.hpp"
#include <algorithm>

namespace clawcombat {

namespace {

AbilityDef make_ability(const std::string& name, ElementType type,
                        const std::string& description, AbilityTrigger trigger) {
    AbilityDef def;
    def.name = name;
    def.type = type;
    def.description = description;
    def.trigger = trigger;
    return def;
}

// "+30% <type> moves when HP < 33%"
DamageModCallback pinch_boost(ElementType boosted) {
    return [boosted](const HitContext& hit) {
        if (hit.move.type == boosted && hit.attacker.hp_ratio() < 0.33) return 1.3;
        return 1.0;
    };
}

DamageModCallback bonus_against(std::vector<ElementType> targets, double factor) {
    return [targets, factor](const HitContext& hit) {
        for (ElementType t : targets) {
            if (hit.defender.type == t) return factor;
        }
        return 1.0;
    };
}

// Super-effective hits are capped at `cap`
EffectivenessCallback super_effective_cap(double cap) {
    return [cap](double eff) { return eff > 1.0 ? std::min(eff, cap) : eff; };
}

// ============================================================================
// BATTLE START
// ============================================================================

void register_battle_start(AbilityTable& table) {
    auto sand_force = make_ability("Sand Force", ElementType::EARTH, "+15% atk/def",
                                   AbilityTrigger::BATTLE_START);
    sand_force.start_changes = {{StatKind::ATTACK, 1.15, EffectTarget::SELF},
                                {StatKind::DEFENSE, 1.15, EffectTarget::SELF}};
    sand_force.start_message = [](const std::string& self, const std::string&) {
        return self + "'s Sand Force boosted its Attack and Defense!";
    };
    table.register_ability(std::move(sand_force));

    auto aerilate = make_ability("Aerilate", ElementType::AIR, "+20% speed",
                                 AbilityTrigger::BATTLE_START);
    aerilate.start_changes = {{StatKind::SPEED, 1.2, EffectTarget::SELF}};
    aerilate.start_message = [](const std::string& self, const std::string&) {
        return self + "'s Aerilate boosted its Speed!";
    };
    table.register_ability(std::move(aerilate));

    auto dragon_force = make_ability("Dragon Force", ElementType::DRAGON, "+10% Attack and Claw",
                                     AbilityTrigger::BATTLE_START);
    dragon_force.start_changes = {{StatKind::ATTACK, 1.10, EffectTarget::SELF},
                                  {StatKind::SP_ATK, 1.10, EffectTarget::SELF}};
    dragon_force.start_message = [](const std::string& self, const std::string&) {
        return self + "'s Dragon Force boosted its Attack and Claw!";
    };
    table.register_ability(std::move(dragon_force));

    auto intimidate = make_ability("Intimidate", ElementType::SHADOW, "-15% opponent atk at start",
                                   AbilityTrigger::BATTLE_START);
    intimidate.start_changes = {{StatKind::ATTACK, 0.85, EffectTarget::OPPONENT}};
    intimidate.start_message = [](const std::string& self, const std::string& opponent) {
        return self + "'s Intimidate lowered " + opponent + "'s Attack!";
    };
    table.register_ability(std::move(intimidate));

    auto heavy_metal = make_ability("Heavy Metal", ElementType::METAL, "+20% def, -10% speed",
                                    AbilityTrigger::BATTLE_START);
    heavy_metal.start_changes = {{StatKind::DEFENSE, 1.20, EffectTarget::SELF},
                                 {StatKind::SPEED, 0.90, EffectTarget::SELF}};
    heavy_metal.start_message = [](const std::string& self, const std::string&) {
        return self + "'s Heavy Metal boosted Defense but lowered Speed!";
    };
    table.register_ability(std::move(heavy_metal));

    auto charm = make_ability("Charm", ElementType::MYSTIC, "-15% opponent atk at start",
                              AbilityTrigger::BATTLE_START);
    charm.start_changes = {{StatKind::ATTACK, 0.85, EffectTarget::OPPONENT}};
    charm.start_message = [](const std::string& self, const std::string& opponent) {
        return self + "'s Charm lowered " + opponent + "'s Attack!";
    };
    table.register_ability(std::move(charm));
}

// ============================================================================
// DAMAGE
// ============================================================================

void register_damage_modifiers(AbilityTable& table) {
    auto blaze = make_ability("Blaze", ElementType::FIRE, "+30% fire moves when HP < 33%",
                              AbilityTrigger::DAMAGE_CALC);
    blaze.damage_dealt_mod = pinch_boost(ElementType::FIRE);
    table.register_ability(std::move(blaze));

    auto torrent = make_ability("Torrent", ElementType::WATER, "+30% water moves when HP < 33%",
                                AbilityTrigger::DAMAGE_CALC);
    torrent.damage_dealt_mod = pinch_boost(ElementType::WATER);
    table.register_ability(std::move(torrent));

    auto overgrow = make_ability("Overgrow", ElementType::GRASS, "+30% grass moves when HP < 33%",
                                 AbilityTrigger::DAMAGE_CALC);
    overgrow.damage_dealt_mod = pinch_boost(ElementType::GRASS);
    table.register_ability(std::move(overgrow));

    auto swarm = make_ability("Swarm", ElementType::INSECT, "+30% bug moves when HP < 33%",
                              AbilityTrigger::DAMAGE_CALC);
    swarm.damage_dealt_mod = pinch_boost(ElementType::INSECT);
    table.register_ability(std::move(swarm));

    auto guts = make_ability("Guts", ElementType::MARTIAL, "+30% atk when statused",
                             AbilityTrigger::DAMAGE_CALC);
    guts.damage_dealt_mod = [](const HitContext& hit) {
        return hit.attacker.has_status() ? 1.3 : 1.0;
    };
    table.register_ability(std::move(guts));

    auto iron_fist = make_ability("Iron Fist", ElementType::MARTIAL, "+10% physical moves",
                                  AbilityTrigger::DAMAGE_CALC);
    iron_fist.damage_dealt_mod = [](const HitContext& hit) {
        return hit.move.is_physical() ? 1.1 : 1.0;
    };
    table.register_ability(std::move(iron_fist));

    auto corrosion = make_ability("Corrosion", ElementType::VENOM, "Ignore 15% defense",
                                  AbilityTrigger::DAMAGE_CALC);
    corrosion.target_defense_mod = 0.85;
    table.register_ability(std::move(corrosion));

    auto dark_aura = make_ability("Dark Aura", ElementType::SHADOW, "+15% vs Psychic/Ghost/Fairy",
                                  AbilityTrigger::DAMAGE_CALC);
    dark_aura.damage_dealt_mod = bonus_against(
        {ElementType::PSYCHE, ElementType::GHOST, ElementType::MYSTIC}, 1.15);
    table.register_ability(std::move(dark_aura));

    auto pixilate = make_ability("Pixilate", ElementType::MYSTIC, "+15% vs Dragon/Dark/Fighting",
                                 AbilityTrigger::DAMAGE_CALC);
    pixilate.damage_dealt_mod = bonus_against(
        {ElementType::DRAGON, ElementType::SHADOW, ElementType::MARTIAL}, 1.15);
    table.register_ability(std::move(pixilate));

    auto multiscale = make_ability("Multiscale", ElementType::DRAGON, "25% less damage when HP full",
                                   AbilityTrigger::DAMAGE_TAKEN);
    multiscale.damage_taken_mod = [](const HitContext& hit) {
        return hit.defender.at_full_hp() ? 0.75 : 1.0;
    };
    table.register_ability(std::move(multiscale));

    auto resilience = make_ability("Resilience", ElementType::NEUTRAL, "Super-effective hits do 0.75x",
                                   AbilityTrigger::DAMAGE_TAKEN);
    resilience.adjust_effectiveness = [](double eff) { return eff > 1.0 ? eff * 0.75 : eff; };
    table.register_ability(std::move(resilience));

    auto solid_rock = make_ability("Solid Rock", ElementType::STONE, "Super-effective = 1.5x instead of 2.0x",
                                   AbilityTrigger::DAMAGE_TAKEN);
    solid_rock.adjust_effectiveness = super_effective_cap(1.25);
    table.register_ability(std::move(solid_rock));

    auto filter = make_ability("Filter", ElementType::METAL, "Super-effective = 1.5x",
                               AbilityTrigger::DAMAGE_TAKEN);
    filter.adjust_effectiveness = super_effective_cap(1.25);
    table.register_ability(std::move(filter));

    auto adaptability = make_ability("Adaptability", ElementType::NEUTRAL, "STAB is 2.0 instead of 1.5",
                                     AbilityTrigger::STAB_CALC);
    adaptability.stab_multiplier = 2.0;
    table.register_ability(std::move(adaptability));
}

// ============================================================================
// HIT INTERACTION (before / after)
// ============================================================================

void register_hit_interaction(AbilityTable& table) {
    auto volt_absorb = make_ability("Volt Absorb", ElementType::ELECTRIC, "Immune to electric, heal 25% HP",
                                    AbilityTrigger::BEFORE_HIT);
    volt_absorb.immune_type = ElementType::ELECTRIC;
    volt_absorb.absorb_heal_fraction = 0.25;
    table.register_ability(std::move(volt_absorb));

    auto levitate = make_ability("Levitate", ElementType::GHOST, "Immune to ground",
                                 AbilityTrigger::BEFORE_HIT);
    levitate.immune_type = ElementType::EARTH;
    table.register_ability(std::move(levitate));

    auto sand_veil = make_ability("Sand Veil", ElementType::EARTH, "10% dodge chance",
                                  AbilityTrigger::BEFORE_HIT);
    sand_veil.dodge_chance = 0.10;
    table.register_ability(std::move(sand_veil));

    auto telepathy = make_ability("Telepathy", ElementType::PSYCHE, "10% dodge chance",
                                  AbilityTrigger::BEFORE_HIT);
    telepathy.dodge_chance = 0.10;
    table.register_ability(std::move(telepathy));

    auto inferno = make_ability("Inferno", ElementType::FIRE, "15% chance to burn on hit",
                                AbilityTrigger::AFTER_HIT);
    inferno.proc_chance = 0.15;
    inferno.on_hit_status = StatusCondition::BURNED;
    inferno.on_hit_verb = "burned";
    table.register_ability(std::move(inferno));

    auto permafrost = make_ability("Permafrost", ElementType::ICE, "10% freeze on hit",
                                   AbilityTrigger::AFTER_HIT);
    permafrost.proc_chance = 0.10;
    permafrost.on_hit_status = StatusCondition::FREEZE;
    permafrost.on_hit_verb = "froze";
    table.register_ability(std::move(permafrost));

    auto poison_touch = make_ability("Poison Touch", ElementType::VENOM, "15% poison on hit",
                                     AbilityTrigger::AFTER_HIT);
    poison_touch.proc_chance = 0.15;
    poison_touch.on_hit_status = StatusCondition::POISON;
    poison_touch.on_hit_verb = "poisoned";
    table.register_ability(std::move(poison_touch));

    auto stat = make_ability("Static", ElementType::ELECTRIC, "20% paralyze on contact",
                             AbilityTrigger::AFTER_HIT_RECEIVED);
    stat.proc_chance = 0.20;
    stat.retaliate_status = StatusCondition::PARALYSIS;
    stat.retaliate_physical_only = true;
    stat.on_hit_verb = "paralyzed";
    table.register_ability(std::move(stat));

    auto cursed_body = make_ability("Cursed Body", ElementType::GHOST, "20% reduce opponent best stat by 1",
                                    AbilityTrigger::AFTER_HIT_RECEIVED);
    cursed_body.proc_chance = 0.20;
    cursed_body.retaliate_stage_drop = true;
    table.register_ability(std::move(cursed_body));
}

// ============================================================================
// MISC (turn order, accuracy, end of turn, survival)
// ============================================================================

void register_misc(AbilityTable& table) {
    auto gale_wings = make_ability("Gale Wings", ElementType::AIR, "Always go first when HP full",
                                   AbilityTrigger::SPEED_CALC);
    gale_wings.priority_bonus = [](const CombatantState& self) {
        return self.at_full_hp() ? 1 : 0;
    };
    table.register_ability(std::move(gale_wings));

    auto compound_eyes = make_ability("Compound Eyes", ElementType::INSECT, "+30% accuracy",
                                      AbilityTrigger::ACCURACY_CALC);
    compound_eyes.accuracy_mod = 1.3;
    table.register_ability(std::move(compound_eyes));

    auto hydration = make_ability("Hydration", ElementType::WATER, "Heal 6.25% HP per turn",
                                  AbilityTrigger::END_TURN);
    hydration.end_turn_heal_fraction = 0.0625;
    table.register_ability(std::move(hydration));

    auto photosynthesis = make_ability("Photosynthesis", ElementType::GRASS, "Heal 6.25% HP per turn",
                                       AbilityTrigger::END_TURN);
    photosynthesis.end_turn_heal_fraction = 0.0625;
    table.register_ability(std::move(photosynthesis));

    auto ice_body = make_ability("Ice Body", ElementType::ICE, "Heal 6.25% HP per turn",
                                 AbilityTrigger::END_TURN);
    ice_body.end_turn_heal_fraction = 0.0625;
    table.register_ability(std::move(ice_body));

    auto magic_guard = make_ability("Magic Guard", ElementType::PSYCHE, "Immune to status damage",
                                    AbilityTrigger::STATUS_DAMAGE);
    magic_guard.status_damage_immune = true;
    table.register_ability(std::move(magic_guard));

    auto sturdy = make_ability("Sturdy", ElementType::STONE, "Survive any hit with 1 HP once",
                               AbilityTrigger::BEFORE_FAINT);
    sturdy.survive_lethal_once = true;
    table.register_ability(std::move(sturdy));
}

} // anonymous namespace

void AbilityTable::register_ability(AbilityDef def) {
    std::string key = def.name;
    if (abilities_.find(key) == abilities_.end()) {
        order_.push_back(key);
    }
    abilities_[key] = std::move(def);
}

const AbilityDef* AbilityTable::get(const std::string& name) const {
    if (name.empty()) return nullptr;
    auto it = abilities_.find(name);
    if (it != abilities_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::vector<std::string> AbilityTable::abilities_for_type(ElementType type) const {
    std::vector<std::string> names;
    for (const auto& name : order_) {
        if (abilities_.at(name).type == type) {
            names.push_back(name);
        }
    }
    return names;
}

const AbilityTable& AbilityTable::standard() {
    static const AbilityTable table = [] {
        AbilityTable t;
        register_battle_start(t);
        register_damage_modifiers(t);
        register_hit_interaction(t);
        register_misc(t);
        return t;
    }();
    return table;
}

} // namespace clawcombat
