/**
 * Tests for the damage formula
 *
 * All combatants are level 1 with default stats (22 attack, 22 defense,
 * 22 claw, 21 shell), so a neutral 40 power move has a base of 10.
 */

using namespace clawcombat;

namespace {

CombatantState fighter(ElementType type = ElementType::NEUTRAL, const std::string& ability = "") {
    BattleBuilder builder(test_moves());
    AgentProfile profile = make_profile("fighter", {"tackle"}, 16, type);
    profile.ability = ability;
    return builder.build_combatant(profile);
}

const MoveDef& move_def(const MoveID& id) {
    return *test_moves().get_move(id);
}

} // namespace

TEST(DamageCalculator, NeutralHitWithStab) {
    DamageCalculator calc;
    ScriptedRng rng({0.5, 0.5});
    DamageResult r = calc.calculate(fighter(), fighter(), move_def("tackle"), rng);

    // 10 * 1.5 STAB * 0.925 random
    TEST_ASSERT_EQ(13, r.damage);
    TEST_ASSERT_FALSE(r.critical);
    TEST_ASSERT_FALSE(r.immune);
    TEST_ASSERT_EQ(1.0, r.chart_effectiveness);
    TEST_ASSERT_EQ(2, rng.draws());
}

TEST(DamageCalculator, RandomFactorBounds) {
    DamageCalculator calc;

    ScriptedRng low({0.5, 0.0});
    TEST_ASSERT_EQ(12, calc.calculate(fighter(), fighter(), move_def("tackle"), low).damage);

    ScriptedRng high({0.5, 0.99});
    TEST_ASSERT_EQ(14, calc.calculate(fighter(), fighter(), move_def("tackle"), high).damage);
}

TEST(DamageCalculator, CriticalHit) {
    DamageCalculator calc;
    ScriptedRng rng({0.01, 0.5});
    DamageResult r = calc.calculate(fighter(), fighter(), move_def("tackle"), rng);

    TEST_ASSERT_TRUE(r.critical);
    TEST_ASSERT_EQ(17, r.damage);
}

TEST(DamageCalculator, CriticalIgnoresDefenderBoosts) {
    DamageCalculator calc;
    CombatantState defender = fighter();
    defender.stages.adjust(StatKind::DEFENSE, 2);

    ScriptedRng normal({0.5, 0.5});
    TEST_ASSERT_EQ(6, calc.calculate(fighter(), defender, move_def("tackle"), normal).damage);

    ScriptedRng crit({0.01, 0.5});
    TEST_ASSERT_EQ(17, calc.calculate(fighter(), defender, move_def("tackle"), crit).damage);
}

TEST(DamageCalculator, AttackStagesScale) {
    DamageCalculator calc;
    CombatantState attacker = fighter();
    attacker.stages.adjust(StatKind::ATTACK, 2);

    ScriptedRng rng({0.5, 0.5});
    TEST_ASSERT_EQ(27, calc.calculate(attacker, fighter(), move_def("tackle"), rng).damage);
}

TEST(DamageCalculator, TypeEffectivenessIsCapped) {
    DamageCalculator calc;
    ScriptedRng rng({0.5, 0.5});
    DamageResult r = calc.calculate(fighter(), fighter(ElementType::GRASS), move_def("ember"), rng);

    TEST_ASSERT_EQ(2.0, r.chart_effectiveness);
    TEST_ASSERT_EQ(1.5, r.type_effectiveness);
    // 22/21 * 40 * 0.25 * 1.5 * 0.925
    TEST_ASSERT_EQ(14, r.damage);
}

TEST(DamageCalculator, ImmuneConsumesNoDraws) {
    DamageCalculator calc;
    ScriptedRng rng;
    DamageResult r = calc.calculate(fighter(), fighter(ElementType::GHOST), move_def("tackle"), rng);

    TEST_ASSERT_TRUE(r.immune);
    TEST_ASSERT_EQ(0, r.damage);
    TEST_ASSERT_EQ(0.0, r.type_effectiveness);
    TEST_ASSERT_EQ(0, rng.draws());
}

TEST(DamageCalculator, StatusMoveDealsNothing) {
    DamageCalculator calc;
    ScriptedRng rng;
    DamageResult r = calc.calculate(fighter(), fighter(), move_def("swords_dance"), rng);
    TEST_ASSERT_EQ(0, r.damage);
    TEST_ASSERT_EQ(0, rng.draws());
}

TEST(DamageCalculator, BurnHalvesPhysicalOnly) {
    DamageCalculator calc;
    CombatantState attacker = fighter();
    attacker.inflict(StatusCondition::BURNED);

    ScriptedRng physical({0.5, 0.5});
    TEST_ASSERT_EQ(6, calc.calculate(attacker, fighter(), move_def("tackle"), physical).damage);

    // Special: 22/21 * 40 * 0.25 * 0.925, no STAB
    ScriptedRng special({0.5, 0.5});
    TEST_ASSERT_EQ(9, calc.calculate(attacker, fighter(), move_def("ember"), special).damage);
}

TEST(DamageCalculator, DoubleAgainstPoisoned) {
    DamageCalculator calc;
    CombatantState defender = fighter();

    ScriptedRng plain({0.5, 0.5});
    TEST_ASSERT_EQ(15, calc.calculate(fighter(), defender, move_def("venoshock"), plain).damage);

    defender.inflict(StatusCondition::POISON);
    ScriptedRng poisoned({0.5, 0.5});
    TEST_ASSERT_EQ(31, calc.calculate(fighter(), defender, move_def("venoshock"), poisoned).damage);
}

TEST(DamageCalculator, AtLeastOneDamage) {
    DamageCalculator calc;
    CombatantState attacker = fighter();
    attacker.effective_stats.attack = 1;
    CombatantState defender = fighter();
    defender.effective_stats.defense = 500;

    ScriptedRng rng({0.5, 0.5});
    TEST_ASSERT_EQ(1, calc.calculate(attacker, defender, move_def("tackle"), rng).damage);
}

TEST(DamageCalculator, AdaptabilityRaisesStab) {
    DamageCalculator calc;
    ScriptedRng rng({0.5, 0.5});
    // 10 * 2.0 * 0.925
    TEST_ASSERT_EQ(18, calc.calculate(fighter(ElementType::NEUTRAL, "Adaptability"), fighter(),
                                      move_def("tackle"), rng).damage);
}

TEST(DamageCalculator, SolidRockSoftensSuperEffective) {
    DamageCalculator calc;
    ScriptedRng rng({0.5, 0.5});
    DamageResult r = calc.calculate(fighter(), fighter(ElementType::GRASS, "Solid Rock"),
                                    move_def("ember"), rng);
    TEST_ASSERT_EQ(1.25, r.type_effectiveness);
    TEST_ASSERT_EQ(2.0, r.chart_effectiveness);
    TEST_ASSERT_EQ(12, r.damage);
}
