/**
 * Tests for the type chart, stat scaling and the battle RNG
 */

using namespace clawcombat;

// ============================================================================
// TYPE CHART
// ============================================================================

TEST(TypeChart, SuperEffectiveAndResisted) {
    TEST_ASSERT_EQ(2.0, effectiveness(ElementType::FIRE, ElementType::GRASS));
    TEST_ASSERT_EQ(0.5, effectiveness(ElementType::FIRE, ElementType::WATER));
    TEST_ASSERT_EQ(2.0, effectiveness(ElementType::WATER, ElementType::FIRE));
    TEST_ASSERT_EQ(1.0, effectiveness(ElementType::FIRE, ElementType::NEUTRAL));
}

TEST(TypeChart, Immunities) {
    TEST_ASSERT_EQ(0.0, effectiveness(ElementType::NEUTRAL, ElementType::GHOST));
    TEST_ASSERT_EQ(0.0, effectiveness(ElementType::ELECTRIC, ElementType::EARTH));
    TEST_ASSERT_EQ(0.0, effectiveness(ElementType::DRAGON, ElementType::MYSTIC));
    TEST_ASSERT_TRUE(is_immune(effectiveness(ElementType::GHOST, ElementType::NEUTRAL)));
}

TEST(TypeChart, EveryCellIsAKnownMultiplier) {
    for (ElementType attack : ALL_ELEMENT_TYPES) {
        for (ElementType defend : ALL_ELEMENT_TYPES) {
            double e = effectiveness(attack, defend);
            TEST_ASSERT_TRUE(e == 0.0 || e == 0.5 || e == 1.0 || e == 2.0);
        }
    }
}

TEST(TypeChart, StringLookupFallsBackToNeutral) {
    TEST_ASSERT_EQ(2.0, effectiveness(std::string("FIRE"), std::string("GRASS")));
    TEST_ASSERT_EQ(1.0, effectiveness(std::string("LAVA"), std::string("GRASS")));
    TEST_ASSERT_EQ(1.0, effectiveness(std::string("fire"), std::string("GRASS")));
}

TEST(TypeChart, Classification) {
    TEST_ASSERT_TRUE(is_super_effective(2.0));
    TEST_ASSERT_FALSE(is_super_effective(1.5));
    TEST_ASSERT_TRUE(is_not_very_effective(0.5));
    TEST_ASSERT_FALSE(is_not_very_effective(0.0));
}

// ============================================================================
// STAT SCALING
// ============================================================================

TEST(StatScaling, StageMultipliers) {
    TEST_ASSERT_EQ(1.0, stat_stage_multiplier(0));
    TEST_ASSERT_EQ(2.0, stat_stage_multiplier(2));
    TEST_ASSERT_EQ(0.67, stat_stage_multiplier(-1));
    TEST_ASSERT_EQ(0.25, stat_stage_multiplier(-6));
    // Clamped
    TEST_ASSERT_EQ(4.0, stat_stage_multiplier(9));
    TEST_ASSERT_EQ(0.25, stat_stage_multiplier(-9));
}

TEST(StatScaling, EvolutionTiers) {
    TEST_ASSERT_EQ(1, evolution_tier(1).tier);
    TEST_ASSERT_EQ(std::string("Basic"), evolution_tier(19).name);
    TEST_ASSERT_EQ(2, evolution_tier(20).tier);
    TEST_ASSERT_EQ(std::string("Evolved"), evolution_tier(59).name);
    TEST_ASSERT_EQ(3, evolution_tier(60).tier);
    TEST_ASSERT_EQ(0.25, evolution_tier(100).stat_bonus);
}

TEST(StatScaling, CheckEvolution) {
    auto change = check_evolution(19, 20);
    TEST_ASSERT_TRUE(change.has_value());
    TEST_ASSERT_EQ(1, change->from_tier);
    TEST_ASSERT_EQ(2, change->to_tier);
    TEST_ASSERT_EQ(std::string("Evolved"), change->tier_name);

    TEST_ASSERT_FALSE(check_evolution(20, 59).has_value());
    TEST_ASSERT_FALSE(check_evolution(60, 30).has_value());
}

TEST(StatScaling, EffectiveHp) {
    TEST_ASSERT_EQ(71, effective_hp(17, 1));
    // 17 * 1.38 * 3 * 1.1 + 20 = 97.4
    TEST_ASSERT_EQ(97, effective_hp(17, 20));
}

TEST(StatScaling, EffectiveStat) {
    TEST_ASSERT_EQ(22, effective_stat(17, 1));
    TEST_ASSERT_EQ(21, effective_stat(16, 1));
    // Nature boost: 17 * 1.1 + 5 = 23.7
    TEST_ASSERT_EQ(24, effective_stat(17, 1, 0, 1.1));
    // EVs: floor(100 / 4) * 50 / 100 = 12.5 on top of 17 * 1.98 * 1.1 + 5
    TEST_ASSERT_EQ(55, effective_stat(17, 50, 100));
}

TEST(StatScaling, MovePowerScalesWithLevel) {
    TEST_ASSERT_EQ(40, effective_move_power(40, 1));
    TEST_ASSERT_EQ(103, effective_move_power(100, 11));
    TEST_ASSERT_EQ(0, effective_move_power(0, 50));
}

TEST(StatScaling, Natures) {
    TEST_ASSERT_EQ(size_t(25), all_natures().size());

    const Nature* brutal = find_nature("brutal");
    TEST_ASSERT_NOT_NULL(brutal);
    TEST_ASSERT_TRUE(brutal->boost == StatKind::ATTACK);
    TEST_ASSERT_TRUE(brutal->reduce == StatKind::SP_ATK);

    // Legacy names resolve to their current equivalents
    const Nature* adamant = find_nature("Adamant");
    TEST_ASSERT_NOT_NULL(adamant);
    TEST_ASSERT_EQ(std::string("Brutal"), adamant->name);

    TEST_ASSERT_NULL(find_nature("Sleepy"));
}

TEST(StatScaling, NatureModifier) {
    TEST_ASSERT_EQ(1.1, nature_modifier(StatKind::SPEED, StatKind::ATTACK, StatKind::SPEED));
    TEST_ASSERT_EQ(0.9, nature_modifier(StatKind::SPEED, StatKind::ATTACK, StatKind::ATTACK));
    TEST_ASSERT_EQ(1.0, nature_modifier(std::nullopt, std::nullopt, StatKind::SPEED));
}

// ============================================================================
// BATTLE RNG
// ============================================================================

TEST(BattleRng, SameSeedSameSequence) {
    BattleRng a(1234);
    BattleRng b(1234);
    for (int i = 0; i < 10; i++) {
        TEST_ASSERT_EQ(a.uniform(), b.uniform());
    }
}

TEST(BattleRng, SavedStateResumesSequence) {
    BattleRng rng(99);
    rng.uniform();
    rng.uniform();
    std::string saved = rng.save_state();
    double next = rng.uniform();

    BattleRng restored(1);
    TEST_ASSERT_TRUE(restored.restore_state(saved));
    TEST_ASSERT_EQ(next, restored.uniform());
}

TEST(BattleRng, RejectsGarbageState) {
    BattleRng rng(5);
    double expected = BattleRng(5).uniform();
    TEST_ASSERT_FALSE(rng.restore_state("not a state"));
    TEST_ASSERT_EQ(expected, rng.uniform());
}

TEST(BattleRng, UniformIntStaysInRange) {
    BattleRng rng(42);
    for (int i = 0; i < 200; i++) {
        int v = rng.uniform_int(2, 5);
        TEST_ASSERT_TRUE(v >= 2 && v <= 5);
    }
    TEST_ASSERT_EQ(3, rng.uniform_int(3, 3));
}
