/**
 * Tests for AI move scoring and selection
 */

using namespace clawcombat;

namespace {

CombatantState ai_combatant(std::vector<MoveID> moves, ElementType type = ElementType::NEUTRAL) {
    BattleBuilder builder(test_moves());
    return builder.build_combatant(make_profile("ai", std::move(moves), 16, type));
}

} // namespace

TEST(AIStrategist, EstimateDamage) {
    CombatantState a = ai_combatant({"tackle"});
    CombatantState d = ai_combatant({"tackle"});
    const MoveDef& tackle = *test_moves().get_move("tackle");

    // 40 * 22/22 * 0.5
    TEST_ASSERT_EQ(20, AIStrategist::estimate_damage(a, d, tackle, 1.0));
    TEST_ASSERT_EQ(1, AIStrategist::estimate_damage(a, d, tackle, 0.0));
    TEST_ASSERT_EQ(0, AIStrategist::estimate_damage(a, d, *test_moves().get_move("wish"), 1.0));
}

TEST(AIStrategist, PlainMoveScoresBase) {
    AIStrategist ai;
    CombatantState a = ai_combatant({"tackle"});
    CombatantState d = ai_combatant({"tackle"});
    TEST_ASSERT_EQ(50.0, ai.evaluate_move(a, d, *test_moves().get_move("tackle")));
}

TEST(AIStrategist, SuperEffectiveAndStatusValue) {
    AIStrategist ai;
    CombatantState a = ai_combatant({"ember"});
    CombatantState d = ai_combatant({"tackle"}, ElementType::GRASS);
    const MoveDef& ember = *test_moves().get_move("ember");

    // 50 + 30 super effective + 10 significant damage + 15 burn chance, clamped
    TEST_ASSERT_EQ(100.0, ai.evaluate_move(a, d, ember));

    d.inflict(StatusCondition::POISON);
    TEST_ASSERT_EQ(90.0, ai.evaluate_move(a, d, ember));
}

TEST(AIStrategist, ImmuneMovesScoreLow) {
    AIStrategist ai;
    CombatantState a = ai_combatant({"tackle"});
    CombatantState d = ai_combatant({"tackle"}, ElementType::GHOST);
    TEST_ASSERT_EQ(10.0, ai.evaluate_move(a, d, *test_moves().get_move("tackle")));
}

TEST(AIStrategist, KillShotAndAccuracyPenalty) {
    AIStrategist ai;
    CombatantState a = ai_combatant({"tackle"});
    CombatantState d = ai_combatant({"tackle"});
    d.current_hp = 15;
    TEST_ASSERT_EQ(75.0, ai.evaluate_move(a, d, *test_moves().get_move("tackle")));

    // 90% accuracy costs 2 points, +15 for a status against a clean target
    d.current_hp = d.max_hp;
    TEST_ASSERT_EQ(63.0, ai.evaluate_move(a, d, *test_moves().get_move("thunder_wave")));
}

TEST(AIStrategist, HealingWhenLow) {
    AIStrategist ai;
    CombatantState a = ai_combatant({"wish"});
    CombatantState d = ai_combatant({"tackle"});
    const MoveDef& wish = *test_moves().get_move("wish");

    TEST_ASSERT_EQ(50.0, ai.evaluate_move(a, d, wish));
    a.current_hp = 20;
    TEST_ASSERT_EQ(70.0, ai.evaluate_move(a, d, wish));
}

TEST(AIStrategist, LowHpAggression) {
    AIStrategist ai;
    CombatantState a = ai_combatant({"tackle"});
    CombatantState d = ai_combatant({"tackle"});
    a.current_hp = 10;
    TEST_ASSERT_EQ(60.0, ai.evaluate_move(a, d, *test_moves().get_move("tackle")));
}

TEST(AIStrategist, RankMovesBestFirst) {
    AIStrategist ai;
    CombatantState a = ai_combatant({"tackle", "ember", "swords_dance"});
    CombatantState d = ai_combatant({"tackle"}, ElementType::GRASS);

    std::vector<ScoredMove> ranked = ai.rank_moves(a, d);
    TEST_ASSERT_EQ(size_t(3), ranked.size());
    TEST_ASSERT_EQ(std::string("ember"), ranked[0].move_id);
    // Equal scores keep slot order
    TEST_ASSERT_EQ(std::string("tackle"), ranked[1].move_id);
    TEST_ASSERT_EQ(std::string("swords_dance"), ranked[2].move_id);
}

TEST(AIStrategist, HardTakesBestUsableMove) {
    AIStrategist ai(Difficulty::HARD);
    CombatantState a = ai_combatant({"tackle", "ember"});
    CombatantState d = ai_combatant({"tackle"}, ElementType::GRASS);
    ScriptedRng rng;

    TEST_ASSERT_EQ(std::string("ember"), ai.choose(a, d, rng));
    TEST_ASSERT_EQ(0, rng.draws());

    a.find_move("ember")->current_pp = 0;
    TEST_ASSERT_EQ(std::string("tackle"), ai.choose(a, d, rng));
}

TEST(AIStrategist, NoPpFallsBackToFirstMove) {
    AIStrategist ai(Difficulty::HARD);
    CombatantState a = ai_combatant({"tackle", "ember"});
    CombatantState d = ai_combatant({"tackle"});
    ScriptedRng rng;

    for (auto& slot : a.moves) slot.current_pp = 0;
    TEST_ASSERT_EQ(std::string("tackle"), ai.choose(a, d, rng));

    a.moves.clear();
    TEST_ASSERT_TRUE(ai.choose(a, d, rng).empty());
}

TEST(AIStrategist, EasyPicksUniformly) {
    AIStrategist ai(Difficulty::EASY);
    CombatantState a = ai_combatant({"tackle", "ember", "swords_dance"});
    CombatantState d = ai_combatant({"tackle"}, ElementType::GRASS);

    ScriptedRng low({0.1});
    TEST_ASSERT_EQ(std::string("tackle"), ai.choose(a, d, low));
    ScriptedRng high({0.7});
    TEST_ASSERT_EQ(std::string("swords_dance"), ai.choose(a, d, high));
}

TEST(AIStrategist, NormalUsuallyTakesBest) {
    AIStrategist ai(Difficulty::NORMAL);
    CombatantState a = ai_combatant({"tackle", "ember", "swords_dance"});
    CombatantState d = ai_combatant({"tackle"}, ElementType::GRASS);

    ScriptedRng best({0.5});
    TEST_ASSERT_EQ(std::string("ember"), ai.choose(a, d, best));
    ScriptedRng runner_up({0.9});
    TEST_ASSERT_EQ(std::string("tackle"), ai.choose(a, d, runner_up));
}

TEST(AIStrategist, EffectivenessIsCached) {
    AIStrategist ai;
    CombatantState a = ai_combatant({"tackle", "ember"});
    CombatantState d = ai_combatant({"tackle"}, ElementType::GRASS);

    ai.rank_moves(a, d);
    ai.rank_moves(a, d);
    TEST_ASSERT_EQ(size_t(2), ai.cache_size());

    ai.clear_cache();
    TEST_ASSERT_EQ(size_t(0), ai.cache_size());
}

TEST(AIStrategist, CustomChart) {
    int lookups = 0;
    AIStrategist ai(Difficulty::HARD, [&lookups](ElementType, ElementType) {
        lookups++;
        return 2.0;
    });
    CombatantState a = ai_combatant({"tackle"});
    CombatantState d = ai_combatant({"tackle"});

    // 50 + 30 + 10 (estimate 40 >= 35.5)
    TEST_ASSERT_EQ(90.0, ai.evaluate_move(a, d, *test_moves().get_move("tackle")));
    ai.evaluate_move(a, d, *test_moves().get_move("tackle"));
    TEST_ASSERT_EQ(1, lookups);
}
