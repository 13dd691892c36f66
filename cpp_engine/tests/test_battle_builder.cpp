/**
 * Tests for combatant construction and battle creation
 */

using namespace clawcombat;

TEST(BattleBuilder, DefaultStatsAtLevelOne) {
    BattleBuilder builder(test_moves());
    CombatantState c = builder.build_combatant(make_profile("pinchy"));

    TEST_ASSERT_EQ(71, c.max_hp);
    TEST_ASSERT_EQ(71, c.current_hp);
    TEST_ASSERT_EQ(22, c.effective_stats.attack);
    TEST_ASSERT_EQ(22, c.effective_stats.sp_atk);
    TEST_ASSERT_EQ(21, c.effective_stats.sp_def);
    TEST_ASSERT_EQ(21, c.effective_stats.speed);
    TEST_ASSERT_EQ(1, c.evolution_tier);
    TEST_ASSERT_TRUE(c.stages.all_zero());
    TEST_ASSERT_TRUE(c.status == StatusCondition::NONE);
}

TEST(BattleBuilder, EvolutionTierFollowsLevel) {
    BattleBuilder builder(test_moves());
    AgentProfile profile = make_profile("pinchy");
    profile.level = 20;
    CombatantState c = builder.build_combatant(profile);

    TEST_ASSERT_EQ(2, c.evolution_tier);
    TEST_ASSERT_EQ(std::string("Evolved"), c.evolution_name);
    TEST_ASSERT_EQ(97, c.max_hp);
}

TEST(BattleBuilder, NonPositiveLevelBecomesOne) {
    BattleBuilder builder(test_moves());
    AgentProfile profile = make_profile("pinchy");
    profile.level = 0;
    CombatantState c = builder.build_combatant(profile);
    TEST_ASSERT_EQ(1, c.level);
    TEST_ASSERT_EQ(71, c.max_hp);
}

TEST(BattleBuilder, MovesResolveAndDeduplicate) {
    BattleBuilder builder(test_moves());
    AgentProfile profile = make_profile(
        "pinchy", {"fire_1", "ember", "nope", "tackle", "wish", "swords_dance", "quick_attack"});
    CombatantState c = builder.build_combatant(profile);

    std::vector<MoveID> ids = c.move_ids();
    TEST_ASSERT_EQ(size_t(4), ids.size());
    TEST_ASSERT_EQ(std::string("ember"), ids[0]);
    TEST_ASSERT_EQ(std::string("tackle"), ids[1]);
    TEST_ASSERT_EQ(std::string("wish"), ids[2]);
    TEST_ASSERT_EQ(std::string("swords_dance"), ids[3]);

    // Each slot starts at full PP
    TEST_ASSERT_EQ(25, c.moves[0].current_pp);
}

TEST(BattleBuilder, NoUsableMovesFallsBackToDefaultLoadout) {
    BattleBuilder builder(test_moves());
    AgentProfile profile = make_profile("pinchy", {"nope", "also_nope"}, 16, ElementType::FIRE);
    CombatantState c = builder.build_combatant(profile);

    std::vector<MoveID> ids = c.move_ids();
    TEST_ASSERT_EQ(size_t(3), ids.size());
    TEST_ASSERT_EQ(std::string("ember"), ids[0]);
    TEST_ASSERT_EQ(std::string("flare_blitz"), ids[2]);
}

TEST(BattleBuilder, NamedNature) {
    BattleBuilder builder(test_moves());
    AgentProfile profile = make_profile("pinchy");
    profile.nature_name = "Adamant";
    CombatantState c = builder.build_combatant(profile);

    // Brutal: +Attack, -Claw
    TEST_ASSERT_EQ(24, c.effective_stats.attack);
    TEST_ASSERT_EQ(20, c.effective_stats.sp_atk);
}

TEST(BattleBuilder, ExplicitNaturePairWinsOverName) {
    BattleBuilder builder(test_moves());
    AgentProfile profile = make_profile("pinchy");
    profile.nature_name = "Brutal";
    profile.nature_boost = StatKind::SPEED;
    profile.nature_reduce = StatKind::ATTACK;
    CombatantState c = builder.build_combatant(profile);

    TEST_ASSERT_EQ(23, c.effective_stats.speed);
    TEST_ASSERT_EQ(20, c.effective_stats.attack);
    TEST_ASSERT_EQ(22, c.effective_stats.sp_atk);
}

TEST(BattleBuilder, CreateBattle) {
    BattleState state = make_default_battle();

    TEST_ASSERT_EQ(std::string("battle_test"), state.id);
    TEST_ASSERT_EQ(0, state.turn_number);
    TEST_ASSERT_TRUE(state.status == BattleStatus::ACTIVE);
    TEST_ASSERT_TRUE(state.winner_id.empty());
    TEST_ASSERT_TRUE(state.turns.empty());
    TEST_ASSERT_TRUE(state.opening_events.empty());
    TEST_ASSERT_EQ(std::string("2023-11-14T22:13:20.000Z"), state.started_at);
    TEST_ASSERT_EQ(TEST_NOW_MS, state.last_turn_at_ms);
    TEST_ASSERT_EQ(uint64_t(7), state.rng_seed);
    TEST_ASSERT_FALSE(state.pending_move_a.has_value());
}

TEST(BattleBuilder, IntimidateLowersOpponentAttack) {
    AgentProfile a = make_profile("pinchy");
    AgentProfile b = make_profile("snappy");
    b.ability = "Intimidate";
    BattleState state = make_battle(a, b);

    TEST_ASSERT_EQ(18, state.agent_a.effective_stats.attack);
    TEST_ASSERT_EQ(22, state.agent_a.base_stats.attack);
    TEST_ASSERT_EQ(22, state.agent_b.effective_stats.attack);

    TEST_ASSERT_EQ(size_t(1), state.opening_events.size());
    const TurnEvent& event = state.opening_events[0];
    TEST_ASSERT_TRUE(event.type == EventType::ABILITY);
    TEST_ASSERT_TRUE(event.side == Side::B);
    TEST_ASSERT_EQ(std::string("snappy's Intimidate lowered pinchy's Attack!"), event.message);
}

TEST(BattleBuilder, StartAbilitiesApplyInSideOrder) {
    AgentProfile a = make_profile("pinchy");
    a.ability = "Sand Force";
    AgentProfile b = make_profile("snappy");
    b.ability = "Intimidate";
    BattleState state = make_battle(a, b);

    // Sand Force first (22 -> 25), then Intimidate (25 -> 21)
    TEST_ASSERT_EQ(21, state.agent_a.effective_stats.attack);
    TEST_ASSERT_EQ(25, state.agent_a.effective_stats.defense);
    TEST_ASSERT_EQ(size_t(2), state.opening_events.size());
    TEST_ASSERT_TRUE(state.opening_events[0].side == Side::A);
}

TEST(BattleBuilder, Iso8601Timestamps) {
    TEST_ASSERT_EQ(std::string("1970-01-01T00:00:00.000Z"), iso8601_utc(0));
    TEST_ASSERT_EQ(std::string("2023-11-14T22:13:20.123Z"), iso8601_utc(TEST_NOW_MS + 123));
    TEST_ASSERT_EQ(std::string("2024-02-29T23:59:59.999Z"), iso8601_utc(1709251199999));
}
