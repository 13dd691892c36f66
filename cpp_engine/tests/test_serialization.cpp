/**
 * Tests for battle, profile and queue JSON persistence
 */

using namespace clawcombat;

namespace {

// Two turns in: B burned, A boosted with a wish pending, some PP spent
BattleState battle_in_progress() {
    BattleState state = make_battle(make_profile("pinchy", {"swords_dance", "wish", "tackle"}, 30),
                                    make_profile("snappy", {"tackle", "will_o_wisp"}));
    state.agent_b.inflict(StatusCondition::BURNED);
    state.agent_a.confused = true;
    state.agent_a.confusion_turns = 0;
    TurnResolver resolver;
    ScriptedRng rng({0.9});
    resolver.resolve_turn(state, MoveID("swords_dance"), MoveID("tackle"), rng);
    resolver.resolve_turn(state, MoveID("wish"), MoveID("tackle"), rng);
    return state;
}

} // namespace

TEST(Serialization, BattleRoundTrip) {
    BattleState original = battle_in_progress();
    std::string text = serialize_battle(original);

    BattleLoadResult loaded = deserialize_battle(text);
    TEST_ASSERT_MSG(loaded.ok, loaded.message);
    const BattleState& copy = loaded.state;

    TEST_ASSERT_EQ(original.id, copy.id);
    TEST_ASSERT_EQ(original.turn_number, copy.turn_number);
    TEST_ASSERT_EQ(original.turns.size(), copy.turns.size());
    TEST_ASSERT_EQ(original.started_at, copy.started_at);
    TEST_ASSERT_EQ(original.rng_seed, copy.rng_seed);
    TEST_ASSERT_TRUE(copy.first_side == original.first_side);

    TEST_ASSERT_EQ(original.agent_a.current_hp, copy.agent_a.current_hp);
    TEST_ASSERT_EQ(2, copy.agent_a.stages.attack);
    TEST_ASSERT_TRUE(copy.agent_a.wish_pending);
    TEST_ASSERT_EQ(original.agent_a.wish_turn, copy.agent_a.wish_turn);
    TEST_ASSERT_TRUE(copy.agent_a.confused);
    TEST_ASSERT_EQ(original.agent_a.confusion_turns, copy.agent_a.confusion_turns);
    TEST_ASSERT_TRUE(copy.agent_b.status == StatusCondition::BURNED);
    TEST_ASSERT_EQ(33, copy.agent_b.find_move("tackle")->current_pp);
    TEST_ASSERT_EQ(original.agent_b.effective_stats.speed, copy.agent_b.effective_stats.speed);

    // Serializing the copy reproduces the same document
    TEST_ASSERT_EQ(text, serialize_battle(copy));
}

TEST(Serialization, RestoredBattleResolvesIdentically) {
    BattleState original = battle_in_progress();
    BattleLoadResult loaded = deserialize_battle(serialize_battle(original));
    TEST_ASSERT_TRUE(loaded.ok);
    BattleState copy = loaded.state;

    TurnResolver resolver;
    BattleRng rng_a(99);
    BattleRng rng_b(99);
    resolver.resolve_turn(original, MoveID("tackle"), MoveID("will_o_wisp"), rng_a);
    resolver.resolve_turn(copy, MoveID("tackle"), MoveID("will_o_wisp"), rng_b);

    TEST_ASSERT_EQ(original.agent_a.current_hp, copy.agent_a.current_hp);
    TEST_ASSERT_EQ(original.agent_b.current_hp, copy.agent_b.current_hp);
    TEST_ASSERT_EQ(serialize_battle(original), serialize_battle(copy));
}

TEST(Serialization, MalformedJson) {
    BattleLoadResult r = deserialize_battle("{\"id\": ");
    TEST_ASSERT_FALSE(r.ok);
    TEST_ASSERT_TRUE(r.error == StateError::MALFORMED_JSON);
}

TEST(Serialization, MissingFields) {
    nlohmann::json data = battle_to_json(make_default_battle());
    data.erase("agent_b");
    BattleLoadResult r = battle_from_json(data);
    TEST_ASSERT_FALSE(r.ok);
    TEST_ASSERT_TRUE(r.error == StateError::MISSING_FIELD);
    TEST_ASSERT_TRUE(r.message.find("agent_b") != std::string::npos);

    nlohmann::json no_hp = battle_to_json(make_default_battle());
    no_hp["agent_a"].erase("current_hp");
    TEST_ASSERT_TRUE(battle_from_json(no_hp).error == StateError::MISSING_FIELD);
}

TEST(Serialization, InvalidValues) {
    nlohmann::json hp = battle_to_json(make_default_battle());
    hp["agent_a"]["current_hp"] = 500;
    BattleLoadResult r = battle_from_json(hp);
    TEST_ASSERT_FALSE(r.ok);
    TEST_ASSERT_TRUE(r.error == StateError::INVALID_VALUE);

    nlohmann::json stage = battle_to_json(make_default_battle());
    stage["agent_b"]["stages"]["attack"] = 7;
    TEST_ASSERT_TRUE(battle_from_json(stage).error == StateError::INVALID_VALUE);

    nlohmann::json status = battle_to_json(make_default_battle());
    status["agent_a"]["status"] = "petrified";
    TEST_ASSERT_TRUE(battle_from_json(status).error == StateError::INVALID_VALUE);

    nlohmann::json wrong_type = battle_to_json(make_default_battle());
    wrong_type["turn_number"] = "three";
    TEST_ASSERT_TRUE(battle_from_json(wrong_type).error == StateError::INVALID_VALUE);

    TEST_ASSERT_TRUE(battle_from_json(nlohmann::json::array()).error == StateError::INVALID_VALUE);
}

TEST(Serialization, FinishedBattleNeedsParticipantWinner) {
    BattleState state = make_default_battle();
    TurnResolver resolver;
    resolver.surrender(state, Side::B);

    nlohmann::json data = battle_to_json(state);
    TEST_ASSERT_TRUE(battle_from_json(data).ok);

    data["winner_id"] = "stranger";
    TEST_ASSERT_TRUE(battle_from_json(data).error == StateError::INVALID_VALUE);

    nlohmann::json active = battle_to_json(make_default_battle());
    active["winner_id"] = "pinchy";
    TEST_ASSERT_TRUE(battle_from_json(active).error == StateError::INVALID_VALUE);
}

TEST(Serialization, TurnLogRoundTrip) {
    BattleState state = battle_in_progress();
    const TurnLog& log = state.turns.back();

    auto parsed = turn_log_from_json(turn_log_to_json(log));
    TEST_ASSERT_TRUE(parsed.has_value());
    TEST_ASSERT_EQ(log.turn_number, parsed->turn_number);
    TEST_ASSERT_EQ(log.events.size(), parsed->events.size());
    TEST_ASSERT_TRUE(parsed->move_a == log.move_a);

    std::string error;
    TEST_ASSERT_FALSE(turn_log_from_json(nlohmann::json::object(), &error).has_value());
    TEST_ASSERT_FALSE(error.empty());
}

TEST(Serialization, AgentProfileDefaults) {
    auto minimal = agent_profile_from_json(nlohmann::json{{"id", "crusher"}});
    TEST_ASSERT_TRUE(minimal.has_value());
    TEST_ASSERT_EQ(std::string("Unknown"), minimal->name);
    TEST_ASSERT_TRUE(minimal->type == ElementType::NEUTRAL);
    TEST_ASSERT_EQ(1, minimal->level);
    TEST_ASSERT_EQ(17, minimal->base_hp);
    TEST_ASSERT_EQ(16, minimal->base_sp_def);
    TEST_ASSERT_TRUE(minimal->moves.empty());
    TEST_ASSERT_FALSE(minimal->nature_boost.has_value());

    std::string error;
    TEST_ASSERT_FALSE(agent_profile_from_json(nlohmann::json{{"name", "nameless"}}, &error).has_value());
    TEST_ASSERT_TRUE(error.find("id") != std::string::npos);

    TEST_ASSERT_FALSE(agent_profile_from_json(nlohmann::json{{"id", "x"}, {"type", "LAVA"}}).has_value());
}

TEST(Serialization, AgentProfileRoundTrip) {
    AgentProfile profile = make_profile("crusher", {"ember", "tackle"}, 40, ElementType::FIRE);
    profile.nature_boost = StatKind::SPEED;
    profile.nature_reduce = StatKind::DEFENSE;
    profile.ability = "Blaze";
    profile.ev_attack = 12;

    auto parsed = agent_profile_from_json(agent_profile_to_json(profile));
    TEST_ASSERT_TRUE(parsed.has_value());
    TEST_ASSERT_TRUE(parsed->type == ElementType::FIRE);
    TEST_ASSERT_EQ(40, parsed->base_speed);
    TEST_ASSERT_EQ(12, parsed->ev_attack);
    TEST_ASSERT_TRUE(parsed->nature_boost == StatKind::SPEED);
    TEST_ASSERT_TRUE(parsed->nature_reduce == StatKind::DEFENSE);
    TEST_ASSERT_EQ(std::string("Blaze"), parsed->ability);
    TEST_ASSERT_EQ(size_t(2), parsed->moves.size());
}

TEST(Serialization, QueueEntryRoundTrip) {
    QueueEntry entry;
    entry.agent_id = "crusher";
    entry.level = 14;
    entry.joined_at = QueueClock::time_point(std::chrono::milliseconds(TEST_NOW_MS));

    nlohmann::json j = queue_entry_to_json(entry);
    TEST_ASSERT_EQ(TEST_NOW_MS, j["joined_at_ms"].get<int64_t>());

    auto parsed = queue_entry_from_json(j);
    TEST_ASSERT_TRUE(parsed.has_value());
    TEST_ASSERT_EQ(std::string("crusher"), parsed->agent_id);
    TEST_ASSERT_EQ(14, parsed->level);
    TEST_ASSERT_TRUE(parsed->joined_at == entry.joined_at);

    TEST_ASSERT_FALSE(queue_entry_from_json(nlohmann::json{{"agent_id", "x"}}).has_value());
}
