/**
 * Tests for the battle service, engine configuration and battle trace logging
 */

using namespace clawcombat;

namespace {

class RecordingSink : public OutcomeSink {
public:
    std::vector<BattleOutcome> outcomes;

    void on_battle_end(const BattleOutcome& outcome) override {
        outcomes.push_back(outcome);
    }
};

EngineConfig seeded_config() {
    EngineConfig config;
    config.rng_seed = 11;
    return config;
}

struct ServiceHarness {
    InMemoryBattleStore store;
    InMemoryAgentDirectory agents;
    RecordingSink sink;
    int64_t now = TEST_NOW_MS;
    BattleService service;

    explicit ServiceHarness(EngineConfig config = seeded_config())
        : service(test_moves(), store, agents, std::move(config), &sink, [this] { return now; }) {
        agents.add(make_profile("pinchy", {"tackle", "swords_dance"}, 30));
        agents.add(make_profile("snappy", {"tackle", "swords_dance"}));
    }

    BattleID start() {
        return service.start_battle(*agents.find_agent("pinchy"), *agents.find_agent("snappy")).id;
    }
};

std::string scratch_dir(const std::string& name) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    return dir.string();
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

// ============================================================================
// BATTLE SERVICE
// ============================================================================

TEST(BattleService, StartBattleStoresRecord) {
    ServiceHarness h;
    BattleID id = h.start();

    TEST_ASSERT_EQ(std::string("battle_1"), id);
    TEST_ASSERT_EQ(size_t(1), h.store.size());
    TEST_ASSERT_TRUE(h.store.active_battle_for("pinchy") == id);

    auto stored = h.service.get_battle(id);
    TEST_ASSERT_TRUE(stored.has_value());
    TEST_ASSERT_EQ(uint64_t(12), stored->rng_seed);
    TEST_ASSERT_EQ(TEST_NOW_MS, stored->last_turn_at_ms);
    TEST_ASSERT_EQ(71, stored->agent_b.current_hp);
}

TEST(BattleService, TurnResolvesOnceBothMovesAreIn) {
    ServiceHarness h;
    BattleID id = h.start();
    h.now += 5000;

    SubmitResult first = h.service.submit_move(id, "pinchy", "swords_dance");
    TEST_ASSERT_TRUE(first.status == SubmitStatus::ACCEPTED);
    TEST_ASSERT_FALSE(first.turn.has_value());
    TEST_ASSERT_TRUE(h.service.get_battle(id)->pending_move_a == MoveID("swords_dance"));

    SubmitResult again = h.service.submit_move(id, "pinchy", "tackle");
    TEST_ASSERT_TRUE(again.status == SubmitStatus::ALREADY_SUBMITTED);

    SubmitResult second = h.service.submit_move(id, "snappy", "swords_dance");
    TEST_ASSERT_TRUE(second.status == SubmitStatus::RESOLVED);
    TEST_ASSERT_TRUE(second.turn.has_value());
    TEST_ASSERT_EQ(1, second.turn->turn_number);
    TEST_ASSERT_FALSE(second.battle_finished);

    BattleState stored = *h.service.get_battle(id);
    TEST_ASSERT_EQ(1, stored.turn_number);
    TEST_ASSERT_EQ(2, stored.agent_a.stages.attack);
    TEST_ASSERT_FALSE(stored.pending_move_a.has_value());
    TEST_ASSERT_FALSE(stored.pending_move_b.has_value());
    TEST_ASSERT_EQ(TEST_NOW_MS + 5000, stored.last_turn_at_ms);
    TEST_ASSERT_FALSE(stored.rng_state.empty());
    TEST_ASSERT_FALSE(stored.last_move_at.empty());
}

TEST(BattleService, SubmitRejections) {
    ServiceHarness h;
    BattleID id = h.start();

    TEST_ASSERT_TRUE(h.service.submit_move("battle_99", "pinchy", "tackle").status ==
                     SubmitStatus::BATTLE_NOT_FOUND);
    TEST_ASSERT_TRUE(h.service.submit_move(id, "stranger", "tackle").status ==
                     SubmitStatus::NOT_A_PARTICIPANT);
    TEST_ASSERT_TRUE(h.service.submit_move(id, "pinchy", "ember").status ==
                     SubmitStatus::UNKNOWN_MOVE);

    BattleState state = *h.service.get_battle(id);
    state.agent_a.find_move("tackle")->current_pp = 0;
    TEST_ASSERT_TRUE(h.store.save(state));
    TEST_ASSERT_TRUE(h.service.submit_move(id, "pinchy", "tackle").status == SubmitStatus::NO_PP);

    // Rejected submissions leave nothing pending
    TEST_ASSERT_FALSE(h.service.get_battle(id)->pending_move_a.has_value());
}

TEST(BattleService, SurrenderReportsOutcome) {
    ServiceHarness h;
    BattleID id = h.start();

    SubmitResult r = h.service.surrender(id, "pinchy");
    TEST_ASSERT_TRUE(r.status == SubmitStatus::RESOLVED);
    TEST_ASSERT_TRUE(r.battle_finished);
    TEST_ASSERT_EQ(std::string("snappy"), r.winner_id);

    TEST_ASSERT_EQ(size_t(1), h.sink.outcomes.size());
    const BattleOutcome& outcome = h.sink.outcomes[0];
    TEST_ASSERT_EQ(id, outcome.battle_id);
    TEST_ASSERT_EQ(std::string("snappy"), outcome.winner_id);
    TEST_ASSERT_EQ(std::string("pinchy"), outcome.loser_id);
    TEST_ASSERT_TRUE(outcome.reason == EndReason::SURRENDER);
    TEST_ASSERT_EQ(1, outcome.turns);

    TEST_ASSERT_FALSE(h.store.active_battle_for("pinchy").has_value());
    TEST_ASSERT_TRUE(h.service.submit_move(id, "snappy", "tackle").status ==
                     SubmitStatus::BATTLE_FINISHED);
    TEST_ASSERT_TRUE(h.service.surrender(id, "snappy").status == SubmitStatus::BATTLE_FINISHED);
}

TEST(BattleService, TimeoutSweepWaitsForDeadline) {
    ServiceHarness h;
    BattleID id = h.start();
    h.service.submit_move(id, "pinchy", "tackle");

    h.now += 30000;
    TEST_ASSERT_TRUE(h.service.check_timeouts().empty());

    h.now += 1;
    std::vector<BattleID> advanced = h.service.check_timeouts();
    TEST_ASSERT_EQ(size_t(1), advanced.size());

    BattleState stored = *h.service.get_battle(id);
    TEST_ASSERT_EQ(1, stored.turn_number);
    TEST_ASSERT_EQ(1, stored.agent_b.consecutive_timeouts);
    TEST_ASSERT_EQ(0, stored.agent_a.consecutive_timeouts);
    TEST_ASSERT_TRUE(stored.agent_b.current_hp < stored.agent_b.max_hp);
    TEST_ASSERT_TRUE(stored.turns.back().has_event(EventType::TIMEOUT));
}

TEST(BattleService, RepeatedTimeoutsForfeit) {
    ServiceHarness h;
    BattleID id = h.start();

    for (int i = 0; i < 3; i++) {
        h.service.submit_move(id, "pinchy", "swords_dance");
        h.now += 31000;
        h.service.check_timeouts();
    }

    BattleState stored = *h.service.get_battle(id);
    TEST_ASSERT_TRUE(stored.is_finished());
    TEST_ASSERT_EQ(std::string("pinchy"), stored.winner_id);
    TEST_ASSERT_TRUE(stored.end_reason == EndReason::FORFEIT_TIMEOUT);
    TEST_ASSERT_EQ(size_t(1), h.sink.outcomes.size());
    TEST_ASSERT_TRUE(h.service.check_timeouts().empty());
}

TEST(BattleService, AiMoveSubmission) {
    ServiceHarness h;
    BattleID id = h.start();

    SubmitResult r = h.service.submit_ai_move(id, "snappy", Difficulty::HARD);
    TEST_ASSERT_TRUE(r.status == SubmitStatus::ACCEPTED);

    auto pending = h.service.get_battle(id)->pending_move_b;
    TEST_ASSERT_TRUE(pending.has_value());
    TEST_ASSERT_EQ(std::string("tackle"), *pending);

    TEST_ASSERT_TRUE(h.service.submit_ai_move("battle_99", "snappy").status ==
                     SubmitStatus::BATTLE_NOT_FOUND);
}

TEST(BattleService, AiBattlePlaysToTheEnd) {
    ServiceHarness h;
    BattleState state = h.service.play_ai_battle(*h.agents.find_agent("pinchy"),
                                                 *h.agents.find_agent("snappy"),
                                                 Difficulty::HARD, Difficulty::HARD);

    TEST_ASSERT_TRUE(state.is_finished());
    TEST_ASSERT_TRUE(state.end_reason == EndReason::FAINT);
    TEST_ASSERT_EQ(size_t(1), h.sink.outcomes.size());
    TEST_ASSERT_EQ(state.winner_id, h.sink.outcomes[0].winner_id);
    TEST_ASSERT_EQ(state.turn_number, static_cast<int>(state.turns.size()));
    TEST_ASSERT_TRUE(h.service.get_battle(state.id)->is_finished());
}

TEST(BattleService, StalemateAiBattleStopsAtTurnCap) {
    EngineConfig config = seeded_config();
    config.max_battle_turns = 0;
    ServiceHarness h(config);

    // Neither side can deal damage
    BattleState state = h.service.play_ai_battle(make_profile("stone_a", {"swords_dance"}, 30),
                                                 make_profile("stone_b", {"swords_dance"}),
                                                 Difficulty::HARD, Difficulty::HARD);

    TEST_ASSERT_TRUE(state.is_finished());
    TEST_ASSERT_TRUE(state.end_reason == EndReason::TURN_LIMIT);
    TEST_ASSERT_EQ(50, state.turn_number);
    TEST_ASSERT_EQ(std::string("stone_a"), state.winner_id);
}

TEST(BattleService, SeededServicesReplayExactly) {
    ServiceHarness first;
    ServiceHarness second;
    AgentProfile a = *first.agents.find_agent("pinchy");
    AgentProfile b = *first.agents.find_agent("snappy");

    first.service.play_ai_battle(a, b, Difficulty::NORMAL, Difficulty::EASY);
    second.service.play_ai_battle(a, b, Difficulty::NORMAL, Difficulty::EASY);

    TEST_ASSERT_FALSE(first.store.record("battle_1").empty());
    TEST_ASSERT_EQ(first.store.record("battle_1"), second.store.record("battle_1"));
}

TEST(BattleService, MatchmakingStartsBattles) {
    ServiceHarness h;
    UnlimitedFightPolicy limits;
    InMemoryQueueStore queue_store;
    MatchmakingQueue queue(queue_store, limits, h.store);

    queue.join("pinchy", 1);
    queue.join("snappy", 1);
    std::vector<BattleID> started = h.service.run_matchmaking(queue);
    TEST_ASSERT_EQ(size_t(1), started.size());

    // The store now reports both agents as busy
    TEST_ASSERT_TRUE(queue.join("pinchy", 1).status == QueueJoinStatus::ALREADY_IN_BATTLE);

    std::vector<BattleID> none = h.service.start_matched({MatchPair{"pinchy", "ghost_agent", 0}});
    TEST_ASSERT_TRUE(none.empty());
}

TEST(BattleService, CorruptRecordIsNotFound) {
    ServiceHarness h;
    h.store.put_record("battle_bad", "{\"id\": \"battle_bad\"");
    TEST_ASSERT_FALSE(h.service.get_battle("battle_bad").has_value());
    TEST_ASSERT_TRUE(h.service.submit_move("battle_bad", "pinchy", "tackle").status ==
                     SubmitStatus::BATTLE_NOT_FOUND);
}

TEST(BattleService, TraceFileWritten) {
    std::string dir = scratch_dir("claw_service_xray");
    EngineConfig config = seeded_config();
    config.xray_enabled = true;
    config.xray_output_dir = dir;
    ServiceHarness h(config);

    h.service.play_ai_battle(*h.agents.find_agent("pinchy"), *h.agents.find_agent("snappy"),
                             Difficulty::HARD, Difficulty::HARD);

    int files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        TEST_ASSERT_TRUE(entry.path().filename().string().rfind("battle_trace_battle_1_", 0) == 0);
        TEST_ASSERT_TRUE(read_file(entry.path().string()).find("BATTLE END") != std::string::npos);
        files++;
    }
    TEST_ASSERT_EQ(1, files);
    std::filesystem::remove_all(dir);
}

// ============================================================================
// ENGINE CONFIG
// ============================================================================

TEST(EngineConfig, LoadsShippedFile) {
    EngineConfig config;
    TEST_ASSERT_TRUE(config.load_from_json(std::string(CLAWCOMBAT_DATA_DIR) + "/engine_config.json"));
    TEST_ASSERT_EQ(std::string("moves.json"), config.moves_path);
    TEST_ASSERT_EQ(50, config.max_battle_turns);
    TEST_ASSERT_EQ(int64_t(30000), config.turn_timeout_ms());
    TEST_ASSERT_TRUE(config.default_ai_difficulty == Difficulty::NORMAL);
    TEST_ASSERT_EQ(size_t(3), config.matchmaking.level_bands.size());
    TEST_ASSERT_EQ(20, config.matchmaking.level_bands[2].second);
}

TEST(EngineConfig, PartialDocumentKeepsDefaults) {
    EngineConfig config;
    TEST_ASSERT_TRUE(config.load_from_string(R"({"max_battle_turns": 20, "default_ai_difficulty": "hard"})"));
    TEST_ASSERT_EQ(20, config.max_battle_turns);
    TEST_ASSERT_EQ(20, config.resolver_settings().max_battle_turns);
    TEST_ASSERT_TRUE(config.default_ai_difficulty == Difficulty::HARD);
    TEST_ASSERT_EQ(30, config.turn_timeout_seconds);
    TEST_ASSERT_EQ(3, config.resolver_settings().max_consecutive_timeouts);
}

TEST(EngineConfig, InvalidDocumentsChangeNothing) {
    EngineConfig config;
    TEST_ASSERT_FALSE(config.load_from_string(R"({"max_battle_turns": 10, "turn_timeout_seconds": 0})"));
    TEST_ASSERT_FALSE(config.load_from_string(R"({"default_ai_difficulty": "brutal"})"));
    TEST_ASSERT_FALSE(config.load_from_string(R"({"xray_enabled": "yes"})"));
    TEST_ASSERT_FALSE(config.load_from_string(R"({"rng_seed": -4})"));
    TEST_ASSERT_FALSE(config.load_from_string(
        R"({"level_bands": [{"max_wait_seconds": 60, "range": 5}, {"max_wait_seconds": 30, "range": 10}]})"));
    TEST_ASSERT_FALSE(config.load_from_string("[1, 2]"));
    TEST_ASSERT_FALSE(config.load_from_string("{broken"));
    TEST_ASSERT_FALSE(config.load_from_json("/nonexistent/engine_config.json"));

    TEST_ASSERT_EQ(50, config.max_battle_turns);
    TEST_ASSERT_EQ(30, config.turn_timeout_seconds);
    TEST_ASSERT_TRUE(config.default_ai_difficulty == Difficulty::NORMAL);
}

TEST(EngineConfig, JsonRoundTrip) {
    EngineConfig config;
    config.rng_seed = 77;
    config.matchmaking.level_bands = {{15, 3}, {45, 8}};

    EngineConfig copy;
    TEST_ASSERT_TRUE(copy.load_from_string(config.to_json().dump()));
    TEST_ASSERT_EQ(uint64_t(77), copy.rng_seed);
    TEST_ASSERT_EQ(size_t(2), copy.matchmaking.level_bands.size());
    TEST_ASSERT_EQ(8, copy.matchmaking.level_bands[1].second);
}

// ============================================================================
// BATTLE LOGGER
// ============================================================================

TEST(BattleLogger, WritesTurnsAndResult) {
    std::string dir = scratch_dir("claw_logger_test");
    BattleState state = make_default_battle();
    TurnResolver resolver;
    ScriptedRng rng;

    std::string path;
    {
        BattleLogger logger(state.id, dir);
        TEST_ASSERT_TRUE(logger.is_enabled());
        path = logger.get_log_path();
        std::string filename = std::filesystem::path(path).filename().string();
        TEST_ASSERT_TRUE(filename.rfind("battle_trace_battle_test_", 0) == 0);

        logger.log_battle_start(state);
        TurnResult turn = resolver.resolve_turn(state, MoveID("swords_dance"), MoveID("tackle"), rng);
        logger.log_turn(state, turn.log);
        resolver.surrender(state, Side::B);
        logger.log_battle_end(state);
    }

    std::string text = read_file(path);
    TEST_ASSERT_TRUE(text.find("BATTLE TRACE - battle_test") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("[TURN 1] A: swords_dance | B: tackle | First: A") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("HP: 58/71") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Stages: atk+2") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Winner: pinchy") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Loser: snappy") != std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST(BattleLogger, DisabledLoggerWritesNothing) {
    std::string dir = scratch_dir("claw_logger_disabled");
    BattleState state = make_default_battle();

    std::string path;
    {
        BattleLogger logger(state.id, dir);
        logger.set_enabled(false);
        path = logger.get_log_path();
        logger.log_battle_start(state);
    }

    TEST_ASSERT_TRUE(read_file(path).find("[BATTLE START]") == std::string::npos);
    std::filesystem::remove_all(dir);
}
