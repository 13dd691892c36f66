/**
 * Tests for move loading, lookup, loadouts and selection validation
 */

using namespace clawcombat;

// ============================================================================
// LOADING AND LOOKUP
// ============================================================================

TEST(MoveDatabase, LoadsAllPools) {
    const MoveDatabase& db = test_moves();
    TEST_ASSERT_EQ(size_t(21), db.move_count());
    TEST_ASSERT_EQ(size_t(5), db.move_pool(ElementType::NEUTRAL).size());
    TEST_ASSERT_EQ(size_t(3), db.move_pool(ElementType::FIRE).size());
    TEST_ASSERT_TRUE(db.move_pool(ElementType::MYSTIC).empty());
}

TEST(MoveDatabase, GetMoveById) {
    const MoveDef* tackle = test_moves().get_move("tackle");
    TEST_ASSERT_NOT_NULL(tackle);
    TEST_ASSERT_EQ(40, tackle->power);
    TEST_ASSERT_EQ(35, tackle->pp);
    TEST_ASSERT_TRUE(tackle->category == MoveCategory::PHYSICAL);
    TEST_ASSERT_FALSE(tackle->has_effect());

    TEST_ASSERT_NULL(test_moves().get_move("hyper_beam"));
}

TEST(MoveDatabase, LegacyIdsResolve) {
    const MoveDef* move = test_moves().get_move("fire_1");
    TEST_ASSERT_NOT_NULL(move);
    TEST_ASSERT_EQ(std::string("ember"), move->id);

    // Legacy entries pointing at missing moves are dropped
    TEST_ASSERT_FALSE(test_moves().has_move("fire_9"));
}

TEST(MoveDatabase, EffectsAreParsed) {
    const MoveDef* blitz = test_moves().get_move("flare_blitz");
    TEST_ASSERT_NOT_NULL(blitz);
    const auto* recoil = blitz->effect_as<effects::Recoil>();
    TEST_ASSERT_NOT_NULL(recoil);
    TEST_ASSERT_EQ(33, recoil->percent);

    const MoveDef* outrage = test_moves().get_move("outrage");
    const auto* status = outrage->effect_as<effects::InflictStatus>();
    TEST_ASSERT_NOT_NULL(status);
    TEST_ASSERT_TRUE(status->status == StatusCondition::CONFUSION);
    TEST_ASSERT_TRUE(status->target == EffectTarget::SELF);
    TEST_ASSERT_TRUE(status->delay);

    TEST_ASSERT_EQ(1, test_moves().get_move("quick_attack")->effective_priority());
    TEST_ASSERT_EQ(0, test_moves().get_move("tackle")->effective_priority());
}

TEST(MoveDatabase, RejectsBadMoves) {
    std::string error;
    auto bad_effect = MoveDatabase::parse_move(nlohmann::json::parse(
        R"({"id": "x", "type": "FIRE", "category": "physical", "power": 10, "effect": {"type": "teleport"}})"),
        &error);
    TEST_ASSERT_FALSE(bad_effect.has_value());
    TEST_ASSERT_TRUE(error.find("teleport") != std::string::npos);

    auto bad_accuracy = MoveDatabase::parse_move(nlohmann::json::parse(
        R"({"id": "y", "type": "FIRE", "category": "physical", "power": 10, "accuracy": 120})"));
    TEST_ASSERT_FALSE(bad_accuracy.has_value());

    auto bad_type = MoveDatabase::parse_move(nlohmann::json::parse(
        R"({"id": "z", "type": "LAVA", "category": "physical", "power": 10})"));
    TEST_ASSERT_FALSE(bad_type.has_value());
}

TEST(MoveDatabase, SkipsInvalidEntriesButKeepsTheRest) {
    MoveDatabase db;
    bool ok = db.load_from_string(R"({"moves_by_type": {"WATER": [
        {"id": "splash", "type": "WATER", "category": "status", "power": 0},
        {"id": "broken", "type": "WATER", "category": "physical", "power": -5}
    ]}})");
    TEST_ASSERT_TRUE(ok);
    TEST_ASSERT_EQ(size_t(1), db.move_count());
    TEST_ASSERT_TRUE(db.has_move("splash"));
}

TEST(MoveDatabase, MalformedDocumentFails) {
    MoveDatabase db;
    TEST_ASSERT_FALSE(db.load_from_string("{not json"));
    TEST_ASSERT_FALSE(db.load_from_string(R"({"moves": []})"));
    TEST_ASSERT_FALSE(db.load_from_json("/nonexistent/moves.json"));
}

TEST(MoveDatabase, EffectJsonRoundTrip) {
    const MoveDef* outrage = test_moves().get_move("outrage");
    auto parsed = MoveDatabase::parse_move(MoveDatabase::move_to_json(*outrage));
    TEST_ASSERT_TRUE(parsed.has_value());
    const auto* status = parsed->effect_as<effects::InflictStatus>();
    TEST_ASSERT_NOT_NULL(status);
    TEST_ASSERT_EQ(100, status->chance);
    TEST_ASSERT_TRUE(status->target == EffectTarget::SELF);
}

// ============================================================================
// LOADOUTS
// ============================================================================

TEST(MoveDatabase, DefaultLoadoutIsFirstFourOfPool) {
    auto loadout = test_moves().default_loadout(ElementType::NEUTRAL);
    TEST_ASSERT_EQ(size_t(4), loadout.size());
    TEST_ASSERT_EQ(std::string("tackle"), loadout[0]);
    TEST_ASSERT_EQ(std::string("wish"), loadout[3]);

    // Short pools give what they have
    TEST_ASSERT_EQ(size_t(3), test_moves().default_loadout(ElementType::FIRE).size());
}

TEST(MoveDatabase, EmptyPoolFallsBackToNeutral) {
    auto loadout = test_moves().default_loadout(ElementType::MYSTIC);
    TEST_ASSERT_EQ(size_t(4), loadout.size());
    TEST_ASSERT_EQ(std::string("tackle"), loadout[0]);
}

TEST(MoveDatabase, ValidateMoveSelection) {
    const MoveDatabase& db = test_moves();

    auto ok = db.validate_move_selection({"tackle", "quick_attack", "swords_dance", "wish"},
                                         ElementType::NEUTRAL);
    TEST_ASSERT_TRUE(ok.valid);

    auto too_few = db.validate_move_selection({"tackle", "wish"}, ElementType::NEUTRAL);
    TEST_ASSERT_FALSE(too_few.valid);
    TEST_ASSERT_EQ(std::string("Must select exactly 4 moves"), too_few.error);

    auto wrong_type = db.validate_move_selection({"tackle", "quick_attack", "swords_dance", "ember"},
                                                 ElementType::NEUTRAL);
    TEST_ASSERT_FALSE(wrong_type.valid);
    TEST_ASSERT_EQ(std::string("Invalid moves for type NEUTRAL: ember"), wrong_type.error);

    auto duplicate = db.validate_move_selection({"tackle", "tackle", "swords_dance", "wish"},
                                                ElementType::NEUTRAL);
    TEST_ASSERT_FALSE(duplicate.valid);
    TEST_ASSERT_EQ(std::string("All 4 moves must be different"), duplicate.error);
}

// ============================================================================
// SHIPPED DATA
// ============================================================================

TEST(MoveDatabase, ShippedMoveFileCoversEveryType) {
    MoveDatabase db;
    TEST_ASSERT_TRUE(db.load_from_json(std::string(CLAWCOMBAT_DATA_DIR) + "/moves.json"));

    for (ElementType type : ALL_ELEMENT_TYPES) {
        TEST_ASSERT_MSG(db.move_pool(type).size() >= MoveDatabase::LOADOUT_SIZE,
                        std::string("short pool for ") + to_string(type));
        auto result = db.validate_move_selection(db.default_loadout(type), type);
        TEST_ASSERT_MSG(result.valid, result.error);
    }

    const MoveDef* legacy = db.get_move("fire_1");
    TEST_ASSERT_NOT_NULL(legacy);
    TEST_ASSERT_EQ(std::string("ember"), legacy->id);
}

TEST(MoveDatabase, RandomLoadoutDrawsFromPool) {
    MoveDatabase db;
    TEST_ASSERT_TRUE(db.load_from_json(std::string(CLAWCOMBAT_DATA_DIR) + "/moves.json"));

    BattleRng rng(3);
    auto loadout = db.random_loadout(ElementType::FIRE, rng);
    auto result = db.validate_move_selection(loadout, ElementType::FIRE);
    TEST_ASSERT_MSG(result.valid, result.error);

    int status_moves = 0;
    for (const auto& id : loadout) {
        if (!db.get_move(id)->is_damaging()) status_moves++;
    }
    TEST_ASSERT_EQ(1, status_moves);
}
