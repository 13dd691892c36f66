/**
 * ClawCombat Battle Engine - Battle Serialization Implementation
 */

#include "battle_serialization.hpp"
#include "move_database.hpp"
#include "stat_scaling.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace clawcombat {

namespace {

/**
 * Load failure raised while walking a document. Caught at the public entry
 * points and turned into a result.
 */
class LoadError : public std::runtime_error {
public:
    LoadError(StateError kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    StateError kind() const { return kind_; }

private:
    StateError kind_;
};

bool present(const json& j, const char* key) {
    return j.contains(key) && !j[key].is_null();
}

const json& require(const json& j, const char* key) {
    if (!present(j, key)) {
        throw LoadError(StateError::MISSING_FIELD, std::string("missing field '") + key + "'");
    }
    return j[key];
}

void expect_object(const json& j, const std::string& what) {
    if (!j.is_object()) {
        throw LoadError(StateError::INVALID_VALUE, what + " must be an object");
    }
}

int read_int(const json& j, const char* key, int fallback) {
    if (!present(j, key)) return fallback;
    if (!j[key].is_number_integer()) {
        throw LoadError(StateError::INVALID_VALUE, std::string("field '") + key + "' must be an integer");
    }
    return j[key].get<int>();
}

int require_int(const json& j, const char* key) {
    require(j, key);
    return read_int(j, key, 0);
}

bool read_bool(const json& j, const char* key, bool fallback) {
    if (!present(j, key)) return fallback;
    if (!j[key].is_boolean()) {
        throw LoadError(StateError::INVALID_VALUE, std::string("field '") + key + "' must be a boolean");
    }
    return j[key].get<bool>();
}

std::string read_string(const json& j, const char* key, const std::string& fallback = "") {
    if (!present(j, key)) return fallback;
    if (!j[key].is_string()) {
        throw LoadError(StateError::INVALID_VALUE, std::string("field '") + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

std::optional<std::string> read_optional_string(const json& j, const char* key) {
    if (!present(j, key)) return std::nullopt;
    return read_string(j, key);
}

template <typename T, typename Parser>
T read_enum(const json& j, const char* key, T fallback, Parser parse) {
    if (!present(j, key)) return fallback;
    std::string text = read_string(j, key);
    auto parsed = parse(text);
    if (!parsed) {
        throw LoadError(StateError::INVALID_VALUE, std::string("unknown ") + key + " '" + text + "'");
    }
    return *parsed;
}

template <typename T, typename Parser>
T require_enum(const json& j, const char* key, Parser parse) {
    require(j, key);
    return read_enum(j, key, T{}, parse);
}

std::optional<Side> parse_side(const std::string& s) {
    if (s == "A") return Side::A;
    if (s == "B") return Side::B;
    return std::nullopt;
}

std::optional<BattleStatus> parse_battle_status(const std::string& s) {
    if (s == "active") return BattleStatus::ACTIVE;
    if (s == "finished") return BattleStatus::FINISHED;
    return std::nullopt;
}

std::optional<BattlePhase> parse_battle_phase(const std::string& s) {
    if (s == "waiting") return BattlePhase::WAITING;
    if (s == "finished") return BattlePhase::FINISHED;
    return std::nullopt;
}

std::optional<Side> read_side(const json& j, const char* key) {
    if (!present(j, key)) return std::nullopt;
    return read_enum(j, key, Side::A, parse_side);
}

// ----------------------------------------------------------------------------
// Stat blocks
// ----------------------------------------------------------------------------

json stat_block_to_json(const StatBlock& stats) {
    return json{
        {"hp", stats.hp},
        {"attack", stats.attack},
        {"defense", stats.defense},
        {"sp_atk", stats.sp_atk},
        {"sp_def", stats.sp_def},
        {"speed", stats.speed}
    };
}

StatBlock stat_block_from_json(const json& j, const std::string& what) {
    expect_object(j, what);
    StatBlock stats;
    stats.hp = require_int(j, "hp");
    stats.attack = require_int(j, "attack");
    stats.defense = require_int(j, "defense");
    stats.sp_atk = require_int(j, "sp_atk");
    stats.sp_def = require_int(j, "sp_def");
    stats.speed = require_int(j, "speed");
    return stats;
}

json stages_to_json(const StatStages& stages) {
    json j = json::object();
    for (StatKind stat : STAGED_STATS) {
        j[to_string(stat)] = stages.get(stat);
    }
    return j;
}

StatStages stages_from_json(const json& j) {
    expect_object(j, "stages");
    StatStages stages;
    for (StatKind stat : STAGED_STATS) {
        int value = read_int(j, to_string(stat), 0);
        if (value < MIN_STAT_STAGE || value > MAX_STAT_STAGE) {
            throw LoadError(StateError::INVALID_VALUE,
                            std::string("stage '") + to_string(stat) + "' out of range: " + std::to_string(value));
        }
        stages.adjust(stat, value);
    }
    return stages;
}

// ----------------------------------------------------------------------------
// Events and turn logs
// ----------------------------------------------------------------------------

TurnEvent event_from_json(const json& j) {
    expect_object(j, "event");
    TurnEvent event;
    event.type = require_enum<EventType>(j, "type", parse_event_type);
    event.side = read_side(j, "side");
    event.message = read_string(j, "message");
    event.amount = read_int(j, "amount", 0);
    if (present(j, "remaining_hp")) {
        event.remaining_hp = read_int(j, "remaining_hp", 0);
    }
    event.critical = read_bool(j, "critical", false);
    if (present(j, "effectiveness")) {
        if (!j["effectiveness"].is_number()) {
            throw LoadError(StateError::INVALID_VALUE, "field 'effectiveness' must be a number");
        }
        event.effectiveness = j["effectiveness"].get<double>();
    }
    event.move_id = read_string(j, "move_id");
    event.status = read_enum(j, "status", StatusCondition::NONE, parse_status);
    if (present(j, "stat")) {
        event.stat = read_enum(j, "stat", StatKind::ATTACK, parse_stat);
    }
    event.winner_id = read_string(j, "winner_id");
    event.reason = read_enum(j, "reason", EndReason::NONE, parse_end_reason);
    event.failure = read_enum(j, "failure", MoveFailure::NONE, parse_move_failure);
    return event;
}

std::vector<TurnEvent> events_from_json(const json& j, const char* key) {
    std::vector<TurnEvent> events;
    if (!present(j, key)) return events;
    if (!j[key].is_array()) {
        throw LoadError(StateError::INVALID_VALUE, std::string("field '") + key + "' must be an array");
    }
    for (const auto& e : j[key]) {
        events.push_back(event_from_json(e));
    }
    return events;
}

TurnLog log_from_json(const json& j) {
    expect_object(j, "turn");
    TurnLog log;
    log.turn_number = require_int(j, "turn_number");
    log.move_a = read_optional_string(j, "move_a");
    log.move_b = read_optional_string(j, "move_b");
    log.first_side = read_side(j, "first_side");
    log.events = events_from_json(j, "events");
    log.agent_a_hp = read_int(j, "agent_a_hp", 0);
    log.agent_b_hp = read_int(j, "agent_b_hp", 0);
    return log;
}

// ----------------------------------------------------------------------------
// Combatants
// ----------------------------------------------------------------------------

MoveSlot slot_from_json(const json& j) {
    expect_object(j, "move slot");
    std::string error;
    auto move = MoveDatabase::parse_move(require(j, "move"), &error);
    if (!move) {
        throw LoadError(StateError::INVALID_VALUE, "bad move in slot: " + error);
    }
    MoveSlot slot(*move);
    slot.current_pp = read_int(j, "current_pp", move->pp);
    if (slot.current_pp < 0) {
        throw LoadError(StateError::INVALID_VALUE, "negative PP for move '" + move->id + "'");
    }
    return slot;
}

CombatantState combatant_from_json(const json& j, const std::string& what) {
    expect_object(j, what);
    CombatantState c;
    c.id = read_string(j, "id");
    if (c.id.empty()) {
        throw LoadError(StateError::MISSING_FIELD, what + " has no id");
    }
    c.name = read_string(j, "name", c.id);
    c.type = require_enum<ElementType>(j, "type", parse_element_type);
    c.level = read_int(j, "level", 1);
    EvolutionTier tier = evolution_tier(c.level);
    c.evolution_tier = read_int(j, "evolution_tier", tier.tier);
    c.evolution_name = read_string(j, "evolution_name", tier.name);

    c.max_hp = require_int(j, "max_hp");
    c.current_hp = require_int(j, "current_hp");
    if (c.max_hp <= 0 || c.current_hp < 0 || c.current_hp > c.max_hp) {
        throw LoadError(StateError::INVALID_VALUE,
                        what + " HP out of range: " + std::to_string(c.current_hp) + "/" + std::to_string(c.max_hp));
    }

    c.effective_stats = stat_block_from_json(require(j, "stats"), "stats");
    c.base_stats = present(j, "base_stats") ? stat_block_from_json(j["base_stats"], "base_stats")
                                            : c.effective_stats;

    c.status = read_enum(j, "status", StatusCondition::NONE, parse_status);
    if (c.status == StatusCondition::CONFUSION) {
        throw LoadError(StateError::INVALID_VALUE, what + " has confusion as its primary status");
    }
    c.confused = read_bool(j, "confused", false);
    c.freeze_turns = read_int(j, "freeze_turns", 0);
    c.sleep_turns = read_int(j, "sleep_turns", 0);
    c.confusion_turns = read_int(j, "confusion_turns", 0);
    c.woke_from_damage = read_bool(j, "woke_from_damage", false);

    if (present(j, "stages")) {
        c.stages = stages_from_json(j["stages"]);
    }

    c.sturdy_used = read_bool(j, "sturdy_used", false);
    c.wish_pending = read_bool(j, "wish_pending", false);
    c.wish_turn = read_int(j, "wish_turn", 0);
    c.leech_seeded = read_bool(j, "leech_seeded", false);
    c.cursed = read_bool(j, "cursed", false);
    c.flinched = read_bool(j, "flinched", false);
    c.took_damage_this_turn = read_bool(j, "took_damage_this_turn", false);

    c.ability = read_string(j, "ability");

    const json& moves = require(j, "moves");
    if (!moves.is_array()) {
        throw LoadError(StateError::INVALID_VALUE, what + " moves must be an array");
    }
    for (const auto& m : moves) {
        c.moves.push_back(slot_from_json(m));
    }

    c.consecutive_timeouts = read_int(j, "consecutive_timeouts", 0);
    return c;
}

BattleState state_from_json(const json& j) {
    expect_object(j, "battle");
    BattleState state;
    state.id = read_string(j, "id");
    if (state.id.empty()) {
        throw LoadError(StateError::MISSING_FIELD, "missing field 'id'");
    }
    state.agent_a = combatant_from_json(require(j, "agent_a"), "agent_a");
    state.agent_b = combatant_from_json(require(j, "agent_b"), "agent_b");

    state.turn_number = require_int(j, "turn_number");
    if (state.turn_number < 0) {
        throw LoadError(StateError::INVALID_VALUE, "negative turn number");
    }
    state.status = require_enum<BattleStatus>(j, "status", parse_battle_status);
    state.current_phase = read_enum(j, "current_phase",
                                    state.is_finished() ? BattlePhase::FINISHED : BattlePhase::WAITING,
                                    parse_battle_phase);
    state.winner_id = read_string(j, "winner_id");
    state.end_reason = read_enum(j, "end_reason", EndReason::NONE, parse_end_reason);

    if (state.is_finished() && !state.side_of(state.winner_id)) {
        throw LoadError(StateError::INVALID_VALUE, "finished battle without a participant winner");
    }
    if (!state.is_finished() && !state.winner_id.empty()) {
        throw LoadError(StateError::INVALID_VALUE, "active battle has a winner");
    }

    state.first_side = read_side(j, "first_side");
    state.opening_events = events_from_json(j, "opening_events");

    if (present(j, "turns")) {
        if (!j["turns"].is_array()) {
            throw LoadError(StateError::INVALID_VALUE, "field 'turns' must be an array");
        }
        for (const auto& t : j["turns"]) {
            state.turns.push_back(log_from_json(t));
        }
    }

    state.started_at = read_string(j, "started_at");
    state.last_move_at = read_string(j, "last_move_at");
    if (present(j, "last_turn_at_ms")) {
        if (!j["last_turn_at_ms"].is_number_integer()) {
            throw LoadError(StateError::INVALID_VALUE, "field 'last_turn_at_ms' must be an integer");
        }
        state.last_turn_at_ms = j["last_turn_at_ms"].get<int64_t>();
    }
    if (present(j, "rng_seed")) {
        if (!j["rng_seed"].is_number_unsigned()) {
            throw LoadError(StateError::INVALID_VALUE, "field 'rng_seed' must be an unsigned integer");
        }
        state.rng_seed = j["rng_seed"].get<uint64_t>();
    }
    state.rng_state = read_string(j, "rng_state");
    state.pending_move_a = read_optional_string(j, "pending_move_a");
    state.pending_move_b = read_optional_string(j, "pending_move_b");
    return state;
}

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json side_to_json(const std::optional<Side>& side) {
    return side ? json(to_string(*side)) : json(nullptr);
}

} // namespace

// ============================================================================
// TO JSON
// ============================================================================

json turn_event_to_json(const TurnEvent& event) {
    json j = {
        {"type", to_string(event.type)},
        {"message", event.message}
    };
    if (event.side) j["side"] = to_string(*event.side);
    if (event.amount != 0) j["amount"] = event.amount;
    if (event.remaining_hp) j["remaining_hp"] = *event.remaining_hp;
    if (event.critical) j["critical"] = true;
    if (event.effectiveness != 1.0) j["effectiveness"] = event.effectiveness;
    if (!event.move_id.empty()) j["move_id"] = event.move_id;
    if (event.status != StatusCondition::NONE) j["status"] = to_string(event.status);
    if (event.stat) j["stat"] = to_string(*event.stat);
    if (!event.winner_id.empty()) j["winner_id"] = event.winner_id;
    if (event.reason != EndReason::NONE) j["reason"] = to_string(event.reason);
    if (event.failure != MoveFailure::NONE) j["failure"] = to_string(event.failure);
    return j;
}

json turn_log_to_json(const TurnLog& log) {
    json events = json::array();
    for (const auto& e : log.events) {
        events.push_back(turn_event_to_json(e));
    }
    return json{
        {"turn_number", log.turn_number},
        {"move_a", optional_to_json(log.move_a)},
        {"move_b", optional_to_json(log.move_b)},
        {"first_side", side_to_json(log.first_side)},
        {"events", events},
        {"agent_a_hp", log.agent_a_hp},
        {"agent_b_hp", log.agent_b_hp}
    };
}

json combatant_to_json(const CombatantState& c) {
    json moves = json::array();
    for (const auto& slot : c.moves) {
        moves.push_back({
            {"move", MoveDatabase::move_to_json(slot.move)},
            {"current_pp", slot.current_pp}
        });
    }

    return json{
        {"id", c.id},
        {"name", c.name},
        {"type", to_string(c.type)},
        {"level", c.level},
        {"evolution_tier", c.evolution_tier},
        {"evolution_name", c.evolution_name},
        {"max_hp", c.max_hp},
        {"current_hp", c.current_hp},
        {"base_stats", stat_block_to_json(c.base_stats)},
        {"stats", stat_block_to_json(c.effective_stats)},
        {"status", to_string(c.status)},
        {"confused", c.confused},
        {"freeze_turns", c.freeze_turns},
        {"sleep_turns", c.sleep_turns},
        {"confusion_turns", c.confusion_turns},
        {"woke_from_damage", c.woke_from_damage},
        {"stages", stages_to_json(c.stages)},
        {"sturdy_used", c.sturdy_used},
        {"wish_pending", c.wish_pending},
        {"wish_turn", c.wish_turn},
        {"leech_seeded", c.leech_seeded},
        {"cursed", c.cursed},
        {"flinched", c.flinched},
        {"took_damage_this_turn", c.took_damage_this_turn},
        {"ability", c.ability},
        {"moves", moves},
        {"consecutive_timeouts", c.consecutive_timeouts}
    };
}

json battle_to_json(const BattleState& state) {
    json opening = json::array();
    for (const auto& e : state.opening_events) {
        opening.push_back(turn_event_to_json(e));
    }
    json turns = json::array();
    for (const auto& t : state.turns) {
        turns.push_back(turn_log_to_json(t));
    }

    return json{
        {"id", state.id},
        {"agent_a", combatant_to_json(state.agent_a)},
        {"agent_b", combatant_to_json(state.agent_b)},
        {"turn_number", state.turn_number},
        {"status", to_string(state.status)},
        {"current_phase", to_string(state.current_phase)},
        {"winner_id", state.winner_id},
        {"end_reason", to_string(state.end_reason)},
        {"first_side", side_to_json(state.first_side)},
        {"opening_events", opening},
        {"turns", turns},
        {"started_at", state.started_at},
        {"last_move_at", state.last_move_at},
        {"last_turn_at_ms", state.last_turn_at_ms},
        {"rng_seed", state.rng_seed},
        {"rng_state", state.rng_state},
        {"pending_move_a", optional_to_json(state.pending_move_a)},
        {"pending_move_b", optional_to_json(state.pending_move_b)}
    };
}

json agent_profile_to_json(const AgentProfile& p) {
    json j = {
        {"id", p.id},
        {"name", p.name},
        {"type", to_string(p.type)},
        {"level", p.level},
        {"base_hp", p.base_hp},
        {"base_attack", p.base_attack},
        {"base_defense", p.base_defense},
        {"base_sp_atk", p.base_sp_atk},
        {"base_sp_def", p.base_sp_def},
        {"base_speed", p.base_speed},
        {"ev_hp", p.ev_hp},
        {"ev_attack", p.ev_attack},
        {"ev_defense", p.ev_defense},
        {"ev_sp_atk", p.ev_sp_atk},
        {"ev_sp_def", p.ev_sp_def},
        {"ev_speed", p.ev_speed},
        {"ability", p.ability},
        {"moves", p.moves}
    };
    if (!p.nature_name.empty()) j["nature"] = p.nature_name;
    if (p.nature_boost) j["nature_boost"] = to_string(*p.nature_boost);
    if (p.nature_reduce) j["nature_reduce"] = to_string(*p.nature_reduce);
    return j;
}

json queue_entry_to_json(const QueueEntry& entry) {
    auto joined_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.joined_at.time_since_epoch()).count();
    return json{
        {"agent_id", entry.agent_id},
        {"level", entry.level},
        {"joined_at_ms", static_cast<int64_t>(joined_ms)}
    };
}

json queue_stats_to_json(const QueueStats& stats) {
    return json{
        {"size", stats.size},
        {"avg_level", stats.avg_level},
        {"min_level", stats.min_level},
        {"max_level", stats.max_level},
        {"min_wait_seconds", stats.min_wait_seconds},
        {"avg_wait_seconds", stats.avg_wait_seconds},
        {"max_wait_seconds", stats.max_wait_seconds}
    };
}

std::string serialize_battle(const BattleState& state, int indent) {
    return battle_to_json(state).dump(indent);
}

// ============================================================================
// FROM JSON
// ============================================================================

BattleLoadResult battle_from_json(const json& data) {
    BattleLoadResult result;
    try {
        result.state = state_from_json(data);
        result.ok = true;
    } catch (const LoadError& e) {
        result.error = e.kind();
        result.message = e.what();
    } catch (const json::exception& e) {
        result.error = StateError::INVALID_VALUE;
        result.message = e.what();
    }
    return result;
}

BattleLoadResult deserialize_battle(const std::string& text) {
    json data;
    try {
        data = json::parse(text);
    } catch (const json::parse_error& e) {
        BattleLoadResult result;
        result.error = StateError::MALFORMED_JSON;
        result.message = e.what();
        return result;
    }
    return battle_from_json(data);
}

std::optional<TurnLog> turn_log_from_json(const json& data, std::string* error) {
    try {
        return log_from_json(data);
    } catch (const LoadError& e) {
        if (error) *error = e.what();
    } catch (const json::exception& e) {
        if (error) *error = e.what();
    }
    return std::nullopt;
}

std::optional<AgentProfile> agent_profile_from_json(const json& data, std::string* error) {
    try {
        expect_object(data, "agent");
        AgentProfile p;
        p.id = read_string(data, "id");
        if (p.id.empty()) {
            throw LoadError(StateError::MISSING_FIELD, "missing field 'id'");
        }
        p.name = read_string(data, "name", p.name);
        p.type = read_enum(data, "type", ElementType::NEUTRAL, parse_element_type);
        p.level = read_int(data, "level", p.level);

        p.base_hp = read_int(data, "base_hp", p.base_hp);
        p.base_attack = read_int(data, "base_attack", p.base_attack);
        p.base_defense = read_int(data, "base_defense", p.base_defense);
        p.base_sp_atk = read_int(data, "base_sp_atk", p.base_sp_atk);
        p.base_sp_def = read_int(data, "base_sp_def", p.base_sp_def);
        p.base_speed = read_int(data, "base_speed", p.base_speed);

        p.ev_hp = read_int(data, "ev_hp", 0);
        p.ev_attack = read_int(data, "ev_attack", 0);
        p.ev_defense = read_int(data, "ev_defense", 0);
        p.ev_sp_atk = read_int(data, "ev_sp_atk", 0);
        p.ev_sp_def = read_int(data, "ev_sp_def", 0);
        p.ev_speed = read_int(data, "ev_speed", 0);

        p.nature_name = read_string(data, "nature");
        if (present(data, "nature_boost")) {
            p.nature_boost = read_enum(data, "nature_boost", StatKind::ATTACK, parse_stat);
        }
        if (present(data, "nature_reduce")) {
            p.nature_reduce = read_enum(data, "nature_reduce", StatKind::ATTACK, parse_stat);
        }

        p.ability = read_string(data, "ability");
        if (present(data, "moves")) {
            p.moves = data["moves"].get<std::vector<MoveID>>();
        }
        return p;
    } catch (const LoadError& e) {
        if (error) *error = e.what();
    } catch (const json::exception& e) {
        if (error) *error = e.what();
    }
    return std::nullopt;
}

std::optional<QueueEntry> queue_entry_from_json(const json& data, std::string* error) {
    try {
        expect_object(data, "queue entry");
        QueueEntry entry;
        entry.agent_id = read_string(data, "agent_id");
        if (entry.agent_id.empty()) {
            throw LoadError(StateError::MISSING_FIELD, "missing field 'agent_id'");
        }
        entry.level = read_int(data, "level", 1);
        require(data, "joined_at_ms");
        entry.joined_at = QueueClock::time_point(
            std::chrono::milliseconds(data["joined_at_ms"].get<int64_t>()));
        return entry;
    } catch (const LoadError& e) {
        if (error) *error = e.what();
    } catch (const json::exception& e) {
        if (error) *error = e.what();
    }
    return std::nullopt;
}

} // namespace clawcombat
