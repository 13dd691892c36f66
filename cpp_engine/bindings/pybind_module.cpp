/**
 * ClawCombat Battle Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * Exposes battle creation, turn resolution, the AI strategist, matchmaking
 * and the battle record format to the Python backend.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "claw_engine.hpp"

namespace py = pybind11;
namespace cc = clawcombat;

PYBIND11_MODULE(claw_engine_cpp, m) {
    m.doc() = "ClawCombat lobster battle engine";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<cc::ElementType>(m, "ElementType")
        .value("NEUTRAL", cc::ElementType::NEUTRAL)
        .value("FIRE", cc::ElementType::FIRE)
        .value("WATER", cc::ElementType::WATER)
        .value("ELECTRIC", cc::ElementType::ELECTRIC)
        .value("GRASS", cc::ElementType::GRASS)
        .value("ICE", cc::ElementType::ICE)
        .value("MARTIAL", cc::ElementType::MARTIAL)
        .value("VENOM", cc::ElementType::VENOM)
        .value("EARTH", cc::ElementType::EARTH)
        .value("AIR", cc::ElementType::AIR)
        .value("PSYCHE", cc::ElementType::PSYCHE)
        .value("INSECT", cc::ElementType::INSECT)
        .value("STONE", cc::ElementType::STONE)
        .value("GHOST", cc::ElementType::GHOST)
        .value("DRAGON", cc::ElementType::DRAGON)
        .value("SHADOW", cc::ElementType::SHADOW)
        .value("METAL", cc::ElementType::METAL)
        .value("MYSTIC", cc::ElementType::MYSTIC)
        .export_values();

    py::enum_<cc::MoveCategory>(m, "MoveCategory")
        .value("PHYSICAL", cc::MoveCategory::PHYSICAL)
        .value("SPECIAL", cc::MoveCategory::SPECIAL)
        .value("STATUS", cc::MoveCategory::STATUS)
        .export_values();

    py::enum_<cc::StatusCondition>(m, "StatusCondition")
        .value("NONE", cc::StatusCondition::NONE)
        .value("BURNED", cc::StatusCondition::BURNED)
        .value("PARALYSIS", cc::StatusCondition::PARALYSIS)
        .value("POISON", cc::StatusCondition::POISON)
        .value("FREEZE", cc::StatusCondition::FREEZE)
        .value("SLEEP", cc::StatusCondition::SLEEP)
        .value("CONFUSION", cc::StatusCondition::CONFUSION)
        .export_values();

    py::enum_<cc::StatKind>(m, "StatKind")
        .value("HP", cc::StatKind::HP)
        .value("ATTACK", cc::StatKind::ATTACK)
        .value("DEFENSE", cc::StatKind::DEFENSE)
        .value("SP_ATK", cc::StatKind::SP_ATK)
        .value("SP_DEF", cc::StatKind::SP_DEF)
        .value("SPEED", cc::StatKind::SPEED)
        .export_values();

    py::enum_<cc::Side>(m, "Side")
        .value("A", cc::Side::A)
        .value("B", cc::Side::B);

    py::enum_<cc::BattleStatus>(m, "BattleStatus")
        .value("ACTIVE", cc::BattleStatus::ACTIVE)
        .value("FINISHED", cc::BattleStatus::FINISHED);

    py::enum_<cc::EndReason>(m, "EndReason")
        .value("NONE", cc::EndReason::NONE)
        .value("FAINT", cc::EndReason::FAINT)
        .value("TURN_LIMIT", cc::EndReason::TURN_LIMIT)
        .value("FORFEIT_TIMEOUT", cc::EndReason::FORFEIT_TIMEOUT)
        .value("SURRENDER", cc::EndReason::SURRENDER);

    py::enum_<cc::Difficulty>(m, "Difficulty")
        .value("EASY", cc::Difficulty::EASY)
        .value("NORMAL", cc::Difficulty::NORMAL)
        .value("HARD", cc::Difficulty::HARD);

    py::enum_<cc::QueueJoinStatus>(m, "QueueJoinStatus")
        .value("QUEUED", cc::QueueJoinStatus::QUEUED)
        .value("ALREADY_QUEUED", cc::QueueJoinStatus::ALREADY_QUEUED)
        .value("ALREADY_IN_BATTLE", cc::QueueJoinStatus::ALREADY_IN_BATTLE)
        .value("RATE_LIMITED", cc::QueueJoinStatus::RATE_LIMITED);

    py::enum_<cc::QueueLeaveStatus>(m, "QueueLeaveStatus")
        .value("REMOVED", cc::QueueLeaveStatus::REMOVED)
        .value("NOT_IN_QUEUE", cc::QueueLeaveStatus::NOT_IN_QUEUE);

    py::enum_<cc::SubmitStatus>(m, "SubmitStatus")
        .value("ACCEPTED", cc::SubmitStatus::ACCEPTED)
        .value("RESOLVED", cc::SubmitStatus::RESOLVED)
        .value("BATTLE_NOT_FOUND", cc::SubmitStatus::BATTLE_NOT_FOUND)
        .value("BATTLE_FINISHED", cc::SubmitStatus::BATTLE_FINISHED)
        .value("NOT_A_PARTICIPANT", cc::SubmitStatus::NOT_A_PARTICIPANT)
        .value("ALREADY_SUBMITTED", cc::SubmitStatus::ALREADY_SUBMITTED)
        .value("UNKNOWN_MOVE", cc::SubmitStatus::UNKNOWN_MOVE)
        .value("NO_PP", cc::SubmitStatus::NO_PP);

    // ========================================================================
    // TYPE & STAT ENGINE
    // ========================================================================

    m.def("effectiveness",
          py::overload_cast<cc::ElementType, cc::ElementType>(&cc::effectiveness),
          py::arg("attack_type"), py::arg("defender_type"));
    m.def("effectiveness_by_name",
          py::overload_cast<const std::string&, const std::string&>(&cc::effectiveness),
          py::arg("attack_type"), py::arg("defender_type"));
    m.def("stat_stage_multiplier", &cc::stat_stage_multiplier);
    m.def("effective_hp", &cc::effective_hp,
          py::arg("base_hp"), py::arg("level"), py::arg("ev") = 0);
    m.def("effective_stat", &cc::effective_stat,
          py::arg("base"), py::arg("level"), py::arg("ev") = 0, py::arg("nature_mod") = 1.0);
    m.def("effective_move_power", &cc::effective_move_power);

    py::class_<cc::EvolutionTier>(m, "EvolutionTier")
        .def_readonly("tier", &cc::EvolutionTier::tier)
        .def_readonly("name", &cc::EvolutionTier::name)
        .def_readonly("min_level", &cc::EvolutionTier::min_level)
        .def_readonly("max_level", &cc::EvolutionTier::max_level)
        .def_readonly("stat_bonus", &cc::EvolutionTier::stat_bonus);

    m.def("evolution_tier", &cc::evolution_tier);

    // ========================================================================
    // MOVES
    // ========================================================================

    py::class_<cc::MoveDef>(m, "MoveDef")
        .def_readonly("id", &cc::MoveDef::id)
        .def_readonly("name", &cc::MoveDef::name)
        .def_readonly("type", &cc::MoveDef::type)
        .def_readonly("category", &cc::MoveDef::category)
        .def_readonly("power", &cc::MoveDef::power)
        .def_readonly("accuracy", &cc::MoveDef::accuracy)
        .def_readonly("pp", &cc::MoveDef::pp)
        .def_readonly("priority", &cc::MoveDef::priority)
        .def_readonly("description", &cc::MoveDef::description)
        .def("to_json", [](const cc::MoveDef& move) {
            return cc::MoveDatabase::move_to_json(move).dump();
        });

    py::class_<cc::MoveSelectionResult>(m, "MoveSelectionResult")
        .def_readonly("valid", &cc::MoveSelectionResult::valid)
        .def_readonly("error", &cc::MoveSelectionResult::error);

    py::class_<cc::MoveDatabase>(m, "MoveDatabase")
        .def(py::init<>())
        .def("load_from_json", &cc::MoveDatabase::load_from_json)
        .def("load_from_string", &cc::MoveDatabase::load_from_string)
        .def("get_move", &cc::MoveDatabase::get_move, py::return_value_policy::reference_internal)
        .def("has_move", &cc::MoveDatabase::has_move)
        .def("move_pool", &cc::MoveDatabase::move_pool)
        .def("default_loadout", &cc::MoveDatabase::default_loadout)
        .def("validate_move_selection", &cc::MoveDatabase::validate_move_selection)
        .def("get_all_move_ids", &cc::MoveDatabase::get_all_move_ids)
        .def("move_count", &cc::MoveDatabase::move_count);

    py::class_<cc::BattleRng>(m, "BattleRng")
        .def(py::init<uint64_t>(), py::arg("seed") = 0)
        .def("uniform", &cc::BattleRng::uniform)
        .def("uniform_int", &cc::BattleRng::uniform_int)
        .def("seed", &cc::BattleRng::seed)
        .def("save_state", &cc::BattleRng::save_state)
        .def("restore_state", &cc::BattleRng::restore_state);

    // ========================================================================
    // AGENTS & COMBATANTS
    // ========================================================================

    py::class_<cc::AgentProfile>(m, "AgentProfile")
        .def(py::init<>())
        .def_readwrite("id", &cc::AgentProfile::id)
        .def_readwrite("name", &cc::AgentProfile::name)
        .def_readwrite("type", &cc::AgentProfile::type)
        .def_readwrite("level", &cc::AgentProfile::level)
        .def_readwrite("base_hp", &cc::AgentProfile::base_hp)
        .def_readwrite("base_attack", &cc::AgentProfile::base_attack)
        .def_readwrite("base_defense", &cc::AgentProfile::base_defense)
        .def_readwrite("base_sp_atk", &cc::AgentProfile::base_sp_atk)
        .def_readwrite("base_sp_def", &cc::AgentProfile::base_sp_def)
        .def_readwrite("base_speed", &cc::AgentProfile::base_speed)
        .def_readwrite("ev_hp", &cc::AgentProfile::ev_hp)
        .def_readwrite("ev_attack", &cc::AgentProfile::ev_attack)
        .def_readwrite("ev_defense", &cc::AgentProfile::ev_defense)
        .def_readwrite("ev_sp_atk", &cc::AgentProfile::ev_sp_atk)
        .def_readwrite("ev_sp_def", &cc::AgentProfile::ev_sp_def)
        .def_readwrite("ev_speed", &cc::AgentProfile::ev_speed)
        .def_readwrite("nature_name", &cc::AgentProfile::nature_name)
        .def_readwrite("nature_boost", &cc::AgentProfile::nature_boost)
        .def_readwrite("nature_reduce", &cc::AgentProfile::nature_reduce)
        .def_readwrite("ability", &cc::AgentProfile::ability)
        .def_readwrite("moves", &cc::AgentProfile::moves);

    py::class_<cc::MoveSlot>(m, "MoveSlot")
        .def_readonly("move", &cc::MoveSlot::move)
        .def_readonly("current_pp", &cc::MoveSlot::current_pp);

    py::class_<cc::CombatantState>(m, "CombatantState")
        .def_readonly("id", &cc::CombatantState::id)
        .def_readonly("name", &cc::CombatantState::name)
        .def_readonly("type", &cc::CombatantState::type)
        .def_readonly("level", &cc::CombatantState::level)
        .def_readonly("evolution_tier", &cc::CombatantState::evolution_tier)
        .def_readonly("evolution_name", &cc::CombatantState::evolution_name)
        .def_readonly("max_hp", &cc::CombatantState::max_hp)
        .def_readonly("current_hp", &cc::CombatantState::current_hp)
        .def_readonly("status", &cc::CombatantState::status)
        .def_readonly("confused", &cc::CombatantState::confused)
        .def_readonly("ability", &cc::CombatantState::ability)
        .def_readonly("moves", &cc::CombatantState::moves)
        .def_readonly("consecutive_timeouts", &cc::CombatantState::consecutive_timeouts)
        .def("is_fainted", &cc::CombatantState::is_fainted)
        .def("hp_ratio", &cc::CombatantState::hp_ratio)
        .def("move_ids", &cc::CombatantState::move_ids)
        .def("stage", [](const cc::CombatantState& c, cc::StatKind stat) {
            return c.stages.get(stat);
        });

    // ========================================================================
    // BATTLE STATE
    // ========================================================================

    py::class_<cc::TurnEvent>(m, "TurnEvent")
        .def_property_readonly("type", [](const cc::TurnEvent& e) {
            return std::string(cc::to_string(e.type));
        })
        .def_readonly("side", &cc::TurnEvent::side)
        .def_readonly("message", &cc::TurnEvent::message)
        .def_readonly("amount", &cc::TurnEvent::amount)
        .def_readonly("critical", &cc::TurnEvent::critical)
        .def_readonly("effectiveness", &cc::TurnEvent::effectiveness)
        .def_readonly("move_id", &cc::TurnEvent::move_id);

    py::class_<cc::TurnLog>(m, "TurnLog")
        .def_readonly("turn_number", &cc::TurnLog::turn_number)
        .def_readonly("move_a", &cc::TurnLog::move_a)
        .def_readonly("move_b", &cc::TurnLog::move_b)
        .def_readonly("first_side", &cc::TurnLog::first_side)
        .def_readonly("events", &cc::TurnLog::events)
        .def_readonly("agent_a_hp", &cc::TurnLog::agent_a_hp)
        .def_readonly("agent_b_hp", &cc::TurnLog::agent_b_hp)
        .def("to_json", [](const cc::TurnLog& log) {
            return cc::turn_log_to_json(log).dump();
        });

    py::class_<cc::BattleState>(m, "BattleState")
        .def_readonly("id", &cc::BattleState::id)
        .def_readonly("agent_a", &cc::BattleState::agent_a)
        .def_readonly("agent_b", &cc::BattleState::agent_b)
        .def_readonly("turn_number", &cc::BattleState::turn_number)
        .def_readonly("status", &cc::BattleState::status)
        .def_readonly("winner_id", &cc::BattleState::winner_id)
        .def_readonly("end_reason", &cc::BattleState::end_reason)
        .def_readonly("turns", &cc::BattleState::turns)
        .def_readonly("opening_events", &cc::BattleState::opening_events)
        .def_readonly("started_at", &cc::BattleState::started_at)
        .def_readonly("last_move_at", &cc::BattleState::last_move_at)
        .def("is_finished", &cc::BattleState::is_finished)
        .def("loser_id", &cc::BattleState::loser_id)
        .def("to_json", [](const cc::BattleState& state, int indent) {
            return cc::serialize_battle(state, indent);
        }, py::arg("indent") = -1);

    py::class_<cc::BattleLoadResult>(m, "BattleLoadResult")
        .def_readonly("ok", &cc::BattleLoadResult::ok)
        .def_readonly("message", &cc::BattleLoadResult::message)
        .def_readonly("state", &cc::BattleLoadResult::state)
        .def_property_readonly("error", [](const cc::BattleLoadResult& r) {
            return std::string(cc::to_string(r.error));
        });

    m.def("serialize_battle", &cc::serialize_battle,
          py::arg("state"), py::arg("indent") = -1);
    m.def("deserialize_battle", &cc::deserialize_battle);

    // ========================================================================
    // RESOLUTION
    // ========================================================================

    py::class_<cc::BattleBuilder>(m, "BattleBuilder")
        .def(py::init([](const cc::MoveDatabase& moves) {
            return cc::BattleBuilder(moves);
        }), py::keep_alive<1, 2>())
        .def("build_combatant", &cc::BattleBuilder::build_combatant)
        .def("create_battle", &cc::BattleBuilder::create_battle,
             py::arg("profile_a"), py::arg("profile_b"), py::arg("battle_id"),
             py::arg("seed"), py::arg("now_ms") = 0);

    py::class_<cc::TurnResult>(m, "TurnResult")
        .def_readonly("ok", &cc::TurnResult::ok)
        .def_readonly("log", &cc::TurnResult::log);

    py::class_<cc::TurnResolver>(m, "TurnResolver")
        .def(py::init([](int max_battle_turns, int max_consecutive_timeouts) {
            cc::ResolverSettings settings;
            settings.max_battle_turns = max_battle_turns;
            settings.max_consecutive_timeouts = max_consecutive_timeouts;
            return cc::TurnResolver(settings);
        }), py::arg("max_battle_turns") = 50, py::arg("max_consecutive_timeouts") = 3)
        .def("resolve_turn", &cc::TurnResolver::resolve_turn)
        .def("surrender", &cc::TurnResolver::surrender)
        .def("effective_speed", &cc::TurnResolver::effective_speed);

    // ========================================================================
    // AI STRATEGIST
    // ========================================================================

    py::class_<cc::ScoredMove>(m, "ScoredMove")
        .def_readonly("move_id", &cc::ScoredMove::move_id)
        .def_readonly("name", &cc::ScoredMove::name)
        .def_readonly("score", &cc::ScoredMove::score);

    py::class_<cc::AIStrategist>(m, "AIStrategist")
        .def(py::init([](cc::Difficulty difficulty) {
            return cc::AIStrategist(difficulty);
        }), py::arg("difficulty") = cc::Difficulty::NORMAL)
        .def("choose", &cc::AIStrategist::choose)
        .def("evaluate_move", &cc::AIStrategist::evaluate_move)
        .def("rank_moves", &cc::AIStrategist::rank_moves)
        .def_property("difficulty", &cc::AIStrategist::difficulty, &cc::AIStrategist::set_difficulty);

    // ========================================================================
    // MATCHMAKING
    // ========================================================================

    py::class_<cc::QueueStore>(m, "QueueStore");
    py::class_<cc::InMemoryQueueStore, cc::QueueStore>(m, "InMemoryQueueStore")
        .def(py::init<>())
        .def("size", &cc::InMemoryQueueStore::size);

    py::class_<cc::FightLimitPolicy>(m, "FightLimitPolicy");
    py::class_<cc::UnlimitedFightPolicy, cc::FightLimitPolicy>(m, "UnlimitedFightPolicy")
        .def(py::init<>())
        .def("fights_recorded", &cc::UnlimitedFightPolicy::fights_recorded);

    py::class_<cc::ActiveBattleLookup>(m, "ActiveBattleLookup");
    py::class_<cc::BattleStore, cc::ActiveBattleLookup>(m, "BattleStore");
    py::class_<cc::InMemoryBattleStore, cc::BattleStore>(m, "InMemoryBattleStore")
        .def(py::init<>())
        .def("record", &cc::InMemoryBattleStore::record)
        .def("put_record", &cc::InMemoryBattleStore::put_record)
        .def("active_battle_ids", &cc::InMemoryBattleStore::active_battle_ids)
        .def("active_battle_for", &cc::InMemoryBattleStore::active_battle_for)
        .def("size", &cc::InMemoryBattleStore::size);

    py::class_<cc::QueueJoinResult>(m, "QueueJoinResult")
        .def_readonly("status", &cc::QueueJoinResult::status)
        .def_readonly("queue_position", &cc::QueueJoinResult::queue_position)
        .def_readonly("battle_id", &cc::QueueJoinResult::battle_id)
        .def_readonly("reason", &cc::QueueJoinResult::reason);

    py::class_<cc::MatchPair>(m, "MatchPair")
        .def_readonly("agent_a", &cc::MatchPair::agent_a)
        .def_readonly("agent_b", &cc::MatchPair::agent_b)
        .def_readonly("level_diff", &cc::MatchPair::level_diff);

    py::class_<cc::MatchmakingQueue>(m, "MatchmakingQueue")
        .def(py::init<cc::QueueStore&, cc::FightLimitPolicy&, const cc::ActiveBattleLookup&>(),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>(), py::keep_alive<1, 4>())
        .def("join", &cc::MatchmakingQueue::join)
        .def("leave", &cc::MatchmakingQueue::leave)
        .def("process_queue", &cc::MatchmakingQueue::process_queue)
        .def("level_range", &cc::MatchmakingQueue::level_range)
        .def("stats", [](cc::MatchmakingQueue& queue) {
            return cc::queue_stats_to_json(queue.stats()).dump();
        });

    // ========================================================================
    // SERVICE
    // ========================================================================

    py::class_<cc::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("moves_path", &cc::EngineConfig::moves_path)
        .def_readwrite("max_battle_turns", &cc::EngineConfig::max_battle_turns)
        .def_readwrite("turn_timeout_seconds", &cc::EngineConfig::turn_timeout_seconds)
        .def_readwrite("max_consecutive_timeouts", &cc::EngineConfig::max_consecutive_timeouts)
        .def_readwrite("xray_enabled", &cc::EngineConfig::xray_enabled)
        .def_readwrite("rng_seed", &cc::EngineConfig::rng_seed)
        .def("load_from_json", &cc::EngineConfig::load_from_json)
        .def("load_from_string", &cc::EngineConfig::load_from_string);

    py::class_<cc::AgentDirectory>(m, "AgentDirectory");
    py::class_<cc::InMemoryAgentDirectory, cc::AgentDirectory>(m, "InMemoryAgentDirectory")
        .def(py::init<>())
        .def("add", &cc::InMemoryAgentDirectory::add);

    py::class_<cc::SubmitResult>(m, "SubmitResult")
        .def_readonly("status", &cc::SubmitResult::status)
        .def_readonly("turn", &cc::SubmitResult::turn)
        .def_readonly("battle_finished", &cc::SubmitResult::battle_finished)
        .def_readonly("winner_id", &cc::SubmitResult::winner_id);

    py::class_<cc::BattleService>(m, "BattleService")
        .def(py::init([](const cc::MoveDatabase& moves, cc::BattleStore& store,
                         const cc::AgentDirectory& agents, const cc::EngineConfig& config) {
            return std::make_unique<cc::BattleService>(moves, store, agents, config);
        }), py::arg("moves"), py::arg("store"), py::arg("agents"),
            py::arg("config") = cc::EngineConfig{},
            py::keep_alive<1, 2>(), py::keep_alive<1, 3>(), py::keep_alive<1, 4>())
        .def("start_battle", &cc::BattleService::start_battle)
        .def("run_matchmaking", &cc::BattleService::run_matchmaking)
        .def("submit_move", &cc::BattleService::submit_move)
        .def("submit_ai_move", &cc::BattleService::submit_ai_move,
             py::arg("battle_id"), py::arg("agent_id"), py::arg("difficulty") = py::none())
        .def("surrender", &cc::BattleService::surrender)
        .def("check_timeouts", &cc::BattleService::check_timeouts)
        .def("play_ai_battle", &cc::BattleService::play_ai_battle)
        .def("get_battle", &cc::BattleService::get_battle);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = cc::get_version();
    m.attr("__version__") = cc::get_version();
}
