/**
 * ClawCombat Battle Engine - Battle Service Implementation
 */

#include "battle_service.hpp"
#include "battle_rng.hpp"
#include "battle_serialization.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <set>

namespace clawcombat {

// ============================================================================
// IN-MEMORY COLLABORATORS
// ============================================================================

std::optional<AgentProfile> InMemoryAgentDirectory::find_agent(const AgentID& agent_id) const {
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) return std::nullopt;
    return it->second;
}

bool InMemoryBattleStore::save(const BattleState& state) {
    std::string text;
    try {
        text = serialize_battle(state);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[BattleStore] Failed to serialize " << state.id << ": " << e.what() << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    records_[state.id] = std::move(text);

    for (const AgentID& agent_id : {state.agent_a.id, state.agent_b.id}) {
        auto it = active_by_agent_.find(agent_id);
        if (!state.is_finished()) {
            active_by_agent_[agent_id] = state.id;
        } else if (it != active_by_agent_.end() && it->second == state.id) {
            active_by_agent_.erase(it);
        }
    }
    return true;
}

std::optional<BattleState> InMemoryBattleStore::load(const BattleID& battle_id) const {
    std::string text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(battle_id);
        if (it == records_.end()) return std::nullopt;
        text = it->second;
    }

    BattleLoadResult loaded = deserialize_battle(text);
    if (!loaded.ok) {
        std::cerr << "[BattleStore] Corrupt record " << battle_id << " ("
                  << to_string(loaded.error) << "): " << loaded.message << std::endl;
        return std::nullopt;
    }
    return std::move(loaded.state);
}

std::vector<BattleID> InMemoryBattleStore::active_battle_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<BattleID> ids;
    for (const auto& entry : active_by_agent_) {
        ids.insert(entry.second);
    }
    return std::vector<BattleID>(ids.begin(), ids.end());
}

std::optional<BattleID> InMemoryBattleStore::active_battle_for(const AgentID& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_by_agent_.find(agent_id);
    if (it == active_by_agent_.end()) return std::nullopt;
    return it->second;
}

std::string InMemoryBattleStore::record(const BattleID& battle_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(battle_id);
    return it != records_.end() ? it->second : std::string();
}

void InMemoryBattleStore::put_record(const BattleID& battle_id, const std::string& json_text) {
    BattleLoadResult loaded = deserialize_battle(json_text);

    std::lock_guard<std::mutex> lock(mutex_);
    records_[battle_id] = json_text;
    if (loaded.ok && !loaded.state.is_finished()) {
        active_by_agent_[loaded.state.agent_a.id] = battle_id;
        active_by_agent_[loaded.state.agent_b.id] = battle_id;
    }
}

size_t InMemoryBattleStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

// ============================================================================
// BATTLE SERVICE
// ============================================================================

BattleService::BattleService(const MoveDatabase& moves,
                             BattleStore& store,
                             const AgentDirectory& agents,
                             EngineConfig config,
                             OutcomeSink* outcomes,
                             MillisClockFn clock)
    : store_(store),
      agents_(agents),
      config_(std::move(config)),
      outcomes_(outcomes),
      clock_(clock ? std::move(clock) : MillisClockFn(unix_now_ms)),
      builder_(moves),
      resolver_(config_.resolver_settings()) {}

BattleService::~BattleService() = default;

BattleID BattleService::next_battle_id() {
    return "battle_" + std::to_string(++battle_counter_);
}

uint64_t BattleService::next_seed() {
    if (config_.rng_seed != 0) {
        return config_.rng_seed + static_cast<uint64_t>(battle_counter_);
    }
    return BattleRng::from_clock().seed();
}

BattleRng BattleService::rng_for(const BattleState& state) const {
    BattleRng rng(state.rng_seed);
    if (!state.rng_state.empty() && !rng.restore_state(state.rng_state)) {
        std::cerr << "[BattleService] Bad RNG state in " << state.id
                  << ", continuing from seed" << std::endl;
    }
    return rng;
}

BattleLogger* BattleService::logger_for(const BattleState& state) {
    if (!config_.xray_enabled) return nullptr;

    auto it = loggers_.find(state.id);
    if (it == loggers_.end()) {
        auto logger = std::make_unique<BattleLogger>(state.id, config_.xray_output_dir);
        it = loggers_.emplace(state.id, std::move(logger)).first;
    }
    return it->second.get();
}

BattleState BattleService::create_and_store(const AgentProfile& agent_a, const AgentProfile& agent_b) {
    BattleID battle_id = next_battle_id();
    BattleState state = builder_.create_battle(agent_a, agent_b, battle_id, next_seed(), clock_());

    if (!store_.save(state)) {
        std::cerr << "[BattleService] Failed to store new battle " << battle_id << std::endl;
    }

    if (BattleLogger* logger = logger_for(state)) {
        logger->log_battle_start(state);
    }

    std::cout << "[BattleService] Battle " << battle_id << " started: "
              << state.agent_a.name << " vs " << state.agent_b.name << std::endl;
    return state;
}

void BattleService::commit_turn(BattleState& state, const TurnLog& log, BattleRng& rng) {
    int64_t now = clock_();
    state.rng_state = rng.save_state();
    state.last_turn_at_ms = now;
    state.last_move_at = iso8601_utc(now);
    state.pending_move_a.reset();
    state.pending_move_b.reset();

    if (!store_.save(state)) {
        std::cerr << "[BattleService] Failed to store turn " << log.turn_number
                  << " of " << state.id << std::endl;
    }

    BattleLogger* logger = logger_for(state);
    if (logger) {
        logger->log_turn(state, log);
    }

    if (!state.is_finished()) return;

    if (logger) {
        logger->log_battle_end(state);
        loggers_.erase(state.id);
    }

    std::cout << "[BattleService] Battle " << state.id << " finished after "
              << state.turn_number << " turns: " << state.winner_id
              << " wins (" << to_string(state.end_reason) << ")" << std::endl;

    if (outcomes_) {
        BattleOutcome outcome;
        outcome.battle_id = state.id;
        outcome.winner_id = state.winner_id;
        outcome.loser_id = state.loser_id();
        outcome.reason = state.end_reason;
        outcome.turns = state.turn_number;
        outcomes_->on_battle_end(outcome);
    }
}

// ============================================================================
// BATTLE CREATION
// ============================================================================

BattleState BattleService::start_battle(const AgentProfile& agent_a, const AgentProfile& agent_b) {
    std::lock_guard<std::mutex> lock(mutex_);
    return create_and_store(agent_a, agent_b);
}

std::vector<BattleID> BattleService::start_matched(const std::vector<MatchPair>& pairs) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BattleID> started;

    for (const auto& pair : pairs) {
        auto agent_a = agents_.find_agent(pair.agent_a);
        auto agent_b = agents_.find_agent(pair.agent_b);
        if (!agent_a || !agent_b) {
            std::cerr << "[BattleService] Cannot start " << pair.agent_a << " vs " << pair.agent_b
                      << ": unknown agent" << std::endl;
            continue;
        }
        started.push_back(create_and_store(*agent_a, *agent_b).id);
    }

    return started;
}

std::vector<BattleID> BattleService::run_matchmaking(MatchmakingQueue& queue) {
    return start_matched(queue.process_queue());
}

// ============================================================================
// MOVE SUBMISSION
// ============================================================================

SubmitResult BattleService::submit_locked(BattleState& state, Side side, const MoveID& move_id) {
    SubmitResult result;

    const MoveSlot* slot = state.combatant(side).find_move(move_id);
    if (!slot) {
        result.status = SubmitStatus::UNKNOWN_MOVE;
        return result;
    }
    if (slot->current_pp <= 0) {
        result.status = SubmitStatus::NO_PP;
        return result;
    }
    if (state.pending_move(side)) {
        result.status = SubmitStatus::ALREADY_SUBMITTED;
        return result;
    }

    state.pending_move(side) = move_id;

    if (!state.pending_move_a || !state.pending_move_b) {
        if (!store_.save(state)) {
            std::cerr << "[BattleService] Failed to store move for " << state.id << std::endl;
        }
        result.status = SubmitStatus::ACCEPTED;
        return result;
    }

    // The resolver clears pending moves when the battle ends
    std::optional<MoveID> move_a = state.pending_move_a;
    std::optional<MoveID> move_b = state.pending_move_b;

    BattleRng rng = rng_for(state);
    TurnResult turn = resolver_.resolve_turn(state, move_a, move_b, rng);
    commit_turn(state, turn.log, rng);

    result.status = SubmitStatus::RESOLVED;
    result.turn = turn.log;
    result.battle_finished = state.is_finished();
    result.winner_id = state.winner_id;
    return result;
}

SubmitResult BattleService::submit_move(const BattleID& battle_id, const AgentID& agent_id,
                                        const MoveID& move_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubmitResult result;

    auto state = store_.load(battle_id);
    if (!state) {
        result.status = SubmitStatus::BATTLE_NOT_FOUND;
        return result;
    }
    if (state->is_finished()) {
        result.status = SubmitStatus::BATTLE_FINISHED;
        return result;
    }
    auto side = state->side_of(agent_id);
    if (!side) {
        result.status = SubmitStatus::NOT_A_PARTICIPANT;
        return result;
    }

    return submit_locked(*state, *side, move_id);
}

SubmitResult BattleService::submit_ai_move(const BattleID& battle_id, const AgentID& agent_id,
                                           std::optional<Difficulty> difficulty) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubmitResult result;

    auto state = store_.load(battle_id);
    if (!state) {
        result.status = SubmitStatus::BATTLE_NOT_FOUND;
        return result;
    }
    if (state->is_finished()) {
        result.status = SubmitStatus::BATTLE_FINISHED;
        return result;
    }
    auto side = state->side_of(agent_id);
    if (!side) {
        result.status = SubmitStatus::NOT_A_PARTICIPANT;
        return result;
    }

    AIStrategist strategist(difficulty.value_or(config_.default_ai_difficulty));
    BattleRng rng = rng_for(*state);
    MoveID choice = strategist.choose(state->combatant(*side), state->combatant(opponent_of(*side)), rng);
    state->rng_state = rng.save_state();

    return submit_locked(*state, *side, choice);
}

SubmitResult BattleService::surrender(const BattleID& battle_id, const AgentID& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubmitResult result;

    auto state = store_.load(battle_id);
    if (!state) {
        result.status = SubmitStatus::BATTLE_NOT_FOUND;
        return result;
    }
    if (state->is_finished()) {
        result.status = SubmitStatus::BATTLE_FINISHED;
        return result;
    }
    auto side = state->side_of(agent_id);
    if (!side) {
        result.status = SubmitStatus::NOT_A_PARTICIPANT;
        return result;
    }

    BattleRng rng = rng_for(*state);
    TurnResult turn = resolver_.surrender(*state, *side);
    commit_turn(*state, turn.log, rng);

    result.status = SubmitStatus::RESOLVED;
    result.turn = turn.log;
    result.battle_finished = true;
    result.winner_id = state->winner_id;
    return result;
}

// ============================================================================
// TIMEOUTS
// ============================================================================

std::vector<BattleID> BattleService::check_timeouts() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BattleID> advanced;
    int64_t now = clock_();

    for (const BattleID& battle_id : store_.active_battle_ids()) {
        auto state = store_.load(battle_id);
        if (!state || state->is_finished()) continue;
        if (now - state->last_turn_at_ms <= config_.turn_timeout_ms()) continue;

        for (Side side : {Side::A, Side::B}) {
            if (!state->pending_move(side)) {
                std::cout << "[BattleService] " << state->combatant(side).name
                          << " turn skipped due to timeout in " << battle_id << " ("
                          << state->combatant(side).consecutive_timeouts + 1 << "/"
                          << config_.max_consecutive_timeouts << ")" << std::endl;
            }
        }

        std::optional<MoveID> move_a = state->pending_move_a;
        std::optional<MoveID> move_b = state->pending_move_b;

        BattleRng rng = rng_for(*state);
        TurnResult turn = resolver_.resolve_timeout_turn(*state, move_a, move_b, rng);
        if (!turn.ok) continue;

        commit_turn(*state, turn.log, rng);
        advanced.push_back(battle_id);
    }

    return advanced;
}

// ============================================================================
// AI BATTLES
// ============================================================================

BattleState BattleService::play_ai_battle(const AgentProfile& agent_a, const AgentProfile& agent_b,
                                          Difficulty difficulty_a, Difficulty difficulty_b) {
    std::lock_guard<std::mutex> lock(mutex_);

    BattleState state = create_and_store(agent_a, agent_b);
    AIStrategist strategist_a(difficulty_a);
    AIStrategist strategist_b(difficulty_b);
    BattleRng rng = rng_for(state);

    while (!state.is_finished()) {
        MoveID move_a = strategist_a.choose(state.agent_a, state.agent_b, rng);
        MoveID move_b = strategist_b.choose(state.agent_b, state.agent_a, rng);

        TurnResult turn = resolver_.resolve_turn(state, move_a, move_b, rng);
        if (!turn.ok) break;
        commit_turn(state, turn.log, rng);
    }

    return state;
}

std::optional<BattleState> BattleService::get_battle(const BattleID& battle_id) const {
    return store_.load(battle_id);
}

} // namespace clawcombat
