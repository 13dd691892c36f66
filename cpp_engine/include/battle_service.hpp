/**
 * ClawCombat Battle Engine - Battle Service
 *
 * Request-driven battle orchestration:
 *
 *   - matched pairs from the queue become new battles
 *   - each side submits a move; the turn resolves once both are in
 *   - agents without a move source get one from the AI strategist
 *   - a timeout sweep resolves turns a side failed to submit in time
 *   - finished battles are reported to the outcome sink
 *
 * Battles are persisted through BattleStore between requests, RNG state
 * included, so every request works from the stored record.
 */

#pragma once

#include "ai_strategist.hpp"
#include "battle_builder.hpp"
#include "battle_logger.hpp"
#include "engine_config.hpp"
#include "matchmaking.hpp"
#include "turn_resolver.hpp"
#include <map>
#include <memory>
#include <mutex>

namespace clawcombat {

// ============================================================================
// COLLABORATORS
// ============================================================================

struct BattleOutcome {
    BattleID battle_id;
    AgentID winner_id;
    AgentID loser_id;
    EndReason reason = EndReason::NONE;
    int turns = 0;
};

/**
 * Receives finished battles (XP / ELO bookkeeping lives behind this).
 */
class OutcomeSink {
public:
    virtual ~OutcomeSink() = default;
    virtual void on_battle_end(const BattleOutcome& outcome) = 0;
};

/**
 * Agent records by id.
 */
class AgentDirectory {
public:
    virtual ~AgentDirectory() = default;
    virtual std::optional<AgentProfile> find_agent(const AgentID& agent_id) const = 0;
};

class InMemoryAgentDirectory : public AgentDirectory {
public:
    void add(const AgentProfile& profile) { agents_[profile.id] = profile; }

    std::optional<AgentProfile> find_agent(const AgentID& agent_id) const override;

private:
    std::map<AgentID, AgentProfile> agents_;
};

/**
 * Battle record store. Also answers "is this agent in an active battle?"
 * for the matchmaking queue.
 */
class BattleStore : public ActiveBattleLookup {
public:
    virtual bool save(const BattleState& state) = 0;

    /**
     * std::nullopt when the battle does not exist or its record is corrupt.
     */
    virtual std::optional<BattleState> load(const BattleID& battle_id) const = 0;

    virtual std::vector<BattleID> active_battle_ids() const = 0;
};

/**
 * Keeps each battle as its serialized JSON record.
 */
class InMemoryBattleStore : public BattleStore {
public:
    bool save(const BattleState& state) override;
    std::optional<BattleState> load(const BattleID& battle_id) const override;
    std::vector<BattleID> active_battle_ids() const override;
    std::optional<BattleID> active_battle_for(const AgentID& agent_id) const override;

    /**
     * Raw stored record, empty if absent.
     */
    std::string record(const BattleID& battle_id) const;

    /**
     * Replace a raw record (used to import battles and in tests).
     */
    void put_record(const BattleID& battle_id, const std::string& json_text);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<BattleID, std::string> records_;
    std::map<AgentID, BattleID> active_by_agent_;
};

// ============================================================================
// RESULTS
// ============================================================================

enum class SubmitStatus : uint8_t {
    ACCEPTED,            // stored, waiting for the opponent
    RESOLVED,            // both moves in, turn resolved
    BATTLE_NOT_FOUND,
    BATTLE_FINISHED,
    NOT_A_PARTICIPANT,
    ALREADY_SUBMITTED,
    UNKNOWN_MOVE,
    NO_PP
};

inline const char* to_string(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::ACCEPTED: return "accepted";
        case SubmitStatus::RESOLVED: return "resolved";
        case SubmitStatus::BATTLE_NOT_FOUND: return "battle_not_found";
        case SubmitStatus::BATTLE_FINISHED: return "battle_finished";
        case SubmitStatus::NOT_A_PARTICIPANT: return "not_a_participant";
        case SubmitStatus::ALREADY_SUBMITTED: return "already_submitted";
        case SubmitStatus::UNKNOWN_MOVE: return "unknown_move";
        case SubmitStatus::NO_PP: return "no_pp";
        default: return "unknown";
    }
}

struct SubmitResult {
    SubmitStatus status = SubmitStatus::ACCEPTED;
    std::optional<TurnLog> turn;    // set when a turn was resolved
    bool battle_finished = false;
    AgentID winner_id;
};

// ============================================================================
// BATTLE SERVICE
// ============================================================================

using MillisClockFn = std::function<int64_t()>;

class BattleService {
public:
    BattleService(const MoveDatabase& moves,
                  BattleStore& store,
                  const AgentDirectory& agents,
                  EngineConfig config = {},
                  OutcomeSink* outcomes = nullptr,
                  MillisClockFn clock = nullptr);

    ~BattleService();

    /**
     * Snapshot both agents into a new battle and store it.
     */
    BattleState start_battle(const AgentProfile& agent_a, const AgentProfile& agent_b);

    /**
     * Start battles for matched pairs. Pairs with an unknown agent are
     * skipped and reported.
     *
     * @return Ids of the battles started
     */
    std::vector<BattleID> start_matched(const std::vector<MatchPair>& pairs);

    /**
     * One queue pairing pass followed by start_matched().
     */
    std::vector<BattleID> run_matchmaking(MatchmakingQueue& queue);

    /**
     * Submit `agent_id`'s move for the current turn. Checks, in order:
     * battle exists, still active, agent participates, move known, PP left,
     * not already submitted. The turn resolves when both moves are in.
     */
    SubmitResult submit_move(const BattleID& battle_id, const AgentID& agent_id, const MoveID& move_id);

    /**
     * Submit a move chosen by the AI strategist for `agent_id`.
     */
    SubmitResult submit_ai_move(const BattleID& battle_id, const AgentID& agent_id,
                                std::optional<Difficulty> difficulty = std::nullopt);

    SubmitResult surrender(const BattleID& battle_id, const AgentID& agent_id);

    /**
     * Resolve every active battle whose current turn has been open longer
     * than the turn timeout. Sides without a pending move skip the turn.
     *
     * @return Ids of the battles that were advanced
     */
    std::vector<BattleID> check_timeouts();

    /**
     * Play a whole battle with both sides driven by the AI strategist.
     */
    BattleState play_ai_battle(const AgentProfile& agent_a, const AgentProfile& agent_b,
                               Difficulty difficulty_a, Difficulty difficulty_b);

    std::optional<BattleState> get_battle(const BattleID& battle_id) const;

    const EngineConfig& config() const { return config_; }
    const TurnResolver& resolver() const { return resolver_; }

private:
    BattleStore& store_;
    const AgentDirectory& agents_;
    EngineConfig config_;
    OutcomeSink* outcomes_;
    MillisClockFn clock_;

    BattleBuilder builder_;
    TurnResolver resolver_;

    std::mutex mutex_;
    int battle_counter_ = 0;
    std::map<BattleID, std::unique_ptr<BattleLogger>> loggers_;

    BattleID next_battle_id();
    uint64_t next_seed();

    BattleState create_and_store(const AgentProfile& agent_a, const AgentProfile& agent_b);

    /**
     * RNG positioned where the battle left off.
     */
    BattleRng rng_for(const BattleState& state) const;

    /**
     * Store the advanced battle, trace the turn and report a finished
     * battle.
     */
    void commit_turn(BattleState& state, const TurnLog& log, BattleRng& rng);

    SubmitResult submit_locked(BattleState& state, Side side, const MoveID& move_id);

    BattleLogger* logger_for(const BattleState& state);
};

} // namespace clawcombat
