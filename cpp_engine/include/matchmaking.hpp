/**
 * ClawCombat Battle Engine - Matchmaking Queue
 *
 * Level-proximity matchmaking with a search range that widens as an agent
 * waits:
 *
 *    0-30 seconds:  +/- 5 levels
 *   30-60 seconds:  +/- 10 levels
 *   60-90 seconds:  +/- 20 levels
 *   90+ seconds:    any level
 *
 * Queue state lives behind QueueStore. Every operation is a single
 * transact() call, so two concurrent pairing passes can never hand the same
 * agent to two opponents.
 */

#pragma once

#include "types.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace clawcombat {

using QueueClock = std::chrono::system_clock;
using ClockFn = std::function<QueueClock::time_point()>;

struct QueueEntry {
    AgentID agent_id;
    int level = 1;
    QueueClock::time_point joined_at;
};

// ============================================================================
// COLLABORATORS
// ============================================================================

/**
 * Transactional queue storage. The callback receives the full queue in
 * join order; whatever it leaves behind is committed atomically. If the
 * callback throws, nothing is committed.
 */
class QueueStore {
public:
    using Transaction = std::function<void(std::vector<QueueEntry>&)>;

    virtual ~QueueStore() = default;
    virtual void transact(const Transaction& fn) = 0;
};

/**
 * Process-local store. Transactions are serialized by a mutex and work on
 * a copy that replaces the queue on success.
 */
class InMemoryQueueStore : public QueueStore {
public:
    void transact(const Transaction& fn) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<QueueEntry> entries_;
};

struct FightLimitInfo {
    bool allowed = true;
    std::string reason;
    std::string tier;
    int remaining = -1;  // -1 = unlimited
};

/**
 * Fight rate limiting. The policy itself is external; results pass through.
 */
class FightLimitPolicy {
public:
    virtual ~FightLimitPolicy() = default;
    virtual FightLimitInfo check(const AgentID& agent_id) = 0;
    virtual void record_fight(const AgentID& agent_id) = 0;
};

/**
 * Allows everything and counts recorded fights.
 */
class UnlimitedFightPolicy : public FightLimitPolicy {
public:
    FightLimitInfo check(const AgentID&) override { return FightLimitInfo{}; }
    void record_fight(const AgentID& agent_id) override;

    int fights_recorded(const AgentID& agent_id) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<AgentID, int> fights_;
};

class ActiveBattleLookup {
public:
    virtual ~ActiveBattleLookup() = default;

    /**
     * Id of an active battle the agent is in, std::nullopt if none.
     */
    virtual std::optional<BattleID> active_battle_for(const AgentID& agent_id) const = 0;
};

// ============================================================================
// RESULTS
// ============================================================================

enum class QueueJoinStatus : uint8_t {
    QUEUED,
    ALREADY_QUEUED,
    ALREADY_IN_BATTLE,
    RATE_LIMITED
};

inline const char* to_string(QueueJoinStatus status) {
    switch (status) {
        case QueueJoinStatus::QUEUED: return "queued";
        case QueueJoinStatus::ALREADY_QUEUED: return "already_queued";
        case QueueJoinStatus::ALREADY_IN_BATTLE: return "already_in_battle";
        case QueueJoinStatus::RATE_LIMITED: return "rate_limited";
        default: return "unknown";
    }
}

enum class QueueLeaveStatus : uint8_t {
    REMOVED,
    NOT_IN_QUEUE
};

inline const char* to_string(QueueLeaveStatus status) {
    return status == QueueLeaveStatus::REMOVED ? "removed" : "not_in_queue";
}

struct QueueJoinResult {
    QueueJoinStatus status = QueueJoinStatus::QUEUED;
    int queue_position = 0;
    BattleID battle_id;         // already_in_battle
    std::string reason;         // rate_limited
    std::string tier;
    int remaining = -1;
};

struct MatchPair {
    AgentID agent_a;
    AgentID agent_b;
    int level_diff = 0;
};

struct QueueStats {
    int size = 0;
    double avg_level = 0.0;     // rounded to one decimal
    int min_level = 0;
    int max_level = 0;
    int64_t min_wait_seconds = 0;
    int64_t avg_wait_seconds = 0;
    int64_t max_wait_seconds = 0;
};

// ============================================================================
// MATCHMAKING QUEUE
// ============================================================================

struct MatchmakingSettings {
    // (wait seconds upper bound, level range); waits past the last band are unbounded
    std::vector<std::pair<int, int>> level_bands = {{30, 5}, {60, 10}, {90, 20}};
};

class MatchmakingQueue {
public:
    MatchmakingQueue(QueueStore& store,
                     FightLimitPolicy& limits,
                     const ActiveBattleLookup& battles,
                     MatchmakingSettings settings = {},
                     ClockFn clock = nullptr);

    /**
     * Add an agent. Checks, in order: rate limit, already queued (with its
     * current position), already in a battle.
     */
    QueueJoinResult join(const AgentID& agent_id, int level);

    QueueLeaveStatus leave(const AgentID& agent_id);

    /**
     * Closest-level opponent within the agent's current range. Ties go to
     * the opponent that joined first. Does not modify the queue.
     */
    std::optional<QueueEntry> find_match(const AgentID& agent_id);

    /**
     * One greedy pairing pass in join order. Matched agents leave the
     * queue and a fight is recorded for each.
     */
    std::vector<MatchPair> process_queue();

    QueueStats stats();

    /**
     * Allowed level difference after waiting `wait_seconds`.
     * std::nullopt means any level.
     */
    std::optional<int> level_range(double wait_seconds) const;

private:
    QueueStore& store_;
    FightLimitPolicy& limits_;
    const ActiveBattleLookup& battles_;
    MatchmakingSettings settings_;
    ClockFn clock_;

    double wait_seconds(const QueueEntry& entry, QueueClock::time_point now) const;

    /**
     * Index of the best partner for queue[index] among entries not yet
     * matched, or -1.
     */
    int best_partner(const std::vector<QueueEntry>& queue, size_t index,
                     const std::vector<bool>& matched, QueueClock::time_point now) const;
};

} // namespace clawcombat
