/**
 * ClawCombat Battle Engine - Matchmaking Queue Implementation
 */

#include "matchmaking.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace clawcombat {

// ============================================================================
// STORES AND POLICIES
// ============================================================================

void InMemoryQueueStore::transact(const Transaction& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QueueEntry> working = entries_;
    fn(working);
    entries_ = std::move(working);
}

size_t InMemoryQueueStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void UnlimitedFightPolicy::record_fight(const AgentID& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    fights_[agent_id]++;
}

int UnlimitedFightPolicy::fights_recorded(const AgentID& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fights_.find(agent_id);
    return it != fights_.end() ? it->second : 0;
}

// ============================================================================
// MATCHMAKING QUEUE
// ============================================================================

MatchmakingQueue::MatchmakingQueue(QueueStore& store,
                                   FightLimitPolicy& limits,
                                   const ActiveBattleLookup& battles,
                                   MatchmakingSettings settings,
                                   ClockFn clock)
    : store_(store),
      limits_(limits),
      battles_(battles),
      settings_(std::move(settings)),
      clock_(clock ? std::move(clock) : ClockFn([] { return QueueClock::now(); })) {}

std::optional<int> MatchmakingQueue::level_range(double wait_seconds) const {
    for (const auto& band : settings_.level_bands) {
        if (wait_seconds < band.first) return band.second;
    }
    return std::nullopt;
}

double MatchmakingQueue::wait_seconds(const QueueEntry& entry, QueueClock::time_point now) const {
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.joined_at);
    return waited.count() / 1000.0;
}

QueueJoinResult MatchmakingQueue::join(const AgentID& agent_id, int level) {
    QueueJoinResult result;

    FightLimitInfo limit = limits_.check(agent_id);
    if (!limit.allowed) {
        result.status = QueueJoinStatus::RATE_LIMITED;
        result.reason = limit.reason;
        result.tier = limit.tier;
        result.remaining = limit.remaining;
        return result;
    }

    auto now = clock_();
    store_.transact([&](std::vector<QueueEntry>& queue) {
        auto existing = std::find_if(queue.begin(), queue.end(),
                                     [&](const QueueEntry& e) { return e.agent_id == agent_id; });
        if (existing != queue.end()) {
            result.status = QueueJoinStatus::ALREADY_QUEUED;
            auto joined = existing->joined_at;
            result.queue_position = static_cast<int>(std::count_if(
                queue.begin(), queue.end(),
                [joined](const QueueEntry& e) { return e.joined_at <= joined; }));
            return;
        }

        if (auto battle_id = battles_.active_battle_for(agent_id)) {
            result.status = QueueJoinStatus::ALREADY_IN_BATTLE;
            result.battle_id = *battle_id;
            return;
        }

        queue.push_back(QueueEntry{agent_id, level > 0 ? level : 1, now});
        result.status = QueueJoinStatus::QUEUED;
        result.queue_position = static_cast<int>(queue.size());
    });

    return result;
}

QueueLeaveStatus MatchmakingQueue::leave(const AgentID& agent_id) {
    QueueLeaveStatus status = QueueLeaveStatus::NOT_IN_QUEUE;
    store_.transact([&](std::vector<QueueEntry>& queue) {
        auto it = std::remove_if(queue.begin(), queue.end(),
                                 [&](const QueueEntry& e) { return e.agent_id == agent_id; });
        if (it != queue.end()) {
            queue.erase(it, queue.end());
            status = QueueLeaveStatus::REMOVED;
        }
    });
    return status;
}

int MatchmakingQueue::best_partner(const std::vector<QueueEntry>& queue, size_t index,
                                   const std::vector<bool>& matched,
                                   QueueClock::time_point now) const {
    const QueueEntry& entry = queue[index];
    std::optional<int> range = level_range(wait_seconds(entry, now));

    int best = -1;
    int best_diff = 0;
    for (size_t i = 0; i < queue.size(); i++) {
        if (i == index || matched[i]) continue;
        int diff = std::abs(entry.level - queue[i].level);
        if (range && diff > *range) continue;
        // Strict comparison keeps the earliest joiner on ties
        if (best < 0 || diff < best_diff) {
            best = static_cast<int>(i);
            best_diff = diff;
        }
    }
    return best;
}

std::optional<QueueEntry> MatchmakingQueue::find_match(const AgentID& agent_id) {
    std::optional<QueueEntry> opponent;
    auto now = clock_();

    // Read-only: search a sorted copy, commit the queue as it was
    store_.transact([&](std::vector<QueueEntry>& stored) {
        std::vector<QueueEntry> queue = stored;
        std::stable_sort(queue.begin(), queue.end(), [](const QueueEntry& a, const QueueEntry& b) {
            return a.joined_at < b.joined_at;
        });
        for (size_t i = 0; i < queue.size(); i++) {
            if (queue[i].agent_id != agent_id) continue;
            std::vector<bool> matched(queue.size(), false);
            int partner = best_partner(queue, i, matched, now);
            if (partner >= 0) {
                opponent = queue[static_cast<size_t>(partner)];
            }
            return;
        }
    });

    return opponent;
}

std::vector<MatchPair> MatchmakingQueue::process_queue() {
    std::vector<MatchPair> matches;
    auto now = clock_();

    store_.transact([&](std::vector<QueueEntry>& queue) {
        if (queue.size() < 2) return;

        std::stable_sort(queue.begin(), queue.end(), [](const QueueEntry& a, const QueueEntry& b) {
            return a.joined_at < b.joined_at;
        });

        std::vector<bool> matched(queue.size(), false);
        for (size_t i = 0; i < queue.size(); i++) {
            if (matched[i]) continue;
            int partner = best_partner(queue, i, matched, now);
            if (partner < 0) continue;

            auto j = static_cast<size_t>(partner);
            matched[i] = true;
            matched[j] = true;
            matches.push_back(MatchPair{queue[i].agent_id, queue[j].agent_id,
                                        std::abs(queue[i].level - queue[j].level)});
        }

        std::vector<QueueEntry> remaining;
        for (size_t i = 0; i < queue.size(); i++) {
            if (!matched[i]) remaining.push_back(queue[i]);
        }
        queue = std::move(remaining);
    });

    for (const auto& match : matches) {
        limits_.record_fight(match.agent_a);
        limits_.record_fight(match.agent_b);
        std::cout << "[Matchmaking] Matched " << match.agent_a << " vs " << match.agent_b
                  << " (level diff " << match.level_diff << ")" << std::endl;
    }

    return matches;
}

QueueStats MatchmakingQueue::stats() {
    QueueStats stats;
    auto now = clock_();

    store_.transact([&](std::vector<QueueEntry>& queue) {
        if (queue.empty()) return;

        stats.size = static_cast<int>(queue.size());
        stats.min_level = queue.front().level;
        stats.max_level = queue.front().level;
        double level_sum = 0.0;
        double wait_sum = 0.0;
        double min_wait = wait_seconds(queue.front(), now);
        double max_wait = min_wait;

        for (const auto& entry : queue) {
            stats.min_level = std::min(stats.min_level, entry.level);
            stats.max_level = std::max(stats.max_level, entry.level);
            level_sum += entry.level;

            double wait = wait_seconds(entry, now);
            wait_sum += wait;
            min_wait = std::min(min_wait, wait);
            max_wait = std::max(max_wait, wait);
        }

        stats.avg_level = std::round(level_sum / stats.size * 10.0) / 10.0;
        stats.min_wait_seconds = static_cast<int64_t>(std::llround(min_wait));
        stats.avg_wait_seconds = static_cast<int64_t>(std::llround(wait_sum / stats.size));
        stats.max_wait_seconds = static_cast<int64_t>(std::llround(max_wait));
    });

    return stats;
}

} // namespace clawcombat
