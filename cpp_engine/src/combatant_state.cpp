/**
 * ClawCombat Battle Engine - Combatant State Implementation
 */

#include "combatant_state.hpp"
#include "stat_scaling.hpp"
#include <algorithm>

namespace clawcombat {

// ============================================================================
// STAT BLOCK
// ============================================================================

int StatBlock::get(StatKind stat) const {
    switch (stat) {
        case StatKind::HP: return hp;
        case StatKind::ATTACK: return attack;
        case StatKind::DEFENSE: return defense;
        case StatKind::SP_ATK: return sp_atk;
        case StatKind::SP_DEF: return sp_def;
        case StatKind::SPEED: return speed;
    }
    return 0;
}

void StatBlock::set(StatKind stat, int value) {
    switch (stat) {
        case StatKind::HP: hp = value; break;
        case StatKind::ATTACK: attack = value; break;
        case StatKind::DEFENSE: defense = value; break;
        case StatKind::SP_ATK: sp_atk = value; break;
        case StatKind::SP_DEF: sp_def = value; break;
        case StatKind::SPEED: speed = value; break;
    }
}

// ============================================================================
// STAT STAGES
// ============================================================================

int StatStages::get(StatKind stat) const {
    switch (stat) {
        case StatKind::ATTACK: return attack;
        case StatKind::DEFENSE: return defense;
        case StatKind::SP_ATK: return sp_atk;
        case StatKind::SP_DEF: return sp_def;
        case StatKind::SPEED: return speed;
        case StatKind::HP: return 0;
    }
    return 0;
}

int StatStages::adjust(StatKind stat, int delta) {
    int* stage = nullptr;
    switch (stat) {
        case StatKind::ATTACK: stage = &attack; break;
        case StatKind::DEFENSE: stage = &defense; break;
        case StatKind::SP_ATK: stage = &sp_atk; break;
        case StatKind::SP_DEF: stage = &sp_def; break;
        case StatKind::SPEED: stage = &speed; break;
        case StatKind::HP: return 0;  // HP has no stage
    }
    if (!stage) return 0;

    int before = *stage;
    *stage = std::clamp(before + delta, MIN_STAT_STAGE, MAX_STAT_STAGE);
    return *stage - before;
}

// ============================================================================
// COMBATANT
// ============================================================================

MoveSlot* CombatantState::find_move(const MoveID& move_id) {
    for (auto& slot : moves) {
        if (slot.move.id == move_id) return &slot;
    }
    return nullptr;
}

const MoveSlot* CombatantState::find_move(const MoveID& move_id) const {
    for (const auto& slot : moves) {
        if (slot.move.id == move_id) return &slot;
    }
    return nullptr;
}

std::vector<MoveID> CombatantState::move_ids() const {
    std::vector<MoveID> ids;
    ids.reserve(moves.size());
    for (const auto& slot : moves) {
        ids.push_back(slot.move.id);
    }
    return ids;
}

double CombatantState::staged_stat(StatKind stat) const {
    if (stat == StatKind::HP) return effective_stats.hp;
    return effective_stats.get(stat) * stat_stage_multiplier(stages.get(stat));
}

StatKind CombatantState::highest_stage() const {
    StatKind best = StatKind::ATTACK;
    int best_stage = stages.attack;
    for (StatKind stat : STAGED_STATS) {
        int stage = stages.get(stat);
        if (stage > best_stage) {
            best_stage = stage;
            best = stat;
        }
    }
    return best;
}

int CombatantState::take_damage(int amount) {
    if (amount <= 0) return 0;
    int before = current_hp;
    current_hp = std::max(0, current_hp - amount);
    return before - current_hp;
}

int CombatantState::heal(int amount) {
    if (amount <= 0) return 0;
    int before = current_hp;
    current_hp = std::min(max_hp, current_hp + amount);
    return current_hp - before;
}

void CombatantState::inflict(StatusCondition condition) {
    switch (condition) {
        case StatusCondition::NONE:
            clear_status();
            break;
        case StatusCondition::CONFUSION:
            confused = true;
            confusion_turns = 0;
            break;
        default:
            status = condition;
            freeze_turns = 0;
            sleep_turns = 0;
            woke_from_damage = false;
            break;
    }
}

void CombatantState::clear_status() {
    status = StatusCondition::NONE;
    freeze_turns = 0;
    sleep_turns = 0;
    woke_from_damage = false;
}

} // namespace clawcombat
