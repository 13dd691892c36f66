/**
 * ClawCombat Battle Engine - Battle RNG Implementation
 */

#include "battle_rng.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>

namespace clawcombat {

BattleRng::BattleRng(uint64_t seed) : seed_(seed) {
    engine_.seed(static_cast<std::mt19937::result_type>(seed));
}

BattleRng BattleRng::from_clock() {
    auto seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return BattleRng(static_cast<uint64_t>(seed));
}

double BattleRng::uniform() {
    // 32 random bits scaled into [0, 1)
    return static_cast<double>(engine_()) / 4294967296.0;
}

int BattleRng::uniform_int(int lo, int hi) {
    if (hi <= lo) return lo;
    int span = hi - lo + 1;
    int value = lo + static_cast<int>(uniform() * span);
    return std::min(value, hi);
}

std::string BattleRng::save_state() const {
    std::ostringstream oss;
    oss << engine_;
    return oss.str();
}

bool BattleRng::restore_state(const std::string& state) {
    std::istringstream iss(state);
    std::mt19937 restored;
    iss >> restored;
    if (iss.fail()) {
        return false;
    }
    engine_ = restored;
    return true;
}

} // namespace clawcombat
