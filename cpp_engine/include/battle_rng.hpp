/**
 * ClawCombat Battle Engine - Battle RNG
 *
 * Seedable random source threaded through turn resolution, move selection
 * and loadout generation. Its full engine state can be saved with the
 * battle and restored, so a persisted battle replays identically.
 */

#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace clawcombat {

class BattleRng {
public:
    explicit BattleRng(uint64_t seed = 0);
    virtual ~BattleRng() = default;

    /**
     * Seed from the high resolution clock.
     */
    static BattleRng from_clock();

    /**
     * Uniform double in [0, 1). All other draws derive from this one.
     */
    virtual double uniform();

    /**
     * Uniform integer in [lo, hi] (inclusive).
     */
    int uniform_int(int lo, int hi);

    /**
     * True with probability p (0..1).
     */
    bool chance(double p) { return uniform() < p; }

    /**
     * True with probability pct/100, drawn as `uniform() * 100 < pct`.
     */
    bool percent(double pct) { return uniform() * 100.0 < pct; }

    uint64_t seed() const { return seed_; }

    /**
     * Serialized engine state (std::mt19937 stream format).
     */
    std::string save_state() const;

    /**
     * Restore a state produced by save_state(). Returns false and leaves the
     * engine untouched if the text is not a valid engine state.
     */
    bool restore_state(const std::string& state);

protected:
    std::mt19937 engine_;
    uint64_t seed_ = 0;
};

} // namespace clawcombat
