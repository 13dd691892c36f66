/**
 * ClawCombat Battle Engine - Engine Configuration
 *
 * Runtime settings loaded from JSON (data/engine_config.json). Every field
 * has a default, so a missing file key keeps the value below.
 */

#pragma once

#include "matchmaking.hpp"
#include "turn_resolver.hpp"
#include <nlohmann/json_fwd.hpp>

namespace clawcombat {

struct EngineConfig {
    std::string moves_path = "data/moves.json";

    int max_battle_turns = 50;
    int turn_timeout_seconds = 30;
    int max_consecutive_timeouts = 3;

    Difficulty default_ai_difficulty = Difficulty::NORMAL;

    // X-ray battle traces
    bool xray_enabled = false;
    std::string xray_output_dir = "logs/xray";

    // 0 = seed each battle from the clock
    uint64_t rng_seed = 0;

    MatchmakingSettings matchmaking;

    /**
     * Load from a JSON file. On failure the config is left unchanged and
     * the reason is printed.
     */
    bool load_from_json(const std::string& filepath);

    bool load_from_string(const std::string& text);

    ResolverSettings resolver_settings() const {
        ResolverSettings settings;
        settings.max_battle_turns = max_battle_turns;
        settings.max_consecutive_timeouts = max_consecutive_timeouts;
        return settings;
    }

    int64_t turn_timeout_ms() const { return static_cast<int64_t>(turn_timeout_seconds) * 1000; }

    nlohmann::json to_json() const;

private:
    bool apply(const nlohmann::json& data);
};

} // namespace clawcombat
