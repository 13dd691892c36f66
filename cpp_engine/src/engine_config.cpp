/**
 * ClawCombat Battle Engine - Engine Configuration Implementation
 */

#include "engine_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace clawcombat {

namespace {

bool read_positive(const json& data, const char* key, int& out) {
    if (!data.contains(key)) return true;
    if (!data[key].is_number_integer() || data[key].get<int>() <= 0) {
        std::cerr << "[EngineConfig] '" << key << "' must be a positive integer" << std::endl;
        return false;
    }
    out = data[key].get<int>();
    return true;
}

bool read_string(const json& data, const char* key, std::string& out) {
    if (!data.contains(key)) return true;
    if (!data[key].is_string()) {
        std::cerr << "[EngineConfig] '" << key << "' must be a string" << std::endl;
        return false;
    }
    out = data[key].get<std::string>();
    return true;
}

} // namespace

bool EngineConfig::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[EngineConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return apply(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[EngineConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[EngineConfig] Error: " << e.what() << std::endl;
        return false;
    }
}

bool EngineConfig::load_from_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return apply(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[EngineConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[EngineConfig] Error: " << e.what() << std::endl;
        return false;
    }
}

bool EngineConfig::apply(const json& data) {
    if (!data.is_object()) {
        std::cerr << "[EngineConfig] Top level must be an object" << std::endl;
        return false;
    }

    // Work on a copy so a failed load changes nothing
    EngineConfig next = *this;

    if (!read_string(data, "moves_path", next.moves_path)) return false;
    if (!read_positive(data, "max_battle_turns", next.max_battle_turns)) return false;
    if (!read_positive(data, "turn_timeout_seconds", next.turn_timeout_seconds)) return false;
    if (!read_positive(data, "max_consecutive_timeouts", next.max_consecutive_timeouts)) return false;

    if (data.contains("default_ai_difficulty")) {
        std::string name;
        if (!read_string(data, "default_ai_difficulty", name)) return false;
        auto difficulty = parse_difficulty(name);
        if (!difficulty) {
            std::cerr << "[EngineConfig] Unknown AI difficulty: " << name << std::endl;
            return false;
        }
        next.default_ai_difficulty = *difficulty;
    }

    if (data.contains("xray_enabled")) {
        if (!data["xray_enabled"].is_boolean()) {
            std::cerr << "[EngineConfig] 'xray_enabled' must be a boolean" << std::endl;
            return false;
        }
        next.xray_enabled = data["xray_enabled"].get<bool>();
    }
    if (!read_string(data, "xray_output_dir", next.xray_output_dir)) return false;

    if (data.contains("rng_seed")) {
        if (!data["rng_seed"].is_number_unsigned()) {
            std::cerr << "[EngineConfig] 'rng_seed' must be a non-negative integer" << std::endl;
            return false;
        }
        next.rng_seed = data["rng_seed"].get<uint64_t>();
    }

    if (data.contains("level_bands")) {
        const json& bands = data["level_bands"];
        if (!bands.is_array()) {
            std::cerr << "[EngineConfig] 'level_bands' must be an array" << std::endl;
            return false;
        }
        std::vector<std::pair<int, int>> parsed;
        int previous_wait = 0;
        for (const auto& band : bands) {
            if (!band.is_object() || !band.contains("max_wait_seconds") || !band.contains("range")
                || !band["max_wait_seconds"].is_number_integer() || !band["range"].is_number_integer()) {
                std::cerr << "[EngineConfig] Each level band needs integer 'max_wait_seconds' and 'range'"
                          << std::endl;
                return false;
            }
            int wait = band["max_wait_seconds"].get<int>();
            int range = band["range"].get<int>();
            if (wait <= previous_wait || range < 0) {
                std::cerr << "[EngineConfig] Level bands must have increasing waits and non-negative ranges"
                          << std::endl;
                return false;
            }
            parsed.emplace_back(wait, range);
            previous_wait = wait;
        }
        next.matchmaking.level_bands = parsed;
    }

    *this = next;
    return true;
}

json EngineConfig::to_json() const {
    json bands = json::array();
    for (const auto& band : matchmaking.level_bands) {
        bands.push_back({{"max_wait_seconds", band.first}, {"range", band.second}});
    }
    return json{
        {"moves_path", moves_path},
        {"max_battle_turns", max_battle_turns},
        {"turn_timeout_seconds", turn_timeout_seconds},
        {"max_consecutive_timeouts", max_consecutive_timeouts},
        {"default_ai_difficulty", to_string(default_ai_difficulty)},
        {"xray_enabled", xray_enabled},
        {"xray_output_dir", xray_output_dir},
        {"rng_seed", rng_seed},
        {"level_bands", bands}
    };
}

} // namespace clawcombat
