/**
 * ClawCombat Battle Engine - Move Database Implementation
 *
 * Loads move definitions from JSON files using nlohmann/json.
 */

#include "move_database.hpp"
#include "battle_rng.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <unordered_set>

using json = nlohmann::json;

namespace clawcombat {

namespace {

void set_error(std::string* error, const std::string& message) {
    if (error) *error = message;
}

// Parses an optional enum-valued field; missing key yields `fallback`.
template <typename T, typename Parser>
bool read_enum(const json& j, const char* key, T fallback, Parser parse, T& out,
               std::string* error) {
    if (!j.contains(key) || j[key].is_null()) {
        out = fallback;
        return true;
    }
    if (!j[key].is_string()) {
        set_error(error, std::string("field '") + key + "' must be a string");
        return false;
    }
    auto parsed = parse(j[key].template get<std::string>());
    if (!parsed) {
        set_error(error, std::string("unknown ") + key + " '" + j[key].template get<std::string>() + "'");
        return false;
    }
    out = *parsed;
    return true;
}

} // namespace

MoveDatabase::MoveDatabase() {}

bool MoveDatabase::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[MoveDatabase] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[MoveDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[MoveDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool MoveDatabase::load_from_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[MoveDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[MoveDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool MoveDatabase::load_document(const json& data) {
    if (!data.contains("moves_by_type") || !data["moves_by_type"].is_object()) {
        std::cerr << "[MoveDatabase] No 'moves_by_type' object found" << std::endl;
        return false;
    }

    std::unordered_map<MoveID, MoveDef> moves;
    std::array<std::vector<MoveID>, ELEMENT_TYPE_COUNT> pools;
    std::unordered_map<MoveID, MoveID> legacy;
    int skipped = 0;

    for (auto it = data["moves_by_type"].begin(); it != data["moves_by_type"].end(); ++it) {
        auto pool_type = parse_element_type(it.key());
        if (!pool_type) {
            std::cerr << "[MoveDatabase] Skipping unknown type pool: " << it.key() << std::endl;
            continue;
        }
        if (!it.value().is_array()) {
            std::cerr << "[MoveDatabase] Pool " << it.key() << " is not an array" << std::endl;
            return false;
        }

        for (const auto& move_json : it.value()) {
            std::string error;
            auto move = parse_move(move_json, &error);
            if (!move) {
                std::cerr << "[MoveDatabase] Skipping move in " << it.key() << ": " << error << std::endl;
                skipped++;
                continue;
            }
            if (moves.count(move->id)) {
                std::cerr << "[MoveDatabase] Duplicate move id: " << move->id << std::endl;
                skipped++;
                continue;
            }
            pools[static_cast<size_t>(*pool_type)].push_back(move->id);
            moves.emplace(move->id, std::move(*move));
        }
    }

    if (data.contains("legacy_ids") && data["legacy_ids"].is_object()) {
        for (auto it = data["legacy_ids"].begin(); it != data["legacy_ids"].end(); ++it) {
            if (!it.value().is_string()) continue;
            std::string target = it.value().get<std::string>();
            if (moves.count(target)) {
                legacy[it.key()] = target;
            }
        }
    }

    moves_ = std::move(moves);
    pools_ = std::move(pools);
    legacy_ids_ = std::move(legacy);

    std::cout << "[MoveDatabase] Loaded " << moves_.size() << " moves";
    if (skipped > 0) {
        std::cout << " (" << skipped << " skipped)";
    }
    std::cout << std::endl;
    return true;
}

// ============================================================================
// LOOKUP
// ============================================================================

const MoveDef* MoveDatabase::get_move(const MoveID& move_id) const {
    auto it = moves_.find(move_id);
    if (it != moves_.end()) {
        return &it->second;
    }
    auto legacy = legacy_ids_.find(move_id);
    if (legacy != legacy_ids_.end()) {
        auto target = moves_.find(legacy->second);
        if (target != moves_.end()) {
            return &target->second;
        }
    }
    return nullptr;
}

bool MoveDatabase::has_move(const MoveID& move_id) const {
    return get_move(move_id) != nullptr;
}

const std::vector<MoveID>& MoveDatabase::move_pool(ElementType type) const {
    return pools_[static_cast<size_t>(type)];
}

std::vector<MoveID> MoveDatabase::default_loadout(ElementType type) const {
    const auto* pool = &move_pool(type);
    if (pool->empty()) {
        pool = &move_pool(ElementType::NEUTRAL);
    }
    size_t count = std::min(LOADOUT_SIZE, pool->size());
    return std::vector<MoveID>(pool->begin(), pool->begin() + static_cast<long>(count));
}

std::vector<MoveID> MoveDatabase::random_loadout(ElementType type, BattleRng& rng) const {
    const auto& pool = move_pool(type);
    if (pool.size() <= LOADOUT_SIZE) {
        return default_loadout(type);
    }

    std::vector<MoveID> damaging;
    std::vector<MoveID> status;
    for (const auto& id : pool) {
        const MoveDef* move = get_move(id);
        if (move && move->is_damaging()) {
            damaging.push_back(id);
        } else {
            status.push_back(id);
        }
    }

    // Fisher-Yates with the battle RNG
    auto shuffle = [&rng](std::vector<MoveID>& ids) {
        for (int i = static_cast<int>(ids.size()) - 1; i > 0; i--) {
            int j = rng.uniform_int(0, i);
            std::swap(ids[static_cast<size_t>(i)], ids[static_cast<size_t>(j)]);
        }
    };
    shuffle(damaging);
    shuffle(status);

    std::vector<MoveID> selected;
    size_t damage_count = std::min<size_t>(3, damaging.size());
    selected.insert(selected.end(), damaging.begin(), damaging.begin() + static_cast<long>(damage_count));

    if (!status.empty()) {
        selected.push_back(status.front());
    }

    for (size_t i = damage_count; selected.size() < LOADOUT_SIZE && i < damaging.size(); i++) {
        selected.push_back(damaging[i]);
    }
    for (size_t i = 1; selected.size() < LOADOUT_SIZE && i < status.size(); i++) {
        selected.push_back(status[i]);
    }

    return selected;
}

MoveSelectionResult MoveDatabase::validate_move_selection(const std::vector<MoveID>& move_ids,
                                                          ElementType type) const {
    MoveSelectionResult result;

    if (move_ids.size() != LOADOUT_SIZE) {
        result.error = "Must select exactly 4 moves";
        return result;
    }

    const auto& pool = move_pool(type);
    std::vector<MoveID> invalid;
    for (const auto& id : move_ids) {
        if (std::find(pool.begin(), pool.end(), id) == pool.end()) {
            invalid.push_back(id);
        }
    }
    if (!invalid.empty()) {
        result.error = std::string("Invalid moves for type ") + to_string(type) + ": ";
        for (size_t i = 0; i < invalid.size(); i++) {
            if (i > 0) result.error += ", ";
            result.error += invalid[i];
        }
        return result;
    }

    std::unordered_set<MoveID> unique(move_ids.begin(), move_ids.end());
    if (unique.size() != LOADOUT_SIZE) {
        result.error = "All 4 moves must be different";
        return result;
    }

    result.valid = true;
    return result;
}

std::vector<MoveID> MoveDatabase::get_all_move_ids() const {
    std::vector<MoveID> ids;
    for (const auto& pool : pools_) {
        ids.insert(ids.end(), pool.begin(), pool.end());
    }
    return ids;
}

// ============================================================================
// PARSING
// ============================================================================

std::optional<MoveDef> MoveDatabase::parse_move(const json& move_json, std::string* error) {
    if (!move_json.is_object()) {
        set_error(error, "move entry is not an object");
        return std::nullopt;
    }

    MoveDef move;
    move.id = move_json.value("id", "");
    if (move.id.empty()) {
        set_error(error, "move has no id");
        return std::nullopt;
    }
    move.name = move_json.value("name", move.id);

    if (!read_enum(move_json, "type", ElementType::NEUTRAL, parse_element_type, move.type, error) ||
        !read_enum(move_json, "category", MoveCategory::PHYSICAL, parse_move_category, move.category, error)) {
        if (error) *error = move.id + ": " + *error;
        return std::nullopt;
    }

    move.power = move_json.value("power", 0);
    move.accuracy = move_json.value("accuracy", 100);
    move.pp = move_json.value("pp", 10);
    move.priority = move_json.value("priority", 0);
    move.description = move_json.value("description", "");

    if (move.power < 0 || move.pp < 0 || move.accuracy < 0 || move.accuracy > 100) {
        set_error(error, move.id + ": power/pp/accuracy out of range");
        return std::nullopt;
    }

    if (move_json.contains("effect") && !move_json["effect"].is_null()) {
        std::string effect_error;
        auto effect = parse_effect(move_json["effect"], &effect_error);
        if (!effect) {
            set_error(error, move.id + ": " + effect_error);
            return std::nullopt;
        }
        move.effect = std::move(*effect);
    }

    return move;
}

std::optional<MoveEffect> MoveDatabase::parse_effect(const json& effect_json, std::string* error) {
    if (!effect_json.is_object()) {
        set_error(error, "effect is not an object");
        return std::nullopt;
    }

    std::string type = effect_json.value("type", "");

    if (type == "priority") return MoveEffect{effects::Priority{}};
    if (type == "ohko") return MoveEffect{effects::OneHitKO{}};
    if (type == "leech_seed") return MoveEffect{effects::LeechSeed{}};
    if (type == "curse") return MoveEffect{effects::Curse{}};
    if (type == "reset_stats") return MoveEffect{effects::ResetStats{}};
    if (type == "hp_scaling") return MoveEffect{effects::HpScaling{}};
    if (type == "double_if_poisoned") return MoveEffect{effects::DoubleIfPoisoned{}};
    if (type == "use_physical_def") return MoveEffect{effects::UsePhysicalDef{}};

    if (type == "status") {
        effects::InflictStatus e;
        if (!read_enum(effect_json, "status", StatusCondition::NONE, parse_status, e.status, error) ||
            !read_enum(effect_json, "target", EffectTarget::OPPONENT, parse_effect_target, e.target, error)) {
            return std::nullopt;
        }
        if (e.status == StatusCondition::NONE) {
            set_error(error, "status effect without a status");
            return std::nullopt;
        }
        e.chance = effect_json.value("chance", 0);
        e.delay = effect_json.value("delay", false);
        return MoveEffect{e};
    }

    if (type == "stat_boost") {
        effects::StatBoost e;
        if (!read_enum(effect_json, "stat", StatKind::ATTACK, parse_stat, e.stat, error) ||
            !read_enum(effect_json, "target", EffectTarget::SELF, parse_effect_target, e.target, error)) {
            return std::nullopt;
        }
        if (effect_json.contains("stat2") && !effect_json["stat2"].is_null()) {
            StatKind stat2 = StatKind::ATTACK;
            if (!read_enum(effect_json, "stat2", StatKind::ATTACK, parse_stat, stat2, error)) {
                return std::nullopt;
            }
            e.stat2 = stat2;
        }
        e.stages = effect_json.value("stages", 1);
        e.stages2 = effect_json.value("stages2", 1);
        e.chance = effect_json.value("chance", 0);
        return MoveEffect{e};
    }

    if (type == "stat_drop") {
        effects::StatDrop e;
        if (!read_enum(effect_json, "stat", StatKind::ATTACK, parse_stat, e.stat, error) ||
            !read_enum(effect_json, "target", EffectTarget::OPPONENT, parse_effect_target, e.target, error)) {
            return std::nullopt;
        }
        e.stages = effect_json.value("stages", 1);
        e.chance = effect_json.value("chance", 0);
        return MoveEffect{e};
    }

    if (type == "heal") {
        effects::Heal e;
        e.percent = effect_json.value("percent", 50);
        e.delay = effect_json.value("delay", false);
        return MoveEffect{e};
    }
    if (type == "drain") {
        return MoveEffect{effects::Drain{effect_json.value("percent", 50)}};
    }
    if (type == "recoil") {
        return MoveEffect{effects::Recoil{effect_json.value("percent", 25)}};
    }
    if (type == "flinch") {
        return MoveEffect{effects::Flinch{effect_json.value("chance", 0)}};
    }
    if (type == "high_crit") {
        return MoveEffect{effects::HighCrit{effect_json.value("crit_rate", 12.5)}};
    }
    if (type == "focus") {
        return MoveEffect{effects::Focus{effect_json.value("fail_if_hit", true)}};
    }

    set_error(error, "unknown effect type '" + type + "'");
    return std::nullopt;
}

json MoveDatabase::move_to_json(const MoveDef& move) {
    json j = {
        {"id", move.id},
        {"name", move.name},
        {"type", to_string(move.type)},
        {"category", to_string(move.category)},
        {"power", move.power},
        {"accuracy", move.accuracy},
        {"pp", move.pp},
        {"priority", move.priority},
        {"description", move.description},
    };
    if (move.has_effect()) {
        j["effect"] = effect_to_json(move.effect);
    }
    return j;
}

json MoveDatabase::effect_to_json(const MoveEffect& effect) {
    json j = {{"type", effect_type_name(effect)}};

    if (const auto* e = std::get_if<effects::InflictStatus>(&effect)) {
        j["status"] = to_string(e->status);
        j["chance"] = e->chance;
        j["target"] = to_string(e->target);
        j["delay"] = e->delay;
    } else if (const auto* e = std::get_if<effects::StatBoost>(&effect)) {
        j["stat"] = to_string(e->stat);
        j["stages"] = e->stages;
        if (e->stat2) {
            j["stat2"] = to_string(*e->stat2);
            j["stages2"] = e->stages2;
        }
        j["chance"] = e->chance;
        j["target"] = to_string(e->target);
    } else if (const auto* e = std::get_if<effects::StatDrop>(&effect)) {
        j["stat"] = to_string(e->stat);
        j["stages"] = e->stages;
        j["chance"] = e->chance;
        j["target"] = to_string(e->target);
    } else if (const auto* e = std::get_if<effects::Heal>(&effect)) {
        j["percent"] = e->percent;
        j["delay"] = e->delay;
    } else if (const auto* e = std::get_if<effects::Drain>(&effect)) {
        j["percent"] = e->percent;
    } else if (const auto* e = std::get_if<effects::Recoil>(&effect)) {
        j["percent"] = e->percent;
    } else if (const auto* e = std::get_if<effects::Flinch>(&effect)) {
        j["chance"] = e->chance;
    } else if (const auto* e = std::get_if<effects::HighCrit>(&effect)) {
        j["crit_rate"] = e->crit_rate;
    } else if (const auto* e = std::get_if<effects::Focus>(&effect)) {
        j["fail_if_hit"] = e->fail_if_hit;
    }

    return j;
}

} // namespace clawcombat
