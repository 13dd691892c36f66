/**
 * ClawCombat Battle Engine - Move Database
 *
 * Stores immutable move definitions loaded from JSON, grouped into one
 * ordered pool per element type. Provides lookup by move id (including
 * legacy ids such as "fire_1"), default loadouts and move selection
 * validation.
 */

#pragma once

#include "move.hpp"
#include <array>
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace clawcombat {

class BattleRng;

/**
 * Result of validating an agent's chosen moves.
 */
struct MoveSelectionResult {
    bool valid = false;
    std::string error;
};

/**
 * MoveDatabase - Central move lookup.
 *
 * Loaded once at startup and shared by const reference.
 */
class MoveDatabase {
public:
    static constexpr size_t LOADOUT_SIZE = 4;

    MoveDatabase();
    ~MoveDatabase() = default;

    /**
     * Load moves from a JSON file.
     *
     * Expected layout:
     *   { "moves_by_type": { "FIRE": [ {move}, ... ], ... },
     *     "legacy_ids": { "fire_1": "flamethrower", ... } }
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load moves from JSON text (same layout as load_from_json).
     */
    bool load_from_string(const std::string& text);

    /**
     * Get a move by id or legacy id.
     *
     * Returns nullptr if the move is not found.
     */
    const MoveDef* get_move(const MoveID& move_id) const;

    bool has_move(const MoveID& move_id) const;

    /**
     * Ordered move pool of a type (empty if the type has none).
     */
    const std::vector<MoveID>& move_pool(ElementType type) const;

    /**
     * Deterministic default loadout: the first four moves of the type's
     * pool, or of the NEUTRAL pool when the type has none.
     */
    std::vector<MoveID> default_loadout(ElementType type) const;

    /**
     * Random loadout for generated agents: three damaging moves and one
     * status move where the pool allows, topped up with damaging moves.
     */
    std::vector<MoveID> random_loadout(ElementType type, BattleRng& rng) const;

    /**
     * Exactly four distinct moves, all from the type's pool.
     */
    MoveSelectionResult validate_move_selection(const std::vector<MoveID>& move_ids,
                                                ElementType type) const;

    std::vector<MoveID> get_all_move_ids() const;

    size_t move_count() const { return moves_.size(); }

    /**
     * Static parsing utilities - shared with battle state serialization.
     *
     * parse_move returns std::nullopt (and fills `error` when given) if a
     * required field is missing or holds an unknown value.
     */
    static std::optional<MoveDef> parse_move(const nlohmann::json& move_json,
                                             std::string* error = nullptr);
    static std::optional<MoveEffect> parse_effect(const nlohmann::json& effect_json,
                                                  std::string* error = nullptr);
    static nlohmann::json move_to_json(const MoveDef& move);
    static nlohmann::json effect_to_json(const MoveEffect& effect);

private:
    std::unordered_map<MoveID, MoveDef> moves_;
    std::unordered_map<MoveID, MoveID> legacy_ids_;
    std::array<std::vector<MoveID>, ELEMENT_TYPE_COUNT> pools_;

    bool load_document(const nlohmann::json& data);
};

} // namespace clawcombat
