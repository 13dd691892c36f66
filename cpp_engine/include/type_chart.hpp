/**
 * ClawCombat Battle Engine - Type Chart
 *
 * Immutable 18x18 effectiveness table. Every entry is one of
 * {0, 0.5, 1.0, 2.0}.
 */

#pragma once

#include "types.hpp"

namespace clawcombat {

/**
 * Effectiveness multiplier of an attack of `attack_type` against a
 * defender of `defender_type`.
 */
double effectiveness(ElementType attack_type, ElementType defender_type);

/**
 * String overload for stored/external data.
 *
 * Unknown type names on either side return 1.0 (never an error).
 */
double effectiveness(const std::string& attack_type, const std::string& defender_type);

inline bool is_super_effective(double multiplier) { return multiplier >= 2.0; }
inline bool is_not_very_effective(double multiplier) { return multiplier > 0.0 && multiplier < 1.0; }
inline bool is_immune(double multiplier) { return multiplier == 0.0; }

} // namespace clawcombat
