/**
 * ClawCombat Battle Engine - Type Chart Implementation
 */

#include "type_chart.hpp"

namespace clawcombat {

namespace {

// Rows: attacking type. Columns: defending type. Both in ElementType order.
constexpr double H = 0.5;

constexpr double TYPE_CHART[ELEMENT_TYPE_COUNT][ELEMENT_TYPE_COUNT] = {
    //          NEU FIR WAT ELE GRA ICE MAR VEN EAR AIR PSY INS STO GHO DRA SHA MET MYS
    /* NEU */ { 1,  1,  1,  1,  1,  1,  1,  1,  1,  1,  1,  1,  H,  0,  1,  1,  H,  1 },
    /* FIR */ { 1,  H,  H,  1,  2,  2,  1,  1,  1,  1,  1,  2,  H,  1,  H,  1,  2,  1 },
    /* WAT */ { 1,  2,  H,  1,  H,  1,  1,  1,  2,  1,  1,  1,  2,  1,  H,  1,  1,  1 },
    /* ELE */ { 1,  1,  2,  H,  H,  1,  1,  1,  0,  2,  1,  1,  1,  1,  H,  1,  1,  1 },
    /* GRA */ { 1,  H,  2,  1,  H,  1,  1,  H,  2,  H,  1,  H,  2,  1,  H,  1,  H,  1 },
    /* ICE */ { 1,  H,  H,  1,  2,  H,  1,  1,  2,  2,  1,  1,  1,  1,  2,  1,  H,  1 },
    /* MAR */ { 2,  1,  1,  1,  1,  2,  1,  H,  1,  H,  H,  H,  2,  0,  1,  2,  2,  H },
    /* VEN */ { 1,  1,  1,  1,  2,  1,  1,  H,  H,  1,  1,  1,  H,  H,  1,  1,  0,  2 },
    /* EAR */ { 1,  2,  1,  2,  H,  1,  1,  2,  1,  0,  1,  H,  2,  1,  1,  1,  2,  1 },
    /* AIR */ { 1,  1,  1,  H,  2,  1,  2,  1,  1,  1,  1,  2,  H,  1,  1,  1,  H,  1 },
    /* PSY */ { 1,  1,  1,  1,  1,  1,  2,  2,  1,  1,  H,  1,  1,  1,  1,  0,  H,  1 },
    /* INS */ { 1,  H,  1,  1,  2,  1,  H,  H,  1,  H,  2,  1,  1,  H,  1,  2,  H,  H },
    /* STO */ { 1,  2,  1,  1,  1,  2,  H,  1,  H,  2,  1,  2,  1,  1,  1,  1,  H,  1 },
    /* GHO */ { 0,  1,  1,  1,  1,  1,  1,  1,  1,  1,  2,  1,  1,  2,  1,  H,  1,  1 },
    /* DRA */ { 1,  1,  1,  1,  1,  1,  1,  1,  1,  1,  1,  1,  1,  1,  2,  1,  H,  0 },
    /* SHA */ { 1,  1,  1,  1,  1,  1,  H,  1,  1,  1,  2,  1,  1,  2,  1,  H,  1,  H },
    /* MET */ { 1,  H,  H,  H,  1,  2,  1,  1,  1,  1,  1,  1,  2,  1,  1,  1,  H,  2 },
    /* MYS */ { 1,  H,  1,  1,  1,  1,  2,  H,  1,  1,  1,  1,  1,  1,  2,  2,  H,  1 },
};

} // namespace

double effectiveness(ElementType attack_type, ElementType defender_type) {
    auto row = static_cast<size_t>(attack_type);
    auto col = static_cast<size_t>(defender_type);
    if (row >= ELEMENT_TYPE_COUNT || col >= ELEMENT_TYPE_COUNT) {
        return 1.0;
    }
    return TYPE_CHART[row][col];
}

double effectiveness(const std::string& attack_type, const std::string& defender_type) {
    auto attack = parse_element_type(attack_type);
    auto defender = parse_element_type(defender_type);
    if (!attack || !defender) {
        return 1.0;
    }
    return effectiveness(*attack, *defender);
}

} // namespace clawcombat
