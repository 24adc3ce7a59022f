#pragma once

/**
 * Move and species data used by the reference engine and the heuristics.
 */

#include "vgc/core/types.hpp"
#include <string>
#include <vector>

namespace vgc {

enum class MoveEffect : uint8_t {
    None = 0,
    Protect,
    FakeOut,
    Tailwind,
    TrickRoom,
    Reflect,
    LightScreen,
    SpeedDrop,      // -1 Spe on each target hit
    Redirect,       // Follow Me / Rage Powder
    BoostAtk2,
    BoostSpA2,
    Heal50
};

struct MoveData {
    std::string id;
    Type type;
    MoveCategory category;
    int power;
    int accuracy;      // Percent, 0 = never misses
    int priority;
    MoveTarget target;
    MoveEffect effect;
    uint32_t tags;
    int pp;

    bool is_damaging() const { return category != MoveCategory::Status && power > 0; }
    bool is_spread() const {
        return target == MoveTarget::AllAdjacentFoes || target == MoveTarget::AllAdjacent;
    }
    bool targets_foe() const {
        return target == MoveTarget::Normal || is_spread();
    }
};

struct SpeciesData {
    std::string name;
    std::array<Type, 2> types;
    StatBlock base_stats;
    std::vector<std::string> moves;     // Default moveset
    std::string default_spread;
    std::string default_item;
    Type default_tera;
};

/**
 * @throws std::invalid_argument for unknown ids
 */
const MoveData& find_move(const std::string& id);

// Returns nullptr for unknown ids
const MoveData* lookup_move(const std::string& id);

const MoveData& struggle_move();

/**
 * @throws std::invalid_argument for unknown species
 */
const SpeciesData& find_species(const std::string& name);

std::vector<std::string> species_names();

}  // namespace vgc
