#pragma once

/**
 * Stat formulas and EV spread templates.
 *
 * Spread classes are the coarse hypotheses tracked by BeliefState;
 * StatParticleFilter refines them into concrete stat values.
 */

#include "vgc/core/types.hpp"
#include <array>
#include <string>
#include <vector>

namespace vgc {

using NatureMods = std::array<float, NUM_STATS>;

constexpr int MAX_EV_PER_STAT = 252;
constexpr int MAX_EV_TOTAL = 510;
constexpr int PERFECT_IV = 31;

// +10% / -10% nature, HP never affected
NatureMods make_nature(Stat plus, Stat minus);
NatureMods neutral_nature();

/**
 * Stat spread class (EV template + nature).
 */
struct StatSpread {
    std::string name;
    std::array<int, NUM_STATS> evs;
    NatureMods nature;

    bool speed_invested() const {
        return evs[stat_index(Stat::Spe)] >= MAX_EV_PER_STAT ||
               nature[stat_index(Stat::Spe)] > 1.0f;
    }

    bool bulk_invested() const {
        return evs[stat_index(Stat::HP)] >= MAX_EV_PER_STAT;
    }
};

int compute_stat(Stat stat, int base, int ev, float nature_mod, int level = LEVEL);

StatBlock compute_stats(
    const StatBlock& base,
    const std::array<int, NUM_STATS>& evs,
    const NatureMods& nature,
    int level = LEVEL
);

inline StatBlock compute_stats(const StatBlock& base, const StatSpread& spread) {
    return compute_stats(base, spread.evs, spread.nature);
}

// Stage multiplier for stat boosts in [-6, +6]
float boost_multiplier(int stage);

/**
 * Known spread templates (CS252, AS252, HS252, HB252, ...).
 */
const std::vector<StatSpread>& spread_catalog();

/**
 * @throws std::invalid_argument if the name is not in the catalog
 */
const StatSpread& find_spread(const std::string& name);

}  // namespace vgc
