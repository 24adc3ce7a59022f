#include "vgc/core/stats.hpp"
#include <cmath>
#include <stdexcept>

namespace vgc {

NatureMods neutral_nature() {
    NatureMods mods;
    mods.fill(1.0f);
    return mods;
}

NatureMods make_nature(Stat plus, Stat minus) {
    NatureMods mods = neutral_nature();
    if (plus == minus || plus == Stat::HP || minus == Stat::HP) {
        return mods;
    }
    mods[stat_index(plus)] = 1.1f;
    mods[stat_index(minus)] = 0.9f;
    return mods;
}

int compute_stat(Stat stat, int base, int ev, float nature_mod, int level) {
    int core = (2 * base + PERFECT_IV + ev / 4) * level / 100;
    if (stat == Stat::HP) {
        return core + level + 10;
    }
    return static_cast<int>(std::floor((core + 5) * nature_mod));
}

StatBlock compute_stats(
    const StatBlock& base,
    const std::array<int, NUM_STATS>& evs,
    const NatureMods& nature,
    int level
) {
    StatBlock stats{};
    for (int i = 0; i < NUM_STATS; ++i) {
        stats[i] = compute_stat(static_cast<Stat>(i), base[i], evs[i], nature[i], level);
    }
    return stats;
}

float boost_multiplier(int stage) {
    if (stage > 6) stage = 6;
    if (stage < -6) stage = -6;
    if (stage >= 0) {
        return (2.0f + stage) / 2.0f;
    }
    return 2.0f / (2.0f - stage);
}

const std::vector<StatSpread>& spread_catalog() {
    //                                          HP   Atk  Def  SpA  SpD  Spe
    static const std::vector<StatSpread> catalog = {
        {"CS252",       {{  4,   0,   0, 252,   0, 252}}, make_nature(Stat::SpA, Stat::Atk)},
        {"AS252",       {{  4, 252,   0,   0,   0, 252}}, make_nature(Stat::Atk, Stat::SpA)},
        {"HS252",       {{252,   0,   4,   0,   0, 252}}, neutral_nature()},
        {"HB252",       {{252,   0, 252,   0,   4,   0}}, make_nature(Stat::Def, Stat::Atk)},
        {"HD252",       {{252,   0,   4,   0, 252,   0}}, make_nature(Stat::SpD, Stat::Atk)},
        {"HC252",       {{252,   0,   0, 252,   4,   0}}, make_nature(Stat::SpA, Stat::Atk)},
        {"HA252",       {{252, 252,   0,   0,   4,   0}}, make_nature(Stat::Atk, Stat::SpA)},
        {"CS252_timid", {{  4,   0,   0, 252,   0, 252}}, make_nature(Stat::Spe, Stat::Atk)},
        {"AS252_jolly", {{  4, 252,   0,   0,   0, 252}}, make_nature(Stat::Spe, Stat::SpA)},
    };
    return catalog;
}

const StatSpread& find_spread(const std::string& name) {
    for (const auto& spread : spread_catalog()) {
        if (spread.name == name) {
            return spread;
        }
    }
    throw std::invalid_argument("Unknown spread class: " + name);
}

}  // namespace vgc
