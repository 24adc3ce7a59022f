#include "vgc/neural/state_encoder.hpp"
#include <algorithm>

namespace vgc {

std::vector<float> StateEncoder::encode(const BattleState& state, Side perspective) {
    std::vector<float> features;
    features.reserve(INPUT_DIM);

    encode_side(state.side(perspective), features);
    encode_side(state.side(opposite(perspective)), features);
    encode_field(state, features);

    return features;
}

void StateEncoder::encode_pokemon(const PokemonState& p, bool active, std::vector<float>& out) {
    out.push_back(p.hp_fraction);
    out.push_back(active ? 1.0f : 0.0f);
    out.push_back(p.fainted() ? 1.0f : 0.0f);

    // Status one-hot (None encodes as all zeros)
    for (int s = 1; s <= STATUS_DIM; ++s) {
        out.push_back(static_cast<int>(p.status) == s ? 1.0f : 0.0f);
    }

    for (int s = stat_index(Stat::Atk); s <= stat_index(Stat::Spe); ++s) {
        out.push_back(p.boosts[s] / 6.0f);
    }

    out.push_back(p.terastallized ? 1.0f : 0.0f);

    // Current defensive typing (multi-hot)
    auto types = p.defensive_types();
    for (int t = 0; t < NUM_TYPES; ++t) {
        Type type = static_cast<Type>(t);
        out.push_back(types[0] == type || types[1] == type ? 1.0f : 0.0f);
    }
}

void StateEncoder::encode_side(const SideState& side, std::vector<float>& out) {
    for (int i = 0; i < MAX_ROSTER; ++i) {
        if (i < static_cast<int>(side.roster.size())) {
            encode_pokemon(side.roster[i], side.is_active(i), out);
        } else {
            out.insert(out.end(), POKEMON_DIM, 0.0f);
        }
    }

    out.push_back(side.tera_used ? 1.0f : 0.0f);
    out.push_back(side.tailwind_turns / 4.0f);
    out.push_back(side.reflect_turns / 5.0f);
    out.push_back(side.light_screen_turns / 5.0f);
}

void StateEncoder::encode_field(const BattleState& state, std::vector<float>& out) {
    for (int w = 0; w < 5; ++w) {
        out.push_back(static_cast<int>(state.field.weather) == w ? 1.0f : 0.0f);
    }
    for (int t = 0; t < 5; ++t) {
        out.push_back(static_cast<int>(state.field.terrain) == t ? 1.0f : 0.0f);
    }
    out.push_back(state.field.trick_room_turns / 5.0f);
    out.push_back(std::min(state.turn, 20) / 20.0f);
}

}  // namespace vgc
