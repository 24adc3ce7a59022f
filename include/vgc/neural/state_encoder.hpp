#pragma once

/**
 * Battle state encoder - converts a BattleState to value network input.
 *
 * Layout (perspective side first):
 * - Per side: MAX_ROSTER Pokemon blocks + side conditions
 * - Field conditions and turn
 */

#include "vgc/game/battle_state.hpp"
#include <vector>

namespace vgc {

class StateEncoder {
public:
    static std::vector<float> encode(const BattleState& state, Side perspective);

    static constexpr int MAX_ROSTER = 6;
    static constexpr int STATUS_DIM = 6;          // Burn .. Freeze
    static constexpr int BOOST_DIM = 5;           // Atk .. Spe
    static constexpr int POKEMON_DIM = 3 + STATUS_DIM + BOOST_DIM + 1 + NUM_TYPES;
    static constexpr int SIDE_CONDITION_DIM = 4;
    static constexpr int SIDE_DIM = MAX_ROSTER * POKEMON_DIM + SIDE_CONDITION_DIM;
    static constexpr int FIELD_DIM = 5 + 5 + 2;
    static constexpr int INPUT_DIM = 2 * SIDE_DIM + FIELD_DIM;

private:
    static void encode_pokemon(const PokemonState& p, bool active, std::vector<float>& out);
    static void encode_side(const SideState& side, std::vector<float>& out);
    static void encode_field(const BattleState& state, std::vector<float>& out);
};

}  // namespace vgc
