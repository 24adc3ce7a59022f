#pragma once

// Small hand-built positions shared by the test programs

#include "vgc/game/battle_engine.hpp"
#include "vgc/game/battle_state.hpp"
#include <memory>
#include <string>
#include <vector>

namespace vgc {
namespace fixtures {

inline PokemonState pokemon(
    const std::string& species,
    const std::vector<std::string>& moves = {},
    float hp_fraction = 1.0f
) {
    PokemonState p = create_pokemon(species, "", moves);
    p.hp_fraction = hp_fraction;
    return p;
}

// Item known to be absent, so no hypothesis ever replaces it
inline PokemonState no_item(PokemonState p) {
    p.item.clear();
    p.item_revealed = true;
    return p;
}

inline SideState side(std::vector<PokemonState> roster, int slot_a = 0, int slot_b = -1) {
    SideState s;
    s.roster = std::move(roster);
    s.active = {{slot_a, slot_b}};
    return s;
}

inline BattleState battle(SideState self, SideState opponent) {
    BattleState state;
    state.side(Side::Self) = std::move(self);
    state.side(Side::Opponent) = std::move(opponent);
    return state;
}

/**
 * Garchomp alone against a weakened Raichu that cannot touch it.
 * Any Ground or Dragon attack wins on the spot.
 */
inline BattleState knockout_position() {
    SideState self = side({pokemon("garchomp", {"earthquake", "dragonclaw", "protect"})});
    SideState opp = side({no_item(pokemon("raichu", {"thunderbolt"}, 0.3f))});
    opp.tera_used = true;
    return battle(self, opp);
}

/**
 * A nearly fainted Gyarados facing a faster Raichu, with Garchomp
 * (immune to Thunderbolt) in the back. Four Pokemon remain.
 */
inline BattleState switch_position() {
    PokemonState gyarados = no_item(pokemon("gyarados", {"waterfall", "tackle"}, 0.1f));
    PokemonState garchomp = pokemon("garchomp", {"earthquake", "dragonclaw"});
    SideState self = side({gyarados, garchomp});
    self.tera_used = true;

    PokemonState raichu = no_item(pokemon("raichu", {"thunderbolt"}));
    raichu.turns_active = 2;
    PokemonState amoonguss = no_item(pokemon("amoonguss", {"sludgebomb"}));
    SideState opp = side({raichu, amoonguss});
    opp.tera_used = true;
    return battle(self, opp);
}

inline JointAction single_move(const std::string& move_id, int8_t target = TARGET_FOE_A) {
    return JointAction(CandidateAction::use_move(find_move(move_id), target), CandidateAction::pass());
}

inline TurnActions turn(const JointAction& self, const JointAction& opp) {
    TurnActions actions;
    actions[side_index(Side::Self)] = self;
    actions[side_index(Side::Opponent)] = opp;
    return actions;
}

}  // namespace fixtures
}  // namespace vgc
