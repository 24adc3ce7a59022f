#pragma once

/**
 * Determinizer - resolves hidden opponent attributes into concrete states.
 *
 * Each hypothesis replaces the unrevealed item, Tera type and stats of
 * every believed opponent Pokemon with one draw from BeliefState.
 * Revealed attributes are never resampled.
 */

#include "vgc/belief/belief_state.hpp"
#include "vgc/game/battle_state.hpp"
#include <random>
#include <vector>

namespace vgc {

struct Determinization {
    BattleState state;
    uint64_t signature = 0;     // Hash of the sampled attributes, used as the TT hypothesis key
    std::vector<PokemonHypothesis> hypotheses;   // Opponent roster order
};

class Determinizer {
public:
    explicit Determinizer(unsigned int seed = 42);

    /**
     * Draw k independent determinizations of `state`.
     */
    std::vector<Determinization> sample(
        const BeliefState& belief,
        const BattleState& state,
        int k,
        Side opponent = Side::Opponent);

    // Most likely attributes for every opponent Pokemon
    Determinization point_estimate(
        const BeliefState& belief,
        const BattleState& state,
        Side opponent = Side::Opponent) const;

    void seed(unsigned int seed) { rng_.seed(seed); }

private:
    static Determinization apply(
        const BattleState& state,
        Side opponent,
        std::vector<PokemonHypothesis> hypotheses,
        const std::vector<bool>& known);

    std::mt19937 rng_;
};

}  // namespace vgc
