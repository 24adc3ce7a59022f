#include "vgc/search/determinizer.hpp"
#include "vgc/core/hash.hpp"

namespace vgc {

Determinizer::Determinizer(unsigned int seed)
    : rng_(seed)
{
}

Determinization Determinizer::apply(
    const BattleState& state,
    Side opponent,
    std::vector<PokemonHypothesis> hypotheses,
    const std::vector<bool>& known
) {
    Determinization d;
    d.state = state;
    uint64_t sig = 0x5eed;

    auto& roster = d.state.side(opponent).roster;
    for (size_t i = 0; i < roster.size(); ++i) {
        if (!known[i]) continue;
        PokemonState& p = roster[i];
        const PokemonHypothesis& h = hypotheses[i];

        if (!p.item_revealed) {
            p.item = h.item == "none" ? std::string() : h.item;
        }
        if (!p.terastallized) {
            p.tera_type = h.tera_type;
        }
        // HP fraction is observed, only the scale changes
        p.stats = h.stats;

        sig = hash_combine(sig, hash_string(p.species));
        sig = hash_combine(sig, hash_string(p.item));
        sig = hash_combine(sig, static_cast<uint64_t>(p.tera_type));
        for (int s = 0; s < NUM_STATS; ++s) {
            sig = hash_combine(sig, static_cast<uint64_t>(p.stats[s]));
        }
    }

    d.signature = sig;
    d.hypotheses = std::move(hypotheses);
    return d;
}

std::vector<Determinization> Determinizer::sample(
    const BeliefState& belief,
    const BattleState& state,
    int k,
    Side opponent
) {
    const auto& roster = state.side(opponent).roster;
    std::vector<bool> known(roster.size());
    for (size_t i = 0; i < roster.size(); ++i) {
        known[i] = belief.knows(roster[i].species);
    }

    std::vector<Determinization> result;
    result.reserve(k > 0 ? k : 0);
    for (int n = 0; n < k; ++n) {
        std::vector<PokemonHypothesis> hypotheses(roster.size());
        for (size_t i = 0; i < roster.size(); ++i) {
            if (known[i]) hypotheses[i] = belief.sample(roster[i].species, rng_);
        }
        result.push_back(apply(state, opponent, std::move(hypotheses), known));
    }
    return result;
}

Determinization Determinizer::point_estimate(
    const BeliefState& belief,
    const BattleState& state,
    Side opponent
) const {
    const auto& roster = state.side(opponent).roster;
    std::vector<bool> known(roster.size());
    std::vector<PokemonHypothesis> hypotheses(roster.size());
    for (size_t i = 0; i < roster.size(); ++i) {
        known[i] = belief.knows(roster[i].species);
        if (known[i]) hypotheses[i] = belief.point_estimate(roster[i].species);
    }
    return apply(state, opponent, std::move(hypotheses), known);
}

}  // namespace vgc
