#include "vgc/belief/belief_state.hpp"
#include "vgc/belief/opponent_style.hpp"
#include "vgc/belief/stat_particle_filter.hpp"
#include "vgc/game/damage_calc.hpp"
#include "vgc/search/determinizer.hpp"
#include "battle_fixtures.hpp"
#include <cmath>
#include <iostream>
#include <cassert>
#include <set>
#include <stdexcept>

using namespace vgc;
using namespace vgc::fixtures;

namespace {

bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) < eps;
}

std::shared_ptr<const DamageOracle> damage_oracle() {
    return std::make_shared<StandardDamageCalc>();
}

}  // namespace

void test_categorical_belief() {
    std::cout << "Testing categorical belief... ";

    CategoricalBelief b({"a", "b", "c"}, {2.0f, 1.0f, 1.0f});
    assert(near(b.total(), 1.0f));
    assert(near(b.probability("a"), 0.5f));
    assert(b.most_likely() == "a");
    assert(b.support_size() == 3);

    bool ok = b.update([](const std::string& label) { return label == "c" ? 1.0f : 0.1f; });
    assert(ok);
    assert(near(b.total(), 1.0f));
    assert(b.most_likely() == "c");

    // Contradicting everything falls back to uniform
    ok = b.update([](const std::string&) { return 0.0f; });
    assert(!ok);
    assert(near(b.probability("a"), 1.0f / 3.0f));

    // Confirmed labels ignore evidence, unknown labels are added
    b.confirm("d");
    assert(b.confirmed());
    assert(near(b.probability("d"), 1.0f));
    b.update([](const std::string& label) { return label == "a" ? 1.0f : 0.0f; });
    assert(near(b.probability("d"), 1.0f));
    assert(near(b.entropy(), 0.0f));

    bool threw = false;
    try {
        CategoricalBelief bad({"x"}, {1.0f, 2.0f});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_particle_filter() {
    std::cout << "Testing stat particle filter... ";

    std::mt19937 rng(3);
    ParticleFilterConfig config;
    config.num_particles = 40;
    const SpeciesData& raichu = find_species("raichu");
    StatParticleFilter filter(raichu.base_stats, {{"CS252", 1.0f}, {"HB252", 1.0f}}, config, rng);

    assert(filter.size() == 40);
    assert(near(filter.total_weight(), 1.0f));
    assert(near(filter.effective_sample_size(), 40.0f, 0.01f));

    // Keep only one spread class
    bool ok = filter.update([](const StatParticle& p) {
        return p.spread == "CS252" ? 1.0f : 0.0f;
    }, rng);
    assert(ok);
    assert(near(filter.total_weight(), 1.0f));
    for (const auto& p : filter.particles()) {
        if (p.weight > 0.0f) assert(p.spread == "CS252");
    }

    // Total collapse falls back to uniform weights
    ok = filter.update([](const StatParticle&) { return 0.0f; }, rng);
    assert(!ok);
    assert(near(filter.total_weight(), 1.0f));

    StatBlock cautious = filter.pessimistic_stats(0.9f);
    StatBlock median = filter.quantile_estimate(0.5f);
    assert(cautious[stat_index(Stat::Spe)] >= median[stat_index(Stat::Spe)]);
    assert(cautious[stat_index(Stat::HP)] <= median[stat_index(Stat::HP)]);

    auto draws = filter.sample(5, rng);
    assert(draws.size() == 5);

    std::cout << "PASSED (resamples=" << filter.resample_count() << ")\n";
}

void test_belief_registration() {
    std::cout << "Testing belief registration... ";

    BeliefState belief(damage_oracle());
    BattleState state = switch_position();
    belief.register_opponents(state);

    assert(belief.knows("raichu"));
    assert(belief.knows("amoonguss"));
    assert(!belief.knows("gyarados"));
    assert(belief.species().size() == 2);

    // Items were revealed as absent in the fixture
    assert(belief.attributes("raichu").item.confirmed());
    assert(near(belief.attributes("raichu").item.probability("none"), 1.0f));

    // Unrevealed opponents start from the usage prior
    PokemonState hidden = create_pokemon("gastrodon");
    belief.register_pokemon(hidden);
    const HiddenAttributeBelief& attrs = belief.attributes("gastrodon");
    assert(!attrs.item.confirmed());
    assert(attrs.item.most_likely() == "lifeorb");
    assert(near(attrs.item.total(), 1.0f));
    assert(near(attrs.spread.total(), 1.0f));
    assert(near(attrs.tera.total(), 1.0f));

    bool threw = false;
    try {
        belief.update(HealObservation{"missingno", 25.0f});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_speed_observation() {
    std::cout << "Testing speed order update... ";

    BeliefState belief(damage_oracle());
    belief.register_pokemon(create_pokemon("raichu"));
    const HiddenAttributeBelief& attrs = belief.attributes("raichu");

    float fast_before = attrs.spread.probability("CS252");
    float bulky_before = attrs.spread.probability("HB252");
    float scarf_before = attrs.item.probability("choicescarf");

    // Our 150-speed Pokemon moved first: an uninvested Raichu (130) fits, CS252 (162) does not
    SpeedOrderObservation obs;
    obs.species = "raichu";
    obs.went_first = false;
    obs.reference_speed = 150;
    belief.update(obs);

    assert(attrs.spread.probability("CS252") < fast_before);
    assert(attrs.spread.probability("HB252") > bulky_before);
    assert(attrs.item.probability("choicescarf") < scarf_before);
    assert(near(attrs.spread.total(), 1.0f));
    assert(belief.observations_applied() == 1);

    std::cout << "PASSED\n";
}

void test_damage_evidence() {
    std::cout << "Testing damage evidence... ";

    BeliefState belief(damage_oracle());
    belief.register_pokemon(create_pokemon("raichu"));
    const CategoricalBelief& spread = belief.attributes("raichu").spread;

    // Damage exactly in the range predicted for a bulky Raichu
    PokemonState attacker = create_pokemon("garchomp");
    PokemonState bulky = create_pokemon("raichu");
    bulky.item.clear();
    bulky.stats = compute_stats(bulky.base_stats, find_spread("HB252"));
    StandardDamageCalc calc;
    DamageResult predicted = calc.damage_distribution(
        attacker, bulky, find_move("dragonclaw"), FieldState{}, DamageModifiers{});

    float ratio_before = spread.probability("HB252") / spread.probability("CS252");

    DamageObservation obs;
    obs.species = "raichu";
    obs.move_id = "dragonclaw";
    obs.percent = 0.5f * (predicted.min_percent + predicted.max_percent);
    obs.counterpart = attacker;
    belief.update(obs);

    float ratio_after = spread.probability("HB252") / spread.probability("CS252");
    assert(ratio_after >= ratio_before - 1e-4f);
    assert(near(spread.total(), 1.0f));
    assert(near(belief.attributes("raichu").item.total(), 1.0f));

    std::cout << "PASSED (" << obs.percent << "%)\n";
}

void test_reveals_and_heals() {
    std::cout << "Testing reveals and heals... ";

    BeliefState belief(damage_oracle());
    belief.register_pokemon(create_pokemon("gastrodon"));
    belief.register_pokemon(create_pokemon("garchomp"));
    belief.register_pokemon(create_pokemon("amoonguss"));

    // Leftovers-sized heal raises Leftovers without confirming it
    float lefties_before = belief.attributes("gastrodon").item.probability("leftovers");
    belief.update(HealObservation{"gastrodon", 6.25f});
    const CategoricalBelief& item = belief.attributes("gastrodon").item;
    assert(item.probability("leftovers") > lefties_before);
    assert(!item.confirmed());

    // A quarter heal points at a Sitrus Berry without ruling out the rest
    const CategoricalBelief& chomp_item = belief.attributes("garchomp").item;
    belief.update(HealObservation{"garchomp", 25.0f});
    assert(!chomp_item.confirmed());
    assert(chomp_item.most_likely() == "sitrusberry");
    assert(chomp_item.probability("leftovers") > 0.0f);
    assert(chomp_item.probability("lifeorb") > 0.0f);
    assert(near(chomp_item.total(), 1.0f));

    // Repeated Leftovers-sized heals still move the belief afterwards
    float lefties_after_sitrus = chomp_item.probability("leftovers");
    float sitrus_peak = chomp_item.probability("sitrusberry");
    for (int i = 0; i < 5; ++i) {
        belief.update(HealObservation{"garchomp", 6.25f});
    }
    assert(chomp_item.probability("leftovers") > lefties_after_sitrus);
    assert(chomp_item.probability("sitrusberry") < sitrus_peak);
    assert(chomp_item.most_likely() == "leftovers");

    // Protect is rare on Choice items
    float band_before = belief.attributes("amoonguss").item.probability("choiceband");
    belief.update(MoveRevealedObservation{"amoonguss", "protect"});
    assert(belief.attributes("amoonguss").item.probability("choiceband") < band_before);
    assert(belief.attributes("amoonguss").seen_moves.size() == 1);

    belief.update(ItemRevealedObservation{"amoonguss", "rockyhelmet"});
    assert(near(belief.attributes("amoonguss").item.probability("rockyhelmet"), 1.0f));

    belief.update(TeraRevealedObservation{"amoonguss", Type::Water});
    PokemonHypothesis h = belief.point_estimate("amoonguss");
    assert(h.item == "rockyhelmet");
    assert(h.tera_type == Type::Water);

    std::cout << "PASSED\n";
}

void test_belief_sampling() {
    std::cout << "Testing belief sampling... ";

    BeliefState belief(damage_oracle(), BeliefConfig{}, 11);
    belief.register_pokemon(create_pokemon("raichu"));

    std::mt19937 rng(5);
    auto hypotheses = belief.sample("raichu", 20, rng);
    assert(hypotheses.size() == 20);

    std::set<std::string> items;
    for (const auto& h : hypotheses) {
        items.insert(h.item);
        assert(h.stats[stat_index(Stat::HP)] > 0);
        assert(belief.attributes("raichu").item.probability(h.item) > 0.0f);
    }
    assert(items.size() > 1);

    // Same seed, same draws
    std::mt19937 a(9), b(9);
    PokemonHypothesis ha = belief.sample("raichu", a);
    PokemonHypothesis hb = belief.sample("raichu", b);
    assert(ha.item == hb.item && ha.spread == hb.spread && ha.stats == hb.stats);

    std::cout << "PASSED\n";
}

void test_determinizer() {
    std::cout << "Testing determinizer... ";

    BeliefState belief(damage_oracle());
    BattleState state = switch_position();
    // Raichu's item becomes hidden again
    state.side(Side::Opponent).roster[0].item_revealed = false;
    belief.register_opponents(state);

    Determinizer determinizer(21);
    auto worlds = determinizer.sample(belief, state, 6);
    assert(worlds.size() == 6);

    std::set<uint64_t> signatures;
    for (const auto& w : worlds) {
        signatures.insert(w.signature);
        const PokemonState& amoonguss = w.state.side(Side::Opponent).roster[1];
        // Revealed attributes are never resampled
        assert(amoonguss.item.empty());
        // HP fraction is observed, not sampled
        assert(w.state.side(Side::Opponent).roster[0].hp_fraction == 1.0f);
        assert(w.state.side(Side::Self).roster[0].stats == state.side(Side::Self).roster[0].stats);
        assert(w.hypotheses.size() == 2);
    }
    assert(signatures.size() > 1);

    Determinization best = determinizer.point_estimate(belief, state);
    const PokemonState& raichu = best.state.side(Side::Opponent).roster[0];
    assert(raichu.item == belief.attributes("raichu").item.most_likely());
    assert(raichu.tera_type == Type::Fairy);

    // Terastallized opponents keep their type
    state.side(Side::Opponent).roster[0].terastallized = true;
    state.side(Side::Opponent).roster[0].tera_type = Type::Ground;
    best = determinizer.point_estimate(belief, state);
    assert(best.state.side(Side::Opponent).roster[0].tera_type == Type::Ground);

    std::cout << "PASSED (" << signatures.size() << " distinct worlds)\n";
}

void test_opponent_style() {
    std::cout << "Testing opponent style model... ";

    OpponentStyleModel style;
    JointAction protect(CandidateAction::use_move(find_move("protect"), TARGET_NONE),
                        CandidateAction::use_move(find_move("protect"), TARGET_NONE));
    JointAction attack = single_move("thunderbolt");

    assert(style.action_bias(protect) == 1.0f);
    assert(style.samples() == 0);

    for (int i = 0; i < 6; ++i) {
        style.observe(protect);
    }
    assert(style.samples() == 6);
    OpponentStyleProfile profile = style.profile();
    assert(profile.protect_rate > 0.15f);
    assert(profile.protect_rate <= 0.40f);   // Clamped
    assert(style.action_bias(protect) > 1.0f);
    assert(style.action_bias(attack) < 1.0f);
    assert(style.action_bias(protect) <= StyleConfig{}.max_bias);

    style.reset();
    assert(style.samples() == 0);
    assert(style.action_bias(protect) == 1.0f);

    std::cout << "PASSED (protect rate=" << profile.protect_rate << ")\n";
}

int main() {
    std::cout << "\n=== VGC Belief Tests ===\n\n";

    test_categorical_belief();
    test_particle_filter();
    test_belief_registration();
    test_speed_observation();
    test_damage_evidence();
    test_reveals_and_heals();
    test_belief_sampling();
    test_determinizer();
    test_opponent_style();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
