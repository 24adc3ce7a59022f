#include "vgc/core/dex.hpp"
#include "vgc/core/stats.hpp"
#include "vgc/core/types.hpp"
#include "vgc/game/battle_engine.hpp"
#include "vgc/neural/state_encoder.hpp"
#include "battle_fixtures.hpp"
#include <cmath>
#include <iostream>
#include <cassert>
#include <stdexcept>

using namespace vgc;
using namespace vgc::fixtures;

void test_types() {
    std::cout << "Testing type chart... ";

    assert(type_effectiveness(Type::Ground, Type::Electric) == 2.0f);
    assert(type_effectiveness(Type::Electric, Type::Ground) == 0.0f);
    assert(type_effectiveness(Type::Normal, Type::None) == 1.0f);

    // Dual types multiply
    std::array<Type, 2> gyarados = {{Type::Water, Type::Flying}};
    assert(type_effectiveness(Type::Electric, gyarados) == 4.0f);

    assert(type_from_string("fairy") == Type::Fairy);
    assert(type_to_string(Type::Steel) == "steel");

    bool threw = false;
    try {
        type_from_string("cosmic");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_stats() {
    std::cout << "Testing stat formulas... ";

    const SpeciesData& raichu = find_species("raichu");
    StatBlock stats = compute_stats(raichu.base_stats, find_spread("CS252_timid"));
    assert(stats[stat_index(Stat::HP)] == 136);
    assert(stats[stat_index(Stat::Spe)] == 178);

    const SpeciesData& garchomp = find_species("garchomp");
    StatBlock chomp = compute_stats(garchomp.base_stats, find_spread("AS252_jolly"));
    assert(chomp[stat_index(Stat::Atk)] == 182);
    assert(chomp[stat_index(Stat::Spe)] == 169);

    assert(boost_multiplier(0) == 1.0f);
    assert(boost_multiplier(2) == 2.0f);
    assert(boost_multiplier(-2) == 0.5f);

    assert(find_spread("HB252").bulk_invested());
    assert(find_spread("CS252").speed_invested());

    std::cout << "PASSED (raichu hp=" << stats[stat_index(Stat::HP)] << ")\n";
}

void test_dex() {
    std::cout << "Testing dex lookups... ";

    const MoveData& eq = find_move("earthquake");
    assert(eq.is_spread());
    assert(eq.is_damaging());
    assert(!find_move("protect").is_damaging());
    assert(find_move("fakeout").priority == 3);

    assert(lookup_move("notamove") == nullptr);
    bool threw = false;
    try {
        find_move("notamove");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        find_species("missingno");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    PokemonState p = create_pokemon("garchomp");
    assert(p.item == "lifeorb");
    assert(p.moves.size() == 4);
    assert(p.hp_fraction == 1.0f);
    assert(p.tera_type == Type::Steel);
    assert(p.knows_move("earthquake"));
    assert(!p.knows_move("thunderbolt"));

    std::cout << "PASSED\n";
}

void test_actions() {
    std::cout << "Testing action encoding... ";

    CandidateAction tb = CandidateAction::use_move(find_move("thunderbolt"), TARGET_FOE_B);
    assert(tb.is_move());
    assert(tb.move_id() == "thunderbolt");
    assert(tb.target() == TARGET_FOE_B);
    assert(tb.to_string() == "move:thunderbolt:-2");

    CandidateAction tera = CandidateAction::terastallize(find_move("thunderbolt"), TARGET_FOE_B);
    assert(tera.is_tera());
    assert(tera.has_tag(TAG_TERA));
    assert(tera != tb);

    CandidateAction sw = CandidateAction::switch_to(3);
    assert(sw.is_switch());
    assert(sw.switch_index() == 3);
    assert(sw.has_tag(TAG_SWITCH));

    CandidateAction fake = CandidateAction::use_move(find_move("fakeout"), TARGET_FOE_A);
    assert(fake.has_tag(TAG_PRIORITY));
    assert(fake.has_tag(TAG_FAKE_OUT));

    JointAction joint(tb, sw);
    assert(joint.to_string() == "move:thunderbolt:-2|switch:3");
    assert(joint.tera_count() == 0);
    assert(JointAction(tera, tera).tera_count() == 2);
    assert(joint.signature() == JointAction(tb, sw).signature());

    std::cout << "PASSED\n";
}

void test_state_signature() {
    std::cout << "Testing state signature... ";

    BattleState a = switch_position();
    BattleState b = switch_position();
    assert(a.signature() == b.signature());

    b.side(Side::Opponent).roster[0].hp_fraction = 0.5f;
    assert(a.signature() != b.signature());

    // Turn only matters when asked for
    BattleState c = switch_position();
    c.turn = 7;
    assert(a.signature() != c.signature());
    assert(a.signature(false) == c.signature(false));

    assert(a.total_remaining() == 4);
    assert(!a.is_terminal());

    std::cout << "PASSED\n";
}

void test_legal_actions() {
    std::cout << "Testing legal actions... ";

    ReferenceBattleEngine engine;
    BattleState state = knockout_position();

    // Three moves, each with a Tera variant; no bench, single foe
    auto actions = engine.legal_actions(state, Side::Self, 0);
    assert(actions.size() == 6);

    state.side(Side::Self).tera_used = true;
    actions = engine.legal_actions(state, Side::Self, 0);
    assert(actions.size() == 3);

    // Empty slot passes
    auto empty = engine.legal_actions(state, Side::Self, 1);
    assert(empty.size() == 1 && empty[0].is_pass());

    // Bench members become switch targets
    BattleState sw = switch_position();
    auto gyarados = engine.legal_actions(sw, Side::Self, 0);
    int switches = 0;
    for (const auto& a : gyarados) {
        if (a.is_switch()) {
            assert(a.switch_index() == 1);
            switches++;
        }
    }
    assert(switches == 1);

    // No PP left: Struggle
    for (auto& ms : state.side(Side::Self).roster[0].moves) ms.pp = 0;
    actions = engine.legal_actions(state, Side::Self, 0);
    assert(actions.size() == 1);
    assert(actions[0].move_id() == "struggle");

    std::cout << "PASSED\n";
}

void test_apply_deterministic() {
    std::cout << "Testing seeded turn resolution... ";

    ReferenceBattleEngine engine;
    BattleState state = switch_position();
    TurnActions actions = turn(single_move("waterfall"), single_move("thunderbolt"));

    StepResult a = engine.apply(state, actions, 1234);
    StepResult b = engine.apply(state, actions, 1234);
    assert(a.next.signature() == b.next.signature());
    assert(a.next.turn == state.turn + 1);

    // Input state is untouched
    assert(state.side(Side::Self).roster[0].hp_fraction == 0.1f);

    std::cout << "PASSED\n";
}

void test_auto_replacement() {
    std::cout << "Testing fainted replacement... ";

    ReferenceBattleEngine engine;
    BattleState state = switch_position();

    // Raichu outspeeds and knocks Gyarados out before it moves
    StepResult step = engine.apply(state, turn(single_move("waterfall"), single_move("thunderbolt")), 7);
    const SideState& self = step.next.side(Side::Self);
    assert(self.roster[0].fainted());
    assert(self.active[0] == 1);
    assert(self.roster[1].turns_active == 0);
    assert(!step.terminal);

    // Opponent untouched
    assert(step.next.side(Side::Opponent).roster[0].hp_fraction == 1.0f);

    std::cout << "PASSED\n";
}

void test_switch_resolves_first() {
    std::cout << "Testing switch order... ";

    ReferenceBattleEngine engine;
    BattleState state = switch_position();
    JointAction sw(CandidateAction::switch_to(1), CandidateAction::pass());

    StepResult step = engine.apply(state, turn(sw, single_move("thunderbolt")), 3);
    const SideState& self = step.next.side(Side::Self);
    assert(self.active[0] == 1);
    // Thunderbolt lands on the Ground-type switch-in
    assert(self.roster[1].hp_fraction == 1.0f);
    assert(self.roster[0].hp_fraction == 0.1f);

    std::cout << "PASSED\n";
}

void test_protect_and_fake_out() {
    std::cout << "Testing Protect and Fake Out... ";

    ReferenceBattleEngine engine;

    // Protect blocks the attack and starts a streak
    BattleState state = battle(
        side({pokemon("garchomp", {"protect", "earthquake"})}),
        side({no_item(pokemon("gyarados", {"waterfall"}))}));
    JointAction protect(CandidateAction::use_move(find_move("protect"), TARGET_NONE), CandidateAction::pass());
    StepResult step = engine.apply(state, turn(protect, single_move("waterfall")), 11);
    assert(step.next.side(Side::Self).roster[0].hp_fraction == 1.0f);
    assert(step.next.side(Side::Self).roster[0].protect_streak == 1);

    // Fake Out flinches the slower target on the first turn out
    BattleState fake = battle(
        side({pokemon("raichu", {"fakeout", "thunderbolt"})}),
        side({no_item(pokemon("gyarados", {"tackle"}))}));
    step = engine.apply(fake, turn(single_move("fakeout"), single_move("tackle")), 5);
    assert(step.next.side(Side::Self).roster[0].hp_fraction == 1.0f);
    assert(step.next.side(Side::Opponent).roster[0].hp_fraction < 1.0f);

    // After the first turn it fails
    BattleState late = fake;
    late.side(Side::Self).roster[0].turns_active = 1;
    step = engine.apply(late, turn(single_move("fakeout"), single_move("tackle")), 5);
    assert(step.next.side(Side::Opponent).roster[0].hp_fraction == 1.0f);

    std::cout << "PASSED\n";
}

void test_enumerate_outcomes() {
    std::cout << "Testing chance enumeration... ";

    ReferenceBattleEngine engine;
    // Neither attack can knock out, so crits and rolls stay distinct
    BattleState state = battle(
        side({pokemon("garchomp", {"dragonclaw"})}),
        side({no_item(pokemon("gyarados", {"tackle"}))}));
    TurnActions actions = turn(single_move("dragonclaw"), single_move("tackle"));

    std::vector<ChanceBranch> branches;
    bool ok = engine.enumerate_outcomes(state, actions, 64, branches);
    assert(ok);
    assert(branches.size() > 1);

    float total = 0.0f;
    for (const auto& b : branches) {
        assert(b.probability > 0.0f);
        total += b.probability;
    }
    assert(std::fabs(total - 1.0f) < 1e-4f);

    // Cap exceeded
    std::vector<ChanceBranch> capped;
    assert(!engine.enumerate_outcomes(state, actions, 1, capped));

    std::cout << "PASSED (" << branches.size() << " branches)\n";
}

void test_terminal() {
    std::cout << "Testing terminal states... ";

    BattleState state = knockout_position();
    assert(!state.is_terminal());
    assert(!state.winner());

    state.side(Side::Opponent).roster[0].hp_fraction = 0.0f;
    assert(state.is_terminal());
    assert(state.winner() && *state.winner() == Side::Self);

    // Both sides out: draw
    state.side(Side::Self).roster[0].hp_fraction = 0.0f;
    assert(state.is_terminal());
    assert(!state.winner());

    // The engine reports the knockout
    ReferenceBattleEngine engine;
    StepResult step = engine.apply(
        knockout_position(),
        turn(single_move("dragonclaw"), single_move("thunderbolt")), 99);
    assert(step.terminal);
    assert(step.winner && *step.winner == Side::Self);

    std::cout << "PASSED\n";
}

void test_illegal_actions() {
    std::cout << "Testing illegal actions... ";

    ReferenceBattleEngine engine;
    BattleState state = knockout_position();

    bool threw = false;
    try {
        engine.apply(state, turn(single_move("thunderbolt"), single_move("thunderbolt")), 1);
    } catch (const OracleError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    JointAction bad_switch(CandidateAction::switch_to(4), CandidateAction::pass());
    try {
        engine.apply(state, turn(bad_switch, single_move("thunderbolt")), 1);
    } catch (const OracleError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_state_encoder() {
    std::cout << "Testing state encoder... ";

    BattleState state = switch_position();
    auto self_view = StateEncoder::encode(state, Side::Self);
    auto opp_view = StateEncoder::encode(state, Side::Opponent);
    assert(static_cast<int>(self_view.size()) == StateEncoder::INPUT_DIM);
    assert(static_cast<int>(opp_view.size()) == StateEncoder::INPUT_DIM);
    assert(self_view != opp_view);

    std::cout << "PASSED (dim=" << StateEncoder::INPUT_DIM << ")\n";
}

int main() {
    std::cout << "\n=== VGC Solver Basic Tests ===\n\n";

    test_types();
    test_stats();
    test_dex();
    test_actions();
    test_state_signature();
    test_legal_actions();
    test_apply_deterministic();
    test_auto_replacement();
    test_switch_resolves_first();
    test_protect_and_fake_out();
    test_enumerate_outcomes();
    test_terminal();
    test_illegal_actions();
    test_state_encoder();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
