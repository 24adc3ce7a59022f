#include "vgc/search/endgame_solver.hpp"
#include "vgc/search/evaluator.hpp"
#include "vgc/search/game_solver.hpp"
#include "vgc/search/transposition_table.hpp"
#include "battle_fixtures.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <cassert>
#include <thread>
#include <vector>

using namespace vgc;
using namespace vgc::fixtures;

namespace {

bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) < eps;
}

bool is_knockout_move(const JointAction& action) {
    std::string id = action[0].move_id();
    return id == "earthquake" || id == "dragonclaw";
}

// Engine, rules, evaluator and generator wired together
struct SearchRig {
    ReferenceBattleEngine engine;
    ScoringRules rules = ScoringRules::standard();
    StaticEvaluator evaluator{EvaluatorConfig{}, rules};
    CandidateActionGenerator generator{CandidateConfig{}, engine, engine.damage_calc(), rules};
    TranspositionTable table;
};

}  // namespace

void test_evaluator() {
    std::cout << "Testing static evaluator... ";

    ScoringRules rules = ScoringRules::standard();
    StaticEvaluator eval(EvaluatorConfig{}, rules);

    BattleState won = knockout_position();
    won.side(Side::Opponent).roster[0].hp_fraction = 0.0f;
    assert(near(eval.evaluate(won, Side::Self, 0), 1.0f));
    assert(near(eval.evaluate(won, Side::Self, 3), 0.985f));
    // Discount stops after nine plies
    assert(near(eval.evaluate(won, Side::Self, 20), 0.955f));
    assert(near(eval.evaluate(won, Side::Opponent, 1), -0.995f));

    BattleState draw = won;
    draw.side(Side::Self).roster[0].hp_fraction = 0.0f;
    assert(eval.evaluate(draw, Side::Self, 0) == 0.0f);

    // Non-terminal values stay strictly inside the terminal range
    BattleState behind = switch_position();
    float v = eval.evaluate(behind, Side::Self, 0);
    assert(v < 0.0f);
    assert(v > -0.9f);
    assert(near(v, -eval.evaluate(behind, Side::Opponent, 0), 1e-3f));

    assert(near(StaticEvaluator::to_win_probability(0.0f), 0.5f));
    assert(near(StaticEvaluator::to_win_probability(1.0f), 1.0f));
    assert(StaticEvaluator::to_win_probability(-3.0f) == 0.0f);

    // Leaf callback replaces the heuristic at full weight
    EvaluatorConfig blended;
    blended.neural_weight = 1.0f;
    blended.leaf_value = [](const std::vector<float>&) { return 0.5f; };
    StaticEvaluator neural(blended, rules);
    assert(near(neural.evaluate(behind, Side::Self, 0), 0.5f));

    std::cout << "PASSED (behind=" << v << ")\n";
}

void test_transposition_table() {
    std::cout << "Testing transposition table... ";

    TranspositionTable table(4);
    TTKey key{3, 11, 22, 33, 44, 1};
    assert(!table.lookup(key));
    assert(table.misses() == 1);

    table.store(key, TTEntry{0.4f, 0.01f, 0.3f, 0.5f});
    auto hit = table.lookup(key);
    assert(hit && near(hit->mean, 0.4f));
    assert(table.hits() == 1);

    // Remaining depth is part of the key
    TTKey deeper = key;
    deeper.depth = 2;
    assert(!table.lookup(deeper));
    assert(!(key == deeper));

    // Concurrent writers on disjoint keys
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&table, t]() {
            for (int i = 0; i < 100; ++i) {
                TTKey k{t, static_cast<uint64_t>(i), 0, 0, 0, 0};
                table.store(k, TTEntry{static_cast<float>(i), 0.0f, 0.0f, 0.0f});
                table.lookup(k);
            }
        });
    }
    for (auto& th : threads) th.join();
    assert(table.size() == 401);
    assert(table.hits() == 401);

    table.clear();
    assert(table.size() == 0);
    assert(table.hits() == 0 && table.misses() == 0);

    std::cout << "PASSED\n";
}

void test_solver_finds_knockout() {
    std::cout << "Testing game solver knockout... ";

    SearchRig rig;
    SolverConfig config;
    config.depth = 2;
    GameSolver solver(config, rig.engine, rig.generator, rig.evaluator, rig.table);

    SolveResult result = solver.solve(knockout_position(), Side::Self, 0);
    assert(!result.self_actions.empty());
    assert(result.opp_actions.size() == 1);
    assert(result.utility.size() == result.self_actions.size());
    assert(result.complete);
    assert(result.nodes > 0);

    assert(is_knockout_move(result.self_actions[result.best_index]));
    assert(result.value > 0.95f);

    // Both chance samples of a Protect turn reach the same position, so the
    // second one is served from the table within this single call
    assert(rig.table.hits() > 0);

    float policy_total = 0.0f;
    for (float p : result.self_policy) policy_total += p;
    assert(near(policy_total, 1.0f));

    auto stats = result.action_stats();
    assert(stats.size() == result.self_actions.size());
    assert(stats[result.best_index].min_value > 0.95f);

    std::cout << "PASSED (value=" << result.value << ", nodes=" << result.nodes << ")\n";
}

void test_solver_prefers_switch() {
    std::cout << "Testing game solver switch... ";

    SearchRig rig;
    SolverConfig config;
    config.depth = 2;
    GameSolver solver(config, rig.engine, rig.generator, rig.evaluator, rig.table);

    BattleState state = switch_position();
    SolveResult result = solver.solve(state, Side::Self, 0);
    const JointAction& best = result.self_actions[result.best_index];
    assert(best[0].is_switch());
    assert(best[0].switch_index() == 1);

    // A second pass over the same table reuses the cached pairs
    uint64_t hits_before = rig.table.hits();
    solver.solve(state, Side::Self, 0);
    assert(rig.table.hits() > hits_before);

    std::cout << "PASSED (tt=" << rig.table.size() << " entries)\n";
}

void test_solver_deadline() {
    std::cout << "Testing game solver deadline... ";

    SearchRig rig;
    SolverConfig config;
    config.depth = 3;
    GameSolver solver(config, rig.engine, rig.generator, rig.evaluator, rig.table);

    Deadline deadline = Deadline::after(0.001f);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    assert(deadline.expired());

    SolveResult result = solver.solve(switch_position(), Side::Self, 0, deadline);
    assert(!result.complete);
    assert(!result.self_actions.empty());
    // Depth-capped pairs are never cached
    assert(rig.table.size() == 0);

    std::cout << "PASSED\n";
}

void test_opponent_policy_bias() {
    std::cout << "Testing modeled opponent policy... ";

    SearchRig rig;
    OpponentStyleModel style;
    GameSolver solver(SolverConfig{}, rig.engine, rig.generator, rig.evaluator, rig.table, &style);

    JointAction protect(CandidateAction::use_move(find_move("protect"), TARGET_NONE), CandidateAction::pass());
    JointAction attack = single_move("thunderbolt");
    std::vector<JointAction> opp = {attack, protect};
    // Equal value for both columns
    std::vector<std::vector<float>> utility = {{0.1f, 0.1f}, {-0.2f, -0.2f}};

    auto q = solver.opponent_policy(utility, opp, Side::Opponent);
    assert(near(q[0], 0.5f) && near(q[1], 0.5f));

    for (int i = 0; i < 5; ++i) style.observe(protect);
    q = solver.opponent_policy(utility, opp, Side::Opponent);
    assert(q[1] > q[0]);
    assert(near(q[0] + q[1], 1.0f));

    // Columns bad for us are likelier
    std::vector<std::vector<float>> skewed = {{0.5f, -0.5f}};
    GameSolver plain(SolverConfig{}, rig.engine, rig.generator, rig.evaluator, rig.table);
    q = plain.opponent_policy(skewed, opp, Side::Opponent);
    assert(q[1] > 0.95f);

    std::cout << "PASSED\n";
}

void test_endgame_solver() {
    std::cout << "Testing endgame solver... ";

    SearchRig rig;
    EndgameSolver endgame(EndgameConfig{}, rig.engine, rig.generator, rig.evaluator);

    assert(endgame.should_trigger(knockout_position()));
    assert(!endgame.should_trigger(switch_position()));

    EndgameResult result = endgame.solve(knockout_position(), Side::Self);
    assert(result.solved);
    assert(is_knockout_move(result.self_actions[result.best_index]));
    assert(near(result.value, 0.995f, 1e-3f));
    assert(near(result.remaining_score, 0.0f));

    // Every knockout line wins in all chance branches; stalling wins later
    auto stats = result.action_stats();
    for (const auto& s : stats) {
        if (is_knockout_move(s.action)) {
            assert(s.min_value >= 0.95f);
            assert(s.expected >= stats[result.best_index].expected - 1e-6f);
        } else {
            assert(s.expected < stats[result.best_index].expected);
            // Stalling one turn wins a ply later
            assert(near(s.expected, 0.99f, 1e-3f));
        }
    }

    // A recursion guard at one ply scores stalling lines statically
    EndgameConfig shallow;
    shallow.max_ply = 1;
    EndgameSolver guarded(shallow, rig.engine, rig.generator, rig.evaluator);
    EndgameResult cut = guarded.solve(knockout_position(), Side::Self);
    assert(cut.solved);
    assert(cut.static_cuts > 0);
    assert(is_knockout_move(cut.self_actions[cut.best_index]));

    // Budget exhaustion reports an unsolved result
    EndgameConfig tight;
    tight.node_budget = 1;
    EndgameSolver capped(tight, rig.engine, rig.generator, rig.evaluator);
    EndgameResult aborted = capped.solve(knockout_position(), Side::Self);
    assert(!aborted.solved);

    std::cout << "PASSED (nodes=" << result.nodes << ")\n";
}

int main() {
    std::cout << "\n=== VGC Search Tests ===\n\n";

    test_evaluator();
    test_transposition_table();
    test_solver_finds_knockout();
    test_solver_prefers_switch();
    test_solver_deadline();
    test_opponent_policy_bias();
    test_endgame_solver();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
