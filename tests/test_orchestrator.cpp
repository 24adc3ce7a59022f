#include "vgc/search/turn_orchestrator.hpp"
#include "battle_fixtures.hpp"
#include <chrono>
#include <iostream>
#include <cassert>
#include <stdexcept>
#include <thread>

using namespace vgc;
using namespace vgc::fixtures;

namespace {

bool is_knockout_move(const JointAction& action) {
    std::string id = action[0].move_id();
    return id == "earthquake" || id == "dragonclaw";
}

// Small, unlimited-time configuration so results do not depend on machine speed
OrchestratorConfig test_config() {
    OrchestratorConfig config;
    config.determinizations = 3;
    config.time_budget = 0.0f;
    config.num_threads = 2;
    config.solver.depth = 2;
    config.seed = 7;
    return config;
}

struct Engines {
    std::shared_ptr<ReferenceBattleEngine> engine = std::make_shared<ReferenceBattleEngine>();
    // Aliases the engine's damage calculator
    std::shared_ptr<const DamageOracle> damage{engine, &engine->damage_calc()};
};

// Legal actions from the reference engine, every resolution fails
class FailingOracle : public BattleOracle {
public:
    std::vector<CandidateAction> legal_actions(
        const BattleState& state, Side side, int slot) const override {
        return engine_.legal_actions(state, side, slot);
    }

    StepResult apply(const BattleState&, const TurnActions&, uint64_t) const override {
        throw OracleError("simulator disconnected");
    }

    bool enumerate_outcomes(const BattleState&, const TurnActions&, size_t,
                            std::vector<ChanceBranch>&) const override {
        throw OracleError("simulator disconnected");
    }

private:
    ReferenceBattleEngine engine_;
};

class FixedAdvisor : public Advisor {
public:
    explicit FixedAdvisor(std::vector<AdvisorySuggestion> advice) : advice_(std::move(advice)) {}

    std::vector<AdvisorySuggestion> propose(const BattleState&, Side) override {
        return advice_;
    }

private:
    std::vector<AdvisorySuggestion> advice_;
};

class SlowAdvisor : public Advisor {
public:
    std::vector<AdvisorySuggestion> propose(const BattleState&, Side) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        return {{0, "waterfall", 1.0f}};
    }
};

class BrokenAdvisor : public Advisor {
public:
    std::vector<AdvisorySuggestion> propose(const BattleState&, Side) override {
        throw std::runtime_error("advisory backend unavailable");
    }
};

}  // namespace

void test_construction() {
    std::cout << "Testing orchestrator construction... ";

    Engines e;
    bool threw = false;
    try {
        TurnDecisionOrchestrator bad(test_config(), nullptr, e.damage);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    OrchestratorConfig zero = test_config();
    zero.determinizations = 0;
    threw = false;
    try {
        TurnDecisionOrchestrator bad(zero, e.engine, e.damage);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    TurnDecisionOrchestrator ok(test_config(), e.engine, e.damage);
    assert(ok.phase() == DecisionPhase::AwaitingTurn);
    assert(phase_to_string(DecisionPhase::Aggregate) == "aggregate");

    assert(OrchestratorConfig::fast_preset().determinizations < OrchestratorConfig::tournament_preset().determinizations);
    assert(OrchestratorConfig::tournament_preset().use_fictitious_play);

    std::cout << "PASSED\n";
}

void test_phase_sequence() {
    std::cout << "Testing decision phases... ";

    Engines e;
    TurnDecisionOrchestrator orchestrator(test_config(), e.engine, e.damage);
    BattleState state = switch_position();

    TurnDecision d = orchestrator.decide(state, Side::Self, orchestrator.belief());
    const std::vector<DecisionPhase> expected = {
        DecisionPhase::AwaitingTurn,
        DecisionPhase::BeliefUpdate,
        DecisionPhase::PostureDecision,
        DecisionPhase::Search,
        DecisionPhase::Aggregate,
        DecisionPhase::Selected
    };
    assert(d.trace.phases == expected);
    assert(orchestrator.phase() == DecisionPhase::AwaitingTurn);

    assert(d.win_probability >= 0.0f && d.win_probability <= 1.0f);
    assert(d.trace.determinizations_requested == 3);
    assert(d.trace.determinizations_completed == 3);
    assert(!d.trace.timed_out);
    assert(!d.trace.used_endgame);
    assert(!d.trace.alternatives.empty());
    assert(d.trace.alternatives.front().action == d.action);
    assert(d.trace.tt_hits + d.trace.tt_misses > 0);
    assert(d.trace.nodes > 0);

    // Opponents were registered during BeliefUpdate
    assert(orchestrator.belief().knows("raichu"));

    std::cout << "PASSED (" << d.action.to_string() << ")\n";
}

void test_switches_out_of_knockout() {
    std::cout << "Testing switch under threat... ";

    Engines e;
    TurnDecisionOrchestrator orchestrator(test_config(), e.engine, e.damage);
    orchestrator.set_win_probability_hint(0.7f);

    TurnDecision d = orchestrator.decide(switch_position(), Side::Self, orchestrator.belief());
    assert(d.trace.posture == RiskPosture::Secure);
    assert(d.action[0].is_switch());
    assert(d.action[0].switch_index() == 1);

    std::cout << "PASSED\n";
}

void test_endgame_knockout() {
    std::cout << "Testing endgame knockout... ";

    Engines e;
    TurnDecisionOrchestrator orchestrator(test_config(), e.engine, e.damage);
    // Behind by estimate, but a sure win is still taken
    orchestrator.set_win_probability_hint(0.2f);

    TurnDecision d = orchestrator.decide(knockout_position(), Side::Self, orchestrator.belief());
    assert(d.trace.used_endgame);
    assert(!d.trace.endgame_fallback);
    assert(d.trace.posture == RiskPosture::Gamble);
    assert(d.trace.terminal_override);
    assert(is_knockout_move(d.action));
    assert(d.win_probability > 0.99f);

    std::cout << "PASSED\n";
}

void test_determinized_knockout() {
    std::cout << "Testing determinized knockout... ";

    Engines e;
    OrchestratorConfig config = test_config();
    config.use_endgame = false;
    config.determinizations = 4;
    TurnDecisionOrchestrator orchestrator(config, e.engine, e.damage);

    TurnDecision d = orchestrator.decide(knockout_position(), Side::Self, orchestrator.belief());
    assert(!d.trace.used_endgame);
    assert(d.trace.determinizations_completed == 4);
    assert(is_knockout_move(d.action));
    assert(d.trace.terminal_override);

    std::cout << "PASSED\n";
}

void test_endgame_budget_fallback() {
    std::cout << "Testing endgame fallback... ";

    Engines e;
    OrchestratorConfig config = test_config();
    config.endgame.node_budget = 1;
    TurnDecisionOrchestrator orchestrator(config, e.engine, e.damage);

    TurnDecision d = orchestrator.decide(knockout_position(), Side::Self, orchestrator.belief());
    assert(!d.trace.used_endgame);
    assert(d.trace.endgame_fallback);
    assert(d.trace.determinizations_completed == 3);
    assert(is_knockout_move(d.action));

    std::cout << "PASSED\n";
}

void test_finished_battle() {
    std::cout << "Testing decision on a finished battle... ";

    Engines e;
    OrchestratorConfig config = test_config();
    config.use_endgame = false;
    TurnDecisionOrchestrator orchestrator(config, e.engine, e.damage);

    BattleState won = knockout_position();
    won.side(Side::Opponent).roster[0].hp_fraction = 0.0f;
    assert(won.is_terminal());

    TurnDecision d = orchestrator.decide(won, Side::Self, orchestrator.belief());
    assert(d.action[0].is_pass());
    assert(d.action[1].is_pass());
    assert(d.win_probability > 0.99f);
    const std::vector<DecisionPhase> expected = {DecisionPhase::AwaitingTurn, DecisionPhase::Selected};
    assert(d.trace.phases == expected);
    assert(d.trace.determinizations_completed == 0);
    assert(orchestrator.phase() == DecisionPhase::AwaitingTurn);

    // Same answer with the endgame solver enabled, and for the losing side
    TurnDecisionOrchestrator with_endgame(test_config(), e.engine, e.damage);
    TurnDecision lost = with_endgame.decide(won, Side::Opponent, with_endgame.belief());
    assert(lost.action[0].is_pass());
    assert(lost.win_probability < 0.01f);

    std::cout << "PASSED\n";
}

void test_observations() {
    std::cout << "Testing turn observations... ";

    Engines e;
    TurnDecisionOrchestrator orchestrator(test_config(), e.engine, e.damage);
    BattleState state = switch_position();
    state.side(Side::Opponent).roster[0].item_revealed = false;

    TurnObservations first;
    first.turn = 1;
    first.events.push_back(ItemRevealedObservation{"raichu", "choicescarf"});
    JointAction protect(CandidateAction::use_move(find_move("protect"), TARGET_NONE), CandidateAction::pass());
    first.opponent_action = protect;

    TurnDecision d = orchestrator.decide_turn(state, Side::Self, first);
    assert(!d.trace.phases.empty());
    assert(orchestrator.belief().attributes("raichu").item.confirmed());
    assert(orchestrator.belief().point_estimate("raichu").item == "choicescarf");
    assert(orchestrator.style().samples() == 1);

    // Late observations for an earlier turn are rejected
    TurnObservations stale;
    stale.turn = 0;
    bool threw = false;
    try {
        orchestrator.observe(stale);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(orchestrator.style().samples() == 1);

    // Unknown species fail loudly
    TurnObservations unknown;
    unknown.turn = 2;
    unknown.events.push_back(HealObservation{"missingno", 25.0f});
    threw = false;
    try {
        orchestrator.observe(unknown);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(orchestrator.phase() == DecisionPhase::AwaitingTurn);

    std::cout << "PASSED\n";
}

void test_oracle_failure_propagates() {
    std::cout << "Testing oracle failure propagation... ";

    auto failing = std::make_shared<FailingOracle>();
    auto damage = std::make_shared<StandardDamageCalc>();
    OrchestratorConfig config = test_config();
    config.num_threads = 3;
    TurnDecisionOrchestrator orchestrator(config, failing, damage);

    bool threw = false;
    try {
        orchestrator.decide(switch_position(), Side::Self, orchestrator.belief());
    } catch (const OracleError& err) {
        threw = std::string(err.what()) == "simulator disconnected";
    }
    assert(threw);
    assert(orchestrator.phase() == DecisionPhase::AwaitingTurn);

    // Endgame path fails the same way
    threw = false;
    try {
        orchestrator.decide(knockout_position(), Side::Self, orchestrator.belief());
    } catch (const OracleError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_advisory() {
    std::cout << "Testing advisory handling... ";

    Engines e;
    OrchestratorConfig config = test_config();
    config.advisory_timeout = 0.25f;

    auto good = std::make_shared<FixedAdvisor>(std::vector<AdvisorySuggestion>{{0, "switch", 1.0f}});
    TurnDecisionOrchestrator advised(config, e.engine, e.damage, good);
    TurnDecision d = advised.decide(switch_position(), Side::Self, advised.belief());
    assert(d.trace.advisory_used);

    // Slow or failing advisories are skipped and the decision still happens
    TurnDecisionOrchestrator slow(config, e.engine, e.damage, std::make_shared<SlowAdvisor>());
    d = slow.decide(switch_position(), Side::Self, slow.belief());
    assert(!d.trace.advisory_used);
    assert(d.trace.determinizations_completed == 3);

    TurnDecisionOrchestrator broken(config, e.engine, e.damage, std::make_shared<BrokenAdvisor>());
    d = broken.decide(switch_position(), Side::Self, broken.belief());
    assert(!d.trace.advisory_used);

    std::cout << "PASSED\n";
}

void test_fictitious_play_refinement() {
    std::cout << "Testing fictitious play refinement... ";

    Engines e;
    OrchestratorConfig config = test_config();
    config.use_fictitious_play = true;
    TurnDecisionOrchestrator orchestrator(config, e.engine, e.damage);

    TurnDecision d = orchestrator.decide(switch_position(), Side::Self, orchestrator.belief());
    assert(!d.trace.fictitious_play_policy.empty());
    float total = 0.0f;
    for (float p : d.trace.fictitious_play_policy) total += p;
    assert(total > 0.999f && total < 1.001f);
    assert(d.trace.nash_gap >= 0.0f);

    std::cout << "PASSED (gap=" << d.trace.nash_gap << ")\n";
}

void test_deadline_marks_timeout() {
    std::cout << "Testing time budget... ";

    Engines e;
    OrchestratorConfig config = test_config();
    config.determinizations = 64;
    config.num_threads = 1;
    config.solver.depth = 3;
    config.time_budget = 0.001f;
    TurnDecisionOrchestrator orchestrator(config, e.engine, e.damage);

    TurnDecision d = orchestrator.decide(switch_position(), Side::Self, orchestrator.belief());
    // The first determinization always runs
    assert(d.trace.determinizations_completed >= 1);
    assert(d.trace.determinizations_completed < 64);
    assert(d.trace.timed_out);
    assert(!d.trace.alternatives.empty());

    std::cout << "PASSED (" << d.trace.determinizations_completed << " worlds)\n";
}

int main() {
    std::cout << "\n=== VGC Turn Orchestrator Tests ===\n\n";

    test_construction();
    test_phase_sequence();
    test_switches_out_of_knockout();
    test_endgame_knockout();
    test_determinized_knockout();
    test_endgame_budget_fallback();
    test_finished_battle();
    test_observations();
    test_oracle_failure_propagates();
    test_advisory();
    test_fictitious_play_refinement();
    test_deadline_marks_timeout();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
