#pragma once

/**
 * Per-turn decision entry point.
 *
 * Usage:
 *   TurnDecisionOrchestrator orchestrator(config, engine, damage);
 *   orchestrator.observe(last_turn);            // BeliefUpdate
 *   TurnDecision d = orchestrator.decide(state, Side::Self, orchestrator.belief());
 *   // d.action is the chosen joint action, d.win_probability its estimate
 *
 * One decision runs AwaitingTurn -> BeliefUpdate -> PostureDecision ->
 * Search -> Aggregate -> Selected, strictly in that order. The Search
 * stage spreads the determinizations over a pool of worker threads that
 * share one TranspositionTable; Aggregate averages their utility
 * matrices and hands per-action statistics to the RiskAwareSolver.
 */

#include "vgc/belief/belief_state.hpp"
#include "vgc/belief/opponent_style.hpp"
#include "vgc/search/candidate_generator.hpp"
#include "vgc/search/determinizer.hpp"
#include "vgc/search/endgame_solver.hpp"
#include "vgc/search/evaluator.hpp"
#include "vgc/search/game_solver.hpp"
#include "vgc/search/scoring_rules.hpp"
#include "vgc/search/transposition_table.hpp"
#include "vgc/strategy/fictitious_play.hpp"
#include "vgc/strategy/risk_aware_solver.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vgc {

struct OrchestratorConfig {
    int determinizations = 10;      // K
    float time_budget = 3.0f;       // Seconds per decision (0 = unlimited)
    int num_threads = 4;

    SolverConfig solver;
    CandidateConfig candidates;
    BeliefConfig belief;
    StyleConfig style;
    RiskConfig risk;
    FictitiousPlayConfig fictitious_play;
    EndgameConfig endgame;
    EvaluatorConfig evaluator;

    bool use_fictitious_play = false;
    bool use_endgame = true;
    float advisory_timeout = 0.3f;  // Seconds
    int trace_alternatives = 5;

    bool verbose = false;
    unsigned int seed = 42;

    static OrchestratorConfig fast_preset() {
        OrchestratorConfig cfg;
        cfg.determinizations = 4;
        cfg.time_budget = 1.0f;
        cfg.num_threads = 2;
        cfg.solver = SolverConfig::fast_preset();
        cfg.endgame.node_budget = 50000;
        return cfg;
    }

    static OrchestratorConfig tournament_preset() {
        OrchestratorConfig cfg;
        cfg.determinizations = 16;
        cfg.time_budget = 5.0f;
        cfg.num_threads = 8;
        cfg.solver = SolverConfig::tournament_preset();
        cfg.use_fictitious_play = true;
        return cfg;
    }
};

enum class DecisionPhase {
    AwaitingTurn,
    BeliefUpdate,
    PostureDecision,
    Search,
    Aggregate,
    Selected
};

std::string phase_to_string(DecisionPhase phase);

/**
 * Everything observed during one resolved turn.
 */
struct TurnObservations {
    int turn = 0;
    std::vector<Observation> events;
    std::optional<JointAction> opponent_action;   // Feeds the style model
};

struct AlternativeAction {
    JointAction action;
    float score = 0.0f;         // Posture criterion
    float expected = 0.0f;
    float probability = 0.0f;   // Own policy weight
};

struct DecisionTrace {
    RiskPosture posture = RiskPosture::Neutral;
    float posture_win_probability = 0.5f;
    int determinizations_requested = 0;
    int determinizations_completed = 0;
    bool used_endgame = false;
    bool endgame_fallback = false;
    float endgame_remaining_score = 0.0f;
    float endgame_hp_score = 0.0f;
    bool advisory_used = false;
    bool timed_out = false;
    bool terminal_override = false;
    std::vector<AlternativeAction> alternatives;   // Best first
    std::vector<float> fictitious_play_policy;
    float nash_gap = 0.0f;
    uint64_t tt_hits = 0;
    uint64_t tt_misses = 0;
    size_t nodes = 0;
    float elapsed_seconds = 0.0f;
    std::vector<DecisionPhase> phases;
};

struct TurnDecision {
    JointAction action;
    float win_probability = 0.5f;
    DecisionTrace trace;
};

class TurnDecisionOrchestrator {
public:
    /**
     * @param advisor Optional; decisions never depend on it being present
     * @throws std::invalid_argument if an oracle is null
     */
    TurnDecisionOrchestrator(
        const OrchestratorConfig& config,
        std::shared_ptr<const BattleOracle> oracle,
        std::shared_ptr<const DamageOracle> damage,
        std::shared_ptr<Advisor> advisor = nullptr
    );

    /**
     * Apply one turn's observations to the owned belief and style model.
     *
     * @throws std::logic_error if turn is lower than the last applied turn
     * @throws std::invalid_argument for observations about unknown Pokemon
     */
    void observe(const TurnObservations& observations);

    /**
     * Choose a joint action for `side` under the given belief.
     *
     * @throws OracleError if a collaborator fails, also inside worker threads
     */
    TurnDecision decide(const BattleState& state, Side side, BeliefState& belief);

    /**
     * Register newly seen opponents, observe, then decide with the owned belief.
     */
    TurnDecision decide_turn(const BattleState& state, Side side, const TurnObservations& observations);

    // Overrides the posture input for the next decision only
    void set_win_probability_hint(float p) { win_probability_hint_ = p; }

    DecisionPhase phase() const { return phase_; }
    BeliefState& belief() { return belief_; }
    const OpponentStyleModel& style() const { return style_; }
    const CandidateActionGenerator& generator() const { return generator_; }
    const TranspositionTable& table() const { return table_; }
    const OrchestratorConfig& config() const { return config_; }

private:
    struct WorkerResult {
        bool done = false;
        SolveResult result;
    };

    void enter(DecisionPhase phase, DecisionTrace& trace);

    std::vector<AdvisorySuggestion> query_advisor(
        const BattleState& state, Side side, bool& available);

    float posture_probability(const BattleState& state, Side side) const;

    // Search stage: every determinization over the same root candidate lists
    std::vector<WorkerResult> run_determinizations(
        const std::vector<Determinization>& worlds,
        Side side,
        const std::vector<JointAction>& self_candidates,
        const std::vector<JointAction>& opp_candidates,
        const Deadline& deadline);

    // BeliefUpdate through Aggregate for a state that is still in play
    TurnDecision search_turn(const BattleState& state, Side side, BeliefState& belief,
                             const Deadline& deadline, DecisionTrace trace);

    TurnDecision select_from_endgame(const EndgameResult& endgame, DecisionTrace trace, float posture_p);

    OrchestratorConfig config_;
    std::shared_ptr<const BattleOracle> oracle_;
    std::shared_ptr<const DamageOracle> damage_;
    std::shared_ptr<Advisor> advisor_;

    ScoringRules rules_;
    StaticEvaluator evaluator_;
    CandidateActionGenerator generator_;
    TranspositionTable table_;
    OpponentStyleModel style_;
    BeliefState belief_;
    Determinizer determinizer_;
    RiskAwareSolver risk_;
    FictitiousPlayRefiner refiner_;

    DecisionPhase phase_ = DecisionPhase::AwaitingTurn;
    int last_observed_turn_ = 0;
    std::optional<float> win_probability_hint_;
    std::optional<float> last_win_probability_;
};

}  // namespace vgc
