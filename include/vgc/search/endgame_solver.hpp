#pragma once

/**
 * Exhaustive endgame search.
 *
 * With few Pokemon left, every legal joint action and every chance
 * branch (oracle.enumerate_outcomes) is expanded to the end of the game.
 * Positions are memoized by turn-independent signature and by ply until
 * the terminal discount saturates. A position that is revisited while
 * still on the search stack is a cycle and scores statically; values
 * resting on such a cut are not memoized. Exceeding the node budget or
 * the deadline aborts the search so the caller can fall back to GameSolver.
 */

#include "vgc/core/deadline.hpp"
#include "vgc/game/oracle.hpp"
#include "vgc/search/candidate_generator.hpp"
#include "vgc/search/evaluator.hpp"
#include "vgc/strategy/risk_aware_solver.hpp"
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vgc {

struct EndgameConfig {
    int remaining_threshold = 3;       // Total non-fainted Pokemon on both sides
    size_t node_budget = 300000;       // Chance branches expanded before giving up
    size_t max_branches = 64;          // Per action pair
    // Recursion guard only; PP and HP keep real lines far shorter.
    // A node at this ply scores statically and counts as a cut.
    int max_ply = 40;
    float tau_opp = 0.25f;
    bool verbose = false;
};

struct EndgameResult {
    bool solved = false;               // Exhaustive search finished within budget
    std::vector<JointAction> self_actions;
    std::vector<JointAction> opp_actions;
    std::vector<std::vector<float>> utility;
    std::vector<std::vector<float>> pair_min;
    std::vector<std::vector<float>> pair_max;
    std::vector<float> opp_policy;
    std::vector<float> self_values;
    int best_index = 0;
    float value = 0.0f;
    size_t nodes = 0;
    size_t static_cuts = 0;            // Cycle and recursion-guard cuts scored statically

    // Material summary of the root, reported when falling back
    float remaining_score = 0.0f;
    float hp_score = 0.0f;

    std::vector<ActionValueEstimate> action_stats() const;
};

class EndgameSolver {
public:
    EndgameSolver(
        const EndgameConfig& config,
        const BattleOracle& oracle,
        const CandidateActionGenerator& generator,
        const StaticEvaluator& evaluator
    );

    bool should_trigger(const BattleState& state) const;

    /**
     * @throws OracleError from the battle oracle
     */
    EndgameResult solve(
        const BattleState& state,
        Side side,
        const Deadline& deadline = Deadline::none());

    const EndgameConfig& config() const { return config_; }

private:
    struct PairOutcome {
        float expected = 0.0f;
        float min = 0.0f;
        float max = 0.0f;
    };

    float search(const BattleState& state, Side side, int ply);

    PairOutcome expand_pair(
        const BattleState& state, Side side,
        const JointAction& self_action, const JointAction& opp_action, int ply);

    float aggregate(const std::vector<std::vector<float>>& utility,
                    std::vector<float>* opp_policy = nullptr,
                    std::vector<float>* self_values = nullptr) const;

    bool out_of_budget();

    EndgameConfig config_;
    const BattleOracle& oracle_;
    const CandidateActionGenerator& generator_;
    const StaticEvaluator& evaluator_;

    // Per-solve state
    std::unordered_map<uint64_t, float> memo_;
    std::unordered_set<uint64_t> in_progress_;
    size_t nodes_ = 0;
    size_t cuts_ = 0;
    bool aborted_ = false;
    const Deadline* deadline_ = nullptr;
};

}  // namespace vgc
