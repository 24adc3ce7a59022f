#pragma once

/**
 * Depth-limited simultaneous-move search on one determinized state.
 *
 * Each node builds the utility matrix U[i][j] over self candidates i and
 * opponent candidates j. A pair's value is the mean over sampled chance
 * resolutions of the child value. The opponent plays a quantal response
 * to U (temperature tau_opp, optionally biased by its observed style);
 * the node value is the best self row against that response.
 *
 * Pair values are cached in the shared TranspositionTable. When the
 * deadline expires, remaining pairs are evaluated statically at their
 * immediate successor and the result is marked incomplete.
 */

#include "vgc/belief/opponent_style.hpp"
#include "vgc/core/deadline.hpp"
#include "vgc/game/oracle.hpp"
#include "vgc/search/candidate_generator.hpp"
#include "vgc/search/evaluator.hpp"
#include "vgc/search/transposition_table.hpp"
#include "vgc/strategy/risk_aware_solver.hpp"
#include <vector>

namespace vgc {

struct SolverConfig {
    int depth = 2;              // Turns searched below the root decision
    int n_samples = 2;          // Chance samples per root pair
    int top_k_self = 10;        // Root caps when the solver generates its own candidates
    int top_k_opp = 8;
    int inner_top_k = 4;        // Candidates per side below the root
    int inner_samples = 1;
    float tau_opp = 0.25f;      // Opponent quantal response temperature
    float tau_self = 0.30f;     // Own policy temperature (reporting only)
    unsigned int seed = 42;

    static SolverConfig fast_preset() {
        SolverConfig cfg;
        cfg.depth = 1;
        cfg.n_samples = 1;
        cfg.top_k_self = 6;
        cfg.top_k_opp = 4;
        cfg.inner_top_k = 3;
        return cfg;
    }

    static SolverConfig tournament_preset() {
        SolverConfig cfg;
        cfg.depth = 2;
        cfg.n_samples = 3;
        cfg.top_k_self = 15;
        cfg.top_k_opp = 10;
        cfg.inner_top_k = 5;
        cfg.inner_samples = 2;
        return cfg;
    }
};

struct SolveResult {
    std::vector<JointAction> self_actions;
    std::vector<JointAction> opp_actions;

    // Pair statistics, [self][opp]
    std::vector<std::vector<float>> utility;
    std::vector<std::vector<float>> pair_variance;
    std::vector<std::vector<float>> pair_min;
    std::vector<std::vector<float>> pair_max;

    std::vector<float> opp_policy;     // Modeled opponent response
    std::vector<float> self_values;    // U * opp_policy
    std::vector<float> self_policy;    // Quantal response at tau_self
    int best_index = 0;
    float value = 0.0f;                // self_values[best_index]
    bool complete = true;              // false if the deadline cut depth
    size_t nodes = 0;

    /**
     * Per self action: mean, total variance, and the worst / best pair
     * outcome among opponent actions with non-negligible probability.
     */
    std::vector<ActionValueEstimate> action_stats(float min_probability = 0.01f) const;
};

class GameSolver {
public:
    GameSolver(
        const SolverConfig& config,
        const BattleOracle& oracle,
        const CandidateActionGenerator& generator,
        const StaticEvaluator& evaluator,
        TranspositionTable& table,
        const OpponentStyleModel* style = nullptr
    );

    /**
     * Search from the root with fixed root candidate lists.
     * Empty lists are generated with top_k_self / top_k_opp.
     *
     * @param hypothesis Signature of the determinization (cache key part)
     * @throws OracleError from the battle or damage oracle
     */
    SolveResult solve(
        const BattleState& root,
        Side side,
        uint64_t hypothesis,
        std::vector<JointAction> self_candidates,
        std::vector<JointAction> opp_candidates,
        const Deadline& deadline = Deadline::none()
    );

    SolveResult solve(
        const BattleState& root,
        Side side,
        uint64_t hypothesis = 0,
        const Deadline& deadline = Deadline::none()
    );

    /**
     * Modeled opponent policy over the columns of U: quantal response to
     * the opponent's mean value per column, times the style bias.
     */
    std::vector<float> opponent_policy(
        const std::vector<std::vector<float>>& utility,
        const std::vector<JointAction>& opp_actions,
        Side opp_side) const;

    size_t nodes() const { return nodes_; }
    const SolverConfig& config() const { return config_; }

private:
    struct Node {
        std::vector<JointAction> self_actions;
        std::vector<JointAction> opp_actions;
        std::vector<std::vector<TTEntry>> pairs;
    };

    Node expand(
        const BattleState& state,
        Side side,
        uint64_t hypothesis,
        const std::vector<JointAction>& self_actions,
        const std::vector<JointAction>& opp_actions,
        int depth,
        int ply,
        int samples,
        const Deadline& deadline);

    // Value of an interior node
    float node_value(
        const BattleState& state, Side side, uint64_t hypothesis,
        int depth, int ply, const Deadline& deadline);

    TTEntry evaluate_pair(
        const BattleState& state,
        Side side,
        uint64_t hypothesis,
        const JointAction& self_action,
        const JointAction& opp_action,
        int depth,
        int ply,
        int samples,
        const Deadline& deadline);

    static std::vector<float> row_values(
        const std::vector<std::vector<TTEntry>>& pairs, const std::vector<float>& q);

    SolverConfig config_;
    const BattleOracle& oracle_;
    const CandidateActionGenerator& generator_;
    const StaticEvaluator& evaluator_;
    TranspositionTable& table_;
    const OpponentStyleModel* style_;
    size_t nodes_ = 0;
    bool complete_ = true;
};

}  // namespace vgc
