#include "vgc/search/game_solver.hpp"
#include "vgc/strategy/quantal_response.hpp"
#include <algorithm>
#include <cmath>

namespace vgc {

namespace {

TurnActions make_turn(Side side, const JointAction& self_action, const JointAction& opp_action) {
    TurnActions actions;
    actions[side_index(side)] = self_action;
    actions[side_index(opposite(side))] = opp_action;
    return actions;
}

std::vector<JointAction> strip_scores(std::vector<ScoredJointAction> scored) {
    std::vector<JointAction> actions;
    actions.reserve(scored.size());
    for (auto& sj : scored) {
        actions.push_back(std::move(sj.action));
    }
    return actions;
}

}  // namespace

// =============================================================================
// SolveResult
// =============================================================================

std::vector<ActionValueEstimate> SolveResult::action_stats(float min_probability) const {
    std::vector<ActionValueEstimate> stats;
    stats.reserve(self_actions.size());

    int likeliest = opp_policy.empty() ? 0 : best_response(opp_policy);

    for (size_t i = 0; i < self_actions.size(); ++i) {
        ActionValueEstimate e;
        e.action = self_actions[i];
        e.expected = self_values[i];

        float variance = 0.0f;
        float lo = 0.0f;
        float hi = 0.0f;
        bool any = false;
        for (size_t j = 0; j < opp_actions.size(); ++j) {
            float q = opp_policy[j];
            float diff = utility[i][j] - e.expected;
            variance += q * (pair_variance[i][j] + diff * diff);

            bool plausible = q >= min_probability || static_cast<int>(j) == likeliest;
            if (!plausible) continue;
            lo = any ? std::min(lo, pair_min[i][j]) : pair_min[i][j];
            hi = any ? std::max(hi, pair_max[i][j]) : pair_max[i][j];
            any = true;
        }
        e.variance = variance;
        e.min_value = any ? lo : e.expected;
        e.max_value = any ? hi : e.expected;
        stats.push_back(std::move(e));
    }
    return stats;
}

// =============================================================================
// GameSolver Implementation
// =============================================================================

GameSolver::GameSolver(
    const SolverConfig& config,
    const BattleOracle& oracle,
    const CandidateActionGenerator& generator,
    const StaticEvaluator& evaluator,
    TranspositionTable& table,
    const OpponentStyleModel* style
) : config_(config),
    oracle_(oracle),
    generator_(generator),
    evaluator_(evaluator),
    table_(table),
    style_(style)
{
    config_.depth = std::max(1, config_.depth);
    config_.n_samples = std::max(1, config_.n_samples);
    config_.inner_samples = std::max(1, config_.inner_samples);
    config_.inner_top_k = std::max(1, config_.inner_top_k);
}

SolveResult GameSolver::solve(
    const BattleState& root,
    Side side,
    uint64_t hypothesis,
    const Deadline& deadline
) {
    return solve(root, side, hypothesis, {}, {}, deadline);
}

SolveResult GameSolver::solve(
    const BattleState& root,
    Side side,
    uint64_t hypothesis,
    std::vector<JointAction> self_candidates,
    std::vector<JointAction> opp_candidates,
    const Deadline& deadline
) {
    nodes_ = 0;
    complete_ = true;

    SolveResult result;
    if (root.is_terminal()) {
        result.value = evaluator_.evaluate(root, side, 0);
        return result;
    }

    if (self_candidates.empty()) {
        self_candidates = strip_scores(generator_.generate_scored(side, root, config_.top_k_self));
    }
    if (opp_candidates.empty()) {
        opp_candidates = strip_scores(
            generator_.generate_scored(opposite(side), root, config_.top_k_opp));
    }

    Node node = expand(root, side, hypothesis, self_candidates, opp_candidates,
                       config_.depth - 1, 0, config_.n_samples, deadline);

    const size_t rows = node.self_actions.size();
    const size_t cols = node.opp_actions.size();
    result.utility.assign(rows, std::vector<float>(cols, 0.0f));
    result.pair_variance.assign(rows, std::vector<float>(cols, 0.0f));
    result.pair_min.assign(rows, std::vector<float>(cols, 0.0f));
    result.pair_max.assign(rows, std::vector<float>(cols, 0.0f));
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            const TTEntry& e = node.pairs[i][j];
            result.utility[i][j] = e.mean;
            result.pair_variance[i][j] = e.variance;
            result.pair_min[i][j] = e.min;
            result.pair_max[i][j] = e.max;
        }
    }

    result.opp_policy = opponent_policy(result.utility, node.opp_actions, opposite(side));
    result.self_values = row_values(node.pairs, result.opp_policy);
    result.self_policy = quantal_response(result.self_values, config_.tau_self);
    result.best_index = best_response(result.self_values);
    result.value = result.self_values[result.best_index];
    result.self_actions = std::move(node.self_actions);
    result.opp_actions = std::move(node.opp_actions);
    result.complete = complete_;
    result.nodes = nodes_;
    return result;
}

std::vector<float> GameSolver::opponent_policy(
    const std::vector<std::vector<float>>& utility,
    const std::vector<JointAction>& opp_actions,
    Side opp_side
) const {
    const size_t cols = opp_actions.size();
    std::vector<float> opp_values(cols, 0.0f);
    if (!utility.empty()) {
        // Zero-sum: the opponent's value is the negated mean over our rows
        for (size_t j = 0; j < cols; ++j) {
            float total = 0.0f;
            for (const auto& row : utility) total += row[j];
            opp_values[j] = -total / utility.size();
        }
    }

    std::vector<float> q = quantal_response(opp_values, config_.tau_opp);
    if (style_ != nullptr && opp_side == Side::Opponent && style_->samples() > 0) {
        for (size_t j = 0; j < cols; ++j) {
            q[j] *= style_->action_bias(opp_actions[j]);
        }
        normalize_distribution(q);
    }
    return q;
}

std::vector<float> GameSolver::row_values(
    const std::vector<std::vector<TTEntry>>& pairs, const std::vector<float>& q
) {
    std::vector<float> values(pairs.size(), 0.0f);
    for (size_t i = 0; i < pairs.size(); ++i) {
        for (size_t j = 0; j < pairs[i].size() && j < q.size(); ++j) {
            values[i] += q[j] * pairs[i][j].mean;
        }
    }
    return values;
}

GameSolver::Node GameSolver::expand(
    const BattleState& state,
    Side side,
    uint64_t hypothesis,
    const std::vector<JointAction>& self_actions,
    const std::vector<JointAction>& opp_actions,
    int depth,
    int ply,
    int samples,
    const Deadline& deadline
) {
    Node node;
    node.self_actions = self_actions;
    node.opp_actions = opp_actions;
    node.pairs.assign(self_actions.size(), std::vector<TTEntry>(opp_actions.size()));

    for (size_t i = 0; i < self_actions.size(); ++i) {
        for (size_t j = 0; j < opp_actions.size(); ++j) {
            node.pairs[i][j] = evaluate_pair(state, side, hypothesis, self_actions[i],
                                             opp_actions[j], depth, ply, samples, deadline);
        }
    }
    return node;
}

float GameSolver::node_value(
    const BattleState& state, Side side, uint64_t hypothesis,
    int depth, int ply, const Deadline& deadline
) {
    if (state.is_terminal()) {
        return evaluator_.evaluate(state, side, ply);
    }

    auto self_actions = strip_scores(generator_.generate_scored(side, state, config_.inner_top_k));
    auto opp_actions = strip_scores(
        generator_.generate_scored(opposite(side), state, config_.inner_top_k));

    // Fully forced: no cross-product to aggregate
    if (self_actions.size() == 1 && opp_actions.size() == 1) {
        return evaluate_pair(state, side, hypothesis, self_actions[0], opp_actions[0],
                             depth - 1, ply, config_.inner_samples, deadline).mean;
    }

    Node node = expand(state, side, hypothesis, self_actions, opp_actions,
                       depth - 1, ply, config_.inner_samples, deadline);

    std::vector<std::vector<float>> utility(node.pairs.size());
    for (size_t i = 0; i < node.pairs.size(); ++i) {
        for (const auto& e : node.pairs[i]) utility[i].push_back(e.mean);
    }
    std::vector<float> q = opponent_policy(utility, node.opp_actions, opposite(side));
    std::vector<float> values = row_values(node.pairs, q);
    return *std::max_element(values.begin(), values.end());
}

TTEntry GameSolver::evaluate_pair(
    const BattleState& state,
    Side side,
    uint64_t hypothesis,
    const JointAction& self_action,
    const JointAction& opp_action,
    int depth,
    int ply,
    int samples,
    const Deadline& deadline
) {
    const uint64_t state_sig = state.signature();
    TTKey key{state.turn, self_action.signature(), opp_action.signature(),
              hypothesis, state_sig, depth};
    if (auto cached = table_.lookup(key)) {
        return *cached;
    }

    const bool outer_complete = complete_;
    complete_ = true;

    const TurnActions actions = make_turn(side, self_action, opp_action);
    uint64_t base_seed = hash_combine(hash_combine(config_.seed, hypothesis),
                                      hash_combine(state_sig, hash_combine(key.self_action,
                                                                           key.opp_action)));

    std::vector<float> values;
    values.reserve(samples);
    for (int s = 0; s < samples; ++s) {
        StepResult step = oracle_.apply(state, actions, base_seed + static_cast<uint64_t>(s));
        nodes_++;

        float v;
        if (step.terminal || depth <= 0) {
            v = evaluator_.evaluate(step.next, side, ply + 1);
        } else if (deadline.expired()) {
            // Out of time: cap depth here
            complete_ = false;
            v = evaluator_.evaluate(step.next, side, ply + 1);
        } else {
            v = node_value(step.next, side, hypothesis, depth, ply + 1, deadline);
        }
        values.push_back(v);
    }

    TTEntry entry;
    float sum = 0.0f;
    entry.min = values.front();
    entry.max = values.front();
    for (float v : values) {
        sum += v;
        entry.min = std::min(entry.min, v);
        entry.max = std::max(entry.max, v);
    }
    entry.mean = sum / values.size();
    float sq = 0.0f;
    for (float v : values) sq += (v - entry.mean) * (v - entry.mean);
    entry.variance = sq / values.size();

    // Depth-capped values are not cached
    if (complete_) {
        table_.store(key, entry);
    }
    complete_ = outer_complete && complete_;
    return entry;
}

}  // namespace vgc
