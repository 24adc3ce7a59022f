#include "vgc/search/endgame_solver.hpp"
#include "vgc/core/hash.hpp"
#include "vgc/strategy/quantal_response.hpp"
#include <algorithm>
#include <iostream>

namespace vgc {

namespace {

TurnActions make_turn(Side side, const JointAction& self_action, const JointAction& opp_action) {
    TurnActions actions;
    actions[side_index(side)] = self_action;
    actions[side_index(opposite(side))] = opp_action;
    return actions;
}

}  // namespace

std::vector<ActionValueEstimate> EndgameResult::action_stats() const {
    std::vector<ActionValueEstimate> stats;
    for (size_t i = 0; i < self_actions.size(); ++i) {
        ActionValueEstimate e;
        e.action = self_actions[i];
        e.expected = self_values[i];
        e.min_value = e.expected;
        e.max_value = e.expected;
        bool any = false;
        for (size_t j = 0; j < opp_actions.size(); ++j) {
            if (opp_policy[j] < 0.01f) continue;
            e.min_value = any ? std::min(e.min_value, pair_min[i][j]) : pair_min[i][j];
            e.max_value = any ? std::max(e.max_value, pair_max[i][j]) : pair_max[i][j];
            float diff = utility[i][j] - e.expected;
            e.variance += opp_policy[j] * diff * diff;
            any = true;
        }
        stats.push_back(std::move(e));
    }
    return stats;
}

// =============================================================================
// EndgameSolver Implementation
// =============================================================================

EndgameSolver::EndgameSolver(
    const EndgameConfig& config,
    const BattleOracle& oracle,
    const CandidateActionGenerator& generator,
    const StaticEvaluator& evaluator
) : config_(config), oracle_(oracle), generator_(generator), evaluator_(evaluator)
{
}

bool EndgameSolver::should_trigger(const BattleState& state) const {
    return !state.is_terminal() && state.total_remaining() <= config_.remaining_threshold;
}

bool EndgameSolver::out_of_budget() {
    if (aborted_) return true;
    if (nodes_ > config_.node_budget) {
        aborted_ = true;
    } else if (deadline_ != nullptr && (nodes_ & 255) == 0 && deadline_->expired()) {
        aborted_ = true;
    }
    return aborted_;
}

float EndgameSolver::aggregate(
    const std::vector<std::vector<float>>& utility,
    std::vector<float>* opp_policy,
    std::vector<float>* self_values
) const {
    const size_t rows = utility.size();
    const size_t cols = rows > 0 ? utility[0].size() : 0;

    std::vector<float> opp_values(cols, 0.0f);
    for (size_t j = 0; j < cols; ++j) {
        for (size_t i = 0; i < rows; ++i) opp_values[j] -= utility[i][j];
        opp_values[j] /= static_cast<float>(rows);
    }
    std::vector<float> q = quantal_response(opp_values, config_.tau_opp);

    std::vector<float> values(rows, 0.0f);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) values[i] += q[j] * utility[i][j];
    }
    float best = values.empty() ? 0.0f : *std::max_element(values.begin(), values.end());

    if (opp_policy) *opp_policy = std::move(q);
    if (self_values) *self_values = std::move(values);
    return best;
}

EndgameSolver::PairOutcome EndgameSolver::expand_pair(
    const BattleState& state, Side side,
    const JointAction& self_action, const JointAction& opp_action, int ply
) {
    PairOutcome outcome;
    std::vector<ChanceBranch> branches;
    if (!oracle_.enumerate_outcomes(state, make_turn(side, self_action, opp_action),
                                    config_.max_branches, branches)) {
        aborted_ = true;
        return outcome;
    }

    bool first = true;
    float total_probability = 0.0f;
    for (const auto& branch : branches) {
        nodes_++;
        if (out_of_budget()) return outcome;

        float v = branch.result.terminal
            ? evaluator_.evaluate(branch.result.next, side, ply + 1)
            : search(branch.result.next, side, ply + 1);
        if (aborted_) return outcome;

        outcome.expected += branch.probability * v;
        total_probability += branch.probability;
        outcome.min = first ? v : std::min(outcome.min, v);
        outcome.max = first ? v : std::max(outcome.max, v);
        first = false;
    }
    if (total_probability > 0.0f) {
        outcome.expected /= total_probability;
    }
    return outcome;
}

float EndgameSolver::search(const BattleState& state, Side side, int ply) {
    if (state.is_terminal()) {
        return evaluator_.evaluate(state, side, ply);
    }
    if (ply >= config_.max_ply) {
        cuts_++;
        return evaluator_.evaluate(state, side, ply);
    }

    const uint64_t sig = state.signature(false);
    // Terminal values below this node depend on the ply until the discount saturates
    const int discount_ply = std::min(ply, evaluator_.config().max_discounted_plies);
    const uint64_t memo_key = hash_combine(sig, static_cast<uint64_t>(discount_ply));
    auto memo = memo_.find(memo_key);
    if (memo != memo_.end()) {
        return memo->second;
    }
    if (in_progress_.count(sig)) {
        // Cycle back to an open position
        cuts_++;
        return evaluator_.evaluate(state, side, ply);
    }
    in_progress_.insert(sig);
    const size_t cuts_before = cuts_;

    std::vector<JointAction> self_actions = generator_.enumerate(side, state);
    std::vector<JointAction> opp_actions = generator_.enumerate(opposite(side), state);

    std::vector<std::vector<float>> utility(self_actions.size(),
                                            std::vector<float>(opp_actions.size(), 0.0f));
    for (size_t i = 0; i < self_actions.size() && !aborted_; ++i) {
        for (size_t j = 0; j < opp_actions.size() && !aborted_; ++j) {
            utility[i][j] = expand_pair(state, side, self_actions[i], opp_actions[j], ply).expected;
        }
    }

    in_progress_.erase(sig);
    if (aborted_) return 0.0f;

    float value = aggregate(utility);
    // Values resting on a static cut are not exact
    if (cuts_ == cuts_before) {
        memo_[memo_key] = value;
    }
    return value;
}

EndgameResult EndgameSolver::solve(const BattleState& state, Side side, const Deadline& deadline) {
    memo_.clear();
    in_progress_.clear();
    nodes_ = 0;
    cuts_ = 0;
    aborted_ = false;
    deadline_ = &deadline;

    EndgameResult result;
    const SideState& own = state.side(side);
    const SideState& foe = state.side(opposite(side));
    result.remaining_score = static_cast<float>(own.remaining() - foe.remaining());
    result.hp_score = own.total_hp_fraction() - foe.total_hp_fraction();

    if (state.is_terminal()) {
        result.value = evaluator_.evaluate(state, side, 0);
        deadline_ = nullptr;
        return result;
    }

    result.self_actions = generator_.enumerate(side, state);
    result.opp_actions = generator_.enumerate(opposite(side), state);
    const size_t rows = result.self_actions.size();
    const size_t cols = result.opp_actions.size();
    result.utility.assign(rows, std::vector<float>(cols, 0.0f));
    result.pair_min.assign(rows, std::vector<float>(cols, 0.0f));
    result.pair_max.assign(rows, std::vector<float>(cols, 0.0f));

    in_progress_.insert(state.signature(false));
    for (size_t i = 0; i < rows && !aborted_; ++i) {
        for (size_t j = 0; j < cols && !aborted_; ++j) {
            PairOutcome o = expand_pair(state, side, result.self_actions[i], result.opp_actions[j], 0);
            result.utility[i][j] = o.expected;
            result.pair_min[i][j] = o.min;
            result.pair_max[i][j] = o.max;
        }
    }

    result.nodes = nodes_;
    result.static_cuts = cuts_;
    deadline_ = nullptr;
    if (aborted_) {
        if (config_.verbose) {
            std::cout << "Endgame search aborted after " << nodes_ << " nodes"
                      << " (remaining " << result.remaining_score
                      << ", hp " << result.hp_score << ")" << std::endl;
        }
        return result;
    }

    result.value = aggregate(result.utility, &result.opp_policy, &result.self_values);
    result.best_index = best_response(result.self_values);
    result.solved = true;

    if (config_.verbose) {
        std::cout << "Endgame solved: " << nodes_ << " nodes, value " << result.value
                  << ", best " << result.self_actions[result.best_index].to_string() << std::endl;
    }
    return result;
}

}  // namespace vgc
