#pragma once

/**
 * Static position evaluation for search leaves.
 *
 * Terminal states score +-(1 - discount * ply), so a win found sooner
 * is preferred. Non-terminal states are squashed into
 * (-non_terminal_bound, +non_terminal_bound), strictly inside every
 * terminal value reachable within the discounted plies.
 */

#include "vgc/game/battle_state.hpp"
#include "vgc/search/scoring_rules.hpp"
#include <functional>
#include <vector>

namespace vgc {

/**
 * Callback for value network leaf evaluation.
 * Takes an encoded state (StateEncoder) and returns a value in [-1, 1].
 */
using LeafValueCallback = std::function<float(const std::vector<float>&)>;

struct EvaluatorConfig {
    float non_terminal_bound = 0.9f;
    float terminal_ply_discount = 0.005f;
    int max_discounted_plies = 9;
    float heuristic_scale = 0.5f;     // tanh input scale
    float neural_weight = 0.0f;       // Blend weight of the leaf callback

    LeafValueCallback leaf_value = nullptr;
};

class StaticEvaluator {
public:
    StaticEvaluator(const EvaluatorConfig& config, const ScoringRules& rules);

    /**
     * Value of the state for `side`, in [-1, 1].
     *
     * @param ply Plies from the search root (terminal discount)
     */
    float evaluate(const BattleState& state, Side side, int ply = 0) const;

    // Weighted feature difference before squashing
    float heuristic(const BattleState& state, Side side) const;

    // +-(1 - discount * min(ply, max)); 0 for a draw
    float terminal_value(const BattleState& state, Side side, int ply) const;

    // Calibration of a utility to a win probability: (u + 1) / 2, clamped
    static float to_win_probability(float utility);

    const EvaluatorConfig& config() const { return config_; }

private:
    struct SideFeatures {
        float hp = 0.0f;
        float remaining = 0.0f;
        float status = 0.0f;
        float boosts = 0.0f;
        float speed_control = 0.0f;
        float screens = 0.0f;
        float tera = 0.0f;
    };

    SideFeatures side_features(const BattleState& state, Side side) const;

    EvaluatorConfig config_;
    const ScoringRules& rules_;
};

}  // namespace vgc
