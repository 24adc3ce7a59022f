#pragma once

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace vgc {

/**
 * Logit quantal response over action values.
 *
 * σ(a) = exp(v(a) / τ) / Σ exp(v / τ)
 *
 * τ controls rationality:
 * - τ → 0: best response (hard max); τ <= 0 returns the argmax point mass
 * - τ → ∞: uniform
 *
 * @param values Value of each action to the acting player
 * @param tau Temperature
 * @return Probability distribution over actions
 */
inline std::vector<float> quantal_response(const std::vector<float>& values, float tau) {
    const size_t n = values.size();
    std::vector<float> policy(n, 0.0f);

    if (n == 0) return policy;
    if (n == 1) {
        policy[0] = 1.0f;
        return policy;
    }

    if (tau <= 0.0f) {
        size_t best = static_cast<size_t>(
            std::max_element(values.begin(), values.end()) - values.begin());
        policy[best] = 1.0f;
        return policy;
    }

    // Subtract max before exp for numerical stability
    float max_value = *std::max_element(values.begin(), values.end());
    float sum_exp = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        policy[i] = std::exp((values[i] - max_value) / tau);
        sum_exp += policy[i];
    }
    for (size_t i = 0; i < n; ++i) {
        policy[i] /= sum_exp;
    }
    return policy;
}

/**
 * Index of the highest value (first on ties).
 */
inline int best_response(const std::vector<float>& values) {
    if (values.empty()) return -1;
    return static_cast<int>(std::max_element(values.begin(), values.end()) - values.begin());
}

/**
 * Normalize non-negative weights in place; uniform if they sum to zero.
 */
inline void normalize_distribution(std::vector<float>& weights) {
    if (weights.empty()) return;
    float total = 0.0f;
    for (auto& w : weights) {
        if (!(w > 0.0f)) w = 0.0f;
        total += w;
    }
    if (total > 0.0f) {
        for (auto& w : weights) w /= total;
    } else {
        std::fill(weights.begin(), weights.end(), 1.0f / weights.size());
    }
}

/**
 * Average strategy from cumulative action counts or weights.
 */
inline std::vector<float> compute_average_strategy(const std::vector<float>& strategy_sum) {
    std::vector<float> avg(strategy_sum);
    normalize_distribution(avg);
    return avg;
}

/**
 * p^T U q for a row-player utility matrix.
 */
inline float expected_utility(
    const std::vector<std::vector<float>>& utility,
    const std::vector<float>& row_policy,
    const std::vector<float>& col_policy
) {
    float total = 0.0f;
    for (size_t i = 0; i < utility.size() && i < row_policy.size(); ++i) {
        if (row_policy[i] == 0.0f) continue;
        for (size_t j = 0; j < utility[i].size() && j < col_policy.size(); ++j) {
            total += row_policy[i] * col_policy[j] * utility[i][j];
        }
    }
    return total;
}

}  // namespace vgc
