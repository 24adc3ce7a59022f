#pragma once

/**
 * Fictitious play over a restricted matrix game.
 *
 * Given the pairwise utility table U[i][j] (row player = self, zero-sum)
 * from GameSolver, alternate best responses against the opponent's and
 * our own empirical mixed strategies and return the averaged strategies.
 * Operates only within the already generated candidate sets.
 */

#include <functional>
#include <vector>

namespace vgc {

struct FictitiousPlayConfig {
    int iterations = 10;
    float convergence_threshold = 0.01f;   // Stop early once nash_gap falls below
    float blend_weight = 0.3f;             // Weight of the refined policy when blending

    // Double oracle
    int max_oracle_rounds = 8;
    int initial_support = 2;
};

struct FictitiousPlayResult {
    std::vector<float> self_policy;
    std::vector<float> opp_policy;
    float value = 0.0f;                 // p^T U q
    float nash_gap = 0.0f;
    int iterations = 0;
    bool converged = false;

    // Double oracle only: restricted action indices into the full matrix
    std::vector<int> self_support;
    std::vector<int> opp_support;
};

class FictitiousPlayRefiner {
public:
    explicit FictitiousPlayRefiner(const FictitiousPlayConfig& config = FictitiousPlayConfig{});

    /**
     * Refine both mixed strategies.
     *
     * @param utility Row player's utility matrix
     * @param initial_opp Optional starting opponent strategy (e.g. the quantal response)
     */
    FictitiousPlayResult refine(
        const std::vector<std::vector<float>>& utility,
        const std::vector<float>* initial_opp = nullptr) const;

    /**
     * Exploitability of (p, q): max_i (Uq)_i - min_j (p^T U)_j. Zero at equilibrium.
     */
    static float nash_gap(
        const std::vector<std::vector<float>>& utility,
        const std::vector<float>& self_policy,
        const std::vector<float>& opp_policy);

    /**
     * (1 - weight) * quantal + weight * refined, renormalized.
     */
    static std::vector<float> blend_with_quantal(
        const std::vector<float>& refined,
        const std::vector<float>& quantal,
        float weight);

    /**
     * Double oracle: start from small supports, solve the restricted game
     * with fictitious play, add each side's best response against the
     * full matrix until neither improves.
     *
     * @param utility_fn Pair utility (row, column), evaluated lazily
     */
    FictitiousPlayResult double_oracle(
        int rows,
        int cols,
        const std::function<float(int, int)>& utility_fn) const;

    const FictitiousPlayConfig& config() const { return config_; }

private:
    FictitiousPlayConfig config_;
};

}  // namespace vgc
