#include "vgc/strategy/fictitious_play.hpp"
#include "vgc/strategy/quantal_response.hpp"
#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

namespace vgc {

namespace {

// (Uq)_i
std::vector<float> row_payoffs(const std::vector<std::vector<float>>& u, const std::vector<float>& q) {
    std::vector<float> values(u.size(), 0.0f);
    for (size_t i = 0; i < u.size(); ++i) {
        for (size_t j = 0; j < q.size(); ++j) {
            values[i] += u[i][j] * q[j];
        }
    }
    return values;
}

// (p^T U)_j
std::vector<float> col_payoffs(const std::vector<std::vector<float>>& u, const std::vector<float>& p) {
    size_t cols = u.empty() ? 0 : u[0].size();
    std::vector<float> values(cols, 0.0f);
    for (size_t i = 0; i < u.size(); ++i) {
        for (size_t j = 0; j < cols; ++j) {
            values[j] += p[i] * u[i][j];
        }
    }
    return values;
}

int argmin(const std::vector<float>& values) {
    return static_cast<int>(std::min_element(values.begin(), values.end()) - values.begin());
}

}  // namespace

FictitiousPlayRefiner::FictitiousPlayRefiner(const FictitiousPlayConfig& config)
    : config_(config)
{
}

float FictitiousPlayRefiner::nash_gap(
    const std::vector<std::vector<float>>& utility,
    const std::vector<float>& self_policy,
    const std::vector<float>& opp_policy
) {
    if (utility.empty() || utility[0].empty()) return 0.0f;
    std::vector<float> rows = row_payoffs(utility, opp_policy);
    std::vector<float> cols = col_payoffs(utility, self_policy);
    float best_row = *std::max_element(rows.begin(), rows.end());
    float worst_col = *std::min_element(cols.begin(), cols.end());
    return best_row - worst_col;
}

std::vector<float> FictitiousPlayRefiner::blend_with_quantal(
    const std::vector<float>& refined,
    const std::vector<float>& quantal,
    float weight
) {
    if (refined.size() != quantal.size()) {
        throw std::invalid_argument("blend_with_quantal: policy sizes differ");
    }
    weight = std::max(0.0f, std::min(1.0f, weight));
    std::vector<float> blended(refined.size());
    for (size_t i = 0; i < refined.size(); ++i) {
        blended[i] = (1.0f - weight) * quantal[i] + weight * refined[i];
    }
    normalize_distribution(blended);
    return blended;
}

FictitiousPlayResult FictitiousPlayRefiner::refine(
    const std::vector<std::vector<float>>& utility,
    const std::vector<float>* initial_opp
) const {
    FictitiousPlayResult result;
    const size_t rows = utility.size();
    const size_t cols = rows > 0 ? utility[0].size() : 0;
    if (rows == 0 || cols == 0) return result;

    // Empirical action counts; the initial opponent strategy seeds one round
    std::vector<float> self_counts(rows, 0.0f);
    std::vector<float> opp_counts(cols, 0.0f);
    if (initial_opp != nullptr && initial_opp->size() == cols) {
        opp_counts = *initial_opp;
    } else {
        std::fill(opp_counts.begin(), opp_counts.end(), 1.0f / cols);
    }

    std::vector<float> p(rows, 1.0f / rows);
    std::vector<float> q = compute_average_strategy(opp_counts);

    for (int t = 0; t < config_.iterations; ++t) {
        // Self best-responds to the opponent average
        self_counts[best_response(row_payoffs(utility, q))] += 1.0f;
        p = compute_average_strategy(self_counts);

        // Opponent minimizes our payoff against our average
        opp_counts[argmin(col_payoffs(utility, p))] += 1.0f;
        q = compute_average_strategy(opp_counts);

        result.iterations = t + 1;
        result.nash_gap = nash_gap(utility, p, q);
        if (result.nash_gap < config_.convergence_threshold) {
            result.converged = true;
            break;
        }
    }

    result.self_policy = p;
    result.opp_policy = q;
    result.value = expected_utility(utility, p, q);
    result.nash_gap = nash_gap(utility, p, q);
    return result;
}

FictitiousPlayResult FictitiousPlayRefiner::double_oracle(
    int rows,
    int cols,
    const std::function<float(int, int)>& utility_fn
) const {
    FictitiousPlayResult result;
    if (rows <= 0 || cols <= 0) return result;

    std::map<std::pair<int, int>, float> cache;
    auto u = [&](int i, int j) {
        auto key = std::make_pair(i, j);
        auto it = cache.find(key);
        if (it != cache.end()) return it->second;
        float v = utility_fn(i, j);
        cache[key] = v;
        return v;
    };

    std::vector<int> self_support;
    std::vector<int> opp_support;
    for (int i = 0; i < std::min(rows, std::max(1, config_.initial_support)); ++i) self_support.push_back(i);
    for (int j = 0; j < std::min(cols, std::max(1, config_.initial_support)); ++j) opp_support.push_back(j);

    FictitiousPlayResult restricted;
    for (int round = 0; round < config_.max_oracle_rounds; ++round) {
        std::vector<std::vector<float>> sub(self_support.size(), std::vector<float>(opp_support.size()));
        for (size_t a = 0; a < self_support.size(); ++a) {
            for (size_t b = 0; b < opp_support.size(); ++b) {
                sub[a][b] = u(self_support[a], opp_support[b]);
            }
        }
        restricted = refine(sub);

        // Best responses against the full action sets
        int best_row = self_support.front();
        float best_row_value = -std::numeric_limits<float>::infinity();
        for (int i = 0; i < rows; ++i) {
            float v = 0.0f;
            for (size_t b = 0; b < opp_support.size(); ++b) {
                v += restricted.opp_policy[b] * u(i, opp_support[b]);
            }
            if (v > best_row_value) {
                best_row_value = v;
                best_row = i;
            }
        }
        int best_col = opp_support.front();
        float best_col_value = std::numeric_limits<float>::infinity();
        for (int j = 0; j < cols; ++j) {
            float v = 0.0f;
            for (size_t a = 0; a < self_support.size(); ++a) {
                v += restricted.self_policy[a] * u(self_support[a], j);
            }
            if (v < best_col_value) {
                best_col_value = v;
                best_col = j;
            }
        }

        bool grew = false;
        if (best_row_value > restricted.value + config_.convergence_threshold &&
            std::find(self_support.begin(), self_support.end(), best_row) == self_support.end()) {
            self_support.push_back(best_row);
            grew = true;
        }
        if (best_col_value < restricted.value - config_.convergence_threshold &&
            std::find(opp_support.begin(), opp_support.end(), best_col) == opp_support.end()) {
            opp_support.push_back(best_col);
            grew = true;
        }
        result.iterations = round + 1;
        if (!grew) {
            result.converged = true;
            break;
        }
    }

    // Final restricted solve over the grown supports, spread back to full size
    std::vector<std::vector<float>> sub(self_support.size(), std::vector<float>(opp_support.size()));
    for (size_t a = 0; a < self_support.size(); ++a) {
        for (size_t b = 0; b < opp_support.size(); ++b) {
            sub[a][b] = u(self_support[a], opp_support[b]);
        }
    }
    restricted = refine(sub);

    result.self_policy.assign(rows, 0.0f);
    result.opp_policy.assign(cols, 0.0f);
    for (size_t a = 0; a < self_support.size(); ++a) {
        result.self_policy[self_support[a]] = restricted.self_policy[a];
    }
    for (size_t b = 0; b < opp_support.size(); ++b) {
        result.opp_policy[opp_support[b]] = restricted.opp_policy[b];
    }
    result.value = restricted.value;
    result.nash_gap = restricted.nash_gap;
    result.self_support = self_support;
    result.opp_support = opp_support;
    return result;
}

}  // namespace vgc
