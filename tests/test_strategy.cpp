#include "vgc/strategy/fictitious_play.hpp"
#include "vgc/strategy/quantal_response.hpp"
#include "vgc/strategy/risk_aware_solver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <cassert>
#include <stdexcept>

using namespace vgc;

namespace {

bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) < eps;
}

float sum(const std::vector<float>& v) {
    float total = 0.0f;
    for (float x : v) total += x;
    return total;
}

ActionValueEstimate estimate(float expected, float variance, float lo, float hi) {
    ActionValueEstimate e;
    e.expected = expected;
    e.variance = variance;
    e.min_value = lo;
    e.max_value = hi;
    return e;
}

}  // namespace

void test_quantal_response() {
    std::cout << "Testing quantal response... ";

    auto uniform = quantal_response({0.2f, 0.2f, 0.2f}, 0.25f);
    for (float p : uniform) assert(near(p, 1.0f / 3.0f));

    auto sharp = quantal_response({0.0f, 1.0f}, 0.25f);
    assert(near(sum(sharp), 1.0f));
    assert(sharp[1] > 0.98f);

    // Higher temperature flattens
    auto flat = quantal_response({0.0f, 1.0f}, 10.0f);
    assert(flat[1] < sharp[1]);
    assert(flat[1] > 0.5f);

    // Zero temperature is the best response
    auto hard = quantal_response({0.3f, 0.9f, 0.1f}, 0.0f);
    assert(hard[1] == 1.0f && hard[0] == 0.0f);

    // Large values do not overflow
    auto big = quantal_response({1000.0f, 999.0f}, 0.01f);
    assert(near(sum(big), 1.0f));

    assert(quantal_response({}, 0.3f).empty());
    assert(best_response({0.1f, 0.5f, 0.5f}) == 1);

    std::vector<float> zeros = {0.0f, 0.0f, 0.0f, 0.0f};
    normalize_distribution(zeros);
    assert(near(zeros[2], 0.25f));

    std::vector<std::vector<float>> u = {{1.0f, -1.0f}, {-1.0f, 1.0f}};
    assert(near(expected_utility(u, {1.0f, 0.0f}, {0.25f, 0.75f}), -0.5f));

    std::cout << "PASSED\n";
}

void test_risk_postures() {
    std::cout << "Testing risk postures... ";

    RiskAwareSolver solver;
    assert(solver.posture(0.60f) == RiskPosture::Secure);
    assert(solver.posture(0.55f) == RiskPosture::Secure);
    assert(solver.posture(0.50f) == RiskPosture::Neutral);
    assert(solver.posture(0.45f) == RiskPosture::Gamble);
    assert(solver.posture(0.10f) == RiskPosture::Gamble);
    assert(posture_to_string(RiskPosture::Secure) == "secure");

    RiskConfig inverted;
    inverted.gamble_threshold = 0.7f;
    inverted.secure_threshold = 0.6f;
    bool threw = false;
    try {
        RiskAwareSolver bad(inverted);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_risk_selection() {
    std::cout << "Testing risk-aware selection... ";

    RiskAwareSolver solver;
    // Safe: steady value. Swingy: slightly better on average, wide spread
    std::vector<ActionValueEstimate> options = {
        estimate(0.30f, 0.00f, 0.30f, 0.30f),
        estimate(0.35f, 0.20f, -0.50f, 0.90f)
    };

    RiskSelection secure = solver.select(options, 0.70f);
    assert(secure.posture == RiskPosture::Secure);
    assert(secure.index == 0);
    assert(secure.scores.size() == 2);

    RiskSelection neutral = solver.select(options, 0.50f);
    assert(neutral.index == 1);
    assert(near(neutral.scores[1], 0.35f));

    RiskSelection gamble = solver.select(options, 0.20f);
    assert(gamble.index == 1);
    assert(gamble.scores[1] > gamble.scores[0]);
    assert(!gamble.terminal_override);

    // A guaranteed win beats a higher but uncertain score in any posture
    std::vector<ActionValueEstimate> finish = {
        estimate(0.98f, 0.05f, 0.50f, 1.00f),
        estimate(0.97f, 0.00f, 0.96f, 0.98f)
    };
    RiskSelection sure = solver.select(finish, 0.20f);
    assert(sure.index == 1);
    assert(sure.terminal_override);

    bool threw = false;
    try {
        solver.select({}, 0.5f);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_fictitious_play_dominant() {
    std::cout << "Testing fictitious play (dominant row)... ";

    FictitiousPlayRefiner refiner;
    std::vector<std::vector<float>> u = {{1.0f, 1.0f}, {0.0f, 0.0f}};
    FictitiousPlayResult r = refiner.refine(u);
    assert(r.converged);
    assert(near(r.self_policy[0], 1.0f));
    assert(near(r.nash_gap, 0.0f));
    assert(near(r.value, 1.0f));
    assert(r.iterations <= refiner.config().iterations);

    std::cout << "PASSED (iterations=" << r.iterations << ")\n";
}

void test_fictitious_play_matching_pennies() {
    std::cout << "Testing fictitious play (matching pennies)... ";

    FictitiousPlayConfig config;
    config.iterations = 1000;
    FictitiousPlayRefiner refiner(config);
    std::vector<std::vector<float>> u = {{1.0f, -1.0f}, {-1.0f, 1.0f}};

    // Start from a lopsided opponent guess
    std::vector<float> initial = {0.9f, 0.1f};
    FictitiousPlayResult r = refiner.refine(u, &initial);
    assert(near(sum(r.self_policy), 1.0f));
    assert(near(sum(r.opp_policy), 1.0f));
    assert(r.self_policy[0] > 0.35f && r.self_policy[0] < 0.65f);
    assert(r.opp_policy[0] > 0.35f && r.opp_policy[0] < 0.65f);
    assert(r.nash_gap < 0.3f);
    assert(std::fabs(r.value) < 0.2f);

    // The pure profile is far from equilibrium
    assert(FictitiousPlayRefiner::nash_gap(u, {1.0f, 0.0f}, {1.0f, 0.0f}) > 1.0f);

    std::cout << "PASSED (gap=" << r.nash_gap << ")\n";
}

void test_blend_with_quantal() {
    std::cout << "Testing policy blending... ";

    auto blended = FictitiousPlayRefiner::blend_with_quantal({1.0f, 0.0f}, {0.0f, 1.0f}, 0.3f);
    assert(near(blended[0], 0.3f));
    assert(near(blended[1], 0.7f));

    // Weight is clamped to [0, 1]
    auto all_refined = FictitiousPlayRefiner::blend_with_quantal({1.0f, 0.0f}, {0.0f, 1.0f}, 2.0f);
    assert(near(all_refined[0], 1.0f));

    bool threw = false;
    try {
        FictitiousPlayRefiner::blend_with_quantal({1.0f}, {0.5f, 0.5f}, 0.3f);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_double_oracle() {
    std::cout << "Testing double oracle... ";

    // Rock-paper-scissors plus a dominated fourth action on each side
    auto payoff = [](int i, int j) -> float {
        if (i == 3) return -1.0f;
        if (j == 3) return 1.0f;
        if (i == j) return 0.0f;
        return ((i + 1) % 3 == j) ? -1.0f : 1.0f;
    };
    int evaluated = 0;
    auto counted = [&](int i, int j) {
        evaluated++;
        return payoff(i, j);
    };

    FictitiousPlayConfig config;
    config.iterations = 300;
    FictitiousPlayRefiner refiner(config);
    FictitiousPlayResult r = refiner.double_oracle(4, 4, counted);

    assert(r.self_policy.size() == 4);
    assert(r.opp_policy.size() == 4);
    assert(std::find(r.self_support.begin(), r.self_support.end(), 3) == r.self_support.end());
    assert(std::find(r.opp_support.begin(), r.opp_support.end(), 3) == r.opp_support.end());
    assert(r.self_support.size() == 3);
    assert(r.self_policy[3] == 0.0f);
    assert(std::fabs(r.value) < 0.2f);
    // Pair utilities are evaluated once each
    assert(evaluated <= 16);

    std::cout << "PASSED (rounds=" << r.iterations << ")\n";
}

int main() {
    std::cout << "\n=== VGC Strategy Tests ===\n\n";

    test_quantal_response();
    test_risk_postures();
    test_risk_selection();
    test_fictitious_play_dominant();
    test_fictitious_play_matching_pennies();
    test_blend_with_quantal();
    test_double_oracle();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
