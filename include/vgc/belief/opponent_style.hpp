#pragma once

/**
 * Opponent behavioral tendencies for the current match.
 *
 * Each tendency is a Beta posterior over a per-turn rate, updated with
 * one Bernoulli observation per opponent joint action. Rates are clamped
 * so a handful of observations never drive the modeled policy to
 * certainty.
 */

#include "vgc/game/action.hpp"

namespace vgc {

struct BetaRate {
    float alpha = 1.0f;
    float beta = 1.0f;
    float lo = 0.0f;
    float hi = 1.0f;

    float prior_mean = 0.5f;

    BetaRate() = default;
    BetaRate(float a, float b, float low, float high)
        : alpha(a), beta(b), lo(low), hi(high), prior_mean(a / (a + b)) {}

    float mean() const {
        float m = alpha / (alpha + beta);
        return m < lo ? lo : (m > hi ? hi : m);
    }

    void observe(bool hit) {
        if (hit) alpha += 1.0f; else beta += 1.0f;
    }
};

struct StyleConfig {
    BetaRate protect{1.5f, 8.5f, 0.05f, 0.40f};
    BetaRate switching{1.0f, 9.0f, 0.02f, 0.30f};
    BetaRate aggression{5.0f, 5.0f, 0.20f, 0.95f};
    BetaRate focus_fire{3.0f, 7.0f, 0.10f, 0.60f};
    BetaRate setup{2.0f, 8.0f, 0.02f, 0.50f};

    // Bounds on the multiplicative bias applied to one joint action
    float min_bias = 0.25f;
    float max_bias = 4.0f;
};

struct OpponentStyleProfile {
    float protect_rate = 0.0f;
    float switch_rate = 0.0f;
    float aggression_rate = 0.0f;
    float focus_fire_rate = 0.0f;
    float setup_rate = 0.0f;
    int samples = 0;
};

class OpponentStyleModel {
public:
    explicit OpponentStyleModel(const StyleConfig& config = StyleConfig{});

    // Record one observed opponent joint action
    void observe(const JointAction& action);

    OpponentStyleProfile profile() const;

    /**
     * Multiplicative prior on an opponent joint action, relative to the
     * starting priors. 1.0 before any observation.
     */
    float action_bias(const JointAction& action) const;

    int samples() const { return samples_; }

    void reset();

private:
    StyleConfig config_;
    BetaRate protect_;
    BetaRate switching_;
    BetaRate aggression_;
    BetaRate focus_fire_;
    BetaRate setup_;
    int samples_ = 0;
};

}  // namespace vgc
