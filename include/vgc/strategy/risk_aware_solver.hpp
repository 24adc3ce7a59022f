#pragma once

/**
 * Risk-sensitive action selection.
 *
 * The posture is derived from the current win probability:
 * - secure  (ahead):  EV minus variance and downside penalties
 * - neutral:          plain EV
 * - gamble  (behind): EV plus an upside bonus
 *
 * An action whose worst plausible outcome is already a win is chosen
 * regardless of posture.
 */

#include "vgc/game/action.hpp"
#include <string>
#include <vector>

namespace vgc {

enum class RiskPosture {
    Secure,
    Neutral,
    Gamble
};

std::string posture_to_string(RiskPosture posture);

struct RiskConfig {
    float secure_threshold = 0.55f;     // win probability >= -> secure
    float gamble_threshold = 0.45f;     // win probability <= -> gamble
    float variance_penalty = 0.5f;
    float downside_penalty = 0.25f;
    float upside_bonus = 0.3f;
    float guaranteed_win = 0.95f;       // min utility treated as a sure win

    static RiskConfig cautious() {
        RiskConfig cfg;
        cfg.variance_penalty = 1.0f;
        cfg.downside_penalty = 0.5f;
        return cfg;
    }

    static RiskConfig aggressive() {
        RiskConfig cfg;
        cfg.upside_bonus = 0.6f;
        cfg.secure_threshold = 0.65f;
        return cfg;
    }
};

/**
 * Value statistics of one self action under the modeled opponent policy.
 */
struct ActionValueEstimate {
    JointAction action;
    float expected = 0.0f;
    float variance = 0.0f;
    float min_value = 0.0f;
    float max_value = 0.0f;
};

struct RiskSelection {
    int index = -1;
    RiskPosture posture = RiskPosture::Neutral;
    std::vector<float> scores;          // Posture criterion per action
    bool terminal_override = false;     // Picked as a guaranteed win
};

class RiskAwareSolver {
public:
    explicit RiskAwareSolver(const RiskConfig& config = RiskConfig{});

    RiskPosture posture(float win_probability) const;

    float score(const ActionValueEstimate& estimate, RiskPosture posture) const;

    /**
     * Choose among the estimates.
     *
     * @throws std::invalid_argument if estimates is empty
     */
    RiskSelection select(
        const std::vector<ActionValueEstimate>& estimates,
        float win_probability) const;

    const RiskConfig& config() const { return config_; }

private:
    RiskConfig config_;
};

}  // namespace vgc
